// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal.hpp
 * @brief Hardware Abstraction Layer (HAL) interfaces for kcore.
 * @details
 * Each platform supplies a Platform object with console, clock and context-switch
 * operations. Address-space root and TLS pointer are core-local registers: outside of
 * switch_context() they are only read, through ContextSwitchOps.
 *
 * @see hal.cpp, core.hpp, context.hpp
 */

#ifndef HAL_HPP
#define HAL_HPP

#include "core.hpp"
#include "context.hpp"
#include <cstdint>
#include <cstddef>

namespace kcore {
namespace hal {

struct UARTDriverOps {
    virtual ~UARTDriverOps() = default;
    virtual void putc(char c) = 0;
    virtual void puts(const char* str) = 0;
};

struct TimerDriverOps {
    virtual ~TimerDriverOps() = default;
    virtual uint64_t get_system_time_us() = 0;
};

struct ContextSwitchOps {
    virtual ~ContextSwitchOps() = default;
    virtual uintptr_t address_space_root() const = 0;
    virtual uintptr_t thread_local_pointer() const = 0;
};

/**
 * @brief The privileged steps of the reset-time bootstrap.
 * @note On hardware these are single instructions in boot.S; jump_to_kernel_entry()
 *       and halt() do not return there. Models (sim::SimCore) record them and return.
 */
struct BootOps {
    virtual ~BootOps() = default;
    virtual uint32_t read_affinity_id() = 0;
    virtual void set_stack_pointer(uintptr_t sp) = 0;
    virtual void set_global_pointer(uintptr_t gp) = 0;
    virtual void jump_to_kernel_entry(uintptr_t entry) = 0;
    virtual void halt() = 0;
};

class Platform {
public:
    virtual ~Platform() = default;
    virtual const char* name() const = 0;
    virtual uint32_t get_core_id() const = 0;
    virtual uint32_t get_num_cores() const = 0;
    virtual UARTDriverOps* get_uart_ops() = 0;
    virtual TimerDriverOps* get_timer_ops() = 0;
    virtual ContextSwitchOps* get_context_ops() = 0;
    virtual void early_init_platform() = 0;
    [[noreturn]] virtual void park_core() = 0;
    [[noreturn]] virtual void panic(const char* msg, const char* file, int line) = 0;
};

Platform* get_platform();

/**
 * @brief Scheduler-facing switch.
 * @details Traces the switch and panics if @p in_slot holds no resident context, then
 * calls the unchecked switch_context(). Interrupts must already be masked.
 */
void cpu_context_switch(ctx::ContextSlot* out_slot, ctx::ContextSlot* in_slot);

} // namespace hal
} // namespace kcore

#endif // HAL_HPP
