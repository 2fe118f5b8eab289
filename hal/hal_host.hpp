// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_host.hpp
 * @brief Hosted HAL for running kcore and its tests as a user-space process.
 * @details
 * A single modelled core. The address-space root and TLS pointer are software registers
 * in kcore_host_cpu_regs, which hal/x86_64/switch.S saves and restores exactly where the
 * hardware ports touch satp, TTBR0_EL1 or the MIPS root word.
 */

#ifndef HAL_HOST_HPP
#define HAL_HOST_HPP

#include "../hal.hpp"
#include <cstdint>

extern "C" {
    struct KcoreHostCpuRegs {
        uintptr_t root; // KCORE_X64_CPU_ROOT
        uintptr_t tls;  // KCORE_X64_CPU_TLS
    };
    extern KcoreHostCpuRegs kcore_host_cpu_regs;
}

namespace hal::host {

class UARTDriver : public kcore::hal::UARTDriverOps {
public:
    void putc(char c) override;
    void puts(const char* str) override;
};

class TimerDriver : public kcore::hal::TimerDriverOps {
public:
    uint64_t get_system_time_us() override;
};

class ContextOps : public kcore::hal::ContextSwitchOps {
public:
    uintptr_t address_space_root() const override { return kcore_host_cpu_regs.root; }
    uintptr_t thread_local_pointer() const override { return kcore_host_cpu_regs.tls; }
};

class PlatformHost : public kcore::hal::Platform {
public:
    const char* name() const override { return "host"; }
    uint32_t get_core_id() const override { return 0; }
    uint32_t get_num_cores() const override { return 1; }
    kcore::hal::UARTDriverOps* get_uart_ops() override { return &uart_driver_; }
    kcore::hal::TimerDriverOps* get_timer_ops() override { return &timer_driver_; }
    kcore::hal::ContextSwitchOps* get_context_ops() override { return &context_ops_; }
    void early_init_platform() override;
    [[noreturn]] void park_core() override;
    [[noreturn]] void panic(const char* msg, const char* file, int line) override;
private:
    UARTDriver uart_driver_;
    TimerDriver timer_driver_;
    ContextOps context_ops_;
};

/// Installs root and TLS values as if a previous switch had left them on this core.
void load_boot_control_registers(uintptr_t root, uintptr_t tls) noexcept;

} // namespace hal::host

#endif // HAL_HOST_HPP
