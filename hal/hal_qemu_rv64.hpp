// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_qemu_rv64.hpp
 * @brief RISC-V 64 HAL header for the QEMU virt platform in kcore.
 * @details
 * Runs in machine mode. NS16550A console, CLINT mtime clock, and context operations
 * over satp and tp. Bootstrap and switch live in hal/riscv64/boot.S and switch.S.
 */

#ifndef HAL_QEMU_RV64_HPP
#define HAL_QEMU_RV64_HPP

#include "../hal.hpp"
#include <cstdint>

namespace hal::qemu_virt_rv64 {

constexpr uint64_t UART_BASE = 0x10000000;
constexpr uint32_t UART_THR = 0x00;
constexpr uint32_t UART_LSR = 0x05;
constexpr uint8_t UART_LSR_THRE = 0x20;
constexpr uint64_t CLINT_MTIME = 0x0200BFF8;
constexpr uint64_t MTIME_FREQ_HZ = 10000000;

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
    uintptr_t address_space_root() const override;
    uintptr_t thread_local_pointer() const override;
};

class PlatformQEMUVirtRV64 : public kcore::hal::Platform {
public:
    const char* name() const override { return "qemu-virt-rv64"; }
    uint32_t get_core_id() const override;
    uint32_t get_num_cores() const override;
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

} // namespace hal::qemu_virt_rv64

#endif // HAL_QEMU_RV64_HPP
