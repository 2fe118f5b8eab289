// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_qemu_arm64.hpp
 * @brief AArch64 HAL header for the QEMU virt platform in kcore.
 * @details
 * PL011 console, generic-timer clock, and context operations over TTBR0_EL1 and
 * TPIDR_EL0. Bootstrap and switch live in hal/aarch64/boot.S and switch.S.
 */

#ifndef HAL_QEMU_ARM64_HPP
#define HAL_QEMU_ARM64_HPP

#include "../hal.hpp"
#include <cstdint>

namespace hal::qemu_virt_arm64 {

constexpr uint64_t UART_BASE = 0x09000000; // PL011 UART
constexpr uint32_t UART_DR = 0x00;
constexpr uint32_t UART_FR = 0x18;
constexpr uint32_t UART_FR_TXFF = 1u << 5;

class UARTDriver : public kcore::hal::UARTDriverOps {
public:
    void putc(char c) override;
    void puts(const char* str) override;
};

class TimerDriver : public kcore::hal::TimerDriverOps {
public:
    void init_system_timer_properties();
    uint64_t get_system_time_us() override;
private:
    uint64_t timer_freq_hz_ = 0;
};

class ContextOps : public kcore::hal::ContextSwitchOps {
public:
    uintptr_t address_space_root() const override;
    uintptr_t thread_local_pointer() const override;
};

class PlatformQEMUVirtARM64 : public kcore::hal::Platform {
public:
    const char* name() const override { return "qemu-virt-aarch64"; }
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

} // namespace hal::qemu_virt_arm64

#endif // HAL_QEMU_ARM64_HPP
