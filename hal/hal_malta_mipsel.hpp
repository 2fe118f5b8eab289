// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_malta_mipsel.hpp
 * @brief MIPS32 little-endian HAL header for the Malta board in kcore.
 * @details
 * The reference port. Address translation is a software-refilled TLB, so the
 * address-space root is the per-core word kcore_root_page_table_ptr read by the refill
 * handler; the TLS pointer is the word kcore_cur_tls, mirrored into CP0 UserLocal so
 * user code can read it with rdhwr $29. Only switch.S writes either word.
 */

#ifndef HAL_MALTA_MIPSEL_HPP
#define HAL_MALTA_MIPSEL_HPP

#include "../hal.hpp"
#include <cstdint>

extern "C" {
    extern volatile uint32_t kcore_root_page_table_ptr;
    extern volatile uint32_t kcore_cur_tls;
}

namespace hal::malta_mipsel {

constexpr uint32_t UART_BASE = 0xB80003F8; // on-board 16550 through KSEG1
constexpr uint32_t UART_THR = 0x00;
constexpr uint32_t UART_LSR = 0x05;
constexpr uint8_t UART_LSR_THRE = 0x20;
constexpr uint64_t CP0_COUNT_FREQ_HZ = 100000000; // half the 200MHz core clock

class UARTDriver : public kcore::hal::UARTDriverOps {
public:
    void putc(char c) override;
    void puts(const char* str) override;
};

class TimerDriver : public kcore::hal::TimerDriverOps {
public:
    uint64_t get_system_time_us() override;
private:
    // CP0 Count is 32 bits wide; extended on every read.
    uint32_t last_count_ = 0;
    uint64_t high_ = 0;
};

class ContextOps : public kcore::hal::ContextSwitchOps {
public:
    uintptr_t address_space_root() const override { return kcore_root_page_table_ptr; }
    uintptr_t thread_local_pointer() const override { return kcore_cur_tls; }
};

class PlatformMalta : public kcore::hal::Platform {
public:
    const char* name() const override { return "malta-mips32el"; }
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

} // namespace hal::malta_mipsel

#endif // HAL_MALTA_MIPSEL_HPP
