// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_malta_mipsel.cpp
 * @brief MIPS32 little-endian HAL implementation for the Malta board in kcore.
 */

#include "hal_malta_mipsel.hpp"
#include "../kcore.hpp"
#include "../util.hpp"

extern "C" {
    volatile uint32_t kcore_root_page_table_ptr = 0;
    volatile uint32_t kcore_cur_tls = 0;
}

namespace hal::malta_mipsel {

namespace {

PlatformMalta g_platform_instance;

inline void write_mmio8(uint32_t addr, uint8_t value) {
    *reinterpret_cast<volatile uint8_t*>(addr) = value;
}
inline uint8_t read_mmio8(uint32_t addr) {
    return *reinterpret_cast<volatile uint8_t*>(addr);
}
inline uint32_t read_cp0_count() { uint32_t v; asm volatile("mfc0 %0, $9" : "=r"(v)); return v; }
inline uint32_t read_cp0_ebase() { uint32_t v; asm volatile("mfc0 %0, $15, 1" : "=r"(v)); return v; }

void uart16550_putc(char c) {
    while (!(read_mmio8(UART_BASE + UART_LSR) & UART_LSR_THRE)) {}
    write_mmio8(UART_BASE + UART_THR, static_cast<uint8_t>(c));
}

} // namespace

// --- UARTDriver ---
void UARTDriver::putc(char c) { uart16550_putc(c); }
void UARTDriver::puts(const char* str) {
    if (!str) return;
    while (*str) {
        if (*str == '\n') putc('\r');
        putc(*str++);
    }
}

// --- TimerDriver ---
uint64_t TimerDriver::get_system_time_us() {
    uint32_t now = read_cp0_count();
    if (now < last_count_) high_ += (1ULL << 32);
    last_count_ = now;
    return (high_ | now) / (CP0_COUNT_FREQ_HZ / 1000000);
}

// --- Platform ---
uint32_t PlatformMalta::get_core_id() const { return read_cp0_ebase() & KCORE_MIPS32_AFFINITY_MASK; }
uint32_t PlatformMalta::get_num_cores() const { return kcore::core::MAX_CORES; }

void PlatformMalta::early_init_platform() {
    uart_driver_.puts("[kcore HAL] Malta MIPS32 platform early init done\n");
}

[[noreturn]] void PlatformMalta::park_core() {
    asm volatile("di; ehb" ::: "memory");
    for (;;) { asm volatile("wait"); }
}

[[noreturn]] void PlatformMalta::panic(const char* msg, const char* file, int line) {
    asm volatile("di; ehb" ::: "memory");
    early_uart_puts("\n*** KERNEL PANIC ***\n");
    if (msg) { early_uart_puts("Message: "); early_uart_puts(msg); early_uart_puts("\n"); }
    if (file) { early_uart_puts("File: "); early_uart_puts(file); }
    char line_buf[48];
    kcore::util::k_snprintf(line_buf, sizeof(line_buf), ":%d\nCore: %u\nHalting.\n", line, get_core_id());
    early_uart_puts(line_buf);
    for (;;) { asm volatile("wait"); }
}

} // namespace hal::malta_mipsel

extern "C" void early_uart_puts(const char* str) {
    if (!str) return;
    while (*str) {
        if (*str == '\n') hal::malta_mipsel::uart16550_putc('\r');
        hal::malta_mipsel::uart16550_putc(*str++);
    }
}

namespace kcore::hal {
Platform* get_platform() { return &::hal::malta_mipsel::g_platform_instance; }
} // namespace kcore::hal
