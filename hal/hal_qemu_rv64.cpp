// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_qemu_rv64.cpp
 * @brief RISC-V 64 HAL implementation for the QEMU virt platform in kcore.
 */

#include "hal_qemu_rv64.hpp"
#include "../kcore.hpp"
#include "../util.hpp"

namespace hal::qemu_virt_rv64 {

namespace {

PlatformQEMUVirtRV64 g_platform_instance;

inline void write_mmio8(uint64_t addr, uint8_t value) {
    *reinterpret_cast<volatile uint8_t*>(addr) = value;
}
inline uint8_t read_mmio8(uint64_t addr) {
    return *reinterpret_cast<volatile uint8_t*>(addr);
}

void ns16550_putc(char c) {
    while (!(read_mmio8(UART_BASE + UART_LSR) & UART_LSR_THRE)) {}
    write_mmio8(UART_BASE + UART_THR, static_cast<uint8_t>(c));
}

} // namespace

// --- UARTDriver ---
void UARTDriver::putc(char c) { ns16550_putc(c); }
void UARTDriver::puts(const char* str) {
    if (!str) return;
    while (*str) {
        if (*str == '\n') putc('\r');
        putc(*str++);
    }
}

// --- TimerDriver ---
uint64_t TimerDriver::get_system_time_us() {
    uint64_t ticks = *reinterpret_cast<volatile uint64_t*>(CLINT_MTIME);
    return ticks / (MTIME_FREQ_HZ / 1000000);
}

// --- ContextOps ---
uintptr_t ContextOps::address_space_root() const {
    uint64_t v;
    asm volatile("csrr %0, satp" : "=r"(v));
    return v;
}
uintptr_t ContextOps::thread_local_pointer() const {
    uint64_t v;
    asm volatile("mv %0, tp" : "=r"(v));
    return v;
}

// --- Platform ---
uint32_t PlatformQEMUVirtRV64::get_core_id() const {
    uint64_t hart;
    asm volatile("csrr %0, mhartid" : "=r"(hart));
    return static_cast<uint32_t>(hart);
}
uint32_t PlatformQEMUVirtRV64::get_num_cores() const { return kcore::core::MAX_CORES; }

void PlatformQEMUVirtRV64::early_init_platform() {
    uart_driver_.puts("[kcore HAL] QEMU RV64 platform early init done\n");
}

[[noreturn]] void PlatformQEMUVirtRV64::park_core() {
    asm volatile("csrci mstatus, 8" ::: "memory"); // MIE
    for (;;) { asm volatile("wfi"); }
}

[[noreturn]] void PlatformQEMUVirtRV64::panic(const char* msg, const char* file, int line) {
    asm volatile("csrci mstatus, 8" ::: "memory");
    early_uart_puts("\n*** KERNEL PANIC ***\n");
    if (msg) { early_uart_puts("Message: "); early_uart_puts(msg); early_uart_puts("\n"); }
    if (file) { early_uart_puts("File: "); early_uart_puts(file); }
    char line_buf[48];
    kcore::util::k_snprintf(line_buf, sizeof(line_buf), ":%d\nCore: %u\nHalting.\n", line, get_core_id());
    early_uart_puts(line_buf);
    for (;;) { asm volatile("wfi"); }
}

} // namespace hal::qemu_virt_rv64

extern "C" void early_uart_puts(const char* str) {
    if (!str) return;
    while (*str) {
        if (*str == '\n') hal::qemu_virt_rv64::ns16550_putc('\r');
        hal::qemu_virt_rv64::ns16550_putc(*str++);
    }
}

namespace kcore::hal {
Platform* get_platform() { return &::hal::qemu_virt_rv64::g_platform_instance; }
} // namespace kcore::hal
