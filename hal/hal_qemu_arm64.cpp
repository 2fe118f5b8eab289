// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_qemu_arm64.cpp
 * @brief AArch64 HAL implementation for the QEMU virt platform in kcore.
 */

#include "hal_qemu_arm64.hpp"
#include "../kcore.hpp"
#include "../util.hpp"

namespace hal::qemu_virt_arm64 {

namespace {

PlatformQEMUVirtARM64 g_platform_instance;

inline void mmio_write32(uint64_t addr, uint32_t value) {
    *reinterpret_cast<volatile uint32_t*>(addr) = value;
}
inline uint32_t mmio_read32(uint64_t addr) {
    return *reinterpret_cast<volatile uint32_t*>(addr);
}
inline uint64_t read_sysreg_cntpct() { uint64_t v; asm volatile("isb; mrs %0, cntpct_el0" : "=r"(v)); return v; }
inline uint64_t read_sysreg_cntfrq() { uint64_t v; asm volatile("mrs %0, cntfrq_el0" : "=r"(v)); return v; }

void pl011_putc(char c) {
    while (mmio_read32(UART_BASE + UART_FR) & UART_FR_TXFF) {}
    mmio_write32(UART_BASE + UART_DR, static_cast<uint32_t>(c));
}

} // namespace

// --- UARTDriver ---
void UARTDriver::putc(char c) { pl011_putc(c); }
void UARTDriver::puts(const char* str) {
    if (!str) return;
    while (*str) {
        if (*str == '\n') putc('\r');
        putc(*str++);
    }
}

// --- TimerDriver ---
void TimerDriver::init_system_timer_properties() {
    timer_freq_hz_ = read_sysreg_cntfrq();
    if (timer_freq_hz_ == 0) {
        early_uart_puts("[HAL] CNTFRQ_EL0 is 0, using 62.5MHz\n");
        timer_freq_hz_ = 62500000;
    }
}
uint64_t TimerDriver::get_system_time_us() {
    if (timer_freq_hz_ == 0) return 0;
    return (read_sysreg_cntpct() * 1000000ULL) / timer_freq_hz_;
}

// --- ContextOps ---
uintptr_t ContextOps::address_space_root() const {
    uint64_t v;
    asm volatile("mrs %0, ttbr0_el1" : "=r"(v));
    return v;
}
uintptr_t ContextOps::thread_local_pointer() const {
    uint64_t v;
    asm volatile("mrs %0, tpidr_el0" : "=r"(v));
    return v;
}

// --- Platform ---
uint32_t PlatformQEMUVirtARM64::get_core_id() const {
    uint64_t mpidr;
    asm volatile("mrs %0, mpidr_el1" : "=r"(mpidr));
    return static_cast<uint32_t>(mpidr & KCORE_A64_AFFINITY_MASK);
}
uint32_t PlatformQEMUVirtARM64::get_num_cores() const { return kcore::core::MAX_CORES; }

void PlatformQEMUVirtARM64::early_init_platform() {
    timer_driver_.init_system_timer_properties();
    uart_driver_.puts("[kcore HAL] QEMU AArch64 platform early init done\n");
}

[[noreturn]] void PlatformQEMUVirtARM64::park_core() {
    asm volatile("msr daifset, #0xf" ::: "memory");
    for (;;) { asm volatile("wfi"); }
}

[[noreturn]] void PlatformQEMUVirtARM64::panic(const char* msg, const char* file, int line) {
    asm volatile("msr daifset, #0xf" ::: "memory");
    early_uart_puts("\n*** KERNEL PANIC ***\n");
    if (msg) { early_uart_puts("Message: "); early_uart_puts(msg); early_uart_puts("\n"); }
    if (file) { early_uart_puts("File: "); early_uart_puts(file); }
    char line_buf[48];
    kcore::util::k_snprintf(line_buf, sizeof(line_buf), ":%d\nCore: %u\nHalting.\n", line, get_core_id());
    early_uart_puts(line_buf);
    for (;;) { asm volatile("wfi"); }
}

} // namespace hal::qemu_virt_arm64

extern "C" void early_uart_puts(const char* str) {
    if (!str) return;
    while (*str) {
        if (*str == '\n') hal::qemu_virt_arm64::pl011_putc('\r');
        hal::qemu_virt_arm64::pl011_putc(*str++);
    }
}

namespace kcore::hal {
Platform* get_platform() { return &::hal::qemu_virt_arm64::g_platform_instance; }
} // namespace kcore::hal
