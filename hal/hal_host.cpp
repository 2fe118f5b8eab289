// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_host.cpp
 * @brief Hosted HAL implementation for kcore.
 */

#include "hal_host.hpp"
#include "../kcore.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

extern "C" {
    KcoreHostCpuRegs kcore_host_cpu_regs = {0, 0};
}

static_assert(offsetof(KcoreHostCpuRegs, root) == KCORE_X64_CPU_ROOT);
static_assert(offsetof(KcoreHostCpuRegs, tls) == KCORE_X64_CPU_TLS);

namespace hal::host {

namespace {
PlatformHost g_platform_instance;
}

// --- UARTDriver ---
void UARTDriver::putc(char c) { std::fputc(c, stdout); }
void UARTDriver::puts(const char* str) {
    if (!str) return;
    std::fputs(str, stdout);
    std::fflush(stdout);
}

// --- TimerDriver ---
uint64_t TimerDriver::get_system_time_us() {
    static const auto start = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::steady_clock::now() - start;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

// --- Platform ---
void PlatformHost::early_init_platform() {
    uart_driver_.puts("[kcore HAL] host platform early init done\n");
}

[[noreturn]] void PlatformHost::park_core() {
    std::fflush(stdout);
    std::exit(0);
}

[[noreturn]] void PlatformHost::panic(const char* msg, const char* file, int line) {
    std::fflush(stdout);
    std::fprintf(stderr, "\n*** KERNEL PANIC ***\nMessage: %s\nFile: %s:%d\n", msg ? msg : "(null)",
                 file ? file : "(null)", line);
    std::abort();
}

void load_boot_control_registers(uintptr_t root, uintptr_t tls) noexcept {
    kcore_host_cpu_regs.root = root;
    kcore_host_cpu_regs.tls = tls;
}

} // namespace hal::host

extern "C" void early_uart_puts(const char* str) {
    if (!str) return;
    std::fputs(str, stdout);
    std::fflush(stdout);
}

namespace kcore::hal {
Platform* get_platform() { return &::hal::host::g_platform_instance; }
} // namespace kcore::hal
