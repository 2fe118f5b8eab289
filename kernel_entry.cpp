// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file kernel_entry.cpp
 * @brief Architecture-independent kernel entry reached from hal/<arch>/boot.S.
 */

#include "kcore.hpp"
#include "core.hpp"
#include "selftest.hpp"
#include "trace.hpp"
#include "util.hpp"

extern "C" {
    // Linker script symbols
    extern char __bss_start[];
    extern char __bss_end[];
    typedef void (*InitFunc)();
    extern InitFunc __init_array_start[];
    extern InitFunc __init_array_end[];
}

namespace {

constexpr uint32_t SELFTEST_ROUNDS = 4;

void clear_bss() {
    for (volatile char* p = __bss_start; p < __bss_end; ++p) *p = 0;
}

void run_static_constructors() {
    for (InitFunc* fn = __init_array_start; fn < __init_array_end; ++fn) (*fn)();
}

} // namespace

extern "C" [[noreturn]] void boot_main() {
    clear_bss();
    run_static_constructors();
    early_uart_puts("[BOOT] kcore entered boot_main\n");

    kcore::g_platform = kcore::hal::get_platform();
    if (!kcore::g_platform) {
        early_uart_puts("[BOOT] no platform, halting\n");
        for (;;) {}
    }
    kcore::g_platform->early_init_platform();

    trace::g_trace_manager.init();
    trace::g_trace_manager.set_enabled(true);

    uint32_t core_id = kcore::g_platform->get_core_id();
    if (core_id >= kcore::core::MAX_CORES) {
        kcore::g_platform->panic("boot core id out of range", __FILE__, __LINE__);
    }
    kcore::core::PerCPUData& cpu = kcore::core::g_per_cpu_data[core_id];
    cpu.affinity_id = core_id;
    if (!kcore::core::transition_core(cpu, kcore::core::CoreState::ACTIVE)) {
        kcore::g_platform->panic("boot core was already started", __FILE__, __LINE__);
    }
    trace::g_trace_manager.record_event(trace::EventType::CORE_BOOT, "boot_main", core_id,
                                        kcore::core::BOOT_STACK_TOP);
    // The other cores never left boot.S.
    kcore::core::record_halted_secondaries(kcore::core::g_per_cpu_data, core_id,
                                           kcore::g_platform->get_num_cores());

    kcore::hal::UARTDriverOps* uart = kcore::g_platform->get_uart_ops();
    char buf[96];
    kcore::util::k_snprintf(buf, sizeof(buf), "[BOOT] %s core %u active, boot stack 0x%llx\n",
                            kcore::g_platform->name(), core_id,
                            static_cast<unsigned long long>(kcore::core::BOOT_STACK_TOP));
    uart->puts(buf);

    int failures = kcore::selftest::run_switch_selftest(uart, SELFTEST_ROUNDS);
    uart->puts(failures == 0 ? "[BOOT] switch self-test PASSED\n" : "[BOOT] switch self-test FAILED\n");

    kcore::core::dump_core_states(uart);
    trace::g_trace_manager.dump_trace(uart);
    kcore::g_platform->park_core();
}
