// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file core.cpp
 * @brief Per-core state machine and bootstrap sequence for kcore.
 */

#include "core.hpp"
#include "hal.hpp"
#include "util.hpp"
#include "trace.hpp"
#include "kcore.hpp"

#include <cstddef>

namespace kcore {
namespace core {

bool transition_core(PerCPUData& cpu, CoreState next) noexcept {
    if (cpu.state != CoreState::UNSTARTED || next == CoreState::UNSTARTED) return false;
    cpu.state = next;
    return true;
}

const char* core_state_name(CoreState state) noexcept {
    switch (state) {
        case CoreState::UNSTARTED: return "UNSTARTED";
        case CoreState::ACTIVE: return "ACTIVE";
        case CoreState::HALTED: return "HALTED";
        default: return "UNKNOWN";
    }
}

size_t record_halted_secondaries(std::array<PerCPUData, MAX_CORES>& cpus, uint32_t boot_core_id,
                                 uint32_t num_cores) noexcept {
    size_t limit = num_cores < MAX_CORES ? num_cores : MAX_CORES;
    size_t marked = 0;
    for (size_t i = 0; i < limit; ++i) {
        if (i == boot_core_id) continue;
        cpus[i].affinity_id = static_cast<uint32_t>(i);
        if (transition_core(cpus[i], CoreState::HALTED)) {
            trace::g_trace_manager.record_event(trace::EventType::CORE_HALT, "secondary", i);
            marked++;
        }
    }
    return marked;
}

CoreState CoreBootstrap::run(hal::BootOps& ops) {
    if (cpu_.state != CoreState::UNSTARTED) return cpu_.state;

    uint32_t affinity = ops.read_affinity_id();
    cpu_.affinity_id = affinity;

    if (affinity != PRIMARY_AFFINITY_ID) {
        transition_core(cpu_, CoreState::HALTED);
        trace::g_trace_manager.record_event(trace::EventType::CORE_HALT, "secondary", affinity);
        ops.halt();
        return cpu_.state;
    }

    ops.set_stack_pointer(cfg_.boot_stack_top);
    ops.set_global_pointer(cfg_.global_data_base);
    transition_core(cpu_, CoreState::ACTIVE);
    trace::g_trace_manager.record_event(trace::EventType::CORE_BOOT, "primary", affinity, cfg_.boot_stack_top);
    ops.jump_to_kernel_entry(cfg_.kernel_entry);
    return cpu_.state;
}

void dump_core_states(hal::UARTDriverOps* uart_ops) {
    if (!uart_ops) return;
    char buf[96];
    uart_ops->puts("\n--- Core States ---\n");
    for (size_t i = 0; i < MAX_CORES; ++i) {
        const PerCPUData& cpu = g_per_cpu_data[i];
        util::k_snprintf(buf, sizeof(buf), "Core %u: %s (affinity %u, boot slot %p)\n",
                         static_cast<unsigned>(i), core_state_name(cpu.state), cpu.affinity_id,
                         reinterpret_cast<void*>(cpu.boot_context));
        uart_ops->puts(buf);
    }
    uart_ops->puts("--- End Core States ---\n");
}

} // namespace core
} // namespace kcore
