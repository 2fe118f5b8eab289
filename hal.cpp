// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal.cpp
 * @brief Scheduler-facing context switch entry for kcore.
 */

#include "hal.hpp"
#include "core.hpp"
#include "kcore.hpp"
#include "trace.hpp"
#include <cstdint>

#if defined(KCORE_HAVE_SWITCH)

namespace kcore {
namespace hal {

void cpu_context_switch(ctx::ContextSlot* out_slot, ctx::ContextSlot* in_slot) {
    if (!out_slot || !in_slot || *in_slot == ctx::EMPTY_SLOT) {
        if (kcore::g_platform) {
            kcore::g_platform->panic("cpu_context_switch: incoming context is not resident", __FILE__, __LINE__);
        }
        early_uart_puts("[PANIC] cpu_context_switch: incoming context is not resident\n");
        for (;;) {}
    }
    trace::g_trace_manager.record_event(trace::EventType::CONTEXT_SWITCH, "switch",
                                        reinterpret_cast<uintptr_t>(out_slot), *in_slot);
    ::switch_context(out_slot, in_slot);
}

} // namespace hal
} // namespace kcore

#endif // KCORE_HAVE_SWITCH
