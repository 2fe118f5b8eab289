// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file trace.hpp
 * @brief Event tracing subsystem header for kcore.
 * @details
 * Records boot, halt, thread-creation and context-switch events in a fixed-size ring
 * buffer that can be dumped to a UART. Recording never allocates and never blocks, so
 * it is safe to call from the scheduler side of a switch with interrupts masked.
 *
 * @see trace.cpp, hal.hpp
 */

#ifndef TRACE_HPP
#define TRACE_HPP

#include "hal.hpp"
#include <atomic>
#include <array>
#include <string_view>
#include <cstdint>

namespace trace {

constexpr size_t MAX_TRACE_EVENTS = 64;

enum class EventType {
    CORE_BOOT,
    CORE_HALT,
    THREAD_CREATE,
    CONTEXT_SWITCH,
    CUSTOM
};

struct TraceEvent {
    uint64_t timestamp_us;
    EventType type;
    uint32_t core_id;
    std::string_view name;
    uint64_t arg1;
    uint64_t arg2;
};

class TraceManager {
public:
    TraceManager() : enabled_(false) {}

    void init() noexcept { clear_trace(); }

    void set_enabled(bool enable) noexcept { enabled_.store(enable, std::memory_order_relaxed); }


    /**
     * @brief Records one event.
     * @param name Must outlive the trace buffer (string literal).
     * @return false when tracing is disabled or no platform clock is available.
     */
    bool record_event(EventType type, std::string_view name, uint64_t arg1 = 0, uint64_t arg2 = 0) noexcept;

    size_t event_count() const noexcept;

    /// Oldest-first access; index < event_count().
    const TraceEvent& event(size_t index) const noexcept;

    void dump_trace(kcore::hal::UARTDriverOps* uart_ops) const;

    void clear_trace() noexcept;

private:
    std::atomic<bool> enabled_;
    std::array<TraceEvent, MAX_TRACE_EVENTS> buffer_{};
    std::atomic<size_t> buffer_idx_{0};
};

extern TraceManager g_trace_manager;

const char* event_type_name(EventType type) noexcept;

} // namespace trace

#endif // TRACE_HPP
