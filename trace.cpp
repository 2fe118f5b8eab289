// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file trace.cpp
 * @brief Event tracing subsystem implementation for kcore.
 */

#include "trace.hpp"
#include "kcore.hpp"
#include "util.hpp"
#include <atomic>

namespace trace {

TraceManager g_trace_manager;

const char* event_type_name(EventType type) noexcept {
    switch (type) {
        case EventType::CORE_BOOT: return "BOOT   ";
        case EventType::CORE_HALT: return "HALT   ";
        case EventType::THREAD_CREATE: return "CREATE ";
        case EventType::CONTEXT_SWITCH: return "SWITCH ";
        case EventType::CUSTOM: return "CUSTOM ";
        default: return "UNKNOWN";
    }
}

bool TraceManager::record_event(EventType type, std::string_view name, uint64_t arg1, uint64_t arg2) noexcept {
    if (!enabled_.load(std::memory_order_relaxed) || !kcore::g_platform || !kcore::g_platform->get_timer_ops()) {
        return false;
    }
    size_t idx = buffer_idx_.fetch_add(1, std::memory_order_relaxed) % MAX_TRACE_EVENTS;
    TraceEvent& current_event = buffer_[idx];
    current_event.timestamp_us = kcore::g_platform->get_timer_ops()->get_system_time_us();
    current_event.type = type;
    current_event.core_id = kcore::g_platform->get_core_id();
    current_event.name = name;
    current_event.arg1 = arg1;
    current_event.arg2 = arg2;
    return true;
}

size_t TraceManager::event_count() const noexcept {
    return kcore::util::min(buffer_idx_.load(std::memory_order_relaxed), MAX_TRACE_EVENTS);
}

const TraceEvent& TraceManager::event(size_t index) const noexcept {
    size_t written = buffer_idx_.load(std::memory_order_relaxed);
    size_t start_idx = (written > MAX_TRACE_EVENTS) ? written % MAX_TRACE_EVENTS : 0;
    return buffer_[(start_idx + index) % MAX_TRACE_EVENTS];
}

void TraceManager::dump_trace(kcore::hal::UARTDriverOps* uart_ops) const {
    if (!uart_ops) return;
    size_t count = event_count();
    if (count == 0) {
        uart_ops->puts("Trace buffer empty\n");
        return;
    }
    uart_ops->puts("\n--- Trace Buffer ---\n");
    for (size_t i = 0; i < count; ++i) {
        const TraceEvent& ev = event(i);
        char line_buf[160];
        char name_buf[kcore::core::MAX_NAME_LENGTH + 1];
        size_t name_len = kcore::util::min(ev.name.length(), kcore::core::MAX_NAME_LENGTH);
        kcore::util::kmemcpy(name_buf, ev.name.data(), name_len);
        name_buf[name_len] = '\0';
        kcore::util::k_snprintf(line_buf, sizeof(line_buf), "[C%u] %llu us: %s %s 0x%llx 0x%llx\n",
                                ev.core_id, static_cast<unsigned long long>(ev.timestamp_us),
                                event_type_name(ev.type), name_buf,
                                static_cast<unsigned long long>(ev.arg1),
                                static_cast<unsigned long long>(ev.arg2));
        uart_ops->puts(line_buf);
    }
    uart_ops->puts("--- End Trace ---\n");
}

void TraceManager::clear_trace() noexcept {
    buffer_idx_.store(0, std::memory_order_relaxed);
    for (auto& event_entry : buffer_) {
        event_entry = TraceEvent{};
    }
}

} // namespace trace
