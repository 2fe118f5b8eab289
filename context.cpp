// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file context.cpp
 * @brief Initial thread-frame synthesis for the native switch_context().
 */

#include "context.hpp"
#include "kcore.hpp"
#include "trace.hpp"
#include "util.hpp"

#if defined(KCORE_HAVE_SWITCH)

namespace kcore {
namespace ctx {

#if !defined(__x86_64__)
namespace {

// A fresh thread starts with the global-data pointer of its creator.
uintptr_t current_global_pointer() noexcept {
    uintptr_t gp;
#if defined(__mips__)
    asm volatile("move %0, $gp" : "=r"(gp));
#elif defined(__riscv)
    asm volatile("mv %0, gp" : "=r"(gp));
#elif defined(__aarch64__)
    asm volatile("mov %0, x18" : "=r"(gp));
#endif
    return gp;
}

} // namespace
#endif

ContextSlot make_initial_frame(void* stack_base, size_t stack_size, ThreadEntry entry, void* arg,
                               uintptr_t address_space_root, uintptr_t thread_local_pointer) noexcept {
    if (!stack_base || !entry || stack_size < MIN_THREAD_STACK) return EMPTY_SLOT;

    uintptr_t top = reinterpret_cast<uintptr_t>(stack_base) + stack_size;
    top &= ~static_cast<uintptr_t>(KCORE_STACK_ALIGN - 1);
    top -= KCORE_CTX_ENTRY_RESERVE;
    uintptr_t sp = top - KCORE_CTX_SIZE;

    Frame* frame = reinterpret_cast<Frame*>(sp);
    util::kmemset(frame, 0, sizeof(Frame));

    auto* raw = reinterpret_cast<uint8_t*>(sp);
    auto store = [raw](size_t offset, uintptr_t value) {
        using Word = decltype(Frame::ra);
        Word w = static_cast<Word>(value);
        util::kmemcpy(raw + offset, &w, sizeof(w));
    };
    store(KCORE_CTX_RA, reinterpret_cast<uintptr_t>(&kcore_context_entry_trampoline));
    store(KCORE_CTX_ENTRY, reinterpret_cast<uintptr_t>(entry));
    store(KCORE_CTX_ARG, reinterpret_cast<uintptr_t>(arg));
    store(KCORE_CTX_ROOT, address_space_root);
    store(KCORE_CTX_TLS, thread_local_pointer);
#if !defined(__x86_64__)
    frame->gp = static_cast<decltype(Frame::gp)>(current_global_pointer());
#endif

    trace::g_trace_manager.record_event(trace::EventType::THREAD_CREATE, "frame", sp, address_space_root);
    return static_cast<ContextSlot>(sp);
}

} // namespace ctx
} // namespace kcore

extern "C" [[noreturn]] void kcore_context_entry_returned() {
    if (kcore::g_platform) {
        kcore::g_platform->panic("thread entry function returned", __FILE__, __LINE__);
    }
    early_uart_puts("[PANIC] thread entry function returned\n");
    for (;;) {}
}

#endif // KCORE_HAVE_SWITCH
