// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_context.cpp
 * @brief Frame layout and initial-frame synthesis tests.
 */

#include "test_framework.hpp"
#include "context.hpp"
#include "core.hpp"
#include "trace.hpp"

#include <cstdint>

namespace test {

namespace {

bool test_frame_layouts(kcore::hal::UARTDriverOps* uart_ops) {
    using namespace kcore::ctx;
    // One word each for ra, root and tls plus the callee-saved set, padded to alignment.
    bool ok = expect(sizeof(mips32::Frame) == (3 + 1 + KCORE_MIPS32_CTX_NUM_SAVED + 1) * 4, uart_ops,
                     "mips32 frame holds ra/root/tls/pad + s0-s8 + gp");
    ok &= expect(sizeof(rv64::Frame) % KCORE_RV64_STACK_ALIGN == 0, uart_ops, "rv64 frame keeps sp aligned");
    ok &= expect(sizeof(a64::Frame) % KCORE_A64_STACK_ALIGN == 0, uart_ops, "a64 frame keeps sp aligned");
    // The x86-64 frame includes the caller-pushed return address.
    ok &= expect((sizeof(x64::Frame) + 8) % KCORE_X64_STACK_ALIGN == 0, uart_ops, "x64 frame plus call keeps alignment");
    ok &= expect(KCORE_MIPS32_CTX_ROOT != KCORE_MIPS32_CTX_TLS && KCORE_MIPS32_CTX_GP > KCORE_MIPS32_CTX_S0,
                 uart_ops, "mips32 roles occupy distinct words");
    return ok;
}

bool test_rv64_root_encoding(kcore::hal::UARTDriverOps* uart_ops) {
    using namespace kcore::ctx::rv64;
    const uint64_t root = make_satp(SATP_MODE_SV39, 0x1000);
    bool ok = expect(root == 0x8000000000000001ULL, uart_ops, "Sv39 root for a table at 0x1000");
    ok &= expect((root >> 60) == SATP_MODE_SV39, uart_ops, "MODE field is non-Bare whenever a PPN is set");
    ok &= expect(make_satp(SATP_MODE_BARE, 0) == 0, uart_ops, "Bare root is all zeros");
    ok &= expect(make_satp(SATP_MODE_SV39, 1ULL << 60) == (SATP_MODE_SV39 << 60), uart_ops,
                 "PPN clipped to 44 bits, ASID stays 0");
    return ok;
}

bool test_empty_context_view(kcore::hal::UARTDriverOps* uart_ops) {
#if defined(KCORE_HAS_NATIVE_CONTEXT)
    kcore::ctx::ContextSlot slot = kcore::ctx::EMPTY_SLOT;
    kcore::ctx::Context view = kcore::ctx::Context::from_slot(slot);
    return expect(!view.is_resident(), uart_ops, "empty slot is not resident");
#else
    (void)uart_ops;
    return true;
#endif
}

#if defined(KCORE_HAVE_SWITCH)

alignas(16) uint8_t g_frame_stack[kcore::core::THREAD_STACK_SIZE];

void never_runs(void*) {}

bool test_initial_frame_rejects_bad_input(kcore::hal::UARTDriverOps* uart_ops) {
    using kcore::ctx::make_initial_frame;
    using kcore::ctx::EMPTY_SLOT;
    bool ok = expect(make_initial_frame(nullptr, sizeof(g_frame_stack), never_runs, nullptr, 0, 0) == EMPTY_SLOT,
                     uart_ops, "null stack rejected");
    ok &= expect(make_initial_frame(g_frame_stack, 64, never_runs, nullptr, 0, 0) == EMPTY_SLOT,
                 uart_ops, "undersized stack rejected");
    ok &= expect(make_initial_frame(g_frame_stack, sizeof(g_frame_stack), nullptr, nullptr, 0, 0) == EMPTY_SLOT,
                 uart_ops, "null entry rejected");
    return ok;
}

bool test_initial_frame_contents(kcore::hal::UARTDriverOps* uart_ops) {
    int marker = 0;
    trace::g_trace_manager.clear_trace();
    kcore::ctx::ContextSlot slot = kcore::ctx::make_initial_frame(g_frame_stack, sizeof(g_frame_stack), never_runs,
                                                                  &marker, 0x3000, 0x4000);
    kcore::ctx::Context view = kcore::ctx::Context::from_slot(slot);
    const uintptr_t base = reinterpret_cast<uintptr_t>(g_frame_stack);
    const uintptr_t end = base + sizeof(g_frame_stack);

    bool ok = expect(view.is_resident(), uart_ops, "frame handle is resident");
    ok &= expect(slot >= base && slot + KCORE_CTX_SIZE + KCORE_CTX_ENTRY_RESERVE <= end, uart_ops,
                 "frame lies inside the stack with the entry reserve above it");
    ok &= expect(view.return_address() == reinterpret_cast<uintptr_t>(&kcore_context_entry_trampoline), uart_ops,
                 "first return goes to the trampoline");
    ok &= expect(view.address_space_root() == 0x3000 && view.thread_local_pointer() == 0x4000, uart_ops,
                 "root and tls stored for the first restore");

    const auto* raw = reinterpret_cast<const uint8_t*>(slot);
    ok &= expect(*reinterpret_cast<const uintptr_t*>(raw + KCORE_CTX_ENTRY) == reinterpret_cast<uintptr_t>(&never_runs),
                 uart_ops, "entry in its callee-saved slot");
    ok &= expect(*reinterpret_cast<const uintptr_t*>(raw + KCORE_CTX_ARG) == reinterpret_cast<uintptr_t>(&marker),
                 uart_ops, "argument in its callee-saved slot");
    // After ret pops the frame the trampoline runs on a 16-byte aligned stack.
    ok &= expect((slot + KCORE_CTX_SIZE) % KCORE_STACK_ALIGN == 0, uart_ops, "stack aligned at trampoline entry");

    ok &= expect(trace::g_trace_manager.event_count() == 1 &&
                 trace::g_trace_manager.event(0).type == trace::EventType::THREAD_CREATE,
                 uart_ops, "thread creation traced");
    return ok;
}

#endif // KCORE_HAVE_SWITCH

} // namespace

void register_context_tests(TestFramework& tf) {
    tf.register_test({"frame_layouts", test_frame_layouts, "per-architecture frame layouts"});
    tf.register_test({"rv64_root_encoding", test_rv64_root_encoding, "satp values used as thread roots"});
    tf.register_test({"empty_context_view", test_empty_context_view, "context view over an empty slot"});
#if defined(KCORE_HAVE_SWITCH)
    tf.register_test({"initial_frame_rejects", test_initial_frame_rejects_bad_input, "initial frame input checks"});
    tf.register_test({"initial_frame_contents", test_initial_frame_contents, "initial frame shape"});
#endif
}

} // namespace test
