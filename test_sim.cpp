// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_sim.cpp
 * @brief Register-level switch tests on the MIPS32 core model.
 */

#include "test_framework.hpp"
#include "sim_core.hpp"

#include <cstddef>

namespace test {

namespace {

using kcore::sim::MemoryWrite;
using kcore::sim::SimCore;
namespace reg = kcore::sim;

constexpr uint32_t SLOT_A = 0x80010000;
constexpr uint32_t SLOT_B = 0x80010004;
constexpr uint32_t STACK_A = 0x80400000;
constexpr uint32_t FRAME_B = 0x80500000 - KCORE_MIPS32_CTX_SIZE;
constexpr uint32_t RESUME_A = 0x80101230;
constexpr uint32_t RESUME_B = 0x80102340;
constexpr uint32_t TLS_A = 0x80600000;
constexpr uint32_t TLS_B = 0x80610000;
constexpr uint32_t GP_VALUE = 0x80187ff0;

// Thread A is running; thread B is suspended in a frame at FRAME_B.
void setup_two_threads(SimCore& core) {
    core.set_gpr(reg::SP, STACK_A);
    core.set_gpr(reg::GP, GP_VALUE);
    for (uint32_t i = 0; i < 8; ++i) core.set_gpr(reg::S0 + i, 0xA0000000u + i);
    core.set_gpr(reg::S0, 0x11111111);
    core.set_gpr(reg::S8, 0xA0000008);
    core.load_control_registers(0x1000, TLS_A);

    auto& mem = core.memory();
    mem.load(FRAME_B + KCORE_MIPS32_CTX_RA, RESUME_B);
    mem.load(FRAME_B + KCORE_MIPS32_CTX_ROOT, 0x2000);
    mem.load(FRAME_B + KCORE_MIPS32_CTX_TLS, TLS_B);
    for (uint32_t i = 0; i < KCORE_MIPS32_CTX_NUM_SAVED; ++i) {
        mem.load(FRAME_B + KCORE_MIPS32_CTX_S0 + i * 4, 0xB0000000u + i);
    }
    mem.load(FRAME_B + KCORE_MIPS32_CTX_S0, 0x22222222);
    mem.load(FRAME_B + KCORE_MIPS32_CTX_GP, GP_VALUE);
    mem.load(SLOT_A, 0);
    mem.load(SLOT_B, FRAME_B);
}

bool test_two_context_scenario(kcore::hal::UARTDriverOps* uart_ops) {
    SimCore core(0);
    setup_two_threads(core);
    core.switch_context(SLOT_A, SLOT_B, RESUME_A);

    bool ok = expect(core.gpr(reg::S0) == 0x22222222, uart_ops, "s0 holds B's marker");
    ok &= expect(core.address_space_root() == 0x2000, uart_ops, "root register holds B's root");
    ok &= expect(core.thread_local_pointer() == TLS_B && core.user_local() == TLS_B, uart_ops, "TLS is B's");
    ok &= expect(core.memory().read32(SLOT_B) == 0, uart_ops, "incoming slot is empty");

    uint32_t handle_a = core.memory().read32(SLOT_A);
    ok &= expect(handle_a == STACK_A - KCORE_MIPS32_CTX_SIZE, uart_ops, "outgoing slot points at A's frame");
    kcore::ctx::mips32::Frame fa = core.read_frame(handle_a);
    ok &= expect(fa.s[0] == 0x11111111 && fa.root == 0x1000, uart_ops, "A's frame holds its marker and root");
    ok &= expect(fa.tls == TLS_A && fa.ra == RESUME_A && fa.gp == GP_VALUE, uart_ops, "A's frame holds tls, ra, gp");
    ok &= expect(core.pc() == RESUME_B, uart_ops, "execution resumes at B's return address");
    ok &= expect(core.gpr(reg::SP) == FRAME_B + KCORE_MIPS32_CTX_SIZE, uart_ops, "B's frame popped");
    return ok;
}

bool test_round_trip_restores_a(kcore::hal::UARTDriverOps* uart_ops) {
    SimCore core(0);
    setup_two_threads(core);
    uint32_t before[9];
    for (uint32_t i = 0; i < 8; ++i) before[i] = core.gpr(reg::S0 + i);
    before[8] = core.gpr(reg::S8);

    core.switch_context(SLOT_A, SLOT_B, RESUME_A);
    core.set_gpr(reg::S3, 0xDEADBEEF); // B clobbers a callee-saved register while it runs
    core.switch_context(SLOT_B, SLOT_A, RESUME_B + 8);

    bool ok = true;
    for (uint32_t i = 0; i < 8; ++i) {
        ok &= expect(core.gpr(reg::S0 + i) == before[i], uart_ops, "s0-s7 restored");
    }
    ok &= expect(core.gpr(reg::S8) == before[8], uart_ops, "s8 restored");
    ok &= expect(core.gpr(reg::GP) == GP_VALUE, uart_ops, "gp restored");
    ok &= expect(core.gpr(reg::SP) == STACK_A, uart_ops, "sp back at A's pre-call value");
    ok &= expect(core.address_space_root() == 0x1000 && core.thread_local_pointer() == TLS_A, uart_ops,
                 "root and tls restored");
    ok &= expect(core.pc() == RESUME_A, uart_ops, "A resumes after its call");
    ok &= expect(core.memory().read32(SLOT_A) == 0, uart_ops, "A's slot consumed");

    kcore::ctx::mips32::Frame fb = core.read_frame(core.memory().read32(SLOT_B));
    ok &= expect(fb.s[3] == 0xDEADBEEF && fb.root == 0x2000, uart_ops, "B saved with its own changes");
    return ok;
}

bool test_publish_and_zero_ordering(kcore::hal::UARTDriverOps* uart_ops) {
    SimCore core(0);
    setup_two_threads(core);
    core.memory().clear_log();
    core.switch_context(SLOT_A, SLOT_B, RESUME_A);

    const auto& log = core.memory().writes();
    const uint32_t frame_a = STACK_A - KCORE_MIPS32_CTX_SIZE;
    size_t publish = log.size(), root = log.size(), tls = log.size(), last_frame_store = 0;
    for (size_t i = 0; i < log.size(); ++i) {
        const MemoryWrite& w = log[i];
        if (w.addr >= frame_a && w.addr < STACK_A) last_frame_store = i;
        if (w.addr == SLOT_A && publish == log.size()) publish = i;
        if (w.addr == SimCore::ROOT_REGISTER_ADDR) root = i;
        if (w.addr == SimCore::TLS_REGISTER_ADDR) tls = i;
    }
    bool ok = expect(log.size() == 13 + 1 + 2 + 1, uart_ops, "frame, publish, root, tls, zero");
    ok &= expect(publish < log.size() && last_frame_store < publish, uart_ops, "frame complete before publish");
    ok &= expect(publish < root && root < tls, uart_ops, "root restored before tls, both after publish");
    ok &= expect(!log.empty() && log.back().addr == SLOT_B && log.back().value == 0, uart_ops,
                 "incoming slot zeroed last");
    return ok;
}

bool test_double_resume_detectable(kcore::hal::UARTDriverOps* uart_ops) {
    SimCore core(0);
    setup_two_threads(core);
    core.switch_context(SLOT_A, SLOT_B, RESUME_A);
    // A scheduler validating its slot now sees the empty sentinel for B.
    bool ok = expect(core.memory().read32(SLOT_B) == kcore::ctx::EMPTY_SLOT, uart_ops, "B's slot empty while B runs");
    core.switch_context(SLOT_B, SLOT_A, RESUME_B);
    ok &= expect(core.memory().read32(SLOT_B) != kcore::ctx::EMPTY_SLOT, uart_ops, "slot repopulated once B suspends");
    ok &= expect(core.memory().read32(SLOT_A) == kcore::ctx::EMPTY_SLOT, uart_ops, "A's slot empty while A runs");
    return ok;
}

bool test_fresh_thread_through_trampoline(kcore::hal::UARTDriverOps* uart_ops) {
    constexpr uint32_t SLOT_T = 0x80010008;
    constexpr uint32_t ENTRY = 0x80105000;
    constexpr uint32_t ARG = 0x8020CAFE;
    SimCore core(0);
    setup_two_threads(core);

    uint32_t handle = core.make_initial_frame(0x80300004, ENTRY, ARG, 0x3000, 0x80620000);
    core.memory().load(SLOT_T, handle);

    bool ok = expect(handle % KCORE_MIPS32_STACK_ALIGN == 0, uart_ops, "frame aligned");
    ok &= expect(handle + KCORE_MIPS32_CTX_SIZE + KCORE_CTX_ENTRY_RESERVE <= 0x80300000, uart_ops,
                 "argument home area above the frame");

    core.switch_context(SLOT_A, SLOT_T, RESUME_A);
    ok &= expect(core.pc() == SimCore::TRAMPOLINE_ADDR, uart_ops, "first resume enters the trampoline");
    ok &= expect(core.address_space_root() == 0x3000, uart_ops, "fresh thread runs in its address space");
    ok &= expect(core.gpr(reg::GP) == GP_VALUE, uart_ops, "fresh thread inherits gp");
    ok &= expect(core.step_trampoline(), uart_ops, "trampoline steps");
    ok &= expect(core.pc() == ENTRY && core.gpr(reg::A0) == ARG, uart_ops, "entry called with its argument");
    ok &= expect(core.gpr(reg::RA) == SimCore::TRAMPOLINE_ADDR + 12, uart_ops,
                 "entry returns into the trampoline's panic path");
    ok &= expect(!core.step_trampoline(), uart_ops, "trampoline step only at the trampoline");
    return ok;
}

} // namespace

void register_sim_tests(TestFramework& tf) {
    tf.register_test({"two_context_scenario", test_two_context_scenario, "A=0x11111111/0x1000 to B=0x22222222/0x2000"});
    tf.register_test({"round_trip_restores_a", test_round_trip_restores_a, "A->B->A restores A"});
    tf.register_test({"publish_and_zero_ordering", test_publish_and_zero_ordering, "slot store ordering"});
    tf.register_test({"double_resume_detectable", test_double_resume_detectable, "consumed slot reads empty"});
    tf.register_test({"fresh_thread_trampoline", test_fresh_thread_through_trampoline, "synthesized first frame"});
}

} // namespace test
