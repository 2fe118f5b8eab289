// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file selftest.cpp
 * @brief Switch self-test implementation for kcore.
 */

#include "selftest.hpp"
#include "core.hpp"
#include "context.hpp"
#include "kcore.hpp"
#include "util.hpp"

#if defined(KCORE_HAVE_SWITCH)

namespace kcore {
namespace selftest {

namespace {

struct WorkerRecord {
    uintptr_t expected_root;
    uintptr_t expected_tls;
    uint32_t runs;
    uint32_t mismatches;
};

struct SwitchSelftest {
    ctx::ContextSlot* boot_slot;
    ctx::ContextSlot worker_one_slot;
    ctx::ContextSlot worker_two_slot;
    WorkerRecord one;
    WorkerRecord two;
    uint32_t slot_violations;
};

SwitchSelftest g_state;
alignas(16) uint8_t g_worker_stacks[2][core::THREAD_STACK_SIZE];
uint64_t g_worker_tls[2][4];

void observe(WorkerRecord& rec) {
    hal::ContextSwitchOps* ops = g_platform->get_context_ops();
    rec.runs++;
    if (ops->address_space_root() != rec.expected_root || ops->thread_local_pointer() != rec.expected_tls) {
        rec.mismatches++;
    }
}

void worker_one(void* arg) {
    auto* st = static_cast<SwitchSelftest*>(arg);
    for (;;) {
        observe(st->one);
        if (st->worker_one_slot != ctx::EMPTY_SLOT) st->slot_violations++;
        hal::cpu_context_switch(&st->worker_one_slot, &st->worker_two_slot);
    }
}

void worker_two(void* arg) {
    auto* st = static_cast<SwitchSelftest*>(arg);
    for (;;) {
        observe(st->two);
        if (st->worker_two_slot != ctx::EMPTY_SLOT) st->slot_violations++;
        if (st->worker_one_slot == ctx::EMPTY_SLOT || *st->boot_slot == ctx::EMPTY_SLOT) st->slot_violations++;
        hal::cpu_context_switch(&st->worker_two_slot, st->boot_slot);
    }
}

} // namespace

int run_switch_selftest(hal::UARTDriverOps* uart_ops, uint32_t rounds) {
    if (!g_platform || !g_platform->get_context_ops()) return -1;
    hal::ContextSwitchOps* ops = g_platform->get_context_ops();
    char buf[128];

    uint32_t core_id = g_platform->get_core_id();
    if (core_id >= core::MAX_CORES) core_id = 0;

    const uintptr_t boot_root = ops->address_space_root();
    const uintptr_t boot_tls = ops->thread_local_pointer();

    // Workers left suspended by a previous run are abandoned with their frames.
    g_state = SwitchSelftest{};
    g_state.boot_slot = &core::g_per_cpu_data[core_id].boot_context;
    *g_state.boot_slot = ctx::EMPTY_SLOT;
    g_state.one.expected_root = WORKER_ONE_ROOT;
    g_state.one.expected_tls = reinterpret_cast<uintptr_t>(&g_worker_tls[0]);
    g_state.two.expected_root = WORKER_TWO_ROOT;
    g_state.two.expected_tls = reinterpret_cast<uintptr_t>(&g_worker_tls[1]);

    g_state.worker_one_slot = ctx::make_initial_frame(g_worker_stacks[0], sizeof(g_worker_stacks[0]), &worker_one,
                                                      &g_state, g_state.one.expected_root, g_state.one.expected_tls);
    g_state.worker_two_slot = ctx::make_initial_frame(g_worker_stacks[1], sizeof(g_worker_stacks[1]), &worker_two,
                                                      &g_state, g_state.two.expected_root, g_state.two.expected_tls);
    if (g_state.worker_one_slot == ctx::EMPTY_SLOT || g_state.worker_two_slot == ctx::EMPTY_SLOT) {
        if (uart_ops) uart_ops->puts("[SELFTEST] could not build worker frames\n");
        return 1;
    }

    int failures = 0;
    for (uint32_t round = 0; round < rounds; ++round) {
        hal::cpu_context_switch(g_state.boot_slot, &g_state.worker_one_slot);
        if (*g_state.boot_slot != ctx::EMPTY_SLOT) failures++;
        if (g_state.worker_one_slot == ctx::EMPTY_SLOT || g_state.worker_two_slot == ctx::EMPTY_SLOT) failures++;
        if (ops->address_space_root() != boot_root || ops->thread_local_pointer() != boot_tls) failures++;
    }
    if (g_state.one.runs != rounds || g_state.two.runs != rounds) failures++;
    failures += static_cast<int>(g_state.one.mismatches + g_state.two.mismatches + g_state.slot_violations);

    if (uart_ops) {
        util::k_snprintf(buf, sizeof(buf), "[SELFTEST] %u rounds, worker runs %u/%u, %d failures\n",
                         rounds, g_state.one.runs, g_state.two.runs, failures);
        uart_ops->puts(buf);
    }
    return failures;
}

} // namespace selftest
} // namespace kcore

#endif // KCORE_HAVE_SWITCH
