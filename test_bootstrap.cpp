// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_bootstrap.cpp
 * @brief Core bootstrap state machine tests against the MIPS32 core model.
 */

#include "test_framework.hpp"
#include "core.hpp"
#include "sim_core.hpp"
#include "trace.hpp"

#include <array>

namespace test {

namespace {

using kcore::core::BootConfig;
using kcore::core::CoreBootstrap;
using kcore::core::CoreState;
using kcore::core::PerCPUData;
using kcore::sim::SimCore;

constexpr uint32_t LINKED_GP = 0x80187ff0;
constexpr uint32_t BOOT_MAIN = 0x80100400;

BootConfig malta_config() {
    BootConfig cfg;
    cfg.boot_stack_top = 0x80800000;
    cfg.global_data_base = LINKED_GP;
    cfg.kernel_entry = BOOT_MAIN;
    return cfg;
}

class CountingBootOps : public kcore::hal::BootOps {
public:
    explicit CountingBootOps(uint32_t affinity) : affinity_(affinity) {}
    uint32_t read_affinity_id() override { ++calls; return affinity_; }
    void set_stack_pointer(uintptr_t) override { ++calls; }
    void set_global_pointer(uintptr_t) override { ++calls; }
    void jump_to_kernel_entry(uintptr_t) override { ++calls; }
    void halt() override { ++calls; }
    int calls = 0;
private:
    uint32_t affinity_;
};

bool test_primary_core_enters_kernel(kcore::hal::UARTDriverOps* uart_ops) {
    SimCore core(0);
    PerCPUData cpu;
    trace::g_trace_manager.clear_trace();
    CoreState st = CoreBootstrap(cpu, malta_config()).run(core);

    bool ok = expect(st == CoreState::ACTIVE && cpu.state == CoreState::ACTIVE, uart_ops, "affinity 0 becomes ACTIVE");
    ok &= expect(core.gpr(kcore::sim::SP) == 0x80800000, uart_ops, "sp is the boot stack");
    ok &= expect(core.gpr(kcore::sim::GP) == LINKED_GP, uart_ops, "gp is the linked symbol");
    ok &= expect(core.entered_kernel() && core.pc() == BOOT_MAIN, uart_ops, "control reaches boot_main");
    ok &= expect(core.gpr(kcore::sim::RA) == 0, uart_ops, "jump leaves no return address");
    ok &= expect(!core.halted(), uart_ops, "primary core does not halt");
    ok &= expect(trace::g_trace_manager.event_count() == 1 &&
                 trace::g_trace_manager.event(0).type == trace::EventType::CORE_BOOT,
                 uart_ops, "boot traced");
    return ok;
}

bool test_secondary_core_halts(kcore::hal::UARTDriverOps* uart_ops) {
    bool ok = true;
    for (uint32_t affinity : {1u, 2u, 3u, 0x3ffu}) {
        SimCore core(affinity);
        PerCPUData cpu;
        CoreState st = CoreBootstrap(cpu, malta_config()).run(core);
        ok &= expect(st == CoreState::HALTED, uart_ops, "non-zero affinity halts");
        ok &= expect(core.halted() && !core.entered_kernel(), uart_ops, "never reaches boot_main");
        ok &= expect(core.memory().writes().empty(), uart_ops, "halted core writes no memory");
        ok &= expect(core.gpr(kcore::sim::SP) == 0 && core.gpr(kcore::sim::GP) == 0, uart_ops,
                     "halted core sets up no stack");
        ok &= expect(cpu.affinity_id == affinity, uart_ops, "affinity recorded");
    }
    return ok;
}

bool test_bootstrap_runs_once(kcore::hal::UARTDriverOps* uart_ops) {
    PerCPUData primary;
    CountingBootOps ops0(0);
    CoreBootstrap boot0(primary, malta_config());
    boot0.run(ops0);
    int first_calls = ops0.calls;
    CoreState again = boot0.run(ops0);
    bool ok = expect(first_calls == 4, uart_ops, "primary path: read, sp, gp, jump");
    ok &= expect(again == CoreState::ACTIVE && ops0.calls == first_calls, uart_ops, "second run touches nothing");

    PerCPUData secondary;
    CountingBootOps ops1(1);
    CoreBootstrap boot1(secondary, malta_config());
    boot1.run(ops1);
    ok &= expect(ops1.calls == 2, uart_ops, "secondary path: read, halt");
    ok &= expect(boot1.run(ops1) == CoreState::HALTED && ops1.calls == 2, uart_ops, "halted is terminal");
    return ok;
}

bool test_transition_core_single_step(kcore::hal::UARTDriverOps* uart_ops) {
    PerCPUData cpu;
    bool ok = expect(!kcore::core::transition_core(cpu, CoreState::UNSTARTED), uart_ops, "cannot re-enter UNSTARTED");
    ok &= expect(kcore::core::transition_core(cpu, CoreState::HALTED), uart_ops, "first transition accepted");
    ok &= expect(!kcore::core::transition_core(cpu, CoreState::ACTIVE), uart_ops, "HALTED core cannot become ACTIVE");
    ok &= expect(cpu.state == CoreState::HALTED, uart_ops, "state unchanged by rejected transition");
    return ok;
}

bool test_secondaries_recorded_halted(kcore::hal::UARTDriverOps* uart_ops) {
    std::array<PerCPUData, kcore::core::MAX_CORES> cpus{};
    kcore::core::transition_core(cpus[0], CoreState::ACTIVE);
    trace::g_trace_manager.clear_trace();

    size_t marked = kcore::core::record_halted_secondaries(cpus, 0, kcore::core::MAX_CORES);
    bool ok = expect(marked == kcore::core::MAX_CORES - 1, uart_ops, "every other core marked");
    ok &= expect(cpus[0].state == CoreState::ACTIVE, uart_ops, "boot core stays ACTIVE");
    for (size_t i = 1; i < cpus.size(); ++i) {
        ok &= expect(cpus[i].state == CoreState::HALTED && cpus[i].affinity_id == i, uart_ops,
                     "secondary reported HALTED with its affinity");
    }
    ok &= expect(trace::g_trace_manager.event_count() == marked &&
                 trace::g_trace_manager.event(0).type == trace::EventType::CORE_HALT,
                 uart_ops, "each halt traced");
    ok &= expect(kcore::core::record_halted_secondaries(cpus, 0, kcore::core::MAX_CORES) == 0, uart_ops,
                 "already halted cores are left alone");

    std::array<PerCPUData, kcore::core::MAX_CORES> pair{};
    ok &= expect(kcore::core::record_halted_secondaries(pair, 1, 2) == 1, uart_ops, "only cores the platform has");
    ok &= expect(pair[0].state == CoreState::HALTED && pair[1].state == CoreState::UNSTARTED &&
                 pair[2].state == CoreState::UNSTARTED, uart_ops, "boot core and absent cores untouched");
    std::array<PerCPUData, kcore::core::MAX_CORES> wide{};
    ok &= expect(kcore::core::record_halted_secondaries(wide, 0, 64) == kcore::core::MAX_CORES - 1, uart_ops,
                 "core count clamped to MAX_CORES");
    return ok;
}

} // namespace

void register_bootstrap_tests(TestFramework& tf) {
    tf.register_test({"primary_core_enters_kernel", test_primary_core_enters_kernel, "affinity 0 boot path"});
    tf.register_test({"secondary_core_halts", test_secondary_core_halts, "non-zero affinity halt path"});
    tf.register_test({"bootstrap_runs_once", test_bootstrap_runs_once, "bootstrap is single-shot"});
    tf.register_test({"secondaries_recorded_halted", test_secondaries_recorded_halted, "boot_main core table"});
    tf.register_test({"transition_core_single_step", test_transition_core_single_step, "core state machine"});
}

} // namespace test
