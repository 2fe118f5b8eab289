// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file core.hpp
 * @brief Per-core state and bootstrap state machine for kcore.
 * @details
 * Defines the global constants, the per-core data block and the core lifecycle
 * (UNSTARTED -> ACTIVE | HALTED). Exactly one core, affinity 0, becomes ACTIVE; every
 * other core halts for good. The hardware rendition of the bootstrap lives in
 * hal/<arch>/boot.S; CoreBootstrap is the same decision sequence driven through
 * hal::BootOps, which the simulator implements.
 *
 * @see core.cpp, hal.hpp, arch_layout.h
 */

#ifndef CORE_HPP
#define CORE_HPP

#include "arch_layout.h"
#include "context.hpp"
#include <cstdint>
#include <cstddef>
#include <array>

namespace kcore { namespace hal { struct BootOps; struct UARTDriverOps; } }

namespace kcore {
namespace core {

// Global constants
constexpr size_t MAX_CORES = 4;
constexpr size_t MAX_NAME_LENGTH = 32;
constexpr size_t THREAD_STACK_SIZE = 16 * 1024;
constexpr uint32_t PRIMARY_AFFINITY_ID = 0;
constexpr uintptr_t BOOT_STACK_TOP = KCORE_BOOT_STACK_TOP;

enum class CoreState : uint8_t { UNSTARTED, ACTIVE, HALTED };

struct PerCPUData {
    CoreState state = CoreState::UNSTARTED;
    uint32_t affinity_id = 0;
    ctx::ContextSlot boot_context = ctx::EMPTY_SLOT; // boot thread while switched away
};

alignas(64) extern std::array<PerCPUData, MAX_CORES> g_per_cpu_data;

/**
 * @brief Moves a core out of UNSTARTED.
 * @return false if the core already left UNSTARTED or @p next is UNSTARTED.
 */
bool transition_core(PerCPUData& cpu, CoreState next) noexcept;

const char* core_state_name(CoreState state) noexcept;

/**
 * @brief Records the cores that boot.S halted at reset.
 * @details Every core below @p num_cores (clamped to MAX_CORES) other than
 * @p boot_core_id that is still UNSTARTED becomes HALTED.
 * @return Number of cores marked.
 */
size_t record_halted_secondaries(std::array<PerCPUData, MAX_CORES>& cpus, uint32_t boot_core_id,
                                 uint32_t num_cores) noexcept;

struct BootConfig {
    uintptr_t boot_stack_top = BOOT_STACK_TOP;
    uintptr_t global_data_base = 0; // linker symbol (_gp, __global_pointer$, ...)
    uintptr_t kernel_entry = 0;     // boot_main
};

class CoreBootstrap {
public:
    CoreBootstrap(PerCPUData& cpu, const BootConfig& cfg) noexcept : cpu_(cpu), cfg_(cfg) {}
    CoreBootstrap(const CoreBootstrap&) = delete;
    CoreBootstrap& operator=(const CoreBootstrap&) = delete;

    /**
     * @brief Runs the reset-time decision for one core.
     * @details Reads the affinity id; a non-zero id halts the core without any other
     * hardware access. Affinity 0 gets the boot stack and global-data pointer and is
     * handed to the kernel entry with a jump. A core that already left UNSTARTED is
     * not touched again.
     * @return The state the core ended in.
     */
    CoreState run(hal::BootOps& ops);

    CoreState state() const noexcept { return cpu_.state; }

private:
    PerCPUData& cpu_;
    BootConfig cfg_;
};

void dump_core_states(hal::UARTDriverOps* uart_ops);

} // namespace core
} // namespace kcore

#endif // CORE_HPP
