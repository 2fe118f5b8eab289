// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file sim_core.hpp
 * @brief Register-level model of one MIPS32 core running the kcore bootstrap and switch.
 * @details
 * SimCore executes the same steps as hal/mipsel/boot.S and hal/mipsel/switch.S against a
 * modelled GPR file, the CP0 registers the kernel touches and a sparse physical memory
 * that logs every store. It lets the register-level behaviour of the reference
 * architecture be checked on a development host: which values land in which frame
 * word, in what order the slots are written, and that a halted core stores nothing.
 *
 * @see hal/mipsel/switch.S, hal/mipsel/boot.S, context.hpp
 */

#ifndef SIM_CORE_HPP
#define SIM_CORE_HPP

#include "context.hpp"
#include "hal.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <vector>

namespace kcore {
namespace sim {

struct MemoryWrite {
    uint32_t addr;
    uint32_t value;
};

class SimMemory {
public:
    uint32_t read32(uint32_t addr) const;
    /// Store performed by the modelled core; logged.
    void write32(uint32_t addr, uint32_t value);
    /// Test setup store; not logged.
    void load(uint32_t addr, uint32_t value) { words_[addr] = value; }

    const std::vector<MemoryWrite>& writes() const noexcept { return writes_; }
    void clear_log() noexcept { writes_.clear(); }

private:
    std::map<uint32_t, uint32_t> words_;
    std::vector<MemoryWrite> writes_;
};

/// o32 register numbers used by the kernel's assembly.
enum Reg : uint32_t {
    ZERO = 0, V0 = 2, A0 = 4, A1 = 5, T0 = 8, T1 = 9,
    S0 = 16, S1 = 17, S2 = 18, S3 = 19, S4 = 20, S5 = 21, S6 = 22, S7 = 23,
    GP = 28, SP = 29, S8 = 30, RA = 31
};

class SimCore : public hal::BootOps {
public:
    // Link addresses of the per-core kcore_root_page_table_ptr / kcore_cur_tls words.
    static constexpr uint32_t ROOT_REGISTER_ADDR = 0x80001000;
    static constexpr uint32_t TLS_REGISTER_ADDR = 0x80001004;
    // Link address of kcore_context_entry_trampoline in the modelled image.
    static constexpr uint32_t TRAMPOLINE_ADDR = 0x80000200;

    explicit SimCore(uint32_t cpu_num) noexcept : ebase_(0x80000000u | (cpu_num & KCORE_MIPS32_AFFINITY_MASK)) {}

    uint32_t gpr(uint32_t reg) const noexcept { return reg < gpr_.size() ? gpr_[reg] : 0; }
    void set_gpr(uint32_t reg, uint32_t value) noexcept;
    uint32_t pc() const noexcept { return pc_; }
    bool halted() const noexcept { return halted_; }
    bool entered_kernel() const noexcept { return entered_kernel_; }
    uint32_t user_local() const noexcept { return user_local_; }

    SimMemory& memory() noexcept { return mem_; }
    const SimMemory& memory() const noexcept { return mem_; }

    /// Installs a root and TLS value the way a previous switch would have left them.
    void load_control_registers(uint32_t root, uint32_t tls);
    uint32_t address_space_root() const { return mem_.read32(ROOT_REGISTER_ADDR); }
    uint32_t thread_local_pointer() const { return mem_.read32(TLS_REGISTER_ADDR); }

    // hal::BootOps
    uint32_t read_affinity_id() override { return ebase_ & KCORE_MIPS32_AFFINITY_MASK; }
    void set_stack_pointer(uintptr_t sp) override { set_gpr(SP, static_cast<uint32_t>(sp)); }
    void set_global_pointer(uintptr_t gp) override { set_gpr(GP, static_cast<uint32_t>(gp)); }
    void jump_to_kernel_entry(uintptr_t entry) override;
    void halt() override { halted_ = true; }

    /**
     * @brief Switch steps 1-4: pushes a frame and fills it from the live registers.
     * @return The frame address, which is the context handle.
     */
    uint32_t save_current_into_frame();

    /// Switch steps 7-8 for the frame at @p handle; sp must already equal @p handle.
    void restore_from(uint32_t handle);

    /**
     * @brief Executes switch_context(out, in) as if called with jal from @p return_pc.
     * @details On return pc holds the resumed thread's return address.
     */
    void switch_context(uint32_t out_slot_addr, uint32_t in_slot_addr, uint32_t return_pc);

    /// Synthesizes a fresh thread frame below @p stack_top; returns its handle.
    uint32_t make_initial_frame(uint32_t stack_top, uint32_t entry, uint32_t arg, uint32_t root, uint32_t tls);

    /// Runs kcore_context_entry_trampoline up to the call of entry(arg).
    /// @return false if pc is not at the trampoline.
    bool step_trampoline();

    ctx::mips32::Frame read_frame(uint32_t handle) const;

private:
    std::array<uint32_t, 32> gpr_{};
    uint32_t pc_ = 0xBFC00000; // reset vector
    uint32_t ebase_;
    uint32_t user_local_ = 0;
    bool halted_ = false;
    bool entered_kernel_ = false;
    SimMemory mem_;
};

} // namespace sim
} // namespace kcore

#endif // SIM_CORE_HPP
