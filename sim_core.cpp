// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file sim_core.cpp
 * @brief MIPS32 core model implementation for kcore.
 */

#include "sim_core.hpp"
#include "arch_layout.h"

namespace kcore {
namespace sim {

uint32_t SimMemory::read32(uint32_t addr) const {
    auto it = words_.find(addr);
    return it == words_.end() ? 0 : it->second;
}

void SimMemory::write32(uint32_t addr, uint32_t value) {
    words_[addr] = value;
    writes_.push_back({addr, value});
}

void SimCore::set_gpr(uint32_t reg, uint32_t value) noexcept {
    if (reg == ZERO || reg >= gpr_.size()) return;
    gpr_[reg] = value;
}

void SimCore::load_control_registers(uint32_t root, uint32_t tls) {
    mem_.load(ROOT_REGISTER_ADDR, root);
    mem_.load(TLS_REGISTER_ADDR, tls);
    user_local_ = tls;
}

void SimCore::jump_to_kernel_entry(uintptr_t entry) {
    // j boot_main: no link register update.
    pc_ = static_cast<uint32_t>(entry);
    entered_kernel_ = true;
}

uint32_t SimCore::save_current_into_frame() {
    uint32_t sp = gpr_[SP] - KCORE_MIPS32_CTX_SIZE;
    gpr_[SP] = sp;
    mem_.write32(sp + KCORE_MIPS32_CTX_RA, gpr_[RA]);
    for (uint32_t i = 0; i < 8; ++i) {
        mem_.write32(sp + KCORE_MIPS32_CTX_S0 + i * KCORE_MIPS32_CTX_WORD, gpr_[S0 + i]);
    }
    mem_.write32(sp + KCORE_MIPS32_CTX_S0 + 8 * KCORE_MIPS32_CTX_WORD, gpr_[S8]);
    mem_.write32(sp + KCORE_MIPS32_CTX_GP, gpr_[GP]);

    gpr_[T0] = mem_.read32(ROOT_REGISTER_ADDR);
    mem_.write32(sp + KCORE_MIPS32_CTX_ROOT, gpr_[T0]);
    gpr_[T1] = mem_.read32(TLS_REGISTER_ADDR);
    mem_.write32(sp + KCORE_MIPS32_CTX_TLS, gpr_[T1]);
    return sp;
}

void SimCore::restore_from(uint32_t handle) {
    gpr_[T0] = mem_.read32(handle + KCORE_MIPS32_CTX_ROOT);
    mem_.write32(ROOT_REGISTER_ADDR, gpr_[T0]);
    gpr_[T1] = mem_.read32(handle + KCORE_MIPS32_CTX_TLS);
    mem_.write32(TLS_REGISTER_ADDR, gpr_[T1]);
    user_local_ = gpr_[T1];

    for (uint32_t i = 0; i < 8; ++i) {
        gpr_[S0 + i] = mem_.read32(handle + KCORE_MIPS32_CTX_S0 + i * KCORE_MIPS32_CTX_WORD);
    }
    gpr_[S8] = mem_.read32(handle + KCORE_MIPS32_CTX_S0 + 8 * KCORE_MIPS32_CTX_WORD);
    gpr_[GP] = mem_.read32(handle + KCORE_MIPS32_CTX_GP);
    gpr_[RA] = mem_.read32(handle + KCORE_MIPS32_CTX_RA);
}

void SimCore::switch_context(uint32_t out_slot_addr, uint32_t in_slot_addr, uint32_t return_pc) {
    gpr_[A0] = out_slot_addr;
    gpr_[A1] = in_slot_addr;
    gpr_[RA] = return_pc;

    uint32_t handle = save_current_into_frame();
    mem_.write32(gpr_[A0], handle);

    gpr_[SP] = mem_.read32(gpr_[A1]);
    restore_from(gpr_[SP]);
    gpr_[SP] += KCORE_MIPS32_CTX_SIZE;
    mem_.write32(gpr_[A1], 0);
    pc_ = gpr_[RA];
}

uint32_t SimCore::make_initial_frame(uint32_t stack_top, uint32_t entry, uint32_t arg, uint32_t root, uint32_t tls) {
    uint32_t top = stack_top & ~static_cast<uint32_t>(KCORE_MIPS32_STACK_ALIGN - 1);
    top -= KCORE_CTX_ENTRY_RESERVE;
    uint32_t sp = top - KCORE_MIPS32_CTX_SIZE;
    for (uint32_t off = 0; off < KCORE_MIPS32_CTX_SIZE; off += KCORE_MIPS32_CTX_WORD) {
        mem_.write32(sp + off, 0);
    }
    mem_.write32(sp + KCORE_MIPS32_CTX_RA, TRAMPOLINE_ADDR);
    mem_.write32(sp + KCORE_MIPS32_CTX_S0, entry);
    mem_.write32(sp + KCORE_MIPS32_CTX_S0 + KCORE_MIPS32_CTX_WORD, arg);
    mem_.write32(sp + KCORE_MIPS32_CTX_ROOT, root);
    mem_.write32(sp + KCORE_MIPS32_CTX_TLS, tls);
    mem_.write32(sp + KCORE_MIPS32_CTX_GP, gpr_[GP]);
    return sp;
}

bool SimCore::step_trampoline() {
    if (pc_ != TRAMPOLINE_ADDR) return false;
    gpr_[A0] = gpr_[S1];            // move a0, s1
    gpr_[RA] = TRAMPOLINE_ADDR + 12; // jalr s0 at +4, delay slot at +8
    pc_ = gpr_[S0];
    return true;
}

ctx::mips32::Frame SimCore::read_frame(uint32_t handle) const {
    ctx::mips32::Frame f{};
    f.ra = mem_.read32(handle + KCORE_MIPS32_CTX_RA);
    f.root = mem_.read32(handle + KCORE_MIPS32_CTX_ROOT);
    f.tls = mem_.read32(handle + KCORE_MIPS32_CTX_TLS);
    f.reserved = mem_.read32(handle + KCORE_MIPS32_CTX_TLS + KCORE_MIPS32_CTX_WORD);
    for (uint32_t i = 0; i < KCORE_MIPS32_CTX_NUM_SAVED; ++i) {
        f.s[i] = mem_.read32(handle + KCORE_MIPS32_CTX_S0 + i * KCORE_MIPS32_CTX_WORD);
    }
    f.gp = mem_.read32(handle + KCORE_MIPS32_CTX_GP);
    return f;
}

} // namespace sim
} // namespace kcore
