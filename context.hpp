// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file context.hpp
 * @brief Saved thread context, context slots and the switch primitive contract for kcore.
 * @details
 * A Context is the register frame a suspended thread left on its own stack. The frame
 * address is the whole handle: a ContextSlot holds either that address (resident) or
 * EMPTY_SLOT (the thread is running, or was never suspended).
 *
 * switch_context() is implemented per architecture in hal/<arch>/switch.S. It must be
 * called with interrupts masked and never re-entrantly; it validates nothing.
 *
 * @see arch_layout.h, hal.hpp
 */

#ifndef CONTEXT_HPP
#define CONTEXT_HPP

#include "arch_layout.h"
#include <cstdint>
#include <cstddef>

namespace kcore {
namespace ctx {

using ContextSlot = uintptr_t;
constexpr ContextSlot EMPTY_SLOT = 0;

using ThreadEntry = void (*)(void*);

namespace mips32 {
struct Frame {
    uint32_t ra;
    uint32_t root;
    uint32_t tls;
    uint32_t reserved;
    uint32_t s[KCORE_MIPS32_CTX_NUM_SAVED]; // s0..s7, s8/fp
    uint32_t gp;
};
static_assert(sizeof(Frame) == KCORE_MIPS32_CTX_SIZE, "MIPS32 frame size mismatch");
static_assert(offsetof(Frame, ra) == KCORE_MIPS32_CTX_RA);
static_assert(offsetof(Frame, root) == KCORE_MIPS32_CTX_ROOT);
static_assert(offsetof(Frame, tls) == KCORE_MIPS32_CTX_TLS);
static_assert(offsetof(Frame, s) == KCORE_MIPS32_CTX_S0);
static_assert(offsetof(Frame, gp) == KCORE_MIPS32_CTX_GP);
static_assert(KCORE_MIPS32_CTX_SIZE % KCORE_MIPS32_STACK_ALIGN == 0);
} // namespace mips32

namespace rv64 {
struct Frame {
    uint64_t ra;
    uint64_t root; // satp
    uint64_t tls;  // tp
    uint64_t gp;
    uint64_t s[KCORE_RV64_CTX_NUM_SAVED];
};
static_assert(sizeof(Frame) == KCORE_RV64_CTX_SIZE, "RV64 frame size mismatch");
static_assert(offsetof(Frame, root) == KCORE_RV64_CTX_ROOT);
static_assert(offsetof(Frame, tls) == KCORE_RV64_CTX_TLS);
static_assert(offsetof(Frame, gp) == KCORE_RV64_CTX_GP);
static_assert(offsetof(Frame, s) == KCORE_RV64_CTX_S0);
static_assert(KCORE_RV64_CTX_SIZE % KCORE_RV64_STACK_ALIGN == 0);

// satp holds a non-zero PPN only with a paging MODE; Bare with PPN != 0 is unspecified.
constexpr uint64_t SATP_MODE_BARE = 0;
constexpr uint64_t SATP_MODE_SV39 = 8;
constexpr uint64_t SATP_PPN_MASK = (1ULL << 44) - 1;

/// satp value for a root page table at physical address @p table_pa (ASID 0).
constexpr uint64_t make_satp(uint64_t mode, uint64_t table_pa) noexcept {
    return (mode << 60) | ((table_pa >> 12) & SATP_PPN_MASK);
}
} // namespace rv64

namespace a64 {
struct Frame {
    uint64_t ra;   // x30
    uint64_t root; // TTBR0_EL1
    uint64_t tls;  // TPIDR_EL0
    uint64_t gp;   // x18
    uint64_t fp;   // x29
    uint64_t x19_x28[10];
    uint64_t reserved;
};
static_assert(sizeof(Frame) == KCORE_A64_CTX_SIZE, "AArch64 frame size mismatch");
static_assert(offsetof(Frame, root) == KCORE_A64_CTX_ROOT);
static_assert(offsetof(Frame, tls) == KCORE_A64_CTX_TLS);
static_assert(offsetof(Frame, gp) == KCORE_A64_CTX_GP);
static_assert(offsetof(Frame, fp) == KCORE_A64_CTX_FP);
static_assert(offsetof(Frame, x19_x28) == KCORE_A64_CTX_X19);
static_assert(KCORE_A64_CTX_SIZE % KCORE_A64_STACK_ALIGN == 0);
} // namespace a64

namespace x64 {
struct Frame {
    uint64_t root;
    uint64_t tls;
    uint64_t r15, r14, r13, r12, rbx, rbp;
    uint64_t ra; // pushed by the caller's call instruction
};
static_assert(sizeof(Frame) == KCORE_X64_CTX_SIZE, "x86-64 frame size mismatch");
static_assert(offsetof(Frame, r12) == KCORE_X64_CTX_R12);
static_assert(offsetof(Frame, rbp) == KCORE_X64_CTX_RBP);
static_assert(offsetof(Frame, ra) == KCORE_X64_CTX_RA);
} // namespace x64

#if defined(__mips__)
using Frame = mips32::Frame;
#elif defined(__riscv) && (__riscv_xlen == 64)
using Frame = rv64::Frame;
#elif defined(__aarch64__)
using Frame = a64::Frame;
#elif defined(__x86_64__)
using Frame = x64::Frame;
#endif

#if defined(KCORE_CTX_SIZE)
#define KCORE_HAS_NATIVE_CONTEXT 1

static_assert(sizeof(Frame) == KCORE_CTX_SIZE);
static_assert(sizeof(ContextSlot) == sizeof(void*), "a context slot is one machine word");

/**
 * @brief Read-only view of a resident context.
 * @note Valid only while the slot it was taken from still holds the same handle.
 */
class Context {
public:
    constexpr Context() noexcept = default;
    explicit constexpr Context(ContextSlot handle) noexcept : sp_(handle) {}

    static Context from_slot(const ContextSlot& slot) noexcept { return Context(slot); }

    bool is_resident() const noexcept { return sp_ != EMPTY_SLOT; }
    const Frame& frame() const noexcept { return *reinterpret_cast<const Frame*>(sp_); }

    uintptr_t return_address() const noexcept { return static_cast<uintptr_t>(frame().ra); }
    uintptr_t address_space_root() const noexcept { return static_cast<uintptr_t>(frame().root); }
    uintptr_t thread_local_pointer() const noexcept { return static_cast<uintptr_t>(frame().tls); }

private:
    ContextSlot sp_ = EMPTY_SLOT;
};

/**
 * @brief Builds the frame a fresh thread is first switched into.
 * @details The frame is shaped exactly like one switch_context() saved: its return
 * address is kcore_context_entry_trampoline, which calls entry(arg).
 * @return Handle to store in the thread's context slot, or EMPTY_SLOT if the stack is
 *         missing or too small.
 */
ContextSlot make_initial_frame(void* stack_base, size_t stack_size, ThreadEntry entry, void* arg,
                               uintptr_t address_space_root, uintptr_t thread_local_pointer) noexcept;

constexpr size_t MIN_THREAD_STACK = KCORE_CTX_SIZE + KCORE_CTX_ENTRY_RESERVE + 256;

#endif // KCORE_CTX_SIZE

} // namespace ctx
} // namespace kcore

// The build defines KCORE_HAVE_SWITCH when a hal/<arch>/switch.S is linked in.
extern "C" {
    // hal/<arch>/switch.S
    void switch_context(kcore::ctx::ContextSlot* out_slot, kcore::ctx::ContextSlot* in_slot);
    void kcore_context_entry_trampoline();
    // context.cpp
    [[noreturn]] void kcore_context_entry_returned();
}

#endif // CONTEXT_HPP
