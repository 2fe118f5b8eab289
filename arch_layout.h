/* SPDX-License-Identifier: MIT OR Apache-2.0 */
/**
 * @file arch_layout.h
 * @brief Saved-context frame layouts and boot constants shared by assembly and C++.
 * @details
 * Every architecture saves the same roles into its switch frame: return address,
 * address-space root, thread-local-storage pointer, global-data pointer and the
 * callee-saved registers of its calling convention. Offsets are in bytes from the
 * frame base, which is also the value published into a context slot.
 *
 * This header is included from .S files, so it must stay plain preprocessor.
 *
 * @see context.hpp, hal/<arch>/switch.S, hal/<arch>/boot.S
 */

#ifndef ARCH_LAYOUT_H
#define ARCH_LAYOUT_H

/* --- MIPS32 o32 (reference architecture) --- */
#define KCORE_MIPS32_CTX_WORD       4
#define KCORE_MIPS32_CTX_RA         (0 * 4)
#define KCORE_MIPS32_CTX_ROOT       (1 * 4)
#define KCORE_MIPS32_CTX_TLS        (2 * 4)
/* word 3 is padding */
#define KCORE_MIPS32_CTX_S0         (4 * 4)   /* s0..s7, s8(fp): 9 words */
#define KCORE_MIPS32_CTX_GP         (13 * 4)
#define KCORE_MIPS32_CTX_SIZE       (14 * 4)
#define KCORE_MIPS32_CTX_NUM_SAVED  9
#define KCORE_MIPS32_STACK_ALIGN    8
#define KCORE_MIPS32_AFFINITY_MASK  0x3ff     /* EBase.CPUNum */

/* --- RISC-V 64 --- */
#define KCORE_RV64_CTX_WORD         8
#define KCORE_RV64_CTX_RA           (0 * 8)
#define KCORE_RV64_CTX_ROOT         (1 * 8)   /* satp */
#define KCORE_RV64_CTX_TLS          (2 * 8)   /* tp */
#define KCORE_RV64_CTX_GP           (3 * 8)
#define KCORE_RV64_CTX_S0           (4 * 8)   /* s0..s11: 12 words */
#define KCORE_RV64_CTX_SIZE         (16 * 8)
#define KCORE_RV64_CTX_NUM_SAVED    12
#define KCORE_RV64_STACK_ALIGN      16

/* --- AArch64 --- */
#define KCORE_A64_CTX_WORD          8
#define KCORE_A64_CTX_RA            (0 * 8)   /* x30 */
#define KCORE_A64_CTX_ROOT          (1 * 8)   /* TTBR0_EL1 */
#define KCORE_A64_CTX_TLS           (2 * 8)   /* TPIDR_EL0 */
#define KCORE_A64_CTX_GP            (3 * 8)   /* x18, reserved with -ffixed-x18 */
#define KCORE_A64_CTX_FP            (4 * 8)   /* x29 */
#define KCORE_A64_CTX_X19           (5 * 8)   /* x19..x28: 10 words */
/* word 15 is padding */
#define KCORE_A64_CTX_SIZE          (16 * 8)
#define KCORE_A64_CTX_NUM_SAVED     11
#define KCORE_A64_STACK_ALIGN       16
#define KCORE_A64_AFFINITY_MASK     0xff      /* MPIDR_EL1.Aff0 */

/* --- x86-64 hosted: the frame is pushed below the caller's return address --- */
#define KCORE_X64_CTX_WORD          8
#define KCORE_X64_CTX_ROOT          (0 * 8)
#define KCORE_X64_CTX_TLS           (1 * 8)
#define KCORE_X64_CTX_R15           (2 * 8)
#define KCORE_X64_CTX_R14           (3 * 8)
#define KCORE_X64_CTX_R13           (4 * 8)
#define KCORE_X64_CTX_R12           (5 * 8)
#define KCORE_X64_CTX_RBX           (6 * 8)
#define KCORE_X64_CTX_RBP           (7 * 8)
#define KCORE_X64_CTX_RA            (8 * 8)
#define KCORE_X64_CTX_SIZE          (9 * 8)
#define KCORE_X64_CTX_NUM_SAVED     6
#define KCORE_X64_STACK_ALIGN       16
/* kcore_host_cpu_regs field offsets */
#define KCORE_X64_CPU_ROOT          0
#define KCORE_X64_CPU_TLS           8

/*
 * Native selection. KCORE_CTX_ENTRY / KCORE_CTX_ARG name the callee-saved slots a
 * synthesized thread frame uses to hand entry function and argument to
 * kcore_context_entry_trampoline.
 */
#if defined(__mips__)
#define KCORE_CTX_SIZE              KCORE_MIPS32_CTX_SIZE
#define KCORE_CTX_RA                KCORE_MIPS32_CTX_RA
#define KCORE_CTX_ROOT              KCORE_MIPS32_CTX_ROOT
#define KCORE_CTX_TLS               KCORE_MIPS32_CTX_TLS
#define KCORE_CTX_ENTRY             (KCORE_MIPS32_CTX_S0 + 0 * 4)   /* s0 */
#define KCORE_CTX_ARG               (KCORE_MIPS32_CTX_S0 + 1 * 4)   /* s1 */
#define KCORE_STACK_ALIGN           KCORE_MIPS32_STACK_ALIGN
#elif defined(__riscv) && (__riscv_xlen == 64)
#define KCORE_CTX_SIZE              KCORE_RV64_CTX_SIZE
#define KCORE_CTX_RA                KCORE_RV64_CTX_RA
#define KCORE_CTX_ROOT              KCORE_RV64_CTX_ROOT
#define KCORE_CTX_TLS               KCORE_RV64_CTX_TLS
#define KCORE_CTX_ENTRY             (KCORE_RV64_CTX_S0 + 0 * 8)     /* s0 */
#define KCORE_CTX_ARG               (KCORE_RV64_CTX_S0 + 1 * 8)     /* s1 */
#define KCORE_STACK_ALIGN           KCORE_RV64_STACK_ALIGN
#elif defined(__aarch64__)
#define KCORE_CTX_SIZE              KCORE_A64_CTX_SIZE
#define KCORE_CTX_RA                KCORE_A64_CTX_RA
#define KCORE_CTX_ROOT              KCORE_A64_CTX_ROOT
#define KCORE_CTX_TLS               KCORE_A64_CTX_TLS
#define KCORE_CTX_ENTRY             (KCORE_A64_CTX_X19 + 0 * 8)     /* x19 */
#define KCORE_CTX_ARG               (KCORE_A64_CTX_X19 + 1 * 8)     /* x20 */
#define KCORE_STACK_ALIGN           KCORE_A64_STACK_ALIGN
#elif defined(__x86_64__)
#define KCORE_CTX_SIZE              KCORE_X64_CTX_SIZE
#define KCORE_CTX_RA                KCORE_X64_CTX_RA
#define KCORE_CTX_ROOT              KCORE_X64_CTX_ROOT
#define KCORE_CTX_TLS               KCORE_X64_CTX_TLS
#define KCORE_CTX_ENTRY             KCORE_X64_CTX_R12
#define KCORE_CTX_ARG               KCORE_X64_CTX_R13
#define KCORE_STACK_ALIGN           KCORE_X64_STACK_ALIGN
#endif

/* Bytes left above a synthesized frame: o32 argument home area, x86-64 call alignment. */
#define KCORE_CTX_ENTRY_RESERVE     16

/*
 * Physical boot stack: 8 MiB above the start of RAM. The kernel image has to fit
 * below it. Override with -DKCORE_BOOT_STACK_TOP=... when the board differs.
 */
#ifndef KCORE_BOOT_STACK_TOP
#if defined(__mips__)
#define KCORE_BOOT_STACK_TOP        0x80800000
#elif defined(__riscv)
#define KCORE_BOOT_STACK_TOP        0x80800000
#elif defined(__aarch64__)
#define KCORE_BOOT_STACK_TOP        0x40800000
#else
#define KCORE_BOOT_STACK_TOP        0x80800000
#endif
#endif

#endif /* ARCH_LAYOUT_H */
