// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file selftest.hpp
 * @brief Switch self-test run by boot_main and by the host test runner.
 */

#ifndef SELFTEST_HPP
#define SELFTEST_HPP

#include "hal.hpp"
#include <cstdint>

namespace kcore {
namespace selftest {

#if defined(__riscv)
// The kernel runs in M-mode, which satp does not translate, so Sv39 roots are inert
// but are stored as written.
constexpr uintptr_t WORKER_ONE_ROOT = ctx::rv64::make_satp(ctx::rv64::SATP_MODE_SV39, 0x1000);
constexpr uintptr_t WORKER_TWO_ROOT = ctx::rv64::make_satp(ctx::rv64::SATP_MODE_SV39, 0x2000);
#else
constexpr uintptr_t WORKER_ONE_ROOT = 0x1000;
constexpr uintptr_t WORKER_TWO_ROOT = 0x2000;
#endif

/**
 * @brief Ping-pongs the calling thread through two fresh worker threads.
 * @details Each round switches boot -> worker one -> worker two -> boot through
 * hal::cpu_context_switch(). Every thread checks that it runs with its own address-space
 * root and TLS pointer and that its own slot was consumed when it was resumed.
 * @return Number of failed checks; -1 if the platform has no context operations.
 */
int run_switch_selftest(hal::UARTDriverOps* uart_ops, uint32_t rounds);

} // namespace selftest
} // namespace kcore

#endif // SELFTEST_HPP
