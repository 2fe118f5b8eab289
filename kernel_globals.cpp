// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file kernel_globals.cpp
 * @brief Definitions of global kernel variables.
 */

#include "kcore.hpp"

namespace kcore {

// Global platform pointer (set by boot_main or the host test runner)
hal::Platform* g_platform = nullptr;

} // namespace kcore

namespace kcore {
namespace core {

alignas(64) std::array<PerCPUData, MAX_CORES> g_per_cpu_data;

} // namespace core
} // namespace kcore
