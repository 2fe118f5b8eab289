// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file kcore.hpp
 * @brief Main internal kernel header for kcore.
 * @details
 * Includes the core headers and the global definitions shared by kernel modules.
 */
#ifndef KCORE_HPP
#define KCORE_HPP

#include "core.hpp"    // kcore::core types
#include "context.hpp" // kcore::ctx types
#include "hal.hpp"     // kcore::hal interfaces
#include <cstdint>
#include <cstddef>

// Global kernel variables (defined in kernel_globals.cpp)
namespace kcore {
    extern hal::Platform* g_platform;
} // namespace kcore

// Platform console usable before g_platform is set (defined by each hal/ platform).
extern "C" void early_uart_puts(const char* str);

// Kernel entry reached from hal/<arch>/boot.S on the primary core.
extern "C" [[noreturn]] void boot_main();

#endif // KCORE_HPP
