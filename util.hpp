// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file util.hpp
 * @brief Freestanding utility functions header for kcore.
 */

#ifndef UTIL_HPP
#define UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <cstdarg>

namespace kcore {
namespace util {

// Builtins lower to the freestanding_stubs.cpp symbols on target builds and to libc on the host.
inline void* kmemcpy(void* dest, const void* src, size_t count) noexcept {
    return __builtin_memcpy(dest, src, count);
}

inline void* kmemset(void* dest, int ch, size_t count) noexcept {
    return __builtin_memset(dest, ch, count);
}

inline size_t kstrlen(const char* str) noexcept {
    if (!str) return 0;
    return __builtin_strlen(str);
}

// Number to string conversion helpers
int int_to_str(int32_t value, char* buffer, size_t buffer_size, int base = 10) noexcept;
int uint_to_str(uint32_t value, char* buffer, size_t buffer_size, int base = 10) noexcept;
int uint64_to_str(uint64_t value, char* buffer, size_t buffer_size, int base = 10) noexcept;
int uint64_to_hex_str(uint64_t value, char* buffer, size_t buffer_size, bool leading_0x = true) noexcept;

// Simplified snprintf: %s %c %d %i %u %x %X %p, with an optional ll length modifier.
int k_vsnprintf(char* buffer, size_t bufsz, const char* format, va_list args) noexcept;
int k_snprintf(char* buffer, size_t bufsz, const char* format, ...) noexcept __attribute__((format(printf, 3, 4)));

template <typename T>
constexpr const T& min(const T& a, const T& b) { return (b < a) ? b : a; }

} // namespace util
} // namespace kcore

#endif // UTIL_HPP
