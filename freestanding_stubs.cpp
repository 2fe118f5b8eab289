// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file freestanding_stubs.cpp
 * @brief Freestanding implementations of the C library functions the compiler may emit calls to.
 * @details Linked into target images only; the host build uses libc. Built with
 * -fno-tree-loop-distribute-patterns so the loops below are not turned back into calls
 * to themselves.
 */

#include <cstddef>
#include <cstdint>

extern "C" {

void* memcpy(void* dest_ptr, const void* src_ptr, size_t count) {
    auto* dest = static_cast<unsigned char*>(dest_ptr);
    const auto* src = static_cast<const unsigned char*>(src_ptr);
    for (size_t i = 0; i < count; ++i) dest[i] = src[i];
    return dest_ptr;
}

void* memmove(void* dest_ptr, const void* src_ptr, size_t count) {
    auto* dest = static_cast<unsigned char*>(dest_ptr);
    const auto* src = static_cast<const unsigned char*>(src_ptr);
    if (dest == src || count == 0) return dest_ptr;
    if (dest < src) {
        for (size_t i = 0; i < count; ++i) dest[i] = src[i];
    } else {
        for (size_t i = count; i > 0; --i) dest[i - 1] = src[i - 1];
    }
    return dest_ptr;
}

void* memset(void* dest_ptr, int ch_int, size_t count) {
    auto* dest = static_cast<unsigned char*>(dest_ptr);
    auto ch = static_cast<unsigned char>(ch_int);
    for (size_t i = 0; i < count; ++i) dest[i] = ch;
    return dest_ptr;
}

int memcmp(const void* ptr1, const void* ptr2, size_t count) {
    const auto* p1 = static_cast<const unsigned char*>(ptr1);
    const auto* p2 = static_cast<const unsigned char*>(ptr2);
    for (size_t i = 0; i < count; ++i) {
        if (p1[i] != p2[i]) return (p1[i] < p2[i]) ? -1 : 1;
    }
    return 0;
}

size_t strlen(const char* str) {
    size_t len = 0;
    while (str[len] != '\0') len++;
    return len;
}

} // extern "C"
