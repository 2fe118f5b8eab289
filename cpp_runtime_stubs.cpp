// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file cpp_runtime_stubs.cpp
 * @brief Minimal C++ ABI support for the freestanding kernel image.
 * @details The kernel never allocates: the operator delete overloads exist only because
 * virtual destructors reference them. Static objects live for the whole uptime, so
 * __cxa_atexit registrations are dropped.
 */

#include <cstddef>
#include <cstdint>

#include "kcore.hpp"

[[noreturn]] static void runtime_panic(const char* msg) {
    if (kcore::g_platform) kcore::g_platform->panic(msg, __FILE__, __LINE__);
    early_uart_puts(msg);
    for (;;) {}
}

void operator delete(void* ptr) noexcept {
    if (ptr) runtime_panic("operator delete called in kernel image\n");
}
void operator delete(void* ptr, size_t) noexcept {
    if (ptr) runtime_panic("operator delete called in kernel image\n");
}

extern "C" {
    void* __dso_handle = nullptr;

    [[noreturn]] void __cxa_pure_virtual() {
        runtime_panic("pure virtual function call\n");
    }

    int __cxa_atexit(void (*func)(void*), void* arg, void* dso_handle) {
        (void)func; (void)arg; (void)dso_handle;
        return 0;
    }
}
