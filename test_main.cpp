// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_main.cpp
 * @brief Host entry point for the kcore unit tests.
 */

#include "test_framework.hpp"
#include "kcore.hpp"
#include "trace.hpp"

int main() {
    kcore::g_platform = kcore::hal::get_platform();
    kcore::g_platform->early_init_platform();
    trace::g_trace_manager.init();
    trace::g_trace_manager.set_enabled(true);

    test::TestFramework tf;
    test::register_util_tests(tf);
    test::register_context_tests(tf);
    test::register_bootstrap_tests(tf);
    test::register_sim_tests(tf);
    test::register_switch_tests(tf);

    int failures = tf.run_all_tests(kcore::g_platform->get_uart_ops());
    return failures == 0 ? 0 : 1;
}
