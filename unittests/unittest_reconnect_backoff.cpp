/* SPDX-License-Identifier: MPL-2.0 */

#include "core/options.hpp"
#include "session/reconnect_backoff.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_interval_doubles_up_to_the_cap ()
{
    qlink::options_t options;
    options.reconnect_ivl = 100;
    options.reconnect_ivl_max = 1000;
    options.reconnect_max_attempts = 0;
    qlink::reconnect_backoff_t backoff (options);
    backoff.reset (0);

    //  Base intervals 100, 200, 400, 800, 1000, each plus jitter below
    //  the base and never above the cap.
    const int base[] = {100, 200, 400, 800, 1000, 1000};
    for (size_t i = 0; i < sizeof base / sizeof base[0]; i++) {
        const int ivl = backoff.next (0);
        TEST_ASSERT_GREATER_OR_EQUAL_INT (base[i], ivl);
        TEST_ASSERT_LESS_THAN_INT (base[i] + 100, ivl);
        TEST_ASSERT_LESS_OR_EQUAL_INT (1000, ivl);
    }
    TEST_ASSERT_EQUAL_INT (6, backoff.attempts ());
}

void test_without_cap_interval_stays_at_base ()
{
    qlink::options_t options;
    options.reconnect_ivl = 50;
    options.reconnect_ivl_max = 0;
    options.reconnect_max_attempts = 0;
    qlink::reconnect_backoff_t backoff (options);
    backoff.reset (0);

    for (int i = 0; i < 5; i++) {
        const int ivl = backoff.next (0);
        TEST_ASSERT_GREATER_OR_EQUAL_INT (50, ivl);
        TEST_ASSERT_LESS_THAN_INT (100, ivl);
    }
}

void test_gives_up_after_max_attempts ()
{
    qlink::options_t options;
    options.reconnect_ivl = 10;
    options.reconnect_max_attempts = 3;
    qlink::reconnect_backoff_t backoff (options);
    backoff.reset (0);

    TEST_ASSERT_TRUE (backoff.next (0) >= 0);
    TEST_ASSERT_TRUE (backoff.next (0) >= 0);
    TEST_ASSERT_TRUE (backoff.next (0) >= 0);
    TEST_ASSERT_EQUAL_INT (-1, backoff.next (0));
}

void test_gives_up_after_max_duration ()
{
    qlink::options_t options;
    options.reconnect_ivl = 10;
    options.reconnect_max_attempts = 0;
    options.reconnect_max_duration = 500;
    qlink::reconnect_backoff_t backoff (options);
    backoff.reset (1000);

    TEST_ASSERT_TRUE (backoff.next (1200) >= 0);
    TEST_ASSERT_TRUE (backoff.next (1499) >= 0);
    TEST_ASSERT_EQUAL_INT (-1, backoff.next (1500));
}

void test_reset_starts_a_new_episode ()
{
    qlink::options_t options;
    options.reconnect_ivl = 100;
    options.reconnect_ivl_max = 10000;
    options.reconnect_max_attempts = 2;
    qlink::reconnect_backoff_t backoff (options);
    backoff.reset (0);

    TEST_ASSERT_TRUE (backoff.next (0) >= 0);
    TEST_ASSERT_TRUE (backoff.next (0) >= 200);
    TEST_ASSERT_EQUAL_INT (-1, backoff.next (0));

    backoff.reset (0);
    TEST_ASSERT_EQUAL_INT (0, backoff.attempts ());
    const int ivl = backoff.next (0);
    TEST_ASSERT_GREATER_OR_EQUAL_INT (100, ivl);
    TEST_ASSERT_LESS_THAN_INT (200, ivl);
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_interval_doubles_up_to_the_cap);
    RUN_TEST (test_without_cap_interval_stays_at_base);
    RUN_TEST (test_gives_up_after_max_attempts);
    RUN_TEST (test_gives_up_after_max_duration);
    RUN_TEST (test_reset_starts_a_new_episode);
    return UNITY_END ();
}
