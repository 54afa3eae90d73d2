#include "test_common.h"
#include "codemode/security.h"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace codemode;

int main() {
    auto now = std::make_shared<std::atomic<int64_t>>(1000000);
    auto clock = [now] { return now->load(); };

    // Test 1: up to max_executions_per_minute allowed, then denied
    {
        SecurityManager sm(SecurityConfig{}, nullptr, clock);
        for (int i = 0; i < 60; i++) {
            expect_true(sm.check_rate_limit("alice"), "call " + std::to_string(i) + " should be allowed");
        }
        expect_true(!sm.check_rate_limit("alice"), "61st call should be denied");
        expect_true(!sm.check_rate_limit("alice"), "still denied");
        expect_eq_ll(sm.rate_limit_remaining("alice"), 0, "nothing remaining");
    }

    // Test 2: callers are tracked independently
    {
        SecurityConfig cfg;
        cfg.max_executions_per_minute = 2;
        SecurityManager sm(cfg, nullptr, clock);
        expect_true(sm.check_rate_limit("a"), "a #1");
        expect_true(sm.check_rate_limit("a"), "a #2");
        expect_true(!sm.check_rate_limit("a"), "a #3 denied");
        expect_true(sm.check_rate_limit("b"), "b unaffected");
        expect_eq_ll(sm.rate_limit_remaining("b"), 1, "b has one left");
        expect_eq_ll(sm.rate_limit_remaining("never-seen"), 2, "unknown caller has the full budget");
    }

    // Test 3: the window resets after 60 seconds
    {
        SecurityConfig cfg;
        cfg.max_executions_per_minute = 1;
        SecurityManager sm(cfg, nullptr, clock);
        expect_true(sm.check_rate_limit("w"), "first allowed");
        expect_true(!sm.check_rate_limit("w"), "second denied");
        now->fetch_add(SecurityManager::kRateWindowMs - 1);
        expect_true(!sm.check_rate_limit("w"), "still inside the window");
        now->fetch_add(1);
        expect_true(sm.check_rate_limit("w"), "new window");
        expect_eq_ll(sm.rate_limit_remaining("w"), 0, "new window counts the call");
    }

    // Test 4: a zero budget denies after the opening call of each window
    {
        SecurityConfig cfg;
        cfg.max_executions_per_minute = 0;
        SecurityManager sm(cfg, nullptr, clock);
        sm.check_rate_limit("z");
        expect_true(!sm.check_rate_limit("z"), "zero budget denies");
    }

    // Test 5: cleanup drops expired entries only
    {
        SecurityManager sm(SecurityConfig{}, nullptr, clock);
        sm.check_rate_limit("old");
        now->fetch_add(30000);
        sm.check_rate_limit("new");
        expect_eq_ll((long long)sm.tracked_callers(), 2, "two tracked");
        now->fetch_add(30000);
        sm.cleanup_rate_limits();
        expect_eq_ll((long long)sm.tracked_callers(), 1, "expired entry removed");
        expect_eq_ll(sm.rate_limit_remaining("new"), 59, "live entry kept");
        now->fetch_add(30000);
        sm.cleanup_rate_limits();
        expect_eq_ll((long long)sm.tracked_callers(), 0, "all expired");
    }

    // Test 6: expired entries are reaped during normal checks
    {
        SecurityManager sm(SecurityConfig{}, nullptr, clock);
        for (int i = 0; i < 100; i++) sm.check_rate_limit("burst-" + std::to_string(i));
        now->fetch_add(SecurityManager::kRateWindowMs);
        for (int i = 0; i < 300; i++) sm.check_rate_limit("steady");
        expect_eq_ll((long long)sm.tracked_callers(), 1, "stale callers reaped without cleanup()");
    }

    // Test 7: concurrent checks never over-admit
    {
        SecurityConfig cfg;
        cfg.max_executions_per_minute = 500;
        SecurityManager sm(cfg, nullptr, clock);
        std::atomic<int> allowed{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; t++) {
            threads.emplace_back([&] {
                for (int i = 0; i < 200; i++) {
                    if (sm.check_rate_limit("shared")) allowed.fetch_add(1);
                }
            });
        }
        for (auto& th : threads) th.join();
        expect_eq_ll(allowed.load(), 500, "exactly the budget admitted");
    }

    std::cerr << "test_rate_limit: ALL PASSED" << std::endl;
    return 0;
}
