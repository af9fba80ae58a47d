#include <gtest/gtest.h>
#include <managers/quota_tracker.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "fakes.hpp"

using namespace std::chrono_literals;

TEST(QuotaTracker, AdmitsUpToLimit) {
    ManualClock clock;
    QuotaTracker q(3, std::chrono::minutes(60), std::chrono::minutes(10), clock.fn());

    EXPECT_EQ(q.remaining("alice"), 3);
    EXPECT_TRUE(q.try_admit("alice"));
    EXPECT_TRUE(q.try_admit("alice"));
    EXPECT_EQ(q.remaining("alice"), 1);
    EXPECT_TRUE(q.try_admit("alice"));
    EXPECT_FALSE(q.try_admit("alice"));
    EXPECT_EQ(q.remaining("alice"), 0);
}

TEST(QuotaTracker, UsersAreIndependent) {
    ManualClock clock;
    QuotaTracker q(1, std::chrono::minutes(60), std::chrono::minutes(10), clock.fn());

    EXPECT_TRUE(q.try_admit("alice"));
    EXPECT_FALSE(q.try_admit("alice"));
    EXPECT_TRUE(q.try_admit("bob"));
    EXPECT_EQ(q.tracked_users(), 2u);
}

TEST(QuotaTracker, WindowResetsAfterExpiry) {
    ManualClock clock;
    QuotaTracker q(2, std::chrono::minutes(60), std::chrono::minutes(10), clock.fn());

    EXPECT_TRUE(q.try_admit("alice"));
    clock.advance(20min);
    EXPECT_TRUE(q.try_admit("alice"));
    EXPECT_FALSE(q.try_admit("alice"));

    // Fixed window: anchored at the first request, not the latest
    clock.advance(40min);
    EXPECT_EQ(q.remaining("alice"), 2);
    EXPECT_TRUE(q.try_admit("alice"));
    EXPECT_EQ(q.remaining("alice"), 1);
}

TEST(QuotaTracker, ResetInOnlyWhenLimited) {
    ManualClock clock;
    QuotaTracker q(1, std::chrono::minutes(60), std::chrono::minutes(10), clock.fn());

    EXPECT_EQ(q.reset_in("alice"), 0s);
    EXPECT_TRUE(q.try_admit("alice"));
    clock.advance(15min);
    EXPECT_FALSE(q.try_admit("alice"));
    EXPECT_EQ(q.reset_in("alice"), std::chrono::seconds(45 * 60));

    clock.advance(45min);
    EXPECT_EQ(q.reset_in("alice"), 0s);
}

TEST(QuotaTracker, EvictsOnlyIdleWindows) {
    ManualClock clock;
    QuotaTracker q(5, std::chrono::minutes(60), std::chrono::minutes(10), clock.fn());

    q.try_admit("old");
    clock.advance(65min);
    q.try_admit("fresh");

    EXPECT_EQ(q.evict_idle(), 0u);  // "old" is past the window but inside the grace
    clock.advance(6min);
    EXPECT_EQ(q.evict_idle(), 1u);
    EXPECT_EQ(q.tracked_users(), 1u);

    // An evicted user starts over with a full allowance
    EXPECT_EQ(q.remaining("old"), 5);
    EXPECT_TRUE(q.try_admit("old"));
    EXPECT_EQ(q.remaining("old"), 4);
}

TEST(QuotaTracker, RejectsBadLimits) {
    EXPECT_THROW(QuotaTracker(0, std::chrono::minutes(60)), std::invalid_argument);
    EXPECT_THROW(QuotaTracker(5, std::chrono::minutes(0)), std::invalid_argument);
}

TEST(QuotaTracker, ConcurrentAdmitsNeverExceedLimit) {
    QuotaTracker q(50, std::chrono::minutes(60));
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                if (q.try_admit("shared")) ++admitted;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(admitted.load(), 50);
}

TEST(QuotaTracker, EvictionRacingAdmitsKeepsCounts) {
    QuotaTracker q(1000, std::chrono::minutes(1), std::chrono::minutes(0), steady_now());
    std::atomic<bool> stop{false};
    std::thread evictor([&] {
        while (!stop) q.evict_idle();
    });
    int admitted = 0;
    for (int i = 0; i < 500; ++i) {
        if (q.try_admit("user")) ++admitted;
    }
    stop = true;
    evictor.join();
    EXPECT_EQ(admitted, 500);
    EXPECT_EQ(q.remaining("user"), 500);
}
