// ============================================================
// test_progress.cpp -- ProgressAggregator and subscriptions
// ============================================================

#include "../common/progress.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

TEST(ProgressTest, ConcurrentUpdatesSumExactly) {
    ProgressAggregator agg;
    const u32 workers = 8;
    const int rounds  = 20000;
    agg.begin(1, 0, workers);

    std::vector<std::thread> threads;
    std::atomic<u64> expected{0};
    for (u32 w = 0; w <= workers; ++w) {
        threads.emplace_back([&, w]() {
            u64 local = 0;
            for (int i = 0; i < rounds; ++i) {
                u64 delta = (u64)(i % 7) + w;
                agg.update(1, w, delta);
                local += delta;
                if (i % 1000 == 0) agg.snapshot(1);  // readers interleave with writers
            }
            expected += local;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(agg.snapshot(1).bytes_transferred, expected.load());
}

TEST(ProgressTest, OutOfRangeWorkerCountsOnPrimarySlot) {
    ProgressAggregator agg;
    agg.begin(2, 100, 1);
    agg.update(2, 1, 10);
    agg.update(2, 7, 5);
    EXPECT_EQ(agg.snapshot(2).bytes_transferred, 15u);
}

TEST(ProgressTest, RateAndEtaOverSlidingWindow) {
    ProgressAggregator agg;
    agg.begin(3, 1000, 0);

    ProgressSnapshot s = agg.snapshot_at(3, 10000);
    EXPECT_TRUE(s.valid);
    EXPECT_EQ(s.rate_bps, 0.0);
    EXPECT_EQ(s.eta_seconds, -1);

    agg.update(3, 0, 300);
    s = agg.snapshot_at(3, 11000);
    EXPECT_DOUBLE_EQ(s.rate_bps, 300.0);
    EXPECT_EQ(s.eta_seconds, 3);  // ceil(700 / 300)

    // Nothing moves for four seconds: the window forgets the burst
    s = agg.snapshot_at(3, 15000);
    EXPECT_EQ(s.bytes_transferred, 300u);
    EXPECT_EQ(s.rate_bps, 0.0);
    EXPECT_EQ(s.eta_seconds, -1);

    agg.update(3, 0, 700);
    s = agg.snapshot_at(3, 16000);
    EXPECT_EQ(s.eta_seconds, 0);
    EXPECT_DOUBLE_EQ(s.rate_bps, 140.0);  // 700 bytes since the 11 s baseline
}

TEST(ProgressTest, FinishAndEnd) {
    ProgressAggregator agg;
    agg.begin(4, 10, 2);
    EXPECT_TRUE(agg.contains(4));
    EXPECT_FALSE(agg.snapshot(4).terminal);

    agg.finish(4);
    EXPECT_TRUE(agg.snapshot(4).terminal);

    agg.end(4);
    EXPECT_FALSE(agg.contains(4));
    EXPECT_FALSE(agg.snapshot(4).valid);
    agg.update(4, 0, 1);  // ignored
    EXPECT_FALSE(agg.contains(4));
}

TEST(ProgressTest, SubscriptionStopsAtTerminalSnapshot) {
    ProgressAggregator agg;
    agg.begin(5, 100, 0);

    std::mutex mu;
    std::vector<ProgressSnapshot> seen;
    ProgressSubscription sub(agg, 5, [&](const ProgressSnapshot& s) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(s);
    }, 10);

    agg.update(5, 0, 40);
    ASSERT_TRUE(testutil::eventually([&] {
        std::lock_guard<std::mutex> lk(mu);
        return !seen.empty() && seen.back().bytes_transferred == 40;
    }, 2000));

    agg.update(5, 0, 60);
    agg.finish(5);
    ASSERT_TRUE(testutil::eventually([&] { return !sub.active(); }, 2000));

    std::lock_guard<std::mutex> lk(mu);
    EXPECT_TRUE(seen.back().terminal);
    EXPECT_EQ(seen.back().bytes_transferred, 100u);
}

TEST(ProgressTest, SubscriptionEndsForUnknownSession) {
    ProgressAggregator agg;
    std::atomic<int> calls{0};
    ProgressSubscription sub(agg, 99, [&](const ProgressSnapshot&) { ++calls; }, 10);
    ASSERT_TRUE(testutil::eventually([&] { return !sub.active(); }, 2000));
    EXPECT_EQ(calls.load(), 0);
}

TEST(ProgressTest, DestroyingSubscriptionStopsDelivery) {
    ProgressAggregator agg;
    agg.begin(6, 100, 0);
    std::atomic<int> calls{0};
    {
        ProgressSubscription sub(agg, 6, [&](const ProgressSnapshot&) { ++calls; }, 5);
        ASSERT_TRUE(testutil::eventually([&] { return calls.load() > 0; }, 2000));
    }
    int after = calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(calls.load(), after);
}
