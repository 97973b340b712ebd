#include "concurrency_limiter.hpp"
#include "test_support.hpp"
#include <mutex>

using namespace agentgate_test;

namespace {

TEST(ConcurrencyLimiterTest, AdmitsUpToCapacity) {
    ConcurrencyLimiter limiter(2);
    CancellationToken token;
    EXPECT_TRUE(limiter.acquire(token));
    EXPECT_TRUE(limiter.acquire(token));
    EXPECT_EQ(limiter.active(), 2);
    limiter.release();
    EXPECT_EQ(limiter.active(), 1);
}

TEST(ConcurrencyLimiterTest, WaitersServedInArrivalOrder) {
    ConcurrencyLimiter limiter(1);
    CancellationToken token;
    ASSERT_TRUE(limiter.acquire(token));

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; i++) {
        waiters.emplace_back([&, i] {
            ASSERT_TRUE(limiter.acquire(token));
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }
            limiter.release();
        });
        // Queue them one by one so arrival order is known
        while (limiter.queued() < i + 1) std::this_thread::sleep_for(1ms);
    }

    limiter.release();
    for (auto& t : waiters) t.join();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(limiter.active(), 0);
}

TEST(ConcurrencyLimiterTest, CancelledWaiterLeavesQueue) {
    ConcurrencyLimiter limiter(1);
    CancellationToken holder;
    ASSERT_TRUE(limiter.acquire(holder));

    CancellationToken waiter_token;
    std::atomic<bool> acquired{true};
    std::thread waiter([&] { acquired = limiter.acquire(waiter_token); });
    while (limiter.queued() < 1) std::this_thread::sleep_for(1ms);

    waiter_token.cancel();
    waiter.join();
    EXPECT_FALSE(acquired.load());
    EXPECT_EQ(limiter.queued(), 0);

    limiter.release();
    EXPECT_TRUE(limiter.acquire(holder));
}

TEST(ConcurrencyLimiterTest, PermitReleasesOnScopeExit) {
    ConcurrencyLimiter limiter(1);
    CancellationToken token;
    {
        ASSERT_TRUE(limiter.acquire(token));
        Permit p(&limiter);
        Permit moved(std::move(p));
        EXPECT_EQ(limiter.active(), 1);
    }
    EXPECT_EQ(limiter.active(), 0);
}

} // namespace
