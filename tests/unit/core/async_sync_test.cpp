#include <gtest/gtest.h>

#include <agentd/core/async_sync.h>

#include "../../common/async_test_helpers.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

using namespace agentd;
using namespace agentd::test;

namespace {

boost::asio::awaitable<void> sleepFor(std::chrono::milliseconds d) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(d);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

class AsyncSyncTest : public ::testing::Test, protected AsyncTestBase {};

} // namespace

TEST_F(AsyncSyncTest, EventWaitCompletesAfterSet) {
    AsyncEvent event;
    std::atomic<int> woken{0};
    for (int i = 0; i < 3; ++i) {
        boost::asio::co_spawn(
            executor(),
            [&]() -> boost::asio::awaitable<void> {
                co_await event.wait();
                woken.fetch_add(1);
            },
            boost::asio::detached);
    }

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(woken.load(), 0);
    EXPECT_FALSE(event.isSet());

    event.set();
    EXPECT_TRUE(waitForCondition([&] { return woken.load() == 3; }));
    EXPECT_TRUE(event.isSet());
}

TEST_F(AsyncSyncTest, EventWaitOnSetEventReturnsImmediately) {
    AsyncEvent event;
    event.set();
    event.set();
    run([&]() -> boost::asio::awaitable<void> { co_await event.wait(); }());
    SUCCEED();
}

TEST_F(AsyncSyncTest, MutexProvidesMutualExclusion) {
    AsyncMutex mutex;
    int inside = 0;
    int maxInside = 0;
    std::atomic<int> done{0};

    for (int i = 0; i < 8; ++i) {
        boost::asio::co_spawn(
            executor(),
            [&]() -> boost::asio::awaitable<void> {
                auto guard = co_await mutex.scopedLock();
                ++inside;
                maxInside = std::max(maxInside, inside);
                co_await sleepFor(2ms);
                --inside;
                done.fetch_add(1);
            },
            boost::asio::detached);
    }

    ASSERT_TRUE(waitForCondition([&] { return done.load() == 8; }));
    EXPECT_EQ(maxInside, 1);
    EXPECT_FALSE(mutex.isLocked());
}

TEST_F(AsyncSyncTest, MutexHandsOffInArrivalOrder) {
    AsyncMutex mutex;
    ASSERT_TRUE(mutex.tryLock());

    std::mutex orderMutex;
    std::vector<int> order;
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i) {
        boost::asio::co_spawn(
            executor(),
            [&, i]() -> boost::asio::awaitable<void> {
                co_await mutex.lock();
                {
                    std::lock_guard<std::mutex> lk(orderMutex);
                    order.push_back(i);
                }
                mutex.unlock();
                done.fetch_add(1);
            },
            boost::asio::detached);
        // Let each waiter park before the next one arrives
        std::this_thread::sleep_for(10ms);
    }

    mutex.unlock();
    ASSERT_TRUE(waitForCondition([&] { return done.load() == 4; }));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(AsyncSyncTest, UnlockWithoutLockThrows) {
    AsyncMutex mutex;
    EXPECT_THROW(mutex.unlock(), std::logic_error);
    ASSERT_TRUE(mutex.tryLock());
    EXPECT_FALSE(mutex.tryLock());
    mutex.unlock();
    EXPECT_FALSE(mutex.isLocked());
}

TEST_F(AsyncSyncTest, QueueAppliesBackPressureWhenFull) {
    AsyncQueue<int> queue(1);
    std::atomic<bool> secondPushed{false};

    boost::asio::co_spawn(
        executor(),
        [&]() -> boost::asio::awaitable<void> {
            co_await queue.push(1);
            co_await queue.push(2);
            secondPushed = true;
        },
        boost::asio::detached);

    ASSERT_TRUE(waitForCondition([&] { return queue.size() == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(secondPushed.load());

    auto first = run(queue.pop());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 1);
    EXPECT_TRUE(waitForCondition([&] { return secondPushed.load(); }));

    auto second = run(queue.pop());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 2);
}

TEST_F(AsyncSyncTest, ClosedQueueDrainsThenEnds) {
    AsyncQueue<std::string> queue(4);
    EXPECT_TRUE(run(queue.push("a")));
    EXPECT_TRUE(run(queue.push("b")));
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(run(queue.push("c")));
    EXPECT_EQ(run(queue.pop()), std::optional<std::string>("a"));
    EXPECT_EQ(run(queue.pop()), std::optional<std::string>("b"));
    EXPECT_FALSE(run(queue.pop()).has_value());
}

TEST_F(AsyncSyncTest, CloseWakesParkedConsumer) {
    AsyncQueue<int> queue(2);
    std::atomic<bool> ended{false};
    boost::asio::co_spawn(
        executor(),
        [&]() -> boost::asio::awaitable<void> {
            auto item = co_await queue.pop();
            ended = !item.has_value();
        },
        boost::asio::detached);

    std::this_thread::sleep_for(20ms);
    queue.close();
    EXPECT_TRUE(waitForCondition([&] { return ended.load(); }));
}
