#include <gtest/gtest.h>

#include <agentd/server/components/Session.h>

#include "../../common/async_test_helpers.h"

#include <atomic>
#include <memory>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace agentd;
using namespace agentd::test;

namespace {

class SessionTest : public ::testing::Test, protected AsyncTestBase {
protected:
    std::shared_ptr<Session> makeSession(Session::Job job) {
        auto processor = std::make_shared<SessionEventProcessor>("ctx-1", "task-1", storage);
        return std::make_shared<Session>(executor(), processor, std::move(job));
    }

    std::shared_ptr<InMemoryTaskStorage> storage = std::make_shared<InMemoryTaskStorage>();
};

boost::asio::awaitable<void> sleepFor(std::chrono::milliseconds d) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, d);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

} // namespace

TEST_F(SessionTest, StartRunsJobOnce) {
    std::atomic<int> runs{0};
    auto session = makeSession([&]() -> boost::asio::awaitable<void> {
        ++runs;
        co_return;
    });
    EXPECT_EQ(session->jobState(), Session::JobState::NotStarted);

    session->start();
    session->start();
    run(session->join());

    EXPECT_EQ(runs.load(), 1);
    EXPECT_TRUE(session->isFinished());
    EXPECT_TRUE(session->isClosed());
    EXPECT_TRUE(session->eventProcessor()->isClosed());
    EXPECT_FALSE(session->failure());
}

TEST_F(SessionTest, JoinStartsAnUnstartedSession) {
    std::atomic<bool> ran{false};
    auto session = makeSession([&]() -> boost::asio::awaitable<void> {
        ran = true;
        co_return;
    });
    run(session->join());
    EXPECT_TRUE(ran.load());
}

TEST_F(SessionTest, CloseBeforeStartFinishesWithoutRunning) {
    std::atomic<bool> ran{false};
    auto session = makeSession([&]() -> boost::asio::awaitable<void> {
        ran = true;
        co_return;
    });
    run(session->close());

    EXPECT_TRUE(session->isFinished());
    EXPECT_TRUE(session->isClosed());
    EXPECT_TRUE(session->stopToken().stop_requested());

    session->start();
    run(session->join());
    EXPECT_FALSE(ran.load());
}

TEST_F(SessionTest, RecordsJobFailure) {
    auto session = makeSession([]() -> boost::asio::awaitable<void> {
        throw std::runtime_error("boom");
        co_return;
    });
    run(session->join());

    auto failure = session->failure();
    ASSERT_TRUE(failure);
    EXPECT_THROW(std::rethrow_exception(failure), std::runtime_error);
}

TEST_F(SessionTest, CloseRequestsStopOfRunningJob) {
    std::atomic<bool> observedStop{false};
    std::shared_ptr<Session> session;
    session = makeSession([&]() -> boost::asio::awaitable<void> {
        auto token = session->stopToken();
        while (!token.stop_requested()) {
            co_await sleepFor(5ms);
        }
        observedStop = true;
    });
    session->start();
    ASSERT_TRUE(waitForCondition([&] { return session->isStarted(); }));

    run(session->close());
    run(session->join());
    EXPECT_TRUE(observedStop.load());
}

TEST_F(SessionTest, PublishAfterCloseFailsTheJob) {
    auto release = std::make_shared<AsyncEvent>();
    std::shared_ptr<Session> session;
    session = makeSession([&]() -> boost::asio::awaitable<void> {
        co_await release->wait();
        co_await session->eventProcessor()->sendTaskEvent(makeTask("task-1", "ctx-1"));
    });
    session->start();

    run(session->close());
    release->set();
    run(session->join());

    auto failure = session->failure();
    ASSERT_TRUE(failure);
    try {
        std::rethrow_exception(failure);
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SessionClosed);
    }
}

TEST_F(SessionTest, ConcurrentClosesAllComplete) {
    auto session = makeSession([]() -> boost::asio::awaitable<void> {
        co_await sleepFor(20ms);
    });
    session->start();

    auto a = boost::asio::co_spawn(executor(), session->close(), boost::asio::use_future);
    auto b = boost::asio::co_spawn(executor(), session->close(), boost::asio::use_future);
    auto c = boost::asio::co_spawn(executor(), session->close(), boost::asio::use_future);
    for (auto* f : {&a, &b, &c}) {
        ASSERT_EQ(f->wait_for(5s), std::future_status::ready);
        EXPECT_NO_THROW(f->get());
    }
    EXPECT_TRUE(session->isClosed());
    run(session->join());
}

TEST(SessionConstructionTest, RequiresEventProcessor) {
    boost::asio::io_context io;
    EXPECT_THROW(Session(io.get_executor(), nullptr, {}), std::invalid_argument);
}
