#pragma once

#include <agentd/core/uuid.h>
#include <agentd/model/task.h>
#include <agentd/server/components/WorkCoordinator.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

namespace agentd::test {

using namespace std::chrono_literals;

// Runs the awaitable on the executor and blocks the test thread for its result.
template <typename T>
T runAwait(const boost::asio::any_io_executor& executor, boost::asio::awaitable<T> awaitable,
           std::chrono::milliseconds timeout = 10s) {
    auto future = boost::asio::co_spawn(executor, std::move(awaitable), boost::asio::use_future);
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw std::runtime_error("runAwait: awaitable did not complete in time");
    }
    return future.get();
}

// Polls `condition` until it holds or the timeout expires.
template <typename Pred>
bool waitForCondition(Pred&& condition, std::chrono::milliseconds timeout = 5s,
                      std::chrono::milliseconds interval = 5ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition())
            return true;
        std::this_thread::sleep_for(interval);
    }
    return condition();
}

inline Message userMessage(const std::string& text,
                           std::optional<std::string> conversationId = std::nullopt,
                           std::optional<std::string> taskId = std::nullopt) {
    Message m;
    m.messageId = core::generateUUID();
    m.role = Role::User;
    m.parts.push_back(Part::fromText(text));
    m.conversationId = std::move(conversationId);
    m.taskId = std::move(taskId);
    return m;
}

inline Task makeTask(const std::string& id, const std::string& conversationId,
                     TaskState state = TaskState::Submitted) {
    Task task;
    task.id = id;
    task.conversationId = conversationId;
    task.status.state = state;
    task.status.timestamp = std::chrono::system_clock::now();
    return task;
}

inline TaskStatusUpdateEvent statusEvent(const std::string& taskId,
                                         const std::string& conversationId, TaskState state,
                                         bool final = false) {
    TaskStatusUpdateEvent e;
    e.taskId = taskId;
    e.conversationId = conversationId;
    e.status.state = state;
    e.status.timestamp = std::chrono::system_clock::now();
    e.final = final;
    return e;
}

// Starts a worker pool for the lifetime of the fixture.
class AsyncTestBase {
protected:
    AsyncTestBase() { coordinator_.start(4); }
    ~AsyncTestBase() {
        coordinator_.stop();
        coordinator_.join();
    }

    boost::asio::any_io_executor executor() { return coordinator_.getExecutor(); }

    template <typename T>
    T run(boost::asio::awaitable<T> awaitable, std::chrono::milliseconds timeout = 10s) {
        return runAwait(executor(), std::move(awaitable), timeout);
    }

    WorkCoordinator coordinator_;
};

} // namespace agentd::test
