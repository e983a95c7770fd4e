#include <gtest/gtest.h>

#include <agentd/app/echo_agent_executor.h>
#include <agentd/server/protocol_server.h>

#include "../../common/async_test_helpers.h"

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

using namespace agentd;
using namespace agentd::test;

namespace {

// Publishes a Working task, then parks until released.
class GatedAgent : public AgentExecutor {
public:
    boost::asio::awaitable<void>
    execute(std::shared_ptr<const RequestContext<MessageSendParams>> context,
            std::shared_ptr<SessionEventProcessor> processor) override {
        co_await processor->sendTaskEvent(
            makeTask(context->taskId(), context->conversationId(), TaskState::Working));
        co_await release.wait();
        if (processor->isClosed())
            co_return;
        if (failAfterRelease)
            throw std::runtime_error("agent exploded");
        co_await processor->sendTaskEvent(statusEvent(
            context->taskId(), context->conversationId(), TaskState::Completed, true));
    }

    boost::asio::awaitable<void> cancel(std::shared_ptr<const RequestContext<TaskIdParams>>,
                                        std::shared_ptr<Session> session) override {
        ++cancelCalls;
        if (refuseCancel)
            throw ProtocolError(ErrorCode::TaskNotCancelable, "Task cannot be canceled");
        if (joinOnCancel) {
            // Stop the execution and wait until it is fully finalized.
            co_await session->close();
            release.set();
            co_await session->join();
        }
    }

    AsyncEvent release;
    std::atomic<bool> refuseCancel{false};
    std::atomic<bool> joinOnCancel{false};
    std::atomic<bool> failAfterRelease{false};
    std::atomic<int> cancelCalls{0};
};

// Publishes a Working task and completes it after yielding a few times.
class QuickAgent : public AgentExecutor {
public:
    boost::asio::awaitable<void>
    execute(std::shared_ptr<const RequestContext<MessageSendParams>> context,
            std::shared_ptr<SessionEventProcessor> processor) override {
        co_await processor->sendTaskEvent(
            makeTask(context->taskId(), context->conversationId(), TaskState::Working));
        auto executor = co_await boost::asio::this_coro::executor;
        for (int i = 0; i < 3; ++i)
            co_await boost::asio::post(executor, boost::asio::use_awaitable);
        co_await processor->sendTaskEvent(statusEvent(
            context->taskId(), context->conversationId(), TaskState::Completed, true));
    }
};

class RecordingPushSender : public PushNotificationSender {
public:
    boost::asio::awaitable<void> send(PushNotificationConfig, Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_[task.id].push_back(task.status.state);
        co_return;
    }

    std::vector<TaskState> statesFor(const std::string& taskId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sent_.find(taskId);
        return it == sent_.end() ? std::vector<TaskState>{} : it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<TaskState>> sent_;
};

class ProtocolServerTest : public ::testing::Test, protected AsyncTestBase {
protected:
    ~ProtocolServerTest() override {
        gated->release.set();
        if (server) {
            waitForCondition([this] { return server->sessionManager().activeSessions() == 0; });
        }
        coordinator_.stop();
        coordinator_.join();
    }

    void makeServer(std::shared_ptr<AgentExecutor> agent, bool withPush = true) {
        ProtocolServer::Dependencies deps;
        deps.executor = executor();
        deps.agentExecutor = std::move(agent);
        deps.taskStorage = taskStorage;
        if (withPush) {
            deps.pushConfigStorage = pushStorage;
            deps.pushSender = pushSender;
        }
        ProtocolServer::Config config;
        config.agentCard.name = "test-agent";
        server = std::make_unique<ProtocolServer>(std::move(deps), std::move(config));
    }

    void useEcho() { makeServer(std::make_shared<app::EchoAgentExecutor>(5ms, 3)); }
    void useGated() { makeServer(gated); }

    static Request<MessageSendParams> send(Message message, bool blocking = false) {
        MessageSendParams params;
        params.message = std::move(message);
        MessageSendConfiguration configuration;
        configuration.blocking = blocking;
        params.configuration = configuration;
        return Request<MessageSendParams>{RequestId{int64_t{1}}, std::move(params)};
    }

    template <typename Params> static Request<Params> req(Params params) {
        return Request<Params>{RequestId{std::string("req-1")}, std::move(params)};
    }

    std::vector<Event> drain(EventStream& stream) {
        std::vector<Event> events;
        for (;;) {
            auto response = run(stream.next());
            if (!response)
                break;
            events.push_back(std::move(response->data));
        }
        return events;
    }

    // Code of the ProtocolError `call` fails with.
    template <typename T> ErrorCode failureOf(boost::asio::awaitable<T> call) {
        try {
            run(std::move(call));
        } catch (const ProtocolError& e) {
            return e.code();
        }
        return ErrorCode::Success;
    }

    // Starts a gated task and waits until its first event is stored.
    std::string startGatedTask() {
        auto result = run(server->sendMessage(send(userMessage("work", "ctx-1")), {}));
        auto* task = std::get_if<Task>(&result.data);
        if (!task)
            throw std::runtime_error("expected a task");
        return task->id;
    }

    Task getTask(const std::string& id) {
        return run(server->getTask(req(TaskQueryParams{id, std::nullopt, {}}), {})).data;
    }

    bool sessionGone(const std::string& taskId) {
        return waitForCondition(
            [&] { return server->sessionManager().sessionForTask(taskId) == nullptr; });
    }

    std::shared_ptr<InMemoryTaskStorage> taskStorage = std::make_shared<InMemoryTaskStorage>();
    std::shared_ptr<InMemoryPushNotificationConfigStorage> pushStorage =
        std::make_shared<InMemoryPushNotificationConfigStorage>();
    std::shared_ptr<RecordingPushSender> pushSender = std::make_shared<RecordingPushSender>();
    std::shared_ptr<GatedAgent> gated = std::make_shared<GatedAgent>();
    std::unique_ptr<ProtocolServer> server;
};

} // namespace

TEST_F(ProtocolServerTest, HelloWorldRepliesWithMessage) {
    useEcho();
    auto response = run(server->sendMessage(send(userMessage("hello world")), {}));

    EXPECT_EQ(response.id, RequestId{int64_t{1}});
    auto* message = std::get_if<Message>(&response.data);
    ASSERT_NE(message, nullptr);
    EXPECT_EQ(message->role, Role::Agent);
    EXPECT_EQ(message->parts[0].text, "Hello World");
    EXPECT_TRUE(message->conversationId.has_value());
}

TEST_F(ProtocolServerTest, BlockingSendReturnsCompletedTask) {
    useEcho();
    auto response = run(server->sendMessage(send(userMessage("do task", "ctx-1"), true), {}));

    auto* task = std::get_if<Task>(&response.data);
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->status.state, TaskState::Completed);
    EXPECT_EQ(task->conversationId, "ctx-1");
    EXPECT_FALSE(task->history.empty());
    EXPECT_EQ(getTask(task->id).status.state, TaskState::Completed);
}

TEST_F(ProtocolServerTest, NonBlockingSendReturnsFirstTaskEvent) {
    useEcho();
    auto response = run(server->sendMessage(send(userMessage("do task")), {}));

    auto* task = std::get_if<Task>(&response.data);
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->status.state, TaskState::Working);

    // The agent keeps running after the response.
    const auto id = task->id;
    EXPECT_TRUE(waitForCondition([&] {
        auto stored = taskStorage->get(id, 0, false);
        return stored && stored->status.state == TaskState::Completed;
    }));
}

TEST_F(ProtocolServerTest, StreamingDeliversEventsInOrder) {
    useEcho();
    auto stream = run(server->sendMessageStreaming(send(userMessage("do task", "ctx-1")), {}));
    EXPECT_EQ(stream.requestId(), RequestId{int64_t{1}});

    auto events = drain(stream);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(kindOf(events[0]), EventKind::Task);
    EXPECT_EQ(kindOf(events[1]), EventKind::StatusUpdate);
    auto& last = std::get<TaskStatusUpdateEvent>(events[2]);
    EXPECT_TRUE(last.final);
    EXPECT_EQ(last.status.state, TaskState::Completed);
    EXPECT_EQ(last.conversationId, "ctx-1");
}

TEST_F(ProtocolServerTest, GetTaskProjectsHistory) {
    useEcho();
    auto response = run(server->sendMessage(send(userMessage("do task"), true), {}));
    const auto id = std::get<Task>(response.data).id;

    auto limited = run(server->getTask(req(TaskQueryParams{id, 1, {}}), {}));
    EXPECT_EQ(limited.id, RequestId{std::string("req-1")});
    EXPECT_LE(limited.data.history.size(), 1u);

    EXPECT_EQ(failureOf(server->getTask(req(TaskQueryParams{"missing", std::nullopt, {}}), {})),
              ErrorCode::TaskNotFound);
}

TEST_F(ProtocolServerTest, CancelStoredTasks) {
    useEcho();
    auto completed = run(server->sendMessage(send(userMessage("do task"), true), {}));
    const auto completedId = std::get<Task>(completed.data).id;
    ASSERT_TRUE(sessionGone(completedId));
    EXPECT_EQ(failureOf(server->cancelTask(req(TaskIdParams{completedId, {}}), {})),
              ErrorCode::UnsupportedOperation);

    auto waiting = run(server->sendMessage(send(userMessage("need input"), true), {}));
    const auto waitingId = std::get<Task>(waiting.data).id;
    EXPECT_EQ(std::get<Task>(waiting.data).status.state, TaskState::InputRequired);
    ASSERT_TRUE(sessionGone(waitingId));

    auto canceled = run(server->cancelTask(req(TaskIdParams{waitingId, {}}), {}));
    EXPECT_EQ(canceled.data.status.state, TaskState::Canceled);
    auto again = run(server->cancelTask(req(TaskIdParams{waitingId, {}}), {}));
    EXPECT_EQ(again.data.status.state, TaskState::Canceled);

    EXPECT_EQ(failureOf(server->cancelTask(req(TaskIdParams{"missing", {}}), {})),
              ErrorCode::TaskNotFound);
}

TEST_F(ProtocolServerTest, CancelRunningTaskClosesSession) {
    useGated();
    const auto id = startGatedTask();
    auto stream = run(server->resubscribeTask(req(TaskIdParams{id, {}}), {}));

    auto canceled = run(server->cancelTask(req(TaskIdParams{id, {}}), {}));
    EXPECT_EQ(canceled.data.status.state, TaskState::Canceled);
    EXPECT_EQ(gated->cancelCalls.load(), 1);

    // The subscriber's stream ends once the session is closed.
    EXPECT_TRUE(drain(stream).empty());

    gated->release.set();
    EXPECT_TRUE(sessionGone(id));
    EXPECT_EQ(getTask(id).status.state, TaskState::Canceled);
}

TEST_F(ProtocolServerTest, CancelHookMayJoinTheSession) {
    useGated();
    gated->joinOnCancel = true;
    const auto id = startGatedTask();

    auto canceled = run(server->cancelTask(req(TaskIdParams{id, {}}), {}), 3s);
    EXPECT_EQ(canceled.data.status.state, TaskState::Canceled);
    EXPECT_EQ(gated->cancelCalls.load(), 1);

    // join() returned inside the hook, so the monitor has already finalized the session.
    EXPECT_EQ(server->sessionManager().sessionForTask(id), nullptr);
    EXPECT_EQ(server->sessionManager().activeSessions(), 0u);
    EXPECT_FALSE(server->sessionManager().isTaskLocked(id));
    EXPECT_EQ(server->sessionManager().lockTableSize(), 0u);
    EXPECT_EQ(getTask(id).status.state, TaskState::Canceled);
}

TEST_F(ProtocolServerTest, CancelRacingCompletionFinalizesOnce) {
    makeServer(std::make_shared<QuickAgent>());
    auto& manager = server->sessionManager();

    std::vector<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        auto request = send(userMessage("work", "ctx-1"));
        request.data.configuration->pushNotificationConfig =
            PushNotificationConfig{std::nullopt, "http://localhost:9/cb", std::nullopt,
                                   std::nullopt};
        auto first = run(server->sendMessage(std::move(request), {}));
        const auto id = std::get<Task>(first.data).id;
        ids.push_back(id);

        // The agent completes on its own while the cancellation is in flight.
        try {
            auto result = run(server->cancelTask(req(TaskIdParams{id, {}}), {}));
            EXPECT_TRUE(result.data.status.state == TaskState::Canceled ||
                        result.data.status.state == TaskState::Completed);
        } catch (const ProtocolError& e) {
            EXPECT_EQ(e.code(), ErrorCode::UnsupportedOperation);
        }

        ASSERT_TRUE(waitForCondition([&] { return !pushSender->statesFor(id).empty(); }));
        ASSERT_TRUE(sessionGone(id));
        ASSERT_TRUE(waitForCondition([&] { return manager.lockTableSize() == 0; }));
        EXPECT_EQ(manager.activeSessions(), 0u);

        const auto state = getTask(id).status.state;
        EXPECT_TRUE(state == TaskState::Canceled || state == TaskState::Completed);
        EXPECT_EQ(pushSender->statesFor(id).front(), state);
    }

    for (const auto& id : ids) {
        EXPECT_EQ(pushSender->statesFor(id).size(), 1u) << id;
    }
}

TEST_F(ProtocolServerTest, EchoAgentCancelPublishesCanceledStatus) {
    makeServer(std::make_shared<app::EchoAgentExecutor>(50ms, 100));
    auto stream =
        run(server->sendMessageStreaming(send(userMessage("do long-running task")), {}));
    auto first = run(stream.next());
    ASSERT_TRUE(first);
    const auto id = std::get<Task>(first->data).id;

    auto canceled = run(server->cancelTask(req(TaskIdParams{id, {}}), {}));
    EXPECT_EQ(canceled.data.status.state, TaskState::Canceled);

    bool sawCanceled = false;
    try {
        for (;;) {
            auto next = run(stream.next());
            if (!next)
                break;
            if (auto* status = std::get_if<TaskStatusUpdateEvent>(&next->data)) {
                sawCanceled = sawCanceled || status->status.state == TaskState::Canceled;
            }
        }
    } catch (const ProtocolError& e) {
        // The progress loop may race the close and fail its next publish.
        EXPECT_EQ(e.code(), ErrorCode::SessionClosed);
    }
    EXPECT_TRUE(sawCanceled);
    EXPECT_TRUE(sessionGone(id));
}

TEST_F(ProtocolServerTest, RefusedCancelLeavesTaskRunning) {
    useGated();
    gated->refuseCancel = true;
    const auto id = startGatedTask();

    EXPECT_EQ(failureOf(server->cancelTask(req(TaskIdParams{id, {}}), {})),
              ErrorCode::TaskNotCancelable);
    EXPECT_EQ(getTask(id).status.state, TaskState::Working);
    EXPECT_NE(server->sessionManager().sessionForTask(id), nullptr);
    EXPECT_FALSE(server->sessionManager().isTaskLocked(id));

    gated->release.set();
    EXPECT_TRUE(sessionGone(id));
    EXPECT_EQ(getTask(id).status.state, TaskState::Completed);
}

TEST_F(ProtocolServerTest, RejectsMessagesToUnavailableTasks) {
    useGated();
    const auto running = startGatedTask();
    EXPECT_EQ(failureOf(server->sendMessage(send(userMessage("more", "ctx-1", running)), {})),
              ErrorCode::UnsupportedOperation);

    EXPECT_EQ(failureOf(server->sendMessage(send(userMessage("x", std::nullopt, "nope")), {})),
              ErrorCode::TaskNotFound);

    ASSERT_TRUE(taskStorage->update(makeTask("done", "ctx-9", TaskState::Completed)));
    EXPECT_EQ(failureOf(server->sendMessage(send(userMessage("x", "ctx-9", "done")), {})),
              ErrorCode::UnsupportedOperation);

    ASSERT_TRUE(taskStorage->update(makeTask("paused", "ctx-9", TaskState::InputRequired)));
    EXPECT_EQ(failureOf(server->sendMessage(send(userMessage("x", "ctx-other", "paused")), {})),
              ErrorCode::InvalidParams);
    EXPECT_EQ(server->sessionManager().sessionForTask("paused"), nullptr);
}

TEST_F(ProtocolServerTest, FollowUpMustCarryTaskConversation) {
    useGated();
    ASSERT_TRUE(taskStorage->update(makeTask("t1", "ctx-A", TaskState::InputRequired)));

    EXPECT_EQ(failureOf(server->sendMessage(send(userMessage("more", std::nullopt, "t1")), {})),
              ErrorCode::InvalidParams);
    EXPECT_EQ(server->sessionManager().sessionForTask("t1"), nullptr);
    EXPECT_EQ(getTask("t1").status.state, TaskState::InputRequired);
}

TEST_F(ProtocolServerTest, RejectedFollowUpLeavesNoPushConfig) {
    useGated();
    ASSERT_TRUE(taskStorage->update(makeTask("paused", "ctx-9", TaskState::InputRequired)));

    auto followUp = [&](const std::string& configId) {
        auto request = send(userMessage("resume", "ctx-9", "paused"));
        request.data.configuration->pushNotificationConfig = PushNotificationConfig{
            configId, "http://localhost:9/" + configId, std::nullopt, std::nullopt};
        return boost::asio::co_spawn(executor(), server->sendMessage(std::move(request), {}),
                                     boost::asio::use_future);
    };
    auto first = followUp("cfg-a");
    auto second = followUp("cfg-b");

    std::vector<std::string> accepted;
    auto collect = [&](std::future<Response<SendMessageResult>>& future,
                       const std::string& configId) {
        ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
        try {
            future.get();
            accepted.push_back(configId);
        } catch (const ProtocolError& e) {
            EXPECT_TRUE(e.code() == ErrorCode::UnsupportedOperation ||
                        e.code() == ErrorCode::SessionAlreadyExists);
        }
    };
    collect(first, "cfg-a");
    collect(second, "cfg-b");

    ASSERT_EQ(accepted.size(), 1u);
    auto stored = pushStorage->getAll("paused");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].id, std::optional<std::string>(accepted[0]));
}

TEST_F(ProtocolServerTest, FollowUpResumesInputRequiredTask) {
    useEcho();
    auto first = run(server->sendMessage(send(userMessage("need input", "ctx-7"), true), {}));
    const auto id = std::get<Task>(first.data).id;
    ASSERT_TRUE(sessionGone(id));

    auto second =
        run(server->sendMessage(send(userMessage("42 please", "ctx-7", id), true), {}));
    auto& task = std::get<Task>(second.data);
    EXPECT_EQ(task.id, id);
    EXPECT_EQ(task.conversationId, "ctx-7");
    EXPECT_EQ(task.status.state, TaskState::Completed);
    ASSERT_TRUE(task.status.message.has_value());
    EXPECT_EQ(task.status.message->parts[0].text, "Received: 42 please");
}

TEST_F(ProtocolServerTest, AgentFailureEndsTheStream) {
    useGated();
    gated->failAfterRelease = true;
    auto stream = run(server->sendMessageStreaming(send(userMessage("work")), {}));

    auto first = run(stream.next());
    ASSERT_TRUE(first);
    EXPECT_EQ(kindOf(first->data), EventKind::Task);

    gated->release.set();
    EXPECT_THROW(run(stream.next()), std::runtime_error);
}

TEST_F(ProtocolServerTest, ResubscribeRequiresRunningSession) {
    useGated();
    EXPECT_EQ(failureOf(server->resubscribeTask(req(TaskIdParams{"missing", {}}), {})),
              ErrorCode::UnsupportedOperation);

    const auto id = startGatedTask();
    auto stream = run(server->resubscribeTask(req(TaskIdParams{id, {}}), {}));
    gated->release.set();

    auto events = drain(stream);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<TaskStatusUpdateEvent>(events[0]).status.state, TaskState::Completed);
}

TEST_F(ProtocolServerTest, PushConfigLifecycle) {
    useEcho();
    PushNotificationConfig config{std::string("cfg-1"), "http://localhost:9/cb", std::nullopt,
                                  std::nullopt};
    EXPECT_EQ(failureOf(server->setTaskPushNotificationConfig(
                  req(TaskPushNotificationConfig{"missing", config}), {})),
              ErrorCode::TaskNotFound);

    ASSERT_TRUE(taskStorage->update(makeTask("task-1", "ctx-1", TaskState::InputRequired)));
    auto set = run(
        server->setTaskPushNotificationConfig(req(TaskPushNotificationConfig{"task-1", config}),
                                              {}));
    EXPECT_EQ(set.data.taskId, "task-1");
    EXPECT_EQ(set.data.pushNotificationConfig.id, std::optional<std::string>("cfg-1"));

    PushNotificationConfig invalid;
    EXPECT_EQ(failureOf(server->setTaskPushNotificationConfig(
                  req(TaskPushNotificationConfig{"task-1", invalid}), {})),
              ErrorCode::InvalidParams);

    auto got = run(server->getTaskPushNotificationConfig(
        req(TaskPushNotificationConfigParams{"task-1", std::string("cfg-1")}), {}));
    EXPECT_EQ(got.data.pushNotificationConfig.url, "http://localhost:9/cb");

    auto list = run(server->listTaskPushNotificationConfig(req(TaskIdParams{"task-1", {}}), {}));
    ASSERT_EQ(list.data.size(), 1u);

    run(server->deleteTaskPushNotificationConfig(
        req(TaskPushNotificationConfigParams{"task-1", std::string("cfg-1")}), {}));
    EXPECT_EQ(failureOf(server->getTaskPushNotificationConfig(
                  req(TaskPushNotificationConfigParams{"task-1", std::string("cfg-1")}), {})),
              ErrorCode::NotFound);
}

TEST_F(ProtocolServerTest, PushOperationsNeedStorage) {
    makeServer(std::make_shared<app::EchoAgentExecutor>(), false);
    ASSERT_TRUE(taskStorage->update(makeTask("task-1", "ctx-1")));

    EXPECT_EQ(failureOf(server->listTaskPushNotificationConfig(req(TaskIdParams{"task-1", {}}),
                                                               {})),
              ErrorCode::PushNotificationNotSupported);

    auto request = send(userMessage("do task"));
    request.data.configuration->pushNotificationConfig =
        PushNotificationConfig{std::nullopt, "http://localhost:9/cb", std::nullopt, std::nullopt};
    EXPECT_EQ(failureOf(server->sendMessage(std::move(request), {})),
              ErrorCode::PushNotificationNotSupported);
}

TEST_F(ProtocolServerTest, ExtendedCardFallsBackToPublicCard) {
    useEcho();
    auto card = run(server->getAuthenticatedExtendedAgentCard(req(NoParams{}), {}));
    EXPECT_EQ(card.data.name, "test-agent");
    EXPECT_EQ(server->getAgentCard().name, "test-agent");
}

TEST(ProtocolServerConstructionTest, RequiresAgentExecutor) {
    boost::asio::io_context io;
    ProtocolServer::Dependencies deps;
    deps.executor = io.get_executor();
    EXPECT_THROW(ProtocolServer(std::move(deps), {}), std::invalid_argument);
}
