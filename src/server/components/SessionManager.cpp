#include <agentd/server/components/SessionManager.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace agentd {

namespace {

std::string describeException(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace

// Reads the first event of a session concurrently with the job so that the probe never
// applies back-pressure to the publisher.
struct SessionManager::FirstEventProbe {
    std::shared_ptr<EventSubscription> subscription;
    std::atomic<bool> taskRelated{false};
    AsyncEvent done;
};

SessionManager::SessionManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.executor) {
        throw std::invalid_argument("SessionManager: executor cannot be null");
    }
    if (!deps_.taskStorage) {
        throw std::invalid_argument("SessionManager: taskStorage cannot be null");
    }
}

SessionManager::~SessionManager() {
    std::shared_lock lock(registryMutex_);
    if (!sessions_.empty()) {
        spdlog::warn("[SessionManager] Destroyed with {} active sessions", sessions_.size());
    }
}

void SessionManager::addSession(const std::shared_ptr<Session>& session) {
    if (!session) {
        throw std::invalid_argument("SessionManager::addSession: session cannot be null");
    }
    const auto& taskId = session->taskId();
    {
        std::unique_lock lock(registryMutex_);
        auto [it, inserted] = sessions_.try_emplace(taskId, session);
        if (!inserted) {
            throw ProtocolError(ErrorCode::SessionAlreadyExists,
                                "Session for task '" + taskId + "' already exists");
        }
    }

    session->setManaged();
    auto probe = std::make_shared<FirstEventProbe>();
    probe->subscription = session->eventProcessor()->subscribe();

    boost::asio::co_spawn(deps_.executor, readFirstEvent(probe), boost::asio::detached);
    boost::asio::co_spawn(deps_.executor, monitor(session, probe), boost::asio::detached);
    spdlog::debug("[SessionManager] Registered session for task {}", taskId);
}

std::shared_ptr<Session> SessionManager::sessionForTask(const std::string& taskId) const {
    std::shared_lock lock(registryMutex_);
    auto it = sessions_.find(taskId);
    return it == sessions_.end() ? nullptr : it->second;
}

std::size_t SessionManager::activeSessions() const {
    std::shared_lock lock(registryMutex_);
    return sessions_.size();
}

boost::asio::awaitable<void> SessionManager::taskLock(const std::string& taskId) {
    std::shared_ptr<TaskLockEntry> entry;
    {
        std::lock_guard<std::mutex> lock(lockTableMutex_);
        auto& slot = taskLocks_[taskId];
        if (!slot) {
            slot = std::make_shared<TaskLockEntry>();
        }
        ++slot->refs;
        entry = slot;
    }
    co_await entry->mutex.lock();
}

void SessionManager::taskUnlock(const std::string& taskId) {
    std::shared_ptr<TaskLockEntry> entry;
    {
        std::lock_guard<std::mutex> lock(lockTableMutex_);
        auto it = taskLocks_.find(taskId);
        if (it == taskLocks_.end() || !it->second->mutex.isLocked()) {
            throw std::logic_error("Task lock for '" + taskId + "' is not held");
        }
        entry = it->second;
        if (--entry->refs == 0) {
            taskLocks_.erase(it);
        }
    }
    entry->mutex.unlock();
}

bool SessionManager::isTaskLocked(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(lockTableMutex_);
    auto it = taskLocks_.find(taskId);
    return it != taskLocks_.end() && it->second->mutex.isLocked();
}

std::size_t SessionManager::lockTableSize() const {
    std::lock_guard<std::mutex> lock(lockTableMutex_);
    return taskLocks_.size();
}

boost::asio::awaitable<void>
SessionManager::readFirstEvent(std::shared_ptr<FirstEventProbe> probe) {
    if (auto first = co_await probe->subscription->nextOrEnd()) {
        probe->taskRelated.store(isTaskEvent(*first), std::memory_order_release);
    }
    probe->subscription->cancel();
    probe->done.set();
}

boost::asio::awaitable<void> SessionManager::monitor(std::shared_ptr<Session> session,
                                                     std::shared_ptr<FirstEventProbe> probe) {
    const std::string taskId = session->taskId();

    co_await session->waitFinished();

    co_await withTaskLock(taskId, [this, &session, &taskId]() -> boost::asio::awaitable<void> {
        {
            std::unique_lock lock(registryMutex_);
            auto it = sessions_.find(taskId);
            if (it != sessions_.end() && it->second == session) {
                sessions_.erase(it);
            }
        }
        co_await session->close();
    });

    // The processor is closed, so the probe has either seen the first event or the end.
    co_await probe->done.wait();
    if (probe->taskRelated.load(std::memory_order_acquire)) {
        co_await notifyCompletion(taskId);
    }

    if (auto failure = session->failure()) {
        spdlog::info("[SessionManager] Session for task {} finished with error: {}", taskId,
                     describeException(failure));
    } else {
        spdlog::debug("[SessionManager] Session for task {} finished", taskId);
    }
    session->markFinalized();
}

boost::asio::awaitable<void> SessionManager::notifyCompletion(const std::string& taskId) {
    if (!deps_.pushConfigStorage || !deps_.pushSender) {
        co_return;
    }
    auto configs = deps_.pushConfigStorage->getAll(taskId);
    if (configs.empty()) {
        co_return;
    }
    auto task = deps_.taskStorage->get(taskId, 0, false);
    if (!task) {
        spdlog::warn("[SessionManager] Task {} vanished before push notification", taskId);
        co_return;
    }

    for (auto& config : configs) {
        try {
            co_await deps_.pushSender->send(config, *task);
            spdlog::debug("[SessionManager] Push notification for task {} sent to {}", taskId,
                          config.url);
        } catch (const std::exception& e) {
            spdlog::warn("[SessionManager] Push notification for task {} to {} failed: {}", taskId,
                         config.url, e.what());
        } catch (...) {
            spdlog::warn("[SessionManager] Push notification for task {} to {} failed with a "
                         "non-standard exception",
                         taskId, config.url);
        }
    }
}

} // namespace agentd
