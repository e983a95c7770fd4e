#pragma once

#include <agentd/core/async_sync.h>
#include <agentd/server/components/Session.h>
#include <agentd/server/storage/push_notification_storage.h>
#include <agentd/server/storage/task_storage.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace agentd {

/**
 * @brief Registry of running sessions keyed by task id.
 *
 * For every registered session a monitor coroutine waits for the job to finish, then,
 * under the per-task lock, unregisters and closes the session. If the session's first
 * event was task related and push notification targets exist for the task, the final
 * task snapshot is sent to each of them.
 *
 * Two independent locks:
 * - The registry is guarded by a reader-writer lock with non-suspending critical
 *   sections (lookups shared, insert/remove exclusive).
 * - The per-task lock table linearizes finalization of one task between the monitor and
 *   an explicit cancellation. Entries are created on first use and dropped once nobody
 *   holds or waits for them.
 *
 * Task locks are not reentrant; never acquire the same task lock twice on one flow.
 * The manager must outlive the sessions it monitors.
 */
class SessionManager {
public:
    struct Dependencies {
        boost::asio::any_io_executor executor;
        std::shared_ptr<TaskStorage> taskStorage;
        // Optional; without both, completion notifications are skipped.
        std::shared_ptr<PushNotificationConfigStorage> pushConfigStorage;
        std::shared_ptr<PushNotificationSender> pushSender;
    };

    explicit SessionManager(Dependencies deps);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Register a session and start monitoring it.
     *
     * Does not start the session.
     *
     * @throws ProtocolError(SessionAlreadyExists) if a session for the task is registered
     */
    void addSession(const std::shared_ptr<Session>& session);

    [[nodiscard]] std::shared_ptr<Session> sessionForTask(const std::string& taskId) const;
    [[nodiscard]] std::size_t activeSessions() const;

    boost::asio::awaitable<void> taskLock(const std::string& taskId);

    /**
     * @throws std::logic_error if the task lock is not currently held
     */
    void taskUnlock(const std::string& taskId);

    [[nodiscard]] bool isTaskLocked(const std::string& taskId) const;

    // Number of live entries in the per-task lock table.
    [[nodiscard]] std::size_t lockTableSize() const;

    /**
     * @brief Run `action` while holding the task lock; released on every exit path.
     *
     * `action` must return an awaitable. Its result is returned.
     */
    template <typename Action> auto withTaskLock(std::string taskId, Action action)
        -> decltype(action()) {
        using Value = typename decltype(action())::value_type;
        co_await taskLock(taskId);
        std::exception_ptr failure;
        if constexpr (std::is_void_v<Value>) {
            try {
                co_await action();
            } catch (...) {
                failure = std::current_exception();
            }
            taskUnlock(taskId);
            if (failure)
                std::rethrow_exception(failure);
        } else {
            std::optional<Value> result;
            try {
                result.emplace(co_await action());
            } catch (...) {
                failure = std::current_exception();
            }
            taskUnlock(taskId);
            if (failure)
                std::rethrow_exception(failure);
            co_return std::move(*result);
        }
    }

private:
    struct TaskLockEntry {
        AsyncMutex mutex;
        std::size_t refs = 0;
    };

    struct FirstEventProbe;

    boost::asio::awaitable<void> monitor(std::shared_ptr<Session> session,
                                         std::shared_ptr<FirstEventProbe> probe);
    static boost::asio::awaitable<void> readFirstEvent(std::shared_ptr<FirstEventProbe> probe);
    boost::asio::awaitable<void> notifyCompletion(const std::string& taskId);

    Dependencies deps_;

    mutable std::shared_mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    mutable std::mutex lockTableMutex_;
    std::unordered_map<std::string, std::shared_ptr<TaskLockEntry>> taskLocks_;
};

} // namespace agentd
