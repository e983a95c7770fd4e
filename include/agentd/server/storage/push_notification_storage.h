#pragma once

#include <agentd/core/types.h>
#include <agentd/model/params.h>
#include <agentd/model/task.h>

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace agentd {

// Storage contract for per-task push notification targets.
class PushNotificationConfigStorage {
public:
    virtual ~PushNotificationConfigStorage() = default;

    // Upserts by config id; a config without id is stored under the task id.
    virtual Result<PushNotificationConfig> save(const std::string& taskId,
                                                PushNotificationConfig config) = 0;
    // Without configId, looks up the config stored under the task id.
    virtual Result<PushNotificationConfig>
    get(const std::string& taskId, const std::optional<std::string>& configId) const = 0;
    virtual std::vector<PushNotificationConfig> getAll(const std::string& taskId) const = 0;
    virtual Result<void> remove(const std::string& taskId, const std::string& configId) = 0;
};

class InMemoryPushNotificationConfigStorage : public PushNotificationConfigStorage {
public:
    Result<PushNotificationConfig> save(const std::string& taskId,
                                        PushNotificationConfig config) override;
    Result<PushNotificationConfig> get(const std::string& taskId,
                                       const std::optional<std::string>& configId) const override;
    std::vector<PushNotificationConfig> getAll(const std::string& taskId) const override;
    Result<void> remove(const std::string& taskId, const std::string& configId) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<PushNotificationConfig>> configs_;
};

// Delivers a task snapshot to one push notification target.
class PushNotificationSender {
public:
    virtual ~PushNotificationSender() = default;
    virtual boost::asio::awaitable<void> send(PushNotificationConfig config, Task task) = 0;
};

} // namespace agentd
