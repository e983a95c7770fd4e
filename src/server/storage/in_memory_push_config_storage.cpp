#include <agentd/server/storage/push_notification_storage.h>

#include <algorithm>
#include <mutex>

namespace agentd {

Result<PushNotificationConfig>
InMemoryPushNotificationConfigStorage::save(const std::string& taskId,
                                            PushNotificationConfig config) {
    if (config.url.empty())
        return Error{ErrorCode::InvalidParams, "Push notification url must not be empty"};
    if (!config.id || config.id->empty())
        config.id = taskId;

    std::unique_lock lock(mutex_);
    auto& list = configs_[taskId];
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const PushNotificationConfig& c) { return c.id == config.id; });
    if (it != list.end()) {
        *it = config;
    } else {
        list.push_back(config);
    }
    return config;
}

Result<PushNotificationConfig>
InMemoryPushNotificationConfigStorage::get(const std::string& taskId,
                                           const std::optional<std::string>& configId) const {
    const std::string wanted = configId.value_or(taskId);
    std::shared_lock lock(mutex_);
    auto it = configs_.find(taskId);
    if (it != configs_.end()) {
        for (const auto& c : it->second) {
            if (c.id == wanted)
                return c;
        }
    }
    return Error{ErrorCode::NotFound,
                 "Push notification config '" + wanted + "' not found for task '" + taskId + "'"};
}

std::vector<PushNotificationConfig>
InMemoryPushNotificationConfigStorage::getAll(const std::string& taskId) const {
    std::shared_lock lock(mutex_);
    auto it = configs_.find(taskId);
    if (it == configs_.end())
        return {};
    return it->second;
}

Result<void> InMemoryPushNotificationConfigStorage::remove(const std::string& taskId,
                                                           const std::string& configId) {
    std::unique_lock lock(mutex_);
    auto it = configs_.find(taskId);
    if (it == configs_.end())
        return {};
    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const PushNotificationConfig& c) { return c.id == configId; }),
               list.end());
    if (list.empty())
        configs_.erase(it);
    return {};
}

} // namespace agentd
