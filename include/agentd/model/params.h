#pragma once

#include <agentd/model/task.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentd {

// Protocol envelopes

using RequestId = std::variant<int64_t, std::string>;

template <typename T> struct Request {
    RequestId id;
    T data;
};

template <typename T> struct Response {
    RequestId id;
    T data;
};

// Push notifications

struct PushNotificationAuthentication {
    std::vector<std::string> schemes;
    std::optional<std::string> credentials;
};

struct PushNotificationConfig {
    std::optional<std::string> id;
    std::string url;
    std::optional<std::string> token;
    std::optional<PushNotificationAuthentication> authentication;
};

struct TaskPushNotificationConfig {
    std::string taskId;
    PushNotificationConfig pushNotificationConfig;
};

struct TaskPushNotificationConfigParams {
    std::string id;
    std::optional<std::string> pushNotificationConfigId;
};

// Operation parameters

struct MessageSendConfiguration {
    std::vector<std::string> acceptedOutputModes;
    std::optional<int> historyLength;
    std::optional<PushNotificationConfig> pushNotificationConfig;
    bool blocking = false;
};

struct MessageSendParams {
    Message message;
    std::optional<MessageSendConfiguration> configuration;
    Metadata metadata;
};

struct TaskQueryParams {
    std::string id;
    std::optional<int> historyLength;
    Metadata metadata;
};

struct TaskIdParams {
    std::string id;
    Metadata metadata;
};

// Empty payload for operations that take no parameters.
struct NoParams {};

using SendMessageResult = std::variant<Message, Task>;

// Agent discovery

struct AgentCapabilities {
    bool streaming = true;
    bool pushNotifications = false;
    bool stateTransitionHistory = false;
};

struct AgentSkill {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    std::vector<std::string> examples;
};

struct AgentCard {
    std::string name;
    std::string description;
    std::string url;
    std::string version;
    std::string protocolVersion = "0.3.0";
    AgentCapabilities capabilities;
    std::vector<std::string> defaultInputModes{"text/plain"};
    std::vector<std::string> defaultOutputModes{"text/plain"};
    std::vector<AgentSkill> skills;
    bool supportsAuthenticatedExtendedCard = false;
};

/**
 * @brief Transport-provided context of a single call.
 *
 * `headers` carries transport metadata verbatim; `user` is set when the transport
 * authenticated the caller. `state` is free-form storage for transport extensions.
 */
struct ServerCallContext {
    std::map<std::string, std::string> headers;
    std::optional<std::string> user;
    std::map<std::string, std::string> state;
};

} // namespace agentd
