#pragma once

#include <agentd/model/params.h>
#include <agentd/model/task.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

// JSON mapping of the data model. Field names follow the A2A wire format, so a task's
// conversation is carried as "contextId" and every event object has a "kind" tag.
// Decoding throws nlohmann::json::exception on malformed input; the dispatcher maps that
// onto InvalidParams.

namespace agentd {

using json = nlohmann::json;

void to_json(json& j, const Part& p);
void from_json(const json& j, Part& p);

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);

void to_json(json& j, const TaskStatus& s);
void from_json(const json& j, TaskStatus& s);

void to_json(json& j, const Artifact& a);
void from_json(const json& j, Artifact& a);

void to_json(json& j, const Task& t);
void from_json(const json& j, Task& t);

void to_json(json& j, const TaskStatusUpdateEvent& e);
void from_json(const json& j, TaskStatusUpdateEvent& e);

void to_json(json& j, const TaskArtifactUpdateEvent& e);
void from_json(const json& j, TaskArtifactUpdateEvent& e);

void to_json(json& j, const PushNotificationAuthentication& a);
void from_json(const json& j, PushNotificationAuthentication& a);

void to_json(json& j, const PushNotificationConfig& c);
void from_json(const json& j, PushNotificationConfig& c);

void to_json(json& j, const TaskPushNotificationConfig& c);
void from_json(const json& j, TaskPushNotificationConfig& c);

void from_json(const json& j, TaskPushNotificationConfigParams& p);
void from_json(const json& j, MessageSendConfiguration& c);
void from_json(const json& j, MessageSendParams& p);
void from_json(const json& j, TaskQueryParams& p);
void from_json(const json& j, TaskIdParams& p);

void to_json(json& j, const AgentCapabilities& c);
void to_json(json& j, const AgentSkill& s);
void to_json(json& j, const AgentCard& c);

} // namespace agentd

namespace agentd::rpc {

json eventToJson(const Event& event);

// Dispatches on the "kind" tag.
Event eventFromJson(const json& j);

json sendMessageResultToJson(const SendMessageResult& result);

json requestIdToJson(const RequestId& id);

// Integer and string ids are accepted; anything else yields std::nullopt.
std::optional<RequestId> requestIdFromJson(const json& j);

// ISO 8601 UTC, e.g. 2025-10-01T14:30:00.123Z. Fractional seconds are optional.
std::optional<TimePoint> parseTimestamp(std::string_view text);

} // namespace agentd::rpc
