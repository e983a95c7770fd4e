#include <agentd/core/uuid.h>
#include <agentd/rpc/json_codec.h>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentd {

namespace {

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T> std::optional<T> getOptional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

void putMetadata(json& j, const Metadata& metadata) {
    if (!metadata.empty()) {
        j["metadata"] = metadata;
    }
}

// Non-string metadata values are kept in their serialized form.
Metadata getMetadata(const json& j) {
    Metadata out;
    auto it = j.find("metadata");
    if (it == j.end() || !it->is_object()) {
        return out;
    }
    for (const auto& [key, value] : it->items()) {
        out[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return out;
}

void expectKind(const json& j, std::string_view expected) {
    auto it = j.find("kind");
    if (it != j.end() && it->is_string() && it->get<std::string>() != expected) {
        throw ProtocolError(ErrorCode::InvalidParams, "Expected kind '" + std::string(expected) +
                                                          "' but got '" +
                                                          it->get<std::string>() + "'");
    }
}

Role parseRole(const std::string& s) {
    if (s == "user")
        return Role::User;
    if (s == "agent")
        return Role::Agent;
    throw ProtocolError(ErrorCode::InvalidParams, "Unknown message role '" + s + "'");
}

} // namespace

void to_json(json& j, const Part& p) {
    j = json::object();
    switch (p.kind) {
        case Part::Kind::Text:
            j["kind"] = "text";
            j["text"] = p.text;
            break;
        case Part::Kind::File: {
            j["kind"] = "file";
            json file = json::object();
            putOptional(file, "name", p.name);
            putOptional(file, "mimeType", p.mimeType);
            putOptional(file, "uri", p.uri);
            putOptional(file, "bytes", p.bytes);
            j["file"] = std::move(file);
            break;
        }
        case Part::Kind::Data: {
            j["kind"] = "data";
            auto data = json::parse(p.text, nullptr, false);
            j["data"] = data.is_discarded() ? json(p.text) : std::move(data);
            break;
        }
    }
    putMetadata(j, p.metadata);
}

void from_json(const json& j, Part& p) {
    const auto kind = j.at("kind").get<std::string>();
    p = Part{};
    if (kind == "text") {
        p.kind = Part::Kind::Text;
        p.text = j.at("text").get<std::string>();
    } else if (kind == "file") {
        p.kind = Part::Kind::File;
        const auto& file = j.at("file");
        p.name = getOptional<std::string>(file, "name");
        p.mimeType = getOptional<std::string>(file, "mimeType");
        p.uri = getOptional<std::string>(file, "uri");
        p.bytes = getOptional<std::string>(file, "bytes");
    } else if (kind == "data") {
        p.kind = Part::Kind::Data;
        p.text = j.at("data").dump();
    } else {
        throw ProtocolError(ErrorCode::InvalidParams, "Unknown part kind '" + kind + "'");
    }
    p.metadata = getMetadata(j);
}

void to_json(json& j, const Message& m) {
    j = json{{"kind", "message"},
             {"messageId", m.messageId},
             {"role", toString(m.role)},
             {"parts", m.parts}};
    putOptional(j, "contextId", m.conversationId);
    putOptional(j, "taskId", m.taskId);
    if (!m.referenceTaskIds.empty()) {
        j["referenceTaskIds"] = m.referenceTaskIds;
    }
    putMetadata(j, m.metadata);
}

void from_json(const json& j, Message& m) {
    expectKind(j, "message");
    m.messageId = j.at("messageId").get<std::string>();
    m.role = parseRole(j.at("role").get<std::string>());
    m.parts = j.at("parts").get<std::vector<Part>>();
    m.conversationId = getOptional<std::string>(j, "contextId");
    m.taskId = getOptional<std::string>(j, "taskId");
    m.referenceTaskIds = j.value("referenceTaskIds", std::vector<std::string>{});
    m.metadata = getMetadata(j);
}

void to_json(json& j, const TaskStatus& s) {
    j = json{{"state", toString(s.state)}};
    putOptional(j, "message", s.message);
    if (s.timestamp) {
        j["timestamp"] = core::formatTimestamp(*s.timestamp);
    }
}

void from_json(const json& j, TaskStatus& s) {
    const auto stateName = j.at("state").get<std::string>();
    auto state = parseTaskState(stateName);
    if (!state) {
        throw ProtocolError(ErrorCode::InvalidParams, "Unknown task state '" + stateName + "'");
    }
    s.state = *state;
    s.message = getOptional<Message>(j, "message");
    s.timestamp.reset();
    if (auto ts = getOptional<std::string>(j, "timestamp")) {
        s.timestamp = rpc::parseTimestamp(*ts);
        if (!s.timestamp) {
            throw ProtocolError(ErrorCode::InvalidParams, "Malformed timestamp '" + *ts + "'");
        }
    }
}

void to_json(json& j, const Artifact& a) {
    j = json{{"artifactId", a.artifactId}, {"parts", a.parts}};
    putOptional(j, "name", a.name);
    putOptional(j, "description", a.description);
    putMetadata(j, a.metadata);
}

void from_json(const json& j, Artifact& a) {
    a.artifactId = j.at("artifactId").get<std::string>();
    a.name = getOptional<std::string>(j, "name");
    a.description = getOptional<std::string>(j, "description");
    a.parts = j.at("parts").get<std::vector<Part>>();
    a.metadata = getMetadata(j);
}

void to_json(json& j, const Task& t) {
    j = json{{"kind", "task"},
             {"id", t.id},
             {"contextId", t.conversationId},
             {"status", t.status},
             {"history", t.history},
             {"artifacts", t.artifacts}};
    putMetadata(j, t.metadata);
}

void from_json(const json& j, Task& t) {
    expectKind(j, "task");
    t.id = j.at("id").get<std::string>();
    t.conversationId = j.at("contextId").get<std::string>();
    t.status = j.at("status").get<TaskStatus>();
    t.history = j.value("history", std::vector<Message>{});
    t.artifacts = j.value("artifacts", std::vector<Artifact>{});
    t.metadata = getMetadata(j);
}

void to_json(json& j, const TaskStatusUpdateEvent& e) {
    j = json{{"kind", "status-update"},
             {"taskId", e.taskId},
             {"contextId", e.conversationId},
             {"status", e.status},
             {"final", e.final}};
    putMetadata(j, e.metadata);
}

void from_json(const json& j, TaskStatusUpdateEvent& e) {
    expectKind(j, "status-update");
    e.taskId = j.at("taskId").get<std::string>();
    e.conversationId = j.at("contextId").get<std::string>();
    e.status = j.at("status").get<TaskStatus>();
    e.final = j.value("final", false);
    e.metadata = getMetadata(j);
}

void to_json(json& j, const TaskArtifactUpdateEvent& e) {
    j = json{{"kind", "artifact-update"},
             {"taskId", e.taskId},
             {"contextId", e.conversationId},
             {"artifact", e.artifact},
             {"append", e.append},
             {"lastChunk", e.lastChunk}};
    putMetadata(j, e.metadata);
}

void from_json(const json& j, TaskArtifactUpdateEvent& e) {
    expectKind(j, "artifact-update");
    e.taskId = j.at("taskId").get<std::string>();
    e.conversationId = j.at("contextId").get<std::string>();
    e.artifact = j.at("artifact").get<Artifact>();
    e.append = j.value("append", false);
    e.lastChunk = j.value("lastChunk", false);
    e.metadata = getMetadata(j);
}

void to_json(json& j, const PushNotificationAuthentication& a) {
    j = json{{"schemes", a.schemes}};
    putOptional(j, "credentials", a.credentials);
}

void from_json(const json& j, PushNotificationAuthentication& a) {
    a.schemes = j.value("schemes", std::vector<std::string>{});
    a.credentials = getOptional<std::string>(j, "credentials");
}

void to_json(json& j, const PushNotificationConfig& c) {
    j = json{{"url", c.url}};
    putOptional(j, "id", c.id);
    putOptional(j, "token", c.token);
    putOptional(j, "authentication", c.authentication);
}

void from_json(const json& j, PushNotificationConfig& c) {
    c.id = getOptional<std::string>(j, "id");
    c.url = j.at("url").get<std::string>();
    c.token = getOptional<std::string>(j, "token");
    c.authentication = getOptional<PushNotificationAuthentication>(j, "authentication");
}

void to_json(json& j, const TaskPushNotificationConfig& c) {
    j = json{{"taskId", c.taskId}, {"pushNotificationConfig", c.pushNotificationConfig}};
}

void from_json(const json& j, TaskPushNotificationConfig& c) {
    c.taskId = j.at("taskId").get<std::string>();
    c.pushNotificationConfig = j.at("pushNotificationConfig").get<PushNotificationConfig>();
}

void from_json(const json& j, TaskPushNotificationConfigParams& p) {
    p.id = j.at("id").get<std::string>();
    p.pushNotificationConfigId = getOptional<std::string>(j, "pushNotificationConfigId");
}

void from_json(const json& j, MessageSendConfiguration& c) {
    c.acceptedOutputModes = j.value("acceptedOutputModes", std::vector<std::string>{});
    c.historyLength = getOptional<int>(j, "historyLength");
    c.pushNotificationConfig = getOptional<PushNotificationConfig>(j, "pushNotificationConfig");
    c.blocking = j.value("blocking", false);
}

void from_json(const json& j, MessageSendParams& p) {
    p.message = j.at("message").get<Message>();
    p.configuration = getOptional<MessageSendConfiguration>(j, "configuration");
    p.metadata = getMetadata(j);
}

void from_json(const json& j, TaskQueryParams& p) {
    p.id = j.at("id").get<std::string>();
    p.historyLength = getOptional<int>(j, "historyLength");
    p.metadata = getMetadata(j);
}

void from_json(const json& j, TaskIdParams& p) {
    p.id = j.at("id").get<std::string>();
    p.metadata = getMetadata(j);
}

void to_json(json& j, const AgentCapabilities& c) {
    j = json{{"streaming", c.streaming},
             {"pushNotifications", c.pushNotifications},
             {"stateTransitionHistory", c.stateTransitionHistory}};
}

void to_json(json& j, const AgentSkill& s) {
    j = json{{"id", s.id},
             {"name", s.name},
             {"description", s.description},
             {"tags", s.tags}};
    if (!s.examples.empty()) {
        j["examples"] = s.examples;
    }
}

void to_json(json& j, const AgentCard& c) {
    j = json{{"name", c.name},
             {"description", c.description},
             {"url", c.url},
             {"version", c.version},
             {"protocolVersion", c.protocolVersion},
             {"capabilities", c.capabilities},
             {"defaultInputModes", c.defaultInputModes},
             {"defaultOutputModes", c.defaultOutputModes},
             {"skills", c.skills},
             {"supportsAuthenticatedExtendedCard", c.supportsAuthenticatedExtendedCard}};
}

} // namespace agentd

namespace agentd::rpc {

json eventToJson(const Event& event) {
    return std::visit([](const auto& e) { return json(e); }, event);
}

Event eventFromJson(const json& j) {
    const auto kind = j.at("kind").get<std::string>();
    if (kind == "message")
        return j.get<Message>();
    if (kind == "task")
        return j.get<Task>();
    if (kind == "status-update")
        return j.get<TaskStatusUpdateEvent>();
    if (kind == "artifact-update")
        return j.get<TaskArtifactUpdateEvent>();
    throw ProtocolError(ErrorCode::InvalidParams, "Unknown event kind '" + kind + "'");
}

json sendMessageResultToJson(const SendMessageResult& result) {
    return std::visit([](const auto& r) { return json(r); }, result);
}

json requestIdToJson(const RequestId& id) {
    return std::visit([](const auto& v) { return json(v); }, id);
}

std::optional<RequestId> requestIdFromJson(const json& j) {
    if (j.is_number_integer()) {
        return RequestId{j.get<int64_t>()};
    }
    if (j.is_string()) {
        return RequestId{j.get<std::string>()};
    }
    return std::nullopt;
}

std::optional<TimePoint> parseTimestamp(std::string_view text) {
    std::tm tm{};
    std::istringstream iss{std::string(text)};
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    std::chrono::milliseconds millis{0};
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::chrono::milliseconds(std::stoi(digits));
    }

    std::string zone;
    iss >> zone;
    if (zone != "Z" && zone != "+00:00") {
        return std::nullopt;
    }

#ifdef _WIN32
    const auto seconds = _mkgmtime(&tm);
#else
    const auto seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds) + millis;
}

} // namespace agentd::rpc
