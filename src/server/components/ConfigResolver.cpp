// Copyright 2025 The YAMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <agentd/server/components/ConfigResolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace agentd {

namespace {

std::optional<long> parseLong(const std::string& s) {
    try {
        std::size_t pos = 0;
        long v = std::stol(s, &pos);
        if (pos != s.size())
            return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

bool ConfigResolver::envTruthy(const char* value) {
    if (!value || !*value) {
        return false;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::filesystem::path ConfigResolver::resolveDefaultConfigPath() {
    if (const char* explicitPath = std::getenv("AGENTD_CONFIG_PATH")) {
        std::filesystem::path p{explicitPath};
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        std::filesystem::path p = std::filesystem::path(xdg) / "agentd" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* home = std::getenv("HOME")) {
        std::filesystem::path p =
            std::filesystem::path(home) / ".config" / "agentd" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    return {};
}

std::map<std::string, std::string>
ConfigResolver::parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;
    auto trim = [](std::string s) {
        auto issp = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!s.empty() && issp(static_cast<unsigned char>(s.front())))
            s.erase(s.begin());
        while (!s.empty() && issp(static_cast<unsigned char>(s.back())))
            s.pop_back();
        return s;
    };

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (!value.empty() && value.front() == '"') {
            auto close = value.find('"', 1);
            value = close == std::string::npos ? value.substr(1) : value.substr(1, close - 1);
        } else {
            auto comment = value.find('#');
            if (comment != std::string::npos)
                value = trim(value.substr(0, comment));
        }
        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

std::optional<long> ConfigResolver::readEnvInt(const char* envName, long minValue) {
    const char* v = std::getenv(envName);
    if (!v || !*v)
        return std::nullopt;
    auto parsed = parseLong(v);
    if (!parsed) {
        spdlog::warn("[ConfigResolver] Ignoring non-numeric {}='{}'", envName, v);
        return std::nullopt;
    }
    return std::max(minValue, *parsed);
}

ServerConfig ConfigResolver::resolve(const std::filesystem::path& explicitPath) {
    ServerConfig config;
    config.agentCard.name = "agentd";
    config.agentCard.description = "Agent task server";
    config.agentCard.version = "0.1.0";

    config.configFilePath = explicitPath.empty() ? resolveDefaultConfigPath() : explicitPath;
    if (!config.configFilePath.empty()) {
        if (!std::filesystem::exists(config.configFilePath)) {
            spdlog::warn("[ConfigResolver] Config file {} does not exist, using defaults",
                         config.configFilePath.string());
        } else {
            auto kv = parseSimpleTomlFlat(config.configFilePath);
            auto str = [&](const char* key) -> std::optional<std::string> {
                auto it = kv.find(key);
                if (it == kv.end())
                    return std::nullopt;
                return it->second;
            };
            auto num = [&](const char* key) -> std::optional<long> {
                auto s = str(key);
                if (!s)
                    return std::nullopt;
                auto v = parseLong(*s);
                if (!v)
                    spdlog::warn("[ConfigResolver] Ignoring non-numeric {}='{}'", key, *s);
                return v;
            };

            if (auto v = num("server.worker_threads"); v && *v > 0)
                config.workerThreads = static_cast<std::size_t>(*v);
            if (auto v = num("server.event_buffer"); v && *v > 0)
                config.eventBufferSize = static_cast<std::size_t>(*v);
            if (auto v = str("push.enabled"))
                config.pushEnabled = envTruthy(v->c_str());
            if (auto v = num("push.timeout_ms"); v && *v > 0)
                config.pushTimeout = std::chrono::milliseconds(*v);
            if (auto v = str("logging.level"))
                config.logLevel = *v;
            if (auto v = str("logging.file"))
                config.logFile = *v;
            if (auto v = str("agent.name"))
                config.agentCard.name = *v;
            if (auto v = str("agent.description"))
                config.agentCard.description = *v;
            if (auto v = str("agent.url"))
                config.agentCard.url = *v;
            if (auto v = str("agent.version"))
                config.agentCard.version = *v;
            spdlog::debug("[ConfigResolver] Loaded {} keys from {}", kv.size(),
                          config.configFilePath.string());
        }
    }

    // Environment overrides win over the file
    if (auto v = readEnvInt("AGENTD_WORKER_THREADS", 1))
        config.workerThreads = static_cast<std::size_t>(*v);
    if (auto v = readEnvInt("AGENTD_EVENT_BUFFER", 1))
        config.eventBufferSize = static_cast<std::size_t>(*v);
    if (const char* v = std::getenv("AGENTD_LOG_LEVEL"); v && *v)
        config.logLevel = v;
    if (const char* v = std::getenv("AGENTD_PUSH_ENABLED"))
        config.pushEnabled = envTruthy(v);

    config.agentCard.capabilities.pushNotifications = config.pushEnabled;
    return config;
}

} // namespace agentd
