#include <agentd/app/echo_agent_executor.h>
#include <agentd/rpc/http_push_sender.h>
#include <agentd/rpc/jsonrpc_dispatcher.h>
#include <agentd/rpc/stdio_transport.h>
#include <agentd/server/components/ConfigResolver.h>
#include <agentd/server/components/WorkCoordinator.h>
#include <agentd/server/protocol_server.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace {

// stdout carries the JSON-RPC frames, so every log line goes to stderr or the log file.
void setupLogging(const agentd::ServerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile.string(), 10 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            std::fprintf(stderr, "agentd: cannot open log file %s: %s\n",
                         config.logFile.string().c_str(), e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("agentd", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto level = spdlog::level::from_str(config.logLevel);
    if (level == spdlog::level::off && config.logLevel != "off") {
        spdlog::warn("Unknown log level '{}', using info", config.logLevel);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"agentd - agent task server (JSON-RPC over stdio)"};

    std::string configPath;
    std::string logLevel;
    std::string logFile;
    std::size_t workers = 0;

    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");
    app.add_option("--workers", workers, "Number of worker threads");
    app.add_option("--log-file", logFile, "Log file path");

    CLI11_PARSE(app, argc, argv);

    auto config = agentd::ConfigResolver::resolve(configPath);
    // Command-line flags win over file and environment
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (!logFile.empty())
        config.logFile = logFile;
    if (workers > 0)
        config.workerThreads = workers;

    setupLogging(config);
    std::signal(SIGPIPE, SIG_IGN);

    agentd::WorkCoordinator coordinator;
    try {
        coordinator.start(config.workerThreads);

        agentd::ProtocolServer::Dependencies deps;
        deps.executor = coordinator.getExecutor();
        deps.agentExecutor = std::make_shared<agentd::app::EchoAgentExecutor>();
        deps.taskStorage = std::make_shared<agentd::InMemoryTaskStorage>();
        deps.messageStorage = std::make_shared<agentd::InMemoryMessageStorage>();
        if (config.pushEnabled) {
            deps.pushConfigStorage =
                std::make_shared<agentd::InMemoryPushNotificationConfigStorage>();
            deps.pushSender = std::make_shared<agentd::rpc::HttpPushNotificationSender>(
                coordinator.getExecutor(), config.pushTimeout);
        }

        agentd::ProtocolServer::Config serverConfig;
        serverConfig.agentCard = config.agentCard;
        serverConfig.eventBufferSize = config.eventBufferSize;

        agentd::ProtocolServer server(std::move(deps), std::move(serverConfig));
        agentd::rpc::JsonRpcDispatcher dispatcher(server);
        agentd::rpc::StdioTransport transport;

        spdlog::info("agentd {} starting with {} workers", config.agentCard.version,
                     coordinator.getWorkerCount());
        transport.serve(dispatcher, coordinator.getExecutor());

        coordinator.stop();
        coordinator.join();
    } catch (const std::exception& e) {
        spdlog::critical("agentd failed: {}", e.what());
        coordinator.stop();
        coordinator.join();
        return 1;
    }

    spdlog::info("agentd stopped");
    return 0;
}
