#include <agentd/rpc/stdio_transport.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>

#include <boost/asio/co_spawn.hpp>

namespace agentd::rpc {

StdioTransport::StdioTransport() : StdioTransport(std::cin, std::cout) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void StdioTransport::send(const json& message) {
    const auto payload = message.dump();
    std::lock_guard<std::mutex> lock(outMutex_);
    out_ << payload << '\n';
    out_.flush();
}

std::size_t StdioTransport::inFlight() const {
    std::lock_guard<std::mutex> lock(inflightMutex_);
    return inflight_;
}

void StdioTransport::finishRequest() {
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        --inflight_;
    }
    inflightCv_.notify_all();
}

void StdioTransport::serve(JsonRpcDispatcher& dispatcher,
                           const boost::asio::any_io_executor& executor) {
    spdlog::info("[StdioTransport] Serving JSON-RPC on stdio");
    std::string line;
    while (!stopRequested_.load() && std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;

        {
            std::lock_guard<std::mutex> lock(inflightMutex_);
            ++inflight_;
        }
        boost::asio::co_spawn(
            executor,
            [&dispatcher, this, frame = std::move(line)]() -> boost::asio::awaitable<void> {
                co_await dispatcher.dispatchLine(frame, ServerCallContext{},
                                                 [this](const json& m) { send(m); });
            },
            [this](std::exception_ptr ep) {
                finishRequest();
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        spdlog::error("[StdioTransport] Request failed: {}", e.what());
                    } catch (...) {
                        spdlog::error("[StdioTransport] Request failed with a non-standard "
                                      "exception");
                    }
                }
            });
        line.clear();
    }

    std::unique_lock<std::mutex> lock(inflightMutex_);
    inflightCv_.wait(lock, [this] { return inflight_ == 0; });
    spdlog::info("[StdioTransport] Input closed, all requests finished");
}

} // namespace agentd::rpc
