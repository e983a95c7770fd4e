#pragma once

#include <agentd/rpc/jsonrpc_dispatcher.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>

#include <boost/asio/any_io_executor.hpp>

namespace agentd::rpc {

/**
 * @brief Newline-delimited JSON-RPC over a pair of streams (stdin/stdout by default).
 *
 * serve() reads one request per line on the calling thread and dispatches each on the
 * executor, so a long-running stream does not block later requests. Output frames are
 * written whole, one per line, under a mutex. At end of input serve() waits for the
 * in-flight requests to finish.
 */
class StdioTransport {
public:
    StdioTransport();
    StdioTransport(std::istream& in, std::ostream& out);

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void serve(JsonRpcDispatcher& dispatcher, const boost::asio::any_io_executor& executor);

    void send(const json& message);

    // Stops reading after the current line.
    void requestStop() noexcept { stopRequested_.store(true); }

    std::size_t inFlight() const;

private:
    void finishRequest();

    std::istream& in_;
    std::ostream& out_;
    std::mutex outMutex_;

    std::atomic<bool> stopRequested_{false};
    mutable std::mutex inflightMutex_;
    std::condition_variable inflightCv_;
    std::size_t inflight_ = 0;
};

} // namespace agentd::rpc
