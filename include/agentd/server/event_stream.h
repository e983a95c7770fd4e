#pragma once

#include <agentd/model/params.h>
#include <agentd/server/components/SessionEventProcessor.h>

#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>

namespace agentd {

/**
 * @brief Server-streaming response of sendMessageStreaming/resubscribeTask.
 *
 * next() yields responses tagged with the request id until the session ends, then
 * std::nullopt. If the agent failed, next() rethrows its exception after the last
 * event. Destroying or cancelling the stream detaches it from the session without
 * affecting the running job.
 */
class EventStream {
public:
    // An empty stream; next() returns std::nullopt immediately.
    EventStream() = default;
    EventStream(RequestId requestId, std::shared_ptr<EventSubscription> subscription);
    ~EventStream();

    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&& other) noexcept;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    const RequestId& requestId() const noexcept { return requestId_; }

    boost::asio::awaitable<std::optional<Response<Event>>> next();

    void cancel();

private:
    RequestId requestId_;
    std::shared_ptr<EventSubscription> subscription_;
};

} // namespace agentd
