#include <agentd/server/event_stream.h>

namespace agentd {

EventStream::EventStream(RequestId requestId, std::shared_ptr<EventSubscription> subscription)
    : requestId_(std::move(requestId)), subscription_(std::move(subscription)) {}

EventStream::~EventStream() {
    cancel();
}

EventStream& EventStream::operator=(EventStream&& other) noexcept {
    if (this != &other) {
        cancel();
        requestId_ = std::move(other.requestId_);
        subscription_ = std::move(other.subscription_);
    }
    return *this;
}

boost::asio::awaitable<std::optional<Response<Event>>> EventStream::next() {
    if (!subscription_) {
        co_return std::nullopt;
    }
    auto event = co_await subscription_->next();
    if (!event) {
        co_return std::nullopt;
    }
    co_return Response<Event>{requestId_, std::move(*event)};
}

void EventStream::cancel() {
    if (subscription_) {
        subscription_->cancel();
    }
}

} // namespace agentd
