#include "chunkpipe/network/response_router.hpp"
#include "chunkpipe/core/logger.hpp"

namespace chunkpipe::network {

const char* to_string(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::OK: return "ok";
        case ResponseStatus::END_OF_FILE: return "end of file";
        case ResponseStatus::FAILURE: return "failure";
        case ResponseStatus::NO_SUCH_FILE: return "no such file";
        case ResponseStatus::PERMISSION_DENIED: return "permission denied";
        case ResponseStatus::CONNECTION_LOST: return "connection lost";
    }
    return "unknown";
}

SubscriptionId ResponseRouter::subscribe(ReadTransport::ResponseHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    LOG_DEBUG("Response subscriber {} registered ({} total)", id, handlers_.size());
    return id;
}

void ResponseRouter::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
    LOG_DEBUG("Response subscriber {} removed ({} left)", id, handlers_.size());
}

void ResponseRouter::publish(const ResponsePtr& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, handler] : handlers_) {
        handler(response);
    }
}

size_t ResponseRouter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

}
