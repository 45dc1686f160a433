#pragma once

#include "read_transport.hpp"
#include <map>
#include <mutex>

namespace chunkpipe::network {

// Fans inbound responses out to every subscriber of a shared connection.
class ResponseRouter {
public:
    SubscriptionId subscribe(ReadTransport::ResponseHandler handler);
    void unsubscribe(SubscriptionId id);
    
    // Handlers run under the router lock, in subscription order.
    void publish(const ResponsePtr& response);
    
    size_t subscriber_count() const;
    
private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, ReadTransport::ResponseHandler> handlers_;
    SubscriptionId next_id_ = 1;
};

}
