#pragma once

#include "request_dispatcher.hpp"
#include "transfer_types.hpp"
#include "chunkpipe/network/read_transport.hpp"

namespace chunkpipe::transfer {

enum class CorrelationResult {
    ACCEPTED,
    FAILED,
    IGNORED
};

// Matches inbound responses to the dispatcher's pending requests by request
// id. Responses may arrive in any order and may belong to other users of the
// connection; anything without a pending request is ignored.
class ResponseCorrelator {
public:
    explicit ResponseCorrelator(RequestDispatcher& dispatcher);
    
    CorrelationResult handle_response(TransferState& state, const network::ReadResponse& response);
    
private:
    RequestDispatcher& dispatcher_;
};

}
