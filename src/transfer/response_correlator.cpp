#include "chunkpipe/transfer/response_correlator.hpp"
#include "chunkpipe/core/logger.hpp"

namespace chunkpipe::transfer {

ResponseCorrelator::ResponseCorrelator(RequestDispatcher& dispatcher)
    : dispatcher_(dispatcher) {
}

CorrelationResult ResponseCorrelator::handle_response(TransferState& state, const network::ReadResponse& response) {
    // Connection loss takes every outstanding request with it.
    if (response.is_connection_event()) {
        state.record_error(TransferError::TRANSPORT_ERROR,
                           "connection lost: " + response.error_message);
        return CorrelationResult::FAILED;
    }
    
    auto request = dispatcher_.release(response.request_id);
    if (!request) {
        state.responses_ignored++;
        LOG_DEBUG("Ignoring response {} with no pending request", response.request_id);
        return CorrelationResult::IGNORED;
    }
    
    state.in_flight--;
    
    if (!response.is_data()) {
        std::string message = "read of " + std::to_string(request->length) + " bytes at offset " +
                              std::to_string(request->offset) + " failed: " + network::to_string(response.status);
        if (!response.error_message.empty()) {
            message += " (" + response.error_message + ")";
        }
        state.record_error(TransferError::TRANSPORT_ERROR, std::move(message));
        return CorrelationResult::FAILED;
    }
    
    if (response.payload.size() != request->length) {
        state.record_error(TransferError::PROTOCOL_MISMATCH,
                           "invalid data block size at offset " + std::to_string(request->offset) +
                           ": expected " + std::to_string(request->length) + " bytes, got " +
                           std::to_string(response.payload.size()));
        return CorrelationResult::FAILED;
    }
    
    if (request->offset < state.write_cursor || state.pending_chunks.count(request->offset) > 0) {
        state.record_error(TransferError::INTERNAL_ERROR,
                           "chunk at offset " + std::to_string(request->offset) + " received twice");
        return CorrelationResult::FAILED;
    }
    
    state.pending_chunks.emplace(request->offset,
                                 ReceivedChunk{request->offset, request->length, response.payload});
    
    LOG_TRACE("Received {} bytes at offset {} (request {}, {} buffered)",
              request->length, request->offset, request->request_id, state.pending_chunks.size());
    return CorrelationResult::ACCEPTED;
}

}
