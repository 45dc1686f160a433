#include "chunkpipe/transfer/request_dispatcher.hpp"
#include "chunkpipe/core/logger.hpp"
#include <algorithm>

namespace chunkpipe::transfer {

RequestDispatcher::RequestDispatcher(network::ReadTransport& transport, network::FileHandle handle,
                                     ChunkPlanner& planner)
    : transport_(transport)
    , handle_(std::move(handle))
    , planner_(planner) {
}

bool RequestDispatcher::try_dispatch_next(TransferState& state, std::uint32_t max_in_flight) {
    if (state.terminal_error || state.outstanding() >= max_in_flight ||
        state.requested_offset >= state.file_size) {
        return false;
    }
    
    auto chunk = planner_.next();
    if (!chunk) {
        state.record_error(TransferError::INTERNAL_ERROR,
                           "chunk plan exhausted at offset " + std::to_string(state.requested_offset) +
                           " of " + std::to_string(state.file_size));
        return false;
    }
    
    if (chunk->offset != state.requested_offset) {
        state.record_error(TransferError::INTERNAL_ERROR,
                           "chunk plan out of step: planned offset " + std::to_string(chunk->offset) +
                           ", expected " + std::to_string(state.requested_offset));
        return false;
    }
    
    // Held across the send: a response published before issue_read_request()
    // returns waits in owns() until its id is recorded.
    std::unique_lock<std::mutex> owned_lock(owned_mutex_);
    auto request_id = transport_.issue_read_request(handle_, chunk->offset, chunk->length);
    if (!request_id) {
        state.record_error(TransferError::TRANSPORT_ERROR,
                           "failed to send read request at offset " + std::to_string(chunk->offset) +
                           " for " + handle_.path);
        return false;
    }
    
    auto [it, inserted] = pending_.emplace(*request_id, PendingRequest{*request_id, chunk->offset, chunk->length});
    if (!inserted) {
        state.record_error(TransferError::INTERNAL_ERROR,
                           "transport reused request id " + std::to_string(*request_id));
        return false;
    }
    owned_ids_.insert(*request_id);
    owned_lock.unlock();
    
    state.in_flight++;
    state.peak_in_flight = std::max(state.peak_in_flight, state.in_flight);
    state.requests_issued++;
    state.requested_offset += chunk->length;
    
    LOG_TRACE("Requested {} bytes at offset {} (request {}, {} in flight)",
              chunk->length, chunk->offset, *request_id, state.in_flight);
    return true;
}

std::optional<PendingRequest> RequestDispatcher::release(network::RequestId request_id) {
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    
    auto request = it->second;
    pending_.erase(it);
    
    std::lock_guard<std::mutex> lock(owned_mutex_);
    owned_ids_.erase(request_id);
    return request;
}

bool RequestDispatcher::is_pending(network::RequestId request_id) const {
    return pending_.find(request_id) != pending_.end();
}

bool RequestDispatcher::owns(network::RequestId request_id) const {
    std::lock_guard<std::mutex> lock(owned_mutex_);
    return owned_ids_.count(request_id) > 0;
}

size_t RequestDispatcher::abandon_all() {
    auto count = pending_.size();
    pending_.clear();
    
    std::lock_guard<std::mutex> lock(owned_mutex_);
    owned_ids_.clear();
    return count;
}

}
