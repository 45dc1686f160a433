#pragma once

#include "chunk_planner.hpp"
#include "transfer_types.hpp"
#include "chunkpipe/network/read_transport.hpp"
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace chunkpipe::transfer {

// Keeps the sliding window of outstanding read requests full. Owns every
// PendingRequest until the correlator claims it with release().
class RequestDispatcher {
public:
    RequestDispatcher(network::ReadTransport& transport, network::FileHandle handle, ChunkPlanner& planner);
    
    // Issues the next chunk's read request if the window has room. Never
    // blocks on a response. Returns false when the window is full, every
    // chunk is requested, or the transport refused the request (the latter
    // is recorded as the terminal error).
    bool try_dispatch_next(TransferState& state, std::uint32_t max_in_flight);
    
    std::optional<PendingRequest> release(network::RequestId request_id);
    bool is_pending(network::RequestId request_id) const;
    
    // Safe to call from the transport's reader context. True while the id
    // belongs to an unresolved request of this dispatcher.
    bool owns(network::RequestId request_id) const;
    size_t pending_count() const { return pending_.size(); }
    
    // Forgets every unresolved request; their responses will be ignored.
    size_t abandon_all();
    
private:
    network::ReadTransport& transport_;
    network::FileHandle handle_;
    ChunkPlanner& planner_;
    std::unordered_map<network::RequestId, PendingRequest> pending_;
    
    mutable std::mutex owned_mutex_;
    std::unordered_set<network::RequestId> owned_ids_;
};

}
