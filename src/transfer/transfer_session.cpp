#include "chunkpipe/transfer/transfer_session.hpp"
#include "chunkpipe/transfer/chunk_planner.hpp"
#include "chunkpipe/transfer/reassembly_writer.hpp"
#include "chunkpipe/transfer/request_dispatcher.hpp"
#include "chunkpipe/transfer/response_correlator.hpp"
#include "chunkpipe/transfer/response_queue.hpp"
#include "chunkpipe/core/logger.hpp"
#include "chunkpipe/core/utils.hpp"
#include <algorithm>

namespace chunkpipe::transfer {

namespace {

// Routes this session's responses from the shared connection into its queue
// for as long as the subscription lives. Other callers' traffic is dropped on
// the reader side, so it neither fills the queue nor blocks delivery to them.
// Closing the queue first releases a reader blocked on a full queue, so
// unsubscribe() cannot wait on it.
class InboundSubscription {
public:
    InboundSubscription(network::ReadTransport& transport, ResponseQueue& queue,
                        const RequestDispatcher& dispatcher)
        : transport_(transport)
        , queue_(queue)
        , dropped_(0) {
        id_ = transport_.subscribe([this, &queue, &dispatcher](const network::ResponsePtr& response) {
            if (!response->is_connection_event() && !dispatcher.owns(response->request_id)) {
                dropped_++;
                return;
            }
            if (!queue.push(response)) {
                LOG_TRACE("Dropped response {} for a finished session", response->request_id);
            }
        });
    }
    
    ~InboundSubscription() {
        queue_.close();
        transport_.unsubscribe(id_);
    }
    
    InboundSubscription(const InboundSubscription&) = delete;
    InboundSubscription& operator=(const InboundSubscription&) = delete;
    
    std::uint64_t dropped() const { return dropped_; }
    
private:
    network::ReadTransport& transport_;
    ResponseQueue& queue_;
    network::SubscriptionId id_;
    std::atomic<std::uint64_t> dropped_;
};

class CancelRegistration {
public:
    CancelRegistration(const std::shared_ptr<CancelSignal>& signal, ResponseQueue& queue)
        : signal_(signal)
        , id_(0) {
        if (signal_) {
            id_ = signal_->add_callback([&queue]() { queue.interrupt(); });
        }
    }
    
    ~CancelRegistration() {
        if (signal_) {
            signal_->remove_callback(id_);
        }
    }
    
    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;
    
private:
    std::shared_ptr<CancelSignal> signal_;
    std::uint64_t id_;
};

}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::PLANNING: return "planning";
        case SessionState::TRANSFERRING: return "transferring";
        case SessionState::COMPLETED: return "completed";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(network::ReadTransport& transport, network::FileHandle handle,
                                 TransferOptions options)
    : transport_(transport)
    , handle_(std::move(handle))
    , options_(std::move(options))
    , session_id_(options_.session_id.empty() ? generate_session_id() : options_.session_id)
    , state_(SessionState::PLANNING)
    , started_(false)
    , snapshot_requested_offset_(0)
    , snapshot_write_cursor_(0)
    , snapshot_in_flight_(0)
    , snapshot_buffered_(0)
    , snapshot_requests_issued_(0)
    , elapsed_(0) {
}

TransferResult TransferSession::run(storage::OutputSink& sink) {
    if (started_.exchange(true)) {
        return TransferResult(TransferError::INTERNAL_ERROR, "transfer session " + session_id_ + " already ran");
    }
    
    auto start_time = std::chrono::steady_clock::now();
    
    TransferResult result;
    {
        ReassemblyWriter writer(sink, options_.progress_callback);
        result = execute(writer);
        writer.release();
    }
    
    if (result.success()) {
        result = verify_completion(sink);
    }
    
    elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
    
    if (result.success()) {
        set_state(SessionState::COMPLETED);
        LOG_INFO("[{}] Transfer of {} completed: {} in {}", session_id_, handle_.path,
                 core::utils::StringUtils::format_bytes(result.bytes_written),
                 core::utils::StringUtils::format_duration(elapsed_));
    } else {
        set_state(SessionState::FAILED);
        LOG_WARN("[{}] Transfer of {} failed ({}): {}", session_id_, handle_.path,
                 to_string(result.error), result.message);
    }
    
    return result;
}

SessionSnapshot TransferSession::snapshot() const {
    SessionSnapshot snap;
    snap.state = state_;
    snap.requested_offset = snapshot_requested_offset_;
    snap.write_cursor = snapshot_write_cursor_;
    snap.in_flight = snapshot_in_flight_;
    snap.buffered_chunks = snapshot_buffered_;
    snap.requests_issued = snapshot_requests_issued_;
    return snap;
}

TransferResult TransferSession::execute(ReassemblyWriter& writer) {
    auto validation = validate_options();
    if (!validation.success()) {
        return validation;
    }
    
    auto file_size = transport_.file_size(handle_);
    if (!file_size) {
        return TransferResult(TransferError::FILE_NOT_FOUND, "cannot determine size of " + handle_.path);
    }
    
    transfer_state_ = TransferState(*file_size);
    ChunkPlanner planner(*file_size, options_.chunk_length);
    RequestDispatcher dispatcher(transport_, handle_, planner);
    
    if (!writer.acquire()) {
        return TransferResult(TransferError::SINK_ERROR, "cannot open output sink");
    }
    
    ResponseQueue queue(options_.effective_queue_capacity());
    InboundSubscription subscription(transport_, queue, dispatcher);
    CancelRegistration cancel_registration(options_.cancel_signal, queue);
    
    set_state(SessionState::TRANSFERRING);
    LOG_INFO("[{}] Transferring {} ({}, {} chunks of {} bytes, window {})", session_id_, handle_.path,
             core::utils::StringUtils::format_bytes(*file_size), planner.chunk_count(),
             options_.chunk_length, options_.max_in_flight);
    
    auto result = transfer_loop(dispatcher, writer, queue);
    transfer_state_.responses_ignored += subscription.dropped();
    return result;
}

TransferResult TransferSession::transfer_loop(RequestDispatcher& dispatcher, ReassemblyWriter& writer,
                                              ResponseQueue& queue) {
    ResponseCorrelator correlator(dispatcher);
    auto& state = transfer_state_;
    
    // The timeout runs from the last response that resolved one of our own
    // requests; ignored responses do not extend it.
    const bool bounded = options_.response_timeout.count() > 0;
    auto deadline = std::chrono::steady_clock::now() + options_.response_timeout;
    
    while (true) {
        if (is_cancelled()) {
            return abandon(dispatcher, TransferResult(TransferError::CANCELLED, "transfer cancelled"));
        }
        
        while (dispatcher.try_dispatch_next(state, options_.max_in_flight)) {
        }
        publish_snapshot();
        
        if (state.terminal_error) {
            return abandon(dispatcher, *state.terminal_error);
        }
        
        if (state.is_complete()) {
            break;
        }
        
        if (state.in_flight == 0) {
            return abandon(dispatcher, TransferResult(
                TransferError::INTERNAL_ERROR,
                "transfer stalled at offset " + std::to_string(state.write_cursor) + " with " +
                std::to_string(state.pending_chunks.size()) + " buffered chunks and nothing in flight"));
        }
        
        auto wait = std::chrono::milliseconds(0);
        if (bounded) {
            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return abandon(dispatcher, timeout_result());
            }
            wait = remaining;
        }
        
        network::ResponsePtr response;
        switch (queue.pop(response, wait)) {
            case PopStatus::ITEM:
                break;
            case PopStatus::INTERRUPTED:
                return abandon(dispatcher, TransferResult(TransferError::CANCELLED, "transfer cancelled"));
            case PopStatus::TIMED_OUT:
                return abandon(dispatcher, timeout_result());
            case PopStatus::CLOSED:
                return abandon(dispatcher, TransferResult(TransferError::TRANSPORT_ERROR, "response stream closed"));
        }
        
        if (correlator.handle_response(state, *response) != CorrelationResult::IGNORED) {
            deadline = std::chrono::steady_clock::now() + options_.response_timeout;
        }
        writer.drain(state);
        publish_snapshot();
        
        if (state.terminal_error) {
            return abandon(dispatcher, *state.terminal_error);
        }
    }
    
    return TransferResult(TransferError::SUCCESS, "", state.write_cursor);
}

TransferResult TransferSession::verify_completion(const storage::OutputSink& sink) {
    const auto& state = transfer_state_;
    auto written = sink.bytes_written();
    
    if (state.write_cursor != state.file_size || written != state.file_size) {
        LOG_ERROR("[{}] Consistency check failed: cursor {}, sink holds {}, expected {}",
                  session_id_, state.write_cursor, written, state.file_size);
        return TransferResult(TransferError::SIZE_MISMATCH,
                              "file size mismatch: " + std::to_string(state.file_size) + " != " +
                              std::to_string(written),
                              written);
    }
    
    return TransferResult(TransferError::SUCCESS, "", written);
}

TransferResult TransferSession::abandon(RequestDispatcher& dispatcher, TransferResult result) {
    auto& state = transfer_state_;
    auto abandoned = dispatcher.abandon_all();
    
    LOG_DEBUG("[{}] Abandoning {} pending requests and {} buffered chunks", session_id_,
              abandoned, state.pending_chunks.size());
    
    state.record_error(result.error, result.message);
    state.pending_chunks.clear();
    publish_snapshot();
    
    result.bytes_written = state.write_cursor;
    return result;
}

TransferResult TransferSession::timeout_result() const {
    return TransferResult(TransferError::TIMEOUT,
                          "no response within " + std::to_string(options_.response_timeout.count()) + "ms (" +
                          std::to_string(transfer_state_.in_flight) + " requests in flight)");
}

TransferResult TransferSession::validate_options() const {
    if (options_.chunk_length == 0) {
        return TransferResult(TransferError::INVALID_ARGUMENT, "chunk length must be positive");
    }
    if (options_.max_in_flight == 0) {
        return TransferResult(TransferError::INVALID_ARGUMENT, "max in flight must be at least 1");
    }
    return TransferResult();
}

bool TransferSession::is_cancelled() const {
    return options_.cancel_signal && options_.cancel_signal->is_cancelled();
}

void TransferSession::set_state(SessionState state) {
    state_ = state;
}

void TransferSession::publish_snapshot() {
    const auto& state = transfer_state_;
    snapshot_requested_offset_ = state.requested_offset;
    snapshot_write_cursor_ = state.write_cursor;
    snapshot_in_flight_ = state.in_flight;
    snapshot_buffered_ = state.pending_chunks.size();
    snapshot_requests_issued_ = state.requests_issued;
}

TransferResult transfer(network::ReadTransport& transport, const network::FileHandle& handle,
                        storage::OutputSink& sink, const TransferOptions& options) {
    TransferSession session(transport, handle, options);
    return session.run(sink);
}

}
