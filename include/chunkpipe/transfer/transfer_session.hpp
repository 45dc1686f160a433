#pragma once

#include "transfer_options.hpp"
#include "transfer_types.hpp"
#include "chunkpipe/network/read_transport.hpp"
#include "chunkpipe/storage/output_sink.hpp"
#include <atomic>
#include <chrono>
#include <string>

namespace chunkpipe::transfer {

enum class SessionState {
    PLANNING,
    TRANSFERRING,
    COMPLETED,
    FAILED
};

const char* to_string(SessionState state);

// Counters published by the control loop for observers on other threads.
struct SessionSnapshot {
    SessionState state;
    std::uint64_t requested_offset;
    std::uint64_t write_cursor;
    std::uint32_t in_flight;
    std::uint64_t buffered_chunks;
    std::uint64_t requests_issued;
};

class ReassemblyWriter;
class RequestDispatcher;
class ResponseQueue;

// Downloads one remote file through a window of pipelined read requests.
// A single control loop owns all transfer bookkeeping; the transport's reader
// context only hands responses over through a bounded queue.
class TransferSession {
public:
    TransferSession(network::ReadTransport& transport, network::FileHandle handle, TransferOptions options = {});
    
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;
    
    // Runs the transfer to a terminal state. A session runs at most once.
    TransferResult run(storage::OutputSink& sink);
    
    SessionState get_state() const { return state_; }
    SessionSnapshot snapshot() const;
    
    // Final bookkeeping; only meaningful once run() has returned.
    const TransferState& get_transfer_state() const { return transfer_state_; }
    
    const std::string& get_session_id() const { return session_id_; }
    const network::FileHandle& get_handle() const { return handle_; }
    std::chrono::milliseconds get_elapsed() const { return elapsed_; }
    
private:
    TransferResult execute(ReassemblyWriter& writer);
    TransferResult transfer_loop(RequestDispatcher& dispatcher, ReassemblyWriter& writer, ResponseQueue& queue);
    TransferResult verify_completion(const storage::OutputSink& sink);
    TransferResult abandon(RequestDispatcher& dispatcher, TransferResult result);
    TransferResult timeout_result() const;
    TransferResult validate_options() const;
    bool is_cancelled() const;
    void set_state(SessionState state);
    void publish_snapshot();
    
    network::ReadTransport& transport_;
    network::FileHandle handle_;
    TransferOptions options_;
    std::string session_id_;
    
    TransferState transfer_state_;
    std::atomic<SessionState> state_;
    std::atomic<bool> started_;
    
    std::atomic<std::uint64_t> snapshot_requested_offset_;
    std::atomic<std::uint64_t> snapshot_write_cursor_;
    std::atomic<std::uint32_t> snapshot_in_flight_;
    std::atomic<std::uint64_t> snapshot_buffered_;
    std::atomic<std::uint64_t> snapshot_requests_issued_;
    
    std::chrono::milliseconds elapsed_;
};

// Convenience wrapper: one session, run to completion.
TransferResult transfer(network::ReadTransport& transport, const network::FileHandle& handle,
                        storage::OutputSink& sink, const TransferOptions& options = {});

}
