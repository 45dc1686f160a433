#pragma once

#include "chunkpipe/network/read_transport.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkpipe::transfer {

constexpr std::uint32_t DEFAULT_CHUNK_LENGTH = 32 * 1024;
constexpr std::uint32_t DEFAULT_MAX_IN_FLIGHT = 48;

// A contiguous byte range of the source file, the unit of one read request.
struct Chunk {
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
    
    std::uint64_t end() const { return offset + length; }
    bool operator==(const Chunk& other) const = default;
};

struct PendingRequest {
    network::RequestId request_id = 0;
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
};

struct ReceivedChunk {
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
    std::vector<std::uint8_t> payload;
};

enum class TransferError {
    SUCCESS = 0,
    TRANSPORT_ERROR,
    PROTOCOL_MISMATCH,
    SIZE_MISMATCH,
    CANCELLED,
    TIMEOUT,
    FILE_NOT_FOUND,
    SINK_ERROR,
    INVALID_ARGUMENT,
    DIGEST_MISMATCH,
    INTERNAL_ERROR
};

const char* to_string(TransferError error);

std::string generate_session_id();

struct TransferResult {
    TransferError error;
    std::string message;
    std::uint64_t bytes_written;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "", std::uint64_t bytes = 0)
        : error(err), message(std::move(msg)), bytes_written(bytes) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

// Bookkeeping of one transfer. Only the session's control loop mutates it.
// write_cursor <= requested_offset <= file_size holds at all times.
struct TransferState {
    std::uint64_t file_size = 0;
    std::uint64_t requested_offset = 0;
    std::uint64_t write_cursor = 0;
    std::uint32_t in_flight = 0;
    std::map<std::uint64_t, ReceivedChunk> pending_chunks;
    std::optional<TransferResult> terminal_error;
    
    std::uint32_t peak_in_flight = 0;
    std::uint64_t requests_issued = 0;
    std::uint64_t responses_ignored = 0;
    
    TransferState() = default;
    explicit TransferState(std::uint64_t size) : file_size(size) {}
    
    bool is_complete() const { return write_cursor == file_size && in_flight == 0; }
    
    // Requests in flight plus chunks buffered ahead of the write cursor.
    std::uint64_t outstanding() const { return in_flight + pending_chunks.size(); }
    
    // The first fatal error wins; later ones are dropped. Returns true if recorded.
    bool record_error(TransferError error, std::string message);
};

}
