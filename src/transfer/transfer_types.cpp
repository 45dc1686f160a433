#include "chunkpipe/transfer/transfer_types.hpp"
#include <mutex>
#include <random>
#include <sstream>

namespace chunkpipe::transfer {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::TRANSPORT_ERROR: return "transport error";
        case TransferError::PROTOCOL_MISMATCH: return "protocol mismatch";
        case TransferError::SIZE_MISMATCH: return "size mismatch";
        case TransferError::CANCELLED: return "cancelled";
        case TransferError::TIMEOUT: return "timeout";
        case TransferError::FILE_NOT_FOUND: return "file not found";
        case TransferError::SINK_ERROR: return "sink error";
        case TransferError::INVALID_ARGUMENT: return "invalid argument";
        case TransferError::DIGEST_MISMATCH: return "digest mismatch";
        case TransferError::INTERNAL_ERROR: return "internal error";
    }
    return "unknown";
}

std::string generate_session_id() {
    static std::mutex mutex;
    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<std::uint32_t> dis(0, UINT32_MAX);
    
    std::lock_guard<std::mutex> lock(mutex);
    std::ostringstream oss;
    oss << "session_" << std::hex << dis(gen);
    return oss.str();
}

bool TransferState::record_error(TransferError error, std::string message) {
    if (terminal_error) {
        return false;
    }
    terminal_error = TransferResult(error, std::move(message), write_cursor);
    return true;
}

}
