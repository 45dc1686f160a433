#pragma once

#include "cancel_signal.hpp"
#include "reassembly_writer.hpp"
#include "transfer_types.hpp"
#include "chunkpipe/core/config.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace chunkpipe::transfer {

struct TransferOptions {
    std::uint32_t chunk_length = DEFAULT_CHUNK_LENGTH;
    std::uint32_t max_in_flight = DEFAULT_MAX_IN_FLIGHT;
    ProgressCallback progress_callback;
    std::shared_ptr<CancelSignal> cancel_signal;
    
    // Zero waits for responses without limit.
    std::chrono::milliseconds response_timeout{0};
    // Zero derives the handoff queue size from the window.
    size_t queue_capacity = 0;
    // Used in logs and statistics; generated when empty.
    std::string session_id;
    
    size_t effective_queue_capacity() const;
    
    static TransferOptions from_config(const core::Config& config);
};

}
