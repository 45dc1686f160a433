#include "chunkpipe/transfer/transfer_options.hpp"
#include <algorithm>

namespace chunkpipe::transfer {

size_t TransferOptions::effective_queue_capacity() const {
    if (queue_capacity > 0) {
        return queue_capacity;
    }
    return std::max<size_t>(static_cast<size_t>(max_in_flight) * 2, 16);
}

TransferOptions TransferOptions::from_config(const core::Config& config) {
    TransferOptions options;
    
    auto chunk_length = config.get_as<std::uint32_t>("transfer.chunk_size");
    if (chunk_length) {
        options.chunk_length = *chunk_length;
    }
    
    auto max_in_flight = config.get_as<std::uint32_t>("transfer.max_in_flight");
    if (max_in_flight) {
        options.max_in_flight = *max_in_flight;
    }
    
    auto timeout_ms = config.get_as<std::int64_t>("transfer.response_timeout_ms");
    if (timeout_ms && *timeout_ms > 0) {
        options.response_timeout = std::chrono::milliseconds(*timeout_ms);
    }
    
    auto queue_capacity = config.get_as<size_t>("transfer.queue_capacity");
    if (queue_capacity) {
        options.queue_capacity = *queue_capacity;
    }
    
    return options;
}

}
