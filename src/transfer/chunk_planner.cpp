#include "chunkpipe/transfer/chunk_planner.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkpipe::transfer {

ChunkPlanner::ChunkPlanner(std::uint64_t file_size, std::uint32_t chunk_length)
    : file_size_(file_size)
    , chunk_length_(chunk_length)
    , next_offset_(0) {
    
    if (chunk_length_ == 0) {
        throw std::invalid_argument("chunk length must be positive");
    }
}

std::optional<Chunk> ChunkPlanner::next() {
    if (!has_next()) {
        return std::nullopt;
    }
    
    Chunk chunk;
    chunk.offset = next_offset_;
    chunk.length = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(chunk_length_, file_size_ - next_offset_));
    
    next_offset_ += chunk.length;
    return chunk;
}

std::uint64_t ChunkPlanner::chunk_count() const {
    return (file_size_ + chunk_length_ - 1) / chunk_length_;
}

std::vector<Chunk> ChunkPlanner::plan() const {
    ChunkPlanner copy(file_size_, chunk_length_);
    
    std::vector<Chunk> chunks;
    chunks.reserve(chunk_count());
    while (auto chunk = copy.next()) {
        chunks.push_back(*chunk);
    }
    return chunks;
}

}
