#pragma once

#include "transfer_types.hpp"
#include <optional>
#include <vector>

namespace chunkpipe::transfer {

// Splits [0, file_size) into consecutive chunks of chunk_length bytes; the
// last chunk may be shorter. Chunks are handed out once each, in offset order.
class ChunkPlanner {
public:
    explicit ChunkPlanner(std::uint64_t file_size, std::uint32_t chunk_length = DEFAULT_CHUNK_LENGTH);
    
    std::optional<Chunk> next();
    bool has_next() const { return next_offset_ < file_size_; }
    void reset() { next_offset_ = 0; }
    
    std::uint64_t get_file_size() const { return file_size_; }
    std::uint32_t get_chunk_length() const { return chunk_length_; }
    std::uint64_t get_next_offset() const { return next_offset_; }
    std::uint64_t chunk_count() const;
    
    // The whole plan, independent of the cursor.
    std::vector<Chunk> plan() const;
    
private:
    std::uint64_t file_size_;
    std::uint32_t chunk_length_;
    std::uint64_t next_offset_;
};

}
