#pragma once

#include "transfer_types.hpp"
#include "chunkpipe/storage/output_sink.hpp"
#include <functional>

namespace chunkpipe::transfer {

using ProgressCallback = std::function<void(std::uint64_t bytes_written)>;

// Flushes buffered chunks to the sink strictly in offset order. Holds the
// sink open from acquire() until release() or destruction.
class ReassemblyWriter {
public:
    explicit ReassemblyWriter(storage::OutputSink& sink, ProgressCallback progress = nullptr);
    ~ReassemblyWriter();
    
    ReassemblyWriter(const ReassemblyWriter&) = delete;
    ReassemblyWriter& operator=(const ReassemblyWriter&) = delete;
    
    bool acquire();
    void release();
    bool is_acquired() const { return acquired_; }
    
    // Writes every chunk contiguous with the write cursor and stops at the
    // first gap. Returns the number of bytes written by this call.
    std::uint64_t drain(TransferState& state);
    
private:
    storage::OutputSink& sink_;
    ProgressCallback progress_;
    bool acquired_;
};

}
