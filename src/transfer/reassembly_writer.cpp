#include "chunkpipe/transfer/reassembly_writer.hpp"
#include "chunkpipe/core/logger.hpp"

namespace chunkpipe::transfer {

ReassemblyWriter::ReassemblyWriter(storage::OutputSink& sink, ProgressCallback progress)
    : sink_(sink)
    , progress_(std::move(progress))
    , acquired_(false) {
}

ReassemblyWriter::~ReassemblyWriter() {
    release();
}

bool ReassemblyWriter::acquire() {
    if (acquired_) {
        return true;
    }
    
    if (!sink_.open()) {
        LOG_ERROR("Cannot open output sink {}", sink_.describe());
        return false;
    }
    
    acquired_ = true;
    return true;
}

void ReassemblyWriter::release() {
    if (acquired_) {
        sink_.close();
        acquired_ = false;
    }
}

std::uint64_t ReassemblyWriter::drain(TransferState& state) {
    if (!acquired_) {
        state.record_error(TransferError::INTERNAL_ERROR, "drain called without an open sink");
        return 0;
    }
    
    std::uint64_t written = 0;
    
    for (auto it = state.pending_chunks.find(state.write_cursor);
         it != state.pending_chunks.end();
         it = state.pending_chunks.find(state.write_cursor)) {
        
        const auto& chunk = it->second;
        if (!sink_.write(chunk.payload)) {
            state.record_error(TransferError::SINK_ERROR,
                               "write of " + std::to_string(chunk.length) + " bytes at offset " +
                               std::to_string(chunk.offset) + " to " + sink_.describe() + " failed");
            break;
        }
        
        auto length = chunk.length;
        state.write_cursor += length;
        state.pending_chunks.erase(it);
        written += length;
        
        if (progress_) {
            progress_(length);
        }
    }
    
    if (written > 0) {
        LOG_TRACE("Flushed {} bytes, write cursor at {} ({} chunks still buffered)",
                  written, state.write_cursor, state.pending_chunks.size());
    }
    return written;
}

}
