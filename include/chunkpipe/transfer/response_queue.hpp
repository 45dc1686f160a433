#pragma once

#include "chunkpipe/network/read_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace chunkpipe::transfer {

enum class PopStatus {
    ITEM,
    TIMED_OUT,
    INTERRUPTED,
    CLOSED
};

// Bounded handoff from the transport's reader context to a session's control
// loop.
class ResponseQueue {
public:
    explicit ResponseQueue(size_t capacity);
    
    // Blocks while the queue is full. Returns false, dropping the response,
    // once the queue is closed or interrupted.
    bool push(network::ResponsePtr response);
    
    // A zero timeout waits without limit. Interruption wins over queued items.
    PopStatus pop(network::ResponsePtr& out, std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    
    void interrupt();
    void close();
    
    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool is_closed() const;
    
private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<network::ResponsePtr> items_;
    bool closed_ = false;
    bool interrupted_ = false;
};

}
