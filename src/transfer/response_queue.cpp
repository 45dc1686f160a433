#include "chunkpipe/transfer/response_queue.hpp"
#include <algorithm>

namespace chunkpipe::transfer {

ResponseQueue::ResponseQueue(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {
}

bool ResponseQueue::push(network::ResponsePtr response) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() {
        return closed_ || interrupted_ || items_.size() < capacity_;
    });
    
    if (closed_ || interrupted_) {
        return false;
    }
    
    items_.push_back(std::move(response));
    not_empty_.notify_one();
    return true;
}

PopStatus ResponseQueue::pop(network::ResponsePtr& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this]() { return interrupted_ || closed_ || !items_.empty(); };
    
    if (timeout.count() > 0) {
        if (!not_empty_.wait_for(lock, timeout, ready)) {
            return PopStatus::TIMED_OUT;
        }
    } else {
        not_empty_.wait(lock, ready);
    }
    
    if (interrupted_) {
        return PopStatus::INTERRUPTED;
    }
    
    if (items_.empty()) {
        return PopStatus::CLOSED;
    }
    
    out = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return PopStatus::ITEM;
}

void ResponseQueue::interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
}

void ResponseQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
}

size_t ResponseQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool ResponseQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}
