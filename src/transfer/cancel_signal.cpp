#include "chunkpipe/transfer/cancel_signal.hpp"

namespace chunkpipe::transfer {

void CancelSignal::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true)) {
        return;
    }
    
    for (auto& [id, callback] : callbacks_) {
        callback();
    }
}

std::uint64_t CancelSignal::add_callback(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        callback();
    }
    
    auto id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void CancelSignal::remove_callback(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

}
