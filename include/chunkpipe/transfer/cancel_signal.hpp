#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace chunkpipe::transfer {

// Shareable cancellation token. Callbacks run on the cancelling thread, under
// the signal's lock, and must not block.
class CancelSignal {
public:
    using Callback = std::function<void()>;
    
    void cancel();
    bool is_cancelled() const { return cancelled_; }
    
    // Runs the callback immediately if the signal has already fired.
    std::uint64_t add_callback(Callback callback);
    void remove_callback(std::uint64_t id);
    
private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<std::uint64_t, Callback> callbacks_;
    std::uint64_t next_id_ = 1;
};

}
