#pragma once

#include "chunkpipe/network/read_transport.hpp"
#include "chunkpipe/network/response_router.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <vector>

namespace chunkpipe::test {

// In-memory ReadTransport whose delivery order and faults are scripted by the
// test. Responses are published from a dedicated delivery thread, the way a
// real connection's reader context would.
class ScriptedTransport : public network::ReadTransport {
public:
    enum class Release {
        IMMEDIATE,
        REVERSE_BATCH,
        SHUFFLED_BATCH,
        HOLD
    };

    struct IssuedRequest {
        network::RequestId request_id;
        std::uint64_t offset;
        std::uint32_t length;
    };

    static constexpr network::RequestId FOREIGN_ID_BASE = 1'000'000;

    explicit ScriptedTransport(std::vector<std::uint8_t> content, std::string path = "remote/data.bin")
        : content_(std::move(content))
        , path_(std::move(path))
        , delivery_thread_([this]() { delivery_loop(); }) {
    }

    ~ScriptedTransport() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        outbox_cv_.notify_all();
        delivery_thread_.join();
    }

    ScriptedTransport(const ScriptedTransport&) = delete;
    ScriptedTransport& operator=(const ScriptedTransport&) = delete;

    static std::vector<std::uint8_t> make_content(size_t size, std::uint32_t seed = 7) {
        std::vector<std::uint8_t> data(size);
        std::mt19937 rng(seed);
        for (auto& byte : data) {
            byte = static_cast<std::uint8_t>(rng());
        }
        return data;
    }

    const std::vector<std::uint8_t>& content() const { return content_; }

    // Batch modes deliver every batch_size requests together, and flush the
    // batch early when the request for the final bytes of the file arrives.
    void set_release_mode(Release mode, size_t batch_size = 1, std::uint32_t seed = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
        batch_size_ = std::max<size_t>(batch_size, 1);
        rng_.seed(seed);
    }

    void corrupt_length(std::uint64_t offset, std::uint32_t delivered_length) {
        std::lock_guard<std::mutex> lock(mutex_);
        corrupt_lengths_[offset] = delivered_length;
    }

    void fail_request(std::uint64_t offset, network::ResponseStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[offset] = status;
    }

    void set_duplicate_responses(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        duplicates_ = enabled;
    }

    // Precedes every real response with one for a request this caller never issued.
    void set_foreign_traffic(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        foreign_traffic_ = enabled;
    }

    void fail_next_issues(size_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_issues_ = count;
    }

    void set_missing(bool missing) {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_ = missing;
    }

    void set_reported_size(std::optional<std::uint64_t> size) {
        std::lock_guard<std::mutex> lock(mutex_);
        reported_size_ = size;
    }

    void drop_connection() {
        auto event = std::make_shared<network::ReadResponse>();
        event->request_id = network::CONNECTION_EVENT_ID;
        event->status = network::ResponseStatus::CONNECTION_LOST;
        event->error_message = "scripted disconnect";

        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        outbox_.push_back(event);
        outbox_cv_.notify_all();
    }

    // Publishes a response for a request some other caller issued.
    void publish_foreign(network::RequestId request_id) {
        auto response = std::make_shared<network::ReadResponse>();
        response->request_id = FOREIGN_ID_BASE + request_id;
        response->payload.assign(16, 0xEE);

        std::lock_guard<std::mutex> lock(mutex_);
        outbox_.push_back(response);
        outbox_cv_.notify_all();
    }

    void release_held(const std::vector<std::uint64_t>& offsets) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto offset : offsets) {
            auto it = std::find_if(held_.begin(), held_.end(),
                                   [offset](const IssuedRequest& request) { return request.offset == offset; });
            if (it != held_.end()) {
                enqueue(*it);
                held_.erase(it);
            }
        }
        outbox_cv_.notify_all();
    }

    void release_all_held() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& request : held_) {
            enqueue(request);
        }
        held_.clear();
        outbox_cv_.notify_all();
    }

    std::vector<std::uint64_t> held_offsets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::uint64_t> offsets;
        for (const auto& request : held_) {
            offsets.push_back(request.offset);
        }
        return offsets;
    }

    bool wait_until_held(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return held_cv_.wait_for(lock, timeout, [&]() { return held_.size() >= count; });
    }

    size_t requests_issued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return issued_.size();
    }

    std::vector<IssuedRequest> issued_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return issued_;
    }

    int open_handle_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_handles_;
    }

    size_t subscriber_count() const { return router_.subscriber_count(); }

    std::optional<network::FileHandle> open_file(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (missing_ || path != path_) {
            return std::nullopt;
        }
        ++open_handles_;
        return network::FileHandle{++next_handle_, path};
    }

    void close_file(const network::FileHandle& handle) override {
        (void)handle;
        std::lock_guard<std::mutex> lock(mutex_);
        --open_handles_;
    }

    std::optional<std::uint64_t> file_size(const network::FileHandle& handle) override {
        (void)handle;
        std::lock_guard<std::mutex> lock(mutex_);
        if (missing_) {
            return std::nullopt;
        }
        return reported_size_.value_or(content_.size());
    }

    std::optional<network::RequestId> issue_read_request(const network::FileHandle& handle,
                                                         std::uint64_t offset,
                                                         std::uint32_t length) override {
        (void)handle;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return std::nullopt;
        }
        if (failing_issues_ > 0) {
            --failing_issues_;
            return std::nullopt;
        }

        IssuedRequest request{next_request_id_++, offset, length};
        issued_.push_back(request);

        switch (mode_) {
            case Release::IMMEDIATE:
                enqueue(request);
                break;
            case Release::REVERSE_BATCH:
            case Release::SHUFFLED_BATCH:
                batch_.push_back(request);
                if (batch_.size() >= batch_size_ || offset + length >= content_.size()) {
                    flush_batch();
                }
                break;
            case Release::HOLD:
                held_.push_back(request);
                held_cv_.notify_all();
                break;
        }
        outbox_cv_.notify_all();

        return request.request_id;
    }

    network::SubscriptionId subscribe(ResponseHandler handler) override {
        return router_.subscribe(std::move(handler));
    }

    void unsubscribe(network::SubscriptionId id) override {
        router_.unsubscribe(id);
    }

private:
    void flush_batch() {
        if (mode_ == Release::REVERSE_BATCH) {
            std::reverse(batch_.begin(), batch_.end());
        } else {
            std::shuffle(batch_.begin(), batch_.end(), rng_);
        }
        for (const auto& request : batch_) {
            enqueue(request);
        }
        batch_.clear();
    }

    // Caller holds mutex_.
    void enqueue(const IssuedRequest& request) {
        if (foreign_traffic_) {
            auto foreign = std::make_shared<network::ReadResponse>();
            foreign->request_id = FOREIGN_ID_BASE + request.request_id;
            foreign->payload.assign(request.length, 0xEE);
            outbox_.push_back(foreign);
        }

        auto response = make_response(request);
        outbox_.push_back(response);
        if (duplicates_) {
            outbox_.push_back(response);
        }
    }

    network::ResponsePtr make_response(const IssuedRequest& request) const {
        auto response = std::make_shared<network::ReadResponse>();
        response->request_id = request.request_id;

        auto failure = failures_.find(request.offset);
        if (failure != failures_.end()) {
            response->status = failure->second;
            response->error_message = "scripted failure";
            return response;
        }

        auto begin = std::min<std::uint64_t>(request.offset, content_.size());
        auto end = std::min<std::uint64_t>(request.offset + request.length, content_.size());
        response->payload.assign(content_.begin() + begin, content_.begin() + end);

        auto corrupt = corrupt_lengths_.find(request.offset);
        if (corrupt != corrupt_lengths_.end()) {
            response->payload.resize(corrupt->second);
        }

        return response;
    }

    void delivery_loop() {
        while (true) {
            network::ResponsePtr response;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                outbox_cv_.wait(lock, [this]() { return stopping_ || !outbox_.empty(); });
                if (stopping_) {
                    return;
                }
                response = outbox_.front();
                outbox_.pop_front();
            }
            router_.publish(response);
        }
    }

    const std::vector<std::uint8_t> content_;
    const std::string path_;

    mutable std::mutex mutex_;
    std::condition_variable outbox_cv_;
    std::condition_variable held_cv_;
    std::deque<network::ResponsePtr> outbox_;

    Release mode_ = Release::IMMEDIATE;
    size_t batch_size_ = 1;
    std::mt19937 rng_{1};
    std::vector<IssuedRequest> batch_;
    std::vector<IssuedRequest> held_;
    std::vector<IssuedRequest> issued_;

    std::map<std::uint64_t, std::uint32_t> corrupt_lengths_;
    std::map<std::uint64_t, network::ResponseStatus> failures_;
    bool duplicates_ = false;
    bool foreign_traffic_ = false;
    size_t failing_issues_ = 0;
    bool missing_ = false;
    bool connected_ = true;
    std::optional<std::uint64_t> reported_size_;

    int open_handles_ = 0;
    std::uint64_t next_handle_ = 0;
    network::RequestId next_request_id_ = 1;
    bool stopping_ = false;

    network::ResponseRouter router_;
    std::thread delivery_thread_;
};

}
