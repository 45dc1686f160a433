#pragma once

#include "chunkpipe/network/read_transport.hpp"
#include "chunkpipe/network/response_router.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>

namespace chunkpipe::network {

struct LocalTransportOptions {
    size_t worker_threads = 4;
    // Each read is delayed by a random amount up to this bound, which makes
    // responses overtake each other the way they do on a real link.
    std::chrono::microseconds max_latency{0};
};

// Serves files below a root directory over the ReadTransport contract. Reads
// run on a Boost.Asio reader pool and are published to every subscriber.
class LocalFileTransport : public ReadTransport {
public:
    explicit LocalFileTransport(std::filesystem::path root, LocalTransportOptions options = {});
    ~LocalFileTransport() override;
    
    LocalFileTransport(const LocalFileTransport&) = delete;
    LocalFileTransport& operator=(const LocalFileTransport&) = delete;
    
    bool start();
    // Publishes CONNECTION_LOST to subscribers once the reader pool has drained.
    void stop();
    bool is_running() const { return running_; }
    
    std::optional<FileHandle> open_file(const std::string& path) override;
    void close_file(const FileHandle& handle) override;
    std::optional<std::uint64_t> file_size(const FileHandle& handle) override;
    std::optional<RequestId> issue_read_request(const FileHandle& handle,
                                                std::uint64_t offset,
                                                std::uint32_t length) override;
    SubscriptionId subscribe(ResponseHandler handler) override;
    void unsubscribe(SubscriptionId id) override;
    
    std::uint64_t get_requests_served() const { return requests_served_; }
    const std::filesystem::path& get_root() const { return root_; }

private:
    struct OpenFile {
        int fd;
        std::string path;
        
        OpenFile(int descriptor, std::string file_path) : fd(descriptor), path(std::move(file_path)) {}
        ~OpenFile();
    };
    
    std::optional<std::filesystem::path> resolve(const std::string& path) const;
    std::shared_ptr<OpenFile> find_open_file(const FileHandle& handle) const;
    std::chrono::microseconds random_latency();
    void serve_read(const std::shared_ptr<OpenFile>& file, RequestId request_id,
                    std::uint64_t offset, std::uint32_t length);
    void publish_failure(RequestId request_id, ResponseStatus status, std::string message);
    
    std::filesystem::path root_;
    LocalTransportOptions options_;
    
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_;
    
    std::atomic<RequestId> next_request_id_;
    std::atomic<std::uint64_t> requests_served_;
    
    mutable std::mutex files_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<OpenFile>> open_files_;
    std::uint64_t next_handle_id_;
    
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    
    ResponseRouter router_;
};

}
