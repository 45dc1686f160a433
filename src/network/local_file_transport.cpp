#include "chunkpipe/network/local_file_transport.hpp"
#include "chunkpipe/core/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chunkpipe::network {

LocalFileTransport::OpenFile::~OpenFile() {
    if (fd >= 0) {
        ::close(fd);
    }
}

LocalFileTransport::LocalFileTransport(std::filesystem::path root, LocalTransportOptions options)
    : root_(std::move(root))
    , options_(options)
    , io_context_()
    , running_(false)
    , next_request_id_(1)
    , requests_served_(0)
    , next_handle_id_(1)
    , rng_(std::random_device{}()) {
    
    if (options_.worker_threads == 0) {
        options_.worker_threads = 1;
    }
    
    LOG_INFO("Local transport initialized for {}", root_.string());
}

LocalFileTransport::~LocalFileTransport() {
    stop();
}

bool LocalFileTransport::start() {
    if (running_) {
        LOG_WARN("Local transport already running");
        return false;
    }
    
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        LOG_ERROR("Transport root is not a directory: {}", root_.string());
        return false;
    }
    
    io_context_.restart();
    work_guard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        io_context_.get_executor());
    running_ = true;
    
    for (size_t i = 0; i < options_.worker_threads; ++i) {
        workers_.emplace_back([this]() {
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("Reader pool error: {}", e.what());
                }
            }
        });
    }
    
    LOG_INFO("Local transport started with {} reader threads (max latency {}us)",
             options_.worker_threads, options_.max_latency.count());
    return true;
}

void LocalFileTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_INFO("Stopping local transport for {}", root_.string());
    
    work_guard_.reset();
    io_context_.stop();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    
    auto event = std::make_shared<ReadResponse>();
    event->request_id = CONNECTION_EVENT_ID;
    event->status = ResponseStatus::CONNECTION_LOST;
    event->error_message = "transport stopped";
    router_.publish(event);
}

std::optional<FileHandle> LocalFileTransport::open_file(const std::string& path) {
    auto resolved = resolve(path);
    if (!resolved) {
        LOG_WARN("Rejected remote path outside transport root: {}", path);
        return std::nullopt;
    }
    
    int fd = ::open(resolved->c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        LOG_WARN("Cannot open {}: {}", resolved->string(), std::strerror(errno));
        return std::nullopt;
    }
    
    struct stat info{};
    if (::fstat(fd, &info) != 0 || !S_ISREG(info.st_mode)) {
        ::close(fd);
        LOG_WARN("Not a regular file: {}", resolved->string());
        return std::nullopt;
    }
    
    std::lock_guard<std::mutex> lock(files_mutex_);
    FileHandle handle{next_handle_id_++, path};
    open_files_[handle.id] = std::make_shared<OpenFile>(fd, resolved->string());
    
    LOG_DEBUG("Opened {} as handle {}", resolved->string(), handle.id);
    return handle;
}

void LocalFileTransport::close_file(const FileHandle& handle) {
    std::lock_guard<std::mutex> lock(files_mutex_);
    // Reads still queued keep the descriptor alive through their shared_ptr.
    if (open_files_.erase(handle.id) > 0) {
        LOG_DEBUG("Closed handle {} ({})", handle.id, handle.path);
    }
}

std::optional<std::uint64_t> LocalFileTransport::file_size(const FileHandle& handle) {
    auto file = find_open_file(handle);
    if (!file) {
        return std::nullopt;
    }
    
    struct stat info{};
    if (::fstat(file->fd, &info) != 0) {
        LOG_WARN("fstat failed for {}: {}", file->path, std::strerror(errno));
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.st_size);
}

std::optional<RequestId> LocalFileTransport::issue_read_request(const FileHandle& handle,
                                                                std::uint64_t offset,
                                                                std::uint32_t length) {
    if (!running_) {
        return std::nullopt;
    }
    
    auto file = find_open_file(handle);
    if (!file) {
        LOG_WARN("Read request for unknown handle {}", handle.id);
        return std::nullopt;
    }
    
    RequestId request_id = next_request_id_++;
    auto delay = random_latency();
    
    if (delay.count() > 0) {
        auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay);
        timer->async_wait([this, timer, file, request_id, offset, length](const boost::system::error_code& ec) {
            if (!ec) {
                serve_read(file, request_id, offset, length);
            }
        });
    } else {
        boost::asio::post(io_context_, [this, file, request_id, offset, length]() {
            serve_read(file, request_id, offset, length);
        });
    }
    
    return request_id;
}

SubscriptionId LocalFileTransport::subscribe(ResponseHandler handler) {
    return router_.subscribe(std::move(handler));
}

void LocalFileTransport::unsubscribe(SubscriptionId id) {
    router_.unsubscribe(id);
}

std::optional<std::filesystem::path> LocalFileTransport::resolve(const std::string& path) const {
    auto relative = std::filesystem::path(path).relative_path().lexically_normal();
    if (relative.empty()) {
        return std::nullopt;
    }
    
    for (const auto& part : relative) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    
    return root_ / relative;
}

std::shared_ptr<LocalFileTransport::OpenFile> LocalFileTransport::find_open_file(const FileHandle& handle) const {
    std::lock_guard<std::mutex> lock(files_mutex_);
    auto it = open_files_.find(handle.id);
    return it != open_files_.end() ? it->second : nullptr;
}

std::chrono::microseconds LocalFileTransport::random_latency() {
    if (options_.max_latency.count() <= 0) {
        return std::chrono::microseconds(0);
    }
    
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<std::int64_t> dist(0, options_.max_latency.count());
    return std::chrono::microseconds(dist(rng_));
}

void LocalFileTransport::serve_read(const std::shared_ptr<OpenFile>& file, RequestId request_id,
                                    std::uint64_t offset, std::uint32_t length) {
    auto response = std::make_shared<ReadResponse>();
    response->request_id = request_id;
    response->payload.resize(length);
    
    size_t total = 0;
    while (total < length) {
        ssize_t n = ::pread(file->fd, response->payload.data() + total, length - total,
                            static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            publish_failure(request_id, ResponseStatus::FAILURE, std::strerror(errno));
            return;
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    
    if (total == 0 && length > 0) {
        publish_failure(request_id, ResponseStatus::END_OF_FILE, "read past end of " + file->path);
        return;
    }
    
    // A short read near the end of a file that shrank is passed through as-is.
    response->payload.resize(total);
    response->status = ResponseStatus::OK;
    requests_served_++;
    
    LOG_TRACE("Served request {} ({} bytes at offset {})", request_id, total, offset);
    router_.publish(response);
}

void LocalFileTransport::publish_failure(RequestId request_id, ResponseStatus status, std::string message) {
    auto response = std::make_shared<ReadResponse>();
    response->request_id = request_id;
    response->status = status;
    response->error_message = std::move(message);
    
    LOG_DEBUG("Request {} failed: {} ({})", request_id, to_string(status), response->error_message);
    router_.publish(response);
}

}
