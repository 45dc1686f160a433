#include "chunkpipe/storage/output_sink.hpp"
#include "chunkpipe/core/logger.hpp"
#include "chunkpipe/core/utils.hpp"

namespace chunkpipe::storage {

FileSink::FileSink(std::filesystem::path path)
    : path_(std::move(path))
    , bytes_written_(0) {
}

FileSink::~FileSink() {
    close();
}

bool FileSink::open() {
    if (file_.is_open()) {
        return true;
    }
    
    if (path_.has_parent_path() && !core::utils::FileUtils::exists(path_.parent_path())) {
        LOG_WARN("Destination directory does not exist: {}", path_.parent_path().string());
        return false;
    }
    
    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        LOG_ERROR("Failed to open {} for writing", path_.string());
        return false;
    }
    
    bytes_written_ = 0;
    LOG_DEBUG("Opened file sink {}", path_.string());
    return true;
}

bool FileSink::write(std::span<const std::uint8_t> data) {
    if (!file_.is_open()) {
        return false;
    }
    
    file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file_.good()) {
        LOG_ERROR("Write of {} bytes to {} failed", data.size(), path_.string());
        return false;
    }
    
    bytes_written_ += data.size();
    return true;
}

void FileSink::close() {
    if (!file_.is_open()) {
        return;
    }
    
    file_.flush();
    file_.close();
    LOG_DEBUG("Closed file sink {} after {} bytes", path_.string(), bytes_written_);
}

std::uint64_t FileSink::bytes_written() const {
    if (file_.is_open()) {
        return bytes_written_;
    }
    
    auto on_disk = core::utils::FileUtils::file_size(path_);
    return on_disk ? *on_disk : 0;
}

bool MemorySink::open() {
    if (!open_) {
        data_.clear();
        open_ = true;
        open_count_++;
    }
    return true;
}

bool MemorySink::write(std::span<const std::uint8_t> data) {
    if (!open_) {
        return false;
    }
    
    data_.insert(data_.end(), data.begin(), data.end());
    write_count_++;
    return true;
}

void MemorySink::close() {
    if (open_) {
        open_ = false;
        close_count_++;
    }
}

}
