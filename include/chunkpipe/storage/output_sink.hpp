#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <vector>

namespace chunkpipe::storage {

// Sequential-write byte sink. Opened once for a whole transfer and closed on
// every exit path by its owner.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    
    virtual bool open() = 0;
    virtual bool write(std::span<const std::uint8_t> data) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    
    // Bytes the sink holds; used for the final consistency check.
    virtual std::uint64_t bytes_written() const = 0;
    virtual std::string describe() const = 0;
};

// Writes to a local file, truncating any previous content. Once closed,
// bytes_written() reports the size found on disk.
class FileSink : public OutputSink {
public:
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;
    
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;
    
    bool open() override;
    bool write(std::span<const std::uint8_t> data) override;
    void close() override;
    bool is_open() const override { return file_.is_open(); }
    std::uint64_t bytes_written() const override;
    std::string describe() const override { return path_.string(); }
    
    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream file_;
    std::uint64_t bytes_written_;
};

class MemorySink : public OutputSink {
public:
    MemorySink() = default;
    
    bool open() override;
    bool write(std::span<const std::uint8_t> data) override;
    void close() override;
    bool is_open() const override { return open_; }
    std::uint64_t bytes_written() const override { return data_.size(); }
    std::string describe() const override { return "memory"; }
    
    const std::vector<std::uint8_t>& data() const { return data_; }
    size_t get_open_count() const { return open_count_; }
    size_t get_close_count() const { return close_count_; }
    size_t get_write_count() const { return write_count_; }

private:
    std::vector<std::uint8_t> data_;
    bool open_ = false;
    size_t open_count_ = 0;
    size_t close_count_ = 0;
    size_t write_count_ = 0;
};

}
