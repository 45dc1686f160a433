#pragma once

#include "transfer_options.hpp"
#include "transfer_types.hpp"
#include "chunkpipe/network/read_transport.hpp"
#include <filesystem>
#include <functional>
#include <string>

namespace chunkpipe::transfer {

// Downloads a remote file into a local folder through a TransferSession and
// checks the local copy against the remote size, and optionally a digest.
class FileDownloader {
public:
    using StartedCallback = std::function<void(std::uint64_t remote_size)>;
    
    explicit FileDownloader(network::ReadTransport& transport, TransferOptions options = {});
    
    // expected_digest is a hex BLAKE2b-256 digest; empty skips verification.
    TransferResult download_file(const std::string& remote_path,
                                 const std::filesystem::path& destination_folder,
                                 const std::string& expected_digest = "");
    
    void set_started_callback(StartedCallback callback) { started_callback_ = std::move(callback); }
    
    static std::filesystem::path destination_path(const std::string& remote_path,
                                                  const std::filesystem::path& destination_folder);
    
private:
    TransferResult verify_digest(const std::filesystem::path& local_path,
                                 const std::string& expected_digest,
                                 std::uint64_t bytes_written) const;
    
    network::ReadTransport& transport_;
    TransferOptions options_;
    StartedCallback started_callback_;
};

}
