#include "chunkpipe/transfer/file_downloader.hpp"
#include "chunkpipe/transfer/transfer_session.hpp"
#include "chunkpipe/crypto/digest.hpp"
#include "chunkpipe/storage/output_sink.hpp"
#include "chunkpipe/core/logger.hpp"
#include "chunkpipe/core/utils.hpp"

namespace chunkpipe::transfer {

namespace {

class RemoteFileGuard {
public:
    RemoteFileGuard(network::ReadTransport& transport, network::FileHandle handle)
        : transport_(transport)
        , handle_(std::move(handle)) {
    }
    
    ~RemoteFileGuard() {
        transport_.close_file(handle_);
    }
    
    RemoteFileGuard(const RemoteFileGuard&) = delete;
    RemoteFileGuard& operator=(const RemoteFileGuard&) = delete;
    
private:
    network::ReadTransport& transport_;
    network::FileHandle handle_;
};

}

FileDownloader::FileDownloader(network::ReadTransport& transport, TransferOptions options)
    : transport_(transport)
    , options_(std::move(options)) {
}

std::filesystem::path FileDownloader::destination_path(const std::string& remote_path,
                                                       const std::filesystem::path& destination_folder) {
    return destination_folder / std::filesystem::path(remote_path).filename();
}

TransferResult FileDownloader::download_file(const std::string& remote_path,
                                             const std::filesystem::path& destination_folder,
                                             const std::string& expected_digest) {
    auto local_path = destination_path(remote_path, destination_folder);
    if (local_path.filename().empty()) {
        return TransferResult(TransferError::INVALID_ARGUMENT, "remote path has no file name: " + remote_path);
    }
    
    if (!core::utils::FileUtils::exists(destination_folder)) {
        return TransferResult(TransferError::SINK_ERROR,
                              "destination folder does not exist: " + destination_folder.string());
    }
    
    auto handle = transport_.open_file(remote_path);
    if (!handle) {
        return TransferResult(TransferError::FILE_NOT_FOUND, "cannot open remote file " + remote_path);
    }
    RemoteFileGuard guard(transport_, *handle);
    
    auto remote_size = transport_.file_size(*handle);
    if (!remote_size) {
        return TransferResult(TransferError::FILE_NOT_FOUND, "cannot stat remote file " + remote_path);
    }
    
    LOG_INFO("Downloading {} ({}) to {}", remote_path,
             core::utils::StringUtils::format_bytes(*remote_size), local_path.string());
    
    if (started_callback_) {
        started_callback_(*remote_size);
    }
    
    storage::FileSink sink(local_path);
    TransferSession session(transport_, *handle, options_);
    auto result = session.run(sink);
    if (!result.success()) {
        return result;
    }
    
    auto local_size = core::utils::FileUtils::file_size(local_path);
    if (!local_size || *local_size != *remote_size) {
        return TransferResult(TransferError::SIZE_MISMATCH,
                              "file size mismatch: " + std::to_string(*remote_size) + " != " +
                              std::to_string(local_size.value_or(0)),
                              result.bytes_written);
    }
    
    if (!expected_digest.empty()) {
        return verify_digest(local_path, expected_digest, result.bytes_written);
    }
    
    return result;
}

TransferResult FileDownloader::verify_digest(const std::filesystem::path& local_path,
                                             const std::string& expected_digest,
                                             std::uint64_t bytes_written) const {
    auto expected = crypto::hash_utils::hash_from_hex(core::utils::StringUtils::to_lower(expected_digest));
    if (!expected) {
        return TransferResult(TransferError::INVALID_ARGUMENT, "malformed digest: " + expected_digest, bytes_written);
    }
    
    crypto::Blake2bHash actual{};
    auto hashed = crypto::Blake2bHasher::hash_file(local_path, actual);
    if (!hashed.success()) {
        return TransferResult(TransferError::SINK_ERROR, hashed.message, bytes_written);
    }
    
    if (actual != *expected) {
        return TransferResult(TransferError::DIGEST_MISMATCH,
                              "digest mismatch for " + local_path.string() + ": expected " +
                              crypto::hash_utils::hash_to_hex(*expected) + ", got " +
                              crypto::hash_utils::hash_to_hex(actual),
                              bytes_written);
    }
    
    LOG_DEBUG("Digest verified for {}", local_path.string());
    return TransferResult(TransferError::SUCCESS, "", bytes_written);
}

}
