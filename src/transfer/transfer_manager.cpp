#include "chunkpipe/transfer/transfer_manager.hpp"
#include "chunkpipe/transfer/file_downloader.hpp"
#include "chunkpipe/core/logger.hpp"

namespace chunkpipe::transfer {

TransferManager::TransferManager(network::ReadTransport& transport, TransferOptions defaults)
    : transport_(transport)
    , defaults_(std::move(defaults))
    , max_concurrent_transfers_(8)
    , total_bytes_transferred_(0) {
}

TransferManager::~TransferManager() {
    cancel_all();
    wait_all();
}

std::string TransferManager::start_download(const std::string& remote_path,
                                            const std::filesystem::path& destination_folder,
                                            const std::string& expected_digest) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    
    std::uint32_t active = 0;
    for (const auto& [id, managed] : transfers_) {
        if (!managed->finished) {
            active++;
        }
    }
    if (active >= max_concurrent_transfers_) {
        LOG_WARN("Refusing download of {}: {} transfers already active", remote_path, active);
        return "";
    }
    
    auto managed = std::make_shared<ManagedTransfer>();
    do {
        managed->session_id = generate_session_id();
    } while (transfers_.count(managed->session_id) > 0);
    managed->remote_path = remote_path;
    managed->destination_folder = destination_folder;
    managed->cancel_signal = std::make_shared<CancelSignal>();
    
    TransferOptions options = defaults_;
    options.session_id = managed->session_id;
    options.cancel_signal = managed->cancel_signal;
    
    auto session_id = managed->session_id;
    monitor_.start_session(session_id, 0);
    
    auto& ref = *managed;
    transfers_.emplace(session_id, std::move(managed));
    ref.worker = std::thread(&TransferManager::run_transfer, this, std::ref(ref), std::move(options), expected_digest);
    
    LOG_INFO("[{}] Queued download of {}", session_id, remote_path);
    return session_id;
}

void TransferManager::run_transfer(ManagedTransfer& managed, TransferOptions options, std::string expected_digest) {
    const auto session_id = managed.session_id;
    auto user_progress = options.progress_callback;
    options.progress_callback = [this, session_id, user_progress](std::uint64_t bytes) {
        monitor_.on_bytes_transferred(session_id, bytes);
        total_bytes_transferred_ += bytes;
        if (user_progress) {
            user_progress(bytes);
        }
    };
    
    FileDownloader downloader(transport_, std::move(options));
    downloader.set_started_callback([this, session_id](std::uint64_t remote_size) {
        monitor_.set_total_bytes(session_id, remote_size);
    });
    
    auto result = downloader.download_file(managed.remote_path, managed.destination_folder, expected_digest);
    
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        managed.result = result;
    }
    managed.finished = true;
}

bool TransferManager::has_session(const std::string& session_id) const {
    return find(session_id) != nullptr;
}

bool TransferManager::cancel_transfer(const std::string& session_id) {
    auto managed = find(session_id);
    if (!managed || managed->finished) {
        return false;
    }
    
    LOG_INFO("[{}] Cancelling download of {}", session_id, managed->remote_path);
    managed->cancel_signal->cancel();
    return true;
}

void TransferManager::cancel_all() {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    for (auto& [id, managed] : transfers_) {
        if (!managed->finished) {
            managed->cancel_signal->cancel();
        }
    }
}

std::optional<TransferResult> TransferManager::wait_for(const std::string& session_id) {
    auto managed = find(session_id);
    if (!managed) {
        return std::nullopt;
    }
    
    join(*managed);
    
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    return managed->result;
}

size_t TransferManager::remove_finished() {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    
    size_t removed = 0;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        auto& managed = it->second;
        if (!managed->finished) {
            ++it;
            continue;
        }
        
        // A finished worker no longer takes transfers_mutex_.
        join(*managed);
        monitor_.end_session(managed->session_id);
        it = transfers_.erase(it);
        removed++;
    }
    
    if (removed > 0) {
        LOG_DEBUG("Removed {} finished transfers ({} left)", removed, transfers_.size());
    }
    return removed;
}

void TransferManager::join(ManagedTransfer& managed) {
    std::call_once(managed.join_once, [&managed]() {
        if (managed.worker.joinable()) {
            managed.worker.join();
        }
    });
}

void TransferManager::wait_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        for (const auto& [id, managed] : transfers_) {
            ids.push_back(id);
        }
    }
    
    for (const auto& id : ids) {
        wait_for(id);
    }
}

std::optional<TransferSessionStats> TransferManager::get_session_stats(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(session_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return create_session_stats(*it->second);
}

std::vector<TransferSessionStats> TransferManager::get_all_sessions() const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    
    std::vector<TransferSessionStats> all_stats;
    for (const auto& [id, managed] : transfers_) {
        all_stats.push_back(create_session_stats(*managed));
    }
    return all_stats;
}

std::uint32_t TransferManager::get_active_transfer_count() const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    
    std::uint32_t active = 0;
    for (const auto& [id, managed] : transfers_) {
        if (!managed->finished) {
            active++;
        }
    }
    return active;
}

std::uint64_t TransferManager::get_total_bytes_transferred() const {
    return total_bytes_transferred_;
}

std::shared_ptr<TransferManager::ManagedTransfer> TransferManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(session_id);
    return it != transfers_.end() ? it->second : nullptr;
}

TransferSessionStats TransferManager::create_session_stats(const ManagedTransfer& managed) const {
    TransferSessionStats stats;
    stats.session_id = managed.session_id;
    stats.remote_path = managed.remote_path;
    stats.destination_folder = managed.destination_folder;
    stats.finished = managed.finished;
    stats.result = managed.result;
    stats.throughput = monitor_.get_session_stats(managed.session_id);
    return stats;
}

}
