#pragma once

#include "performance_monitor.hpp"
#include "transfer_options.hpp"
#include "transfer_types.hpp"
#include "chunkpipe/network/read_transport.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace chunkpipe::transfer {

struct TransferSessionStats {
    std::string session_id;
    std::string remote_path;
    std::filesystem::path destination_folder;
    bool finished = false;
    std::optional<TransferResult> result;
    ThroughputStats throughput;
};

// Runs several downloads at once over one shared transport. Each download
// gets its own thread, session and cancel signal.
class TransferManager {
public:
    explicit TransferManager(network::ReadTransport& transport, TransferOptions defaults = {});
    ~TransferManager();
    
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;
    
    // Returns an empty id when the concurrency limit is reached.
    std::string start_download(const std::string& remote_path,
                               const std::filesystem::path& destination_folder,
                               const std::string& expected_digest = "");
    
    bool has_session(const std::string& session_id) const;
    bool cancel_transfer(const std::string& session_id);
    void cancel_all();
    
    // Blocks until the download finishes; nullopt for unknown ids.
    std::optional<TransferResult> wait_for(const std::string& session_id);
    void wait_all();
    
    // Forgets finished downloads and their throughput stats. Returns how
    // many were removed.
    size_t remove_finished();
    
    std::optional<TransferSessionStats> get_session_stats(const std::string& session_id) const;
    std::vector<TransferSessionStats> get_all_sessions() const;
    
    void set_max_concurrent_transfers(std::uint32_t max_transfers) { max_concurrent_transfers_ = max_transfers; }
    std::uint32_t get_active_transfer_count() const;
    std::uint64_t get_total_bytes_transferred() const;
    
    const PerformanceMonitor& get_performance_monitor() const { return monitor_; }
    
private:
    struct ManagedTransfer {
        std::string session_id;
        std::string remote_path;
        std::filesystem::path destination_folder;
        std::shared_ptr<CancelSignal> cancel_signal;
        std::thread worker;
        std::once_flag join_once;
        std::atomic<bool> finished{false};
        std::optional<TransferResult> result;
    };
    
    void run_transfer(ManagedTransfer& managed, TransferOptions options, std::string expected_digest);
    std::shared_ptr<ManagedTransfer> find(const std::string& session_id) const;
    static void join(ManagedTransfer& managed);
    TransferSessionStats create_session_stats(const ManagedTransfer& managed) const;
    
    network::ReadTransport& transport_;
    TransferOptions defaults_;
    PerformanceMonitor monitor_;
    
    std::unordered_map<std::string, std::shared_ptr<ManagedTransfer>> transfers_;
    mutable std::mutex transfers_mutex_;
    
    std::atomic<std::uint32_t> max_concurrent_transfers_;
    std::atomic<std::uint64_t> total_bytes_transferred_;
};

}
