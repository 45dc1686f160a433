#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkpipe::transfer {

struct ThroughputStats {
    std::string session_id;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    double percentage_complete = 0.0;
    std::uint64_t current_speed_bps = 0;
    std::uint64_t average_speed_bps = 0;
    std::chrono::milliseconds estimated_time_remaining{0};
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;
};

// Per-session byte counters with a sliding window for current speed.
class PerformanceMonitor {
public:
    void start_session(const std::string& session_id, std::uint64_t total_bytes);
    void set_total_bytes(const std::string& session_id, std::uint64_t total_bytes);
    void end_session(const std::string& session_id);
    
    void on_bytes_transferred(const std::string& session_id, std::uint64_t bytes);
    
    ThroughputStats get_session_stats(const std::string& session_id) const;
    std::vector<ThroughputStats> get_all_session_stats() const;
    
    std::uint64_t get_total_bytes_transferred() const;
    std::uint64_t get_current_global_speed() const;
    
private:
    struct SessionData {
        std::uint64_t total_bytes = 0;
        std::uint64_t bytes_transferred = 0;
        std::chrono::steady_clock::time_point start_time;
        std::chrono::steady_clock::time_point last_update;
        std::deque<std::pair<std::chrono::steady_clock::time_point, std::uint64_t>> transfer_history;
    };
    
    ThroughputStats make_stats(const std::string& session_id, const SessionData& session,
                               std::chrono::steady_clock::time_point now) const;
    static std::uint64_t current_speed(const SessionData& session, std::chrono::steady_clock::time_point now);
    static void trim_history(SessionData& session, std::chrono::steady_clock::time_point now);
    
    std::unordered_map<std::string, SessionData> sessions_;
    mutable std::mutex mutex_;
    
    static constexpr std::chrono::seconds HISTORY_WINDOW{30};
    static constexpr std::chrono::seconds SPEED_WINDOW{1};
};

}
