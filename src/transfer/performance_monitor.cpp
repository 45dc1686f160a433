#include "chunkpipe/transfer/performance_monitor.hpp"

namespace chunkpipe::transfer {

void PerformanceMonitor::start_session(const std::string& session_id, std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SessionData session;
    session.total_bytes = total_bytes;
    session.start_time = std::chrono::steady_clock::now();
    session.last_update = session.start_time;
    sessions_[session_id] = std::move(session);
}

void PerformanceMonitor::set_total_bytes(const std::string& session_id, std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.total_bytes = total_bytes;
    }
}

void PerformanceMonitor::end_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

void PerformanceMonitor::on_bytes_transferred(const std::string& session_id, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }
    
    auto& session = it->second;
    session.bytes_transferred += bytes;
    session.last_update = std::chrono::steady_clock::now();
    session.transfer_history.emplace_back(session.last_update, bytes);
    trim_history(session, session.last_update);
}

ThroughputStats PerformanceMonitor::get_session_stats(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return make_stats(session_id, it->second, now);
    }
    
    ThroughputStats stats;
    stats.session_id = session_id;
    stats.start_time = now;
    stats.last_update = now;
    return stats;
}

std::vector<ThroughputStats> PerformanceMonitor::get_all_session_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    
    std::vector<ThroughputStats> all_stats;
    for (const auto& [session_id, session] : sessions_) {
        all_stats.push_back(make_stats(session_id, session, now));
    }
    return all_stats;
}

std::uint64_t PerformanceMonitor::get_total_bytes_transferred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::uint64_t total = 0;
    for (const auto& [session_id, session] : sessions_) {
        total += session.bytes_transferred;
    }
    return total;
}

std::uint64_t PerformanceMonitor::get_current_global_speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    
    std::uint64_t total_speed = 0;
    for (const auto& [session_id, session] : sessions_) {
        total_speed += current_speed(session, now);
    }
    return total_speed;
}

ThroughputStats PerformanceMonitor::make_stats(const std::string& session_id, const SessionData& session,
                                               std::chrono::steady_clock::time_point now) const {
    ThroughputStats stats;
    stats.session_id = session_id;
    stats.total_bytes = session.total_bytes;
    stats.bytes_transferred = session.bytes_transferred;
    stats.percentage_complete = session.total_bytes > 0 ?
        (static_cast<double>(session.bytes_transferred) / session.total_bytes) * 100.0 : 0.0;
    stats.current_speed_bps = current_speed(session, now);
    stats.start_time = session.start_time;
    stats.last_update = session.last_update;
    
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - session.start_time);
    if (elapsed.count() > 0) {
        stats.average_speed_bps = (session.bytes_transferred * 1000) / static_cast<std::uint64_t>(elapsed.count());
    }
    
    // Prefer the recent speed for the ETA, fall back to the average.
    auto speed = stats.current_speed_bps > 0 ? stats.current_speed_bps : stats.average_speed_bps;
    if (speed > 0 && session.bytes_transferred < session.total_bytes) {
        auto remaining = session.total_bytes - session.bytes_transferred;
        stats.estimated_time_remaining = std::chrono::milliseconds((remaining * 1000) / speed);
    }
    
    return stats;
}

std::uint64_t PerformanceMonitor::current_speed(const SessionData& session, std::chrono::steady_clock::time_point now) {
    auto window_start = now - SPEED_WINDOW;
    
    std::uint64_t recent_bytes = 0;
    for (const auto& [timestamp, bytes] : session.transfer_history) {
        if (timestamp >= window_start) {
            recent_bytes += bytes;
        }
    }
    return recent_bytes;
}

void PerformanceMonitor::trim_history(SessionData& session, std::chrono::steady_clock::time_point now) {
    auto cutoff = now - HISTORY_WINDOW;
    
    while (!session.transfer_history.empty() &&
           session.transfer_history.front().first < cutoff) {
        session.transfer_history.pop_front();
    }
}

}
