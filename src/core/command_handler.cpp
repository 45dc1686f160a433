#include "chunkpipe/core/command_handler.hpp"
#include "chunkpipe/core/logger.hpp"
#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/utils.hpp"
#include "chunkpipe/crypto/digest.hpp"
#include "chunkpipe/network/local_file_transport.hpp"
#include "chunkpipe/transfer/chunk_planner.hpp"
#include "chunkpipe/transfer/file_downloader.hpp"
#include "chunkpipe/transfer/transfer_manager.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <limits>
#include <mutex>

namespace chunkpipe::core {

namespace {

network::LocalTransportOptions transport_options_from_config(const Config& config) {
    network::LocalTransportOptions options;
    
    auto workers = config.get_as<size_t>("transport.worker_threads");
    if (workers && *workers > 0) {
        options.worker_threads = *workers;
    }
    
    auto latency = config.get_as<std::int64_t>("transport.max_latency_us");
    if (latency && *latency > 0) {
        options.max_latency = std::chrono::microseconds(*latency);
    }
    
    return options;
}

std::unique_ptr<network::LocalFileTransport> start_transport(const Config& config) {
    auto root = utils::FileUtils::expand_home(config.get_string("transport.root", "."));
    auto transport = std::make_unique<network::LocalFileTransport>(root, transport_options_from_config(config));
    
    if (!transport->start()) {
        return nullptr;
    }
    return transport;
}

// Transfer errors map to distinct exit codes so scripts can tell them apart.
int exit_code_for(transfer::TransferError error) {
    return static_cast<int>(error) + 1;
}

}

// FetchCommandHandler Implementation
CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const std::string& remote_path = args[1];
    std::filesystem::path destination_folder = utils::FileUtils::expand_home(args[2]);
    std::string expected_digest = args.size() > 3 ? args[3] : "";
    
    auto& config = Config::instance();
    auto transport = start_transport(config);
    if (!transport) {
        return CommandResult::error("Failed to start transport");
    }
    
    auto options = transfer::TransferOptions::from_config(config);
    
    std::atomic<std::uint64_t> received{0};
    std::atomic<std::uint64_t> total{0};
    std::atomic<int> last_decile{-1};
    options.progress_callback = [&](std::uint64_t bytes) {
        auto done = received.fetch_add(bytes) + bytes;
        auto size = total.load();
        if (size == 0) return;
        
        int decile = static_cast<int>(done * 10 / size);
        int previous = last_decile.load();
        if (decile > previous && last_decile.compare_exchange_strong(previous, decile)) {
            std::cout << "  " << decile * 10 << "% ("
                      << utils::StringUtils::format_bytes(done) << " / "
                      << utils::StringUtils::format_bytes(size) << ")\n";
        }
    };
    
    transfer::FileDownloader downloader(*transport, options);
    downloader.set_started_callback([&](std::uint64_t remote_size) {
        total = remote_size;
        std::cout << "Fetching " << remote_path << " ("
                  << utils::StringUtils::format_bytes(remote_size) << ") into "
                  << destination_folder.string() << "\n";
    });
    
    LOG_INFO("Fetching {} into {}", remote_path, destination_folder.string());
    auto started = std::chrono::steady_clock::now();
    auto result = downloader.download_file(remote_path, destination_folder, expected_digest);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    
    transport->stop();
    
    if (!result.success()) {
        return CommandResult::error(std::string("Fetch failed (") + transfer::to_string(result.error) + "): " + result.message,
                                    exit_code_for(result.error));
    }
    
    std::uint64_t rate = elapsed.count() > 0 ? result.bytes_written * 1000 / elapsed.count() : 0;
    std::cout << "Fetched " << utils::StringUtils::format_bytes(result.bytes_written)
              << " in " << utils::StringUtils::format_duration(elapsed)
              << " (" << utils::StringUtils::format_bytes(rate) << "/s)\n";
    std::cout << "Saved to: "
              << transfer::FileDownloader::destination_path(remote_path, destination_folder).string() << "\n";
    
    return CommandResult::ok("Fetch completed");
}

// MirrorCommandHandler Implementation
CommandResult MirrorCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path destination_folder = utils::FileUtils::expand_home(args[1]);
    std::vector<std::string> remote_paths(args.begin() + 2, args.end());
    
    auto& config = Config::instance();
    auto transport = start_transport(config);
    if (!transport) {
        return CommandResult::error("Failed to start transport");
    }
    
    transfer::TransferManager manager(*transport, transfer::TransferOptions::from_config(config));
    manager.set_max_concurrent_transfers(static_cast<std::uint32_t>(remote_paths.size()));
    
    std::vector<std::pair<std::string, std::string>> sessions;
    for (const auto& remote_path : remote_paths) {
        auto session_id = manager.start_download(remote_path, destination_folder);
        if (session_id.empty()) {
            LOG_WARN("Could not start download of {}", remote_path);
            std::cout << "  " << remote_path << ": not started\n";
            continue;
        }
        sessions.emplace_back(remote_path, session_id);
    }
    
    std::cout << "Mirroring " << sessions.size() << " file(s) into " << destination_folder.string() << "\n";
    
    size_t failures = remote_paths.size() - sessions.size();
    for (const auto& [remote_path, session_id] : sessions) {
        auto result = manager.wait_for(session_id);
        if (result && result->success()) {
            std::cout << "  " << remote_path << ": "
                      << utils::StringUtils::format_bytes(result->bytes_written) << "\n";
        } else {
            ++failures;
            std::cout << "  " << remote_path << ": FAILED";
            if (result) {
                std::cout << " (" << transfer::to_string(result->error) << ": " << result->message << ")";
            }
            std::cout << "\n";
        }
    }
    
    std::cout << "Total: " << utils::StringUtils::format_bytes(manager.get_total_bytes_transferred()) << "\n";
    transport->stop();
    
    if (failures > 0) {
        return CommandResult::error(std::to_string(failures) + " of " + std::to_string(remote_paths.size()) +
                                    " download(s) failed");
    }
    return CommandResult::ok("Mirror completed");
}

// DigestCommandHandler Implementation
CommandResult DigestCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    if (!crypto::initialize()) {
        return CommandResult::error("Failed to initialize libsodium");
    }
    
    std::filesystem::path file_path = utils::FileUtils::expand_home(args[1]);
    if (!utils::FileUtils::exists(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    crypto::Blake2bHash hash{};
    auto result = crypto::Blake2bHasher::hash_file(file_path, hash);
    if (!result.success()) {
        return CommandResult::error("Failed to hash " + file_path.string() + ": " + result.message);
    }
    
    std::cout << crypto::hash_utils::hash_to_hex(hash) << "  " << file_path.string() << "\n";
    return CommandResult::ok();
}

// PlanCommandHandler Implementation
CommandResult PlanCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto file_size = utils::StringUtils::parse_uint(args[1]);
    if (!file_size) {
        return CommandResult::error("Invalid file size: " + args[1]);
    }
    
    auto chunk_length = Config::instance().get_as<std::uint32_t>("transfer.chunk_size")
                            .value_or(transfer::DEFAULT_CHUNK_LENGTH);
    if (args.size() > 2) {
        auto parsed = utils::StringUtils::parse_uint(args[2]);
        if (!parsed || *parsed == 0 || *parsed > std::numeric_limits<std::uint32_t>::max()) {
            return CommandResult::error("Invalid chunk size: " + args[2]);
        }
        chunk_length = static_cast<std::uint32_t>(*parsed);
    }
    if (chunk_length == 0) {
        return CommandResult::error("Chunk size must be positive");
    }
    
    transfer::ChunkPlanner planner(*file_size, chunk_length);
    auto count = planner.chunk_count();
    
    std::cout << "File size:  " << *file_size << " bytes (" << utils::StringUtils::format_bytes(*file_size) << ")\n";
    std::cout << "Chunk size: " << chunk_length << " bytes\n";
    std::cout << "Requests:   " << count << "\n";
    
    if (count == 0) {
        return CommandResult::ok();
    }
    
    // Long plans show the head and the tail only.
    constexpr std::uint64_t SHOWN = 4;
    std::uint64_t index = 0;
    while (auto chunk = planner.next()) {
        if (index < SHOWN || index + SHOWN >= count) {
            std::cout << "  #" << index << "  offset " << chunk->offset << "  length " << chunk->length << "\n";
        } else if (index == SHOWN) {
            std::cout << "  ...\n";
        }
        ++index;
    }
    
    return CommandResult::ok();
}

}
