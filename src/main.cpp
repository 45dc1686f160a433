#include <iostream>
#include <string>
#include <vector>
#include "chunkpipe/core/logger.hpp"
#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/cli.hpp"
#include "chunkpipe/core/utils.hpp"
#include "chunkpipe/core/command_registry.hpp"

namespace {

void apply_overrides(const chunkpipe::core::CommandLineParser& parser, chunkpipe::core::Config& config) {
    const std::pair<const char*, const char*> overrides[] = {
        {"root", "transport.root"},
        {"chunk-size", "transfer.chunk_size"},
        {"max-in-flight", "transfer.max_in_flight"},
        {"timeout-ms", "transfer.response_timeout_ms"},
        {"workers", "transport.worker_threads"},
        {"latency-us", "transport.max_latency_us"},
        {"log-file", "log.file"},
    };
    
    for (const auto& [option, key] : overrides) {
        if (parser.has_option(option)) {
            config.set(key, parser.get_option(option));
        }
    }
}

}

int main(int argc, char* argv[]) {
    chunkpipe::core::CommandLineParser parser("chunkpipe");
    parser.add_option("r", "root", "Directory served by the local transport");
    parser.add_option("", "chunk-size", "Bytes per read request", chunkpipe::core::OptionKind::UNSIGNED);
    parser.add_option("", "max-in-flight", "Maximum outstanding read requests", chunkpipe::core::OptionKind::UNSIGNED);
    parser.add_option("", "timeout-ms", "Fail if no response arrives within this time (0 waits forever)",
                      chunkpipe::core::OptionKind::UNSIGNED);
    parser.add_option("", "workers", "Transport reader threads", chunkpipe::core::OptionKind::UNSIGNED);
    parser.add_option("", "latency-us", "Random per-read latency bound in microseconds",
                      chunkpipe::core::OptionKind::UNSIGNED);
    parser.add_option("", "digest", "Expected BLAKE2b-256 digest (hex) for fetch");
    parser.add_option("", "log-file", "Log file path");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        chunkpipe::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = chunkpipe::core::Config::instance();
    config.set_defaults();
    
    auto config_file = chunkpipe::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.chunkpipe.conf"));
    if (chunkpipe::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read config file " << config_file.string() << "\n";
        }
    }
    config.apply_environment("CHUNKPIPE_");
    apply_overrides(parser, config);
    
    auto log_level = parser.has_option("verbose") ?
        chunkpipe::core::LogLevel::Debug :
        chunkpipe::core::Logger::parse_level(config.get_string("log.level", "info"));
    chunkpipe::core::Logger::initialize(config.get_string("log.file", "chunkpipe.log"), log_level);
    
    LOG_INFO("chunkpipe starting up");
    
    chunkpipe::core::CommandRegistry command_registry;
    
    auto args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        chunkpipe::core::Logger::shutdown();
        return 0;
    }
    
    std::string command = args[0];
    if (command == "fetch" && parser.has_option("digest") && args.size() == 3) {
        args.push_back(parser.get_option("digest"));
    }
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    chunkpipe::core::Logger::shutdown();
    return result.exit_code;
}
