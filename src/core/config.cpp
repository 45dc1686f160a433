#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/logger.hpp"
#include "chunkpipe/core/utils.hpp"
#include <cctype>
#include <cstdlib>

namespace chunkpipe::core {

using utils::StringUtils;

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring malformed line '{}'", filename, line_number, line);
            continue;
        }
        
        values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# chunkpipe configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto lower = StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["transfer.chunk_size"] = "32768";
    values_["transfer.max_in_flight"] = "48";
    values_["transfer.response_timeout_ms"] = "0";
    values_["transfer.queue_capacity"] = "0";
    values_["transport.root"] = ".";
    values_["transport.worker_threads"] = "4";
    values_["transport.max_latency_us"] = "0";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkpipe.log";
}

size_t Config::apply_environment(const std::string& prefix) {
    size_t applied = 0;
    
    for (auto& [key, value] : values_) {
        auto name = environment_name(prefix, key);
        const char* override_value = std::getenv(name.c_str());
        if (override_value) {
            LOG_DEBUG("Config {} overridden by {}", key, name);
            value = override_value;
            ++applied;
        }
    }
    
    return applied;
}

std::string Config::environment_name(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    for (unsigned char c : key) {
        name += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    }
    return name;
}

}
