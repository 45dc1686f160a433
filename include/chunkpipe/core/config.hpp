#pragma once

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace chunkpipe::core {

class Config {
public:
    Config() = default;
    
    static Config& instance();
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    void set_defaults();
    void clear() { values_.clear(); }
    
    // Overrides known keys from the environment: with prefix "CHUNKPIPE_",
    // transfer.chunk_size is read from CHUNKPIPE_TRANSFER_CHUNK_SIZE.
    // Returns the number of keys overridden.
    size_t apply_environment(const std::string& prefix);
    static std::string environment_name(const std::string& prefix, const std::string& key);
    
private:
    std::map<std::string, std::string> values_;
};

}
