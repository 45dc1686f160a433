#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkpipe::core {

enum class OptionKind {
    FLAG,
    VALUE,
    // A value that must parse as a non-negative integer; checked by parse().
    UNSIGNED
};

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name, const std::string& version = "1.0.0");
    
    void add_flag(const std::string& short_name, const std::string& long_name, const std::string& description);
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, OptionKind kind = OptionKind::VALUE,
                    const std::string& default_value = "");
    
    // Everything after a bare "--" is positional.
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::optional<std::uint64_t> get_uint_option(const std::string& name) const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;
    
private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        OptionKind kind;
        std::string default_value;
    };
    
    const Option* find_long(const std::string& long_name) const;
    const Option* find_short(const std::string& short_name) const;
    const Option* find(const std::string& name) const;
    
    bool parse_long(const std::string& arg, int& index, int argc, char* argv[]);
    bool parse_short_cluster(const std::string& arg, int& index, int argc, char* argv[]);
    bool store(const Option& option, const std::string& value, const std::string& spelled);
    
    std::string program_name_;
    std::string version_;
    std::vector<Option> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
