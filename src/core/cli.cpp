#include "chunkpipe/core/cli.hpp"
#include "chunkpipe/core/utils.hpp"
#include <iomanip>
#include <iostream>

namespace chunkpipe::core {

CommandLineParser::CommandLineParser(const std::string& program_name, const std::string& version)
    : program_name_(program_name)
    , version_(version) {
    
    add_flag("h", "help", "Show this help message");
    add_flag("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", OptionKind::VALUE, "~/.chunkpipe.conf");
    add_flag("", "verbose", "Enable debug logging");
}

void CommandLineParser::add_flag(const std::string& short_name, const std::string& long_name,
                                 const std::string& description) {
    add_option(short_name, long_name, description, OptionKind::FLAG);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, OptionKind kind,
                                   const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, kind, default_value});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    bool options_ended = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (options_ended || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        
        if (arg == "--") {
            options_ended = true;
            continue;
        }
        
        bool ok = arg.starts_with("--") ? parse_long(arg, i, argc, argv)
                                        : parse_short_cluster(arg, i, argc, argv);
        if (!ok) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
    
    const Option* option = find_long(name);
    if (!option) {
        error_ = "Unknown option: --" + name;
        return false;
    }
    
    if (option->kind == OptionKind::FLAG) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        return store(*option, "true", "--" + name);
    }
    
    if (eq_pos != std::string::npos) {
        return store(*option, arg.substr(eq_pos + 1), "--" + name);
    }
    if (index + 1 >= argc) {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return store(*option, argv[++index], "--" + name);
}

bool CommandLineParser::parse_short_cluster(const std::string& arg, int& index, int argc, char* argv[]) {
    for (size_t j = 1; j < arg.length(); ++j) {
        std::string short_name(1, arg[j]);
        
        const Option* option = find_short(short_name);
        if (!option) {
            error_ = "Unknown option: -" + short_name;
            return false;
        }
        
        if (option->kind == OptionKind::FLAG) {
            if (!store(*option, "true", "-" + short_name)) {
                return false;
            }
            continue;
        }
        
        // The rest of the cluster, or else the next argument, is the value.
        if (j + 1 < arg.length()) {
            return store(*option, arg.substr(j + 1), "-" + short_name);
        }
        if (index + 1 >= argc) {
            error_ = "Option -" + short_name + " requires a value";
            return false;
        }
        return store(*option, argv[++index], "-" + short_name);
    }
    
    return true;
}

bool CommandLineParser::store(const Option& option, const std::string& value, const std::string& spelled) {
    if (option.kind == OptionKind::UNSIGNED && !utils::StringUtils::parse_uint(value)) {
        error_ = "Option " + spelled + " expects a non-negative integer, got '" + value + "'";
        return false;
    }
    
    auto key = option.long_name.empty() ? option.short_name : option.long_name;
    parsed_options_[key] = value;
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const Option* option = find(name);
    if (!option) {
        return false;
    }
    auto key = option->long_name.empty() ? option->short_name : option->long_name;
    return parsed_options_.count(key) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const Option* option = find(name);
    if (!option) {
        return default_value;
    }
    
    auto key = option->long_name.empty() ? option->short_name : option->long_name;
    auto it = parsed_options_.find(key);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    
    return option->default_value.empty() ? default_value : option->default_value;
}

std::optional<std::uint64_t> CommandLineParser::get_uint_option(const std::string& name) const {
    auto value = get_option(name);
    if (value.empty()) {
        return std::nullopt;
    }
    return utils::StringUtils::parse_uint(value);
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string spelled = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        if (!option.long_name.empty()) {
            spelled += "--" + option.long_name;
        }
        if (option.kind == OptionKind::VALUE) {
            spelled += " <value>";
        } else if (option.kind == OptionKind::UNSIGNED) {
            spelled += " <n>";
        }
        
        std::cout << "  " << std::left << std::setw(28) << spelled << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version " << version_ << "\n";
    std::cout << "Built with C++20\n";
}

const CommandLineParser::Option* CommandLineParser::find_long(const std::string& long_name) const {
    for (const auto& option : options_) {
        if (!option.long_name.empty() && option.long_name == long_name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find_short(const std::string& short_name) const {
    for (const auto& option : options_) {
        if (!option.short_name.empty() && option.short_name == short_name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    auto option = find_long(name);
    return option ? option : find_short(name);
}

}
