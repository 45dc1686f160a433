#pragma once

#include <string>
#include <vector>

namespace chunkpipe::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") { return {true, msg, 0}; }
    static CommandResult error(const std::string& msg, int code = 1) { return {false, msg, code}; }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class FetchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download a remote file with pipelined reads"; }
    std::string get_usage() const override { return "chunkpipe fetch <remote-path> <destination-folder> [expected-digest]"; }
};

class MirrorCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download several remote files concurrently over one connection"; }
    std::string get_usage() const override { return "chunkpipe mirror <destination-folder> <remote-path>..."; }
};

class DigestCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the BLAKE2b-256 digest of a local file"; }
    std::string get_usage() const override { return "chunkpipe digest <file>"; }
};

class PlanCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show how a file of the given size is split into read requests"; }
    std::string get_usage() const override { return "chunkpipe plan <file-size> [chunk-size]"; }
};

}
