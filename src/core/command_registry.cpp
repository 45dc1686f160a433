#include "chunkpipe/core/command_registry.hpp"
#include "chunkpipe/core/logger.hpp"
#include <exception>
#include <iomanip>
#include <iostream>

namespace chunkpipe::core {

CommandRegistry::CommandRegistry() {
    register_command("fetch", std::make_unique<FetchCommandHandler>());
    register_command("mirror", std::make_unique<MirrorCommandHandler>());
    register_command("digest", std::make_unique<DigestCommandHandler>());
    register_command("plan", std::make_unique<PlanCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    LOG_DEBUG("Running command '{}' with {} arguments", command, args.size() > 0 ? args.size() - 1 : 0);
    
    // Filesystem and argument errors surface as a failed command, not a crash.
    try {
        return it->second->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' failed: {}", command, e.what());
        return CommandResult::error(command + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

std::vector<std::string> CommandRegistry::get_command_names() const {
    std::vector<std::string> names;
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
