#pragma once

#include "../commands/Command.hpp"
#include "../commands/CommandOptions.hpp"
#include <map>
#include <memory>
#include <string>

class CommandManager {
public:
    void registerCommand(const std::string& name, std::unique_ptr<Command> command);
    bool hasCommand(const std::string& name) const;

    // Returns false when the command is unknown or failed
    bool executeCommand(const std::string& name, const CommandOptions& options);

private:
    std::map<std::string, std::unique_ptr<Command>> commands;
};
