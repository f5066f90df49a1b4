#pragma once

#include "CommandOptions.hpp"

class Command {
public:
    virtual ~Command() = default;
    // Throws on failure; the CommandManager reports it
    virtual void execute(const CommandOptions& options) = 0;
};
