#pragma once

#include "Command.hpp"

// Prints the torrent's metadata; -v adds the info dictionary contents.
class InfoCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
};
