#pragma once

#include "Command.hpp"
#include "../utils/ClientConfig.hpp"

class DownloadCommand : public Command {
public:
    void execute(const CommandOptions& options) override;

    static ClientConfig configFromOptions(const CommandOptions& options);
};
