#include "commands/DownloadCommand.hpp"
#include "commands/InfoCommand.hpp"
#include "manager/CommandManager.hpp"
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

namespace {

const std::set<std::string> FLAGS = {"-v", "--verbose"};

CommandOptions parseCommandOptions(int argc, char* argv[], int first) {
    CommandOptions options;

    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() > 1 && arg[0] == '-') {  // This is an option
            if (FLAGS.count(arg)) {
                options.flags.insert(arg);
            } else if (i + 1 < argc) {  // Make sure we have a value after the option
                options.options[arg] = argv[i + 1];
                i++;  // Skip the next argument since it's the option value
            } else {
                throw std::runtime_error("Missing value for option " + arg);
            }
        } else {
            options.args.push_back(arg);
        }
    }

    return options;
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " [info|download] [-v] [-d <dir>] [-p <port>] <torrent_file>"
                  << std::endl;
        return 1;
    }

    CommandManager manager;
    manager.registerCommand("info", std::make_unique<InfoCommand>());
    manager.registerCommand("download", std::make_unique<DownloadCommand>());

    // download is the default when the first argument isn't a command
    std::string command = argv[1];
    int first = 2;
    if (!manager.hasCommand(command)) {
        command = "download";
        first = 1;
    }

    CommandOptions options;
    try {
        options = parseCommandOptions(argc, argv, first);
    } catch (const std::exception& e) {
        std::cerr << "Error executing command: " << e.what() << std::endl;
        return 1;
    }

    return manager.executeCommand(command, options) ? 0 : 1;
}
