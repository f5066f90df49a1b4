#include "InfoCommand.hpp"
#include "../metainfo/MetaInfo.hpp"
#include <iostream>
#include <stdexcept>

void InfoCommand::execute(const CommandOptions& options) {
    if (options.args.size() != 1) {
        throw std::runtime_error("Expected: info <torrent_file>");
    }

    MetaInfo meta = MetaInfo::fromFile(options.args[0]);
    std::cout << meta.describe(options.hasFlag("-v", "--verbose"));
}
