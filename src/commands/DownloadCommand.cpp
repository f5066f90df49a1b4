#include "DownloadCommand.hpp"
#include "../manager/DownloadManager.hpp"
#include "../metainfo/MetaInfo.hpp"
#include "../protocol/Identifiers.hpp"
#include "../storage/FileStorage.hpp"
#include "../utils/Log.hpp"
#include <stdexcept>

ClientConfig DownloadCommand::configFromOptions(const CommandOptions& options) {
    ClientConfig config;
    config.verbose = options.hasFlag("-v", "--verbose");
    if (auto dir = options.option("-d", "--download-dir")) {
        config.download_dir = *dir;
    }
    if (auto port = options.option("-p", "--port")) {
        int value = 0;
        try {
            size_t used = 0;
            value = std::stoi(*port, &used);
            if (used != port->size()) {
                value = 0;
            }
        } catch (const std::logic_error&) {
            value = 0;
        }
        if (value <= 0 || value > 65535) {
            throw std::runtime_error("Invalid port: " + *port);
        }
        config.listen_port = static_cast<uint16_t>(value);
    }
    return config;
}

void DownloadCommand::execute(const CommandOptions& options) {
    if (options.args.size() != 1) {
        throw std::runtime_error("Expected: download [-d <dir>] [-p <port>] <torrent_file>");
    }

    ClientConfig config = configFromOptions(options);
    Log::setVerbose(config.verbose);

    MetaInfo meta = MetaInfo::fromFile(options.args[0]);
    FileStorage storage(meta, config.download_dir);
    PeerId peer_id = PeerId::generate();
    Log::debug("Peer id ", peer_id.toHex(), ", info hash ", meta.info_hash.toHex());

    DownloadManager download(meta, config, peer_id, storage);
    if (!download.run()) {
        throw std::runtime_error("Download of " + meta.name() + " did not finish");
    }
    Log::info("Saved to ", storage.rootPath().string());
}
