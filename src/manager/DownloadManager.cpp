#include "DownloadManager.hpp"
#include "PeerConnection.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Log.hpp"

DownloadManager::DownloadManager(const MetaInfo& meta, const ClientConfig& config, const PeerId& peer_id,
                                 PieceStorage& storage)
    : meta(meta), config(config), peer_id(peer_id), pieces(meta, storage, config.block_size),
      tasks(stop_signal) {
    for (const auto& url : meta.trackers()) {
        trackers.push_back(std::make_unique<TrackerClient>(url, meta.info_hash, peer_id, config));
    }
}

DownloadManager::~DownloadManager() {
    tasks.stopAndJoin();
}

bool DownloadManager::run() {
    Log::info("Downloading ", meta.name(), ": ", pieces.pieceCount(), " pieces, ",
              meta.totalLength(), " bytes, ", trackers.size(), " trackers");
    startTrackers();

    int64_t reported = -1;
    while (!pieces.finished()) {
        launchPending();
        if (stop_signal.waitFor(POLL_INTERVAL)) {
            break;
        }

        DownloadProgress current = pieces.snapshot();
        if (current.bytes_downloaded != reported) {
            reported = current.bytes_downloaded;
            Log::debug("Progress: ", current.bytes_downloaded, "/", current.bytes_total, " bytes, ",
                       activePeers(), " peers connected");
        }
    }

    bool finished = pieces.finished();
    tasks.stopAndJoin();
    if (finished) {
        finalAnnounce();
        Log::info("Download of ", meta.name(), " complete");
    }
    return finished;
}

void DownloadManager::stop() {
    stop_signal.requestStop();
}

void DownloadManager::startTrackers() {
    for (auto& tracker : trackers) {
        TrackerClient* client = tracker.get();
        tasks.spawn("tracker " + client->url(), [this, client]() {
            client->run(stop_signal, [this]() { return pieces.snapshot(); },
                        [this](const std::vector<Peer>& found) { addPeers(found); });
        });
    }
}

void DownloadManager::addPeers(const std::vector<Peer>& peers) {
    std::lock_guard<std::mutex> lock(peers_mutex);
    for (const auto& peer : peers) {
        if (known_peers.insert(peer.address()).second) {
            backlog.push_back(peer);
        }
    }
}

size_t DownloadManager::activePeers() {
    std::lock_guard<std::mutex> lock(peers_mutex);
    return active_peers;
}

void DownloadManager::launchPending() {
    std::lock_guard<std::mutex> lock(peers_mutex);
    while (!backlog.empty() && active_peers < static_cast<size_t>(config.max_peers)) {
        Peer peer = backlog.front();
        backlog.pop_front();
        if (!tasks.spawn("peer " + peer.address(), [this, peer]() { runPeer(peer); })) {
            return;
        }
        active_peers++;
    }
}

void DownloadManager::runPeer(const Peer& peer) {
    try {
        PeerConnection connection(peer, meta.info_hash, peer_id, pieces, config, stop_signal);
        connection.start();
    } catch (const NetworkError& e) {
        Log::debug("Peer ", peer.address(), " closed: ", e.what());
    } catch (const Cancelled&) {
        Log::debug("Peer ", peer.address(), " stopped");
    } catch (const std::exception& e) {
        Log::error("Peer ", peer.address(), " failed: ", e.what());
    }

    // The address may come back in a later announce
    std::lock_guard<std::mutex> lock(peers_mutex);
    active_peers--;
    known_peers.erase(peer.address());
}

void DownloadManager::finalAnnounce() {
    DownloadProgress current = pieces.snapshot();
    if (current.bytes_downloaded == 0) {
        return;
    }
    for (auto& tracker : trackers) {
        try {
            tracker->announce(current);
        } catch (const TrackerError& e) {
            Log::warn(tracker->url(), ": ", e.what());
        }
    }
}
