#pragma once
#include "PieceManager.hpp"
#include "TaskGroup.hpp"
#include "../metainfo/MetaInfo.hpp"
#include "../storage/PieceStorage.hpp"
#include "../tracker/TrackerClient.hpp"
#include "../utils/ClientConfig.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Runs one swarm download: an announce task per tracker, a connection task per
// peer (at most max_peers at a time, the rest wait in a backlog).
class DownloadManager {
public:
    DownloadManager(const MetaInfo& meta, const ClientConfig& config, const PeerId& peer_id,
                    PieceStorage& storage);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Blocks until every piece is verified or stop() is called. All tasks are
    // joined before it returns. Returns true when the download finished.
    bool run();
    void stop();

    // Queues peers not seen before; safe to call from any thread
    void addPeers(const std::vector<Peer>& peers);

    DownloadProgress progress() const { return pieces.snapshot(); }
    PieceManager& pieceManager() { return pieces; }
    size_t activePeers();

private:
    void startTrackers();
    void launchPending();
    void runPeer(const Peer& peer);
    void finalAnnounce();

    static constexpr std::chrono::milliseconds POLL_INTERVAL{200};

    const MetaInfo& meta;
    ClientConfig config;
    PeerId peer_id;
    StopSignal stop_signal;
    PieceManager pieces;
    std::vector<std::unique_ptr<TrackerClient>> trackers;

    std::mutex peers_mutex;
    std::set<std::string> known_peers;
    std::deque<Peer> backlog;
    size_t active_peers = 0;

    // Declared last: joined before anything the tasks reference goes away
    TaskGroup tasks;
};
