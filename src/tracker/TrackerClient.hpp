#pragma once
#include "../manager/PieceManager.hpp"
#include "../protocol/Identifiers.hpp"
#include "../utils/ClientConfig.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

class StopSignal;

struct Peer {
    std::optional<PeerId> peer_id;
    std::string ip;
    int port = 0;

    std::string address() const { return ip + ":" + std::to_string(port); }
};

// Successful announce response
struct PeerInfoResult {
    std::optional<std::string> warning_message;
    std::optional<int64_t> interval;
    std::optional<int64_t> min_interval;
    std::optional<std::string> tracker_id;
    int64_t complete = 0;
    int64_t incomplete = 0;
    std::vector<Peer> peers;
};

struct AnnounceRequest {
    InfoHash info_hash;
    PeerId peer_id;
    uint16_t port = 0;
    DownloadProgress progress;
    std::optional<std::string> tracker_id;
};

// HTTP announce client for one tracker URL.
class TrackerClient {
public:
    using ProgressSource = std::function<DownloadProgress()>;
    using PeersCallback = std::function<void(const std::vector<Peer>&)>;

    TrackerClient(std::string tracker_url, const InfoHash& info_hash, const PeerId& peer_id,
                  const ClientConfig& config);

    // Throws TrackerError (TrackerFailure when the tracker refused the announce),
    // Cancelled when stop fires during the transfer.
    PeerInfoResult announce(const DownloadProgress& progress, const StopSignal* stop = nullptr);

    // Announces until stop fires, reporting every peer list to on_peers.
    // Failures are logged and retried; they never end the loop.
    void run(StopSignal& stop, const ProgressSource& progress, const PeersCallback& on_peers);

    // Wait before the next announce after a successful one
    std::chrono::milliseconds nextInterval(const PeerInfoResult& result) const;

    static std::string buildAnnounceUrl(const std::string& tracker_url, const AnnounceRequest& request);
    static PeerInfoResult parseAnnounceResponse(std::string_view body);
    static std::vector<Peer> parseCompactPeers(const std::string& blob);
    static std::vector<Peer> parsePeerList(const nlohmann::json& peers);

    const std::string& url() const { return tracker_url; }
    const std::optional<std::string>& trackerId() const { return tracker_id; }

private:
    std::string performRequest(const std::string& url, const StopSignal* stop);

    std::string tracker_url;
    InfoHash info_hash;
    PeerId peer_id;
    ClientConfig config;
    std::optional<std::string> tracker_id;
};
