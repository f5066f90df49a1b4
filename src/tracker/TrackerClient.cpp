#include "TrackerClient.hpp"
#include "../bencode/BencodeFields.hpp"
#include "../bencode/BencodeParser.hpp"
#include "../manager/TaskGroup.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Log.hpp"
#include "../utils/PeerUtils.hpp"
#include "../utils/TorrentUtils.hpp"
#include <algorithm>
#include <mutex>
#include <sstream>
#include <curl/curl.h>

namespace {

std::once_flag curl_init_flag;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const StopSignal*>(clientp);
    return stop != nullptr && stop->stopRequested() ? 1 : 0;
}

Peer decodePeer(const nlohmann::json& value) {
    const auto& dict = BencodeFields::requireDictionary(value, "peers");
    BencodeFields::expectOnly(dict, {"peer id", "ip", "port"});

    Peer peer;
    if (auto id = BencodeFields::optionalString(dict, "peer id")) {
        peer.peer_id = PeerId::fromBytes(*id);
    }
    peer.ip = BencodeFields::requireString(dict, "ip");
    int64_t port = BencodeFields::requireInteger(dict, "port");
    if (port <= 0 || port > 65535) {
        throw InvalidField("port", "out of range");
    }
    peer.port = static_cast<int>(port);
    return peer;
}

}

TrackerClient::TrackerClient(std::string tracker_url, const InfoHash& info_hash, const PeerId& peer_id,
                             const ClientConfig& config)
    : tracker_url(std::move(tracker_url)), info_hash(info_hash), peer_id(peer_id), config(config) {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string TrackerClient::buildAnnounceUrl(const std::string& tracker_url, const AnnounceRequest& request) {
    const auto& progress = request.progress;

    std::stringstream ss;
    ss << tracker_url
       << (tracker_url.find('?') == std::string::npos ? "?" : "&")
       << "info_hash=" << TorrentUtils::urlEncode(request.info_hash.view())
       << "&peer_id=" << TorrentUtils::urlEncode(request.peer_id.view())
       << "&port=" << request.port
       << "&uploaded=" << progress.bytes_uploaded
       << "&downloaded=" << progress.bytes_downloaded
       << "&left=" << progress.bytesLeft()
       << "&compact=1";
    if (request.tracker_id) {
        ss << "&trackerid=" << TorrentUtils::urlEncode(*request.tracker_id);
    }
    if (progress.bytes_downloaded == 0) {
        ss << "&event=started";
    } else if (progress.finished()) {
        ss << "&event=finished";
    }
    return ss.str();
}

std::vector<Peer> TrackerClient::parseCompactPeers(const std::string& blob) {
    if (blob.size() % 6 != 0) {
        throw TrackerError("compact peer list length " + std::to_string(blob.size()) +
                           " is not a multiple of 6");
    }
    std::vector<Peer> peers;
    for (size_t i = 0; i < blob.size(); i += 6) {
        auto [ip, port] = PeerUtils::parsePeerAddress(blob, i);
        peers.push_back(Peer{std::nullopt, ip, port});
    }
    return peers;
}

std::vector<Peer> TrackerClient::parsePeerList(const nlohmann::json& peers) {
    if (!peers.is_array()) {
        throw InvalidField("peers", "expected a list of peer dictionaries");
    }
    std::vector<Peer> result;
    for (const auto& entry : peers) {
        result.push_back(decodePeer(entry));
    }
    return result;
}

PeerInfoResult TrackerClient::parseAnnounceResponse(std::string_view body) {
    nlohmann::json response;
    try {
        response = BencodeParser().decode(body);
    } catch (const DecodeError& e) {
        throw TrackerError(std::string("undecodable response: ") + e.what());
    }
    if (!response.is_object()) {
        throw TrackerError("response is not a dictionary");
    }

    // A failure reason overrides everything else in the response
    if (response.contains("failure reason")) {
        const auto& reason = response["failure reason"];
        throw TrackerFailure(reason.is_string() ? reason.get<std::string>() : reason.dump());
    }

    try {
        BencodeFields::expectOnly(response, {"warning message", "interval", "min interval", "tracker id",
                                             "complete", "incomplete", "peers", "external ip"});

        PeerInfoResult result;
        result.warning_message = BencodeFields::optionalString(response, "warning message");
        result.interval = BencodeFields::optionalInteger(response, "interval");
        result.min_interval = BencodeFields::optionalInteger(response, "min interval");
        result.tracker_id = BencodeFields::optionalString(response, "tracker id");
        result.complete = BencodeFields::optionalInteger(response, "complete").value_or(0);
        result.incomplete = BencodeFields::optionalInteger(response, "incomplete").value_or(0);

        const auto& peers = BencodeFields::require(response, "peers");
        try {
            result.peers = parsePeerList(peers);
        } catch (const DecodeError&) {
            if (!peers.is_string()) {
                throw;
            }
            result.peers = parseCompactPeers(peers.get<std::string>());
        }
        return result;
    } catch (const DecodeError& e) {
        throw TrackerError(e.what());
    } catch (const PeerError& e) {
        throw TrackerError(e.what());
    }
}

std::string TrackerClient::performRequest(const std::string& url, const StopSignal* stop) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TrackerError("Failed to initialize curl");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.tracker_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config.tracker_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<StopSignal*>(stop));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw Cancelled();
    }
    if (res != CURLE_OK) {
        throw TrackerError("Failed to contact tracker: " + std::string(curl_easy_strerror(res)));
    }
    if (status != 200) {
        throw TrackerError("HTTP status " + std::to_string(status));
    }
    return response;
}

PeerInfoResult TrackerClient::announce(const DownloadProgress& progress, const StopSignal* stop) {
    AnnounceRequest request{info_hash, peer_id, config.listen_port, progress, tracker_id};
    std::string url = buildAnnounceUrl(tracker_url, request);
    Log::debug("Announcing to ", tracker_url);

    PeerInfoResult result = parseAnnounceResponse(performRequest(url, stop));
    if (result.tracker_id) {
        tracker_id = result.tracker_id;
    }
    if (result.warning_message) {
        Log::warn("Tracker ", tracker_url, ": ", *result.warning_message);
    }
    return result;
}

std::chrono::milliseconds TrackerClient::nextInterval(const PeerInfoResult& result) const {
    std::chrono::milliseconds wait = config.announce_interval;
    if (result.interval && *result.interval > 0) {
        wait = std::chrono::seconds(*result.interval);
    }
    if (result.min_interval && *result.min_interval > 0) {
        wait = std::max<std::chrono::milliseconds>(wait, std::chrono::seconds(*result.min_interval));
    }
    return wait;
}

void TrackerClient::run(StopSignal& stop, const ProgressSource& progress, const PeersCallback& on_peers) {
    while (!stop.stopRequested()) {
        std::chrono::milliseconds wait = config.retry_interval;
        try {
            PeerInfoResult result = announce(progress(), &stop);
            Log::debug("Tracker ", tracker_url, " returned ", result.peers.size(), " peers (",
                       result.complete, " seeders, ", result.incomplete, " leechers)");
            on_peers(result.peers);
            wait = nextInterval(result);
        } catch (const TrackerError& e) {
            Log::warn(tracker_url, ": ", e.what());
        }
        if (stop.waitFor(wait)) {
            break;
        }
    }
}
