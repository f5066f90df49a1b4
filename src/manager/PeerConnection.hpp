#pragma once
#include "PieceManager.hpp"
#include "../protocol/Identifiers.hpp"
#include "../protocol/PeerMessage.hpp"
#include "../tracker/TrackerClient.hpp"
#include "../utils/ClientConfig.hpp"
#include "../utils/PeerUtils.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class StopSignal;

// One TCP session with a remote peer, driven by its own task.
// Closed is terminal: a failed connection is never retried by this object.
class PeerConnection {
public:
    enum class State { Connecting, Handshaking, Idle, Requesting, Transferring, Closed };

    PeerConnection(Peer peer, const InfoHash& info_hash, const PeerId& peer_id, PieceManager& pieces,
                   const ClientConfig& config, const StopSignal& stop);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    // connect, handshake, then run until the download is finished or stop fires.
    // Whatever happens, the peer's outstanding blocks go back to the piece manager.
    void start();

    void connect();
    void handshake();
    void run();
    void close();

    State getState() const { return state; }
    const std::string& address() const { return peer_address; }
    const std::optional<PeerId>& remotePeerId() const { return remote_id; }

    bool amChoking() const { return am_choking; }
    bool amInterested() const { return am_interested; }
    bool peerChoking() const { return peer_choking; }
    bool peerInterested() const { return peer_interested; }

    static const char* toString(State state);

private:
    void handleMessage(const PeerMessage& message);
    void handlePiece(const BlockData& block);
    void updateInterest();
    void fillPipeline();
    void announceNewPieces();
    void send(const PeerMessage& message);

    Peer peer;
    std::string peer_address;
    InfoHash info_hash;
    PeerId peer_id;
    PieceManager& pieces;
    const ClientConfig& config;
    const StopSignal& stop;

    std::unique_ptr<PeerUtils> wire;
    State state = State::Connecting;
    std::optional<PeerId> remote_id;

    bool am_choking = true;
    bool am_interested = false;
    bool peer_choking = true;
    bool peer_interested = false;

    std::vector<BlockRequest> outstanding;
    std::vector<bool> announced;
    std::chrono::steady_clock::time_point last_send;
    std::chrono::steady_clock::time_point last_receive;
    std::chrono::steady_clock::time_point last_block;
};
