#include "PeerConnection.hpp"
#include "TaskGroup.hpp"
#include "../protocol/Handshake.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Log.hpp"
#include <algorithm>
#include <array>

namespace {
constexpr std::chrono::milliseconds RECEIVE_WAIT{1000};
}

const char* PeerConnection::toString(State state) {
    switch (state) {
        case State::Connecting: return "connecting";
        case State::Handshaking: return "handshaking";
        case State::Idle: return "idle";
        case State::Requesting: return "requesting";
        case State::Transferring: return "transferring";
        case State::Closed: return "closed";
    }
    return "unknown";
}

PeerConnection::PeerConnection(Peer peer, const InfoHash& info_hash, const PeerId& peer_id,
                               PieceManager& pieces, const ClientConfig& config, const StopSignal& stop)
    : peer(std::move(peer)), info_hash(info_hash), peer_id(peer_id), pieces(pieces), config(config),
      stop(stop) {
    peer_address = this->peer.address();
}

PeerConnection::~PeerConnection() {
    close();
}

void PeerConnection::start() {
    try {
        connect();
        handshake();
        run();
    } catch (const std::exception&) {
        close();
        throw;
    }
    close();
}

void PeerConnection::connect() {
    state = State::Connecting;
    int sock = PeerUtils::connectTo(peer.ip, peer.port, config.connect_timeout, &stop);
    wire = std::make_unique<PeerUtils>(sock, &stop);
    Log::debug("Connected to ", peer_address);
}

void PeerConnection::handshake() {
    if (!wire) {
        throw PeerError(PeerError::SocketUnavailable, "Not connected to " + peer_address);
    }
    state = State::Handshaking;

    Handshake ours;
    ours.info_hash = info_hash;
    ours.peer_id = peer_id;
    wire->sendAll(ours.serialize());

    std::array<uint8_t, Handshake::LENGTH> response;
    wire->recvExact(response.data(), response.size(), config.handshake_timeout);
    Handshake theirs = Handshake::parse(response);
    if (theirs.info_hash != info_hash) {
        throw PeerError(PeerError::ProtocolViolation, peer_address + " answered for another torrent");
    }
    remote_id = theirs.peer_id;

    // Fresh session: both sides choked and not interested
    am_choking = true;
    am_interested = false;
    peer_choking = true;
    peer_interested = false;
    state = State::Idle;
    Log::debug("Handshake with ", peer_address, " done, remote peer id ", remote_id->toHex());
}

void PeerConnection::run() {
    if (!wire) {
        throw PeerError(PeerError::SocketUnavailable, "Not connected to " + peer_address);
    }
    pieces.addPeer(peer_address);

    auto now = std::chrono::steady_clock::now();
    last_send = now;
    last_receive = now;

    announced = pieces.completedPieces();
    if (std::find(announced.begin(), announced.end(), true) != announced.end()) {
        send(PeerMessage::bitfield(announced));
    }

    while (!pieces.finished()) {
        stop.throwIfStopped();

        announceNewPieces();
        updateInterest();
        fillPipeline();

        if (auto message = wire->receiveMessage(RECEIVE_WAIT, config.peer_idle_timeout)) {
            last_receive = std::chrono::steady_clock::now();
            handleMessage(*message);
        }

        now = std::chrono::steady_clock::now();
        if (now - last_receive >= config.peer_idle_timeout) {
            throw PeerError(PeerError::SocketUnavailable, peer_address + " idle for too long");
        }
        if (!outstanding.empty() && now - last_block >= config.request_timeout) {
            throw PeerError(PeerError::SocketUnavailable, peer_address + " left " +
                            std::to_string(outstanding.size()) + " requests unanswered");
        }
        if (now - last_send >= config.keepalive_interval) {
            send(PeerMessage::keepAlive());
        }
    }
    Log::debug("Download finished, leaving ", peer_address);
}

void PeerConnection::close() {
    if (state == State::Closed) {
        return;
    }
    if (state != State::Connecting && state != State::Handshaking) {
        pieces.removePeer(peer_address);
    }
    outstanding.clear();
    wire.reset();
    state = State::Closed;
}

void PeerConnection::handleMessage(const PeerMessage& message) {
    if (!message.isKnownType()) {
        Log::debug(peer_address, " sent unknown message id ", static_cast<int>(message.getId()), ", ignoring");
        return;
    }

    switch (message.getType()) {
        case PeerMessageType::KEEP_ALIVE:
        case PeerMessageType::UNKNOWN:
            break;
        case PeerMessageType::CHOKE:
            peer_choking = true;
            pieces.releaseRequests(peer_address);
            outstanding.clear();
            state = State::Idle;
            break;
        case PeerMessageType::UNCHOKE:
            peer_choking = false;
            break;
        case PeerMessageType::INTERESTED:
            peer_interested = true;
            break;
        case PeerMessageType::NOT_INTERESTED:
            peer_interested = false;
            break;
        case PeerMessageType::HAVE: {
            uint32_t index = message.asHave();
            if (index >= pieces.pieceCount()) {
                throw PeerError(PeerError::ProtocolViolation,
                                peer_address + " announced piece " + std::to_string(index) + " out of range");
            }
            pieces.peerHave(peer_address, index);
            break;
        }
        case PeerMessageType::BITFIELD:
            pieces.peerBitfield(peer_address, message.asBitfield(pieces.pieceCount()));
            break;
        case PeerMessageType::REQUEST:
        case PeerMessageType::CANCEL: {
            // Every remote peer stays choked, so requests are never served
            BlockRequest request = message.asRequest();
            Log::debug(peer_address, " sent ", ::toString(message.getType()), " for piece ", request.index, ", ignoring");
            break;
        }
        case PeerMessageType::PIECE:
            handlePiece(message.asPiece());
            break;
    }
}

void PeerConnection::handlePiece(const BlockData& block) {
    auto it = std::find_if(outstanding.begin(), outstanding.end(), [&block](const BlockRequest& request) {
        return request.index == block.index && request.begin == block.begin;
    });
    bool requested = it != outstanding.end();
    if (requested) {
        outstanding.erase(it);
        last_block = std::chrono::steady_clock::now();
    }

    state = State::Transferring;
    switch (pieces.receiveBlock(peer_address, block)) {
        case BlockResult::PieceComplete:
            Log::info("Downloaded piece ", block.index, " from ", peer_address);
            break;
        case BlockResult::HashMismatch:
            Log::warn("Piece ", block.index, " from ", peer_address, " failed verification");
            break;
        case BlockResult::Unexpected:
            if (requested) {
                throw PeerError(PeerError::ProtocolViolation, peer_address + " answered request " +
                                std::to_string(block.index) + "/" + std::to_string(block.begin) +
                                " with " + std::to_string(block.data.size()) + " bytes");
            }
            Log::debug(peer_address, " sent an unrequested block ", block.index, "/", block.begin);
            break;
        case BlockResult::Accepted:
        case BlockResult::WriteFailed:
            break;
    }
    if (outstanding.empty()) {
        state = State::Idle;
    }
}

void PeerConnection::updateInterest() {
    bool interested = pieces.isInteresting(peer_address);
    if (interested != am_interested) {
        am_interested = interested;
        send(PeerMessage::create(interested ? PeerMessageType::INTERESTED : PeerMessageType::NOT_INTERESTED));
    }
}

void PeerConnection::fillPipeline() {
    if (peer_choking || !am_interested) {
        return;
    }
    if (outstanding.empty()) {
        last_block = std::chrono::steady_clock::now();
    }
    while (outstanding.size() < static_cast<size_t>(config.pipeline_depth)) {
        auto request = pieces.nextRequest(peer_address);
        if (!request) {
            break;
        }
        send(PeerMessage::request(*request));
        outstanding.push_back(*request);
    }
    if (!outstanding.empty()) {
        state = State::Requesting;
    }
}

// Tells the peer about pieces other connections completed since the last check
void PeerConnection::announceNewPieces() {
    auto completed = pieces.completedPieces();
    for (size_t i = 0; i < completed.size(); i++) {
        if (completed[i] && !announced[i]) {
            send(PeerMessage::have(static_cast<uint32_t>(i)));
        }
    }
    announced = std::move(completed);
}

void PeerConnection::send(const PeerMessage& message) {
    wire->sendMessage(message);
    last_send = std::chrono::steady_clock::now();
}
