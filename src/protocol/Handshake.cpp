#include "Handshake.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>

std::vector<uint8_t> Handshake::serialize() const {
    std::vector<uint8_t> handshake;
    handshake.reserve(LENGTH);

    // Protocol length and protocol string
    handshake.push_back(static_cast<uint8_t>(PROTOCOL.size()));
    handshake.insert(handshake.end(), PROTOCOL.begin(), PROTOCOL.end());

    handshake.insert(handshake.end(), reserved.begin(), reserved.end());
    handshake.insert(handshake.end(), info_hash.bytes().begin(), info_hash.bytes().end());
    handshake.insert(handshake.end(), peer_id.bytes().begin(), peer_id.bytes().end());
    return handshake;
}

Handshake Handshake::parse(const std::array<uint8_t, LENGTH>& data) {
    if (data[0] != PROTOCOL.size() ||
        !std::equal(PROTOCOL.begin(), PROTOCOL.end(), data.begin() + 1)) {
        throw PeerError(PeerError::ProtocolViolation, "Peer does not speak the BitTorrent protocol");
    }

    const char* bytes = reinterpret_cast<const char*>(data.data());
    Handshake handshake;
    std::copy(data.begin() + 20, data.begin() + 28, handshake.reserved.begin());
    handshake.info_hash = InfoHash::fromBytes(std::string_view(bytes + 28, InfoHash::SIZE));
    handshake.peer_id = PeerId::fromBytes(std::string_view(bytes + 48, PeerId::SIZE));
    return handshake;
}
