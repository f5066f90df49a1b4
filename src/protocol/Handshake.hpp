#pragma once
#include "Identifiers.hpp"
#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

// 68-byte preamble: pstrlen (19), "BitTorrent protocol", 8 reserved bytes,
// info hash, peer id.
struct Handshake {
    static constexpr size_t LENGTH = 68;
    static constexpr std::string_view PROTOCOL = "BitTorrent protocol";

    std::array<uint8_t, 8> reserved{};
    InfoHash info_hash;
    PeerId peer_id;

    std::vector<uint8_t> serialize() const;

    // Throws PeerError(ProtocolViolation) when the protocol name differs
    static Handshake parse(const std::array<uint8_t, LENGTH>& data);
};
