#pragma once
#include <cstdint>

enum class PeerMessageType : uint8_t {
    CHOKE = 0,
    UNCHOKE = 1,
    INTERESTED = 2,
    NOT_INTERESTED = 3,
    HAVE = 4,
    BITFIELD = 5,
    REQUEST = 6,
    PIECE = 7,
    CANCEL = 8,
    // Any id past CANCEL; the raw byte is kept in PeerMessage::getId()
    UNKNOWN = 0xFE,
    // Zero-length frame; never appears on the wire as an id
    KEEP_ALIVE = 0xFF,
};

const char* toString(PeerMessageType type);
