#pragma once
#include "PeerMessageType.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

struct BlockRequest {
    uint32_t index = 0;
    uint32_t begin = 0;
    uint32_t length = 0;

    bool operator==(const BlockRequest& other) const = default;
};

struct BlockData {
    uint32_t index = 0;
    uint32_t begin = 0;
    std::vector<uint8_t> data;
};

// One peer wire message. serialize() yields the full frame: 4-byte big-endian
// length, then the 1-byte id and payload (nothing for keep-alive).
class PeerMessage {
public:
    // Constructors
    static PeerMessage create(PeerMessageType type, const std::vector<uint8_t>& payload = {});
    static PeerMessage keepAlive();
    static PeerMessage have(uint32_t index);
    static PeerMessage bitfield(const std::vector<bool>& pieces);
    static PeerMessage request(const BlockRequest& block);
    static PeerMessage cancel(const BlockRequest& block);
    static PeerMessage piece(uint32_t index, uint32_t begin, const std::vector<uint8_t>& data);

    // Parses a frame body (id + payload); an empty body is a keep-alive.
    // Ids outside the standard set are kept with their raw value.
    static PeerMessage parse(std::vector<uint8_t> body);

    // Getters
    PeerMessageType getType() const { return type; }
    uint8_t getId() const { return id; }
    const std::vector<uint8_t>& getPayload() const { return payload; }
    uint32_t getLength() const;  // message_id (1) + payload, 0 for keep-alive
    bool isKnownType() const;

    // Payload decoders; a malformed payload is a protocol violation
    uint32_t asHave() const;
    std::vector<bool> asBitfield(size_t piece_count) const;
    BlockRequest asRequest() const;
    BlockData asPiece() const;

    // Serialization
    std::vector<uint8_t> serialize() const;

private:
    PeerMessageType type = PeerMessageType::KEEP_ALIVE;
    uint8_t id = 0;
    std::vector<uint8_t> payload;
};
