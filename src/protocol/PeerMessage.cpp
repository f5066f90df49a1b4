#include "PeerMessage.hpp"
#include "../utils/Errors.hpp"
#include "../utils/PeerUtils.hpp"
#include <string>

const char* toString(PeerMessageType type) {
    switch (type) {
        case PeerMessageType::CHOKE: return "choke";
        case PeerMessageType::UNCHOKE: return "unchoke";
        case PeerMessageType::INTERESTED: return "interested";
        case PeerMessageType::NOT_INTERESTED: return "not-interested";
        case PeerMessageType::HAVE: return "have";
        case PeerMessageType::BITFIELD: return "bitfield";
        case PeerMessageType::REQUEST: return "request";
        case PeerMessageType::PIECE: return "piece";
        case PeerMessageType::CANCEL: return "cancel";
        case PeerMessageType::KEEP_ALIVE: return "keep-alive";
        case PeerMessageType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

namespace {
PeerError malformed(const std::string& what) {
    return PeerError(PeerError::ProtocolViolation, "Malformed " + what + " message");
}

std::vector<uint8_t> blockPayload(const BlockRequest& block) {
    std::vector<uint8_t> payload(12);
    PeerUtils::addIntToPayload(payload, block.index, 0);
    PeerUtils::addIntToPayload(payload, block.begin, 4);
    PeerUtils::addIntToPayload(payload, block.length, 8);
    return payload;
}
}

PeerMessage PeerMessage::create(PeerMessageType type, const std::vector<uint8_t>& payload) {
    PeerMessage msg;
    msg.type = type;
    msg.id = static_cast<uint8_t>(type);
    msg.payload = payload;
    return msg;
}

PeerMessage PeerMessage::keepAlive() {
    return PeerMessage();
}

PeerMessage PeerMessage::have(uint32_t index) {
    std::vector<uint8_t> payload(4);
    PeerUtils::addIntToPayload(payload, index, 0);
    return create(PeerMessageType::HAVE, payload);
}

PeerMessage PeerMessage::bitfield(const std::vector<bool>& pieces) {
    std::vector<uint8_t> payload((pieces.size() + 7) / 8, 0);
    for (size_t i = 0; i < pieces.size(); i++) {
        if (pieces[i]) {
            payload[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }
    return create(PeerMessageType::BITFIELD, payload);
}

PeerMessage PeerMessage::request(const BlockRequest& block) {
    return create(PeerMessageType::REQUEST, blockPayload(block));
}

PeerMessage PeerMessage::cancel(const BlockRequest& block) {
    return create(PeerMessageType::CANCEL, blockPayload(block));
}

PeerMessage PeerMessage::piece(uint32_t index, uint32_t begin, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> payload(8);
    PeerUtils::addIntToPayload(payload, index, 0);
    PeerUtils::addIntToPayload(payload, begin, 4);
    payload.insert(payload.end(), data.begin(), data.end());
    return create(PeerMessageType::PIECE, payload);
}

PeerMessage PeerMessage::parse(std::vector<uint8_t> body) {
    PeerMessage msg;
    if (body.empty()) {
        return msg;
    }
    msg.id = body[0];
    msg.type = body[0] <= static_cast<uint8_t>(PeerMessageType::CANCEL) ? static_cast<PeerMessageType>(body[0])
                                                                       : PeerMessageType::UNKNOWN;
    msg.payload.assign(body.begin() + 1, body.end());
    return msg;
}

uint32_t PeerMessage::getLength() const {
    if (type == PeerMessageType::KEEP_ALIVE) {
        return 0;
    }
    return static_cast<uint32_t>(1 + payload.size());
}

bool PeerMessage::isKnownType() const {
    return type != PeerMessageType::UNKNOWN;
}

uint32_t PeerMessage::asHave() const {
    if (type != PeerMessageType::HAVE || payload.size() != 4) {
        throw malformed("have");
    }
    return PeerUtils::readIntFromPayload(payload, 0);
}

std::vector<bool> PeerMessage::asBitfield(size_t piece_count) const {
    if (type != PeerMessageType::BITFIELD || payload.size() != (piece_count + 7) / 8) {
        throw malformed("bitfield");
    }

    std::vector<bool> pieces;
    pieces.reserve(payload.size() * 8);
    for (uint8_t byte : payload) {
        for (int i = 7; i >= 0; --i) {
            pieces.push_back((byte >> i) & 1);
        }
    }
    // Spare bits past the last piece must be clear
    for (size_t i = piece_count; i < pieces.size(); i++) {
        if (pieces[i]) {
            throw malformed("bitfield");
        }
    }
    pieces.resize(piece_count);
    return pieces;
}

BlockRequest PeerMessage::asRequest() const {
    if ((type != PeerMessageType::REQUEST && type != PeerMessageType::CANCEL) || payload.size() != 12) {
        throw malformed(toString(type));
    }
    return BlockRequest{
        .index = PeerUtils::readIntFromPayload(payload, 0),
        .begin = PeerUtils::readIntFromPayload(payload, 4),
        .length = PeerUtils::readIntFromPayload(payload, 8)
    };
}

BlockData PeerMessage::asPiece() const {
    if (type != PeerMessageType::PIECE || payload.size() < 8) {
        throw malformed("piece");
    }
    return BlockData{
        .index = PeerUtils::readIntFromPayload(payload, 0),
        .begin = PeerUtils::readIntFromPayload(payload, 4),
        .data = std::vector<uint8_t>(payload.begin() + 8, payload.end())
    };
}

std::vector<uint8_t> PeerMessage::serialize() const {
    uint32_t length = getLength();
    std::vector<uint8_t> result(4);
    PeerUtils::addIntToPayload(result, length, 0);
    if (length > 0) {
        result.push_back(id);
        result.insert(result.end(), payload.begin(), payload.end());
    }
    return result;
}
