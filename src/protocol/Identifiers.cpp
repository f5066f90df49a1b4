#include "Identifiers.hpp"
#include "../utils/Errors.hpp"
#include "../utils/SHA1.hpp"
#include <algorithm>

InfoHash InfoHash::fromInfoBytes(std::string_view info_bytes) {
    auto digest = SHA1::calculate(info_bytes);
    InfoHash hash;
    std::copy(digest.begin(), digest.end(), hash.data.begin());
    return hash;
}

InfoHash InfoHash::fromBytes(std::string_view bytes) {
    if (bytes.size() != SIZE) {
        throw InvalidField("info_hash", "expected 20 bytes, got " + std::to_string(bytes.size()));
    }
    InfoHash hash;
    std::copy(bytes.begin(), bytes.end(), hash.data.begin());
    return hash;
}

std::string InfoHash::toHex() const {
    return SHA1::toHex(data.data(), data.size());
}

PeerId PeerId::generate() {
    std::random_device rd;
    std::mt19937 rng(rd());
    return generate(rng);
}

PeerId PeerId::generate(std::mt19937& rng) {
    static constexpr std::string_view alphabet =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);

    PeerId id;
    std::copy(CLIENT_PREFIX.begin(), CLIENT_PREFIX.end(), id.data.begin());
    for (size_t i = CLIENT_PREFIX.size(); i < SIZE; i++) {
        id.data[i] = static_cast<uint8_t>(alphabet[dist(rng)]);
    }
    return id;
}

PeerId PeerId::fromBytes(std::string_view bytes) {
    if (bytes.size() != SIZE) {
        throw InvalidField("peer id", "expected 20 bytes, got " + std::to_string(bytes.size()));
    }
    PeerId id;
    std::copy(bytes.begin(), bytes.end(), id.data.begin());
    return id;
}

std::string PeerId::toHex() const {
    return SHA1::toHex(data.data(), data.size());
}
