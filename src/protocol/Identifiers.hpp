#pragma once
#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

// SHA-1 of the raw bencoded info dictionary. Identifies the swarm.
class InfoHash {
public:
    static constexpr size_t SIZE = 20;

    InfoHash() = default;

    static InfoHash fromInfoBytes(std::string_view info_bytes);
    static InfoHash fromBytes(std::string_view bytes);

    std::string_view view() const {
        return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
    }
    const std::array<uint8_t, SIZE>& bytes() const { return data; }
    std::string toHex() const;

    bool operator==(const InfoHash& other) const = default;

private:
    std::array<uint8_t, SIZE> data{};
};

// Identifies this client for the lifetime of the process.
class PeerId {
public:
    static constexpr size_t SIZE = 20;
    static constexpr std::string_view CLIENT_PREFIX = "-BS0001-";

    PeerId() = default;

    static PeerId generate();
    static PeerId generate(std::mt19937& rng);
    static PeerId fromBytes(std::string_view bytes);

    std::string_view view() const {
        return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
    }
    const std::array<uint8_t, SIZE>& bytes() const { return data; }
    std::string toHex() const;

    bool operator==(const PeerId& other) const = default;

private:
    std::array<uint8_t, SIZE> data{};
};
