#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class SHA1 {
public:
    using Digest = std::array<unsigned char, 20>;

    // Returns SHA1 hash as a 20-byte array
    static Digest calculate(std::string_view input);
    static Digest calculate(const std::vector<uint8_t>& input);

    // Converts binary hash to hex string
    static std::string toHex(const unsigned char* data, size_t len);
    static std::string toHex(const Digest& hash) { return toHex(hash.data(), hash.size()); }
};
