#pragma once
#include "BencodeParser.hpp"
#include "BencodeEncoder.hpp"

class Bencode {
public:
    static nlohmann::json decode(std::string_view encoded_value) {
        return BencodeParser().decode(encoded_value);
    }

    static std::string encode(const nlohmann::json& value) {
        return BencodeEncoder().encode(value);
    }
};
