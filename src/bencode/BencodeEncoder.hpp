#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Canonical bencode: dictionary keys in byte order, booleans as 0/1 integers.
class BencodeEncoder {
public:
    std::string encode(const nlohmann::json& value);

private:
    void encode_value(const nlohmann::json& value, std::string& out);
    void encode_string(const std::string& str, std::string& out);
    void encode_integer(int64_t value, std::string& out);
};
