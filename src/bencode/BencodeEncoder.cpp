#include "BencodeEncoder.hpp"
#include <stdexcept>

std::string BencodeEncoder::encode(const nlohmann::json& value) {
    std::string out;
    encode_value(value, out);
    return out;
}

void BencodeEncoder::encode_value(const nlohmann::json& value, std::string& out) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            encode_string(value.get_ref<const std::string&>(), out);
            break;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            encode_integer(value.get<int64_t>(), out);
            break;
        case nlohmann::json::value_t::boolean:
            encode_integer(value.get<bool>() ? 1 : 0, out);
            break;
        case nlohmann::json::value_t::array:
            out += 'l';
            for (const auto& item : value) {
                encode_value(item, out);
            }
            out += 'e';
            break;
        case nlohmann::json::value_t::object:
            // json objects iterate in key order, which is the byte order bencode requires
            out += 'd';
            for (auto it = value.begin(); it != value.end(); ++it) {
                encode_string(it.key(), out);
                encode_value(it.value(), out);
            }
            out += 'e';
            break;
        default:
            throw std::runtime_error("Unsupported JSON type for bencode encoding: " + std::string(value.type_name()));
    }
}

void BencodeEncoder::encode_string(const std::string& str, std::string& out) {
    out += std::to_string(str.size());
    out += ':';
    out += str;
}

void BencodeEncoder::encode_integer(int64_t value, std::string& out) {
    out += 'i';
    out += std::to_string(value);
    out += 'e';
}
