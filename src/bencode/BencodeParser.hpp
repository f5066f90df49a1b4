#pragma once

#include <map>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

// Decodes bencode into a json tree: byte strings become json strings (raw bytes,
// not necessarily UTF-8), integers become int64, lists arrays and dictionaries objects.
class BencodeParser {
public:
    nlohmann::json decode(std::string_view encoded_value);

    // Exact bytes of a value of the root dictionary from the last decode() call.
    // The view points into the buffer passed to decode().
    std::string_view rawValue(const std::string& key) const;
    bool hasRawValue(const std::string& key) const;

private:
    nlohmann::json parse_value();
    nlohmann::json parse_string();
    nlohmann::json parse_integer();
    nlohmann::json parse_list();
    nlohmann::json parse_dictionary();
    std::string parse_byte_string();

    std::string_view input;
    size_t pos = 0;
    int depth = 0;
    std::map<std::string, std::string_view> root_values;
};
