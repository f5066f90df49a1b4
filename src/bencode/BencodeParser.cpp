#include "BencodeParser.hpp"
#include "../utils/Errors.hpp"
#include <cctype>
#include <charconv>
#include <limits>

namespace {
constexpr int MAX_DEPTH = 256;

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
}

nlohmann::json BencodeParser::decode(std::string_view encoded_value) {
    input = encoded_value;
    pos = 0;
    depth = 0;
    root_values.clear();

    if (input.empty()) {
        throw MalformedEncoding(0, "empty input");
    }

    nlohmann::json value = parse_value();
    if (pos != input.size()) {
        throw MalformedEncoding(pos, "trailing data after root value");
    }
    return value;
}

std::string_view BencodeParser::rawValue(const std::string& key) const {
    auto it = root_values.find(key);
    if (it == root_values.end()) {
        throw MissingField(key);
    }
    return it->second;
}

bool BencodeParser::hasRawValue(const std::string& key) const {
    return root_values.count(key) != 0;
}

nlohmann::json BencodeParser::parse_value() {
    if (pos >= input.size()) {
        throw MalformedEncoding(pos, "unexpected end of input");
    }

    char c = input[pos];
    if (isDigit(c)) {
        return parse_string();
    } else if (c == 'i') {
        return parse_integer();
    } else if (c == 'l') {
        return parse_list();
    } else if (c == 'd') {
        return parse_dictionary();
    }
    throw MalformedEncoding(pos, std::string("unexpected character '") + c + "'");
}

std::string BencodeParser::parse_byte_string() {
    size_t start = pos;
    size_t colon_index = input.find(':', pos);
    if (colon_index == std::string_view::npos) {
        throw MalformedEncoding(start, "string length without colon");
    }

    std::string_view digits = input.substr(pos, colon_index - pos);
    if (digits.empty()) {
        throw MalformedEncoding(start, "empty string length");
    }
    for (char c : digits) {
        if (!isDigit(c)) {
            throw MalformedEncoding(start, "non-numeric string length");
        }
    }
    if (digits.size() > 1 && digits[0] == '0') {
        throw MalformedEncoding(start, "string length with leading zero");
    }

    size_t length = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), length);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        throw MalformedEncoding(start, "string length out of range");
    }

    size_t content_start = colon_index + 1;
    if (length > input.size() - content_start) {
        throw MalformedEncoding(start, "string runs past end of input");
    }

    pos = content_start + length;
    return std::string(input.substr(content_start, length));
}

nlohmann::json BencodeParser::parse_string() {
    return nlohmann::json(parse_byte_string());
}

nlohmann::json BencodeParser::parse_integer() {
    size_t start = pos;
    size_t e_index = input.find('e', pos);
    if (e_index == std::string_view::npos) {
        throw MalformedEncoding(start, "integer missing terminator");
    }

    std::string_view integer_str = input.substr(pos + 1, e_index - pos - 1);
    std::string_view digits = integer_str;
    bool negative = !digits.empty() && digits[0] == '-';
    if (negative) {
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        throw MalformedEncoding(start, "integer without digits");
    }
    for (char c : digits) {
        if (!isDigit(c)) {
            throw MalformedEncoding(start, "non-numeric integer");
        }
    }
    if (digits.size() > 1 && digits[0] == '0') {
        throw MalformedEncoding(start, "integer with leading zero");
    }
    if (negative && digits == "0") {
        throw MalformedEncoding(start, "negative zero");
    }

    int64_t value = 0;
    auto [end, ec] = std::from_chars(integer_str.data(), integer_str.data() + integer_str.size(), value);
    if (ec != std::errc() || end != integer_str.data() + integer_str.size()) {
        throw MalformedEncoding(start, "integer out of range");
    }

    pos = e_index + 1;
    return nlohmann::json(value);
}

nlohmann::json BencodeParser::parse_list() {
    size_t start = pos;
    if (++depth > MAX_DEPTH) {
        throw MalformedEncoding(start, "nesting too deep");
    }

    nlohmann::json list = nlohmann::json::array();
    pos++;
    while (pos < input.size() && input[pos] != 'e') {
        list.push_back(parse_value());
    }

    if (pos >= input.size()) {
        throw MalformedEncoding(start, "list missing terminator");
    }

    pos++;
    depth--;
    return list;
}

nlohmann::json BencodeParser::parse_dictionary() {
    size_t start = pos;
    if (++depth > MAX_DEPTH) {
        throw MalformedEncoding(start, "nesting too deep");
    }
    bool is_root = depth == 1;

    nlohmann::json dict = nlohmann::json::object();
    pos++;
    while (pos < input.size() && input[pos] != 'e') {
        if (!isDigit(input[pos])) {
            throw MalformedEncoding(pos, "dictionary key is not a byte string");
        }
        size_t key_offset = pos;
        std::string key = parse_byte_string();
        if (dict.contains(key)) {
            throw MalformedEncoding(key_offset, "duplicate dictionary key");
        }

        size_t value_start = pos;
        dict[key] = parse_value();
        if (is_root) {
            root_values[key] = input.substr(value_start, pos - value_start);
        }
    }

    if (pos >= input.size()) {
        throw MalformedEncoding(start, "dictionary missing terminator");
    }

    pos++;
    depth--;
    return dict;
}
