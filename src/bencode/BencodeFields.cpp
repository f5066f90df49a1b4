#include "BencodeFields.hpp"
#include "../utils/Errors.hpp"
#include <algorithm>

const nlohmann::json& BencodeFields::requireDictionary(const nlohmann::json& value, const std::string& what) {
    if (!value.is_object()) {
        throw InvalidField(what, "expected a dictionary");
    }
    return value;
}

const nlohmann::json& BencodeFields::require(const nlohmann::json& dict, const std::string& key) {
    auto it = dict.find(key);
    if (it == dict.end()) {
        throw MissingField(key);
    }
    return *it;
}

const std::string& BencodeFields::requireString(const nlohmann::json& dict, const std::string& key) {
    const auto& value = require(dict, key);
    if (!value.is_string()) {
        throw InvalidField(key, "expected a byte string");
    }
    return value.get_ref<const std::string&>();
}

int64_t BencodeFields::requireInteger(const nlohmann::json& dict, const std::string& key) {
    const auto& value = require(dict, key);
    if (!value.is_number_integer()) {
        throw InvalidField(key, "expected an integer");
    }
    return value.get<int64_t>();
}

const nlohmann::json& BencodeFields::requireList(const nlohmann::json& dict, const std::string& key) {
    const auto& value = require(dict, key);
    if (!value.is_array()) {
        throw InvalidField(key, "expected a list");
    }
    return value;
}

std::optional<std::string> BencodeFields::optionalString(const nlohmann::json& dict, const std::string& key) {
    if (!dict.contains(key)) {
        return std::nullopt;
    }
    return requireString(dict, key);
}

std::optional<int64_t> BencodeFields::optionalInteger(const nlohmann::json& dict, const std::string& key) {
    if (!dict.contains(key)) {
        return std::nullopt;
    }
    return requireInteger(dict, key);
}

void BencodeFields::expectOnly(const nlohmann::json& dict, std::initializer_list<const char*> allowed_keys) {
    for (auto it = dict.begin(); it != dict.end(); ++it) {
        const std::string& key = it.key();
        bool allowed = std::any_of(allowed_keys.begin(), allowed_keys.end(),
            [&key](const char* allowed_key) { return key == allowed_key; });
        if (!allowed) {
            throw UnexpectedField(key);
        }
    }
}
