#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Typed field access for decoders built on the bencode value tree.
// Absent required keys throw MissingField, wrong value types InvalidField,
// and keys outside a closed schema UnexpectedField.
class BencodeFields {
public:
    static const nlohmann::json& requireDictionary(const nlohmann::json& value, const std::string& what);

    static const nlohmann::json& require(const nlohmann::json& dict, const std::string& key);
    static const std::string& requireString(const nlohmann::json& dict, const std::string& key);
    static int64_t requireInteger(const nlohmann::json& dict, const std::string& key);
    static const nlohmann::json& requireList(const nlohmann::json& dict, const std::string& key);

    static std::optional<std::string> optionalString(const nlohmann::json& dict, const std::string& key);
    static std::optional<int64_t> optionalInteger(const nlohmann::json& dict, const std::string& key);

    static void expectOnly(const nlohmann::json& dict, std::initializer_list<const char*> allowed_keys);
};
