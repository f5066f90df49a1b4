#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct CommandOptions {
    std::map<std::string, std::string> options;  // Valued options like -d and their values
    std::set<std::string> flags;                 // Switches like -v
    std::vector<std::string> args;               // Regular arguments

    bool hasFlag(const std::string& short_name, const std::string& long_name) const {
        return flags.count(short_name) > 0 || flags.count(long_name) > 0;
    }

    std::optional<std::string> option(const std::string& short_name, const std::string& long_name) const {
        for (const auto& name : {short_name, long_name}) {
            auto it = options.find(name);
            if (it != options.end()) {
                return it->second;
            }
        }
        return std::nullopt;
    }
};
