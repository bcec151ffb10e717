#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "error.hpp"
#include "utils.hpp"

// Process-wide settings: the default algorithm, the default
// parameters of each algorithm, the pepper. Nested YAML mappings are
// flattened into dotted keys, so
//
//   hash:
//     scrypt:
//       workfactor: 16384
//
// becomes “hash.scrypt.workfactor”.
struct Configuration
{
    using StringMap = std::unordered_map<std::string, std::string>;

    StringMap properties;

    static E<Configuration> fromYaml(const std::filesystem::path& path);
    static E<Configuration> fromYamlStr(std::string yaml);

    std::optional<std::string> get(const std::string& key) const;
    std::string get(const std::string& key, std::string_view default_value)
        const;

    // Return the number under “key”, or “default_value” if the key is
    // not set. A value that is not a number is a ConfigurationError.
    template<typename NumType>
    E<NumType> getNumber(const std::string& key, NumType default_value) const
    {
        auto value = get(key);
        if(!value.has_value())
        {
            return default_value;
        }
        auto number = strToNumber<NumType>(*value);
        if(!number.has_value())
        {
            return std::unexpected(configurationError(
                "Invalid number for " + key + ": " + *value + " (" +
                errorMsg(number.error()) + ")"));
        }
        return *number;
    }
};
