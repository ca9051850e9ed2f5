// SPDX-License-Identifier: MIT

// src/converter_config.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "src/table/column_type.hpp"

namespace hcat_pipe {

/// Job property names read by ConverterConfig::FromProperties.
inline constexpr std::string_view kBigDecimalFormatProperty = "sqoop.bigdecimal.format.string";
inline constexpr std::string_view kDebugImportMapperProperty = "sqoop.debug.import.mapper";
inline constexpr std::string_view kValidatePartitionKeysProperty = "hcat.validate.partition.keys";

using Properties = std::unordered_map<std::string, std::string>;

/// Session configuration for record conversion.  Held by value in every
/// converter so parallel mappers never share mutable configuration.
struct ConverterConfig {
    bool bigdecimal_format_string = true;   ///< Decimal -> string uses the plain form
    bool debug_logging = false;             ///< Trace every field before conversion
    bool validate_partition_keys = false;   ///< Reject null partition values

    /// Read configuration from job properties.  Missing keys keep their
    /// defaults; values must be "true" or "false" (any case).
    static std::expected<ConverterConfig, Error> FromProperties(const Properties& props) {
        ConverterConfig config;
        auto read = [&props](std::string_view key, bool& out) -> std::expected<void, Error> {
            auto it = props.find(std::string(key));
            if (it == props.end()) return {};
            auto value = ParseBool(it->second);
            if (!value) {
                return std::unexpected(Error{ErrorCode::InvalidConfig,
                    fmt::format("Property {} must be true or false, got '{}'", key, it->second)});
            }
            out = *value;
            return {};
        };

        if (auto r = read(kBigDecimalFormatProperty, config.bigdecimal_format_string); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read(kDebugImportMapperProperty, config.debug_logging); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read(kValidatePartitionKeysProperty, config.validate_partition_keys); !r) {
            return std::unexpected(r.error());
        }
        return config;
    }

private:
    static std::expected<bool, std::string> ParseBool(std::string_view text) {
        auto first = text.find_first_not_of(" \t");
        auto last = text.find_last_not_of(" \t");
        std::string t = first == std::string_view::npos
            ? std::string{}
            : ToLowerAscii(text.substr(first, last - first + 1));
        if (t == "true") return true;
        if (t == "false") return false;
        return std::unexpected(t);
    }
};

}  // namespace hcat_pipe
