// SPDX-License-Identifier: MIT

// src/table/column_type.hpp
#pragma once

#include <cctype>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace hcat_pipe {

/// Storage type of a target column.  Carries no data; the matching C++
/// representation of a converted value is listed beside each tag.
enum class TargetFieldType : uint8_t {
    Boolean,   ///< bool
    TinyInt,   ///< int8_t
    SmallInt,  ///< int16_t
    Int,       ///< int32_t
    BigInt,    ///< int64_t
    Float,     ///< float
    Double,    ///< double
    String,    ///< std::string
    Binary,    ///< ByteVector
};

/// Canonical HCatalog type name for a tag.
constexpr std::string_view field_type_name(TargetFieldType type) {
    switch (type) {
        case TargetFieldType::Boolean:  return "boolean";
        case TargetFieldType::TinyInt:  return "tinyint";
        case TargetFieldType::SmallInt: return "smallint";
        case TargetFieldType::Int:      return "int";
        case TargetFieldType::BigInt:   return "bigint";
        case TargetFieldType::Float:    return "float";
        case TargetFieldType::Double:   return "double";
        case TargetFieldType::String:   return "string";
        case TargetFieldType::Binary:   return "binary";
    }
    return "unknown";
}

/// Lower-case ASCII copy of @p s.  Field names and type strings are matched
/// case-insensitively throughout.
inline std::string ToLowerAscii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/// Parse an HCatalog column type string such as "bigint" or "varchar(32)".
///
/// Matching ignores case and surrounding whitespace.  Character types with a
/// length modifier (char(n), varchar(n)) map to String.
inline std::expected<TargetFieldType, Error> ParseFieldType(std::string_view type_string) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!type_string.empty() && is_space(type_string.front())) type_string.remove_prefix(1);
    while (!type_string.empty() && is_space(type_string.back())) type_string.remove_suffix(1);

    std::string t = ToLowerAscii(type_string);
    if (t == "boolean") return TargetFieldType::Boolean;
    if (t == "tinyint") return TargetFieldType::TinyInt;
    if (t == "smallint") return TargetFieldType::SmallInt;
    if (t == "int" || t == "integer") return TargetFieldType::Int;
    if (t == "bigint") return TargetFieldType::BigInt;
    if (t == "float") return TargetFieldType::Float;
    if (t == "double") return TargetFieldType::Double;
    if (t == "string") return TargetFieldType::String;
    if (t == "binary") return TargetFieldType::Binary;
    // Note: check "varchar(" before "char(" so the prefix test stays unambiguous
    if ((t.starts_with("varchar(") || t.starts_with("char(")) && t.ends_with(")")) {
        return TargetFieldType::String;
    }
    return std::unexpected(Error{ErrorCode::InvalidSchema,
        fmt::format("Unsupported HCatalog type '{}'", type_string)});
}

}  // namespace hcat_pipe
