// SPDX-License-Identifier: MIT

// src/value.cpp
#include "src/value.hpp"

#include <fmt/format.h>

namespace hcat_pipe {

std::string_view SourceKindName(const SourceValue& value) {
    if (value.valueless_by_exception()) return "valueless";
    return std::visit([](const auto& v) -> std::string_view {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "null";
        else if constexpr (std::is_same_v<T, int8_t>) return "int8";
        else if constexpr (std::is_same_v<T, int16_t>) return "int16";
        else if constexpr (std::is_same_v<T, int32_t>) return "int32";
        else if constexpr (std::is_same_v<T, int64_t>) return "int64";
        else if constexpr (std::is_same_v<T, float>) return "float";
        else if constexpr (std::is_same_v<T, double>) return "double";
        else if constexpr (std::is_same_v<T, Decimal>) return "decimal";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, Date>) return "date";
        else if constexpr (std::is_same_v<T, Time>) return "time";
        else if constexpr (std::is_same_v<T, Timestamp>) return "timestamp";
        else if constexpr (std::is_same_v<T, ByteVector>) return "bytes";
        else if constexpr (std::is_same_v<T, BlobRef>) return "blob";
        else if constexpr (std::is_same_v<T, ClobRef>) return "clob";
        else static_assert(kAlwaysFalse<T>, "unhandled source kind");
    }, value);
}

std::string FormatSourceValue(const SourceValue& value) {
    if (value.valueless_by_exception()) return "<valueless>";
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, int8_t>) {
            return fmt::format("{}", static_cast<int>(v));
        } else if constexpr (SourceNumber<T> || std::is_same_v<T, bool> ||
                             std::is_same_v<T, std::string>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, ByteVector>) {
            return fmt::format("<{} bytes>", v.size());
        } else {
            // Decimal, temporal kinds and large-object refs
            return v.ToString();
        }
    }, value);
}

}  // namespace hcat_pipe
