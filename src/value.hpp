// SPDX-License-Identifier: MIT

// src/value.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>

#include "src/decimal.hpp"
#include "src/large_object.hpp"
#include "src/temporal.hpp"

namespace hcat_pipe {

/// Dynamically typed input value.  The alternative set is closed: every
/// consumer handles each kind explicitly.
using SourceValue = std::variant<
    std::monostate,  // null
    int8_t, int16_t, int32_t, int64_t, float, double, Decimal,
    bool,
    std::string,
    Date, Time, Timestamp,
    ByteVector,
    BlobRef,
    ClobRef>;

/// Input record: field name (any case) to value.
using SourceRecord = std::unordered_map<std::string, SourceValue>;

/// Converted value.  Its alternative always matches the TargetFieldType of
/// the field it was converted for.
using ConvertedValue = std::variant<
    std::monostate,  // null
    bool, int8_t, int16_t, int32_t, int64_t, float, double,
    std::string,
    ByteVector>;

/// Output record keyed by lower-cased field name.
using ConvertedRecord = std::unordered_map<std::string, ConvertedValue>;

/// Key that travels unchanged with each record through the import harness.
using RecordKey = std::string;

template <typename>
inline constexpr bool kAlwaysFalse = false;

/// Numeric alternatives of SourceValue.
template <typename T>
concept SourceNumber = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

/// Name of the runtime kind held by @p value, for diagnostics.
std::string_view SourceKindName(const SourceValue& value);

/// Render @p value for debug output.
std::string FormatSourceValue(const SourceValue& value);

}  // namespace hcat_pipe
