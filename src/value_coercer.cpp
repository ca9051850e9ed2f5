// SPDX-License-Identifier: MIT

// src/value_coercer.cpp
#include "src/value_coercer.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace hcat_pipe {

namespace {

using MaybeValue = std::optional<ConvertedValue>;

template <typename T>
MaybeValue Make(T v) {
    return ConvertedValue{std::in_place_type<T>, std::move(v)};
}

int32_t SaturateToInt32(double d) {
    if (std::isnan(d)) return 0;
    if (d >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    if (d <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    return static_cast<int32_t>(d);
}

int64_t SaturateToInt64(double d) {
    if (std::isnan(d)) return 0;
    // 2^63 is exactly representable; anything at or above it saturates.
    if (d >= 9223372036854775808.0) return std::numeric_limits<int64_t>::max();
    if (d <= -9223372036854775808.0) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(d);
}

// 32-bit integral view used for tinyint, smallint and int targets.
template <SourceNumber T>
int32_t IntValue(T n) {
    if constexpr (std::is_floating_point_v<T>) return SaturateToInt32(n);
    else return static_cast<int32_t>(n);
}

template <SourceNumber T>
int64_t LongValue(T n) {
    if constexpr (std::is_floating_point_v<T>) return SaturateToInt64(n);
    else return static_cast<int64_t>(n);
}

template <SourceNumber T>
MaybeValue FromNumber(T n, TargetFieldType type) {
    switch (type) {
        case TargetFieldType::TinyInt:  return Make(static_cast<int8_t>(IntValue(n)));
        case TargetFieldType::SmallInt: return Make(static_cast<int16_t>(IntValue(n)));
        case TargetFieldType::Int:      return Make(IntValue(n));
        case TargetFieldType::BigInt:   return Make(LongValue(n));
        case TargetFieldType::Float:    return Make(static_cast<float>(n));
        case TargetFieldType::Double:   return Make(static_cast<double>(n));
        case TargetFieldType::Boolean:  return Make(n != 0);
        default:                        return std::nullopt;
    }
}

MaybeValue FromDecimal(const Decimal& d, TargetFieldType type, bool plain_string) {
    switch (type) {
        case TargetFieldType::String:
            return Make(plain_string ? d.ToPlainString() : d.ToString());
        case TargetFieldType::TinyInt:  return Make(static_cast<int8_t>(d.ToInt64()));
        case TargetFieldType::SmallInt: return Make(static_cast<int16_t>(d.ToInt64()));
        case TargetFieldType::Int:      return Make(static_cast<int32_t>(d.ToInt64()));
        case TargetFieldType::BigInt:   return Make(d.ToInt64());
        case TargetFieldType::Float:    return Make(d.ToFloat());
        case TargetFieldType::Double:   return Make(d.ToDouble());
        case TargetFieldType::Boolean:  return Make(!d.IsZero());
        default:                        return std::nullopt;
    }
}

MaybeValue FromBoolean(bool b, TargetFieldType type) {
    switch (type) {
        case TargetFieldType::Boolean:  return Make(b);
        case TargetFieldType::TinyInt:  return Make(static_cast<int8_t>(b ? 1 : 0));
        case TargetFieldType::SmallInt: return Make(static_cast<int16_t>(b ? 1 : 0));
        case TargetFieldType::Int:      return Make(static_cast<int32_t>(b ? 1 : 0));
        case TargetFieldType::BigInt:   return Make(static_cast<int64_t>(b ? 1 : 0));
        case TargetFieldType::Float:    return Make(b ? 1.0f : 0.0f);
        case TargetFieldType::Double:   return Make(b ? 1.0 : 0.0);
        default:                        return std::nullopt;
    }
}

// Date, Time and Timestamp share one rule.
template <typename Temporal>
MaybeValue FromTemporal(const Temporal& t, TargetFieldType type) {
    if (type == TargetFieldType::BigInt) return Make(t.EpochMillis());
    if (type == TargetFieldType::String) return Make(t.ToString());
    return std::nullopt;
}

}  // namespace

std::expected<ConvertedValue, Error> ValueCoercer::Coerce(const SourceValue& value,
                                                          TargetFieldType type,
                                                          std::string_view type_string) const {
    if (value.valueless_by_exception()) {
        return std::unexpected(Error{ErrorCode::UnsupportedSourceType,
            fmt::format("Objects of type {} are not supported", SourceKindName(value))});
    }

    MaybeValue result = std::visit([&](const auto& v) -> MaybeValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return ConvertedValue{};
        } else if constexpr (SourceNumber<T>) {
            return FromNumber(v, type);
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return FromDecimal(v, type, config_.bigdecimal_format_string);
        } else if constexpr (std::is_same_v<T, bool>) {
            return FromBoolean(v, type);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (type == TargetFieldType::String) return Make(v);
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, Date> || std::is_same_v<T, Time> ||
                             std::is_same_v<T, Timestamp>) {
            return FromTemporal(v, type);
        } else if constexpr (std::is_same_v<T, ByteVector>) {
            if (type == TargetFieldType::Binary) return Make(v);
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, BlobRef>) {
            if (type != TargetFieldType::Binary) return std::nullopt;
            // Unmaterialized content degrades to the reference text.
            return Make(v.IsExternal() ? ToBytes(v.external().ToString()) : v.data());
        } else if constexpr (std::is_same_v<T, ClobRef>) {
            if (type != TargetFieldType::String) return std::nullopt;
            return Make(v.IsExternal() ? v.external().ToString() : v.data());
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled source kind");
        }
    }, value);

    if (!result) {
        return std::unexpected(Error{ErrorCode::UnsupportedMapping,
            fmt::format("Objects of type {} can not be mapped to HCatalog type {}",
                        SourceKindName(value), type_string)});
    }
    return std::move(*result);
}

std::expected<ConvertedValue, Error> ValueCoercer::CoerceField(std::string_view field_name,
                                                               const SourceValue& value,
                                                               const SchemaField& field) const {
    if (config_.debug_logging && logger_) {
        logger_->debug("SourceRecordVal: field = {} Val {} of type {}, hcattype {}",
                       field_name, FormatSourceValue(value), SourceKindName(value),
                       field.type_string);
    }
    return Coerce(value, field.type, field.type_string);
}

}  // namespace hcat_pipe
