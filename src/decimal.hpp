// SPDX-License-Identifier: MIT

// src/decimal.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace hcat_pipe {

/// Arbitrary-precision decimal: an unscaled integer of any length and a
/// 32-bit scale.  The value is unscaled * 10^-scale.
///
/// Scale is significant: 123.450 (unscaled 123450, scale 3) and 123.45
/// (unscaled 12345, scale 2) render differently and compare unequal.
///
/// Thread safety: Value type, safe to copy and use across threads.
class Decimal {
public:
    /// Zero with scale 0.
    Decimal() = default;

    /// Construct from an optionally signed run of decimal digits.
    /// @throws std::invalid_argument if @p unscaled is not [+-]digits.
    Decimal(std::string_view unscaled, int32_t scale);

    /// Parse a decimal literal: "123.450", "-0.001", "1.5E+3", "2e-7".
    /// @throws std::invalid_argument on malformed input or scale overflow.
    static Decimal FromString(std::string_view text);

    /// Exact value of a 64-bit integer (scale 0).
    static Decimal FromInt64(int64_t value);

    /// Default rendering.  Uses scientific notation when the scale is
    /// negative or the adjusted exponent is below -6 ("1.23E-7", "1E+3").
    std::string ToString() const;

    /// Rendering without an exponent field ("0.000000123", "1000").
    std::string ToPlainString() const;

    /// Integral part (fraction dropped), reduced modulo 2^64.
    int64_t ToInt64() const;

    /// Nearest double; out-of-range magnitudes become +/-infinity or +/-0.
    double ToDouble() const;

    /// Nearest float; out-of-range magnitudes become +/-infinity or +/-0.
    float ToFloat() const;

    bool IsZero() const { return digits_ == "0"; }
    bool IsNegative() const { return negative_; }
    int32_t Scale() const { return scale_; }
    /// Magnitude digits of the unscaled value, no leading zeros.
    const std::string& UnscaledDigits() const { return digits_; }

    bool operator==(const Decimal&) const = default;

private:
    template <typename T>
    T ToFloating() const;

    std::string digits_ = "0";
    int32_t scale_ = 0;
    bool negative_ = false;
};

}  // namespace hcat_pipe
