// SPDX-License-Identifier: MIT

// src/decimal.cpp
#include "src/decimal.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace hcat_pipe {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

// Digits of a non-zero coefficient with a decimal point inserted @p scale
// places from the right (scale > 0).
std::string InsertPoint(const std::string& digits, int32_t scale) {
    auto n = static_cast<int64_t>(digits.size());
    if (n > scale) {
        std::string out = digits.substr(0, static_cast<size_t>(n - scale));
        out += '.';
        out.append(digits, static_cast<size_t>(n - scale), std::string::npos);
        return out;
    }
    std::string out = "0.";
    out.append(static_cast<size_t>(scale - n), '0');
    out += digits;
    return out;
}

}  // namespace

Decimal::Decimal(std::string_view unscaled, int32_t scale) : scale_(scale) {
    bool negative = false;
    if (!unscaled.empty() && (unscaled.front() == '-' || unscaled.front() == '+')) {
        negative = unscaled.front() == '-';
        unscaled.remove_prefix(1);
    }
    if (unscaled.empty() || !std::all_of(unscaled.begin(), unscaled.end(), IsDigit)) {
        throw std::invalid_argument(
            fmt::format("Invalid unscaled decimal value: '{}'", unscaled));
    }
    auto first = unscaled.find_first_not_of('0');
    if (first == std::string_view::npos) {
        digits_ = "0";
        negative_ = false;  // no negative zero
    } else {
        digits_ = std::string(unscaled.substr(first));
        negative_ = negative;
    }
}

Decimal Decimal::FromString(std::string_view text) {
    std::string_view rest = text;
    std::string sign;
    if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
        if (rest.front() == '-') sign = "-";
        rest.remove_prefix(1);
    }

    std::string digits;
    int64_t fraction_digits = 0;
    bool seen_point = false;
    while (!rest.empty() && (IsDigit(rest.front()) || rest.front() == '.')) {
        if (rest.front() == '.') {
            if (seen_point) break;
            seen_point = true;
        } else {
            digits += rest.front();
            if (seen_point) ++fraction_digits;
        }
        rest.remove_prefix(1);
    }
    if (digits.empty()) {
        throw std::invalid_argument(fmt::format("Invalid decimal literal: '{}'", text));
    }

    int64_t exponent = 0;
    if (!rest.empty() && (rest.front() == 'e' || rest.front() == 'E')) {
        rest.remove_prefix(1);
        if (!rest.empty() && rest.front() == '+') rest.remove_prefix(1);
        auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), exponent);
        if (ec != std::errc{} || ptr == rest.data()) {
            throw std::invalid_argument(fmt::format("Invalid decimal exponent: '{}'", text));
        }
        rest.remove_prefix(static_cast<size_t>(ptr - rest.data()));
    }
    if (!rest.empty()) {
        throw std::invalid_argument(fmt::format("Invalid decimal literal: '{}'", text));
    }

    int64_t scale = fraction_digits - exponent;
    if (scale > std::numeric_limits<int32_t>::max() ||
        scale < std::numeric_limits<int32_t>::min()) {
        throw std::invalid_argument(fmt::format("Decimal scale out of range: '{}'", text));
    }
    return Decimal(sign + digits, static_cast<int32_t>(scale));
}

Decimal Decimal::FromInt64(int64_t value) {
    return Decimal(fmt::format("{}", value), 0);
}

std::string Decimal::ToString() const {
    std::string out = negative_ ? "-" : "";
    if (scale_ == 0) return out + digits_;

    int64_t adjusted = -static_cast<int64_t>(scale_) +
                       static_cast<int64_t>(digits_.size()) - 1;
    if (scale_ > 0 && adjusted >= -6) {
        return out + InsertPoint(digits_, scale_);
    }

    out += digits_.front();
    if (digits_.size() > 1) {
        out += '.';
        out.append(digits_, 1, std::string::npos);
    }
    if (adjusted != 0) {
        out += fmt::format("E{}{}", adjusted > 0 ? "+" : "", adjusted);
    }
    return out;
}

std::string Decimal::ToPlainString() const {
    std::string out = negative_ ? "-" : "";
    if (scale_ == 0) return out + digits_;
    if (scale_ < 0) {
        if (IsZero()) return "0";
        out += digits_;
        out.append(static_cast<size_t>(-static_cast<int64_t>(scale_)), '0');
        return out;
    }
    return out + InsertPoint(digits_, scale_);
}

int64_t Decimal::ToInt64() const {
    auto size = static_cast<int64_t>(digits_.size());
    int64_t keep = size;
    if (scale_ > 0) keep = scale_ >= size ? 0 : size - scale_;

    // Unsigned arithmetic wraps, which yields the low 64 bits directly.
    uint64_t acc = 0;
    for (int64_t i = 0; i < keep; ++i) {
        acc = acc * 10 + static_cast<uint64_t>(digits_[static_cast<size_t>(i)] - '0');
    }
    if (scale_ < 0) {
        // 10^64 is a multiple of 2^64; further factors cannot change the result.
        int64_t zeros = std::min<int64_t>(-static_cast<int64_t>(scale_), 64);
        for (int64_t i = 0; i < zeros; ++i) acc *= 10;
    }
    if (negative_) acc = 0 - acc;
    return static_cast<int64_t>(acc);
}

template <typename T>
T Decimal::ToFloating() const {
    std::string literal = fmt::format("{}{}e{}", negative_ ? "-" : "", digits_,
                                      -static_cast<int64_t>(scale_));
    T value{};
    auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
    if (ec == std::errc::result_out_of_range) {
        int64_t adjusted = -static_cast<int64_t>(scale_) +
                           static_cast<int64_t>(digits_.size()) - 1;
        T magnitude = adjusted > 0 ? std::numeric_limits<T>::infinity() : T{0};
        return negative_ ? -magnitude : magnitude;
    }
    if (ec != std::errc{}) {
        throw std::logic_error(fmt::format("Cannot convert decimal '{}' to floating point",
                                           ToString()));
    }
    return value;
}

double Decimal::ToDouble() const { return ToFloating<double>(); }

float Decimal::ToFloat() const { return ToFloating<float>(); }

}  // namespace hcat_pipe
