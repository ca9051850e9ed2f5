// SPDX-License-Identifier: MIT

// src/temporal.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace hcat_pipe {

// Date, Time and Timestamp mirror the three SQL temporal column kinds.
// Each exposes its instant as milliseconds since the Unix epoch and a
// canonical text form.  Text is always rendered in UTC so that output does
// not depend on the host timezone.
//
// Thread safety: Value types, safe to copy and use across threads.

namespace detail {

inline std::string FormatYmd(std::chrono::sys_days day) {
    std::chrono::year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

template <typename Duration>
std::string FormatHms(std::chrono::hh_mm_ss<Duration> tod) {
    return fmt::format("{:02}:{:02}:{:02}", tod.hours().count(),
                       tod.minutes().count(), tod.seconds().count());
}

}  // namespace detail

/// Calendar date (SQL DATE).
class Date {
public:
    constexpr Date() = default;
    explicit constexpr Date(std::chrono::sys_days day) : day_(day) {}
    explicit Date(std::chrono::year_month_day ymd) : day_(ymd) {}

    /// Milliseconds since epoch at UTC midnight.
    int64_t EpochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   day_.time_since_epoch()).count();
    }

    /// "yyyy-mm-dd"
    std::string ToString() const { return detail::FormatYmd(day_); }

    std::chrono::sys_days day() const { return day_; }
    bool operator==(const Date&) const = default;

private:
    std::chrono::sys_days day_{};
};

/// Time of day carried as a full instant (SQL TIME).  Drivers usually anchor
/// it on 1970-01-01, but any instant is accepted and only its time of day is
/// rendered.
class Time {
public:
    using TimePoint = std::chrono::sys_time<std::chrono::milliseconds>;

    constexpr Time() = default;
    explicit constexpr Time(TimePoint instant) : instant_(instant) {}

    /// Time of day anchored on the epoch date.
    static Time FromTimeOfDay(std::chrono::milliseconds since_midnight) {
        return Time(TimePoint{since_midnight});
    }

    int64_t EpochMillis() const { return instant_.time_since_epoch().count(); }

    /// "hh:mm:ss"
    std::string ToString() const {
        auto day = std::chrono::floor<std::chrono::days>(instant_);
        return detail::FormatHms(std::chrono::hh_mm_ss{
            std::chrono::floor<std::chrono::seconds>(instant_ - day)});
    }

    TimePoint instant() const { return instant_; }
    bool operator==(const Time&) const = default;

private:
    TimePoint instant_{};
};

/// Instant with nanosecond precision (SQL TIMESTAMP).
class Timestamp {
public:
    using TimePoint = std::chrono::sys_time<std::chrono::nanoseconds>;

    constexpr Timestamp() = default;
    explicit constexpr Timestamp(TimePoint instant) : instant_(instant) {}

    /// Whole milliseconds since epoch; sub-millisecond digits are floored.
    int64_t EpochMillis() const {
        return std::chrono::floor<std::chrono::milliseconds>(instant_)
            .time_since_epoch().count();
    }

    /// "yyyy-mm-dd hh:mm:ss.f" with trailing fraction zeros trimmed, keeping
    /// at least one fraction digit ("2024-03-01 09:30:00.0").
    std::string ToString() const {
        auto day = std::chrono::floor<std::chrono::days>(instant_);
        auto since_midnight = instant_ - day;
        auto secs = std::chrono::floor<std::chrono::seconds>(since_midnight);
        auto nanos = (since_midnight - secs).count();

        std::string fraction = fmt::format("{:09}", nanos);
        auto last = fraction.find_last_not_of('0');
        fraction.resize(last == std::string::npos ? 1 : last + 1);

        return fmt::format("{} {}.{}", detail::FormatYmd(day),
                           detail::FormatHms(std::chrono::hh_mm_ss{secs}), fraction);
    }

    TimePoint instant() const { return instant_; }
    bool operator==(const Timestamp&) const = default;

private:
    TimePoint instant_{};
};

}  // namespace hcat_pipe
