// SPDX-License-Identifier: MIT

// src/log.hpp
#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hcat_pipe {

inline constexpr const char* kLoggerName = "hcat_pipe";

/// Process-wide default logger, created on first use.  Reuses a logger an
/// application registered under kLoggerName beforehand.
inline std::shared_ptr<spdlog::logger> Logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        return spdlog::stderr_color_mt(kLoggerName);
    }();
    return logger;
}

}  // namespace hcat_pipe
