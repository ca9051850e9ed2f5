// SPDX-License-Identifier: MIT

// src/value_coercer.hpp
#pragma once

#include <expected>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "lib/stream/error.hpp"
#include "src/converter_config.hpp"
#include "src/log.hpp"
#include "src/table/table.hpp"
#include "src/value.hpp"

namespace hcat_pipe {

/// Converts one SourceValue to the representation of a target column type.
///
/// Dispatch is on the source kind first, then on the target type:
///
/// | source          | accepted targets                                      |
/// |-----------------|-------------------------------------------------------|
/// | null            | any (result is null)                                  |
/// | numeric         | boolean, tinyint..bigint, float, double               |
/// | decimal         | as numeric, plus string                               |
/// | boolean         | boolean, tinyint..bigint, float, double (1 / 0)       |
/// | string          | string                                                |
/// | date/time/ts    | bigint (epoch millis), string                         |
/// | bytes           | binary                                                |
/// | blob            | binary (inline payload or reference text bytes)       |
/// | clob            | string (inline text or reference text)                |
///
/// Integer narrowing truncates toward zero and wraps to the target width.
/// Floating sources saturate to the 32-bit range (64-bit for bigint) before
/// wrapping; NaN becomes 0.
///
/// **Thread safety:** Const after construction; Coerce may be called
/// concurrently.
class ValueCoercer {
public:
    /// @param config  Decimal formatting and debug-trace switches.
    /// @param logger  Destination of the debug trace; lowered to debug level
    ///                when the trace is enabled.
    explicit ValueCoercer(ConverterConfig config = {},
                          std::shared_ptr<spdlog::logger> logger = Logger())
        : config_(config), logger_(std::move(logger)) {
        if (config_.debug_logging && logger_ && !logger_->should_log(spdlog::level::debug)) {
            logger_->set_level(spdlog::level::debug);
        }
    }

    /// Convert @p value for a column of type @p type.
    /// @param type_string  Column type as displayed in error messages.
    /// @return UnsupportedMapping if a non-null value has no conversion to
    ///         @p type; UnsupportedSourceType if @p value holds no kind.
    std::expected<ConvertedValue, Error> Coerce(const SourceValue& value,
                                                TargetFieldType type,
                                                std::string_view type_string) const;

    /// Coerce for a named schema field, emitting the debug trace first when
    /// enabled.
    std::expected<ConvertedValue, Error> CoerceField(std::string_view field_name,
                                                     const SourceValue& value,
                                                     const SchemaField& field) const;

    const ConverterConfig& config() const { return config_; }

private:
    ConverterConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace hcat_pipe
