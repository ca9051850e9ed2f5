// SPDX-License-Identifier: MIT

// src/partition_key_validator.hpp
#pragma once

#include <expected>
#include <memory>
#include <variant>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "src/table/table.hpp"
#include "src/value.hpp"

namespace hcat_pipe {

/// Opt-in check run on converted records: dynamic partition values must not
/// be null.  Partition fields absent from the record are not checked.
class PartitionKeyValidator {
public:
    explicit PartitionKeyValidator(std::shared_ptr<const TargetSchema> schema)
        : schema_(std::move(schema)) {}

    /// @return NullPartitionKey naming the first null partition column.
    std::expected<void, Error> Validate(const ConvertedRecord& record) const {
        for (const auto& name : schema_->partition_field_names()) {
            auto it = record.find(name);
            if (it != record.end() && std::holds_alternative<std::monostate>(it->second)) {
                return std::unexpected(Error{ErrorCode::NullPartitionKey,
                    fmt::format("Dynamic partition keys cannot be null. Please make sure "
                                "that the column {} is declared as not null in the database",
                                name)});
            }
        }
        return {};
    }

private:
    std::shared_ptr<const TargetSchema> schema_;
};

}  // namespace hcat_pipe
