// SPDX-License-Identifier: MIT

// src/record_converter.hpp
#pragma once

#include <expected>
#include <memory>

#include "lib/stream/error.hpp"
#include "src/table/table.hpp"
#include "src/value.hpp"
#include "src/value_coercer.hpp"

namespace hcat_pipe {

/// Converts whole records against a shared TargetSchema.
///
/// Every source field is looked up by lower-cased name, coerced to the
/// field's type and stored under the lower-cased name.  The output holds
/// exactly the fields of the input; schema fields missing from the input are
/// not synthesized.  The first failing field aborts the record.
///
/// **Thread safety:** Convert is const and touches only the immutable
/// schema; one converter may serve several threads, or each thread may hold
/// its own converter over the same schema.
class RecordConverter {
public:
    RecordConverter(std::shared_ptr<const TargetSchema> schema, ValueCoercer coercer)
        : schema_(std::move(schema)), coercer_(std::move(coercer)) {}

    /// @return The converted record, or the first SchemaLookupFailed /
    ///         UnsupportedMapping / UnsupportedSourceType error.
    std::expected<ConvertedRecord, Error> Convert(const SourceRecord& source) const;

    const TargetSchema& schema() const { return *schema_; }
    const ValueCoercer& coercer() const { return coercer_; }

private:
    std::shared_ptr<const TargetSchema> schema_;
    ValueCoercer coercer_;
};

}  // namespace hcat_pipe
