// SPDX-License-Identifier: MIT

// src/import_mapper.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/sink.hpp"
#include "src/converter_config.hpp"
#include "src/large_object_loader.hpp"
#include "src/log.hpp"
#include "src/partition_key_validator.hpp"
#include "src/record_converter.hpp"
#include "src/table/table.hpp"

namespace hcat_pipe {

/// Per-task import harness: turns (key, SourceRecord) pairs into
/// (key, ConvertedRecord) pairs delivered to a RecordSink.
///
/// Lifecycle: Setup() once, Map() per record, Cleanup() once.  Each mapper
/// owns its configuration and converter; run one mapper per execution unit
/// and share the table metadata (or a pre-built schema) between them.
///
/// Failures are both returned and reported through the sink's OnError.
/// Large-object loader failures surface as ErrorCode::IoError.
///
/// @tparam Sink  Downstream consumer satisfying RecordSink.
template <RecordSink Sink>
class ImportMapper {
public:
    ImportMapper(ConverterConfig config, TableInfo table,
                 std::shared_ptr<ILargeObjectLoader> loader, Sink& sink)
        : config_(config),
          table_(std::move(table)),
          has_table_(true),
          loader_(loader ? std::move(loader) : std::make_shared<NoOpLargeObjectLoader>()),
          sink_(sink) {}

    /// Construct over a schema built elsewhere; Setup() then skips parsing.
    ImportMapper(ConverterConfig config, std::shared_ptr<const TargetSchema> schema,
                 std::shared_ptr<ILargeObjectLoader> loader, Sink& sink)
        : config_(config),
          loader_(loader ? std::move(loader) : std::make_shared<NoOpLargeObjectLoader>()),
          sink_(sink),
          schema_(std::move(schema)) {}

    /// Build the target schema (data columns, then partition columns) and
    /// the converter.
    std::expected<void, Error> Setup() {
        if (state_ != State::Created) {
            return Fail(Error{ErrorCode::InvalidState, "Setup called twice"});
        }
        if (!schema_) {
            auto schema = TargetSchema::FromTable(table_);
            if (!schema) return Fail(schema.error());
            schema_ = std::make_shared<const TargetSchema>(std::move(*schema));
        }
        converter_.emplace(schema_, ValueCoercer(config_));
        if (config_.validate_partition_keys) validator_.emplace(schema_);
        state_ = State::Ready;
        if (has_table_) {
            Logger()->info("Import mapper ready for {}.{} at '{}': {} fields ({} partition)",
                           table_.database, table_.name, table_.location, schema_->size(),
                           schema_->partition_field_names().size());
        } else {
            Logger()->info("Import mapper ready: {} fields ({} partition)",
                           schema_->size(), schema_->partition_field_names().size());
        }
        return {};
    }

    /// Load large objects, convert and emit one record.
    std::expected<void, Error> Map(RecordKey key, SourceRecord record) {
        if (state_ != State::Ready) {
            return Fail(Error{ErrorCode::InvalidState, "Map called outside Setup/Cleanup"});
        }

        if (auto loaded = loader_->LoadLargeObjects(record); !loaded) {
            return Fail(Error{ErrorCode::IoError,
                fmt::format("Failed to load large objects: {}", loaded.error().message)});
        }

        auto converted = converter_->Convert(record);
        if (!converted) return Fail(converted.error());

        if (validator_) {
            if (auto valid = validator_->Validate(*converted); !valid) return Fail(valid.error());
        }

        sink_.OnRecord(std::move(key), std::move(*converted));
        ++records_;
        return {};
    }

    /// Close the loader and signal completion.  Safe to call more than once.
    void Cleanup() {
        if (state_ == State::Closed) return;
        loader_->Close();
        state_ = State::Closed;
        Logger()->info("Import mapper finished: {} records converted", records_);
        sink_.OnComplete();
    }

    /// Schema in use; null before Setup() unless supplied at construction.
    std::shared_ptr<const TargetSchema> schema() const { return schema_; }

    /// Number of records emitted so far.
    std::size_t records() const { return records_; }

private:
    enum class State { Created, Ready, Closed };

    std::unexpected<Error> Fail(Error e) {
        sink_.OnError(e);
        return std::unexpected(std::move(e));
    }

    ConverterConfig config_;
    TableInfo table_;
    bool has_table_ = false;
    std::shared_ptr<ILargeObjectLoader> loader_;
    Sink& sink_;
    std::shared_ptr<const TargetSchema> schema_;
    std::optional<RecordConverter> converter_;
    std::optional<PartitionKeyValidator> validator_;
    State state_ = State::Created;
    std::size_t records_ = 0;
};

}  // namespace hcat_pipe
