// SPDX-License-Identifier: MIT

// src/table/table.cpp
#include "src/table/table.hpp"

#include <utility>

#include <fmt/format.h>

namespace hcat_pipe {

namespace {

std::expected<std::vector<SchemaField>, Error> ParseColumns(
        const std::vector<ColumnInfo>& columns) {
    std::vector<SchemaField> fields;
    fields.reserve(columns.size());
    for (const auto& col : columns) {
        auto type = ParseFieldType(col.type_string);
        if (!type) {
            return std::unexpected(Error{type.error().code,
                fmt::format("column '{}': {}", col.name, type.error().message)});
        }
        fields.push_back(SchemaField{col.name, *type, col.type_string});
    }
    return fields;
}

}  // namespace

std::expected<TargetSchema, Error> TargetSchema::Create(
        std::vector<SchemaField> data_fields,
        std::vector<SchemaField> partition_fields) {
    TargetSchema schema;
    schema.fields_.reserve(data_fields.size() + partition_fields.size());

    auto append = [&schema](SchemaField&& field, bool partition) -> std::expected<void, Error> {
        std::string key = ToLowerAscii(field.name);
        if (schema.index_.contains(key)) {
            return std::unexpected(Error{ErrorCode::DuplicateField,
                fmt::format("Duplicate field '{}' in target schema", field.name)});
        }
        schema.index_.emplace(key, schema.fields_.size());
        if (partition) {
            schema.partition_names_.push_back(key);
            schema.partition_set_.insert(std::move(key));
        }
        schema.fields_.push_back(std::move(field));
        return {};
    };

    for (auto& field : data_fields) {
        if (auto r = append(std::move(field), false); !r) return std::unexpected(r.error());
    }
    for (auto& field : partition_fields) {
        if (auto r = append(std::move(field), true); !r) return std::unexpected(r.error());
    }
    return schema;
}

std::expected<TargetSchema, Error> TargetSchema::FromTable(const TableInfo& table) {
    auto data = ParseColumns(table.data_columns);
    if (!data) return std::unexpected(data.error());
    auto partitions = ParseColumns(table.partition_columns);
    if (!partitions) return std::unexpected(partitions.error());
    return Create(std::move(*data), std::move(*partitions));
}

const SchemaField* TargetSchema::Find(std::string_view name) const {
    auto it = index_.find(ToLowerAscii(name));
    return it == index_.end() ? nullptr : &fields_[it->second];
}

std::expected<const SchemaField*, Error> TargetSchema::Lookup(std::string_view name) const {
    if (const SchemaField* field = Find(name)) return field;
    return std::unexpected(Error{ErrorCode::SchemaLookupFailed,
        fmt::format("Field '{}' is not part of the target schema", name)});
}

bool TargetSchema::IsPartitionField(std::string_view name) const {
    return partition_set_.contains(ToLowerAscii(name));
}

}  // namespace hcat_pipe
