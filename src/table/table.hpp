// SPDX-License-Identifier: MIT

// src/table/table.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/table/column_type.hpp"

namespace hcat_pipe {

/// A single target column: name, storage type and the display string used in
/// diagnostics (e.g. "varchar(32)" for a String field).
struct SchemaField {
    std::string name;         ///< Column name as declared in the metastore.
    TargetFieldType type;     ///< Storage type tag.
    std::string type_string;  ///< Human-readable type for error messages.
};

/// Column metadata as delivered by the metastore.
struct ColumnInfo {
    std::string name;
    std::string type_string;
};

/// Table metadata needed to build a TargetSchema.
struct TableInfo {
    std::string database;
    std::string name;
    std::vector<ColumnInfo> data_columns;
    std::vector<ColumnInfo> partition_columns;
    std::string location;  ///< Table storage location
};

/// Flattened target schema: data columns followed by partition columns,
/// indexed by lower-cased name.
///
/// Immutable once built.  Share one instance (as shared_ptr<const>) across
/// any number of converters; concurrent lookups need no synchronization.
class TargetSchema {
public:
    /// Build from already-typed fields.
    /// @return DuplicateField if two names collide after lower-casing.
    static std::expected<TargetSchema, Error> Create(
        std::vector<SchemaField> data_fields,
        std::vector<SchemaField> partition_fields = {});

    /// Build from metastore column metadata, parsing every type string.
    /// @return InvalidSchema for an unknown type, DuplicateField on collision.
    static std::expected<TargetSchema, Error> FromTable(const TableInfo& table);

    /// Case-insensitive lookup.
    /// @return SchemaLookupFailed if @p name is not part of the schema.
    std::expected<const SchemaField*, Error> Lookup(std::string_view name) const;

    /// Case-insensitive lookup; nullptr when absent.
    const SchemaField* Find(std::string_view name) const;

    /// @return true if @p name (any case) came from the partition columns.
    bool IsPartitionField(std::string_view name) const;

    /// Lower-cased names of the partition columns, in declaration order.
    const std::vector<std::string>& partition_field_names() const { return partition_names_; }

    const std::vector<SchemaField>& fields() const { return fields_; }
    std::size_t size() const { return fields_.size(); }

private:
    TargetSchema() = default;

    std::vector<SchemaField> fields_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::string> partition_names_;
    std::unordered_set<std::string> partition_set_;
};

}  // namespace hcat_pipe
