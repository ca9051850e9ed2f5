// SPDX-License-Identifier: MIT

// src/large_object_loader.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "src/value.hpp"

namespace hcat_pipe {

/// Resolves large-object references in a record before conversion.
///
/// Implementations replace external BlobRef / ClobRef values with inline
/// content where they choose to materialize it, and leave the rest external.
/// Conversion then falls back to the reference text for anything left
/// external.
class ILargeObjectLoader {
public:
    virtual ~ILargeObjectLoader() = default;

    /// Materialize large objects of @p record in place.
    virtual std::expected<void, Error> LoadLargeObjects(SourceRecord& record) = 0;

    /// Release resources held for the session.
    virtual void Close() {}
};

/// Loader that leaves every reference external.
class NoOpLargeObjectLoader : public ILargeObjectLoader {
public:
    std::expected<void, Error> LoadLargeObjects(SourceRecord&) override { return {}; }
};

/// Loader backed by in-memory large-object files.
///
/// Objects up to @c max_inline_size bytes are materialized from the named
/// file's byte range; larger ones stay external.  A reference to an unknown
/// file or a range past its end fails with LargeObjectUnavailable.
class InMemoryLargeObjectLoader : public ILargeObjectLoader {
public:
    explicit InMemoryLargeObjectLoader(int64_t max_inline_size = 16 * 1024 * 1024)
        : max_inline_size_(max_inline_size) {}

    /// Register the content of a large-object file.
    void AddFile(std::string name, std::string content) {
        files_.insert_or_assign(std::move(name), std::move(content));
    }

    std::expected<void, Error> LoadLargeObjects(SourceRecord& record) override {
        for (auto& [name, value] : record) {
            if (auto* blob = std::get_if<BlobRef>(&value); blob && blob->IsExternal()) {
                auto content = Read(blob->external());
                if (!content) return std::unexpected(content.error());
                if (*content) *blob = BlobRef::Inline(ToBytes(**content));
            } else if (auto* clob = std::get_if<ClobRef>(&value); clob && clob->IsExternal()) {
                auto content = Read(clob->external());
                if (!content) return std::unexpected(content.error());
                if (*content) *clob = ClobRef::Inline(std::string(**content));
            }
        }
        return {};
    }

    void Close() override { files_.clear(); }

private:
    // nullopt: object exceeds the inline limit and stays external.
    std::expected<std::optional<std::string_view>, Error> Read(const ExternalLobRef& ref) const {
        if (ref.length > max_inline_size_) return std::optional<std::string_view>{};
        auto it = files_.find(ref.file);
        if (it == files_.end()) {
            return std::unexpected(Error{ErrorCode::LargeObjectUnavailable,
                fmt::format("Large object file '{}' not found", ref.file)});
        }
        const std::string& data = it->second;
        if (ref.offset < 0 || ref.length < 0 ||
            static_cast<uint64_t>(ref.offset) + static_cast<uint64_t>(ref.length) > data.size()) {
            return std::unexpected(Error{ErrorCode::LargeObjectUnavailable,
                fmt::format("Range [{}, +{}) is outside large object file '{}' ({} bytes)",
                            ref.offset, ref.length, ref.file, data.size())});
        }
        return std::optional<std::string_view>{std::string_view(data).substr(
            static_cast<size_t>(ref.offset), static_cast<size_t>(ref.length))};
    }

    int64_t max_inline_size_;
    std::unordered_map<std::string, std::string> files_;
};

}  // namespace hcat_pipe
