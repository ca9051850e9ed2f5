// SPDX-License-Identifier: MIT

// src/large_object.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace hcat_pipe {

using ByteVector = std::vector<std::byte>;

/// Copy the bytes of @p s (UTF-8 stays UTF-8).
inline ByteVector ToBytes(std::string_view s) {
    ByteVector out(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) out[i] = static_cast<std::byte>(s[i]);
    return out;
}

/// Location of large-object content that was not materialized inline: a
/// byte range inside a large-object file.
struct ExternalLobRef {
    std::string file;    ///< File name, relative to the large-object directory.
    int64_t offset = 0;  ///< Byte offset of the record inside the file.
    int64_t length = 0;  ///< Length of the payload in bytes (or chars).

    /// "externalLob(lf,<file>,<offset>,<length>)"
    std::string ToString() const {
        return fmt::format("externalLob(lf,{},{},{})", file, offset, length);
    }

    bool operator==(const ExternalLobRef&) const = default;
};

/// Large object whose content is either held inline or left external.
///
/// @tparam Data  ByteVector for binary objects, std::string for character
///               objects.
template <typename Data>
class LargeObjectRef {
public:
    using DataType = Data;

    /// Content materialized in memory.
    static LargeObjectRef Inline(Data data) {
        return LargeObjectRef(std::in_place_index<0>, std::move(data));
    }

    /// Content left in external storage.
    static LargeObjectRef External(ExternalLobRef ref) {
        return LargeObjectRef(std::in_place_index<1>, std::move(ref));
    }

    bool IsExternal() const { return content_.index() == 1; }

    /// Inline payload.  Only valid when !IsExternal().
    const Data& data() const { return std::get<0>(content_); }

    /// External reference.  Only valid when IsExternal().
    const ExternalLobRef& external() const { return std::get<1>(content_); }

    /// Textual form of the external reference, or a size summary for inline
    /// content.
    std::string ToString() const {
        if (IsExternal()) return external().ToString();
        return fmt::format("inlineLob({} bytes)", data().size());
    }

    bool operator==(const LargeObjectRef&) const = default;

private:
    template <std::size_t I, typename T>
    LargeObjectRef(std::in_place_index_t<I> tag, T&& value)
        : content_(tag, std::forward<T>(value)) {}

    std::variant<Data, ExternalLobRef> content_;
};

using BlobRef = LargeObjectRef<ByteVector>;   ///< Large binary object.
using ClobRef = LargeObjectRef<std::string>;  ///< Large character object.

}  // namespace hcat_pipe
