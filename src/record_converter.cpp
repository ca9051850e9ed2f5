// SPDX-License-Identifier: MIT

// src/record_converter.cpp
#include "src/record_converter.hpp"

#include <string>
#include <utility>

namespace hcat_pipe {

std::expected<ConvertedRecord, Error> RecordConverter::Convert(const SourceRecord& source) const {
    ConvertedRecord result;
    result.reserve(source.size());

    for (const auto& [name, value] : source) {
        std::string key = ToLowerAscii(name);
        auto field = schema_->Lookup(key);
        if (!field) return std::unexpected(field.error());

        auto converted = coercer_.CoerceField(name, value, **field);
        if (!converted) return std::unexpected(converted.error());

        result.insert_or_assign(std::move(key), std::move(*converted));
    }
    return result;
}

}  // namespace hcat_pipe
