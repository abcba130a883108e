/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_key_range.h"

#include <algorithm>

namespace r2n::arsc {
static std::size_t primary_entry_count(const TypeGroup& group) {
    return group.empty() ? 0 : static_cast<std::size_t>(group.front().header.entry_count);
}

KeyRangeResult key_range(const Package& package, std::uint32_t type_id) {
    KeyRangeResult out{};
    if (type_id < 1) {
        out.error = ResolveError{
            ResolveErrorKind::InvalidType,
            "Minimum ID of type is 1, " + std::to_string(type_id) + " given"
        };
        return out;
    }
    if (type_id > package.types.size() || package.types[type_id - 1].empty()) {
        out.error = ResolveError{
            ResolveErrorKind::TypeNotFound,
            "No type-spec record for type " + std::to_string(type_id) + " (package has "
                + std::to_string(package.types.size()) + " type groups)"
        };
        return out;
    }

    std::size_t first = 0;
    for (std::uint32_t i = 0; i + 1 < type_id; i++) {
        first += primary_entry_count(package.types[i]);
    }
    out.range.first = first;
    out.range.last = first + primary_entry_count(package.types[type_id - 1]);
    return out;
}

DecodedString key_name(const Package& package, const KeyRange& range, std::uint32_t entry_id) {
    const auto& pool = package.key_strings;
    const std::size_t slice_end = std::min(range.last, pool.size());
    const std::size_t slice_size = slice_end > range.first ? slice_end - range.first : 0;
    if (entry_id >= slice_size) {
        DecodedString out{};
        out.error = ResolveError{
            ResolveErrorKind::KeyIndexOutOfRange,
            "Entry " + std::to_string(entry_id) + " outside key range ["
                + std::to_string(range.first) + ", " + std::to_string(range.last)
                + ") of a pool with " + std::to_string(pool.size()) + " keys"
        };
        return out;
    }
    return pool.decode(range.first + entry_id);
}

TypeKeys type_keys(const Package& package, std::uint32_t type_id) {
    TypeKeys out{};
    const auto range = key_range(package, type_id);
    if (!range.ok()) {
        out.error = range.error;
        return out;
    }

    const std::size_t slice_end = std::min(range.range.last, package.key_strings.size());
    for (std::size_t idx = range.range.first; idx < slice_end; idx++) {
        const auto entry_id = static_cast<std::uint32_t>(idx - range.range.first);
        auto decoded = package.key_strings.decode(idx);
        if (!decoded.ok()) {
            out.keys.clear();
            out.error = std::move(decoded.error);
            return out;
        }
        out.keys.emplace(entry_id, std::move(decoded.text));
    }
    return out;
}
}  // namespace r2n::arsc
