/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc_resolve_error.h"
#include "arsc_string_decoder.h"
#include "arsc_table.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace r2n::arsc {
// Half-open slice [first, last) of a package's key-name pool.
struct KeyRange {
    std::size_t first = 0;
    std::size_t last = 0;

    std::size_t size() const { return last - first; }
};

struct KeyRangeResult {
    KeyRange range{};
    std::optional<ResolveError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * Computes the slice of the shared key-name pool owned by `type_id`.
 *
 * Keys are assumed to be laid out contiguously in type order: the slice starts at the sum of
 * the entry counts declared by the primary (type-spec) record of every preceding group and
 * spans the entry count of the type's own group.
 */
KeyRangeResult key_range(const Package& package, std::uint32_t type_id);

// Decodes the key at position `entry_id` within `range`. Positions past the end of the slice,
// or past the end of the pool, fail with KeyIndexOutOfRange.
DecodedString key_name(const Package& package, const KeyRange& range, std::uint32_t entry_id);

struct TypeKeys {
    // Entry id (0-based within the type) -> key name.
    std::map<std::uint32_t, std::string> keys;
    std::optional<ResolveError> error;

    bool ok() const { return !error.has_value(); }
};

// Every key of `type_id`, decoded.
TypeKeys type_keys(const Package& package, std::uint32_t type_id);
}  // namespace r2n::arsc
