/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc_resolve_error.h"
#include "arsc_table.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace r2n::arsc {
struct TypeNameTable {
    // Type id (1-based) -> name.
    std::map<std::uint32_t, std::string> names;
    std::optional<ResolveError> error;

    bool ok() const { return !error.has_value(); }
};

TypeNameTable build_type_table(const Package& package);
}  // namespace r2n::arsc
