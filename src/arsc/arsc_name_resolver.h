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
struct ResourceName {
    std::string package;
    std::string type;
    std::string key;

    bool operator==(const ResourceName&) const = default;
};

struct ResolveOptions {
    // Reject package id 0 and type id 0 up front as MalformedIdentifier.
    bool strict_ids = false;
};

struct ResolveResult {
    ResourceName name;
    std::optional<ResolveError> error;

    bool ok() const { return !error.has_value(); }
};

const Package* find_package(const ResTable& table, std::uint32_t package_id);

/**
 * Resolves (package id, type id, entry id) against a decoded table.
 *
 * Only reads from `table`; concurrent calls on the same table are safe. The first failing
 * step is reported and no partial name is returned.
 */
ResolveResult resolve(
    const ResTable& table,
    std::uint32_t package_id,
    std::uint32_t type_id,
    std::uint32_t entry_id,
    const ResolveOptions& opt = {}
);
ResolveResult
resolve(const ResTable& table, std::uint32_t resource_id, const ResolveOptions& opt = {});

struct PackageNames {
    std::map<std::uint32_t, std::string> names;
    std::optional<ResolveError> error;

    bool ok() const { return !error.has_value(); }
};

PackageNames package_names(const ResTable& table);
}  // namespace r2n::arsc
