/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_name_resolver.h"

#include "arsc/arsc_hex.h"
#include "arsc/arsc_key_range.h"
#include "arsc/arsc_res_id.h"
#include "arsc/arsc_string_decoder.h"
#include "arsc/arsc_type_names.h"

namespace r2n::arsc {
static ResolveResult fail(ResolveError err) {
    ResolveResult out{};
    out.error = std::move(err);
    return out;
}

const Package* find_package(const ResTable& table, std::uint32_t package_id) {
    for (const auto& pkg : table.packages) {
        if (pkg.header.id == package_id) {
            return &pkg;
        }
    }
    return nullptr;
}

ResolveResult resolve(
    const ResTable& table,
    std::uint32_t package_id,
    std::uint32_t type_id,
    std::uint32_t entry_id,
    const ResolveOptions& opt
) {
    if (opt.strict_ids && (package_id == 0 || type_id == 0)) {
        return fail(
            {ResolveErrorKind::MalformedIdentifier,
             "Reserved id component: package " + to_hex(package_id, 2) + ", type "
                 + to_hex(type_id, 2)}
        );
    }

    const Package* pkg = find_package(table, package_id);
    if (!pkg) {
        return fail(
            {ResolveErrorKind::PackageNotFound,
             "Package with ID " + to_hex(package_id, 2) + " not found"}
        );
    }

    auto types = build_type_table(*pkg);
    if (!types.ok()) {
        return fail(std::move(*types.error));
    }
    auto type_it = types.names.find(type_id);
    if (type_it == types.names.end()) {
        return fail(
            {ResolveErrorKind::TypeNotFound,
             "Type " + to_hex(type_id, 2) + " not found in package " + to_hex(package_id, 2)
                 + " (" + std::to_string(types.names.size()) + " types)"}
        );
    }

    const auto range = key_range(*pkg, type_id);
    if (!range.ok()) {
        return fail(*range.error);
    }
    auto key = key_name(*pkg, range.range, entry_id);
    if (!key.ok()) {
        return fail(std::move(*key.error));
    }

    auto pkg_name = decode_utf16_field(pkg->header.name);
    if (!pkg_name.ok()) {
        pkg_name.error->message = "Package name: " + pkg_name.error->message;
        return fail(std::move(*pkg_name.error));
    }

    ResolveResult out{};
    out.name.package = std::move(pkg_name.text);
    out.name.type = std::move(type_it->second);
    out.name.key = std::move(key.text);
    return out;
}

ResolveResult resolve(const ResTable& table, std::uint32_t resource_id, const ResolveOptions& opt) {
    const ResId rid = decompose(resource_id);
    return resolve(table, rid.package_id, rid.type_id, rid.entry_id, opt);
}

PackageNames package_names(const ResTable& table) {
    PackageNames out{};
    for (const auto& pkg : table.packages) {
        auto name = decode_utf16_field(pkg.header.name);
        if (!name.ok()) {
            out.names.clear();
            out.error = std::move(name.error);
            out.error->message =
                "Package " + to_hex(pkg.header.id, 2) + " name: " + out.error->message;
            return out;
        }
        out.names[pkg.header.id] = std::move(name.text);
    }
    return out;
}
}  // namespace r2n::arsc
