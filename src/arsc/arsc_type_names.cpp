/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_type_names.h"

namespace r2n::arsc {
TypeNameTable build_type_table(const Package& package) {
    TypeNameTable out{};
    const auto& pool = package.type_strings;
    for (std::size_t i = 0; i < pool.size(); i++) {
        auto decoded = pool.decode(i);
        if (!decoded.ok()) {
            out.error = std::move(decoded.error);
            out.error->message = "Type name #" + std::to_string(i + 1) + ": " + out.error->message;
            out.names.clear();
            return out;
        }
        out.names.emplace(static_cast<std::uint32_t>(i + 1), std::move(decoded.text));
    }
    return out;
}
}  // namespace r2n::arsc
