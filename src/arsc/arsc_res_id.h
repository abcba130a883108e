/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include <cstdint>

namespace r2n::arsc {
// 0xPPTTEEEE: package id, 1-based type id, 0-based entry id.
struct ResId {
    std::uint8_t package_id = 0;
    std::uint8_t type_id = 0;
    std::uint16_t entry_id = 0;

    bool operator==(const ResId&) const = default;
};

constexpr ResId decompose(std::uint32_t id) {
    return ResId{
        static_cast<std::uint8_t>((id & 0xFF000000u) >> 24),
        static_cast<std::uint8_t>((id & 0x00FF0000u) >> 16),
        static_cast<std::uint16_t>(id & 0x0000FFFFu),
    };
}

constexpr std::uint32_t compose(const ResId& rid) {
    return (static_cast<std::uint32_t>(rid.package_id) << 24)
           | (static_cast<std::uint32_t>(rid.type_id) << 16)
           | static_cast<std::uint32_t>(rid.entry_id);
}

static_assert(compose(decompose(0x7f020001u)) == 0x7f020001u);
}  // namespace r2n::arsc
