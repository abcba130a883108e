/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include <cstdint>
#include <string>

namespace r2n::arsc {
// Lowercase "0x"-prefixed hex, zero padded to `digits`; higher bits are dropped.
inline std::string to_hex(std::uint32_t v, int digits) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out = "0x";
    for (int i = digits - 1; i >= 0; i--) {
        out.push_back(hexdig[(v >> (4 * i)) & 0xFu]);
    }
    return out;
}
}  // namespace r2n::arsc
