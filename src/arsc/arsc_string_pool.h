/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc_chunk.h"
#include "arsc_string_decoder.h"

#include <cstdint>
#include <span>
#include <vector>

namespace r2n::arsc {
struct StringPoolHeader {
    ChunkHeader chunk{};
    std::uint32_t string_count = 0;
    std::uint32_t style_count = 0;
    std::uint32_t flags = 0;
    std::uint32_t strings_start = 0;
    std::uint32_t styles_start = 0;

    static constexpr std::uint32_t SORTED_FLAG = 1u << 0;
    static constexpr std::uint32_t UTF8_FLAG = 1u << 8;
};

constexpr std::size_t kStringPoolHeaderSize = 28;

struct StringPool {
    StringPoolHeader header{};
    // Raw entries in pool order, each still wrapped in its length prefix and terminator.
    std::vector<std::vector<std::uint8_t>> strings;

    StringEncoding encoding() const {
        return (header.flags & StringPoolHeader::UTF8_FLAG) != 0 ? StringEncoding::Utf8
                                                                 : StringEncoding::Utf16;
    }
    std::size_t size() const { return strings.size(); }
    DecodedString decode(std::size_t index) const;
};

// `chunk` spans exactly one RES_STRING_POOL_TYPE chunk.
StringPool parse_string_pool(std::span<const std::uint8_t> chunk, bool debug = false);
}  // namespace r2n::arsc
