/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace r2n::arsc {
enum ChunkType : std::uint16_t {
    RES_NULL_TYPE = 0x0000,
    RES_STRING_POOL_TYPE = 0x0001,
    RES_TABLE_TYPE = 0x0002,
    RES_TABLE_PACKAGE_TYPE = 0x0200,
    RES_TABLE_TYPE_TYPE = 0x0201,
    RES_TABLE_TYPE_SPEC_TYPE = 0x0202,
    RES_TABLE_LIBRARY_TYPE = 0x0203,
};

constexpr std::size_t kChunkHeaderSize = 8;

struct ChunkHeader {
    std::uint16_t type = 0;
    std::uint16_t header_size = 0;
    std::uint32_t size = 0;
};

std::uint8_t read_u8(std::span<const std::uint8_t> s, std::size_t off);
std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off);
std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off);

// Throws if the header is inconsistent or the chunk does not fit in `s`.
ChunkHeader read_chunk_header(std::span<const std::uint8_t> s, std::size_t off);

// Returns the chunk starting at `off`, header included.
std::span<const std::uint8_t> chunk_span(std::span<const std::uint8_t> s, std::size_t off);
}  // namespace r2n::arsc
