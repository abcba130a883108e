/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_chunk.h"

#include <stdexcept>
#include <string>

namespace r2n::arsc {
static void require_bytes(std::span<const std::uint8_t> s, std::size_t off, std::size_t n) {
    if (off > s.size() || n > s.size() - off) {
        throw std::runtime_error(
            std::string("Read of ") + std::to_string(n) + " bytes at offset "
            + std::to_string(off) + " out of bounds (size " + std::to_string(s.size()) + ")"
        );
    }
}

std::uint8_t read_u8(std::span<const std::uint8_t> s, std::size_t off) {
    require_bytes(s, off, 1);
    return s[off];
}

std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off) {
    require_bytes(s, off, 2);
    return static_cast<std::uint16_t>(
        static_cast<std::uint16_t>(s[off]) | (static_cast<std::uint16_t>(s[off + 1]) << 8)
    );
}

std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    require_bytes(s, off, 4);
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

ChunkHeader read_chunk_header(std::span<const std::uint8_t> s, std::size_t off) {
    require_bytes(s, off, kChunkHeaderSize);

    ChunkHeader hdr{};
    hdr.type = read_u16_le(s, off);
    hdr.header_size = read_u16_le(s, off + 2);
    hdr.size = read_u32_le(s, off + 4);

    if (hdr.header_size < kChunkHeaderSize) {
        throw std::runtime_error(
            std::string("Chunk type ") + std::to_string(hdr.type) + " header too small at offset "
            + std::to_string(off)
        );
    }
    if (hdr.size < hdr.header_size) {
        throw std::runtime_error(
            std::string("Chunk size smaller than its header at offset ") + std::to_string(off)
        );
    }
    if (hdr.size > s.size() - off) {
        throw std::runtime_error(
            std::string("Chunk at offset ") + std::to_string(off) + " overruns its parent ("
            + std::to_string(hdr.size) + " > " + std::to_string(s.size() - off) + ")"
        );
    }
    return hdr;
}

std::span<const std::uint8_t> chunk_span(std::span<const std::uint8_t> s, std::size_t off) {
    const ChunkHeader hdr = read_chunk_header(s, off);
    return s.subspan(off, hdr.size);
}
}  // namespace r2n::arsc
