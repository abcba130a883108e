/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_string_pool.h"

#include "utils/log.h"

#include <stdexcept>
#include <string>

namespace r2n::arsc {
DecodedString StringPool::decode(std::size_t index) const {
    if (index >= strings.size()) {
        DecodedString out{};
        out.error = ResolveError{
            ResolveErrorKind::KeyIndexOutOfRange,
            "String index " + std::to_string(index) + " out of range (pool has "
                + std::to_string(strings.size()) + " entries)"
        };
        return out;
    }
    return decode_pooled_string(strings[index], encoding());
}

StringPool parse_string_pool(std::span<const std::uint8_t> chunk, bool debug) {
    StringPool pool{};
    auto& hdr = pool.header;
    hdr.chunk = read_chunk_header(chunk, 0);
    if (hdr.chunk.type != RES_STRING_POOL_TYPE) {
        throw std::runtime_error(
            std::string("Expected string pool chunk, got type ") + std::to_string(hdr.chunk.type)
        );
    }
    if (hdr.chunk.header_size < kStringPoolHeaderSize) {
        throw std::runtime_error(std::string("String pool header too small"));
    }

    hdr.string_count = read_u32_le(chunk, 8);
    hdr.style_count = read_u32_le(chunk, 12);
    hdr.flags = read_u32_le(chunk, 16);
    hdr.strings_start = read_u32_le(chunk, 20);
    hdr.styles_start = read_u32_le(chunk, 24);

    const std::size_t chunk_size = hdr.chunk.size;
    const std::size_t offsets_pos = hdr.chunk.header_size;
    if (hdr.string_count > (chunk_size - offsets_pos) / 4) {
        throw std::runtime_error(
            "String pool declares " + std::to_string(hdr.string_count)
            + " strings, more than its offset table can hold"
        );
    }
    if (hdr.string_count == 0) {
        return pool;
    }
    if (hdr.strings_start < offsets_pos + 4ull * hdr.string_count
        || hdr.strings_start >= chunk_size) {
        throw std::runtime_error(
            "String pool stringsStart out of range: " + std::to_string(hdr.strings_start)
        );
    }

    // String data ends where styles begin, or at the end of the chunk.
    std::size_t strings_end = chunk_size;
    if (hdr.style_count != 0 && hdr.styles_start > hdr.strings_start
        && hdr.styles_start <= chunk_size) {
        strings_end = hdr.styles_start;
    }
    const auto data = chunk.subspan(hdr.strings_start, strings_end - hdr.strings_start);
    const StringEncoding encoding = pool.encoding();

    pool.strings.reserve(hdr.string_count);
    int truncated = 0;
    for (std::uint32_t i = 0; i < hdr.string_count; i++) {
        const std::uint32_t off = read_u32_le(chunk, offsets_pos + 4u * i);
        if (off >= data.size()) {
            throw std::runtime_error(
                "String #" + std::to_string(i) + " offset " + std::to_string(off)
                + " outside string data (" + std::to_string(data.size()) + " bytes)"
            );
        }
        const auto rest = data.subspan(off);
        std::size_t extent = rest.size();
        const auto env = read_entry_envelope(rest, encoding);
        if (env.has_value() && env->total_size() <= rest.size()) {
            extent = env->total_size();
        } else {
            // Kept as-is; decoding this entry reports the overrun.
            truncated++;
        }
        pool.strings.emplace_back(rest.begin(), rest.begin() + static_cast<std::ptrdiff_t>(extent));
    }

    if (debug) {
        R2N_LOG_INFO(
            "String pool: strings=%u styles=%u flags=0x%X utf8=%d truncated=%d",
            hdr.string_count, hdr.style_count, hdr.flags,
            encoding == StringEncoding::Utf8 ? 1 : 0, truncated
        );
    }
    return pool;
}
}  // namespace r2n::arsc
