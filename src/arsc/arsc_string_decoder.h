/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc_resolve_error.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace r2n::arsc {
enum class StringEncoding { Utf8, Utf16 };

/**
 * Layout of one string pool entry.
 *
 * UTF-8 entries: UTF-16 length (1-2 bytes), UTF-8 byte length (1-2 bytes), payload, 0x00.
 * UTF-16 entries: length in code units (1-2 units), payload, 0x0000.
 * A length field takes its second unit when the high bit of the first is set.
 */
struct EntryEnvelope {
    std::size_t prefix_size = 0;
    std::size_t payload_size = 0;
    std::size_t terminator_size = 0;

    std::size_t total_size() const { return prefix_size + payload_size + terminator_size; }
};

// Reads the length fields at the start of `data`. Empty if they are truncated.
std::optional<EntryEnvelope>
read_entry_envelope(std::span<const std::uint8_t> data, StringEncoding encoding);

struct DecodedString {
    std::string text;
    std::optional<ResolveError> error;

    bool ok() const { return !error.has_value(); }
};

// Strips the envelope of a raw pool entry using its declared length and converts the payload to
// UTF-8. Leading and trailing NUL characters are trimmed.
DecodedString decode_pooled_string(std::span<const std::uint8_t> raw, StringEncoding encoding);

// Decodes a fixed-width UTF-16LE field up to its first NUL code unit (package header names).
DecodedString decode_utf16_field(std::span<const std::uint8_t> field);
}  // namespace r2n::arsc
