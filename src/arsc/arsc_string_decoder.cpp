/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_string_decoder.h"

namespace r2n::arsc {
namespace {
DecodedString fail(std::string message) {
    DecodedString out{};
    out.error = ResolveError{ResolveErrorKind::StringDecodeError, std::move(message)};
    return out;
}

std::uint16_t unit_at(std::span<const std::uint8_t> s, std::size_t unit) {
    return static_cast<std::uint16_t>(
        s[unit * 2] | (static_cast<std::uint16_t>(s[unit * 2 + 1]) << 8)
    );
}

// Returns the number of bytes consumed, or 0 if the field is truncated.
std::size_t read_length_u8(std::span<const std::uint8_t> s, std::size_t off, std::size_t& len) {
    if (off >= s.size()) {
        return 0;
    }
    len = s[off];
    if ((len & 0x80u) == 0) {
        return 1;
    }
    if (off + 1 >= s.size()) {
        return 0;
    }
    len = ((len & 0x7Fu) << 8) | s[off + 1];
    return 2;
}

std::size_t read_length_u16(std::span<const std::uint8_t> s, std::size_t& len) {
    if (s.size() < 2) {
        return 0;
    }
    len = unit_at(s, 0);
    if ((len & 0x8000u) == 0) {
        return 2;
    }
    if (s.size() < 4) {
        return 0;
    }
    len = ((len & 0x7FFFu) << 16) | unit_at(s, 1);
    return 4;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Strict validation: no overlong forms, no surrogates, nothing above U+10FFFF.
bool validate_utf8(std::span<const std::uint8_t> s, std::size_t& bad_offset) {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::uint8_t b = s[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if (b < 0x80) {
            i++;
            continue;
        } else if ((b & 0xE0) == 0xC0) {
            extra = 1;
            cp = b & 0x1F;
            min_cp = 0x80;
        } else if ((b & 0xF0) == 0xE0) {
            extra = 2;
            cp = b & 0x0F;
            min_cp = 0x800;
        } else if ((b & 0xF8) == 0xF0) {
            extra = 3;
            cp = b & 0x07;
            min_cp = 0x10000;
        } else {
            bad_offset = i;
            return false;
        }
        if (i + extra >= s.size()) {
            bad_offset = i;
            return false;
        }
        for (std::size_t k = 1; k <= extra; k++) {
            const std::uint8_t c = s[i + k];
            if ((c & 0xC0) != 0x80) {
                bad_offset = i;
                return false;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            bad_offset = i;
            return false;
        }
        i += extra + 1;
    }
    return true;
}

bool utf16le_to_utf8(std::span<const std::uint8_t> s, std::string& out, std::size_t& bad_offset) {
    const std::size_t units = s.size() / 2;
    out.reserve(units);
    std::size_t u = 0;
    while (u < units) {
        const std::uint32_t c = unit_at(s, u);
        if (c >= 0xD800 && c <= 0xDBFF) {
            if (u + 1 >= units) {
                bad_offset = u * 2;
                return false;
            }
            const std::uint32_t lo = unit_at(s, u + 1);
            if (lo < 0xDC00 || lo > 0xDFFF) {
                bad_offset = u * 2;
                return false;
            }
            append_utf8(out, 0x10000 + ((c - 0xD800) << 10) + (lo - 0xDC00));
            u += 2;
            continue;
        }
        if (c >= 0xDC00 && c <= 0xDFFF) {
            bad_offset = u * 2;
            return false;
        }
        append_utf8(out, c);
        u++;
    }
    return true;
}

std::string trim_nuls(std::string s) {
    const auto first = s.find_first_not_of('\0');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of('\0');
    return s.substr(first, last - first + 1);
}
}  // namespace

std::optional<EntryEnvelope>
read_entry_envelope(std::span<const std::uint8_t> data, StringEncoding encoding) {
    EntryEnvelope env{};
    if (encoding == StringEncoding::Utf8) {
        std::size_t char_len = 0;
        std::size_t byte_len = 0;
        const std::size_t n0 = read_length_u8(data, 0, char_len);
        if (n0 == 0) {
            return std::nullopt;
        }
        const std::size_t n1 = read_length_u8(data, n0, byte_len);
        if (n1 == 0) {
            return std::nullopt;
        }
        env.prefix_size = n0 + n1;
        env.payload_size = byte_len;
        env.terminator_size = 1;
        return env;
    }

    std::size_t unit_len = 0;
    const std::size_t n = read_length_u16(data, unit_len);
    if (n == 0) {
        return std::nullopt;
    }
    env.prefix_size = n;
    env.payload_size = unit_len * 2;
    env.terminator_size = 2;
    return env;
}

DecodedString decode_pooled_string(std::span<const std::uint8_t> raw, StringEncoding encoding) {
    const auto env = read_entry_envelope(raw, encoding);
    if (!env.has_value()) {
        return fail(
            "String entry too short for its length prefix (" + std::to_string(raw.size())
            + " bytes)"
        );
    }
    if (raw.size() < env->total_size()) {
        return fail(
            "String entry declares " + std::to_string(env->payload_size)
            + " payload bytes but only " + std::to_string(raw.size()) + " bytes are present"
        );
    }
    for (std::size_t i = 0; i < env->terminator_size; i++) {
        if (raw[env->prefix_size + env->payload_size + i] != 0) {
            return fail(std::string("String entry is not NUL-terminated"));
        }
    }

    const auto payload = raw.subspan(env->prefix_size, env->payload_size);
    std::size_t bad = 0;
    if (encoding == StringEncoding::Utf8) {
        if (!validate_utf8(payload, bad)) {
            return fail("Invalid UTF-8 at payload offset " + std::to_string(bad));
        }
        DecodedString out{};
        out.text = trim_nuls(
            std::string(reinterpret_cast<const char*>(payload.data()), payload.size())
        );
        return out;
    }

    std::string text;
    if (!utf16le_to_utf8(payload, text, bad)) {
        return fail("Invalid UTF-16 at payload offset " + std::to_string(bad));
    }
    DecodedString out{};
    out.text = trim_nuls(std::move(text));
    return out;
}

DecodedString decode_utf16_field(std::span<const std::uint8_t> field) {
    const std::size_t units = field.size() / 2;
    std::size_t end = units;
    for (std::size_t u = 0; u < units; u++) {
        if (unit_at(field, u) == 0) {
            end = u;
            break;
        }
    }
    if (end == units) {
        return fail(std::string("UTF-16 field has no NUL terminator"));
    }

    std::string text;
    std::size_t bad = 0;
    if (!utf16le_to_utf8(field.first(end * 2), text, bad)) {
        return fail("Invalid UTF-16 at field offset " + std::to_string(bad));
    }
    DecodedString out{};
    out.text = std::move(text);
    return out;
}
}  // namespace r2n::arsc
