/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_table.h"

#include "arsc/arsc_hex.h"
#include "utils/log.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace r2n::arsc {
namespace {
constexpr std::size_t kTableHeaderSize = 12;
constexpr std::size_t kTypeSpecHeaderSize = 16;
constexpr std::size_t kTypeHeaderMinSize = 20;

TypeRecordHeader read_type_record_header(std::span<const std::uint8_t> chunk) {
    TypeRecordHeader hdr{};
    hdr.chunk = read_chunk_header(chunk, 0);
    const bool spec = hdr.chunk.type == RES_TABLE_TYPE_SPEC_TYPE;
    const std::size_t min_size = spec ? kTypeSpecHeaderSize : kTypeHeaderMinSize;
    if (hdr.chunk.header_size < min_size) {
        throw std::runtime_error(
            std::string(spec ? "RES_TABLE_TYPE_SPEC_TYPE" : "RES_TABLE_TYPE_TYPE") + " too small"
        );
    }
    hdr.id = read_u8(chunk, 8);
    hdr.flags = read_u8(chunk, 9);
    hdr.reserved = read_u16_le(chunk, 10);
    hdr.entry_count = read_u32_le(chunk, 12);
    if (!spec) {
        hdr.entries_start = read_u32_le(chunk, 16);
    }
    if (hdr.id == 0) {
        throw std::runtime_error(std::string("Type record has invalid ID 0"));
    }
    return hdr;
}
}  // namespace

Package parse_package(std::span<const std::uint8_t> chunk, bool debug) {
    Package pkg{};
    auto& hdr = pkg.header;
    hdr.chunk = read_chunk_header(chunk, 0);
    if (hdr.chunk.type != RES_TABLE_PACKAGE_TYPE) {
        throw std::runtime_error(
            std::string("Expected package chunk, got type ") + std::to_string(hdr.chunk.type)
        );
    }
    // typeIdOffset was added later; older tables stop before it.
    if (hdr.chunk.header_size < kPackageHeaderMinSize) {
        throw std::runtime_error(std::string("RES_TABLE_PACKAGE_TYPE too small"));
    }

    hdr.id = read_u32_le(chunk, 8);
    std::copy_n(chunk.begin() + 12, hdr.name.size(), hdr.name.begin());
    hdr.type_strings = read_u32_le(chunk, 268);
    hdr.last_public_type = read_u32_le(chunk, 272);
    hdr.key_strings = read_u32_le(chunk, 276);
    hdr.last_public_key = read_u32_le(chunk, 280);
    if (hdr.chunk.header_size >= kPackageHeaderSize) {
        hdr.type_id_offset = read_u32_le(chunk, 284);
    }

    bool have_type_strings = false;
    bool have_key_strings = false;
    std::size_t pos = hdr.chunk.header_size;
    while (pos + kChunkHeaderSize <= hdr.chunk.size) {
        const auto child = chunk_span(chunk, pos);
        const ChunkHeader child_hdr = read_chunk_header(child, 0);

        switch (child_hdr.type) {
            case RES_STRING_POOL_TYPE: {
                // Matched by the header offsets; unmatched pools fill the empty slots in order.
                if (pos == hdr.type_strings && !have_type_strings) {
                    pkg.type_strings = parse_string_pool(child, debug);
                    have_type_strings = true;
                } else if (pos == hdr.key_strings && !have_key_strings) {
                    pkg.key_strings = parse_string_pool(child, debug);
                    have_key_strings = true;
                } else if (!have_type_strings) {
                    pkg.type_strings = parse_string_pool(child, debug);
                    have_type_strings = true;
                } else if (!have_key_strings) {
                    pkg.key_strings = parse_string_pool(child, debug);
                    have_key_strings = true;
                } else {
                    R2N_LOG_WARN(
                        "Extra string pool in package %s ignored", to_hex(hdr.id, 2).c_str()
                    );
                }
            } break;

            case RES_TABLE_TYPE_SPEC_TYPE: {
                TypeRecord rec{};
                rec.header = read_type_record_header(child);
                pkg.types.push_back(TypeGroup{rec});
            } break;

            case RES_TABLE_TYPE_TYPE: {
                TypeRecord rec{};
                rec.header = read_type_record_header(child);
                if (pkg.types.empty() || pkg.types.back().front().header.id != rec.header.id) {
                    throw std::runtime_error(
                        "RES_TABLE_TYPE_TYPE with ID " + to_hex(rec.header.id, 2)
                        + " found without preceding RES_TABLE_TYPE_SPEC_TYPE"
                    );
                }
                pkg.types.back().push_back(rec);
            } break;

            default:
                if (debug) {
                    R2N_LOG_INFO(
                        "Package %s: skipping chunk type 0x%04X (%u bytes)",
                        to_hex(hdr.id, 2).c_str(), static_cast<unsigned>(child_hdr.type),
                        child_hdr.size
                    );
                }
                break;
        }
        pos += child_hdr.size;
    }

    if (!have_type_strings || !have_key_strings) {
        throw std::runtime_error(
            "Package " + to_hex(hdr.id, 2) + " is missing its "
            + (have_type_strings ? "key" : "type") + " string pool"
        );
    }

    if (debug) {
        R2N_LOG_INFO(
            "Package %s: types=%zu typeStrings=%zu keyStrings=%zu", to_hex(hdr.id, 2).c_str(),
            pkg.types.size(), pkg.type_strings.size(), pkg.key_strings.size()
        );
    }
    return pkg;
}

ResTable parse_arsc(std::span<const std::uint8_t> bytes, bool debug) {
    if (bytes.size() < kTableHeaderSize) {
        throw std::runtime_error(std::string("Resource table too small for header"));
    }

    ResTable table{};
    table.header.chunk = read_chunk_header(bytes, 0);
    if (table.header.chunk.type != RES_TABLE_TYPE) {
        throw std::runtime_error(std::string("Not a resource table (bad chunk type)"));
    }
    if (table.header.chunk.header_size < kTableHeaderSize) {
        throw std::runtime_error(std::string("RES_TABLE_TYPE header too small"));
    }
    table.header.package_count = read_u32_le(bytes, 8);

    const auto body = bytes.first(table.header.chunk.size);
    bool have_value_strings = false;
    std::size_t pos = table.header.chunk.header_size;
    while (pos + kChunkHeaderSize <= body.size()) {
        const auto child = chunk_span(body, pos);
        const ChunkHeader child_hdr = read_chunk_header(child, 0);

        if (child_hdr.type == RES_STRING_POOL_TYPE && !have_value_strings) {
            table.value_strings = parse_string_pool(child, debug);
            have_value_strings = true;
        } else if (child_hdr.type == RES_TABLE_PACKAGE_TYPE) {
            table.packages.push_back(parse_package(child, debug));
        } else if (debug) {
            R2N_LOG_INFO(
                "Skipping top-level chunk type 0x%04X at offset %zu",
                static_cast<unsigned>(child_hdr.type), pos
            );
        }
        pos += child_hdr.size;
    }

    if (table.packages.size() != table.header.package_count) {
        R2N_LOG_WARN(
            "Resource table declares %u packages, found %zu", table.header.package_count,
            table.packages.size()
        );
    }
    return table;
}
}  // namespace r2n::arsc
