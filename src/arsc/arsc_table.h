/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc_chunk.h"
#include "arsc_string_pool.h"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace r2n::arsc {
struct TableHeader {
    ChunkHeader chunk{};
    std::uint32_t package_count = 0;
};

struct PackageHeader {
    ChunkHeader chunk{};
    std::uint32_t id = 0;
    // char16_t[128], NUL padded.
    std::array<std::uint8_t, 256> name{};
    std::uint32_t type_strings = 0;
    std::uint32_t last_public_type = 0;
    std::uint32_t key_strings = 0;
    std::uint32_t last_public_key = 0;
    std::uint32_t type_id_offset = 0;
};

constexpr std::size_t kPackageHeaderMinSize = 284;
constexpr std::size_t kPackageHeaderSize = 288;

// Shared layout of RES_TABLE_TYPE_SPEC_TYPE and RES_TABLE_TYPE_TYPE headers.
struct TypeRecordHeader {
    ChunkHeader chunk{};
    std::uint8_t id = 0;
    std::uint8_t flags = 0;
    std::uint16_t reserved = 0;
    std::uint32_t entry_count = 0;
    // RES_TABLE_TYPE_TYPE only.
    std::uint32_t entries_start = 0;
};

struct TypeRecord {
    TypeRecordHeader header{};

    bool is_spec() const { return header.chunk.type == RES_TABLE_TYPE_SPEC_TYPE; }
};

// One type-spec record followed by the type records of its configurations.
using TypeGroup = std::vector<TypeRecord>;

struct Package {
    PackageHeader header{};
    StringPool type_strings;
    StringPool key_strings;
    std::vector<TypeGroup> types;
};

struct ResTable {
    TableHeader header{};
    StringPool value_strings;
    std::vector<Package> packages;
};

ResTable parse_arsc(std::span<const std::uint8_t> bytes, bool debug = false);
Package parse_package(std::span<const std::uint8_t> chunk, bool debug = false);
}  // namespace r2n::arsc
