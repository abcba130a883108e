/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc/arsc_name_resolver.h"
#include "arsc/arsc_table.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace r2n::arsc {

enum class OutputFormat { Fqdn, XmlId, Json };

struct LoadOptions {
    bool debug = false;
};

std::optional<OutputFormat> parse_output_format(std::string_view name);

// Integer literal with optional 0x/0o/0b prefix; empty if malformed or wider than 32 bits.
std::optional<std::uint32_t> parse_resource_id(std::string_view text);

class ArscResolver {
   public:
    static ResTable LoadTableFile(const std::filesystem::path& path, const LoadOptions& opt = {});
    static ResTable LoadTableBytes(
        std::span<const std::uint8_t> bytes,
        const LoadOptions& opt = {},
        std::string_view label = {}
    );

    static std::string FormatName(const ResourceName& name, OutputFormat format);

    // Packages, their types and every key in each type's key range.
    static nlohmann::ordered_json DescribeTable(const ResTable& table);
};

}  // namespace r2n::arsc
