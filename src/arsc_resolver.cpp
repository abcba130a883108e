/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc_resolver.h"

#include "arsc/arsc_hex.h"
#include "arsc/arsc_key_range.h"
#include "arsc/arsc_res_id.h"
#include "arsc/arsc_type_names.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <charconv>
#include <chrono>
#include <stdexcept>

namespace r2n::arsc {

static std::string trim_ascii(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) {
        b++;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r')) {
        e--;
    }
    return std::string(s.substr(b, e - b));
}

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "fqdn") {
        return OutputFormat::Fqdn;
    }
    if (name == "xmlid") {
        return OutputFormat::XmlId;
    }
    if (name == "json") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

std::optional<std::uint32_t> parse_resource_id(std::string_view text) {
    const std::string s = trim_ascii(text);
    if (s.empty()) {
        return std::nullopt;
    }

    int base = 10;
    std::size_t pos = 0;
    if (s.size() > 2 && s[0] == '0') {
        const char p = s[1];
        if (p == 'x' || p == 'X') {
            base = 16;
        } else if (p == 'o' || p == 'O') {
            base = 8;
        } else if (p == 'b' || p == 'B') {
            base = 2;
        }
        if (base != 10) {
            pos = 2;
        }
    }
    // Decimal literals other than 0 itself may not carry leading zeros.
    if (base == 10 && s.size() > 1 && s[0] == '0') {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const char* first = s.data() + pos;
    const char* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (ec != std::errc() || ptr != last || value > 0xFFFFFFFFull) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

ResTable ArscResolver::LoadTableFile(const std::filesystem::path& path, const LoadOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = r2n::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("Resource table file is empty: " + path.string());
    }
    const auto t1 = std::chrono::steady_clock::now();
    auto table = LoadTableBytes(bytes, opt, path.filename().string());
    if (opt.debug) {
        const auto read_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        R2N_LOG_INFO(
            "Read %s: bytes=%zu read=%lldms", path.string().c_str(), bytes.size(),
            static_cast<long long>(read_ms)
        );
    }
    return table;
}

ResTable ArscResolver::LoadTableBytes(
    std::span<const std::uint8_t> bytes,
    const LoadOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    ResTable table;
    try {
        table = parse_arsc(bytes, opt.debug);
    } catch (const std::exception& e) {
        if (label.empty()) {
            throw;
        }
        throw std::runtime_error(std::string(label) + ": " + e.what());
    }
    if (opt.debug) {
        const auto t1 = std::chrono::steady_clock::now();
        const auto parse_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        R2N_LOG_INFO(
            "Parsed %s: packages=%zu valueStrings=%zu parse=%lldms",
            label.empty() ? "<bytes>" : std::string(label).c_str(), table.packages.size(),
            table.value_strings.size(), static_cast<long long>(parse_ms)
        );
    }
    return table;
}

std::string ArscResolver::FormatName(const ResourceName& name, OutputFormat format) {
    switch (format) {
        case OutputFormat::Fqdn:
            return name.package + ".R." + name.type + "." + name.key;
        case OutputFormat::XmlId:
            return "@" + name.package + ":" + name.type + "/" + name.key;
        case OutputFormat::Json: {
            // ", " and ": " separators; non-ASCII characters are escaped.
            const auto quoted = [](const std::string& s) {
                return nlohmann::json(s).dump(-1, ' ', true);
            };
            return "{\"package\": " + quoted(name.package) + ", \"type\": " + quoted(name.type)
                   + ", \"key\": " + quoted(name.key) + "}";
        }
    }
    throw std::invalid_argument("Unknown output format");
}

static nlohmann::ordered_json describe_package(const Package& pkg, const std::string& name) {
    nlohmann::ordered_json p = nlohmann::ordered_json::object();
    p["id"] = to_hex(pkg.header.id, 2);
    p["name"] = name;

    const auto type_names = build_type_table(pkg);
    if (!type_names.ok()) {
        p["error"] = type_names.error->message;
        return p;
    }

    nlohmann::ordered_json types = nlohmann::ordered_json::array();
    for (std::size_t i = 0; i < pkg.types.size(); i++) {
        const auto type_id = static_cast<std::uint32_t>(i + 1);
        const auto& group = pkg.types[i];

        nlohmann::ordered_json t = nlohmann::ordered_json::object();
        t["id"] = type_id;
        const auto name_it = type_names.names.find(type_id);
        if (name_it != type_names.names.end()) {
            t["name"] = name_it->second;
        } else {
            t["name"] = nullptr;
        }
        t["entryCount"] = group.empty() ? 0u : group.front().header.entry_count;
        t["configCount"] = group.empty() ? 0u : static_cast<std::uint32_t>(group.size() - 1);

        const auto keys = type_keys(pkg, type_id);
        if (!keys.ok()) {
            t["error"] = std::string(to_string(keys.error->kind)) + ": " + keys.error->message;
        } else {
            nlohmann::ordered_json kj = nlohmann::ordered_json::object();
            for (const auto& [entry_id, key] : keys.keys) {
                const ResId rid{
                    static_cast<std::uint8_t>(pkg.header.id), static_cast<std::uint8_t>(type_id),
                    static_cast<std::uint16_t>(entry_id)
                };
                kj[to_hex(compose(rid), 8)] = key;
            }
            t["keys"] = std::move(kj);
        }
        types.push_back(std::move(t));
    }
    p["types"] = std::move(types);
    return p;
}

nlohmann::ordered_json ArscResolver::DescribeTable(const ResTable& table) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["packageCount"] = table.header.package_count;
    out["valueStrings"] = table.value_strings.size();

    nlohmann::ordered_json packages = nlohmann::ordered_json::array();
    for (const auto& pkg : table.packages) {
        auto name = decode_utf16_field(pkg.header.name);
        auto p = describe_package(pkg, name.ok() ? name.text : std::string{});
        if (!name.ok()) {
            p["nameError"] = name.error->message;
        }
        packages.push_back(std::move(p));
    }
    out["packages"] = std::move(packages);
    return out;
}

}  // namespace r2n::arsc
