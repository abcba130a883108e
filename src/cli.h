/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include "arsc_resolver.h"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace r2n::cli {

// Process exit codes.
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitBadInput = 2;
constexpr int kExitUnresolved = 3;

struct Settings {
    std::filesystem::path input;
    bool dump = false;
    bool strict = false;
    bool debug = false;
    r2n::arsc::OutputFormat format = r2n::arsc::OutputFormat::Fqdn;
    std::optional<std::uint32_t> resource_id;
    std::optional<std::filesystem::path> out_path;
};

struct ParseResult {
    std::optional<Settings> settings;
    int exit_code = kExitOk;  // set when settings is empty
};

void print_usage();

// Reads argv[1..]; logs the problem and returns an exit code when the arguments are unusable.
ParseResult parse_settings(int argc, const char* const* argv);

// Loads the table and prints the resolved name (or the --dump document).
int run(const Settings& settings);

// parse_settings + input checks + run; load failures are caught and reported.
int run_main(int argc, const char* const* argv);

}  // namespace r2n::cli
