/**
 * Copyright (c) 2026 rid2name authors
 */
#include "cli.h"

#include "utils/fs_utils.h"
#include "utils/log.h"

#include <cstdio>
#include <exception>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace r2n::cli {

void print_usage() {
    R2N_LOG_INFO(
        "Usage:\n" \
        "    rid2name <resources.arsc> <resource-id> [fqdn|xmlid|json] [--strict] [--out <file>]"
        " [--debug]\n" \
        "    rid2name <resources.arsc> --dump [--out <file>] [--debug]\n\n" \
        "Options:\n" \
        "    resource-id   32-bit id, decimal or 0x/0o/0b prefixed (e.g. 0x7f010000)\n" \
        "    fqdn          package.R.type.key (default)\n" \
        "    xmlid         @package:type/key\n" \
        "    json          {\"package\": ..., \"type\": ..., \"key\": ...}\n" \
        "    --dump        prints every package, type and key as JSON\n" \
        "    --strict      rejects ids with a zero package or type component\n" \
        "    --out         writes the result to a file instead of stdout\n" \
        "    --debug       enables extra logging\n"
    );
}

static ParseResult fail(int exit_code) {
    ParseResult out{};
    out.exit_code = exit_code;
    return out;
}

ParseResult parse_settings(int argc, const char* const* argv) {
    if (argc < 3) {
        print_usage();
        return fail(kExitUsage);
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        R2N_LOG_ERROR("First argument must be a resource table file.");
        print_usage();
        return fail(kExitBadInput);
    }

    Settings settings;
    settings.input = fs::path(std::string(first_arg));
    bool have_format = false;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--dump") {
            settings.dump = true;
            continue;
        }
        if (arg == "--strict") {
            settings.strict = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--out") {
            if (i + 1 >= argc) {
                R2N_LOG_ERROR("Missing value for --out");
                return fail(kExitBadInput);
            }
            settings.out_path = fs::path(argv[++i]);
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            R2N_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            return fail(kExitBadInput);
        }
        if (!settings.resource_id.has_value()) {
            settings.resource_id = r2n::arsc::parse_resource_id(arg);
            if (!settings.resource_id.has_value()) {
                R2N_LOG_ERROR("Invalid resource id: %s", std::string(arg).c_str());
                return fail(kExitBadInput);
            }
            continue;
        }
        if (!have_format) {
            const auto fmt = r2n::arsc::parse_output_format(arg);
            if (!fmt.has_value()) {
                R2N_LOG_ERROR("Unknown output type: %s", std::string(arg).c_str());
                return fail(kExitBadInput);
            }
            settings.format = *fmt;
            have_format = true;
            continue;
        }
        R2N_LOG_ERROR("Unexpected argument: %s", std::string(arg).c_str());
        return fail(kExitBadInput);
    }

    if (!settings.dump && !settings.resource_id.has_value()) {
        R2N_LOG_ERROR("Missing resource id.");
        print_usage();
        return fail(kExitUsage);
    }
    if (settings.dump && settings.resource_id.has_value()) {
        R2N_LOG_ERROR("--dump does not take a resource id.");
        return fail(kExitBadInput);
    }

    ParseResult out{};
    out.settings = std::move(settings);
    return out;
}

static void emit(const std::string& text, const Settings& settings) {
    if (settings.out_path.has_value()) {
        r2n::fs_utils::write_text_file(*settings.out_path, text + "\n");
        R2N_LOG_INFO("Wrote: %s", settings.out_path->string().c_str());
        return;
    }
    std::fputs(text.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

int run(const Settings& settings) {
    r2n::arsc::LoadOptions load_opt{};
    load_opt.debug = settings.debug;
    const auto table = r2n::arsc::ArscResolver::LoadTableFile(settings.input, load_opt);

    if (settings.dump) {
        emit(r2n::arsc::ArscResolver::DescribeTable(table).dump(2), settings);
        return kExitOk;
    }

    r2n::arsc::ResolveOptions resolve_opt{};
    resolve_opt.strict_ids = settings.strict;
    const auto res = r2n::arsc::resolve(table, *settings.resource_id, resolve_opt);
    if (!res.ok()) {
        R2N_LOG_ERROR(
            "0x%08X: %s: %s", *settings.resource_id,
            std::string(r2n::arsc::to_string(res.error->kind)).c_str(),
            res.error->message.c_str()
        );
        return kExitUnresolved;
    }
    if (settings.debug) {
        R2N_LOG_INFO(
            "0x%08X -> package=%s type=%s key=%s", *settings.resource_id,
            res.name.package.c_str(), res.name.type.c_str(), res.name.key.c_str()
        );
    }
    emit(r2n::arsc::ArscResolver::FormatName(res.name, settings.format), settings);
    return kExitOk;
}

int run_main(int argc, const char* const* argv) {
    const ParseResult parsed = parse_settings(argc, argv);
    if (!parsed.settings.has_value()) {
        return parsed.exit_code;
    }
    const Settings& settings = *parsed.settings;

    if (!fs::exists(settings.input)) {
        R2N_LOG_ERROR("Input does not exist: %s", settings.input.string().c_str());
        return kExitBadInput;
    }
    if (!r2n::fs_utils::is_arsc_file(settings.input)) {
        R2N_LOG_WARN(
            "Input does not have an .arsc extension: %s", settings.input.string().c_str()
        );
    }

    try {
        return run(settings);
    } catch (const std::exception& e) {
        R2N_LOG_ERROR("Failed: %s (%s)", settings.input.string().c_str(), e.what());
        return kExitBadInput;
    }
}

}  // namespace r2n::cli
