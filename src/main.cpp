/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    bool verbose = false;
    bool manifest = false;
    bool keep_strings = false;
    bool check_size = false;
    bool debug = false;
    std::optional<fs::path> output_dir;
};

static void print_usage() {
    DARKCFG_LOG_INFO(
        "Usage:\n" \
        "    dcb_parser <input-file> [output-dir] [--verbose] [--manifest] [--strings] [--check-size] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a packed config container\n" \
        "    output-dir       defaults to <input-without-extension>_unpack\n" \
        "    -v, --verbose    logs every emitted entry\n" \
        "    --manifest       writes _manifest.json with header and per-entry metadata\n" \
        "    --strings        adds the string table to the manifest (implies --manifest)\n" \
        "    --check-size     fails when an entry's declared size differs from its payload size\n" \
        "    --debug          enables extra logging\n" \
        "    -h, --help       shows this message\n"
    );
}

static int process_file(const fs::path& input, const fs::path& out_dir, const Settings& settings) {
    try {
        darkcfg::dcb::ParserDecodeOptions opt{};
        opt.check_size = settings.check_size;
        opt.keep_strings = settings.keep_strings;
        opt.verbose = settings.verbose;
        opt.debug = settings.debug;
        const auto res = darkcfg::dcb::DcbParser::DecodeFile(input, opt);

        darkcfg::dcb::ParserWriteOptions wopt{};
        wopt.write_manifest = settings.manifest;
        wopt.debug = settings.debug;
        const auto written = darkcfg::dcb::DcbParser::WriteOutputs(res, out_dir, wopt);
        if (settings.verbose) {
            for (const auto& p : written) {
                DARKCFG_LOG_INFO(
                    "Wrote: %s", darkcfg::fs_utils::display_path(p, out_dir).c_str()
                );
            }
        }
        DARKCFG_LOG_INFO(
            "Extracted %zu file(s) to %s", written.size(), out_dir.string().c_str()
        );
        return 0;
    } catch (const darkcfg::dcb::UnsupportedFeatureError& e) {
        DARKCFG_LOG_ERROR("Unsupported: %s (%s)", input.string().c_str(), e.what());
        return 3;
    } catch (const std::exception& e) {
        DARKCFG_LOG_ERROR("Failed: %s (%s)", input.string().c_str(), e.what());
        return 1;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (first_arg == "-h" || first_arg == "--help") {
        print_usage();
        return 0;
    }
    if (!first_arg.empty() && first_arg[0] == '-') {
        DARKCFG_LOG_ERROR("First argument must be an input file.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::absolute(fs::path(std::string(first_arg)));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
            continue;
        }
        if (arg == "--manifest") {
            settings.manifest = true;
            continue;
        }
        if (arg == "--strings") {
            settings.manifest = true;
            settings.keep_strings = true;
            continue;
        }
        if (arg == "--check-size") {
            settings.check_size = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        if (!arg.empty() && arg[0] != '-' && !settings.output_dir.has_value()) {
            settings.output_dir = fs::path(std::string(arg));
            continue;
        }
        DARKCFG_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::is_regular_file(input)) {
        DARKCFG_LOG_ERROR("Input does not exist or is not a file: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_dir = settings.output_dir.has_value()
                                 ? *settings.output_dir
                                 : darkcfg::fs_utils::default_output_dir(input);
    return process_file(input, out_dir, settings);
}
