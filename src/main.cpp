// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief Command line entry point
 *
 * Reads a raw layout file, parses it and writes the canonical re-encoding
 * next to it (board.json -> board_output.json). All layout logic lives in
 * the kale_core library.
 */

#include "environment_config.h"
#include "kale_version.h"
#include "keyboard_layout.h"
#include "layout_file.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

using kale::config::EnvironmentConfig;

namespace {

constexpr int EXIT_USAGE = 2;

struct CliOptions {
    std::string input_path;
    std::string output_path; // Empty: derive from input
    bool to_stdout = false;
    bool verbose = false;
};

void print_usage(const char* prog) {
    printf("Usage: %s [options] <layout.json>\n"
           "\n"
           "Parse a raw keyboard layout and write its canonical re-encoding.\n"
           "\n"
           "Options:\n"
           "  -o, --output <file>  Write to <file> instead of <name>%s.json\n"
           "      --stdout         Print the re-encoded layout instead of writing a file\n"
           "  -v, --verbose        Debug logging\n"
           "      --version        Print version and exit\n"
           "  -h, --help           Show this help\n"
           "\n"
           "Environment:\n"
           "  KALE_LOG_LEVEL       trace|debug|info|warn|error|critical|off\n"
           "  KALE_VERBOSE=1       Same as --verbose\n"
           "  KALE_OUTPUT_SUFFIX   Output name suffix (default _output)\n",
           prog, EnvironmentConfig::get_output_suffix().c_str());
}

/// @return -1 to continue, otherwise the exit code
int parse_args(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(arg, "--version") == 0) {
            printf("kale %s\n", kale_version_full());
            return 0;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (strcmp(arg, "--stdout") == 0) {
            opts.to_stdout = true;
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s: %s requires a file name\n", argv[0], arg);
                return EXIT_USAGE;
            }
            opts.output_path = argv[++i];
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fprintf(stderr, "%s: unknown option %s\n", argv[0], arg);
            print_usage(argv[0]);
            return EXIT_USAGE;
        } else if (opts.input_path.empty()) {
            opts.input_path = arg;
        } else {
            fprintf(stderr, "%s: unexpected argument %s\n", argv[0], arg);
            return EXIT_USAGE;
        }
    }

    if (opts.input_path.empty()) {
        fprintf(stderr, "%s: no file name provided\n", argv[0]);
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    return -1;
}

void init_logging(const CliOptions& opts) {
    spdlog::level::level_enum level = spdlog::level::info;
    if (auto name = EnvironmentConfig::get_log_level()) {
        level = spdlog::level::from_str(*name);
    }
    if (opts.verbose || EnvironmentConfig::get_verbose()) {
        level = spdlog::level::debug;
    }
    spdlog::set_level(level);
}

int run(int argc, char** argv) {
    CliOptions opts;
    int rc = parse_args(argc, argv, opts);
    if (rc >= 0) {
        return rc;
    }
    init_logging(opts);

    std::string raw;
    std::string error;
    if (!kale::read_layout_file(opts.input_path, raw, error)) {
        spdlog::error("[kale] {}", error);
        return 1;
    }

    kale::Keyboard keyboard;
    kale::DecodeError err = kale::parse_layout(raw, keyboard);
    if (!err.success()) {
        // parse_layout() has already logged the failure
        return 1;
    }
    spdlog::info("[kale] Successfully parsed keyboard ({} keys)", keyboard.keys.size());

    std::string output = kale::to_raw_format(keyboard);

    if (opts.to_stdout) {
        fwrite(output.data(), 1, output.size(), stdout);
        fputc('\n', stdout);
        fflush(stdout);
        return 0;
    }

    std::string output_path = opts.output_path;
    if (output_path.empty()) {
        output_path =
            kale::derive_output_path(opts.input_path, EnvironmentConfig::get_output_suffix());
    }
    if (!kale::write_layout_file(output_path, output, error)) {
        spdlog::error("[kale] {}", error);
        return 1;
    }
    spdlog::info("[kale] Written to {}", output_path);
    return 0;
}

// Called by std::terminate() for uncaught exceptions and other fatal runtime errors.
// spdlog may be in a broken state here, so write straight to stderr.
void terminate_handler() {
    static bool entered = false;
    if (entered) {
        abort();
    }
    entered = true;

    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            fprintf(stderr, "[FATAL] Uncaught exception: %s\n", e.what());
        } catch (...) {
            fprintf(stderr, "[FATAL] Uncaught non-std::exception\n");
        }
    } else {
        fprintf(stderr, "[FATAL] std::terminate() called without active exception\n");
    }
    fflush(stderr);
    abort();
}

} // namespace

int main(int argc, char** argv) {
    std::set_terminate(terminate_handler);

    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "[FATAL] Unhandled exception: %s\n", e.what());
        fflush(stderr);
        return 1;
    }
}
