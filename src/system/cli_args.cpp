// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace kiosk {

// Helper to parse a non-negative integer with validation
static bool parse_int64(const char* str, int64_t max_val, int64_t& out, const char* name) {
    char* endptr;
    long long val = strtoll(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < 0 || val > max_val) {
        printf("Error: invalid %s (must be 0-%lld): %s\n", name, static_cast<long long>(max_val),
               str);
        return false;
    }
    out = static_cast<int64_t>(val);
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options] -s <script.json>\n", program_name);
    printf("Replays scripted input against a headless kiosk on a virtual clock.\n\n");
    printf("Options:\n");
    printf("  -c, --config <path>      Config file (default: config/kiosk.json)\n");
    printf("  -s, --script <path>      Replay script (JSON)\n");
    printf("  --duration-ms <ms>       Virtual run time (default: until the script ends)\n");
    printf("  --log-target <target>    Log target: auto, journal, syslog, file, console\n");
    printf("  -v, --verbose            Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  -h, --help               Show this help message\n");
}

// Value for "-x <v>" or "--long <v>" / "--long=<v>"
static const char* option_value(int argc, char** argv, int& i, const char* short_name,
                                const char* long_name) {
    size_t long_len = strlen(long_name);
    if (strncmp(argv[i], long_name, long_len) == 0 && argv[i][long_len] == '=') {
        return argv[i] + long_len + 1;
    }
    if ((short_name && strcmp(argv[i], short_name) == 0) || strcmp(argv[i], long_name) == 0) {
        if (i + 1 < argc) {
            return argv[++i];
        }
        printf("Error: %s requires a value\n", argv[i]);
        return nullptr;
    }
    return nullptr;
}

static bool matches(const char* arg, const char* short_name, const char* long_name) {
    size_t long_len = strlen(long_name);
    if (strncmp(arg, long_name, long_len) == 0 && (arg[long_len] == '\0' || arg[long_len] == '=')) {
        return true;
    }
    return short_name && strcmp(arg, short_name) == 0;
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (matches(argv[i], "-c", "--config")) {
            const char* value = option_value(argc, argv, i, "-c", "--config");
            if (!value) {
                return false;
            }
            args.config_path = value;
        } else if (matches(argv[i], "-s", "--script")) {
            const char* value = option_value(argc, argv, i, "-s", "--script");
            if (!value) {
                return false;
            }
            args.script_path = value;
        } else if (matches(argv[i], nullptr, "--duration-ms")) {
            const char* value = option_value(argc, argv, i, nullptr, "--duration-ms");
            if (!value || !parse_int64(value, 86400000LL * 365, args.duration_ms, "--duration-ms")) {
                return false;
            }
        } else if (matches(argv[i], nullptr, "--log-target")) {
            const char* value = option_value(argc, argv, i, nullptr, "--log-target");
            if (!value) {
                return false;
            }
            if (strcmp(value, "auto") != 0 && strcmp(value, "journal") != 0 &&
                strcmp(value, "syslog") != 0 && strcmp(value, "file") != 0 &&
                strcmp(value, "console") != 0) {
                printf("Error: unknown log target: %s\n", value);
                return false;
            }
            args.log_target = value;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help_shown = true;
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (args.script_path.empty()) {
        printf("Error: --script is required\n");
        printf("Use --help for more information\n");
        return false;
    }

    return true;
}

} // namespace kiosk
