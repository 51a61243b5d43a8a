/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "lmstamp/lmstamp_logger.h"
#include "lmstamp/media_renamer.h"
#include "lmstamp/time_offset.h"

#ifndef LMSTAMP_VERSION
#define LMSTAMP_VERSION "dev"
#endif

using namespace lmshao::lmstamp;

static void PrintUsage(const char *prog)
{
    std::fprintf(stderr,
                 "Usage: %s [OPTIONS] <file>...\n"
                 "Prefix media files with the Unix time of their embedded creation date.\n\n"
                 "Options:\n"
                 "  -n, --dry-run           Don't rename files, just print what would be done\n"
                 "  -t, --tz-offset HOURS   Offset in hours (can be fractional) to add to timestamps read\n"
                 "                          from files, for cameras that store local time without a timezone\n"
                 "      --log-level LEVEL   debug|info|warn|error (default: error)\n"
                 "  -V, --version           Print version and exit\n"
                 "  -h, --help              Show this help\n",
                 prog);
}

static bool ParseLogLevel(const std::string &s, lmshao::lmcore::LogLevel &level)
{
    using lmshao::lmcore::LogLevel;
    if (s == "debug") {
        level = LogLevel::kDebug;
    } else if (s == "info") {
        level = LogLevel::kInfo;
    } else if (s == "warn" || s == "warning") {
        level = LogLevel::kWarn;
    } else if (s == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

static bool ParseHours(const std::string &s, float &hours)
{
    if (s.empty()) {
        return false;
    }
    char *end = nullptr;
    hours = std::strtof(s.c_str(), &end);
    return end != nullptr && *end == '\0';
}

// Prints report lines to stdout and errors to stderr. The report line comes
// before the rename, so a failed rename still shows the intended name.
class ConsoleListener : public IRenameListener {
public:
    void OnResolved(const RenameResult &result) override
    {
        std::printf("%s -> %s (%s)\n", result.source_path.c_str(), result.target_path.c_str(),
                    FormatRfc2822(result.stamped).c_str());
        std::fflush(stdout);
    }

    void OnRenamed(const RenameResult &) override {}

    void OnError(const std::string &path, StampError code, const std::string &msg) override
    {
        (void)code;
        std::fprintf(stderr, "Error processing %s: %s\n", path.c_str(), msg.c_str());
    }
};

int main(int argc, char **argv)
{
    bool dry_run = false;
    float offset_hours = 0.0f;
    lmshao::lmcore::LogLevel log_level = lmshao::lmcore::LogLevel::kError;
    std::vector<std::string> paths;

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            paths.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "-n" || arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "-t" || arg == "--tz-offset") {
            if (i + 1 >= argc || !ParseHours(argv[i + 1], offset_hours)) {
                std::fprintf(stderr, "%s expects a number of hours\n", arg.c_str());
                return 2;
            }
            ++i;
        } else if (arg.rfind("--tz-offset=", 0) == 0) {
            if (!ParseHours(arg.substr(12), offset_hours)) {
                std::fprintf(stderr, "--tz-offset expects a number of hours\n");
                return 2;
            }
        } else if (arg == "--log-level" || arg.rfind("--log-level=", 0) == 0) {
            std::string value;
            if (arg == "--log-level") {
                if (i + 1 >= argc) {
                    std::fprintf(stderr, "--log-level expects a level\n");
                    return 2;
                }
                value = argv[++i];
            } else {
                value = arg.substr(12);
            }
            if (!ParseLogLevel(value, log_level)) {
                std::fprintf(stderr, "Unknown log level: %s\n", value.c_str());
                return 2;
            }
        } else if (arg == "-V" || arg == "--version") {
            std::printf("lmstamp %s\n", LMSTAMP_VERSION);
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (paths.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    ConfigureLmstampLogger(log_level);

    // The offset is validated once, before any file is touched
    RenameOptions options;
    options.dry_run = dry_run;
    if (!HoursToOffsetSeconds(offset_hours, options.offset_seconds)) {
        std::fprintf(stderr, "offset too big\n");
        return 1;
    }

    MediaRenamer renamer(options);
    renamer.SetListener(std::make_shared<ConsoleListener>());

    bool ok = true;
    for (const auto &path : paths) {
        if (!renamer.Process(path)) {
            ok = false;
        }
    }
    return ok ? 0 : 1;
}
