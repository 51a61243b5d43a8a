/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_TYPES_H
#define LMSHAO_LMSTAMP_TYPES_H

#include <cstdint>
#include <string>

#include "lmstamp/container_kind.h"
#include "lmstamp/timestamp.h"

namespace lmshao::lmstamp {

enum class StampError {
    kOk = 0,
    kUnrecognizedContainerType,
    kContainerParseFailure,
    kDateNotFound,
    kOffsetOutOfRange, // run-wide, checked before any file
    kRenameFailure,
};

const char *StampErrorString(StampError error);

// Run-wide settings, fixed for every file of a run.
struct RenameOptions {
    bool dry_run = false;
    int32_t offset_seconds = 0;
};

// Outcome of one successfully resolved file.
struct RenameResult {
    std::string source_path;
    std::string target_path;
    ContainerKind kind = ContainerKind::kMatroska;
    Timestamp resolved;     // as stored in the container
    Timestamp stamped;      // after the offset, used for the new name
    bool renamed = false;   // false in dry-run mode
};

struct RenameStatistics {
    uint64_t processed = 0;
    uint64_t renamed = 0;
    uint64_t dry_run = 0;
    uint64_t failed = 0;
};

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_TYPES_H
