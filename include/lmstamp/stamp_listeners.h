/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_LISTENERS_H
#define LMSHAO_LMSTAMP_LISTENERS_H

#include <string>

#include "lmstamp/stamp_types.h"

namespace lmshao::lmstamp {

// Class-based listener for per-file rename outcomes.
class IRenameListener {
public:
    virtual ~IRenameListener() = default;

    // Called once the new path is known, before any rename is attempted
    virtual void OnResolved(const RenameResult &result) = 0;

    // Called after a file was renamed, or would have been in dry-run mode
    virtual void OnRenamed(const RenameResult &result) = 0;

    // Error with the originating path
    virtual void OnError(const std::string &path, StampError code, const std::string &msg) = 0;
};

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_LISTENERS_H
