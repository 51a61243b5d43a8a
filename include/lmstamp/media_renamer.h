/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_MEDIA_RENAMER_H
#define LMSHAO_LMSTAMP_MEDIA_RENAMER_H

#include <memory>
#include <string>

#include "lmcore/noncopyable.h"
#include "lmstamp/stamp_listeners.h"
#include "lmstamp/stamp_types.h"

namespace lmshao::lmstamp {

/**
 * @brief Renames media files after their embedded creation date
 *
 * Each path is handled on its own: classify by extension, parse the
 * container, resolve the creation date, apply the run-wide offset, build
 * the new name and rename (skipped in dry-run mode). Failures are reported
 * to the listener and never affect the next file.
 */
class MediaRenamer final : public lmcore::NonCopyable {
public:
    explicit MediaRenamer(const RenameOptions &options);
    ~MediaRenamer();

    void SetListener(const std::shared_ptr<IRenameListener> &listener);

    // Everything up to the new path, without touching the filesystem.
    StampError Resolve(const std::string &path, RenameResult &result, std::string &message);

    // Resolve, rename unless dry-run, notify the listener. True on success.
    bool Process(const std::string &path);

    const RenameOptions &Options() const;
    RenameStatistics GetStatistics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_MEDIA_RENAMER_H
