/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/path_namer.h"

#include <filesystem>
#include <stdexcept>

namespace lmshao::lmstamp {

std::string StampedPath(const std::string &path, const Timestamp &ts)
{
    std::filesystem::path p(path);
    std::filesystem::path name = p.filename();
    if (name.empty() || name == "." || name == "..") {
        // callers only pass paths that already matched a container extension
        throw std::logic_error("path has no file name: " + path);
    }
    p.replace_filename(std::to_string(ts.unix_seconds) + " " + name.string());
    return p.string();
}

} // namespace lmshao::lmstamp
