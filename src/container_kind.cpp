/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/container_kind.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "internal_logger.h"

namespace lmshao::lmstamp {

bool DetectContainerKind(const std::string &path, ContainerKind &kind)
{
    // extension() yields "" for dot-files such as ".mkv"
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext.empty()) {
        LMSTAMP_LOGD("No extension: %s", path.c_str());
        return false;
    }
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "mkv") {
        kind = ContainerKind::kMatroska;
        return true;
    }
    if (ext == "mov" || ext == "mp4" || ext == "m4v") {
        kind = ContainerKind::kMp4;
        return true;
    }
    LMSTAMP_LOGD("Unrecognized extension '%s': %s", ext.c_str(), path.c_str());
    return false;
}

const char *ContainerKindName(ContainerKind kind)
{
    switch (kind) {
        case ContainerKind::kMatroska:
            return "Matroska";
        case ContainerKind::kMp4:
            return "MP4";
    }
    return "unknown";
}

} // namespace lmshao::lmstamp
