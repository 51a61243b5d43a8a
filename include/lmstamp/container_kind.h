/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_CONTAINER_KIND_H
#define LMSHAO_LMSTAMP_CONTAINER_KIND_H

#include <string>

namespace lmshao::lmstamp {

enum class ContainerKind {
    kMatroska,
    kMp4,
};

// Classify a path by its lower-cased extension only:
// mkv -> Matroska; mov, mp4, m4v -> Mp4. Returns false for anything else.
bool DetectContainerKind(const std::string &path, ContainerKind &kind);

const char *ContainerKindName(ContainerKind kind);

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_CONTAINER_KIND_H
