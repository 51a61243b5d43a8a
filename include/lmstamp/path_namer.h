/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_PATH_NAMER_H
#define LMSHAO_LMSTAMP_PATH_NAMER_H

#include <string>

#include "lmstamp/timestamp.h"

namespace lmshao::lmstamp {

/**
 * @brief Path of the renamed file: same directory, name "<unix-seconds> <original name>"
 *
 * e.g. "folder/IMG_4792.mkv" at 1681265941 -> "folder/1681265941 IMG_4792.mkv".
 * Throws std::logic_error if the path has no file name component.
 */
std::string StampedPath(const std::string &path, const Timestamp &ts);

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_PATH_NAMER_H
