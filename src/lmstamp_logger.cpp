/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/lmstamp_logger.h"

#include "internal_logger.h"

namespace lmshao::lmstamp {

void ConfigureLmstampLogger(lmcore::LogLevel level, lmcore::LogOutput output, const std::string &filename)
{
    (void)GetLmstampLoggerWithAutoInit();
    InitLmstampLogger(level, output, filename);
}

} // namespace lmshao::lmstamp
