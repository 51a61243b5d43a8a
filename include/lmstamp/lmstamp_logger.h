/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_LMSTAMP_LOGGER_H
#define LMSHAO_LMSTAMP_LMSTAMP_LOGGER_H

#include <lmcore/logger.h>

#include <string>

namespace lmshao::lmstamp {

// Module tag for Lmstamp
struct LmstampModuleTag {};

/**
 * @brief Initialize Lmstamp logger with specified settings
 */
inline void InitLmstampLogger(lmcore::LogLevel level =
#if defined(_DEBUG) || defined(DEBUG) || !defined(NDEBUG)
                                  lmcore::LogLevel::kDebug,
#else
                                  lmcore::LogLevel::kWarn,
#endif
                              lmcore::LogOutput output = lmcore::LogOutput::CONSOLE, const std::string &filename = "")
{
    lmcore::LoggerRegistry::RegisterModule<LmstampModuleTag>("LMSTAMP");
    lmcore::LoggerRegistry::InitLogger<LmstampModuleTag>(level, output, filename);
}

/**
 * @brief Apply logger settings after the library's lazy initialization has run,
 * so that later library logging keeps the requested level
 */
void ConfigureLmstampLogger(lmcore::LogLevel level, lmcore::LogOutput output = lmcore::LogOutput::CONSOLE,
                            const std::string &filename = "");

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_LMSTAMP_LOGGER_H
