/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_INTERNAL_LOGGER_H
#define LMSHAO_LMSTAMP_INTERNAL_LOGGER_H

#include <mutex>

#include "lmstamp/lmstamp_logger.h"

namespace lmshao::lmstamp {

inline lmshao::lmcore::Logger &GetLmstampLoggerWithAutoInit()
{
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        lmshao::lmcore::LoggerRegistry::RegisterModule<LmstampModuleTag>("LMSTAMP");
        InitLmstampLogger();
    });
    return lmshao::lmcore::LoggerRegistry::GetLogger<LmstampModuleTag>();
}

#define LMSTAMP_LOG_AT(lvl, fmt, ...)                                                                                  \
    do {                                                                                                               \
        auto &logger = lmshao::lmstamp::GetLmstampLoggerWithAutoInit();                                                \
        if (logger.ShouldLog(lvl)) {                                                                                   \
            logger.LogWithModuleTag<lmshao::lmstamp::LmstampModuleTag>(lvl, __FILE__, __LINE__, __FUNCTION__, fmt,     \
                                                                       ##__VA_ARGS__);                                 \
        }                                                                                                              \
    } while (0)

#define LMSTAMP_LOGD(fmt, ...) LMSTAMP_LOG_AT(lmshao::lmcore::LogLevel::kDebug, fmt, ##__VA_ARGS__)
#define LMSTAMP_LOGI(fmt, ...) LMSTAMP_LOG_AT(lmshao::lmcore::LogLevel::kInfo, fmt, ##__VA_ARGS__)
#define LMSTAMP_LOGW(fmt, ...) LMSTAMP_LOG_AT(lmshao::lmcore::LogLevel::kWarn, fmt, ##__VA_ARGS__)
#define LMSTAMP_LOGE(fmt, ...) LMSTAMP_LOG_AT(lmshao::lmcore::LogLevel::kError, fmt, ##__VA_ARGS__)
#define LMSTAMP_LOGF(fmt, ...) LMSTAMP_LOG_AT(lmshao::lmcore::LogLevel::kFatal, fmt, ##__VA_ARGS__)

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_INTERNAL_LOGGER_H
