/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/time_offset.h"

#include <cmath>

#include "internal_logger.h"

namespace lmshao::lmstamp {

// 2^31 is exactly representable as a float; INT32_MAX is not
static constexpr float kInt32UpperBound = 2147483648.0f;

bool HoursToOffsetSeconds(float hours, int32_t &seconds)
{
    float secs = std::round(hours * 60.0f * 60.0f);
    if (!std::isfinite(secs) || secs < -kInt32UpperBound || secs >= kInt32UpperBound) {
        LMSTAMP_LOGD("Offset of %g hours does not fit in 32-bit seconds", static_cast<double>(hours));
        return false;
    }
    seconds = static_cast<int32_t>(secs);
    return true;
}

bool ApplyOffset(const Timestamp &ts, int32_t offset_seconds, Timestamp &out)
{
    if (!MakeTimestamp(ts.unix_seconds + offset_seconds, out)) {
        LMSTAMP_LOGD("Offset %d s moves %lld out of range", offset_seconds, static_cast<long long>(ts.unix_seconds));
        return false;
    }
    return true;
}

} // namespace lmshao::lmstamp
