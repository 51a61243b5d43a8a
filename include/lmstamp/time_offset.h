/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_TIME_OFFSET_H
#define LMSHAO_LMSTAMP_TIME_OFFSET_H

#include <cstdint>

#include "lmstamp/timestamp.h"

namespace lmshao::lmstamp {

// Convert fractional hours to whole seconds, rounded half away from zero.
// Fails for NaN/infinite input or a result outside the int32_t range.
bool HoursToOffsetSeconds(float hours, int32_t &seconds);

// ts + offset_seconds; fails if the shifted time is not representable.
bool ApplyOffset(const Timestamp &ts, int32_t offset_seconds, Timestamp &out);

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_TIME_OFFSET_H
