/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <limits>

#include "lmstamp/time_offset.h"

using namespace lmshao::lmstamp;

int main()
{
    // Hours to seconds
    {
        int32_t secs = 1;
        assert(HoursToOffsetSeconds(0.0f, secs));
        assert(secs == 0);
        assert(HoursToOffsetSeconds(-3.5f, secs));
        assert(secs == -12600);
        assert(HoursToOffsetSeconds(5.75f, secs));
        assert(secs == 20700);
        assert(HoursToOffsetSeconds(0.25f, secs));
        assert(secs == 900);
        assert(HoursToOffsetSeconds(-596523.0f, secs));
        assert(secs == -2147482800);
    }

    // Values that do not fit
    {
        int32_t secs = 7;
        assert(!HoursToOffsetSeconds(600000.0f, secs));
        assert(!HoursToOffsetSeconds(-600000.0f, secs));
        assert(!HoursToOffsetSeconds(std::numeric_limits<float>::quiet_NaN(), secs));
        assert(!HoursToOffsetSeconds(std::numeric_limits<float>::infinity(), secs));
        assert(secs == 7);
    }

    // Applying an offset
    {
        Timestamp ts;
        ts.unix_seconds = 1000000;
        Timestamp out;
        assert(ApplyOffset(ts, -12600, out));
        assert(out.unix_seconds == 987400);
        assert(ApplyOffset(ts, 0, out));
        assert(out == ts);
        assert(ApplyOffset(ts, 3600, out));
        assert(out.unix_seconds == 1003600);
    }

    // Shifting past either end of the range fails
    {
        Timestamp top;
        top.unix_seconds = kMaxUnixSeconds;
        Timestamp out;
        out.unix_seconds = 11;
        assert(!ApplyOffset(top, 1, out));
        assert(out.unix_seconds == 11);
        assert(ApplyOffset(top, -1, out));
        assert(out.unix_seconds == kMaxUnixSeconds - 1);

        Timestamp bottom;
        bottom.unix_seconds = kMinUnixSeconds;
        assert(!ApplyOffset(bottom, -1, out));
    }

    return 0;
}
