/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <string>

#include "lmstamp/timestamp.h"

using namespace lmshao::lmstamp;

static int64_t ParseOrDie(const std::string &text)
{
    Timestamp ts;
    bool ok = ParseIso8601(text, ts);
    assert(ok);
    (void)ok;
    return ts.unix_seconds;
}

static bool Rejects(const std::string &text)
{
    Timestamp ts;
    return !ParseIso8601(text, ts);
}

int main()
{
    // Range limits
    {
        Timestamp ts;
        assert(MakeTimestamp(kMaxUnixSeconds, ts));
        assert(MakeTimestamp(kMinUnixSeconds, ts));
        assert(!MakeTimestamp(kMaxUnixSeconds + 1, ts));
        assert(!MakeTimestamp(kMinUnixSeconds - 1, ts));
        assert(ts.unix_seconds == kMinUnixSeconds);
    }

    // Calendar helpers
    {
        assert(DaysFromCivil(1970, 1, 1) == 0);
        assert(DaysFromCivil(2000, 3, 1) == 11017);
        assert(DaysFromCivil(1969, 12, 31) == -1);
        int64_t y = 0;
        unsigned m = 0;
        unsigned d = 0;
        CivilFromDays(19459, y, m, d);
        assert(y == 2023 && m == 4 && d == 12);
        assert(DaysInMonth(2024, 2) == 29);
        assert(DaysInMonth(1900, 2) == 28);
        assert(DaysInMonth(2000, 2) == 29);
        assert(DaysInMonth(2023, 13) == 0);
    }

    // Accepted ISO-8601 forms, all the same instant
    assert(ParseOrDie("2023-04-12T02:19:01Z") == 1681265941);
    assert(ParseOrDie("2023-04-12T04:19:01+02:00") == 1681265941);
    assert(ParseOrDie("2023-04-11T21:19:01-0500") == 1681265941);
    assert(ParseOrDie("2023-04-12T03:19:01+01") == 1681265941);
    assert(ParseOrDie("20230412T021901Z") == 1681265941);
    assert(ParseOrDie("2023-04-12t02:19:01.123456z") == 1681265941);
    assert(ParseOrDie("2023-04-12T02:19:01,9Z") == 1681265941);

    // Seconds are optional
    assert(ParseOrDie("2023-04-12T02:19Z") == 1681265940);

    // Leap day and leap second
    assert(ParseOrDie("2024-02-29T00:00:00Z") == 1709164800);
    assert(ParseOrDie("2016-12-31T23:59:60Z") == 1483228799);

    // Pre-epoch
    assert(ParseOrDie("1969-12-31T23:59:59Z") == -1);
    assert(ParseOrDie("1904-01-01T00:00:00Z") == -2082844800);

    // Rejected inputs
    assert(Rejects(""));
    assert(Rejects("2023-04-12"));
    assert(Rejects("2023-04-12T02:19:01"));
    assert(Rejects("2023-04-12 02:19:01Z"));
    assert(Rejects("2023-04-12T02:19:01Zjunk"));
    assert(Rejects("2023-02-29T00:00:00Z"));
    assert(Rejects("2023-13-01T00:00:00Z"));
    assert(Rejects("2023-00-10T00:00:00Z"));
    assert(Rejects("2023-04-31T00:00:00Z"));
    assert(Rejects("2023-04-12T24:00:00Z"));
    assert(Rejects("2023-04-12T12:60:00Z"));
    assert(Rejects("2023-04-12T12:30:60Z"));
    assert(Rejects("2023-04-12T02:19:01+24:00"));
    assert(Rejects("2023-04-12T02:19:01.Z"));
    assert(Rejects("Wed, 12 Apr 2023 02:19:01 +0000"));

    // RFC 2822 rendering
    {
        Timestamp ts;
        ts.unix_seconds = 1681265941;
        assert(FormatRfc2822(ts) == "Wed, 12 Apr 2023 02:19:01 +0000");
        assert(FormatIso8601(ts) == "2023-04-12T02:19:01Z");

        ts.unix_seconds = 0;
        assert(FormatRfc2822(ts) == "Thu, 01 Jan 1970 00:00:00 +0000");

        ts.unix_seconds = -1;
        assert(FormatRfc2822(ts) == "Wed, 31 Dec 1969 23:59:59 +0000");
        assert(FormatIso8601(ts) == "1969-12-31T23:59:59Z");

        ts.unix_seconds = kMaxUnixSeconds;
        assert(FormatRfc2822(ts) == "Fri, 31 Dec 9999 23:59:59 +0000");
        assert(FormatIso8601(ts) == "9999-12-31T23:59:59Z");
    }

    return 0;
}
