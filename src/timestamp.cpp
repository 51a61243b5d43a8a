/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/timestamp.h"

#include <cstdio>

#include "internal_logger.h"

namespace lmshao::lmstamp {

static constexpr int64_t kSecondsPerDay = 86400;

static const char *const kWeekdayNames[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
static const char *const kMonthNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool IsRepresentable(int64_t unix_seconds)
{
    return unix_seconds >= kMinUnixSeconds && unix_seconds <= kMaxUnixSeconds;
}

bool MakeTimestamp(int64_t unix_seconds, Timestamp &out)
{
    if (!IsRepresentable(unix_seconds)) {
        return false;
    }
    out.unix_seconds = unix_seconds;
    return true;
}

static inline bool IsLeapYear(int64_t year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int64_t year, unsigned month)
{
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Howard Hinnant's days_from_civil
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day)
{
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;
    const int64_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void CivilFromDays(int64_t days, int64_t &year, unsigned &month, unsigned &day)
{
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

static inline bool IsDigit(char c)
{
    return c >= '0' && c <= '9';
}

static bool ReadDigits(const std::string &s, size_t &pos, size_t count, int &value)
{
    if (pos + count > s.size()) {
        return false;
    }
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!IsDigit(c)) {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    pos += count;
    value = v;
    return true;
}

static inline bool Accept(const std::string &s, size_t &pos, char c)
{
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

static bool ParseDate(const std::string &s, size_t &pos, int &year, int &month, int &day)
{
    if (!ReadDigits(s, pos, 4, year)) {
        return false;
    }
    if (Accept(s, pos, '-')) {
        return ReadDigits(s, pos, 2, month) && Accept(s, pos, '-') && ReadDigits(s, pos, 2, day);
    }
    return ReadDigits(s, pos, 2, month) && ReadDigits(s, pos, 2, day);
}

static bool ParseTime(const std::string &s, size_t &pos, int &hour, int &minute, int &second)
{
    second = 0;
    if (!ReadDigits(s, pos, 2, hour)) {
        return false;
    }
    if (Accept(s, pos, ':')) {
        if (!ReadDigits(s, pos, 2, minute)) {
            return false;
        }
        if (Accept(s, pos, ':') && !ReadDigits(s, pos, 2, second)) {
            return false;
        }
    } else {
        if (!ReadDigits(s, pos, 2, minute)) {
            return false;
        }
        if (pos < s.size() && IsDigit(s[pos]) && !ReadDigits(s, pos, 2, second)) {
            return false;
        }
    }
    // fractional seconds are parsed and dropped
    if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
        ++pos;
        size_t start = pos;
        while (pos < s.size() && IsDigit(s[pos])) {
            ++pos;
        }
        if (pos == start) {
            return false;
        }
    }
    return true;
}

static bool ParseOffset(const std::string &s, size_t &pos, int &offset_seconds)
{
    if (Accept(s, pos, 'Z') || Accept(s, pos, 'z')) {
        offset_seconds = 0;
        return true;
    }
    int sign = 0;
    if (Accept(s, pos, '+')) {
        sign = 1;
    } else if (Accept(s, pos, '-')) {
        sign = -1;
    } else {
        return false;
    }
    int hours = 0;
    int minutes = 0;
    if (!ReadDigits(s, pos, 2, hours)) {
        return false;
    }
    if (Accept(s, pos, ':')) {
        if (!ReadDigits(s, pos, 2, minutes)) {
            return false;
        }
    } else if (pos < s.size() && !ReadDigits(s, pos, 2, minutes)) {
        return false;
    }
    if (hours > 23 || minutes > 59) {
        return false;
    }
    offset_seconds = sign * (hours * 3600 + minutes * 60);
    return true;
}

bool ParseIso8601(const std::string &text, Timestamp &out)
{
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    int offset = 0;

    if (!ParseDate(text, pos, year, month, day)) {
        LMSTAMP_LOGD("ISO-8601: bad date in '%s'", text.c_str());
        return false;
    }
    if (!Accept(text, pos, 'T') && !Accept(text, pos, 't')) {
        LMSTAMP_LOGD("ISO-8601: missing time designator in '%s'", text.c_str());
        return false;
    }
    if (!ParseTime(text, pos, hour, minute, second)) {
        LMSTAMP_LOGD("ISO-8601: bad time in '%s'", text.c_str());
        return false;
    }
    if (!ParseOffset(text, pos, offset)) {
        LMSTAMP_LOGD("ISO-8601: bad or missing offset in '%s'", text.c_str());
        return false;
    }
    if (pos != text.size()) {
        LMSTAMP_LOGD("ISO-8601: trailing characters in '%s'", text.c_str());
        return false;
    }

    if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > DaysInMonth(year, month)) {
        return false;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return false;
    }
    if (second == 60) {
        // leap second: only valid as the last second of a UTC day
        if (hour != 23 || minute != 59) {
            return false;
        }
        second = 59;
    }

    int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t local = days * kSecondsPerDay + hour * 3600 + minute * 60 + second;
    return MakeTimestamp(local - offset, out);
}

static void SplitTimestamp(const Timestamp &ts, int64_t &days, int64_t &secs_of_day)
{
    days = ts.unix_seconds / kSecondsPerDay;
    secs_of_day = ts.unix_seconds % kSecondsPerDay;
    if (secs_of_day < 0) {
        secs_of_day += kSecondsPerDay;
        --days;
    }
}

std::string FormatRfc2822(const Timestamp &ts)
{
    int64_t days = 0;
    int64_t sod = 0;
    SplitTimestamp(ts, days, sod);
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    CivilFromDays(days, year, month, day);
    int weekday = static_cast<int>((days % 7 + 11) % 7); // 1970-01-01 was a Thursday

    // years before 0000 keep four digits after the sign
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02u %s %s%04lld %02d:%02d:%02d +0000", kWeekdayNames[weekday], day,
                  kMonthNames[month - 1], year < 0 ? "-" : "", static_cast<long long>(year < 0 ? -year : year),
                  static_cast<int>(sod / 3600), static_cast<int>((sod / 60) % 60), static_cast<int>(sod % 60));
    return buf;
}

std::string FormatIso8601(const Timestamp &ts)
{
    int64_t days = 0;
    int64_t sod = 0;
    SplitTimestamp(ts, days, sod);
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    CivilFromDays(days, year, month, day);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ", static_cast<long long>(year), month, day,
                  static_cast<int>(sod / 3600), static_cast<int>((sod / 60) % 60), static_cast<int>(sod % 60));
    return buf;
}

} // namespace lmshao::lmstamp
