/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_TIMESTAMP_H
#define LMSHAO_LMSTAMP_TIMESTAMP_H

#include <cstdint>
#include <string>

namespace lmshao::lmstamp {

// Representable range: -9999-01-01T00:00:00Z .. 9999-12-31T23:59:59Z
static constexpr int64_t kMinUnixSeconds = -377705203200LL;
static constexpr int64_t kMaxUnixSeconds = 253402300799LL;

// Absolute point in time, whole seconds since 1970-01-01T00:00:00Z.
struct Timestamp {
    int64_t unix_seconds = 0;
};

inline bool operator==(const Timestamp &a, const Timestamp &b)
{
    return a.unix_seconds == b.unix_seconds;
}
inline bool operator!=(const Timestamp &a, const Timestamp &b)
{
    return !(a == b);
}

bool IsRepresentable(int64_t unix_seconds);

// Fails when unix_seconds lies outside the representable range.
bool MakeTimestamp(int64_t unix_seconds, Timestamp &out);

// Proleptic Gregorian calendar helpers (days relative to 1970-01-01).
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day);
void CivilFromDays(int64_t days, int64_t &year, unsigned &month, unsigned &day);
unsigned DaysInMonth(int64_t year, unsigned month);

/**
 * @brief Parse an ISO-8601 date-time with UTC offset
 *
 * Accepts calendar dates in extended (YYYY-MM-DD) or basic (YYYYMMDD) form,
 * a 'T' separator, hh:mm[:ss[.fff]] or hhmm[ss[.fff]], and an offset of
 * Z, +hh, +hh:mm or +hhmm. Each part may use either form. Fractional
 * seconds are dropped. Returns false on any syntax or range error.
 */
bool ParseIso8601(const std::string &text, Timestamp &out);

// "Wed, 12 Apr 2023 02:19:01 +0000"
std::string FormatRfc2822(const Timestamp &ts);

// "2023-04-12T02:19:01Z"
std::string FormatIso8601(const Timestamp &ts);

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_TIMESTAMP_H
