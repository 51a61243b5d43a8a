/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/creation_date.h"

#include <cstring>
#include <limits>

#include "internal_logger.h"

namespace lmshao::lmstamp {

static bool EqualsIgnoreAsciiCase(const std::string &a, const char *b)
{
    size_t n = std::strlen(b);
    if (a.size() != n) {
        return false;
    }
    for (size_t i = 0; i < n; ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') {
            ca = static_cast<char>(ca - 'A' + 'a');
        }
        if (cb >= 'A' && cb <= 'Z') {
            cb = static_cast<char>(cb - 'A' + 'a');
        }
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

bool FindQuickTimeCreationDate(const MatroskaDocument &doc, Timestamp &out)
{
    for (const auto &tag : doc.tags) {
        const MatroskaSimpleTag *match = nullptr;
        for (const auto &simple : tag.simple_tags) {
            if (EqualsIgnoreAsciiCase(simple.name, kQuickTimeCreationDateTag)) {
                match = &simple;
                break;
            }
        }
        if (!match) {
            continue;
        }
        if (match->value_type != TagValueType::kString) {
            LMSTAMP_LOGD("QuickTime creation date tag is not a string, ignoring");
            continue;
        }
        if (ParseIso8601(match->string_value, out)) {
            return true;
        }
        LMSTAMP_LOGD("QuickTime creation date '%s' is not ISO-8601, ignoring", match->string_value.c_str());
    }
    return false;
}

bool ResolveMatroskaCreationDate(const MatroskaDocument &doc, Timestamp &out)
{
    if (FindQuickTimeCreationDate(doc, out)) {
        LMSTAMP_LOGD("Creation date from QuickTime tag: %s", FormatIso8601(out).c_str());
        return true;
    }
    if (doc.info.has_date_utc) {
        out = doc.info.date_utc;
        LMSTAMP_LOGD("Creation date from segment DateUTC: %s", FormatIso8601(out).c_str());
        return true;
    }
    return false;
}

bool ResolveMp4CreationDate(const Mp4MovieHeader &mvhd, Timestamp &out)
{
    if (mvhd.creation_time > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        LMSTAMP_LOGD("mvhd creation_time %llu out of range", (unsigned long long)mvhd.creation_time);
        return false;
    }
    int64_t unix_seconds = static_cast<int64_t>(mvhd.creation_time) - kMp4EpochOffsetSeconds;
    if (!MakeTimestamp(unix_seconds, out)) {
        LMSTAMP_LOGD("mvhd creation_time %llu out of range", (unsigned long long)mvhd.creation_time);
        return false;
    }
    return true;
}

} // namespace lmshao::lmstamp
