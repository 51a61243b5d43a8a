/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_CREATION_DATE_H
#define LMSHAO_LMSTAMP_CREATION_DATE_H

#include <cstdint>

#include "lmstamp/matroska_parser.h"
#include "lmstamp/mp4_parser.h"
#include "lmstamp/timestamp.h"

namespace lmshao::lmstamp {

// Tag written by Apple devices, carrying a timezone-qualified ISO-8601 date.
static constexpr char kQuickTimeCreationDateTag[] = "com.apple.quicktime.creationdate";

// Seconds between the MP4 epoch (1904-01-01) and the Unix epoch.
static constexpr int64_t kMp4EpochOffsetSeconds = 2082844800LL;

/**
 * @brief Best-guess creation date of a Matroska document
 *
 * The first QuickTime creation-date SimpleTag (name compared ASCII
 * case-insensitively, one candidate per Tag) that holds a parseable ISO-8601
 * string wins. Binary or malformed values fall through to the segment
 * DateUTC. Returns false when neither source yields a date.
 */
bool ResolveMatroskaCreationDate(const MatroskaDocument &doc, Timestamp &out);

// QuickTime creation-date tag only; false if absent, binary or malformed.
bool FindQuickTimeCreationDate(const MatroskaDocument &doc, Timestamp &out);

/**
 * @brief Creation date from the MP4 movie header
 *
 * creation_time is rebased from 1904 to 1970. Zero is accepted (it decodes
 * to 1904-01-01). Returns false when the result is not representable.
 */
bool ResolveMp4CreationDate(const Mp4MovieHeader &mvhd, Timestamp &out);

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_CREATION_DATE_H
