/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/matroska_parser.h"

#include <utility>

#include "internal_logger.h"
#include "lmcore/mapped_file.h"
#include "lmstamp/ebml_reader.h"

namespace lmshao::lmstamp {

// Common EBML/Matroska element IDs (partial)
static constexpr uint64_t kEbmlHeaderId = 0x1A45DFA3ULL;  // EBML
static constexpr uint64_t kDocTypeId = 0x4282ULL;         // DocType
static constexpr uint64_t kSegmentId = 0x18538067ULL;     // Segment
static constexpr uint64_t kInfoId = 0x1549A966ULL;        // Info
static constexpr uint64_t kTimecodeScaleId = 0x2AD7B1ULL; // TimecodeScale
static constexpr uint64_t kDurationId = 0x4489ULL;        // Duration
static constexpr uint64_t kDateUtcId = 0x4461ULL;         // DateUTC
static constexpr uint64_t kTitleId = 0x7BA9ULL;           // Title
static constexpr uint64_t kMuxingAppId = 0x4D80ULL;       // MuxingApp
static constexpr uint64_t kWritingAppId = 0x5741ULL;      // WritingApp
static constexpr uint64_t kTagsId = 0x1254C367ULL;        // Tags
static constexpr uint64_t kTagId = 0x7373ULL;             // Tag
static constexpr uint64_t kSimpleTagId = 0x67C8ULL;       // SimpleTag
static constexpr uint64_t kTagNameId = 0x45A3ULL;         // TagName
static constexpr uint64_t kTagStringId = 0x4487ULL;       // TagString
static constexpr uint64_t kTagBinaryId = 0x4485ULL;       // TagBinary
static constexpr uint64_t kSeekHeadId = 0x114D9B74ULL;    // SeekHead
static constexpr uint64_t kTracksId = 0x1654AE6BULL;      // Tracks
static constexpr uint64_t kCuesId = 0x1C53BB6BULL;        // Cues
static constexpr uint64_t kClusterId = 0x1F43B675ULL;     // Cluster
static constexpr uint64_t kChaptersId = 0x1043A770ULL;    // Chapters
static constexpr uint64_t kAttachmentsId = 0x1941A469ULL; // Attachments

// DateUTC counts nanoseconds from 2001-01-01T00:00:00Z
static constexpr int64_t kMatroskaEpochUnixSeconds = 978307200LL;
static constexpr int64_t kNanosPerSecond = 1000000000LL;

static bool ParseEbmlHeader(BufferCursor &cur, size_t end, MatroskaInfo &info)
{
    EbmlElementHeader kv{};
    while (cur.Tell() < end) {
        if (!NextElement(cur, kv)) {
            return false;
        }
        size_t kv_end = PayloadEnd(cur, kv, end);
        if (kv.id == kDocTypeId) {
            if (!ReadString(cur, kv_end - cur.Tell(), info.doc_type)) {
                return false;
            }
        }
        cur.Seek(kv_end);
    }
    return true;
}

static void ParseInfo(BufferCursor &cur, size_t end, MatroskaInfo &info)
{
    double raw_duration = 0.0;
    EbmlElementHeader kv{};
    while (cur.Tell() < end) {
        if (!NextElement(cur, kv)) {
            break;
        }
        size_t kv_end = PayloadEnd(cur, kv, end);
        uint64_t size = kv_end - cur.Tell();
        if (kv.id == kTimecodeScaleId) {
            uint64_t v = 0;
            if (ReadUnsigned(cur, size, v) && v > 0) {
                info.timecode_scale_ns = v;
            }
        } else if (kv.id == kDurationId) {
            ReadFloat(cur, size, raw_duration);
        } else if (kv.id == kDateUtcId) {
            int64_t ns = 0;
            if (ReadSigned(cur, size, ns)) {
                // floor toward negative infinity so pre-2001 dates keep whole seconds
                int64_t secs = ns / kNanosPerSecond;
                if (ns % kNanosPerSecond < 0) {
                    --secs;
                }
                info.has_date_utc = MakeTimestamp(secs + kMatroskaEpochUnixSeconds, info.date_utc);
            }
        } else if (kv.id == kTitleId) {
            ReadString(cur, size, info.title);
        } else if (kv.id == kMuxingAppId) {
            ReadString(cur, size, info.muxing_app);
        } else if (kv.id == kWritingAppId) {
            ReadString(cur, size, info.writing_app);
        }
        // Move to end of field, parsed or not
        cur.Seek(kv_end);
    }
    // Duration is stored in TimecodeScale units
    info.duration_seconds = raw_duration * static_cast<double>(info.timecode_scale_ns) / 1e9;
    LMSTAMP_LOGD("Info: TimecodeScale=%llu ns, duration=%.3f s, date_utc=%s",
                 (unsigned long long)info.timecode_scale_ns, info.duration_seconds,
                 info.has_date_utc ? FormatIso8601(info.date_utc).c_str() : "(none)");
}

static bool ParseSimpleTag(BufferCursor &cur, size_t end, MatroskaSimpleTag &tag)
{
    EbmlElementHeader kv{};
    while (cur.Tell() < end) {
        if (!NextElement(cur, kv)) {
            return false;
        }
        size_t kv_end = PayloadEnd(cur, kv, end);
        uint64_t size = kv_end - cur.Tell();
        if (kv.id == kTagNameId) {
            ReadString(cur, size, tag.name);
        } else if (kv.id == kTagStringId) {
            if (ReadString(cur, size, tag.string_value)) {
                tag.value_type = TagValueType::kString;
            }
        } else if (kv.id == kTagBinaryId) {
            if (ReadBinary(cur, size, tag.binary_value)) {
                tag.value_type = TagValueType::kBinary;
            }
        }
        // nested SimpleTags and TagLanguage/TagDefault are not needed
        cur.Seek(kv_end);
    }
    return true;
}

static void ParseTag(BufferCursor &cur, size_t end, MatroskaTag &tag)
{
    EbmlElementHeader sub{};
    while (cur.Tell() < end) {
        if (!NextElement(cur, sub)) {
            break;
        }
        size_t sub_end = PayloadEnd(cur, sub, end);
        if (sub.id == kSimpleTagId) {
            MatroskaSimpleTag simple;
            if (ParseSimpleTag(cur, sub_end, simple)) {
                tag.simple_tags.push_back(std::move(simple));
            }
        }
        // Targets skipped
        cur.Seek(sub_end);
    }
}

static bool IsSegmentChildId(uint64_t id)
{
    switch (id) {
        case kSeekHeadId:
        case kInfoId:
        case kTracksId:
        case kCuesId:
        case kClusterId:
        case kChaptersId:
        case kAttachmentsId:
        case kTagsId:
            return true;
        default:
            return false;
    }
}

// An unknown-size element (a live Cluster) ends where the next Segment-level
// element starts. Leaves the cursor on that element, or at `end`.
static void SkipUnknownSizeElement(BufferCursor &cur, size_t end)
{
    EbmlElementHeader sub{};
    while (cur.Tell() < end) {
        size_t start = cur.Tell();
        if (!NextElement(cur, sub)) {
            cur.Seek(end);
            return;
        }
        if (IsSegmentChildId(sub.id)) {
            cur.Seek(start);
            return;
        }
        if (sub.IsUnknownSize()) {
            SkipUnknownSizeElement(cur, end);
            continue;
        }
        cur.Seek(PayloadEnd(cur, sub, end));
    }
}

static void ParseTags(BufferCursor &cur, size_t end, std::vector<MatroskaTag> &tags)
{
    EbmlElementHeader sub{};
    while (cur.Tell() < end) {
        if (!NextElement(cur, sub)) {
            break;
        }
        size_t sub_end = PayloadEnd(cur, sub, end);
        if (sub.id == kTagId) {
            MatroskaTag tag;
            ParseTag(cur, sub_end, tag);
            LMSTAMP_LOGD("Tag with %zu simple tags", tag.simple_tags.size());
            tags.push_back(std::move(tag));
        }
        cur.Seek(sub_end);
    }
}

bool MatroskaParser::ParseBuffer(const uint8_t *data, size_t size, MatroskaDocument &doc)
{
    BufferCursor cur(data, size);
    EbmlElementHeader hdr{};
    if (!NextElement(cur, hdr)) {
        LMSTAMP_LOGW("Failed to read first EBML element header");
        return false;
    }
    if (hdr.id != kEbmlHeaderId) {
        LMSTAMP_LOGW("Unexpected first element ID: 0x%llX, expected EBML", (unsigned long long)hdr.id);
        return false;
    }
    size_t header_end = PayloadEnd(cur, hdr, cur.Size());
    if (!ParseEbmlHeader(cur, header_end, doc.info)) {
        LMSTAMP_LOGW("Malformed EBML header");
        return false;
    }
    if (!doc.info.doc_type.empty() && doc.info.doc_type != "matroska" && doc.info.doc_type != "webm") {
        LMSTAMP_LOGW("Unsupported DocType: %s", doc.info.doc_type.c_str());
        return false;
    }
    cur.Seek(header_end);

    // There may be Void or other top-level elements before the Segment
    bool found = false;
    while (NextElement(cur, hdr)) {
        if (hdr.id == kSegmentId) {
            found = true;
            break;
        }
        if (hdr.IsUnknownSize() || !SkipBytes(cur, hdr.size)) {
            break;
        }
    }
    if (!found) {
        LMSTAMP_LOGW("Segment not found");
        return false;
    }

    // Unknown-size (live) segments extend to the end of the buffer
    size_t segment_end = PayloadEnd(cur, hdr, cur.Size());
    while (cur.Tell() < segment_end) {
        EbmlElementHeader child{};
        if (!NextElement(cur, child)) {
            LMSTAMP_LOGW("End of segment or failed to read child header");
            break;
        }
        if (child.IsUnknownSize() && child.id != kInfoId && child.id != kTagsId) {
            LMSTAMP_LOGD("Unknown-size element 0x%llX inside Segment, skipping to next top-level element",
                         (unsigned long long)child.id);
            SkipUnknownSizeElement(cur, segment_end);
            continue;
        }
        size_t child_end = PayloadEnd(cur, child, segment_end);
        if (child.id == kInfoId) {
            ParseInfo(cur, child_end, doc.info);
        } else if (child.id == kTagsId) {
            ParseTags(cur, child_end, doc.tags);
        }
        // Clusters, Tracks, Cues and the rest are skipped by size
        cur.Seek(child_end);
    }

    LMSTAMP_LOGI("Parsed Matroska: doctype=%s, tags=%zu, date_utc=%s", doc.info.doc_type.c_str(), doc.tags.size(),
                 doc.info.has_date_utc ? "yes" : "no");
    return true;
}

bool MatroskaParser::ParseFile(const std::string &path, MatroskaDocument &doc)
{
    auto mf = lmshao::lmcore::MappedFile::Open(path);
    if (!mf || !mf->IsValid()) {
        LMSTAMP_LOGW("Cannot open input file: %s", path.c_str());
        return false;
    }
    return ParseBuffer(mf->Data(), mf->Size(), doc);
}

} // namespace lmshao::lmstamp
