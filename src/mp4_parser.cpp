/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/mp4_parser.h"

#include "internal_logger.h"
#include "lmcore/byte_order.h"
#include "lmcore/mapped_file.h"
#include "lmstamp/buffer_cursor.h"

namespace lmshao::lmstamp {

using lmshao::lmcore::ByteOrder;

static constexpr uint32_t kBoxHeaderSize = 8;
static constexpr uint32_t kLargeBoxHeaderSize = 16;
static constexpr uint64_t kMvhdV0PayloadSize = 4 + 4 * 4;         // version/flags + 4x u32
static constexpr uint64_t kMvhdV1PayloadSize = 4 + 8 + 8 + 4 + 8; // version/flags + u64 u64 u32 u64

std::string FourccToString(uint32_t type)
{
    std::string s(4, ' ');
    for (int i = 0; i < 4; ++i) {
        char c = static_cast<char>((type >> (24 - 8 * i)) & 0xFF);
        s[i] = (c >= 0x20 && c <= 0x7E) ? c : '.';
    }
    return s;
}

static bool ReadU32(BufferCursor &cur, uint32_t &value)
{
    uint8_t b[4];
    if (cur.Read(b, 4) != 4) {
        return false;
    }
    value = ByteOrder::ReadBE32(b);
    return true;
}

static bool ReadU64(BufferCursor &cur, uint64_t &value)
{
    uint8_t b[8];
    if (cur.Read(b, 8) != 8) {
        return false;
    }
    value = ByteOrder::ReadBE64(b);
    return true;
}

// Read size + type (+ largesize) and validate the box against its parent end.
static bool ReadBoxHeader(BufferCursor &cur, size_t parent_end, Mp4BoxHeader &box)
{
    box.offset = cur.Tell();
    uint32_t size32 = 0;
    if (!ReadU32(cur, size32) || !ReadU32(cur, box.type)) {
        LMSTAMP_LOGW("Truncated box header at offset %llu", (unsigned long long)box.offset);
        return false;
    }
    box.header_size = kBoxHeaderSize;
    if (size32 == 1) {
        // 64-bit extended size
        if (!ReadU64(cur, box.size)) {
            LMSTAMP_LOGW("Truncated largesize for box %s", FourccToString(box.type).c_str());
            return false;
        }
        box.header_size = kLargeBoxHeaderSize;
    } else if (size32 == 0) {
        // box extends to the end of its parent
        box.size = parent_end - box.offset;
    } else {
        box.size = size32;
    }

    if (box.size < box.header_size) {
        LMSTAMP_LOGW("Box %s size %llu smaller than its header", FourccToString(box.type).c_str(),
                     (unsigned long long)box.size);
        return false;
    }
    if (box.size > static_cast<uint64_t>(parent_end - box.offset)) {
        LMSTAMP_LOGW("Box %s size %llu at offset %llu runs past parent end %zu", FourccToString(box.type).c_str(),
                     (unsigned long long)box.size, (unsigned long long)box.offset, parent_end);
        return false;
    }
    return true;
}

static bool ParseMvhd(BufferCursor &cur, uint64_t payload_size, Mp4MovieHeader &mvhd)
{
    uint32_t version_flags = 0;
    if (payload_size < 4 || !ReadU32(cur, version_flags)) {
        LMSTAMP_LOGW("mvhd too short: %llu", (unsigned long long)payload_size);
        return false;
    }
    mvhd.version = static_cast<uint8_t>(version_flags >> 24);
    if (mvhd.version == 1) {
        if (payload_size < kMvhdV1PayloadSize) {
            LMSTAMP_LOGW("mvhd v1 too short: %llu", (unsigned long long)payload_size);
            return false;
        }
        return ReadU64(cur, mvhd.creation_time) && ReadU64(cur, mvhd.modification_time) &&
               ReadU32(cur, mvhd.timescale) && ReadU64(cur, mvhd.duration);
    }
    if (mvhd.version == 0) {
        if (payload_size < kMvhdV0PayloadSize) {
            LMSTAMP_LOGW("mvhd v0 too short: %llu", (unsigned long long)payload_size);
            return false;
        }
        uint32_t creation = 0;
        uint32_t modification = 0;
        uint32_t duration = 0;
        if (!ReadU32(cur, creation) || !ReadU32(cur, modification) || !ReadU32(cur, mvhd.timescale) ||
            !ReadU32(cur, duration)) {
            return false;
        }
        mvhd.creation_time = creation;
        mvhd.modification_time = modification;
        mvhd.duration = duration;
        return true;
    }
    LMSTAMP_LOGW("Unsupported mvhd version %u", (unsigned)mvhd.version);
    return false;
}

static bool ParseMoov(BufferCursor &cur, size_t moov_end, Mp4MovieHeader &mvhd)
{
    while (cur.Tell() + kBoxHeaderSize <= moov_end) {
        Mp4BoxHeader child;
        if (!ReadBoxHeader(cur, moov_end, child)) {
            return false;
        }
        uint64_t payload_size = child.size - child.header_size;
        LMSTAMP_LOGD("moov child=%s size=%llu", FourccToString(child.type).c_str(), (unsigned long long)child.size);
        if (child.type == Fourcc("mvhd")) {
            return ParseMvhd(cur, payload_size, mvhd);
        }
        cur.Seek(static_cast<size_t>(child.offset + child.size));
    }
    LMSTAMP_LOGW("mvhd not found in moov");
    return false;
}

bool Mp4Parser::ParseBuffer(const uint8_t *data, size_t size, Mp4MovieHeader &mvhd)
{
    BufferCursor cur(data, size);
    while (cur.Remaining() >= kBoxHeaderSize) {
        Mp4BoxHeader box;
        if (!ReadBoxHeader(cur, cur.Size(), box)) {
            return false;
        }
        LMSTAMP_LOGD("box=%s size=%llu offset=%llu", FourccToString(box.type).c_str(), (unsigned long long)box.size,
                     (unsigned long long)box.offset);
        if (box.type == Fourcc("moov")) {
            if (!ParseMoov(cur, static_cast<size_t>(box.offset + box.size), mvhd)) {
                return false;
            }
            LMSTAMP_LOGI("Parsed MP4: mvhd v%u creation_time=%llu timescale=%u duration=%llu", (unsigned)mvhd.version,
                         (unsigned long long)mvhd.creation_time, mvhd.timescale, (unsigned long long)mvhd.duration);
            return true;
        }
        // mdat, ftyp, free and the rest are skipped
        cur.Seek(static_cast<size_t>(box.offset + box.size));
    }
    LMSTAMP_LOGW("moov not found");
    return false;
}

bool Mp4Parser::ParseFile(const std::string &path, Mp4MovieHeader &mvhd)
{
    auto mf = lmshao::lmcore::MappedFile::Open(path);
    if (!mf || !mf->IsValid()) {
        LMSTAMP_LOGW("Cannot open input file: %s", path.c_str());
        return false;
    }
    return ParseBuffer(mf->Data(), mf->Size(), mvhd);
}

} // namespace lmshao::lmstamp
