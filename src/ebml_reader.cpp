/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/ebml_reader.h"

#include <cstring>
#include <utility>

#include "internal_logger.h"
#include "lmcore/byte_order.h"

namespace lmshao::lmstamp {

// EBML varint width detection: leading 1 bit mask across first byte
static inline int DetectVintWidth(uint8_t first)
{
    for (int i = 0; i < 8; ++i) {
        if (first & (0x80 >> i)) {
            return i + 1; // width in bytes
        }
    }
    return -1; // invalid
}

static inline size_t ReadBytes(BufferCursor &cur, uint8_t *dst, size_t n)
{
    size_t r = cur.Read(dst, n);
    if (r != n) {
        LMSTAMP_LOGW("Failed to read %zu bytes, got %zu", n, r);
    }
    return r;
}

size_t ReadVintId(BufferCursor &cur, uint64_t &value)
{
    uint8_t b0 = 0;
    if (ReadBytes(cur, &b0, 1) != 1) {
        return 0;
    }
    int width = DetectVintWidth(b0);
    if (width <= 0) {
        LMSTAMP_LOGW("Invalid EBML ID leading byte: 0x%02X", b0);
        return 0;
    }
    uint64_t v = b0;
    for (int i = 1; i < width; ++i) {
        uint8_t bi = 0;
        if (ReadBytes(cur, &bi, 1) != 1) {
            return 0;
        }
        v = (v << 8) | bi;
    }
    value = v;
    return static_cast<size_t>(width);
}

size_t ReadVintSize(BufferCursor &cur, uint64_t &value)
{
    uint8_t b0 = 0;
    if (ReadBytes(cur, &b0, 1) != 1) {
        return 0;
    }
    int width = DetectVintWidth(b0);
    if (width <= 0) {
        LMSTAMP_LOGW("Invalid EBML size leading byte: 0x%02X", b0);
        return 0;
    }
    // strip leading 1-bit
    uint64_t v = static_cast<uint64_t>(b0 & (0xFF >> width));
    for (int i = 1; i < width; ++i) {
        uint8_t bi = 0;
        if (ReadBytes(cur, &bi, 1) != 1) {
            return 0;
        }
        v = (v << 8) | bi;
    }
    const uint64_t all_ones = (1ULL << (7 * width)) - 1;
    value = (v == all_ones) ? kEbmlUnknownSize : v;
    return static_cast<size_t>(width);
}

bool NextElement(BufferCursor &cur, EbmlElementHeader &out)
{
    uint64_t id = 0;
    size_t id_len = ReadVintId(cur, id);
    if (id_len == 0) {
        return false;
    }
    uint64_t size = 0;
    size_t size_len = ReadVintSize(cur, size);
    if (size_len == 0) {
        return false;
    }
    out.id = id;
    out.size = size;
    return true;
}

size_t PayloadEnd(const BufferCursor &cur, const EbmlElementHeader &hdr, size_t limit)
{
    size_t start = cur.Tell();
    if (start >= limit) {
        return limit;
    }
    if (hdr.IsUnknownSize() || hdr.size > static_cast<uint64_t>(limit - start)) {
        if (!hdr.IsUnknownSize()) {
            LMSTAMP_LOGW("Element 0x%llX size=%llu runs past parent, clamping to %zu", (unsigned long long)hdr.id,
                         (unsigned long long)hdr.size, limit - start);
        }
        return limit;
    }
    return start + static_cast<size_t>(hdr.size);
}

bool SkipBytes(BufferCursor &cur, uint64_t n)
{
    if (n > static_cast<uint64_t>(cur.Remaining())) {
        return false;
    }
    return cur.Seek(cur.Tell() + static_cast<size_t>(n));
}

bool ReadUnsigned(BufferCursor &cur, uint64_t size, uint64_t &value)
{
    if (size > 8) {
        LMSTAMP_LOGW("Unsigned integer too wide: %llu bytes", (unsigned long long)size);
        return false;
    }
    uint8_t buf[8] = {0};
    if (ReadBytes(cur, buf, static_cast<size_t>(size)) != size) {
        return false;
    }
    uint64_t v = 0;
    for (size_t i = 0; i < size; ++i) {
        v = (v << 8) | buf[i];
    }
    value = v;
    return true;
}

bool ReadSigned(BufferCursor &cur, uint64_t size, int64_t &value)
{
    uint64_t raw = 0;
    if (!ReadUnsigned(cur, size, raw)) {
        return false;
    }
    if (size > 0 && size < 8) {
        // sign-extend from the top bit of the stored width
        const uint64_t sign_bit = 1ULL << (size * 8 - 1);
        if (raw & sign_bit) {
            raw |= ~((sign_bit << 1) - 1);
        }
    }
    value = static_cast<int64_t>(raw);
    return true;
}

bool ReadFloat(BufferCursor &cur, uint64_t size, double &value)
{
    using lmshao::lmcore::ByteOrder;
    uint8_t buf[8] = {0};
    if (size == 0) {
        value = 0.0;
        return true;
    }
    if (size != 4 && size != 8) {
        LMSTAMP_LOGW("Unsupported float size: %llu", (unsigned long long)size);
        return false;
    }
    if (ReadBytes(cur, buf, static_cast<size_t>(size)) != size) {
        return false;
    }
    if (size == 4) {
        uint32_t bits = ByteOrder::ReadBE32(buf);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        value = static_cast<double>(f);
    } else {
        uint64_t bits = ByteOrder::ReadBE64(buf);
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        value = d;
    }
    return true;
}

bool ReadString(BufferCursor &cur, uint64_t size, std::string &value)
{
    if (size > static_cast<uint64_t>(cur.Remaining())) {
        LMSTAMP_LOGW("String payload size=%llu exceeds remaining %zu", (unsigned long long)size, cur.Remaining());
        return false;
    }
    std::string s(static_cast<size_t>(size), '\0');
    if (size > 0) {
        ReadBytes(cur, reinterpret_cast<uint8_t *>(&s[0]), s.size());
    }
    // strings may be zero-padded
    while (!s.empty() && s.back() == '\0') {
        s.pop_back();
    }
    value = std::move(s);
    return true;
}

bool ReadBinary(BufferCursor &cur, uint64_t size, std::vector<uint8_t> &value)
{
    if (size > static_cast<uint64_t>(cur.Remaining())) {
        LMSTAMP_LOGW("Binary payload size=%llu exceeds remaining %zu", (unsigned long long)size, cur.Remaining());
        return false;
    }
    value.resize(static_cast<size_t>(size));
    if (size > 0) {
        ReadBytes(cur, value.data(), value.size());
    }
    return true;
}

} // namespace lmshao::lmstamp
