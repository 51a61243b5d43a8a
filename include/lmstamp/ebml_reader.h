/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_EBML_READER_H
#define LMSHAO_LMSTAMP_EBML_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "lmstamp/buffer_cursor.h"

namespace lmshao::lmstamp {

// Size value reported for elements whose size field has all value bits set.
static constexpr uint64_t kEbmlUnknownSize = ~0ULL;

struct EbmlElementHeader {
    uint64_t id;
    uint64_t size;
    bool IsUnknownSize() const { return size == kEbmlUnknownSize; }
};

// Read EBML varint for element ID; keeps leading 1-bit.
size_t ReadVintId(BufferCursor &cur, uint64_t &value);

// Read EBML varint for element size; strips leading 1-bit.
// An all-ones value is reported as kEbmlUnknownSize.
size_t ReadVintSize(BufferCursor &cur, uint64_t &value);

// Parse next element header from current position.
bool NextElement(BufferCursor &cur, EbmlElementHeader &out);

// End offset of a payload starting at the cursor, clamped to `limit`.
// Unknown sizes extend to `limit`.
size_t PayloadEnd(const BufferCursor &cur, const EbmlElementHeader &hdr, size_t limit);

// Advance the cursor by n bytes; fails without moving if n runs past the buffer.
bool SkipBytes(BufferCursor &cur, uint64_t n);

// Typed payload readers. `size` is the element payload size.
bool ReadUnsigned(BufferCursor &cur, uint64_t size, uint64_t &value);
bool ReadSigned(BufferCursor &cur, uint64_t size, int64_t &value);
bool ReadFloat(BufferCursor &cur, uint64_t size, double &value);
bool ReadString(BufferCursor &cur, uint64_t size, std::string &value);
bool ReadBinary(BufferCursor &cur, uint64_t size, std::vector<uint8_t> &value);

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_EBML_READER_H
