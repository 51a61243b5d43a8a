/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_BUFFER_CURSOR_H
#define LMSHAO_LMSTAMP_BUFFER_CURSOR_H

#include <cstddef>
#include <cstdint>

namespace lmshao::lmstamp {

// Buffer-only cursor for sequential reading over memory
struct BufferCursor {
    const uint8_t *data_;
    size_t size_;
    size_t pos_;
    BufferCursor(const uint8_t *d, size_t s) : data_(d), size_(s), pos_(0) {}
    size_t Read(uint8_t *dst, size_t n)
    {
        size_t remain = Remaining();
        size_t to_read = n < remain ? n : remain;
        if (to_read > 0) {
            for (size_t i = 0; i < to_read; ++i)
                dst[i] = data_[pos_ + i];
            pos_ += to_read;
        }
        return to_read;
    }
    bool Seek(size_t offset)
    {
        if (offset > size_)
            return false;
        pos_ = offset;
        return true;
    }
    size_t Tell() const { return pos_; }
    size_t Size() const { return size_; }
    size_t Remaining() const { return (pos_ < size_) ? (size_ - pos_) : 0; }
};

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_BUFFER_CURSOR_H
