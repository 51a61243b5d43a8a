/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_MP4_PARSER_H
#define LMSHAO_LMSTAMP_MP4_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace lmshao::lmstamp {

// Build a box type from its four characters, e.g. Fourcc("moov").
constexpr uint32_t Fourcc(const char (&s)[5])
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(s[0])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(s[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(s[2])) << 8) | static_cast<uint32_t>(static_cast<uint8_t>(s[3]));
}

std::string FourccToString(uint32_t type);

struct Mp4BoxHeader {
    uint32_t type = 0;
    uint64_t size = 0;   // total box size including header
    uint64_t offset = 0; // offset of the box in the buffer
    uint32_t header_size = 0;
};

// Fields of the movie header box (moov/mvhd). Times count seconds since
// 1904-01-01T00:00:00Z.
struct Mp4MovieHeader {
    uint8_t version = 0;
    uint64_t creation_time = 0;
    uint64_t modification_time = 0;
    uint32_t timescale = 0;
    uint64_t duration = 0;
};

class Mp4Parser {
public:
    Mp4Parser() = default;
    // Locate moov/mvhd in a memory buffer
    bool ParseBuffer(const uint8_t *data, size_t size, Mp4MovieHeader &mvhd);
    // Map the file read-only and parse it
    bool ParseFile(const std::string &path, Mp4MovieHeader &mvhd);
};

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_MP4_PARSER_H
