/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMSTAMP_MATROSKA_PARSER_H
#define LMSHAO_LMSTAMP_MATROSKA_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "lmstamp/timestamp.h"

namespace lmshao::lmstamp {

enum class TagValueType {
    kNone,   // SimpleTag without TagString/TagBinary
    kString, // TagString (UTF-8)
    kBinary, // TagBinary
};

struct MatroskaSimpleTag {
    std::string name;
    TagValueType value_type = TagValueType::kNone;
    std::string string_value;
    std::vector<uint8_t> binary_value;
};

// One Tag element; SimpleTags keep their stored order.
struct MatroskaTag {
    std::vector<MatroskaSimpleTag> simple_tags;
};

struct MatroskaInfo {
    std::string doc_type;
    uint64_t timecode_scale_ns = 1000000;
    double duration_seconds = 0.0;
    std::string title;
    std::string muxing_app;
    std::string writing_app;
    // Segment DateUTC, present only if the element was stored
    bool has_date_utc = false;
    Timestamp date_utc;
};

struct MatroskaDocument {
    MatroskaInfo info;
    std::vector<MatroskaTag> tags;
};

class MatroskaParser {
public:
    MatroskaParser() = default;
    // Parse from memory buffer without IO
    bool ParseBuffer(const uint8_t *data, size_t size, MatroskaDocument &doc);
    // Map the file read-only and parse it
    bool ParseFile(const std::string &path, MatroskaDocument &doc);
};

} // namespace lmshao::lmstamp

#endif // LMSHAO_LMSTAMP_MATROSKA_PARSER_H
