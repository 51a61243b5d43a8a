/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <string>

#include "lmcore/mapped_file.h"
#include "lmstamp/container_kind.h"
#include "lmstamp/creation_date.h"
#include "lmstamp/matroska_parser.h"
#include "lmstamp/mp4_parser.h"

using namespace lmshao::lmstamp;

static int DumpMatroska(const uint8_t *data, size_t size, const std::string &path)
{
    MatroskaParser parser;
    MatroskaDocument doc;
    if (!parser.ParseBuffer(data, size, doc)) {
        printf("Parse failed for: %s\n", path.c_str());
        return 3;
    }

    printf("DocType: %s\n", doc.info.doc_type.c_str());
    printf("TimecodeScale(ns): %llu\n", (unsigned long long)doc.info.timecode_scale_ns);
    printf("Duration(s): %.3f\n", doc.info.duration_seconds);
    if (!doc.info.title.empty())
        printf("Title: %s\n", doc.info.title.c_str());
    printf("MuxingApp: %s\n", doc.info.muxing_app.c_str());
    printf("WritingApp: %s\n", doc.info.writing_app.c_str());
    printf("DateUTC: %s\n", doc.info.has_date_utc ? FormatIso8601(doc.info.date_utc).c_str() : "(none)");
    for (size_t i = 0; i < doc.tags.size(); ++i) {
        for (const auto &simple : doc.tags[i].simple_tags) {
            if (simple.value_type == TagValueType::kString) {
                printf("Tag[%zu] %s = %s\n", i, simple.name.c_str(), simple.string_value.c_str());
            } else if (simple.value_type == TagValueType::kBinary) {
                printf("Tag[%zu] %s = <%zu bytes>\n", i, simple.name.c_str(), simple.binary_value.size());
            } else {
                printf("Tag[%zu] %s\n", i, simple.name.c_str());
            }
        }
    }

    Timestamp ts;
    if (ResolveMatroskaCreationDate(doc, ts)) {
        printf("Creation date: %s (%lld)\n", FormatIso8601(ts).c_str(), (long long)ts.unix_seconds);
    } else {
        printf("Creation date: (none)\n");
    }
    return 0;
}

static int DumpMp4(const uint8_t *data, size_t size, const std::string &path)
{
    Mp4Parser parser;
    Mp4MovieHeader mvhd;
    if (!parser.ParseBuffer(data, size, mvhd)) {
        printf("Parse failed for: %s\n", path.c_str());
        return 3;
    }

    printf("mvhd version: %u\n", (unsigned)mvhd.version);
    printf("creation_time: %llu\n", (unsigned long long)mvhd.creation_time);
    printf("modification_time: %llu\n", (unsigned long long)mvhd.modification_time);
    printf("timescale: %u\n", mvhd.timescale);
    if (mvhd.timescale > 0)
        printf("Duration(s): %.3f\n", (double)mvhd.duration / mvhd.timescale);

    Timestamp ts;
    if (ResolveMp4CreationDate(mvhd, ts)) {
        printf("Creation date: %s (%lld)\n", FormatIso8601(ts).c_str(), (long long)ts.unix_seconds);
    } else {
        printf("Creation date: (out of range)\n");
    }
    return 0;
}

int main(int argc, char **argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <input.mkv|input.mp4>\n", argv[0]);
        return 1;
    }

    const std::string path = argv[1];
    ContainerKind kind;
    if (!DetectContainerKind(path, kind)) {
        printf("Unknown file type: %s\n", path.c_str());
        return 2;
    }

    auto mf = lmshao::lmcore::MappedFile::Open(path);
    if (!mf || !mf->IsValid()) {
        printf("Cannot open input file: %s\n", path.c_str());
        return 2;
    }

    printf("Container: %s\n", ContainerKindName(kind));
    if (kind == ContainerKind::kMatroska) {
        return DumpMatroska(mf->Data(), mf->Size(), path);
    }
    return DumpMp4(mf->Data(), mf->Size(), path);
}
