/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>

#include "lmstamp/mp4_parser.h"
#include "test_utils.h"

using namespace lmshao::lmstamp;
using namespace lmstamp_test;

static bool Parse(const Bytes &data, Mp4MovieHeader &mvhd)
{
    Mp4Parser parser;
    return parser.ParseBuffer(data.data(), data.size(), mvhd);
}

int main()
{
    assert(Fourcc("moov") == 0x6D6F6F76u);
    assert(FourccToString(Fourcc("mvhd")) == "mvhd");
    assert(FourccToString(0x00616263u) == ".abc");

    // Version 0, moov after mdat
    {
        Mp4MovieHeader mvhd;
        assert(Parse(Mp4File(MvhdV0(3764110741u)), mvhd));
        assert(mvhd.version == 0);
        assert(mvhd.creation_time == 3764110741u);
        assert(mvhd.modification_time == 3764110741u);
        assert(mvhd.timescale == 600);
        assert(mvhd.duration == 6000);
    }

    // Version 1 uses 64-bit times
    {
        Mp4MovieHeader mvhd;
        assert(Parse(Mp4File(MvhdV1(0x100000000ULL)), mvhd));
        assert(mvhd.version == 1);
        assert(mvhd.creation_time == 0x100000000ULL);
        assert(mvhd.timescale == 1000);
        assert(mvhd.duration == 5000);
    }

    // 64-bit largesize on mdat and moov
    {
        Bytes file = Ftyp();
        AppendLargeBox(file, "mdat", Bytes(32, 0));
        AppendLargeBox(file, "moov", MvhdV0(2082844800u));
        Mp4MovieHeader mvhd;
        assert(Parse(file, mvhd));
        assert(mvhd.creation_time == 2082844800u);
    }

    // size 0: last box runs to the end of the file
    {
        Bytes file = Ftyp();
        WriteU32(file, 0);
        Bytes moov = Str("moov");
        file.insert(file.end(), moov.begin(), moov.end());
        Bytes mvhd_box = MvhdV0(5);
        file.insert(file.end(), mvhd_box.begin(), mvhd_box.end());
        Mp4MovieHeader mvhd;
        assert(Parse(file, mvhd));
        assert(mvhd.creation_time == 5);
    }

    // No moov
    {
        Bytes file = Concat({Ftyp(), Box("mdat", Bytes(8, 0))});
        Mp4MovieHeader mvhd;
        assert(!Parse(file, mvhd));
    }

    // moov without mvhd
    {
        Bytes file = Concat({Ftyp(), Box("moov", Box("trak", Bytes(4, 0)))});
        Mp4MovieHeader mvhd;
        assert(!Parse(file, mvhd));
    }

    // Box claims more bytes than the file holds
    {
        Bytes file = Ftyp();
        WriteU32(file, 4096);
        Bytes type = Str("mdat");
        file.insert(file.end(), type.begin(), type.end());
        Mp4MovieHeader mvhd;
        assert(!Parse(file, mvhd));
    }

    // Box smaller than its own header
    {
        Bytes file;
        WriteU32(file, 4);
        Bytes type = Str("free");
        file.insert(file.end(), type.begin(), type.end());
        Mp4MovieHeader mvhd;
        assert(!Parse(file, mvhd));
    }

    // Unsupported mvhd version and truncated mvhd
    {
        Bytes p;
        WriteU32(p, 0x02000000);
        p.resize(100, 0);
        Mp4MovieHeader mvhd;
        assert(!Parse(Mp4File(Box("mvhd", p)), mvhd));

        Bytes short_v0;
        WriteU32(short_v0, 0);
        WriteU32(short_v0, 1);
        assert(!Parse(Mp4File(Box("mvhd", short_v0)), mvhd));
    }

    // Through a mapped file
    {
        auto dir = TempDir("lmstamp_mp4_parser_test");
        auto path = WriteFile(dir / "clip.mov", Mp4File(MvhdV0(3764110741u)));
        Mp4Parser parser;
        Mp4MovieHeader mvhd;
        assert(parser.ParseFile(path.string(), mvhd));
        assert(mvhd.creation_time == 3764110741u);
        assert(!parser.ParseFile((dir / "missing.mov").string(), mvhd));
        std::filesystem::remove_all(dir);
    }

    return 0;
}
