/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "lmstamp/media_renamer.h"
#include "test_utils.h"

using namespace lmshao::lmstamp;
using namespace lmstamp_test;
namespace fs = std::filesystem;

class RecordingListener : public IRenameListener {
public:
    void OnResolved(const RenameResult &result) override { resolved.push_back(result); }

    void OnRenamed(const RenameResult &result) override { renamed.push_back(result); }

    void OnError(const std::string &path, StampError code, const std::string &msg) override
    {
        error_paths.push_back(path);
        error_codes.push_back(code);
        error_messages.push_back(msg);
    }

    std::vector<RenameResult> resolved;
    std::vector<RenameResult> renamed;
    std::vector<std::string> error_paths;
    std::vector<StampError> error_codes;
    std::vector<std::string> error_messages;
};

int main()
{
    fs::path dir = TempDir("lmstamp_media_renamer_test");
    Bytes quicktime_mkv = MatroskaFile(
        {InfoWithDate(5), TagsElement({TagBlock({StringTag("com.apple.quicktime.creationdate",
                                                           "2023-04-12T04:19:01+02:00")})})});

    // Dry run reports the new name and leaves the file alone
    {
        fs::path src = WriteFile(dir / "IMG_4792.mkv", quicktime_mkv);
        RenameOptions options;
        options.dry_run = true;
        MediaRenamer renamer(options);
        auto listener = std::make_shared<RecordingListener>();
        renamer.SetListener(listener);

        assert(renamer.Process(src.string()));
        assert(fs::exists(src));
        assert(!fs::exists(dir / "1681265941 IMG_4792.mkv"));
        assert(listener->resolved.size() == 1);
        assert(listener->renamed.size() == 1);
        const RenameResult &r = listener->renamed[0];
        assert(r.kind == ContainerKind::kMatroska);
        assert(r.resolved.unix_seconds == 1681265941);
        assert(r.stamped.unix_seconds == 1681265941);
        assert(r.target_path == (dir / "1681265941 IMG_4792.mkv").string());
        assert(!r.renamed);

        RenameStatistics stats = renamer.GetStatistics();
        assert(stats.processed == 1);
        assert(stats.dry_run == 1);
        assert(stats.renamed == 0);
        assert(stats.failed == 0);
    }

    // Real run with an offset renames the MP4 in place
    {
        fs::path src = WriteFile(dir / "clip.MOV", Mp4File(MvhdV0(3764110741u)));
        RenameOptions options;
        options.offset_seconds = -12600;
        MediaRenamer renamer(options);
        auto listener = std::make_shared<RecordingListener>();
        renamer.SetListener(listener);

        assert(renamer.Process(src.string()));
        fs::path expected = dir / "1681253341 clip.MOV";
        assert(!fs::exists(src));
        assert(fs::exists(expected));
        assert(listener->renamed.size() == 1);
        assert(listener->renamed[0].renamed);
        assert(listener->renamed[0].resolved.unix_seconds == 1681265941);
        assert(listener->renamed[0].kind == ContainerKind::kMp4);
        assert(renamer.GetStatistics().renamed == 1);
        assert(renamer.Options().offset_seconds == -12600);
    }

    // Failures keep the file and carry a reason
    {
        fs::path unknown = WriteFile(dir / "notes.txt", Str("hello"));
        fs::path garbage = WriteFile(dir / "broken.mp4", Str("not an mp4 at all"));
        fs::path dateless = WriteFile(dir / "nodate.mkv", MatroskaFile({InfoWithoutDate()}));
        // last representable second, pushed over by the offset
        uint64_t last_second = static_cast<uint64_t>(kMaxUnixSeconds) + 2082844800ULL;
        fs::path edge = WriteFile(dir / "edge.mp4", Mp4File(MvhdV1(last_second)));

        RenameOptions options;
        options.offset_seconds = 1;
        MediaRenamer renamer(options);
        auto listener = std::make_shared<RecordingListener>();
        renamer.SetListener(listener);

        assert(!renamer.Process(unknown.string()));
        assert(!renamer.Process(garbage.string()));
        assert(!renamer.Process(dateless.string()));
        assert(!renamer.Process(edge.string()));
        assert(!renamer.Process((dir / "missing.mkv").string()));

        assert(fs::exists(unknown) && fs::exists(garbage) && fs::exists(dateless) && fs::exists(edge));
        assert(listener->resolved.empty());
        assert(listener->renamed.empty());
        assert(listener->error_codes.size() == 5);
        assert(listener->error_codes[0] == StampError::kUnrecognizedContainerType);
        assert(listener->error_messages[0] == "unknown file type");
        assert(listener->error_codes[1] == StampError::kContainerParseFailure);
        assert(listener->error_messages[1] == "unable to parse MP4 file");
        assert(listener->error_codes[2] == StampError::kDateNotFound);
        assert(listener->error_messages[2] == "unable to determine creation date");
        assert(listener->error_codes[3] == StampError::kDateNotFound);
        assert(listener->error_messages[3] == "offset moves date out of range");
        assert(listener->error_codes[4] == StampError::kContainerParseFailure);
        assert(listener->error_paths[0] == unknown.string());

        RenameStatistics stats = renamer.GetStatistics();
        assert(stats.processed == 5);
        assert(stats.failed == 5);
    }

    // Rename onto a non-empty directory fails; the file stays and the
    // intended name was already reported
    {
        fs::path src = WriteFile(dir / "blocked.mkv", MatroskaFile({InfoWithDate(2000)}));
        fs::path target = dir / "2000 blocked.mkv";
        fs::create_directories(target);
        WriteFile(target / "keep.txt", Str("x"));

        MediaRenamer renamer(RenameOptions{});
        auto listener = std::make_shared<RecordingListener>();
        renamer.SetListener(listener);

        assert(!renamer.Process(src.string()));
        assert(fs::exists(src));
        assert(fs::is_directory(target));
        assert(listener->resolved.size() == 1);
        assert(listener->resolved[0].target_path == target.string());
        assert(listener->renamed.empty());
        assert(listener->error_codes.size() == 1);
        assert(listener->error_codes[0] == StampError::kRenameFailure);
        const std::string prefix = "unable to rename to " + target.string() + ": ";
        assert(listener->error_messages[0].compare(0, prefix.size(), prefix) == 0);
        assert(listener->error_messages[0].size() > prefix.size());

        RenameStatistics stats = renamer.GetStatistics();
        assert(stats.processed == 1);
        assert(stats.renamed == 0);
        assert(stats.failed == 1);
    }

    // Resolve never touches the filesystem
    {
        fs::path src = WriteFile(dir / "still.mkv", MatroskaFile({InfoWithDate(1000)}));
        MediaRenamer renamer(RenameOptions{});
        RenameResult result;
        std::string message;
        assert(renamer.Resolve(src.string(), result, message) == StampError::kOk);
        assert(result.target_path == (dir / "1000 still.mkv").string());
        assert(fs::exists(src));
        assert(renamer.GetStatistics().processed == 0);
    }

    // Without a listener outcomes are still counted
    {
        fs::path src = WriteFile(dir / "quiet.m4v", Mp4File(MvhdV1(2082844800ULL)));
        MediaRenamer renamer(RenameOptions{});
        assert(renamer.Process(src.string()));
        assert(fs::exists(dir / "0 quiet.m4v"));
        assert(!renamer.Process((dir / "none.avi").string()));
        assert(renamer.GetStatistics().renamed == 1);
        assert(renamer.GetStatistics().failed == 1);
    }

    assert(std::string(StampErrorString(StampError::kDateNotFound)) == "creation date not found");

    fs::remove_all(dir);
    return 0;
}
