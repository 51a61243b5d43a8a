/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmstamp/media_renamer.h"

#include <filesystem>
#include <system_error>

#include "internal_logger.h"
#include "lmstamp/container_kind.h"
#include "lmstamp/creation_date.h"
#include "lmstamp/matroska_parser.h"
#include "lmstamp/mp4_parser.h"
#include "lmstamp/path_namer.h"
#include "lmstamp/time_offset.h"

namespace lmshao::lmstamp {

const char *StampErrorString(StampError error)
{
    switch (error) {
        case StampError::kOk:
            return "ok";
        case StampError::kUnrecognizedContainerType:
            return "unrecognized container type";
        case StampError::kContainerParseFailure:
            return "container parse failure";
        case StampError::kDateNotFound:
            return "creation date not found";
        case StampError::kOffsetOutOfRange:
            return "offset out of range";
        case StampError::kRenameFailure:
            return "rename failure";
    }
    return "unknown error";
}

class MediaRenamer::Impl {
public:
    explicit Impl(const RenameOptions &options) : options_(options) {}

    StampError Resolve(const std::string &path, RenameResult &result, std::string &message)
    {
        result = RenameResult{};
        result.source_path = path;

        if (!DetectContainerKind(path, result.kind)) {
            message = "unknown file type";
            return StampError::kUnrecognizedContainerType;
        }

        bool found = false;
        switch (result.kind) {
            case ContainerKind::kMatroska: {
                MatroskaParser parser;
                MatroskaDocument doc;
                if (!parser.ParseFile(path, doc)) {
                    message = "unable to parse Matroska file";
                    return StampError::kContainerParseFailure;
                }
                found = ResolveMatroskaCreationDate(doc, result.resolved);
                break;
            }
            case ContainerKind::kMp4: {
                Mp4Parser parser;
                Mp4MovieHeader mvhd;
                if (!parser.ParseFile(path, mvhd)) {
                    message = "unable to parse MP4 file";
                    return StampError::kContainerParseFailure;
                }
                found = ResolveMp4CreationDate(mvhd, result.resolved);
                break;
            }
        }
        if (!found) {
            message = "unable to determine creation date";
            return StampError::kDateNotFound;
        }

        if (!ApplyOffset(result.resolved, options_.offset_seconds, result.stamped)) {
            message = "offset moves date out of range";
            return StampError::kDateNotFound;
        }
        result.target_path = StampedPath(path, result.stamped);
        return StampError::kOk;
    }

    bool Process(const std::string &path)
    {
        ++statistics_.processed;
        RenameResult result;
        std::string message;
        StampError err = Resolve(path, result, message);
        if (err != StampError::kOk) {
            Fail(path, err, message);
            return false;
        }
        if (listener_) {
            listener_->OnResolved(result);
        }

        if (options_.dry_run) {
            LMSTAMP_LOGD("Dry run: %s -> %s", path.c_str(), result.target_path.c_str());
            ++statistics_.dry_run;
        } else {
            std::error_code ec;
            std::filesystem::rename(path, result.target_path, ec);
            if (ec) {
                Fail(path, StampError::kRenameFailure,
                     "unable to rename to " + result.target_path + ": " + ec.message());
                return false;
            }
            result.renamed = true;
            ++statistics_.renamed;
            LMSTAMP_LOGI("Renamed %s -> %s", path.c_str(), result.target_path.c_str());
        }
        if (listener_) {
            listener_->OnRenamed(result);
        }
        return true;
    }

    void SetListener(const std::shared_ptr<IRenameListener> &listener) { listener_ = listener; }
    const RenameOptions &Options() const { return options_; }
    RenameStatistics GetStatistics() const { return statistics_; }

private:
    void Fail(const std::string &path, StampError code, const std::string &message)
    {
        ++statistics_.failed;
        LMSTAMP_LOGD("%s: %s (%s)", path.c_str(), message.c_str(), StampErrorString(code));
        if (listener_) {
            listener_->OnError(path, code, message);
        }
    }

    RenameOptions options_;
    std::shared_ptr<IRenameListener> listener_;
    RenameStatistics statistics_;
};

MediaRenamer::MediaRenamer(const RenameOptions &options) : impl_(new Impl(options)) {}

MediaRenamer::~MediaRenamer() = default;

void MediaRenamer::SetListener(const std::shared_ptr<IRenameListener> &listener)
{
    impl_->SetListener(listener);
}

StampError MediaRenamer::Resolve(const std::string &path, RenameResult &result, std::string &message)
{
    return impl_->Resolve(path, result, message);
}

bool MediaRenamer::Process(const std::string &path)
{
    return impl_->Process(path);
}

const RenameOptions &MediaRenamer::Options() const
{
    return impl_->Options();
}

RenameStatistics MediaRenamer::GetStatistics() const
{
    return impl_->GetStatistics();
}

} // namespace lmshao::lmstamp
