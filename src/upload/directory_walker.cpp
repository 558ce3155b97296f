#include "fsup/upload/directory_walker.hpp"

#include "fsup/core/text.hpp"
#include "fsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace fsup::upload {

using share::RemoteDirectory;

std::vector<std::string> DirectoryWalker::split_segments(std::string_view raw_path) {
    std::string normalized(raw_path);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    normalized = text::trim(normalized);

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= normalized.size()) {
        const auto slash = normalized.find('/', start);
        const auto end = slash == std::string::npos ? normalized.size() : slash;
        if (end > start) {
            segments.push_back(normalized.substr(start, end - start));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

UploadResult<std::unique_ptr<RemoteDirectory>>
DirectoryWalker::walk(std::unique_ptr<RemoteDirectory> root, const std::optional<std::string>& raw_path) const {
    using DirectoryPtr = std::unique_ptr<RemoteDirectory>;

    if (text::is_missing(raw_path)) {
        return fsup::Ok<DirectoryPtr, UploadError>(std::move(root));
    }

    DirectoryPtr current = std::move(root);
    for (const auto& segment : split_segments(*raw_path)) {
        auto next = fsup::capture_handle(ErrorKind::RemoteIO, [&] { return current->subdirectory(segment); });
        if (next.is_error()) {
            return fsup::Err<DirectoryPtr>(UploadError{
                ErrorKind::RemoteIO,
                "Failed to open directory '" + share::join_share_path(current->path(), segment) + "': " +
                    next.error().detail});
        }
        current = std::move(next.value());

        auto exists = fsup::capture(ErrorKind::RemoteIO, [&] { return current->exists(); });
        if (exists.is_error()) {
            return fsup::Err<DirectoryPtr>(UploadError{
                ErrorKind::RemoteIO,
                "Failed to check directory '" + current->path() + "': " + exists.error().detail});
        }
        if (exists.value()) {
            continue;
        }

        auto created = fsup::capture(ErrorKind::RemoteIO, [&] { return current->create(); });
        if (created.is_error()) {
            return fsup::Err<DirectoryPtr>(UploadError{
                ErrorKind::RemoteIO,
                "Failed to create directory '" + current->path() + "': " + created.error().detail});
        }
        spdlog::debug("Created remote directory '{}'", current->path());
        bus_.emit(events::DirectoryCreatedEvent{current->path()});
    }

    return fsup::Ok<DirectoryPtr, UploadError>(std::move(current));
}

} // namespace fsup::upload
