#pragma once

#include "fsup/core/error.hpp"
#include "fsup/events/event_bus.hpp"
#include "fsup/share/share_client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fsup::upload {

/**
 * @brief Descends a remote directory path, creating missing segments
 *
 * Segments are processed left to right. Directories created before a
 * failure are left in place.
 */
class DirectoryWalker {
public:
    explicit DirectoryWalker(events::EventBus& bus) : bus_(bus) {}

    /**
     * @brief Split a raw path into its non-empty segments
     *
     * Backslashes count as separators; surrounding whitespace of the whole
     * path is trimmed. "a/b", "a\\b", "/a/b/" and "a//b" all give {"a", "b"}.
     */
    static std::vector<std::string> split_segments(std::string_view raw_path);

    /**
     * @brief Return a handle positioned at @p raw_path below @p root
     *
     * A missing or blank path returns @p root unchanged without any remote
     * call. Remote failures are RemoteIOError.
     */
    UploadResult<std::unique_ptr<share::RemoteDirectory>>
    walk(std::unique_ptr<share::RemoteDirectory> root, const std::optional<std::string>& raw_path) const;

private:
    events::EventBus& bus_;
};

} // namespace fsup::upload
