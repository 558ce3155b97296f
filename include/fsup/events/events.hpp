/**
 * @file events.hpp
 * @brief Events emitted by the upload pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: DirectoryCreatedEvent, ChunkWrittenEvent.
 *
 * No event carries the access token or the endpoint built from it.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fsup::events {

// ════════════════════════════════════════════════════════
// Upload lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the request passed validation and a credential was resolved
 *
 * WHO EMITS: UploadService
 * WHO SUBSCRIBES: LoggerComponent
 */
struct UploadStartedEvent {
    std::int64_t document_id = 0;
    std::string share_name;
    std::string target_path;   ///< Share-relative directory path + file name
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the whole pipeline succeeded
 */
struct UploadCompletedEvent {
    std::int64_t document_id = 0;
    std::string target_path;
    std::uint64_t bytes_written = 0;
    std::uint32_t chunks_written = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when any stage failed; message is the reported "<kind>: <detail>"
 */
struct UploadFailedEvent {
    std::int64_t document_id = 0;
    std::string file_name;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Remote share changes
// ════════════════════════════════════════════════════════

struct DirectoryCreatedEvent {
    std::string directory_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// A pre-existing target file was deleted before the new upload
struct RemoteFileReplacedEvent {
    std::string file_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RemoteFileAllocatedEvent {
    std::string file_path;
    std::uint64_t allocated_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Streaming
// ════════════════════════════════════════════════════════

struct ChunkWrittenEvent {
    std::string file_path;
    std::uint32_t chunk_index = 0;
    std::uint64_t chunk_bytes = 0;
    std::uint64_t total_written = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Bytes streamed differ from the size allocated up front
 *
 * Happens when the repository reported a stale or missing size. Diagnostic
 * only; the upload outcome is not changed.
 */
struct SizeMismatchEvent {
    std::string file_path;
    std::uint64_t allocated_bytes = 0;
    std::uint64_t bytes_written = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace fsup::events
