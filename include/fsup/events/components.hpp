/**
 * @file components.hpp
 * @brief Observers of upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadService service(..., bus);
 * service.upload(request);   // logged and counted
 * metrics.print_stats();
 *
 * Both components unsubscribe in their destructor, so they may be shorter
 * lived than the bus.
 */

#pragma once

#include "fsup/events/event_bus.hpp"
#include "fsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace fsup::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Per-chunk and per-directory events log at debug, lifecycle events at info.
 * Failures are logged by UploadService itself.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        started_id_ = bus_.subscribe<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] document={} share={} target={}",
                         e.document_id, e.share_name, e.target_path);
        });

        directory_id_ = bus_.subscribe<DirectoryCreatedEvent>([](const DirectoryCreatedEvent& e) {
            spdlog::debug("[DirectoryCreated] path={}", e.directory_path);
        });

        replaced_id_ = bus_.subscribe<RemoteFileReplacedEvent>([](const RemoteFileReplacedEvent& e) {
            spdlog::info("[FileReplaced] path={} (existing file deleted)", e.file_path);
        });

        allocated_id_ = bus_.subscribe<RemoteFileAllocatedEvent>([](const RemoteFileAllocatedEvent& e) {
            spdlog::debug("[FileAllocated] path={} bytes={}", e.file_path, e.allocated_bytes);
        });

        chunk_id_ = bus_.subscribe<ChunkWrittenEvent>([](const ChunkWrittenEvent& e) {
            spdlog::debug("[ChunkWritten] path={} chunk={} bytes={} total={}",
                          e.file_path, e.chunk_index, e.chunk_bytes, e.total_written);
        });

        mismatch_id_ = bus_.subscribe<SizeMismatchEvent>([](const SizeMismatchEvent& e) {
            spdlog::warn("[SizeMismatch] path={} allocated={} written={}",
                         e.file_path, e.allocated_bytes, e.bytes_written);
        });

        completed_id_ = bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] document={} target={} bytes={} chunks={} duration={}ms",
                         e.document_id, e.target_path, e.bytes_written, e.chunks_written,
                         e.duration.count());
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<UploadStartedEvent>(started_id_);
        bus_.unsubscribe<DirectoryCreatedEvent>(directory_id_);
        bus_.unsubscribe<RemoteFileReplacedEvent>(replaced_id_);
        bus_.unsubscribe<RemoteFileAllocatedEvent>(allocated_id_);
        bus_.unsubscribe<ChunkWrittenEvent>(chunk_id_);
        bus_.unsubscribe<SizeMismatchEvent>(mismatch_id_);
        bus_.unsubscribe<UploadCompletedEvent>(completed_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    EventBus::HandlerId started_id_ = 0;
    EventBus::HandlerId directory_id_ = 0;
    EventBus::HandlerId replaced_id_ = 0;
    EventBus::HandlerId allocated_id_ = 0;
    EventBus::HandlerId chunk_id_ = 0;
    EventBus::HandlerId mismatch_id_ = 0;
    EventBus::HandlerId completed_id_ = 0;
};

/**
 * @brief Counts upload activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Uploads: {}", stats.uploads_succeeded.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> uploads_succeeded{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> directories_created{0};
        std::atomic<std::uint64_t> files_replaced{0};
        std::atomic<std::uint64_t> chunks_written{0};
        std::atomic<std::uint64_t> bytes_written{0};
        std::atomic<std::uint64_t> size_mismatches{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        completed_id_ = bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_succeeded++;
        });

        failed_id_ = bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        directory_id_ = bus_.subscribe<DirectoryCreatedEvent>([this](const DirectoryCreatedEvent&) {
            stats_.directories_created++;
        });

        replaced_id_ = bus_.subscribe<RemoteFileReplacedEvent>([this](const RemoteFileReplacedEvent&) {
            stats_.files_replaced++;
        });

        chunk_id_ = bus_.subscribe<ChunkWrittenEvent>([this](const ChunkWrittenEvent& e) {
            stats_.chunks_written++;
            stats_.bytes_written += e.chunk_bytes;
        });

        mismatch_id_ = bus_.subscribe<SizeMismatchEvent>([this](const SizeMismatchEvent&) {
            stats_.size_mismatches++;
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<UploadCompletedEvent>(completed_id_);
        bus_.unsubscribe<UploadFailedEvent>(failed_id_);
        bus_.unsubscribe<DirectoryCreatedEvent>(directory_id_);
        bus_.unsubscribe<RemoteFileReplacedEvent>(replaced_id_);
        bus_.unsubscribe<ChunkWrittenEvent>(chunk_id_);
        bus_.unsubscribe<SizeMismatchEvent>(mismatch_id_);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads succeeded:   {}", stats_.uploads_succeeded.load());
        spdlog::info("  Uploads failed:      {}", stats_.uploads_failed.load());
        spdlog::info("  Directories created: {}", stats_.directories_created.load());
        spdlog::info("  Files replaced:      {}", stats_.files_replaced.load());
        spdlog::info("  Chunks written:      {}", stats_.chunks_written.load());
        spdlog::info("  Bytes written:       {}", stats_.bytes_written.load());
        spdlog::info("  Size mismatches:     {}", stats_.size_mismatches.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    EventBus::HandlerId completed_id_ = 0;
    EventBus::HandlerId failed_id_ = 0;
    EventBus::HandlerId directory_id_ = 0;
    EventBus::HandlerId replaced_id_ = 0;
    EventBus::HandlerId chunk_id_ = 0;
    EventBus::HandlerId mismatch_id_ = 0;
};

} // namespace fsup::events
