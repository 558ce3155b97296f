#include "fsup/upload/transfer.hpp"

#include "fsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>

namespace fsup::upload {

using share::RemoteFile;
using share::RemoteWriteStream;
using source::SourceStream;

namespace {

/**
 * Owns an open remote write stream and closes it exactly once: through
 * close(), or from the destructor when an exception unwinds past it.
 */
class ScopedWriteStream {
public:
    explicit ScopedWriteStream(std::unique_ptr<RemoteWriteStream> stream)
        : stream_(std::move(stream)) {}

    ~ScopedWriteStream() {
        if (stream_) {
            auto result = close();
            if (result.is_error()) {
                spdlog::warn("Failed to close remote write stream during unwind: {}", result.error().detail);
            }
        }
    }

    ScopedWriteStream(const ScopedWriteStream&) = delete;
    ScopedWriteStream& operator=(const ScopedWriteStream&) = delete;

    RemoteWriteStream& get() { return *stream_; }

    UploadResult<void> close() {
        auto stream = std::move(stream_);
        return fsup::capture(ErrorKind::RemoteIO, [&] { return stream->close(); });
    }

private:
    std::unique_ptr<RemoteWriteStream> stream_;
};

} // namespace

TransferOrchestrator::TransferOrchestrator(source::DocumentRepository& documents,
                                           events::EventBus& bus,
                                           std::size_t chunk_size)
    : documents_(documents), bus_(bus), chunk_size_(chunk_size) {}

UploadResult<TransferReport> TransferOrchestrator::transfer(share::RemoteDirectory& directory,
                                                            const std::string& file_name,
                                                            source::DocumentId document_id,
                                                            source::SourceLease& lease) const {
    if (chunk_size_ == 0) {
        return fsup::Err<TransferReport>(UploadError{ErrorKind::Configuration, "chunk size must be > 0"});
    }

    auto handle = fsup::capture_handle(ErrorKind::RemoteIO, [&] { return directory.file(file_name); });
    if (handle.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO, "Failed to open file '" + share::join_share_path(directory.path(), file_name) +
                                     "': " + handle.error().detail});
    }
    auto file = std::move(handle.value());
    TransferReport report;
    report.file_path = file->path();

    if (auto res = replace_existing(*file, report); res.is_error()) {
        return fsup::Err<TransferReport>(res.error());
    }

    auto version = fsup::capture(ErrorKind::SourceRead,
                                 [&] { return documents_.resolve_current_version(document_id); });
    if (version.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::SourceRead,
            "Failed to resolve current version of document " + std::to_string(document_id) + ": " +
                version.error().detail});
    }
    report.allocated_bytes = version.value().declared_size();
    if (!version.value().size) {
        spdlog::debug("Document {} has no size metadata, allocating 0 bytes", document_id);
    }

    auto opened = fsup::capture(ErrorKind::SourceRead, [&] { return documents_.open_read_stream(document_id); });
    if (opened.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::SourceRead,
            "Failed to open document " + std::to_string(document_id) + ": " + opened.error().detail});
    }
    if (!opened.value()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::SourceRead, "Repository returned no stream for document " + std::to_string(document_id)});
    }
    lease.acquire(std::move(opened.value()));

    auto allocated = fsup::capture(ErrorKind::RemoteIO, [&] { return file->create(report.allocated_bytes); });
    if (allocated.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO, "Failed to allocate '" + report.file_path + "': " + allocated.error().detail});
    }
    bus_.emit(events::RemoteFileAllocatedEvent{report.file_path, report.allocated_bytes});

    auto writer = fsup::capture(ErrorKind::RemoteIO, [&] { return file->open_write_stream(); });
    if (writer.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO, "Failed to open write stream for '" + report.file_path + "': " +
                                     writer.error().detail});
    }
    if (!writer.value()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO, "Share returned no write stream for '" + report.file_path + "'"});
    }

    ScopedWriteStream output(std::move(writer.value()));
    auto streamed = stream_chunks(lease.stream(), output.get(), report);
    auto closed = output.close();

    if (streamed.is_error()) {
        if (closed.is_error()) {
            spdlog::warn("Failed to close remote write stream for '{}' after error: {}",
                         report.file_path, closed.error().detail);
        }
        return fsup::Err<TransferReport>(streamed.error());
    }
    if (closed.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO, "Failed to finalize '" + report.file_path + "': " + closed.error().detail});
    }

    if (report.bytes_written != report.allocated_bytes) {
        spdlog::warn("Remote file '{}' was allocated {} bytes but {} bytes were written",
                     report.file_path, report.allocated_bytes, report.bytes_written);
        bus_.emit(events::SizeMismatchEvent{report.file_path, report.allocated_bytes, report.bytes_written});
    }

    return fsup::Ok<TransferReport, UploadError>(std::move(report));
}

UploadResult<void> TransferOrchestrator::replace_existing(RemoteFile& file, TransferReport& report) const {
    auto exists = fsup::capture(ErrorKind::RemoteIO, [&] { return file.exists(); });
    if (exists.is_error()) {
        return fsup::Err<void>(UploadError{
            ErrorKind::RemoteIO, "Failed to check file '" + file.path() + "': " + exists.error().detail});
    }
    if (!exists.value()) {
        return fsup::Ok<UploadError>();
    }

    auto removed = fsup::capture(ErrorKind::RemoteIO, [&] { return file.remove(); });
    if (removed.is_error()) {
        return fsup::Err<void>(UploadError{
            ErrorKind::RemoteIO, "Failed to delete existing file '" + file.path() + "': " + removed.error().detail});
    }
    report.replaced_existing = true;
    bus_.emit(events::RemoteFileReplacedEvent{file.path()});
    return fsup::Ok<UploadError>();
}

UploadResult<void> TransferOrchestrator::stream_chunks(SourceStream& input,
                                                       RemoteWriteStream& output,
                                                       TransferReport& report) const {
    std::vector<std::uint8_t> buffer(chunk_size_);

    while (true) {
        auto filled = fill_chunk(input, buffer);
        if (filled.is_error()) {
            return fsup::Err<void>(filled.error());
        }

        const std::size_t bytes_read = filled.value();
        if (bytes_read == 0) {
            break;
        }

        auto written = fsup::capture(ErrorKind::RemoteIO, [&] { return output.write(buffer.data(), bytes_read); });
        if (written.is_error()) {
            return fsup::Err<void>(UploadError{
                ErrorKind::RemoteIO,
                "Failed to write chunk " + std::to_string(report.chunks_written) + " of '" + report.file_path +
                    "': " + written.error().detail});
        }

        report.bytes_written += bytes_read;
        bus_.emit(events::ChunkWrittenEvent{report.file_path, report.chunks_written,
                                            static_cast<std::uint64_t>(bytes_read),
                                            report.bytes_written});
        ++report.chunks_written;

        if (bytes_read < buffer.size()) {
            break;
        }
    }

    return fsup::Ok<UploadError>();
}

UploadResult<std::size_t> TransferOrchestrator::fill_chunk(SourceStream& input, std::vector<std::uint8_t>& buffer) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        const std::size_t wanted = buffer.size() - filled;
        auto read = fsup::capture(ErrorKind::SourceRead, [&] { return input.read(buffer.data() + filled, wanted); });
        if (read.is_error()) {
            return fsup::Err<std::size_t>(UploadError{
                ErrorKind::SourceRead, "Failed to read document stream: " + read.error().detail});
        }
        if (read.value() == 0) {
            break;
        }
        if (read.value() > wanted) {
            return fsup::Err<std::size_t>(UploadError{
                ErrorKind::SourceRead, "Document stream returned more bytes than requested"});
        }
        filled += read.value();
    }
    return fsup::Ok<std::size_t, UploadError>(filled);
}

} // namespace fsup::upload
