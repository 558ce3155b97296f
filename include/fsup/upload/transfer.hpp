#pragma once

#include "fsup/core/error.hpp"
#include "fsup/events/event_bus.hpp"
#include "fsup/share/share_client.hpp"
#include "fsup/source/document_repository.hpp"
#include "fsup/source/source_lease.hpp"
#include "fsup/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fsup::upload {

/**
 * @brief Replaces a remote file with the current version of a document
 *
 * Order of operations:
 *  1. delete the target if it already exists
 *  2. resolve the document's current version and declared size
 *  3. open the source stream (owned by the caller's SourceLease)
 *  4. allocate the remote file at the declared size
 *  5. stream the source in chunk_size() pieces, in order
 *  6. close the remote write stream, also when streaming failed
 *
 * Nothing is cleaned up remotely on failure: the file may be left allocated
 * and partially written.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(source::DocumentRepository& documents,
                         events::EventBus& bus,
                         std::size_t chunk_size = kDefaultChunkSize);

    UploadResult<TransferReport> transfer(share::RemoteDirectory& directory,
                                          const std::string& file_name,
                                          source::DocumentId document_id,
                                          source::SourceLease& lease) const;

    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }

private:
    UploadResult<void> replace_existing(share::RemoteFile& file, TransferReport& report) const;

    UploadResult<void> stream_chunks(source::SourceStream& input,
                                     share::RemoteWriteStream& output,
                                     TransferReport& report) const;

    /// Reads until @p buffer is full or the stream ends; returns the byte count
    static UploadResult<std::size_t> fill_chunk(source::SourceStream& input, std::vector<std::uint8_t>& buffer);

    source::DocumentRepository& documents_;
    events::EventBus& bus_;
    std::size_t chunk_size_;
};

} // namespace fsup::upload
