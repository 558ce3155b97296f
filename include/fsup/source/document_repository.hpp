#pragma once

#include "fsup/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace fsup::source {

using DocumentId = std::int64_t;

/**
 * @brief Metadata of the current version of a document
 */
struct DocumentVersion {
    DocumentId document_id = 0;
    std::uint32_t version = 0;
    std::optional<std::uint64_t> size; ///< Absent when the repository has no size metadata

    std::uint64_t declared_size() const { return size.value_or(0); }
};

/**
 * @brief Finite, non-rewindable byte stream over a document's content
 *
 * read() returns the number of bytes copied into @p buffer, 0 at end of
 * stream. It may return fewer bytes than requested before the end.
 */
class SourceStream {
public:
    virtual ~SourceStream() = default;

    virtual fsup::Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) = 0;
    virtual fsup::Result<void> close() = 0;
};

class DocumentRepository {
public:
    virtual ~DocumentRepository() = default;

    virtual fsup::Result<DocumentVersion> resolve_current_version(DocumentId id) = 0;
    virtual fsup::Result<std::unique_ptr<SourceStream>> open_read_stream(DocumentId id) = 0;
};

} // namespace fsup::source
