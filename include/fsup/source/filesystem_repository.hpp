#pragma once

#include "fsup/core/result.hpp"
#include "fsup/source/document_repository.hpp"

#include <filesystem>
#include <memory>

namespace fsup::source {

/**
 * @brief Document repository stored on disk
 *
 * Layout: <root>/<document id>/<version number>. The current version is the
 * entry with the highest numeric name; non-numeric entries are ignored.
 */
class FilesystemDocumentRepository : public DocumentRepository {
public:
    explicit FilesystemDocumentRepository(std::filesystem::path root);

    fsup::Result<DocumentVersion> resolve_current_version(DocumentId id) override;
    fsup::Result<std::unique_ptr<SourceStream>> open_read_stream(DocumentId id) override;

private:
    fsup::Result<std::filesystem::path> current_version_path(DocumentId id, std::uint32_t* version) const;

    std::filesystem::path root_;
};

} // namespace fsup::source
