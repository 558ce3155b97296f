#include "fsup/source/filesystem_repository.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace fsup::source {
namespace fs = std::filesystem;

namespace {

bool parse_version(const std::string& name, std::uint32_t& version) {
    if (name.empty() || name.size() > 9) {
        return false;
    }
    std::uint32_t value = 0;
    for (char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    version = value;
    return true;
}

class FileSourceStream : public SourceStream {
public:
    explicit FileSourceStream(fs::path path)
        : path_(std::move(path)), input_(path_, std::ios::binary) {}

    bool is_open() const { return input_.is_open(); }

    fsup::Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) override {
        if (!input_.is_open()) {
            return fsup::Err<std::size_t>(std::string("Stream is closed: ") + path_.string());
        }
        input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_bytes));
        if (input_.bad()) {
            return fsup::Err<std::size_t>(std::string("I/O error reading ") + path_.string());
        }
        return fsup::Ok(static_cast<std::size_t>(input_.gcount()));
    }

    fsup::Result<void> close() override {
        input_.clear();
        input_.close();
        if (input_.fail()) {
            return fsup::Err<void>(std::string("Failed to close ") + path_.string());
        }
        return fsup::Ok();
    }

private:
    fs::path path_;
    std::ifstream input_;
};

} // namespace

FilesystemDocumentRepository::FilesystemDocumentRepository(fs::path root)
    : root_(std::move(root)) {}

fsup::Result<fs::path> FilesystemDocumentRepository::current_version_path(DocumentId id,
                                                                         std::uint32_t* version) const {
    const fs::path document_dir = root_ / std::to_string(id);
    std::error_code ec;
    if (!fs::is_directory(document_dir, ec)) {
        return fsup::Err<fs::path>(std::string("Document ") + std::to_string(id) + " not found");
    }

    bool found = false;
    std::uint32_t newest = 0;
    fs::path newest_path;
    for (const auto& entry : fs::directory_iterator(document_dir, ec)) {
        std::uint32_t candidate = 0;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !parse_version(entry.path().filename().string(), candidate)) {
            continue;
        }
        if (!found || candidate > newest) {
            found = true;
            newest = candidate;
            newest_path = entry.path();
        }
    }
    if (ec) {
        return fsup::Err<fs::path>(std::string("Failed to list versions of document ") + std::to_string(id) +
                                   ": " + ec.message());
    }
    if (!found) {
        return fsup::Err<fs::path>(std::string("Document ") + std::to_string(id) + " has no versions");
    }

    if (version) {
        *version = newest;
    }
    return fsup::Ok(newest_path);
}

fsup::Result<DocumentVersion> FilesystemDocumentRepository::resolve_current_version(DocumentId id) {
    std::uint32_t version = 0;
    auto path = current_version_path(id, &version);
    if (path.is_error()) {
        return fsup::Err<DocumentVersion>(path.error());
    }

    DocumentVersion info;
    info.document_id = id;
    info.version = version;

    std::error_code ec;
    const auto size = fs::file_size(path.value(), ec);
    if (ec) {
        spdlog::warn("No size for document {} version {}: {}", id, version, ec.message());
    } else {
        info.size = size;
    }
    return fsup::Ok(info);
}

fsup::Result<std::unique_ptr<SourceStream>> FilesystemDocumentRepository::open_read_stream(DocumentId id) {
    auto path = current_version_path(id, nullptr);
    if (path.is_error()) {
        return fsup::Err<std::unique_ptr<SourceStream>>(path.error());
    }

    auto stream = std::make_unique<FileSourceStream>(path.value());
    if (!stream->is_open()) {
        return fsup::Err<std::unique_ptr<SourceStream>>(std::string("Failed to open ") + path.value().string());
    }
    return fsup::Ok<std::unique_ptr<SourceStream>>(std::move(stream));
}

} // namespace fsup::source
