#include "fsup/share/local_share.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace fsup::share {
namespace fs = std::filesystem;

namespace {

constexpr const char* kFileScheme = "file://";

/// Maps a share-relative path to disk, refusing "." and ".." segments
fsup::Result<fs::path> resolve_on_disk(const fs::path& share_root, const std::string& relative) {
    fs::path resolved = share_root;
    std::size_t start = 0;
    while (start < relative.size()) {
        auto slash = relative.find('/', start);
        auto end = slash == std::string::npos ? relative.size() : slash;
        const auto segment = relative.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return fsup::Err<fs::path>(std::string("Invalid path segment in '") + relative + "'");
        }
        resolved /= segment;
        start = end + 1;
    }
    return fsup::Ok(resolved);
}

class LocalWriteStream : public RemoteWriteStream {
public:
    LocalWriteStream(fs::path path, std::uint64_t allocated)
        : path_(std::move(path)), allocated_(allocated) {
        out_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    }

    bool is_open() const { return out_.is_open(); }

    fsup::Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (closed_) {
            return fsup::Err<void>(std::string("Write stream already closed: ") + path_.string());
        }
        if (offset_ + size > allocated_) {
            return fsup::Err<void>(std::string("Write of ") + std::to_string(size) + " bytes at offset " +
                                   std::to_string(offset_) + " exceeds allocated size " +
                                   std::to_string(allocated_) + " of " + path_.string());
        }

        out_.seekp(static_cast<std::streamoff>(offset_));
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out_) {
            return fsup::Err<void>(std::string("Failed to write range of ") + path_.string());
        }
        offset_ += size;
        return fsup::Ok();
    }

    fsup::Result<void> close() override {
        if (closed_) {
            return fsup::Ok();
        }
        closed_ = true;
        out_.flush();
        const bool flushed = static_cast<bool>(out_);
        out_.close();
        if (!flushed || out_.fail()) {
            return fsup::Err<void>(std::string("Failed to flush ") + path_.string());
        }
        return fsup::Ok();
    }

private:
    fs::path path_;
    std::uint64_t allocated_;
    std::uint64_t offset_ = 0;
    std::fstream out_;
    bool closed_ = false;
};

class LocalFile : public RemoteFile {
public:
    LocalFile(fs::path share_root, std::string path)
        : share_root_(std::move(share_root)), path_(std::move(path)) {}

    const std::string& path() const override { return path_; }

    fsup::Result<bool> exists() override {
        auto disk = resolve_on_disk(share_root_, path_);
        if (disk.is_error()) {
            return fsup::Err<bool>(disk.error());
        }
        std::error_code ec;
        const bool found = fs::is_regular_file(disk.value(), ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return fsup::Err<bool>(std::string("Failed to stat ") + path_ + ": " + ec.message());
        }
        return fsup::Ok(found);
    }

    fsup::Result<void> remove() override {
        auto disk = resolve_on_disk(share_root_, path_);
        if (disk.is_error()) {
            return fsup::Err<void>(disk.error());
        }
        std::error_code ec;
        if (!fs::remove(disk.value(), ec)) {
            return fsup::Err<void>(std::string("Failed to delete ") + path_ + ": " +
                                   (ec ? ec.message() : std::string("file not found")));
        }
        return fsup::Ok();
    }

    fsup::Result<void> create(std::uint64_t total_size) override {
        auto disk = resolve_on_disk(share_root_, path_);
        if (disk.is_error()) {
            return fsup::Err<void>(disk.error());
        }
        std::error_code ec;
        if (!fs::is_directory(disk.value().parent_path(), ec)) {
            return fsup::Err<void>(std::string("Parent directory does not exist for ") + path_);
        }

        {
            std::ofstream create(disk.value(), std::ios::binary | std::ios::trunc);
            if (!create) {
                return fsup::Err<void>(std::string("Failed to create ") + path_);
            }
        }

        fs::resize_file(disk.value(), total_size, ec);
        if (ec) {
            return fsup::Err<void>(std::string("Failed to allocate ") + std::to_string(total_size) +
                                   " bytes for " + path_ + ": " + ec.message());
        }
        return fsup::Ok();
    }

    fsup::Result<std::unique_ptr<RemoteWriteStream>> open_write_stream() override {
        auto disk = resolve_on_disk(share_root_, path_);
        if (disk.is_error()) {
            return fsup::Err<std::unique_ptr<RemoteWriteStream>>(disk.error());
        }
        std::error_code ec;
        const auto allocated = fs::file_size(disk.value(), ec);
        if (ec) {
            return fsup::Err<std::unique_ptr<RemoteWriteStream>>(
                std::string("File has not been created: ") + path_);
        }

        auto stream = std::make_unique<LocalWriteStream>(disk.value(), allocated);
        if (!stream->is_open()) {
            return fsup::Err<std::unique_ptr<RemoteWriteStream>>(std::string("Failed to open ") + path_);
        }
        return fsup::Ok<std::unique_ptr<RemoteWriteStream>>(std::move(stream));
    }

private:
    fs::path share_root_;
    std::string path_;
};

class LocalDirectory : public RemoteDirectory {
public:
    LocalDirectory(fs::path share_root, std::string path)
        : share_root_(std::move(share_root)), path_(std::move(path)) {}

    const std::string& path() const override { return path_; }

    fsup::Result<bool> exists() override {
        auto disk = resolve_on_disk(share_root_, path_);
        if (disk.is_error()) {
            return fsup::Err<bool>(disk.error());
        }
        std::error_code ec;
        const bool found = fs::is_directory(disk.value(), ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return fsup::Err<bool>(std::string("Failed to stat ") + path_ + ": " + ec.message());
        }
        return fsup::Ok(found);
    }

    fsup::Result<void> create() override {
        auto disk = resolve_on_disk(share_root_, path_);
        if (disk.is_error()) {
            return fsup::Err<void>(disk.error());
        }
        std::error_code ec;
        if (!fs::create_directory(disk.value(), ec)) {
            return fsup::Err<void>(std::string("Failed to create directory ") + path_ + ": " +
                                   (ec ? ec.message() : std::string("already exists")));
        }
        return fsup::Ok();
    }

    std::unique_ptr<RemoteDirectory> subdirectory(const std::string& name) const override {
        return std::make_unique<LocalDirectory>(share_root_, join_share_path(path_, name));
    }

    std::unique_ptr<RemoteFile> file(const std::string& name) const override {
        return std::make_unique<LocalFile>(share_root_, join_share_path(path_, name));
    }

private:
    fs::path share_root_;
    std::string path_;
};

class LocalShareClient : public ShareClient {
public:
    explicit LocalShareClient(fs::path share_root) : share_root_(std::move(share_root)) {}

    std::unique_ptr<RemoteDirectory> root_directory() override {
        return std::make_unique<LocalDirectory>(share_root_, std::string{});
    }

private:
    fs::path share_root_;
};

} // namespace

fsup::Result<LocalShareClientFactory::ParsedEndpoint>
LocalShareClientFactory::parse_endpoint(const std::string& endpoint) {
    const auto query = endpoint.find('?');
    if (query == std::string::npos || query + 1 == endpoint.size()) {
        return fsup::Err<ParsedEndpoint>(std::string("Share endpoint carries no access token"));
    }

    std::string location = endpoint.substr(0, query);
    if (location.rfind(kFileScheme, 0) == 0) {
        location.erase(0, std::char_traits<char>::length(kFileScheme));
    }
    if (location.empty()) {
        return fsup::Err<ParsedEndpoint>(std::string("Share endpoint has no location"));
    }

    ParsedEndpoint parsed;
    parsed.share_root = fs::path(location);
    parsed.token = endpoint.substr(query + 1);
    return fsup::Ok(std::move(parsed));
}

fsup::Result<std::unique_ptr<ShareClient>> LocalShareClientFactory::connect(const std::string& endpoint) {
    auto parsed = parse_endpoint(endpoint);
    if (parsed.is_error()) {
        return fsup::Err<std::unique_ptr<ShareClient>>(parsed.error());
    }

    const auto& share_root = parsed.value().share_root;
    std::error_code ec;
    if (!fs::is_directory(share_root, ec)) {
        return fsup::Err<std::unique_ptr<ShareClient>>(
            std::string("Share does not exist: ") + share_root.filename().string());
    }

    spdlog::debug("Connected to local share '{}'", share_root.string());
    return fsup::Ok<std::unique_ptr<ShareClient>>(std::make_unique<LocalShareClient>(share_root));
}

} // namespace fsup::share
