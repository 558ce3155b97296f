/**
 * @file share_client.hpp
 * @brief Abstract client for a remote hierarchical file share
 *
 * The upload pipeline only talks to the share through these interfaces.
 * Transport, authentication headers and retry policy live in the
 * implementation behind them.
 *
 * HANDLE MODEL:
 * Handles are cheap path references. Creating one (subdirectory(), file())
 * performs no remote call; exists()/create()/remove() do.
 *
 * ERRORS:
 * Every remote operation returns an fsup::Result with a human readable
 * error string. The pipeline tags these as RemoteIOError.
 */

#pragma once

#include "fsup/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace fsup::share {

/**
 * @brief Sequential writer into an allocated remote file
 *
 * Bytes are written at increasing offsets starting from 0. close() must be
 * called once to finalize the stream; nothing written is guaranteed to be
 * visible before that.
 */
class RemoteWriteStream {
public:
    virtual ~RemoteWriteStream() = default;

    virtual fsup::Result<void> write(const std::uint8_t* data, std::size_t size) = 0;
    virtual fsup::Result<void> close() = 0;
};

class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    /// Share-relative path, '/' separated, no leading slash
    virtual const std::string& path() const = 0;

    virtual fsup::Result<bool> exists() = 0;
    virtual fsup::Result<void> remove() = 0;

    /**
     * @brief Create the file with its final size reserved up front
     *
     * The remote protocol needs the total length before any range write.
     */
    virtual fsup::Result<void> create(std::uint64_t total_size) = 0;

    virtual fsup::Result<std::unique_ptr<RemoteWriteStream>> open_write_stream() = 0;
};

class RemoteDirectory {
public:
    virtual ~RemoteDirectory() = default;

    /// Share-relative path; empty for the share root
    virtual const std::string& path() const = 0;

    virtual fsup::Result<bool> exists() = 0;
    virtual fsup::Result<void> create() = 0;

    virtual std::unique_ptr<RemoteDirectory> subdirectory(const std::string& name) const = 0;
    virtual std::unique_ptr<RemoteFile> file(const std::string& name) const = 0;
};

class ShareClient {
public:
    virtual ~ShareClient() = default;

    virtual std::unique_ptr<RemoteDirectory> root_directory() = 0;
};

/**
 * @brief Builds a ShareClient for a fully qualified share endpoint
 *
 * The endpoint carries the access token as its query string, see
 * make_share_endpoint().
 */
class ShareClientFactory {
public:
    virtual ~ShareClientFactory() = default;

    virtual fsup::Result<std::unique_ptr<ShareClient>> connect(const std::string& endpoint) = 0;
};

/// accountUrl + "/" + shareName + "?" + token, byte for byte
inline std::string make_share_endpoint(const std::string& account_url,
                                       const std::string& share_name,
                                       const std::string& token) {
    return account_url + "/" + share_name + "?" + token;
}

/// Joins a share-relative parent path and a child name
inline std::string join_share_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace fsup::share
