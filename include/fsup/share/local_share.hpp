#pragma once

#include "fsup/core/result.hpp"
#include "fsup/share/share_client.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fsup::share {

/**
 * @brief ShareClientFactory backed by a local directory tree
 *
 * Endpoint form: "<root>/<share>?<token>", where <root> is a local path or a
 * file:// URL. The share directory must already exist and the token must be
 * non-empty; the token is not otherwise checked.
 *
 * Behaves like the remote protocol where it matters to the uploader:
 * - a directory can only be created once and only under an existing parent
 * - create(size) allocates the full length up front (zero filled)
 * - writes are sequential and may not run past the allocated length
 */
class LocalShareClientFactory : public ShareClientFactory {
public:
    fsup::Result<std::unique_ptr<ShareClient>> connect(const std::string& endpoint) override;

    struct ParsedEndpoint {
        std::filesystem::path share_root;
        std::string token;
    };

    static fsup::Result<ParsedEndpoint> parse_endpoint(const std::string& endpoint);
};

} // namespace fsup::share
