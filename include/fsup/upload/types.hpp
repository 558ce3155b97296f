#pragma once

#include "fsup/core/error.hpp"
#include "fsup/source/document_repository.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace fsup::upload {

/// Chunk size for streaming writes; kept under the share's per-request payload ceiling
inline constexpr std::size_t kDefaultChunkSize = 4 * 1024 * 1024;

/**
 * @brief Inputs of one upload invocation
 */
struct UploadRequest {
    std::string account_url;                      ///< Required
    std::string share_name;                       ///< Required
    std::optional<std::string> directory_path;    ///< Either separator; blank means share root
    std::string file_name;                        ///< Required
    std::optional<source::DocumentId> document_id;
    std::optional<std::string> manual_token;      ///< Wins over the vault when non-blank
    std::optional<std::string> vault_key;
    std::optional<std::string> vault_field;
};

/**
 * @brief What the transfer stage actually did
 */
struct TransferReport {
    std::string file_path;              ///< Share-relative target path
    bool replaced_existing = false;
    std::uint64_t allocated_bytes = 0;
    std::uint64_t bytes_written = 0;
    std::uint32_t chunks_written = 0;
};

/**
 * @brief Result handed back to the invoking workflow
 *
 * Either success with no message, or failure with a "<kind>: <detail>"
 * message. No other combination can be constructed.
 */
class TransferOutcome {
public:
    static TransferOutcome succeeded() { return TransferOutcome(true, std::nullopt); }
    static TransferOutcome failed(const UploadError& error) { return TransferOutcome(false, error.message()); }

    [[nodiscard]] bool success() const noexcept { return success_; }
    [[nodiscard]] const std::optional<std::string>& message() const noexcept { return message_; }

private:
    TransferOutcome(bool success, std::optional<std::string> message)
        : success_(success), message_(std::move(message)) {}

    bool success_;
    std::optional<std::string> message_;
};

} // namespace fsup::upload
