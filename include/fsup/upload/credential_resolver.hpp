#pragma once

#include "fsup/core/error.hpp"
#include "fsup/core/result.hpp"
#include "fsup/upload/types.hpp"
#include "fsup/vault/secret_vault.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fsup::upload {

/**
 * @brief One way of obtaining the share access token
 *
 * Returns std::nullopt when this source has nothing to offer for the
 * request; an error result when the source itself failed.
 */
class CredentialSource {
public:
    virtual ~CredentialSource() = default;

    virtual const char* name() const = 0;
    virtual fsup::Result<std::optional<std::string>> resolve(const UploadRequest& request) = 0;
};

/// Token typed in by the caller (UploadRequest::manual_token)
class ManualTokenSource : public CredentialSource {
public:
    const char* name() const override { return "manual"; }
    fsup::Result<std::optional<std::string>> resolve(const UploadRequest& request) override;
};

/// Token stored in a vault under (vault_key, vault_field)
class VaultTokenSource : public CredentialSource {
public:
    explicit VaultTokenSource(vault::SecretVault& vault) : vault_(vault) {}

    const char* name() const override { return "vault"; }
    fsup::Result<std::optional<std::string>> resolve(const UploadRequest& request) override;

private:
    vault::SecretVault& vault_;
};

/**
 * @brief Ordered credential fallback; the first non-blank token wins
 *
 * A source that fails stops the resolution with a ConfigurationError.
 * Running out of sources is a ConfigurationError as well.
 */
class CredentialResolver {
public:
    static constexpr const char* kMissingCredential = "No SAS Token provided via SCS or Manual Input.";

    explicit CredentialResolver(std::vector<std::unique_ptr<CredentialSource>> sources);

    /// Manual token first, then the vault
    static CredentialResolver with_defaults(vault::SecretVault& vault);

    UploadResult<std::string> resolve(const UploadRequest& request) const;

private:
    std::vector<std::unique_ptr<CredentialSource>> sources_;
};

} // namespace fsup::upload
