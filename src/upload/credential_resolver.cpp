#include "fsup/upload/credential_resolver.hpp"

#include "fsup/core/text.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace fsup::upload {

fsup::Result<std::optional<std::string>> ManualTokenSource::resolve(const UploadRequest& request) {
    if (text::is_missing(request.manual_token)) {
        return fsup::Ok(std::optional<std::string>{});
    }
    return fsup::Ok(std::optional<std::string>{*request.manual_token});
}

fsup::Result<std::optional<std::string>> VaultTokenSource::resolve(const UploadRequest& request) {
    if (text::is_missing(request.vault_key) || text::is_missing(request.vault_field)) {
        return fsup::Ok(std::optional<std::string>{});
    }

    auto secrets = vault_.get_secrets(*request.vault_key);
    if (secrets.is_error()) {
        return fsup::Err<std::optional<std::string>>(
            "Vault lookup failed for key '" + *request.vault_key + "': " + secrets.error());
    }

    const auto& fields = secrets.value();
    if (!fields) {
        spdlog::debug("Vault has no entry for key '{}'", *request.vault_key);
        return fsup::Ok(std::optional<std::string>{});
    }

    auto it = fields->find(*request.vault_field);
    if (it == fields->end() || text::is_blank(it->second)) {
        spdlog::debug("Vault entry '{}' has no field '{}'", *request.vault_key, *request.vault_field);
        return fsup::Ok(std::optional<std::string>{});
    }
    return fsup::Ok(std::optional<std::string>{it->second});
}

CredentialResolver::CredentialResolver(std::vector<std::unique_ptr<CredentialSource>> sources)
    : sources_(std::move(sources)) {}

CredentialResolver CredentialResolver::with_defaults(vault::SecretVault& vault) {
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::make_unique<ManualTokenSource>());
    sources.push_back(std::make_unique<VaultTokenSource>(vault));
    return CredentialResolver(std::move(sources));
}

UploadResult<std::string> CredentialResolver::resolve(const UploadRequest& request) const {
    for (const auto& source : sources_) {
        auto token = fsup::capture(ErrorKind::Configuration, [&] { return source->resolve(request); });
        if (token.is_error()) {
            return fsup::Err<std::string>(token.error());
        }
        if (token.value() && !text::is_blank(*token.value())) {
            spdlog::debug("Access token resolved from {} source", source->name());
            return fsup::Ok<std::string, UploadError>(std::move(*token.value()));
        }
    }
    return fsup::Err<std::string>(UploadError{ErrorKind::Configuration, kMissingCredential});
}

} // namespace fsup::upload
