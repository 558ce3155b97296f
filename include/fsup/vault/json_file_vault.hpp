#pragma once

#include "fsup/core/result.hpp"
#include "fsup/vault/secret_vault.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace fsup::vault {

/**
 * @brief Secret vault read from a JSON document
 *
 * Expected shape:
 * {
 *   "azure-creds": { "sasToken": "sv=...&sig=..." },
 *   "other-key":   { "field": "value" }
 * }
 * Non-string field values are rejected when loading.
 */
class JsonFileVault : public SecretVault {
public:
    static fsup::Result<JsonFileVault> load(const std::filesystem::path& path);
    static fsup::Result<JsonFileVault> parse(const std::string& document);

    fsup::Result<std::optional<SecretFields>> get_secrets(const std::string& key) override;

    std::size_t size() const { return entries_.size(); }

private:
    explicit JsonFileVault(std::map<std::string, SecretFields> entries);

    std::map<std::string, SecretFields> entries_;
};

} // namespace fsup::vault
