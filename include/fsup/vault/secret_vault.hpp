#pragma once

#include "fsup/core/result.hpp"

#include <map>
#include <optional>
#include <string>

namespace fsup::vault {

using SecretFields = std::map<std::string, std::string>;

/**
 * @brief Read-only secret store: key -> named secret fields
 *
 * get_secrets() returns std::nullopt for an unknown key. An error result
 * means the store itself could not be read.
 */
class SecretVault {
public:
    virtual ~SecretVault() = default;

    virtual fsup::Result<std::optional<SecretFields>> get_secrets(const std::string& key) = 0;
};

} // namespace fsup::vault
