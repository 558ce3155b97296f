#include "fsup/vault/json_file_vault.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace fsup::vault {

using json = nlohmann::json;

JsonFileVault::JsonFileVault(std::map<std::string, SecretFields> entries)
    : entries_(std::move(entries)) {}

fsup::Result<JsonFileVault> JsonFileVault::load(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fsup::Err<JsonFileVault>(std::string("Failed to open vault file: ") + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto vault = parse(buffer.str());
    if (vault.is_ok()) {
        spdlog::debug("Loaded {} vault entries from {}", vault.value().size(), path.string());
    }
    return vault;
}

fsup::Result<JsonFileVault> JsonFileVault::parse(const std::string& document) {
    json root;
    try {
        root = json::parse(document);
    } catch (const json::parse_error& e) {
        return fsup::Err<JsonFileVault>(std::string("Invalid vault JSON: ") + e.what());
    }

    if (!root.is_object()) {
        return fsup::Err<JsonFileVault>(std::string("Vault JSON must be an object of objects"));
    }

    std::map<std::string, SecretFields> entries;
    for (const auto& [key, fields] : root.items()) {
        if (!fields.is_object()) {
            return fsup::Err<JsonFileVault>(std::string("Vault entry '") + key + "' is not an object");
        }
        SecretFields secrets;
        for (const auto& [field, value] : fields.items()) {
            if (!value.is_string()) {
                return fsup::Err<JsonFileVault>(std::string("Vault field '") + key + "." + field +
                                                "' is not a string");
            }
            secrets.emplace(field, value.get<std::string>());
        }
        entries.emplace(key, std::move(secrets));
    }

    return fsup::Ok(JsonFileVault(std::move(entries)));
}

fsup::Result<std::optional<SecretFields>> JsonFileVault::get_secrets(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return fsup::Ok(std::optional<SecretFields>{});
    }
    return fsup::Ok(std::optional<SecretFields>{it->second});
}

} // namespace fsup::vault
