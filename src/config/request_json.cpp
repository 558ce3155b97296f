#include "fsup/config/request_json.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace fsup::config {

using json = nlohmann::json;

namespace {

fsup::Result<std::optional<std::string>> optional_string(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return fsup::Ok(std::optional<std::string>{});
    }
    if (!it->is_string()) {
        return fsup::Err<std::optional<std::string>>(std::string("'") + key + "' must be a string");
    }
    return fsup::Ok(std::optional<std::string>{it->get<std::string>()});
}

fsup::Result<std::optional<source::DocumentId>> optional_document_id(const json& document) {
    using Id = std::optional<source::DocumentId>;

    auto it = document.find("documentId");
    if (it == document.end() || it->is_null()) {
        return fsup::Ok(Id{});
    }
    if (it->is_number_unsigned() &&
        it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<source::DocumentId>::max())) {
        return fsup::Err<Id>(std::string("'documentId' is out of range"));
    }
    if (it->is_number_integer()) {
        return fsup::Ok(Id{it->get<source::DocumentId>()});
    }
    if (it->is_string()) {
        const auto text = it->get<std::string>();
        if (text.empty()) {
            return fsup::Ok(Id{});
        }
        std::size_t start = text[0] == '-' ? 1 : 0;
        bool digits = start < text.size();
        for (std::size_t i = start; i < text.size(); ++i) {
            digits = digits && std::isdigit(static_cast<unsigned char>(text[i]));
        }
        if (digits) {
            try {
                return fsup::Ok(Id{std::stoll(text)});
            } catch (const std::out_of_range&) {
                // falls through to the error below
            }
        }
    }
    return fsup::Err<Id>(std::string("'documentId' must be an integer"));
}

} // namespace

fsup::Result<upload::UploadRequest> request_from_json(const json& document) {
    using upload::UploadRequest;

    if (!document.is_object()) {
        return fsup::Err<UploadRequest>(std::string("Request must be a JSON object"));
    }

    UploadRequest request;

    struct Binding {
        const char* key;
        std::optional<std::string>* target;
    };
    std::optional<std::string> account_url;
    std::optional<std::string> share_name;
    std::optional<std::string> file_name;
    const Binding bindings[] = {
        {"accountUrl", &account_url},
        {"shareName", &share_name},
        {"directoryPath", &request.directory_path},
        {"fileName", &file_name},
        {"manualToken", &request.manual_token},
        {"vaultKey", &request.vault_key},
        {"vaultField", &request.vault_field},
    };

    for (const auto& binding : bindings) {
        auto value = optional_string(document, binding.key);
        if (value.is_error()) {
            return fsup::Err<UploadRequest>(value.error());
        }
        *binding.target = std::move(value.value());
    }

    request.account_url = account_url.value_or("");
    request.share_name = share_name.value_or("");
    request.file_name = file_name.value_or("");

    auto document_id = optional_document_id(document);
    if (document_id.is_error()) {
        return fsup::Err<UploadRequest>(document_id.error());
    }
    request.document_id = document_id.value();

    return fsup::Ok(std::move(request));
}

fsup::Result<json> read_json_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return fsup::Err<json>(std::string("Failed to open ") + path.string());
    }

    try {
        json document;
        input >> document;
        return fsup::Ok(std::move(document));
    } catch (const json::parse_error& e) {
        return fsup::Err<json>(std::string("Invalid JSON in ") + path.string() + ": " + e.what());
    }
}

fsup::Result<upload::UploadRequest> load_request(const std::filesystem::path& path) {
    auto document = read_json_file(path);
    if (document.is_error()) {
        return fsup::Err<upload::UploadRequest>(document.error());
    }
    return request_from_json(document.value());
}

json outcome_to_json(const upload::TransferOutcome& outcome) {
    json j;
    j["isSuccess"] = outcome.success();
    if (outcome.message()) {
        j["errorMessage"] = *outcome.message();
    } else {
        j["errorMessage"] = nullptr;
    }
    return j;
}

} // namespace fsup::config
