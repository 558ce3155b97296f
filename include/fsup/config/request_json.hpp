#pragma once

#include "fsup/core/result.hpp"
#include "fsup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace fsup::config {

/**
 * @brief JSON binding of the invocation contract
 *
 * Input names: accountUrl, shareName, directoryPath, fileName, documentId,
 * manualToken, vaultKey, vaultField. Missing or null keys leave the field
 * empty; the upload pipeline decides what is required. documentId may be a
 * number or a decimal string. Unknown keys are ignored.
 *
 * Output: {"isSuccess": bool, "errorMessage": string|null}
 */
fsup::Result<upload::UploadRequest> request_from_json(const nlohmann::json& document);

/// Reads a JSON document from disk
fsup::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

fsup::Result<upload::UploadRequest> load_request(const std::filesystem::path& path);

nlohmann::json outcome_to_json(const upload::TransferOutcome& outcome);

} // namespace fsup::config
