#include "fsup/config/request_json.hpp"
#include "fsup/events/components.hpp"
#include "fsup/events/event_bus.hpp"
#include "fsup/share/local_share.hpp"
#include "fsup/source/filesystem_repository.hpp"
#include "fsup/upload/service.hpp"
#include "fsup/vault/json_file_vault.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using fsup::ErrorKind;
using fsup::UploadError;
using fsup::upload::TransferOutcome;

namespace {

/// Vault used when no --vault file is given: knows no keys
class EmptyVault : public fsup::vault::SecretVault {
public:
    fsup::Result<std::optional<fsup::vault::SecretFields>> get_secrets(const std::string&) override {
        return fsup::Ok(std::optional<fsup::vault::SecretFields>{});
    }
};

void print_usage(const char* program) {
    std::cerr
        << "Usage: " << program << " [options]\n"
        << "  --request <file>        JSON invocation document\n"
        << "  --account-url <url>     Share account root (local path or file:// URL)\n"
        << "  --share <name>          Share name\n"
        << "  --dir <path>            Target directory inside the share\n"
        << "  --file-name <name>      Target file name\n"
        << "  --document-id <id>      Source document identifier\n"
        << "  --token <sas>           Access token\n"
        << "  --vault <file>          JSON vault file\n"
        << "  --vault-key <key>       Vault key holding the token\n"
        << "  --vault-field <field>   Vault field holding the token\n"
        << "  --documents <dir>       Document repository root (default: ./documents)\n"
        << "  --log-level <level>     trace|debug|info|warn|error|off (default: info)\n";
}

int report(const TransferOutcome& outcome) {
    std::cout << fsup::config::outcome_to_json(outcome).dump(2) << std::endl;
    return outcome.success() ? 0 : 1;
}

int report_configuration_error(const std::string& detail) {
    return report(TransferOutcome::failed(UploadError{ErrorKind::Configuration, detail}));
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries the JSON outcome, logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("fsup"));
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> request_file;
    std::optional<fs::path> vault_file;
    fs::path documents_root = fs::current_path() / "documents";
    nlohmann::json overrides = nlohmann::json::object();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--request" && has_value) {
            request_file = fs::path(argv[++i]);
        } else if (arg == "--account-url" && has_value) {
            overrides["accountUrl"] = argv[++i];
        } else if (arg == "--share" && has_value) {
            overrides["shareName"] = argv[++i];
        } else if (arg == "--dir" && has_value) {
            overrides["directoryPath"] = argv[++i];
        } else if (arg == "--file-name" && has_value) {
            overrides["fileName"] = argv[++i];
        } else if (arg == "--document-id" && has_value) {
            overrides["documentId"] = argv[++i];
        } else if (arg == "--token" && has_value) {
            overrides["manualToken"] = argv[++i];
        } else if (arg == "--vault" && has_value) {
            vault_file = fs::path(argv[++i]);
        } else if (arg == "--vault-key" && has_value) {
            overrides["vaultKey"] = argv[++i];
        } else if (arg == "--vault-field" && has_value) {
            overrides["vaultField"] = argv[++i];
        } else if (arg == "--documents" && has_value) {
            documents_root = fs::path(argv[++i]);
        } else if (arg == "--log-level" && has_value) {
            spdlog::set_level(spdlog::level::from_str(argv[++i]));
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    nlohmann::json document = nlohmann::json::object();
    if (request_file) {
        auto loaded = fsup::config::read_json_file(*request_file);
        if (loaded.is_error()) {
            return report_configuration_error(loaded.error());
        }
        document = std::move(loaded.value());
    }
    if (document.is_object()) {
        document.update(overrides);
    }

    auto request = fsup::config::request_from_json(document);
    if (request.is_error()) {
        return report_configuration_error(request.error());
    }

    EmptyVault empty_vault;
    std::optional<fsup::vault::JsonFileVault> json_vault;
    if (vault_file) {
        auto loaded = fsup::vault::JsonFileVault::load(*vault_file);
        if (loaded.is_error()) {
            return report_configuration_error(loaded.error());
        }
        json_vault.emplace(std::move(loaded.value()));
    }
    fsup::vault::SecretVault& vault = json_vault
        ? static_cast<fsup::vault::SecretVault&>(*json_vault)
        : static_cast<fsup::vault::SecretVault&>(empty_vault);

    fsup::events::EventBus bus;
    fsup::events::LoggerComponent logger(bus);
    fsup::events::MetricsComponent metrics(bus);

    fsup::share::LocalShareClientFactory shares;
    fsup::source::FilesystemDocumentRepository documents(documents_root);
    fsup::upload::UploadService service(shares, documents, vault, bus);

    const auto outcome = service.upload(request.value());
    metrics.print_stats();
    return report(outcome);
}
