#include "fsup/upload/service.hpp"

#include "fsup/core/text.hpp"
#include "fsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace fsup::upload {
namespace {

std::string target_path_of(const UploadRequest& request) {
    std::string path;
    if (request.directory_path) {
        for (const auto& segment : DirectoryWalker::split_segments(*request.directory_path)) {
            path = share::join_share_path(path, segment);
        }
    }
    return share::join_share_path(path, request.file_name);
}

} // namespace

UploadService::UploadService(share::ShareClientFactory& shares,
                             source::DocumentRepository& documents,
                             vault::SecretVault& vault,
                             events::EventBus& bus,
                             std::size_t chunk_size)
    : UploadService(shares, documents, CredentialResolver::with_defaults(vault), bus, chunk_size) {}

UploadService::UploadService(share::ShareClientFactory& shares,
                             source::DocumentRepository& documents,
                             CredentialResolver credentials,
                             events::EventBus& bus,
                             std::size_t chunk_size)
    : shares_(shares),
      bus_(bus),
      credentials_(std::move(credentials)),
      walker_(bus),
      transfer_(documents, bus, chunk_size) {}

TransferOutcome UploadService::upload(const UploadRequest& request) const {
    const auto started_at = std::chrono::steady_clock::now();
    const auto document_id = request.document_id.value_or(0);

    std::optional<UploadError> failure;
    TransferReport report;
    source::SourceLease lease;

    try {
        auto result = run_pipeline(request, lease);
        if (result.is_error()) {
            failure = result.error();
        } else {
            report = std::move(result.value());
        }
    } catch (const std::exception& e) {
        failure = UploadError{ErrorKind::Internal, e.what()};
    } catch (...) {
        failure = UploadError{ErrorKind::Internal, "unknown exception"};
    }

    auto released = lease.release();
    if (released.is_error()) {
        spdlog::error("{}", UploadError{ErrorKind::ResourceRelease,
                                        "Failed to close document input stream: " + released.error()}
                                .message());
    }

    if (failure) {
        auto outcome = TransferOutcome::failed(*failure);
        spdlog::error("Error uploading file into remote share. Document id is {} and file name is {}: {}",
                      document_id, request.file_name, *outcome.message());
        bus_.emit(events::UploadFailedEvent{document_id, request.file_name, *outcome.message()});
        return outcome;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    bus_.emit(events::UploadCompletedEvent{document_id, report.file_path, report.bytes_written,
                                           report.chunks_written, duration});
    return TransferOutcome::succeeded();
}

UploadResult<TransferReport> UploadService::run_pipeline(const UploadRequest& request,
                                                         source::SourceLease& lease) const {
    if (auto valid = validate(request); valid.is_error()) {
        return fsup::Err<TransferReport>(valid.error());
    }

    auto token = credentials_.resolve(request);
    if (token.is_error()) {
        return fsup::Err<TransferReport>(token.error());
    }

    bus_.emit(events::UploadStartedEvent{*request.document_id, request.share_name, target_path_of(request)});

    const auto endpoint = share::make_share_endpoint(request.account_url, request.share_name, token.value());
    auto client = fsup::capture(ErrorKind::RemoteIO, [&] { return shares_.connect(endpoint); });
    if (client.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO,
            "Failed to connect to share '" + request.share_name + "' at " + request.account_url + ": " +
                client.error().detail});
    }
    if (!client.value()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO, "No client for share '" + request.share_name + "'"});
    }

    auto root = fsup::capture_handle(ErrorKind::RemoteIO, [&] { return client.value()->root_directory(); });
    if (root.is_error()) {
        return fsup::Err<TransferReport>(UploadError{
            ErrorKind::RemoteIO,
            "Failed to open root of share '" + request.share_name + "': " + root.error().detail});
    }

    auto directory = walker_.walk(std::move(root.value()), request.directory_path);
    if (directory.is_error()) {
        return fsup::Err<TransferReport>(directory.error());
    }

    return transfer_.transfer(*directory.value(), request.file_name, *request.document_id, lease);
}

UploadResult<void> UploadService::validate(const UploadRequest& request) {
    if (text::is_blank(request.account_url)) {
        return fsup::Err<void>(UploadError{ErrorKind::Configuration, "Account URL is required."});
    }
    if (text::is_blank(request.share_name)) {
        return fsup::Err<void>(UploadError{ErrorKind::Configuration, "Share name is required."});
    }
    if (text::is_blank(request.file_name)) {
        return fsup::Err<void>(UploadError{ErrorKind::Configuration, "File name is required."});
    }
    if (!request.document_id) {
        return fsup::Err<void>(UploadError{ErrorKind::Configuration, "Source document is null or missing."});
    }
    return fsup::Ok<UploadError>();
}

} // namespace fsup::upload
