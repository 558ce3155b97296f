#pragma once

#include "fsup/core/error.hpp"
#include "fsup/events/event_bus.hpp"
#include "fsup/share/share_client.hpp"
#include "fsup/source/document_repository.hpp"
#include "fsup/source/source_lease.hpp"
#include "fsup/upload/credential_resolver.hpp"
#include "fsup/upload/directory_walker.hpp"
#include "fsup/upload/transfer.hpp"
#include "fsup/upload/types.hpp"
#include "fsup/vault/secret_vault.hpp"

#include <cstddef>

namespace fsup::upload {

/**
 * @brief Runs one upload request end to end and reports the outcome
 *
 * credentials -> share client -> directory walk -> transfer
 *
 * upload() is the single failure boundary: every error, including an
 * exception thrown by a collaborator, becomes a failed TransferOutcome.
 * The source stream is closed exactly once on every path; a failure to
 * close it is logged and does not change the outcome.
 *
 * One call is fully synchronous. Concurrent calls for different targets are
 * independent; concurrent calls for the same target path race.
 */
class UploadService {
public:
    UploadService(share::ShareClientFactory& shares,
                  source::DocumentRepository& documents,
                  vault::SecretVault& vault,
                  events::EventBus& bus,
                  std::size_t chunk_size = kDefaultChunkSize);

    UploadService(share::ShareClientFactory& shares,
                  source::DocumentRepository& documents,
                  CredentialResolver credentials,
                  events::EventBus& bus,
                  std::size_t chunk_size = kDefaultChunkSize);

    TransferOutcome upload(const UploadRequest& request) const;

private:
    UploadResult<TransferReport> run_pipeline(const UploadRequest& request, source::SourceLease& lease) const;

    static UploadResult<void> validate(const UploadRequest& request);

    share::ShareClientFactory& shares_;
    events::EventBus& bus_;
    CredentialResolver credentials_;
    DirectoryWalker walker_;
    TransferOrchestrator transfer_;
};

} // namespace fsup::upload
