#include "fsup/upload/service.hpp"

#include "fsup/events/components.hpp"
#include "fsup/events/events.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using fsup::events::EventBus;
using fsup::events::MetricsComponent;
using fsup::events::UploadFailedEvent;
using fsup::testing::FakeDocumentRepository;
using fsup::testing::FakeShareFactory;
using fsup::testing::FakeVault;
using fsup::testing::make_payload;
using fsup::upload::TransferOutcome;
using fsup::upload::UploadRequest;
using fsup::upload::UploadService;

namespace {

constexpr std::size_t kChunk = 8;

struct ServiceFixture {
    EventBus bus;
    FakeShareFactory shares;
    FakeDocumentRepository documents;
    FakeVault vault;
    UploadService service{shares, documents, vault, bus, kChunk};
};

UploadRequest base_request() {
    UploadRequest request;
    request.account_url = "https://acct.file.core.windows.net";
    request.share_name = "finance";
    request.directory_path = "";
    request.file_name = "report.pdf";
    request.document_id = 42;
    request.manual_token = "sv=2024-01-01&sig=abc";
    return request;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

} // namespace

TEST(UploadServiceTest, ManualTokenUploadToShareRoot) {
    ServiceFixture f;
    f.documents.add(42, make_payload(20));

    auto outcome = f.service.upload(base_request());
    EXPECT_TRUE(outcome.success());
    EXPECT_FALSE(outcome.message().has_value());

    ASSERT_TRUE(f.shares.state->has_file("report.pdf"));
    EXPECT_EQ(f.shares.state->files.at("report.pdf").allocated, 20u);
    EXPECT_EQ(f.shares.state->content_of("report.pdf"), make_payload(20));
    EXPECT_EQ(f.documents.state->closes, 1u);
}

TEST(UploadServiceTest, EndpointIsAccountShareAndToken) {
    ServiceFixture f;
    f.documents.add(42, "x");

    ASSERT_TRUE(f.service.upload(base_request()).success());
    ASSERT_EQ(f.shares.endpoints.size(), 1u);
    EXPECT_EQ(f.shares.endpoints[0], "https://acct.file.core.windows.net/finance?sv=2024-01-01&sig=abc");
}

TEST(UploadServiceTest, MissingVaultFieldReportsConfigurationError) {
    ServiceFixture f;
    f.documents.add(42, "x");
    f.vault.entries["azure-creds"] = {{"accountName", "acct"}};

    auto request = base_request();
    request.manual_token.reset();
    request.vault_key = "azure-creds";
    request.vault_field = "sasToken";

    auto outcome = f.service.upload(request);
    EXPECT_FALSE(outcome.success());
    ASSERT_TRUE(outcome.message().has_value());
    EXPECT_EQ(*outcome.message(), "ConfigurationError: No SAS Token provided via SCS or Manual Input.");
    EXPECT_TRUE(f.shares.endpoints.empty());
    EXPECT_TRUE(f.shares.state->calls.empty());
}

TEST(UploadServiceTest, VaultTokenIsUsedForEndpoint) {
    ServiceFixture f;
    f.documents.add(42, "x");
    f.vault.entries["azure-creds"] = {{"sasToken", "sv=vault&sig=zzz"}};

    auto request = base_request();
    request.manual_token.reset();
    request.vault_key = "azure-creds";
    request.vault_field = "sasToken";

    ASSERT_TRUE(f.service.upload(request).success());
    ASSERT_EQ(f.shares.endpoints.size(), 1u);
    EXPECT_EQ(f.shares.endpoints[0], "https://acct.file.core.windows.net/finance?sv=vault&sig=zzz");
}

TEST(UploadServiceTest, CreatesDirectoriesBeforeFileOperations) {
    ServiceFixture f;
    f.documents.add(42, "abc");

    auto request = base_request();
    request.directory_path = "reports/2024";
    ASSERT_TRUE(f.service.upload(request).success());

    const auto& calls = f.shares.state->calls;
    ASSERT_GE(calls.size(), 5u);
    EXPECT_EQ(calls[0], "dir.exists reports");
    EXPECT_EQ(calls[1], "dir.create reports");
    EXPECT_EQ(calls[2], "dir.exists reports/2024");
    EXPECT_EQ(calls[3], "dir.create reports/2024");
    EXPECT_EQ(calls[4], "file.exists reports/2024/report.pdf");
    EXPECT_EQ(f.shares.state->content_of("reports/2024/report.pdf"), "abc");
}

TEST(UploadServiceTest, ExistingTargetIsReplaced) {
    ServiceFixture f;
    f.shares.state->files["report.pdf"].content = {'s', 't', 'a', 'l', 'e', '!', '!', '!', '!', '!'};
    f.documents.add(42, "fresh");

    ASSERT_TRUE(f.service.upload(base_request()).success());
    EXPECT_EQ(f.shares.state->calls[1], "file.delete report.pdf");
    EXPECT_EQ(f.shares.state->content_of("report.pdf"), "fresh");
}

TEST(UploadServiceTest, RepeatedUploadLeavesLatestContent) {
    ServiceFixture f;
    auto request = base_request();
    request.directory_path = "a\\b";

    f.documents.add(42, make_payload(30));
    ASSERT_TRUE(f.service.upload(request).success());

    f.documents.add(42, "second upload");
    ASSERT_TRUE(f.service.upload(request).success());

    EXPECT_EQ(f.shares.state->files.size(), 1u);
    EXPECT_EQ(f.shares.state->content_of("a/b/report.pdf"), "second upload");
    EXPECT_EQ(f.documents.state->closes, 2u);
}

TEST(UploadServiceTest, ReadFailureMidStreamReportsSourceReadError) {
    ServiceFixture f;
    f.documents.add(42, make_payload(5 * kChunk));
    f.documents.document(42).fail_after_bytes = 2 * kChunk;

    auto outcome = f.service.upload(base_request());
    EXPECT_FALSE(outcome.success());
    ASSERT_TRUE(outcome.message().has_value());
    EXPECT_TRUE(starts_with(*outcome.message(), "SourceReadError: ")) << *outcome.message();

    EXPECT_EQ(f.shares.state->write_sizes.size(), 2u);
    EXPECT_EQ(f.shares.state->files.at("report.pdf").allocated, 5 * kChunk);
    EXPECT_EQ(f.shares.state->content_of("report.pdf").size(), 2 * kChunk);
    EXPECT_EQ(f.documents.state->opens, 1u);
    EXPECT_EQ(f.documents.state->closes, 1u);
}

TEST(UploadServiceTest, MissingDocumentIdFailsBeforeRemoteCalls) {
    ServiceFixture f;
    auto request = base_request();
    request.document_id.reset();

    auto outcome = f.service.upload(request);
    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(starts_with(*outcome.message(), "ConfigurationError: "));
    EXPECT_TRUE(f.shares.endpoints.empty());
}

TEST(UploadServiceTest, BlankRequiredInputsAreConfigurationErrors) {
    ServiceFixture f;
    auto no_account = base_request();
    no_account.account_url = " ";
    auto no_share = base_request();
    no_share.share_name.clear();
    auto no_file = base_request();
    no_file.file_name = "";

    for (const auto& request : {no_account, no_share, no_file}) {
        auto outcome = f.service.upload(request);
        EXPECT_FALSE(outcome.success());
        EXPECT_TRUE(starts_with(*outcome.message(), "ConfigurationError: "));
    }
    EXPECT_TRUE(f.shares.endpoints.empty());
}

TEST(UploadServiceTest, ConnectFailureIsRemoteIOErrorWithoutToken) {
    ServiceFixture f;
    f.documents.add(42, "x");
    f.shares.fail_connect = true;

    auto outcome = f.service.upload(base_request());
    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(starts_with(*outcome.message(), "RemoteIOError: "));
    EXPECT_EQ(outcome.message()->find("sig=abc"), std::string::npos);
}

TEST(UploadServiceTest, ReleaseFailureDoesNotChangeOutcome) {
    ServiceFixture f;
    f.documents.add(42, "content");
    f.documents.state->fail_close = true;

    auto outcome = f.service.upload(base_request());
    EXPECT_TRUE(outcome.success());
    EXPECT_FALSE(outcome.message().has_value());
    EXPECT_EQ(f.documents.state->closes, 1u);
}

TEST(UploadServiceTest, ReleaseFailureKeepsPrimaryFailure) {
    ServiceFixture f;
    f.documents.add(42, make_payload(20));
    f.documents.state->fail_close = true;
    f.shares.state->fail_write_at = 0;

    auto outcome = f.service.upload(base_request());
    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(starts_with(*outcome.message(), "RemoteIOError: "));
    EXPECT_EQ(f.documents.state->closes, 1u);
}

TEST(UploadServiceTest, EmitsFailureEventAndCountsMetrics) {
    ServiceFixture f;
    MetricsComponent metrics(f.bus);
    std::vector<std::string> failures;
    f.bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent& e) { failures.push_back(e.message); });

    f.documents.add(42, make_payload(20));
    ASSERT_TRUE(f.service.upload(base_request()).success());

    auto broken = base_request();
    broken.document_id = 99;
    EXPECT_FALSE(f.service.upload(broken).success());

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_succeeded.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.chunks_written.load(), 3u);
    EXPECT_EQ(stats.bytes_written.load(), 20u);
    EXPECT_EQ(stats.files_replaced.load(), 1u);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_TRUE(starts_with(failures[0], "SourceReadError: "));
}

TEST(UploadServiceTest, ThrowingDirectoryHandleIsRemoteIOError) {
    ServiceFixture f;
    f.documents.add(42, "x");
    f.shares.state->throw_on_handle = true;

    auto request = base_request();
    request.directory_path = "reports";
    auto outcome = f.service.upload(request);
    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(starts_with(*outcome.message(), "RemoteIOError: ")) << *outcome.message();
    EXPECT_NE(outcome.message()->find("invalid directory name"), std::string::npos);
    EXPECT_TRUE(f.shares.state->calls.empty());
}

TEST(UploadServiceTest, ThrowingFileHandleIsRemoteIOError) {
    ServiceFixture f;
    f.documents.add(42, "x");
    f.shares.state->throw_on_handle = true;

    auto outcome = f.service.upload(base_request());
    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(starts_with(*outcome.message(), "RemoteIOError: ")) << *outcome.message();
    EXPECT_NE(outcome.message()->find("invalid file name"), std::string::npos);
    EXPECT_EQ(f.documents.state->opens, 0u);
}

TEST(UploadServiceTest, NullShareHandlesAreRemoteIOErrors) {
    ServiceFixture f;
    f.documents.add(42, "x");

    f.shares.state->null_root = true;
    auto no_root = f.service.upload(base_request());
    EXPECT_TRUE(starts_with(*no_root.message(), "RemoteIOError: ")) << *no_root.message();

    f.shares.state->null_root = false;
    f.shares.state->null_handle = true;
    auto no_file = f.service.upload(base_request());
    EXPECT_TRUE(starts_with(*no_file.message(), "RemoteIOError: ")) << *no_file.message();

    auto request = base_request();
    request.directory_path = "reports";
    auto no_directory = f.service.upload(request);
    EXPECT_TRUE(starts_with(*no_directory.message(), "RemoteIOError: ")) << *no_directory.message();
}

TEST(UploadServiceTest, NonStandardExceptionFromObserverDoesNotEscape) {
    ServiceFixture f;
    f.documents.add(42, "x");
    f.bus.subscribe<fsup::events::UploadCompletedEvent>([](const fsup::events::UploadCompletedEvent&) {
        throw 17;
    });

    TransferOutcome outcome = TransferOutcome::failed(fsup::UploadError{fsup::ErrorKind::Internal, "unset"});
    EXPECT_NO_THROW(outcome = f.service.upload(base_request()));
    EXPECT_TRUE(outcome.success());
}
