#include "fsup/upload/transfer.hpp"

#include "fsup/events/events.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using fsup::ErrorKind;
using fsup::events::EventBus;
using fsup::events::SizeMismatchEvent;
using fsup::source::SourceLease;
using fsup::testing::FakeDirectory;
using fsup::testing::FakeDocumentRepository;
using fsup::testing::FakeShareState;
using fsup::testing::make_payload;
using fsup::upload::TransferOrchestrator;

namespace {

constexpr fsup::source::DocumentId kDocument = 42;

struct TransferFixture {
    EventBus bus;
    FakeDocumentRepository documents;
    std::shared_ptr<FakeShareState> share = std::make_shared<FakeShareState>();
    FakeDirectory root{share, ""};
};

} // namespace

TEST(TransferOrchestratorTest, DefaultChunkSizeIsFourMiB) {
    TransferFixture f;
    TransferOrchestrator transfer(f.documents, f.bus);
    EXPECT_EQ(transfer.chunk_size(), 4u * 1024u * 1024u);
}

TEST(TransferOrchestratorTest, WritesCeilOfSizeOverChunkAndPreservesBytes) {
    constexpr std::size_t kChunk = 16;
    for (std::size_t size : {0u, 1u, 15u, 16u, 17u, 32u, 100u}) {
        TransferFixture f;
        const auto payload = make_payload(size);
        f.documents.add(kDocument, payload);
        f.documents.document(kDocument).max_read = 5;  // short reads must still fill whole chunks

        TransferOrchestrator transfer(f.documents, f.bus, kChunk);
        SourceLease lease;
        auto report = transfer.transfer(f.root, "report.pdf", kDocument, lease);
        ASSERT_TRUE(report.is_ok()) << size;

        const std::size_t expected_writes = (size + kChunk - 1) / kChunk;
        EXPECT_EQ(f.share->write_sizes.size(), expected_writes) << size;
        EXPECT_EQ(report.value().chunks_written, expected_writes) << size;
        EXPECT_EQ(report.value().bytes_written, size) << size;
        EXPECT_EQ(f.share->content_of("report.pdf"), payload) << size;
        for (std::size_t i = 0; i + 1 < f.share->write_sizes.size(); ++i) {
            EXPECT_EQ(f.share->write_sizes[i], kChunk) << size;
        }
        EXPECT_EQ(f.share->closes, 1u) << size;
    }
}

TEST(TransferOrchestratorTest, AllocatesDeclaredSizeBeforeWriting) {
    TransferFixture f;
    f.documents.add(kDocument, make_payload(40));

    TransferOrchestrator transfer(f.documents, f.bus, 16);
    SourceLease lease;
    ASSERT_TRUE(transfer.transfer(f.root, "report.pdf", kDocument, lease).is_ok());

    const std::vector<std::string> expected{
        "file.exists report.pdf",
        "file.create report.pdf 40",
        "file.open report.pdf",
        "write report.pdf", "write report.pdf", "write report.pdf",
        "close report.pdf"};
    EXPECT_EQ(f.share->calls, expected);
    EXPECT_EQ(f.share->files.at("report.pdf").allocated, 40u);
}

TEST(TransferOrchestratorTest, ExistingFileIsDeletedFirst) {
    TransferFixture f;
    f.share->files["report.pdf"].content = {'o', 'l', 'd', ' ', 'd', 'a', 't', 'a'};
    f.documents.add(kDocument, "new");

    TransferOrchestrator transfer(f.documents, f.bus, 16);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "report.pdf", kDocument, lease);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().replaced_existing);

    ASSERT_GE(f.share->calls.size(), 3u);
    EXPECT_EQ(f.share->calls[0], "file.exists report.pdf");
    EXPECT_EQ(f.share->calls[1], "file.delete report.pdf");
    EXPECT_EQ(f.share->calls[2], "file.create report.pdf 3");
    EXPECT_EQ(f.share->content_of("report.pdf"), "new");
}

TEST(TransferOrchestratorTest, MissingSizeAllocatesZeroAndReportsMismatch) {
    TransferFixture f;
    f.documents.add(kDocument, "payload");
    f.documents.document(kDocument).reported_size.reset();

    std::vector<SizeMismatchEvent> mismatches;
    f.bus.subscribe<SizeMismatchEvent>([&](const SizeMismatchEvent& e) { mismatches.push_back(e); });

    TransferOrchestrator transfer(f.documents, f.bus, 4);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "doc.bin", kDocument, lease);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().allocated_bytes, 0u);
    EXPECT_EQ(report.value().bytes_written, 7u);
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].allocated_bytes, 0u);
    EXPECT_EQ(mismatches[0].bytes_written, 7u);
}

TEST(TransferOrchestratorTest, ReadFailureStopsStreamingAndClosesWriter) {
    constexpr std::size_t kChunk = 8;
    TransferFixture f;
    f.documents.add(kDocument, make_payload(5 * kChunk));
    f.documents.document(kDocument).fail_after_bytes = 2 * kChunk;

    TransferOrchestrator transfer(f.documents, f.bus, kChunk);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "big.bin", kDocument, lease);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::SourceRead);
    EXPECT_EQ(f.share->write_sizes.size(), 2u);
    EXPECT_EQ(f.share->closes, 1u);
    EXPECT_EQ(f.share->files.at("big.bin").allocated, 5 * kChunk);
    EXPECT_TRUE(lease.held());
}

TEST(TransferOrchestratorTest, WriteFailureIsRemoteIOError) {
    TransferFixture f;
    f.documents.add(kDocument, make_payload(30));
    f.share->fail_write_at = 1;

    TransferOrchestrator transfer(f.documents, f.bus, 10);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "out.bin", kDocument, lease);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::RemoteIO);
    EXPECT_NE(report.error().detail.find("connection reset"), std::string::npos);
    EXPECT_EQ(f.share->write_sizes.size(), 2u);
    EXPECT_EQ(f.share->closes, 1u);
}

TEST(TransferOrchestratorTest, CloseFailureAfterCompleteStreamFails) {
    TransferFixture f;
    f.documents.add(kDocument, "abc");
    f.share->fail_close = true;

    TransferOrchestrator transfer(f.documents, f.bus, 10);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "out.bin", kDocument, lease);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::RemoteIO);
    EXPECT_NE(report.error().detail.find("flush rejected"), std::string::npos);
}

TEST(TransferOrchestratorTest, StreamFailureWinsOverCloseFailure) {
    TransferFixture f;
    f.documents.add(kDocument, make_payload(20));
    f.documents.document(kDocument).fail_after_bytes = 10;
    f.share->fail_close = true;

    TransferOrchestrator transfer(f.documents, f.bus, 10);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "out.bin", kDocument, lease);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::SourceRead);
}

TEST(TransferOrchestratorTest, ThrowingAllocationIsRemoteIOError) {
    TransferFixture f;
    f.documents.add(kDocument, "abc");
    f.share->throw_on_file_create = true;

    TransferOrchestrator transfer(f.documents, f.bus, 10);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "out.bin", kDocument, lease);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::RemoteIO);
    EXPECT_NE(report.error().detail.find("socket closed"), std::string::npos);
}

TEST(TransferOrchestratorTest, UnknownDocumentIsSourceReadError) {
    TransferFixture f;

    TransferOrchestrator transfer(f.documents, f.bus, 10);
    SourceLease lease;
    auto report = transfer.transfer(f.root, "out.bin", 7, lease);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::SourceRead);
    EXPECT_FALSE(lease.held());
    EXPECT_FALSE(f.share->has_file("out.bin"));
}
