#include <gtest/gtest.h>
#include <relsync/feed/rfc2822.h>
#include <relsync/transfer/resumable_transfer.h>

#include "common/test_helpers.h"

#include <filesystem>
#include <memory>
#include <string>

using namespace relsync;
using namespace relsync::transfer;
using relsync::tests::FakeHttpClient;
using relsync::tests::FakeNotifier;

namespace fs = std::filesystem;

namespace {

constexpr const char* kUrl = "https://example.org/dl/build-42.zip";

std::string payload(std::size_t n) {
    std::string s;
    s.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        s.push_back(static_cast<char>('a' + (i % 26)));
    return s;
}

class ResumableTransferTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = relsync::tests::make_temp_dir("relsync_transfer_"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    feed::ArtifactRecord record() const {
        return feed::ArtifactRecord{*feed::parseRfc2822("Mon, 01 Jan 2024 00:00:00 GMT"), kUrl,
                                    "0123456789abcdef0123456789abcdef", "build-42.zip",
                                    "http://localhost:8080/assets/build-42.zip"};
    }

    ResumableTransfer makeTransfer(int retryLimit = 5) {
        TransferOptions options;
        options.retryLimit = retryLimit;
        options.fsyncOnComplete = false;
        return ResumableTransfer{http_, notifier_, options};
    }

    fs::path dir_;
    std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();
    std::shared_ptr<FakeNotifier> notifier_ = std::make_shared<FakeNotifier>();
};

} // namespace

TEST_F(ResumableTransferTest, DownloadsInOneAttempt) {
    const auto content = payload(1000);
    http_->setFile(kUrl, content);

    auto transfer = makeTransfer();
    auto r = transfer.download(record(), dir_ / "build-42.zip");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), 1000u);
    EXPECT_EQ(relsync::tests::read_file(dir_ / "build-42.zip"), content);
    ASSERT_EQ(http_->streamCalls().size(), 1u);
    EXPECT_EQ(http_->streamCalls()[0].offset, 0u);
}

TEST_F(ResumableTransferTest, ResumesFromBytesOnDisk) {
    const auto content = payload(1000);
    http_->setFile(kUrl, content);
    http_->interruptAfter(100);
    http_->interruptAfter(250);

    auto transfer = makeTransfer();
    auto r = transfer.download(record(), dir_ / "build-42.zip");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), 1000u);
    EXPECT_EQ(relsync::tests::read_file(dir_ / "build-42.zip"), content);

    auto calls = http_->streamCalls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].offset, 0u);
    EXPECT_EQ(calls[1].offset, 100u);
    EXPECT_EQ(calls[2].offset, 350u);
    for (const auto& c : calls)
        EXPECT_EQ(c.url, kUrl);
}

TEST_F(ResumableTransferTest, GivesUpAfterRetryLimit) {
    http_->setFile(kUrl, payload(1000));
    for (int i = 0; i < 5; ++i)
        http_->interruptAfter(10);

    auto transfer = makeTransfer(5);
    const auto dest = dir_ / "build-42.zip";
    auto r = transfer.download(record(), dest);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StreamInterrupted);
    EXPECT_EQ(http_->streamCalls().size(), 5u);

    // Partial data stays where it is.
    ASSERT_TRUE(fs::exists(dest));
    EXPECT_EQ(fs::file_size(dest), 50u);
    EXPECT_TRUE(notifier_->messages().empty());
}

TEST_F(ResumableTransferTest, RetryLimitOfOneMeansNoRetry) {
    http_->setFile(kUrl, payload(100));
    http_->interruptAfter(10);

    auto transfer = makeTransfer(1);
    auto r = transfer.download(record(), dir_ / "build-42.zip");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StreamInterrupted);
    EXPECT_EQ(http_->streamCalls().size(), 1u);
}

TEST_F(ResumableTransferTest, ServerErrorIsNotRetried) {
    http_->failStreamsWith(Error{ErrorCode::ServerError, "HTTP error 503"});

    auto transfer = makeTransfer();
    auto r = transfer.download(record(), dir_ / "build-42.zip");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ServerError);
    EXPECT_EQ(http_->streamCalls().size(), 1u);
    EXPECT_TRUE(notifier_->messages().empty());
}

TEST_F(ResumableTransferTest, ZeroLengthArtifact) {
    http_->setFile(kUrl, "");

    auto transfer = makeTransfer();
    const auto dest = dir_ / "build-42.zip";
    auto r = transfer.download(record(), dest);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), 0u);
    ASSERT_TRUE(fs::exists(dest));
    EXPECT_EQ(fs::file_size(dest), 0u);
}

TEST_F(ResumableTransferTest, TruncatesStaleDestination) {
    const auto dest = relsync::tests::write_file(dir_ / "build-42.zip", payload(5000));
    http_->setFile(kUrl, "fresh");

    auto transfer = makeTransfer();
    auto r = transfer.download(record(), dest);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(relsync::tests::read_file(dest), "fresh");
}

TEST_F(ResumableTransferTest, CreatesMissingParentDirectories) {
    http_->setFile(kUrl, "abc");
    auto transfer = makeTransfer();
    const auto dest = dir_ / "nested" / "deeper" / "build-42.zip";
    auto r = transfer.download(record(), dest);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(relsync::tests::read_file(dest), "abc");
}

TEST_F(ResumableTransferTest, NotifiesWithSummary) {
    http_->setFile(kUrl, payload(10));
    auto transfer = makeTransfer();
    auto rec = record();
    ASSERT_TRUE(transfer.download(rec, dir_ / "build-42.zip"));

    auto messages = notifier_->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "download complete:\n" + rec.summary());
}

TEST_F(ResumableTransferTest, NotificationFailureDoesNotFailTransfer) {
    http_->setFile(kUrl, payload(10));
    notifier_->failWith(Error{ErrorCode::NetworkError, "telegram unreachable"});

    auto transfer = makeTransfer();
    auto r = transfer.download(record(), dir_ / "build-42.zip");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), 10u);
    EXPECT_EQ(notifier_->messages().size(), 1u);
}

TEST_F(ResumableTransferTest, WorksWithoutNotifier) {
    http_->setFile(kUrl, payload(10));
    TransferOptions options;
    options.fsyncOnComplete = true;
    ResumableTransfer transfer{http_, nullptr, options};
    auto r = transfer.download(record(), dir_ / "build-42.zip");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), 10u);
}

TEST(OpenRangeValueTest, FormatsOpenEndedRange) {
    EXPECT_EQ(net::openRangeValue(0), "bytes=0-");
    EXPECT_EQ(net::openRangeValue(350), "bytes=350-");
}
