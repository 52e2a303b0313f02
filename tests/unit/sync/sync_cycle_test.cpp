#include <gtest/gtest.h>
#include <relsync/sync/sync_cycle.h>

#include "common/test_helpers.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

using namespace relsync;
using namespace relsync::sync;
using relsync::tests::FakeHttpClient;
using relsync::tests::FakeNotifier;

namespace fs = std::filesystem;

namespace {

constexpr const char* kFeedUrl = "https://example.org/releases.rss";
constexpr const char* kDownloadUrl = "https://example.org/dl/build-42.zip";

struct Finished {
    std::string fileName;
    bool ok;
    std::uint64_t bytes;
    std::optional<ErrorCode> code;
};

class SyncCycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        saveDir_ = relsync::tests::make_temp_dir("relsync_cycle_");

        http_->setPage(kFeedUrl, relsync::tests::make_feed("rom/build-42.zip", kDownloadUrl,
                                                           "Mon, 01 Jan 2024 00:00:00 GMT",
                                                           "0123456789abcdef0123456789abcdef"));
        http_->setFile(kDownloadUrl, "release payload");

        transfer::TransferOptions options;
        options.fsyncOnComplete = false;

        ctx_ = std::make_shared<SyncContext>();
        ctx_->feedUrl = kFeedUrl;
        ctx_->saveDir = saveDir_;
        ctx_->http = http_;
        ctx_->notifier = notifier_;
        ctx_->resolver =
            std::make_shared<feed::FeedEntryResolver>(http_, "http://localhost:8080/assets");
        ctx_->transfer = std::make_shared<transfer::ResumableTransfer>(http_, notifier_, options);
        ctx_->ioExecutor = io_.get_executor();
        ctx_->onTransferFinished = [this](const feed::ArtifactRecord& record,
                                          const Result<std::uint64_t>& r) {
            finished_.push_back(Finished{record.fileName(), r.has_value(),
                                         r.has_value() ? r.value() : 0,
                                         r.has_value() ? std::nullopt
                                                       : std::optional<ErrorCode>(r.error().code)});
        };
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(saveDir_, ec);
    }

    std::optional<CycleOutcome> runOneCycle() {
        std::optional<CycleOutcome> outcome;
        boost::asio::co_spawn(io_, runCycle(ctx_),
                              [&outcome](std::exception_ptr ep, CycleOutcome o) {
                                  if (!ep)
                                      outcome = o;
                              });
        io_.restart();
        io_.run();
        return outcome;
    }

    boost::asio::io_context io_;
    fs::path saveDir_;
    std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();
    std::shared_ptr<FakeNotifier> notifier_ = std::make_shared<FakeNotifier>();
    std::shared_ptr<SyncContext> ctx_;
    std::vector<Finished> finished_;
};

} // namespace

TEST_F(SyncCycleTest, DownloadsNewRelease) {
    auto outcome = runOneCycle();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, CycleOutcome::TransferLaunched);

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].fileName, "build-42.zip");
    EXPECT_TRUE(finished_[0].ok);
    EXPECT_EQ(finished_[0].bytes, std::string("release payload").size());
    EXPECT_EQ(relsync::tests::read_file(saveDir_ / "build-42.zip"), "release payload");

    auto messages = notifier_->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].rfind("download complete:\nfile name: build-42.zip", 0), 0u);
}

TEST_F(SyncCycleTest, SkipsReleaseAlreadyOnDisk) {
    relsync::tests::write_file(saveDir_ / "build-42.zip", "old bytes");

    auto outcome = runOneCycle();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, CycleOutcome::Skipped);
    EXPECT_TRUE(http_->streamCalls().empty());
    EXPECT_TRUE(finished_.empty());
    EXPECT_TRUE(notifier_->messages().empty());
    EXPECT_EQ(relsync::tests::read_file(saveDir_ / "build-42.zip"), "old bytes");
}

TEST_F(SyncCycleTest, SecondCycleSkipsAfterDownload) {
    ASSERT_EQ(runOneCycle(), CycleOutcome::TransferLaunched);
    ASSERT_EQ(runOneCycle(), CycleOutcome::Skipped);
    EXPECT_EQ(http_->streamCalls().size(), 1u);
    EXPECT_EQ(http_->fetched().size(), 2u);
}

TEST_F(SyncCycleTest, ResolutionFailureEndsCycle) {
    http_->setPage(kFeedUrl, "oops", 502);

    auto outcome = runOneCycle();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, CycleOutcome::ResolutionFailed);
    EXPECT_TRUE(http_->streamCalls().empty());
    EXPECT_TRUE(finished_.empty());
}

TEST_F(SyncCycleTest, FailedTransferIsReportedNotThrown) {
    http_->failStreamsWith(Error{ErrorCode::ServerError, "HTTP error 404"});

    auto outcome = runOneCycle();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, CycleOutcome::TransferLaunched);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_FALSE(finished_[0].ok);
    EXPECT_EQ(finished_[0].code, ErrorCode::ServerError);
    EXPECT_TRUE(notifier_->messages().empty());
}

TEST_F(SyncCycleTest, NonStdExceptionFromTransferIsReported) {
    struct Foreign {};
    http_->setStreamHook([] { throw Foreign{}; });

    std::optional<CycleOutcome> outcome;
    EXPECT_NO_THROW(outcome = runOneCycle());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, CycleOutcome::TransferLaunched);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_FALSE(finished_[0].ok);
    EXPECT_EQ(finished_[0].code, ErrorCode::InternalError);
    EXPECT_TRUE(notifier_->messages().empty());
}

TEST_F(SyncCycleTest, BlockingWorkRunsOnWorkerPool) {
    boost::asio::thread_pool workers(2);
    ctx_->workerExecutor = workers.get_executor();

    auto outcome = runOneCycle();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, CycleOutcome::TransferLaunched);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_TRUE(finished_[0].ok);

    workers.join();
}

TEST(SyncStateTest, Names) {
    EXPECT_STREQ(toString(SyncState::Idle), "Idle");
    EXPECT_STREQ(toString(SyncState::Downloading), "Downloading");
    EXPECT_STREQ(toString(CycleOutcome::Skipped), "Skipped");
    EXPECT_STREQ(toString(CycleOutcome::TransferLaunched), "TransferLaunched");
}
