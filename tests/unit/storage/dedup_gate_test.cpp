#include <gtest/gtest.h>
#include <relsync/storage/dedup_gate.h>

#include "common/test_helpers.h"

#include <filesystem>

using namespace relsync::storage;
using relsync::tests::make_temp_dir;
using relsync::tests::write_file;

namespace fs = std::filesystem;

class DedupGateTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = make_temp_dir("relsync_dedup_"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(DedupGateTest, DestinationIsInsideSaveDir) {
    EXPECT_EQ(destinationPath(dir_, "build-42.zip"), dir_ / "build-42.zip");
}

TEST_F(DedupGateTest, MissingFileIsNotFetched) {
    EXPECT_FALSE(alreadyFetched(dir_, "build-42.zip"));
}

TEST_F(DedupGateTest, ExistingFileIsFetched) {
    write_file(dir_ / "build-42.zip", "payload");
    EXPECT_TRUE(alreadyFetched(dir_, "build-42.zip"));
}

TEST_F(DedupGateTest, PartialFileStillCountsAsFetched) {
    // Existence alone decides; a truncated leftover is not re-downloaded.
    write_file(dir_ / "build-42.zip", "");
    EXPECT_TRUE(alreadyFetched(dir_, "build-42.zip"));
}

TEST_F(DedupGateTest, MissingSaveDirIsNotFetched) {
    EXPECT_FALSE(alreadyFetched(dir_ / "nope", "build-42.zip"));
}
