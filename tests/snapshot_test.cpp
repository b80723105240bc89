#include "engine/snapshot.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace hashwatch;
using namespace hashwatch::engine;
namespace fs = std::filesystem;

class SnapshotTrackerTest : public ::testing::Test {
protected:
    void SetUp() override { m_dir = test::make_temp_dir("snapshot"); }
    void TearDown() override { fs::remove_all(m_dir); }

    fs::path m_dir;
    SnapshotTracker m_tracker;
};

TEST_F(SnapshotTrackerTest, FirstSightingIsAChange) {
    auto path = m_dir / "a.conf";
    test::write_file(path, "x");

    EXPECT_TRUE(m_tracker.has_real_change(path));
    EXPECT_EQ(m_tracker.size(), 1u);
}

TEST_F(SnapshotTrackerTest, SameMetadataIsNotAChange) {
    auto path = m_dir / "a.conf";
    test::write_file(path, "x");

    ASSERT_TRUE(m_tracker.has_real_change(path));
    EXPECT_FALSE(m_tracker.has_real_change(path));
}

TEST_F(SnapshotTrackerTest, SizeOrMtimeChangeIsAChange) {
    auto path = m_dir / "a.conf";
    test::write_file(path, "x");
    ASSERT_TRUE(m_tracker.has_real_change(path));

    test::write_file(path, "xyz");
    EXPECT_TRUE(m_tracker.has_real_change(path));

    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(10));
    EXPECT_TRUE(m_tracker.has_real_change(path));
    EXPECT_FALSE(m_tracker.has_real_change(path));
}

TEST_F(SnapshotTrackerTest, RemovedFileIsAChangeAndIsForgotten) {
    auto path = m_dir / "a.conf";
    test::write_file(path, "x");
    ASSERT_TRUE(m_tracker.has_real_change(path));

    fs::remove(path);
    EXPECT_TRUE(m_tracker.has_real_change(path));
    EXPECT_EQ(m_tracker.size(), 0u);
    EXPECT_TRUE(m_tracker.has_real_change(path));
}
