#include "engine/credential_cache.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace hashwatch;
using namespace hashwatch::engine;
using json = nlohmann::json;
namespace fs = std::filesystem;

class CredentialCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = test::make_temp_dir("credentials");
        m_now = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    }

    void TearDown() override {
        fs::remove_all(m_dir);
    }

    CredentialCache make_cache() {
        return CredentialCache(path(), [this] { return m_now; });
    }

    fs::path path() const { return m_dir / "nested" / "sid.json"; }

    fs::path m_dir;
    std::chrono::system_clock::time_point m_now;
};

TEST_F(CredentialCacheTest, MissingFileIsMiss) {
    EXPECT_FALSE(make_cache().load().has_value());
}

TEST_F(CredentialCacheTest, StoreThenLoad) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.store("abc", 1800));

    auto record = json::parse(test::read_file(path()));
    EXPECT_EQ(record["sid"], "abc");
    EXPECT_EQ(record["expires"], "1700001795");

    EXPECT_EQ(cache.load(), std::optional<std::string>("abc"));
}

TEST_F(CredentialCacheTest, ExpiryEqualToNowIsExpired) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.store("abc", 1800));

    m_now += std::chrono::seconds(1794);
    EXPECT_TRUE(cache.load().has_value());

    m_now += std::chrono::seconds(1);
    EXPECT_FALSE(cache.load().has_value());

    m_now += std::chrono::seconds(1);
    EXPECT_FALSE(cache.load().has_value());
}

TEST_F(CredentialCacheTest, ValidityInsideMarginExpiresImmediately) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.store("abc", 3));

    EXPECT_EQ(json::parse(test::read_file(path()))["expires"], "1700000000");
    EXPECT_FALSE(cache.load().has_value());
}

TEST_F(CredentialCacheTest, AcceptsNumericExpiry) {
    fs::create_directories(path().parent_path());
    test::write_file(path(), R"({"sid": "abc", "expires": 1700000100})");

    EXPECT_EQ(make_cache().load(), std::optional<std::string>("abc"));
}

TEST_F(CredentialCacheTest, MalformedRecordsAreMisses) {
    fs::create_directories(path().parent_path());
    const char* records[] = {
        "",
        "not json",
        "[1, 2]",
        R"({"expires": "1700000100"})",
        R"({"sid": "", "expires": "1700000100"})",
        R"({"sid": 7, "expires": "1700000100"})",
        R"({"sid": "abc"})",
        R"({"sid": "abc", "expires": "tomorrow"})",
        R"({"sid": "abc", "expires": null})",
        R"({"sid": "abc", "expires": "nan"})",
    };

    for (const char* record : records) {
        test::write_file(path(), record);
        EXPECT_FALSE(make_cache().load().has_value()) << record;
    }
}

TEST_F(CredentialCacheTest, ClearRemovesRecord) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.store("abc", 1800));

    cache.clear();
    EXPECT_FALSE(fs::exists(path()));
    EXPECT_FALSE(cache.load().has_value());

    cache.clear();
}

TEST_F(CredentialCacheTest, UnwritableLocationIsReported) {
    fs::create_directories(m_dir / "blocked");
    CredentialCache cache(m_dir / "blocked", [this] { return m_now; });

    EXPECT_FALSE(cache.store("abc", 1800));
    EXPECT_FALSE(cache.load().has_value());
}
