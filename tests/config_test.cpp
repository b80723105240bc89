#include "engine/config.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <map>

using namespace hashwatch;
using namespace hashwatch::engine;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { m_dir = test::make_temp_dir("config"); }
    void TearDown() override { fs::remove_all(m_dir); }

    Config load() {
        return Config::load([this](const char* name) -> const char* {
            auto it = m_env.find(name);
            return it == m_env.end() ? nullptr : it->second.c_str();
        });
    }

    fs::path m_dir;
    std::map<std::string, std::string> m_env;
};

TEST_F(ConfigTest, Defaults) {
    Config cfg = load();
    EXPECT_TRUE(cfg.watch_dir.empty());
    EXPECT_DOUBLE_EQ(cfg.debounce_seconds, 3.0);
    EXPECT_EQ(cfg.debounce_period(), std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.hash_path, "/tmp/pi_hole_config_hash/config.md5");
    EXPECT_EQ(cfg.sid_cache_path, "/tmp/pi_hole_config_hash/sid.json");
    EXPECT_EQ(cfg.first_run_exit, 1);
    EXPECT_FALSE(cfg.verbose);
    EXPECT_EQ(cfg.api_options().endpoints.size(), 6u);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    m_env = {
        {"WATCH_DIR", m_dir.string()},
        {"WATCH_INCLUDE", R"(\.toml$)"},
        {"WATCH_EXCLUDE", ""},
        {"DEBOUNCE_TIME", "0.5"},
        {"ONCHANGE_CMD", "nebula-sync run"},
        {"WATCH_VERBOSE", "Yes"},
        {"PIHOLE_API_URL", "http://pi.hole"},
        {"PIHOLE_PASSWORD", "secret"},
        {"PIHOLE_HASH_FIRST_RUN_EXIT", "0"},
    };

    Config cfg = load();
    EXPECT_EQ(cfg.watch_dir, m_dir);
    EXPECT_EQ(cfg.include_pattern, R"(\.toml$)");
    EXPECT_TRUE(cfg.exclude_pattern.empty());
    EXPECT_EQ(cfg.debounce_period(), std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.onchange_cmd, "nebula-sync run");
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.api_options().base_url, "http://pi.hole");
    EXPECT_EQ(cfg.api_options().password, "secret");
    EXPECT_EQ(cfg.first_run_exit, 0);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto file = m_dir / "hashwatch.json";
    test::write_file(file, R"({
        "watch_dir": "/srv/pihole",
        "debounce_time": 7,
        "pihole_api_url": "http://from-file",
        "pihole_hash_path": "/var/lib/hashwatch/config.md5",
        "watch_verbose": true
    })");
    m_env = {
        {"HASHWATCH_CONFIG", file.string()},
        {"PIHOLE_API_URL", "http://from-env"},
    };

    Config cfg = load();
    EXPECT_EQ(cfg.watch_dir, "/srv/pihole");
    EXPECT_DOUBLE_EQ(cfg.debounce_seconds, 7.0);
    EXPECT_EQ(cfg.api_url, "http://from-env");
    EXPECT_EQ(cfg.hash_path, "/var/lib/hashwatch/config.md5");
    EXPECT_TRUE(cfg.verbose);
}

TEST_F(ConfigTest, RejectsBadValues) {
    m_env = {{"DEBOUNCE_TIME", "soon"}};
    EXPECT_THROW(load(), ConfigError);

    m_env = {{"DEBOUNCE_TIME", "-1"}};
    EXPECT_THROW(load(), ConfigError);

    m_env = {{"DEBOUNCE_TIME", "1e13"}};
    EXPECT_THROW(load(), ConfigError);

    test::write_file(m_dir / "slow.json", R"({"debounce_time": 1e20})");
    m_env = {{"HASHWATCH_CONFIG", (m_dir / "slow.json").string()}};
    EXPECT_THROW(load(), ConfigError);

    m_env = {{"PIHOLE_HASH_FIRST_RUN_EXIT", "1.5"}};
    EXPECT_THROW(load(), ConfigError);

    m_env = {{"HASHWATCH_CONFIG", (m_dir / "missing.json").string()}};
    EXPECT_THROW(load(), ConfigError);

    test::write_file(m_dir / "broken.json", "{ nope");
    m_env = {{"HASHWATCH_CONFIG", (m_dir / "broken.json").string()}};
    EXPECT_THROW(load(), ConfigError);

    test::write_file(m_dir / "typed.json", R"({"watch_dir": 5})");
    m_env = {{"HASHWATCH_CONFIG", (m_dir / "typed.json").string()}};
    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, DebouncePeriodIsCapped) {
    m_env = {{"DEBOUNCE_TIME", "31536000"}};
    Config cfg = load();
    EXPECT_EQ(cfg.debounce_period(), std::chrono::milliseconds(31536000000LL));

    cfg.debounce_seconds = 1e13;
    EXPECT_EQ(cfg.debounce_period(), std::chrono::milliseconds(31536000000LL));
}

TEST_F(ConfigTest, CheckRequiresApiUrl) {
    Config cfg = load();
    EXPECT_THROW(cfg.validate_for_check(), ConfigError);

    cfg.api_url = "http://pi.hole";
    EXPECT_NO_THROW(cfg.validate_for_check());
}

TEST_F(ConfigTest, WatchValidation) {
    m_env = {{"PIHOLE_API_URL", "http://pi.hole"}};
    Config missing = load();
    EXPECT_THROW(missing.validate_for_watch(), ConfigError);

    m_env["WATCH_DIR"] = (m_dir / "nope").string();
    Config absent = load();
    EXPECT_THROW(absent.validate_for_watch(), ConfigError);

    test::write_file(m_dir / "file", "x");
    m_env["WATCH_DIR"] = (m_dir / "file").string();
    Config not_dir = load();
    EXPECT_THROW(not_dir.validate_for_watch(), ConfigError);

    m_env["WATCH_DIR"] = m_dir.string();
    m_env["WATCH_INCLUDE"] = "(";
    Config bad_regex = load();
    EXPECT_THROW(bad_regex.validate_for_watch(), ConfigError);

    m_env.erase("WATCH_INCLUDE");
    m_env["WATCH_EXCLUDE"] = "[z-a]";
    Config bad_exclude = load();
    EXPECT_THROW(bad_exclude.validate_for_watch(), ConfigError);

    m_env.erase("WATCH_EXCLUDE");
    Config ok = load();
    EXPECT_NO_THROW(ok.validate_for_watch());
    EXPECT_TRUE(ok.watch_dir.is_absolute());
    EXPECT_EQ(ok.watch_dir, fs::weakly_canonical(m_dir));
}
