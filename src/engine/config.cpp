#include "config.hpp"
#include "json_util.hpp"
#include "path_filter.hpp"
#include <fstream>
#include <string>
#include <regex>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace hashwatch::engine {

    namespace {

        std::optional<std::string> lookup(const Config::EnvLookup& env, const char* name) {
            const char* value = env(name);
            if (!value || !*value) return std::nullopt;
            return std::string(value);
        }

        double parse_seconds(const json& value, const char* name) {
            auto seconds = parse_number(value);
            if (!seconds || *seconds < 0) {
                throw ConfigError(std::string(name) + " must be a non-negative number of seconds");
            }
            if (*seconds > Config::kMaxDebounceSeconds) {
                throw ConfigError(std::string(name) + " must not exceed " +
                                  std::to_string(static_cast<long long>(Config::kMaxDebounceSeconds)) + " seconds");
            }
            return *seconds;
        }

        int parse_exit_code(const json& value, const char* name) {
            auto code = parse_number(value);
            if (!code || *code < 0 || *code > 255 || *code != static_cast<int>(*code)) {
                throw ConfigError(std::string(name) + " must be an integer between 0 and 255");
            }
            return static_cast<int>(*code);
        }

        bool parse_flag(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
            return value == "1" || value == "true" || value == "yes" || value == "on";
        }

        void apply_file(Config& cfg, const std::filesystem::path& path) {
            std::ifstream f(path);
            if (!f.is_open()) {
                throw ConfigError("Cannot read config file: " + path.string());
            }

            json j = json::parse(f, nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                throw ConfigError("Config file is not a JSON object: " + path.string());
            }

            try {
                if (j.contains("watch_dir")) cfg.watch_dir = j["watch_dir"].get<std::string>();
                if (j.contains("watch_include")) cfg.include_pattern = j["watch_include"].get<std::string>();
                if (j.contains("watch_exclude")) cfg.exclude_pattern = j["watch_exclude"].get<std::string>();
                if (j.contains("debounce_time")) cfg.debounce_seconds = parse_seconds(j["debounce_time"], "debounce_time");
                if (j.contains("onchange_cmd")) cfg.onchange_cmd = j["onchange_cmd"].get<std::string>();
                if (j.contains("watch_verbose")) {
                    const auto& v = j["watch_verbose"];
                    cfg.verbose = v.is_boolean() ? v.get<bool>() : parse_flag(v.get<std::string>());
                }
                if (j.contains("pihole_api_url")) cfg.api_url = j["pihole_api_url"].get<std::string>();
                if (j.contains("pihole_password")) cfg.api_password = j["pihole_password"].get<std::string>();
                if (j.contains("pihole_hash_path")) cfg.hash_path = j["pihole_hash_path"].get<std::string>();
                if (j.contains("pihole_sid_cache_path")) cfg.sid_cache_path = j["pihole_sid_cache_path"].get<std::string>();
                if (j.contains("pihole_hash_first_run_exit")) {
                    cfg.first_run_exit = parse_exit_code(j["pihole_hash_first_run_exit"], "pihole_hash_first_run_exit");
                }
            } catch (const json::exception& e) {
                throw ConfigError("Invalid value in " + path.string() + ": " + e.what());
            }
        }

    }

    Config Config::load(const EnvLookup& env) {
        Config cfg;

        if (auto file = lookup(env, "HASHWATCH_CONFIG")) {
            apply_file(cfg, *file);
        }

        if (auto v = lookup(env, "WATCH_DIR")) cfg.watch_dir = *v;
        if (auto v = lookup(env, "WATCH_INCLUDE")) cfg.include_pattern = *v;
        if (auto v = lookup(env, "WATCH_EXCLUDE")) cfg.exclude_pattern = *v;
        if (auto v = lookup(env, "DEBOUNCE_TIME")) cfg.debounce_seconds = parse_seconds(json(*v), "DEBOUNCE_TIME");
        if (auto v = lookup(env, "ONCHANGE_CMD")) cfg.onchange_cmd = *v;
        if (auto v = lookup(env, "WATCH_VERBOSE")) cfg.verbose = parse_flag(*v);
        if (auto v = lookup(env, "PIHOLE_API_URL")) cfg.api_url = *v;
        if (auto v = lookup(env, "PIHOLE_PASSWORD")) cfg.api_password = *v;
        if (auto v = lookup(env, "PIHOLE_HASH_PATH")) cfg.hash_path = *v;
        if (auto v = lookup(env, "PIHOLE_SID_CACHE_PATH")) cfg.sid_cache_path = *v;
        if (auto v = lookup(env, "PIHOLE_HASH_FIRST_RUN_EXIT")) {
            cfg.first_run_exit = parse_exit_code(json(*v), "PIHOLE_HASH_FIRST_RUN_EXIT");
        }

        return cfg;
    }

    void Config::validate_for_check() const {
        if (api_url.empty()) {
            throw ConfigError("PIHOLE_API_URL environment variable is required");
        }
    }

    void Config::validate_for_watch() {
        validate_for_check();

        if (watch_dir.empty()) {
            throw ConfigError("WATCH_DIR environment variable is required");
        }

        std::error_code ec;
        auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(watch_dir, ec), ec);
        if (ec || !std::filesystem::exists(resolved)) {
            throw ConfigError("Watch directory does not exist: " + watch_dir.string());
        }
        if (!std::filesystem::is_directory(resolved)) {
            throw ConfigError("Watch path is not a directory: " + resolved.string());
        }
        watch_dir = resolved;

        try {
            PathFilter(include_pattern, "");
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid WATCH_INCLUDE pattern '" + include_pattern + "': " + e.what());
        }
        try {
            PathFilter("", exclude_pattern);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid WATCH_EXCLUDE pattern '" + exclude_pattern + "': " + e.what());
        }
    }

}
