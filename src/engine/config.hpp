#pragma once

#include <string>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <cstdlib>
#include <stdexcept>
#include "hash_pipeline.hpp"

namespace hashwatch::engine {

    /**
     * @brief Missing or invalid setting. Fatal at startup.
     */
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct Config {
        // Watcher
        std::filesystem::path watch_dir;
        std::string include_pattern;
        std::string exclude_pattern;
        double debounce_seconds = 3.0;
        static constexpr double kMaxDebounceSeconds = 365.0 * 24 * 60 * 60;
        std::string onchange_cmd;
        bool verbose = false;

        // Remote API and persisted state
        std::string api_url;
        std::string api_password;
        std::filesystem::path hash_path = "/tmp/pi_hole_config_hash/config.md5";
        std::filesystem::path sid_cache_path = "/tmp/pi_hole_config_hash/sid.json";
        int first_run_exit = 1;

        using EnvLookup = std::function<const char*(const char*)>;

        /**
         * @brief Builds the configuration from HASHWATCH_CONFIG (a JSON file, optional)
         * and then the environment, which takes precedence. Empty values count as unset.
         * @throws ConfigError on unreadable files or malformed values.
         */
        static Config load(const EnvLookup& env = std::getenv);

        /**
         * @brief Checks the settings the standalone check needs.
         */
        void validate_for_check() const;

        /**
         * @brief Checks everything the watcher needs and makes watch_dir absolute.
         */
        void validate_for_watch();

        std::chrono::milliseconds debounce_period() const {
            // Keeps steady_clock::now() + period representable
            double seconds = std::min(debounce_seconds, kMaxDebounceSeconds);
            return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
        }

        ApiOptions api_options() const {
            ApiOptions options;
            options.base_url = api_url;
            options.password = api_password;
            return options;
        }
    };

}
