#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include <chrono>

namespace hashwatch::engine {

    /**
     * @brief On-disk cache for the API session id.
     *
     * The record is one JSON object: {"sid": "...", "expires": "<epoch seconds>"}.
     * Anything unreadable is a cache miss, never an error.
     */
    class CredentialCache {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        /// Seconds shaved off the server-reported validity.
        static constexpr double kExpiryMargin = 5.0;

        explicit CredentialCache(std::filesystem::path path, Clock clock = std::chrono::system_clock::now);

        /**
         * @brief Returns the cached session id if present and not yet expired.
         * A record whose expiry equals the current time is already expired.
         */
        std::optional<std::string> load() const;

        /**
         * @brief Persists a session id valid for validity_seconds from now, minus the margin.
         * @return false if the record could not be written.
         */
        bool store(const std::string& token, double validity_seconds);

        /**
         * @brief Forgets the cached session id.
         */
        void clear();

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
        Clock m_clock;

        double now_seconds() const;
    };

}
