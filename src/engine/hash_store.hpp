#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace hashwatch::engine {

    /**
     * @brief The single persisted summary hash: one ASCII line with a trailing newline.
     */
    class HashStore {
    public:
        explicit HashStore(std::filesystem::path path);

        /**
         * @brief Reads the stored hash with surrounding whitespace trimmed.
         * @return nullopt if nothing has been stored yet.
         */
        std::optional<std::string> read() const;

        /**
         * @brief Overwrites the stored hash, creating parent directories as needed.
         */
        bool write(const std::string& value);

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

}
