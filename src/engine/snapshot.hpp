#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include "hashwatch/types.hpp"

namespace hashwatch::engine {

    /**
     * @brief Remembers (mtime, size) per path to drop notifications that changed nothing.
     * Not thread-safe; owned by the thread that delivers file events.
     */
    class SnapshotTracker {
    public:
        /**
         * @brief Compares the file's current metadata with the last one seen and records it.
         * A file that no longer exists always counts as a change and is forgotten.
         * Two writes landing on the same mtime and size are indistinguishable and the
         * second one is reported as unchanged.
         * @return true if the path should be treated as really changed.
         */
        bool has_real_change(const std::filesystem::path& path);

        size_t size() const { return m_snapshots.size(); }

    private:
        std::unordered_map<std::string, FileInfo> m_snapshots;
    };

}
