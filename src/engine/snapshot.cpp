#include "snapshot.hpp"

namespace hashwatch::engine {

    bool SnapshotTracker::has_real_change(const std::filesystem::path& path) {
        const std::string key = path.string();

        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status)) {
            m_snapshots.erase(key);
            return true;
        }

        FileInfo current;
        current.path = path;
        current.last_write_time = std::filesystem::last_write_time(path, ec);
        if (ec) {
            m_snapshots.erase(key);
            return true;
        }
        current.size = std::filesystem::is_regular_file(status) ? std::filesystem::file_size(path, ec) : 0;
        if (ec) current.size = 0;

        auto it = m_snapshots.find(key);
        if (it != m_snapshots.end()
            && it->second.last_write_time == current.last_write_time
            && it->second.size == current.size) {
            return false;
        }

        m_snapshots[key] = current;
        return true;
    }

}
