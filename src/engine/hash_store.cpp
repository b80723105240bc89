#include "hash_store.hpp"
#include <fstream>
#include <sstream>
#include <iostream>

namespace hashwatch::engine {

    HashStore::HashStore(std::filesystem::path path) : m_path(std::move(path)) {}

    std::optional<std::string> HashStore::read() const {
        std::ifstream f(m_path);
        if (!f.is_open()) return std::nullopt;

        std::stringstream buffer;
        buffer << f.rdbuf();
        std::string value = buffer.str();

        const char* ws = " \t\r\n";
        value.erase(0, value.find_first_not_of(ws));
        value.erase(value.find_last_not_of(ws) + 1);
        return value;
    }

    bool HashStore::write(const std::string& value) {
        std::error_code ec;
        if (m_path.has_parent_path()) {
            std::filesystem::create_directories(m_path.parent_path(), ec);
            if (ec) {
                std::cerr << "[HashStore] Failed to create " << m_path.parent_path() << ": " << ec.message() << "\n";
                return false;
            }
        }

        // Replace atomically so a failed write never leaves a truncated record
        std::filesystem::path tmp = m_path;
        tmp += ".tmp";
        {
            std::ofstream f(tmp, std::ios::trunc);
            f << value << "\n";
            f.close();
            if (!f) {
                std::cerr << "[HashStore] Failed to write " << tmp << "\n";
                std::filesystem::remove(tmp, ec);
                return false;
            }
        }

        std::filesystem::rename(tmp, m_path, ec);
        if (ec) {
            std::cerr << "[HashStore] Failed to replace " << m_path << ": " << ec.message() << "\n";
            std::filesystem::remove(tmp, ec);
            return false;
        }
        return true;
    }

}
