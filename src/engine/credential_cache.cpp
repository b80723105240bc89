#include "credential_cache.hpp"
#include "json_util.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cstdio>

using json = nlohmann::json;

namespace hashwatch::engine {

    CredentialCache::CredentialCache(std::filesystem::path path, Clock clock)
        : m_path(std::move(path)), m_clock(std::move(clock)) {}

    std::optional<std::string> CredentialCache::load() const {
        std::ifstream f(m_path);
        if (!f.is_open()) return std::nullopt;

        json payload = json::parse(f, nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) return std::nullopt;

        auto sid = payload.find("sid");
        if (sid == payload.end() || !sid->is_string() || sid->get_ref<const std::string&>().empty()) {
            return std::nullopt;
        }

        auto expires = payload.find("expires");
        if (expires == payload.end()) return std::nullopt;

        auto expires_ts = parse_number(*expires);
        if (!expires_ts || *expires_ts <= now_seconds()) return std::nullopt;

        return sid->get<std::string>();
    }

    bool CredentialCache::store(const std::string& token, double validity_seconds) {
        double expires = now_seconds() + std::max(validity_seconds - kExpiryMargin, 0.0);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", expires);

        json payload = {
            {"sid", token},
            {"expires", std::string(buf)}
        };

        std::error_code ec;
        if (m_path.has_parent_path()) {
            std::filesystem::create_directories(m_path.parent_path(), ec);
        }

        std::ofstream f(m_path, std::ios::trunc);
        if (!f.is_open()) {
            std::cerr << "[CredentialCache] Failed to write " << m_path << "\n";
            return false;
        }
        f << payload.dump() << "\n";
        if (!f) {
            std::cerr << "[CredentialCache] Failed to write " << m_path << "\n";
            return false;
        }
        return true;
    }

    void CredentialCache::clear() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
        if (ec) {
            std::cerr << "[CredentialCache] Failed to remove " << m_path << ": " << ec.message() << "\n";
        }
    }

    double CredentialCache::now_seconds() const {
        using namespace std::chrono;
        return duration_cast<duration<double>>(m_clock().time_since_epoch()).count();
    }

}
