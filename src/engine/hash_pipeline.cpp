#include "hash_pipeline.hpp"
#include "json_util.hpp"
#include "hashwatch/md5.h"
#include <iostream>

using json = nlohmann::json;

namespace hashwatch::engine {

    std::string join_url(const std::string& base, const std::string& endpoint) {
        size_t base_end = base.find_last_not_of('/');
        std::string left = (base_end == std::string::npos) ? "" : base.substr(0, base_end + 1);

        size_t endpoint_start = endpoint.find_first_not_of('/');
        std::string right = (endpoint_start == std::string::npos) ? "" : endpoint.substr(endpoint_start);

        return left + "/" + right;
    }

    json strip_field(const json& data, const std::string& field) {
        if (data.is_object()) {
            json result = json::object();
            for (auto it = data.begin(); it != data.end(); ++it) {
                if (it.key() == field) continue;
                result[it.key()] = strip_field(it.value(), field);
            }
            return result;
        }
        if (data.is_array()) {
            json result = json::array();
            for (const auto& item : data) {
                result.push_back(strip_field(item, field));
            }
            return result;
        }
        return data;
    }

    std::string digest_payload(const json& payload) {
        // nlohmann::json keeps object members in a std::map, so keys come out sorted
        std::string normalized = payload.dump(-1, ' ', true, json::error_handler_t::replace);
        return crypto::MD5::hash(normalized);
    }

    std::string combine_hashes(const std::vector<std::string>& hashes) {
        std::string combined;
        for (const auto& h : hashes) combined += h;
        return crypto::MD5::hash(combined);
    }

    HashPipeline::HashPipeline(ApiOptions options, HttpClient& http, CredentialCache& credentials, HashStore& store)
        : m_options(std::move(options)), m_http(http), m_credentials(credentials), m_store(store) {}

    CheckResult HashPipeline::check() {
        std::string summary_hash;
        try {
            if (m_options.base_url.empty()) {
                throw ApiError("No API base URL configured");
            }

            std::string sid = session_id();

            std::vector<std::string> digests;
            digests.reserve(m_options.endpoints.size());
            for (const auto& endpoint : m_options.endpoints) {
                digests.push_back(digest_payload(strip_field(fetch(endpoint, sid), "took")));
            }
            summary_hash = combine_hashes(digests);
        } catch (const ApiError& e) {
            return CheckResult::error(e.what());
        }

        auto previous_hash = m_store.read();
        if (!m_store.write(summary_hash)) {
            return CheckResult::error("Failed to persist summary hash to " + m_store.path().string());
        }

        if (!previous_hash) {
            return {CheckResult::Status::FirstRun, summary_hash, std::nullopt,
                    "No previous hash found; stored current summary hash."};
        }

        if (*previous_hash == summary_hash) {
            return {CheckResult::Status::Unchanged, summary_hash, previous_hash,
                    "Pi-hole configuration unchanged."};
        }

        return {CheckResult::Status::Changed, summary_hash, previous_hash,
                "Pi-hole configuration has changed."};
    }

    std::string HashPipeline::session_id() {
        if (auto cached = m_credentials.load()) {
            return *cached;
        }
        return login();
    }

    std::string HashPipeline::login() {
        json body = {{"password", m_options.password}};
        HttpResponse response = m_http.post_json(join_url(m_options.base_url, m_options.login_endpoint), body.dump(), {});

        if (!response.ok()) {
            throw ApiError("Login failed with status " + std::to_string(response.status));
        }

        json payload = json::parse(response.body, nullptr, false);
        if (payload.is_discarded()) {
            throw ApiError("Login response is not valid JSON");
        }

        auto session = payload.is_object() ? payload.find("session") : payload.end();
        if (session == payload.end() || !session->is_object()) {
            throw ApiError("Login response does not contain 'session' information");
        }

        auto sid = session->find("sid");
        if (sid == session->end() || !sid->is_string() || sid->get_ref<const std::string&>().empty()) {
            throw ApiError("Login response does not contain a valid 'sid'");
        }

        auto validity_it = session->find("validity");
        std::optional<double> validity;
        if (validity_it != session->end()) validity = parse_number(*validity_it);
        if (!validity) {
            throw ApiError("Login response does not contain a valid 'validity' value");
        }

        std::string token = sid->get<std::string>();
        if (!m_credentials.store(token, *validity)) {
            std::cerr << "[HashPipeline] Session could not be cached; next check will log in again.\n";
        }
        return token;
    }

    json HashPipeline::fetch(const std::string& endpoint, const std::string& sid) {
        HttpResponse response;
        try {
            response = m_http.get(join_url(m_options.base_url, endpoint), {{kSessionHeader, sid}});
        } catch (const ApiError& e) {
            throw ApiError("Failed to fetch " + endpoint + ": " + e.what());
        }

        if (response.status == 401) {
            // Session was revoked or expired early; force a fresh login next time
            m_credentials.clear();
        }
        if (!response.ok()) {
            throw ApiError("Failed to fetch " + endpoint + ": status " + std::to_string(response.status));
        }

        json data = json::parse(response.body, nullptr, false);
        if (data.is_discarded()) {
            throw ApiError("Response from " + endpoint + " is not valid JSON");
        }
        return data;
    }

}
