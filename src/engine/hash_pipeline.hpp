#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hashwatch/types.hpp"
#include "http_client.hpp"
#include "credential_cache.hpp"
#include "hash_store.hpp"

namespace hashwatch::engine {

    struct ApiOptions {
        std::string base_url;
        std::string password;
        std::string login_endpoint = "/api/auth";
        std::vector<std::string> endpoints = default_endpoints();

        static std::vector<std::string> default_endpoints() {
            return {
                "/api/config",
                "/api/dhcp/leases",
                "/api/groups",
                "/api/lists",
                "/api/domains",
                "/api/clients",
            };
        }
    };

    /**
     * @brief Fetches the configured API resources and compares their combined
     * digest with the one stored by the previous run.
     */
    class HashPipeline {
    public:
        static constexpr const char* kSessionHeader = "X-FTL-SID";

        HashPipeline(ApiOptions options, HttpClient& http, CredentialCache& credentials, HashStore& store);

        /**
         * @brief Runs one full check. Never throws for API failures; they come back as Status::Error.
         * Nothing is persisted unless every endpoint was fetched.
         */
        CheckResult check();

    private:
        ApiOptions m_options;
        HttpClient& m_http;
        CredentialCache& m_credentials;
        HashStore& m_store;

        std::string session_id();
        std::string login();
        nlohmann::json fetch(const std::string& endpoint, const std::string& sid);
    };

    /**
     * @brief Joins base URL and endpoint with exactly one '/'.
     */
    std::string join_url(const std::string& base, const std::string& endpoint);

    /**
     * @brief Removes every object member named `field` at any depth, including inside arrays.
     */
    nlohmann::json strip_field(const nlohmann::json& data, const std::string& field);

    /**
     * @brief MD5 of the canonical serialization: sorted keys, no whitespace, ASCII-escaped.
     */
    std::string digest_payload(const nlohmann::json& payload);

    /**
     * @brief MD5 of the concatenated digests. Order matters.
     */
    std::string combine_hashes(const std::vector<std::string>& hashes);

}
