#include "http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <iostream>

namespace hashwatch::engine {

    class CurlHttpClient : public HttpClient {
    public:
        explicit CurlHttpClient(std::chrono::seconds timeout) : m_timeout(timeout) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~CurlHttpClient() {
            curl_global_cleanup();
        }

        HttpResponse get(const std::string& url, const Headers& headers) override {
            return perform(url, nullptr, headers);
        }

        HttpResponse post_json(const std::string& url, const std::string& body, const Headers& headers) override {
            Headers all = headers;
            all.emplace_back("Content-Type", "application/json");
            return perform(url, &body, all);
        }

    private:
        std::chrono::seconds m_timeout;

        struct CurlDeleter {
            void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
        };
        struct SlistDeleter {
            void operator()(curl_slist* list) const { curl_slist_free_all(list); }
        };

        HttpResponse perform(const std::string& url, const std::string* body, const Headers& headers) {
            std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
            if (!curl) throw ApiError("curl_easy_init() failed");

            std::unique_ptr<curl_slist, SlistDeleter> header_list;
            for (const auto& [name, value] : headers) {
                std::string line = name + ": " + value;
                curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
                if (!appended) throw ApiError("curl_slist_append() failed");
                header_list.release();
                header_list.reset(appended);
            }

            HttpResponse response;
            curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(m_timeout.count()));
            curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
            if (body) {
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
            }

            CURLcode res = curl_easy_perform(curl.get());
            if (res != CURLE_OK) {
                std::cerr << "[CurlHttpClient] " << url << ": " << curl_easy_strerror(res) << "\n";
                throw ApiError(std::string("request to ") + url + " failed: " + curl_easy_strerror(res));
            }

            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
            return response;
        }

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<HttpClient> create_curl_http_client(std::chrono::seconds timeout) {
        return std::make_unique<CurlHttpClient>(timeout);
    }

}
