#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <utility>
#include <stdexcept>

namespace hashwatch::engine {

    /**
     * @brief Authentication or fetch failure against the remote API.
     */
    class ApiError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct HttpResponse {
        long status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    /**
     * @brief Abstract base class for the HTTP transport.
     */
    class HttpClient {
    public:
        using Headers = std::vector<std::pair<std::string, std::string>>;

        virtual ~HttpClient() = default;

        /**
         * @brief Issues a GET request.
         * @throws ApiError when no response could be obtained (DNS, connect, timeout).
         */
        virtual HttpResponse get(const std::string& url, const Headers& headers) = 0;

        /**
         * @brief Issues a POST request with a JSON body.
         * @throws ApiError when no response could be obtained.
         */
        virtual HttpResponse post_json(const std::string& url, const std::string& body, const Headers& headers) = 0;
    };

    std::unique_ptr<HttpClient> create_curl_http_client(std::chrono::seconds timeout = std::chrono::seconds(10));

}
