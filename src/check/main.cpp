#include <iostream>
#include <exception>

#include "engine/config.hpp"
#include "engine/credential_cache.hpp"
#include "engine/hash_store.hpp"
#include "engine/hash_pipeline.hpp"
#include "engine/http_client.hpp"

namespace {

    constexpr int kExitUnchanged = 0;
    constexpr int kExitChanged = 1;
    constexpr int kExitConfigError = 2;
    constexpr int kExitError = 3;

    int exit_code_for(const hashwatch::engine::CheckResult& result, int first_run_exit) {
        using Status = hashwatch::engine::CheckResult::Status;
        switch (result.status) {
            case Status::Unchanged: return kExitUnchanged;
            case Status::Changed: return kExitChanged;
            case Status::FirstRun: return first_run_exit;
            case Status::Error: return kExitError;
        }
        return kExitError;
    }

}

int main() {
    hashwatch::engine::Config config;
    try {
        config = hashwatch::engine::Config::load();
        config.validate_for_check();
    } catch (const hashwatch::engine::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return kExitConfigError;
    }

    hashwatch::engine::CheckResult result;
    try {
        auto http = hashwatch::engine::create_curl_http_client();
        hashwatch::engine::CredentialCache credentials(config.sid_cache_path);
        hashwatch::engine::HashStore store(config.hash_path);
        hashwatch::engine::HashPipeline pipeline(config.api_options(), *http, credentials, store);
        result = pipeline.check();
    } catch (const std::exception& e) {
        result = hashwatch::engine::CheckResult::error(std::string("Hash check raised an unexpected error: ") + e.what());
    }

    if (!result.message.empty()) {
        auto& stream = (result.status == hashwatch::engine::CheckResult::Status::Error) ? std::cerr : std::cout;
        stream << result.message << "\n";
    }
    return exit_code_for(result, config.first_run_exit);
}
