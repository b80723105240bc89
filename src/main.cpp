#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <memory>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/credential_cache.hpp"
#include "engine/hash_store.hpp"
#include "engine/hash_pipeline.hpp"
#include "engine/http_client.hpp"
#include "engine/command_runner.hpp"
#include "engine/change_watcher.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[hashwatch] Starting daemon (v0.1.0)...\n";

    hashwatch::engine::Config config;
    try {
        config = hashwatch::engine::Config::load();
        config.validate_for_watch();
    } catch (const hashwatch::engine::ConfigError& e) {
        std::cerr << "[hashwatch] " << e.what() << "\n";
        return 2;
    }

    std::cout << "[hashwatch] Hash file: " << config.hash_path << "\n";
    std::cout << "[hashwatch] Quiet period: " << config.debounce_seconds << "s\n";

    auto http = hashwatch::engine::create_curl_http_client();
    hashwatch::engine::CredentialCache credentials(config.sid_cache_path);
    hashwatch::engine::HashStore store(config.hash_path);
    hashwatch::engine::HashPipeline pipeline(config.api_options(), *http, credentials, store);
    hashwatch::engine::CommandRunner runner;

    hashwatch::engine::ChangeWatcher::Options options;
    options.root = config.watch_dir;
    options.include_pattern = config.include_pattern;
    options.exclude_pattern = config.exclude_pattern;
    options.debounce = config.debounce_period();
    options.onchange_cmd = config.onchange_cmd;
    options.verbose = config.verbose;

    auto sentry = hashwatch::platform::Sentry::create();
    if (!sentry) return 1;

    hashwatch::engine::ChangeWatcher watcher(options, [&pipeline] { return pipeline.check(); }, runner, std::move(sentry));
    if (!watcher.start()) {
        std::cerr << "[hashwatch] Failed to start watching " << config.watch_dir << "\n";
        return 1;
    }
    std::cout << "[hashwatch] Ready.\n";

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::cout << "[hashwatch] Shutting down.\n";
    watcher.stop();

    return 0;
}
