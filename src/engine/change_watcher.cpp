#include "change_watcher.hpp"
#include <iostream>

namespace hashwatch::engine {

    ChangeWatcher::ChangeWatcher(Options options, CheckFn check, CommandRunner& runner,
                                 std::unique_ptr<platform::Sentry> sentry)
        : m_options(std::move(options)),
          m_check(std::move(check)),
          m_runner(runner),
          m_sentry(std::move(sentry)),
          m_filter(m_options.include_pattern, m_options.exclude_pattern),
          m_debouncer(m_options.debounce, [this] { on_settled(); }) {}

    ChangeWatcher::~ChangeWatcher() {
        stop();
    }

    bool ChangeWatcher::start() {
        if (m_stopped) return false;

        m_debouncer.start();

        if (!m_sentry) return true;

        if (!m_sentry->add_watch(m_options.root)) {
            std::cerr << "[Watcher] Unable to watch " << m_options.root << "\n";
            m_debouncer.stop();
            return false;
        }
        m_sentry->set_callback([this](const platform::FileEvent& event) { handle_event(event); });

        std::cout << "[Watcher] Watching " << m_options.root << "\n";
        m_sentry_thread = std::thread([this] { m_sentry->start(); });
        return true;
    }

    void ChangeWatcher::stop() {
        if (m_stopped.exchange(true)) return;

        if (m_sentry) m_sentry->stop();
        if (m_sentry_thread.joinable()) m_sentry_thread.join();
        m_debouncer.stop();
    }

    bool ChangeWatcher::is_relevant(const platform::FileEvent& event) {
        if (event.is_directory) return false;

        switch (event.type) {
            case platform::FileEvent::Type::Modified:
            case platform::FileEvent::Type::Created:
            case platform::FileEvent::Type::Moved:
            case platform::FileEvent::Type::ClosedWrite:
                return true;
            case platform::FileEvent::Type::Deleted:
                return false;
        }
        return false;
    }

    bool ChangeWatcher::handle_event(const platform::FileEvent& event) {
        if (!is_relevant(event)) return false;
        if (!m_filter.accepts(event.path)) return false;

        if (!m_snapshots.has_real_change(event.path)) {
            if (m_options.verbose) {
                std::cout << "[Watcher] Skipping " << event.path << "; metadata unchanged.\n";
            }
            return false;
        }

        if (m_options.verbose) {
            std::cout << "[Watcher] File changed: " << event.path << "\n";
        }
        m_debouncer.notify();
        return true;
    }

    void ChangeWatcher::on_settled() {
        std::cout << "[Watcher] Debounced change detected; running hash check.\n";

        CheckResult result;
        try {
            result = m_check();
        } catch (const std::exception& e) {
            result = CheckResult::error(std::string("Hash check raised an unexpected error: ") + e.what());
        }

        if (result.status == CheckResult::Status::Error) {
            std::cerr << "[Watcher] " << result.message << "\n";
        } else {
            std::cout << "[Watcher] " << result.message << "\n";
        }
        if (result.summary_hash) {
            std::cout << "[Watcher] Current config hash: " << *result.summary_hash << "\n";
        }

        switch (result.status) {
            case CheckResult::Status::Changed:
                std::cout << "[Watcher] Configuration change detected.\n";
                run_onchange_command();
                break;
            case CheckResult::Status::Unchanged:
                std::cout << "[Watcher] Configuration unchanged. Skipping sync.\n";
                break;
            case CheckResult::Status::FirstRun:
            case CheckResult::Status::Error:
                std::cout << "[Watcher] Hash check returned " << to_string(result.status) << "; skipping sync.\n";
                break;
        }
    }

    void ChangeWatcher::run_onchange_command() {
        if (m_options.onchange_cmd.empty()) {
            std::cout << "[Watcher] No ONCHANGE_CMD configured; skipping.\n";
            return;
        }

        std::cout << "[Watcher] Executing: " << m_options.onchange_cmd << "\n";
        if (!m_runner.launch(m_options.onchange_cmd)) {
            std::cerr << "[Watcher] Failed to run ONCHANGE_CMD.\n";
        }
    }

}
