#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "../platform.hpp"
#include "hashwatch/types.hpp"
#include "command_runner.hpp"
#include "debouncer.hpp"
#include "path_filter.hpp"
#include "snapshot.hpp"

namespace hashwatch::engine {

    /**
     * @brief Wires file events through filtering and debouncing into the hash check.
     *
     * Raw events arrive on the Sentry thread and pass three stages: event kind,
     * include/exclude patterns, and (mtime, size) snapshot comparison. Survivors
     * notify the Debouncer, whose thread runs the check and, on a detected change,
     * launches the follow-up command once.
     */
    class ChangeWatcher {
    public:
        using CheckFn = std::function<CheckResult()>;

        struct Options {
            std::filesystem::path root;
            std::string include_pattern;
            std::string exclude_pattern;
            std::chrono::milliseconds debounce{3000};
            std::string onchange_cmd;
            bool verbose = false;
        };

        /**
         * @param sentry Event source; may be null when events are fed through handle_event().
         * @throws std::regex_error if a pattern does not compile.
         */
        ChangeWatcher(Options options, CheckFn check, CommandRunner& runner,
                      std::unique_ptr<platform::Sentry> sentry = nullptr);
        ~ChangeWatcher();

        ChangeWatcher(const ChangeWatcher&) = delete;
        ChangeWatcher& operator=(const ChangeWatcher&) = delete;

        /**
         * @brief Starts the debouncer and, if present, watches the root on a background thread.
         * @return false if the root could not be watched.
         */
        bool start();

        /**
         * @brief Stops the event source and the debouncer. Idempotent.
         */
        void stop();

        /**
         * @brief Runs one raw event through the filter stages.
         * @return true if it was forwarded to the debouncer.
         */
        bool handle_event(const platform::FileEvent& event);

        /**
         * @brief Event kinds that can indicate a content change. Directories never qualify.
         */
        static bool is_relevant(const platform::FileEvent& event);

    private:
        Options m_options;
        CheckFn m_check;
        CommandRunner& m_runner;
        std::unique_ptr<platform::Sentry> m_sentry;

        PathFilter m_filter;
        SnapshotTracker m_snapshots;
        Debouncer m_debouncer;

        std::thread m_sentry_thread;
        std::atomic<bool> m_stopped{false};

        void on_settled();
        void run_onchange_command();
    };

}
