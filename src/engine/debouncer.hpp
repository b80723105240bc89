#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>

namespace hashwatch::engine {

    /**
     * @brief Coalesces bursts of notify() calls into a single callback.
     *
     * The callback fires on the debouncer's own thread once no notify() has
     * arrived for a full quiet period. Every notify() pushes the deadline out
     * again, so a burst of any length produces exactly one callback.
     * Callbacks never overlap; notifies that arrive while one is running are
     * folded into the next window.
     */
    class Debouncer {
    public:
        using Clock = std::chrono::steady_clock;
        using Callback = std::function<void()>;

        Debouncer(std::chrono::milliseconds quiet_period, Callback callback);
        ~Debouncer();

        Debouncer(const Debouncer&) = delete;
        Debouncer& operator=(const Debouncer&) = delete;

        /**
         * @brief Launches the worker thread. Has no effect once started or stopped.
         */
        void start();

        /**
         * @brief Records an event now. Safe to call from any thread.
         */
        void notify();

        /**
         * @brief Abandons any pending window and joins the worker.
         * No callback begins after this returns. Idempotent.
         */
        void stop();

    private:
        void run();

        const std::chrono::milliseconds m_quiet_period;
        Callback m_callback;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_pending = false;
        bool m_stop = false;
        Clock::time_point m_deadline;
        std::thread m_thread;
    };

}
