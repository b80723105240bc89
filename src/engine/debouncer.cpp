#include "debouncer.hpp"
#include <iostream>
#include <exception>

namespace hashwatch::engine {

    Debouncer::Debouncer(std::chrono::milliseconds quiet_period, Callback callback)
        : m_quiet_period(quiet_period), m_callback(std::move(callback)) {}

    Debouncer::~Debouncer() {
        stop();
    }

    void Debouncer::start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop || m_thread.joinable()) return;
        m_thread = std::thread([this] { run(); });
    }

    void Debouncer::notify() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop) return;
            m_pending = true;
            m_deadline = Clock::now() + m_quiet_period;
        }
        m_cv.notify_one();
    }

    void Debouncer::stop() {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
            m_pending = false;
            // A callback that stops its own debouncer cannot join itself
            if (m_thread.get_id() != std::this_thread::get_id()) {
                worker = std::move(m_thread);
            }
        }
        m_cv.notify_all();

        if (worker.joinable()) worker.join();
    }

    void Debouncer::run() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_stop) {
            if (!m_pending) {
                m_cv.wait(lock, [this] { return m_pending || m_stop; });
                continue;
            }

            // Wakes early on notify()/stop(); the deadline is re-read every pass
            m_cv.wait_until(lock, m_deadline);
            if (m_stop) break;
            if (Clock::now() < m_deadline) continue;

            m_pending = false;
            lock.unlock();
            try {
                m_callback();
            } catch (const std::exception& e) {
                std::cerr << "[Debouncer] Callback failed: " << e.what() << "\n";
            } catch (...) {
                std::cerr << "[Debouncer] Callback failed with a non-standard exception.\n";
            }
            lock.lock();
        }
    }

}
