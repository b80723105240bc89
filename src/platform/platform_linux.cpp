#include "../platform.hpp"
#include <iostream>
#include <sys/inotify.h>
#include <unistd.h>
#include <poll.h>
#include <map>
#include <vector>
#include <cerrno>
#include <cstring>
#include <atomic>

namespace hashwatch::platform {

    class LinuxSentry : public Sentry {
    public:
        LinuxSentry() {
            m_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
            if (m_fd < 0) {
                std::cerr << "[Sentry] Failed to initialize inotify: " << strerror(errno) << "\n";
            }
        }

        ~LinuxSentry() {
            stop();
            if (m_fd >= 0) close(m_fd);
        }

        bool add_watch(const std::filesystem::path& path) override {
            if (m_fd < 0) return false;

            std::error_code ec;
            if (!std::filesystem::is_directory(path, ec)) {
                std::cerr << "[Sentry] Not a directory: " << path << "\n";
                return false;
            }

            if (!add_watch_single(path)) return false;
            add_watch_tree(path);
            return true;
        }

        void set_callback(EventCallback callback) override {
            m_callback = std::move(callback);
        }

        void start() override {
            if (m_fd < 0) return;
            std::cout << "[Sentry] Starting watcher loop...\n";

            struct pollfd pfd = { m_fd, POLLIN, 0 };
            char buffer[4096] __attribute__ ((aligned(__alignof__(struct inotify_event))));

            while (!m_stopped) {
                int poll_num = poll(&pfd, 1, 500); // 500ms timeout bounds stop() latency
                if (poll_num < 0) {
                    if (errno == EINTR) continue;
                    std::cerr << "[Sentry] poll error: " << strerror(errno) << "\n";
                    break;
                }
                if (poll_num == 0 || !(pfd.revents & POLLIN)) continue;

                ssize_t len = read(m_fd, buffer, sizeof(buffer));
                if (len < 0) {
                    if (errno != EAGAIN && errno != EINTR) {
                        std::cerr << "[Sentry] read error: " << strerror(errno) << "\n";
                    }
                    continue;
                }

                const struct inotify_event* event;
                for (char* ptr = buffer; ptr < buffer + len; ptr += sizeof(struct inotify_event) + event->len) {
                    event = (const struct inotify_event*) ptr;
                    handle_event(event);
                }
            }
            std::cout << "[Sentry] Watcher loop stopped.\n";
        }

        void stop() override {
            m_stopped = true;
        }

    private:
        int m_fd = -1;
        std::atomic<bool> m_stopped{false};
        std::map<int, std::filesystem::path> m_watches; // wd -> path
        EventCallback m_callback;

        static constexpr uint32_t kWatchMask =
            IN_MODIFY | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_CLOSE_WRITE;

        bool add_watch_single(const std::filesystem::path& path) {
            int wd = inotify_add_watch(m_fd, path.c_str(), kWatchMask);
            if (wd < 0) {
                std::cerr << "[Sentry] Failed to watch " << path << ": " << strerror(errno) << "\n";
                return false;
            }
            m_watches[wd] = path;
            return true;
        }

        void add_watch_tree(const std::filesystem::path& root) {
            std::error_code ec;
            auto it = std::filesystem::recursive_directory_iterator(
                root, std::filesystem::directory_options::skip_permission_denied, ec);
            for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_directory(ec)) {
                    add_watch_single(it->path());
                }
            }
        }

        void handle_event(const struct inotify_event* event) {
            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "[Sentry] Event queue overflow.\n";
                return;
            }

            auto it = m_watches.find(event->wd);
            if (it == m_watches.end()) return;

            if (event->mask & IN_IGNORED) {
                m_watches.erase(it);
                return;
            }

            std::filesystem::path full_path = it->second;
            if (event->len > 0) full_path /= event->name;

            bool is_dir = (event->mask & IN_ISDIR) != 0;

            // New directories need their own watches, including anything created before we got here
            if (is_dir && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
                if (add_watch_single(full_path)) add_watch_tree(full_path);
            }

            if (!m_callback) return;

            FileEvent fe;
            fe.path = full_path;
            fe.is_directory = is_dir;

            if (event->mask & IN_CLOSE_WRITE) fe.type = FileEvent::Type::ClosedWrite;
            else if (event->mask & IN_CREATE) fe.type = FileEvent::Type::Created;
            else if (event->mask & IN_DELETE) fe.type = FileEvent::Type::Deleted;
            else if (event->mask & IN_MODIFY) fe.type = FileEvent::Type::Modified;
            else if (event->mask & (IN_MOVED_FROM | IN_MOVED_TO)) fe.type = FileEvent::Type::Moved;
            else return;

            m_callback(fe);
        }
    };

    std::unique_ptr<Sentry> Sentry::create() {
        return std::make_unique<LinuxSentry>();
    }

}
