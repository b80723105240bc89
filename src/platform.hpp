#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <filesystem>

namespace hashwatch::platform {

    /**
     * @brief Platform-agnostic file system event types.
     */
    struct FileEvent {
        enum class Type {
            Modified,
            Created,
            Deleted,
            Moved,
            ClosedWrite
        };

        std::filesystem::path path;
        Type type;
        bool is_directory = false;
    };

    /**
     * @brief Abstract base class for the File Watcher (Sentry).
     * Implementations will use inotify (Linux) or ReadDirectoryChangesW (Windows).
     */
    class Sentry {
    public:
        using EventCallback = std::function<void(const FileEvent&)>;

        virtual ~Sentry() = default;

        /**
         * @brief Starts watching a directory recursively.
         * @param path The root path to watch.
         * @return false if the root could not be watched.
         */
        virtual bool add_watch(const std::filesystem::path& path) = 0;

        /**
         * @brief Sets the callback for file events.
         */
        virtual void set_callback(EventCallback callback) = 0;

        /**
         * @brief Runs the watcher loop until stop() is called. Blocks the calling thread.
         */
        virtual void start() = 0;

        /**
         * @brief Stops the watcher. Safe to call more than once and from another thread.
         */
        virtual void stop() = 0;

        /**
         * @brief Factory method to create a platform-specific Sentry.
         */
        static std::unique_ptr<Sentry> create();
    };

}
