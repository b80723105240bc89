#pragma once

#include <string>

namespace hashwatch::engine {

    /**
     * @brief Launches the follow-up shell command without waiting for it.
     */
    class CommandRunner {
    public:
        virtual ~CommandRunner() = default;

        /**
         * @brief Starts `/bin/sh -c command` in the background. Output is not captured.
         * The child is reaped on a detached thread that logs its exit status.
         * @return false if the process could not be started.
         */
        virtual bool launch(const std::string& command);
    };

}
