#include "command_runner.hpp"
#include <iostream>
#include <thread>
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace hashwatch::engine {

    bool CommandRunner::launch(const std::string& command) {
        pid_t pid = 0;
        const char* argv[] = {"/bin/sh", "-c", command.c_str(), nullptr};

        int rc = posix_spawn(&pid, "/bin/sh", nullptr, nullptr, const_cast<char* const*>(argv), environ);
        if (rc != 0) {
            std::cerr << "[CommandRunner] Failed to run command: " << strerror(rc) << "\n";
            return false;
        }

        std::cout << "[CommandRunner] Started pid " << pid << "\n";

        std::thread([pid]() {
            int status = 0;
            pid_t waited;
            do {
                waited = waitpid(pid, &status, 0);
            } while (waited < 0 && errno == EINTR);

            if (waited < 0) {
                std::cerr << "[CommandRunner] waitpid(" << pid << ") failed: " << strerror(errno) << "\n";
            } else if (WIFEXITED(status)) {
                std::cout << "[CommandRunner] pid " << pid << " exited with status " << WEXITSTATUS(status) << "\n";
            } else if (WIFSIGNALED(status)) {
                std::cerr << "[CommandRunner] pid " << pid << " killed by signal " << WTERMSIG(status) << "\n";
            }
        }).detach();

        return true;
    }

}
