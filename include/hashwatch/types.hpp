#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace hashwatch::engine {

    struct FileInfo {
        std::filesystem::path path;
        std::uintmax_t size;
        std::filesystem::file_time_type last_write_time;
    };

    struct CheckResult {
        enum class Status {
            Unchanged,
            Changed,
            FirstRun,
            Error
        };

        Status status = Status::Error;
        std::optional<std::string> summary_hash;
        std::optional<std::string> previous_hash;
        std::string message;

        static CheckResult error(const std::string& message) {
            return {Status::Error, std::nullopt, std::nullopt, message};
        }
    };

    inline const char* to_string(CheckResult::Status status) {
        switch (status) {
            case CheckResult::Status::Unchanged: return "unchanged";
            case CheckResult::Status::Changed: return "changed";
            case CheckResult::Status::FirstRun: return "first-run";
            case CheckResult::Status::Error: return "error";
        }
        return "unknown";
    }

}
