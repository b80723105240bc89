#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <regex>

namespace hashwatch::engine {

    class PathFilter {
    public:
        PathFilter() = default;

        /**
         * @brief Compiles the include and exclude patterns.
         * Empty patterns are treated as unset.
         * @throws std::regex_error if a pattern does not compile.
         */
        PathFilter(const std::string& include, const std::string& exclude);

        /**
         * @brief Checks a path against the rules.
         * @param path Absolute path of the event. Patterns are searched, not anchored.
         * @return true if the include rule (when set) matches and the exclude rule (when set) does not.
         */
        bool accepts(const std::filesystem::path& path) const;

        bool has_include() const { return m_include.has_value(); }
        bool has_exclude() const { return m_exclude.has_value(); }

    private:
        std::optional<std::regex> m_include;
        std::optional<std::regex> m_exclude;

        static std::optional<std::regex> compile(const std::string& pattern);
    };

}
