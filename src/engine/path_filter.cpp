#include "path_filter.hpp"

namespace hashwatch::engine {

    PathFilter::PathFilter(const std::string& include, const std::string& exclude)
        : m_include(compile(include)), m_exclude(compile(exclude)) {}

    bool PathFilter::accepts(const std::filesystem::path& path) const {
        const std::string str = path.string();

        if (m_include && !std::regex_search(str, *m_include)) return false;
        if (m_exclude && std::regex_search(str, *m_exclude)) return false;

        return true;
    }

    std::optional<std::regex> PathFilter::compile(const std::string& pattern) {
        if (pattern.empty()) return std::nullopt;
        return std::regex(pattern, std::regex::ECMAScript);
    }

}
