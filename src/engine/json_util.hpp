#pragma once

#include <string>
#include <optional>
#include <cmath>
#include <nlohmann/json.hpp>

namespace hashwatch::engine {

    /**
     * @brief Reads a finite number given either as a JSON number or as a numeric string.
     */
    inline std::optional<double> parse_number(const nlohmann::json& value) {
        double result = 0;
        if (value.is_number()) {
            result = value.get<double>();
        } else if (value.is_string()) {
            const std::string& str = value.get_ref<const std::string&>();
            size_t consumed = 0;
            try {
                result = std::stod(str, &consumed);
            } catch (const std::exception&) {
                return std::nullopt;
            }
            if (str.find_first_not_of(" \t\r\n", consumed) != std::string::npos) return std::nullopt;
        } else {
            return std::nullopt;
        }
        if (!std::isfinite(result)) return std::nullopt;
        return result;
    }

}
