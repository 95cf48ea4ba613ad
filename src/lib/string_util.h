#ifndef TILEBOX_STRING_UTIL_H
#define TILEBOX_STRING_UTIL_H
#pragma once

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace tilebox {
namespace detail {

inline std::string trim(const std::string &value) {
    const auto first = value.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(first, last - first + 1);
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

inline bool equals_ignore_case(const std::string &lhs, const std::string &rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline bool ends_with(const std::string &value, const std::string &suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::vector<std::string> split(const std::string &value, char separator) {
    std::stringstream ss(value);
    std::string token;
    std::vector<std::string> parts;
    while (std::getline(ss, token, separator)) {
        parts.emplace_back(trim(token));
    }
    return parts;
}

inline std::optional<long long> parse_int(const std::string &value) {
    try {
        std::size_t processed = 0;
        const long long parsed = std::stoll(value, &processed);
        if (processed == value.size()) {
            return parsed;
        }
    } catch (const std::exception &) {
    }
    return std::nullopt;
}

inline std::optional<double> parse_double(const std::string &value) {
    try {
        std::size_t processed = 0;
        const double parsed = std::stod(value, &processed);
        if (processed == value.size()) {
            return parsed;
        }
    } catch (const std::exception &) {
    }
    return std::nullopt;
}

}  // namespace detail
}  // namespace tilebox

#endif // TILEBOX_STRING_UTIL_H
