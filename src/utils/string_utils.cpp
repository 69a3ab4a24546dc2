/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "scriptjail/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>

namespace scriptjail {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter,
                                            bool skip_empty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (skip_empty && token.empty()) {
            continue;
        }
        tokens.push_back(token);
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& separator) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << separator << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================================
// PARSING
// ============================================================================

std::optional<std::pair<std::string, std::string>>
StringUtils::ParseKeyValue(const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }
    return std::make_pair(assignment.substr(0, eq), assignment.substr(eq + 1));
}

// ============================================================================
// GENERATION
// ============================================================================

std::string StringUtils::RandomAlphanumeric(std::size_t length) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(alphabet) - 2);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += alphabet[dis(gen)];
    }
    return result;
}

} // namespace utils
} // namespace scriptjail
