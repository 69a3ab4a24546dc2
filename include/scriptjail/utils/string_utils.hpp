/**
 * @file string_utils.hpp
 * @brief Small string helpers used across the sandbox
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace scriptjail {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /// Remove leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// Lowercase ASCII copy
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on a delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @param skip_empty Drop empty fields
     * @return Fields in order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter,
                                          bool skip_empty = false);

    /// Join with a separator
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& separator);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /***************************************************************************
     * Parsing
     ***************************************************************************/

    /**
     * @brief Parse "KEY=VALUE"
     *
     * The value may contain further '=' characters and may be empty. The key
     * must be non-empty.
     *
     * @return (key, value) or nullopt when there is no '=' or the key is empty
     */
    static std::optional<std::pair<std::string, std::string>>
    ParseKeyValue(const std::string& assignment);

    /***************************************************************************
     * Generation
     ***************************************************************************/

    /**
     * @brief Random string of lowercase letters and digits
     *
     * Used for image tags and container names, which must not collide
     * between processes on the same host.
     */
    static std::string RandomAlphanumeric(std::size_t length);
};

} // namespace utils
} // namespace scriptjail
