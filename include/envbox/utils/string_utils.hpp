/**
 * @file string_utils.hpp
 * @brief String manipulation utilities for shell command handling
 *
 * Provides the string processing used across the sandbox: trimming and
 * splitting, POSIX shell quoting, environment variable name validation and
 * UTF-8 aware length/prefix helpers for output truncation.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace envbox {
namespace utils {

/**
 * @class StringUtils
 * @brief String utilities shared by the session, policy and runner code
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Build a shell-safe export line
 * std::string line = "export " + key + "=" + StringUtils::ShellQuote(value);
 *
 * // Truncate on a character boundary
 * if (StringUtils::Utf8Length(output) > limit) {
 *     output = output.substr(0, StringUtils::Utf8Offset(output, limit));
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Remove every trailing '\n' (and '\r') from string
     *
     * Shell output conventionally ends with a newline; callers that present
     * output to an agent strip it so `echo hello` yields "hello".
     *
     * @param str Input string
     * @return String without trailing newlines
     */
    static std::string TrimTrailingNewlines(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string into lines, keeping empty lines
     * @param str Input string
     * @return Lines without their '\n' terminators
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace all occurrences of substring
     * @param str Input string
     * @param from Substring to find
     * @param to Replacement substring
     * @return Modified string
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Count occurrences of a character
     * @param str String to scan
     * @param c Character to count
     * @return Number of occurrences
     */
    static std::size_t CountChar(const std::string& str, char c);

    /**
     * @brief Check if string is a valid shell variable name
     *
     * Matches `[A-Za-z_][A-Za-z0-9_]*`.
     *
     * @param str Candidate name
     * @return true if usable as an `export` target
     */
    static bool IsValidIdentifier(const std::string& str);

    /***************************************************************************
     * Shell Quoting
     ***************************************************************************/

    /**
     * @brief Quote string for a POSIX shell
     *
     * Wraps the value in single quotes; embedded single quotes become `'\''`.
     *
     * **Example**:
     * @code
     * ShellQuote("it's");   // 'it'\''s'
     * @endcode
     */
    static std::string ShellQuote(const std::string& str);

    /***************************************************************************
     * UTF-8
     ***************************************************************************/

    /**
     * @brief Count UTF-8 code points
     *
     * Continuation bytes (10xxxxxx) are not counted, so invalid sequences
     * degrade to byte counting rather than failing.
     *
     * @param str UTF-8 string
     * @return Number of code points
     */
    static std::size_t Utf8Length(const std::string& str);

    /**
     * @brief Byte offset of the first @p count code points
     * @param str UTF-8 string
     * @param count Number of code points
     * @return Byte offset (str.size() if the string is shorter)
     */
    static std::size_t Utf8Offset(const std::string& str, std::size_t count);

    /***************************************************************************
     * Utility Functions
     ***************************************************************************/

    /**
     * @brief Turn an arbitrary string into a container/file name component
     *
     * Keeps `[A-Za-z0-9_.-]`, maps everything else to '_'.
     *
     * @param str Input string
     * @return Sanitized name
     */
    static std::string SanitizeName(const std::string& str);

    /**
     * @brief Truncate string to maximum length for log lines
     * @param str Input string
     * @param max_length Maximum allowed length
     * @param suffix Suffix to append if truncated (default: "...")
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace envbox
