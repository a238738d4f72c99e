/**
 * @file output_formatter.hpp
 * @brief Truncation and error framing of command output
 *
 * Output returned to an agent has an exact shape: at most `L` characters of
 * text, followed by a skip marker when anything was dropped, wrapped in an
 * error prefix/suffix when the command failed.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace envbox {
namespace core {

/**
 * @class OutputFormatter
 * @brief Bit-exact output truncation
 *
 * Lengths are counted in UTF-8 code points.
 *
 * **Example** (L = 10):
 * @code
 * OutputFormatter formatter(10);
 * formatter.Format("0123456789abc\nxyz", 0);
 * // "0123456789\n\n[... 1 lines skipped ...]\n\n"
 * formatter.Format("0123456789abc", 2);
 * // "ERROR: Could not execute given command\n0123456789"
 * // "\n\n[... 0 lines skipped ...]\n\n\n"
 * @endcode
 */
class OutputFormatter {
public:
    static constexpr const char* kErrorPrefix = "ERROR: Could not execute given command\n";

    /**
     * @param max_chars Character limit (nullopt disables truncation)
     */
    explicit OutputFormatter(std::optional<std::size_t> max_chars);

    /**
     * @brief Truncate text to the limit, appending the skip marker if needed
     *
     * `n` in the marker is the number of '\n' characters in the dropped
     * tail.
     */
    std::string Truncate(const std::string& text) const;

    /**
     * @brief Frame the output of a finished command
     *
     * A failed command gets the error prefix in front of its truncated
     * output and one trailing "\n"; the prefix is not counted against
     * the limit.
     *
     * @param output Captured output (trailing newlines already stripped)
     * @param exit_code Command status; nullopt means the command did not run
     *                  to completion and no error framing is applied
     */
    std::string Format(const std::string& output, std::optional<int> exit_code) const;

    /**
     * @brief The literal skip marker for @p skipped_lines
     */
    static std::string SkipMarker(std::size_t skipped_lines);

    std::optional<std::size_t> MaxChars() const { return max_chars_; }

private:
    std::optional<std::size_t> max_chars_;  ///< Limit in code points
};

} // namespace core
} // namespace envbox
