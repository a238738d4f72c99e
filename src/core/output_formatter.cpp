/**
 * @file output_formatter.cpp
 * @brief Truncation and failure framing of session output
 *
 * Limits are counted in UTF-8 code points, so a cut never lands inside a
 * multi-byte sequence.
 *
 * @date 2025
 */

#include "envbox/core/output_formatter.hpp"
#include "envbox/utils/string_utils.hpp"

namespace envbox {
namespace core {

using utils::StringUtils;

OutputFormatter::OutputFormatter(std::optional<std::size_t> max_chars)
    : max_chars_(max_chars) {
}

std::string OutputFormatter::SkipMarker(std::size_t skipped_lines) {
    return "\n\n[... " + std::to_string(skipped_lines) + " lines skipped ...]\n\n";
}

std::string OutputFormatter::Truncate(const std::string& text) const {
    if (!max_chars_ || StringUtils::Utf8Length(text) <= *max_chars_) {
        return text;
    }

    std::size_t cut = StringUtils::Utf8Offset(text, *max_chars_);
    std::size_t skipped = StringUtils::CountChar(text.substr(cut), '\n');
    return text.substr(0, cut) + SkipMarker(skipped);
}

std::string OutputFormatter::Format(const std::string& output, std::optional<int> exit_code) const {
    // The prefix does not count against the limit
    if (exit_code && *exit_code != 0) {
        return kErrorPrefix + Truncate(output) + "\n";
    }
    return Truncate(output);
}

} // namespace core
} // namespace envbox
