/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation utilities
 *
 * **Shell Quoting**:
 * Single quotes are the only POSIX quoting form with no interpretation inside,
 * so a value is wrapped in `'...'` and each embedded `'` is written as the
 * four-character sequence `'\''` (close, escaped quote, reopen).
 *
 * **UTF-8 Handling**:
 * Lengths and prefixes are measured in code points. A byte is the start of a
 * code point unless it matches the continuation pattern 10xxxxxx.
 *
 * @date 2025
 */

#include "envbox/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace envbox {
namespace utils {

namespace {

inline bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================
// Basic string operations: trimming, casing, splitting, joining, replacing

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::TrimTrailingNewlines(const std::string& str) {
    std::size_t end = str.size();
    while (end > 0 && (str[end - 1] == '\n' || str[end - 1] == '\r')) {
        --end;
    }
    return str.substr(0, end);
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (begin < str.size()) {
        std::size_t end = str.find('\n', begin);
        if (end == std::string::npos) {
            lines.push_back(str.substr(begin));
            break;
        }
        lines.push_back(str.substr(begin, end - begin));
        begin = end + 1;
    }
    return lines;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                   const std::string& from,
                                   const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

// ============================================================================
// STRING CHECKING
// ============================================================================

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::size_t StringUtils::CountChar(const std::string& str, char c) {
    return static_cast<std::size_t>(std::count(str.begin(), str.end(), c));
}

bool StringUtils::IsValidIdentifier(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(str[0]);
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    return std::all_of(str.begin() + 1, str.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

// ============================================================================
// SHELL QUOTING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 2);
    result += '\'';
    for (char c : str) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
}

// ============================================================================
// UTF-8
// ============================================================================

std::size_t StringUtils::Utf8Length(const std::string& str) {
    std::size_t count = 0;
    for (char c : str) {
        if (!IsContinuationByte(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::size_t StringUtils::Utf8Offset(const std::string& str, std::size_t count) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!IsContinuationByte(static_cast<unsigned char>(str[i]))) {
            if (seen == count) {
                return i;
            }
            ++seen;
        }
    }
    return str.size();
}

// ============================================================================
// STRING SANITIZATION AND TRUNCATION
// ============================================================================

std::string StringUtils::SanitizeName(const std::string& str) {
    std::string result;
    result.reserve(str.length());

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '.' || c == '-') {
            result += c;
        } else {
            result += '_';
        }
    }

    return result;
}

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace envbox
