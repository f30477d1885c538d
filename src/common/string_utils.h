#ifndef STEPCOACH_STRING_UTILS_H
#define STEPCOACH_STRING_UTILS_H

#include <string>
#include <vector>
#include <map>

namespace stepcoach {
namespace utils {

/**
 * @brief String helpers shared by the grammar, planner and judges
 *
 * All functions operate on UTF-8 byte strings. Case folding only touches
 * ASCII letters so multi-byte sequences pass through unchanged.
 */
class StringUtils {
public:
    /**
     * @brief Replace all occurrences of a substring
     * @param from Substring to find (must not be empty)
     */
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

    static std::string trim(const std::string& str);

    /**
     * @brief Split by delimiter, keeping empty fields
     */
    static std::vector<std::string> split(const std::string& str, const std::string& delimiter);

    /**
     * @brief Split text into lines, accepting both \n and \r\n
     */
    static std::vector<std::string> splitLines(const std::string& text);

    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);
    static bool contains(const std::string& haystack, const std::string& needle);

    /**
     * @brief True if any keyword occurs in the text (ASCII case-insensitive)
     */
    static bool containsAny(const std::string& text, const std::vector<std::string>& keywords);

    static std::string toLowerCase(const std::string& str);
    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);
    static bool isWhitespaceOnly(const std::string& str);

    /**
     * @brief Remove any sequence of the given prefixes from the front of a string
     *
     * Used to strip list markers ("1.", "-", "•", ")") from free text lines.
     */
    static std::string stripLeadingTokens(const std::string& str, const std::vector<std::string>& tokens);

    /**
     * @brief Shorten to at most maxBytes without splitting a UTF-8 sequence
     */
    static std::string truncateUtf8(const std::string& str, size_t maxBytes);

    /**
     * @brief Replace {{NAME}} placeholders with values from the map
     *
     * Unknown placeholders are left untouched.
     */
    static std::string substituteVariables(const std::string& templateText,
                                           const std::map<std::string, std::string>& variables);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace stepcoach

#endif // STEPCOACH_STRING_UTILS_H
