#include "string_utils.h"
#include "structured_logger.h"
#include <algorithm>
#include <sstream>

namespace stepcoach {
namespace utils {

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        SLOG_ERROR().message("Empty 'from' parameter in replaceAll");
        return str;
    }

    std::string result = str;
    size_t startPos = 0;
    while ((startPos = result.find(from, startPos)) != std::string::npos) {
        result.replace(startPos, from.length(), to);
        startPos += to.length();
    }
    return result;
}

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> result;

    if (delimiter.empty()) {
        SLOG_ERROR().message("Empty delimiter in split");
        if (!str.empty()) {
            result.push_back(str);
        }
        return result;
    }

    if (str.empty()) {
        return result;
    }

    size_t start = 0;
    size_t end = 0;
    while ((end = str.find(delimiter, start)) != std::string::npos) {
        result.push_back(str.substr(start, end - start));
        start = end + delimiter.length();
    }
    result.push_back(str.substr(start));
    return result;
}

std::vector<std::string> StringUtils::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    if (prefix.empty() || str.length() < prefix.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    if (suffix.empty() || str.length() < suffix.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool StringUtils::contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && haystack.find(needle) != std::string::npos;
}

bool StringUtils::containsAny(const std::string& text, const std::vector<std::string>& keywords) {
    const std::string lowered = toLowerCase(text);
    return std::any_of(keywords.begin(), keywords.end(), [&lowered](const std::string& keyword) {
        return contains(lowered, toLowerCase(keyword));
    });
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    });
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

bool StringUtils::isWhitespaceOnly(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](char c) { return isWhitespace(c); });
}

std::string StringUtils::stripLeadingTokens(const std::string& str, const std::vector<std::string>& tokens) {
    std::string result = trim(str);
    bool stripped = true;
    while (stripped && !result.empty()) {
        stripped = false;
        for (const auto& token : tokens) {
            if (startsWith(result, token)) {
                result = trim(result.substr(token.length()));
                stripped = true;
                break;
            }
        }
    }
    return result;
}

std::string StringUtils::truncateUtf8(const std::string& str, size_t maxBytes) {
    if (str.length() <= maxBytes) {
        return str;
    }
    size_t cut = maxBytes;
    // Back off continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

std::string StringUtils::substituteVariables(const std::string& templateText,
                                             const std::map<std::string, std::string>& variables) {
    std::string result = templateText;
    for (const auto& [name, value] : variables) {
        result = replaceAll(result, "{{" + name + "}}", value);
    }
    return result;
}

bool StringUtils::isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace utils
} // namespace stepcoach
