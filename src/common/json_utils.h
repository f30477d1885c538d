#ifndef STEPCOACH_JSON_UTILS_H
#define STEPCOACH_JSON_UTILS_H

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace stepcoach {
namespace utils {

/**
 * @brief Lenient JSON field access and extraction of JSON from model output
 */
class JsonUtils {
public:
    /**
     * @brief Get a string field; numbers and booleans are converted
     * @return Field value, or defaultValue if missing or of another type
     */
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName,
                                      const std::string& defaultValue = "");

    /**
     * @brief Get an integer field; floats truncate and numeric strings are parsed
     */
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    /**
     * @brief Get a boolean field; accepts "true"/"false"/"yes"/"no" strings and 0/1
     */
    static bool getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue = false);

    static double getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue = 0.0);

    /**
     * @brief Get an array of strings; non-string elements are skipped
     */
    static std::vector<std::string> getStringArrayField(const nlohmann::json& json, const std::string& fieldName);

    /**
     * @brief Get a nested value using dot notation ("engine.max_replans")
     * @return Pointer into json, or nullptr if any segment is missing
     */
    static const nlohmann::json* findPath(const nlohmann::json& json, const std::string& path);

    /**
     * @brief Locate and parse the JSON object inside free model output
     *
     * Tries, in order: a ```json fenced block, any ``` fenced block, and the
     * span from the first '{' to the last '}'.
     * @return The parsed object, or empty if nothing parses to an object
     */
    static std::optional<nlohmann::json> extractJsonObject(const std::string& text);

private:
    static std::optional<nlohmann::json> tryParseObject(const std::string& candidate);
};

} // namespace utils
} // namespace stepcoach

#endif // STEPCOACH_JSON_UTILS_H
