#ifndef STEPCOACH_FILE_UTILS_H
#define STEPCOACH_FILE_UTILS_H

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace stepcoach {
namespace utils {

/**
 * @brief File I/O helpers with logging; failures are reported as false
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON file
     * @param jsonOutput Receives the parsed document
     * @return true if the file exists and parses
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Save JSON atomically (temp file + rename), creating parent directories
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);
    static bool createDirectoryIfNotExists(const std::string& directoryPath);
    static bool readFileToString(const std::string& filePath, std::string& content);

    /**
     * @brief Read a binary file such as a captured screenshot
     */
    static bool readFileToBytes(const std::string& filePath, std::vector<uint8_t>& bytes);

private:
    static bool validateFilePath(const std::string& filePath);
    static bool ensureParentDirectoryExists(const std::string& filePath);
    static bool replaceAtomically(const std::string& filePath, const std::string& content);
};

} // namespace utils
} // namespace stepcoach

#endif // STEPCOACH_FILE_UTILS_H
