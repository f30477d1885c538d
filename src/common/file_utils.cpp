#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>
#include <sstream>
#include <iterator>

namespace stepcoach {
namespace utils {

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_WARNING().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    SLOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    if (!validateFilePath(filePath)) {
        return false;
    }
    return replaceAtomically(filePath, jsonData.dump(2));
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (filePath.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        SLOG_ERROR().message("Empty directory path provided to createDirectoryIfNotExists");
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(directoryPath, ec)) {
        if (std::filesystem::is_directory(directoryPath, ec)) {
            return true;
        }
        SLOG_ERROR().message("Path exists but is not a directory").context("path", directoryPath);
        return false;
    }

    if (!std::filesystem::create_directories(directoryPath, ec) || ec) {
        SLOG_ERROR().message("Could not create directory").context("path", directoryPath).context("error", ec.message());
        return false;
    }
    SLOG_DEBUG().message("Created directory").context("path", directoryPath);
    return true;
}

bool FileUtils::readFileToString(const std::string& filePath, std::string& content) {
    if (!validateFilePath(filePath) || !fileExists(filePath)) {
        SLOG_ERROR().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

bool FileUtils::readFileToBytes(const std::string& filePath, std::vector<uint8_t>& bytes) {
    if (!validateFilePath(filePath) || !fileExists(filePath)) {
        SLOG_ERROR().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

bool FileUtils::validateFilePath(const std::string& filePath) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided");
        return false;
    }
    if (filePath.find('\0') != std::string::npos) {
        SLOG_ERROR().message("Invalid character in file path").context("path", filePath);
        return false;
    }
    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    std::filesystem::path parentPath = std::filesystem::path(filePath).parent_path();
    if (parentPath.empty()) {
        return true;
    }
    return createDirectoryIfNotExists(parentPath.string());
}

bool FileUtils::replaceAtomically(const std::string& filePath, const std::string& content) {
    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    const std::string tempFilePath = filePath + ".tmp";
    {
        std::ofstream tempFile(tempFilePath, std::ios::trunc);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }
        tempFile << content;
        tempFile.flush();
        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write temporary file").context("temp_path", tempFilePath);
            std::error_code ec;
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file").context("error", ec.message());
        std::filesystem::remove(tempFilePath, ec);
        return false;
    }

    SLOG_DEBUG().message("Wrote file").context("path", filePath).context("bytes", content.length());
    return true;
}

} // namespace utils
} // namespace stepcoach
