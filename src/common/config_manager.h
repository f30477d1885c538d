#ifndef STEPCOACH_CONFIG_MANAGER_H
#define STEPCOACH_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

namespace stepcoach {

// Budgets and timings of the execution loop
struct EngineConfig {
    int maxStepRetries = 3;
    int maxReplans = 3;
    int idleTimeoutMs = 30000;
    int loadingPollInitialMs = 500;
    int loadingPollCapMs = 10000;
    int settleDelayMs = 500;
    std::string helpPrompt = "Need help completing this step: {{STEP}}?";
    bool warnOnSensitiveSteps = true;
    std::vector<std::string> sensitiveOperations;
};

struct LlmConfig {
    std::string baseUrl;
    std::string modelName;
    std::string visionModelName;
    std::string apiKey;
    int timeoutMs = 60000;
    int maxRetries = 2;
    int retryDelayMs = 1000;
    double temperature = 0.2;
    int maxTokens = 2000;
    int requestsPerMinute = 30;
    bool verifySsl = true;
    std::string proxyUrl;
};

struct PerceptionConfig {
    std::string captureCommand;
    std::string capturePath;
};

/**
 * @brief Process-wide configuration document with built-in defaults
 *
 * Values loaded from disk are merged over the defaults, so a partial file
 * only overrides what it names.
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& configPath = "config/stepcoach.json");
    bool saveConfig(const std::string& configPath) const;

    /**
     * @brief Merge a JSON document over the current configuration
     */
    void merge(const nlohmann::json& overrides);
    void resetToDefaults();

    EngineConfig getEngineConfig() const;
    LlmConfig getLlmConfig() const;
    PerceptionConfig getPerceptionConfig() const;

    // Logging
    std::string getLogFile() const;
    std::string getLogLevel() const;
    std::string getLogFormat() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;
    int getSlowOperationMs() const;

    /**
     * @brief Prompt template override for a named purpose, empty if none
     */
    std::string getPromptTemplate(const std::string& name) const;

    std::string getConfigPath() const;

    // Dot-path accessors with fallbacks ("engine.max_replans")
    std::string getString(const std::string& path, const std::string& defaultValue = "") const;
    int getInt(const std::string& path, int defaultValue = 0) const;
    double getDouble(const std::string& path, double defaultValue = 0.0) const;
    bool getBool(const std::string& path, bool defaultValue = false) const;
    std::vector<std::string> getStringList(const std::string& path) const;

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();
    std::string resolveApiKey() const;
};

} // namespace stepcoach

#endif // STEPCOACH_CONFIG_MANAGER_H
