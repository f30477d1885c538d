#include "config_manager.h"
#include "structured_logger.h"
#include "file_utils.h"
#include "json_utils.h"
#include <cstdlib>

namespace stepcoach {

ConfigManager::ConfigManager()
    : m_config(defaults()) {}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"engine", {
            {"max_step_retries", 3},
            {"max_replans", 3},
            {"idle_timeout_ms", 30000},
            {"loading_poll_initial_ms", 500},
            {"loading_poll_cap_ms", 10000},
            {"settle_delay_ms", 500},
            {"help_prompt", "Need help completing this step: {{STEP}}?"}
        }},
        {"llm", {
            {"base_url", "https://api.openai.com/v1"},
            {"model_name", "gpt-4o-mini"},
            {"vision_model_name", "gpt-4o"},
            {"api_key", ""},
            {"api_key_env", "STEPCOACH_API_KEY"},
            {"timeout_ms", 60000},
            {"max_retries", 2},
            {"retry_delay_ms", 1000},
            {"temperature", 0.2},
            {"max_tokens", 2000},
            {"requests_per_minute", 30},
            {"verify_ssl", true},
            {"proxy", ""}
        }},
        {"perception", {
            {"capture_command", "import -window root {output}"},
            {"capture_path", "/tmp/stepcoach_screen.png"}
        }},
        {"safety", {
            {"warn_on_sensitive_steps", true},
            {"sensitive_operations", nlohmann::json::array({
                "payment", "transfer", "password", "delete", "uninstall", "authorize",
                "支付", "转账", "删除", "卸载", "授权", "密码", "验证码"
            })}
        }},
        {"prompts", nlohmann::json::object()},
        {"logging", {
            {"level", "INFO"},
            {"file", "logs/stepcoach.log"},
            {"format", "text"},
            {"max_size_mb", 10},
            {"max_files", 5},
            {"slow_operation_ms", 5000}
        }}
    };
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = configPath;
    }

    nlohmann::json loaded;
    if (utils::FileUtils::loadJsonFromFile(configPath, loaded) && loaded.is_object()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
        m_config.merge_patch(loaded);
        SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
        return true;
    }

    SLOG_WARNING().message("Config file not found or invalid, using defaults").context("config_path", configPath);
    resetToDefaults();
    if (!utils::FileUtils::fileExists(configPath)) {
        saveConfig(configPath);
    }
    return false;
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = m_config;
    }
    if (!utils::FileUtils::saveJsonToFile(configPath, snapshot)) {
        SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
        return false;
    }
    SLOG_INFO().message("Configuration saved").context("config_path", configPath);
    return true;
}

void ConfigManager::merge(const nlohmann::json& overrides) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.merge_patch(overrides);
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
}

EngineConfig ConfigManager::getEngineConfig() const {
    EngineConfig config;
    config.maxStepRetries = getInt("engine.max_step_retries", config.maxStepRetries);
    config.maxReplans = getInt("engine.max_replans", config.maxReplans);
    config.idleTimeoutMs = getInt("engine.idle_timeout_ms", config.idleTimeoutMs);
    config.loadingPollInitialMs = getInt("engine.loading_poll_initial_ms", config.loadingPollInitialMs);
    config.loadingPollCapMs = getInt("engine.loading_poll_cap_ms", config.loadingPollCapMs);
    config.settleDelayMs = getInt("engine.settle_delay_ms", config.settleDelayMs);
    config.helpPrompt = getString("engine.help_prompt", config.helpPrompt);
    config.warnOnSensitiveSteps = getBool("safety.warn_on_sensitive_steps", config.warnOnSensitiveSteps);
    config.sensitiveOperations = getStringList("safety.sensitive_operations");

    if (config.maxStepRetries < 0 || config.maxReplans < 0 || config.idleTimeoutMs <= 0 ||
        config.loadingPollInitialMs <= 0 || config.loadingPollCapMs < 0 || config.settleDelayMs < 0) {
        SLOG_WARNING().message("Engine configuration out of range, clamping to defaults");
        EngineConfig fallback;
        if (config.maxStepRetries < 0) config.maxStepRetries = fallback.maxStepRetries;
        if (config.maxReplans < 0) config.maxReplans = fallback.maxReplans;
        if (config.idleTimeoutMs <= 0) config.idleTimeoutMs = fallback.idleTimeoutMs;
        if (config.loadingPollInitialMs <= 0) config.loadingPollInitialMs = fallback.loadingPollInitialMs;
        if (config.loadingPollCapMs < 0) config.loadingPollCapMs = fallback.loadingPollCapMs;
        if (config.settleDelayMs < 0) config.settleDelayMs = fallback.settleDelayMs;
    }
    return config;
}

LlmConfig ConfigManager::getLlmConfig() const {
    LlmConfig config;
    config.baseUrl = getString("llm.base_url");
    config.modelName = getString("llm.model_name");
    config.visionModelName = getString("llm.vision_model_name", config.modelName);
    config.apiKey = resolveApiKey();
    config.timeoutMs = getInt("llm.timeout_ms", config.timeoutMs);
    config.maxRetries = getInt("llm.max_retries", config.maxRetries);
    config.retryDelayMs = getInt("llm.retry_delay_ms", config.retryDelayMs);
    config.temperature = getDouble("llm.temperature", config.temperature);
    config.maxTokens = getInt("llm.max_tokens", config.maxTokens);
    config.requestsPerMinute = getInt("llm.requests_per_minute", config.requestsPerMinute);
    config.verifySsl = getBool("llm.verify_ssl", config.verifySsl);
    config.proxyUrl = getString("llm.proxy");
    return config;
}

PerceptionConfig ConfigManager::getPerceptionConfig() const {
    PerceptionConfig config;
    config.captureCommand = getString("perception.capture_command");
    config.capturePath = getString("perception.capture_path");
    return config;
}

std::string ConfigManager::getLogFile() const {
    return getString("logging.file", "logs/stepcoach.log");
}

std::string ConfigManager::getLogLevel() const {
    return getString("logging.level", "INFO");
}

std::string ConfigManager::getLogFormat() const {
    return getString("logging.format", "text");
}

int ConfigManager::getLogMaxSizeMb() const {
    return getInt("logging.max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return getInt("logging.max_files", 5);
}

int ConfigManager::getSlowOperationMs() const {
    return getInt("logging.slow_operation_ms", 5000);
}

std::string ConfigManager::getPromptTemplate(const std::string& name) const {
    return getString("prompts." + name);
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configPath;
}

std::string ConfigManager::getString(const std::string& path, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = utils::JsonUtils::findPath(m_config, path);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& path, int defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = utils::JsonUtils::findPath(m_config, path);
    if (value && value->is_number()) {
        return value->get<int>();
    }
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& path, double defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = utils::JsonUtils::findPath(m_config, path);
    if (value && value->is_number()) {
        return value->get<double>();
    }
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& path, bool defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = utils::JsonUtils::findPath(m_config, path);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }
    return defaultValue;
}

std::vector<std::string> ConfigManager::getStringList(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> values;
    const nlohmann::json* value = utils::JsonUtils::findPath(m_config, path);
    if (value && value->is_array()) {
        for (const auto& item : *value) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
    }
    return values;
}

std::string ConfigManager::resolveApiKey() const {
    std::string configured = getString("llm.api_key");
    if (!configured.empty()) {
        return configured;
    }

    std::string envVar = getString("llm.api_key_env", "STEPCOACH_API_KEY");
    const char* fromEnv = std::getenv(envVar.c_str());
    if (fromEnv == nullptr || std::string(fromEnv).empty()) {
        SLOG_WARNING().message("API key not found in config file or environment variable").context("env_var", envVar);
        return "";
    }
    return fromEnv;
}

} // namespace stepcoach
