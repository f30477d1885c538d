#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include "common/config_manager.h"
#include "common/file_utils.h"
#include "common/structured_logger.h"

using namespace stepcoach;

namespace {

std::filesystem::path scratchDirectory() {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "stepcoach_config_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // anonymous namespace

void testDefaults() {
    std::cout << "[TEST] Engine defaults\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();

    EngineConfig engine = config.getEngineConfig();
    assert(engine.maxStepRetries == 3);
    assert(engine.maxReplans == 3);
    assert(engine.idleTimeoutMs == 30000);
    assert(engine.loadingPollInitialMs == 500);
    assert(engine.loadingPollCapMs == 10000);
    assert(engine.helpPrompt.find("{{STEP}}") != std::string::npos);
    assert(engine.warnOnSensitiveSteps);
    assert(!engine.sensitiveOperations.empty());

    assert(config.getLogLevel() == "INFO");
    assert(config.getLogFormat() == "text");
    assert(config.getSlowOperationMs() == 5000);
    assert(config.getLlmConfig().verifySsl);
    assert(config.getLlmConfig().proxyUrl.empty());
    assert(config.getPerceptionConfig().captureCommand.find("{output}") != std::string::npos);
    assert(config.getPromptTemplate("planning").empty());

    std::cout << "[OK] Defaults test passed\n\n";
}

void testPartialFileMergesOverDefaults() {
    std::cout << "[TEST] A partial config file only overrides what it names\n";

    auto dir = scratchDirectory();
    std::string path = (dir / "partial.json").string();
    nlohmann::json partial = {
        {"engine", {{"max_replans", 5}, {"idle_timeout_ms", 45000}}},
        {"logging", {{"level", "DEBUG"}}},
        {"prompts", {{"planning", "Plan: {{GOAL}}"}}}
    };
    assert(utils::FileUtils::saveJsonToFile(path, partial));

    auto& config = ConfigManager::getInstance();
    assert(config.loadConfig(path));
    assert(config.getConfigPath() == path);

    EngineConfig engine = config.getEngineConfig();
    assert(engine.maxReplans == 5);
    assert(engine.idleTimeoutMs == 45000);
    assert(engine.maxStepRetries == 3);
    assert(engine.loadingPollCapMs == 10000);
    assert(config.getLogLevel() == "DEBUG");
    assert(config.getLogFile() == "logs/stepcoach.log");
    assert(config.getPromptTemplate("planning") == "Plan: {{GOAL}}");

    std::filesystem::remove_all(dir);
    std::cout << "[OK] Partial merge test passed\n\n";
}

void testMissingFileWritesDefaults() {
    std::cout << "[TEST] A missing config file is created from defaults\n";

    auto dir = scratchDirectory();
    std::string path = (dir / "nested" / "stepcoach.json").string();

    auto& config = ConfigManager::getInstance();
    assert(!config.loadConfig(path));
    assert(utils::FileUtils::fileExists(path));

    nlohmann::json written;
    assert(utils::FileUtils::loadJsonFromFile(path, written));
    assert(written["engine"]["max_step_retries"] == 3);
    assert(written["llm"]["api_key_env"] == "STEPCOACH_API_KEY");

    std::filesystem::remove_all(dir);
    std::cout << "[OK] Missing file test passed\n\n";
}

void testInvalidValuesClamped() {
    std::cout << "[TEST] Out-of-range engine values fall back to defaults\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.merge({{"engine", {{"max_step_retries", -1}, {"idle_timeout_ms", 0}, {"max_replans", 0}}}});

    EngineConfig engine = config.getEngineConfig();
    assert(engine.maxStepRetries == 3);
    assert(engine.idleTimeoutMs == 30000);
    assert(engine.maxReplans == 0);

    config.merge({{"engine", {{"max_replans", "many"}}}});
    assert(config.getEngineConfig().maxReplans == 3);

    std::cout << "[OK] Clamping test passed\n\n";
}

void testDotPathAccessors() {
    std::cout << "[TEST] Dot-path accessors and API key lookup\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();

    assert(config.getInt("engine.max_replans") == 3);
    assert(config.getInt("engine.missing", 7) == 7);
    assert(config.getString("llm.model_name") == "gpt-4o-mini");
    assert(config.getDouble("llm.temperature") == 0.2);
    assert(config.getBool("safety.warn_on_sensitive_steps"));
    assert(config.getString("engine.max_replans", "fallback") == "fallback");
    assert(config.getStringList("safety.sensitive_operations").size() > 5);

    setenv("STEPCOACH_TEST_KEY", "sk-from-env", 1);
    config.merge({{"llm", {{"api_key_env", "STEPCOACH_TEST_KEY"}}}});
    assert(config.getLlmConfig().apiKey == "sk-from-env");

    config.merge({{"llm", {{"api_key", "sk-from-file"}}}});
    assert(config.getLlmConfig().apiKey == "sk-from-file");
    unsetenv("STEPCOACH_TEST_KEY");

    config.resetToDefaults();
    std::cout << "[OK] Accessor test passed\n\n";
}

int main() {
    std::cout << "=== StepCoach Config Manager Test Suite ===\n\n";
    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testDefaults();
        testPartialFileMergesOverDefaults();
        testMissingFileWritesDefaults();
        testInvalidValuesClamped();
        testDotPathAccessors();

        StructuredLogger::getInstance().shutdown();
        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
