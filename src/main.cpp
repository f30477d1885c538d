#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "common/structured_logger.h"
#include "common/config_manager.h"
#include "common/shutdown_manager.h"
#include "common/file_utils.h"
#include "common/clock.h"
#include "llm_connector/llm_oracle.h"
#include "environmental_perception/environmental_perception.h"
#include "planner/planner.h"
#include "feedback/change_observer.h"
#include "feedback/goal_evaluator.h"
#include "input/input_event_source.h"
#include "orchestrator/execution_engine.h"
#include "ui_module/ui_module.h"

using namespace stepcoach;

namespace {

const char* const STEPCOACH_VERSION = "0.3.0";

struct CommandLine {
    std::string configPath = "config/stepcoach.json";
    std::string goal;
    std::string targetApp;
    std::string targetState;
    std::vector<std::string> criteria;
    std::string knowledgeFile;
    std::string mode = "coached";
    bool planOnly = false;
};

void printUsage() {
    std::cout << "StepCoach - step-by-step guidance for desktop tasks\n";
    std::cout << "Usage: stepcoach --goal <text> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>          Configuration file (default config/stepcoach.json)\n";
    std::cout << "  --goal <text>            What you want to do\n";
    std::cout << "  --app <name>             Application the task happens in\n";
    std::cout << "  --target-state <text>    What the screen should show when done\n";
    std::cout << "  --criteria <text>        Success criterion (repeatable)\n";
    std::cout << "  --knowledge <file>       Reference notes passed to the planner\n";
    std::cout << "  --mode coached|simulate  Wait for you, or simulate each step (default coached)\n";
    std::cout << "  --plan-only              Print the plan and exit\n";
    std::cout << "  --help, -h               Show this help message\n";
    std::cout << "  --version, -v            Show version information\n";
}

// Returns -1 to continue, otherwise the process exit code
int parseArguments(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto takeValue = [&](std::string& target) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " option requires an argument\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "StepCoach v" << STEPCOACH_VERSION << "\n";
            return 0;
        } else if (arg == "--plan-only") {
            cmd.planOnly = true;
        } else if (arg == "--criteria") {
            std::string criterion;
            if (!takeValue(criterion)) return 1;
            cmd.criteria.push_back(criterion);
        } else if (arg == "--config") {
            if (!takeValue(cmd.configPath)) return 1;
        } else if (arg == "--goal") {
            if (!takeValue(cmd.goal)) return 1;
        } else if (arg == "--app") {
            if (!takeValue(cmd.targetApp)) return 1;
        } else if (arg == "--target-state") {
            if (!takeValue(cmd.targetState)) return 1;
        } else if (arg == "--knowledge") {
            if (!takeValue(cmd.knowledgeFile)) return 1;
        } else if (arg == "--mode") {
            if (!takeValue(cmd.mode)) return 1;
            if (cmd.mode != "coached" && cmd.mode != "simulate") {
                std::cerr << "Error: --mode must be coached or simulate\n";
                return 1;
            }
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (cmd.goal.empty()) {
        std::cerr << "Error: --goal is required\n";
        printUsage();
        return 1;
    }
    return -1;
}

void configureLogging(const ConfigManager& config) {
    auto& slogger = StructuredLogger::getInstance();
    slogger.setLogLevel(parseLogLevel(config.getLogLevel()));

    std::shared_ptr<ILogFormatter> formatter;
    if (config.getLogFormat() == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }

    // The terminal belongs to the coach; logs only go to the file
    slogger.clearSinks();

    RotatingFileLogSink::Config fileConfig;
    fileConfig.base_path = config.getLogFile();
    fileConfig.max_file_size = static_cast<size_t>(config.getLogMaxSizeMb()) * 1024 * 1024;
    fileConfig.max_files = static_cast<size_t>(config.getLogMaxFiles());
    slogger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, formatter));
    slogger.setSlowOperationThreshold(std::chrono::milliseconds(config.getSlowOperationMs()));
    slogger.setAsyncLogging(true);

    SLOG_INFO().message("Structured logging configured")
        .context("log_level", config.getLogLevel())
        .context("log_file", config.getLogFile())
        .context("format", config.getLogFormat());
}

Intent buildIntent(const CommandLine& cmd) {
    Intent intent(cmd.goal);
    if (!cmd.targetApp.empty()) intent.targetApp = cmd.targetApp;
    if (!cmd.targetState.empty()) intent.targetState = cmd.targetState;
    intent.successCriteria = cmd.criteria;
    return intent;
}

int runPlanOnly(IPerception& perception, IPlanner& planner, UIModule& ui,
                const Intent& intent, const std::string& knowledge) {
    auto snapshot = perception.capture();
    ScreenState screen = snapshot ? snapshot.value().state
                                  : ScreenState::unknown("screen capture failed");
    Plan plan = planner.createPlan(intent, screen, knowledge);
    ui.displayPlan(plan);
    std::cout << plan.toJson().dump(2) << std::endl;
    return plan.isEmpty() ? 2 : 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ShutdownManager::installSignalHandlers();

    CommandLine cmd;
    int parseResult = parseArguments(argc, argv, cmd);
    if (parseResult >= 0) {
        return parseResult;
    }

    try {
        auto& config = ConfigManager::getInstance();
        config.loadConfig(cmd.configPath);
        configureLogging(config);

        SLOG_INFO().message("StepCoach starting")
            .context("version", STEPCOACH_VERSION)
            .context("config_path", cmd.configPath)
            .context("mode", cmd.mode);

        std::string knowledge;
        if (!cmd.knowledgeFile.empty() &&
            !utils::FileUtils::readFileToString(cmd.knowledgeFile, knowledge)) {
            std::cerr << "Error: could not read knowledge file " << cmd.knowledgeFile << "\n";
            return 1;
        }

        auto clock = std::make_shared<SteadyClock>();
        PromptLibrary prompts = PromptLibrary::fromConfig(config);
        auto oracle = std::make_shared<LlmOracle>(config.getLlmConfig());

        PerceptionConfig perceptionConfig = config.getPerceptionConfig();
        auto snapshotSource = std::make_shared<CommandSnapshotSource>(
            perceptionConfig.captureCommand, perceptionConfig.capturePath);
        auto perception = std::make_shared<OraclePerception>(snapshotSource, oracle, clock, prompts);
        auto planner = std::make_shared<Planner>(oracle, prompts);

        UIModule ui;
        Intent intent = buildIntent(cmd);

        if (cmd.planOnly) {
            int code = runPlanOnly(*perception, *planner, ui, intent, knowledge);
            StructuredLogger::getInstance().flush();
            return code;
        }

        std::shared_ptr<QueuedInputEventSource> queuedSource;
        std::shared_ptr<ActuatorInputEventSource> actuatorSource;
        EngineDependencies deps;
        if (cmd.mode == "simulate") {
            actuatorSource = std::make_shared<ActuatorInputEventSource>(
                std::make_shared<SimulatedActuator>(), clock);
            deps.inputSource = actuatorSource;
        } else {
            queuedSource = std::make_shared<QueuedInputEventSource>(clock);
            deps.inputSource = queuedSource;
        }
        deps.planner = planner;
        deps.perception = perception;
        deps.changeObserver = std::make_shared<ChangeObserver>(oracle, prompts);
        deps.goalEvaluator = std::make_shared<GoalEvaluator>(oracle, prompts);
        deps.clock = clock;
        deps.callbacks = ui.callbacks();

        ExecutionEngine engine(deps, config.getEngineConfig());
        ShutdownWatcher watcher([&engine]() { engine.cancel(); });

        std::unique_ptr<ConsoleInputListener> listener;
        if (queuedSource) {
            listener.reset(new ConsoleInputListener(
                std::cin,
                [queuedSource]() { queuedSource->signal("enter"); },
                [&engine](const std::string& text) { engine.submitUserFeedback(text); }));
            listener->start();
        }

        RunResult result = engine.run(intent, knowledge);

        if (listener) {
            listener->stop();
        }
        watcher.stop();
        if (actuatorSource) {
            actuatorSource->shutdown();
        }

        ui.displayResult(result);
        SLOG_INFO().message("Run result").context("result", result.toJson());
        SLOG_INFO().message("Operation timings")
            .context("metrics", StructuredLogger::getInstance().getPerformanceTracker().toJson());
        StructuredLogger::getInstance().flush();
        return result.success ? 0 : 2;

    } catch (const std::exception& e) {
        SLOG_CRITICAL().message("Fatal error").context("error", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        StructuredLogger::getInstance().flush();
        return 1;
    }
}
