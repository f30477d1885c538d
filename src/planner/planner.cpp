#include "planner.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"

namespace stepcoach {

Planner::Planner(std::shared_ptr<IOracle> oracle, const PromptLibrary& prompts)
    : m_oracle(std::move(oracle))
    , m_prompts(prompts) {

    if (!m_oracle) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Planner requires an oracle", "", "Planner::Planner");
    }
}

Plan Planner::createPlan(const Intent& intent, const ScreenState& screen, const std::string& knowledgeContext) {
    SLOG_INFO().message("Creating plan").context("goal", intent.goal);
    return requestPlan("plan", buildPlanningPrompt(intent, screen, knowledgeContext), intent);
}

Plan Planner::replan(const ReplanRequest& request, const ScreenState& screen) {
    SLOG_INFO().message("Replanning")
        .context("goal", request.intent.goal)
        .context("completed_steps", request.completedSteps.size())
        .context("reason", request.failureReason);
    return requestPlan("replan", buildReplanPrompt(request, screen), request.intent);
}

std::string Planner::buildPlanningPrompt(const Intent& intent, const ScreenState& screen,
                                         const std::string& knowledgeContext) const {
    std::string knowledge;
    if (!knowledgeContext.empty()) {
        knowledge = "\nReference knowledge:\n" + knowledgeContext + "\n";
    }
    return m_prompts.render("planning", {
        {"GOAL", intent.goal},
        {"INTENT_DETAILS", PromptLibrary::intentDetails(intent)},
        {"SCREEN_STATE", screen.toText()},
        {"KNOWLEDGE", knowledge}
    });
}

std::string Planner::buildReplanPrompt(const ReplanRequest& request, const ScreenState& screen) const {
    return m_prompts.render("replan", {
        {"GOAL", request.intent.goal},
        {"INTENT_DETAILS", PromptLibrary::intentDetails(request.intent)},
        {"COMPLETED_STEPS", PromptLibrary::numberedList(request.completedSteps)},
        {"FAILURE_REASON", request.failureReason},
        {"SCREEN_STATE", screen.toText()}
    });
}

PlanParseReport Planner::getLastReport() const {
    std::lock_guard<std::mutex> lock(m_reportMutex);
    return m_lastReport;
}

Plan Planner::requestPlan(const std::string& purpose, const std::string& prompt, const Intent& intent) {
    OracleRequest request;
    request.purpose = purpose;
    request.systemPrompt = m_prompts.render("planning_system", {});
    request.prompt = prompt;
    request.maxTokens = 2000;

    auto answer = m_oracle->ask(request);
    if (!answer.ok()) {
        const OracleError& error = answer.error();
        STEPCOACH_HANDLE_ERROR(oracleErrorType(error.code), ErrorSeverity::MEDIUM,
                               "Planner oracle call failed", error.message, "Planner::" + purpose);
        Plan empty;
        empty.intent = intent;
        return empty;
    }

    PlanParseReport report;
    Plan plan = PlanParser::parse(answer.value(), intent, report);
    {
        std::lock_guard<std::mutex> lock(m_reportMutex);
        m_lastReport = report;
    }

    SLOG_INFO().message("Plan ready")
        .context("purpose", purpose)
        .context("steps", plan.size())
        .context("repaired", report.repairedSteps)
        .context("rejected", report.rejected.size())
        .context("line_fallback", report.usedLineFallback);
    return plan;
}

} // namespace stepcoach
