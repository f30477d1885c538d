#include "goal_evaluator.h"
#include "../common/structured_logger.h"
#include "../common/json_utils.h"

namespace stepcoach {

GoalEvaluator::GoalEvaluator(std::shared_ptr<IOracle> oracle, const PromptLibrary& prompts)
    : m_oracle(std::move(oracle))
    , m_prompts(prompts) {

    if (!m_oracle) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "GoalEvaluator requires an oracle", "", "GoalEvaluator::GoalEvaluator");
    }
}

GoalVerdict GoalEvaluator::evaluate(const Intent& intent, const Snapshot& snapshot) {
    OracleRequest request;
    request.purpose = "goal_check";
    request.prompt = m_prompts.render("goal_check", {
        {"GOAL", intent.goal},
        {"INTENT_DETAILS", PromptLibrary::intentDetails(intent)},
        {"SCREEN_STATE", snapshot.state.toText()}
    });
    request.maxTokens = 300;
    if (snapshot.image.isValid()) {
        request.images.push_back({snapshot.image.data, snapshot.image.format});
    }

    GoalVerdict verdict;
    auto answer = m_oracle->ask(request);
    if (!answer.ok()) {
        verdict.oracleFailed = true;
        verdict.reason = "Goal check failed: " + answer.error().message;
        SLOG_WARNING().message("Goal check oracle call failed").context("error", answer.error().message);
        return verdict;
    }

    auto document = utils::JsonUtils::extractJsonObject(answer.value());
    if (!document) {
        verdict.reason = "Goal check answer was not JSON";
        SLOG_WARNING().message("Goal check answer was not JSON");
        return verdict;
    }

    verdict.achieved = utils::JsonUtils::getBoolField(*document, "goal_achieved", false);
    verdict.reason = utils::JsonUtils::getStringField(*document, "reason");
    SLOG_DEBUG().message("Goal check")
        .context("achieved", verdict.achieved)
        .context("reason", verdict.reason);
    return verdict;
}

} // namespace stepcoach
