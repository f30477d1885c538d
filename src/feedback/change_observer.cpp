#include "change_observer.h"
#include "../common/structured_logger.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include <algorithm>
#include <set>

namespace stepcoach {

std::string changeClassificationToString(ChangeClassification classification) {
    switch (classification) {
        case ChangeClassification::LOADING: return "LOADING";
        case ChangeClassification::ERROR: return "ERROR";
        case ChangeClassification::UNCHANGED: return "UNCHANGED";
        case ChangeClassification::CHANGED: return "CHANGED";
    }
    return "UNKNOWN";
}

std::string unchangedCauseToString(UnchangedCause cause) {
    switch (cause) {
        case UnchangedCause::USER_ACTION: return "USER_ACTION";
        case UnchangedCause::DYNAMIC_EFFECT: return "DYNAMIC_EFFECT";
        case UnchangedCause::NONE: return "NONE";
    }
    return "UNKNOWN";
}

ChangeObserver::ChangeObserver(std::shared_ptr<IOracle> oracle, const PromptLibrary& prompts)
    : m_oracle(std::move(oracle))
    , m_prompts(prompts) {

    if (!m_oracle) {
        STEPCOACH_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "ChangeObserver requires an oracle", "", "ChangeObserver::ChangeObserver");
    }
}

const std::vector<std::string>& ChangeObserver::loadingKeywords() {
    static const std::vector<std::string> keywords = {
        "loading", "加载", "请稍候", "正在", "处理中"
    };
    return keywords;
}

const std::vector<std::string>& ChangeObserver::errorKeywords() {
    static const std::vector<std::string> keywords = {
        "error", "failed", "错误", "失败", "无法连接"
    };
    return keywords;
}

ChangeJudgment ChangeObserver::classify(const Snapshot& before, const Snapshot& after) {
    ChangeJudgment judgment = classifyStates(before.state, after.state);
    SLOG_DEBUG().message("Classified screen change")
        .context("classification", changeClassificationToString(judgment.classification))
        .context("justification", judgment.justification);
    return judgment;
}

ChangeJudgment ChangeObserver::classifyStates(const ScreenState& before, const ScreenState& after) {
    using utils::StringUtils;

    const std::string observed = after.screenState + " " + after.description;

    if (after.pageStatus == PageStatus::LOADING || StringUtils::containsAny(observed, loadingKeywords())) {
        return {ChangeClassification::LOADING, "Screen is still loading"};
    }
    if (after.pageStatus == PageStatus::ERROR || StringUtils::containsAny(observed, errorKeywords())) {
        return {ChangeClassification::ERROR, "Screen shows an error: " + StringUtils::truncateUtf8(after.description, 200)};
    }

    std::set<std::string> beforeElements(before.availableElements.begin(), before.availableElements.end());
    std::set<std::string> afterElements(after.availableElements.begin(), after.availableElements.end());
    if (before.appName == after.appName && before.screenState == after.screenState &&
        beforeElements == afterElements) {
        return {ChangeClassification::UNCHANGED, "Same application, screen and elements as before"};
    }

    return {ChangeClassification::CHANGED, "Screen moved from \"" + before.screenState + "\" to \"" + after.screenState + "\""};
}

void ChangeObserver::attachImages(OracleRequest& request, const Snapshot& before, const Snapshot& after) {
    if (before.image.isValid()) {
        request.images.push_back({before.image.data, before.image.format});
    }
    if (after.image.isValid()) {
        request.images.push_back({after.image.data, after.image.format});
    }
}

CauseJudgment ChangeObserver::unchangedCause(const Step& step, const Snapshot& before, const Snapshot& after) {
    OracleRequest request;
    request.purpose = "unchanged_cause";
    request.prompt = m_prompts.render("unchanged_cause", {
        {"STEP", step.describe()},
        {"BEFORE", before.state.toText()},
        {"AFTER", after.state.toText()}
    });
    request.maxTokens = 300;
    attachImages(request, before, after);

    CauseJudgment judgment;
    auto answer = m_oracle->ask(request);
    if (!answer.ok()) {
        judgment.oracleFailed = true;
        judgment.justification = "Change-cause check failed: " + answer.error().message;
        SLOG_WARNING().message("Unchanged-cause oracle call failed").context("error", answer.error().message);
        return judgment;
    }

    auto document = utils::JsonUtils::extractJsonObject(answer.value());
    if (!document) {
        judgment.justification = "Change-cause answer was not JSON";
        SLOG_WARNING().message("Unchanged-cause answer was not JSON");
        return judgment;
    }

    std::string changeType = utils::StringUtils::toLowerCase(
        utils::JsonUtils::getStringField(*document, "change_type", "none"));
    if (changeType == "dynamic_effect") {
        judgment.cause = UnchangedCause::DYNAMIC_EFFECT;
    } else if (changeType == "user_action") {
        judgment.cause = UnchangedCause::USER_ACTION;
    } else {
        judgment.cause = UnchangedCause::NONE;
    }
    judgment.justification = utils::JsonUtils::getStringField(*document, "description", changeType);
    return judgment;
}

StepVerdict ChangeObserver::verifyStep(const Step& step, const Snapshot& before, const Snapshot& after) {
    OracleRequest request;
    request.purpose = "verify";
    request.prompt = m_prompts.render("step_verification", {
        {"STEP", step.describe()},
        {"EXPECTED", step.expectedResult.empty() ? std::string("The operation completed successfully") : step.expectedResult},
        {"BEFORE", before.state.toText()},
        {"AFTER", after.state.toText()}
    });
    request.maxTokens = 500;
    attachImages(request, before, after);

    StepVerdict verdict;
    auto answer = m_oracle->ask(request);
    if (!answer.ok()) {
        verdict.oracleFailed = true;
        verdict.reason = "Step verification failed: " + answer.error().message;
        SLOG_WARNING().message("Step verification oracle call failed").context("error", answer.error().message);
        return verdict;
    }

    auto document = utils::JsonUtils::extractJsonObject(answer.value());
    if (!document) {
        verdict.reason = "Step verification answer was not JSON";
        SLOG_WARNING().message("Step verification answer was not JSON");
        return verdict;
    }

    verdict.success = utils::JsonUtils::getBoolField(*document, "success", false) &&
                      utils::JsonUtils::getBoolField(*document, "matches_expected", false);
    verdict.changes = utils::JsonUtils::getStringField(*document, "changes");
    verdict.reason = utils::JsonUtils::getStringField(*document, "reason");
    return verdict;
}

} // namespace stepcoach
