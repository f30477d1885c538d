#include "plan.h"

namespace stepcoach {

nlohmann::json Intent::toJson() const {
    nlohmann::json json = {
        {"goal", goal},
        {"success_criteria", successCriteria}
    };
    if (targetApp) {
        json["target_app"] = *targetApp;
    }
    if (targetState) {
        json["target_state"] = *targetState;
    }
    return json;
}

std::string Step::describe() const {
    return instruction.empty() ? skill.describe() : instruction;
}

nlohmann::json Step::toJson() const {
    nlohmann::json json = skill.toJson();
    json["step_number"] = number;
    json["friendly_description"] = instruction;
    json["expected_result"] = expectedResult;
    json["error_recovery"] = errorRecoveryHint;
    json["visual_hint"] = visualHint;
    return json;
}

bool Plan::isDenselyNumbered() const {
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].number != static_cast<int>(i + 1)) {
            return false;
        }
    }
    return true;
}

void Plan::renumber() {
    for (size_t i = 0; i < steps.size(); ++i) {
        steps[i].number = static_cast<int>(i + 1);
    }
}

nlohmann::json Plan::toJson() const {
    nlohmann::json stepsJson = nlohmann::json::array();
    for (const auto& step : steps) {
        stepsJson.push_back(step.toJson());
    }
    return {
        {"intent", intent.toJson()},
        {"steps", stepsJson},
        {"knowledge_sources", knowledgeSources}
    };
}

} // namespace stepcoach
