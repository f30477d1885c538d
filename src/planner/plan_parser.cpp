#include "plan_parser.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"

namespace stepcoach {

nlohmann::json PlanParseReport::toJson() const {
    return {
        {"found_json", foundJson},
        {"used_line_fallback", usedLineFallback},
        {"canonical_steps", canonicalSteps},
        {"repaired_steps", repairedSteps},
        {"rejected", rejected}
    };
}

Plan PlanParser::parse(const std::string& content, const Intent& intent) {
    PlanParseReport report;
    return parse(content, intent, report);
}

Plan PlanParser::parse(const std::string& content, const Intent& intent, PlanParseReport& report) {
    auto document = utils::JsonUtils::extractJsonObject(content);
    if (document) {
        report.foundJson = true;
        return parseSteps(*document, intent, report);
    }

    SLOG_WARNING().message("No JSON plan in oracle output, parsing as text lines")
        .context("content_length", content.size());
    report.usedLineFallback = true;
    return parseLines(content, intent);
}

Plan PlanParser::parseSteps(const nlohmann::json& document, const Intent& intent, PlanParseReport& report) {
    Plan plan;
    plan.intent = intent;
    plan.knowledgeSources = utils::JsonUtils::getStringArrayField(document, "knowledge_sources");

    if (!document.contains("steps") || !document["steps"].is_array()) {
        SLOG_INFO().message("Plan document has no steps array");
        return plan;
    }

    int position = 0;
    for (const auto& stepJson : document["steps"]) {
        ++position;
        if (!stepJson.is_object()) {
            report.rejected.push_back("step " + std::to_string(position) + ": not an object");
            continue;
        }

        std::string kindString = utils::JsonUtils::getStringField(stepJson, "skill_type", "click");
        int declaredNumber = utils::JsonUtils::getIntField(stepJson, "step_number", position);
        SkillValidation validation = ActionGrammar::validate(kindString);

        switch (validation.status) {
            case SkillValidation::Status::CANONICAL:
                ++report.canonicalSteps;
                break;
            case SkillValidation::Status::REPAIRED:
                ++report.repairedSteps;
                SLOG_INFO().message("Repaired skill type")
                    .context("step_number", declaredNumber)
                    .context("input", kindString)
                    .context("kind", skillKindToString(validation.kind));
                break;
            case SkillValidation::Status::REJECTED:
                report.rejected.push_back("step " + std::to_string(declaredNumber) + ": " + kindString);
                STEPCOACH_HANDLE_ERROR(ErrorType::GRAMMAR_REJECTION, ErrorSeverity::LOW,
                                       "Dropped step with unknown skill type",
                                       "step " + std::to_string(declaredNumber) + ": " + kindString,
                                       "PlanParser::parseSteps");
                continue;
        }

        Skill skill = ActionGrammar::buildSkill(validation.kind, stepJson);
        std::string instruction = utils::JsonUtils::getStringField(stepJson, "friendly_description");
        if (instruction.empty()) {
            instruction = utils::JsonUtils::getStringField(stepJson, "description");
        }

        Step step(declaredNumber, skill, instruction);
        step.expectedResult = utils::JsonUtils::getStringField(stepJson, "expected_result");
        step.errorRecoveryHint = utils::JsonUtils::getStringField(stepJson, "error_recovery");
        step.visualHint = utils::JsonUtils::getStringField(stepJson, "visual_hint");
        plan.steps.push_back(step);
    }

    plan.renumber();

    SLOG_DEBUG().message("Parsed plan")
        .context("steps", plan.steps.size())
        .context("report", report.toJson());
    return plan;
}

Plan PlanParser::parseLines(const std::string& content, const Intent& intent) {
    Plan plan;
    plan.intent = intent;

    for (const auto& rawLine : utils::StringUtils::splitLines(content)) {
        std::string text = cleanListLine(rawLine);
        if (text.empty()) {
            continue;
        }
        Step step(static_cast<int>(plan.steps.size() + 1), Skill::click(TargetDescriptor(text)), text);
        plan.steps.push_back(step);
    }
    return plan;
}

std::string PlanParser::cleanListLine(const std::string& line) {
    static const std::vector<std::string> listMarkers = {
        "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
        ".", "-", "•", ")", "、", "*", " ", "\t"
    };
    return utils::StringUtils::trim(utils::StringUtils::stripLeadingTokens(utils::StringUtils::trim(line), listMarkers));
}

} // namespace stepcoach
