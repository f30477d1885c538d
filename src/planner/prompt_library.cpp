#include "prompt_library.h"
#include "../common/config_manager.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include "plan.h"

namespace stepcoach {

PromptLibrary::PromptLibrary()
    : m_templates(builtInTemplates()) {}

PromptLibrary PromptLibrary::fromConfig(const ConfigManager& config) {
    PromptLibrary library;
    for (const auto& entry : builtInTemplates()) {
        std::string overrideText = config.getPromptTemplate(entry.first);
        if (!overrideText.empty()) {
            SLOG_INFO().message("Using configured prompt template").context("name", entry.first);
            library.setTemplate(entry.first, overrideText);
        }
    }
    return library;
}

void PromptLibrary::setTemplate(const std::string& name, const std::string& templateText) {
    m_templates[name] = templateText;
}

std::string PromptLibrary::getTemplate(const std::string& name) const {
    auto it = m_templates.find(name);
    return it != m_templates.end() ? it->second : "";
}

std::string PromptLibrary::render(const std::string& name, const std::map<std::string, std::string>& variables) const {
    std::map<std::string, std::string> all = variables;
    all.emplace("SKILL_REFERENCE", skillReference());
    return utils::StringUtils::substituteVariables(getTemplate(name), all);
}

std::string PromptLibrary::skillReference() {
    std::string reference;
    for (SkillKind kind : allSkillKinds()) {
        reference += "- " + skillKindToString(kind) + ": ";
        switch (kind) {
            case SkillKind::CLICK:
            case SkillKind::DOUBLE_CLICK:
            case SkillKind::RIGHT_CLICK:
                reference += "target";
                break;
            case SkillKind::DRAG:
                reference += "target, destination";
                break;
            case SkillKind::SCROLL_UP:
            case SkillKind::SCROLL_DOWN:
                reference += "target (area, optional)";
                break;
            case SkillKind::TYPE_TEXT:
                reference += "text, target (input field, optional)";
                break;
            case SkillKind::PRESS_KEY:
                reference += "key";
                break;
            case SkillKind::KEY_COMBINATION:
                reference += "hotkey (e.g. \"Ctrl+C\")";
                break;
            case SkillKind::WAIT:
                reference += "wait_seconds";
                break;
            case SkillKind::WAIT_FOR_ELEMENT:
                reference += "target, wait_seconds (timeout)";
                break;
            case SkillKind::DONE:
                reference += "no parameters; the goal is already reached";
                break;
        }
        reference += "\n";
    }
    return reference;
}

std::string PromptLibrary::intentDetails(const Intent& intent) {
    std::string details;
    if (intent.targetApp && !intent.targetApp->empty()) {
        details += "Target application: " + *intent.targetApp + "\n";
    }
    if (intent.targetState && !intent.targetState->empty()) {
        details += "Target state: " + *intent.targetState + "\n";
    }
    if (!intent.successCriteria.empty()) {
        details += "Success criteria: " + utils::StringUtils::join(intent.successCriteria, "; ") + "\n";
    }
    return details;
}

std::string PromptLibrary::numberedList(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "none";
    }
    std::string list;
    for (size_t i = 0; i < items.size(); ++i) {
        list += std::to_string(i + 1) + ". " + items[i] + "\n";
    }
    return list;
}

std::map<std::string, std::string> PromptLibrary::builtInTemplates() {
    std::map<std::string, std::string> templates;

    templates["planning_system"] =
        "You guide a person through a computer task one small UI operation at a time.\n"
        "Every step must use exactly one of these skill types:\n"
        "{{SKILL_REFERENCE}}\n"
        "Answer with a single JSON object and nothing else:\n"
        "{\"steps\": [{\"step_number\": 1, \"skill_type\": \"click\", \"target\": \"Start button\",\n"
        "  \"text\": \"\", \"key\": \"\", \"hotkey\": \"\", \"wait_seconds\": 1,\n"
        "  \"visual_hint\": \"bottom-left corner of the screen\",\n"
        "  \"expected_result\": \"The start menu opens\",\n"
        "  \"friendly_description\": \"Click the Start button in the bottom-left corner\",\n"
        "  \"error_recovery\": \"If nothing happens, press the Windows key\"}]}\n"
        "Plan from the current screen state. If the goal is already reached, return a single\n"
        "step with skill_type \"done\". If no path exists, return {\"steps\": []}.";

    templates["planning"] =
        "Goal: {{GOAL}}\n"
        "{{INTENT_DETAILS}}"
        "\nCurrent screen state:\n{{SCREEN_STATE}}\n"
        "{{KNOWLEDGE}}"
        "\nCreate the step plan starting from the current screen state.";

    templates["replan"] =
        "A problem occurred while carrying out the task, so a new plan is needed.\n"
        "Goal: {{GOAL}}\n"
        "{{INTENT_DETAILS}}"
        "\nSteps already completed:\n{{COMPLETED_STEPS}}\n"
        "\nProblem: {{FAILURE_REASON}}\n"
        "\nCurrent screen state:\n{{SCREEN_STATE}}\n"
        "\nContinue from the current state. Do not repeat the completed steps and do not restart\n"
        "from scratch. If the screen first needs to return to a safe state, start with those steps.";

    templates["screen_analysis"] =
        "Describe this screenshot for someone who cannot see it. Answer with JSON only:\n"
        "{\"app_name\": \"...\", \"screen_state\": \"short page/screen name\",\n"
        " \"page_status\": \"normal|loading|error|dialog|login\",\n"
        " \"description\": \"...\", \"available_elements\": [\"...\"], \"warnings\": [\"...\"]}";

    templates["unchanged_cause"] =
        "The screen looked the same before and after the person was asked to: {{STEP}}\n"
        "Before: {{BEFORE}}\n"
        "After: {{AFTER}}\n"
        "Decide whether anything changed because of the person's action, or only because of\n"
        "animations, clocks, blinking cursors or other dynamic content.\n"
        "Answer with JSON only: {\"has_change\": true|false, \"change_type\": \"user_action|dynamic_effect|none\"}";

    templates["step_verification"] =
        "The person was asked to: {{STEP}}\n"
        "Expected result: {{EXPECTED}}\n"
        "Screen before: {{BEFORE}}\n"
        "Screen after: {{AFTER}}\n"
        "Did the step succeed? Answer with JSON only:\n"
        "{\"success\": true|false, \"changes\": \"...\", \"matches_expected\": true|false, \"reason\": \"...\"}";

    templates["goal_check"] =
        "Goal: {{GOAL}}\n"
        "{{INTENT_DETAILS}}"
        "Current screen: {{SCREEN_STATE}}\n"
        "Is the overall goal already achieved on this screen, regardless of any remaining steps?\n"
        "Answer with JSON only: {\"goal_achieved\": true|false, \"reason\": \"...\"}";

    return templates;
}

} // namespace stepcoach
