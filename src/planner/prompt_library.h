#ifndef STEPCOACH_PROMPT_LIBRARY_H
#define STEPCOACH_PROMPT_LIBRARY_H

#include <string>
#include <vector>
#include <map>

namespace stepcoach {

class ConfigManager;
struct Intent;

/**
 * @brief Named prompt templates with {{VARIABLE}} placeholders
 *
 * Built-in defaults can be overridden per name from the "prompts" config
 * section. Names: planning_system, planning, replan, screen_analysis,
 * unchanged_cause, step_verification, goal_check.
 */
class PromptLibrary {
public:
    PromptLibrary();

    static PromptLibrary fromConfig(const ConfigManager& config);

    void setTemplate(const std::string& name, const std::string& templateText);
    std::string getTemplate(const std::string& name) const;

    std::string render(const std::string& name, const std::map<std::string, std::string>& variables) const;

    /**
     * @brief Skill reference listing every canonical kind and its parameters
     */
    static std::string skillReference();

    /**
     * @brief Target app, target state and success criteria lines, empty if none are set
     */
    static std::string intentDetails(const Intent& intent);

    /**
     * @brief "1. ...\n2. ..." or "none"
     */
    static std::string numberedList(const std::vector<std::string>& items);

private:
    std::map<std::string, std::string> m_templates;

    static std::map<std::string, std::string> builtInTemplates();
};

} // namespace stepcoach

#endif // STEPCOACH_PROMPT_LIBRARY_H
