#ifndef STEPCOACH_SAFETY_ADVISOR_H
#define STEPCOACH_SAFETY_ADVISOR_H

#include "../planner/plan.h"
#include <string>
#include <vector>
#include <optional>

namespace stepcoach {

/**
 * @brief Flags steps that touch payments, passwords, deletion and the like
 *
 * Advisory only: a flagged step is still announced and executed.
 */
class SafetyAdvisor {
public:
    SafetyAdvisor(const std::vector<std::string>& sensitiveOperations, bool enabled);

    /**
     * @brief Caution text for the step, or nothing when it looks harmless
     */
    std::optional<std::string> review(const Step& step) const;

    static const std::vector<std::string>& defaultSensitiveOperations();

private:
    std::vector<std::string> m_keywords;
    bool m_enabled;
};

} // namespace stepcoach

#endif // STEPCOACH_SAFETY_ADVISOR_H
