#ifndef STEPCOACH_PLAN_PARSER_H
#define STEPCOACH_PLAN_PARSER_H

#include "plan.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace stepcoach {

struct PlanParseReport {
    bool foundJson = false;
    bool usedLineFallback = false;
    int canonicalSteps = 0;
    int repairedSteps = 0;
    std::vector<std::string> rejected;   // "step 3: teleport"

    nlohmann::json toJson() const;
};

/**
 * @brief Turns free oracle output into a densely numbered Plan
 *
 * A JSON object with a "steps" array is parsed step by step through the
 * ActionGrammar; steps whose kind cannot be validated or repaired are dropped.
 * If no JSON object can be found at all, every non-blank line becomes a click
 * step whose target is the line text.
 */
class PlanParser {
public:
    static Plan parse(const std::string& content, const Intent& intent, PlanParseReport& report);
    static Plan parse(const std::string& content, const Intent& intent);

    static Plan parseSteps(const nlohmann::json& document, const Intent& intent, PlanParseReport& report);
    static Plan parseLines(const std::string& content, const Intent& intent);

private:
    static std::string cleanListLine(const std::string& line);
};

} // namespace stepcoach

#endif // STEPCOACH_PLAN_PARSER_H
