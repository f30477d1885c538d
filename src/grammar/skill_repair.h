#ifndef STEPCOACH_SKILL_REPAIR_H
#define STEPCOACH_SKILL_REPAIR_H

#include "action_grammar.h"
#include <string>
#include <vector>
#include <optional>

namespace stepcoach {

struct SkillSynonym {
    std::string name;   // normalized form
    SkillKind kind;
};

/**
 * @brief Known non-canonical spellings planners produce for each kind
 */
const std::vector<SkillSynonym>& skillSynonymTable();

/**
 * @brief Map a non-canonical kind string onto a canonical kind
 *
 * Exact synonym match on the normalized string first. Otherwise the longest
 * canonical name or synonym contained in the string wins, so "double click
 * icon" repairs to DOUBLE_CLICK rather than CLICK.
 */
std::optional<SkillKind> repairSkillKind(const std::string& kindString);

} // namespace stepcoach

#endif // STEPCOACH_SKILL_REPAIR_H
