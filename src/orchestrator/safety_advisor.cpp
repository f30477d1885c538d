#include "safety_advisor.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"

namespace stepcoach {

SafetyAdvisor::SafetyAdvisor(const std::vector<std::string>& sensitiveOperations, bool enabled)
    : m_keywords(sensitiveOperations.empty() ? defaultSensitiveOperations() : sensitiveOperations)
    , m_enabled(enabled) {}

const std::vector<std::string>& SafetyAdvisor::defaultSensitiveOperations() {
    static const std::vector<std::string> keywords = {
        "payment", "transfer", "password", "delete", "uninstall", "purchase",
        "支付", "付款", "转账", "密码", "删除", "卸载", "购买"
    };
    return keywords;
}

std::optional<std::string> SafetyAdvisor::review(const Step& step) const {
    if (!m_enabled) {
        return std::nullopt;
    }

    std::string haystack = utils::StringUtils::toLowerCase(
        step.instruction + " " + step.skill.describe() + " " + step.expectedResult);

    for (const auto& keyword : m_keywords) {
        if (keyword.empty() || !utils::StringUtils::contains(haystack, utils::StringUtils::toLowerCase(keyword))) {
            continue;
        }
        SLOG_INFO().message("Sensitive step flagged")
            .context("step_number", step.number)
            .context("keyword", keyword);
        return "Careful: step " + std::to_string(step.number) + " involves \"" + keyword +
               "\". Check the details on screen before you go ahead.";
    }
    return std::nullopt;
}

} // namespace stepcoach
