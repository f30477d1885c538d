#ifndef STEPCOACH_UI_VOCABULARY_H
#define STEPCOACH_UI_VOCABULARY_H

#include <string>
#include <vector>
#include <optional>

namespace stepcoach {

/**
 * @brief Closed catalog of operating-system chrome a step may point at
 */
enum class SystemElement {
    CLOSE_BUTTON,
    MINIMIZE_BUTTON,
    MAXIMIZE_BUTTON,
    RESTORE_BUTTON,
    START_BUTTON,
    TASKBAR,
    SYSTEM_TRAY,
    SEARCH_BOX,
    DESKTOP,
    DESKTOP_ICON,
    SCROLL_BAR,
    MENU_BAR,
    TITLE_BAR,
    STATUS_BAR,
    OK_BUTTON,
    CANCEL_BUTTON,
    YES_BUTTON,
    NO_BUTTON,
    APPLY_BUTTON,
    TEXT_INPUT,
    PASSWORD_INPUT,
    DROPDOWN,
    CHECKBOX,
    RADIO_BUTTON,
    BACK_BUTTON,
    FORWARD_BUTTON,
    REFRESH_BUTTON,
    HOME_BUTTON
};

struct SystemElementInfo {
    SystemElement element;
    std::string id;
    std::string displayName;
    std::string locationHint;
    std::vector<std::string> aliases;
};

const std::vector<SystemElementInfo>& systemElementCatalog();
const SystemElementInfo& systemElementInfo(SystemElement element);

/**
 * @brief Recognise a catalog element in free target text
 *
 * Exact alias match first, then the longest alias contained in the text.
 * ASCII aliases only match on word boundaries, so "OK" does not match "book".
 */
std::optional<SystemElement> matchSystemElement(const std::string& text);

/**
 * @brief A step target: free text plus the catalog element it names, if any
 */
struct TargetDescriptor {
    std::string text;
    std::optional<SystemElement> element;

    TargetDescriptor() = default;
    explicit TargetDescriptor(const std::string& targetText);

    bool empty() const { return text.empty() && !element; }
    std::string describe() const;
};

/**
 * @brief Canonical key name ("回车" and "return" become "Enter")
 *
 * Unknown names are returned trimmed, with a single ASCII letter upper-cased.
 */
std::string normalizeKeyName(const std::string& key);

/**
 * @brief Split "ctrl + c" or "Ctrl+Shift+Esc" into normalized key names
 */
std::vector<std::string> parseKeyCombination(const std::string& combination);

} // namespace stepcoach

#endif // STEPCOACH_UI_VOCABULARY_H
