#ifndef STEPCOACH_ACTION_GRAMMAR_H
#define STEPCOACH_ACTION_GRAMMAR_H

#include "ui_vocabulary.h"
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace stepcoach {

// The closed set of atomic operations a step may ask for
enum class SkillKind {
    CLICK,
    DOUBLE_CLICK,
    RIGHT_CLICK,
    DRAG,
    SCROLL_UP,
    SCROLL_DOWN,
    TYPE_TEXT,
    PRESS_KEY,
    KEY_COMBINATION,
    WAIT,
    WAIT_FOR_ELEMENT,
    DONE
};

enum class ScrollDirection {
    UP,
    DOWN
};

// Per-kind payloads
struct PointerAction {
    TargetDescriptor target;
};

struct DragAction {
    TargetDescriptor source;
    TargetDescriptor destination;
};

struct ScrollAction {
    ScrollDirection direction;
    TargetDescriptor area;
};

struct TypeTextAction {
    std::string text;
    TargetDescriptor field;
};

struct PressKeyAction {
    std::string key;
};

struct KeyCombinationAction {
    std::vector<std::string> keys;
};

struct WaitAction {
    double seconds;
};

struct WaitForElementAction {
    TargetDescriptor element;
    double timeoutSeconds;
};

struct DoneAction {};

/**
 * @brief One atomic operation: a kind plus the parameters that kind uses
 *
 * Instances are built through the named constructors, which keep the kind
 * and the payload alternative consistent.
 */
class Skill {
public:
    using Payload = std::variant<PointerAction, DragAction, ScrollAction, TypeTextAction,
                                 PressKeyAction, KeyCombinationAction, WaitAction,
                                 WaitForElementAction, DoneAction>;

    static Skill click(const TargetDescriptor& target);
    static Skill doubleClick(const TargetDescriptor& target);
    static Skill rightClick(const TargetDescriptor& target);
    static Skill drag(const TargetDescriptor& source, const TargetDescriptor& destination);
    static Skill scroll(ScrollDirection direction, const TargetDescriptor& area = TargetDescriptor());
    static Skill typeText(const std::string& text, const TargetDescriptor& field = TargetDescriptor());
    static Skill pressKey(const std::string& key);
    static Skill keyCombination(const std::vector<std::string>& keys);
    static Skill wait(double seconds);
    static Skill waitForElement(const TargetDescriptor& element, double timeoutSeconds);
    static Skill done();

    SkillKind kind() const { return m_kind; }
    const Payload& payload() const { return m_payload; }

    template<typename T>
    const T& as() const { return std::get<T>(m_payload); }

    bool isDone() const { return m_kind == SkillKind::DONE; }

    /**
     * @brief The target text of pointer, drag, scroll, type and wait-for-element skills
     */
    std::string targetText() const;

    /**
     * @brief Short imperative rendering, e.g. "Double-click \"Recycle Bin\""
     */
    std::string describe() const;

    nlohmann::json toJson() const;

private:
    Skill(SkillKind kind, Payload payload);

    SkillKind m_kind;
    Payload m_payload;
};

std::string skillKindToString(SkillKind kind);

/**
 * @brief Chinese canonical label of a kind ("单击", "双击", ...)
 */
std::string skillKindLabel(SkillKind kind);

const std::vector<SkillKind>& allSkillKinds();

/**
 * @brief Outcome of checking one planner-produced kind string
 */
struct SkillValidation {
    enum class Status {
        CANONICAL,
        REPAIRED,
        REJECTED
    };

    Status status;
    SkillKind kind;          // meaningful unless REJECTED
    std::string input;

    bool accepted() const { return status != Status::REJECTED; }
};

std::string validationStatusToString(SkillValidation::Status status);

/**
 * @brief Accepts canonical kind names, repairs near misses, rejects the rest
 */
class ActionGrammar {
public:
    static SkillValidation validate(const std::string& kindString);

    /**
     * @brief Canonical-name lookup only (English identifier or Chinese label)
     */
    static std::optional<SkillKind> parseCanonical(const std::string& kindString);

    /**
     * @brief Build a skill of the given kind from a planner step object
     *
     * Reads target, text, key, hotkey, wait_seconds and destination. Missing
     * parameters fall back to the target text where that makes sense.
     */
    static Skill buildSkill(SkillKind kind, const nlohmann::json& step);

    /**
     * @brief Lowercase, trim, and fold '-' and ' ' to '_'
     */
    static std::string normalizeKindString(const std::string& kindString);
};

} // namespace stepcoach

#endif // STEPCOACH_ACTION_GRAMMAR_H
