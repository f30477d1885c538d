#include "action_grammar.h"
#include "skill_repair.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include <algorithm>
#include <sstream>

namespace stepcoach {

namespace {

std::string quoted(const std::string& text) {
    return "\"" + text + "\"";
}

std::string formatSeconds(double seconds) {
    std::ostringstream oss;
    oss << seconds;
    return oss.str() + (seconds == 1.0 ? " second" : " seconds");
}

nlohmann::json targetToJson(const TargetDescriptor& target) {
    nlohmann::json json = {{"text", target.text}};
    if (target.element) {
        json["system_element"] = systemElementInfo(*target.element).id;
    }
    return json;
}

std::vector<std::string> readHotkey(const nlohmann::json& step) {
    std::vector<std::string> keys;
    if (step.contains("hotkey") && step["hotkey"].is_array()) {
        for (const auto& item : step["hotkey"]) {
            if (item.is_string()) {
                std::string key = normalizeKeyName(item.get<std::string>());
                if (!key.empty()) {
                    keys.push_back(key);
                }
            }
        }
        return keys;
    }
    return parseKeyCombination(utils::JsonUtils::getStringField(step, "hotkey"));
}

} // anonymous namespace

Skill::Skill(SkillKind kind, Payload payload)
    : m_kind(kind)
    , m_payload(std::move(payload)) {}

Skill Skill::click(const TargetDescriptor& target) {
    return Skill(SkillKind::CLICK, PointerAction{target});
}

Skill Skill::doubleClick(const TargetDescriptor& target) {
    return Skill(SkillKind::DOUBLE_CLICK, PointerAction{target});
}

Skill Skill::rightClick(const TargetDescriptor& target) {
    return Skill(SkillKind::RIGHT_CLICK, PointerAction{target});
}

Skill Skill::drag(const TargetDescriptor& source, const TargetDescriptor& destination) {
    return Skill(SkillKind::DRAG, DragAction{source, destination});
}

Skill Skill::scroll(ScrollDirection direction, const TargetDescriptor& area) {
    SkillKind kind = direction == ScrollDirection::UP ? SkillKind::SCROLL_UP : SkillKind::SCROLL_DOWN;
    return Skill(kind, ScrollAction{direction, area});
}

Skill Skill::typeText(const std::string& text, const TargetDescriptor& field) {
    return Skill(SkillKind::TYPE_TEXT, TypeTextAction{text, field});
}

Skill Skill::pressKey(const std::string& key) {
    return Skill(SkillKind::PRESS_KEY, PressKeyAction{normalizeKeyName(key)});
}

Skill Skill::keyCombination(const std::vector<std::string>& keys) {
    return Skill(SkillKind::KEY_COMBINATION, KeyCombinationAction{keys});
}

Skill Skill::wait(double seconds) {
    return Skill(SkillKind::WAIT, WaitAction{seconds});
}

Skill Skill::waitForElement(const TargetDescriptor& element, double timeoutSeconds) {
    return Skill(SkillKind::WAIT_FOR_ELEMENT, WaitForElementAction{element, timeoutSeconds});
}

Skill Skill::done() {
    return Skill(SkillKind::DONE, DoneAction{});
}

std::string Skill::targetText() const {
    switch (m_kind) {
        case SkillKind::CLICK:
        case SkillKind::DOUBLE_CLICK:
        case SkillKind::RIGHT_CLICK:
            return as<PointerAction>().target.describe();
        case SkillKind::DRAG:
            return as<DragAction>().source.describe();
        case SkillKind::SCROLL_UP:
        case SkillKind::SCROLL_DOWN:
            return as<ScrollAction>().area.describe();
        case SkillKind::TYPE_TEXT:
            return as<TypeTextAction>().field.describe();
        case SkillKind::WAIT_FOR_ELEMENT:
            return as<WaitForElementAction>().element.describe();
        case SkillKind::PRESS_KEY:
        case SkillKind::KEY_COMBINATION:
        case SkillKind::WAIT:
        case SkillKind::DONE:
            return "";
    }
    return "";
}

std::string Skill::describe() const {
    switch (m_kind) {
        case SkillKind::CLICK:
            return "Click " + quoted(as<PointerAction>().target.describe());
        case SkillKind::DOUBLE_CLICK:
            return "Double-click " + quoted(as<PointerAction>().target.describe());
        case SkillKind::RIGHT_CLICK:
            return "Right-click " + quoted(as<PointerAction>().target.describe());
        case SkillKind::DRAG: {
            const auto& drag = as<DragAction>();
            return "Drag " + quoted(drag.source.describe()) + " to " + quoted(drag.destination.describe());
        }
        case SkillKind::SCROLL_UP:
        case SkillKind::SCROLL_DOWN: {
            const auto& scroll = as<ScrollAction>();
            std::string text = scroll.direction == ScrollDirection::UP ? "Scroll up" : "Scroll down";
            if (!scroll.area.empty()) {
                text += " in " + quoted(scroll.area.describe());
            }
            return text;
        }
        case SkillKind::TYPE_TEXT: {
            const auto& type = as<TypeTextAction>();
            std::string text = "Type " + quoted(type.text);
            if (!type.field.empty()) {
                text += " into " + quoted(type.field.describe());
            }
            return text;
        }
        case SkillKind::PRESS_KEY:
            return "Press " + as<PressKeyAction>().key;
        case SkillKind::KEY_COMBINATION:
            return "Press " + utils::StringUtils::join(as<KeyCombinationAction>().keys, "+");
        case SkillKind::WAIT:
            return "Wait " + formatSeconds(as<WaitAction>().seconds);
        case SkillKind::WAIT_FOR_ELEMENT:
            return "Wait for " + quoted(as<WaitForElementAction>().element.describe()) + " to appear";
        case SkillKind::DONE:
            return "Task complete";
    }
    return "";
}

nlohmann::json Skill::toJson() const {
    nlohmann::json json = {{"skill_type", skillKindToString(m_kind)}};
    switch (m_kind) {
        case SkillKind::CLICK:
        case SkillKind::DOUBLE_CLICK:
        case SkillKind::RIGHT_CLICK:
            json["target"] = targetToJson(as<PointerAction>().target);
            break;
        case SkillKind::DRAG:
            json["target"] = targetToJson(as<DragAction>().source);
            json["destination"] = targetToJson(as<DragAction>().destination);
            break;
        case SkillKind::SCROLL_UP:
        case SkillKind::SCROLL_DOWN:
            json["target"] = targetToJson(as<ScrollAction>().area);
            break;
        case SkillKind::TYPE_TEXT:
            json["text"] = as<TypeTextAction>().text;
            json["target"] = targetToJson(as<TypeTextAction>().field);
            break;
        case SkillKind::PRESS_KEY:
            json["key"] = as<PressKeyAction>().key;
            break;
        case SkillKind::KEY_COMBINATION:
            json["hotkey"] = as<KeyCombinationAction>().keys;
            break;
        case SkillKind::WAIT:
            json["wait_seconds"] = as<WaitAction>().seconds;
            break;
        case SkillKind::WAIT_FOR_ELEMENT:
            json["target"] = targetToJson(as<WaitForElementAction>().element);
            json["wait_seconds"] = as<WaitForElementAction>().timeoutSeconds;
            break;
        case SkillKind::DONE:
            break;
    }
    return json;
}

std::string skillKindToString(SkillKind kind) {
    switch (kind) {
        case SkillKind::CLICK: return "click";
        case SkillKind::DOUBLE_CLICK: return "double_click";
        case SkillKind::RIGHT_CLICK: return "right_click";
        case SkillKind::DRAG: return "drag";
        case SkillKind::SCROLL_UP: return "scroll_up";
        case SkillKind::SCROLL_DOWN: return "scroll_down";
        case SkillKind::TYPE_TEXT: return "type_text";
        case SkillKind::PRESS_KEY: return "press_key";
        case SkillKind::KEY_COMBINATION: return "key_combination";
        case SkillKind::WAIT: return "wait";
        case SkillKind::WAIT_FOR_ELEMENT: return "wait_for_element";
        case SkillKind::DONE: return "done";
    }
    return "unknown";
}

std::string skillKindLabel(SkillKind kind) {
    switch (kind) {
        case SkillKind::CLICK: return "单击";
        case SkillKind::DOUBLE_CLICK: return "双击";
        case SkillKind::RIGHT_CLICK: return "右键单击";
        case SkillKind::DRAG: return "拖动";
        case SkillKind::SCROLL_UP: return "向上滚动";
        case SkillKind::SCROLL_DOWN: return "向下滚动";
        case SkillKind::TYPE_TEXT: return "输入";
        case SkillKind::PRESS_KEY: return "按下";
        case SkillKind::KEY_COMBINATION: return "组合键";
        case SkillKind::WAIT: return "等待";
        case SkillKind::WAIT_FOR_ELEMENT: return "等待出现";
        case SkillKind::DONE: return "完成";
    }
    return "";
}

const std::vector<SkillKind>& allSkillKinds() {
    static const std::vector<SkillKind> kinds = {
        SkillKind::CLICK, SkillKind::DOUBLE_CLICK, SkillKind::RIGHT_CLICK, SkillKind::DRAG,
        SkillKind::SCROLL_UP, SkillKind::SCROLL_DOWN, SkillKind::TYPE_TEXT, SkillKind::PRESS_KEY,
        SkillKind::KEY_COMBINATION, SkillKind::WAIT, SkillKind::WAIT_FOR_ELEMENT, SkillKind::DONE
    };
    return kinds;
}

std::string validationStatusToString(SkillValidation::Status status) {
    switch (status) {
        case SkillValidation::Status::CANONICAL: return "CANONICAL";
        case SkillValidation::Status::REPAIRED: return "REPAIRED";
        case SkillValidation::Status::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

std::string ActionGrammar::normalizeKindString(const std::string& kindString) {
    std::string normalized = utils::StringUtils::toLowerCase(utils::StringUtils::trim(kindString));
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    std::replace(normalized.begin(), normalized.end(), ' ', '_');
    return normalized;
}

std::optional<SkillKind> ActionGrammar::parseCanonical(const std::string& kindString) {
    std::string normalized = normalizeKindString(kindString);
    for (SkillKind kind : allSkillKinds()) {
        if (normalized == skillKindToString(kind) || normalized == skillKindLabel(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

SkillValidation ActionGrammar::validate(const std::string& kindString) {
    SkillValidation result;
    result.input = kindString;
    result.kind = SkillKind::CLICK;

    if (auto canonical = parseCanonical(kindString)) {
        result.status = SkillValidation::Status::CANONICAL;
        result.kind = *canonical;
        return result;
    }
    if (auto repaired = repairSkillKind(kindString)) {
        result.status = SkillValidation::Status::REPAIRED;
        result.kind = *repaired;
        return result;
    }
    result.status = SkillValidation::Status::REJECTED;
    return result;
}

Skill ActionGrammar::buildSkill(SkillKind kind, const nlohmann::json& step) {
    using utils::JsonUtils;

    const std::string target = JsonUtils::getStringField(step, "target");
    const std::string text = JsonUtils::getStringField(step, "text");
    const std::string key = JsonUtils::getStringField(step, "key");
    const double waitSeconds = JsonUtils::getDoubleField(step, "wait_seconds", 0.0);

    switch (kind) {
        case SkillKind::CLICK:
            return Skill::click(TargetDescriptor(target));
        case SkillKind::DOUBLE_CLICK:
            return Skill::doubleClick(TargetDescriptor(target));
        case SkillKind::RIGHT_CLICK:
            return Skill::rightClick(TargetDescriptor(target));
        case SkillKind::DRAG: {
            std::string destination = JsonUtils::getStringField(step, "destination");
            if (destination.empty()) {
                destination = JsonUtils::getStringField(step, "drag_to", text);
            }
            return Skill::drag(TargetDescriptor(target), TargetDescriptor(destination));
        }
        case SkillKind::SCROLL_UP:
            return Skill::scroll(ScrollDirection::UP, TargetDescriptor(target));
        case SkillKind::SCROLL_DOWN:
            return Skill::scroll(ScrollDirection::DOWN, TargetDescriptor(target));
        case SkillKind::TYPE_TEXT:
            if (text.empty()) {
                return Skill::typeText(target);
            }
            return Skill::typeText(text, TargetDescriptor(target));
        case SkillKind::PRESS_KEY:
            return Skill::pressKey(key.empty() ? target : key);
        case SkillKind::KEY_COMBINATION: {
            std::vector<std::string> keys = readHotkey(step);
            if (keys.empty()) {
                keys = parseKeyCombination(key.empty() ? target : key);
            }
            return Skill::keyCombination(keys);
        }
        case SkillKind::WAIT:
            return Skill::wait(waitSeconds > 0.0 ? waitSeconds : 1.0);
        case SkillKind::WAIT_FOR_ELEMENT:
            return Skill::waitForElement(TargetDescriptor(target), waitSeconds > 0.0 ? waitSeconds : 10.0);
        case SkillKind::DONE:
            return Skill::done();
    }
    return Skill::done();
}

} // namespace stepcoach
