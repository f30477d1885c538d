#include <iostream>
#include <cassert>
#include <set>
#include "grammar/action_grammar.h"
#include "grammar/skill_repair.h"
#include "grammar/ui_vocabulary.h"
#include "common/structured_logger.h"

using namespace stepcoach;

void testCanonicalNamesAccepted() {
    std::cout << "[TEST] Canonical names and labels validate unchanged\n";

    assert(allSkillKinds().size() == 12);
    for (SkillKind kind : allSkillKinds()) {
        SkillValidation byName = ActionGrammar::validate(skillKindToString(kind));
        assert(byName.status == SkillValidation::Status::CANONICAL);
        assert(byName.kind == kind);

        SkillValidation byLabel = ActionGrammar::validate(skillKindLabel(kind));
        assert(byLabel.status == SkillValidation::Status::CANONICAL);
        assert(byLabel.kind == kind);
    }

    SkillValidation spaced = ActionGrammar::validate("  Double-Click ");
    assert(spaced.status == SkillValidation::Status::CANONICAL);
    assert(spaced.kind == SkillKind::DOUBLE_CLICK);

    std::cout << "[OK] Canonical names test passed\n\n";
}

void testSynonymsRepaired() {
    std::cout << "[TEST] Known synonyms collapse onto the grammar\n";

    struct Case { const char* input; SkillKind expected; };
    const Case cases[] = {
        {"point-and-click", SkillKind::CLICK},
        {"Point and Click", SkillKind::CLICK},
        {"tap", SkillKind::CLICK},
        {"点击", SkillKind::CLICK},
        {"drag and drop", SkillKind::DRAG},
        {"拖拽", SkillKind::DRAG},
        {"scroll", SkillKind::SCROLL_DOWN},
        {"swipe up", SkillKind::SCROLL_UP},
        {"type", SkillKind::TYPE_TEXT},
        {"hotkey", SkillKind::KEY_COMBINATION},
        {"sleep", SkillKind::WAIT},
        {"wait for", SkillKind::WAIT_FOR_ELEMENT},
        {"finish", SkillKind::DONE},
        {"右击", SkillKind::RIGHT_CLICK}
    };

    for (const auto& c : cases) {
        SkillValidation validation = ActionGrammar::validate(c.input);
        assert(validation.status == SkillValidation::Status::REPAIRED);
        assert(validation.kind == c.expected);
        assert(validation.accepted());
    }

    std::cout << "[OK] Synonym repair test passed\n\n";
}

void testSubstringRepairPrefersLongerNames() {
    std::cout << "[TEST] Substring repair picks the most specific match\n";

    assert(repairSkillKind("double click icon") == SkillKind::DOUBLE_CLICK);
    assert(repairSkillKind("right click the file") == SkillKind::RIGHT_CLICK);
    assert(repairSkillKind("click the button") == SkillKind::CLICK);
    assert(repairSkillKind("wait_for_the_dialog") == SkillKind::WAIT_FOR_ELEMENT);
    assert(repairSkillKind("please wait") == SkillKind::WAIT);
    assert(repairSkillKind("keyboard shortcut ctrl+s") == SkillKind::KEY_COMBINATION);
    assert(repairSkillKind("双击桌面图标") == SkillKind::DOUBLE_CLICK);

    std::cout << "[OK] Longest match test passed\n\n";
}

void testUnknownRejected() {
    std::cout << "[TEST] Operations outside the grammar are rejected\n";

    SkillValidation validation = ActionGrammar::validate("levitate");
    assert(validation.status == SkillValidation::Status::REJECTED);
    assert(!validation.accepted());
    assert(validation.input == "levitate");
    assert(!repairSkillKind("").has_value());
    assert(!ActionGrammar::parseCanonical("teleport").has_value());

    std::cout << "[OK] Rejection test passed\n\n";
}

void testBuildSkillFallbacks() {
    std::cout << "[TEST] Skill payloads are built with field fallbacks\n";

    Skill typed = ActionGrammar::buildSkill(SkillKind::TYPE_TEXT, {{"target", "hello world"}});
    assert(typed.as<TypeTextAction>().text == "hello world");
    assert(typed.as<TypeTextAction>().field.empty());

    Skill typedInto = ActionGrammar::buildSkill(SkillKind::TYPE_TEXT, {{"target", "Search box"}, {"text", "notes"}});
    assert(typedInto.as<TypeTextAction>().text == "notes");
    assert(typedInto.as<TypeTextAction>().field.element == SystemElement::SEARCH_BOX);

    Skill pressed = ActionGrammar::buildSkill(SkillKind::PRESS_KEY, {{"target", "回车"}});
    assert(pressed.as<PressKeyAction>().key == "Enter");

    Skill combo = ActionGrammar::buildSkill(SkillKind::KEY_COMBINATION, {{"hotkey", "ctrl+c"}});
    assert((combo.as<KeyCombinationAction>().keys == std::vector<std::string>{"Ctrl", "C"}));

    Skill comboArray = ActionGrammar::buildSkill(SkillKind::KEY_COMBINATION,
                                                 {{"hotkey", nlohmann::json::array({"alt", "f4"})}});
    assert((comboArray.as<KeyCombinationAction>().keys == std::vector<std::string>{"Alt", "F4"}));

    Skill waited = ActionGrammar::buildSkill(SkillKind::WAIT, nlohmann::json::object());
    assert(waited.as<WaitAction>().seconds == 1.0);

    Skill waitFor = ActionGrammar::buildSkill(SkillKind::WAIT_FOR_ELEMENT, {{"target", "OK button"}});
    assert(waitFor.as<WaitForElementAction>().timeoutSeconds == 10.0);

    Skill dragged = ActionGrammar::buildSkill(SkillKind::DRAG, {{"target", "report.pdf"}, {"drag_to", "Trash"}});
    assert(dragged.as<DragAction>().destination.text == "Trash");

    Skill scrolled = ActionGrammar::buildSkill(SkillKind::SCROLL_UP, {{"target", "page"}});
    assert(scrolled.kind() == SkillKind::SCROLL_UP);
    assert(scrolled.as<ScrollAction>().direction == ScrollDirection::UP);

    std::cout << "[OK] Build skill test passed\n\n";
}

void testDescribeAndJson() {
    std::cout << "[TEST] Skills render as instructions and JSON\n";

    Skill click = Skill::click(TargetDescriptor("Start button"));
    assert(click.describe() == "Click \"Start button\"");
    assert(click.targetText() == "Start button");

    nlohmann::json json = click.toJson();
    assert(json["skill_type"] == "click");
    assert(json["target"]["system_element"] == "start_button");

    assert(Skill::done().isDone());
    assert(Skill::done().describe() == "Task complete");
    assert(Skill::pressKey("esc").describe() == "Press Escape");
    assert(Skill::keyCombination({"Ctrl", "S"}).describe() == "Press Ctrl+S");
    assert(Skill::wait(2).describe() == "Wait 2 seconds");

    std::set<std::string> ids;
    for (SkillKind kind : allSkillKinds()) {
        ids.insert(skillKindToString(kind));
    }
    assert(ids.size() == 12);

    std::cout << "[OK] Describe test passed\n\n";
}

void testSystemElementMatching() {
    std::cout << "[TEST] Target text is matched to well-known screen elements\n";

    assert(matchSystemElement("close") == SystemElement::CLOSE_BUTTON);
    assert(matchSystemElement("the Start Menu") == SystemElement::START_BUTTON);
    assert(matchSystemElement("点击关闭按钮") == SystemElement::CLOSE_BUTTON);
    assert(!matchSystemElement("enclosed letter").has_value());
    assert(!matchSystemElement("").has_value());

    TargetDescriptor blank("   ");
    assert(blank.empty());
    assert(blank.describe().empty());

    assert(normalizeKeyName("RETURN") == "Enter");
    assert(normalizeKeyName("f11") == "F11");
    assert(normalizeKeyName("v") == "V");
    assert((parseKeyCombination("ctrl + shift + esc") == std::vector<std::string>{"Ctrl", "Shift", "Escape"}));

    std::cout << "[OK] System element test passed\n\n";
}

int main() {
    std::cout << "=== StepCoach Action Grammar Test Suite ===\n\n";
    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testCanonicalNamesAccepted();
        testSynonymsRepaired();
        testSubstringRepairPrefersLongerNames();
        testUnknownRejected();
        testBuildSkillFallbacks();
        testDescribeAndJson();
        testSystemElementMatching();

        StructuredLogger::getInstance().shutdown();
        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
