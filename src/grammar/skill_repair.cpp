#include "skill_repair.h"
#include <algorithm>

namespace stepcoach {

const std::vector<SkillSynonym>& skillSynonymTable() {
    static const std::vector<SkillSynonym> table = {
        // Single click
        {"点击", SkillKind::CLICK},
        {"左键点击", SkillKind::CLICK},
        {"左键单击", SkillKind::CLICK},
        {"鼠标点击", SkillKind::CLICK},
        {"left_click", SkillKind::CLICK},
        {"single_click", SkillKind::CLICK},
        {"point_and_click", SkillKind::CLICK},
        {"point_click", SkillKind::CLICK},
        {"mouse_click", SkillKind::CLICK},
        {"tap", SkillKind::CLICK},
        {"select", SkillKind::CLICK},

        {"双击打开", SkillKind::DOUBLE_CLICK},
        {"doubleclick", SkillKind::DOUBLE_CLICK},
        {"dbl_click", SkillKind::DOUBLE_CLICK},
        {"dblclick", SkillKind::DOUBLE_CLICK},
        {"double_tap", SkillKind::DOUBLE_CLICK},

        {"右键点击", SkillKind::RIGHT_CLICK},
        {"右击", SkillKind::RIGHT_CLICK},
        {"右键", SkillKind::RIGHT_CLICK},
        {"rightclick", SkillKind::RIGHT_CLICK},
        {"context_click", SkillKind::RIGHT_CLICK},
        {"context_menu", SkillKind::RIGHT_CLICK},

        {"拖拽", SkillKind::DRAG},
        {"拖到", SkillKind::DRAG},
        {"drag_and_drop", SkillKind::DRAG},
        {"drag_to", SkillKind::DRAG},
        {"drag_drop", SkillKind::DRAG},

        {"向上滑动", SkillKind::SCROLL_UP},
        {"上滑", SkillKind::SCROLL_UP},
        {"swipe_up", SkillKind::SCROLL_UP},
        {"向下滑动", SkillKind::SCROLL_DOWN},
        {"下滑", SkillKind::SCROLL_DOWN},
        {"滚动", SkillKind::SCROLL_DOWN},
        {"swipe_down", SkillKind::SCROLL_DOWN},
        {"scroll", SkillKind::SCROLL_DOWN},

        {"键入", SkillKind::TYPE_TEXT},
        {"打字", SkillKind::TYPE_TEXT},
        {"type", SkillKind::TYPE_TEXT},
        {"enter_text", SkillKind::TYPE_TEXT},
        {"input_text", SkillKind::TYPE_TEXT},
        {"input", SkillKind::TYPE_TEXT},
        {"write", SkillKind::TYPE_TEXT},

        {"按键", SkillKind::PRESS_KEY},
        {"press", SkillKind::PRESS_KEY},
        {"key_press", SkillKind::PRESS_KEY},
        {"keypress", SkillKind::PRESS_KEY},

        {"快捷键", SkillKind::KEY_COMBINATION},
        {"hotkey", SkillKind::KEY_COMBINATION},
        {"shortcut", SkillKind::KEY_COMBINATION},
        {"key_combo", SkillKind::KEY_COMBINATION},
        {"keyboard_shortcut", SkillKind::KEY_COMBINATION},

        {"等一下", SkillKind::WAIT},
        {"sleep", SkillKind::WAIT},
        {"pause", SkillKind::WAIT},
        {"delay", SkillKind::WAIT},

        {"等待元素", SkillKind::WAIT_FOR_ELEMENT},
        {"wait_for", SkillKind::WAIT_FOR_ELEMENT},
        {"wait_until", SkillKind::WAIT_FOR_ELEMENT},
        {"wait_element", SkillKind::WAIT_FOR_ELEMENT},

        {"结束", SkillKind::DONE},
        {"任务完成", SkillKind::DONE},
        {"finish", SkillKind::DONE},
        {"finished", SkillKind::DONE},
        {"complete", SkillKind::DONE},
        {"completed", SkillKind::DONE}
    };
    return table;
}

namespace {

// Canonical names, labels and synonyms ordered longest first
const std::vector<SkillSynonym>& substringCandidates() {
    static const std::vector<SkillSynonym> candidates = [] {
        std::vector<SkillSynonym> all;
        for (SkillKind kind : allSkillKinds()) {
            all.push_back({skillKindToString(kind), kind});
            all.push_back({skillKindLabel(kind), kind});
        }
        const auto& synonyms = skillSynonymTable();
        all.insert(all.end(), synonyms.begin(), synonyms.end());
        std::stable_sort(all.begin(), all.end(), [](const SkillSynonym& a, const SkillSynonym& b) {
            return a.name.size() > b.name.size();
        });
        return all;
    }();
    return candidates;
}

} // anonymous namespace

std::optional<SkillKind> repairSkillKind(const std::string& kindString) {
    std::string normalized = ActionGrammar::normalizeKindString(kindString);
    if (normalized.empty()) {
        return std::nullopt;
    }

    for (const auto& synonym : skillSynonymTable()) {
        if (synonym.name == normalized) {
            return synonym.kind;
        }
    }

    for (const auto& candidate : substringCandidates()) {
        if (normalized.find(candidate.name) != std::string::npos) {
            return candidate.kind;
        }
    }
    return std::nullopt;
}

} // namespace stepcoach
