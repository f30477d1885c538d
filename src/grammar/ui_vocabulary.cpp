#include "ui_vocabulary.h"
#include "../common/string_utils.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace stepcoach {

namespace {

std::string normalizeAlias(const std::string& text) {
    std::string lowered = utils::StringUtils::toLowerCase(utils::StringUtils::trim(text));
    std::replace(lowered.begin(), lowered.end(), '_', ' ');
    std::replace(lowered.begin(), lowered.end(), '-', ' ');
    return lowered;
}

bool isAsciiWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isAsciiOnly(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
}

// Find alias in text; ASCII aliases must sit on word boundaries
bool containsAlias(const std::string& text, const std::string& alias) {
    if (!isAsciiOnly(alias)) {
        return text.find(alias) != std::string::npos;
    }
    size_t pos = text.find(alias);
    while (pos != std::string::npos) {
        bool leftOk = pos == 0 || !isAsciiWordChar(text[pos - 1]);
        size_t end = pos + alias.size();
        bool rightOk = end >= text.size() || !isAsciiWordChar(text[end]);
        if (leftOk && rightOk) {
            return true;
        }
        pos = text.find(alias, pos + 1);
    }
    return false;
}

} // anonymous namespace

const std::vector<SystemElementInfo>& systemElementCatalog() {
    static const std::vector<SystemElementInfo> catalog = {
        {SystemElement::CLOSE_BUTTON, "close_button", "Close button", "top-right corner of the window",
            {"close button", "close", "x button", "关闭按钮", "关闭"}},
        {SystemElement::MINIMIZE_BUTTON, "minimize_button", "Minimize button", "top-right corner, left of maximize",
            {"minimize button", "minimise button", "minimize", "最小化按钮", "最小化"}},
        {SystemElement::MAXIMIZE_BUTTON, "maximize_button", "Maximize button", "top-right corner, between minimize and close",
            {"maximize button", "maximise button", "maximize", "最大化按钮", "最大化"}},
        {SystemElement::RESTORE_BUTTON, "restore_button", "Restore button", "top-right corner of a maximized window",
            {"restore button", "restore down", "还原按钮", "向下还原"}},
        {SystemElement::START_BUTTON, "start_button", "Start button", "left end of the taskbar",
            {"start button", "start menu", "windows button", "开始按钮", "开始菜单"}},
        {SystemElement::TASKBAR, "taskbar", "Taskbar", "bottom edge of the screen",
            {"taskbar", "task bar", "任务栏"}},
        {SystemElement::SYSTEM_TRAY, "system_tray", "System tray", "right end of the taskbar",
            {"system tray", "notification area", "tray icon", "系统托盘", "通知区域", "托盘"}},
        {SystemElement::SEARCH_BOX, "search_box", "Search box", "top of the page or next to the start button",
            {"search box", "search bar", "search field", "搜索框", "搜索栏"}},
        {SystemElement::DESKTOP, "desktop", "Desktop", "behind all windows",
            {"desktop", "桌面"}},
        {SystemElement::DESKTOP_ICON, "desktop_icon", "Desktop icon", "on the desktop",
            {"desktop icon", "desktop shortcut", "桌面图标", "桌面快捷方式"}},
        {SystemElement::SCROLL_BAR, "scroll_bar", "Scroll bar", "right edge of the scrollable area",
            {"scroll bar", "scrollbar", "滚动条"}},
        {SystemElement::MENU_BAR, "menu_bar", "Menu bar", "below the title bar",
            {"menu bar", "menubar", "菜单栏"}},
        {SystemElement::TITLE_BAR, "title_bar", "Title bar", "top edge of the window",
            {"title bar", "titlebar", "标题栏"}},
        {SystemElement::STATUS_BAR, "status_bar", "Status bar", "bottom edge of the window",
            {"status bar", "statusbar", "状态栏"}},
        {SystemElement::OK_BUTTON, "ok_button", "OK button", "bottom-right of the dialog",
            {"ok button", "ok", "确定按钮", "确定", "确认"}},
        {SystemElement::CANCEL_BUTTON, "cancel_button", "Cancel button", "bottom-right of the dialog",
            {"cancel button", "cancel", "取消按钮", "取消"}},
        {SystemElement::YES_BUTTON, "yes_button", "Yes button", "bottom of the dialog",
            {"yes button", "yes", "是按钮"}},
        {SystemElement::NO_BUTTON, "no_button", "No button", "bottom of the dialog",
            {"no button", "否按钮"}},
        {SystemElement::APPLY_BUTTON, "apply_button", "Apply button", "bottom-right of the dialog",
            {"apply button", "apply", "应用按钮"}},
        {SystemElement::TEXT_INPUT, "text_input", "Text input", "inside the form",
            {"text input", "text box", "textbox", "input box", "input field", "输入框", "文本框"}},
        {SystemElement::PASSWORD_INPUT, "password_input", "Password input", "inside the login form",
            {"password input", "password field", "password box", "密码框", "密码输入框"}},
        {SystemElement::DROPDOWN, "dropdown", "Dropdown", "inside the form",
            {"dropdown", "drop down", "drop down list", "combo box", "下拉框", "下拉菜单", "下拉列表"}},
        {SystemElement::CHECKBOX, "checkbox", "Checkbox", "inside the form",
            {"checkbox", "check box", "复选框", "勾选框"}},
        {SystemElement::RADIO_BUTTON, "radio_button", "Radio button", "inside the form",
            {"radio button", "option button", "单选按钮", "单选框"}},
        {SystemElement::BACK_BUTTON, "back_button", "Back button", "top-left of the browser toolbar",
            {"back button", "go back", "后退按钮", "返回按钮", "后退"}},
        {SystemElement::FORWARD_BUTTON, "forward_button", "Forward button", "top-left of the browser toolbar",
            {"forward button", "go forward", "前进按钮", "前进"}},
        {SystemElement::REFRESH_BUTTON, "refresh_button", "Refresh button", "browser toolbar, next to forward",
            {"refresh button", "reload button", "refresh", "reload", "刷新按钮", "刷新"}},
        {SystemElement::HOME_BUTTON, "home_button", "Home button", "browser toolbar",
            {"home button", "homepage button", "主页按钮", "首页按钮"}}
    };
    return catalog;
}

const SystemElementInfo& systemElementInfo(SystemElement element) {
    const auto& catalog = systemElementCatalog();
    for (const auto& info : catalog) {
        if (info.element == element) {
            return info;
        }
    }
    // Every enumerator has a catalog row
    return catalog.front();
}

std::optional<SystemElement> matchSystemElement(const std::string& text) {
    std::string normalized = normalizeAlias(text);
    if (normalized.empty()) {
        return std::nullopt;
    }

    const auto& catalog = systemElementCatalog();
    for (const auto& info : catalog) {
        for (const auto& alias : info.aliases) {
            if (normalized == alias) {
                return info.element;
            }
        }
    }

    std::optional<SystemElement> best;
    size_t bestLength = 0;
    for (const auto& info : catalog) {
        for (const auto& alias : info.aliases) {
            if (alias.size() > bestLength && containsAlias(normalized, alias)) {
                best = info.element;
                bestLength = alias.size();
            }
        }
    }
    return best;
}

TargetDescriptor::TargetDescriptor(const std::string& targetText)
    : text(utils::StringUtils::trim(targetText))
    , element(matchSystemElement(targetText)) {}

std::string TargetDescriptor::describe() const {
    if (!text.empty()) {
        return text;
    }
    if (element) {
        return systemElementInfo(*element).displayName;
    }
    return "";
}

std::string normalizeKeyName(const std::string& key) {
    static const std::map<std::string, std::string> keyNames = {
        {"enter", "Enter"}, {"return", "Enter"}, {"回车", "Enter"}, {"回车键", "Enter"},
        {"esc", "Escape"}, {"escape", "Escape"}, {"退出键", "Escape"},
        {"tab", "Tab"}, {"制表键", "Tab"},
        {"space", "Space"}, {"spacebar", "Space"}, {"空格", "Space"}, {"空格键", "Space"},
        {"backspace", "Backspace"}, {"退格", "Backspace"}, {"退格键", "Backspace"},
        {"delete", "Delete"}, {"del", "Delete"}, {"删除键", "Delete"},
        {"ctrl", "Ctrl"}, {"control", "Ctrl"},
        {"alt", "Alt"}, {"option", "Alt"},
        {"shift", "Shift"},
        {"win", "Win"}, {"windows", "Win"}, {"super", "Win"}, {"meta", "Win"}, {"cmd", "Win"},
        {"up", "Up"}, {"down", "Down"}, {"left", "Left"}, {"right", "Right"},
        {"上", "Up"}, {"下", "Down"}, {"左", "Left"}, {"右", "Right"},
        {"home", "Home"}, {"end", "End"},
        {"pageup", "PageUp"}, {"page up", "PageUp"}, {"pgup", "PageUp"},
        {"pagedown", "PageDown"}, {"page down", "PageDown"}, {"pgdn", "PageDown"}
    };

    std::string trimmed = utils::StringUtils::trim(key);
    std::string lowered = utils::StringUtils::toLowerCase(trimmed);
    auto it = keyNames.find(lowered);
    if (it != keyNames.end()) {
        return it->second;
    }

    // Function keys: f1..f12
    if (lowered.size() >= 2 && lowered.size() <= 3 && lowered[0] == 'f' &&
        std::all_of(lowered.begin() + 1, lowered.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return "F" + lowered.substr(1);
    }

    if (trimmed.size() == 1 && std::isalpha(static_cast<unsigned char>(trimmed[0]))) {
        return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(trimmed[0]))));
    }
    return trimmed;
}

std::vector<std::string> parseKeyCombination(const std::string& combination) {
    std::vector<std::string> keys;
    for (const auto& part : utils::StringUtils::split(combination, "+")) {
        std::string key = normalizeKeyName(part);
        if (!key.empty()) {
            keys.push_back(key);
        }
    }
    return keys;
}

} // namespace stepcoach
