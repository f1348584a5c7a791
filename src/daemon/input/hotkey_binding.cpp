#include "daemon/input/hotkey_binding.h"

#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <linux/input.h>
#include <sstream>
#include <utility>
#include <vector>

namespace daemon_input {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

// Left/right variant of a modifier key, MOD_NONE for ordinary keys.
std::pair<unsigned int, bool> modifierOf(int code) {
    switch (code) {
    case KEY_LEFTCTRL:
        return {MOD_CTRL, true};
    case KEY_RIGHTCTRL:
        return {MOD_CTRL, false};
    case KEY_LEFTSHIFT:
        return {MOD_SHIFT, true};
    case KEY_RIGHTSHIFT:
        return {MOD_SHIFT, false};
    case KEY_LEFTALT:
        return {MOD_ALT, true};
    case KEY_RIGHTALT:
        return {MOD_ALT, false};
    case KEY_LEFTMETA:
        return {MOD_SUPER, true};
    case KEY_RIGHTMETA:
        return {MOD_SUPER, false};
    default:
        return {MOD_NONE, true};
    }
}

struct NamedKey {
    const char* name;
    int code;
};

constexpr std::array<NamedKey, 43> kNamedKeys = {{
    {"space", KEY_SPACE},         {"period", KEY_DOT},         {"dot", KEY_DOT},
    {".", KEY_DOT},               {"comma", KEY_COMMA},        {",", KEY_COMMA},
    {"slash", KEY_SLASH},         {"/", KEY_SLASH},            {"backslash", KEY_BACKSLASH},
    {"semicolon", KEY_SEMICOLON}, {";", KEY_SEMICOLON},        {"apostrophe", KEY_APOSTROPHE},
    {"grave", KEY_GRAVE},         {"`", KEY_GRAVE},            {"minus", KEY_MINUS},
    {"-", KEY_MINUS},             {"equal", KEY_EQUAL},        {"=", KEY_EQUAL},
    {"leftbrace", KEY_LEFTBRACE}, {"rightbrace", KEY_RIGHTBRACE}, {"enter", KEY_ENTER},
    {"return", KEY_ENTER},        {"tab", KEY_TAB},            {"backspace", KEY_BACKSPACE},
    {"escape", KEY_ESC},          {"esc", KEY_ESC},            {"delete", KEY_DELETE},
    {"insert", KEY_INSERT},       {"home", KEY_HOME},          {"end", KEY_END},
    {"pageup", KEY_PAGEUP},       {"pagedown", KEY_PAGEDOWN},  {"up", KEY_UP},
    {"down", KEY_DOWN},           {"left", KEY_LEFT},          {"right", KEY_RIGHT},
    {"capslock", KEY_CAPSLOCK},   {"print", KEY_SYSRQ},        {"pause", KEY_PAUSE},
    {"rightalt", KEY_RIGHTALT},   {"rightctrl", KEY_RIGHTCTRL}, {"scrolllock", KEY_SCROLLLOCK},
    {"menu", KEY_COMPOSE},
}};

}  // namespace

int keyNameToCode(const std::string& name) {
    const std::string lower = toLower(trim(name));
    if (lower.empty()) {
        return -1;
    }

    if (lower.size() == 1 && lower[0] >= 'a' && lower[0] <= 'z') {
        static constexpr std::array<int, 26> kLetters = {
            KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
            KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
            KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z};
        return kLetters[lower[0] - 'a'];
    }
    if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '9') {
        return lower[0] == '0' ? KEY_0 : KEY_1 + (lower[0] - '1');
    }

    for (const auto& key : kNamedKeys) {
        if (lower == key.name) {
            return key.code;
        }
    }

    // KEY_F1..KEY_F10 are contiguous, F11/F12 are not
    if (lower.size() >= 2 && lower.size() <= 3 && lower[0] == 'f' &&
        std::all_of(lower.begin() + 1, lower.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        int n = std::stoi(lower.substr(1));
        if (n >= 1 && n <= 10) {
            return KEY_F1 + (n - 1);
        }
        if (n == 11) {
            return KEY_F11;
        }
        if (n == 12) {
            return KEY_F12;
        }
    }
    return -1;
}

std::optional<HotkeyBinding> parseHotkey(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream ss(text);
    std::string part;
    while (std::getline(ss, part, '+')) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    if (parts.empty()) {
        LOG_ERROR("Hotkey: empty hotkey string");
        return std::nullopt;
    }

    HotkeyBinding binding;
    binding.text = text;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const std::string mod = toLower(parts[i]);
        if (mod == "ctrl" || mod == "control") {
            binding.modifiers |= MOD_CTRL;
        } else if (mod == "shift") {
            binding.modifiers |= MOD_SHIFT;
        } else if (mod == "alt") {
            binding.modifiers |= MOD_ALT;
        } else if (mod == "super" || mod == "meta" || mod == "mod4" || mod == "cmd") {
            binding.modifiers |= MOD_SUPER;
        } else {
            LOG_ERROR("Hotkey: unknown modifier '{}' in '{}'", parts[i], text);
            return std::nullopt;
        }
    }

    binding.keyCode = keyNameToCode(parts.back());
    if (binding.keyCode < 0) {
        LOG_ERROR("Hotkey: unknown key '{}' in '{}'", parts.back(), text);
        return std::nullopt;
    }
    return binding;
}

KeyTransition HotkeyStateFilter::onKey(int code, int value) {
    if (value != 0 && value != 1) {
        return KeyTransition::None;
    }
    const bool pressed = value == 1;

    auto [modifier, left] = modifierOf(code);
    if (modifier != MOD_NONE && code != binding_.keyCode) {
        unsigned int& held = left ? heldLeft_ : heldRight_;
        held = pressed ? (held | modifier) : (held & ~modifier);
        // Releasing a required modifier ends the gesture as well.
        if (!pressed && active_ && !modifiersMatch()) {
            active_ = false;
            return KeyTransition::Released;
        }
        return KeyTransition::None;
    }

    if (code != binding_.keyCode) {
        return KeyTransition::None;
    }
    if (pressed && !active_ && modifiersMatch()) {
        active_ = true;
        return KeyTransition::Pressed;
    }
    if (!pressed && active_) {
        active_ = false;
        return KeyTransition::Released;
    }
    return KeyTransition::None;
}

void HotkeyStateFilter::reset() {
    heldLeft_ = MOD_NONE;
    heldRight_ = MOD_NONE;
    active_ = false;
}

bool HotkeyStateFilter::modifiersMatch() const {
    return (heldLeft_ | heldRight_) == binding_.modifiers;
}

}  // namespace daemon_input
