#pragma once

#include <optional>
#include <string>

namespace daemon_input {

enum HotkeyModifier : unsigned int {
    MOD_NONE = 0,
    MOD_CTRL = 1u << 0,
    MOD_SHIFT = 1u << 1,
    MOD_ALT = 1u << 2,
    MOD_SUPER = 1u << 3,
};

// A key plus the exact set of modifiers that must be held with it.
struct HotkeyBinding {
    int keyCode = -1;
    unsigned int modifiers = MOD_NONE;
    std::string text;
};

// evdev key code for a key name ("a", "period", "f11", "space"), -1 if unknown.
int keyNameToCode(const std::string& name);

// Parses "ctrl+shift+space" style strings. nullopt (with a log line) when a
// modifier or the key is unknown.
std::optional<HotkeyBinding> parseHotkey(const std::string& text);

enum class KeyTransition { None, Pressed, Released };

// Tracks modifier state of one input device and reports press/release of the
// bound key. Auto-repeat (value 2) never produces a transition.
class HotkeyStateFilter {
   public:
    explicit HotkeyStateFilter(HotkeyBinding binding) : binding_(std::move(binding)) {}

    // value: 1 press, 0 release, 2 repeat (linux/input.h EV_KEY semantics)
    KeyTransition onKey(int code, int value);

    bool active() const {
        return active_;
    }
    const HotkeyBinding& binding() const {
        return binding_;
    }
    void reset();

   private:
    bool modifiersMatch() const;

    HotkeyBinding binding_;
    unsigned int heldLeft_ = MOD_NONE;
    unsigned int heldRight_ = MOD_NONE;
    bool active_ = false;
};

}  // namespace daemon_input
