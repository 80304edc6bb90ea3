#pragma once

#include "sdl.hpp"

#include "input.hpp"
#include "settings.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Resolves the opaque binding strings from the settings file to SDL keys and
// mouse buttons.
//
// A binding is either a key name ("W", "Space", "Return", "Up", any name
// SDL_GetKeyFromName accepts) or a mouse button ("LeftClick", "RightClick",
// "MiddleClick"). Unknown names leave the action unbound.
//
// Digits 1..9 are fixed: plain digits switch weapon slots, Shift+digit uses the
// matching consumable slot.

struct Binding {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint8 mouseButton = 0; // SDL_BUTTON_*; 0 = keyboard binding
};

class KeyBinds {
public:
    static KeyBinds fromSettings(const KeyBindings& kb);

    // Inventory actions take priority while the inventory is open.
    InputEvent mapKey(SDL_Keycode key, Uint16 mods, bool inventoryOpen) const;
    InputEvent mapMouse(Uint8 button) const;

    std::string describe(Action a) const;

    static std::optional<Binding> parseBinding(const std::string& name);

private:
    std::vector<std::pair<Action, Binding>> binds_;
    std::vector<std::pair<Action, std::string>> names_;

    void bind(Action a, const std::string& name);
};
