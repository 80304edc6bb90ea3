#include "keybinds.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<Binding> KeyBinds::parseBinding(const std::string& nameIn) {
    const std::string name = toLower(nameIn);
    if (name.empty() || name == "none" || name == "unbound") return std::nullopt;

    Binding b;
    if (name == "leftclick") {
        b.mouseButton = SDL_BUTTON_LEFT;
        return b;
    }
    if (name == "rightclick") {
        b.mouseButton = SDL_BUTTON_RIGHT;
        return b;
    }
    if (name == "middleclick") {
        b.mouseButton = SDL_BUTTON_MIDDLE;
        return b;
    }

    if (name.size() == 1) {
        b.key = static_cast<SDL_Keycode>(static_cast<unsigned char>(name[0]));
        return b;
    }

    if (name == "up") b.key = SDLK_UP;
    else if (name == "down") b.key = SDLK_DOWN;
    else if (name == "left") b.key = SDLK_LEFT;
    else if (name == "right") b.key = SDLK_RIGHT;
    else if (name == "space") b.key = SDLK_SPACE;
    else if (name == "return" || name == "enter") b.key = SDLK_RETURN;
    else if (name == "escape" || name == "esc") b.key = SDLK_ESCAPE;
    else if (name == "tab") b.key = SDLK_TAB;
    else b.key = SDL_GetKeyFromName(nameIn.c_str());

    if (b.key == SDLK_UNKNOWN) return std::nullopt;
    return b;
}

void KeyBinds::bind(Action a, const std::string& name) {
    names_.emplace_back(a, name);
    if (auto b = parseBinding(name)) binds_.emplace_back(a, *b);
}

KeyBinds KeyBinds::fromSettings(const KeyBindings& kb) {
    KeyBinds k;
    k.bind(Action::MoveUp, kb.up);
    k.bind(Action::MoveLeft, kb.left);
    k.bind(Action::MoveDown, kb.down);
    k.bind(Action::MoveRight, kb.right);
    k.bind(Action::Attack, kb.attack);
    k.bind(Action::Dash, kb.dash);
    k.bind(Action::Block, kb.block);
    k.bind(Action::ToggleInventory, kb.inventory);
    k.bind(Action::Ultimate, kb.special);
    k.bind(Action::InventoryUp, kb.inventoryUp);
    k.bind(Action::InventoryDown, kb.inventoryDown);
    k.bind(Action::UseSelected, kb.useSelected);
    k.bind(Action::Pause, kb.pause);
    return k;
}

InputEvent KeyBinds::mapKey(SDL_Keycode key, Uint16 mods, bool inventoryOpen) const {
    InputEvent ev;

    if (key >= SDLK_1 && key <= SDLK_9) {
        ev.slot = static_cast<int>(key - SDLK_1) + 1;
        ev.action = (mods & KMOD_SHIFT) ? Action::UseConsumable : Action::SwitchWeapon;
        return ev;
    }

    auto isInventoryAction = [](Action a) {
        return a == Action::InventoryUp || a == Action::InventoryDown || a == Action::UseSelected;
    };

    Action fallback = Action::None;
    for (const auto& [a, b] : binds_) {
        if (b.mouseButton != 0 || b.key != key) continue;
        if (isInventoryAction(a) == inventoryOpen) {
            ev.action = a;
            return ev;
        }
        if (fallback == Action::None && !isInventoryAction(a)) fallback = a;
    }
    ev.action = fallback;
    return ev;
}

InputEvent KeyBinds::mapMouse(Uint8 button) const {
    InputEvent ev;
    for (const auto& [a, b] : binds_) {
        if (b.mouseButton == button) {
            ev.action = a;
            break;
        }
    }
    return ev;
}

std::string KeyBinds::describe(Action a) const {
    for (const auto& [act, name] : names_) {
        if (act == a) return name;
    }
    return "none";
}
