#include "input.hpp"

const char* actionName(Action a) {
    switch (a) {
        case Action::None:            return "none";
        case Action::MoveUp:          return "move_up";
        case Action::MoveDown:        return "move_down";
        case Action::MoveLeft:        return "move_left";
        case Action::MoveRight:       return "move_right";
        case Action::Attack:          return "attack";
        case Action::Dash:            return "dash";
        case Action::Block:           return "block";
        case Action::UseConsumable:   return "use_consumable";
        case Action::SwitchWeapon:    return "switch_weapon";
        case Action::Ultimate:        return "ultimate";
        case Action::ToggleInventory: return "toggle_inventory";
        case Action::Pause:           return "pause";
        case Action::InventoryUp:     return "inventory_up";
        case Action::InventoryDown:   return "inventory_down";
        case Action::UseSelected:     return "use_selected";
        default:                      return "?";
    }
}

bool parseAction(const std::string& s, Action& out) {
    for (int i = 0; i < ACTION_COUNT; ++i) {
        const Action a = static_cast<Action>(i);
        if (s == actionName(a)) {
            out = a;
            return true;
        }
    }
    return false;
}
