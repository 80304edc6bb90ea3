#pragma once

#include <cstdint>
#include <string>

// Semantic input actions. Frontends translate keys into these; the World only
// ever sees Actions.
enum class Action : uint8_t {
    None = 0,

    // Movement
    MoveUp,
    MoveDown,
    MoveLeft,
    MoveRight,

    Attack,
    Dash,
    Block,
    UseConsumable, // slot 1..9
    SwitchWeapon,  // slot 1..9
    Ultimate,

    ToggleInventory,
    Pause,
    InventoryUp,
    InventoryDown,
    UseSelected,
};

constexpr int ACTION_COUNT = 16;

struct InputEvent {
    Action action = Action::None;
    int slot = 0;      // 1-based; UseConsumable / SwitchWeapon only
    uint32_t tMs = 0;  // timestamp from the input collaborator
};

const char* actionName(Action a);
bool parseAction(const std::string& s, Action& out);

inline bool actionTakesSlot(Action a) {
    return a == Action::UseConsumable || a == Action::SwitchWeapon;
}

// Accepted while paused.
inline bool actionAllowedWhilePaused(Action a) {
    return a == Action::Pause || a == Action::InventoryUp || a == Action::InventoryDown;
}
