#pragma once

#include "combat_rules.hpp"

#include <string>

constexpr const char* SETTINGS_FILE_NAME = "cryptcrawl_settings.ini";

// Keybinding values are opaque strings shared with the frontend:
// letters upper-case ("W"), named keys capitalised ("Space", "Return", "Up"),
// mouse buttons "LeftClick" / "RightClick".
struct KeyBindings {
    std::string up = "W";
    std::string left = "A";
    std::string down = "S";
    std::string right = "D";
    std::string attack = "LeftClick";
    std::string dash = "Space";
    std::string block = "RightClick";
    std::string inventory = "C";
    std::string special = "Q";
    std::string inventoryUp = "Up";
    std::string inventoryDown = "Down";
    std::string useSelected = "Return";
    std::string pause = "P";
};

// User-editable settings file (INI-ish: key = value).
struct Settings {
    KeyBindings binds;

    Difficulty difficulty = Difficulty::Normal;
    Difficulty defaultDifficulty = Difficulty::Normal;

    int musicVolume = 70; // 0..100
    int soundVolume = 80; // 0..100
    bool skipLogo = false;

    std::string playerName = "PLAYER";

    // Simulation step in milliseconds (8..50).
    int tickMs = 16;

    int viewportWidth = 80;
    int viewportHeight = 24;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Unknown keys and malformed values are skipped.
Settings loadSettings(const std::string& path);

// Writes every key. Returns false if the file could not be written.
bool saveSettings(const std::string& path, const Settings& s);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Remove a single key entry from the settings file.
// Returns false only if the file could not be read/written.
bool removeIniKey(const std::string& path, const std::string& key);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
