#include "settings.hpp"

#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string t = trim(v);
        out = std::stoi(t, &used);
        return used == t.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// Letters upper-case, everything else capitalised ("space" -> "Space").
std::string normalizeKeyName(const std::string& v) {
    std::string s = trim(v);
    if (s.empty()) return s;
    if (s.size() == 1) return toUpper(s);
    const std::string lower = toLower(s);
    if (lower == "leftclick") return "LeftClick";
    if (lower == "rightclick") return "RightClick";
    if (lower == "middleclick") return "MiddleClick";
    std::string out = lower;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

// Binding keys in file order.
struct BindEntry {
    const char* key;
    std::string KeyBindings::*field;
};

const BindEntry kBindEntries[] = {
    {"bind_up", &KeyBindings::up},
    {"bind_left", &KeyBindings::left},
    {"bind_down", &KeyBindings::down},
    {"bind_right", &KeyBindings::right},
    {"bind_attack", &KeyBindings::attack},
    {"bind_dash", &KeyBindings::dash},
    {"bind_block", &KeyBindings::block},
    {"bind_inventory", &KeyBindings::inventory},
    {"bind_special", &KeyBindings::special},
    {"bind_inventory_up", &KeyBindings::inventoryUp},
    {"bind_inventory_down", &KeyBindings::inventoryDown},
    {"bind_use_selected", &KeyBindings::useSelected},
    {"bind_pause", &KeyBindings::pause},
};

bool readLines(const std::string& path, std::vector<std::string>& lines) {
    std::ifstream in(path);
    if (!in) return false;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return true;
}

bool writeLines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;
    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return static_cast<bool>(out);
}

// Key of an INI line (lower-cased), or empty for comments/blank lines.
std::string lineKey(const std::string& line) {
    std::string raw = line;
    auto commentPos = raw.find_first_of("#;");
    if (commentPos != std::string::npos) raw = raw.substr(0, commentPos);
    auto eq = raw.find('=');
    if (eq == std::string::npos) return {};
    return toLower(trim(raw.substr(0, eq)));
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        bool handled = false;
        for (const BindEntry& b : kBindEntries) {
            if (key == b.key) {
                const std::string k = normalizeKeyName(val);
                if (!k.empty()) s.binds.*(b.field) = k;
                handled = true;
                break;
            }
        }
        if (handled) continue;

        if (key == "difficulty") {
            Difficulty d = Difficulty::Normal;
            if (parseDifficulty(val, d)) s.difficulty = d;
        } else if (key == "default_difficulty") {
            Difficulty d = Difficulty::Normal;
            if (parseDifficulty(val, d)) s.defaultDifficulty = d;
        } else if (key == "music_volume") {
            int v = 0;
            if (parseInt(val, v)) s.musicVolume = std::clamp(v, 0, 100);
        } else if (key == "sound_volume") {
            int v = 0;
            if (parseInt(val, v)) s.soundVolume = std::clamp(v, 0, 100);
        } else if (key == "skip_logo") {
            bool b = false;
            if (parseBool(val, b)) s.skipLogo = b;
        } else if (key == "player_name") {
            if (!val.empty()) s.playerName = val.substr(0, 24);
        } else if (key == "tick_ms") {
            int v = 0;
            if (parseInt(val, v)) s.tickMs = std::clamp(v, 8, 50);
        } else if (key == "viewport_width") {
            int v = 0;
            if (parseInt(val, v)) s.viewportWidth = std::clamp(v, 20, 240);
        } else if (key == "viewport_height") {
            int v = 0;
            if (parseInt(val, v)) s.viewportHeight = std::clamp(v, 10, 120);
        }
    }

    return s;
}

bool saveSettings(const std::string& path, const Settings& s) {
    std::ofstream f(path, std::ios::trunc);
    if (!f) return false;

    f << "# CryptCrawl settings\n\n";
    for (const BindEntry& b : kBindEntries) f << b.key << " = " << s.binds.*(b.field) << "\n";
    f << "\n";
    f << "difficulty = " << difficultyName(s.difficulty) << "\n";
    f << "default_difficulty = " << difficultyName(s.defaultDifficulty) << "\n";
    f << "music_volume = " << s.musicVolume << "\n";
    f << "sound_volume = " << s.soundVolume << "\n";
    f << "skip_logo = " << (s.skipLogo ? "true" : "false") << "\n";
    f << "player_name = " << s.playerName << "\n";
    f << "tick_ms = " << s.tickMs << "\n";
    f << "viewport_width = " << s.viewportWidth << "\n";
    f << "viewport_height = " << s.viewportHeight << "\n";
    return static_cast<bool>(f);
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# CryptCrawl settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# -----------------------------------------------------------------------------
# Keybindings
#
# Letters are upper-case (W), named keys are capitalised (Space, Return, Up),
# mouse buttons are LeftClick / RightClick.
# -----------------------------------------------------------------------------

bind_up = W
bind_left = A
bind_down = S
bind_right = D
bind_attack = LeftClick
bind_dash = Space
bind_block = RightClick
bind_inventory = C
bind_special = Q
bind_inventory_up = Up
bind_inventory_down = Down
bind_use_selected = Return
bind_pause = P

# Gameplay
# difficulty: Easy | Normal | Hard | Death
difficulty = Normal
default_difficulty = Normal

# Audio (0..100)
music_volume = 70
sound_volume = 80

# Startup
skip_logo = false
player_name = PLAYER

# Simulation step in milliseconds (8..50)
tick_ms = 16

# Visible map area in tiles
viewport_width = 80
viewport_height = 24
)INI";

    return static_cast<bool>(f);
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return false;

    const std::string want = toLower(key);
    bool found = false;
    for (auto& line : lines) {
        if (lineKey(line) == want) {
            line = key + " = " + value;
            found = true;
        }
    }

    if (!found) {
        // Append at end.
        lines.push_back(key + " = " + value);
    }
    return writeLines(path, lines);
}

bool removeIniKey(const std::string& path, const std::string& key) {
    std::vector<std::string> lines;
    if (!readLines(path, lines)) return false;

    const std::string want = toLower(key);
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [&](const std::string& l) { return lineKey(l) == want; }),
                lines.end());
    return writeLines(path, lines);
}
