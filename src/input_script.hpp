#pragma once

#include "combat_rules.hpp"
#include "input.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Input scripts: recorded action streams for headless runs
// ------------------------------------------------------------
//
// Line-based so scripts can be written by hand. Actions are stored by id,
// not by key, so keybind changes do not invalidate a script.
//
//   @cryptcrawl_input 1
//   @game_version 0.4.0
//   @seed 123456
//   @difficulty Normal
//   @end_header
//
//   <ms> A <action_id> [slot]
//   <ms> H <tick> <hash64hex>
//
// '#' starts a comment line.

enum class ScriptEventType : uint8_t {
    Action = 0,
    StateHash, // world hash checkpoint at a given tick
};

struct InputScriptMeta {
    int formatVersion = 1;
    std::string gameVersion;
    uint64_t seed = 0;
    Difficulty difficulty = Difficulty::Normal;
};

struct ScriptEvent {
    uint32_t tMs = 0;
    ScriptEventType kind = ScriptEventType::Action;

    Action action = Action::None;
    int slot = 0;

    uint64_t tick = 0;
    uint64_t hash = 0;
};

struct InputScript {
    InputScriptMeta meta;
    std::vector<ScriptEvent> events;
};

class InputScriptWriter {
public:
    bool open(const std::filesystem::path& path, const InputScriptMeta& meta, std::string* err = nullptr);
    void close();
    bool isOpen() const { return f_.is_open(); }

    void writeAction(uint32_t tMs, Action a, int slot = 0);
    void writeStateHash(uint32_t tMs, uint64_t tick, uint64_t hash);

private:
    void writeLine_(const std::string& line);

    std::ofstream f_;
};

bool loadInputScript(const std::filesystem::path& path, InputScript& out, std::string* err = nullptr);

// Same parser over in-memory text.
bool parseInputScript(const std::string& text, InputScript& out, std::string* err = nullptr);
