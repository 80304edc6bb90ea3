#pragma once

#include "input_script.hpp"
#include "world.hpp"

#include <cstdint>
#include <string>

// Headless script runner: drives a World from a recorded input stream at a
// fixed frame step and validates state-hash checkpoints.

struct ScriptRunOptions {
    // Fixed frame step; clamped to [1, 100].
    uint32_t frameMs = 16;

    // Validate StateHash events when the script contains any.
    bool verifyHashes = true;

    // Safety limits (0 = automatic).
    uint32_t maxSimMs = 0;
    uint32_t maxFrames = 0;

    // Minimum simulated time; lets a run continue past the last event.
    uint32_t minSimMs = 0;

    // Optional recorder: dispatched actions and a checkpoint every
    // `recordHashEveryTicks` ticks are written to it.
    InputScriptWriter* record = nullptr;
    uint32_t recordHashEveryTicks = 60;
};

enum class ScriptFailureKind : uint8_t {
    None = 0,
    HashMismatch,
    SafetyLimit,
    Unknown,
};

inline const char* scriptFailureKindName(ScriptFailureKind k) {
    switch (k) {
        case ScriptFailureKind::None:         return "None";
        case ScriptFailureKind::HashMismatch: return "HashMismatch";
        case ScriptFailureKind::SafetyLimit:  return "SafetyLimit";
        case ScriptFailureKind::Unknown:      return "Unknown";
    }
    return "Unknown";
}

struct ScriptRunStats {
    uint32_t simulatedMs = 0;
    uint32_t frames = 0;
    uint32_t eventsDispatched = 0;
    uint64_t ticks = 0;

    ScriptFailureKind failure = ScriptFailureKind::None;
    uint64_t failedTick = 0;
    uint64_t failedCheckpointTick = 0;
    uint64_t expectedHash = 0;
    uint64_t gotHash = 0;
};

inline uint64_t worldStateHash(const World& w) { return w.stateHash(); }

// World configuration matching the script header (seed, difficulty).
WorldConfig worldConfigForScript(const InputScript& script, const WorldConfig& base = {});

// Runs the script against an already constructed World. Returns true when
// every event was dispatched and every checkpoint matched.
bool runScriptHeadless(World& world,
                       const InputScript& script,
                       const ScriptRunOptions& opt = {},
                       ScriptRunStats* outStats = nullptr,
                       std::string* err = nullptr);
