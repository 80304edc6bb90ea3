#include "script_runner.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <vector>

namespace {

struct TickHashCheckpoint {
    uint64_t tick = 0;
    uint64_t hash = 0;
};

struct TickHashVerifyCtx {
    const std::vector<TickHashCheckpoint>* expected = nullptr;
    size_t idx = 0;
    bool failed = false;
    uint64_t failedTick = 0;
    // May be < failedTick when a checkpoint was skipped over.
    uint64_t expectedTick = 0;
    uint64_t expectedHash = 0;
    uint64_t gotHash = 0;

    bool done() const { return !expected || idx >= expected->size(); }
};

void verifyTick(TickHashVerifyCtx& ctx, uint64_t tick, uint64_t hash) {
    if (ctx.failed || !ctx.expected) return;
    const auto& exp = *ctx.expected;
    if (ctx.idx < exp.size() && exp[ctx.idx].tick < tick) {
        ctx.failed = true;
        ctx.failedTick = tick;
        ctx.expectedTick = exp[ctx.idx].tick;
        ctx.expectedHash = exp[ctx.idx].hash;
        ctx.gotHash = hash;
        return;
    }
    // Several checkpoints may name the same tick; each must match.
    while (ctx.idx < exp.size() && exp[ctx.idx].tick == tick) {
        const uint64_t want = exp[ctx.idx].hash;
        ctx.idx++;
        if (want != hash) {
            ctx.failed = true;
            ctx.failedTick = tick;
            ctx.expectedTick = tick;
            ctx.expectedHash = want;
            ctx.gotHash = hash;
            return;
        }
    }
}

std::string formatHashMismatch(const TickHashVerifyCtx& ctx) {
    std::ostringstream ss;
    if (ctx.expectedTick != ctx.failedTick) {
        ss << "SCRIPT DESYNC: missed checkpoint tick " << ctx.expectedTick
           << " while at tick " << ctx.failedTick
           << " (expected 0x" << std::hex << ctx.expectedHash
           << ", got 0x" << std::hex << ctx.gotHash << ")";
    } else {
        ss << "SCRIPT DESYNC at tick " << ctx.failedTick
           << " (expected 0x" << std::hex << ctx.expectedHash
           << ", got 0x" << std::hex << ctx.gotHash << ")";
    }
    return ss.str();
}

uint32_t clampFrameMs(uint32_t v) {
    if (v < 1) return 1;
    if (v > 100) return 100;
    return v;
}

bool worldEnded(const World& w) {
    return w.state() == GameState::Dead || w.state() == GameState::Victory;
}

} // namespace

WorldConfig worldConfigForScript(const InputScript& script, const WorldConfig& base) {
    WorldConfig cfg = base;
    cfg.seed = script.meta.seed;
    cfg.difficulty = script.meta.difficulty;
    return cfg;
}

bool runScriptHeadless(World& world,
                       const InputScript& script,
                       const ScriptRunOptions& opt,
                       ScriptRunStats* outStats,
                       std::string* err) {
    ScriptRunStats stats;
    const uint32_t frameMs = clampFrameMs(opt.frameMs);

    std::vector<TickHashCheckpoint> checkpoints;
    std::vector<const ScriptEvent*> actions;
    for (const auto& ev : script.events) {
        if (ev.kind == ScriptEventType::StateHash) {
            checkpoints.push_back(TickHashCheckpoint{ev.tick, ev.hash});
        } else {
            actions.push_back(&ev);
        }
    }
    std::stable_sort(checkpoints.begin(), checkpoints.end(),
                     [](const TickHashCheckpoint& a, const TickHashCheckpoint& b) { return a.tick < b.tick; });

    TickHashVerifyCtx verify{};
    if (opt.verifyHashes && !checkpoints.empty()) verify.expected = &checkpoints;

    auto finish = [&](bool ok, uint32_t elapsedMs, uint32_t frames, uint32_t dispatched) {
        stats.simulatedMs = elapsedMs;
        stats.frames = frames;
        stats.eventsDispatched = dispatched;
        stats.ticks = world.tickCount();
        if (!ok && verify.failed) {
            stats.failure = ScriptFailureKind::HashMismatch;
            stats.failedTick = verify.failedTick;
            stats.failedCheckpointTick = verify.expectedTick;
            stats.expectedHash = verify.expectedHash;
            stats.gotHash = verify.gotHash;
            if (err) *err = formatHashMismatch(verify);
        }
        if (outStats) *outStats = stats;
        return ok;
    };

    // Initial state (tick 0).
    verifyTick(verify, world.tickCount(), world.stateHash());
    if (verify.failed) return finish(false, 0, 0, 0);

    const uint32_t lastEventMs = script.events.empty() ? 0 : script.events.back().tMs;
    uint32_t maxSimMs = opt.maxSimMs;
    if (maxSimMs == 0) {
        // Last event time + 5 seconds, at least 5 seconds.
        const uint32_t slack = 5000;
        const uint32_t end = std::max(lastEventMs, opt.minSimMs);
        maxSimMs = end > std::numeric_limits<uint32_t>::max() - slack
                 ? std::numeric_limits<uint32_t>::max()
                 : end + slack;
    }
    const uint32_t maxFrames = opt.maxFrames == 0 ? (maxSimMs / frameMs + 10) : opt.maxFrames;

    size_t idx = 0;
    uint32_t elapsedMs = 0;
    uint32_t frames = 0;
    uint32_t dispatched = 0;
    bool completed = false;

    while (frames < maxFrames && elapsedMs <= maxSimMs) {
        while (idx < actions.size() && actions[idx]->tMs <= elapsedMs) {
            const ScriptEvent& ev = *actions[idx];
            InputEvent in;
            in.action = ev.action;
            in.slot = ev.slot;
            in.tMs = ev.tMs;
            world.queueInput(in);
            if (opt.record) opt.record->writeAction(elapsedMs, ev.action, ev.slot);
            ++idx;
            ++dispatched;
        }

        const bool allEventsDone = idx >= actions.size();
        if (allEventsDone && verify.done() && elapsedMs >= opt.minSimMs) {
            completed = true;
            break;
        }

        if (allEventsDone && worldEnded(world) && world.pendingInputs() == 0) {
            if (!verify.done()) {
                // The world stopped ticking before the remaining checkpoints.
                verify.failed = true;
                verify.failedTick = world.tickCount();
                verify.expectedTick = (*verify.expected)[verify.idx].tick;
                verify.expectedHash = (*verify.expected)[verify.idx].hash;
                verify.gotHash = world.stateHash();
                return finish(false, elapsedMs, frames, dispatched);
            }
            completed = true;
            break;
        }

        uint32_t stepMs = frameMs;
        if (elapsedMs + stepMs > maxSimMs) stepMs = maxSimMs - elapsedMs;
        if (stepMs == 0) break;

        const uint64_t before = world.tickCount();
        world.tick(static_cast<double>(stepMs) / 1000.0);
        elapsedMs += stepMs;
        ++frames;

        const uint64_t tick = world.tickCount();
        if (tick != before) {
            const uint64_t hash = world.stateHash();
            verifyTick(verify, tick, hash);
            if (verify.failed) return finish(false, elapsedMs, frames, dispatched);
            if (opt.record && opt.recordHashEveryTicks > 0 && tick % opt.recordHashEveryTicks == 0) {
                opt.record->writeStateHash(elapsedMs, tick, hash);
            }
        }
    }

    if (!completed) {
        stats.failure = ScriptFailureKind::SafetyLimit;
        if (err) {
            std::ostringstream ss;
            ss << "Script runner exceeded safety limit (elapsedMs=" << elapsedMs
               << ", frames=" << frames << ", maxSimMs=" << maxSimMs << ").";
            *err = ss.str();
        }
        return finish(false, elapsedMs, frames, dispatched);
    }

    return finish(true, elapsedMs, frames, dispatched);
}
