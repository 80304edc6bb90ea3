#include "game_save.hpp"
#include "input_script.hpp"
#include "message_log.hpp"
#include "script_runner.hpp"
#include "settings.hpp"
#include "version.hpp"
#include "world.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace {

void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n"
        << "  " << argv0 << " --input <script> [options]\n\n"
        << "Options:\n"
        << "  --seed <n>          World seed. Default: 1.\n"
        << "  --difficulty <d>    Easy, Normal, Hard or Death. Default: from settings.\n"
        << "  --ticks <n>         Minimum number of frames to simulate. Default: 600.\n"
        << "  --frame-ms <n>      Fixed simulation step in milliseconds (1..100). Default: tick_ms.\n"
        << "  --input <path>      Input script to play (seed/difficulty come from its header).\n"
        << "  --record <path>     Record dispatched actions and hash checkpoints to a script.\n"
        << "  --save <path>       Write a save file when the run ends.\n"
        << "  --load <path>       Resume from a save file.\n"
        << "  --settings <path>   Settings INI to read. Default: " << SETTINGS_FILE_NAME << " if present.\n"
        << "  --log <path>        Write the message log to a file ('-' for stdout).\n"
        << "  --no-verify-hashes  Do not verify script hash checkpoints.\n"
        << "  --version           Print version.\n"
        << "  --help              Show this help.\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseU64(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

std::string hex64(uint64_t v) {
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << v;
    return ss.str();
}

void printSummary(const World& w, const ScriptRunStats& st) {
    const Player& p = w.player();
    std::cout << "Run summary:\n"
              << "  seed=" << w.config().seed
              << " difficulty=" << difficultyName(w.difficulty()) << "\n"
              << "  floor=" << w.floorLevel() << "/" << w.maxLevels()
              << " state=" << gameStateName(w.state()) << "\n"
              << "  ticks=" << w.tickCount()
              << " frames=" << st.frames
              << " simMs=" << st.simulatedMs
              << " events=" << st.eventsDispatched << "\n"
              << "  hp=" << p.hp << "/" << p.maxHp
              << " gold=" << p.gold
              << " kills=" << p.enemiesKilled
              << " enemies_left=" << w.enemies().size() << "\n"
              << "  path=" << (p.skills.chosen() ? skillPathName(*p.skills.chosen()) : "none")
              << " ultimate=" << ultimateName(p.ultimate.kind()) << "\n"
              << "  hash=" << hex64(w.stateHash()) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string settingsPath;
    std::string inputPath;
    std::string recordPath;
    std::string savePath;
    std::string loadPath;
    std::string logPath;
    std::optional<Difficulty> difficultyArg;
    uint64_t seed = 1;
    bool seedGiven = false;
    uint32_t ticks = 600;
    uint32_t frameMs = 0;
    bool verify = true;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << CRYPTCRAWL_APPNAME << " " << CRYPTCRAWL_VERSION << "\n";
            return 0;
        } else if (a == "--seed") {
            if (!argValue(i, argc, argv, v) || !parseU64(v, seed)) {
                std::cerr << "--seed requires a non-negative integer\n";
                return 2;
            }
            seedGiven = true;
        } else if (a == "--difficulty") {
            Difficulty d = Difficulty::Normal;
            if (!argValue(i, argc, argv, v) || !parseDifficulty(v, d)) {
                std::cerr << "--difficulty requires Easy, Normal, Hard or Death\n";
                return 2;
            }
            difficultyArg = d;
        } else if (a == "--ticks") {
            if (!argValue(i, argc, argv, v) || !parseU32(v, ticks)) {
                std::cerr << "Invalid --ticks\n";
                return 2;
            }
        } else if (a == "--frame-ms") {
            if (!argValue(i, argc, argv, v) || !parseU32(v, frameMs) || frameMs < 1 || frameMs > 100) {
                std::cerr << "Invalid --frame-ms (1..100)\n";
                return 2;
            }
        } else if (a == "--input") {
            if (!argValue(i, argc, argv, inputPath)) {
                std::cerr << "--input requires a path\n";
                return 2;
            }
        } else if (a == "--record") {
            if (!argValue(i, argc, argv, recordPath)) {
                std::cerr << "--record requires a path\n";
                return 2;
            }
        } else if (a == "--save") {
            if (!argValue(i, argc, argv, savePath)) {
                std::cerr << "--save requires a path\n";
                return 2;
            }
        } else if (a == "--load") {
            if (!argValue(i, argc, argv, loadPath)) {
                std::cerr << "--load requires a path\n";
                return 2;
            }
        } else if (a == "--settings") {
            if (!argValue(i, argc, argv, settingsPath)) {
                std::cerr << "--settings requires a path\n";
                return 2;
            }
        } else if (a == "--log") {
            if (!argValue(i, argc, argv, logPath)) {
                std::cerr << "--log requires a path\n";
                return 2;
            }
        } else if (a == "--no-verify-hashes") {
            verify = false;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!inputPath.empty() && !loadPath.empty()) {
        std::cerr << "Specify only one of --input or --load\n";
        return 2;
    }

    if (settingsPath.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(SETTINGS_FILE_NAME, ec)) settingsPath = SETTINGS_FILE_NAME;
    }
    const Settings settings = settingsPath.empty() ? Settings{} : loadSettings(settingsPath);

    WorldConfig cfg;
    cfg.seed = seed;
    cfg.difficulty = settings.difficulty;
    cfg.playerName = settings.playerName;
    cfg.viewWidth = settings.viewportWidth;
    cfg.viewHeight = settings.viewportHeight;
    if (difficultyArg) cfg.difficulty = *difficultyArg;
    if (frameMs == 0) frameMs = static_cast<uint32_t>(settings.tickMs);

    InputScript script;
    if (!inputPath.empty()) {
        std::string err;
        if (!loadInputScript(inputPath, script, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        if (seedGiven || difficultyArg) {
            std::cout << "Note: seed and difficulty are taken from the script header.\n";
        }
        cfg = worldConfigForScript(script, cfg);
    }

    GameSave save;
    if (!loadPath.empty()) {
        std::string err;
        if (!loadGameFromFile(loadPath, save, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        cfg = configFromSave(save, cfg);
    }

    // Message log: kept in memory, optionally mirrored to a stream.
    MessageLog log;
    std::ofstream logFile;
    std::unique_ptr<StreamMessageSink> streamSink;
    if (logPath == "-") {
        streamSink = std::make_unique<StreamMessageSink>(std::cout);
    } else if (!logPath.empty()) {
        logFile.open(logPath, std::ios::out | std::ios::trunc);
        if (!logFile) {
            std::cerr << "Failed to open log for writing: " << logPath << "\n";
            return 1;
        }
        streamSink = std::make_unique<StreamMessageSink>(logFile);
    }
    TeeMessageSink sink(&log, streamSink.get());

    World world(cfg, &sink);
    if (!loadPath.empty()) applySave(world, save);

    InputScriptWriter recorder;
    if (!recordPath.empty()) {
        InputScriptMeta meta;
        meta.gameVersion = CRYPTCRAWL_VERSION;
        meta.seed = cfg.seed;
        meta.difficulty = cfg.difficulty;
        std::string err;
        if (!recorder.open(recordPath, meta, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        recorder.writeStateHash(0, world.tickCount(), world.stateHash());
    }

    ScriptRunOptions opt;
    opt.frameMs = frameMs;
    opt.verifyHashes = verify;
    const uint64_t minMs = static_cast<uint64_t>(ticks) * frameMs;
    opt.minSimMs = minMs > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<uint32_t>(minMs);
    opt.record = recorder.isOpen() ? &recorder : nullptr;

    ScriptRunStats stats;
    std::string err;
    const bool ok = runScriptHeadless(world, script, opt, &stats, &err);
    recorder.close();

    printSummary(world, stats);

    if (!ok) {
        std::cout << "Run FAILED (" << scriptFailureKindName(stats.failure) << "): " << err << "\n";
    }

    if (!savePath.empty()) {
        std::string serr;
        if (!saveGameToFile(savePath, makeSave(world), &serr)) {
            std::cerr << serr << "\n";
            return 1;
        }
        std::cout << "Saved: " << savePath << "\n";
    }

    return ok ? 0 : 1;
}
