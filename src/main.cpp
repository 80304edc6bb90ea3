#include "sdl.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "game_save.hpp"
#include "keybinds.hpp"
#include "message_log.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "snapshot.hpp"
#include "version.hpp"
#include "world.hpp"

namespace {

constexpr int CELL_SIZE = 12;

std::optional<uint64_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            try {
                return static_cast<uint64_t>(std::stoull(argv[i + 1], nullptr, 0));
            } catch (const std::invalid_argument&) {
                return std::nullopt;
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

void printUsage(const char* exe) {
    std::cout
        << CRYPTCRAWL_APPNAME << " " << CRYPTCRAWL_VERSION << "\n"
        << "Usage: " << (exe ? exe : "cryptcrawl") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Start a new run with a specific seed\n"
        << "  --load               Resume from the save file (F5 saves in game)\n"
        << "  --settings <path>    Settings file (default: " << SETTINGS_FILE_NAME << ")\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

std::string windowTitle(const WorldSnapshot& s) {
    std::string t = std::string(CRYPTCRAWL_APPNAME) + "  FLOOR " + std::to_string(s.floorLevel) + "/" +
                    std::to_string(s.maxLevels) + "  HP " + std::to_string(s.hp) + "/" + std::to_string(s.maxHp) +
                    "  GOLD " + std::to_string(s.gold) + "  " + toUpper(s.weaponName);
    if (s.paused) t += "  [PAUSED]";
    if (s.dead) t += "  [YOU DIED]";
    if (s.victory) t += "  [VICTORY]";
    return t;
}

void printControls(const KeyBinds& kb) {
    static const Action shown[] = {Action::MoveUp, Action::MoveDown, Action::MoveLeft, Action::MoveRight,
                                   Action::Attack, Action::Dash, Action::Block, Action::Ultimate,
                                   Action::ToggleInventory, Action::Pause};
    std::cout << "Controls:";
    for (Action a : shown) std::cout << "  " << actionName(a) << "=" << kb.describe(a);
    std::cout << "\n  1-9 switch weapon, Shift+1-9 use consumable, F5 save, Esc quit\n";
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "cryptcrawl");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << CRYPTCRAWL_APPNAME << " " << CRYPTCRAWL_VERSION << "\n";
        return 0;
    }

    const std::string settingsPath = parseStringArg(argc, argv, "--settings").value_or(SETTINGS_FILE_NAME);
    {
        std::error_code ec;
        if (hasFlag(argc, argv, "--reset-settings") || !std::filesystem::exists(settingsPath, ec)) {
            if (!writeDefaultSettings(settingsPath)) {
                std::cerr << "Could not write default settings: " << settingsPath << "\n";
            }
        }
    }
    const Settings settings = loadSettings(settingsPath);

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    Renderer renderer(settings.viewportWidth, settings.viewportHeight, CELL_SIZE);
    std::string err;
    if (!renderer.init(CRYPTCRAWL_APPNAME, &err)) {
        std::cerr << err << "\n";
        SDL_Quit();
        return 1;
    }

    MessageLog log;
    StreamMessageSink console(std::cout);
    TeeMessageSink sink(&log, &console);

    WorldConfig cfg;
    cfg.seed = parseSeedArg(argc, argv).value_or(static_cast<uint64_t>(SDL_GetTicks()));
    cfg.difficulty = settings.difficulty;
    cfg.playerName = settings.playerName;
    cfg.viewWidth = settings.viewportWidth;
    cfg.viewHeight = settings.viewportHeight;

    std::optional<GameSave> save;
    if (hasFlag(argc, argv, "--load")) {
        GameSave s;
        if (loadGameFromFile(SAVE_FILE_NAME, s, &err)) {
            save = s;
            cfg = configFromSave(s, cfg);
        } else {
            std::cerr << err << " STARTING A NEW RUN.\n";
        }
    }

    World world(cfg, &sink);
    if (save) {
        applySave(world, *save);
        world.pushMessage("GAME LOADED.", MessageKind::System, false);
    }

    const KeyBinds keyBinds = KeyBinds::fromSettings(settings.binds);
    printControls(keyBinds);
    const uint32_t tickMs = static_cast<uint32_t>(std::clamp(settings.tickMs, 8, 50));

    bool running = true;
    uint32_t lastTicks = SDL_GetTicks();
    uint32_t accumulator = 0;

    while (running) {
        const uint32_t now = SDL_GetTicks();
        // Cap catch-up after a stall to a few ticks.
        accumulator = std::min<uint32_t>(accumulator + (now - lastTicks), tickMs * 5);
        lastTicks = now;

        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_KEYDOWN: {
                    if (ev.key.repeat != 0) break;
                    const SDL_Keycode key = ev.key.keysym.sym;
                    if (key == SDLK_ESCAPE) {
                        running = false;
                        break;
                    }
                    if (key == SDLK_F5) {
                        std::string serr;
                        if (saveGameToFile(SAVE_FILE_NAME, makeSave(world), &serr)) {
                            world.pushMessage("GAME SAVED.", MessageKind::System, false);
                        } else {
                            world.pushMessage(serr, MessageKind::Warning, false);
                        }
                        break;
                    }
                    InputEvent in = keyBinds.mapKey(key, ev.key.keysym.mod, world.inventoryOpen());
                    if (in.action != Action::None) {
                        in.tMs = now;
                        world.queueInput(in);
                    }
                    break;
                }

                case SDL_MOUSEBUTTONDOWN: {
                    InputEvent in = keyBinds.mapMouse(ev.button.button);
                    if (in.action != Action::None) {
                        in.tMs = now;
                        world.queueInput(in);
                    }
                    break;
                }

                default:
                    break;
            }
            if (!running) break;
        }

        while (accumulator >= tickMs) {
            world.tick(static_cast<double>(tickMs) / 1000.0);
            accumulator -= tickMs;
        }

        const WorldSnapshot snap = makeSnapshot(world);
        renderer.setTitle(windowTitle(snap));
        renderer.render(snap);

        SDL_Delay(1);
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
