#include "render.hpp"

#include <algorithm>
#include <cstring>

namespace {

Color dim(const Color& c, int pct) {
    Color o = c;
    o.r = static_cast<uint8_t>(c.r * pct / 100);
    o.g = static_cast<uint8_t>(c.g * pct / 100);
    o.b = static_cast<uint8_t>(c.b * pct / 100);
    return o;
}

float readyFraction(const CooldownView& c) {
    if (c.duration <= 0.0) return 1.0f;
    return static_cast<float>(1.0 - std::clamp(c.remaining / c.duration, 0.0, 1.0));
}

} // namespace

Renderer::Renderer(int viewW_, int viewH_, int cellSize)
    : viewW(std::max(1, viewW_)), viewH(std::max(1, viewH_)), cell(std::max(4, cellSize)) {
    winW = viewW * cell;
    winH = (viewH + HUD_ROWS) * cell;
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(const std::string& title, std::string* err) {
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH, SDL_WINDOW_SHOWN);
    if (!window) {
        if (err) *err = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        // Software fallback for headless CI boxes and remote sessions.
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!renderer) {
        if (err) *err = std::string("SDL_CreateRenderer failed: ") + SDL_GetError();
        shutdown();
        return false;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    return true;
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
}

void Renderer::setTitle(const std::string& title) {
    if (window) SDL_SetWindowTitle(window, title.c_str());
}

void Renderer::setColor(const Color& c, uint8_t alpha) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, alpha);
}

void Renderer::fillCell(Vec2i v, int inset) {
    SDL_Rect r{v.x * cell + inset, v.y * cell + inset, cell - inset * 2, cell - inset * 2};
    SDL_RenderFillRect(renderer, &r);
}

bool Renderer::toView(const WorldSnapshot& s, Vec2i world, Vec2i& out) const {
    out = world - s.camera;
    return out.x >= 0 && out.y >= 0 && out.x < s.viewW && out.y < s.viewH;
}

void Renderer::drawBar(int x, int y, int w, int h, float frac, const Color& fg) {
    frac = std::clamp(frac, 0.0f, 1.0f);
    setColor(colors::DarkGray);
    SDL_Rect bg{x, y, w, h};
    SDL_RenderFillRect(renderer, &bg);
    setColor(fg);
    SDL_Rect bar{x, y, static_cast<int>(static_cast<float>(w) * frac), h};
    SDL_RenderFillRect(renderer, &bar);
}

void Renderer::drawHud(const WorldSnapshot& s) {
    const int top = viewH * cell + cell / 2;
    const int h = std::max(3, cell / 2);
    const int half = winW / 2 - cell;

    const float hpFrac = static_cast<float>(s.hp) / static_cast<float>(std::max(1, s.maxHp));
    drawBar(cell / 2, top, half, h, hpFrac, hpFrac > 0.3f ? colors::Green : colors::Red);
    drawBar(winW / 2 + cell / 2, top, half, h, s.ultimateCharge / 100.0f, colors::LightMagenta);

    // Cooldowns: dash, attack, block, ultimate.
    const CooldownView* cds[4] = {&s.dash, &s.attack, &s.block, &s.ultimate};
    const int slotW = winW / 4;
    for (int i = 0; i < 4; ++i) {
        const float f = readyFraction(*cds[i]);
        drawBar(i * slotW + cell / 2, top + h * 2, slotW - cell, h, f, f >= 1.0f ? colors::Cyan : colors::Gray);
    }

    if (s.paused || s.dead || s.victory) {
        const Color tint = s.dead ? colors::Red : (s.victory ? colors::Gold : colors::Gray);
        setColor(tint, 60);
        SDL_Rect r{0, 0, winW, viewH * cell};
        SDL_RenderFillRect(renderer, &r);
    }
}

void Renderer::render(const WorldSnapshot& s) {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    for (int y = 0; y < s.viewH && y < viewH; ++y) {
        for (int x = 0; x < s.viewW && x < viewW; ++x) {
            const TileView& t = s.tileAt(x, y);
            const bool wall = std::strcmp(t.glyph, "#") == 0;
            setColor(dim(t.color, wall ? 60 : 20));
            fillCell({x, y}, 0);
        }
    }

    Vec2i v{};
    for (const auto& it : s.items) {
        if (!toView(s, it.pos, v)) continue;
        setColor(it.color);
        fillCell(v, cell / 3);
    }
    for (const auto& a : s.animations) {
        setColor(a.color, 160);
        for (const auto& t : a.tiles) {
            if (toView(s, t, v)) fillCell(v, 1);
        }
    }
    for (const auto& e : s.enemies) {
        if (!toView(s, e.pos, v)) continue;
        setColor(e.color);
        fillCell(v, e.boss ? 0 : 2);
    }
    for (const auto& p : s.projectiles) {
        if (!toView(s, p.pos, v)) continue;
        setColor(p.color);
        fillCell(v, cell / 3);
    }
    if (toView(s, s.player, v)) {
        setColor(colors::White);
        fillCell(v, 1);
    }

    drawHud(s);
    SDL_RenderPresent(renderer);
}
