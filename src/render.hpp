#pragma once

#include "sdl.hpp"

#include "snapshot.hpp"

#include <string>

// Draws a WorldSnapshot as coloured cells with a bar HUD underneath.
// Reads only the snapshot; never touches the World.
class Renderer {
public:
    Renderer(int viewW, int viewH, int cellSize);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init(const std::string& title, std::string* err = nullptr);
    void shutdown();

    void render(const WorldSnapshot& s);
    void setTitle(const std::string& title);

private:
    static constexpr int HUD_ROWS = 3;

    int viewW = 80;
    int viewH = 24;
    int cell = 12;
    int winW = 0;
    int winH = 0;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    void setColor(const Color& c, uint8_t alpha = 255);
    void fillCell(Vec2i viewPos, int inset);
    bool toView(const WorldSnapshot& s, Vec2i world, Vec2i& out) const;

    void drawBar(int x, int y, int w, int h, float frac, const Color& fg);
    void drawHud(const WorldSnapshot& s);
};
