#pragma once

#include "common.hpp"

constexpr float CAMERA_EASE = 0.05f;
constexpr float CAMERA_SNAP = 0.1f;

// Smoothed follow camera. Only shapes the render snapshot.
struct Camera {
    int viewW = 80;
    int viewH = 24;
    float x = 0.0f;
    float y = 0.0f;
    Vec2i target{};

    // player - viewport/2, clamped to [0, floor - viewport] and never negative.
    static Vec2i targetFor(Vec2i player, int floorW, int floorH, int viewW, int viewH);

    void setTarget(Vec2i player, int floorW, int floorH);

    // pos += (target - pos) * ease; snaps per axis when |delta| < 0.1.
    void update();

    // Jumps straight to the target (floor changes, loads).
    void snap();

    Vec2i offset() const;
};
