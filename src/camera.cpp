#include "camera.hpp"

#include <algorithm>
#include <cmath>

namespace {

float approach(float pos, int target) {
    const float delta = static_cast<float>(target) - pos;
    if (std::fabs(delta) < CAMERA_SNAP) return static_cast<float>(target);
    return pos + delta * CAMERA_EASE;
}

} // namespace

Vec2i Camera::targetFor(Vec2i player, int floorW, int floorH, int viewW, int viewH) {
    const int maxX = std::max(0, floorW - viewW);
    const int maxY = std::max(0, floorH - viewH);
    return {clampi(player.x - viewW / 2, 0, maxX), clampi(player.y - viewH / 2, 0, maxY)};
}

void Camera::setTarget(Vec2i player, int floorW, int floorH) {
    target = targetFor(player, floorW, floorH, viewW, viewH);
}

void Camera::update() {
    x = approach(x, target.x);
    y = approach(y, target.y);
}

void Camera::snap() {
    x = static_cast<float>(target.x);
    y = static_cast<float>(target.y);
}

Vec2i Camera::offset() const {
    return {static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y))};
}
