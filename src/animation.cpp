#include "animation.hpp"

namespace {

const std::vector<Vec2i> kEmptyTiles;

} // namespace

size_t Animation::frameIndex() const {
    if (frames.empty()) return 0;
    float acc = 0.0f;
    for (size_t i = 0; i < frames.size(); ++i) {
        acc += frames[i].duration;
        if (elapsed < acc) return i;
    }
    return frames.size() - 1;
}

const AnimationFrame* Animation::currentFrame() const {
    if (frames.empty() || finished()) return nullptr;
    return &frames[frameIndex()];
}

const std::vector<Vec2i>& Animation::footprint() const {
    if (frames.empty()) return kEmptyTiles;
    return frames.back().tiles;
}

bool Animation::advance(float dt) {
    if (frames.empty()) return false;
    elapsed += dt;
    if (applied) return false;
    if (frameIndex() + 1 == frames.size()) {
        applied = true;
        return true;
    }
    return false;
}

void fitDuration(std::vector<AnimationFrame>& frames, float seconds) {
    const float total = totalDuration(frames);
    if (total <= 0.0f || seconds <= 0.0f) return;
    const float k = seconds / total;
    for (auto& f : frames) f.duration *= k;
}
