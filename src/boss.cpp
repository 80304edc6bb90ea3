#include "boss.hpp"

#include <algorithm>

namespace {

using AP = AttackPattern;

BossProfile profile(BossKind k, int hp, int dmg, int radius, std::vector<AttackPattern> patterns) {
    BossProfile p;
    p.kind = k;
    p.maxHp = hp;
    p.baseDamage = dmg;
    p.attackRadius = radius;
    p.patterns = std::move(patterns);
    return p;
}

const std::vector<BossProfile>& profiles() {
    static const std::vector<BossProfile> all = {
        profile(BossKind::GoblinOverlord, 120, 25, 2,
                {AP::whirlwind(), AP::basicSlash(), AP::groundSlam(2)}),
        profile(BossKind::SkeletalKnight, 180, 35, 3,
                {AP::basicSlash(), AP::swordThrust(2), AP::groundSlam(1)}),
        profile(BossKind::FlameSorcerer, 100, 30, 4,
                {AP::fireball(3), AP::meteorShower(4, 2), AP::fireball(2)}),
        profile(BossKind::ShadowAssassin, 110, 40, 2,
                {AP::swordThrust(2), AP::whirlwind(), AP::basicSlash()}),
        profile(BossKind::CorruptedWarden, 200, 28, 3,
                {AP::chainLightning(4), AP::fireball(3), AP::frostNova(3)}),
    };
    return all;
}

} // namespace

const char* bossName(BossKind k) {
    switch (k) {
        case BossKind::GoblinOverlord:  return "Goblin Overlord";
        case BossKind::SkeletalKnight:  return "Skeletal Knight";
        case BossKind::FlameSorcerer:   return "Flame Sorcerer";
        case BossKind::ShadowAssassin:  return "Shadow Assassin";
        case BossKind::CorruptedWarden: return "Corrupted Warden";
    }
    return "Goblin Overlord";
}

const char* bossPhaseName(BossPhase p) {
    switch (p) {
        case BossPhase::First:  return "FIRST";
        case BossPhase::Second: return "SECOND";
        case BossPhase::Third:  return "THIRD";
    }
    return "FIRST";
}

const BossProfile& bossProfile(BossKind k) {
    const auto& all = profiles();
    const size_t i = static_cast<size_t>(k);
    return all[i < all.size() ? i : 0];
}

BossPhase phaseForHealth(int hp, int maxHp) {
    const float pct = static_cast<float>(std::max(0, hp)) * 100.0f / static_cast<float>(std::max(1, maxHp));
    if (pct >= 66.0f) return BossPhase::First;
    if (pct >= 33.0f) return BossPhase::Second;
    return BossPhase::Third;
}

float enrageFor(BossPhase p) {
    switch (p) {
        case BossPhase::First:  return 1.0f;
        case BossPhase::Second: return 1.2f;
        case BossPhase::Third:  return 1.5f;
    }
    return 1.0f;
}

float phaseDamageMultiplier(BossPhase p) {
    switch (p) {
        case BossPhase::First:  return 1.0f;
        case BossPhase::Second: return 1.1f;
        case BossPhase::Third:  return 1.3f;
    }
    return 1.0f;
}

BossState makeBossState(BossKind k, double now) {
    const BossProfile& p = bossProfile(k);
    BossState b;
    b.kind = k;
    b.patterns = p.patterns;
    b.baseDamage = p.baseDamage;
    b.attackRadius = p.attackRadius;
    b.maxBaseHp = p.maxHp;
    b.specialCooldown.trigger(now);
    return b;
}

bool updateBossPhase(BossState& b, int hp, double now) {
    const BossPhase next = phaseForHealth(hp, b.maxBaseHp);
    if (next == b.phase) return false;

    b.phase = next;
    b.enrage = enrageFor(next);
    b.transitionCooldown.trigger(now);
    return true;
}

int effectiveDamage(const BossState& b) {
    const float v = static_cast<float>(b.baseDamage) * phaseDamageMultiplier(b.phase) * b.enrage;
    return std::max(1, static_cast<int>(v));
}

AttackPattern nextBossPattern(BossState& b) {
    if (b.patterns.empty()) return AttackPattern::basicSlash();
    const size_t i = b.patternIndex % b.patterns.size();
    b.patternIndex = (i + 1) % b.patterns.size();
    return b.patterns[i];
}

BossSpecialResult tryBossSpecial(BossState& b, double now) {
    BossSpecialResult r;
    if (!b.transitionCooldown.isReady(now)) return r;
    if (!b.specialCooldown.isReady(now)) return r;

    switch (b.kind) {
        case BossKind::GoblinOverlord:
            r.effect = BossSpecial::SpeedBoost;
            r.newSpeed = GOBLIN_RUSH_SPEED;
            b.specialTimer = 2.0f;
            break;
        case BossKind::ShadowAssassin:
            r.effect = BossSpecial::SpeedBoost;
            r.newSpeed = ASSASSIN_RUSH_SPEED;
            b.specialTimer = 2.0f;
            break;
        case BossKind::SkeletalKnight:
            r.effect = BossSpecial::Defensive;
            b.defensive = true;
            b.specialTimer = 3.0f;
            break;
        case BossKind::FlameSorcerer:
            r.effect = BossSpecial::Defensive;
            b.defensive = true;
            b.specialTimer = 2.5f;
            break;
        case BossKind::CorruptedWarden:
            r.effect = BossSpecial::Heal;
            r.heal = b.maxBaseHp / 4;
            break;
    }
    b.specialCooldown.trigger(now);
    return r;
}

bool tickBossSpecial(BossState& b, float dt) {
    if (b.specialTimer <= 0.0f) return false;
    b.specialTimer -= dt;
    if (b.specialTimer > 0.0f) return false;
    b.specialTimer = 0.0f;
    b.defensive = false;
    return true;
}

int bossRegenPerTick(const BossState& b) {
    if (b.kind != BossKind::CorruptedWarden) return 0;
    switch (b.phase) {
        case BossPhase::First:  return 1;
        case BossPhase::Second: return 2;
        case BossPhase::Third:  return 3;
    }
    return 0;
}

