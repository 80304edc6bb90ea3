#include "enemy.hpp"

#include <algorithm>
#include <cmath>

float Enemy::healthPercent() const {
    return static_cast<float>(std::max(0, hp)) * 100.0f / static_cast<float>(std::max(1, maxHp));
}

void Enemy::setHp(int v) {
    hp = clampi(v, 0, std::max(1, maxHp));
    if (hp == 0) dead = true;
}

Enemy makeEnemy(const EnemyTemplate& t, int id, Vec2i pos, Difficulty d) {
    Enemy e;
    e.id = id;
    e.name = t.name;
    e.pos = pos;
    e.spawn = pos;
    e.speed = t.speed;
    e.baseSpeed = t.speed;
    e.maxHp = std::max(1, t.hp);
    e.hp = e.maxHp;
    e.rarity = t.rarity;
    e.element = t.element;
    e.attacks = t.attacks;
    for (const auto& a : e.attacks) e.attackCooldowns.emplace_back(a.cooldown);
    e.ultimate = t.ultimate;
    if (e.ultimate) e.ultimateCooldown.setDuration(e.ultimate->cooldown);
    e.buffs = t.buffs;
    e.detectionRadius = detectionRadius(t.rarity, d);
    return e;
}

Enemy makeBoss(BossKind k, int id, Vec2i pos, Difficulty d, double now) {
    const BossProfile& p = bossProfile(k);
    Enemy e;
    e.id = id;
    e.name = bossName(k);
    e.pos = pos;
    e.spawn = pos;
    e.speed = BOSS_BASE_SPEED;
    e.baseSpeed = BOSS_BASE_SPEED;
    e.maxHp = p.maxHp;
    e.hp = p.maxHp;
    e.rarity = Rarity::Boss;
    e.element = (k == BossKind::ShadowAssassin) ? Element::Ghost : Element::Undead;
    e.detectionRadius = detectionRadius(Rarity::Boss, d);
    e.boss = makeBossState(k, now);
    return e;
}

int rollAttackDamage(const EnemyAttack& a, RNG& rng) {
    const int lo = std::max(1, a.minDamage);
    const int hi = std::max(lo, a.maxDamage);
    return rng.range(lo, hi);
}

int ultimateDamage(const EnemyUltimate& u) {
    const float v = static_cast<float>(u.baseDamage) * ultimatePowerMultiplier(u.power);
    return std::max(1, static_cast<int>(std::ceil(v)));
}
