#include "player.hpp"

#include <algorithm>
#include <cmath>

float Player::healthPercent() const {
    const int m = std::max(1, maxHp);
    return 100.0f * static_cast<float>(std::max(0, hp)) / static_cast<float>(m);
}

void Player::setHp(int v) {
    if (maxHp < 1) maxHp = 1;
    hp = clampi(v, 0, maxHp);
}

int Player::heal(int amount) {
    if (amount <= 0 || hp <= 0) return 0;
    const int before = hp;
    setHp(hp + amount);
    return hp - before;
}

int Player::skillMaxHp() const {
    return std::max(1, static_cast<int>(std::ceil(PLAYER_BASE_HP * skills.healthMultiplier())));
}

void Player::applySkillBonuses() {
    const float ratio = static_cast<float>(hp) / static_cast<float>(std::max(1, maxHp));
    maxHp = skillMaxHp();
    setHp(static_cast<int>(std::ceil(ratio * static_cast<float>(maxHp))));
}

SkillPurchase Player::purchaseSkill(SkillPath p) {
    const SkillPurchase r = skills.purchase(p, gold);
    if (r == SkillPurchase::Ok) applySkillBonuses();
    return r;
}

bool Player::isBlocking(double now) const {
    return blockedAt && (now - *blockedAt) < PLAYER_BLOCK_GUARD_SEC;
}

bool Player::isInvulnerable(double now) const {
    return ultimate.kind() == UltimateKind::Ghost && ultimate.active(now);
}

bool Player::isRaging(double now) const {
    return ultimate.kind() == UltimateKind::Rage && ultimate.active(now);
}

int Player::moveGateTicks(double now) const {
    if (isRaging(now)) return 1;
    const float speed = skills.speedMultiplier();
    int gate = std::max(1, static_cast<int>(std::lround(static_cast<float>(PLAYER_MOVE_TICKS) / speed)));
    if (status.has(StatusKind::Cripple)) gate *= 2;
    return gate;
}

bool Player::canMove(uint64_t tick, double now) const {
    if (!lastMoveTick) return true;
    if (tick < *lastMoveTick) return true;
    return tick - *lastMoveTick >= static_cast<uint64_t>(moveGateTicks(now));
}

int Player::weaponDamage(const Weapon& w, double now) const {
    float dmg = static_cast<float>(w.damage + (attackDamage - PLAYER_BASE_DAMAGE));
    dmg *= skills.damageMultiplier();
    if (isRaging(now)) dmg *= 2.0f;
    return std::max(1, static_cast<int>(std::lround(dmg)));
}
