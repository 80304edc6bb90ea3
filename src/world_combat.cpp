#include "world.hpp"

#include <algorithm>
#include <cmath>

namespace {

// Unit push direction from `from` toward `to`; falls back to `fallback`.
Vec2i pushDir(Vec2i from, Vec2i to, Vec2i fallback) {
    const Vec2i d{sign(to.x - from.x), sign(to.y - from.y)};
    return isZero(d) ? fallback : d;
}

} // namespace

void World::applyAnimationDamage(const Animation& a) {
    std::vector<Vec2i> tiles = a.footprint();
    std::sort(tiles.begin(), tiles.end(), [](const Vec2i& l, const Vec2i& r) {
        return l.y != r.y ? l.y < r.y : l.x < r.x;
    });
    tiles.erase(std::unique(tiles.begin(), tiles.end()), tiles.end());

    if (a.owner == AnimationOwner::Enemy) {
        if (std::find(tiles.begin(), tiles.end(), player_.pos) == tiles.end()) return;
        const Enemy* attacker = enemyById(a.attackerId);
        if (attacker && !attacker->alive()) attacker = nullptr;
        const Vec2i knock = pushDir(a.origin, player_.pos, a.dir);
        const int dealt = hitPlayer(a.damage, a.type, attacker, knock, a.knockback);
        if (dealt > 0 && a.onHit) {
            StatusEffect s = makeStatus(a.onHit->kind, a.onHit->duration);
            if (a.onHit->dps > 0.0f) s.dps = a.onHit->dps;
            if (player_.status.apply(s)) {
                pushMessage(std::string("YOU ARE AFFLICTED: ") + statusTag(s.kind) + ".", MessageKind::Warning);
            }
        }
        return;
    }

    // Player attacks: the first live enemy on each footprint tile.
    for (const Vec2i& t : tiles) {
        Enemy* target = nullptr;
        for (int id : enemyHash_.idsAt(t)) {
            Enemy* e = enemyById(id);
            if (e && e->alive() && e->pos == t) {
                target = e;
                break;
            }
        }
        if (!target) continue;
        if (!floor_.isWalkable(t) && !target->isGhost()) continue;

        const Vec2i knock = pushDir(a.origin, target->pos, a.dir);
        const int dealt = hitEnemy(*target, a.damage, a.type, knock, a.knockback);
        if (dealt > 0 && a.onHit) {
            StatusEffect s = makeStatus(a.onHit->kind, a.onHit->duration);
            if (a.onHit->dps > 0.0f) s.dps = a.onHit->dps;
            target->status.apply(s);
        }
    }
}

int World::hitEnemy(Enemy& e, int baseDamage, DamageType type, Vec2i knockDir, float knockForce) {
    if (!e.alive()) return 0;

    if (hasBuff(e.buffs, BuffKind::PhaseShift) && rng_.chance(0.2f)) {
        pushMessage("THE " + toUpper(e.name) + " PHASES THROUGH YOUR ATTACK.", MessageKind::Combat);
        return 0;
    }

    int base = baseDamage;
    if (e.boss && e.boss->defensive) base = std::max(1, base / 2);

    DamageInput in;
    in.baseDamage = base;
    in.type = type;
    in.attackerHp = player_.hp;
    in.attackerMaxHp = player_.maxHp;
    in.targetElement = e.element;
    in.targetBuffs = &e.buffs;
    const DamageResult r = resolveDamage(in, rng_);

    e.setHp(e.hp - r.damage);
    e.damagedAt = now_;
    player_.ultimate.addCharge(r.damage);

    std::string msg = r.critical ? "CRITICAL! " : "";
    msg += "YOU HIT THE " + toUpper(e.name) + " FOR " + std::to_string(r.damage) + ".";
    pushMessage(msg, MessageKind::Combat);

    if (knockForce > 0.0f && e.alive() && !e.isBoss()) {
        e.knockX = static_cast<float>(knockDir.x) * knockForce;
        e.knockY = static_cast<float>(knockDir.y) * knockForce;
    }
    return r.damage;
}

int World::hitPlayer(int baseDamage, DamageType type, const Enemy* attacker, Vec2i knockDir, float knockForce) {
    if (!player_.alive()) return 0;
    const std::string who = attacker ? "THE " + toUpper(attacker->name) : std::string("SOMETHING");

    if (player_.isInvulnerable(now_)) {
        pushMessage(who + "'S ATTACK PASSES THROUGH YOU.", MessageKind::Combat, false);
        return 0;
    }
    if (player_.isBlocking(now_)) {
        pushMessage("YOU BLOCK " + who + "'S ATTACK.", MessageKind::Combat);
        return 0;
    }

    DamageInput in;
    in.baseDamage = baseDamage;
    in.type = type;
    if (attacker) {
        in.attackerBuffs = &attacker->buffs;
        in.attackerHp = attacker->hp;
        in.attackerMaxHp = attacker->maxHp;
    }
    const DamageResult r = resolveDamage(in, rng_);

    player_.setHp(player_.hp - r.damage);
    player_.ultimate.addCharge(r.damage);
    pushMessage(who + " HITS YOU FOR " + std::to_string(r.damage) + ".", MessageKind::Combat, false);

    if (knockForce > 0.0f) {
        player_.knockX = static_cast<float>(knockDir.x) * knockForce;
        player_.knockY = static_cast<float>(knockDir.y) * knockForce;
    }
    return r.damage;
}

void World::spawnEnemyAttack(Enemy& e, const AttackPattern& pattern, int damage, DamageType type,
                             const std::optional<AttackEffect>& effect) {
    const Vec2i dir = cardinalToward(e.pos, player_.pos);

    Animation a;
    a.frames = animationFrames(pattern, e.pos, dir);
    a.owner = AnimationOwner::Enemy;
    a.attackerId = e.id;
    a.damage = std::max(1, damage);
    a.type = type;
    a.origin = e.pos;
    a.dir = dir;
    a.knockback = patternKnocksBack(pattern) ? ENEMY_KNOCKBACK_FORCE : 0.0f;
    if (effect) {
        AnimationHitEffect h;
        h.kind = effect->kind;
        h.duration = effect->duration;
        h.dps = effect->dps;
        a.onHit = h;
    }
    animations_.push_back(std::move(a));
    e.attackTicks = 0;
}

void World::resolveImpact(const Projectile& p, Vec2i impact) {
    const std::vector<Vec2i> area = impactArea(impact, p.impactRadius());
    const bool fireOil = p.kind == ProjectileKind::FireOil;

    for (auto& e : enemies_) {
        if (!e.alive()) continue;
        if (std::find(area.begin(), area.end(), e.pos) == area.end()) continue;
        const int dealt = hitEnemy(e, p.damage, p.type, p.dir, 0.0f);
        if (dealt > 0 && fireOil) e.status.apply(makeBurn(FIRE_OIL_BURN_SEC));
    }

    if (fireOil) {
        // Short-lived flames; decoration only.
        AnimationFrame f;
        f.tiles = area;
        f.color = colors::Orange;
        f.glyph = "^";
        f.duration = 0.5f;

        Animation burn;
        burn.frames.push_back(std::move(f));
        burn.owner = AnimationOwner::Decoration;
        burn.origin = impact;
        animations_.push_back(std::move(burn));
        pushMessage("THE FIRE OIL BURSTS INTO FLAME!", MessageKind::Combat);
    }
}

void World::dropLoot(const Enemy& e) {
    auto taken = [&](Vec2i q) { return tileHasItem(q); };

    const float loot = e.boss ? e.boss->lootMultiplier : 1.0f;
    const uint32_t gold = goldDrop(e.rarity, cfg_.difficulty, loot);
    if (gold > 0) items_.push_back(makeGoldDrop(dropPosition(floor_, e.pos, taken), gold));

    if (rng_.chance(WEAPON_DROP_CHANCE)) {
        const ItemTier tier = rollWeaponDropTier(cfg_.difficulty, rng_);
        const Weapon w = randomWeapon(tier, rng_);
        items_.push_back(makeWeaponDrop(dropPosition(floor_, e.pos, taken), w));
        pushMessage("THE " + toUpper(e.name) + " DROPS A " + toUpper(w.name) + ".", MessageKind::Loot);
    }
}
