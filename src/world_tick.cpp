#include "world.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace {

constexpr std::array<Vec2i, 4> kCardinals = {{{0, -1}, {0, 1}, {-1, 0}, {1, 0}}};

// Integer part of the accumulated damage; the remainder stays in `carry`.
int drainCarry(float& carry, float amount) {
    carry += amount;
    if (carry < 1.0f) return 0;
    const int whole = static_cast<int>(std::floor(carry));
    carry -= static_cast<float>(whole);
    return whole;
}

bool knockActive(float kx, float ky) {
    return std::fabs(kx) >= KNOCKBACK_EPSILON || std::fabs(ky) >= KNOCKBACK_EPSILON;
}

void dampKnock(float& kx, float& ky) {
    kx *= KNOCKBACK_DAMPING;
    ky *= KNOCKBACK_DAMPING;
    if (std::fabs(kx) < KNOCKBACK_EPSILON && std::fabs(ky) < KNOCKBACK_EPSILON) {
        kx = 0.0f;
        ky = 0.0f;
    }
}

} // namespace

void World::updateStatuses(float dt) {
    std::vector<StatusKind> expired;
    player_.status.update(dt, &expired);
    for (StatusKind k : expired) pushMessage(statusEndMessage(k), MessageKind::Info);

    for (auto& e : enemies_) {
        if (!e.alive()) continue;
        e.status.update(dt);
    }
}

void World::applyDamageOverTime(float dt) {
    const float playerDps = player_.status.totalDps();
    if (playerDps > 0.0f) {
        const int dmg = drainCarry(player_.dotCarry, playerDps * dt);
        if (dmg > 0 && !player_.isInvulnerable(now_)) player_.setHp(player_.hp - dmg);
    } else {
        player_.dotCarry = 0.0f;
    }

    for (auto& e : enemies_) {
        if (!e.alive()) continue;

        const float dps = e.status.totalDps();
        if (dps > 0.0f) {
            const int dmg = drainCarry(e.dotCarry, dps * dt);
            if (dmg > 0) e.setHp(e.hp - dmg);
        } else {
            e.dotCarry = 0.0f;
        }

        const int regen = buffAmount(e.buffs, BuffKind::Regeneration);
        if (regen > 0 && e.alive()) {
            const int heal = drainCarry(e.regenCarry, static_cast<float>(regen) * dt);
            if (heal > 0) e.setHp(e.hp + heal);
        }
    }
}

void World::updateEnemies(float dt) {
    for (auto& e : enemies_) {
        if (!e.alive()) continue;

        applyKnockback(e);
        if (e.boss) updateBoss(e, dt);
        if (e.status.has(StatusKind::Stun)) continue;

        ++e.attackTicks;
        enemyTryAttack(e);
        enemyMove(e);
    }
}

void World::updateBoss(Enemy& e, float dt) {
    BossState& b = *e.boss;
    const BossPhase before = b.phase;
    if (updateBossPhase(b, e.hp, now_)) {
        if (b.phase > before) {
            pushMessage(toUpper(e.name) + " ENTERS ITS " + toUpper(bossPhaseName(b.phase)) + " PHASE!",
                        MessageKind::Warning, false);
        }
    }

    if (tickBossSpecial(b, dt)) {
        e.speed = e.baseSpeed;
    }

    const BossSpecialResult r = tryBossSpecial(b, now_);
    switch (r.effect) {
        case BossSpecial::SpeedBoost:
            e.speed = r.newSpeed;
            pushMessage(toUpper(e.name) + " SURGES FORWARD!", MessageKind::Warning, false);
            break;
        case BossSpecial::Defensive:
            pushMessage(toUpper(e.name) + " RAISES ITS GUARD.", MessageKind::Warning, false);
            break;
        case BossSpecial::Heal:
            e.setHp(e.hp + r.heal);
            pushMessage(toUpper(e.name) + " DRAWS LIFE FROM THE CRYPT.", MessageKind::Warning, false);
            break;
        case BossSpecial::None:
        default:
            break;
    }

    const int regen = bossRegenPerTick(b);
    if (regen > 0) e.setHp(e.hp + regen);
}

void World::enemyTryAttack(Enemy& e) {
    if (e.attackTicks < ENEMY_ATTACK_TICKS) return;
    if (!player_.actedThisFloor || !player_.alive()) return;

    const int dist = manhattan(e.pos, player_.pos);
    const Vec2i dir = cardinalToward(e.pos, player_.pos);

    if (e.boss) {
        if (dist > e.boss->attackRadius) return;
        if (!e.boss->transitionCooldown.isReady(now_)) return;
        const AttackPattern p = nextBossPattern(*e.boss);
        spawnEnemyAttack(e, p, effectiveDamage(*e.boss), DamageType::Physical, std::nullopt);
        return;
    }

    if (e.rarity >= Rarity::Champion && e.ultimate && e.ultimateCooldown.isReady(now_) &&
        dist <= e.ultimate->areaRadius) {
        e.ultimateCooldown.trigger(now_);
        pushMessage(toUpper(e.name) + " UNLEASHES " + toUpper(e.ultimate->name) + "!", MessageKind::Warning, false);
        spawnEnemyAttack(e, e.ultimate->pattern, ultimateDamage(*e.ultimate), DamageType::Physical, std::nullopt);
        return;
    }

    for (size_t i = 0; i < e.attacks.size(); ++i) {
        if (i < e.attackCooldowns.size() && !e.attackCooldowns[i].isReady(now_)) continue;
        const EnemyAttack& a = e.attacks[i];
        const std::vector<Vec2i> tiles = affectedTiles(a.pattern, e.pos, dir);
        if (std::find(tiles.begin(), tiles.end(), player_.pos) == tiles.end()) continue;

        if (i < e.attackCooldowns.size()) e.attackCooldowns[i].trigger(now_);
        spawnEnemyAttack(e, a.pattern, rollAttackDamage(a, rng_), a.type, a.effect);
        return;
    }

    if (dist <= 1) {
        spawnEnemyAttack(e, AttackPattern::basicSlash(), rarityFallbackDamage(e.rarity), DamageType::Physical,
                         std::nullopt);
    }
}

void World::enemyMove(Enemy& e) {
    float rate = e.speed * (1.0f + static_cast<float>(buffAmount(e.buffs, BuffKind::Speed)) / 100.0f);
    if (e.status.has(StatusKind::Cripple)) rate *= 0.5f;
    e.moveAccum = std::min(ENEMY_MOVE_ACCUM_CAP, e.moveAccum + rate);
    if (e.moveAccum < 1.0f) return;

    std::optional<Vec2i> step;
    if (e.status.has(StatusKind::Fear)) {
        step = fleeStep(e);
    } else if (manhattan(e.pos, player_.pos) <= e.detectionRadius) {
        // Adjacent chasers hold position and attack.
        if (manhattan(e.pos, player_.pos) <= 1) return;
        step = chaseStep(e);
        if (!step) step = wanderStep(e);
    } else {
        step = wanderStep(e);
    }

    if (step && tryMoveEnemy(e, *step)) e.moveAccum -= 1.0f;
}

std::optional<Vec2i> World::chaseStep(const Enemy& e) {
    const bool ghost = e.isGhost();
    const std::vector<Vec2i>* path = pathCache_.find(e.pos, player_.pos, ghost);
    if (!path) {
        const Floor& f = floor_;
        PassableFn passable;
        if (ghost) {
            passable = [&f](int x, int y) { return x > 0 && y > 0 && x < f.width - 1 && y < f.height - 1; };
        } else {
            passable = [&f](int x, int y) { return f.isWalkable(x, y); };
        }
        std::vector<Vec2i> fresh =
            astarPath(floor_.width, floor_.height, e.pos, player_.pos, passable, PATH_MAX_EXPANSIONS);
        pathCache_.store(e.pos, player_.pos, ghost, std::move(fresh));
        path = pathCache_.find(e.pos, player_.pos, ghost);
    }
    if (!path || path->size() < 2) return std::nullopt;

    const Vec2i next = (*path)[1];
    if (!enemyCanEnter(e, next)) return std::nullopt;
    return next;
}

std::optional<Vec2i> World::wanderStep(const Enemy& e) {
    std::array<Vec2i, 4> dirs = kCardinals;
    for (size_t i = dirs.size(); i > 1; --i) {
        const size_t j = static_cast<size_t>(rng_.nextU32() % static_cast<uint32_t>(i));
        std::swap(dirs[i - 1], dirs[j]);
    }
    for (const Vec2i& d : dirs) {
        const Vec2i to = e.pos + d;
        if (e.leashRadius && manhattan(to, e.spawn) > *e.leashRadius) continue;
        if (enemyCanEnter(e, to)) return to;
    }
    return std::nullopt;
}

std::optional<Vec2i> World::fleeStep(const Enemy& e) const {
    std::optional<Vec2i> best;
    int bestDist = manhattan(e.pos, player_.pos);
    for (const Vec2i& d : kCardinals) {
        const Vec2i to = e.pos + d;
        if (!enemyCanEnter(e, to)) continue;
        const int dist = manhattan(to, player_.pos);
        if (dist > bestDist) {
            bestDist = dist;
            best = to;
        }
    }
    return best;
}

bool World::enemyCanEnter(const Enemy& e, Vec2i to) const {
    if (!floor_.inBounds(to.x, to.y)) return false;
    if (e.isGhost()) {
        if (to.x <= 0 || to.y <= 0 || to.x >= floor_.width - 1 || to.y >= floor_.height - 1) return false;
    } else if (!floor_.isWalkable(to)) {
        return false;
    }
    if (to == player_.pos) return false;
    for (const auto& o : enemies_) {
        if (o.id == e.id || !o.alive() || !o.collision) continue;
        if (o.pos == to) return false;
    }
    return true;
}

bool World::tryMoveEnemy(Enemy& e, Vec2i to) {
    if (!enemyCanEnter(e, to)) return false;
    e.pos = to;
    return true;
}

void World::applyKnockback(Enemy& e) {
    if (!knockActive(e.knockX, e.knockY)) {
        e.knockX = 0.0f;
        e.knockY = 0.0f;
        return;
    }

    const Vec2i step{static_cast<int>(std::lround(e.knockX)), static_cast<int>(std::lround(e.knockY))};
    if (!isZero(step) && !tryMoveEnemy(e, e.pos + step)) {
        if (step.x == 0 || !tryMoveEnemy(e, e.pos + Vec2i{step.x, 0})) {
            if (step.y != 0) tryMoveEnemy(e, e.pos + Vec2i{0, step.y});
        }
    }
    dampKnock(e.knockX, e.knockY);
}

void World::applyPlayerKnockback() {
    if (!knockActive(player_.knockX, player_.knockY)) {
        player_.knockX = 0.0f;
        player_.knockY = 0.0f;
        return;
    }

    auto canEnter = [&](Vec2i to) { return floor_.isWalkable(to) && !enemyAt(to); };
    const Vec2i step{static_cast<int>(std::lround(player_.knockX)), static_cast<int>(std::lround(player_.knockY))};
    if (!isZero(step)) {
        Vec2i to = player_.pos + step;
        if (!canEnter(to)) {
            to = player_.pos + Vec2i{step.x, 0};
            if (step.x == 0 || !canEnter(to)) to = player_.pos + Vec2i{0, step.y};
        }
        if (to != player_.pos && canEnter(to)) player_.pos = to;
    }
    dampKnock(player_.knockX, player_.knockY);
}

void World::updateProjectiles(float dt) {
    for (auto& p : projectiles_) {
        if (p.dead) continue;

        // Only the player shoots, so only enemies stop a projectile.
        OccupiedFn occupied = [&](Vec2i t) {
            for (int id : enemyHash_.idsAt(t)) {
                const Enemy* e = enemyById(id);
                if (e && e->alive()) return true;
            }
            return false;
        };

        const ProjectileStep step = advanceProjectile(p, dt, floor_, occupied);
        if (step.stopped) resolveImpact(p, step.impact);
    }

    projectiles_.erase(std::remove_if(projectiles_.begin(), projectiles_.end(),
                                      [](const Projectile& p) { return p.dead; }),
                       projectiles_.end());
}

void World::updateAnimations(float dt) {
    for (auto& a : animations_) {
        if (a.advance(dt) && a.owner != AnimationOwner::Decoration) applyAnimationDamage(a);
    }

    animations_.erase(std::remove_if(animations_.begin(), animations_.end(),
                                     [](const Animation& a) { return a.finished(); }),
                      animations_.end());
}

void World::sweepDeaths() {
    for (const auto& e : enemies_) {
        if (e.alive()) continue;

        dropLoot(e);
        player_.enemiesKilled += 1;
        if (e.isBoss()) {
            pushMessage(toUpper(e.name) + " IS DEFEATED!", MessageKind::Success);
        } else {
            pushMessage("THE " + toUpper(e.name) + " DIES.", MessageKind::Combat);
        }
    }

    enemies_.erase(std::remove_if(enemies_.begin(), enemies_.end(), [](const Enemy& e) { return !e.alive(); }),
                   enemies_.end());
}

void World::checkFloorCleared() {
    if (!cfg_.autoAdvanceFloors) return;
    if (!enemies_.empty() || enemiesSpawnedThisFloor_ == 0) return;
    if (!player_.actedThisFloor) return;

    if (isBossFloor()) {
        state_ = GameState::Victory;
        pushMessage("THE CRYPT FALLS SILENT. YOU ARE VICTORIOUS!", MessageKind::Success, false);
        return;
    }
    startFloor(floorLevel_ + 1, floorSeed_ + 1);
}

void World::updateCamera() {
    camera_.setTarget(player_.pos, floor_.width, floor_.height);
    camera_.update();
}
