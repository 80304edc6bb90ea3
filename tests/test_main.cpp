#include "attack_pattern.hpp"
#include "boss.hpp"
#include "camera.hpp"
#include "combat_rules.hpp"
#include "cooldown.hpp"
#include "floor.hpp"
#include "game_save.hpp"
#include "input_script.hpp"
#include "items.hpp"
#include "loot.hpp"
#include "message_log.hpp"
#include "pathfinding.hpp"
#include "projectile.hpp"
#include "rng.hpp"
#include "script_runner.hpp"
#include "settings.hpp"
#include "skill_tree.hpp"
#include "snapshot.hpp"
#include "spawn.hpp"
#include "status_effects.hpp"
#include "ultimate.hpp"
#include "weapons.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool contains(const std::vector<Vec2i>& v, Vec2i p) {
    return std::find(v.begin(), v.end(), p) != v.end();
}

// Walled rectangle with an open interior.
Floor makeArena(int w, int h) {
    std::vector<std::string> rows;
    for (int y = 0; y < h; ++y) {
        std::string row;
        for (int x = 0; x < w; ++x) {
            const bool border = x == 0 || y == 0 || x == w - 1 || y == h - 1;
            row.push_back(border ? '#' : '.');
        }
        rows.push_back(row);
    }
    return Floor::fromRows(rows);
}

WorldConfig arenaConfig() {
    WorldConfig cfg;
    cfg.seed = 7;
    cfg.spawnEnemies = false;
    cfg.spawnItems = false;
    cfg.autoAdvanceFloors = false;
    return cfg;
}

Enemy makeDummy(Vec2i pos, int hp) {
    Enemy e;
    e.name = "Training Dummy";
    e.pos = pos;
    e.spawn = pos;
    e.maxHp = hp;
    e.hp = hp;
    e.speed = 0.0f;
    e.baseSpeed = 0.0f;
    return e;
}

fs::path tempPath(const std::string& name) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = fs::current_path();
    return dir / name;
}

void removeQuiet(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    expect(tag32("ITEMS") != tag32("ENEMIES"), "Salt tags must differ");
}

void test_floor_connected_and_deterministic() {
    const Floor a = Floor::generate(FLOOR_WIDTH, FLOOR_HEIGHT, 12345);
    const Floor b = Floor::generate(FLOOR_WIDTH, FLOOR_HEIGHT, 12345);

    expect(a.width == 180 && a.height == 60, "Floor dimensions");
    expect(a.openTileCount() > 0, "Floor has open tiles");
    expect(!a.rooms.empty(), "Floor has at least one room");

    const auto regions = floodOpenRegions(a);
    expect(regions.size() == 1, "Every open tile is reachable from any other");
    if (!regions.empty()) {
        expect(static_cast<int>(regions.front().size()) == a.openTileCount(),
               "Flood fill covers all open tiles");
    }

    for (int x = 0; x < a.width; ++x) {
        expect(a.isWall(x, 0) && a.isWall(x, a.height - 1), "Top/bottom border is wall");
    }
    for (int y = 0; y < a.height; ++y) {
        expect(a.isWall(0, y) && a.isWall(a.width - 1, y), "Left/right border is wall");
    }

    expect(a.tiles == b.tiles, "Same seed gives the same tiles");
    expect(a.rooms.size() == b.rooms.size(), "Same seed gives the same rooms");

    const Floor c = Floor::generate(FLOOR_WIDTH, FLOOR_HEIGHT, 54321);
    expect(c.tiles != a.tiles, "Different seeds give different floors");

    RNG rng(9u);
    const auto spawn = a.findPlayerSpawn(rng);
    expect(spawn.has_value() && a.isWalkable(*spawn), "Player spawn is walkable");

    const auto near = a.nearestWalkable({0, 0});
    expect(near.has_value() && a.isWalkable(*near), "nearestWalkable finds an open tile");

    for (const Room& r : a.rooms) {
        if (r.tiles.empty()) continue;
        const Vec2i t = r.tiles.front();
        expect(a.roomAt(t.x, t.y) == r.id, "Room tiles map back to their room");
    }
    expect(a.roomAt(0, 0) == -1, "Walls belong to no room");
    expect(a.roomAt(-1, 5) == -1, "Out of bounds belongs to no room");
}

void test_slash_damages_adjacent_enemy() {
    MessageLog log;
    World w(arenaConfig(), &log);
    w.installFloor(makeArena(40, 30), Vec2i{10, 10});
    w.player().facing = {1, 0};

    const int id = w.spawnEnemy(makeDummy({11, 10}, 10));

    w.queueAction(Action::Attack);
    w.tick(0.016);
    expect(w.animations().size() == 1, "Attack spawns an animation");

    for (int i = 0; i < 60 && !w.animations().empty(); ++i) w.tick(0.016);

    const Enemy* e = w.enemyById(id);
    expect(e != nullptr, "Dummy survives a single slash");
    if (e) expect(e->hp == 5, "Iron Sword slash takes 10 HP to 5");
    expect(log.countContaining("YOU HIT THE TRAINING DUMMY FOR 5.") == 1, "Hit message logged once");
    expect(w.player().ultimate.charge() > 0.0f, "Dealing damage charges the ultimate");
}

void test_fire_oil_area_damage() {
    World w(arenaConfig());
    w.installFloor(makeArena(40, 30), Vec2i{5, 5});

    const int a = w.spawnEnemy(makeDummy({20, 20}, 50));
    const int b = w.spawnEnemy(makeDummy({21, 20}, 50));
    const int c = w.spawnEnemy(makeDummy({24, 20}, 50));
    const int far = w.spawnEnemy(makeDummy({30, 20}, 50));

    const Projectile oil = makeFireOil({10, 20}, {1, 0}, 0.0);
    w.resolveImpact(oil, {22, 20});

    for (int id : {a, b, c}) {
        const Enemy* e = w.enemyById(id);
        expect(e != nullptr, "Enemy in the blast still exists");
        if (!e) continue;
        // 8 fire damage x 1.25 against undead.
        expect(e->hp == 40, "Fire oil deals 10 to undead in range");
        expect(e->status.has(StatusKind::Burn), "Fire oil sets targets burning");
    }

    const Enemy* e = w.enemyById(far);
    expect(e && e->hp == 50, "Enemy outside the radius is untouched");
    expect(e && !e->status.has(StatusKind::Burn), "Enemy outside the radius does not burn");
    expect(!w.animations().empty(), "Fire oil leaves a flame decoration");
}

void test_bleed_stacking() {
    StatusEffects s;
    expect(s.apply(makeBleed(2)), "First bleed applies");
    expect(s.apply(makeBleed(3)), "Second bleed stacks");

    expect(s.count() == 1, "Bleed keeps a single entry");
    const StatusEffect* b = s.get(StatusKind::Bleed);
    expect(b && b->stacks == 5, "Bleed stacks add up");
    expect(b && b->duration == BLEED_MAX_DURATION, "Bleed duration refreshed to the cap");

    std::vector<StatusKind> expired;
    s.update(4.0f, &expired);
    expect(s.has(StatusKind::Bleed) && expired.empty(), "Bleed still running after 4s");
    s.update(4.0f, &expired);
    expect(!s.has(StatusKind::Bleed), "Bleed removed after 8s");
    expect(expired.size() == 1 && expired.front() == StatusKind::Bleed, "Expiry reported once");
}

void test_status_rules() {
    StatusEffects s;
    expect(s.apply(makeStatus(StatusKind::PoisonImmunity, 5.0f)), "Immunity applies");
    expect(!s.apply(makeStatus(StatusKind::Poison, 3.0f)), "Poison blocked while immune");
    expect(!s.has(StatusKind::Poison), "No poison entry while immune");

    expect(s.apply(makeBurn(2.0f)), "Burn applies");
    expect(s.apply(makeBurn(3.0f)), "Burns stack independently");
    expect(s.totalDps() > defaultStatusDps(StatusKind::Burn), "Two burns deal more than one");

    expect(s.apply(makeStatus(StatusKind::Stun, 1.0f)), "Stun applies");
    expect(s.apply(makeStatus(StatusKind::Stun, 2.0f)), "Stun replaces");
    const StatusEffect* stun = s.get(StatusKind::Stun);
    expect(stun && stun->duration == 2.0f, "Later stun replaces the earlier one");

    expect(!s.apply(makeStatus(StatusKind::Fear, 0.0f)), "Zero-length effects are rejected");

    s.remove(StatusKind::Stun);
    expect(!s.has(StatusKind::Stun), "remove() drops the effect");
    s.clear();
    expect(s.count() == 0, "clear() empties the list");
}

void test_boss_phases() {
    const BossProfile& prof = bossProfile(BossKind::SkeletalKnight);
    expect(prof.maxHp == 180, "Skeletal Knight has 180 HP");

    BossState b = makeBossState(BossKind::SkeletalKnight, 0.0);
    expect(b.phase == BossPhase::First, "Boss starts in the first phase");
    expect(b.enrage == 1.0f, "Boss starts calm");
    const int d1 = effectiveDamage(b);

    expect(updateBossPhase(b, 90, 1.0), "50% HP changes phase");
    expect(b.phase == BossPhase::Second, "50% HP is the second phase");
    expect(b.enrage == 1.2f, "Second phase enrage");
    const int d2 = effectiveDamage(b);

    expect(updateBossPhase(b, 35, 2.0), "19% HP changes phase");
    expect(b.phase == BossPhase::Third, "19% HP is the third phase");
    expect(b.enrage == 1.5f, "Third phase enrage");
    const int d3 = effectiveDamage(b);

    expect(d1 <= d2 && d2 <= d3, "Boss damage never drops across phases");
    expect(!updateBossPhase(b, 30, 3.0), "Same phase is not a transition");

    expect(updateBossPhase(b, 170, 4.0), "Healing back above 66% changes phase");
    expect(b.phase == BossPhase::First && b.enrage == 1.0f, "Enrage follows the phase after healing");

    BossState warden = makeBossState(BossKind::CorruptedWarden, 0.0);
    const int wardenMax = bossProfile(BossKind::CorruptedWarden).maxHp;
    updateBossPhase(warden, wardenMax / 4, 1.0);
    expect(warden.phase == BossPhase::Third && warden.enrage == 1.5f, "Warden at 25% is enraged");
    updateBossPhase(warden, wardenMax / 2, 2.0);
    expect(warden.phase == BossPhase::Second && warden.enrage == 1.2f, "Warden healed to 50% drops to second-phase enrage");

    BossState knight = makeBossState(BossKind::SkeletalKnight, 0.0);
    expect(updateBossPhase(knight, 90, 8.5), "Knight changes phase at 8.5 s");
    expect(tryBossSpecial(knight, 9.0).effect == BossSpecial::None, "No special during a phase transition");
    expect(tryBossSpecial(knight, 10.1).effect == BossSpecial::Defensive, "Special fires once the transition ends");
    expect(tryBossSpecial(knight, 10.2).effect == BossSpecial::None, "Special restarts its cooldown");

    const size_t n = b.patterns.size();
    expect(n > 0, "Boss has attack patterns");
    if (n > 0) {
        const AttackPattern first = nextBossPattern(b);
        for (size_t i = 1; i < n; ++i) nextBossPattern(b);
        const AttackPattern again = nextBossPattern(b);
        expect(first.kind == again.kind, "Boss patterns cycle");
    }
}

void test_astar_around_wall() {
    // Column x=2 is wall except the top and bottom rows.
    auto solid = [](int x, int y) { return !(x == 2 && y >= 1 && y <= 3); };
    const auto path = astarPath(5, 5, {0, 2}, {4, 2}, solid);

    expect(!path.empty(), "Path exists around the wall");
    if (!path.empty()) {
        expect(path.front() == Vec2i{0, 2} && path.back() == Vec2i{4, 2}, "Path endpoints");
    }
    expect(contains(path, {2, 0}) || contains(path, {2, 4}), "Path goes through a gap");
    expect(!contains(path, {2, 2}), "Path never crosses the wall");
    for (size_t i = 1; i < path.size(); ++i) {
        expect(manhattan(path[i - 1], path[i]) == 1, "Path steps are 4-connected");
    }

    auto ghost = [](int, int) { return true; };
    const auto through = astarPath(5, 5, {0, 2}, {4, 2}, ghost);
    expect(contains(through, {2, 2}), "Ghost path goes straight through the wall");
    expect(through.size() == 5, "Ghost path is the straight line");

    auto sealed = [](int x, int) { return x != 2; };
    expect(astarPath(5, 5, {0, 2}, {4, 2}, sealed).empty(), "No path through a sealed wall");

    PathCache cache(4);
    expect(cache.find({0, 2}, {4, 2}, false) == nullptr, "Empty cache misses");
    cache.store({0, 2}, {4, 2}, false, path);
    const auto* cached = cache.find({0, 2}, {4, 2}, false);
    expect(cached && *cached == path, "Cache returns the stored path");
    expect(cache.find({0, 2}, {4, 2}, true) == nullptr, "Ghost paths are cached separately");
}

void test_attack_pattern_footprints() {
    const Vec2i o{20, 20};
    const Vec2i right{1, 0};

    const auto slash = affectedTiles(AttackPattern::basicSlash(), o, right);
    expect(slash.size() == 3, "Slash covers a three-tile arc");
    expect(contains(slash, {21, 20}) && contains(slash, {21, 19}) && contains(slash, {21, 21}),
           "Slash arc sits in front of the attacker");

    const auto slam = affectedTiles(AttackPattern::groundSlam(2), o, right);
    expect(slam.size() == 8 && !contains(slam, o), "Ground slam ends on its outer ring");

    const auto thrust = affectedTiles(AttackPattern::swordThrust(3), o, right);
    expect(thrust.size() == 7, "Sword thrust footprint");
    expect(contains(thrust, {23, 20}) && !contains(thrust, {19, 20}), "Thrust points forward");

    const auto ball = affectedTiles(AttackPattern::fireball(2), o, right);
    expect(ball.size() == 13 && contains(ball, o), "Fireball fills a disc");

    const std::vector<AttackPattern> all = {
        AttackPattern::basicSlash(),       AttackPattern::groundSlam(2),
        AttackPattern::whirlwind(),        AttackPattern::swordThrust(3),
        AttackPattern::arrowShot(5),       AttackPattern::multiShot(5, 2),
        AttackPattern::barrage(3),         AttackPattern::piercingShot(4),
        AttackPattern::fireball(3),        AttackPattern::chainLightning(3),
        AttackPattern::frostNova(3),       AttackPattern::meteorShower(3, 1),
        AttackPattern::crescentSlash(),    AttackPattern::vortex(3),
    };
    for (const auto& p : all) {
        const auto frames = animationFrames(p, o, {0, -1});
        const std::string name = describePattern(p);
        expect(!frames.empty(), name + " has frames");
        expect(totalDuration(frames) > 0.0f, name + " has a duration");
        expect(!affectedTiles(p, o, {0, -1}).empty(), name + " hits something");
        for (const auto& f : frames) {
            std::vector<Vec2i> tiles = f.tiles;
            std::sort(tiles.begin(), tiles.end(), [](const Vec2i& a, const Vec2i& b) {
                return a.y != b.y ? a.y < b.y : a.x < b.x;
            });
            expect(std::adjacent_find(tiles.begin(), tiles.end()) == tiles.end(), name + " frame tiles unique");
        }
    }

    std::vector<AnimationFrame> frames = animationFrames(AttackPattern::basicSlash(), o, right);
    fitDuration(frames, 0.5f);
    expect(std::abs(totalDuration(frames) - 0.5f) < 1e-4f, "fitDuration rescales the animation");
}

void test_damage_rules() {
    RNG rng(1u);

    DamageInput in;
    in.baseDamage = 5;
    in.type = DamageType::Physical;
    in.targetElement = Element::Undead;
    expect(resolveDamage(in, rng).damage == 5, "Physical vs undead is neutral");

    in.type = DamageType::Holy;
    expect(resolveDamage(in, rng).damage == 7, "Holy vs undead rounds up (6.25 -> 7)");

    in.type = DamageType::Physical;
    in.targetElement = Element::Ghost;
    expect(resolveDamage(in, rng).damage == 4, "Physical vs ghost (3.5 -> 4)");

    const std::vector<Buff> plated = {{BuffKind::Armor, 60}, {BuffKind::Armor, 40}};
    expect(totalArmor(plated) == ARMOR_CAP, "Armor is capped");

    in.baseDamage = 1;
    in.targetElement.reset();
    in.targetBuffs = &plated;
    expect(resolveDamage(in, rng).damage == 1, "Armor never reduces a hit below 1");

    in.baseDamage = 0;
    in.targetBuffs = nullptr;
    expect(resolveDamage(in, rng).damage == 1, "Minimum damage is 1");

    in.baseDamage = 10;
    in.critChance = 1.0f;
    const DamageResult crit = resolveDamage(in, rng);
    expect(crit.critical && crit.damage == 15, "Critical hits multiply by 1.5");

    DamageInput buffed;
    buffed.baseDamage = 10;
    const std::vector<Buff> sharp = {{BuffKind::Sharpness, 20}};
    buffed.attackerBuffs = &sharp;
    expect(resolveDamage(buffed, rng).damage == 12, "Sharpness 20% raises 10 to 12");

    const std::vector<Buff> frenzy = {{BuffKind::BloodFrenzy, 0}};
    buffed.attackerBuffs = &frenzy;
    buffed.attackerHp = 60;
    buffed.attackerMaxHp = 100;
    expect(resolveDamage(buffed, rng).damage == 10, "Blood frenzy is idle above half health");
    buffed.attackerHp = 40;
    expect(resolveDamage(buffed, rng).damage == 15, "Blood frenzy multiplies by 1.5 below half health");

    const std::vector<Buff> both = {{BuffKind::Sharpness, 20}, {BuffKind::BloodFrenzy, 0}};
    buffed.attackerBuffs = &both;
    expect(resolveDamage(buffed, rng).damage == 18, "Attacker buffs multiply together");

    Difficulty d = Difficulty::Normal;
    expect(parseDifficulty("hArD", d) && d == Difficulty::Hard, "Difficulty parse is case-insensitive");
    expect(!parseDifficulty("nightmare", d), "Unknown difficulty rejected");
    expect(std::string(difficultyName(Difficulty::Death)) == "Death", "Difficulty names");
    expect(maxLevelsFor(Difficulty::Easy) == 5 && maxLevelsFor(Difficulty::Death) == 20, "Floor counts");

    expect(std::string(damageTypeName(DamageType::Fire)) == "FIRE", "Damage type names");
    expect(std::string(elementName(Element::Ghost)) == "GHOST", "Element names");
    expect(std::string(rarityName(Rarity::Boss)) == "BOSS", "Rarity names");
    expect(std::string(tierName(ItemTier::Godly)) == "Godly", "Tier names");
    expect(std::string(dropKindName(DropKind::Weapon)) == "Weapon", "Drop kind names");
    expect(std::string(weaponKindName(WeaponKind::Bow)) == "Bow", "Weapon kind names");
}

void test_gold_saturates() {
    const uint32_t max = std::numeric_limits<uint32_t>::max();
    expect(addGoldSaturating(10, 5) == 15, "Gold adds normally");
    expect(addGoldSaturating(max - 1, 10) == max, "Gold saturates at the cap");
    expect(addGoldSaturating(max, max) == max, "Gold stays at the cap");
    expect(goldDrop(Rarity::Boss, Difficulty::Death, 3.0f) >= goldDrop(Rarity::Fighter, Difficulty::Easy, 1.0f),
           "Bosses on hard floors drop more gold");
}

void test_cooldown() {
    Cooldown c(2.0);
    expect(c.isReady(0.0), "Unused cooldown is ready");
    c.trigger(1.0);
    expect(!c.isReady(1.5), "Cooldown blocks right after trigger");
    expect(c.remaining(1.5) == 1.5, "Remaining time");

    double last = -1.0;
    for (int i = 0; i <= 30; ++i) {
        const double p = c.progress(1.0 + 0.1 * i);
        expect(p >= last, "Cooldown progress is monotonic");
        last = p;
    }
    expect(c.isReady(3.0), "Cooldown ready after its duration");
    c.reset();
    expect(!c.started() && c.isReady(1.0), "reset() makes it ready");
}

void test_consumable_stacks() {
    ConsumableInventory inv;
    inv.add(ConsumableKind::WeakHealingDraught, 2);
    inv.add(ConsumableKind::BandageRoll);
    inv.add(ConsumableKind::FireOilFlask, 2);

    expect(inv.size() == 4, "Fire oil never stacks");
    expect(inv.countOf(ConsumableKind::FireOilFlask) == 2, "Fire oil count");
    expect(inv.stacks().front().quantity == 2, "Draughts stack");

    auto used = inv.useItem(0);
    expect(used && *used == ConsumableKind::WeakHealingDraught, "Using slot 1");
    expect(inv.size() == 4 && inv.stacks().front().quantity == 1, "Stack shrinks");

    used = inv.useItem(1);
    expect(used && *used == ConsumableKind::BandageRoll, "Using slot 2");
    expect(inv.size() == 3, "Empty stacks are removed");

    expect(!inv.useItem(10).has_value(), "Out-of-range slot does nothing");
}

void test_weapon_inventory() {
    WeaponInventory inv;
    expect(inv.size() == 2, "Starting loadout has two weapons");
    expect(inv.current() && inv.current()->name == "Iron Sword", "Sword is equipped first");

    expect(inv.switchTo(1) && inv.current()->name == "Wood Bow", "Switch to the bow");
    expect(!inv.switchTo(20), "Out-of-range switch ignored");
    expect(inv.currentIndex() == 1, "Invalid switch keeps the current weapon");

    const Weapon* mace = findWeapon("Stone Mace");
    expect(mace != nullptr, "Catalog lookup");
    if (mace) {
        while (!inv.full()) expect(inv.add(*mace), "Add until full");
        expect(inv.size() == WeaponInventory::MAX_WEAPONS, "Nine weapon slots");
        expect(!inv.add(*mace), "Full belt rejects weapons");
    }
    expect(findWeapon("Rusty Spork") == nullptr, "Unknown weapons are not found");

    expect(inv.remove(1), "Remove the bow");
    expect(inv.current() != nullptr, "Current weapon stays valid after removal");
}

void test_skill_tree() {
    SkillTree t;
    uint32_t gold = 500;

    expect(t.costFor(SkillPath::Warrior) == 100, "First rank costs 100");
    expect(t.purchase(SkillPath::Warrior, gold) == SkillPurchase::Ok, "Buy a warrior rank");
    expect(gold == 400 && t.level(SkillPath::Warrior) == 1, "Gold spent and rank gained");
    expect(t.chosen() && *t.chosen() == SkillPath::Warrior, "Warrior path chosen");
    expect(t.costFor(SkillPath::Warrior) == 150, "Cost rises per rank");

    expect(t.purchase(SkillPath::Mage, gold) == SkillPurchase::PathLocked, "Other paths are locked");
    expect(t.purchase(SkillPath::Balanced, gold) == SkillPurchase::Ok, "Balanced is always open");

    uint32_t poor = 10;
    expect(t.canPurchase(SkillPath::Warrior, poor) == SkillPurchase::NotEnoughGold, "Too poor");

    uint32_t rich = 100000;
    for (int i = 0; i < 10; ++i) t.purchase(SkillPath::Warrior, rich);
    expect(t.level(SkillPath::Warrior) == SKILL_MAX_LEVEL, "Ranks stop at the max level");
    expect(t.canPurchase(SkillPath::Warrior, rich) == SkillPurchase::MaxLevel, "Max level reported");
    expect(t.healthMultiplier() > 1.0f, "Warrior ranks raise health");

    Player p;
    p.gold = 100;
    expect(p.purchaseSkill(SkillPath::Warrior) == SkillPurchase::Ok, "Player buys a warrior rank");
    expect(p.gold == 0, "Purchase spends the player's gold");
    expect(p.maxHp == 115 && p.hp == 115, "Warrior rank raises max HP and keeps the ratio");
    const SkillPurchase broke = p.purchaseSkill(SkillPath::Warrior);
    expect(broke == SkillPurchase::NotEnoughGold, "Second rank is unaffordable");
    expect(std::string(skillPurchaseMessage(broke)) == "NOT ENOUGH GOLD.", "Purchase result message");
}

void test_ultimate_charge() {
    Ultimate u;
    expect(!u.canUse(0.0), "Empty ultimate cannot fire");
    u.addCharge(1000);
    expect(u.charge() == 15.0f, "Charge per hit is capped");
    for (int i = 0; i < 10; ++i) u.addCharge(1000);
    expect(u.charge() == 100.0f, "Charge stops at 100");
    expect(u.use(0.0), "Full ultimate fires");
    expect(u.charge() == 0.0f, "Firing spends the charge");
    expect(u.active(0.1), "Effect is active right after use");

    u.setCharge(100.0f);
    expect(!u.canUse(1.0), "Cooldown blocks a second use");
}

void test_pause_blocks_movement() {
    World w(arenaConfig());
    w.installFloor(makeArena(30, 20), Vec2i{10, 10});

    w.queueAction(Action::Pause);
    w.tick(0.016);
    expect(w.paused(), "Pause toggles on");
    const uint64_t ticks = w.tickCount();

    w.queueAction(Action::MoveRight);
    w.tick(0.016);
    expect(w.player().pos == Vec2i{10, 10}, "No movement while paused");
    expect(w.tickCount() == ticks, "Simulation frozen while paused");

    w.queueAction(Action::Pause);
    w.tick(0.016);
    expect(!w.paused(), "Pause toggles off");

    w.queueAction(Action::MoveRight);
    w.tick(0.016);
    expect(w.player().pos == Vec2i{11, 10}, "Movement resumes");
}

void test_move_gate_and_dash() {
    World w(arenaConfig());
    w.installFloor(makeArena(30, 20), Vec2i{5, 10});

    for (int i = 0; i < 3; ++i) {
        w.queueAction(Action::MoveRight);
        w.tick(0.016);
    }
    expect(w.player().pos == Vec2i{7, 10}, "Movement is gated to every other tick");
    expect(w.player().facing == Vec2i{1, 0}, "Facing follows movement");

    w.tick(0.016);
    w.queueAction(Action::Dash);
    w.tick(0.016);
    expect(w.player().pos == Vec2i{12, 10}, "Dash covers five tiles");

    w.tick(0.016);
    w.tick(0.016);
    w.queueAction(Action::Dash);
    w.tick(0.016);
    expect(w.player().pos == Vec2i{12, 10}, "Dash is on cooldown");

    w.queueAction(Action::MoveUp);
    w.tick(0.016);
    w.setPlayerPosition({1, 1});
    w.tick(0.016);
    w.tick(0.016);
    w.queueAction(Action::MoveLeft);
    w.tick(0.016);
    expect(w.player().pos == Vec2i{1, 1}, "Walls block movement");
    expect(w.player().facing == Vec2i{-1, 0}, "Blocked moves still turn the player");
}

void test_consumable_use_in_world() {
    MessageLog log;
    World w(arenaConfig(), &log);
    w.installFloor(makeArena(30, 20), Vec2i{10, 10});

    Player& p = w.player();
    p.setHp(50);
    p.consumables.add(ConsumableKind::WeakHealingDraught);
    p.consumables.add(ConsumableKind::BandageRoll);
    p.status.apply(makeBleed(2));

    w.queueAction(Action::UseConsumable, 1);
    w.tick(0.016);
    expect(w.player().hp == 60, "Draught heals 10");

    w.queueAction(Action::UseConsumable, 1);
    w.tick(0.016);
    expect(!w.player().status.has(StatusKind::Bleed), "Bandage stops bleeding");
    expect(w.player().consumables.empty(), "Both items consumed");

    p.setHp(p.maxHp);
    p.consumables.add(ConsumableKind::BlessedBread);
    w.queueAction(Action::UseConsumable, 1);
    w.tick(0.016);
    expect(w.player().hp == w.player().maxHp, "Healing never exceeds max HP");

    p.consumables.add(ConsumableKind::AntitoxinVial, 2);
    const WorldSnapshot snap = makeSnapshot(w);
    expect(snap.inventory.size() == 1 && snap.inventory.front().quantity == 2, "Snapshot lists the inventory");
    if (!snap.inventory.empty()) {
        expect(snap.inventory.front().name == "Antitoxin Vial", "Inventory entries are named");
        expect(std::string(snap.inventory.front().description) == consumableDescription(ConsumableKind::AntitoxinVial),
               "Inventory entries carry a description");
    }
}

void test_item_pickup() {
    MessageLog log;
    World w(arenaConfig(), &log);
    w.installFloor(makeArena(30, 20), Vec2i{5, 10});

    const uint32_t goldBefore = w.player().gold;
    w.addItem(makeGoldDrop({6, 10}, 25));
    w.addItem(makeConsumableDrop({7, 10}, ConsumableKind::BandageRoll, ItemTier::Common));

    for (int i = 0; i < 3; ++i) {
        w.queueAction(Action::MoveRight);
        w.tick(0.016);
    }
    expect(w.player().pos == Vec2i{7, 10}, "Walked over both drops");
    expect(w.player().gold == goldBefore + 25, "Gold picked up");
    expect(w.player().consumables.countOf(ConsumableKind::BandageRoll) == 1, "Bandage picked up");
    expect(w.items().empty(), "Picked-up drops leave the floor");
    expect(log.countContaining("YOU PICK UP 25 GOLD.") == 1, "Gold pickup logged");
}

void test_enemy_chase_around_wall() {
    // Column x=10 is wall except for a gap at y=1..2.
    std::vector<std::string> rows;
    for (int y = 0; y < 20; ++y) {
        std::string row;
        for (int x = 0; x < 30; ++x) {
            const bool border = x == 0 || y == 0 || x == 29 || y == 19;
            const bool divider = x == 10 && y >= 3;
            row.push_back(border || divider ? '#' : '.');
        }
        rows.push_back(row);
    }

    World w(arenaConfig());
    w.installFloor(Floor::fromRows(rows), Vec2i{5, 15});

    Enemy chaser = makeDummy({15, 15}, 30);
    chaser.speed = 1.0f;
    chaser.baseSpeed = 1.0f;
    chaser.detectionRadius = 40;
    const int id = w.spawnEnemy(chaser);

    bool stayedOnFloor = true;
    for (int i = 0; i < 300; ++i) {
        w.tick(0.016);
        const Enemy* e = w.enemyById(id);
        if (!e || !w.floor().isWalkable(e->pos)) stayedOnFloor = false;
    }

    const Enemy* e = w.enemyById(id);
    expect(stayedOnFloor, "Chaser never enters a wall");
    expect(e != nullptr && manhattan(e->pos, w.player().pos) == 1, "Chaser walks around the wall to the player");
}

void test_enemy_wander_respects_leash() {
    World w(arenaConfig());
    w.installFloor(makeArena(40, 20), Vec2i{2, 2});

    Enemy wanderer = makeDummy({20, 10}, 30);
    wanderer.speed = 1.0f;
    wanderer.baseSpeed = 1.0f;
    wanderer.detectionRadius = 3;
    wanderer.leashRadius = 2;
    const int id = w.spawnEnemy(wanderer);

    bool moved = false;
    bool leashed = true;
    for (int i = 0; i < 200; ++i) {
        w.tick(0.016);
        const Enemy* e = w.enemyById(id);
        if (!e) {
            leashed = false;
            break;
        }
        if (e->pos != Vec2i{20, 10}) moved = true;
        if (manhattan(e->pos, e->spawn) > 2) leashed = false;
    }
    expect(moved, "Out-of-range enemies wander");
    expect(leashed, "Wandering never leaves the leash radius");
}

uint32_t goldOnFloor(const World& w) {
    uint32_t total = 0;
    for (const auto& it : w.items()) {
        if (it.kind == DropKind::Gold) total += it.gold;
    }
    return total;
}

void test_death_sweep_drops_gold() {
    MessageLog log;
    World w(arenaConfig(), &log);
    w.installFloor(makeArena(40, 30), Vec2i{10, 10});
    w.player().facing = {1, 0};
    w.spawnEnemy(makeDummy({11, 10}, 1));

    w.queueAction(Action::Attack);
    for (int i = 0; i < 60 && (!w.enemies().empty() || !w.animations().empty()); ++i) w.tick(0.016);

    expect(w.enemies().empty(), "Dead enemies are removed at the end of the tick");
    expect(w.player().enemiesKilled == 1, "Kill counted");
    expect(goldOnFloor(w) == 15, "Fighter gold: 10 x 1.5 on Normal");
    expect(log.countContaining("THE TRAINING DUMMY DIES.") == 1, "Death logged once");

    MessageLog bossLog;
    World b(arenaConfig(), &bossLog);
    b.installFloor(makeArena(40, 30), Vec2i{10, 10});
    b.player().facing = {1, 0};
    const int id = b.spawnBoss(BossKind::GoblinOverlord, {11, 10});
    if (Enemy* boss = b.enemyById(id)) boss->setHp(1);

    b.queueAction(Action::Attack);
    for (int i = 0; i < 60 && !b.enemies().empty(); ++i) b.tick(0.016);

    expect(b.enemies().empty(), "Boss slain");
    expect(b.player().enemiesKilled == 1, "Boss kill counted");
    expect(goldDrop(Rarity::Boss, Difficulty::Normal, BOSS_LOOT_MULTIPLIER) == 675, "Boss gold: 150 x 1.5 x 3");
    expect(goldOnFloor(b) == 675, "Boss drops tripled gold");
    expect(bossLog.countContaining("GOBLIN OVERLORD IS DEFEATED!") == 1, "Boss death announced");
}

void test_boss_in_world() {
    MessageLog log;
    World w(arenaConfig(), &log);
    w.installFloor(makeArena(40, 20), Vec2i{5, 10});

    const int wardenMax = bossProfile(BossKind::CorruptedWarden).maxHp;
    const int warden = w.spawnBoss(BossKind::CorruptedWarden, {30, 10});
    if (Enemy* e = w.enemyById(warden)) e->setHp(wardenMax / 4);

    w.tick(0.016);
    const Enemy* e = w.enemyById(warden);
    expect(e != nullptr, "Warden is alive");
    if (!e) return;
    expect(e->boss && e->boss->phase == BossPhase::Third, "Low HP puts the warden in its third phase");
    expect(log.countContaining("CORRUPTED WARDEN ENTERS ITS THIRD PHASE!") == 1, "Phase change announced");
    expect(e->boss && !e->boss->transitionCooldown.isReady(w.now()), "Phase change starts a transition window");
    expect(e->hp == wardenMax / 4 + 3, "Third-phase warden regenerates 3 HP per tick");

    World k(arenaConfig());
    k.installFloor(makeArena(40, 20), Vec2i{5, 10});
    const int knight = k.spawnBoss(BossKind::SkeletalKnight, {30, 10});
    bool guarded = false;
    for (int i = 0; i < 700 && !guarded; ++i) {
        k.tick(0.016);
        const Enemy* kn = k.enemyById(knight);
        guarded = kn && kn->boss && kn->boss->defensive;
    }
    expect(guarded, "Knight raises its guard once the special cooldown ends");
    expect(k.now() >= BOSS_SPECIAL_COOLDOWN, "Special waits for its cooldown");

    if (const Enemy* kn = k.enemyById(knight)) {
        const int before = kn->hp;
        k.resolveImpact(makeArrow(kn->pos, {1, 0}, 10, k.now()), kn->pos);
        const Enemy* after = k.enemyById(knight);
        expect(after != nullptr && after->hp == before - 5, "Guarded boss takes half damage");
    }
}

void test_knockback_and_damping() {
    World w(arenaConfig());
    w.installFloor(makeArena(40, 30), Vec2i{10, 10});
    w.player().facing = {1, 0};
    const int id = w.spawnEnemy(makeDummy({11, 10}, 50));

    w.queueAction(Action::Attack);
    for (int i = 0; i < 60 && !w.animations().empty(); ++i) w.tick(0.016);
    for (int i = 0; i < 30; ++i) w.tick(0.016);

    const Enemy* e = w.enemyById(id);
    expect(e != nullptr, "Dummy survives");
    if (e) {
        expect(e->pos.y == 10 && e->pos.x >= 12, "Slash pushes the enemy away from the player");
        expect(e->knockX == 0.0f && e->knockY == 0.0f, "Knockback damps to zero");
    }

    // A melee slam pushes the player back one tile.
    World m(arenaConfig());
    m.installFloor(makeArena(30, 20), Vec2i{10, 10});
    m.player().actedThisFloor = true;
    const auto soldier = m.spawnEnemyFromTemplate("Rotting Footsoldier", {11, 10});
    if (soldier) {
        if (Enemy* s = m.enemyById(*soldier)) {
            s->speed = 0.0f;
            s->baseSpeed = 0.0f;
        }
    }
    for (int i = 0; i < 150; ++i) m.tick(0.016);
    expect(m.player().hp < m.player().maxHp, "Footsoldier slash lands");
    expect(m.player().pos == Vec2i{9, 10}, "Slash knocks the player back");
    expect(m.player().knockX == 0.0f, "Player knockback damps to zero");

    // A ranged shot does not.
    World r(arenaConfig());
    r.installFloor(makeArena(30, 20), Vec2i{10, 10});
    r.player().actedThisFloor = true;
    const auto shade = r.spawnEnemyFromTemplate("Whispering Shade", {13, 10});
    if (shade) {
        if (Enemy* s = r.enemyById(*shade)) {
            s->speed = 0.0f;
            s->baseSpeed = 0.0f;
        }
    }
    for (int i = 0; i < 150; ++i) r.tick(0.016);
    expect(r.player().hp < r.player().maxHp, "Shade's bolt lands");
    expect(r.player().pos == Vec2i{10, 10}, "Ranged hits do not push the player");
}

void test_arrow_hits_enemy_in_world() {
    World w(arenaConfig());
    w.installFloor(makeArena(20, 12), Vec2i{2, 2});

    const auto id = w.spawnEnemyFromTemplate("Rotting Footsoldier", {8, 5});
    expect(id.has_value(), "Spawn a footsoldier by name");
    expect(!w.spawnEnemyFromTemplate("Lich King", {9, 5}).has_value(), "Unknown templates are rejected");
    if (!id) return;

    Enemy* e = w.enemyById(*id);
    expect(e != nullptr && e->name == "Rotting Footsoldier", "Spawned enemy carries the template name");
    if (!e) return;
    e->speed = 0.0f;
    e->baseSpeed = 0.0f;
    const int before = e->hp;

    w.addProjectile(makeArrow({5, 5}, {1, 0}, 4, w.now()));
    for (int i = 0; i < 60 && !w.projectiles().empty(); ++i) w.tick(0.016);

    expect(w.projectiles().empty(), "Arrow is spent on impact");
    e = w.enemyById(*id);
    expect(e != nullptr && e->hp < before, "Arrow damages the enemy it reaches");
}

void test_projectile_stops_at_walls() {
    const Floor f = makeArena(10, 10);

    Projectile arrow = makeArrow({2, 5}, {1, 0}, 4, 0.0);
    ProjectileStep step = advanceProjectile(arrow, 1.0f, f, nullptr);
    expect(step.stopped && arrow.dead, "Arrow stops at the wall");
    expect(step.impact == Vec2i{8, 5}, "Impact on the last open tile");

    Projectile blocked = makeArrow({2, 5}, {1, 0}, 4, 0.0);
    step = advanceProjectile(blocked, 1.0f, f, [](Vec2i t) { return t == Vec2i{4, 5}; });
    expect(step.stopped && step.impact == Vec2i{4, 5}, "Arrow stops on the first occupied tile");

    expect(impactArea({5, 5}, 1).size() == 1, "Arrows hit a single tile");
    expect(impactArea({5, 5}, FIRE_OIL_RADIUS).size() == 49, "Fire oil disc of radius 4");
}

void test_spawn_constraints() {
    const Floor f = Floor::generate(FLOOR_WIDTH, FLOOR_HEIGHT, 777);
    RNG place(3u);
    const auto player = f.findPlayerSpawn(place);
    expect(player.has_value(), "Floor has a player spawn");
    if (!player) return;

    SpawnRequest req;
    req.player = *player;
    req.maxCount = 12;
    RNG rng(5u);
    const auto spots = findSpawnPositions(f, req, rng);
    expect(!spots.empty(), "Spawns found");
    expect(static_cast<int>(spots.size()) <= req.maxCount, "maxCount respected");

    for (size_t i = 0; i < spots.size(); ++i) {
        expect(f.isWalkable(spots[i]), "Spawn is walkable");
        expect(manhattan(spots[i], *player) >= SPAWN_MIN_PLAYER_DISTANCE, "Spawn far from the player");
        for (size_t j = i + 1; j < spots.size(); ++j) {
            expect(manhattan(spots[i], spots[j]) >= SPAWN_MIN_SPACING, "Spawns are spread out");
        }
    }

    const Floor rock(20, 20);
    RNG rng2(5u);
    expect(findSpawnPositions(rock, req, rng2).empty(), "No spawns on solid rock");

    const auto items = scatterFloorItems(f, 777, Difficulty::Normal, 10, *player);
    const auto again = scatterFloorItems(f, 777, Difficulty::Normal, 10, *player);
    expect(items.size() == again.size(), "Item scatter is deterministic");
    for (size_t i = 0; i < items.size() && i < again.size(); ++i) {
        expect(items[i].pos == again[i].pos, "Item positions are deterministic");
        expect(f.isWalkable(items[i].pos) && items[i].pos != *player, "Items on open tiles away from the player");
    }
}

void test_camera_clamps() {
    expect(Camera::targetFor({5, 5}, 180, 60, 80, 24) == Vec2i{0, 0}, "Camera clamps at the top-left");
    expect(Camera::targetFor({179, 59}, 180, 60, 80, 24) == Vec2i{100, 36}, "Camera clamps at the bottom-right");
    expect(Camera::targetFor({90, 30}, 180, 60, 80, 24) == Vec2i{50, 18}, "Camera centers the player");
    expect(Camera::targetFor({3, 3}, 40, 20, 80, 24) == Vec2i{0, 0}, "Small floors pin the camera");

    Camera c;
    c.viewW = 80;
    c.viewH = 24;
    c.setTarget({90, 30}, 180, 60);
    c.snap();
    expect(c.offset() == Vec2i{50, 18}, "snap() jumps to the target");
    c.setTarget({179, 59}, 180, 60);
    c.update();
    expect(c.offset().x > 50 && c.offset().x <= 100, "update() moves toward the target");
}

void test_world_hp_bounds() {
    WorldConfig cfg;
    cfg.seed = 2024;
    World w(cfg);

    const Action cycle[] = {Action::MoveRight, Action::Attack, Action::MoveDown, Action::Attack,
                            Action::MoveLeft,  Action::Block,  Action::MoveUp,   Action::Dash};
    for (int i = 0; i < 900 && w.state() == GameState::Playing; ++i) {
        w.queueAction(cycle[i % 8]);
        w.tick(0.016);

        const Player& p = w.player();
        expect(p.hp >= 0 && p.hp <= p.maxHp, "Player HP stays in range");
        expect(w.floor().isWalkable(p.pos), "Player stays on open ground");
        for (const auto& e : w.enemies()) {
            expect(e.hp > 0 && e.hp <= e.maxHp, "Live enemy HP stays in range");
        }
    }
    expect(w.tickCount() > 0, "World advanced");
}

void test_state_hash_deterministic() {
    WorldConfig cfg;
    cfg.seed = 99;
    World a(cfg);
    World b(cfg);
    expect(a.stateHash() == b.stateHash(), "Same seed gives the same initial hash");

    const Action cycle[] = {Action::MoveRight, Action::MoveDown, Action::Attack, Action::MoveLeft};
    for (int i = 0; i < 300; ++i) {
        a.queueAction(cycle[i % 4]);
        b.queueAction(cycle[i % 4]);
        a.tick(0.016);
        b.tick(0.016);
        if (i % 50 == 0) expect(a.stateHash() == b.stateHash(), "Hashes agree during the run");
    }
    expect(a.stateHash() == b.stateHash(), "Hashes agree at the end");

    cfg.seed = 100;
    World c(cfg);
    World d(WorldConfig{});
    expect(c.stateHash() != d.stateHash(), "Different seeds hash differently");

    const WorldSnapshot snap = makeSnapshot(a);
    expect(snap.player == a.player().pos, "Snapshot mirrors the player");
    expect(snap.hp == a.player().hp, "Snapshot mirrors HP");
}

void test_save_roundtrip() {
    WorldConfig cfg;
    cfg.seed = 31337;
    cfg.difficulty = Difficulty::Hard;
    cfg.playerName = "Tester";
    World w(cfg);

    Player& p = w.player();
    p.gold = 900;
    p.skills.purchase(SkillPath::Rogue, p.gold);
    p.consumables.add(ConsumableKind::BandageRoll, 3);
    p.consumables.add(ConsumableKind::FireOilFlask, 2);
    if (const Weapon* spear = findWeapon("Iron Spear")) p.weapons.add(*spear);
    p.weapons.switchTo(2);
    p.setHp(42);

    const GameSave save = makeSave(w);
    expect(save.difficulty == "Hard", "Difficulty saved by name");
    expect(save.weapons.size() == 3, "Weapons saved");

    const std::string bytes = encodeSave(save);
    GameSave back;
    std::string err;
    expect(decodeSave(bytes, back, &err), "Decode a fresh save: " + err);
    expect(back.playerName == "Tester", "Name preserved");
    expect(back.stats == save.stats, "Stats preserved");
    expect(back.floorSeed == save.floorSeed, "Floor seed preserved");
    expect(back.position == save.position, "Position preserved");
    expect(back.weapons == save.weapons && back.currentWeapon == 2, "Weapons preserved");
    expect(back.consumables.size() == save.consumables.size(), "Consumables preserved");
    expect(back.skillLevels == save.skillLevels && back.chosenPath == save.chosenPath, "Skills preserved");

    World restored(configFromSave(back, WorldConfig{}));
    applySave(restored, back);
    const Player& r = restored.player();
    expect(restored.difficulty() == Difficulty::Hard, "Difficulty restored");
    expect(r.hp == 42 && r.gold == p.gold, "HP and gold restored");
    expect(r.pos == p.pos, "Position restored");
    expect(r.weapons.currentIndex() == 2 && r.weapons.size() == 3, "Weapon belt restored");
    expect(r.consumables.countOf(ConsumableKind::FireOilFlask) == 2, "Fire oil flasks restored");
    expect(r.skills.level(SkillPath::Rogue) == 1, "Skill ranks restored");

    std::string corrupt = bytes;
    corrupt[corrupt.size() / 2] = static_cast<char>(corrupt[corrupt.size() / 2] ^ 0x5a);
    expect(!decodeSave(corrupt, back, &err), "Corrupted save rejected");
    expect(err.find("CRC") != std::string::npos, "Corruption reported as a CRC mismatch");

    expect(!decodeSave(bytes.substr(0, 8), back, &err), "Truncated save rejected");
    std::string wrongMagic = bytes;
    wrongMagic[0] = 'X';
    expect(!decodeSave(wrongMagic, back, &err), "Foreign file rejected");

    GameSave bogus = save;
    bogus.stats.health = 5000;
    bogus.position = {0, 0};
    bogus.weapons = {"Rusty Spork"};
    bogus.consumables.push_back({200, 1});
    World clamped(configFromSave(bogus, WorldConfig{}));
    applySave(clamped, bogus);
    expect(clamped.player().hp == clamped.player().maxHp, "Loaded HP is clamped");
    expect(clamped.floor().isWalkable(clamped.player().pos), "Loaded position moved onto open ground");
    expect(clamped.player().weapons.size() == 2, "Unknown weapons keep the default belt");

    const fs::path path = tempPath("cryptcrawl_test_save.dat");
    expect(saveGameToFile(path.string(), save, &err), "Save to disk: " + err);
    GameSave fromDisk;
    expect(loadGameFromFile(path.string(), fromDisk, &err), "Load from disk: " + err);
    expect(fromDisk.stats == save.stats, "Disk roundtrip keeps stats");
    removeQuiet(path);
    expect(!loadGameFromFile(path.string(), fromDisk, &err), "Missing save reported");
}

void test_save_keeps_hp_under_skill_ranks() {
    WorldConfig cfg;
    cfg.seed = 4242;
    World w(cfg);
    Player& p = w.player();
    p.gold = 1000;
    p.purchaseSkill(SkillPath::Warrior);

    World restored(cfg);
    int mismatches = 0;
    int firstBad = -1;
    for (int round = 0; round < 2; ++round) {
        if (round == 1) p.purchaseSkill(SkillPath::Balanced);
        for (int hp = 1; hp <= p.maxHp; ++hp) {
            p.setHp(hp);
            const GameSave save = makeSave(w);
            applySave(restored, save);
            if (!(makeSave(restored).stats == save.stats)) {
                ++mismatches;
                if (firstBad < 0) firstBad = hp;
            }
        }
    }
    expect(p.maxHp == 125, "Warrior and balanced ranks give 125 max HP");
    expect(mismatches == 0, "Save and reload keeps every HP value (first bad: " + std::to_string(firstBad) + ")");
}

void test_settings_file() {
    const fs::path path = tempPath("cryptcrawl_test_settings.ini");
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "difficulty = hard\n"
            << "player_name = Ash ; trailing comment\n"
            << "tick_ms = 200\n"
            << "bind_attack = space\n"
            << "bind_up = w\n"
            << "mystery = 1\n";
    }

    Settings s = loadSettings(path.string());
    expect(s.difficulty == Difficulty::Hard, "Difficulty loaded");
    expect(s.playerName == "Ash", "Name loaded without the comment");
    expect(s.tickMs == 50, "Tick length clamped");
    expect(s.binds.attack == "Space", "Key names normalized");
    expect(s.binds.up == "W", "Single keys upper-cased");

    expect(updateIniKey(path.string(), "player_name", "Bo"), "Update an existing key");
    expect(updateIniKey(path.string(), "sound_volume", "40"), "Append a new key");
    s = loadSettings(path.string());
    expect(s.playerName == "Bo" && s.soundVolume == 40, "Updated keys read back");

    expect(removeIniKey(path.string(), "player_name"), "Remove a key");
    s = loadSettings(path.string());
    expect(s.playerName == Settings{}.playerName, "Removed key falls back to the default");

    expect(writeDefaultSettings(path.string()), "Write defaults");
    s = loadSettings(path.string());
    expect(s.difficulty == Settings{}.difficulty && s.tickMs == Settings{}.tickMs, "Defaults read back");

    Settings custom;
    custom.difficulty = Difficulty::Death;
    custom.playerName = "Vera";
    custom.tickMs = 20;
    custom.binds.dash = "Q";
    expect(saveSettings(path.string(), custom), "Save settings");
    s = loadSettings(path.string());
    expect(s.difficulty == Difficulty::Death && s.playerName == "Vera", "Saved settings read back");
    expect(s.tickMs == 20 && s.binds.dash == "Q", "Saved timing and binds read back");
    removeQuiet(path);

    const Settings missing = loadSettings(tempPath("cryptcrawl_no_such_settings.ini").string());
    expect(missing.tickMs == 16, "Missing file gives defaults");
}

void test_input_script_parse() {
    const std::string text =
        "@cryptcrawl_input 1\n"
        "@game_version 0.4.0\n"
        "@seed 99\n"
        "@difficulty hard\n"
        "@end_header\n"
        "# warm-up\n"
        "0 A move_right\n"
        "32 A use_consumable 2\n"
        "48 H 3 00000000000000ff\n"
        "64 Z ignored\n";

    InputScript s;
    std::string err;
    expect(parseInputScript(text, s, &err), "Parse a valid script: " + err);
    expect(s.meta.seed == 99 && s.meta.difficulty == Difficulty::Hard, "Header parsed");
    expect(s.meta.gameVersion == "0.4.0", "Version parsed");
    expect(s.events.size() == 3, "Unknown event codes skipped");
    if (s.events.size() == 3) {
        expect(s.events[0].action == Action::MoveRight, "Action by name");
        expect(s.events[1].slot == 2, "Slot parsed");
        expect(s.events[2].kind == ScriptEventType::StateHash && s.events[2].tick == 3 &&
                   s.events[2].hash == 0xffull,
               "Checkpoint parsed");
    }

    const std::string header = "@cryptcrawl_input 1\n@seed 1\n@end_header\n";
    expect(!parseInputScript(header + "10 A attack\n5 A attack\n", s, &err), "Backwards time rejected");
    expect(err.find("time goes backwards") != std::string::npos, "Backwards time reported");
    expect(!parseInputScript(header + "0 A use_consumable\n", s, &err), "Missing slot rejected");
    expect(!parseInputScript(header + "0 A fly\n", s, &err), "Unknown action rejected");
    expect(!parseInputScript("0 A attack\n", s, &err), "Missing header rejected");
    expect(!parseInputScript("@cryptcrawl_input 2\n@end_header\n", s, &err), "Future format rejected");

    const fs::path path = tempPath("cryptcrawl_test_script.txt");
    InputScriptMeta meta;
    meta.gameVersion = "test";
    meta.seed = 4242;
    meta.difficulty = Difficulty::Easy;
    InputScriptWriter wr;
    expect(wr.open(path, meta, &err), "Open a script for writing: " + err);
    wr.writeAction(0, Action::MoveRight);
    wr.writeAction(16, Action::SwitchWeapon, 2);
    wr.writeStateHash(32, 2, 0xabcdefull);
    wr.close();

    InputScript back;
    expect(loadInputScript(path, back, &err), "Reload the written script: " + err);
    expect(back.meta.seed == 4242 && back.meta.difficulty == Difficulty::Easy, "Header survives");
    expect(back.events.size() == 3, "Events survive");
    if (back.events.size() == 3) {
        expect(back.events[1].action == Action::SwitchWeapon && back.events[1].slot == 2, "Slot survives");
        expect(back.events[2].hash == 0xabcdefull, "Hash survives");
    }
    removeQuiet(path);
}

void test_script_runner_replay() {
    InputScript source;
    source.meta.seed = 555;
    const Action moves[] = {Action::MoveRight, Action::MoveDown, Action::Attack, Action::MoveLeft,
                            Action::Block,     Action::MoveUp,   Action::Attack, Action::Dash};
    for (uint32_t i = 0; i < 24; ++i) {
        ScriptEvent ev;
        ev.tMs = i * 40;
        ev.action = moves[i % 8];
        source.events.push_back(ev);
    }

    const fs::path path = tempPath("cryptcrawl_test_replay.txt");
    std::string err;

    {
        InputScriptMeta meta;
        meta.seed = source.meta.seed;
        meta.difficulty = source.meta.difficulty;
        InputScriptWriter rec;
        expect(rec.open(path, meta, &err), "Open recorder: " + err);

        World w(worldConfigForScript(source));
        rec.writeStateHash(0, w.tickCount(), w.stateHash());

        ScriptRunOptions opt;
        opt.record = &rec;
        opt.recordHashEveryTicks = 30;
        opt.minSimMs = 2000;
        ScriptRunStats stats;
        expect(runScriptHeadless(w, source, opt, &stats, &err), "Recording run succeeds: " + err);
        expect(stats.eventsDispatched == 24, "Every action dispatched");
        expect(stats.simulatedMs >= 2000, "Run lasts at least minSimMs");
        rec.close();
    }

    InputScript replay;
    expect(loadInputScript(path, replay, &err), "Load the recording: " + err);
    size_t checkpoints = 0;
    for (const auto& ev : replay.events) {
        if (ev.kind == ScriptEventType::StateHash) ++checkpoints;
    }
    expect(checkpoints >= 3, "Recording carries checkpoints");

    {
        World w(worldConfigForScript(replay));
        ScriptRunStats stats;
        expect(runScriptHeadless(w, replay, ScriptRunOptions{}, &stats, &err), "Replay matches: " + err);
        expect(stats.failure == ScriptFailureKind::None, "No failure on replay");
    }

    InputScript tampered = replay;
    for (auto it = tampered.events.rbegin(); it != tampered.events.rend(); ++it) {
        if (it->kind == ScriptEventType::StateHash) {
            it->hash ^= 1;
            break;
        }
    }
    {
        World w(worldConfigForScript(tampered));
        ScriptRunStats stats;
        expect(!runScriptHeadless(w, tampered, ScriptRunOptions{}, &stats, &err), "Tampered hash detected");
        expect(stats.failure == ScriptFailureKind::HashMismatch, "Failure kind is a hash mismatch");
        expect(err.find("SCRIPT DESYNC") != std::string::npos, "Desync reported");
    }

    {
        World w(worldConfigForScript(replay));
        ScriptRunOptions opt;
        opt.verifyHashes = false;
        opt.maxSimMs = 100;
        ScriptRunStats stats;
        expect(!runScriptHeadless(w, source, opt, &stats, &err), "Safety limit stops a long script");
        expect(stats.failure == ScriptFailureKind::SafetyLimit, "Failure kind is the safety limit");
    }

    removeQuiet(path);
}

} // namespace

int main() {
    std::cout << "Running CryptCrawl tests...\n";

    test_rng_reproducible();
    test_floor_connected_and_deterministic();
    test_slash_damages_adjacent_enemy();
    test_fire_oil_area_damage();
    test_bleed_stacking();
    test_status_rules();
    test_boss_phases();
    test_astar_around_wall();
    test_attack_pattern_footprints();
    test_damage_rules();
    test_gold_saturates();
    test_cooldown();

    test_consumable_stacks();
    test_weapon_inventory();
    test_skill_tree();
    test_ultimate_charge();

    test_pause_blocks_movement();
    test_move_gate_and_dash();
    test_consumable_use_in_world();
    test_item_pickup();
    test_arrow_hits_enemy_in_world();
    test_enemy_chase_around_wall();
    test_enemy_wander_respects_leash();
    test_death_sweep_drops_gold();
    test_boss_in_world();
    test_knockback_and_damping();
    test_projectile_stops_at_walls();
    test_spawn_constraints();
    test_camera_clamps();
    test_world_hp_bounds();
    test_state_hash_deterministic();

    test_save_roundtrip();
    test_save_keeps_hp_under_skill_ranks();
    test_settings_file();
    test_input_script_parse();
    test_script_runner_replay();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
