#include "world.hpp"

#include "content.hpp"
#include "spawn.hpp"

#include <algorithm>
#include <type_traits>

namespace {

// FNV-1a 64 over plain values.
struct StateHasher {
    uint64_t h = 14695981039346656037ull;

    void bytes(const void* data, size_t len) {
        const auto* p = static_cast<const uint8_t*>(data);
        for (size_t i = 0; i < len; ++i) {
            h ^= p[i];
            h *= 1099511628211ull;
        }
    }

    template <typename T>
    void pod(const T& v) {
        static_assert(std::is_trivially_copyable<T>::value, "pod() requires trivially copyable types");
        bytes(&v, sizeof(T));
    }

    void i32(int v) { pod(static_cast<int32_t>(v)); }
    void u64(uint64_t v) { pod(v); }
    void f32(float v) { pod(v); }
    void vec(Vec2i v) {
        i32(v.x);
        i32(v.y);
    }
    void str(const std::string& s) {
        u64(static_cast<uint64_t>(s.size()));
        bytes(s.data(), s.size());
    }
};

} // namespace

const char* gameStateName(GameState s) {
    switch (s) {
        case GameState::Playing: return "Playing";
        case GameState::Paused:  return "Paused";
        case GameState::Dead:    return "Dead";
        case GameState::Victory: return "Victory";
        default:                 return "?";
    }
}

World::World(const WorldConfig& cfg, MessageSink* sink)
    : cfg_(cfg),
      sink_(sink),
      maxLevels_(maxLevelsFor(cfg.difficulty)),
      rng_(hashCombine(foldSeed(cfg.seed), tag32("WORLD"))) {
    player_.name = cfg_.playerName.empty() ? std::string("Player") : cfg_.playerName;
    camera_.viewW = std::max(1, cfg_.viewWidth);
    camera_.viewH = std::max(1, cfg_.viewHeight);
    startFloor(1, cfg_.seed);
}

void World::startFloor(int level, uint64_t seed) {
    floorLevel_ = std::max(1, level);
    floorSeed_ = seed;
    floor_ = Floor::generate(cfg_.floorWidth, cfg_.floorHeight, seed);

    enemies_.clear();
    projectiles_.clear();
    items_.clear();
    animations_.clear();
    pathCache_.clear();
    enemiesSpawnedThisFloor_ = 0;

    RNG placeRng(hashCombine(foldSeed(seed), tag32("PLAYER")));
    if (auto spawn = floor_.findPlayerSpawn(placeRng)) {
        player_.pos = *spawn;
    } else {
        pushMessage("THE FLOOR IS SOLID ROCK.", MessageKind::Warning, false);
    }
    player_.actedThisFloor = false;
    player_.lastMoveTick.reset();
    player_.knockX = 0.0f;
    player_.knockY = 0.0f;

    RNG enemyRng(hashCombine(foldSeed(seed), tag32("ENEMIES")));
    if (cfg_.spawnEnemies && floor_.openTileCount() > 0) {
        if (isBossFloor()) {
            SpawnRequest req;
            req.player = player_.pos;
            req.minPlayerDistance = BOSS_SPAWN_MIN_DISTANCE;
            req.maxCount = 1;
            std::vector<Vec2i> spots = findSpawnPositions(floor_, req, enemyRng);
            if (spots.empty()) {
                req.minPlayerDistance = SPAWN_MIN_PLAYER_DISTANCE;
                spots = findSpawnPositions(floor_, req, enemyRng);
            }
            if (!spots.empty()) {
                const BossKind k = static_cast<BossKind>(enemyRng.range(0, BOSS_KIND_COUNT - 1));
                spawnBoss(k, spots.front());
                pushMessage("YOU SENSE THE PRESENCE OF " + toUpper(bossName(k)) + ".", MessageKind::Warning, false);
            }
        } else {
            const auto range = enemyCountRange(cfg_.difficulty);
            const int count = enemyRng.range(range.first, range.second);
            const std::vector<const EnemyTemplate*> roster = rosterFor(cfg_.difficulty);

            SpawnRequest req;
            req.player = player_.pos;
            req.maxCount = count;
            const std::vector<Vec2i> spots = findSpawnPositions(floor_, req, enemyRng);
            for (const Vec2i& p : spots) {
                if (roster.empty()) break;
                const EnemyTemplate* t = roster[static_cast<size_t>(enemyRng.range(0, static_cast<int>(roster.size()) - 1))];
                spawnEnemy(makeEnemy(*t, 0, p, cfg_.difficulty));
            }
        }
    }

    if (cfg_.spawnItems) {
        items_ = scatterFloorItems(floor_, seed, cfg_.difficulty, ITEMS_PER_FLOOR, player_.pos);
    }

    rebuildEnemyHash();
    camera_.setTarget(player_.pos, floor_.width, floor_.height);
    camera_.snap();

    if (isBossFloor()) {
        pushMessage("FLOOR " + std::to_string(floorLevel_) + ": THE LAST CRYPT.", MessageKind::System, false);
    } else {
        pushMessage("YOU DESCEND TO FLOOR " + std::to_string(floorLevel_) + ".", MessageKind::System, false);
    }
}

void World::installFloor(Floor f, std::optional<Vec2i> playerPos) {
    floor_ = std::move(f);
    if (floor_.rooms.empty() && floor_.openTileCount() > 0) floor_.detectRooms();
    floorSeed_ = floor_.seed;

    enemies_.clear();
    projectiles_.clear();
    items_.clear();
    animations_.clear();
    pathCache_.clear();
    enemiesSpawnedThisFloor_ = 0;

    if (playerPos) {
        player_.pos = *playerPos;
    } else {
        RNG placeRng(hashCombine(foldSeed(floorSeed_), tag32("PLAYER")));
        if (auto spawn = floor_.findPlayerSpawn(placeRng)) player_.pos = *spawn;
    }
    player_.actedThisFloor = false;
    player_.lastMoveTick.reset();

    rebuildEnemyHash();
    camera_.setTarget(player_.pos, floor_.width, floor_.height);
    camera_.snap();
}

void World::queueInput(const InputEvent& e) {
    pending_.push_back(e);
}

void World::queueAction(Action a, int slot) {
    InputEvent e;
    e.action = a;
    e.slot = slot;
    pending_.push_back(e);
}

void World::tick(double dt) {
    if (dt < 0.0) dt = 0.0;

    // 1. inputs
    std::vector<InputEvent> batch;
    batch.swap(pending_);
    for (const InputEvent& e : batch) {
        if (state_ == GameState::Dead || state_ == GameState::Victory) break;
        if (state_ == GameState::Paused && !actionAllowedWhilePaused(e.action)) continue;
        applyInput(e);
    }
    if (state_ != GameState::Playing) return;

    ++tickCount_;
    now_ += dt;
    const float fdt = static_cast<float>(dt);

    // 2. cooldowns are clock based; statuses count down here
    updateStatuses(fdt);
    // 3.
    applyDamageOverTime(fdt);
    // 4.
    applyPlayerKnockback();
    updateEnemies(fdt);
    rebuildEnemyHash();
    // 5.
    updateProjectiles(fdt);
    // 6.
    updateAnimations(fdt);
    // 7.
    sweepDeaths();
    for (auto& it : items_) it.age += fdt;
    // 8.
    if (!player_.alive() && state_ == GameState::Playing) {
        state_ = GameState::Dead;
        pushMessage("YOU DIE.", MessageKind::Warning, false);
    }
    if (state_ == GameState::Playing) checkFloorCleared();
    // 9.
    updateCamera();
}

const Enemy* World::enemyById(int id) const {
    for (const auto& e : enemies_) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

Enemy* World::enemyById(int id) {
    for (auto& e : enemies_) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

const Enemy* World::enemyAt(Vec2i p) const {
    for (const auto& e : enemies_) {
        if (e.alive() && e.collision && e.pos == p) return &e;
    }
    return nullptr;
}

int World::spawnEnemy(Enemy e) {
    e.id = nextEnemyId_++;
    if (e.attackCooldowns.size() != e.attacks.size()) {
        e.attackCooldowns.clear();
        for (const auto& a : e.attacks) e.attackCooldowns.emplace_back(a.cooldown);
    }
    enemies_.push_back(std::move(e));
    ++enemiesSpawnedThisFloor_;
    enemyHash_.insert(enemies_.back().pos, enemies_.back().id);
    return enemies_.back().id;
}

std::optional<int> World::spawnEnemyFromTemplate(const std::string& name, Vec2i pos) {
    const EnemyTemplate* t = findEnemyTemplate(name);
    if (!t) return std::nullopt;
    return spawnEnemy(makeEnemy(*t, 0, pos, cfg_.difficulty));
}

int World::spawnBoss(BossKind k, Vec2i pos) {
    return spawnEnemy(makeBoss(k, 0, pos, cfg_.difficulty, now_));
}

void World::addItem(const ItemDrop& item) {
    items_.push_back(item);
}

void World::addProjectile(const Projectile& p) {
    projectiles_.push_back(p);
}

void World::setPlayerPosition(Vec2i p) {
    player_.pos = p;
    camera_.setTarget(player_.pos, floor_.width, floor_.height);
    camera_.snap();
}

void World::pushMessage(const std::string& text, MessageKind kind, bool fromPlayer) {
    if (!sink_) return;
    Message m;
    m.text = text;
    m.kind = kind;
    m.fromPlayer = fromPlayer;
    m.tick = tickCount_;
    sink_->push(m);
}

bool World::tileHasItem(Vec2i p) const {
    for (const auto& it : items_) {
        if (it.pos == p) return true;
    }
    return false;
}

void World::rebuildEnemyHash() {
    enemyHash_ = SpatialHashGrid2D(floor_.width, floor_.height, ENEMY_HASH_CELL);
    for (const auto& e : enemies_) {
        if (e.alive()) enemyHash_.insert(e.pos, e.id);
    }
}

uint64_t World::stateHash() const {
    StateHasher h;
    h.u64(tickCount_);
    h.i32(floorLevel_);
    h.u64(floorSeed_);
    h.i32(static_cast<int>(state_));

    h.vec(player_.pos);
    h.vec(player_.facing);
    h.i32(player_.hp);
    h.i32(player_.maxHp);
    h.pod(player_.gold);
    h.pod(player_.enemiesKilled);
    h.f32(player_.ultimate.charge());
    h.u64(static_cast<uint64_t>(player_.weapons.currentIndex()));
    for (const auto& w : player_.weapons.weapons()) h.str(w.name);
    for (const auto& s : player_.consumables.stacks()) {
        h.i32(static_cast<int>(s.kind));
        h.i32(s.quantity);
    }
    for (const auto& s : player_.status.effects()) {
        h.i32(static_cast<int>(s.kind));
        h.i32(s.stacks);
    }

    for (const auto& e : enemies_) {
        h.i32(e.id);
        h.vec(e.pos);
        h.i32(e.hp);
        h.i32(e.maxHp);
        h.i32(e.attackTicks);
        if (e.boss) {
            h.i32(static_cast<int>(e.boss->phase));
            h.u64(static_cast<uint64_t>(e.boss->patternIndex));
        }
    }
    for (const auto& p : projectiles_) {
        h.i32(static_cast<int>(p.kind));
        h.vec(p.tile());
        h.i32(p.damage);
    }
    for (const auto& it : items_) {
        h.i32(static_cast<int>(it.kind));
        h.vec(it.pos);
        h.pod(it.gold);
    }
    h.u64(static_cast<uint64_t>(animations_.size()));
    return h.h;
}
