#pragma once

#include "animation.hpp"
#include "camera.hpp"
#include "combat_rules.hpp"
#include "enemy.hpp"
#include "floor.hpp"
#include "input.hpp"
#include "loot.hpp"
#include "message_log.hpp"
#include "pathfinding.hpp"
#include "player.hpp"
#include "projectile.hpp"
#include "rng.hpp"
#include "spatial_hash.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr int ITEMS_PER_FLOOR = 10;
constexpr int PATH_MAX_EXPANSIONS = 4000;
constexpr float PLAYER_KNOCKBACK_FORCE = 1.0f;
constexpr float ENEMY_KNOCKBACK_FORCE = 0.5f;
constexpr float KNOCKBACK_DAMPING = 0.7f;
constexpr float KNOCKBACK_EPSILON = 0.1f;
constexpr int BOSS_SPAWN_MIN_DISTANCE = 15;

enum class GameState : uint8_t {
    Playing = 0,
    Paused,
    Dead,
    Victory,
};

const char* gameStateName(GameState s);

struct WorldConfig {
    uint64_t seed = 1;
    Difficulty difficulty = Difficulty::Normal;
    std::string playerName = "Player";

    int floorWidth = FLOOR_WIDTH;
    int floorHeight = FLOOR_HEIGHT;
    int viewWidth = 80;
    int viewHeight = 24;

    bool spawnEnemies = true;
    bool spawnItems = true;
    // Clearing a floor moves to the next one (or wins on the boss floor).
    bool autoAdvanceFloors = true;
};

// Authoritative game state.
//
// Owns the floor, the player, every enemy, projectile, item drop and active
// animation. Mutation happens only inside tick() (plus the explicit setup entry
// points used by loaders, scripted arenas and tests). Frontends read it through
// makeSnapshot() and write to it only through queueInput().
class World {
public:
    explicit World(const WorldConfig& cfg, MessageSink* sink = nullptr);

    // Generates floor `level` from `seed` and populates it.
    void startFloor(int level, uint64_t seed);

    // Installs a prebuilt floor with no enemies or items (scripted arenas).
    // The player is placed at `playerPos`, or on the floor's spawn tile.
    void installFloor(Floor f, std::optional<Vec2i> playerPos = std::nullopt);

    void queueInput(const InputEvent& e);
    void queueAction(Action a, int slot = 0);

    // One simulation step of `dt` seconds.
    void tick(double dt);

    // ----- read access -----
    const WorldConfig& config() const { return cfg_; }
    const Floor& floor() const { return floor_; }
    const Player& player() const { return player_; }
    Player& player() { return player_; }
    const std::vector<Enemy>& enemies() const { return enemies_; }
    std::vector<Enemy>& enemies() { return enemies_; }
    const std::vector<Projectile>& projectiles() const { return projectiles_; }
    const std::vector<ItemDrop>& items() const { return items_; }
    const std::vector<Animation>& animations() const { return animations_; }
    const Camera& camera() const { return camera_; }

    uint64_t tickCount() const { return tickCount_; }
    double now() const { return now_; }
    GameState state() const { return state_; }
    bool paused() const { return state_ == GameState::Paused; }
    int floorLevel() const { return floorLevel_; }
    int maxLevels() const { return maxLevels_; }
    bool isBossFloor() const { return floorLevel_ >= maxLevels_; }
    Difficulty difficulty() const { return cfg_.difficulty; }
    uint64_t floorSeed() const { return floorSeed_; }
    bool inventoryOpen() const { return inventoryOpen_; }
    size_t inventoryCursor() const { return inventoryCursor_; }
    size_t pendingInputs() const { return pending_.size(); }

    const Enemy* enemyById(int id) const;
    Enemy* enemyById(int id);
    // First live collision-enabled enemy on `p`.
    const Enemy* enemyAt(Vec2i p) const;

    // ----- setup entry points -----
    int spawnEnemy(Enemy e); // assigns the id
    std::optional<int> spawnEnemyFromTemplate(const std::string& name, Vec2i pos);
    int spawnBoss(BossKind k, Vec2i pos);
    void addItem(const ItemDrop& item);
    void addProjectile(const Projectile& p);
    void setPlayerPosition(Vec2i p);
    void setElapsed(double seconds) { now_ = seconds; }

    // Applies a projectile impact at `impact` (area damage, burn).
    void resolveImpact(const Projectile& p, Vec2i impact);

    // Deterministic 64-bit hash of the simulation state (FNV-1a).
    uint64_t stateHash() const;

    void pushMessage(const std::string& text, MessageKind kind = MessageKind::Info, bool fromPlayer = true);


private:
    // world_input.cpp
    void applyInput(const InputEvent& e);
    bool tryMovePlayer(Vec2i delta);
    void tryDash();
    void tryAttack();
    void tryBlock();
    void useConsumable(size_t index);
    void switchWeapon(int slot);
    void tryUltimate();
    void pickupItemsAt(Vec2i p);

    // world_tick.cpp
    void updateStatuses(float dt);
    void applyDamageOverTime(float dt);
    void updateEnemies(float dt);
    void updateBoss(Enemy& e, float dt);
    void enemyTryAttack(Enemy& e);
    void enemyMove(Enemy& e);
    std::optional<Vec2i> chaseStep(const Enemy& e);
    std::optional<Vec2i> wanderStep(const Enemy& e);
    std::optional<Vec2i> fleeStep(const Enemy& e) const;
    bool tryMoveEnemy(Enemy& e, Vec2i to);
    bool enemyCanEnter(const Enemy& e, Vec2i to) const;
    void applyKnockback(Enemy& e);
    void applyPlayerKnockback();
    void updateProjectiles(float dt);
    void updateAnimations(float dt);
    void sweepDeaths();
    void checkFloorCleared();
    void updateCamera();

    // world_combat.cpp
    void applyAnimationDamage(const Animation& a);
    // Returns the damage dealt (0 when the hit was avoided).
    int hitEnemy(Enemy& e, int baseDamage, DamageType type, Vec2i knockDir, float knockForce);
    int hitPlayer(int baseDamage, DamageType type, const Enemy* attacker, Vec2i knockDir, float knockForce);
    void spawnEnemyAttack(Enemy& e, const AttackPattern& pattern, int damage, DamageType type,
                          const std::optional<AttackEffect>& effect);
    void dropLoot(const Enemy& e);
    void rebuildEnemyHash();

    bool tileHasItem(Vec2i p) const;

    WorldConfig cfg_;
    MessageSink* sink_ = nullptr;

    Floor floor_;
    uint64_t floorSeed_ = 0;
    int floorLevel_ = 1;
    int maxLevels_ = 10;

    Player player_;
    std::vector<Enemy> enemies_;
    std::vector<Projectile> projectiles_;
    std::vector<ItemDrop> items_;
    std::vector<Animation> animations_;
    std::vector<InputEvent> pending_;

    uint64_t tickCount_ = 0;
    double now_ = 0.0;
    GameState state_ = GameState::Playing;
    bool inventoryOpen_ = false;
    size_t inventoryCursor_ = 0;

    int nextEnemyId_ = 1;
    int enemiesSpawnedThisFloor_ = 0;

    RNG rng_;
    PathCache pathCache_;
    SpatialHashGrid2D enemyHash_;
    Camera camera_;
};
