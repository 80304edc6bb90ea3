#pragma once

#include "attack_pattern.hpp"
#include "combat_rules.hpp"
#include "items.hpp"
#include "rng.hpp"

#include <optional>
#include <string>
#include <vector>

enum class WeaponKind : uint8_t {
    Sword = 0,
    Bow,
    Mace,
    Spear,
    Axe,
    Staff,
};

const char* weaponKindName(WeaponKind k);

struct Weapon {
    WeaponKind kind = WeaponKind::Sword;
    int damage = 5;
    float cooldown = 0.5f; // seconds
    std::string name;
    ItemTier tier = ItemTier::Common;
    AttackPattern pattern;
};

// Bows fire arrows; everything else plays its pattern.
inline bool firesArrows(const Weapon& w) { return w.kind == WeaponKind::Bow; }

inline DamageType weaponDamageType(const Weapon& w) {
    return w.kind == WeaponKind::Staff ? DamageType::Magic : DamageType::Physical;
}

const std::vector<Weapon>& weaponCatalog();
std::vector<const Weapon*> weaponsOfTier(ItemTier t);
const Weapon* findWeapon(const std::string& name);

// Random weapon from the tier pool (falls back to Common for an empty pool).
Weapon randomWeapon(ItemTier t, RNG& rng);

constexpr float WEAPON_DROP_CHANCE = 0.33f;

// Tier band for weapons dropped by enemies on a difficulty.
ItemTier rollWeaponDropTier(Difficulty d, RNG& rng);

class WeaponInventory {
public:
    static constexpr size_t MAX_WEAPONS = 9;

    // Starts with an Iron Sword and a Wood Bow.
    WeaponInventory();

    bool add(const Weapon& w); // false when full
    bool remove(size_t slot);  // keeps the current index valid
    bool switchTo(size_t slot); // out-of-range slots are ignored

    const Weapon* current() const;
    size_t currentIndex() const { return current_; }
    size_t size() const { return weapons_.size(); }
    bool full() const { return weapons_.size() >= MAX_WEAPONS; }
    const Weapon& at(size_t i) const { return weapons_[i]; }
    const std::vector<Weapon>& weapons() const { return weapons_; }

    // Replaces the contents (save/load). Invalid indices are clamped.
    void assign(std::vector<Weapon> weapons, size_t current);

private:
    std::vector<Weapon> weapons_;
    size_t current_ = 0;
};
