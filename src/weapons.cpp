#include "weapons.hpp"

#include <algorithm>

namespace {

using AP = AttackPattern;

Weapon W(WeaponKind k, int dmg, float cd, const char* name, ItemTier tier, AttackPattern p) {
    Weapon w;
    w.kind = k;
    w.damage = dmg;
    w.cooldown = cd;
    w.name = name;
    w.tier = tier;
    w.pattern = p;
    return w;
}

std::vector<Weapon> buildCatalog() {
    using K = WeaponKind;
    using T = ItemTier;
    return {
        W(K::Sword, 5, 0.5f, "Iron Sword", T::Common, AP::basicSlash()),
        W(K::Bow, 3, 0.3f, "Wood Bow", T::Common, AP::arrowShot(5)),
        W(K::Mace, 8, 0.8f, "Stone Mace", T::Common, AP::groundSlam(2)),

        W(K::Sword, 10, 0.45f, "Steel Sword", T::Rare, AP::swordThrust(3)),
        W(K::Bow, 7, 0.25f, "Composite Bow", T::Rare, AP::multiShot(5, 2)),
        W(K::Mace, 14, 0.7f, "Steel Mace", T::Rare, AP::groundSlam(3)),
        W(K::Spear, 9, 0.4f, "Iron Spear", T::Rare, AP::swordThrust(4)),
        W(K::Axe, 13, 0.75f, "Battle Axe", T::Rare, AP::barrage(3)),
        W(K::Staff, 6, 0.35f, "Quarterstaff", T::Rare, AP::whirlwind()),

        W(K::Sword, 18, 0.4f, "Mithril Sword", T::Epic, AP::crescentSlash()),
        W(K::Bow, 14, 0.2f, "Longbow", T::Epic, AP::barrage(5)),
        W(K::Mace, 22, 0.65f, "Warhammer", T::Epic, AP::groundSlam(4)),
        W(K::Spear, 16, 0.35f, "Halberd", T::Epic, AP::swordThrust(5)),
        W(K::Axe, 20, 0.65f, "Broad Axe", T::Epic, AP::barrage(4)),
        W(K::Staff, 12, 0.3f, "Frost Staff", T::Epic, AP::frostNova(4)),
        W(K::Staff, 15, 0.35f, "Fire Staff", T::Epic, AP::fireball(3)),

        W(K::Sword, 26, 0.35f, "Adamant Sword", T::Exotic, AP::whirlwind()),
        W(K::Bow, 22, 0.15f, "Platinum Bow", T::Exotic, AP::multiShot(7, 3)),
        W(K::Mace, 32, 0.6f, "Molten Hammer", T::Exotic, AP::groundSlam(5)),
        W(K::Spear, 24, 0.3f, "Dragon Spear", T::Exotic, AP::barrage(6)),
        W(K::Axe, 28, 0.6f, "Storm Axe", T::Exotic, AP::chainLightning(5)),
        W(K::Staff, 20, 0.25f, "Arcane Staff", T::Exotic, AP::chainLightning(6)),
        W(K::Staff, 25, 0.4f, "Meteor Staff", T::Exotic, AP::meteorShower(6, 3)),

        W(K::Sword, 35, 0.3f, "Excalibur", T::Legendary, AP::crescentSlash()),
        W(K::Bow, 28, 0.1f, "Divine Bow", T::Legendary, AP::piercingShot(10)),
        W(K::Mace, 40, 0.55f, "Mjolnir", T::Legendary, AP::groundSlam(6)),
        W(K::Spear, 32, 0.25f, "Gungnir", T::Legendary, AP::swordThrust(7)),
        W(K::Axe, 36, 0.55f, "World Splitter", T::Legendary, AP::vortex(5)),
        W(K::Staff, 30, 0.2f, "Infinity Staff", T::Legendary, AP::chainLightning(8)),

        W(K::Sword, 45, 0.25f, "Primordial Blade", T::Mythic, AP::whirlwind()),
        W(K::Bow, 38, 0.08f, "Celestial Bow", T::Mythic, AP::barrage(8)),
        W(K::Mace, 50, 0.5f, "Titan Hammer", T::Mythic, AP::groundSlam(7)),
        W(K::Spear, 42, 0.2f, "Void Spear", T::Mythic, AP::crescentSlash()),
        W(K::Axe, 46, 0.5f, "Chaos Axe", T::Mythic, AP::vortex(7)),
        W(K::Staff, 40, 0.15f, "Cosmic Staff", T::Mythic, AP::meteorShower(8, 4)),

        W(K::Sword, 55, 0.2f, "Godly Greatsword", T::Godly, AP::swordThrust(8)),
        W(K::Bow, 48, 0.05f, "Heaven's Bow", T::Godly, AP::piercingShot(12)),
        W(K::Mace, 60, 0.45f, "Omnipotent Hammer", T::Godly, AP::groundSlam(8)),
        W(K::Spear, 52, 0.15f, "Dimensional Spear", T::Godly, AP::barrage(10)),
        W(K::Axe, 56, 0.45f, "Apocalypse Axe", T::Godly, AP::vortex(8)),
        W(K::Staff, 50, 0.1f, "Transcendence Staff", T::Godly, AP::chainLightning(10)),
    };
}

} // namespace

const char* weaponKindName(WeaponKind k) {
    switch (k) {
        case WeaponKind::Sword: return "Sword";
        case WeaponKind::Bow:   return "Bow";
        case WeaponKind::Mace:  return "Mace";
        case WeaponKind::Spear: return "Spear";
        case WeaponKind::Axe:   return "Axe";
        case WeaponKind::Staff: return "Staff";
    }
    return "Sword";
}

const std::vector<Weapon>& weaponCatalog() {
    static const std::vector<Weapon> catalog = buildCatalog();
    return catalog;
}

std::vector<const Weapon*> weaponsOfTier(ItemTier t) {
    std::vector<const Weapon*> out;
    for (const auto& w : weaponCatalog()) {
        if (w.tier == t) out.push_back(&w);
    }
    return out;
}

const Weapon* findWeapon(const std::string& name) {
    for (const auto& w : weaponCatalog()) {
        if (w.name == name) return &w;
    }
    return nullptr;
}

Weapon randomWeapon(ItemTier t, RNG& rng) {
    std::vector<const Weapon*> pool = weaponsOfTier(t);
    if (pool.empty()) pool = weaponsOfTier(ItemTier::Common);
    const int i = rng.range(0, static_cast<int>(pool.size()) - 1);
    return *pool[static_cast<size_t>(i)];
}

ItemTier rollWeaponDropTier(Difficulty d, RNG& rng) {
    switch (d) {
        case Difficulty::Easy:
            return rng.chance(0.5f) ? ItemTier::Common : ItemTier::Rare;
        case Difficulty::Normal:
            return rng.chance(0.5f) ? ItemTier::Rare : ItemTier::Epic;
        case Difficulty::Hard:
            return rng.chance(0.5f) ? ItemTier::Epic : ItemTier::Exotic;
        case Difficulty::Death: {
            const int r = rng.range(0, 2);
            if (r == 0) return ItemTier::Exotic;
            if (r == 1) return ItemTier::Legendary;
            return ItemTier::Mythic;
        }
    }
    return ItemTier::Common;
}

WeaponInventory::WeaponInventory() {
    if (const Weapon* sword = findWeapon("Iron Sword")) weapons_.push_back(*sword);
    if (const Weapon* bow = findWeapon("Wood Bow")) weapons_.push_back(*bow);
}

bool WeaponInventory::add(const Weapon& w) {
    if (full()) return false;
    weapons_.push_back(w);
    return true;
}

bool WeaponInventory::remove(size_t slot) {
    if (slot >= weapons_.size()) return false;
    weapons_.erase(weapons_.begin() + static_cast<std::ptrdiff_t>(slot));
    if (weapons_.empty()) {
        current_ = 0;
    } else if (slot < current_ || current_ >= weapons_.size()) {
        current_ = (current_ > 0) ? current_ - 1 : 0;
    }
    return true;
}

bool WeaponInventory::switchTo(size_t slot) {
    if (slot >= weapons_.size()) return false;
    current_ = slot;
    return true;
}

const Weapon* WeaponInventory::current() const {
    if (current_ >= weapons_.size()) return nullptr;
    return &weapons_[current_];
}

void WeaponInventory::assign(std::vector<Weapon> weapons, size_t current) {
    if (weapons.size() > MAX_WEAPONS) weapons.resize(MAX_WEAPONS);
    weapons_ = std::move(weapons);
    current_ = weapons_.empty() ? 0 : std::min(current, weapons_.size() - 1);
}
