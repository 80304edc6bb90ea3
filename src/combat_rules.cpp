#include "combat_rules.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

const char* damageTypeName(DamageType t) {
    switch (t) {
        case DamageType::Physical: return "PHYSICAL";
        case DamageType::Magic:    return "MAGIC";
        case DamageType::Fire:     return "FIRE";
        case DamageType::Holy:     return "HOLY";
        case DamageType::Poison:   return "POISON";
    }
    return "PHYSICAL";
}

const char* elementName(Element e) {
    switch (e) {
        case Element::Undead: return "UNDEAD";
        case Element::Ghost:  return "GHOST";
    }
    return "UNDEAD";
}

const char* rarityName(Rarity r) {
    switch (r) {
        case Rarity::Fighter:  return "FIGHTER";
        case Rarity::Guard:    return "GUARD";
        case Rarity::Champion: return "CHAMPION";
        case Rarity::Elite:    return "ELITE";
        case Rarity::Boss:     return "BOSS";
    }
    return "FIGHTER";
}

const char* difficultyName(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return "Easy";
        case Difficulty::Normal: return "Normal";
        case Difficulty::Hard:   return "Hard";
        case Difficulty::Death:  return "Death";
    }
    return "Normal";
}

bool parseDifficulty(const std::string& s, Difficulty& out) {
    std::string low;
    low.reserve(s.size());
    for (unsigned char c : s) low.push_back(static_cast<char>(std::tolower(c)));

    if (low == "easy") out = Difficulty::Easy;
    else if (low == "normal") out = Difficulty::Normal;
    else if (low == "hard") out = Difficulty::Hard;
    else if (low == "death") out = Difficulty::Death;
    else return false;
    return true;
}

float difficultyMultiplier(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return 1.0f;
        case Difficulty::Normal: return 1.5f;
        case Difficulty::Hard:   return 2.0f;
        case Difficulty::Death:  return 3.0f;
    }
    return 1.0f;
}

float detectionDifficultyMultiplier(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return 0.7f;
        case Difficulty::Normal: return 1.0f;
        case Difficulty::Hard:   return 1.4f;
        case Difficulty::Death:  return 1.8f;
    }
    return 1.0f;
}

int maxLevelsFor(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return 5;
        case Difficulty::Normal: return 10;
        case Difficulty::Hard:   return 15;
        case Difficulty::Death:  return 20;
    }
    return 10;
}

int rarityGoldBase(Rarity r) {
    switch (r) {
        case Rarity::Fighter:  return 10;
        case Rarity::Guard:    return 15;
        case Rarity::Champion: return 25;
        case Rarity::Elite:    return 50;
        case Rarity::Boss:     return 150;
    }
    return 10;
}

int rarityBaseDetection(Rarity r) {
    switch (r) {
        case Rarity::Fighter:  return 5;
        case Rarity::Guard:    return 6;
        case Rarity::Champion: return 8;
        case Rarity::Elite:    return 10;
        case Rarity::Boss:     return 15;
    }
    return 5;
}

int rarityFallbackDamage(Rarity r) {
    switch (r) {
        case Rarity::Fighter:  return 3;
        case Rarity::Guard:    return 5;
        case Rarity::Champion: return 8;
        case Rarity::Elite:    return 12;
        case Rarity::Boss:     return 20;
    }
    return 3;
}

int detectionRadius(Rarity r, Difficulty d) {
    const float v = static_cast<float>(rarityBaseDetection(r)) * detectionDifficultyMultiplier(d);
    return static_cast<int>(std::ceil(v - 1e-4f));
}

uint32_t goldDrop(Rarity r, Difficulty d, float lootMultiplier) {
    const double v = static_cast<double>(rarityGoldBase(r))
        * static_cast<double>(difficultyMultiplier(d))
        * static_cast<double>(std::max(0.0f, lootMultiplier));
    const double c = std::ceil(v - 1e-9);
    if (c >= static_cast<double>(std::numeric_limits<uint32_t>::max())) return std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(c);
}

uint32_t addGoldSaturating(uint32_t gold, uint64_t amount) {
    const uint64_t sum = static_cast<uint64_t>(gold) + amount;
    if (sum > std::numeric_limits<uint32_t>::max()) return std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(sum);
}

float typeMultiplier(std::optional<Element> target, DamageType t) {
    if (!target) return 1.0f;
    switch (*target) {
        case Element::Undead:
            if (t == DamageType::Fire || t == DamageType::Holy) return 1.25f;
            if (t == DamageType::Poison) return 0.5f;
            return 1.0f;
        case Element::Ghost:
            if (t == DamageType::Physical) return 0.7f;
            if (t == DamageType::Magic || t == DamageType::Holy) return 1.25f;
            return 0.9f;
    }
    return 1.0f;
}

int totalArmor(const std::vector<Buff>& buffs) {
    int total = 0;
    for (const auto& b : buffs) {
        if (b.kind == BuffKind::Armor) total += b.amount;
    }
    return std::clamp(total, 0, ARMOR_CAP);
}

bool hasBuff(const std::vector<Buff>& buffs, BuffKind k) {
    for (const auto& b : buffs) {
        if (b.kind == k) return true;
    }
    return false;
}

int buffAmount(const std::vector<Buff>& buffs, BuffKind k) {
    int total = 0;
    for (const auto& b : buffs) {
        if (b.kind == k) total += b.amount;
    }
    return total;
}

DamageResult resolveDamage(const DamageInput& in, RNG& rng) {
    DamageResult out;
    double dmg = static_cast<double>(std::max(0, in.baseDamage));

    if (in.attackerBuffs) {
        for (const auto& b : *in.attackerBuffs) {
            switch (b.kind) {
                case BuffKind::Sharpness:
                    dmg *= 1.0 + static_cast<double>(b.amount) / 100.0;
                    break;
                case BuffKind::BloodFrenzy:
                    if (in.attackerHp * 2 < std::max(1, in.attackerMaxHp)) dmg *= 1.5;
                    break;
                case BuffKind::EchoAmplification:
                    if (in.type == DamageType::Magic) dmg *= 1.25;
                    break;
                default:
                    break;
            }
        }
    }

    dmg *= static_cast<double>(typeMultiplier(in.targetElement, in.type));

    if (in.targetBuffs) {
        const int armor = totalArmor(*in.targetBuffs);
        dmg *= 1.0 - static_cast<double>(armor) / 100.0;
    }

    if (in.critChance > 0.0f && rng.next01() < in.critChance) {
        dmg *= static_cast<double>(CRIT_MULTIPLIER);
        out.critical = true;
    }

    // Guard against 5.0000001 style float noise before the ceiling.
    const int whole = static_cast<int>(std::ceil(dmg - 1e-6));
    out.damage = std::max(1, whole);
    return out;
}
