#include "content.hpp"

namespace {

using AP = AttackPattern;
using DT = DamageType;

EnemyAttack atk(const char* name, int lo, int hi, DT type, int reach, int area, float cd, AttackPattern p,
                std::optional<AttackEffect> effect = std::nullopt) {
    EnemyAttack a;
    a.name = name;
    a.minDamage = lo;
    a.maxDamage = hi;
    a.type = type;
    a.reach = reach;
    a.areaRadius = area;
    a.cooldown = cd;
    a.pattern = p;
    a.effect = effect;
    return a;
}

AttackEffect slow(float sec) { return {StatusKind::Cripple, sec, 0.0f}; }
AttackEffect stun(float sec) { return {StatusKind::Stun, sec, 0.0f}; }
AttackEffect poison(float dps, float sec) { return {StatusKind::Poison, sec, dps}; }

EnemyUltimate ult(const char* name, UltimatePower power, int base, int area, float cd, AttackPattern p) {
    EnemyUltimate u;
    u.name = name;
    u.power = power;
    u.baseDamage = base;
    u.areaRadius = area;
    u.cooldown = cd;
    u.pattern = p;
    return u;
}

EnemyTemplate tmpl(const char* name, Rarity r, Element e, int hp, float speed) {
    EnemyTemplate t;
    t.name = name;
    t.rarity = r;
    t.element = e;
    t.hp = hp;
    t.speed = speed;
    return t;
}

std::vector<EnemyTemplate> buildCatalog() {
    std::vector<EnemyTemplate> out;

    // Fighters
    {
        EnemyTemplate t = tmpl("Rotting Footsoldier", Rarity::Fighter, Element::Undead, 30, 0.15f);
        t.attacks.push_back(atk("Rusted Slash", 2, 4, DT::Physical, 1, 0, 2.0f, AP::basicSlash()));
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("Grave Scrabbler", Rarity::Fighter, Element::Undead, 24, 0.12f);
        t.attacks.push_back(atk("Bone Rake", 2, 4, DT::Physical, 1, 1, 1.8f, AP::whirlwind()));
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("Whispering Shade", Rarity::Fighter, Element::Ghost, 20, 0.18f);
        t.attacks.push_back(atk("Chill Touch", 2, 3, DT::Magic, 1, 0, 2.2f, AP::arrowShot(3), slow(1.0f)));
        out.push_back(std::move(t));
    }

    // Guards
    {
        EnemyTemplate t = tmpl("Crypt Sentinel", Rarity::Guard, Element::Undead, 40, 0.1f);
        t.attacks.push_back(atk("Shield Bash", 3, 5, DT::Physical, 1, 0, 2.5f, AP::arrowShot(3)));
        t.buffs.push_back({BuffKind::Armor, 30});
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("Tomb Watcher", Rarity::Guard, Element::Undead, 36, 0.12f);
        t.attacks.push_back(atk("Longspear Thrust", 3, 5, DT::Physical, 2, 0, 2.3f, AP::swordThrust(2)));
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("Wailing Doorwarden", Rarity::Guard, Element::Ghost, 28, 0.14f);
        t.attacks.push_back(atk("Sonic Screech", 2, 4, DT::Magic, 1, 2, 2.8f, AP::fireball(2)));
        out.push_back(std::move(t));
    }

    // Champions
    {
        EnemyTemplate t = tmpl("Blight Captain", Rarity::Champion, Element::Undead, 70, 0.13f);
        t.attacks.push_back(atk("Cleaving Strike", 4, 7, DT::Physical, 1, 0, 2.0f, AP::frostNova(1)));
        t.attacks.push_back(atk("Commanding Roar", 2, 4, DT::Physical, 1, 3, 3.5f, AP::fireball(3)));
        t.ultimate = ult("Blight Surge", UltimatePower::Weak, 6, 3, 20.0f, AP::fireball(3));
        t.buffs = {{BuffKind::Armor, 15}, {BuffKind::Sharpness, 10}};
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("Veilbound Duelist", Rarity::Champion, Element::Ghost, 60, 0.16f);
        t.attacks.push_back(atk("Phantasmal Lunge", 4, 6, DT::Magic, 2, 0, 2.2f, AP::swordThrust(2)));
        t.attacks.push_back(atk("Fade Step", 2, 4, DT::Magic, 1, 1, 2.8f, AP::fireball(1), slow(1.5f)));
        t.ultimate = ult("Echo Slash", UltimatePower::Weak, 5, 1, 18.0f, AP::basicSlash());
        t.buffs = {{BuffKind::Speed, 20}, {BuffKind::PhaseShift, 0}};
        out.push_back(std::move(t));
    }

    // Elites
    {
        EnemyTemplate t = tmpl("Corpse Abomination", Rarity::Elite, Element::Undead, 55, 0.11f);
        t.attacks.push_back(atk("Slam Fist", 12, 16, DT::Physical, 1, 0, 2.5f, AP::basicSlash()));
        t.attacks.push_back(atk("Grasping Limbs", 8, 12, DT::Physical, 1, 2, 3.0f, AP::fireball(2), slow(2.0f)));
        t.attacks.push_back(atk("Flesh Whip", 10, 14, DT::Physical, 2, 0, 2.8f, AP::swordThrust(2)));
        t.ultimate = ult("Harvest of Limbs", UltimatePower::Average, 14, 2, 25.0f, AP::fireball(2));
        t.buffs = {{BuffKind::Regeneration, 2}, {BuffKind::Armor, 20}};
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("Lantern Haunt", Rarity::Elite, Element::Ghost, 45, 0.14f);
        t.attacks.push_back(atk("Soul Beam", 10, 14, DT::Magic, 3, 0, 2.8f, AP::barrage(3)));
        t.attacks.push_back(atk("Flicker Warp", 7, 10, DT::Magic, 1, 1, 2.2f, AP::fireball(1)));
        t.attacks.push_back(atk("Dread Glow", 5, 8, DT::Magic, 1, 2, 3.0f, AP::fireball(2)));
        t.ultimate = ult("Blackout", UltimatePower::Average, 0, 5, 22.0f, AP::meteorShower(5, 2));
        t.buffs = {{BuffKind::EchoAmplification, 0}, {BuffKind::Speed, 15}};
        out.push_back(std::move(t));
    }

    // Catalog bosses (Death roster)
    {
        EnemyTemplate t = tmpl("The Ossuary King", Rarity::Boss, Element::Undead, 120, 0.12f);
        t.attacks.push_back(atk("Bone Cleave", 18, 24, DT::Physical, 1, 2, 3.0f, AP::frostNova(2)));
        t.attacks.push_back(atk("Skull Throw", 15, 20, DT::Physical, 3, 0, 3.2f, AP::barrage(3)));
        t.attacks.push_back(atk("Bone Spikes", 12, 18, DT::Physical, 1, 3, 3.5f, AP::fireball(3), poison(3.0f, 2.0f)));
        t.attacks.push_back(atk("March of the Dead", 10, 14, DT::Physical, 1, 4, 3.3f, AP::vortex(4)));
        t.attacks.push_back(atk("Royal Stomp", 20, 28, DT::Physical, 1, 3, 3.8f, AP::fireball(3)));
        t.ultimate = ult("Kingdom of Bone", UltimatePower::Devastating, 25, 6, 35.0f, AP::vortex(6));
        t.buffs = {{BuffKind::Armor, 25}, {BuffKind::Regeneration, 3}, {BuffKind::Sharpness, 20}};
        out.push_back(std::move(t));
    }
    {
        EnemyTemplate t = tmpl("The Mourning Bell", Rarity::Boss, Element::Ghost, 100, 0.13f);
        t.attacks.push_back(atk("Toll Strike", 16, 22, DT::Magic, 1, 4, 3.2f, AP::fireball(4)));
        t.attacks.push_back(atk("Chain Wail", 14, 18, DT::Magic, 2, 2, 3.0f, AP::frostNova(2), stun(1.0f)));
        t.attacks.push_back(atk("Possession", 8, 12, DT::Magic, 3, 0, 3.5f, AP::barrage(3), stun(2.0f)));
        t.attacks.push_back(atk("Phasing Drift", 10, 15, DT::Magic, 1, 2, 2.8f, AP::fireball(2)));
        t.attacks.push_back(atk("Dirge Field", 12, 16, DT::Magic, 1, 3, 3.3f, AP::fireball(3), slow(3.0f)));
        t.ultimate = ult("Final Toll", UltimatePower::Devastating, 20, 5, 32.0f, AP::meteorShower(5, 2));
        t.buffs = {{BuffKind::EchoAmplification, 0}, {BuffKind::Speed, 25}, {BuffKind::PhaseShift, 0}};
        out.push_back(std::move(t));
    }

    return out;
}

} // namespace

float ultimatePowerMultiplier(UltimatePower p) {
    switch (p) {
        case UltimatePower::Weak:        return 1.0f;
        case UltimatePower::Average:     return 1.5f;
        case UltimatePower::Devastating: return 2.5f;
    }
    return 1.0f;
}

const std::vector<EnemyTemplate>& enemyCatalog() {
    static const std::vector<EnemyTemplate> catalog = buildCatalog();
    return catalog;
}

const EnemyTemplate* findEnemyTemplate(const std::string& name) {
    for (const auto& t : enemyCatalog()) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::vector<const EnemyTemplate*> rosterFor(Difficulty d) {
    static const char* const easy[] = {
        "Rotting Footsoldier", "Grave Scrabbler", "Whispering Shade",
    };
    static const char* const normal[] = {
        "Rotting Footsoldier", "Grave Scrabbler", "Whispering Shade",
        "Crypt Sentinel", "Tomb Watcher", "Wailing Doorwarden",
    };
    static const char* const hard[] = {
        "Crypt Sentinel", "Tomb Watcher", "Wailing Doorwarden",
        "Blight Captain", "Veilbound Duelist", "Corpse Abomination", "Lantern Haunt",
    };
    static const char* const death[] = {
        "Blight Captain", "Veilbound Duelist", "Corpse Abomination", "Lantern Haunt",
        "The Ossuary King", "The Mourning Bell",
    };

    std::vector<const EnemyTemplate*> out;
    auto addAll = [&](const char* const* names, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            if (const EnemyTemplate* t = findEnemyTemplate(names[i])) out.push_back(t);
        }
    };

    switch (d) {
        case Difficulty::Easy:   addAll(easy, sizeof(easy) / sizeof(easy[0])); break;
        case Difficulty::Normal: addAll(normal, sizeof(normal) / sizeof(normal[0])); break;
        case Difficulty::Hard:   addAll(hard, sizeof(hard) / sizeof(hard[0])); break;
        case Difficulty::Death:  addAll(death, sizeof(death) / sizeof(death[0])); break;
    }
    return out;
}

std::pair<int, int> enemyCountRange(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return {5, 7};
        case Difficulty::Normal: return {8, 11};
        case Difficulty::Hard:   return {12, 15};
        case Difficulty::Death:  return {15, 19};
    }
    return {8, 11};
}

const char* rarityGlyph(Rarity r) {
    switch (r) {
        case Rarity::Fighter:  return "x";
        case Rarity::Guard:    return "⛊";
        case Rarity::Champion: return "◆";
        case Rarity::Elite:    return "☠";
        case Rarity::Boss:     return "♛";
    }
    return "x";
}

Color rarityColor(Rarity r) {
    switch (r) {
        case Rarity::Fighter:  return colors::Red;
        case Rarity::Guard:    return Color{200, 50, 50, 255};
        case Rarity::Champion: return Color{255, 0, 150, 255};
        case Rarity::Elite:    return Color{140, 0, 255, 255};
        case Rarity::Boss:     return Color{0, 255, 100, 255};
    }
    return colors::Red;
}
