#include "snapshot.hpp"

#include "content.hpp"
#include "items.hpp"

namespace {

CooldownView viewOf(const Cooldown& c, double now) {
    CooldownView v;
    v.remaining = c.remaining(now);
    v.duration = c.duration();
    return v;
}

bool inView(const WorldSnapshot& s, Vec2i p) {
    return p.x >= s.camera.x && p.y >= s.camera.y && p.x < s.camera.x + s.viewW && p.y < s.camera.y + s.viewH;
}

} // namespace

WorldSnapshot makeSnapshot(const World& w) {
    WorldSnapshot s;
    const Floor& f = w.floor();
    const Player& p = w.player();
    const double now = w.now();

    s.floorW = f.width;
    s.floorH = f.height;
    s.viewW = w.camera().viewW;
    s.viewH = w.camera().viewH;
    s.camera = w.camera().offset();

    s.tiles.resize(static_cast<size_t>(s.viewW * s.viewH));
    for (int vy = 0; vy < s.viewH; ++vy) {
        for (int vx = 0; vx < s.viewW; ++vx) {
            const int x = s.camera.x + vx;
            const int y = s.camera.y + vy;
            TileView& t = s.tiles[static_cast<size_t>(vy * s.viewW + vx)];
            if (!f.inBounds(x, y)) continue;
            if (f.at(x, y) == TileType::Wall) {
                t.glyph = "#";
                t.color = colors::Gray;
            } else {
                t.glyph = ".";
                t.color = colors::DarkGray;
            }
        }
    }

    s.player = p.pos;
    s.hp = p.hp;
    s.maxHp = p.maxHp;
    s.gold = p.gold;
    s.floorLevel = w.floorLevel();
    s.maxLevels = w.maxLevels();
    if (const Weapon* wp = p.weapons.current()) s.weaponName = wp->name;
    for (const auto& e : p.status.effects()) s.statusTags.emplace_back(statusTag(e.kind));
    s.ultimateCharge = p.ultimate.charge();

    s.dash = viewOf(p.dashCooldown, now);
    s.attack = viewOf(p.attackCooldown, now);
    s.ultimate = viewOf(p.ultimate.cooldown(), now);
    s.block = viewOf(p.blockCooldown, now);

    for (const auto& e : w.enemies()) {
        if (!e.alive() || !inView(s, e.pos)) continue;
        EnemyView v;
        v.id = e.id;
        v.pos = e.pos;
        v.glyph = rarityGlyph(e.rarity);
        v.color = rarityColor(e.rarity);
        v.hp = e.hp;
        v.maxHp = e.maxHp;
        v.name = e.name;
        v.boss = e.isBoss();
        s.enemies.push_back(std::move(v));
    }

    for (const auto& pr : w.projectiles()) {
        if (pr.dead || !inView(s, pr.tile())) continue;
        ProjectileView v;
        v.pos = pr.tile();
        v.glyph = pr.glyph();
        v.color = pr.kind == ProjectileKind::FireOil ? colors::Orange : colors::White;
        s.projectiles.push_back(v);
    }

    for (const auto& a : w.animations()) {
        const AnimationFrame* fr = a.currentFrame();
        if (!fr) continue;
        AnimationView v;
        for (const Vec2i& t : fr->tiles) {
            if (inView(s, t)) v.tiles.push_back(t);
        }
        if (v.tiles.empty()) continue;
        v.color = fr->color;
        v.glyph = fr->glyph;
        s.animations.push_back(std::move(v));
    }

    for (const auto& it : w.items()) {
        if (!inView(s, it.pos)) continue;
        ItemView v;
        v.pos = it.pos;
        v.glyph = it.glyph();
        v.color = it.color();
        s.items.push_back(v);
    }

    s.paused = w.paused();
    s.dead = w.state() == GameState::Dead;
    s.victory = w.state() == GameState::Victory;
    s.inventoryOpen = w.inventoryOpen();
    for (const auto& st : w.player().consumables.stacks()) {
        InventoryEntryView v;
        v.name = consumableName(st.kind);
        v.description = consumableDescription(st.kind);
        v.quantity = st.quantity;
        s.inventory.push_back(std::move(v));
    }
    s.inventoryCursor = w.inventoryCursor();
    s.tick = w.tickCount();
    return s;
}
