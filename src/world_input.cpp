#include "world.hpp"

#include <algorithm>

void World::applyInput(const InputEvent& e) {
    switch (e.action) {
        case Action::MoveUp:    tryMovePlayer({0, -1}); break;
        case Action::MoveDown:  tryMovePlayer({0, 1}); break;
        case Action::MoveLeft:  tryMovePlayer({-1, 0}); break;
        case Action::MoveRight: tryMovePlayer({1, 0}); break;
        case Action::Attack:    tryAttack(); break;
        case Action::Dash:      tryDash(); break;
        case Action::Block:     tryBlock(); break;
        case Action::UseConsumable:
            if (e.slot >= 1 && e.slot <= 9) useConsumable(static_cast<size_t>(e.slot - 1));
            break;
        case Action::SwitchWeapon:
            switchWeapon(e.slot);
            break;
        case Action::Ultimate:  tryUltimate(); break;
        case Action::ToggleInventory:
            inventoryOpen_ = !inventoryOpen_;
            inventoryCursor_ = 0;
            break;
        case Action::Pause:
            if (state_ == GameState::Paused) {
                state_ = GameState::Playing;
                pushMessage("RESUMED.", MessageKind::System, false);
            } else if (state_ == GameState::Playing) {
                state_ = GameState::Paused;
                pushMessage("PAUSED.", MessageKind::System, false);
            }
            break;
        case Action::InventoryUp:
            if (inventoryCursor_ > 0) --inventoryCursor_;
            break;
        case Action::InventoryDown:
            if (inventoryCursor_ + 1 < player_.consumables.size()) ++inventoryCursor_;
            break;
        case Action::UseSelected:
            if (inventoryOpen_) useConsumable(inventoryCursor_);
            break;
        case Action::None:
        default:
            break;
    }
}

bool World::tryMovePlayer(Vec2i delta) {
    if (isZero(delta)) return false;
    if (player_.status.has(StatusKind::Stun)) return false;
    if (!player_.canMove(tickCount_, now_)) return false;

    // Turning in place is allowed even when the step is blocked.
    player_.facing = delta;

    const Vec2i to = player_.pos + delta;
    if (!floor_.isWalkable(to)) return false;
    if (enemyAt(to)) return false;

    player_.pos = to;
    player_.lastMoveTick = tickCount_;
    player_.actedThisFloor = true;
    pickupItemsAt(to);
    camera_.setTarget(player_.pos, floor_.width, floor_.height);
    return true;
}

void World::tryDash() {
    if (player_.status.has(StatusKind::Stun)) return;
    if (!player_.dashCooldown.isReady(now_)) return;
    if (!player_.canMove(tickCount_, now_)) return;
    if (isZero(player_.facing)) return;

    // Intermediate tiles are not checked: dashing slips through gaps.
    const Vec2i to = player_.pos + player_.facing * player_.dashDistance;
    if (!floor_.isWalkable(to) || enemyAt(to)) {
        pushMessage("YOU CAN'T DASH THERE.");
        return;
    }

    player_.pos = to;
    player_.lastMoveTick = tickCount_;
    player_.actedThisFloor = true;
    player_.dashCooldown.trigger(now_);
    pickupItemsAt(to);
    camera_.setTarget(player_.pos, floor_.width, floor_.height);
}

void World::tryAttack() {
    if (player_.status.has(StatusKind::Stun)) return;
    const Weapon* w = player_.weapons.current();
    if (!w) return;

    const int damage = player_.weaponDamage(*w, now_);
    if (firesArrows(*w)) {
        player_.bowCooldown.setDuration(w->cooldown);
        if (!player_.bowCooldown.isReady(now_)) return;
        projectiles_.push_back(makeArrow(player_.pos, player_.facing, damage, now_));
        player_.bowCooldown.trigger(now_);
        player_.actedThisFloor = true;
        return;
    }

    player_.attackCooldown.setDuration(w->cooldown);
    if (!player_.attackCooldown.isReady(now_)) return;

    Animation a;
    a.frames = animationFrames(w->pattern, player_.pos, player_.facing);
    fitDuration(a.frames, w->cooldown);
    a.owner = AnimationOwner::Player;
    a.damage = damage;
    a.type = weaponDamageType(*w);
    a.origin = player_.pos;
    a.dir = normalizeDir(player_.facing);
    a.knockback = patternKnocksBack(w->pattern) ? PLAYER_KNOCKBACK_FORCE : 0.0f;
    animations_.push_back(std::move(a));

    player_.attackCooldown.trigger(now_);
    player_.actedThisFloor = true;
}

void World::tryBlock() {
    if (!player_.blockCooldown.isReady(now_)) return;
    player_.blockCooldown.trigger(now_);
    player_.blockedAt = now_;
    player_.actedThisFloor = true;
    pushMessage("YOU RAISE YOUR GUARD.", MessageKind::Combat);
}

void World::useConsumable(size_t index) {
    const auto used = player_.consumables.useItem(index);
    if (!used) return;

    if (inventoryCursor_ >= player_.consumables.size() && inventoryCursor_ > 0) {
        inventoryCursor_ = player_.consumables.size() > 0 ? player_.consumables.size() - 1 : 0;
    }

    switch (*used) {
        case ConsumableKind::WeakHealingDraught: {
            const int healed = player_.heal(DRAUGHT_HEAL);
            pushMessage("YOU DRINK THE DRAUGHT AND RECOVER " + std::to_string(healed) + " HP.", MessageKind::Success);
            break;
        }
        case ConsumableKind::BandageRoll: {
            player_.status.remove(StatusKind::Bleed);
            const int healed = player_.heal(BANDAGE_HEAL);
            pushMessage("YOU BIND YOUR WOUNDS (+" + std::to_string(healed) + " HP).", MessageKind::Success);
            break;
        }
        case ConsumableKind::AntitoxinVial:
            player_.status.remove(StatusKind::Poison);
            player_.status.apply(makeStatus(StatusKind::PoisonImmunity, ANTITOXIN_IMMUNITY_SEC));
            pushMessage("THE ANTITOXIN BURNS AWAY THE POISON.", MessageKind::Success);
            break;
        case ConsumableKind::FireOilFlask:
            projectiles_.push_back(makeFireOil(player_.pos, player_.facing, now_));
            pushMessage("YOU HURL A FLASK OF FIRE OIL.", MessageKind::Combat);
            break;
        case ConsumableKind::BlessedBread: {
            const int healed = player_.heal(BREAD_HEAL);
            pushMessage("YOU EAT THE BLESSED BREAD (+" + std::to_string(healed) + " HP).", MessageKind::Success);
            break;
        }
    }
    player_.actedThisFloor = true;
}

void World::switchWeapon(int slot) {
    if (slot < 1) return;
    if (!player_.weapons.switchTo(static_cast<size_t>(slot - 1))) return;
    if (const Weapon* w = player_.weapons.current()) {
        pushMessage("YOU READY THE " + toUpper(w->name) + ".");
    }
}

void World::tryUltimate() {
    if (player_.status.has(StatusKind::Stun)) return;
    if (!player_.ultimate.use(now_)) {
        pushMessage("YOUR ULTIMATE IS NOT READY.", MessageKind::Warning);
        return;
    }
    player_.actedThisFloor = true;

    switch (player_.ultimate.kind()) {
        case UltimateKind::Shockwave: {
            Animation a;
            a.frames = animationFrames(AttackPattern::fireball(SHOCKWAVE_RADIUS), player_.pos, player_.facing);
            fitDuration(a.frames, SHOCKWAVE_ANIM_SEC);
            a.owner = AnimationOwner::Player;
            a.damage = SHOCKWAVE_DAMAGE;
            a.type = DamageType::Physical;
            a.origin = player_.pos;
            a.dir = normalizeDir(player_.facing);
            animations_.push_back(std::move(a));
            pushMessage("A SHOCKWAVE ERUPTS AROUND YOU!", MessageKind::Combat);
            break;
        }
        case UltimateKind::Rage:
            pushMessage("RAGE FILLS YOU!", MessageKind::Combat);
            break;
        case UltimateKind::Ghost:
            pushMessage("YOU FADE INTO THE VEIL.", MessageKind::Combat);
            break;
    }
}

void World::pickupItemsAt(Vec2i p) {
    for (size_t i = 0; i < items_.size();) {
        ItemDrop& it = items_[i];
        if (it.pos != p) {
            ++i;
            continue;
        }

        switch (it.kind) {
            case DropKind::Gold:
                player_.gold = addGoldSaturating(player_.gold, it.gold);
                pushMessage("YOU PICK UP " + std::to_string(it.gold) + " GOLD.", MessageKind::Loot);
                break;
            case DropKind::Consumable:
                player_.consumables.add(it.consumable);
                pushMessage("YOU PICK UP " + it.label() + ".", MessageKind::Loot);
                break;
            case DropKind::Weapon:
                if (!it.weapon) break;
                if (!player_.weapons.add(*it.weapon)) {
                    it.pos = dropPosition(floor_, p, [&](Vec2i q) { return q == player_.pos || tileHasItem(q); });
                    pushMessage("YOUR WEAPON BELT IS FULL.", MessageKind::Warning);
                    ++i;
                    continue;
                }
                pushMessage("YOU PICK UP " + it.label() + ".", MessageKind::Loot);
                break;
        }
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(i));
    }
}
