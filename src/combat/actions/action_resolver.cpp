/// @file action_resolver.cpp
/// @brief Intent validation and resolution into events and effects.

#include "skirmish/combat/action_resolver.hpp"

#include <algorithm>
#include <optional>
#include <type_traits>

#include "skirmish/combat/item_catalog.hpp"
#include "skirmish/combat/spell_catalog.hpp"
#include "skirmish/combat/targeting.hpp"
#include "skirmish/combat/turn_undead.hpp"

namespace skirmish::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

std::vector<Rejection> validateActor(const std::string& actorId,
                                     const CombatContext& context) {
    const Combatant* actor = context.Find(actorId);
    if (actor == nullptr) {
        return {{RejectionCode::InvalidActor, "actor is invalid"}};
    }
    if (!context.currentCombatantId || *context.currentCombatantId != actorId) {
        return {{RejectionCode::NotCurrentCombatant,
                 "not current combatant (expected "
                     + context.currentCombatantId.value_or("none") + ")"}};
    }
    if (!actor->IsAlive()) {
        return {{RejectionCode::ActorDead, "actor is dead"}};
    }
    if (actor->fled) {
        return {{RejectionCode::InvalidActor, "actor has fled"}};
    }
    return {};
}

std::optional<Rejection> validateTarget(const Combatant& actor,
                                        const std::string& targetId,
                                        bool wantAlly,
                                        const CombatContext& context) {
    const Combatant* target = context.Find(targetId);
    if (target == nullptr || !target->IsActive()) {
        return Rejection{RejectionCode::InvalidTarget,
                         "target " + targetId + " is not in combat"};
    }
    if (wantAlly && target->side != actor.side) {
        return Rejection{RejectionCode::TargetNotAlly, "target is not an ally"};
    }
    if (!wantAlly && target->side == actor.side) {
        return Rejection{RejectionCode::TargetNotOpponent, "target is not an opponent"};
    }
    return std::nullopt;
}

/// Exhaustive per-intent validation.
struct IntentValidator {
    const CombatContext& context;

    std::vector<Rejection> operator()(const MeleeAttackIntent& intent) const {
        auto rejections = validateActor(intent.actor, context);
        if (!rejections.empty()) {
            return rejections;
        }
        if (auto bad = validateTarget(*context.Find(intent.actor), intent.target,
                                      false, context)) {
            rejections.push_back(*bad);
        }
        return rejections;
    }

    std::vector<Rejection> operator()(const RangedAttackIntent& intent) const {
        auto rejections = validateActor(intent.actor, context);
        if (!rejections.empty()) {
            return rejections;
        }
        const Combatant& actor = *context.Find(intent.actor);
        if (!actor.rangedDamageDie) {
            rejections.push_back({RejectionCode::NoRangedWeapon, "no ranged weapon"});
        }
        if (auto bad = validateTarget(actor, intent.target, false, context)) {
            rejections.push_back(*bad);
        }
        return rejections;
    }

    std::vector<Rejection> operator()(const CastSpellIntent& intent) const {
        auto rejections = validateActor(intent.actor, context);
        if (!rejections.empty()) {
            return rejections;
        }
        const Combatant& actor = *context.Find(intent.actor);
        const SpellDefinition* spell = FindSpell(intent.spellId);
        if (spell == nullptr) {
            rejections.push_back({RejectionCode::SpellNotKnown,
                                  "unknown spell " + intent.spellId});
            return rejections;
        }
        if (!actor.KnowsSpell(intent.spellId)) {
            rejections.push_back({RejectionCode::SpellNotKnown,
                                  "spell " + intent.spellId + " is not known"});
        }
        if (!spell->UsableBy(actor.characterClass)) {
            rejections.push_back({RejectionCode::IneligibleCaster,
                                  std::string(CharacterClassName(actor.characterClass))
                                      + " cannot cast " + intent.spellId});
        }
        if (intent.slotLevel != spell->level) {
            rejections.push_back({RejectionCode::SlotLevelMismatch,
                                  "slot level " + std::to_string(intent.slotLevel)
                                      + " does not match spell level "
                                      + std::to_string(spell->level)});
        } else if (actor.SlotsAt(spell->level) <= 0) {
            rejections.push_back({RejectionCode::NoSpellSlot,
                                  "no level " + std::to_string(spell->level)
                                      + " slot left"});
        }
        if (spell->NeedsExplicitTarget()) {
            if (intent.targetIds.empty()) {
                rejections.push_back({RejectionCode::MissingTargets, "spell needs a target"});
            } else if (intent.targetIds.size() > 1) {
                rejections.push_back({RejectionCode::InvalidTarget,
                                      "spell takes a single target"});
            } else if (auto bad = validateTarget(
                           actor, intent.targetIds.front(),
                           spell->targetMode == TargetMode::SingleAlly, context)) {
                rejections.push_back(*bad);
            }
        }
        return rejections;
    }

    std::vector<Rejection> operator()(const UseItemIntent& intent) const {
        auto rejections = validateActor(intent.actor, context);
        if (!rejections.empty()) {
            return rejections;
        }
        const Combatant& actor = *context.Find(intent.actor);
        const ItemDefinition* item = FindItem(intent.itemName);
        if (item == nullptr || !actor.HasItem(intent.itemName)) {
            rejections.push_back({RejectionCode::ItemNotInInventory,
                                  intent.itemName + " is not carried"});
            return rejections;
        }
        if (item->targetMode == TargetMode::SingleEnemy) {
            if (intent.targetIds.empty()) {
                rejections.push_back({RejectionCode::MissingTargets, "item needs a target"});
            } else if (intent.targetIds.size() > 1) {
                rejections.push_back({RejectionCode::InvalidTarget,
                                      "item takes a single target"});
            } else if (auto bad = validateTarget(actor, intent.targetIds.front(),
                                                 false, context)) {
                rejections.push_back(*bad);
            }
        }
        return rejections;
    }

    std::vector<Rejection> operator()(const FleeIntent& intent) const {
        return validateActor(intent.actor, context);
    }

    std::vector<Rejection> operator()(const TurnUndeadIntent& intent) const {
        auto rejections = validateActor(intent.actor, context);
        if (!rejections.empty()) {
            return rejections;
        }
        const Combatant& actor = *context.Find(intent.actor);
        if (actor.characterClass != CharacterClass::Cleric) {
            rejections.push_back({RejectionCode::IneligibleCaster,
                                  "only a Cleric can turn undead"});
            return rejections;
        }
        const auto enemies = context.Active(OpposingSide(actor.side));
        if (std::none_of(enemies.begin(), enemies.end(),
                         [](const Combatant* c) { return c->isUndead; })) {
            rejections.push_back({RejectionCode::NoUndeadTargets, "no undead to turn"});
        }
        return rejections;
    }
};

template <typename>
inline constexpr bool kAlwaysFalse = false;

template <typename T>
GameResult<T> notFound(const std::string& id) {
    return GameResult<T>::err(GameError(ErrorCode::CombatantNotFound,
                                        "combatant not found: " + id, id));
}

int applyCritical(int amount) {
    // ceil(1.5 * amount)
    return (amount * 3 + 1) / 2;
}

}  // namespace

std::vector<Rejection> ActionResolver::Validate(const ActionIntent& intent,
                                                const CombatContext& context) const {
    return std::visit(IntentValidator{context}, intent);
}

AttackRoll ActionResolver::RollAttack(const Combatant& attacker,
                                      const Combatant& defender,
                                      int attackBonus,
                                      const CombatContext& context) {
    AttackRoll attack;
    attack.roll = dice_.D20();
    attack.total = attack.roll + attackBonus
        + context.modifiers.GetTotal(attacker.id, ModifiedStat::Attack);
    attack.needed = attacker.thac0 - context.EffectiveArmorClass(defender);
    attack.critical = attack.roll == 20;
    attack.hit = attack.critical || (attack.roll > 1 && attack.total >= attack.needed);
    return attack;
}

GameResult<ActionResult> ActionResolver::Resolve(const ActionIntent& intent,
                                                 const CombatContext& context) {
    return std::visit(
        [this, &context](const auto& i) -> GameResult<ActionResult> {
            using T = std::decay_t<decltype(i)>;
            if constexpr (std::is_same_v<T, MeleeAttackIntent>
                          || std::is_same_v<T, RangedAttackIntent>) {
                const Combatant* actor = context.Find(i.actor);
                if (actor == nullptr) {
                    return notFound<ActionResult>(i.actor);
                }
                return resolveWeapon(*actor, i.target,
                                     std::is_same_v<T, RangedAttackIntent>, context);
            } else if constexpr (std::is_same_v<T, CastSpellIntent>) {
                return resolveSpell(i, context);
            } else if constexpr (std::is_same_v<T, UseItemIntent>) {
                return resolveItem(i, context);
            } else if constexpr (std::is_same_v<T, TurnUndeadIntent>) {
                return resolveTurnUndead(i, context);
            } else if constexpr (std::is_same_v<T, FleeIntent>) {
                ActionResult result;
                result.effects.push_back(FleeEffect{i.actor, "intent"});
                return GameResult<ActionResult>::ok(std::move(result));
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled ActionIntent alternative");
            }
        },
        intent);
}

GameResult<ActionResult> ActionResolver::resolveWeapon(const Combatant& actor,
                                                       const std::string& targetId,
                                                       bool ranged,
                                                       const CombatContext& context) {
    const Combatant* defender = context.Find(targetId);
    if (defender == nullptr) {
        return notFound<ActionResult>(targetId);
    }
    if (ranged && !actor.rangedDamageDie) {
        return GameResult<ActionResult>::err(GameError(
            ErrorCode::InvalidState, actor.id + " has no ranged weapon", actor.id));
    }

    auto damageDie = DiceExpression::Parse(ranged ? *actor.rangedDamageDie
                                                  : actor.damageDie);
    if (!damageDie) {
        return GameResult<ActionResult>::err(GameError(
            damageDie.error().code(), std::string(damageDie.error().message()), actor.id));
    }

    const int bonus = ranged ? actor.rangedAttackBonus : actor.attackBonus;
    const int attacks = ranged ? 1 : std::max(actor.attacksPerRound, 1);
    const int damageBonus = context.modifiers.GetTotal(actor.id, ModifiedStat::Damage);

    ActionResult result;
    int projectedHp = defender->hp;
    for (int i = 0; i < attacks; ++i) {
        AttackRoll attack = RollAttack(actor, *defender, bonus, context);
        if (projectedHp <= 0) {
            // Remaining attacks are still rolled but land on a fallen target.
            attack.hit = false;
            attack.critical = false;
        }
        result.events.push_back(AttackRolledEvent{actor.id, defender->id, attack.roll,
                                                  attack.total, attack.needed,
                                                  attack.hit, attack.critical, ranged});
        if (!attack.hit) {
            continue;
        }
        int amount = std::max(dice_.Roll(damageDie.value()) + damageBonus, 1);
        if (attack.critical && actor.side == CombatSide::Party) {
            amount = applyCritical(amount);
        }
        projectedHp -= amount;
        result.effects.push_back(DamageEffect{actor.id, defender->id, amount});
    }
    return GameResult<ActionResult>::ok(std::move(result));
}

GameResult<ActionResult> ActionResolver::resolveSpell(const CastSpellIntent& intent,
                                                      const CombatContext& context) {
    const SpellDefinition* spell = FindSpell(intent.spellId);
    if (spell == nullptr) {
        return GameResult<ActionResult>::err(GameError(
            ErrorCode::UnknownSpell, "unknown spell: " + intent.spellId, intent.actor));
    }
    const Combatant* caster = context.Find(intent.actor);
    if (caster == nullptr) {
        return notFound<ActionResult>(intent.actor);
    }
    const CombatSide enemySide = OpposingSide(caster->side);

    ActionResult result;
    std::vector<std::string> targets;
    std::optional<GroupTargetsResolvedEvent> group;

    switch (spell->targetMode) {
        case TargetMode::SingleEnemy:
        case TargetMode::SingleAlly:
            if (!intent.targetIds.empty()) {
                targets.push_back(intent.targetIds.front());
            }
            break;
        case TargetMode::Self:
            targets.push_back(caster->id);
            break;
        case TargetMode::AllEnemies:
            targets = context.ActiveIds(enemySide);
            break;
        case TargetMode::AllAllies:
            targets = context.ActiveIds(caster->side);
            break;
        case TargetMode::HdPool: {
            auto budget = dice_.Roll(spell->poolDie);
            if (!budget) {
                return GameResult<ActionResult>::err(budget.error());
            }
            std::vector<HitDiceCandidate> candidates;
            for (const auto* c : context.Active(enemySide)) {
                candidates.push_back({c->id, CombatantHitDice(*c)});
            }
            targets = ResolveHdPool(candidates, budget.value());
            group = GroupTargetsResolvedEvent{caster->id, intent.spellId,
                                              spell->targetMode, budget.value(), targets};
            break;
        }
        case TargetMode::EnemyGroup: {
            auto count = dice_.Roll(spell->poolDie);
            if (!count) {
                return GameResult<ActionResult>::err(count.error());
            }
            targets = ResolveRandomGroup(context.ActiveIds(enemySide), count.value(), dice_);
            group = GroupTargetsResolvedEvent{caster->id, intent.spellId,
                                              spell->targetMode, count.value(), targets};
            break;
        }
    }

    result.events.push_back(SpellCastEvent{caster->id, intent.spellId,
                                           std::string(spell->name),
                                           intent.slotLevel, targets});
    if (group) {
        result.events.push_back(std::move(*group));
    }
    result.effects.push_back(ConsumeSlotEffect{caster->id, intent.slotLevel});

    if (!spell->autoHit && !targets.empty()) {
        const Combatant* defender = context.Find(targets.front());
        if (defender == nullptr) {
            return notFound<ActionResult>(targets.front());
        }
        AttackRoll attack = RollAttack(*caster, *defender, caster->attackBonus, context);
        result.events.push_back(AttackRolledEvent{caster->id, defender->id, attack.roll,
                                                  attack.total, attack.needed,
                                                  attack.hit, attack.critical, false});
        if (!attack.hit) {
            return GameResult<ActionResult>::ok(std::move(result));
        }
    }

    // Damage is rolled once per cast (once per projectile) and shared by
    // every target.
    std::vector<int> damageRolls;
    if (!spell->damageDie.empty()) {
        const int projectiles = spell->ProjectileCount(caster->level);
        for (int i = 0; i < projectiles; ++i) {
            auto rolled = dice_.Roll(spell->damageDie);
            if (!rolled) {
                return GameResult<ActionResult>::err(rolled.error());
            }
            damageRolls.push_back(rolled.value());
        }
    } else if (!spell->damagePerLevel.empty()) {
        auto perLevel = DiceExpression::Parse(spell->damagePerLevel);
        if (!perLevel) {
            return GameResult<ActionResult>::err(perLevel.error());
        }
        DiceExpression scaled = perLevel.value();
        const int levels = std::clamp(caster->level, 1, DiceExpression::kMaxCount);
        scaled.count = std::min(scaled.count * levels, DiceExpression::kMaxCount);
        damageRolls.push_back(dice_.Roll(scaled));
    }

    for (const auto& targetId : targets) {
        const Combatant* target = context.Find(targetId);
        if (target == nullptr) {
            return notFound<ActionResult>(targetId);
        }

        bool saved = false;
        if (spell->allowsSave) {
            SavingThrowRolledEvent save;
            save.targetId = targetId;
            save.spellId = intent.spellId;
            save.roll = dice_.D20();
            save.total = save.roll
                + context.modifiers.GetTotal(targetId, ModifiedStat::SavingThrow);
            save.needed = target->saveTarget;
            save.success = save.total >= save.needed;
            saved = save.success;
            result.events.push_back(std::move(save));
            if (saved && spell->saveNegates) {
                continue;
            }
        }

        for (int rolled : damageRolls) {
            int amount = saved ? rolled / 2 : rolled;
            if (amount > 0) {
                result.effects.push_back(DamageEffect{caster->id, targetId, amount});
            }
        }
        if (!spell->healDie.empty()) {
            auto healed = dice_.Roll(spell->healDie);
            if (!healed) {
                return GameResult<ActionResult>::err(healed.error());
            }
            result.effects.push_back(
                HealEffect{caster->id, targetId, std::max(healed.value(), 0)});
        }
        if (!spell->conditionId.empty()) {
            result.effects.push_back(ApplyConditionEffect{
                caster->id, targetId, std::string(spell->conditionId),
                spell->conditionDuration});
        }
        for (const auto& grant : spell->modifiers) {
            ActiveModifier modifier;
            modifier.modifierId = std::string(grant.modifierId);
            modifier.sourceId = caster->id;
            modifier.stat = grant.stat;
            modifier.value = grant.value;
            modifier.remainingRounds = grant.duration;
            result.effects.push_back(
                ApplyModifierEffect{caster->id, targetId, std::move(modifier)});
        }
    }
    return GameResult<ActionResult>::ok(std::move(result));
}

GameResult<ActionResult> ActionResolver::resolveItem(const UseItemIntent& intent,
                                                     const CombatContext& context) {
    const ItemDefinition* item = FindItem(intent.itemName);
    if (item == nullptr) {
        return GameResult<ActionResult>::err(GameError(
            ErrorCode::UnknownItem, "unknown item: " + intent.itemName, intent.actor));
    }
    const Combatant* actor = context.Find(intent.actor);
    if (actor == nullptr) {
        return notFound<ActionResult>(intent.actor);
    }

    std::vector<std::string> targets;
    if (item->targetMode == TargetMode::Self) {
        targets.push_back(actor->id);
    } else if (!intent.targetIds.empty()) {
        targets.push_back(intent.targetIds.front());
    }

    ActionResult result;
    result.events.push_back(ItemUsedEvent{actor->id, intent.itemName, targets});
    result.effects.push_back(ConsumeItemEffect{actor->id, intent.itemName});
    if (targets.empty()) {
        return GameResult<ActionResult>::ok(std::move(result));
    }

    const Combatant* target = context.Find(targets.front());
    if (target == nullptr) {
        return notFound<ActionResult>(targets.front());
    }
    if (item->thrown) {
        AttackRoll attack = RollAttack(*actor, *target, actor->rangedAttackBonus, context);
        result.events.push_back(AttackRolledEvent{actor->id, target->id, attack.roll,
                                                  attack.total, attack.needed,
                                                  attack.hit, attack.critical, true});
        if (!attack.hit) {
            return GameResult<ActionResult>::ok(std::move(result));
        }
    }
    if (!item->damageDie.empty()) {
        auto rolled = dice_.Roll(item->damageDie);
        if (!rolled) {
            return GameResult<ActionResult>::err(rolled.error());
        }
        result.effects.push_back(
            DamageEffect{actor->id, target->id, std::max(rolled.value(), 1)});
    }
    if (!item->healDie.empty()) {
        auto rolled = dice_.Roll(item->healDie);
        if (!rolled) {
            return GameResult<ActionResult>::err(rolled.error());
        }
        result.effects.push_back(
            HealEffect{actor->id, target->id, std::max(rolled.value(), 0)});
    }
    return GameResult<ActionResult>::ok(std::move(result));
}

GameResult<ActionResult> ActionResolver::resolveTurnUndead(const TurnUndeadIntent& intent,
                                                          const CombatContext& context) {
    const Combatant* cleric = context.Find(intent.actor);
    if (cleric == nullptr) {
        return notFound<ActionResult>(intent.actor);
    }

    struct Candidate {
        const Combatant* undead;
        int hitDice;
        TurnUndeadEntry entry;
    };
    std::vector<Candidate> candidates;
    for (const auto* c : context.Active(OpposingSide(cleric->side))) {
        if (c->isUndead) {
            const int hd = CombatantHitDice(*c);
            candidates.push_back({c, hd, LookupTurnUndead(cleric->level, UndeadTier(hd))});
        }
    }

    TurnUndeadAttemptedEvent attempted;
    attempted.actorId = cleric->id;
    ActionResult result;

    const bool anyPossible = std::any_of(
        candidates.begin(), candidates.end(), [](const Candidate& c) {
            return c.entry.requirement != TurnUndeadRequirement::Impossible;
        });
    if (!anyPossible) {
        attempted.result = TurnUndeadResult::Impossible;
        result.events.push_back(std::move(attempted));
        return GameResult<ActionResult>::ok(std::move(result));
    }

    for (const auto& c : candidates) {
        if (c.entry.requirement == TurnUndeadRequirement::Roll
            && (!attempted.targetNumber || c.entry.target < *attempted.targetNumber)) {
            attempted.targetNumber = c.entry.target;
        }
    }
    if (attempted.targetNumber) {
        auto rolled = dice_.Roll("2d6");
        if (!rolled) {
            return GameResult<ActionResult>::err(rolled.error());
        }
        attempted.roll = rolled.value();
    }

    std::vector<HitDiceCandidate> eligible;
    for (const auto& c : candidates) {
        switch (c.entry.requirement) {
            case TurnUndeadRequirement::Turn:
            case TurnUndeadRequirement::Destroy:
                eligible.push_back({c.undead->id, c.hitDice});
                break;
            case TurnUndeadRequirement::Roll:
                if (attempted.roll >= c.entry.target) {
                    eligible.push_back({c.undead->id, c.hitDice});
                }
                break;
            case TurnUndeadRequirement::Impossible:
                break;
        }
    }
    if (eligible.empty()) {
        attempted.result = TurnUndeadResult::Failed;
        result.events.push_back(std::move(attempted));
        return GameResult<ActionResult>::ok(std::move(result));
    }

    auto pool = dice_.Roll("2d6");
    if (!pool) {
        return GameResult<ActionResult>::err(pool.error());
    }
    auto selected = ResolveHdPool(eligible, pool.value());
    if (selected.empty()) {
        // A successful turn always affects at least the weakest eligible undead.
        auto weakest = std::min_element(
            eligible.begin(), eligible.end(),
            [](const HitDiceCandidate& a, const HitDiceCandidate& b) {
                return a.hitDice < b.hitDice;
            });
        selected.push_back(weakest->id);
    }

    auto entryOf = [&candidates](const std::string& id) -> const Candidate& {
        return *std::find_if(candidates.begin(), candidates.end(),
                             [&id](const Candidate& c) { return c.undead->id == id; });
    };
    const bool allDestroyed = std::all_of(
        selected.begin(), selected.end(), [&entryOf](const std::string& id) {
            return entryOf(id).entry.requirement == TurnUndeadRequirement::Destroy;
        });
    attempted.result = allDestroyed ? TurnUndeadResult::Destroyed : TurnUndeadResult::Turned;
    result.events.push_back(std::move(attempted));

    for (const auto& id : selected) {
        const Candidate& c = entryOf(id);
        const bool destroyed = c.entry.requirement == TurnUndeadRequirement::Destroy;
        result.events.push_back(UndeadTurnedEvent{cleric->id, id, destroyed, c.hitDice});
        if (destroyed) {
            result.effects.push_back(
                DamageEffect{cleric->id, id, std::max(c.undead->hp, 1)});
        } else {
            result.effects.push_back(FleeEffect{id, "turned"});
        }
    }
    return GameResult<ActionResult>::ok(std::move(result));
}

}  // namespace skirmish::combat
