#pragma once

/// @file action_resolver.hpp
/// @brief Validation and resolution of action intents.
///
/// Resolution reads the combat context and rolls dice but never mutates the
/// context: it returns the events describing the rolls and the effects the
/// engine must apply, in order.

#include <string>
#include <vector>

#include "skirmish/combat/combat_context.hpp"
#include "skirmish/combat/dice_service.hpp"
#include "skirmish/combat/effects.hpp"
#include "skirmish/combat/events.hpp"
#include "skirmish/combat/intents.hpp"
#include "skirmish/foundation/game_result.hpp"

namespace skirmish::combat {

/// Outcome of resolving one intent.
struct ActionResult {
    std::vector<EncounterEvent> events;
    std::vector<Effect> effects;
};

/// Outcome of one attack roll.
struct AttackRoll {
    int roll = 0;
    int total = 0;
    int needed = 0;
    bool hit = false;
    bool critical = false;
};

class ActionResolver {
public:
    explicit ActionResolver(DiceService& dice)
        : dice_(dice) {}

    /// Check @p intent against the current state. Empty means valid.
    [[nodiscard]] std::vector<Rejection> Validate(const ActionIntent& intent,
                                                  const CombatContext& context) const;

    /// Roll and compute effects for a validated intent.
    foundation::GameResult<ActionResult> Resolve(const ActionIntent& intent,
                                                 const CombatContext& context);

    /// d20 attack against descending armor class.
    ///
    /// Natural 20 always hits, natural 1 always misses; otherwise
    /// roll + bonus + ATTACK modifiers must reach thac0 - effective AC.
    AttackRoll RollAttack(const Combatant& attacker, const Combatant& defender,
                          int attackBonus, const CombatContext& context);

private:
    foundation::GameResult<ActionResult> resolveWeapon(const Combatant& actor,
                                                       const std::string& targetId,
                                                       bool ranged,
                                                       const CombatContext& context);
    foundation::GameResult<ActionResult> resolveSpell(const CastSpellIntent& intent,
                                                      const CombatContext& context);
    foundation::GameResult<ActionResult> resolveItem(const UseItemIntent& intent,
                                                     const CombatContext& context);
    foundation::GameResult<ActionResult> resolveTurnUndead(const TurnUndeadIntent& intent,
                                                           const CombatContext& context);

    DiceService& dice_;
};

}  // namespace skirmish::combat
