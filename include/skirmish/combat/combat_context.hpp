#pragma once

/// @file combat_context.hpp
/// @brief CombatContext: mutable state of one encounter, owned by the engine.
///
/// Providers and the action resolver receive it by const reference; only
/// EncounterEngine applies effects to it.

#include <deque>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "skirmish/combat/combatant.hpp"
#include "skirmish/combat/condition_tracker.hpp"
#include "skirmish/combat/modifier_tracker.hpp"

namespace skirmish::combat {

/// Opposition morale bookkeeping.
struct MoraleState {
    bool enabled = true;
    int passes = 0;
    bool immune = false;
    bool firstDeathChecked = false;
    bool halfDownChecked = false;
};

struct CombatContext {
    std::vector<Combatant> roster;            ///< Party first, then opposition.
    int round = 0;
    std::deque<std::string> queue;            ///< Remaining turns this round.
    std::optional<std::string> currentCombatantId;
    std::set<std::string> announcedDeaths;
    std::optional<CombatSide> surprisedSide;
    ModifierTracker modifiers;
    ConditionTracker conditions;
    MoraleState morale;

    [[nodiscard]] Combatant* Find(std::string_view id);
    [[nodiscard]] const Combatant* Find(std::string_view id) const;

    /// Alive, not-fled combatants of @p side in roster order.
    [[nodiscard]] std::vector<const Combatant*> Active(CombatSide side) const;

    [[nodiscard]] std::vector<std::string> ActiveIds(CombatSide side) const;

    /// Number of roster entries on @p side.
    [[nodiscard]] int CountSide(CombatSide side) const;

    /// Armor class including ARMOR_CLASS modifiers.
    [[nodiscard]] int EffectiveArmorClass(const Combatant& combatant) const;
};

}  // namespace skirmish::combat
