#pragma once

/// @file combat_view.hpp
/// @brief Immutable snapshots of encounter state for observers.
///
/// Views are deep copies. They never reference engine storage, so holding
/// one across further steps is safe.

#include <optional>
#include <string>
#include <vector>

#include "skirmish/combat/combat_context.hpp"
#include "skirmish/combat/combat_types.hpp"
#include "skirmish/combat/modifier_tracker.hpp"

namespace skirmish::combat {

struct CombatantView {
    std::string id;
    std::string name;
    CombatSide side = CombatSide::Party;
    EntityKind kind = EntityKind::Unknown;
    int hp = 0;                   ///< Clamped at 0.
    int maxHp = 0;
    int armorClass = 0;
    int effectiveArmorClass = 0;  ///< Including ARMOR_CLASS modifiers.
    bool isAlive = false;
    bool hasFled = false;
    std::vector<std::string> conditions;
    std::vector<ActiveModifier> modifiers;

    bool operator==(const CombatantView&) const = default;
};

struct CombatView {
    std::string encounterId;
    int roundNumber = 0;
    EncounterState state = EncounterState::Init;
    std::optional<EncounterOutcome> outcome;
    std::optional<std::string> currentCombatantId;
    std::vector<CombatantView> combatants;      ///< Roster order.
    std::vector<std::string> announcedDeaths;   ///< Sorted.

    /// nullptr if @p id is not in the roster.
    [[nodiscard]] const CombatantView* Find(const std::string& id) const;

    bool operator==(const CombatView&) const = default;
};

/// Snapshot @p context. Side-effect free.
[[nodiscard]] CombatView BuildCombatView(const CombatContext& context,
                                         const std::string& encounterId,
                                         EncounterState state,
                                         std::optional<EncounterOutcome> outcome);

}  // namespace skirmish::combat
