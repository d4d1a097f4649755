#pragma once

/// @file combatant.hpp
/// @brief Combatant: the engine-owned stat block of one encounter participant.

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "skirmish/combat/combat_types.hpp"

namespace skirmish::combat {

/// One participant in an encounter.
///
/// Armor class is descending (lower is better). `hp` may drop below zero
/// while effects resolve; views clamp it to 0.
struct Combatant {
    std::string id;
    std::string name;
    CombatSide side = CombatSide::Party;
    EntityKind kind = EntityKind::Unknown;
    CharacterClass characterClass = CharacterClass::Commoner;

    int level = 1;
    int hitDice = 1;          ///< Dice rolled for monster hit points.
    int hp = 1;
    int maxHp = 1;
    int armorClass = 9;
    int thac0 = 19;
    int attackBonus = 0;
    std::string damageDie = "1d6";
    int attacksPerRound = 1;
    std::optional<std::string> rangedDamageDie;
    int rangedAttackBonus = 0;
    int saveTarget = 14;      ///< d20 result needed on a saving throw.
    int morale = 7;           ///< 2..12, opposition only.
    bool isUndead = false;    ///< Subject to a cleric's turn undead.

    std::map<int, int> spellSlots;         ///< Spell level -> slots left.
    std::vector<std::string> knownSpells;
    std::vector<std::string> items;        ///< One entry per carried copy.

    bool fled = false;

    [[nodiscard]] bool IsAlive() const noexcept { return hp > 0; }

    /// Alive and still in the fight.
    [[nodiscard]] bool IsActive() const noexcept { return IsAlive() && !fled; }

    [[nodiscard]] int DisplayHp() const noexcept { return std::max(hp, 0); }

    [[nodiscard]] int SlotsAt(int spellLevel) const {
        auto it = spellSlots.find(spellLevel);
        return it == spellSlots.end() ? 0 : it->second;
    }

    [[nodiscard]] bool KnowsSpell(std::string_view spellId) const {
        return std::find(knownSpells.begin(), knownSpells.end(), spellId)
            != knownSpells.end();
    }

    [[nodiscard]] bool HasItem(std::string_view itemName) const {
        return std::find(items.begin(), items.end(), itemName) != items.end();
    }
};

/// Identifier for a party member: "pc:<name>".
[[nodiscard]] inline std::string MakePartyId(std::string_view name) {
    return "pc:" + std::string(name);
}

/// Identifier for the @p index-th opposition member: "monster:<name>:<index>".
[[nodiscard]] inline std::string MakeMonsterId(std::string_view name, int index) {
    return "monster:" + std::string(name) + ":" + std::to_string(index);
}

/// Hit dice used by group targeting, floored at 1.
///
/// Monsters use the dice rolled for their hit points, player characters
/// their level, anything else counts as 1.
[[nodiscard]] inline int CombatantHitDice(const Combatant& combatant) noexcept {
    switch (combatant.kind) {
        case EntityKind::Monster: return std::max(combatant.hitDice, 1);
        case EntityKind::Player:  return std::max(combatant.level, 1);
        case EntityKind::Unknown: return 1;
    }
    return 1;
}

}  // namespace skirmish::combat
