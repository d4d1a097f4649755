#pragma once

/// @file intents.hpp
/// @brief ActionIntent: the closed set of actions a combatant may propose.
///
/// Intents are plain values. Target lists are always present; a self or
/// untargeted action carries an empty vector.

#include <string>
#include <variant>
#include <vector>

namespace skirmish::combat {

struct MeleeAttackIntent {
    std::string actor;
    std::string target;

    bool operator==(const MeleeAttackIntent&) const = default;
};

struct RangedAttackIntent {
    std::string actor;
    std::string target;

    bool operator==(const RangedAttackIntent&) const = default;
};

struct CastSpellIntent {
    std::string actor;
    std::string spellId;
    int slotLevel = 0;
    std::vector<std::string> targetIds;

    bool operator==(const CastSpellIntent&) const = default;
};

struct UseItemIntent {
    std::string actor;
    std::string itemName;
    std::vector<std::string> targetIds;

    bool operator==(const UseItemIntent&) const = default;
};

struct FleeIntent {
    std::string actor;

    bool operator==(const FleeIntent&) const = default;
};

/// Cleric class ability against every undead opponent in the encounter.
struct TurnUndeadIntent {
    std::string actor;

    bool operator==(const TurnUndeadIntent&) const = default;
};

using ActionIntent = std::variant<MeleeAttackIntent,
                                  RangedAttackIntent,
                                  CastSpellIntent,
                                  UseItemIntent,
                                  FleeIntent,
                                  TurnUndeadIntent>;

/// The combatant proposing @p intent.
[[nodiscard]] inline const std::string& ActorOf(const ActionIntent& intent) {
    return std::visit([](const auto& i) -> const std::string& { return i.actor; },
                      intent);
}

}  // namespace skirmish::combat
