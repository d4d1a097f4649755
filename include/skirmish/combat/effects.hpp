#pragma once

/// @file effects.hpp
/// @brief Effect: the closed set of state mutations an action can produce.
///
/// Resolving one intent yields an ordered list of effects. The engine
/// applies them in order; nothing else writes hit points, slots, items,
/// conditions, modifiers or presence in combat.

#include <optional>
#include <string>
#include <variant>

#include "skirmish/combat/modifier_tracker.hpp"

namespace skirmish::combat {

struct DamageEffect {
    std::string source;
    std::string target;
    int amount = 0;

    bool operator==(const DamageEffect&) const = default;
};

struct ConsumeSlotEffect {
    std::string caster;
    int level = 0;

    bool operator==(const ConsumeSlotEffect&) const = default;
};

struct ApplyConditionEffect {
    std::string source;
    std::string target;
    std::string conditionId;
    std::optional<int> duration;

    bool operator==(const ApplyConditionEffect&) const = default;
};

struct FleeEffect {
    std::string combatant;
    std::string reason;   ///< "intent", "morale" or "turned".

    bool operator==(const FleeEffect&) const = default;
};

struct HealEffect {
    std::string source;
    std::string target;
    int amount = 0;

    bool operator==(const HealEffect&) const = default;
};

struct ApplyModifierEffect {
    std::string source;
    std::string target;
    ActiveModifier modifier;

    bool operator==(const ApplyModifierEffect&) const = default;
};

struct ConsumeItemEffect {
    std::string actor;
    std::string itemName;

    bool operator==(const ConsumeItemEffect&) const = default;
};

using Effect = std::variant<DamageEffect,
                            ConsumeSlotEffect,
                            ApplyConditionEffect,
                            FleeEffect,
                            HealEffect,
                            ApplyModifierEffect,
                            ConsumeItemEffect>;

}  // namespace skirmish::combat
