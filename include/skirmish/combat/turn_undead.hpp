#pragma once

/// @file turn_undead.hpp
/// @brief Cleric turn undead table.
///
/// Undead are grouped into tiers by hit dice. The difference between the
/// cleric's level and the tier decides whether turning is impossible, needs
/// a 2d6 roll against a target number, or succeeds automatically.

#include <cstdint>

namespace skirmish::combat {

enum class TurnUndeadRequirement : uint8_t {
    Impossible,
    Roll,      ///< 2d6 must reach `target`.
    Turn,      ///< Automatic turn.
    Destroy    ///< Automatic destruction.
};

struct TurnUndeadEntry {
    TurnUndeadRequirement requirement = TurnUndeadRequirement::Impossible;
    int target = 0;   ///< Only meaningful for Roll.

    bool operator==(const TurnUndeadEntry&) const = default;
};

/// Table tier for an undead with @p hitDice (1..8; 7 HD and up share tier 8).
[[nodiscard]] int UndeadTier(int hitDice) noexcept;

/// Table entry for a cleric of @p clericLevel against undead of @p tier.
[[nodiscard]] TurnUndeadEntry LookupTurnUndead(int clericLevel, int tier) noexcept;

}  // namespace skirmish::combat
