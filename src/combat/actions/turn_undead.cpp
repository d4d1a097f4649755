/// @file turn_undead.cpp
/// @brief Turn undead tiers and table lookup.

#include "skirmish/combat/turn_undead.hpp"

#include <algorithm>

namespace skirmish::combat {

int UndeadTier(int hitDice) noexcept {
    // Tier 3 is reserved for 2+ HD undead, which whole hit dice cannot express.
    switch (std::max(hitDice, 1)) {
        case 1:  return 1;
        case 2:  return 2;
        case 3:  return 4;
        case 4:  return 5;
        case 5:  return 6;
        case 6:  return 7;
        default: return 8;
    }
}

TurnUndeadEntry LookupTurnUndead(int clericLevel, int tier) noexcept {
    const int diff = std::max(clericLevel, 1) - tier;
    if (diff >= 3) {
        return {TurnUndeadRequirement::Destroy, 0};
    }
    if (diff >= 1) {
        return {TurnUndeadRequirement::Turn, 0};
    }
    switch (diff) {
        case 0:  return {TurnUndeadRequirement::Roll, 7};
        case -1: return {TurnUndeadRequirement::Roll, 9};
        case -2: return {TurnUndeadRequirement::Roll, 11};
        default: return {TurnUndeadRequirement::Impossible, 0};
    }
}

}  // namespace skirmish::combat
