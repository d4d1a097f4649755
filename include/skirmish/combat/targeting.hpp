#pragma once

/// @file targeting.hpp
/// @brief Target selection for multi-target spells and items.
///
/// Pure functions over candidate lists; the only state they touch is the
/// dice service passed in.

#include <string>
#include <vector>

#include "skirmish/combat/dice_service.hpp"

namespace skirmish::combat {

/// A target candidate with its hit dice.
struct HitDiceCandidate {
    std::string id;
    int hitDice = 1;
};

/// Weakest-first selection bounded by a hit-dice budget.
///
/// Candidates are stably sorted by hit dice (each floored at 1) and taken
/// while they fit in the remaining budget. Selection stops at the first
/// candidate that does not fit. Empty if @p poolTotal <= 0.
[[nodiscard]] std::vector<std::string> ResolveHdPool(
    const std::vector<HitDiceCandidate>& candidates, int poolTotal);

/// Random sample without replacement of min(count, size) candidates.
///
/// Empty if @p count <= 0 or there are no candidates. Result order follows
/// the draw order, not the input order.
[[nodiscard]] std::vector<std::string> ResolveRandomGroup(
    const std::vector<std::string>& candidates, int count, DiceService& dice);

}  // namespace skirmish::combat
