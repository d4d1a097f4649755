#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias binding Result to GameError.

#include "skirmish/core/result.hpp"
#include "skirmish/foundation/game_error.hpp"

namespace skirmish::foundation {

/// Result type used by every fallible engine and foundation operation.
///
/// Example:
/// @code
///   GameResult<int> rollDamage(DiceService& dice, std::string_view die) {
///       auto rolled = dice.Roll(die);
///       if (!rolled) {
///           return GameResult<int>::err(rolled.error());
///       }
///       return GameResult<int>::ok(std::max(rolled.value(), 1));
///   }
/// @endcode
template <typename T>
using GameResult = skirmish::Result<T, GameError>;

}  // namespace skirmish::foundation
