#pragma once

/// @file tactical_provider.hpp
/// @brief TacticalProvider: decision strategy for combatants not driven
///        by an external caller.

#include <deque>
#include <string>
#include <vector>

#include "skirmish/combat/combat_context.hpp"
#include "skirmish/combat/dice_service.hpp"
#include "skirmish/combat/events.hpp"
#include "skirmish/combat/intents.hpp"
#include "skirmish/foundation/game_result.hpp"

namespace skirmish::combat {

/// Strategy that picks one of the offered choices for a combatant's turn.
///
/// @p choices is never empty when called by the engine. Returning an error
/// faults the encounter.
class TacticalProvider {
public:
    virtual ~TacticalProvider() = default;

    virtual foundation::GameResult<ActionIntent> ChooseIntent(
        const std::string& combatantId,
        const std::vector<ActionChoice>& choices,
        const CombatContext& context) = 0;
};

/// Uniform random choice through the dice service.
class RandomTacticalProvider final : public TacticalProvider {
public:
    explicit RandomTacticalProvider(DiceService& dice)
        : dice_(dice) {}

    foundation::GameResult<ActionIntent> ChooseIntent(
        const std::string& combatantId,
        const std::vector<ActionChoice>& choices,
        const CombatContext& context) override;

private:
    DiceService& dice_;
};

/// Replays a queue of intents, then falls back to the first offered choice.
///
/// Scripted intents are returned as given, even when they are not among
/// the offered choices; the engine validates them like any other intent.
class ScriptedTacticalProvider final : public TacticalProvider {
public:
    ScriptedTacticalProvider() = default;
    explicit ScriptedTacticalProvider(std::vector<ActionIntent> script);

    void Enqueue(ActionIntent intent);

    [[nodiscard]] std::size_t Remaining() const noexcept { return script_.size(); }

    foundation::GameResult<ActionIntent> ChooseIntent(
        const std::string& combatantId,
        const std::vector<ActionChoice>& choices,
        const CombatContext& context) override;

private:
    std::deque<ActionIntent> script_;
};

}  // namespace skirmish::combat
