/// @file tactical_provider.cpp
/// @brief Random and scripted tactical providers.

#include "skirmish/combat/tactical_provider.hpp"

#include "skirmish/foundation/game_logger.hpp"

namespace skirmish::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<ActionIntent> noChoices(const std::string& combatantId) {
    return GameResult<ActionIntent>::err(GameError(
        ErrorCode::NoProviderChoice,
        "no action choices offered to " + combatantId, combatantId));
}

}  // namespace

GameResult<ActionIntent> RandomTacticalProvider::ChooseIntent(
    const std::string& combatantId,
    const std::vector<ActionChoice>& choices,
    const CombatContext& /*context*/) {
    auto chosen = dice_.Choice(choices);
    if (!chosen) {
        return noChoices(combatantId);
    }
    SKIRMISH_LOG_DEBUG(LogCategory::AI,
                       combatantId + " chose '" + chosen.value().Label() + "'");
    return GameResult<ActionIntent>::ok(chosen.value().intent);
}

ScriptedTacticalProvider::ScriptedTacticalProvider(std::vector<ActionIntent> script)
    : script_(script.begin(), script.end()) {}

void ScriptedTacticalProvider::Enqueue(ActionIntent intent) {
    script_.push_back(std::move(intent));
}

GameResult<ActionIntent> ScriptedTacticalProvider::ChooseIntent(
    const std::string& combatantId,
    const std::vector<ActionChoice>& choices,
    const CombatContext& /*context*/) {
    if (!script_.empty()) {
        ActionIntent next = std::move(script_.front());
        script_.pop_front();
        return GameResult<ActionIntent>::ok(std::move(next));
    }
    if (choices.empty()) {
        return noChoices(combatantId);
    }
    return GameResult<ActionIntent>::ok(choices.front().intent);
}

}  // namespace skirmish::combat
