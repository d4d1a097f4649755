#pragma once

/// @file encounter_engine.hpp
/// @brief EncounterEngine: the turn-based encounter state machine.
///
/// The engine drives INIT -> ROUND_START -> TURN_START -> AWAIT_INTENT ->
/// VALIDATE_INTENT -> EXECUTE_ACTION -> CHECK_DEATHS -> CHECK_MORALE ->
/// CHECK_VICTORY, looping back to TURN_START or ROUND_START until one side
/// is out of the fight. Each Step() runs exactly one state handler and
/// returns the events it produced.
///
/// Combatants with a TacticalProvider act on their own. For everyone else
/// the engine stops at AWAIT_INTENT after emitting NeedAction, and the
/// caller answers with SubmitIntent().
///
/// Example:
/// @code
///   auto engine = EncounterEngine::Create(roster, dice).value();
///   auto steps = engine->StepUntilDecision();
///   engine->StepUntilDecision(MeleeAttackIntent{"pc:Ada", "monster:Goblin:0"});
/// @endcode

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "skirmish/combat/action_resolver.hpp"
#include "skirmish/combat/combat_context.hpp"
#include "skirmish/combat/combat_types.hpp"
#include "skirmish/combat/combat_view.hpp"
#include "skirmish/combat/dice_service.hpp"
#include "skirmish/combat/effects.hpp"
#include "skirmish/combat/events.hpp"
#include "skirmish/combat/intents.hpp"
#include "skirmish/combat/tactical_provider.hpp"
#include "skirmish/foundation/game_result.hpp"

namespace skirmish::combat {

/// Policy knobs for one encounter.
struct EncounterOptions {
    std::string encounterId = "encounter";
    TurnOrderPolicy turnOrder = TurnOrderPolicy::RosterOrder;
    bool moraleEnabled = true;
    bool surpriseEnabled = false;
    bool autoProvideMonsters = false;   ///< Random provider for opposition.
    int maxSteps = kDefaultMaxSteps;
};

/// What one Step() did.
struct StepResult {
    EncounterState state = EncounterState::Init;   ///< State after the step.
    std::vector<EncounterEvent> events;
    bool needsIntent = false;   ///< Suspended waiting for SubmitIntent().
};

class EncounterEngine {
public:
    /// Build an engine over @p roster.
    ///
    /// The roster is reordered party first, then opposition, keeping
    /// insertion order within a side. InvalidRoster if a side has no active
    /// combatant, an id is empty or duplicated, or max hp is not positive.
    /// @p dice must outlive the engine.
    static foundation::GameResult<std::unique_ptr<EncounterEngine>> Create(
        std::vector<Combatant> roster,
        DiceService& dice,
        EncounterOptions options = {});

    ~EncounterEngine();

    EncounterEngine(const EncounterEngine&) = delete;
    EncounterEngine& operator=(const EncounterEngine&) = delete;

    /// Let @p provider choose intents for @p combatantId.
    /// Passing nullptr returns the combatant to external control.
    foundation::GameResult<void> SetProvider(const std::string& combatantId,
                                             std::shared_ptr<TacticalProvider> provider);

    /// Run one state handler.
    ///
    /// EncounterAlreadyEnded once the encounter is over. Failures inside a
    /// handler do not surface here: they fault the encounter and the
    /// returned step carries the EncounterFaulted event.
    foundation::GameResult<StepResult> Step();

    /// Answer a NeedAction for the current combatant.
    ///
    /// NotAwaitingIntent if the engine is not suspended, WrongCombatant if
    /// the intent's actor is not the one being asked, UnknownSpell or
    /// UnknownItem for catalog misses. Legality against the current state
    /// is checked on the next step and reported as ActionRejected.
    foundation::GameResult<void> SubmitIntent(ActionIntent intent);

    /// Submit @p intent if given, then step until the engine needs an
    /// intent or the encounter ends.
    ///
    /// Running out of @p maxSteps (default: options.maxSteps) before
    /// reaching either point faults the encounter and returns
    /// EncounterLoopExhausted.
    foundation::GameResult<std::vector<StepResult>> StepUntilDecision(
        std::optional<ActionIntent> intent = std::nullopt,
        std::optional<int> maxSteps = std::nullopt);

    [[nodiscard]] EncounterState State() const noexcept { return state_; }

    [[nodiscard]] std::optional<EncounterOutcome> Outcome() const noexcept {
        return outcome_;
    }

    [[nodiscard]] bool IsEnded() const noexcept { return state_ == EncounterState::Ended; }

    /// True while suspended on a NeedAction.
    [[nodiscard]] bool IsAwaitingIntent() const noexcept { return awaitingExternal_; }

    /// Every event emitted so far, in order.
    [[nodiscard]] const std::vector<EncounterEvent>& Events() const noexcept {
        return history_;
    }

    /// Choices offered on the current turn.
    [[nodiscard]] const std::vector<ActionChoice>& CurrentChoices() const noexcept {
        return choices_;
    }

    /// Snapshot of the encounter; safe in any state.
    [[nodiscard]] CombatView View() const;

    [[nodiscard]] const CombatContext& Context() const noexcept { return context_; }

    [[nodiscard]] const EncounterOptions& Options() const noexcept { return options_; }

private:
    EncounterEngine(std::vector<Combatant> roster, DiceService& dice,
                    EncounterOptions options);

    // State handlers; each returns the next state.
    foundation::GameResult<EncounterState> handleInit();
    foundation::GameResult<EncounterState> handleRoundStart();
    foundation::GameResult<EncounterState> handleTurnStart();
    foundation::GameResult<EncounterState> handleAwaitIntent();
    foundation::GameResult<EncounterState> handleValidateIntent();
    foundation::GameResult<EncounterState> handleExecuteAction();
    foundation::GameResult<EncounterState> handleCheckDeaths();
    foundation::GameResult<EncounterState> handleCheckMorale();
    foundation::GameResult<EncounterState> handleCheckVictory();

    std::vector<std::string> buildTurnOrder();
    std::vector<ActionChoice> buildChoices(const Combatant& actor) const;
    foundation::GameResult<void> askProvider(TacticalProvider& provider);
    void promptExternal();
    foundation::GameResult<void> applyEffect(const Effect& effect);
    bool rollMorale(const std::string& trigger, int morale);
    void tickRoundBoundary();
    void fault(foundation::ErrorCode code, const std::string& message);
    void emit(EncounterEvent event);

    [[nodiscard]] TacticalProvider* providerFor(const std::string& combatantId) const;

    CombatContext context_;
    DiceService& dice_;
    EncounterOptions options_;
    ActionResolver resolver_;
    std::shared_ptr<TacticalProvider> monsterProvider_;
    std::unordered_map<std::string, std::shared_ptr<TacticalProvider>> providers_;

    EncounterState state_ = EncounterState::Init;
    std::optional<EncounterOutcome> outcome_;
    std::optional<ActionIntent> pendingIntent_;
    std::vector<ActionChoice> choices_;
    bool awaitingExternal_ = false;

    std::vector<EncounterEvent> history_;
    std::vector<EncounterEvent>* stepEvents_ = nullptr;   ///< Sink of the running step.
};

}  // namespace skirmish::combat
