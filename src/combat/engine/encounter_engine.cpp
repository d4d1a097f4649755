/// @file encounter_engine.cpp
/// @brief EncounterEngine state handlers and effect application.

#include "skirmish/combat/encounter_engine.hpp"

#include <algorithm>
#include <set>
#include <type_traits>

#include "skirmish/combat/event_formatter.hpp"
#include "skirmish/combat/item_catalog.hpp"
#include "skirmish/combat/spell_catalog.hpp"
#include "skirmish/foundation/game_logger.hpp"

namespace skirmish::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr DiceExpression kD6{1, 6, 0};
constexpr DiceExpression k2D6{2, 6, 0};

GameResult<std::unique_ptr<EncounterEngine>> invalidRoster(const std::string& message) {
    return GameResult<std::unique_ptr<EncounterEngine>>::err(
        GameError(ErrorCode::InvalidRoster, message));
}

GameResult<EncounterState> next(EncounterState state) {
    return GameResult<EncounterState>::ok(state);
}

template <typename T>
inline constexpr bool kAlwaysFalse = false;

}  // namespace

// ── Construction ────────────────────────────────────────────────────────

GameResult<std::unique_ptr<EncounterEngine>> EncounterEngine::Create(
    std::vector<Combatant> roster,
    DiceService& dice,
    EncounterOptions options) {
    std::set<std::string> ids;
    for (const auto& c : roster) {
        if (c.id.empty()) {
            return invalidRoster("combatant '" + c.name + "' has an empty id");
        }
        if (!ids.insert(c.id).second) {
            return invalidRoster("duplicate combatant id: " + c.id);
        }
        if (c.maxHp <= 0) {
            return invalidRoster("combatant " + c.id + " has non-positive max hp");
        }
    }

    auto hasActive = [&roster](CombatSide side) {
        return std::any_of(roster.begin(), roster.end(), [side](const Combatant& c) {
            return c.side == side && c.IsActive();
        });
    };
    if (!hasActive(CombatSide::Party) || !hasActive(CombatSide::Monster)) {
        return invalidRoster("each side needs at least one active combatant");
    }
    if (options.maxSteps <= 0) {
        return GameResult<std::unique_ptr<EncounterEngine>>::err(GameError(
            ErrorCode::InvalidArgument, "max steps must be positive"));
    }

    std::stable_partition(roster.begin(), roster.end(), [](const Combatant& c) {
        return c.side == CombatSide::Party;
    });

    SKIRMISH_LOG_INFO(LogCategory::Core,
                      "encounter " + options.encounterId + " created with "
                          + std::to_string(roster.size()) + " combatants");
    return GameResult<std::unique_ptr<EncounterEngine>>::ok(std::unique_ptr<EncounterEngine>(
        new EncounterEngine(std::move(roster), dice, std::move(options))));
}

EncounterEngine::EncounterEngine(std::vector<Combatant> roster,
                                 DiceService& dice,
                                 EncounterOptions options)
    : dice_(dice),
      options_(std::move(options)),
      resolver_(dice) {
    context_.roster = std::move(roster);
    context_.morale.enabled = options_.moraleEnabled;
    if (options_.autoProvideMonsters) {
        monsterProvider_ = std::make_shared<RandomTacticalProvider>(dice_);
    }
}

EncounterEngine::~EncounterEngine() = default;

GameResult<void> EncounterEngine::SetProvider(const std::string& combatantId,
                                              std::shared_ptr<TacticalProvider> provider) {
    if (context_.Find(combatantId) == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::CombatantNotFound, "combatant not found: " + combatantId,
            combatantId));
    }
    if (provider) {
        providers_[combatantId] = std::move(provider);
    } else {
        providers_.erase(combatantId);
    }
    return GameResult<void>::ok();
}

TacticalProvider* EncounterEngine::providerFor(const std::string& combatantId) const {
    if (auto it = providers_.find(combatantId); it != providers_.end()) {
        return it->second.get();
    }
    const Combatant* c = context_.Find(combatantId);
    if (monsterProvider_ && c != nullptr && c->side == CombatSide::Monster) {
        return monsterProvider_.get();
    }
    return nullptr;
}

// ── Driving ─────────────────────────────────────────────────────────────

GameResult<StepResult> EncounterEngine::Step() {
    if (state_ == EncounterState::Ended) {
        return GameResult<StepResult>::err(GameError(
            ErrorCode::EncounterAlreadyEnded,
            "encounter " + options_.encounterId + " has already ended"));
    }

    StepResult step;
    stepEvents_ = &step.events;

    GameResult<EncounterState> result = GameResult<EncounterState>::err(
        GameError(ErrorCode::InvalidState, "unhandled state"));
    switch (state_) {
        case EncounterState::Init:           result = handleInit(); break;
        case EncounterState::RoundStart:     result = handleRoundStart(); break;
        case EncounterState::TurnStart:      result = handleTurnStart(); break;
        case EncounterState::AwaitIntent:    result = handleAwaitIntent(); break;
        case EncounterState::ValidateIntent: result = handleValidateIntent(); break;
        case EncounterState::ExecuteAction:  result = handleExecuteAction(); break;
        case EncounterState::CheckDeaths:    result = handleCheckDeaths(); break;
        case EncounterState::CheckMorale:    result = handleCheckMorale(); break;
        case EncounterState::CheckVictory:   result = handleCheckVictory(); break;
        case EncounterState::Ended:          break;
    }

    if (result) {
        state_ = result.value();
    } else {
        fault(result.error().code(), std::string(result.error().message()));
    }

    stepEvents_ = nullptr;
    step.state = state_;
    step.needsIntent = awaitingExternal_ && state_ == EncounterState::AwaitIntent;
    return GameResult<StepResult>::ok(std::move(step));
}

GameResult<void> EncounterEngine::SubmitIntent(ActionIntent intent) {
    if (state_ != EncounterState::AwaitIntent || !awaitingExternal_) {
        return GameResult<void>::err(GameError(
            ErrorCode::NotAwaitingIntent,
            "engine is in " + std::string(EncounterStateName(state_))
                + " and is not awaiting an intent"));
    }
    const std::string& actor = ActorOf(intent);
    if (!context_.currentCombatantId || actor != *context_.currentCombatantId) {
        return GameResult<void>::err(GameError(
            ErrorCode::WrongCombatant,
            "intent for " + actor + " but awaiting "
                + context_.currentCombatantId.value_or("none"),
            actor));
    }
    if (const auto* cast = std::get_if<CastSpellIntent>(&intent)) {
        if (FindSpell(cast->spellId) == nullptr) {
            return GameResult<void>::err(GameError(
                ErrorCode::UnknownSpell, "unknown spell: " + cast->spellId, actor));
        }
    }
    if (const auto* use = std::get_if<UseItemIntent>(&intent)) {
        if (FindItem(use->itemName) == nullptr) {
            return GameResult<void>::err(GameError(
                ErrorCode::UnknownItem, "unknown item: " + use->itemName, actor));
        }
    }

    pendingIntent_ = std::move(intent);
    awaitingExternal_ = false;
    return GameResult<void>::ok();
}

GameResult<std::vector<StepResult>> EncounterEngine::StepUntilDecision(
    std::optional<ActionIntent> intent,
    std::optional<int> maxSteps) {
    using StepsResult = GameResult<std::vector<StepResult>>;

    if (state_ == EncounterState::Ended) {
        return StepsResult::err(GameError(
            ErrorCode::EncounterAlreadyEnded,
            "encounter " + options_.encounterId + " has already ended"));
    }
    if (intent) {
        auto submitted = SubmitIntent(std::move(*intent));
        if (!submitted) {
            return StepsResult::err(submitted.error());
        }
    }

    std::vector<StepResult> steps;
    if (awaitingExternal_) {
        return StepsResult::ok(std::move(steps));
    }

    const int budget = maxSteps.value_or(options_.maxSteps);
    for (int i = 0; i < budget; ++i) {
        auto step = Step();
        if (!step) {
            return StepsResult::err(step.error());
        }
        const bool decided = step.value().needsIntent
            || step.value().state == EncounterState::Ended;
        steps.push_back(std::move(step).value());
        if (decided) {
            return StepsResult::ok(std::move(steps));
        }
    }

    const std::string message = "no decision point reached within "
        + std::to_string(budget) + " steps";
    fault(ErrorCode::EncounterLoopExhausted, message);
    return StepsResult::err(GameError(ErrorCode::EncounterLoopExhausted, message));
}

CombatView EncounterEngine::View() const {
    return BuildCombatView(context_, options_.encounterId, state_, outcome_);
}

// ── State handlers ──────────────────────────────────────────────────────

GameResult<EncounterState> EncounterEngine::handleInit() {
    EncounterStartedEvent started;
    started.encounterId = options_.encounterId;
    for (const auto& c : context_.roster) {
        (c.side == CombatSide::Party ? started.partyIds : started.oppositionIds)
            .push_back(c.id);
    }
    emit(std::move(started));

    if (options_.surpriseEnabled) {
        SurpriseRolledEvent surprise;
        surprise.partyRoll = dice_.Roll(kD6);
        surprise.oppositionRoll = dice_.Roll(kD6);
        if (surprise.partyRoll < surprise.oppositionRoll) {
            surprise.surprisedSide = CombatSide::Party;
        } else if (surprise.oppositionRoll < surprise.partyRoll) {
            surprise.surprisedSide = CombatSide::Monster;
        }
        context_.surprisedSide = surprise.surprisedSide;
        emit(std::move(surprise));
    }
    return next(EncounterState::RoundStart);
}

GameResult<EncounterState> EncounterEngine::handleRoundStart() {
    context_.round += 1;
    emit(RoundStartedEvent{context_.round});

    std::vector<std::string> order = buildTurnOrder();
    context_.queue.assign(order.begin(), order.end());
    emit(TurnQueueBuiltEvent{context_.round, std::move(order)});
    return next(EncounterState::TurnStart);
}

std::vector<std::string> EncounterEngine::buildTurnOrder() {
    std::vector<std::string> order;
    if (options_.turnOrder == TurnOrderPolicy::RosterOrder) {
        for (const auto& c : context_.roster) {
            if (c.IsActive()) {
                order.push_back(c.id);
            }
        }
        return order;
    }

    InitiativeRolledEvent initiative;
    initiative.round = context_.round;
    for (const auto& c : context_.roster) {
        if (c.IsActive()) {
            initiative.rolls.push_back({c.id, dice_.Roll(kD6)});
        }
    }
    std::vector<InitiativeEntry> sorted = initiative.rolls;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const InitiativeEntry& a, const InitiativeEntry& b) {
                         return a.roll > b.roll;
                     });
    for (const auto& entry : sorted) {
        order.push_back(entry.combatantId);
    }
    emit(std::move(initiative));
    return order;
}

GameResult<EncounterState> EncounterEngine::handleTurnStart() {
    choices_.clear();
    pendingIntent_.reset();
    awaitingExternal_ = false;

    while (!context_.queue.empty()) {
        const Combatant* c = context_.Find(context_.queue.front());
        if (c != nullptr && c->IsActive()) {
            break;
        }
        context_.queue.pop_front();
    }
    if (context_.queue.empty()) {
        context_.currentCombatantId.reset();
        return next(EncounterState::CheckVictory);
    }

    const std::string id = context_.queue.front();
    context_.queue.pop_front();
    context_.currentCombatantId = id;
    const Combatant& actor = *context_.Find(id);

    if (context_.round == 1 && context_.surprisedSide == actor.side) {
        emit(TurnSkippedEvent{context_.round, id, "surprised"});
        return next(EncounterState::CheckVictory);
    }
    if (auto reason = context_.conditions.SkipReason(id)) {
        emit(TurnSkippedEvent{context_.round, id, *reason});
        return next(EncounterState::CheckVictory);
    }

    emit(TurnStartedEvent{context_.round, id});
    choices_ = buildChoices(actor);
    if (choices_.empty()) {
        emit(TurnSkippedEvent{context_.round, id, "no_actions"});
        return next(EncounterState::CheckVictory);
    }

    if (TacticalProvider* provider = providerFor(id)) {
        auto chosen = askProvider(*provider);
        if (!chosen) {
            return GameResult<EncounterState>::err(chosen.error());
        }
    } else {
        promptExternal();
    }
    return next(EncounterState::AwaitIntent);
}

std::vector<ActionChoice> EncounterEngine::buildChoices(const Combatant& actor) const {
    std::vector<ActionChoice> choices;
    const auto enemies = context_.Active(OpposingSide(actor.side));
    const auto allies = context_.Active(actor.side);

    for (const auto* enemy : enemies) {
        choices.push_back({"attack_target",
                           {{"target_id", enemy->id}, {"target_name", enemy->name}},
                           MeleeAttackIntent{actor.id, enemy->id}});
    }
    if (actor.rangedDamageDie) {
        for (const auto* enemy : enemies) {
            choices.push_back({"ranged_attack_target",
                               {{"target_id", enemy->id}, {"target_name", enemy->name}},
                               RangedAttackIntent{actor.id, enemy->id}});
        }
    }

    for (const auto& spellId : actor.knownSpells) {
        const SpellDefinition* spell = FindSpell(spellId);
        if (spell == nullptr || !spell->UsableBy(actor.characterClass)
            || actor.SlotsAt(spell->level) <= 0) {
            continue;
        }
        std::map<std::string, std::string> args{{"spell_id", spellId},
                                                {"spell_name", std::string(spell->name)}};
        if (spell->NeedsExplicitTarget()) {
            const auto& pool = spell->targetMode == TargetMode::SingleAlly ? allies : enemies;
            for (const auto* target : pool) {
                auto targeted = args;
                targeted["target_id"] = target->id;
                targeted["target_name"] = target->name;
                choices.push_back({"cast_spell", std::move(targeted),
                                   CastSpellIntent{actor.id, spellId, spell->level,
                                                   {target->id}}});
            }
        } else {
            choices.push_back({"cast_spell", std::move(args),
                               CastSpellIntent{actor.id, spellId, spell->level, {}}});
        }
    }

    std::set<std::string> offeredItems;
    for (const auto& itemName : actor.items) {
        const ItemDefinition* item = FindItem(itemName);
        if (item == nullptr || !offeredItems.insert(itemName).second) {
            continue;
        }
        if (item->targetMode == TargetMode::SingleEnemy) {
            for (const auto* enemy : enemies) {
                choices.push_back({"use_item",
                                   {{"item_name", itemName},
                                    {"target_id", enemy->id},
                                    {"target_name", enemy->name}},
                                   UseItemIntent{actor.id, itemName, {enemy->id}}});
            }
        } else {
            choices.push_back({"use_item", {{"item_name", itemName}},
                               UseItemIntent{actor.id, itemName, {}}});
        }
    }

    if (actor.characterClass == CharacterClass::Cleric
        && std::any_of(enemies.begin(), enemies.end(),
                       [](const Combatant* c) { return c->isUndead; })) {
        choices.push_back({"turn_undead", {}, TurnUndeadIntent{actor.id}});
    }

    if (actor.side == CombatSide::Party) {
        choices.push_back({"flee", {}, FleeIntent{actor.id}});
    }
    return choices;
}

GameResult<void> EncounterEngine::askProvider(TacticalProvider& provider) {
    const std::string& id = *context_.currentCombatantId;
    auto chosen = provider.ChooseIntent(id, choices_, context_);
    if (!chosen) {
        return GameResult<void>::err(chosen.error());
    }
    pendingIntent_ = std::move(chosen).value();
    return GameResult<void>::ok();
}

void EncounterEngine::promptExternal() {
    awaitingExternal_ = true;
    emit(NeedActionEvent{context_.round, *context_.currentCombatantId, choices_});
}

GameResult<EncounterState> EncounterEngine::handleAwaitIntent() {
    if (pendingIntent_) {
        return next(EncounterState::ValidateIntent);
    }
    if (TacticalProvider* provider = providerFor(*context_.currentCombatantId)) {
        auto chosen = askProvider(*provider);
        if (!chosen) {
            return GameResult<EncounterState>::err(chosen.error());
        }
        return next(EncounterState::ValidateIntent);
    }
    // Suspended until SubmitIntent().
    return next(EncounterState::AwaitIntent);
}

GameResult<EncounterState> EncounterEngine::handleValidateIntent() {
    if (!pendingIntent_) {
        return GameResult<EncounterState>::err(
            GameError(ErrorCode::InvalidState, "no intent to validate"));
    }

    auto rejections = resolver_.Validate(*pendingIntent_, context_);
    if (rejections.empty()) {
        return next(EncounterState::ExecuteAction);
    }

    const std::string& id = *context_.currentCombatantId;
    emit(ActionRejectedEvent{id, *pendingIntent_, std::move(rejections)});
    pendingIntent_.reset();
    if (providerFor(id) == nullptr) {
        promptExternal();
    }
    return next(EncounterState::AwaitIntent);
}

GameResult<EncounterState> EncounterEngine::handleExecuteAction() {
    if (!pendingIntent_) {
        return GameResult<EncounterState>::err(
            GameError(ErrorCode::InvalidState, "no intent to execute"));
    }
    ActionIntent intent = std::move(*pendingIntent_);
    pendingIntent_.reset();

    auto resolved = resolver_.Resolve(intent, context_);
    if (!resolved) {
        return GameResult<EncounterState>::err(resolved.error());
    }
    for (auto& event : resolved.value().events) {
        emit(std::move(event));
    }
    for (const auto& effect : resolved.value().effects) {
        auto applied = applyEffect(effect);
        if (!applied) {
            return GameResult<EncounterState>::err(applied.error());
        }
    }
    return next(EncounterState::CheckDeaths);
}

GameResult<EncounterState> EncounterEngine::handleCheckDeaths() {
    for (const auto& c : context_.roster) {
        if (!c.IsAlive() && context_.announcedDeaths.insert(c.id).second) {
            emit(EntityDiedEvent{c.id});
        }
    }
    return next(EncounterState::CheckMorale);
}

GameResult<EncounterState> EncounterEngine::handleCheckMorale() {
    MoraleState& morale = context_.morale;
    if (!morale.enabled || morale.immune
        || context_.Active(CombatSide::Monster).empty()) {
        return next(EncounterState::CheckVictory);
    }

    int groupMorale = 0;
    int dead = 0;
    int down = 0;
    for (const auto& c : context_.roster) {
        if (c.side != CombatSide::Monster) {
            continue;
        }
        groupMorale = std::max(groupMorale, c.morale);
        dead += c.IsAlive() ? 0 : 1;
        down += c.IsActive() ? 0 : 1;
    }
    if (groupMorale >= kFearlessMorale) {
        morale.immune = true;
        return next(EncounterState::CheckVictory);
    }

    std::vector<std::string> triggers;
    if (!morale.firstDeathChecked && dead > 0) {
        morale.firstDeathChecked = true;
        triggers.emplace_back("first_death");
    }
    if (!morale.halfDownChecked && down * 2 >= context_.CountSide(CombatSide::Monster)) {
        morale.halfDownChecked = true;
        triggers.emplace_back("half_down");
    }

    for (const auto& trigger : triggers) {
        if (!rollMorale(trigger, groupMorale)) {
            for (const auto& id : context_.ActiveIds(CombatSide::Monster)) {
                auto applied = applyEffect(FleeEffect{id, "morale"});
                if (!applied) {
                    return GameResult<EncounterState>::err(applied.error());
                }
            }
            break;
        }
        if (morale.immune) {
            break;
        }
    }
    return next(EncounterState::CheckVictory);
}

bool EncounterEngine::rollMorale(const std::string& trigger, int morale) {
    MoraleCheckedEvent check;
    check.side = CombatSide::Monster;
    check.trigger = trigger;
    check.morale = morale;
    check.roll = dice_.Roll(k2D6);
    check.passed = check.roll <= morale;
    if (check.passed) {
        context_.morale.passes += 1;
        if (context_.morale.passes >= kMoralePassesForImmunity) {
            context_.morale.immune = true;
        }
    }
    const bool passed = check.passed;
    emit(std::move(check));
    return passed;
}

GameResult<EncounterState> EncounterEngine::handleCheckVictory() {
    std::optional<EncounterOutcome> outcome;
    if (context_.Active(CombatSide::Monster).empty()) {
        outcome = EncounterOutcome::PartyVictory;
    } else if (context_.Active(CombatSide::Party).empty()) {
        outcome = EncounterOutcome::OppositionVictory;
    }

    if (outcome) {
        outcome_ = outcome;
        emit(VictoryDeterminedEvent{*outcome, context_.round});
        SKIRMISH_LOG_INFO(LogCategory::Combat,
                          "encounter " + options_.encounterId + " ended: "
                              + std::string(EncounterOutcomeName(*outcome)));
        return next(EncounterState::Ended);
    }
    if (!context_.queue.empty()) {
        return next(EncounterState::TurnStart);
    }
    tickRoundBoundary();
    return next(EncounterState::RoundStart);
}

void EncounterEngine::tickRoundBoundary() {
    for (auto& expired : context_.modifiers.TickRound()) {
        emit(ModifierExpiredEvent{std::move(expired.combatantId),
                                  std::move(expired.modifierId)});
    }
    for (auto& expired : context_.conditions.TickRound()) {
        emit(ConditionExpiredEvent{std::move(expired.combatantId),
                                   std::move(expired.conditionId), "duration"});
    }
}

// ── Effects ─────────────────────────────────────────────────────────────

GameResult<void> EncounterEngine::applyEffect(const Effect& effect) {
    return std::visit([this](const auto& e) -> GameResult<void> {
        using T = std::decay_t<decltype(e)>;
        auto missing = [](const std::string& id) {
            return GameResult<void>::err(GameError(
                ErrorCode::CombatantNotFound, "combatant not found: " + id, id));
        };

        if constexpr (std::is_same_v<T, DamageEffect>) {
            Combatant* target = context_.Find(e.target);
            if (target == nullptr) {
                return missing(e.target);
            }
            target->hp -= e.amount;
            emit(DamageAppliedEvent{e.source, e.target, e.amount, target->DisplayHp()});
            for (auto& broken : context_.conditions.BreakOnDamage(e.target)) {
                emit(ConditionExpiredEvent{e.target, std::move(broken), "damage"});
            }
        } else if constexpr (std::is_same_v<T, ConsumeSlotEffect>) {
            Combatant* caster = context_.Find(e.caster);
            if (caster == nullptr) {
                return missing(e.caster);
            }
            int& slots = caster->spellSlots[e.level];
            slots = std::max(slots - 1, 0);
            emit(SpellSlotConsumedEvent{e.caster, e.level, slots});
        } else if constexpr (std::is_same_v<T, ApplyConditionEffect>) {
            if (context_.Find(e.target) == nullptr) {
                return missing(e.target);
            }
            auto applied = context_.conditions.Apply(
                e.target, ActiveCondition{e.conditionId, e.source, e.duration});
            if (!applied) {
                return applied;
            }
            emit(ConditionAppliedEvent{e.source, e.target, e.conditionId, e.duration});
        } else if constexpr (std::is_same_v<T, FleeEffect>) {
            Combatant* c = context_.Find(e.combatant);
            if (c == nullptr) {
                return missing(e.combatant);
            }
            c->fled = true;
            emit(EntityFledEvent{e.combatant, e.reason});
        } else if constexpr (std::is_same_v<T, HealEffect>) {
            Combatant* target = context_.Find(e.target);
            if (target == nullptr) {
                return missing(e.target);
            }
            const int before = target->hp;
            target->hp = std::min(target->maxHp, target->hp + e.amount);
            emit(HealingAppliedEvent{e.source, e.target, target->hp - before,
                                     target->DisplayHp()});
        } else if constexpr (std::is_same_v<T, ApplyModifierEffect>) {
            if (context_.Find(e.target) == nullptr) {
                return missing(e.target);
            }
            context_.modifiers.Add(e.target, e.modifier);
            emit(ModifierAppliedEvent{e.source, e.target, e.modifier.modifierId,
                                      e.modifier.stat, e.modifier.value,
                                      e.modifier.remainingRounds});
        } else if constexpr (std::is_same_v<T, ConsumeItemEffect>) {
            Combatant* actor = context_.Find(e.actor);
            if (actor == nullptr) {
                return missing(e.actor);
            }
            auto it = std::find(actor->items.begin(), actor->items.end(), e.itemName);
            if (it == actor->items.end()) {
                return GameResult<void>::err(GameError(
                    ErrorCode::InvalidState, e.itemName + " is not carried", e.actor));
            }
            actor->items.erase(it);
            const auto remaining = std::count(actor->items.begin(), actor->items.end(),
                                              e.itemName);
            emit(ItemConsumedEvent{e.actor, e.itemName, static_cast<int>(remaining)});
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled effect type");
        }
        return GameResult<void>::ok();
    }, effect);
}

// ── Faults and event sink ───────────────────────────────────────────────

void EncounterEngine::fault(ErrorCode code, const std::string& message) {
    const EncounterState at = state_;
    state_ = EncounterState::Ended;
    outcome_ = EncounterOutcome::Faulted;
    awaitingExternal_ = false;
    pendingIntent_.reset();

    LogContext ctx;
    ctx.encounterId = options_.encounterId;
    ctx.combatantId = context_.currentCombatantId;
    ctx.round = context_.round;
    GameLogger::instance().logWithContext(
        LogLevel::Error, LogCategory::Combat,
        "encounter faulted in " + std::string(EncounterStateName(at)) + ": " + message,
        ctx);

    emit(EncounterFaultedEvent{at, code, message});
}

void EncounterEngine::emit(EncounterEvent event) {
    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        LogContext ctx;
        ctx.encounterId = options_.encounterId;
        ctx.round = context_.round;
        ctx.extra["event"] = std::string(EventKind(event));
        logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
                              EventFormatter::Format(event), ctx);
    }
    if (stepEvents_ != nullptr) {
        stepEvents_->push_back(event);
    }
    history_.push_back(std::move(event));
}

}  // namespace skirmish::combat
