#pragma once

/// @file events.hpp
/// @brief EncounterEvent: the closed set of events the engine emits.
///
/// Events are the only channel through which observers learn what happened
/// in an encounter. Each struct carries its discriminator in `kKind`; the
/// serializer and formatter visit the variant exhaustively.

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "skirmish/combat/combat_types.hpp"
#include "skirmish/combat/intents.hpp"
#include "skirmish/foundation/error_code.hpp"

namespace skirmish::combat {

/// Why an intent was refused.
struct Rejection {
    RejectionCode code = RejectionCode::InvalidActor;
    std::string message;

    bool operator==(const Rejection&) const = default;
};

/// One action offered to the current combatant.
///
/// `uiKey` and `uiArgs` describe the choice for presentation; `intent` is
/// what gets submitted if the choice is taken.
struct ActionChoice {
    std::string uiKey;
    std::map<std::string, std::string> uiArgs;
    ActionIntent intent;

    /// Human-readable label such as "Attack Goblin" or "Cast Sleep".
    [[nodiscard]] std::string Label() const;

    bool operator==(const ActionChoice&) const = default;
};

// ── Encounter flow ──────────────────────────────────────────────────────

struct EncounterStartedEvent {
    static constexpr std::string_view kKind = "EncounterStarted";
    std::string encounterId;
    std::vector<std::string> partyIds;
    std::vector<std::string> oppositionIds;
};

struct SurpriseRolledEvent {
    static constexpr std::string_view kKind = "SurpriseRolled";
    int partyRoll = 0;
    int oppositionRoll = 0;
    std::optional<CombatSide> surprisedSide;
};

struct RoundStartedEvent {
    static constexpr std::string_view kKind = "RoundStarted";
    int round = 0;
};

struct InitiativeEntry {
    std::string combatantId;
    int roll = 0;
};

struct InitiativeRolledEvent {
    static constexpr std::string_view kKind = "InitiativeRolled";
    int round = 0;
    std::vector<InitiativeEntry> rolls;
};

struct TurnQueueBuiltEvent {
    static constexpr std::string_view kKind = "TurnQueueBuilt";
    int round = 0;
    std::vector<std::string> queue;
};

struct TurnStartedEvent {
    static constexpr std::string_view kKind = "TurnStarted";
    int round = 0;
    std::string combatantId;
};

struct TurnSkippedEvent {
    static constexpr std::string_view kKind = "TurnSkipped";
    int round = 0;
    std::string combatantId;
    std::string reason;   ///< Condition id, or "surprised".
};

struct NeedActionEvent {
    static constexpr std::string_view kKind = "NeedAction";
    int round = 0;
    std::string combatantId;
    std::vector<ActionChoice> choices;
};

struct ActionRejectedEvent {
    static constexpr std::string_view kKind = "ActionRejected";
    std::string combatantId;
    ActionIntent intent;
    std::vector<Rejection> rejections;
};

// ── Action resolution ───────────────────────────────────────────────────

struct AttackRolledEvent {
    static constexpr std::string_view kKind = "AttackRolled";
    std::string attackerId;
    std::string defenderId;
    int roll = 0;        ///< Natural d20.
    int total = 0;       ///< Roll plus bonuses.
    int needed = 0;
    bool hit = false;
    bool critical = false;
    bool ranged = false;
};

struct DamageAppliedEvent {
    static constexpr std::string_view kKind = "DamageApplied";
    std::string sourceId;
    std::string targetId;
    int amount = 0;
    int hpAfter = 0;
};

struct HealingAppliedEvent {
    static constexpr std::string_view kKind = "HealingApplied";
    std::string sourceId;
    std::string targetId;
    int amount = 0;
    int hpAfter = 0;
};

struct SpellCastEvent {
    static constexpr std::string_view kKind = "SpellCast";
    std::string casterId;
    std::string spellId;
    std::string spellName;
    int slotLevel = 0;
    std::vector<std::string> targetIds;
};

struct SpellSlotConsumedEvent {
    static constexpr std::string_view kKind = "SpellSlotConsumed";
    std::string casterId;
    int level = 0;
    int remaining = 0;
};

struct GroupTargetsResolvedEvent {
    static constexpr std::string_view kKind = "GroupTargetsResolved";
    std::string casterId;
    std::string spellId;
    TargetMode mode = TargetMode::HdPool;
    int roll = 0;        ///< Hit-dice budget or group size.
    std::vector<std::string> targetIds;
};

struct SavingThrowRolledEvent {
    static constexpr std::string_view kKind = "SavingThrowRolled";
    std::string targetId;
    std::string spellId;
    int roll = 0;
    int total = 0;
    int needed = 0;
    bool success = false;
};

struct ConditionAppliedEvent {
    static constexpr std::string_view kKind = "ConditionApplied";
    std::string sourceId;
    std::string targetId;
    std::string conditionId;
    std::optional<int> duration;
};

struct ConditionExpiredEvent {
    static constexpr std::string_view kKind = "ConditionExpired";
    std::string targetId;
    std::string conditionId;
    std::string reason;   ///< "duration" or "damage".
};

struct ModifierAppliedEvent {
    static constexpr std::string_view kKind = "ModifierApplied";
    std::string sourceId;
    std::string targetId;
    std::string modifierId;
    ModifiedStat stat = ModifiedStat::Attack;
    int value = 0;
    std::optional<int> duration;
};

struct ModifierExpiredEvent {
    static constexpr std::string_view kKind = "ModifierExpired";
    std::string targetId;
    std::string modifierId;
};

struct ItemUsedEvent {
    static constexpr std::string_view kKind = "ItemUsed";
    std::string actorId;
    std::string itemName;
    std::vector<std::string> targetIds;
};

struct ItemConsumedEvent {
    static constexpr std::string_view kKind = "ItemConsumed";
    std::string actorId;
    std::string itemName;
    int remaining = 0;
};

struct TurnUndeadAttemptedEvent {
    static constexpr std::string_view kKind = "TurnUndeadAttempted";
    std::string actorId;
    int roll = 0;                      ///< 2d6; 0 when no roll was needed.
    std::optional<int> targetNumber;   ///< Lowest number any undead required.
    TurnUndeadResult result = TurnUndeadResult::Impossible;
};

struct UndeadTurnedEvent {
    static constexpr std::string_view kKind = "UndeadTurned";
    std::string actorId;
    std::string targetId;
    bool destroyed = false;
    int hdSpent = 0;
};

// ── Checks and outcome ──────────────────────────────────────────────────

struct MoraleCheckedEvent {
    static constexpr std::string_view kKind = "MoraleChecked";
    CombatSide side = CombatSide::Monster;
    std::string trigger;   ///< "first_death" or "half_down".
    int morale = 0;
    int roll = 0;
    bool passed = false;
};

struct EntityDiedEvent {
    static constexpr std::string_view kKind = "EntityDied";
    std::string combatantId;
};

struct EntityFledEvent {
    static constexpr std::string_view kKind = "EntityFled";
    std::string combatantId;
    std::string reason;   ///< "intent", "morale" or "turned".
};

struct VictoryDeterminedEvent {
    static constexpr std::string_view kKind = "VictoryDetermined";
    EncounterOutcome outcome = EncounterOutcome::PartyVictory;
    int round = 0;
};

struct EncounterFaultedEvent {
    static constexpr std::string_view kKind = "EncounterFaulted";
    EncounterState state = EncounterState::Init;
    foundation::ErrorCode code = foundation::ErrorCode::Unknown;
    std::string message;
};

using EncounterEvent = std::variant<EncounterStartedEvent,
                                    SurpriseRolledEvent,
                                    RoundStartedEvent,
                                    InitiativeRolledEvent,
                                    TurnQueueBuiltEvent,
                                    TurnStartedEvent,
                                    TurnSkippedEvent,
                                    NeedActionEvent,
                                    ActionRejectedEvent,
                                    AttackRolledEvent,
                                    DamageAppliedEvent,
                                    HealingAppliedEvent,
                                    SpellCastEvent,
                                    SpellSlotConsumedEvent,
                                    GroupTargetsResolvedEvent,
                                    SavingThrowRolledEvent,
                                    ConditionAppliedEvent,
                                    ConditionExpiredEvent,
                                    ModifierAppliedEvent,
                                    ModifierExpiredEvent,
                                    ItemUsedEvent,
                                    ItemConsumedEvent,
                                    TurnUndeadAttemptedEvent,
                                    UndeadTurnedEvent,
                                    MoraleCheckedEvent,
                                    EntityDiedEvent,
                                    EntityFledEvent,
                                    VictoryDeterminedEvent,
                                    EncounterFaultedEvent>;

/// Discriminator name of @p event ("DamageApplied", ...).
[[nodiscard]] inline std::string_view EventKind(const EncounterEvent& event) {
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::kKind; },
                      event);
}

/// True if @p event is of type @p T.
template <typename T>
[[nodiscard]] bool IsEvent(const EncounterEvent& event) noexcept {
    return std::holds_alternative<T>(event);
}

}  // namespace skirmish::combat
