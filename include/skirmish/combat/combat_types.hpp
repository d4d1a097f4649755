#pragma once

/// @file combat_types.hpp
/// @brief Enumerations and constants for the encounter engine.
///
/// Every enumeration has a matching `...Name()` function returning its
/// symbolic name; the serializer and formatter never expose raw codes.

#include <cstdint>
#include <string_view>

namespace skirmish::combat {

/// Default step budget for EncounterEngine::StepUntilDecision.
constexpr int kDefaultMaxSteps = 64;

/// Morale score at which a group never checks morale.
constexpr int kFearlessMorale = 12;

/// Morale checks a group must pass before it fights to the end.
constexpr int kMoralePassesForImmunity = 2;

/// Which side of the encounter a combatant fights on.
enum class CombatSide : uint8_t {
    Party,     ///< Player-aligned side.
    Monster    ///< Opposing side.
};

/// What kind of entity a combatant wraps (drives hit-dice lookup).
enum class EntityKind : uint8_t {
    Player,
    Monster,
    Unknown
};

/// Character class, used for spell eligibility.
enum class CharacterClass : uint8_t {
    Commoner,
    Fighter,
    Cleric,
    MagicUser,
    Elf,
    Thief,
    Dwarf,
    Halfling
};

/// Combat stat a temporary modifier adjusts.
enum class ModifiedStat : uint8_t {
    Attack,
    Damage,
    ArmorClass,
    SavingThrow
};

/// How a spell or item selects its targets.
enum class TargetMode : uint8_t {
    SingleEnemy,
    AllEnemies,
    Self,
    SingleAlly,
    AllAllies,
    HdPool,      ///< Weakest enemies first, bounded by a rolled hit-dice budget.
    EnemyGroup   ///< Random sample of enemies, size rolled per cast.
};

/// Encounter state machine discriminant.
enum class EncounterState : uint8_t {
    Init,
    RoundStart,
    TurnStart,
    AwaitIntent,
    ValidateIntent,
    ExecuteAction,
    CheckDeaths,
    CheckMorale,
    CheckVictory,
    Ended
};

/// Terminal outcome recorded when the machine reaches Ended.
enum class EncounterOutcome : uint8_t {
    PartyVictory,
    OppositionVictory,
    Faulted
};

/// Per-round turn ordering policy.
enum class TurnOrderPolicy : uint8_t {
    RosterOrder,  ///< Party then opposition, insertion order.
    Initiative    ///< 1d6 per combatant, descending, ties in roster order.
};

/// Reason an intent failed validation against current state.
enum class RejectionCode : uint8_t {
    NotCurrentCombatant,
    InvalidActor,
    ActorDead,
    InvalidTarget,
    TargetNotOpponent,
    TargetNotAlly,
    NoRangedWeapon,
    SpellNotKnown,
    IneligibleCaster,
    SlotLevelMismatch,
    NoSpellSlot,
    ItemNotInInventory,
    MissingTargets,
    NoUndeadTargets
};

/// Outcome of a cleric's attempt to turn undead.
enum class TurnUndeadResult : uint8_t {
    Impossible,  ///< Every undead present is beyond the cleric's level.
    Failed,      ///< The 2d6 roll missed every target number.
    Turned,
    Destroyed
};

constexpr std::string_view CombatSideName(CombatSide side) {
    switch (side) {
        case CombatSide::Party:   return "PARTY";
        case CombatSide::Monster: return "MONSTER";
    }
    return "UNKNOWN";
}

constexpr std::string_view EntityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Player:  return "PLAYER";
        case EntityKind::Monster: return "MONSTER";
        case EntityKind::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

constexpr std::string_view CharacterClassName(CharacterClass cls) {
    switch (cls) {
        case CharacterClass::Commoner:  return "COMMONER";
        case CharacterClass::Fighter:   return "FIGHTER";
        case CharacterClass::Cleric:    return "CLERIC";
        case CharacterClass::MagicUser: return "MAGIC_USER";
        case CharacterClass::Elf:       return "ELF";
        case CharacterClass::Thief:     return "THIEF";
        case CharacterClass::Dwarf:     return "DWARF";
        case CharacterClass::Halfling:  return "HALFLING";
    }
    return "UNKNOWN";
}

constexpr std::string_view ModifiedStatName(ModifiedStat stat) {
    switch (stat) {
        case ModifiedStat::Attack:      return "ATTACK";
        case ModifiedStat::Damage:      return "DAMAGE";
        case ModifiedStat::ArmorClass:  return "ARMOR_CLASS";
        case ModifiedStat::SavingThrow: return "SAVING_THROW";
    }
    return "UNKNOWN";
}

constexpr std::string_view TargetModeName(TargetMode mode) {
    switch (mode) {
        case TargetMode::SingleEnemy: return "SINGLE_ENEMY";
        case TargetMode::AllEnemies:  return "ALL_ENEMIES";
        case TargetMode::Self:        return "SELF";
        case TargetMode::SingleAlly:  return "SINGLE_ALLY";
        case TargetMode::AllAllies:   return "ALL_ALLIES";
        case TargetMode::HdPool:      return "HD_POOL";
        case TargetMode::EnemyGroup:  return "ENEMY_GROUP";
    }
    return "UNKNOWN";
}

constexpr std::string_view EncounterStateName(EncounterState state) {
    switch (state) {
        case EncounterState::Init:           return "INIT";
        case EncounterState::RoundStart:     return "ROUND_START";
        case EncounterState::TurnStart:      return "TURN_START";
        case EncounterState::AwaitIntent:    return "AWAIT_INTENT";
        case EncounterState::ValidateIntent: return "VALIDATE_INTENT";
        case EncounterState::ExecuteAction:  return "EXECUTE_ACTION";
        case EncounterState::CheckDeaths:    return "CHECK_DEATHS";
        case EncounterState::CheckMorale:    return "CHECK_MORALE";
        case EncounterState::CheckVictory:   return "CHECK_VICTORY";
        case EncounterState::Ended:          return "ENDED";
    }
    return "UNKNOWN";
}

constexpr std::string_view EncounterOutcomeName(EncounterOutcome outcome) {
    switch (outcome) {
        case EncounterOutcome::PartyVictory:      return "PARTY_VICTORY";
        case EncounterOutcome::OppositionVictory: return "OPPOSITION_VICTORY";
        case EncounterOutcome::Faulted:           return "FAULTED";
    }
    return "UNKNOWN";
}

constexpr std::string_view TurnOrderPolicyName(TurnOrderPolicy policy) {
    switch (policy) {
        case TurnOrderPolicy::RosterOrder: return "ROSTER_ORDER";
        case TurnOrderPolicy::Initiative:  return "INITIATIVE";
    }
    return "UNKNOWN";
}

constexpr std::string_view RejectionCodeName(RejectionCode code) {
    switch (code) {
        case RejectionCode::NotCurrentCombatant: return "NOT_CURRENT_COMBATANT";
        case RejectionCode::InvalidActor:        return "INVALID_ACTOR";
        case RejectionCode::ActorDead:           return "ACTOR_DEAD";
        case RejectionCode::InvalidTarget:       return "INVALID_TARGET";
        case RejectionCode::TargetNotOpponent:   return "TARGET_NOT_OPPONENT";
        case RejectionCode::TargetNotAlly:       return "TARGET_NOT_ALLY";
        case RejectionCode::NoRangedWeapon:      return "NO_RANGED_WEAPON";
        case RejectionCode::SpellNotKnown:       return "SPELL_NOT_KNOWN";
        case RejectionCode::IneligibleCaster:    return "INELIGIBLE_CASTER";
        case RejectionCode::SlotLevelMismatch:   return "SLOT_LEVEL_MISMATCH";
        case RejectionCode::NoSpellSlot:         return "NO_SPELL_SLOT";
        case RejectionCode::ItemNotInInventory:  return "ITEM_NOT_IN_INVENTORY";
        case RejectionCode::MissingTargets:      return "MISSING_TARGETS";
        case RejectionCode::NoUndeadTargets:     return "NO_UNDEAD_TARGETS";
    }
    return "UNKNOWN";
}

constexpr std::string_view TurnUndeadResultName(TurnUndeadResult result) {
    switch (result) {
        case TurnUndeadResult::Impossible: return "IMPOSSIBLE";
        case TurnUndeadResult::Failed:     return "FAILED";
        case TurnUndeadResult::Turned:     return "TURNED";
        case TurnUndeadResult::Destroyed:  return "DESTROYED";
    }
    return "UNKNOWN";
}

/// The side a combatant on @p side fights against.
constexpr CombatSide OpposingSide(CombatSide side) noexcept {
    return side == CombatSide::Party ? CombatSide::Monster : CombatSide::Party;
}

}  // namespace skirmish::combat
