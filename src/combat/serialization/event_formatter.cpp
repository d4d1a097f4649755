/// @file event_formatter.cpp
/// @brief EventFormatter implementation.

#include "skirmish/combat/event_formatter.hpp"

#include <algorithm>
#include <cctype>

namespace skirmish::combat {

namespace {

std::string joinNames(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) {
            out += ", ";
        }
        out += EventFormatter::DisplayCombatant(id);
    }
    return out;
}

std::string durationText(const std::optional<int>& duration) {
    return duration ? std::to_string(*duration) + " rounds" : std::string("permanent");
}

struct LineVisitor {
    static std::string who(std::string_view id) {
        return EventFormatter::DisplayCombatant(id);
    }

    std::string operator()(const EncounterStartedEvent& e) const {
        return "Encounter " + e.encounterId + " begins.";
    }

    std::string operator()(const SurpriseRolledEvent& e) const {
        std::string rolls = " (party " + std::to_string(e.partyRoll) + ", monsters "
            + std::to_string(e.oppositionRoll) + ")";
        if (!e.surprisedSide) {
            return "No surprise." + rolls;
        }
        return *e.surprisedSide == CombatSide::Party ? "The party is surprised!" + rolls
                                                     : "The monsters are surprised!" + rolls;
    }

    std::string operator()(const RoundStartedEvent& e) const {
        return "Round " + std::to_string(e.round) + " begins.";
    }

    std::string operator()(const InitiativeRolledEvent& e) const {
        std::string out = "Initiative:";
        for (std::size_t i = 0; i < e.rolls.size(); ++i) {
            out += (i == 0 ? " " : ", ") + who(e.rolls[i].combatantId) + " ("
                + std::to_string(e.rolls[i].roll) + ")";
        }
        return out;
    }

    std::string operator()(const TurnQueueBuiltEvent& e) const {
        return "Turn order: " + joinNames(e.queue);
    }

    std::string operator()(const TurnStartedEvent& e) const {
        return who(e.combatantId) + "'s turn.";
    }

    std::string operator()(const TurnSkippedEvent& e) const {
        return who(e.combatantId) + " loses the turn (" + e.reason + ").";
    }

    std::string operator()(const NeedActionEvent& e) const {
        std::string out = "Choose action for " + who(e.combatantId) + ":";
        for (std::size_t i = 0; i < e.choices.size(); ++i) {
            out += (i == 0 ? " " : ", ") + e.choices[i].Label();
        }
        return out;
    }

    std::string operator()(const ActionRejectedEvent& e) const {
        std::string reasons;
        for (const auto& r : e.rejections) {
            if (!reasons.empty()) {
                reasons += "; ";
            }
            reasons += r.message;
        }
        return "Action rejected for " + who(e.combatantId) + ": " + reasons;
    }

    std::string operator()(const AttackRolledEvent& e) const {
        std::string out = who(e.attackerId) + (e.ranged ? " shoots at " : " attacks ")
            + who(e.defenderId) + ": " + (e.hit ? "HIT" : "MISS") + " (rolled "
            + std::to_string(e.total) + " vs " + std::to_string(e.needed) + ")";
        return e.critical ? out + " CRITICAL HIT!" : out + ".";
    }

    std::string operator()(const DamageAppliedEvent& e) const {
        return who(e.sourceId) + " deals " + std::to_string(e.amount) + " damage to "
            + who(e.targetId) + ". " + who(e.targetId) + " has "
            + std::to_string(std::max(e.hpAfter, 0)) + " HP remaining.";
    }

    std::string operator()(const HealingAppliedEvent& e) const {
        return who(e.sourceId) + " heals " + who(e.targetId) + " for "
            + std::to_string(e.amount) + " (now " + std::to_string(e.hpAfter) + " HP).";
    }

    std::string operator()(const SpellCastEvent& e) const {
        std::string targets = joinNames(e.targetIds);
        return targets.empty() ? who(e.casterId) + " casts " + e.spellName + "."
                               : who(e.casterId) + " casts " + e.spellName + " on "
                                     + targets + ".";
    }

    std::string operator()(const SpellSlotConsumedEvent& e) const {
        return who(e.casterId) + " uses a level " + std::to_string(e.level)
            + " spell slot (" + std::to_string(e.remaining) + " remaining).";
    }

    std::string operator()(const GroupTargetsResolvedEvent& e) const {
        std::string targets = joinNames(e.targetIds);
        return e.spellId + " (" + std::string(TargetModeName(e.mode)) + " "
            + std::to_string(e.roll) + ") affects "
            + (targets.empty() ? std::string("no one") : targets) + ".";
    }

    std::string operator()(const SavingThrowRolledEvent& e) const {
        return who(e.targetId) + " saves against " + e.spellId + ": "
            + (e.success ? "SAVED" : "FAILED") + " (rolled " + std::to_string(e.total)
            + " vs " + std::to_string(e.needed) + ").";
    }

    std::string operator()(const ConditionAppliedEvent& e) const {
        return who(e.sourceId) + " applies " + e.conditionId + " to " + who(e.targetId)
            + " (" + durationText(e.duration) + ").";
    }

    std::string operator()(const ConditionExpiredEvent& e) const {
        return who(e.targetId) + " is no longer " + e.conditionId + " (" + e.reason + ").";
    }

    std::string operator()(const ModifierAppliedEvent& e) const {
        std::string value = (e.value >= 0 ? "+" : "") + std::to_string(e.value);
        return who(e.targetId) + " gains " + e.modifierId + " ("
            + std::string(ModifiedStatName(e.stat)) + " " + value + ", "
            + durationText(e.duration) + ").";
    }

    std::string operator()(const ModifierExpiredEvent& e) const {
        return e.modifierId + " on " + who(e.targetId) + " wears off.";
    }

    std::string operator()(const ItemUsedEvent& e) const {
        std::string targets = joinNames(e.targetIds);
        return targets.empty() ? who(e.actorId) + " uses " + e.itemName + "."
                               : who(e.actorId) + " uses " + e.itemName + " on "
                                     + targets + ".";
    }

    std::string operator()(const ItemConsumedEvent& e) const {
        return who(e.actorId) + " has " + std::to_string(e.remaining) + " "
            + e.itemName + " left.";
    }

    std::string operator()(const TurnUndeadAttemptedEvent& e) const {
        switch (e.result) {
            case TurnUndeadResult::Impossible:
                return who(e.actorId) + " cannot turn these undead.";
            case TurnUndeadResult::Failed:
                return who(e.actorId) + " fails to turn undead (rolled "
                    + std::to_string(e.roll) + " vs " + std::to_string(e.targetNumber.value_or(0))
                    + ").";
            case TurnUndeadResult::Turned:
            case TurnUndeadResult::Destroyed:
                break;
        }
        return who(e.actorId) + " presents a holy symbol!";
    }

    std::string operator()(const UndeadTurnedEvent& e) const {
        return who(e.targetId) + (e.destroyed ? " crumbles to dust." : " is turned and flees.");
    }

    std::string operator()(const MoraleCheckedEvent& e) const {
        std::string trigger = e.trigger;
        std::replace(trigger.begin(), trigger.end(), '_', ' ');
        return "Morale check (" + trigger + "): rolled " + std::to_string(e.roll)
            + " vs " + std::to_string(e.morale) + ", "
            + (e.passed ? "passed." : "failed.");
    }

    std::string operator()(const EntityDiedEvent& e) const {
        return who(e.combatantId) + " falls!";
    }

    std::string operator()(const EntityFledEvent& e) const {
        return who(e.combatantId) + " flees the battle (" + e.reason + ")!";
    }

    std::string operator()(const VictoryDeterminedEvent& e) const {
        switch (e.outcome) {
            case EncounterOutcome::PartyVictory:      return "The party is victorious!";
            case EncounterOutcome::OppositionVictory: return "The party has been defeated.";
            case EncounterOutcome::Faulted:           return "Encounter ended in a fault.";
        }
        return "Encounter ended.";
    }

    std::string operator()(const EncounterFaultedEvent& e) const {
        return "FAULT in " + std::string(EncounterStateName(e.state)) + ": ["
            + std::string(foundation::errorCodeName(e.code)) + "] " + e.message;
    }
};

}  // namespace

std::string EventFormatter::DisplayCombatant(std::string_view combatantId) {
    if (combatantId.starts_with("pc:")) {
        return std::string(combatantId.substr(3));
    }
    if (combatantId.starts_with("monster:")) {
        std::string_view rest = combatantId.substr(8);
        auto colon = rest.rfind(':');
        if (colon != std::string_view::npos) {
            std::string_view index = rest.substr(colon + 1);
            bool numeric = !index.empty() && index.size() < 10
                && std::all_of(index.begin(), index.end(), [](char c) {
                       return std::isdigit(static_cast<unsigned char>(c)) != 0;
                   });
            if (numeric) {
                return std::string(rest.substr(0, colon)) + " #"
                    + std::to_string(std::stoi(std::string(index)) + 1);
            }
        }
        return std::string(rest);
    }
    return std::string(combatantId);
}

std::string EventFormatter::Format(const EncounterEvent& event) {
    return std::visit(LineVisitor{}, event);
}

std::string EventFormatter::FormatAll(const std::vector<EncounterEvent>& events) {
    std::string out;
    for (const auto& e : events) {
        if (!out.empty()) {
            out += '\n';
        }
        out += Format(e);
    }
    return out;
}

}  // namespace skirmish::combat
