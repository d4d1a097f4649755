/// @file event_serializer.cpp
/// @brief SerializedValue and the event/intent/effect/view projections.

#include "skirmish/combat/event_serializer.hpp"

#include <algorithm>
#include <cstdio>

namespace skirmish::combat {

// ── SerializedValue ─────────────────────────────────────────────────────

SerializedValue SerializedValue::MakeObject() {
    SerializedValue value;
    value.data_ = Object{};
    return value;
}

void SerializedValue::Set(std::string key, SerializedValue value) {
    if (IsNull()) {
        data_ = Object{};
    }
    auto& members = std::get<Object>(data_);
    auto it = std::lower_bound(members.begin(), members.end(), key,
                               [](const Member& m, const std::string& k) {
                                   return m.first < k;
                               });
    if (it != members.end() && it->first == key) {
        it->second = std::move(value);
        return;
    }
    members.insert(it, Member{std::move(key), std::move(value)});
}

const SerializedValue* SerializedValue::Find(std::string_view key) const {
    if (!IsObject()) {
        return nullptr;
    }
    for (const auto& m : AsObject()) {
        if (m.first == key) {
            return &m.second;
        }
    }
    return nullptr;
}

bool SerializedValue::operator==(const SerializedValue& other) const {
    return data_ == other.data_;
}

namespace {

using Value = SerializedValue;

Value object(std::string_view kind) {
    Value v = Value::MakeObject();
    v.Set("kind", kind);
    return v;
}

Value strings(const std::vector<std::string>& items) {
    Value::Array out;
    out.reserve(items.size());
    for (const auto& s : items) {
        out.emplace_back(s);
    }
    return Value(std::move(out));
}

Value optionalInt(const std::optional<int>& value) {
    return value ? Value(*value) : Value();
}

Value modifierValue(const ActiveModifier& m) {
    Value v = object("ActiveModifier");
    v.Set("modifier_id", m.modifierId);
    v.Set("source_id", m.sourceId);
    v.Set("stat", ModifiedStatName(m.stat));
    v.Set("value", m.value);
    v.Set("remaining_rounds", optionalInt(m.remainingRounds));
    return v;
}

// ── Intents ─────────────────────────────────────────────────────────────

struct IntentVisitor {
    Value operator()(const MeleeAttackIntent& i) const {
        Value v = object("MeleeAttack");
        v.Set("actor", i.actor);
        v.Set("target", i.target);
        return v;
    }
    Value operator()(const RangedAttackIntent& i) const {
        Value v = object("RangedAttack");
        v.Set("actor", i.actor);
        v.Set("target", i.target);
        return v;
    }
    Value operator()(const CastSpellIntent& i) const {
        Value v = object("CastSpell");
        v.Set("actor", i.actor);
        v.Set("spell_id", i.spellId);
        v.Set("slot_level", i.slotLevel);
        v.Set("target_ids", strings(i.targetIds));
        return v;
    }
    Value operator()(const UseItemIntent& i) const {
        Value v = object("UseItem");
        v.Set("actor", i.actor);
        v.Set("item_name", i.itemName);
        v.Set("target_ids", strings(i.targetIds));
        return v;
    }
    Value operator()(const FleeIntent& i) const {
        Value v = object("Flee");
        v.Set("actor", i.actor);
        return v;
    }
    Value operator()(const TurnUndeadIntent& i) const {
        Value v = object("TurnUndead");
        v.Set("actor", i.actor);
        return v;
    }
};

// ── Effects ─────────────────────────────────────────────────────────────

struct EffectVisitor {
    Value operator()(const DamageEffect& e) const {
        Value v = object("Damage");
        v.Set("source", e.source);
        v.Set("target", e.target);
        v.Set("amount", e.amount);
        return v;
    }
    Value operator()(const ConsumeSlotEffect& e) const {
        Value v = object("ConsumeSlot");
        v.Set("caster", e.caster);
        v.Set("level", e.level);
        return v;
    }
    Value operator()(const ApplyConditionEffect& e) const {
        Value v = object("ApplyCondition");
        v.Set("source", e.source);
        v.Set("target", e.target);
        v.Set("condition_id", e.conditionId);
        v.Set("duration", optionalInt(e.duration));
        return v;
    }
    Value operator()(const FleeEffect& e) const {
        Value v = object("Flee");
        v.Set("combatant", e.combatant);
        v.Set("reason", e.reason);
        return v;
    }
    Value operator()(const HealEffect& e) const {
        Value v = object("Heal");
        v.Set("source", e.source);
        v.Set("target", e.target);
        v.Set("amount", e.amount);
        return v;
    }
    Value operator()(const ApplyModifierEffect& e) const {
        Value v = object("ApplyModifier");
        v.Set("source", e.source);
        v.Set("target", e.target);
        v.Set("modifier", modifierValue(e.modifier));
        return v;
    }
    Value operator()(const ConsumeItemEffect& e) const {
        Value v = object("ConsumeItem");
        v.Set("actor", e.actor);
        v.Set("item_name", e.itemName);
        return v;
    }
};

// ── Events ──────────────────────────────────────────────────────────────

struct EventVisitor {
    template <typename E>
    static Value base(const E&) {
        return object(E::kKind);
    }

    Value operator()(const EncounterStartedEvent& e) const {
        Value v = base(e);
        v.Set("encounter_id", e.encounterId);
        v.Set("party_ids", strings(e.partyIds));
        v.Set("opposition_ids", strings(e.oppositionIds));
        return v;
    }
    Value operator()(const SurpriseRolledEvent& e) const {
        Value v = base(e);
        v.Set("party_roll", e.partyRoll);
        v.Set("opposition_roll", e.oppositionRoll);
        v.Set("surprised_side",
              e.surprisedSide ? Value(CombatSideName(*e.surprisedSide)) : Value());
        return v;
    }
    Value operator()(const RoundStartedEvent& e) const {
        Value v = base(e);
        v.Set("round_number", e.round);
        return v;
    }
    Value operator()(const InitiativeRolledEvent& e) const {
        Value v = base(e);
        v.Set("round_number", e.round);
        Value::Array order;
        for (const auto& entry : e.rolls) {
            Value item = Value::MakeObject();
            item.Set("combatant_id", entry.combatantId);
            item.Set("roll", entry.roll);
            order.push_back(std::move(item));
        }
        v.Set("order", Value(std::move(order)));
        return v;
    }
    Value operator()(const TurnQueueBuiltEvent& e) const {
        Value v = base(e);
        v.Set("round_number", e.round);
        v.Set("queue", strings(e.queue));
        return v;
    }
    Value operator()(const TurnStartedEvent& e) const {
        Value v = base(e);
        v.Set("round_number", e.round);
        v.Set("combatant_id", e.combatantId);
        return v;
    }
    Value operator()(const TurnSkippedEvent& e) const {
        Value v = base(e);
        v.Set("round_number", e.round);
        v.Set("combatant_id", e.combatantId);
        v.Set("reason", e.reason);
        return v;
    }
    Value operator()(const NeedActionEvent& e) const {
        Value v = base(e);
        v.Set("round_number", e.round);
        v.Set("combatant_id", e.combatantId);
        Value::Array choices;
        for (const auto& choice : e.choices) {
            choices.push_back(EventSerializer::ToValue(choice));
        }
        v.Set("available", Value(std::move(choices)));
        return v;
    }
    Value operator()(const ActionRejectedEvent& e) const {
        Value v = base(e);
        v.Set("combatant_id", e.combatantId);
        v.Set("intent", EventSerializer::ToValue(e.intent));
        Value::Array reasons;
        for (const auto& r : e.rejections) {
            Value item = object("Rejection");
            item.Set("code", RejectionCodeName(r.code));
            item.Set("message", r.message);
            reasons.push_back(std::move(item));
        }
        v.Set("reasons", Value(std::move(reasons)));
        return v;
    }
    Value operator()(const AttackRolledEvent& e) const {
        Value v = base(e);
        v.Set("attacker_id", e.attackerId);
        v.Set("defender_id", e.defenderId);
        v.Set("roll", e.roll);
        v.Set("total", e.total);
        v.Set("needed", e.needed);
        v.Set("hit", e.hit);
        v.Set("critical", e.critical);
        v.Set("ranged", e.ranged);
        return v;
    }
    Value operator()(const DamageAppliedEvent& e) const {
        Value v = base(e);
        v.Set("source_id", e.sourceId);
        v.Set("target_id", e.targetId);
        v.Set("amount", e.amount);
        v.Set("target_hp_after", e.hpAfter);
        return v;
    }
    Value operator()(const HealingAppliedEvent& e) const {
        Value v = base(e);
        v.Set("source_id", e.sourceId);
        v.Set("target_id", e.targetId);
        v.Set("amount", e.amount);
        v.Set("target_hp_after", e.hpAfter);
        return v;
    }
    Value operator()(const SpellCastEvent& e) const {
        Value v = base(e);
        v.Set("caster_id", e.casterId);
        v.Set("spell_id", e.spellId);
        v.Set("spell_name", e.spellName);
        v.Set("slot_level", e.slotLevel);
        v.Set("target_ids", strings(e.targetIds));
        return v;
    }
    Value operator()(const SpellSlotConsumedEvent& e) const {
        Value v = base(e);
        v.Set("caster_id", e.casterId);
        v.Set("level", e.level);
        v.Set("remaining", e.remaining);
        return v;
    }
    Value operator()(const GroupTargetsResolvedEvent& e) const {
        Value v = base(e);
        v.Set("caster_id", e.casterId);
        v.Set("spell_id", e.spellId);
        v.Set("mode", TargetModeName(e.mode));
        v.Set("roll", e.roll);
        v.Set("target_ids", strings(e.targetIds));
        return v;
    }
    Value operator()(const SavingThrowRolledEvent& e) const {
        Value v = base(e);
        v.Set("target_id", e.targetId);
        v.Set("spell_id", e.spellId);
        v.Set("roll", e.roll);
        v.Set("total", e.total);
        v.Set("needed", e.needed);
        v.Set("success", e.success);
        return v;
    }
    Value operator()(const ConditionAppliedEvent& e) const {
        Value v = base(e);
        v.Set("source_id", e.sourceId);
        v.Set("target_id", e.targetId);
        v.Set("condition_id", e.conditionId);
        v.Set("duration", optionalInt(e.duration));
        return v;
    }
    Value operator()(const ConditionExpiredEvent& e) const {
        Value v = base(e);
        v.Set("target_id", e.targetId);
        v.Set("condition_id", e.conditionId);
        v.Set("reason", e.reason);
        return v;
    }
    Value operator()(const ModifierAppliedEvent& e) const {
        Value v = base(e);
        v.Set("source_id", e.sourceId);
        v.Set("target_id", e.targetId);
        v.Set("modifier_id", e.modifierId);
        v.Set("stat", ModifiedStatName(e.stat));
        v.Set("value", e.value);
        v.Set("duration", optionalInt(e.duration));
        return v;
    }
    Value operator()(const ModifierExpiredEvent& e) const {
        Value v = base(e);
        v.Set("target_id", e.targetId);
        v.Set("modifier_id", e.modifierId);
        return v;
    }
    Value operator()(const ItemUsedEvent& e) const {
        Value v = base(e);
        v.Set("actor_id", e.actorId);
        v.Set("item_name", e.itemName);
        v.Set("target_ids", strings(e.targetIds));
        return v;
    }
    Value operator()(const ItemConsumedEvent& e) const {
        Value v = base(e);
        v.Set("actor_id", e.actorId);
        v.Set("item_name", e.itemName);
        v.Set("remaining", e.remaining);
        return v;
    }
    Value operator()(const TurnUndeadAttemptedEvent& e) const {
        Value v = base(e);
        v.Set("actor_id", e.actorId);
        v.Set("roll", e.roll);
        v.Set("target_number", optionalInt(e.targetNumber));
        v.Set("result", TurnUndeadResultName(e.result));
        return v;
    }
    Value operator()(const UndeadTurnedEvent& e) const {
        Value v = base(e);
        v.Set("actor_id", e.actorId);
        v.Set("target_id", e.targetId);
        v.Set("destroyed", e.destroyed);
        v.Set("hd_spent", e.hdSpent);
        return v;
    }
    Value operator()(const MoraleCheckedEvent& e) const {
        Value v = base(e);
        v.Set("side", CombatSideName(e.side));
        v.Set("trigger", e.trigger);
        v.Set("morale", e.morale);
        v.Set("roll", e.roll);
        v.Set("passed", e.passed);
        return v;
    }
    Value operator()(const EntityDiedEvent& e) const {
        Value v = base(e);
        v.Set("entity_id", e.combatantId);
        return v;
    }
    Value operator()(const EntityFledEvent& e) const {
        Value v = base(e);
        v.Set("entity_id", e.combatantId);
        v.Set("reason", e.reason);
        return v;
    }
    Value operator()(const VictoryDeterminedEvent& e) const {
        Value v = base(e);
        v.Set("outcome", EncounterOutcomeName(e.outcome));
        v.Set("round_number", e.round);
        return v;
    }
    Value operator()(const EncounterFaultedEvent& e) const {
        Value v = base(e);
        v.Set("state", EncounterStateName(e.state));
        v.Set("error_code", foundation::errorCodeName(e.code));
        v.Set("message", e.message);
        return v;
    }
};

// ── JSON text ───────────────────────────────────────────────────────────

void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

void appendJson(std::string& out, const Value& value) {
    if (value.IsNull()) {
        out += "null";
    } else if (value.IsBool()) {
        out += value.AsBool() ? "true" : "false";
    } else if (value.IsInt()) {
        out += std::to_string(value.AsInt());
    } else if (value.IsString()) {
        appendJsonString(out, value.AsString());
    } else if (value.IsArray()) {
        out += '[';
        bool first = true;
        for (const auto& item : value.AsArray()) {
            if (!first) {
                out += ',';
            }
            first = false;
            appendJson(out, item);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, member] : value.AsObject()) {
            if (!first) {
                out += ',';
            }
            first = false;
            appendJsonString(out, key);
            out += ':';
            appendJson(out, member);
        }
        out += '}';
    }
}

}  // namespace

// ── EventSerializer ─────────────────────────────────────────────────────

SerializedValue EventSerializer::ToValue(const EncounterEvent& event) {
    return std::visit(EventVisitor{}, event);
}

SerializedValue EventSerializer::ToValue(const ActionIntent& intent) {
    return std::visit(IntentVisitor{}, intent);
}

SerializedValue EventSerializer::ToValue(const Effect& effect) {
    return std::visit(EffectVisitor{}, effect);
}

SerializedValue EventSerializer::ToValue(const ActionChoice& choice) {
    Value v = object("ActionChoice");
    v.Set("ui_key", choice.uiKey);
    Value args = Value::MakeObject();
    for (const auto& [key, arg] : choice.uiArgs) {
        args.Set(key, arg);
    }
    v.Set("ui_args", std::move(args));
    v.Set("intent", ToValue(choice.intent));
    v.Set("label", choice.Label());
    return v;
}

SerializedValue EventSerializer::ToValue(const CombatView& view) {
    Value v = object("CombatView");
    v.Set("encounter_id", view.encounterId);
    v.Set("round_number", view.roundNumber);
    v.Set("state", EncounterStateName(view.state));
    v.Set("outcome", view.outcome ? Value(EncounterOutcomeName(*view.outcome)) : Value());
    v.Set("current_combatant_id",
          view.currentCombatantId ? Value(*view.currentCombatantId) : Value());
    v.Set("announced_deaths", strings(view.announcedDeaths));

    Value::Array combatants;
    for (const auto& c : view.combatants) {
        Value cv = object("CombatantView");
        cv.Set("id", c.id);
        cv.Set("name", c.name);
        cv.Set("side", CombatSideName(c.side));
        cv.Set("entity_kind", EntityKindName(c.kind));
        cv.Set("hp", c.hp);
        cv.Set("max_hp", c.maxHp);
        cv.Set("armor_class", c.armorClass);
        cv.Set("effective_armor_class", c.effectiveArmorClass);
        cv.Set("is_alive", c.isAlive);
        cv.Set("has_fled", c.hasFled);
        cv.Set("conditions", strings(c.conditions));
        Value::Array modifiers;
        for (const auto& m : c.modifiers) {
            modifiers.push_back(modifierValue(m));
        }
        cv.Set("modifiers", Value(std::move(modifiers)));
        combatants.push_back(std::move(cv));
    }
    v.Set("combatants", Value(std::move(combatants)));
    return v;
}

SerializedValue EventSerializer::Normalize(const SerializedValue& value) {
    if (value.IsArray()) {
        Value::Array out;
        out.reserve(value.AsArray().size());
        for (const auto& item : value.AsArray()) {
            out.push_back(Normalize(item));
        }
        return Value(std::move(out));
    }
    if (value.IsObject()) {
        Value out = Value::MakeObject();
        for (const auto& [key, member] : value.AsObject()) {
            out.Set(key, Normalize(member));
        }
        return out;
    }
    return value;
}

std::string EventSerializer::ToJson(const SerializedValue& value) {
    std::string out;
    appendJson(out, value);
    return out;
}

std::string EventSerializer::ToJson(const EncounterEvent& event) {
    return ToJson(ToValue(event));
}

}  // namespace skirmish::combat
