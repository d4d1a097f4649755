#include <gtest/gtest.h>

#include "skirmish/combat/event_formatter.hpp"
#include "skirmish/combat/event_serializer.hpp"

using namespace skirmish::combat;
using skirmish::foundation::ErrorCode;

namespace {

std::string stringAt(const SerializedValue& value, std::string_view key) {
    const SerializedValue* member = value.Find(key);
    return member != nullptr && member->IsString() ? member->AsString() : std::string();
}

int64_t intAt(const SerializedValue& value, std::string_view key) {
    const SerializedValue* member = value.Find(key);
    return member != nullptr && member->IsInt() ? member->AsInt() : -1;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SerializedValue
// ═══════════════════════════════════════════════════════════════════════════

TEST(SerializedValueTest, SetKeepsKeysSorted) {
    SerializedValue v;
    v.Set("zeta", 1);
    v.Set("alpha", "a");
    v.Set("mid", true);
    v.Set("alpha", "b");

    ASSERT_TRUE(v.IsObject());
    const auto& members = v.AsObject();
    ASSERT_EQ(members.size(), 3u);
    EXPECT_EQ(members[0].first, "alpha");
    EXPECT_EQ(members[0].second.AsString(), "b");
    EXPECT_EQ(members[1].first, "mid");
    EXPECT_EQ(members[2].first, "zeta");
}

TEST(SerializedValueTest, FindOnNonObjectIsNull) {
    SerializedValue number(7);
    EXPECT_EQ(number.Find("kind"), nullptr);
    EXPECT_EQ(SerializedValue::MakeObject().Find("kind"), nullptr);
}

TEST(SerializedValueTest, JsonRendering) {
    SerializedValue v;
    v.Set("list", SerializedValue(SerializedValue::Array{1, "two", SerializedValue()}));
    v.Set("flag", false);
    v.Set("text", "say \"hi\"\n\ttab");
    EXPECT_EQ(EventSerializer::ToJson(v),
              R"({"flag":false,"list":[1,"two",null],"text":"say \"hi\"\n\ttab"})");
}

TEST(SerializedValueTest, ControlCharactersAreEscaped) {
    SerializedValue v(std::string("a\x01z"));
    EXPECT_EQ(EventSerializer::ToJson(v), R"("a\u0001z")");
}

// ═══════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventSerializerTest, DamageAppliedJson) {
    EncounterEvent event = DamageAppliedEvent{"pc:Ada", "monster:Goblin:0", 5, 0};
    EXPECT_EQ(EventSerializer::ToJson(event),
              R"({"amount":5,"kind":"DamageApplied","source_id":"pc:Ada",)"
              R"("target_hp_after":0,"target_id":"monster:Goblin:0"})");
}

TEST(EventSerializerTest, EveryEventCarriesItsKind) {
    std::vector<EncounterEvent> events = {
        EncounterStartedEvent{"e1", {"pc:Ada"}, {"monster:Goblin:0"}},
        RoundStartedEvent{2},
        TurnSkippedEvent{1, "monster:Goblin:0", "asleep"},
        EntityDiedEvent{"monster:Goblin:0"},
        EntityFledEvent{"monster:Goblin:1", "morale"},
        VictoryDeterminedEvent{EncounterOutcome::PartyVictory, 3},
        EncounterFaultedEvent{EncounterState::ExecuteAction, ErrorCode::DiceFormatError, "bad"},
    };
    for (const auto& event : events) {
        SerializedValue value = EventSerializer::ToValue(event);
        EXPECT_EQ(stringAt(value, "kind"), std::string(EventKind(event)));
    }
}

TEST(EventSerializerTest, EnumerationsUseSymbolicNames) {
    SerializedValue victory = EventSerializer::ToValue(
        EncounterEvent{VictoryDeterminedEvent{EncounterOutcome::OppositionVictory, 4}});
    EXPECT_EQ(stringAt(victory, "outcome"), "OPPOSITION_VICTORY");
    EXPECT_EQ(intAt(victory, "round_number"), 4);

    SerializedValue fault = EventSerializer::ToValue(EncounterEvent{
        EncounterFaultedEvent{EncounterState::CheckMorale, ErrorCode::InvalidState, "oops"}});
    EXPECT_EQ(stringAt(fault, "state"), "CHECK_MORALE");
    EXPECT_EQ(stringAt(fault, "error_code"), "InvalidState");
    EXPECT_EQ(stringAt(fault, "message"), "oops");

    SerializedValue died = EventSerializer::ToValue(EncounterEvent{EntityDiedEvent{"pc:Ada"}});
    EXPECT_EQ(stringAt(died, "entity_id"), "pc:Ada");
}

TEST(EventSerializerTest, TurnUndeadEvents) {
    SerializedValue impossible = EventSerializer::ToValue(EncounterEvent{
        TurnUndeadAttemptedEvent{"pc:Tam", 0, std::nullopt, TurnUndeadResult::Impossible}});
    EXPECT_EQ(stringAt(impossible, "kind"), "TurnUndeadAttempted");
    EXPECT_EQ(stringAt(impossible, "actor_id"), "pc:Tam");
    EXPECT_EQ(stringAt(impossible, "result"), "IMPOSSIBLE");
    ASSERT_NE(impossible.Find("target_number"), nullptr);
    EXPECT_TRUE(impossible.Find("target_number")->IsNull());

    SerializedValue turned = EventSerializer::ToValue(EncounterEvent{
        TurnUndeadAttemptedEvent{"pc:Tam", 8, 7, TurnUndeadResult::Turned}});
    EXPECT_EQ(intAt(turned, "roll"), 8);
    EXPECT_EQ(intAt(turned, "target_number"), 7);
    EXPECT_EQ(stringAt(turned, "result"), "TURNED");

    SerializedValue undead = EventSerializer::ToValue(
        EncounterEvent{UndeadTurnedEvent{"pc:Tam", "monster:Skeleton:0", true, 1}});
    EXPECT_EQ(stringAt(undead, "kind"), "UndeadTurned");
    EXPECT_EQ(stringAt(undead, "target_id"), "monster:Skeleton:0");
    ASSERT_NE(undead.Find("destroyed"), nullptr);
    EXPECT_TRUE(undead.Find("destroyed")->AsBool());
    EXPECT_EQ(intAt(undead, "hd_spent"), 1);

    EXPECT_EQ(stringAt(EventSerializer::ToValue(ActionIntent{TurnUndeadIntent{"pc:Tam"}}),
                       "kind"),
              "TurnUndead");
}

TEST(EventSerializerTest, SurpriseWithoutSideIsNull) {
    SerializedValue value =
        EventSerializer::ToValue(EncounterEvent{SurpriseRolledEvent{3, 3, std::nullopt}});
    const SerializedValue* side = value.Find("surprised_side");
    ASSERT_NE(side, nullptr);
    EXPECT_TRUE(side->IsNull());
}

TEST(EventSerializerTest, NeedActionListsLabelledChoices) {
    NeedActionEvent need;
    need.round = 1;
    need.combatantId = "pc:Ada";
    need.choices = {
        {"attack_target", {{"target_id", "monster:Goblin:0"}, {"target_name", "Goblin"}},
         MeleeAttackIntent{"pc:Ada", "monster:Goblin:0"}},
        {"flee", {}, FleeIntent{"pc:Ada"}},
    };

    SerializedValue value = EventSerializer::ToValue(EncounterEvent{need});
    const SerializedValue* available = value.Find("available");
    ASSERT_NE(available, nullptr);
    ASSERT_TRUE(available->IsArray());
    ASSERT_EQ(available->AsArray().size(), 2u);

    const SerializedValue& attack = available->AsArray()[0];
    EXPECT_EQ(stringAt(attack, "kind"), "ActionChoice");
    EXPECT_EQ(stringAt(attack, "label"), "Attack Goblin");
    EXPECT_EQ(stringAt(attack, "ui_key"), "attack_target");
    const SerializedValue* intent = attack.Find("intent");
    ASSERT_NE(intent, nullptr);
    EXPECT_EQ(stringAt(*intent, "kind"), "MeleeAttack");
    EXPECT_EQ(stringAt(*intent, "target"), "monster:Goblin:0");

    EXPECT_EQ(stringAt(available->AsArray()[1], "label"), "Flee");
}

TEST(EventSerializerTest, RejectionReasonsCarryCodes) {
    ActionRejectedEvent rejected{"pc:Ada", RangedAttackIntent{"pc:Ada", "monster:Goblin:0"},
                                 {{RejectionCode::NoRangedWeapon, "no ranged weapon"}}};
    SerializedValue value = EventSerializer::ToValue(EncounterEvent{rejected});

    const SerializedValue* reasons = value.Find("reasons");
    ASSERT_NE(reasons, nullptr);
    ASSERT_EQ(reasons->AsArray().size(), 1u);
    EXPECT_EQ(stringAt(reasons->AsArray()[0], "code"), "NO_RANGED_WEAPON");
    EXPECT_EQ(stringAt(reasons->AsArray()[0], "message"), "no ranged weapon");
    EXPECT_EQ(stringAt(*value.Find("intent"), "kind"), "RangedAttack");
}

// ═══════════════════════════════════════════════════════════════════════════
// Intents and effects
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventSerializerTest, IntentKinds) {
    EXPECT_EQ(stringAt(EventSerializer::ToValue(
                           ActionIntent{CastSpellIntent{"pc:Mira", "sleep", 1, {}}}),
                       "kind"),
              "CastSpell");
    EXPECT_EQ(stringAt(EventSerializer::ToValue(
                           ActionIntent{UseItemIntent{"pc:Ada", "Flask of Oil", {"x"}}}),
                       "kind"),
              "UseItem");
    EXPECT_EQ(stringAt(EventSerializer::ToValue(ActionIntent{FleeIntent{"pc:Ada"}}), "kind"),
              "Flee");
}

TEST(EventSerializerTest, ModifierEffectNestsModifier) {
    ActiveModifier bless{"bless_atk", "pc:Cleo", ModifiedStat::Attack, 1, 6};
    SerializedValue value =
        EventSerializer::ToValue(Effect{ApplyModifierEffect{"pc:Cleo", "pc:Ada", bless}});

    EXPECT_EQ(stringAt(value, "kind"), "ApplyModifier");
    const SerializedValue* modifier = value.Find("modifier");
    ASSERT_NE(modifier, nullptr);
    EXPECT_EQ(stringAt(*modifier, "stat"), "ATTACK");
    EXPECT_EQ(intAt(*modifier, "remaining_rounds"), 6);
}

TEST(EventSerializerTest, PermanentConditionHasNullDuration) {
    SerializedValue value = EventSerializer::ToValue(
        Effect{ApplyConditionEffect{"pc:Mira", "monster:Goblin:0", "asleep", std::nullopt}});
    EXPECT_EQ(stringAt(value, "kind"), "ApplyCondition");
    ASSERT_NE(value.Find("duration"), nullptr);
    EXPECT_TRUE(value.Find("duration")->IsNull());
}

// ═══════════════════════════════════════════════════════════════════════════
// Normalization
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventSerializerTest, NormalizeIsIdempotent) {
    SerializedValue value = EventSerializer::ToValue(
        EncounterEvent{EncounterStartedEvent{"e1", {"pc:Ada"}, {"monster:Goblin:0"}}});
    SerializedValue once = EventSerializer::Normalize(value);
    EXPECT_EQ(once, value);
    EXPECT_EQ(EventSerializer::Normalize(once), once);
}

// ═══════════════════════════════════════════════════════════════════════════
// Formatter
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventFormatterTest, DisplayCombatant) {
    EXPECT_EQ(EventFormatter::DisplayCombatant("pc:Ada"), "Ada");
    EXPECT_EQ(EventFormatter::DisplayCombatant("monster:Goblin:0"), "Goblin #1");
    EXPECT_EQ(EventFormatter::DisplayCombatant("monster:Giant Rat:11"), "Giant Rat #12");
    EXPECT_EQ(EventFormatter::DisplayCombatant("monster:Ogre"), "Ogre");
    EXPECT_EQ(EventFormatter::DisplayCombatant("npc-7"), "npc-7");
}

TEST(EventFormatterTest, DamageLine) {
    EXPECT_EQ(EventFormatter::Format(DamageAppliedEvent{"pc:Ada", "monster:Goblin:0", 5, 0}),
              "Ada deals 5 damage to Goblin #1. Goblin #1 has 0 HP remaining.");
}

TEST(EventFormatterTest, OutcomeLines) {
    EXPECT_EQ(EventFormatter::Format(
                  VictoryDeterminedEvent{EncounterOutcome::PartyVictory, 2}),
              "The party is victorious!");
    EXPECT_EQ(EventFormatter::Format(
                  VictoryDeterminedEvent{EncounterOutcome::OppositionVictory, 2}),
              "The party has been defeated.");
}

TEST(EventFormatterTest, AttackLine) {
    EXPECT_EQ(EventFormatter::Format(
                  AttackRolledEvent{"pc:Ada", "monster:Goblin:0", 20, 20, 12, true, true, false}),
              "Ada attacks Goblin #1: HIT (rolled 20 vs 12) CRITICAL HIT!");
    EXPECT_EQ(EventFormatter::Format(
                  AttackRolledEvent{"monster:Goblin:0", "pc:Ada", 3, 3, 14, false, false, true}),
              "Goblin #1 shoots at Ada: MISS (rolled 3 vs 14).");
}

TEST(EventFormatterTest, TurnUndeadLines) {
    EXPECT_EQ(EventFormatter::Format(TurnUndeadAttemptedEvent{
                  "pc:Tam", 0, std::nullopt, TurnUndeadResult::Impossible}),
              "Tam cannot turn these undead.");
    EXPECT_EQ(EventFormatter::Format(
                  TurnUndeadAttemptedEvent{"pc:Tam", 3, 7, TurnUndeadResult::Failed}),
              "Tam fails to turn undead (rolled 3 vs 7).");
    EXPECT_EQ(EventFormatter::Format(
                  TurnUndeadAttemptedEvent{"pc:Tam", 8, 7, TurnUndeadResult::Turned}),
              "Tam presents a holy symbol!");
    EXPECT_EQ(EventFormatter::Format(
                  UndeadTurnedEvent{"pc:Tam", "monster:Skeleton:0", false, 1}),
              "Skeleton #1 is turned and flees.");
    EXPECT_EQ(EventFormatter::Format(
                  UndeadTurnedEvent{"pc:Tam", "monster:Skeleton:1", true, 1}),
              "Skeleton #2 crumbles to dust.");
}

TEST(EventFormatterTest, FormatAllJoinsLines) {
    std::vector<EncounterEvent> events = {RoundStartedEvent{1}, EntityDiedEvent{"pc:Ada"}};
    EXPECT_EQ(EventFormatter::FormatAll(events), "Round 1 begins.\nAda falls!");
}
