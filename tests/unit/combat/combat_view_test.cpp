#include <gtest/gtest.h>

#include "skirmish/combat/combat_view.hpp"
#include "skirmish/combat/encounter_engine.hpp"

using namespace skirmish::combat;

namespace {

Combatant makeCombatant(std::string id, CombatSide side, int hp, int armorClass) {
    Combatant c;
    c.id = std::move(id);
    c.name = c.id.substr(c.id.find(':') + 1);
    c.side = side;
    c.kind = side == CombatSide::Party ? EntityKind::Player : EntityKind::Monster;
    c.hp = hp;
    c.maxHp = 8;
    c.armorClass = armorClass;
    return c;
}

}  // namespace

class CombatViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_.roster = {
            makeCombatant("pc:Mira", CombatSide::Party, 8, 9),
            makeCombatant("monster:Orc:0", CombatSide::Monster, -3, 6),
            makeCombatant("monster:Goblin:0", CombatSide::Monster, 4, 7),
        };
        context_.round = 3;
        context_.currentCombatantId = "pc:Mira";
    }

    CombatContext context_;
};

TEST_F(CombatViewTest, SnapshotsRosterInOrder) {
    CombatView view = BuildCombatView(context_, "crypt", EncounterState::AwaitIntent,
                                      std::nullopt);

    EXPECT_EQ(view.encounterId, "crypt");
    EXPECT_EQ(view.roundNumber, 3);
    EXPECT_EQ(view.state, EncounterState::AwaitIntent);
    EXPECT_FALSE(view.outcome.has_value());
    EXPECT_EQ(view.currentCombatantId, std::optional<std::string>("pc:Mira"));

    ASSERT_EQ(view.combatants.size(), 3u);
    EXPECT_EQ(view.combatants[0].id, "pc:Mira");
    EXPECT_EQ(view.combatants[0].name, "Mira");
    EXPECT_EQ(view.combatants[1].id, "monster:Orc:0");
    EXPECT_EQ(view.combatants[2].id, "monster:Goblin:0");
}

TEST_F(CombatViewTest, HitPointsAreClampedAtZero) {
    CombatView view = BuildCombatView(context_, "crypt", EncounterState::CheckDeaths,
                                      std::nullopt);
    const CombatantView* orc = view.Find("monster:Orc:0");
    ASSERT_NE(orc, nullptr);
    EXPECT_EQ(orc->hp, 0);
    EXPECT_FALSE(orc->isAlive);
    EXPECT_EQ(orc->maxHp, 8);
}

TEST_F(CombatViewTest, IncludesConditionsAndModifiers) {
    context_.modifiers.Add("pc:Mira", ActiveModifier{"shield_ac", "pc:Mira",
                                                     ModifiedStat::ArmorClass, -2, 12});
    ASSERT_TRUE(context_.conditions
                    .Apply("monster:Goblin:0", ActiveCondition{"asleep", "pc:Mira", std::nullopt})
                    .hasValue());

    CombatView view = BuildCombatView(context_, "crypt", EncounterState::TurnStart,
                                      std::nullopt);

    const CombatantView* mira = view.Find("pc:Mira");
    ASSERT_NE(mira, nullptr);
    EXPECT_EQ(mira->armorClass, 9);
    EXPECT_EQ(mira->effectiveArmorClass, 7);
    ASSERT_EQ(mira->modifiers.size(), 1u);
    EXPECT_EQ(mira->modifiers[0].modifierId, "shield_ac");

    const CombatantView* goblin = view.Find("monster:Goblin:0");
    ASSERT_NE(goblin, nullptr);
    EXPECT_EQ(goblin->conditions, std::vector<std::string>{"asleep"});
    EXPECT_EQ(goblin->effectiveArmorClass, 7);
}

TEST_F(CombatViewTest, AnnouncedDeathsAreSorted) {
    context_.announcedDeaths = {"monster:Orc:0", "monster:Bat:1", "monster:Bat:0"};
    CombatView view = BuildCombatView(context_, "crypt", EncounterState::CheckMorale,
                                      std::nullopt);
    EXPECT_EQ(view.announcedDeaths,
              (std::vector<std::string>{"monster:Bat:0", "monster:Bat:1", "monster:Orc:0"}));
}

TEST_F(CombatViewTest, ViewIsDetachedFromContext) {
    CombatView before = BuildCombatView(context_, "crypt", EncounterState::TurnStart,
                                        std::nullopt);
    context_.Find("pc:Mira")->hp = 1;
    context_.Find("monster:Goblin:0")->fled = true;

    EXPECT_EQ(before.Find("pc:Mira")->hp, 8);
    EXPECT_FALSE(before.Find("monster:Goblin:0")->hasFled);

    CombatView after = BuildCombatView(context_, "crypt", EncounterState::TurnStart,
                                       std::nullopt);
    EXPECT_NE(before, after);
    EXPECT_TRUE(after.Find("monster:Goblin:0")->hasFled);
}

TEST_F(CombatViewTest, FindUnknownIdIsNull) {
    CombatView view = BuildCombatView(context_, "crypt", EncounterState::Init, std::nullopt);
    EXPECT_EQ(view.Find("pc:Nobody"), nullptr);
}

TEST(EngineViewTest, ViewTracksEngineState) {
    auto dice = FixedDiceService::Create({10});
    ASSERT_TRUE(dice.hasValue());

    Combatant ada = makeCombatant("pc:Ada", CombatSide::Party, 8, 5);
    Combatant goblin = makeCombatant("monster:Goblin:0", CombatSide::Monster, 4, 7);
    EncounterOptions options;
    options.encounterId = "road";
    auto engine = EncounterEngine::Create({goblin, ada}, *dice.value(), options);
    ASSERT_TRUE(engine.hasValue());

    CombatView initial = engine.value()->View();
    EXPECT_EQ(initial.state, EncounterState::Init);
    EXPECT_EQ(initial.roundNumber, 0);
    EXPECT_EQ(initial.combatants[0].id, "pc:Ada");

    ASSERT_TRUE(engine.value()->StepUntilDecision().hasValue());
    CombatView waiting = engine.value()->View();
    EXPECT_EQ(waiting.encounterId, "road");
    EXPECT_EQ(waiting.state, EncounterState::AwaitIntent);
    EXPECT_EQ(waiting.roundNumber, 1);
    EXPECT_EQ(waiting.currentCombatantId, std::optional<std::string>("pc:Ada"));
}
