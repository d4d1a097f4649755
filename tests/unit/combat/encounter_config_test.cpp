#include <gtest/gtest.h>

#include "skirmish/combat/encounter_config.hpp"

using namespace skirmish::combat;
using skirmish::foundation::ConfigManager;
using skirmish::foundation::ErrorCode;

namespace {

constexpr const char* kCrypt = R"(
encounter:
  id: crypt-01
  turn_order: Initiative
  morale_enabled: false
  surprise_enabled: true
  auto_provide_monsters: true
  max_steps: 500
roster:
  party:
    - name: Ada
      class: fighter
      level: 2
      hp: 14
      armor_class: 4
      damage: 1d8+1
      items: [Flask of Oil, Flask of Oil]
    - name: Mira
      id: hero-mira
      class: MAGIC_USER
      hp: 5
      spells: [sleep, magic_missile]
      spell_slots: {1: 2}
  opposition:
    - name: Goblin
      count: 2
      hit_dice: 1
      hp: 4
      armor_class: 6
      morale: 7
    - name: Ogre
      hit_dice: 4
      hp: 19
      thac0: 15
      damage: 1d10
    - name: Goblin
      hp: 5
)";

}  // namespace

class EncounterConfigTest : public ::testing::Test {
protected:
    void load(const std::string& yaml) {
        ASSERT_TRUE(config_.loadString(yaml).hasValue());
    }

    ConfigManager config_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Options
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(EncounterConfigTest, OptionsFromYaml) {
    load(kCrypt);
    auto options = LoadEncounterOptions(config_);
    ASSERT_TRUE(options.hasValue());
    EXPECT_EQ(options.value().encounterId, "crypt-01");
    EXPECT_EQ(options.value().turnOrder, TurnOrderPolicy::Initiative);
    EXPECT_FALSE(options.value().moraleEnabled);
    EXPECT_TRUE(options.value().surpriseEnabled);
    EXPECT_TRUE(options.value().autoProvideMonsters);
    EXPECT_EQ(options.value().maxSteps, 500);
}

TEST_F(EncounterConfigTest, AbsentOptionsKeepDefaults) {
    load("roster: {}\n");
    auto options = LoadEncounterOptions(config_);
    ASSERT_TRUE(options.hasValue());

    EncounterOptions defaults;
    EXPECT_EQ(options.value().encounterId, defaults.encounterId);
    EXPECT_EQ(options.value().turnOrder, TurnOrderPolicy::RosterOrder);
    EXPECT_TRUE(options.value().moraleEnabled);
    EXPECT_FALSE(options.value().surpriseEnabled);
    EXPECT_EQ(options.value().maxSteps, kDefaultMaxSteps);
}

TEST_F(EncounterConfigTest, UnknownTurnOrderIsInvalid) {
    load("encounter:\n  turn_order: alphabetical\n");
    auto options = LoadEncounterOptions(config_);
    ASSERT_TRUE(options.hasError());
    EXPECT_EQ(options.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(EncounterConfigTest, NonPositiveStepBudgetIsInvalid) {
    load("encounter:\n  max_steps: 0\n");
    auto options = LoadEncounterOptions(config_);
    ASSERT_TRUE(options.hasError());
    EXPECT_EQ(options.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(EncounterConfigTest, WrongOptionTypeIsMismatch) {
    load("encounter:\n  morale_enabled: sometimes\n");
    auto options = LoadEncounterOptions(config_);
    ASSERT_TRUE(options.hasError());
    EXPECT_EQ(options.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ═══════════════════════════════════════════════════════════════════════════
// Roster
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(EncounterConfigTest, RosterFromYaml) {
    load(kCrypt);
    auto roster = LoadRoster(config_);
    ASSERT_TRUE(roster.hasValue()) << roster.error().message();

    const auto& r = roster.value();
    ASSERT_EQ(r.size(), 6u);

    EXPECT_EQ(r[0].id, "pc:Ada");
    EXPECT_EQ(r[0].side, CombatSide::Party);
    EXPECT_EQ(r[0].kind, EntityKind::Player);
    EXPECT_EQ(r[0].characterClass, CharacterClass::Fighter);
    EXPECT_EQ(r[0].level, 2);
    EXPECT_EQ(r[0].hp, 14);
    EXPECT_EQ(r[0].maxHp, 14);
    EXPECT_EQ(r[0].armorClass, 4);
    EXPECT_EQ(r[0].damageDie, "1d8+1");
    EXPECT_EQ(r[0].items.size(), 2u);

    EXPECT_EQ(r[1].id, "hero-mira");
    EXPECT_EQ(r[1].characterClass, CharacterClass::MagicUser);
    EXPECT_TRUE(r[1].KnowsSpell("sleep"));
    EXPECT_EQ(r[1].SlotsAt(1), 2);

    EXPECT_EQ(r[2].id, "monster:Goblin:0");
    EXPECT_EQ(r[3].id, "monster:Goblin:1");
    EXPECT_EQ(r[4].id, "monster:Ogre:0");
    EXPECT_EQ(r[5].id, "monster:Goblin:2");

    EXPECT_EQ(r[2].side, CombatSide::Monster);
    EXPECT_EQ(r[2].kind, EntityKind::Monster);
    EXPECT_EQ(r[2].armorClass, 6);
    EXPECT_EQ(r[4].hitDice, 4);
    EXPECT_EQ(r[4].thac0, 15);
    EXPECT_EQ(r[4].damageDie, "1d10");
    EXPECT_EQ(r[5].hp, 5);
}

TEST_F(EncounterConfigTest, UndeadFlagDefaultsToFalse) {
    load(R"(
roster:
  party:
    - name: Tam
      class: cleric
      level: 3
      hp: 9
  opposition:
    - name: Skeleton
      count: 2
      hp: 5
      undead: true
    - name: Goblin
      hp: 4
)");
    auto roster = LoadRoster(config_);
    ASSERT_TRUE(roster.hasValue()) << roster.error().message();

    const auto& r = roster.value();
    ASSERT_EQ(r.size(), 4u);
    EXPECT_FALSE(r[0].isUndead);
    EXPECT_TRUE(r[1].isUndead);
    EXPECT_TRUE(r[2].isUndead);
    EXPECT_FALSE(r[3].isUndead);
}

TEST_F(EncounterConfigTest, LoadedRosterStartsAnEncounter) {
    load(kCrypt);
    auto roster = LoadRoster(config_);
    auto options = LoadEncounterOptions(config_);
    ASSERT_TRUE(roster.hasValue());
    ASSERT_TRUE(options.hasValue());

    auto dice = FixedDiceService::Create({3});
    ASSERT_TRUE(dice.hasValue());
    auto engine = EncounterEngine::Create(roster.value(), *dice.value(), options.value());
    ASSERT_TRUE(engine.hasValue());
    EXPECT_EQ(engine.value()->Options().encounterId, "crypt-01");
}

TEST_F(EncounterConfigTest, MissingRosterSectionIsNotFound) {
    load("roster:\n  party:\n    - {name: Ada, hp: 5}\n");
    auto roster = LoadRoster(config_);
    ASSERT_TRUE(roster.hasError());
    EXPECT_EQ(roster.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(EncounterConfigTest, RosterSectionsMustBeLists) {
    load("roster:\n  party: Ada\n  opposition:\n    - {name: Goblin, hp: 4}\n");
    auto roster = LoadRoster(config_);
    ASSERT_TRUE(roster.hasError());
    EXPECT_EQ(roster.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(EncounterConfigTest, InvalidEntriesAreRejected) {
    const char* cases[] = {
        // Missing hp.
        "roster:\n  party:\n    - {name: Ada}\n  opposition:\n    - {name: Goblin, hp: 4}\n",
        // Missing name.
        "roster:\n  party:\n    - {hp: 5}\n  opposition:\n    - {name: Goblin, hp: 4}\n",
        // Unknown class.
        "roster:\n  party:\n    - {name: Ada, hp: 5, class: bard}\n"
        "  opposition:\n    - {name: Goblin, hp: 4}\n",
        // Morale out of range.
        "roster:\n  party:\n    - {name: Ada, hp: 5}\n"
        "  opposition:\n    - {name: Goblin, hp: 4, morale: 13}\n",
        // Malformed damage dice.
        "roster:\n  party:\n    - {name: Ada, hp: 5, damage: lots}\n"
        "  opposition:\n    - {name: Goblin, hp: 4}\n",
        // Zero count.
        "roster:\n  party:\n    - {name: Ada, hp: 5}\n"
        "  opposition:\n    - {name: Goblin, hp: 4, count: 0}\n",
    };
    for (const char* yaml : cases) {
        ConfigManager config;
        ASSERT_TRUE(config.loadString(yaml).hasValue()) << yaml;
        auto roster = LoadRoster(config);
        ASSERT_TRUE(roster.hasError()) << yaml;
        EXPECT_EQ(roster.error().code(), ErrorCode::ConfigInvalidValue) << yaml;
    }
}

TEST_F(EncounterConfigTest, NonNumericStatIsTypeMismatch) {
    load("roster:\n  party:\n    - {name: Ada, hp: lots}\n"
         "  opposition:\n    - {name: Goblin, hp: 4}\n");
    auto roster = LoadRoster(config_);
    ASSERT_TRUE(roster.hasError());
    EXPECT_EQ(roster.error().code(), ErrorCode::ConfigTypeMismatch);
}
