/// @file spell_catalog.cpp
/// @brief Spell table contents.

#include "skirmish/combat/spell_catalog.hpp"

#include <algorithm>

namespace skirmish::combat {

namespace {

using CC = CharacterClass;

std::vector<SpellDefinition> buildCatalog() {
    std::vector<SpellDefinition> spells;

    SpellDefinition magicMissile;
    magicMissile.spellId = "magic_missile";
    magicMissile.name = "Magic Missile";
    magicMissile.level = 1;
    magicMissile.damageDie = "1d6+1";
    magicMissile.usableBy = {CC::MagicUser, CC::Elf};
    magicMissile.projectileThresholds = {{1, 1}, {6, 3}, {11, 5}};
    spells.push_back(magicMissile);

    SpellDefinition sleep;
    sleep.spellId = "sleep";
    sleep.name = "Sleep";
    sleep.level = 1;
    sleep.targetMode = TargetMode::HdPool;
    sleep.targetCount = -1;
    sleep.poolDie = "2d8";
    sleep.conditionId = "asleep";
    sleep.usableBy = {CC::MagicUser, CC::Elf};
    spells.push_back(sleep);

    SpellDefinition holdPerson;
    holdPerson.spellId = "hold_person";
    holdPerson.name = "Hold Person";
    holdPerson.level = 2;
    holdPerson.targetMode = TargetMode::EnemyGroup;
    holdPerson.targetCount = -1;
    holdPerson.poolDie = "1d4";
    holdPerson.conditionId = "held";
    holdPerson.conditionDuration = 9;
    holdPerson.allowsSave = true;
    holdPerson.usableBy = {CC::Cleric};
    spells.push_back(holdPerson);

    SpellDefinition light;
    light.spellId = "light";
    light.name = "Light";
    light.level = 1;
    light.conditionId = "blinded";
    light.conditionDuration = 12;
    light.usableBy = {CC::Cleric, CC::MagicUser, CC::Elf};
    spells.push_back(light);

    SpellDefinition cure;
    cure.spellId = "cure_light_wounds";
    cure.name = "Cure Light Wounds";
    cure.level = 1;
    cure.targetMode = TargetMode::SingleAlly;
    cure.healDie = "1d6+1";
    cure.usableBy = {CC::Cleric};
    spells.push_back(cure);

    SpellDefinition cause;
    cause.spellId = "cause_light_wounds";
    cause.name = "Cause Light Wounds";
    cause.level = 1;
    cause.autoHit = false;
    cause.damageDie = "1d6+1";
    cause.usableBy = {CC::Cleric};
    spells.push_back(cause);

    SpellDefinition bless;
    bless.spellId = "bless";
    bless.name = "Bless";
    bless.level = 2;
    bless.targetMode = TargetMode::AllAllies;
    bless.targetCount = -1;
    bless.modifiers = {
        {"bless_atk", ModifiedStat::Attack, 1, 6},
        {"bless_save", ModifiedStat::SavingThrow, 1, 6},
    };
    bless.usableBy = {CC::Cleric};
    spells.push_back(bless);

    SpellDefinition shield;
    shield.spellId = "shield";
    shield.name = "Shield";
    shield.level = 1;
    shield.targetMode = TargetMode::Self;
    shield.modifiers = {{"shield_ac", ModifiedStat::ArmorClass, -2, 12}};
    shield.usableBy = {CC::MagicUser, CC::Elf};
    spells.push_back(shield);

    SpellDefinition fireball;
    fireball.spellId = "fireball";
    fireball.name = "Fireball";
    fireball.level = 3;
    fireball.targetMode = TargetMode::AllEnemies;
    fireball.targetCount = -1;
    fireball.damagePerLevel = "1d6";
    fireball.allowsSave = true;
    fireball.saveNegates = false;
    fireball.usableBy = {CC::MagicUser, CC::Elf};
    spells.push_back(fireball);

    SpellDefinition lightning = fireball;
    lightning.spellId = "lightning_bolt";
    lightning.name = "Lightning Bolt";
    spells.push_back(lightning);

    return spells;
}

}  // namespace

bool SpellDefinition::UsableBy(CharacterClass cls) const {
    return std::find(usableBy.begin(), usableBy.end(), cls) != usableBy.end();
}

int SpellDefinition::ProjectileCount(int casterLevel) const noexcept {
    int count = 1;
    for (const auto& [minLevel, projectiles] : projectileThresholds) {
        if (casterLevel >= minLevel) {
            count = projectiles;
        }
    }
    return count;
}

const std::vector<SpellDefinition>& SpellCatalog() {
    static const std::vector<SpellDefinition> catalog = buildCatalog();
    return catalog;
}

const SpellDefinition* FindSpell(std::string_view spellId) {
    const auto& catalog = SpellCatalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [spellId](const SpellDefinition& s) {
                               return s.spellId == spellId;
                           });
    return it == catalog.end() ? nullptr : &*it;
}

}  // namespace skirmish::combat
