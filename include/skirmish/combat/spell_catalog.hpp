#pragma once

/// @file spell_catalog.hpp
/// @brief Static combat spell table.

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "skirmish/combat/combat_types.hpp"

namespace skirmish::combat {

/// Temporary modifier granted to each target of a buff spell.
struct SpellModifierGrant {
    std::string_view modifierId;
    ModifiedStat stat = ModifiedStat::Attack;
    int value = 0;
    int duration = 0;
};

/// Immutable catalog entry for one spell.
///
/// Empty dice strings mean "not applicable".
struct SpellDefinition {
    std::string_view spellId;
    std::string_view name;
    int level = 1;
    TargetMode targetMode = TargetMode::SingleEnemy;
    int targetCount = 1;                 ///< 1 = single, -1 = all opponents.
    bool autoHit = true;                 ///< false = needs a touch attack roll.
    std::string_view damageDie;
    std::string_view damagePerLevel;     ///< Rolled once per caster level.
    std::string_view healDie;
    std::string_view poolDie;            ///< HD budget or group size.
    std::string_view conditionId;
    std::optional<int> conditionDuration;
    bool allowsSave = false;
    bool saveNegates = true;             ///< false = a save halves damage.
    std::vector<SpellModifierGrant> modifiers;
    std::vector<CharacterClass> usableBy;
    /// (minimum caster level, projectile count), ascending by level.
    /// Each projectile rolls `damageDie` separately.
    std::vector<std::pair<int, int>> projectileThresholds;

    [[nodiscard]] bool UsableBy(CharacterClass cls) const;

    /// Projectiles fired by a caster of @p casterLevel; 1 without thresholds.
    [[nodiscard]] int ProjectileCount(int casterLevel) const noexcept;

    /// Whether the caster picks targets explicitly in the intent.
    [[nodiscard]] bool NeedsExplicitTarget() const noexcept {
        return targetMode == TargetMode::SingleEnemy
            || targetMode == TargetMode::SingleAlly;
    }
};

/// Every spell, in catalog order.
[[nodiscard]] const std::vector<SpellDefinition>& SpellCatalog();

/// nullptr if @p spellId is not in the catalog.
[[nodiscard]] const SpellDefinition* FindSpell(std::string_view spellId);

}  // namespace skirmish::combat
