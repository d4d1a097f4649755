#pragma once

/// @file encounter_config.hpp
/// @brief Build encounter options and rosters from a ConfigManager.
///
/// Expected layout:
/// @code
///   encounter:
///     id: crypt-01
///     turn_order: initiative        # roster | initiative
///     morale_enabled: true
///     surprise_enabled: false
///     auto_provide_monsters: true
///     max_steps: 2000
///   roster:
///     party:
///       - { name: Ada, class: fighter, level: 2, hp: 14, armor_class: 4 }
///     opposition:
///       - { name: Goblin, count: 3, hit_dice: 1, hp: 4, armor_class: 6 }
/// @endcode

#include <vector>

#include "skirmish/combat/combatant.hpp"
#include "skirmish/combat/encounter_engine.hpp"
#include "skirmish/foundation/config_manager.hpp"
#include "skirmish/foundation/game_result.hpp"

namespace skirmish::combat {

/// Read `encounter.*` keys; absent keys keep their defaults.
foundation::GameResult<EncounterOptions> LoadEncounterOptions(
    const foundation::ConfigManager& config);

/// Read `roster.party` and `roster.opposition`.
///
/// Party ids are "pc:<name>"; opposition entries expand `count` copies
/// with ids "monster:<name>:<n>". An explicit `id` overrides the party id.
foundation::GameResult<std::vector<Combatant>> LoadRoster(
    const foundation::ConfigManager& config);

}  // namespace skirmish::combat
