#pragma once

/// @file item_catalog.hpp
/// @brief Static table of items usable in combat.

#include <string_view>
#include <vector>

#include "skirmish/combat/combat_types.hpp"

namespace skirmish::combat {

struct ItemDefinition {
    std::string_view name;
    TargetMode targetMode = TargetMode::SingleEnemy;
    std::string_view damageDie;
    std::string_view healDie;
    bool thrown = false;
};

[[nodiscard]] const std::vector<ItemDefinition>& ItemCatalog();

/// nullptr if @p name is not a combat item.
[[nodiscard]] const ItemDefinition* FindItem(std::string_view name);

}  // namespace skirmish::combat
