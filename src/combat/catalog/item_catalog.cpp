/// @file item_catalog.cpp
/// @brief Combat item table contents.

#include "skirmish/combat/item_catalog.hpp"

#include <algorithm>

namespace skirmish::combat {

const std::vector<ItemDefinition>& ItemCatalog() {
    static const std::vector<ItemDefinition> catalog = {
        {"Flask of Oil", TargetMode::SingleEnemy, "1d8", "", true},
        {"Holy Water", TargetMode::SingleEnemy, "1d8", "", true},
        {"Potion of Healing", TargetMode::Self, "", "1d8", false},
    };
    return catalog;
}

const ItemDefinition* FindItem(std::string_view name) {
    const auto& catalog = ItemCatalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [name](const ItemDefinition& i) { return i.name == name; });
    return it == catalog.end() ? nullptr : &*it;
}

}  // namespace skirmish::combat
