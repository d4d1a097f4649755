/// @file combat_context.cpp
/// @brief CombatContext lookups.

#include "skirmish/combat/combat_context.hpp"

#include <algorithm>

namespace skirmish::combat {

Combatant* CombatContext::Find(std::string_view id) {
    auto it = std::find_if(roster.begin(), roster.end(),
                           [id](const Combatant& c) { return c.id == id; });
    return it == roster.end() ? nullptr : &*it;
}

const Combatant* CombatContext::Find(std::string_view id) const {
    auto it = std::find_if(roster.begin(), roster.end(),
                           [id](const Combatant& c) { return c.id == id; });
    return it == roster.end() ? nullptr : &*it;
}

std::vector<const Combatant*> CombatContext::Active(CombatSide side) const {
    std::vector<const Combatant*> active;
    for (const auto& c : roster) {
        if (c.side == side && c.IsActive()) {
            active.push_back(&c);
        }
    }
    return active;
}

std::vector<std::string> CombatContext::ActiveIds(CombatSide side) const {
    std::vector<std::string> ids;
    for (const auto* c : Active(side)) {
        ids.push_back(c->id);
    }
    return ids;
}

int CombatContext::CountSide(CombatSide side) const {
    return static_cast<int>(std::count_if(
        roster.begin(), roster.end(),
        [side](const Combatant& c) { return c.side == side; }));
}

int CombatContext::EffectiveArmorClass(const Combatant& combatant) const {
    return combatant.armorClass
        + modifiers.GetTotal(combatant.id, ModifiedStat::ArmorClass);
}

}  // namespace skirmish::combat
