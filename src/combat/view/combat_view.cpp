/// @file combat_view.cpp
/// @brief Snapshot construction.

#include "skirmish/combat/combat_view.hpp"

#include <algorithm>

namespace skirmish::combat {

const CombatantView* CombatView::Find(const std::string& id) const {
    auto it = std::find_if(combatants.begin(), combatants.end(),
                           [&id](const CombatantView& c) { return c.id == id; });
    return it == combatants.end() ? nullptr : &*it;
}

CombatView BuildCombatView(const CombatContext& context,
                           const std::string& encounterId,
                           EncounterState state,
                           std::optional<EncounterOutcome> outcome) {
    CombatView view;
    view.encounterId = encounterId;
    view.roundNumber = context.round;
    view.state = state;
    view.outcome = outcome;
    view.currentCombatantId = context.currentCombatantId;

    view.combatants.reserve(context.roster.size());
    for (const auto& c : context.roster) {
        CombatantView cv;
        cv.id = c.id;
        cv.name = c.name;
        cv.side = c.side;
        cv.kind = c.kind;
        cv.hp = c.DisplayHp();
        cv.maxHp = c.maxHp;
        cv.armorClass = c.armorClass;
        cv.effectiveArmorClass = context.EffectiveArmorClass(c);
        cv.isAlive = c.IsAlive();
        cv.hasFled = c.fled;
        for (const auto& condition : context.conditions.GetAll(c.id)) {
            cv.conditions.push_back(condition.conditionId);
        }
        cv.modifiers = context.modifiers.GetAll(c.id);
        view.combatants.push_back(std::move(cv));
    }

    // std::set iterates in sorted order.
    view.announcedDeaths.assign(context.announcedDeaths.begin(),
                                context.announcedDeaths.end());
    return view;
}

}  // namespace skirmish::combat
