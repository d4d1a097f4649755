/// @file modifier_tracker.cpp
/// @brief ModifierTracker implementation.

#include "skirmish/combat/modifier_tracker.hpp"

#include <algorithm>

namespace skirmish::combat {

void ModifierTracker::Add(const std::string& combatantId, ActiveModifier modifier) {
    modifiers_[combatantId].push_back(std::move(modifier));
}

int ModifierTracker::GetTotal(std::string_view combatantId, ModifiedStat stat) const {
    auto it = modifiers_.find(combatantId);
    if (it == modifiers_.end()) {
        return 0;
    }
    int total = 0;
    for (const auto& m : it->second) {
        if (m.stat == stat) {
            total += m.value;
        }
    }
    return total;
}

std::vector<ActiveModifier> ModifierTracker::GetAll(std::string_view combatantId) const {
    auto it = modifiers_.find(combatantId);
    if (it == modifiers_.end()) {
        return {};
    }
    return it->second;
}

std::size_t ModifierTracker::Remove(std::string_view combatantId,
                                    std::string_view modifierId) {
    auto it = modifiers_.find(combatantId);
    if (it == modifiers_.end()) {
        return 0;
    }
    auto removed = std::erase_if(it->second, [modifierId](const ActiveModifier& m) {
        return m.modifierId == modifierId;
    });
    if (it->second.empty()) {
        modifiers_.erase(it);
    }
    return removed;
}

std::vector<ExpiredModifier> ModifierTracker::TickRound() {
    std::vector<ExpiredModifier> expired;
    for (auto it = modifiers_.begin(); it != modifiers_.end();) {
        auto& list = it->second;
        for (auto& m : list) {
            if (m.remainingRounds.has_value()) {
                *m.remainingRounds -= 1;
                if (*m.remainingRounds <= 0) {
                    expired.push_back({it->first, m.modifierId});
                }
            }
        }
        std::erase_if(list, [](const ActiveModifier& m) {
            return m.remainingRounds.has_value() && *m.remainingRounds <= 0;
        });
        if (list.empty()) {
            it = modifiers_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

}  // namespace skirmish::combat
