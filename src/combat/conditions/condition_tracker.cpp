/// @file condition_tracker.cpp
/// @brief ConditionTracker implementation and the condition table.

#include "skirmish/combat/condition_tracker.hpp"

#include <algorithm>
#include <array>

namespace skirmish::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr std::array<ConditionBehavior, 3> kConditions = {{
    {"held", true, false},
    {"asleep", true, true},
    {"blinded", false, false},
}};

}  // namespace

const ConditionBehavior* FindCondition(std::string_view conditionId) {
    for (const auto& c : kConditions) {
        if (c.conditionId == conditionId) {
            return &c;
        }
    }
    return nullptr;
}

GameResult<void> ConditionTracker::Apply(const std::string& combatantId,
                                         ActiveCondition condition) {
    if (FindCondition(condition.conditionId) == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::UnknownCondition,
            "unknown condition: " + condition.conditionId, combatantId));
    }
    conditions_[combatantId].push_back(std::move(condition));
    return GameResult<void>::ok();
}

bool ConditionTracker::Has(std::string_view combatantId,
                           std::string_view conditionId) const {
    auto it = conditions_.find(combatantId);
    if (it == conditions_.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(),
                       [conditionId](const ActiveCondition& c) {
                           return c.conditionId == conditionId;
                       });
}

std::vector<ActiveCondition> ConditionTracker::GetAll(std::string_view combatantId) const {
    auto it = conditions_.find(combatantId);
    if (it == conditions_.end()) {
        return {};
    }
    return it->second;
}

bool ConditionTracker::Remove(std::string_view combatantId,
                              std::string_view conditionId) {
    auto it = conditions_.find(combatantId);
    if (it == conditions_.end()) {
        return false;
    }
    auto& list = it->second;
    auto pos = std::find_if(list.begin(), list.end(),
                            [conditionId](const ActiveCondition& c) {
                                return c.conditionId == conditionId;
                            });
    if (pos == list.end()) {
        return false;
    }
    list.erase(pos);
    return true;
}

std::optional<std::string> ConditionTracker::SkipReason(
    std::string_view combatantId) const {
    auto it = conditions_.find(combatantId);
    if (it == conditions_.end()) {
        return std::nullopt;
    }
    for (const auto& c : it->second) {
        const auto* behavior = FindCondition(c.conditionId);
        if (behavior != nullptr && behavior->skipsTurn) {
            return c.conditionId;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ConditionTracker::BreakOnDamage(std::string_view combatantId) {
    std::vector<std::string> removed;
    auto it = conditions_.find(combatantId);
    if (it == conditions_.end()) {
        return removed;
    }
    std::erase_if(it->second, [&removed](const ActiveCondition& c) {
        const auto* behavior = FindCondition(c.conditionId);
        if (behavior != nullptr && behavior->breaksOnDamage) {
            removed.push_back(c.conditionId);
            return true;
        }
        return false;
    });
    return removed;
}

std::vector<ExpiredCondition> ConditionTracker::TickRound() {
    std::vector<ExpiredCondition> expired;
    for (auto& entry : conditions_) {
        const std::string& combatantId = entry.first;
        std::erase_if(entry.second, [&](ActiveCondition& c) {
            if (!c.remainingRounds.has_value()) {
                return false;
            }
            *c.remainingRounds -= 1;
            if (*c.remainingRounds > 0) {
                return false;
            }
            expired.push_back({combatantId, c.conditionId});
            return true;
        });
    }
    return expired;
}

}  // namespace skirmish::combat
