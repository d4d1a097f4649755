#pragma once

/// @file condition_tracker.hpp
/// @brief Named conditions (held, asleep, blinded) per combatant.

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "skirmish/foundation/game_result.hpp"

namespace skirmish::combat {

/// Static behavior of a condition id.
struct ConditionBehavior {
    std::string_view conditionId;
    bool skipsTurn = false;
    bool breaksOnDamage = false;
};

/// Look up a condition's behavior; nullptr for unknown ids.
[[nodiscard]] const ConditionBehavior* FindCondition(std::string_view conditionId);

struct ActiveCondition {
    std::string conditionId;
    std::string sourceId;
    std::optional<int> remainingRounds;   ///< Absent = until removed.

    bool operator==(const ActiveCondition&) const = default;
};

struct ExpiredCondition {
    std::string combatantId;
    std::string conditionId;

    bool operator==(const ExpiredCondition&) const = default;
};

/// Holds every active condition of one encounter.
class ConditionTracker {
public:
    /// Add a condition. UnknownCondition if the id has no behavior entry.
    foundation::GameResult<void> Apply(const std::string& combatantId,
                                       ActiveCondition condition);

    [[nodiscard]] bool Has(std::string_view combatantId,
                           std::string_view conditionId) const;

    [[nodiscard]] std::vector<ActiveCondition> GetAll(std::string_view combatantId) const;

    /// Remove the first instance of @p conditionId. Returns false if absent.
    bool Remove(std::string_view combatantId, std::string_view conditionId);

    /// Id of the first turn-skipping condition on the combatant, if any.
    [[nodiscard]] std::optional<std::string> SkipReason(std::string_view combatantId) const;

    /// Drop every condition that ends when the combatant takes damage.
    /// @return Removed condition ids in application order.
    std::vector<std::string> BreakOnDamage(std::string_view combatantId);

    /// Decrement finite durations and drop those reaching zero.
    std::vector<ExpiredCondition> TickRound();

private:
    std::map<std::string, std::vector<ActiveCondition>, std::less<>> conditions_;
};

}  // namespace skirmish::combat
