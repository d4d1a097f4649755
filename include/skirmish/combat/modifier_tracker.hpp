#pragma once

/// @file modifier_tracker.hpp
/// @brief Temporary stat modifiers per combatant with round-based expiry.

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "skirmish/combat/combat_types.hpp"

namespace skirmish::combat {

/// A numeric adjustment to one combat stat.
struct ActiveModifier {
    std::string modifierId;
    std::string sourceId;
    ModifiedStat stat = ModifiedStat::Attack;
    int value = 0;
    std::optional<int> remainingRounds;   ///< Absent = until removed.

    bool operator==(const ActiveModifier&) const = default;
};

/// A modifier removed by TickRound().
struct ExpiredModifier {
    std::string combatantId;
    std::string modifierId;

    bool operator==(const ExpiredModifier&) const = default;
};

/// Holds every active modifier of one encounter.
///
/// Instances stack: adding the same modifier id twice keeps both and
/// GetTotal() sums them. Read accessors return copies.
class ModifierTracker {
public:
    void Add(const std::string& combatantId, ActiveModifier modifier);

    /// Sum of @p stat modifiers on the combatant, 0 if none.
    [[nodiscard]] int GetTotal(std::string_view combatantId, ModifiedStat stat) const;

    [[nodiscard]] std::vector<ActiveModifier> GetAll(std::string_view combatantId) const;

    /// Remove every instance of @p modifierId from the combatant.
    /// @return Number of instances removed.
    std::size_t Remove(std::string_view combatantId, std::string_view modifierId);

    /// Decrement finite durations and drop those reaching zero.
    ///
    /// Expired entries are reported in combatant id order, then in the
    /// order they were added. Permanent modifiers are never touched.
    std::vector<ExpiredModifier> TickRound();

    [[nodiscard]] bool Empty() const noexcept { return modifiers_.empty(); }

private:
    std::map<std::string, std::vector<ActiveModifier>, std::less<>> modifiers_;
};

}  // namespace skirmish::combat
