#pragma once

/// @file event_formatter.hpp
/// @brief One-line human-readable rendering of encounter events.

#include <string>
#include <string_view>
#include <vector>

#include "skirmish/combat/events.hpp"

namespace skirmish::combat {

class EventFormatter {
public:
    /// "pc:Ada" -> "Ada", "monster:Goblin:0" -> "Goblin #1".
    [[nodiscard]] static std::string DisplayCombatant(std::string_view combatantId);

    [[nodiscard]] static std::string Format(const EncounterEvent& event);

    /// Format each event on its own line.
    [[nodiscard]] static std::string FormatAll(const std::vector<EncounterEvent>& events);
};

}  // namespace skirmish::combat
