/// @file targeting.cpp
/// @brief Hit-dice pool and random group target selection.

#include "skirmish/combat/targeting.hpp"

#include <algorithm>

namespace skirmish::combat {

std::vector<std::string> ResolveHdPool(const std::vector<HitDiceCandidate>& candidates,
                                       int poolTotal) {
    std::vector<std::string> selected;
    if (poolTotal <= 0 || candidates.empty()) {
        return selected;
    }

    std::vector<HitDiceCandidate> ordered = candidates;
    for (auto& c : ordered) {
        c.hitDice = std::max(c.hitDice, 1);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const HitDiceCandidate& a, const HitDiceCandidate& b) {
                         return a.hitDice < b.hitDice;
                     });

    int remaining = poolTotal;
    for (const auto& c : ordered) {
        if (c.hitDice > remaining) {
            break;
        }
        remaining -= c.hitDice;
        selected.push_back(c.id);
    }
    return selected;
}

std::vector<std::string> ResolveRandomGroup(const std::vector<std::string>& candidates,
                                            int count, DiceService& dice) {
    std::vector<std::string> selected;
    if (count <= 0 || candidates.empty()) {
        return selected;
    }

    std::vector<std::string> pool = candidates;
    auto picks = std::min(static_cast<std::size_t>(count), pool.size());
    selected.reserve(picks);
    for (std::size_t i = 0; i < picks; ++i) {
        auto index = dice.ChooseIndex(pool.size());
        selected.push_back(std::move(pool[index]));
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return selected;
}

}  // namespace skirmish::combat
