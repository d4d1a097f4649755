#pragma once

/// @file dice_service.hpp
/// @brief Dice notation parsing and the randomness interface.
///
/// Every random decision the engine makes goes through DiceService.
/// RandomDiceService is used in play; FixedDiceService replays a scripted
/// value sequence so that an encounter trajectory is fully reproducible.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "skirmish/foundation/game_result.hpp"

namespace skirmish::combat {

/// Parsed dice expression "NdM[+/-K]", "dM" or a constant "K".
struct DiceExpression {
    static constexpr int kMaxCount = 1000;
    static constexpr int kMaxSides = 1000;
    /// Largest flat modifier; keeps every roll total inside int range.
    static constexpr int kMaxModifier = kMaxCount * kMaxSides;

    int count = 0;      ///< Number of dice (0 for a constant).
    int sides = 0;      ///< Faces per die (0 for a constant).
    int modifier = 0;   ///< Flat bonus or penalty.

    /// Parse dice notation. Case-insensitive; surrounding whitespace is
    /// ignored. Fails with DiceFormatError on anything else, including
    /// counts, sides or modifiers beyond the limits above.
    static foundation::GameResult<DiceExpression> Parse(std::string_view text);

    /// Canonical notation ("2d6+1", "1d8", "3").
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] bool IsConstant() const noexcept { return count == 0; }

    [[nodiscard]] int Minimum() const noexcept { return count + modifier; }
    [[nodiscard]] int Maximum() const noexcept { return count * sides + modifier; }

    bool operator==(const DiceExpression&) const = default;
};

/// Randomness source for the encounter engine.
class DiceService {
public:
    virtual ~DiceService() = default;

    /// Evaluate dice notation, including its modifier.
    foundation::GameResult<int> Roll(std::string_view expression);

    /// Evaluate an already parsed expression.
    int Roll(const DiceExpression& expression);

    /// A single unmodified d20.
    virtual int D20() = 0;

    /// Pick one element of @p items uniformly. EmptyChoice if empty.
    template <typename T>
    foundation::GameResult<T> Choice(const std::vector<T>& items) {
        if (items.empty()) {
            return foundation::GameResult<T>::err(foundation::GameError(
                foundation::ErrorCode::EmptyChoice,
                "cannot choose from an empty sequence"));
        }
        return foundation::GameResult<T>::ok(items[ChooseIndex(items.size())]);
    }

    /// Index in [0, count) chosen uniformly. @p count must be positive.
    virtual std::size_t ChooseIndex(std::size_t count) = 0;

protected:
    /// One die with @p sides faces, in [1, sides].
    virtual int RollDie(int sides) = 0;
};

/// Production dice backed by a Mersenne Twister seeded from
/// std::random_device.
class RandomDiceService final : public DiceService {
public:
    RandomDiceService();

    /// Seeded variant for reproducible simulation runs.
    explicit RandomDiceService(uint32_t seed);

    int D20() override;
    std::size_t ChooseIndex(std::size_t count) override;

protected:
    int RollDie(int sides) override;

private:
    std::mt19937 rng_;
};

/// Scripted dice replaying a fixed value sequence, cycling when exhausted.
///
/// Each die of a rolled expression consumes one value as-is, D20() consumes
/// one value, and ChooseIndex() consumes one value modulo the item count.
class FixedDiceService final : public DiceService {
public:
    /// Fails with EmptyDiceSequence if @p values is empty.
    static foundation::GameResult<std::unique_ptr<FixedDiceService>> Create(
        std::vector<int> values);

    int D20() override;
    std::size_t ChooseIndex(std::size_t count) override;

    /// Total values consumed since construction.
    [[nodiscard]] std::size_t ConsumedCount() const noexcept { return consumed_; }

protected:
    int RollDie(int sides) override;

private:
    explicit FixedDiceService(std::vector<int> values);

    int next();

    std::vector<int> values_;
    std::size_t cursor_ = 0;
    std::size_t consumed_ = 0;
};

}  // namespace skirmish::combat
