/// @file dice_service.cpp
/// @brief DiceExpression parsing and the DiceService implementations.

#include "skirmish/combat/dice_service.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

#include "skirmish/foundation/game_logger.hpp"

namespace skirmish::combat {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<DiceExpression> formatError(std::string_view text, std::string_view why) {
    return GameResult<DiceExpression>::err(GameError(
        ErrorCode::DiceFormatError,
        "invalid dice expression '" + std::string(text) + "': " + std::string(why)));
}

std::string normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace

// ── DiceExpression ──────────────────────────────────────────────────────

GameResult<DiceExpression> DiceExpression::Parse(std::string_view text) {
    static const std::regex kDicePattern(R"(^(\d*)d(\d+)([+-]\d+)?$)");
    static const std::regex kConstantPattern(R"(^[+-]?\d+$)");

    const std::string compact = normalize(text);
    if (compact.empty()) {
        return formatError(text, "empty");
    }

    try {
        std::smatch match;
        if (std::regex_match(compact, kConstantPattern)) {
            DiceExpression expr;
            expr.modifier = std::stoi(compact);
            if (expr.modifier < -kMaxModifier || expr.modifier > kMaxModifier) {
                return formatError(text, "modifier out of range");
            }
            return GameResult<DiceExpression>::ok(expr);
        }
        if (!std::regex_match(compact, match, kDicePattern)) {
            return formatError(text, "expected NdM[+/-K]");
        }

        DiceExpression expr;
        expr.count = match[1].length() == 0 ? 1 : std::stoi(match[1].str());
        expr.sides = std::stoi(match[2].str());
        expr.modifier = match[3].matched ? std::stoi(match[3].str()) : 0;

        if (expr.count < 1 || expr.count > kMaxCount) {
            return formatError(text, "dice count out of range");
        }
        if (expr.sides < 1 || expr.sides > kMaxSides) {
            return formatError(text, "die sides out of range");
        }
        if (expr.modifier < -kMaxModifier || expr.modifier > kMaxModifier) {
            return formatError(text, "modifier out of range");
        }
        return GameResult<DiceExpression>::ok(expr);
    } catch (const std::out_of_range&) {
        return formatError(text, "number too large");
    }
}

std::string DiceExpression::ToString() const {
    if (IsConstant()) {
        return std::to_string(modifier);
    }
    std::string out = std::to_string(count) + "d" + std::to_string(sides);
    if (modifier > 0) {
        out += "+" + std::to_string(modifier);
    } else if (modifier < 0) {
        out += std::to_string(modifier);
    }
    return out;
}

// ── DiceService ─────────────────────────────────────────────────────────

GameResult<int> DiceService::Roll(std::string_view expression) {
    auto parsed = DiceExpression::Parse(expression);
    if (!parsed) {
        SKIRMISH_LOG_WARN(LogCategory::Dice, parsed.error().message());
        return GameResult<int>::err(parsed.error());
    }
    return GameResult<int>::ok(Roll(parsed.value()));
}

int DiceService::Roll(const DiceExpression& expression) {
    int total = expression.modifier;
    for (int i = 0; i < expression.count; ++i) {
        total += RollDie(expression.sides);
    }
    return total;
}

// ── RandomDiceService ───────────────────────────────────────────────────

RandomDiceService::RandomDiceService()
    : rng_(std::random_device{}()) {}

RandomDiceService::RandomDiceService(uint32_t seed)
    : rng_(seed) {}

int RandomDiceService::D20() {
    return RollDie(20);
}

std::size_t RandomDiceService::ChooseIndex(std::size_t count) {
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

int RandomDiceService::RollDie(int sides) {
    std::uniform_int_distribution<int> dist(1, sides);
    return dist(rng_);
}

// ── FixedDiceService ────────────────────────────────────────────────────

GameResult<std::unique_ptr<FixedDiceService>> FixedDiceService::Create(
    std::vector<int> values) {
    if (values.empty()) {
        return GameResult<std::unique_ptr<FixedDiceService>>::err(GameError(
            ErrorCode::EmptyDiceSequence,
            "fixed dice service requires at least one value"));
    }
    return GameResult<std::unique_ptr<FixedDiceService>>::ok(
        std::unique_ptr<FixedDiceService>(new FixedDiceService(std::move(values))));
}

FixedDiceService::FixedDiceService(std::vector<int> values)
    : values_(std::move(values)) {}

int FixedDiceService::next() {
    int value = values_[cursor_];
    cursor_ = (cursor_ + 1) % values_.size();
    ++consumed_;
    return value;
}

int FixedDiceService::D20() {
    return next();
}

std::size_t FixedDiceService::ChooseIndex(std::size_t count) {
    auto value = static_cast<long long>(next());
    auto n = static_cast<long long>(count);
    return static_cast<std::size_t>(((value % n) + n) % n);
}

int FixedDiceService::RollDie(int /*sides*/) {
    return next();
}

}  // namespace skirmish::combat
