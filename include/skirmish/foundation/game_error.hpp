#pragma once

/// @file game_error.hpp
/// @brief Engine error type used with Result<T, GameError>.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "skirmish/foundation/error_code.hpp"

namespace skirmish::foundation {

/// Error carrying a categorized code, a human-readable message and,
/// when the failure concerns a specific combatant, that combatant's id.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::string combatantId)
        : code_(code),
          message_(std::move(message)),
          combatantId_(std::move(combatantId)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Combatant the error refers to, if any.
    [[nodiscard]] const std::optional<std::string>& combatantId() const noexcept {
        return combatantId_;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::optional<std::string> combatantId_;
};

}  // namespace skirmish::foundation
