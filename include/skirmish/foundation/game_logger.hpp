#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon logger_system for encounter logging.
///
/// Provides category-based filtering, structured logging with encounter
/// context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "skirmish/foundation/game_result.hpp"

namespace skirmish::foundation {

/// Log severity levels.
///
/// Maps onto kcenon::common::interfaces::log_level one to one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per engine subsystem.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Startup, shutdown, process-level messages
    Dice   = 1, ///< Dice parsing and scripted replay
    Combat = 2, ///< Encounter state machine and event stream
    AI     = 3, ///< Tactical provider decisions
    Config = 4  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Dice", "Combat", "AI", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.encounterId = "3f9a2c01b7de";
///   ctx.combatantId = "monster:Goblin:0";
///   ctx.round = 2;
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> encounterId;
    std::optional<std::string> combatantId;
    std::optional<int> round;
    std::map<std::string, std::string> extra;
};

/// Encounter logger wrapping kcenon's logging system.
///
/// Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Dice     | Info          |
/// | Combat   | Debug         |
/// | AI       | Debug         |
/// | Config   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by its context as `{key=val, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    GameResult<void> flush();

    /// Process-wide logger used by the SKIRMISH_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace skirmish::foundation

/// @name SKIRMISH_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define SKIRMISH_MIN_LOG_LEVEL before including this header to strip
/// calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef SKIRMISH_MIN_LOG_LEVEL
    #define SKIRMISH_MIN_LOG_LEVEL 0
#endif

#define SKIRMISH_LOG(level, cat, msg)                                                 \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= SKIRMISH_MIN_LOG_LEVEL &&                      \
            ::skirmish::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                             \
            ::skirmish::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define SKIRMISH_LOG_DEBUG(cat, msg) \
    SKIRMISH_LOG(::skirmish::foundation::LogLevel::Debug, (cat), (msg))

#define SKIRMISH_LOG_INFO(cat, msg) \
    SKIRMISH_LOG(::skirmish::foundation::LogLevel::Info, (cat), (msg))

#define SKIRMISH_LOG_WARN(cat, msg) \
    SKIRMISH_LOG(::skirmish::foundation::LogLevel::Warning, (cat), (msg))

#define SKIRMISH_LOG_ERROR(cat, msg) \
    SKIRMISH_LOG(::skirmish::foundation::LogLevel::Error, (cat), (msg))

/// @}
