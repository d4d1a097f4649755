#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the encounter engine.

#include <cstdint>
#include <string_view>

namespace skirmish::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the error source
/// can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Dice (0x0100 - 0x01FF)
    DiceFormatError = 0x0100,
    EmptyDiceSequence = 0x0101,
    EmptyChoice = 0x0102,

    // Combat engine (0x0200 - 0x02FF)
    InvalidRoster = 0x0200,
    CombatantNotFound = 0x0201,
    EncounterAlreadyEnded = 0x0202,
    NotAwaitingIntent = 0x0203,
    WrongCombatant = 0x0204,
    EncounterLoopExhausted = 0x0205,
    NoProviderChoice = 0x0206,
    InvalidState = 0x0207,

    // Catalog (0x0300 - 0x03FF)
    UnknownSpell = 0x0300,
    UnknownItem = 0x0301,
    UnknownCondition = 0x0302,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Dice";
        case 0x0200: return "Combat";
        case 0x0300: return "Catalog";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Return the symbolic name of an error code.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::DiceFormatError: return "DiceFormatError";
        case ErrorCode::EmptyDiceSequence: return "EmptyDiceSequence";
        case ErrorCode::EmptyChoice: return "EmptyChoice";
        case ErrorCode::InvalidRoster: return "InvalidRoster";
        case ErrorCode::CombatantNotFound: return "CombatantNotFound";
        case ErrorCode::EncounterAlreadyEnded: return "EncounterAlreadyEnded";
        case ErrorCode::NotAwaitingIntent: return "NotAwaitingIntent";
        case ErrorCode::WrongCombatant: return "WrongCombatant";
        case ErrorCode::EncounterLoopExhausted: return "EncounterLoopExhausted";
        case ErrorCode::NoProviderChoice: return "NoProviderChoice";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::UnknownSpell: return "UnknownSpell";
        case ErrorCode::UnknownItem: return "UnknownItem";
        case ErrorCode::UnknownCondition: return "UnknownCondition";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalidValue: return "ConfigInvalidValue";
        case ErrorCode::LoggerError: return "LoggerError";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
    }
    return "Unknown";
}

}  // namespace skirmish::foundation
