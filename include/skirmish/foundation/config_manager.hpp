#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "skirmish/foundation/game_result.hpp"

namespace skirmish::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager.
///
/// Maps are flattened into dotted keys ("encounter.max_steps"); sequences
/// and scalars are stored as leaf nodes, so a roster list is read back with
/// `get<YAML::Node>("roster.party")`.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GameResult<void> loadString(std::string_view yaml);

    /// Typed lookup; ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Typed lookup falling back to @p fallback when the key is absent.
    /// A present key of the wrong type is still reported as an error.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value and notify watchers of @p key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace skirmish::foundation
