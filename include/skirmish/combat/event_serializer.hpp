#pragma once

/// @file event_serializer.hpp
/// @brief JSON-safe projection of events, intents, effects and views.
///
/// Every serialized object carries a "kind" discriminator naming its
/// variant, and every enumeration is written as its symbolic name.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "skirmish/combat/combat_view.hpp"
#include "skirmish/combat/effects.hpp"
#include "skirmish/combat/events.hpp"
#include "skirmish/combat/intents.hpp"

namespace skirmish::combat {

/// Generic JSON-compatible value: null, bool, integer, string, array or
/// object. Objects keep their keys sorted.
class SerializedValue {
public:
    using Array = std::vector<SerializedValue>;
    using Member = std::pair<std::string, SerializedValue>;
    using Object = std::vector<Member>;

    SerializedValue() = default;
    SerializedValue(bool value) : data_(value) {}
    SerializedValue(int value) : data_(static_cast<int64_t>(value)) {}
    SerializedValue(int64_t value) : data_(value) {}
    SerializedValue(std::string value) : data_(std::move(value)) {}
    SerializedValue(std::string_view value) : data_(std::string(value)) {}
    SerializedValue(const char* value) : data_(std::string(value)) {}
    SerializedValue(Array value) : data_(std::move(value)) {}

    /// An empty object.
    [[nodiscard]] static SerializedValue MakeObject();

    [[nodiscard]] bool IsNull() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool IsBool() const noexcept { return data_.index() == 1; }
    [[nodiscard]] bool IsInt() const noexcept { return data_.index() == 2; }
    [[nodiscard]] bool IsString() const noexcept { return data_.index() == 3; }
    [[nodiscard]] bool IsArray() const noexcept { return data_.index() == 4; }
    [[nodiscard]] bool IsObject() const noexcept { return data_.index() == 5; }

    [[nodiscard]] bool AsBool() const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t AsInt() const { return std::get<int64_t>(data_); }
    [[nodiscard]] const std::string& AsString() const { return std::get<std::string>(data_); }
    [[nodiscard]] const Array& AsArray() const { return std::get<Array>(data_); }
    [[nodiscard]] const Object& AsObject() const { return std::get<Object>(data_); }

    /// Insert or replace @p key, keeping keys sorted. Turns a null value
    /// into an object first.
    void Set(std::string key, SerializedValue value);

    /// Member lookup on objects; nullptr if absent or not an object.
    [[nodiscard]] const SerializedValue* Find(std::string_view key) const;

    bool operator==(const SerializedValue& other) const;

private:
    std::variant<std::monostate, bool, int64_t, std::string, Array, Object> data_;
};

class EventSerializer {
public:
    [[nodiscard]] static SerializedValue ToValue(const EncounterEvent& event);
    [[nodiscard]] static SerializedValue ToValue(const ActionIntent& intent);
    [[nodiscard]] static SerializedValue ToValue(const Effect& effect);
    [[nodiscard]] static SerializedValue ToValue(const ActionChoice& choice);
    [[nodiscard]] static SerializedValue ToValue(const CombatView& view);

    /// Rebuild @p value with every object's keys sorted and duplicates
    /// collapsed (last wins). Normalize(Normalize(v)) == Normalize(v).
    [[nodiscard]] static SerializedValue Normalize(const SerializedValue& value);

    /// Compact JSON text with sorted keys.
    [[nodiscard]] static std::string ToJson(const SerializedValue& value);

    [[nodiscard]] static std::string ToJson(const EncounterEvent& event);
};

}  // namespace skirmish::combat
