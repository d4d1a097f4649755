/// @file encounter_config.cpp
/// @brief YAML roster and option loading.

#include "skirmish/combat/encounter_config.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>

#include "skirmish/combat/dice_service.hpp"
#include "skirmish/foundation/game_logger.hpp"

namespace skirmish::combat {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<CharacterClass> parseClass(const std::string& text) {
    static const std::map<std::string, CharacterClass> kClasses = {
        {"commoner", CharacterClass::Commoner},
        {"fighter", CharacterClass::Fighter},
        {"cleric", CharacterClass::Cleric},
        {"magic_user", CharacterClass::MagicUser},
        {"elf", CharacterClass::Elf},
        {"thief", CharacterClass::Thief},
        {"dwarf", CharacterClass::Dwarf},
        {"halfling", CharacterClass::Halfling},
    };
    auto it = kClasses.find(lower(text));
    if (it == kClasses.end()) {
        return std::nullopt;
    }
    return it->second;
}

GameError invalid(const std::string& where, const std::string& what) {
    return GameError(ErrorCode::ConfigInvalidValue, where + ": " + what);
}

template <typename T>
const GameError* errorOf(const GameResult<T>& result) {
    return result ? nullptr : &result.error();
}

template <typename T>
T field(const YAML::Node& node, const char* key, T fallback) {
    return node[key] ? node[key].as<T>() : fallback;
}

/// Parse one stat block. Throws YAML::Exception on malformed scalars.
GameResult<Combatant> parseCombatant(const YAML::Node& node, CombatSide side,
                                     const std::string& where) {
    if (!node.IsMap()) {
        return GameResult<Combatant>::err(invalid(where, "expected a mapping"));
    }
    if (!node["name"]) {
        return GameResult<Combatant>::err(invalid(where, "missing 'name'"));
    }
    if (!node["hp"] && !node["max_hp"]) {
        return GameResult<Combatant>::err(invalid(where, "missing 'hp'"));
    }

    Combatant c;
    c.name = node["name"].as<std::string>();
    c.side = side;
    c.kind = side == CombatSide::Party ? EntityKind::Player : EntityKind::Monster;

    const auto className = field<std::string>(node, "class", "commoner");
    auto cls = parseClass(className);
    if (!cls) {
        return GameResult<Combatant>::err(invalid(where, "unknown class '" + className + "'"));
    }
    c.characterClass = *cls;

    c.level = field<int>(node, "level", 1);
    c.hitDice = field<int>(node, "hit_dice", c.level);
    c.maxHp = field<int>(node, "max_hp", field<int>(node, "hp", 1));
    c.hp = field<int>(node, "hp", c.maxHp);
    c.armorClass = field<int>(node, "armor_class", 9);
    c.thac0 = field<int>(node, "thac0", 19);
    c.attackBonus = field<int>(node, "attack_bonus", 0);
    c.damageDie = field<std::string>(node, "damage", "1d6");
    c.attacksPerRound = field<int>(node, "attacks_per_round", 1);
    if (node["ranged_damage"]) {
        c.rangedDamageDie = node["ranged_damage"].as<std::string>();
    }
    c.rangedAttackBonus = field<int>(node, "ranged_attack_bonus", 0);
    c.saveTarget = field<int>(node, "save_target", 14);
    c.morale = field<int>(node, "morale", 7);
    c.isUndead = field<bool>(node, "undead", false);

    if (const auto slots = node["spell_slots"]) {
        for (auto it = slots.begin(); it != slots.end(); ++it) {
            c.spellSlots[it->first.as<int>()] = it->second.as<int>();
        }
    }
    if (const auto spells = node["spells"]) {
        c.knownSpells = spells.as<std::vector<std::string>>();
    }
    if (const auto items = node["items"]) {
        c.items = items.as<std::vector<std::string>>();
    }

    if (auto parsed = DiceExpression::Parse(c.damageDie); !parsed) {
        return GameResult<Combatant>::err(invalid(where, std::string(parsed.error().message())));
    }
    if (c.rangedDamageDie) {
        if (auto parsed = DiceExpression::Parse(*c.rangedDamageDie); !parsed) {
            return GameResult<Combatant>::err(
                invalid(where, std::string(parsed.error().message())));
        }
    }
    if (c.morale < 2 || c.morale > 12) {
        return GameResult<Combatant>::err(invalid(where, "morale must be in 2..12"));
    }
    return GameResult<Combatant>::ok(std::move(c));
}

}  // namespace

GameResult<EncounterOptions> LoadEncounterOptions(const ConfigManager& config) {
    EncounterOptions options;

    auto id = config.getOr<std::string>("encounter.id", options.encounterId);
    auto turnOrder = config.getOr<std::string>("encounter.turn_order", "roster");
    auto morale = config.getOr<bool>("encounter.morale_enabled", options.moraleEnabled);
    auto surprise = config.getOr<bool>("encounter.surprise_enabled", options.surpriseEnabled);
    auto autoProvide = config.getOr<bool>("encounter.auto_provide_monsters",
                                          options.autoProvideMonsters);
    auto maxSteps = config.getOr<int>("encounter.max_steps", options.maxSteps);

    for (const GameError* error : {errorOf(id), errorOf(turnOrder), errorOf(morale),
                                   errorOf(surprise), errorOf(autoProvide),
                                   errorOf(maxSteps)}) {
        if (error != nullptr) {
            SKIRMISH_LOG_WARN(LogCategory::Config, std::string(error->message()));
            return GameResult<EncounterOptions>::err(*error);
        }
    }

    const std::string order = lower(turnOrder.value());
    if (order == "roster") {
        options.turnOrder = TurnOrderPolicy::RosterOrder;
    } else if (order == "initiative") {
        options.turnOrder = TurnOrderPolicy::Initiative;
    } else {
        return GameResult<EncounterOptions>::err(
            invalid("encounter.turn_order", "expected 'roster' or 'initiative'"));
    }
    if (maxSteps.value() <= 0) {
        return GameResult<EncounterOptions>::err(
            invalid("encounter.max_steps", "must be positive"));
    }

    options.encounterId = id.value();
    options.moraleEnabled = morale.value();
    options.surpriseEnabled = surprise.value();
    options.autoProvideMonsters = autoProvide.value();
    options.maxSteps = maxSteps.value();
    return GameResult<EncounterOptions>::ok(std::move(options));
}

GameResult<std::vector<Combatant>> LoadRoster(const ConfigManager& config) {
    using RosterResult = GameResult<std::vector<Combatant>>;

    auto party = config.get<YAML::Node>("roster.party");
    if (!party) {
        return RosterResult::err(party.error());
    }
    auto opposition = config.get<YAML::Node>("roster.opposition");
    if (!opposition) {
        return RosterResult::err(opposition.error());
    }
    if (!party.value().IsSequence() || !opposition.value().IsSequence()) {
        return RosterResult::err(invalid("roster", "party and opposition must be lists"));
    }

    std::vector<Combatant> roster;
    try {
        for (std::size_t i = 0; i < party.value().size(); ++i) {
            const YAML::Node node = party.value()[i];
            auto parsed = parseCombatant(node, CombatSide::Party,
                                         "roster.party[" + std::to_string(i) + "]");
            if (!parsed) {
                return RosterResult::err(parsed.error());
            }
            Combatant c = std::move(parsed).value();
            c.id = node["id"] ? node["id"].as<std::string>() : MakePartyId(c.name);
            roster.push_back(std::move(c));
        }

        std::map<std::string, int> nextIndex;
        for (std::size_t i = 0; i < opposition.value().size(); ++i) {
            const YAML::Node node = opposition.value()[i];
            const std::string where = "roster.opposition[" + std::to_string(i) + "]";
            auto parsed = parseCombatant(node, CombatSide::Monster, where);
            if (!parsed) {
                return RosterResult::err(parsed.error());
            }
            const int count = field<int>(node, "count", 1);
            if (count < 1) {
                return RosterResult::err(invalid(where, "count must be at least 1"));
            }
            for (int n = 0; n < count; ++n) {
                Combatant c = parsed.value();
                c.id = MakeMonsterId(c.name, nextIndex[c.name]++);
                roster.push_back(std::move(c));
            }
        }
    } catch (const YAML::Exception& e) {
        SKIRMISH_LOG_WARN(LogCategory::Config, std::string("bad roster entry: ") + e.what());
        return RosterResult::err(GameError(ErrorCode::ConfigTypeMismatch,
                                           std::string("bad roster entry: ") + e.what()));
    }
    return RosterResult::ok(std::move(roster));
}

}  // namespace skirmish::combat
