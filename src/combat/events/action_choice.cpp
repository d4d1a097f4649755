/// @file action_choice.cpp
/// @brief ActionChoice label rendering.

#include "skirmish/combat/events.hpp"

namespace skirmish::combat {

namespace {

std::string arg(const std::map<std::string, std::string>& args,
                const std::string& key, const std::string& fallbackKey) {
    if (auto it = args.find(key); it != args.end()) {
        return it->second;
    }
    if (auto it = args.find(fallbackKey); it != args.end()) {
        return it->second;
    }
    return "???";
}

std::string optionalArg(const std::map<std::string, std::string>& args,
                        const std::string& key) {
    auto it = args.find(key);
    return it == args.end() ? std::string() : it->second;
}

}  // namespace

std::string ActionChoice::Label() const {
    if (uiKey == "attack_target") {
        return "Attack " + arg(uiArgs, "target_name", "target_id");
    }
    if (uiKey == "ranged_attack_target") {
        return "Ranged: " + arg(uiArgs, "target_name", "target_id");
    }
    if (uiKey == "cast_spell") {
        std::string spell = arg(uiArgs, "spell_name", "spell_id");
        std::string target = optionalArg(uiArgs, "target_name");
        return target.empty() ? "Cast " + spell : "Cast " + spell + " on " + target;
    }
    if (uiKey == "use_item") {
        std::string item = arg(uiArgs, "item_name", "item_name");
        std::string target = optionalArg(uiArgs, "target_name");
        return target.empty() ? "Use " + item : "Throw " + item + " at " + target;
    }
    if (uiKey == "turn_undead") {
        return "Turn undead";
    }
    if (uiKey == "flee") {
        return "Flee";
    }
    return uiKey;
}

}  // namespace skirmish::combat
