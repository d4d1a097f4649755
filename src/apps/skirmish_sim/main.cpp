/// @file main.cpp
/// @brief skirmish_sim: run one encounter from a YAML file to completion.
///
/// Usage: skirmish_sim [--config] <encounter.yaml> [--json] [--seed N]
///
/// Every combatant is driven by the random tactical provider. Events are
/// printed one per line, as text or (with --json) as JSON objects.

#include "skirmish/combat/dice_service.hpp"
#include "skirmish/combat/encounter_config.hpp"
#include "skirmish/combat/encounter_engine.hpp"
#include "skirmish/combat/event_formatter.hpp"
#include "skirmish/combat/event_serializer.hpp"
#include "skirmish/combat/tactical_provider.hpp"
#include "skirmish/foundation/config_manager.hpp"
#include "skirmish/foundation/game_logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct SimArgs {
    std::filesystem::path configPath;
    bool json = false;
    std::optional<uint32_t> seed;
};

std::optional<SimArgs> parseArgs(int argc, char* argv[]) {
    SimArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--json") {
            args.json = true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));  // NOLINT
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else if (!arg.starts_with("--") && args.configPath.empty()) {
            args.configPath = arg;
        } else {
            return std::nullopt;
        }
    }
    if (args.configPath.empty()) {
        if (const char* env = std::getenv("SKIRMISH_CONFIG_PATH")) {
            args.configPath = env;
        }
    }
    if (args.configPath.empty()) {
        return std::nullopt;
    }
    return args;
}

void printEvents(const std::vector<skirmish::combat::EncounterEvent>& events,
                 std::size_t from, bool json) {
    using skirmish::combat::EventFormatter;
    using skirmish::combat::EventSerializer;
    for (std::size_t i = from; i < events.size(); ++i) {
        std::cout << (json ? EventSerializer::ToJson(events[i])
                           : EventFormatter::Format(events[i]))
                  << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace skirmish;

    auto args = parseArgs(argc, argv);
    if (!args) {
        std::cerr << "usage: skirmish_sim [--config] <encounter.yaml> [--json] [--seed N]\n";
        return EXIT_FAILURE;
    }

    foundation::ConfigManager config;
    auto loadResult = config.load(args->configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto options = combat::LoadEncounterOptions(config);
    if (!options) {
        std::cerr << "Invalid encounter options: " << options.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto roster = combat::LoadRoster(config);
    if (!roster) {
        std::cerr << "Invalid roster: " << roster.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::unique_ptr<combat::DiceService> dice =
        args->seed ? std::make_unique<combat::RandomDiceService>(*args->seed)
                   : std::make_unique<combat::RandomDiceService>();

    auto created = combat::EncounterEngine::Create(std::move(roster).value(), *dice,
                                                   std::move(options).value());
    if (!created) {
        std::cerr << "Cannot start encounter: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto engine = std::move(created).value();

    auto provider = std::make_shared<combat::RandomTacticalProvider>(*dice);
    for (const auto& c : engine->Context().roster) {
        auto assigned = engine->SetProvider(c.id, provider);
        if (!assigned) {
            std::cerr << "Cannot assign provider: " << assigned.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto run = engine->StepUntilDecision();
    printEvents(engine->Events(), 0, args->json);
    if (!run) {
        std::cerr << "Encounter aborted: " << run.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto flushed = foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }

    auto outcome = engine->Outcome();
    if (!args->json) {
        std::cout << "Outcome: "
                  << (outcome ? combat::EncounterOutcomeName(*outcome) : "UNDECIDED")
                  << " after " << engine->Context().round << " rounds\n";
    }
    return outcome == combat::EncounterOutcome::Faulted ? EXIT_FAILURE : EXIT_SUCCESS;
}
