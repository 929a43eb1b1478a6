/**
 * Tactics Battle Engine - Console Simulator
 *
 * Plays a battle automatically and prints every step: random legal
 * player hands, the first offered card on every choice.
 *
 * Usage:
 *   tactics_console --cards data/cards.json [--config data/engine_config.json]
 *                   [--seed N] [--turns N] [--log]
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tactics_engine.hpp"

using namespace tactics;

// ============================================================================
// OPTIONS
// ============================================================================

struct ConsoleOptions {
    std::string cards_path = "data/cards.json";
    std::string config_path;
    uint32_t seed = 0;
    bool has_seed = false;
    int turns = 10;
    bool log = false;
};

void print_usage() {
    std::cout << "Usage: tactics_console [--cards <path>] [--config <path>] "
              << "[--seed <n>] [--turns <n>] [--log]" << std::endl;
}

bool parse_options(int argc, char** argv, ConsoleOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--cards") {
            if (!next_value(options.cards_path)) return false;
        } else if (arg == "--config") {
            if (!next_value(options.config_path)) return false;
        } else if (arg == "--seed") {
            if (!next_value(value)) return false;
            try {
                options.seed = static_cast<uint32_t>(std::stoul(value));
                options.has_seed = true;
            } catch (const std::exception&) {
                std::cerr << "Invalid seed: " << value << std::endl;
                return false;
            }
        } else if (arg == "--turns") {
            if (!next_value(value)) return false;
            try {
                options.turns = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid turn count: " << value << std::endl;
                return false;
            }
        } else if (arg == "--log") {
            options.log = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return false;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage();
            return false;
        }
    }
    return true;
}

// ============================================================================
// CONSOLE SINK
// ============================================================================

std::string hp_line(const ActorState& actor) {
    std::string line = actor.name + " [HP:" + std::to_string(actor.hp) + "/" +
                       std::to_string(actor.max_hp) + " Block:" + std::to_string(actor.block) + "]";
    for (const auto& unit : actor.units) {
        line += " " + unit.name + ":" + std::to_string(unit.hp);
    }
    return line;
}

/**
 * ConsoleSink - Prints every step as it resolves.
 */
class ConsoleSink : public PresentationSink {
public:
    void on_step(const BattleState& state, const StepReport& report) override {
        if (!report.item) {
            for (const auto& event : report.events) {
                std::cout << "       " << event.message << std::endl;
            }
            return;
        }
        const QueueItem& item = *report.item;
        std::cout << "  [sp " << item.sp << "] "
                  << (item.actor == Actor::PLAYER ? "P " : "E ")
                  << item.card.name() << (item.card.is_ghost ? "*" : "") << std::endl;
        for (const auto& event : report.events) {
            std::cout << "       " << event.message << std::endl;
        }
        if (report.resolved) {
            std::cout << "       " << hp_line(state.player) << " | " << hp_line(state.enemy)
                      << std::endl;
        }
    }

    void on_turn_end(const BattleState& state, const TurnEndReport& report) override {
        std::cout << "+----------------------------------------------------------------+" << std::endl;
        std::cout << "|  TURN " << report.turn << " END" << std::endl;
        for (const auto& line : report.logs) {
            std::cout << "|    " << line << std::endl;
        }
        std::cout << "|  Ether: player " << state.player.ether_pts
                  << " | enemy " << state.enemy.ether_pts << std::endl;
        std::cout << "+----------------------------------------------------------------+" << std::endl;
    }

    void on_choice_required(const BattleState&, const PendingChoice& choice) override {
        std::cout << "       Choice (" << to_string(choice.kind) << "):";
        for (const auto& id : choice.offers()) {
            std::cout << " " << id;
        }
        std::cout << std::endl;
    }
};

// ============================================================================
// SIMULATION
// ============================================================================

/**
 * Random legal hand: shuffled player pool, added greedily while the
 * energy, speed and count limits hold.
 */
std::vector<CardDefID> pick_hand(const BattleEngine& engine, const BattleState& state, Rng& rng) {
    const CardCatalog& catalog = engine.get_card_catalog();
    std::vector<CardDefID> pool;
    for (const auto& id : catalog.player_card_ids()) {
        if (!state.is_vanished(id)) {
            pool.push_back(id);
        }
    }
    rng.shuffle(pool);

    const int energy = engine.turn_energy(state, Actor::PLAYER);
    const int max_speed = engine.turn_max_speed(state, Actor::PLAYER);
    const int max_cards = engine.get_config().max_submit_cards;

    std::vector<CardDefID> hand;
    int cost = 0;
    int speed = 0;
    for (const auto& id : pool) {
        if (static_cast<int>(hand.size()) >= max_cards) break;
        const CardDef* def = catalog.get_card(id);
        if (!def || !def->required_tokens.empty()) continue;
        if (cost + def->action_cost > energy || speed + def->speed_cost > max_speed) continue;
        hand.push_back(id);
        cost += def->action_cost;
        speed += def->speed_cost;
    }
    return hand;
}

ActorState make_player() {
    ActorState player(Actor::PLAYER, "Player", 60);
    return player;
}

ActorState make_enemy(const CardCatalog& catalog) {
    ActorState enemy(Actor::ENEMY, "Marauders", 0);
    enemy.enemy_kind = "marauder";
    enemy.deck = catalog.enemy_card_ids();
    enemy.min_cards = 1;
    enemy.max_cards = 3;
    enemy.ether_pts = 150;

    Unit left;
    left.unit_id = 1;
    left.name = "Marauder A";
    left.hp = left.max_hp = 25;
    Unit right;
    right.unit_id = 2;
    right.name = "Marauder B";
    right.hp = right.max_hp = 20;
    enemy.units = {left, right};
    return enemy;
}

int main(int argc, char** argv) {
    ConsoleOptions options;
    if (!parse_options(argc, argv, options)) {
        return 1;
    }

    std::cout << "Tactics Battle Engine v" << get_version() << std::endl;

    CardCatalog catalog;
    if (!catalog.load_from_json(options.cards_path)) {
        std::cerr << "Failed to load cards from " << options.cards_path << std::endl;
        return 1;
    }

    EngineConfig config;
    if (!options.config_path.empty() && !config.load_from_json(options.config_path)) {
        std::cerr << "Failed to load config from " << options.config_path << std::endl;
        return 1;
    }

    MersenneRng rng = options.has_seed ? MersenneRng(options.seed) : MersenneRng();
    BattleEngine engine(catalog, config, rng);

    ConsoleSink console_sink;
    engine.add_sink(&console_sink);

    std::unique_ptr<BattleLogger> logger;
    if (options.log || config.logging_enabled) {
        logger = std::make_unique<BattleLogger>(config.log_dir);
        engine.add_sink(logger.get());
    }

    BattleState state = engine.create_battle(make_player(), make_enemy(catalog));

    for (int t = 0; t < options.turns && !state.is_over(); ++t) {
        std::cout << "\n+================================================================+" << std::endl;
        std::cout << "|  TURN " << state.turn << " | " << hp_line(state.player) << std::endl;
        std::cout << "|         | " << hp_line(state.enemy) << std::endl;
        std::cout << "+================================================================+" << std::endl;

        std::vector<CardDefID> hand = pick_hand(engine, state, rng);
        std::cout << "Hand:";
        for (const auto& id : hand) {
            std::cout << " " << id;
        }
        std::cout << std::endl;

        if (!engine.commit_turn(state, hand)) {
            std::cerr << "Hand rejected, committing an empty hand" << std::endl;
            if (!engine.commit_turn(state, {})) {
                return 1;
            }
        }

        while (state.phase == BattlePhase::RESOLVE || state.phase == BattlePhase::AWAITING_CHOICE) {
            engine.run_until_blocked(state);
            if (state.awaiting_choice() && state.pending_choice) {
                const CardDefID pick = state.pending_choice->offers().front();
                std::cout << "       -> picking " << pick << std::endl;
                if (!engine.resume_with_choice(state, pick)) {
                    return 1;
                }
            }
        }

        engine.finish_turn(state);
    }

    std::cout << "\nResult: " << to_string(state.result) << " after "
              << state.turn << " turn(s)" << std::endl;
    if (logger && !state.is_over()) {
        logger->log_battle_end(state);
    }
    return 0;
}
