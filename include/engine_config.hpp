/**
 * Tactics Battle Engine - Engine Configuration
 *
 * Tunable rule constants. Defaults match the built-in constants; a JSON
 * file may override any subset of them.
 */

#pragma once

#include "types.hpp"
#include <map>
#include <nlohmann/json_fwd.hpp>

namespace tactics {

/**
 * Relative weights for picking the enemy planning mode.
 */
struct AiModeWeights {
    double aggro = 1.0;
    double turtle = 1.0;
    double balanced = 1.0;

    double total() const { return aggro + turtle + balanced; }
};

struct EngineConfig {
    // Timeline
    int max_speed = MAX_SPEED;
    int base_player_energy = BASE_PLAYER_ENERGY;
    int max_submit_cards = MAX_SUBMIT_CARDS;

    // Special effects
    int stun_range = STUN_RANGE;
    int parry_range = DEFAULT_PARRY_RANGE;
    int parry_push = DEFAULT_PARRY_PUSH;
    int fleche_chain_cap = MAX_FLECHE_CHAIN;
    int creation_choice_size = CREATION_CHOICE_SIZE;
    int growing_defense_rate = 1;

    // Gun and crit
    double jam_chance_per_stack = JAM_CHANCE_PER_STACK;
    double base_crit_chance = BASE_CRIT_CHANCE;
    double crit_multiplier = CRIT_MULTIPLIER;

    // Enemy planner
    int enemy_max_cards = 3;
    AiModeWeights default_mode_weights;
    std::map<std::string, AiModeWeights> enemy_mode_weights;   // enemy_kind -> weights

    // Logging
    bool logging_enabled = false;
    std::string log_dir = "logs";

    /**
     * Load overrides from a JSON file. Every key is optional and unknown
     * keys are ignored.
     *
     * @return false if the file cannot be opened or parsed
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Apply overrides from an already parsed document.
     */
    bool load_from_document(const nlohmann::json& data);

    /**
     * Weights for an enemy kind, falling back to the defaults.
     */
    const AiModeWeights& weights_for(const std::string& enemy_kind) const;
};

} // namespace tactics
