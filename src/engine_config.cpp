/**
 * Tactics Battle Engine - Engine Configuration Implementation
 */

#include "engine_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tactics {

namespace {

AiModeWeights parse_weights(const json& j, const AiModeWeights& fallback) {
    AiModeWeights w = fallback;
    if (!j.is_object()) {
        return w;
    }
    w.aggro = std::max(0.0, j.value("aggro", w.aggro));
    w.turtle = std::max(0.0, j.value("turtle", w.turtle));
    w.balanced = std::max(0.0, j.value("balanced", w.balanced));
    return w;
}

} // anonymous namespace

bool EngineConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[EngineConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_from_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[EngineConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

bool EngineConfig::load_from_document(const json& data) {
    if (!data.is_object()) {
        std::cerr << "[EngineConfig] Expected a JSON object" << std::endl;
        return false;
    }

    try {
        max_speed = data.value("maxSpeed", max_speed);
        base_player_energy = data.value("basePlayerEnergy", base_player_energy);
        max_submit_cards = data.value("maxSubmitCards", max_submit_cards);

        stun_range = data.value("stunRange", stun_range);
        parry_range = data.value("parryRange", parry_range);
        parry_push = data.value("parryPush", parry_push);
        fleche_chain_cap = data.value("flecheChainCap", fleche_chain_cap);
        creation_choice_size = data.value("creationChoiceSize", creation_choice_size);
        growing_defense_rate = data.value("growingDefenseRate", growing_defense_rate);

        jam_chance_per_stack = data.value("jamChancePerStack", jam_chance_per_stack);
        base_crit_chance = data.value("baseCritChance", base_crit_chance);
        crit_multiplier = data.value("critMultiplier", crit_multiplier);

        enemy_max_cards = data.value("enemyMaxCards", enemy_max_cards);

        if (data.contains("aiModeWeights")) {
            default_mode_weights = parse_weights(data["aiModeWeights"], default_mode_weights);
        }

        if (data.contains("enemyModeWeights") && data["enemyModeWeights"].is_object()) {
            for (auto it = data["enemyModeWeights"].begin(); it != data["enemyModeWeights"].end(); ++it) {
                enemy_mode_weights[it.key()] = parse_weights(it.value(), default_mode_weights);
            }
        }

        if (data.contains("logging") && data["logging"].is_object()) {
            const auto& logging = data["logging"];
            logging_enabled = logging.value("enabled", logging_enabled);
            log_dir = logging.value("dir", log_dir);
        }
    } catch (const json::type_error& e) {
        std::cerr << "[EngineConfig] Wrong value type: " << e.what() << std::endl;
        return false;
    }

    std::cout << "[EngineConfig] Loaded configuration" << std::endl;
    return true;
}

const AiModeWeights& EngineConfig::weights_for(const std::string& enemy_kind) const {
    auto it = enemy_mode_weights.find(enemy_kind);
    if (it != enemy_mode_weights.end()) {
        return it->second;
    }
    return default_mode_weights;
}

} // namespace tactics
