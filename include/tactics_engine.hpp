/**
 * Tactics Battle Engine - C++ Implementation
 *
 * Timeline-based tactical combat: both sides commit timed cards, the
 * engine merges them into one queue and resolves it step by step.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "rng.hpp"

// Data structures
#include "card_catalog.hpp"
#include "card_instance.hpp"
#include "token_store.hpp"
#include "actor_state.hpp"
#include "timeline.hpp"
#include "battle_state.hpp"

// Rules
#include "engine_config.hpp"
#include "token_effects.hpp"
#include "special_registry.hpp"
#include "specials/special_handlers.hpp"
#include "hit_calculation.hpp"
#include "multi_hit.hpp"
#include "action_resolver.hpp"
#include "enemy_ai.hpp"
#include "ether_economy.hpp"

// Engine
#include "presentation_sink.hpp"
#include "battle_logger.hpp"
#include "battle_engine.hpp"

namespace tactics {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace tactics
