/**
 * Tactics Battle Engine - Special Handlers
 *
 * Central registration point for every card special and trait handler.
 * Provides a function to register all known handlers at startup and a
 * metadata table describing each one.
 */

#pragma once

#include "../special_registry.hpp"
#include "special_effects.hpp"
#include <string>
#include <vector>

namespace tactics {
namespace specials {

// ============================================================================
// SPECIAL INFO STRUCTURE
// ============================================================================

/**
 * SpecialInfo - Metadata about a special or trait.
 */
struct SpecialInfo {
    std::string name;
    std::string kind;          // "special" or "trait"
    std::string hook;          // "pre_attack", "post_attack", "card_play", "timeline", "engine"
    std::string description;
    bool implemented = false;
};

// ============================================================================
// REGISTRATION FUNCTIONS
// ============================================================================

/**
 * Register all implemented special and trait handlers.
 *
 * Call this once at startup to populate the SpecialRegistry.
 * Repeated calls are no-ops.
 */
void register_all_specials(SpecialRegistry& registry);

/**
 * Get the list of all known specials and traits.
 */
std::vector<SpecialInfo> get_special_info();

/**
 * Check if a special or trait name is implemented.
 */
bool is_special_implemented(const std::string& name);

// ============================================================================
// PER-HOOK REGISTRATIONS
// ============================================================================

void register_pre_attack_specials(SpecialRegistry& registry);
void register_post_attack_specials(SpecialRegistry& registry);
void register_card_play_specials(SpecialRegistry& registry);

} // namespace specials
} // namespace tactics
