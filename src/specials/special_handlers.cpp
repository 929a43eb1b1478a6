/**
 * Tactics Battle Engine - Special Handlers Implementation
 *
 * Central registration point for all special and trait handlers.
 */

#include "specials/special_handlers.hpp"

namespace tactics {
namespace specials {

// ============================================================================
// SPECIAL INFO DATABASE
// ============================================================================

namespace {

// Static list of every known special/trait and where it is handled.
// Rows with hook "timeline" or "engine" are handled outside the registry
// (special_effects, hit calculation or the battle engine itself).
std::vector<SpecialInfo> g_special_info = {
    // Pre-attack
    {"ignoreBlock", "special", "pre_attack", "Damage bypasses block", true},
    {"piercing", "special", "pre_attack", "Damage bypasses block", true},
    {"clearAllBlock", "special", "pre_attack", "Both sides lose all block", true},
    {"doubleDamageIfSolo", "special", "pre_attack", "x2 damage if it is the only attack card this turn", true},
    {"agilityBonus", "special", "pre_attack", "+5 damage per agility", true},
    {"reloadSpray", "special", "pre_attack", "Clear jam before firing, jam afterwards", true},
    {"gyrusRoulette", "special", "pre_attack", "One or two shots per remaining energy", true},
    {"tempeteDechainee", "special", "pre_attack", "+3 hits per finesse, finesse consumed", true},
    {"cross", "trait", "pre_attack", "Cross bonus (damage_mult) when sharing sp with the opponent", true},
    {"followup", "trait", "pre_attack", "x1.5 damage after a chain card", true},
    {"finisher", "trait", "pre_attack", "x1.5 damage after a chain card, finesse after a followup", true},

    // Post-attack
    {"executeUnder10", "special", "post_attack", "Kill a target below 10% hp", true},
    {"violentMort", "special", "post_attack", "Execute a target at 30 hp or less, ignoring revive", true},
    {"vulnIfNoBlock", "special", "post_attack", "Vulnerable if the target had no block", true},
    {"doubleVulnIfNoBlock", "special", "post_attack", "Vulnerable x2 if the target had no block", true},
    {"repeatIfLast", "special", "post_attack", "Extra hit if this is the actor's last card", true},
    {"halfEnemyEther", "special", "post_attack", "Opponent ether gain halved this turn", true},
    {"emptyAfterUse", "special", "post_attack", "Gun jams after firing", true},
    {"stealBlock", "special", "post_attack", "Gain the block destroyed by the attack", true},
    {"critLoad", "special", "post_attack", "Reload on a critical hit", true},

    // Card play
    {"autoReload", "special", "card_play", "Loaded if a reload card was committed", true},
    {"manipulation", "special", "card_play", "Clear a jam and load, else fire a shot", true},
    {"spreadShot", "special", "card_play", "One shot per living enemy unit", true},
    {"evasiveShot", "special", "card_play", "Queue a bonus shot", true},
    {"executionSquad", "special", "card_play", "Loaded, jam immunity and four bonus shots", true},
    {"sharpenBlade", "special", "card_play", "+3 fencing damage for the battle", true},
    {"stance", "special", "card_play", "Bonus from the previous card, negative tokens removed", true},
    {"elRapide", "special", "card_play", "Agility +2 at the cost of finesse or pain", true},
    {"mentalFocus", "special", "card_play", "+1 max speed and +2 energy next turn", true},
    {"aoeAttack", "special", "card_play", "Damage every living unit", true},
    {"breach", "special", "card_play", "Choose one of three generated cards", true},
    {"createFencingCards3", "special", "card_play", "Three rounds of fencing card choices", true},
    {"parryPush", "special", "card_play", "Open a parry window", true},
    {"growingDefense", "special", "card_play", "Block grows along the timeline", true},
    {"cross", "trait", "card_play", "Cross bonus (gun_attack) queues bonus shots", true},
    {"stun", "trait", "card_play", "Remove opposing cards within stun range", true},
    {"warmup", "trait", "card_play", "+2 energy next turn", true},
    {"training", "trait", "card_play", "+1 strength", true},
    {"double_edge", "trait", "card_play", "1 self damage", true},
    {"vanish", "trait", "card_play", "Removed from the pool after use", true},

    // Timeline
    {"advanceTimeline", "special", "timeline", "Own future cards advance", true},
    {"pushEnemyTimeline", "special", "timeline", "Opponent future cards pushed on damage", true},
    {"beatEffect", "special", "timeline", "Advance 1, push 2 on damage", true},
    {"pushLastEnemyCard", "special", "timeline", "Opponent's last card pushed", true},
    {"advanceIfNextFencing", "special", "timeline", "Advance if the next own card is fencing", true},
    {"chain", "trait", "timeline", "Advance if the next own card is fencing", true},

    // Engine / hit calculation
    {"createAttackOnHit", "special", "engine", "Fleche: create attack cards on hit", true},
    {"destroyOnCollision", "special", "engine", "Destroy opposing cards at the same sp", true},
    {"guaranteedCrit", "special", "engine", "Every hit is critical", true},
    {"singleRoulette", "special", "engine", "Roulette check on the first hit only", true},
    {"crush", "trait", "engine", "Damage against block doubled", true},
    {"outcast", "trait", "engine", "Excluded from combo detection", true},

    // Not yet implemented
    {"knockback", "trait", "engine", "Push the opponent on hit", false},
};

bool g_registry_initialized = false;

} // anonymous namespace

// ============================================================================
// REGISTRATION
// ============================================================================

void register_all_specials(SpecialRegistry& registry) {
    if (g_registry_initialized) {
        return;  // Already registered
    }

    register_pre_attack_specials(registry);
    register_post_attack_specials(registry);
    register_card_play_specials(registry);

    g_registry_initialized = true;
}

std::vector<SpecialInfo> get_special_info() {
    return g_special_info;
}

bool is_special_implemented(const std::string& name) {
    for (const auto& info : g_special_info) {
        if (info.name == name && info.implemented) {
            return true;
        }
    }
    return false;
}

} // namespace specials
} // namespace tactics
