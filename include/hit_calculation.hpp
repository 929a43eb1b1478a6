/**
 * Tactics Battle Engine - Hit Calculation
 *
 * Resolves a single hit of an attack card: base damage, crit, defender
 * token effects (dodge, damage taken, counter), block absorption and the
 * counter-damage returned to the attacker.
 */

#pragma once

#include "actor_state.hpp"
#include "card_instance.hpp"
#include "rng.hpp"

namespace tactics {

/**
 * Per-action settings shared by every hit.
 */
struct HitOptions {
    int fencing_damage_bonus = 0;
    double crit_multiplier = CRIT_MULTIPLIER;

    // Token store read for dodge/vulnerable/counter. Points at the
    // targeted unit's store for composite enemies, nullptr for the
    // defender's own store.
    TokenStore* defender_tokens = nullptr;
};

struct HitResult {
    int damage = 0;            // Dealt to hp after block
    int damage_taken = 0;      // Counter damage the attacker took
    int block_destroyed = 0;
    bool is_critical = false;
    bool dodged = false;
    bool fully_blocked = false;

    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

/**
 * Roll a critical hit.
 *
 * guaranteedCrit always succeeds without consuming randomness; otherwise
 * the chance is base + 5% per crit_boost stack.
 */
bool roll_critical(const CardInstance& card,
                   const TokenStore& attacker_tokens,
                   double base_chance,
                   Rng& rng);

/**
 * Resolve one hit.
 *
 * Damage is card damage + fencing bonus (fencing cards only) + strength,
 * multiplied on a crit. Block absorbs it unless the card ignores block;
 * crush doubles the damage dealt against block. Counter damage
 * (defender counter + reflected) is applied to the attacker only when
 * the hit reached hp.
 *
 * @param attacker Acting side (takes counter damage)
 * @param defender Receiving side (block and hp are updated)
 * @param card Card after pre-attack and token modifiers
 * @param actor Acting side, for messages
 * @param is_critical Result of roll_critical() for this hit
 */
HitResult calculate_single_hit(ActorState& attacker,
                               ActorState& defender,
                               const CardInstance& card,
                               Actor actor,
                               bool is_critical,
                               const HitOptions& options,
                               Rng& rng);

} // namespace tactics
