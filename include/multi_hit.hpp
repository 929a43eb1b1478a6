/**
 * Tactics Battle Engine - Multi-Hit Resolver
 *
 * Sequential hit loop for attack cards: per-hit crit rolls, the gun
 * roulette/jam check and a per-hit callback for presentation.
 */

#pragma once

#include "hit_calculation.hpp"
#include <functional>

namespace tactics {

// ============================================================================
// ROULETTE
// ============================================================================

struct RouletteResult {
    bool checked = false;      // False for non-gun cards and skipped hits
    bool jammed = false;
    bool suppressed = false;   // Jam rolled but jam_immunity held
    double jam_chance = 0.0;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

/**
 * Roulette check after a gun attack hit.
 *
 * Jam chance is roulette stacks x chance_per_stack, read before this
 * hit's stack is added. On a jam gun_jam is granted and roulette resets
 * to 0. jam_immunity turns a jam into a no-op (no stack added). Any other
 * outcome adds one roulette stack. singleRoulette limits the check to the
 * first hit.
 */
RouletteResult process_per_hit_roulette(TokenStore& attacker_tokens,
                                        const CardInstance& card,
                                        Actor actor,
                                        int hit_index,
                                        int total_hits,
                                        Rng& rng,
                                        double chance_per_stack = JAM_CHANCE_PER_STACK,
                                        std::optional<GrantedAt> granted_at = std::nullopt);

// ============================================================================
// MULTI-HIT RESOLVER
// ============================================================================

/**
 * Called after each resolved hit with (hit, hit_index, total_hits).
 */
using HitCallback = std::function<void(const HitResult&, int, int)>;

struct MultiHitResult {
    int total_hits = 0;
    int hits_completed = 0;
    int dealt = 0;
    int taken = 0;
    int block_destroyed = 0;
    int critical_hits = 0;
    bool jammed = false;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

/**
 * MultiHitResolver - Runs an attack's hits in order.
 *
 * The card passed in is the pre-processed copy (pre-attack specials and
 * attacker token modifiers already applied); every hit uses it as is.
 */
class MultiHitResolver {
public:
    MultiHitResolver(Rng& rng, HitOptions options,
                     double base_crit_chance = BASE_CRIT_CHANCE,
                     double jam_chance_per_stack = JAM_CHANCE_PER_STACK);

    /**
     * Invoke the callback after every hit (before the roulette check).
     */
    void set_hit_callback(HitCallback callback) { on_hit_ = std::move(callback); }

    /**
     * Set the grant point recorded on jam tokens.
     */
    void set_granted_at(GrantedAt at) { granted_at_ = at; }

    /**
     * Resolve `hits` hits (at least 1). A jam cancels the remaining hits.
     */
    MultiHitResult resolve(ActorState& attacker,
                           ActorState& defender,
                           const CardInstance& card,
                           Actor actor,
                           int hits);

private:
    Rng& rng_;
    HitOptions options_;
    double base_crit_chance_;
    double jam_chance_per_stack_;
    std::optional<GrantedAt> granted_at_;
    HitCallback on_hit_;
};

} // namespace tactics
