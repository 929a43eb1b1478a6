/**
 * Tactics Battle Engine - Token Effects
 *
 * Read-side token math: how held tokens modify card values, incoming
 * damage, healing, energy and crit chance. These functions never mutate
 * the store; they report which usage tokens should be consumed and the
 * caller applies the consumption through consume_tokens().
 */

#pragma once

#include "token_store.hpp"
#include "rng.hpp"

namespace tactics {

/**
 * Usage token slated for consumption.
 */
struct ConsumedToken {
    TokenID id;
    TokenLifetime lifetime = TokenLifetime::USAGE;
};

struct CardValueModifier {
    int value = 0;
    std::vector<ConsumedToken> consumed;
};

struct DamageTokenOutcome {
    int final_damage = 0;
    bool dodged = false;
    int reflected = 0;
    std::vector<ConsumedToken> consumed;
    std::vector<std::string> logs;
};

struct HealTokenOutcome {
    int healing = 0;
    std::vector<ConsumedToken> consumed;
    std::vector<std::string> logs;
};

struct ReviveOutcome {
    bool revived = false;
    int new_hp = 0;
    std::vector<std::string> logs;
};

// ============================================================================
// OUTGOING VALUES
// ============================================================================

/**
 * Apply attack boost and penalty tokens to a card's damage.
 *
 * Turn boosts add value x stacks, one usage boost adds its value once and
 * is consumed. Result is round(damage * (1 + boost)), then penalties
 * scale it by (1 - penalty) with a floor of 0.
 */
CardValueModifier apply_tokens_to_damage(int damage, const TokenStore& tokens);

/**
 * Same rules as apply_tokens_to_damage() for block, with usage penalty
 * tokens (shaken) consumed as well.
 */
CardValueModifier apply_tokens_to_block(int block, const TokenStore& tokens);

/**
 * Max energy adjusted by ENERGY_BOOST / ENERGY_PENALTY tokens, floored at 0.
 */
int apply_tokens_on_energy(int base_energy, const TokenStore& tokens);

int total_strength(int base_strength, const TokenStore& tokens);
int total_agility(int base_agility, const TokenStore& tokens);

/**
 * base + 5% per crit_boost stack.
 */
double crit_chance(const TokenStore& tokens, double base_chance);

// ============================================================================
// INCOMING VALUES
// ============================================================================

/**
 * Defender-side processing of one hit.
 *
 * 1. Dodge roll against the first DODGE token (usage dodge is consumed
 *    whether or not it succeeds)
 * 2. DAMAGE_TAKEN multiplier (turn tokens by stacks, usage tokens once
 *    and consumed), rounded
 * 3. COUNTER token reflects value + defender strength and is consumed
 */
DamageTokenOutcome apply_tokens_on_damage(int damage,
                                          const TokenStore& defender_tokens,
                                          int defender_strength,
                                          Rng& rng);

/**
 * Lifesteal: heal round(dealt x value), consuming the token.
 */
HealTokenOutcome apply_tokens_on_heal(int damage_dealt, const TokenStore& tokens);

/**
 * Revive check on lethal damage. Does not consume; callers remove the
 * revive token when they apply the new hp.
 */
ReviveOutcome check_revive(int max_hp, const TokenStore& tokens);

/**
 * Damage a burning holder takes each time it plays a card.
 */
int burn_damage(const TokenStore& tokens);

/**
 * Remove one stack per consumed entry.
 */
TokenResult consume_tokens(TokenStore& tokens, const std::vector<ConsumedToken>& consumed);

} // namespace tactics
