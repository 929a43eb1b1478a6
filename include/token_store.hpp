/**
 * Tactics Battle Engine - Token Store
 *
 * Per-actor (and per-unit) ledger of buff/debuff tokens.
 *
 * Tokens live in three lifetime buckets:
 * - usage: consumed by count when referenced
 * - turn: cleared at turn end, or by timeline position when granted mid-turn
 * - permanent: never auto-expire
 *
 * All mutation goes through this API. Every mutation returns the log
 * lines describing what happened so callers can forward them as events.
 */

#pragma once

#include "types.hpp"
#include <optional>

namespace tactics {

// ============================================================================
// TOKEN DEFINITIONS
// ============================================================================

struct TokenEffect {
    TokenEffectType type = TokenEffectType::NONE;
    double value = 0.0;
};

/**
 * Static token definition.
 *
 * max_stacks of 0 means uncapped.
 */
struct TokenDef {
    TokenID id;
    std::string name;
    TokenLifetime lifetime = TokenLifetime::USAGE;
    TokenCategory category = TokenCategory::NEUTRAL;
    TokenEffect effect;
    int max_stacks = 0;
};

/**
 * Look up a token definition. Returns nullptr for unknown ids.
 */
const TokenDef* find_token_def(const TokenID& id);

/**
 * Token cancelled by `id` when it is added (e.g., "attack" -> "dullness").
 * Returns nullptr when the token has no opposite.
 */
const TokenID* cancelling_token(const TokenID& id);

/**
 * All defined token ids (sorted).
 */
std::vector<TokenID> all_token_ids();

// ============================================================================
// TOKEN INSTANCES
// ============================================================================

struct TokenInstance {
    TokenID id;
    int stacks = 0;
    std::optional<GrantedAt> granted_at;   // Turn tokens only
};

/**
 * Outcome of a store mutation.
 */
struct TokenResult {
    bool changed = false;
    std::vector<std::string> logs;

    void append(const TokenResult& other) {
        changed = changed || other.changed;
        logs.insert(logs.end(), other.logs.begin(), other.logs.end());
    }
};

// ============================================================================
// TOKEN STORE
// ============================================================================

class TokenStore {
public:
    TokenStore() = default;

    /**
     * Add stacks of a token.
     *
     * Rules applied in order:
     * 1. 0 stacks or an unknown id is a no-op
     * 2. Negative tokens are blocked by one immunity stack
     * 3. Opposite tokens cancel first, the remainder stacks
     * 4. gun_jam never stacks, roulette never grows while jammed
     * 5. Turn tokens record grantedAt
     *
     * @param id Token id
     * @param stacks Stacks to add
     * @param granted_at Timeline point for turn tokens
     */
    TokenResult add(const TokenID& id, int stacks = 1,
                    std::optional<GrantedAt> granted_at = std::nullopt);

    /**
     * Remove stacks from a specific lifetime bucket. Clamps to zero and
     * drops the entry when it reaches zero.
     */
    TokenResult remove(const TokenID& id, TokenLifetime lifetime, int stacks = 1);

    /**
     * Remove stacks from whichever bucket holds the token.
     */
    TokenResult remove(const TokenID& id, int stacks = 1);

    /**
     * Overwrite the stack count. n <= 0 removes the entry.
     */
    TokenResult set_stacks(const TokenID& id, TokenLifetime lifetime, int n);

    /**
     * Turn end: drop turn tokens that carry no grantedAt. Tokens granted
     * mid-turn survive until expire_turn_tokens_by_timeline() reaches
     * their grant position in a later turn.
     */
    TokenResult clear_turn_tokens();

    /**
     * Drop turn tokens whose grant point has been passed again
     * (grantedAt.turn < turn and sp >= grantedAt.sp).
     */
    TokenResult expire_turn_tokens_by_timeline(int turn, int sp);

    /**
     * Remove every token (all buckets).
     */
    void clear();

    // ========================================================================
    // QUERIES
    // ========================================================================

    int stacks(const TokenID& id) const;
    bool has(const TokenID& id) const { return stacks(id) > 0; }

    const std::vector<TokenInstance>& tokens(TokenLifetime lifetime) const;

    /**
     * All instances, ordered permanent, usage, turn.
     */
    std::vector<TokenInstance> all() const;

    bool empty() const {
        return usage_.empty() && turn_.empty() && permanent_.empty();
    }

    /**
     * Compact "id x stacks" listing for logs.
     */
    std::string describe() const;

private:
    std::vector<TokenInstance> usage_;
    std::vector<TokenInstance> turn_;
    std::vector<TokenInstance> permanent_;

    std::vector<TokenInstance>& bucket(TokenLifetime lifetime);
    const std::vector<TokenInstance>& bucket(TokenLifetime lifetime) const;

    // Returns the number of stacks actually cancelled
    int cancel_opposite(const TokenID& opposite_id, int stacks);
};

} // namespace tactics
