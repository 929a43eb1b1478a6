/**
 * Tactics Battle Engine - Special Registry
 *
 * Central registry for card specials and traits.
 *
 * Architecture:
 * - Handlers are registered per hook point (pre-attack, post-attack,
 *   card-play) under a "special:<name>" or "trait:<name>" key
 * - The resolver walks a card's specials and traits and invokes every
 *   handler registered for the current hook point
 * - Cards whose specials have no handler resolve with base behaviour
 *
 * Example usage:
 *   registry.register_pre_attack("special", "ignoreBlock", handler);
 *   registry.apply_pre_attack(ctx);
 */

#pragma once

#include "actor_state.hpp"
#include "card_instance.hpp"
#include "rng.hpp"
#include <functional>
#include <unordered_map>

namespace tactics {

// Forward declarations
class TimelineScheduler;
class CardCatalog;

// ============================================================================
// RESOLVE CONTEXT
// ============================================================================

/**
 * Read-only view of the battle handed to the resolver for one queue item.
 */
struct ResolveContext {
    int turn = 1;
    int sp = 0;

    const TimelineScheduler* scheduler = nullptr;
    const CardCatalog* catalog = nullptr;

    int player_energy_left = 0;
    int enemy_energy_left = 0;

    std::vector<CardCategory> played_categories;   // Acting side, this turn
    const CardInstance* previous_own_card = nullptr;
    bool is_last_own_card = false;
    bool has_crossed = false;
    int attack_cards_this_turn = 0;                // Acting side's committed attack cards

    int fencing_damage_bonus = 0;
    std::optional<UnitID> selected_target;
    std::vector<CardDefID> committed_hand;         // Player's committed card ids

    double base_crit_chance = BASE_CRIT_CHANCE;
    double crit_multiplier = CRIT_MULTIPLIER;
    double jam_chance_per_stack = JAM_CHANCE_PER_STACK;
    int fleche_chain_cap = MAX_FLECHE_CHAIN;

    GrantedAt granted_at() const { return GrantedAt{turn, sp}; }
};

// ============================================================================
// SPECIAL OUTCOME
// ============================================================================

/**
 * Effects banked for the acting side's next turn.
 */
struct NextTurnEffects {
    int bonus_energy = 0;
    int max_speed_bonus = 0;

    void merge(const NextTurnEffects& other) {
        bonus_energy += other.bonus_energy;
        max_speed_bonus += other.max_speed_bonus;
    }
};

/**
 * Accumulated output of every handler run for one action.
 *
 * Flags request work the engine performs against the timeline (parry
 * windows, stun, choices); handlers never touch the queue directly.
 */
struct SpecialOutcome {
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;

    int extra_hits = 0;
    std::vector<CardInstance> bonus_cards;   // Inserted at sp + 1, ids assigned by the engine
    NextTurnEffects next_turn;
    int fencing_damage_bonus = 0;            // Battle-long delta

    bool trigger_breach = false;
    bool trigger_fencing_creation = false;
    bool open_parry_window = false;
    bool start_growing_defense = false;
    bool stun = false;
    bool vanish = false;

    void add_event(EventType type, Actor actor, int amount,
                   const std::string& card, const std::string& message) {
        events.push_back(BattleEvent{type, actor, amount, card, message});
        logs.push_back(message);
    }

    void add_logs(const std::vector<std::string>& lines) {
        logs.insert(logs.end(), lines.begin(), lines.end());
    }

    void merge(const SpecialOutcome& other);
};

// ============================================================================
// HANDLER CONTEXT
// ============================================================================

/**
 * Mutable state a handler may touch.
 *
 * For composite enemies target_unit points at the unit that took the
 * hit; target helpers then read and write that unit instead of the
 * aggregate defender.
 */
struct SpecialContext {
    ActorState& attacker;
    ActorState& defender;
    CardInstance& card;
    Actor actor;
    const ResolveContext& resolve;
    Rng& rng;
    SpecialOutcome& outcome;

    Unit* target_unit = nullptr;

    // Post-attack only
    int damage_dealt = 0;
    int block_destroyed = 0;
    bool is_critical = false;
    bool target_had_block = false;

    SpecialContext(ActorState& attacker_, ActorState& defender_, CardInstance& card_,
                   Actor actor_, const ResolveContext& resolve_, Rng& rng_,
                   SpecialOutcome& outcome_)
        : attacker(attacker_)
        , defender(defender_)
        , card(card_)
        , actor(actor_)
        , resolve(resolve_)
        , rng(rng_)
        , outcome(outcome_)
    {}

    TokenStore& target_tokens() { return target_unit ? target_unit->tokens : defender.tokens; }
    int& target_hp() { return target_unit ? target_unit->hp : defender.hp; }
    int target_max_hp() const { return target_unit ? target_unit->max_hp : defender.max_hp; }

    /**
     * Grant a token and forward the store's log lines.
     */
    void grant(TokenStore& store, const TokenID& id, int stacks = 1);
};

using SpecialHandler = std::function<void(SpecialContext&)>;

// ============================================================================
// SPECIAL REGISTRY
// ============================================================================

/**
 * SpecialRegistry - Handler lookup by hook point.
 *
 * Not thread-safe for registration (call before the first battle).
 */
class SpecialRegistry {
public:
    SpecialRegistry() = default;
    ~SpecialRegistry() = default;

    // ========================================================================
    // REGISTRATION
    // ========================================================================

    /**
     * @param kind "special" or "trait"
     * @param name Special or trait name as it appears on the card
     */
    void register_pre_attack(const std::string& kind, const std::string& name,
                             SpecialHandler handler);
    void register_post_attack(const std::string& kind, const std::string& name,
                              SpecialHandler handler);
    void register_card_play(const std::string& kind, const std::string& name,
                            SpecialHandler handler);

    // ========================================================================
    // LOOKUP
    // ========================================================================

    bool has_pre_attack(const std::string& kind, const std::string& name) const;
    bool has_post_attack(const std::string& kind, const std::string& name) const;
    bool has_card_play(const std::string& kind, const std::string& name) const;

    // ========================================================================
    // INVOCATION
    // ========================================================================

    /**
     * Run every pre-attack handler matching the card. Handlers may
     * rewrite card.def.damage and card.ignore_block.
     *
     * @return Number of handlers invoked
     */
    int apply_pre_attack(SpecialContext& ctx) const;

    /**
     * Run every post-attack handler matching the card.
     */
    int apply_post_attack(SpecialContext& ctx) const;

    /**
     * Run every card-play handler matching the card.
     */
    int apply_card_play(SpecialContext& ctx) const;

    // ========================================================================
    // STATISTICS
    // ========================================================================

    size_t pre_attack_count() const { return pre_attack_.size(); }
    size_t post_attack_count() const { return post_attack_.size(); }
    size_t card_play_count() const { return card_play_.size(); }

private:
    using HandlerMap = std::unordered_map<std::string, SpecialHandler>;

    // Key: kind + ":" + name
    HandlerMap pre_attack_;
    HandlerMap post_attack_;
    HandlerMap card_play_;

    static std::string make_key(const std::string& kind, const std::string& name) {
        return kind + ":" + name;
    }

    static int apply(const HandlerMap& handlers, SpecialContext& ctx);
};

// ============================================================================
// GLOBAL REGISTRY
// ============================================================================

/**
 * Get the global special registry singleton.
 */
SpecialRegistry& get_special_registry();

} // namespace tactics
