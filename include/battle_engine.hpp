/**
 * Tactics Battle Engine - Main Engine Interface
 *
 * Drives a battle one queue item at a time:
 *
 *   create_battle -> commit_turn -> step ... step -> finish_turn -> commit_turn ...
 *
 * A breach or creation special pauses stepping until resume_with_choice()
 * supplies one of the offered cards.
 *
 * The engine holds only injected read-only dependencies (catalog,
 * config, special registry) and the RNG; every mutable value lives in
 * the BattleState passed to each call.
 */

#pragma once

#include "action_resolver.hpp"
#include "battle_state.hpp"
#include "card_catalog.hpp"
#include "enemy_ai.hpp"
#include "engine_config.hpp"
#include "presentation_sink.hpp"
#include "rng.hpp"

namespace tactics {

/**
 * BattleEngine - Turn and step driver.
 *
 * Not thread-safe. One engine may drive several battles in sequence.
 */
class BattleEngine {
public:
    /**
     * @param catalog Card definitions (must outlive the engine)
     * @param config Rule tunables (must outlive the engine)
     * @param rng Randomness for crits, dodges, jams, offers and planning
     * @param registry Special handlers; the global registry when null
     */
    BattleEngine(const CardCatalog& catalog,
                 const EngineConfig& config,
                 Rng& rng,
                 const SpecialRegistry* registry = nullptr);

    // ========================================================================
    // OBSERVERS
    // ========================================================================

    /**
     * Register a sink (not owned). Sinks are called in registration order.
     */
    void add_sink(PresentationSink* sink);
    void clear_sinks() { sinks_.clear(); }

    /**
     * Observe each hit of a multi-hit card as it lands.
     */
    void set_hit_callback(HitCallback callback);

    // ========================================================================
    // BATTLE SETUP
    // ========================================================================

    /**
     * Create a battle at turn 1, phase SELECT.
     *
     * Composite enemies get their hp re-derived from their units.
     */
    BattleState create_battle(ActorState player, ActorState enemy) const;

    // ========================================================================
    // TURN FLOW
    // ========================================================================

    /**
     * Commit the player's hand, plan the enemy and build the queue.
     *
     * Applies turn-start effects (banked energy and speed, warmedUp /
     * dizzy energy modifiers, agility speed reduction).
     *
     * @param selected_target Unit the player's attacks default to
     * @return false if not in SELECT, a card is unknown or vanished, or
     *         the hand exceeds the card count, energy or speed limits
     */
    bool commit_turn(BattleState& state,
                     const std::vector<CardDefID>& player_card_ids,
                     std::optional<UnitID> selected_target = std::nullopt);

    /**
     * Resolve the next queue item.
     *
     * A no-op (resolved = false) outside RESOLVE or while a step is in
     * flight. An unresolvable card is logged as fatal and skipped.
     */
    StepReport step(BattleState& state);

    /**
     * Step until the queue ends, a choice is pending or a side is
     * defeated.
     */
    std::vector<StepReport> run_until_blocked(BattleState& state);

    /**
     * Supply the pending choice.
     *
     * @return false if nothing is pending or the card was not offered
     */
    bool resume_with_choice(BattleState& state, const CardDefID& card_id);

    /**
     * Settle ether and combos, clear turn tokens, queue and windows, and
     * advance the turn counter (or finish the battle).
     *
     * @return report.valid == false unless the queue was exhausted
     */
    TurnEndReport finish_turn(BattleState& state);

    // ========================================================================
    // QUERIES
    // ========================================================================

    /**
     * Energy the player has for a turn before committing.
     */
    int turn_energy(const BattleState& state, Actor actor) const;

    /**
     * Speed limit for the player's hand this turn.
     */
    int turn_max_speed(const BattleState& state, Actor actor) const;

    const CardCatalog& get_card_catalog() const { return catalog_; }
    const EngineConfig& get_config() const { return config_; }
    EnemyPlanner& get_planner() { return planner_; }

private:
    const CardCatalog& catalog_;
    const EngineConfig& config_;
    Rng& rng_;
    const SpecialRegistry& registry_;
    ActionResolver resolver_;
    EnemyPlanner planner_;
    std::vector<PresentationSink*> sinks_;

    // ========================================================================
    // COMMIT HELPERS
    // ========================================================================

    std::vector<CardInstance> instantiate(BattleState& state, Actor actor,
                                          const std::vector<const CardDef*>& cards) const;

    void apply_turn_start(BattleState& state, Actor actor, int energy);

    // ========================================================================
    // STEP HELPERS
    // ========================================================================

    ResolveContext make_context(const BattleState& state, const QueueItem& item) const;

    void apply_growing_defense(BattleState& state, const QueueItem& item, StepReport& report);

    /**
     * BURN damage to the acting side, straight to hp.
     */
    void apply_burn(BattleState& state, const QueueItem& item, StepReport& report);

    void apply_timeline_effects(BattleState& state, const QueueItem& item,
                                const ActionResult& result, StepReport& report);

    void insert_created_cards(BattleState& state, const QueueItem& item,
                              ActionResult& result, StepReport& report);

    /**
     * Open a breach/creation choice. Enemy choices resolve at once with
     * the first offer.
     */
    void open_choice(BattleState& state, const QueueItem& item,
                     const SpecialOutcome& outcome, StepReport& report);

    bool apply_choice(BattleState& state, const CardDefID& card_id,
                      std::vector<BattleEvent>& events);

    void expire_timeline_tokens(BattleState& state, int sp, StepReport& report);

    void check_defeat(BattleState& state, StepReport& report);

    // ========================================================================
    // SINK DISPATCH
    // ========================================================================

    void notify_step(const BattleState& state, const StepReport& report);
    void notify_turn_end(const BattleState& state, const TurnEndReport& report);
    void notify_choice(const BattleState& state);
};

} // namespace tactics
