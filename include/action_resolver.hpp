/**
 * Tactics Battle Engine - Action Resolver
 *
 * Computes the full outcome of one queued action: token costs, block
 * gain, the attack (pre-attack specials, hits, unit distribution,
 * post-attack specials, on-hit creation, lifesteal and revive), tokens
 * granted on play and card-play specials.
 *
 * The resolver mutates the two actor states it is given and reports
 * everything else (events, created cards, engine requests) in the
 * returned ActionResult. It never touches the timeline.
 */

#pragma once

#include "multi_hit.hpp"
#include "special_registry.hpp"

namespace tactics {

struct ActionResult {
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;

    int dealt = 0;              // hp the defender lost
    int taken = 0;              // hp the attacker lost to counters
    int blocked = 0;            // Block the attacker gained
    int block_destroyed = 0;

    bool attacked = false;
    bool is_critical = false;
    int critical_hits = 0;
    int hits_completed = 0;
    int total_hits = 0;
    bool jammed = false;
    bool target_had_block = false;
    std::optional<UnitID> target_unit_id;

    std::vector<CardInstance> created_cards;   // Fleche chain output

    // Flags and banked effects raised by specials. Its events are
    // already part of `events`.
    SpecialOutcome outcome;
};

/**
 * ActionResolver - Resolves one card for one actor.
 */
class ActionResolver {
public:
    ActionResolver(const SpecialRegistry& registry, Rng& rng);

    /**
     * Observe every hit (forwarded from the multi-hit loop).
     */
    void set_hit_callback(HitCallback callback) { on_hit_ = std::move(callback); }

    /**
     * Resolve a card.
     *
     * @param attacker Acting side
     * @param defender Opposing side
     * @param card Queued copy; specials may rewrite it (e.g. AOE flag)
     * @param actor Acting side
     * @param ctx Battle view for this queue item
     * @return nullopt if the card has no id or is unknown to the catalog
     */
    std::optional<ActionResult> resolve(ActorState& attacker,
                                        ActorState& defender,
                                        CardInstance& card,
                                        Actor actor,
                                        const ResolveContext& ctx);

    /**
     * Unit an attack from `card` lands on: explicit target, then the
     * selected target, then the first living unit.
     *
     * @return nullptr without living units
     */
    static Unit* resolve_target_unit(ActorState& defender,
                                     const CardInstance& card,
                                     const std::optional<UnitID>& selected_target);

private:
    const SpecialRegistry& registry_;
    Rng& rng_;
    HitCallback on_hit_;

    void resolve_block(ActorState& attacker, const CardInstance& card, Actor actor,
                       const ResolveContext& ctx, ActionResult& result);

    void resolve_attack(ActorState& attacker, ActorState& defender, CardInstance& card,
                        Actor actor, const ResolveContext& ctx, Unit* target_unit,
                        ActionResult& result);

    void apply_granted_tokens(ActorState& attacker, ActorState& defender,
                              const CardInstance& card, const ResolveContext& ctx,
                              Unit* target_unit, ActionResult& result);

    /**
     * Distribute one hit's damage over the defender's units.
     *
     * @return hp the units lost
     */
    static int distribute_to_units(ActorState& defender, const CardInstance& card,
                                   const HitResult& hit, Unit* target_unit,
                                   Actor actor, ActionResult& result);

    static void absorb(ActionResult& result, SpecialOutcome& part);
};

} // namespace tactics
