/**
 * Tactics Battle Engine - Enemy AI Planner
 *
 * Picks the enemy's committed cards for a turn: a weighted mode roll,
 * exhaustive enumeration of small card subsets under the speed and
 * energy budgets, then a mode-specific score.
 */

#pragma once

#include "actor_state.hpp"
#include "card_catalog.hpp"
#include "card_instance.hpp"
#include "engine_config.hpp"
#include "rng.hpp"

namespace tactics {

/**
 * Aggregate numbers the planner scores a subset by.
 */
struct PlanStats {
    int atk = 0;   // actionCost of attack cards
    int def = 0;   // actionCost of general/defense cards
    int dmg = 0;   // damage x hits of attack cards
    int blk = 0;   // block of general/defense cards
    int sp = 0;
    int en = 0;
};

struct EnemyPlan {
    AiMode mode = AiMode::BALANCED;
    std::vector<const CardDef*> cards;

    std::vector<CardDefID> card_ids() const;
};

/**
 * EnemyPlanner - Stateless apart from the injected dependencies.
 */
class EnemyPlanner {
public:
    EnemyPlanner(const CardCatalog& catalog, const EngineConfig& config, Rng& rng);

    /**
     * Weighted pick over aggro, turtle and balanced for an enemy kind.
     */
    AiMode pick_mode(const std::string& enemy_kind);

    /**
     * Roll a mode and choose the cards.
     */
    EnemyPlan plan(const ActorState& enemy);

    /**
     * Choose cards for a given mode (deterministic).
     *
     * @return Empty if not even a single card fits the budgets
     */
    std::vector<const CardDef*> choose_cards(const ActorState& enemy, AiMode mode) const;

    static PlanStats stats(const std::vector<const CardDef*>& cards);
    static int score(AiMode mode, const std::vector<const CardDef*>& cards);

    int speed_budget(const ActorState& enemy) const;
    int energy_budget(const ActorState& enemy) const;

private:
    const CardCatalog& catalog_;
    const EngineConfig& config_;
    Rng& rng_;

    std::vector<const CardDef*> build_deck(const ActorState& enemy) const;
    bool satisfies(AiMode mode, const PlanStats& s, int ether_slots) const;
};

/**
 * Whether the enemy spends an ether slot on overdrive this turn.
 *
 * Needs a free slot and a turn after the first. Past those checks the
 * ENEMY_OVERDRIVE_ENABLED lock keeps it off, so this currently always
 * returns false.
 */
bool should_enemy_overdrive(const ActorState& enemy, const EnemyPlan& plan, int turn);

/**
 * Give each planned action a source unit, round-robin over living units.
 * No-op for enemies without living units.
 */
void assign_source_units(std::vector<CardInstance>& actions, const ActorState& enemy);

} // namespace tactics
