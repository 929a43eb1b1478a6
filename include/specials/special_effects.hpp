/**
 * Tactics Battle Engine - Special Effects
 *
 * Reusable building blocks for specials that act on the timeline rather
 * than on a single actor: timeline shifts, on-hit card creation, choice
 * offers, parry windows, stun, collisions and growing defense.
 *
 * Each function reports what it did through a result struct carrying
 * events and log lines; none of them performs presentation.
 */

#pragma once

#include "../actor_state.hpp"
#include "../card_catalog.hpp"
#include "../rng.hpp"
#include "../timeline.hpp"

namespace tactics {
namespace specials {

// ============================================================================
// RESULT STRUCTURES
// ============================================================================

struct TimelineSpecialResult {
    TimelineChanges changes;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

struct CardCreationResult {
    std::vector<CardInstance> created_cards;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

struct ParryResult {
    bool triggered = false;
    int total_push = 0;
    std::vector<QueueItem> outed;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

/**
 * Items removed from the queue by stun or collision.
 */
struct RemovalResult {
    std::vector<QueueItem> removed;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

// ============================================================================
// TIMELINE SHIFTS
// ============================================================================

/**
 * Compute timeline changes requested by a resolved card.
 *
 * - advanceTimeline: own future items advance by advanceAmount (4)
 * - pushEnemyTimeline: opponent future items pushed by pushAmount (5), on damage only
 * - beatEffect: advance advanceAmount (1), push pushAmount (2) on damage
 * - pushLastEnemyCard: only the last opponent item, pushAmount (9)
 * - chain trait / advanceIfNextFencing: advance advanceAmount (3) when the
 *   next own item is a fencing card
 * - cross trait with a "push" cross bonus: push value when crossed
 */
TimelineSpecialResult process_timeline_specials(const CardInstance& card,
                                                Actor actor,
                                                const TimelineScheduler& scheduler,
                                                int damage_dealt,
                                                bool has_crossed = false);

// ============================================================================
// CARD CREATION
// ============================================================================

/**
 * Build a ghost copy of a catalog card.
 *
 * @return nullopt if the card is not in the catalog
 */
std::optional<CardInstance> make_ghost_card(const CardCatalog& catalog,
                                            const CardDefID& card_id,
                                            const CardDefID& created_by);

/**
 * On-hit creation (fleche chain).
 *
 * Fires when the card has createAttackOnHit or was itself created this
 * way, dealt damage, and its chain count is below the cap. Picks up to
 * choice_size distinct attack cards from the catalog, excluding the
 * chain's originating card and cards with token requirements.
 */
CardCreationResult process_card_creation(const CardInstance& card,
                                         Actor actor,
                                         int damage_dealt,
                                         const CardCatalog& catalog,
                                         Rng& rng,
                                         int chain_cap = MAX_FLECHE_CHAIN,
                                         int choice_size = CREATION_CHOICE_SIZE);

/**
 * Offers for a breach: `count` distinct attack/general/special cards
 * without token requirements, never the breach card itself.
 */
std::vector<CardDefID> generate_breach_offers(const CardCatalog& catalog,
                                              const CardDefID& exclude,
                                              Rng& rng,
                                              int count = CREATION_CHOICE_SIZE);

/**
 * Offers for createFencingCards3: `selections` rounds of `per_selection`
 * distinct fencing attack cards each, no card repeated across rounds.
 *
 * @return empty if the fencing pool cannot fill one round
 */
std::vector<std::vector<CardDefID>> generate_fencing_offers(const CardCatalog& catalog,
                                                            const CardDefID& exclude,
                                                            Rng& rng,
                                                            int selections = 3,
                                                            int per_selection = CREATION_CHOICE_SIZE);

// ============================================================================
// PARRY
// ============================================================================

/**
 * ParryWindow - Opened by a parryPush card at its own sp.
 */
struct ParryWindow {
    Actor owner = Actor::PLAYER;
    int center_sp = 0;
    int max_sp = 0;
    int push_amount = DEFAULT_PARRY_PUSH;
    bool triggered = false;
    std::string card_name;

    /**
     * True for an untriggered window with center_sp < sp <= max_sp.
     */
    bool covers(int sp) const {
        return !triggered && center_sp < sp && sp <= max_sp;
    }
};

ParryWindow setup_parry_window(const QueueItem& item,
                               int default_range = DEFAULT_PARRY_RANGE,
                               int default_push = DEFAULT_PARRY_PUSH);

/**
 * Check every open window against a resolved opposing attack.
 *
 * All windows covering the item's sp trigger together; the opponent's
 * future items are pushed by the sum of their push amounts and any item
 * whose new sp exceeds opponent_max_speed is removed.
 */
ParryResult check_parry_trigger(std::vector<ParryWindow>& windows,
                                const QueueItem& opposing_item,
                                TimelineScheduler& scheduler,
                                int opponent_max_speed);

// ============================================================================
// STUN / COLLISION
// ============================================================================

/**
 * Remove every opposing future item with sp in [item.sp, item.sp + range].
 */
RemovalResult process_stun(const QueueItem& item,
                           TimelineScheduler& scheduler,
                           int range = STUN_RANGE);

/**
 * Queue-build pass: each player destroyOnCollision card removes enemy
 * items that share its sp.
 */
RemovalResult process_queue_collisions(TimelineScheduler& scheduler);

// ============================================================================
// GROWING DEFENSE
// ============================================================================

/**
 * GrowingDefense - Block that grows with timeline distance from the
 * activation point. Tracks what it has already granted so no unit of
 * growth is applied twice.
 */
struct GrowingDefense {
    Actor owner = Actor::PLAYER;
    int activated_sp = 0;
    int total_applied = 0;
    int rate = 1;

    /**
     * Grant the block owed at `sp`.
     *
     * @return Block added by this call
     */
    int apply(ActorState& owner_state, int sp);
};

} // namespace specials
} // namespace tactics
