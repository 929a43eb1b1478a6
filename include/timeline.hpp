/**
 * Tactics Battle Engine - Timeline Scheduler
 *
 * Merges both sides' committed cards into a single queue ordered by
 * speed position (sp) and walks it with a cursor.
 *
 * Invariants:
 * - Items after the cursor are always sorted ascending by sp
 * - Only items after the cursor are ever moved, inserted or removed
 * - While a step is in flight, advance() is a no-op
 */

#pragma once

#include "card_instance.hpp"
#include <algorithm>
#include <functional>

namespace tactics {

/**
 * QueueItem - One scheduled action.
 */
struct QueueItem {
    Actor actor = Actor::PLAYER;
    CardInstance card;
    int sp = 0;
    bool has_crossed = false;   // Shares its sp with an opposing item

    QueueItem() = default;
    QueueItem(Actor actor_, CardInstance card_, int sp_)
        : actor(actor_)
        , card(std::move(card_))
        , sp(sp_)
    {}
};

/**
 * Timeline deltas expressed from the acting side's point of view.
 */
struct TimelineChanges {
    int advance_own = 0;         // Own future items move earlier
    int push_opponent = 0;       // Every opponent future item moves later
    int push_last_opponent = 0;  // Only the last opponent future item moves later

    bool any() const {
        return advance_own != 0 || push_opponent != 0 || push_last_opponent != 0;
    }
};

using QueuePredicate = std::function<bool(const QueueItem&)>;

/**
 * TimelineScheduler - Ordered action queue with a cursor.
 *
 * The cursor indexes the item currently being resolved (-1 before the
 * first advance). "Future" always means index > cursor.
 */
class TimelineScheduler {
public:
    TimelineScheduler() = default;

    // ========================================================================
    // CONSTRUCTION
    // ========================================================================

    /**
     * Build the merged queue.
     *
     * Each side's sp is the running sum of its cards' speed cost. The
     * merged list is sorted by sp with the player first on ties, and
     * items sharing an sp with an opposing item are marked crossed.
     */
    void build(const std::vector<CardInstance>& player_cards,
               const std::vector<CardInstance>& enemy_cards);

    /**
     * Drop every item and reset the cursor and flight guard.
     */
    void clear();

    // ========================================================================
    // CURSOR
    // ========================================================================

    /**
     * Move the cursor to the next item.
     *
     * @param skip_enemy Skip enemy items (enemy already defeated)
     * @return false at the end of the queue or while a step is in flight
     */
    bool advance(bool skip_enemy = false);

    int cursor() const { return cursor_; }
    bool at_end() const { return cursor_ >= static_cast<int>(queue_.size()); }

    /**
     * True when no item remains after the cursor.
     */
    bool exhausted() const { return cursor_ + 1 >= static_cast<int>(queue_.size()); }

    /**
     * Item under the cursor, nullptr before the first advance or at the end.
     */
    const QueueItem* current() const;
    QueueItem* current();

    // ========================================================================
    // FLIGHT GUARD
    // ========================================================================

    /**
     * Mark a step as in flight. Returns false if one already is.
     */
    bool begin_step();
    void end_step() { in_flight_ = false; }
    bool in_flight() const { return in_flight_; }

    // ========================================================================
    // MUTATION (future items only)
    // ========================================================================

    /**
     * Apply timeline changes for the acting side and re-sort the future.
     *
     * @return true if any item moved
     */
    bool reorder(Actor acting, const TimelineChanges& changes);

    /**
     * Push every future item of `target` by amount.
     */
    int push_future(Actor target, int amount);

    /**
     * Insert items after the cursor and re-sort. Ghost cards sort before
     * non-ghost cards on equal sp.
     */
    void insert(std::vector<QueueItem> items);

    /**
     * Remove matching future items.
     *
     * @return Removed items in queue order
     */
    std::vector<QueueItem> remove_future(const QueuePredicate& predicate);

    /**
     * Remove matching items anywhere in the queue (pre-resolution only,
     * before the first advance).
     */
    std::vector<QueueItem> remove_pending(const QueuePredicate& predicate);

    // ========================================================================
    // QUERIES
    // ========================================================================

    const std::vector<QueueItem>& queue() const { return queue_; }
    size_t size() const { return queue_.size(); }

    /**
     * First future item of `actor`, nullptr if none.
     */
    const QueueItem* next_own_item(Actor actor) const;

    /**
     * Most recent item of `actor` before the cursor, nullptr if none.
     */
    const QueueItem* previous_own_item(Actor actor) const;

    /**
     * True if `actor` has no future items.
     */
    bool is_last_own_item(Actor actor) const { return next_own_item(actor) == nullptr; }

    /**
     * True if a future item of the opponent of `actor` sits at `sp`.
     */
    bool has_opposing_at_sp(Actor actor, int sp) const;

    /**
     * Verify the post-cursor slice is sorted by sp.
     */
    bool is_future_sorted() const;

    std::vector<const QueueItem*> future_items(Actor actor) const;

private:
    std::vector<QueueItem> queue_;
    int cursor_ = -1;
    bool in_flight_ = false;

    size_t future_begin() const {
        return static_cast<size_t>(std::max(0, cursor_ + 1));
    }

    void sort_future(bool ghost_first);
    void mark_crossed();
};

} // namespace tactics
