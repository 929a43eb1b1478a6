/**
 * Tactics Battle Engine - Timeline Scheduler Implementation
 */

#include "timeline.hpp"
#include <algorithm>
#include <iterator>

namespace tactics {

// ============================================================================
// CONSTRUCTION
// ============================================================================

void TimelineScheduler::build(const std::vector<CardInstance>& player_cards,
                              const std::vector<CardInstance>& enemy_cards) {
    clear();
    queue_.reserve(player_cards.size() + enemy_cards.size());

    int sp = 0;
    for (const auto& card : player_cards) {
        sp += card.def.speed_cost;
        queue_.emplace_back(Actor::PLAYER, card, sp);
    }

    sp = 0;
    for (const auto& card : enemy_cards) {
        sp += card.def.speed_cost;
        queue_.emplace_back(Actor::ENEMY, card, sp);
    }

    std::stable_sort(queue_.begin(), queue_.end(),
                     [](const QueueItem& a, const QueueItem& b) {
                         if (a.sp != b.sp) return a.sp < b.sp;
                         return a.actor == Actor::PLAYER && b.actor == Actor::ENEMY;
                     });

    mark_crossed();
}

void TimelineScheduler::clear() {
    queue_.clear();
    cursor_ = -1;
    in_flight_ = false;
}

void TimelineScheduler::mark_crossed() {
    for (auto& item : queue_) {
        item.has_crossed = std::any_of(queue_.begin(), queue_.end(),
                                       [&item](const QueueItem& other) {
                                           return other.actor != item.actor &&
                                                  other.sp == item.sp;
                                       });
    }
}

// ============================================================================
// CURSOR
// ============================================================================

bool TimelineScheduler::advance(bool skip_enemy) {
    if (in_flight_) {
        return false;
    }

    int next = cursor_ + 1;
    while (next < static_cast<int>(queue_.size())) {
        if (skip_enemy && queue_[next].actor == Actor::ENEMY) {
            next++;
            continue;
        }
        cursor_ = next;
        return true;
    }

    cursor_ = static_cast<int>(queue_.size());
    return false;
}

const QueueItem* TimelineScheduler::current() const {
    if (cursor_ < 0 || cursor_ >= static_cast<int>(queue_.size())) {
        return nullptr;
    }
    return &queue_[cursor_];
}

QueueItem* TimelineScheduler::current() {
    if (cursor_ < 0 || cursor_ >= static_cast<int>(queue_.size())) {
        return nullptr;
    }
    return &queue_[cursor_];
}

bool TimelineScheduler::begin_step() {
    if (in_flight_) {
        return false;
    }
    in_flight_ = true;
    return true;
}

// ============================================================================
// MUTATION
// ============================================================================

void TimelineScheduler::sort_future(bool ghost_first) {
    size_t begin = future_begin();
    if (begin >= queue_.size()) {
        return;
    }

    std::stable_sort(queue_.begin() + begin, queue_.end(),
                     [ghost_first](const QueueItem& a, const QueueItem& b) {
                         if (a.sp != b.sp) return a.sp < b.sp;
                         if (ghost_first) {
                             return a.card.is_ghost && !b.card.is_ghost;
                         }
                         return false;
                     });
}

bool TimelineScheduler::reorder(Actor acting, const TimelineChanges& changes) {
    if (!changes.any()) {
        return false;
    }

    bool moved = false;
    int last_opponent = -1;

    for (size_t i = future_begin(); i < queue_.size(); ++i) {
        QueueItem& item = queue_[i];
        if (item.actor == acting) {
            if (changes.advance_own > 0) {
                int before = item.sp;
                item.sp = std::max(0, item.sp - changes.advance_own);
                moved = moved || before != item.sp;
            }
        } else {
            if (changes.push_opponent > 0) {
                item.sp += changes.push_opponent;
                moved = true;
            }
            last_opponent = static_cast<int>(i);
        }
    }

    if (changes.push_last_opponent > 0 && last_opponent >= 0) {
        queue_[last_opponent].sp += changes.push_last_opponent;
        moved = true;
    }

    if (moved) {
        sort_future(false);
    }
    return moved;
}

int TimelineScheduler::push_future(Actor target, int amount) {
    if (amount <= 0) {
        return 0;
    }

    int pushed = 0;
    for (size_t i = future_begin(); i < queue_.size(); ++i) {
        if (queue_[i].actor == target) {
            queue_[i].sp += amount;
            pushed++;
        }
    }

    if (pushed > 0) {
        sort_future(false);
    }
    return pushed;
}

void TimelineScheduler::insert(std::vector<QueueItem> items) {
    if (items.empty()) {
        return;
    }
    for (auto& item : items) {
        queue_.push_back(std::move(item));
    }
    sort_future(true);
}

std::vector<QueueItem> TimelineScheduler::remove_future(const QueuePredicate& predicate) {
    std::vector<QueueItem> removed;
    size_t begin = future_begin();
    if (begin >= queue_.size()) {
        return removed;
    }

    auto split = std::stable_partition(queue_.begin() + begin, queue_.end(),
                                       [&predicate](const QueueItem& item) {
                                           return !predicate(item);
                                       });
    removed.assign(std::make_move_iterator(split), std::make_move_iterator(queue_.end()));
    queue_.erase(split, queue_.end());
    return removed;
}

std::vector<QueueItem> TimelineScheduler::remove_pending(const QueuePredicate& predicate) {
    if (cursor_ >= 0) {
        return remove_future(predicate);
    }

    std::vector<QueueItem> removed;
    auto split = std::stable_partition(queue_.begin(), queue_.end(),
                                       [&predicate](const QueueItem& item) {
                                           return !predicate(item);
                                       });
    removed.assign(std::make_move_iterator(split), std::make_move_iterator(queue_.end()));
    queue_.erase(split, queue_.end());
    return removed;
}

// ============================================================================
// QUERIES
// ============================================================================

const QueueItem* TimelineScheduler::next_own_item(Actor actor) const {
    for (size_t i = future_begin(); i < queue_.size(); ++i) {
        if (queue_[i].actor == actor) {
            return &queue_[i];
        }
    }
    return nullptr;
}

const QueueItem* TimelineScheduler::previous_own_item(Actor actor) const {
    int end = std::min(cursor_, static_cast<int>(queue_.size()));
    for (int i = end - 1; i >= 0; --i) {
        if (queue_[i].actor == actor) {
            return &queue_[i];
        }
    }
    return nullptr;
}

bool TimelineScheduler::has_opposing_at_sp(Actor actor, int sp) const {
    const Actor opponent = opponent_of(actor);
    for (size_t i = future_begin(); i < queue_.size(); ++i) {
        if (queue_[i].actor == opponent && queue_[i].sp == sp) {
            return true;
        }
    }
    return false;
}

bool TimelineScheduler::is_future_sorted() const {
    size_t begin = future_begin();
    for (size_t i = begin + 1; i < queue_.size(); ++i) {
        if (queue_[i - 1].sp > queue_[i].sp) {
            return false;
        }
    }
    return true;
}

std::vector<const QueueItem*> TimelineScheduler::future_items(Actor actor) const {
    std::vector<const QueueItem*> result;
    for (size_t i = future_begin(); i < queue_.size(); ++i) {
        if (queue_[i].actor == actor) {
            result.push_back(&queue_[i]);
        }
    }
    return result;
}

} // namespace tactics
