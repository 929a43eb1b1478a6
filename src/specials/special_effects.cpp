/**
 * Tactics Battle Engine - Special Effects Implementation
 */

#include "specials/special_effects.hpp"
#include <algorithm>
#include <set>

namespace tactics {
namespace specials {

namespace {

const char* who(Actor actor) {
    return actor == Actor::PLAYER ? "Player" : "Enemy";
}

void push_event(std::vector<BattleEvent>& events, std::vector<std::string>& logs,
                EventType type, Actor actor, int amount,
                const std::string& card, const std::string& message) {
    events.push_back(BattleEvent{type, actor, amount, card, message});
    logs.push_back(message);
}

std::string join_names(const std::vector<CardInstance>& cards) {
    std::string out;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) out += ", ";
        out += cards[i].name();
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// TIMELINE SHIFTS
// ============================================================================

TimelineSpecialResult process_timeline_specials(const CardInstance& card,
                                                Actor actor,
                                                const TimelineScheduler& scheduler,
                                                int damage_dealt,
                                                bool has_crossed) {
    TimelineSpecialResult result;
    const CardDef& def = card.def;
    const std::string prefix = std::string(who(actor)) + " • " + def.name + ": ";

    if (def.has_special("advanceTimeline")) {
        int amount = def.advance_amount.value_or(DEFAULT_ADVANCE_AMOUNT);
        result.changes.advance_own += amount;
        push_event(result.events, result.logs, EventType::TIMELINE, actor, amount, def.name,
                   prefix + "own timeline advanced by " + std::to_string(amount));
    }

    if (def.has_special("pushEnemyTimeline") && damage_dealt > 0) {
        int amount = def.push_amount.value_or(DEFAULT_PUSH_AMOUNT);
        result.changes.push_opponent += amount;
        push_event(result.events, result.logs, EventType::TIMELINE, actor, amount, def.name,
                   prefix + "hit! opponent timeline pushed by " + std::to_string(amount));
    }

    if (def.has_special("beatEffect")) {
        int advance = def.advance_amount.value_or(DEFAULT_BEAT_ADVANCE);
        result.changes.advance_own += advance;
        push_event(result.events, result.logs, EventType::TIMELINE, actor, advance, def.name,
                   prefix + "own timeline advanced by " + std::to_string(advance));

        if (damage_dealt > 0) {
            int push = def.push_amount.value_or(DEFAULT_BEAT_PUSH);
            result.changes.push_opponent += push;
            push_event(result.events, result.logs, EventType::TIMELINE, actor, push, def.name,
                       prefix + "hit! opponent timeline pushed by " + std::to_string(push));
        }
    }

    if (def.has_special("pushLastEnemyCard")) {
        int amount = def.push_amount.value_or(DEFAULT_PUSH_LAST_AMOUNT);
        result.changes.push_last_opponent = amount;
        push_event(result.events, result.logs, EventType::TIMELINE, actor, amount, def.name,
                   prefix + "opponent's last card pushed by " + std::to_string(amount));
    }

    if (def.has_trait("chain") || def.has_special("advanceIfNextFencing")) {
        const QueueItem* next = scheduler.next_own_item(actor);
        if (next && next->card.def.category == CardCategory::FENCING) {
            int amount = def.advance_amount.value_or(DEFAULT_CHAIN_ADVANCE);
            result.changes.advance_own += amount;
            push_event(result.events, result.logs, EventType::TIMELINE, actor, amount, def.name,
                       prefix + "chain! own timeline advanced by " + std::to_string(amount));
        }
    }

    if (has_crossed && def.has_trait("cross") && def.cross_bonus &&
        def.cross_bonus->type == "push") {
        int amount = static_cast<int>(def.cross_bonus->value);
        if (amount > 0) {
            result.changes.push_opponent += amount;
            push_event(result.events, result.logs, EventType::TIMELINE, actor, amount, def.name,
                       prefix + "cross! opponent timeline pushed by " + std::to_string(amount));
        }
    }

    return result;
}

// ============================================================================
// CARD CREATION
// ============================================================================

std::optional<CardInstance> make_ghost_card(const CardCatalog& catalog,
                                            const CardDefID& card_id,
                                            const CardDefID& created_by) {
    const CardDef* def = catalog.get_card(card_id);
    if (!def) {
        return std::nullopt;
    }
    CardInstance ghost(CardID{}, *def);
    ghost.is_ghost = true;
    ghost.created_by = created_by;
    return ghost;
}

CardCreationResult process_card_creation(const CardInstance& card,
                                         Actor actor,
                                         int damage_dealt,
                                         const CardCatalog& catalog,
                                         Rng& rng,
                                         int chain_cap,
                                         int choice_size) {
    CardCreationResult result;

    const int chain_count = card.fleche_chain_count;
    const bool can_chain = card.is_from_fleche ? chain_count < chain_cap : true;
    const bool should_create = (card.has_special("createAttackOnHit") || card.is_from_fleche) &&
                               damage_dealt > 0 && can_chain;
    if (!should_create) {
        return result;
    }

    const CardDefID origin = card.created_by.value_or(card.card_id());

    std::vector<const CardDef*> pool;
    for (const CardDef* def : catalog.creatable_attack_cards()) {
        if (def->card_id != origin) {
            pool.push_back(def);
        }
    }
    if (pool.empty()) {
        return result;
    }

    rng.shuffle(pool);
    const int take = std::min(choice_size, static_cast<int>(pool.size()));
    const int next_chain = card.is_from_fleche ? chain_count + 1 : 1;

    for (int i = 0; i < take; ++i) {
        CardInstance created(CardID{}, *pool[i]);
        created.is_ghost = true;
        created.created_by = origin;
        created.is_from_fleche = true;
        created.fleche_chain_count = next_chain;
        result.created_cards.push_back(std::move(created));
    }

    std::string source = card.is_from_fleche
        ? "chain " + std::to_string(chain_count + 1)
        : card.name();
    std::string last = next_chain < chain_cap ? "" : " (last chain)";
    push_event(result.events, result.logs, EventType::CREATE, actor,
               static_cast<int>(result.created_cards.size()), card.name(),
               std::string(who(actor)) + " • " + source + ": hit! created " +
               std::to_string(result.created_cards.size()) + " attack cards" + last +
               " (" + join_names(result.created_cards) + ")");
    return result;
}

std::vector<CardDefID> generate_breach_offers(const CardCatalog& catalog,
                                              const CardDefID& exclude,
                                              Rng& rng,
                                              int count) {
    std::vector<CardDefID> pool;
    for (const CardDef* def : catalog.breach_candidates()) {
        if (def->card_id != exclude && def->card_id != "breach") {
            pool.push_back(def->card_id);
        }
    }
    rng.shuffle(pool);
    if (static_cast<int>(pool.size()) > count) {
        pool.resize(static_cast<size_t>(std::max(0, count)));
    }
    return pool;
}

std::vector<std::vector<CardDefID>> generate_fencing_offers(const CardCatalog& catalog,
                                                            const CardDefID& exclude,
                                                            Rng& rng,
                                                            int selections,
                                                            int per_selection) {
    std::vector<std::vector<CardDefID>> rounds;

    std::vector<CardDefID> pool;
    for (const CardDef* def : catalog.fencing_attack_cards()) {
        if (def->card_id != exclude) {
            pool.push_back(def->card_id);
        }
    }
    if (per_selection <= 0 || static_cast<int>(pool.size()) < per_selection) {
        return rounds;
    }

    rng.shuffle(pool);

    size_t next = 0;
    for (int round = 0; round < selections && next < pool.size(); ++round) {
        size_t end = std::min(pool.size(), next + static_cast<size_t>(per_selection));
        rounds.emplace_back(pool.begin() + next, pool.begin() + end);
        next = end;
    }
    return rounds;
}

// ============================================================================
// PARRY
// ============================================================================

ParryWindow setup_parry_window(const QueueItem& item, int default_range, int default_push) {
    ParryWindow window;
    window.owner = item.actor;
    window.center_sp = item.sp;
    window.max_sp = item.sp + item.card.def.parry_range.value_or(default_range);
    window.push_amount = item.card.def.parry_push_amount.value_or(default_push);
    window.card_name = item.card.name();
    return window;
}

ParryResult check_parry_trigger(std::vector<ParryWindow>& windows,
                                const QueueItem& opposing_item,
                                TimelineScheduler& scheduler,
                                int opponent_max_speed) {
    ParryResult result;
    if (!opposing_item.card.is_attack()) {
        return result;
    }

    const Actor opponent = opposing_item.actor;
    for (auto& window : windows) {
        if (window.owner == opponent || !window.covers(opposing_item.sp)) {
            continue;
        }
        window.triggered = true;
        result.triggered = true;
        result.total_push += window.push_amount;
        push_event(result.events, result.logs, EventType::PARRY, window.owner, window.push_amount,
                   window.card_name,
                   std::string(who(window.owner)) + " • " + window.card_name + ": parry! (" +
                   opposing_item.card.name() + " at " + std::to_string(opposing_item.sp) +
                   ") opponent timeline pushed by " + std::to_string(window.push_amount));
    }

    if (!result.triggered) {
        return result;
    }

    scheduler.push_future(opponent, result.total_push);
    result.outed = scheduler.remove_future([opponent, opponent_max_speed](const QueueItem& item) {
        return item.actor == opponent && item.sp > opponent_max_speed;
    });

    for (const auto& item : result.outed) {
        push_event(result.events, result.logs, EventType::OUT, opponent_of(opponent),
                   item.sp, item.card.name(),
                   "\"" + item.card.name() + "\" out! (sp " + std::to_string(item.sp) + ")");
    }
    return result;
}

// ============================================================================
// STUN / COLLISION
// ============================================================================

RemovalResult process_stun(const QueueItem& item, TimelineScheduler& scheduler, int range) {
    RemovalResult result;
    const Actor opponent = opponent_of(item.actor);
    const int from = item.sp;
    const int to = item.sp + range;

    result.removed = scheduler.remove_future([opponent, from, to](const QueueItem& other) {
        return other.actor == opponent && other.sp >= from && other.sp <= to;
    });

    if (!result.removed.empty()) {
        std::string names;
        for (size_t i = 0; i < result.removed.size(); ++i) {
            if (i > 0) names += ", ";
            names += result.removed[i].card.name();
        }
        push_event(result.events, result.logs, EventType::STUN, item.actor,
                   static_cast<int>(result.removed.size()), item.card.name(),
                   std::string(who(item.actor)) + " • " + item.card.name() + ": stun! removed " +
                   names + " (sp " + std::to_string(from) + "-" + std::to_string(to) + ")");
    }
    return result;
}

RemovalResult process_queue_collisions(TimelineScheduler& scheduler) {
    RemovalResult result;

    std::set<int> destroy_sps;
    std::vector<const QueueItem*> sources;
    for (const auto& item : scheduler.queue()) {
        if (item.actor == Actor::PLAYER && item.card.has_special("destroyOnCollision")) {
            destroy_sps.insert(item.sp);
            sources.push_back(&item);
        }
    }
    if (destroy_sps.empty()) {
        return result;
    }

    // Names of the destroying cards are captured before the queue changes
    std::vector<std::pair<int, std::string>> source_names;
    for (const QueueItem* source : sources) {
        source_names.emplace_back(source->sp, source->card.name());
    }

    result.removed = scheduler.remove_pending([&destroy_sps](const QueueItem& item) {
        return item.actor == Actor::ENEMY && destroy_sps.count(item.sp) > 0;
    });

    for (const auto& removed : result.removed) {
        std::string source_name;
        for (const auto& entry : source_names) {
            if (entry.first == removed.sp) {
                source_name = entry.second;
                break;
            }
        }
        push_event(result.events, result.logs, EventType::DESTROY, Actor::PLAYER, removed.sp,
                   source_name,
                   "Player • " + source_name + ": collision! " + removed.card.name() + " destroyed");
    }
    return result;
}

// ============================================================================
// GROWING DEFENSE
// ============================================================================

int GrowingDefense::apply(ActorState& owner_state, int sp) {
    const int needed = std::max(0, sp - activated_sp) * rate;
    const int delta = needed - total_applied;
    if (delta <= 0) {
        return 0;
    }
    owner_state.gain_block(delta);
    total_applied = needed;
    return delta;
}

} // namespace specials
} // namespace tactics
