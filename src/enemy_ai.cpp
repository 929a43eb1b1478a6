/**
 * Tactics Battle Engine - Enemy AI Planner Implementation
 */

#include "enemy_ai.hpp"
#include <algorithm>
#include <iostream>

namespace tactics {

namespace {

using CardList = std::vector<const CardDef*>;

/**
 * Every subset of size 1..max_cards, in depth-first index order.
 */
void enumerate_subsets(const CardList& deck, size_t start, size_t max_cards,
                       CardList& current, std::vector<CardList>& out) {
    if (!current.empty()) {
        out.push_back(current);
    }
    if (current.size() >= max_cards) {
        return;
    }
    for (size_t i = start; i < deck.size(); ++i) {
        current.push_back(deck[i]);
        enumerate_subsets(deck, i + 1, max_cards, current, out);
        current.pop_back();
    }
}

std::string joined_ids(const CardList& cards) {
    std::string key;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) key += ",";
        key += cards[i]->card_id;
    }
    return key;
}

bool is_defensive(const CardDef& card) {
    return card.type == CardType::GENERAL || card.type == CardType::DEFENSE;
}

} // anonymous namespace

std::vector<CardDefID> EnemyPlan::card_ids() const {
    std::vector<CardDefID> ids;
    ids.reserve(cards.size());
    for (const CardDef* card : cards) {
        ids.push_back(card->card_id);
    }
    return ids;
}

EnemyPlanner::EnemyPlanner(const CardCatalog& catalog, const EngineConfig& config, Rng& rng)
    : catalog_(catalog)
    , config_(config)
    , rng_(rng)
{}

// ============================================================================
// MODE
// ============================================================================

AiMode EnemyPlanner::pick_mode(const std::string& enemy_kind) {
    const AiModeWeights& weights = config_.weights_for(enemy_kind);
    const double total = weights.total();
    if (total <= 0.0) {
        return AiMode::BALANCED;
    }

    double roll = rng_.next_double() * total;
    roll -= weights.aggro;
    if (roll <= 0.0) return AiMode::AGGRO;
    roll -= weights.turtle;
    if (roll <= 0.0) return AiMode::TURTLE;
    return AiMode::BALANCED;
}

EnemyPlan EnemyPlanner::plan(const ActorState& enemy) {
    EnemyPlan result;
    result.mode = pick_mode(enemy.enemy_kind);
    result.cards = choose_cards(enemy, result.mode);
    return result;
}

// ============================================================================
// BUDGETS / STATS
// ============================================================================

int EnemyPlanner::speed_budget(const ActorState& enemy) const {
    return config_.max_speed + std::max(0, enemy.min_cards - 1) * 10;
}

int EnemyPlanner::energy_budget(const ActorState& enemy) const {
    return config_.base_player_energy + enemy.ether_slots + std::max(0, enemy.min_cards - 1) * 2;
}

PlanStats EnemyPlanner::stats(const CardList& cards) {
    PlanStats s;
    for (const CardDef* card : cards) {
        if (card->is_attack()) {
            s.atk += card->action_cost;
            s.dmg += card->damage * std::max(1, card->hits);
        } else if (is_defensive(*card)) {
            s.def += card->action_cost;
            s.blk += card->block;
        }
        s.sp += card->speed_cost;
        s.en += card->action_cost;
    }
    return s;
}

int EnemyPlanner::score(AiMode mode, const CardList& cards) {
    const PlanStats s = stats(cards);
    int base = 0;
    switch (mode) {
        case AiMode::AGGRO:
            base = s.atk * 100 + s.dmg * 10 - s.sp;
            break;
        case AiMode::TURTLE:
            base = s.def * 100 + s.blk * 10 - s.sp;
            break;
        case AiMode::BALANCED:
            base = (s.dmg + s.blk) * 10 - s.sp;
            break;
    }
    return base + static_cast<int>(cards.size()) * 10000;
}

bool EnemyPlanner::satisfies(AiMode mode, const PlanStats& s, int ether_slots) const {
    const int threshold = (config_.base_player_energy + ether_slots + 1) / 2;
    switch (mode) {
        case AiMode::AGGRO: return s.atk >= threshold;
        case AiMode::TURTLE: return s.def >= threshold;
        case AiMode::BALANCED: return s.atk == s.def;
    }
    return true;
}

// ============================================================================
// SELECTION
// ============================================================================

CardList EnemyPlanner::build_deck(const ActorState& enemy) const {
    CardList deck;
    for (const auto& id : enemy.deck) {
        const CardDef* card = catalog_.get_card(id);
        if (card) {
            deck.push_back(card);
        } else {
            std::cerr << "[EnemyPlanner] Unknown card in deck: " << id << std::endl;
        }
    }

    if (deck.empty()) {
        deck = catalog_.enemy_cards();
    }

    if (!deck.empty() && static_cast<int>(deck.size()) < enemy.min_cards) {
        const CardList original = deck;
        while (static_cast<int>(deck.size()) < enemy.min_cards * 2) {
            deck.insert(deck.end(), original.begin(), original.end());
        }
    }
    return deck;
}

CardList EnemyPlanner::choose_cards(const ActorState& enemy, AiMode mode) const {
    const CardList deck = build_deck(enemy);
    if (deck.empty()) {
        return {};
    }

    const int configured = enemy.max_cards > 0 ? enemy.max_cards : config_.enemy_max_cards;
    const size_t max_cards = static_cast<size_t>(std::max({1, configured, enemy.min_cards}));
    const int max_sp = speed_budget(enemy);
    const int max_en = energy_budget(enemy);

    std::vector<CardList> subsets;
    CardList current;
    enumerate_subsets(deck, 0, max_cards, current, subsets);

    std::vector<CardList> candidates;
    for (auto& subset : subsets) {
        const PlanStats s = stats(subset);
        if (s.sp <= max_sp && s.en <= max_en) {
            candidates.push_back(std::move(subset));
        }
    }

    std::vector<CardList> preferred;
    for (const auto& subset : candidates) {
        if (static_cast<int>(subset.size()) >= enemy.min_cards) {
            preferred.push_back(subset);
        }
    }
    std::vector<CardList>& targets = preferred.empty() ? candidates : preferred;

    std::vector<CardList> satisfied;
    for (const auto& subset : targets) {
        if (satisfies(mode, stats(subset), enemy.ether_slots)) {
            satisfied.push_back(subset);
        }
    }

    if (!satisfied.empty()) {
        std::stable_sort(satisfied.begin(), satisfied.end(),
                         [mode](const CardList& a, const CardList& b) {
            if (a.size() != b.size()) return a.size() > b.size();
            const int sa = score(mode, a);
            const int sb = score(mode, b);
            if (sa != sb) return sa > sb;
            const PlanStats as = stats(a);
            const PlanStats bs = stats(b);
            if (as.sp != bs.sp) return as.sp < bs.sp;
            if (as.en != bs.en) return as.en < bs.en;
            return joined_ids(a) < joined_ids(b);
        });
        return satisfied.front();
    }

    if (!targets.empty()) {
        std::stable_sort(targets.begin(), targets.end(),
                         [mode](const CardList& a, const CardList& b) {
            if (a.size() != b.size()) return a.size() > b.size();
            return score(mode, a) > score(mode, b);
        });
        return targets.front();
    }

    // Nothing fits together: cheapest single card that fits on its own
    const CardDef* cheapest = nullptr;
    for (const CardDef* card : deck) {
        if (card->speed_cost > max_sp || card->action_cost > max_en) {
            continue;
        }
        if (!cheapest ||
            card->speed_cost < cheapest->speed_cost ||
            (card->speed_cost == cheapest->speed_cost && card->action_cost < cheapest->action_cost)) {
            cheapest = card;
        }
    }
    if (cheapest) {
        return {cheapest};
    }
    return {};
}

// ============================================================================
// OVERDRIVE / UNITS
// ============================================================================

bool should_enemy_overdrive(const ActorState& enemy, const EnemyPlan& plan, int turn) {
    if (enemy.ether_slots <= 0 || turn <= 1) {
        return false;
    }
    if (!ENEMY_OVERDRIVE_ENABLED) {
        return false;
    }
    switch (plan.mode) {
        case AiMode::AGGRO:
            return true;
        case AiMode::BALANCED:
            return std::any_of(plan.cards.begin(), plan.cards.end(),
                               [](const CardDef* card) { return card->is_attack(); });
        default:
            return false;
    }
}

void assign_source_units(std::vector<CardInstance>& actions, const ActorState& enemy) {
    const std::vector<UnitID> alive = enemy.alive_unit_ids();
    if (alive.empty()) {
        return;
    }
    for (size_t i = 0; i < actions.size(); ++i) {
        actions[i].source_unit_id = alive[i % alive.size()];
    }
}

} // namespace tactics
