/**
 * Tactics Battle Engine - Test Fixtures
 *
 * Scripted randomness, card builders and a registry with every handler
 * registered, shared by the test files included from test_main.cpp.
 */

#pragma once

#include "tactics_engine.hpp"
#include <algorithm>
#include <deque>

namespace tactics {
namespace testing {

// ============================================================================
// SCRIPTED RNG
// ============================================================================

/**
 * Rng that replays queued values.
 *
 * With an empty queue next_double() returns `fallback` (0.99 by default,
 * so crits, dodges and jams never fire) and next_int() returns lo, which
 * makes shuffle() a fixed permutation.
 */
class ScriptedRng : public Rng {
public:
    std::deque<double> doubles;
    std::deque<int> ints;
    double fallback = 0.99;
    int doubles_used = 0;

    double next_double() override {
        doubles_used++;
        if (doubles.empty()) {
            return fallback;
        }
        double value = doubles.front();
        doubles.pop_front();
        return value;
    }

    int next_int(int lo, int hi) override {
        if (ints.empty()) {
            return lo;
        }
        int value = ints.front();
        ints.pop_front();
        return std::max(lo, std::min(hi, value));
    }
};

// ============================================================================
// CARD BUILDERS
// ============================================================================

inline CardDef make_card(const CardDefID& id, CardType type, int damage, int block,
                         int speed_cost, int action_cost = 1,
                         CardCategory category = CardCategory::GENERAL) {
    CardDef card;
    card.card_id = id;
    card.name = id;
    card.type = type;
    card.category = category;
    card.damage = damage;
    card.block = block;
    card.speed_cost = speed_cost;
    card.action_cost = action_cost;
    return card;
}

inline CardDef make_attack(const CardDefID& id, int damage, int speed_cost = 5,
                           CardCategory category = CardCategory::GENERAL) {
    return make_card(id, CardType::ATTACK, damage, 0, speed_cost, 1, category);
}

inline CardDef make_defense(const CardDefID& id, int block, int speed_cost = 4) {
    return make_card(id, CardType::DEFENSE, 0, block, speed_cost);
}

inline CardInstance make_instance(const CardDef& def, const CardID& id = "t_1") {
    return CardInstance(id, def);
}

/**
 * Player and enemy cards used by the scheduler and special tests.
 */
inline QueueItem make_item(Actor actor, const CardDef& def, int sp, const CardID& id = "t_1") {
    return QueueItem(actor, CardInstance(id, def), sp);
}

// ============================================================================
// REGISTRY / ACTORS
// ============================================================================

/**
 * Registry with every hook registered. Built once per test binary.
 */
inline const SpecialRegistry& full_registry() {
    static const SpecialRegistry registry = [] {
        SpecialRegistry r;
        specials::register_pre_attack_specials(r);
        specials::register_post_attack_specials(r);
        specials::register_card_play_specials(r);
        return r;
    }();
    return registry;
}

inline ActorState make_player(int hp = 50) {
    return ActorState(Actor::PLAYER, "Player", hp);
}

inline ActorState make_enemy(int hp = 40) {
    ActorState enemy(Actor::ENEMY, "Enemy", hp);
    enemy.min_cards = 1;
    enemy.max_cards = 1;
    return enemy;
}

inline Unit make_unit(UnitID id, int hp, int block = 0) {
    Unit unit;
    unit.unit_id = id;
    unit.name = "Unit " + std::to_string(id);
    unit.hp = hp;
    unit.max_hp = hp;
    unit.block = block;
    return unit;
}

/**
 * Resolve context with crits and jams left to the scripted rng.
 */
inline ResolveContext make_context(const CardCatalog* catalog = nullptr) {
    ResolveContext ctx;
    ctx.turn = 1;
    ctx.sp = 5;
    ctx.catalog = catalog;
    return ctx;
}

inline bool has_event(const std::vector<BattleEvent>& events, EventType type) {
    return std::any_of(events.begin(), events.end(),
                       [type](const BattleEvent& e) { return e.type == type; });
}

} // namespace testing
} // namespace tactics
