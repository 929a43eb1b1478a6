/**
 * Tactics Battle Engine - Actor State
 *
 * Represents one side of a battle (player or enemy) including its
 * resources, tokens and, for composite enemies, its units.
 */

#pragma once

#include "token_store.hpp"
#include <algorithm>
#include <map>

namespace tactics {

/**
 * Unit - One member of a composite enemy.
 */
struct Unit {
    UnitID unit_id = 0;
    std::string name;
    int hp = 0;
    int max_hp = 0;
    int block = 0;
    TokenStore tokens;

    bool is_alive() const { return hp > 0; }
};

/**
 * ActorState - Complete state for one side.
 *
 * For composite enemies hp is always re-derived from the unit array via
 * recompute_hp_from_units().
 */
struct ActorState {
    Actor side = Actor::PLAYER;
    std::string name = "Player";

    // Health
    int hp = 0;
    int max_hp = 0;
    int block = 0;
    bool def = false;              // Block only absorbs damage while set

    // Modifiers
    int strength = 0;
    int agility = 0;
    int counter = 0;               // Passive reflect on every damaging hit

    // Resources
    int energy = BASE_PLAYER_ENERGY;
    int max_energy = BASE_PLAYER_ENERGY;
    int max_speed = MAX_SPEED;

    // Ether
    int ether_pts = 0;
    bool ether_ban = false;
    int ether_slots = 0;           // Enemy energy bonus for the planner

    TokenStore tokens;

    // Composite enemy
    std::vector<Unit> units;

    // Enemy planning
    std::vector<CardDefID> deck;
    int min_cards = 1;
    int max_cards = 3;
    std::string enemy_kind;        // Planner weight lookup key

    // Combo usage counts for deflation (combo name -> times used)
    std::map<std::string, int> combo_usage;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    ActorState() = default;

    ActorState(Actor side_, std::string name_, int max_hp_)
        : side(side_)
        , name(std::move(name_))
        , hp(max_hp_)
        , max_hp(max_hp_)
    {}

    // ========================================================================
    // UNIT HELPERS
    // ========================================================================

    bool has_units() const { return !units.empty(); }

    /**
     * Re-derive hp as sum(max(0, unit.hp)). No-op without units.
     */
    void recompute_hp_from_units() {
        if (units.empty()) {
            return;
        }
        int total = 0;
        for (const auto& unit : units) {
            total += std::max(0, unit.hp);
        }
        hp = total;
    }

    Unit* find_unit(UnitID unit_id) {
        for (auto& unit : units) {
            if (unit.unit_id == unit_id) return &unit;
        }
        return nullptr;
    }

    const Unit* find_unit(UnitID unit_id) const {
        for (const auto& unit : units) {
            if (unit.unit_id == unit_id) return &unit;
        }
        return nullptr;
    }

    Unit* first_alive_unit() {
        for (auto& unit : units) {
            if (unit.is_alive()) return &unit;
        }
        return nullptr;
    }

    std::vector<UnitID> alive_unit_ids() const {
        std::vector<UnitID> ids;
        for (const auto& unit : units) {
            if (unit.is_alive()) ids.push_back(unit.unit_id);
        }
        return ids;
    }

    bool is_defeated() const { return hp <= 0; }

    // ========================================================================
    // HP HELPERS
    // ========================================================================

    void clamp_hp() {
        hp = std::max(0, std::min(hp, max_hp));
    }

    void heal(int amount) {
        if (amount <= 0) return;
        hp = std::min(max_hp, hp + amount);
    }

    void gain_block(int amount) {
        if (amount <= 0) return;
        block += amount;
        def = true;
    }

    /**
     * Reset per-turn combat flags (block, def).
     */
    void reset_turn_flags() {
        block = 0;
        def = false;
        for (auto& unit : units) {
            unit.block = 0;
        }
    }
};

} // namespace tactics
