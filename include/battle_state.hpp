/**
 * Tactics Battle Engine - Battle State
 *
 * All mutable state of one battle: both sides, the timeline, the
 * windows and trackers opened by specials, the pending breach/creation
 * choice and the per-turn accumulators the ether economy reads at turn
 * end. The engine owns no battle state of its own.
 */

#pragma once

#include "actor_state.hpp"
#include "ether_economy.hpp"
#include "special_registry.hpp"
#include "specials/special_effects.hpp"
#include "timeline.hpp"

namespace tactics {

// ============================================================================
// PENDING CHOICE
// ============================================================================

enum class ChoiceKind : uint8_t {
    BREACH,             // One pick from attack/general/special offers
    FENCING_CREATION    // Successive picks from fencing attack offers
};

inline const char* to_string(ChoiceKind kind) {
    return kind == ChoiceKind::BREACH ? "breach" : "fencing_creation";
}

/**
 * PendingChoice - Resolution is paused until a card is picked.
 *
 * rounds.front() holds the current offers. Each pick inserts a ghost
 * copy at insert_sp and drops the round.
 */
struct PendingChoice {
    ChoiceKind kind = ChoiceKind::BREACH;
    Actor actor = Actor::PLAYER;
    CardDefID source_card;
    std::string source_name;
    int insert_sp = 0;
    bool is_aoe = false;
    std::vector<std::vector<CardDefID>> rounds;

    const std::vector<CardDefID>& offers() const {
        static const std::vector<CardDefID> empty;
        return rounds.empty() ? empty : rounds.front();
    }

    bool is_offered(const CardDefID& card_id) const {
        const auto& current = offers();
        return std::find(current.begin(), current.end(), card_id) != current.end();
    }

    int remaining_rounds() const { return static_cast<int>(rounds.size()); }
};

// ============================================================================
// PER-SIDE TURN DATA
// ============================================================================

/**
 * What one side did during the current turn.
 */
struct SideTurn {
    std::vector<CardInstance> played;    // Resolved cards, ghosts included
    int accumulated_ether = 0;           // Non-ghost cards by rarity
    int energy_left = 0;
    int attack_cards = 0;                // Committed attack cards
    NextTurnEffects next_turn;           // Banked for the following turn
    int fencing_damage_bonus = 0;        // Battle-long, survives finish_turn

    std::vector<CardCategory> played_categories() const {
        std::vector<CardCategory> categories;
        categories.reserve(played.size());
        for (const auto& card : played) {
            categories.push_back(card.def.category);
        }
        return categories;
    }

    void reset_turn() {
        played.clear();
        accumulated_ether = 0;
        energy_left = 0;
        attack_cards = 0;
    }
};

// ============================================================================
// BATTLE STATE
// ============================================================================

struct BattleState {
    ActorState player;
    ActorState enemy;
    TimelineScheduler scheduler;

    int turn = 1;
    BattlePhase phase = BattlePhase::SELECT;
    BattleResult result = BattleResult::ONGOING;

    // Opened by specials, cleared at turn end
    std::vector<specials::ParryWindow> parry_windows;
    std::vector<specials::GrowingDefense> growing_defenses;
    std::optional<PendingChoice> pending_choice;

    SideTurn player_turn;
    SideTurn enemy_turn;

    AiMode enemy_mode = AiMode::BALANCED;
    bool enemy_overdrive = false;
    std::optional<UnitID> selected_target;
    std::vector<CardDefID> committed_hand;
    std::vector<CardDefID> vanished_cards;   // Removed from the player's pool for the battle

    // Produced between steps (commit collisions, choices), delivered
    // with the next step report
    std::vector<BattleEvent> pending_events;

    int next_instance_id = 1;

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    ActorState& side(Actor actor) { return actor == Actor::PLAYER ? player : enemy; }
    const ActorState& side(Actor actor) const { return actor == Actor::PLAYER ? player : enemy; }

    SideTurn& turn_data(Actor actor) { return actor == Actor::PLAYER ? player_turn : enemy_turn; }
    const SideTurn& turn_data(Actor actor) const {
        return actor == Actor::PLAYER ? player_turn : enemy_turn;
    }

    bool is_over() const { return result != BattleResult::ONGOING; }
    bool awaiting_choice() const { return phase == BattlePhase::AWAITING_CHOICE; }

    bool is_vanished(const CardDefID& card_id) const {
        return std::find(vanished_cards.begin(), vanished_cards.end(), card_id) !=
               vanished_cards.end();
    }

    /**
     * Next queued instance id with a side prefix ("p_", "e_", "g_").
     */
    CardID make_instance_id(const std::string& prefix) {
        return prefix + std::to_string(next_instance_id++);
    }
};

// ============================================================================
// REPORTS
// ============================================================================

/**
 * Outcome of one engine step.
 */
struct StepReport {
    bool resolved = false;                 // A queue item was resolved
    std::optional<QueueItem> item;         // The item, as resolved
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;

    int dealt = 0;
    bool choice_required = false;
    bool turn_complete = false;            // Queue exhausted, call finish_turn()
    bool battle_over = false;
};

/**
 * Outcome of finish_turn().
 */
struct TurnEndReport {
    bool valid = false;
    int turn = 0;
    EtherGain player_ether;
    EtherGain enemy_ether;
    EtherTransfer transfer;
    BattleResult result = BattleResult::ONGOING;
    std::vector<BattleEvent> events;
    std::vector<std::string> logs;
};

} // namespace tactics
