/**
 * Tactics Battle Engine - Ether / Combo Economy
 *
 * Turn-boundary resource system. Cards played during a turn accumulate
 * ether by rarity; at turn end a poker-style combo over the played cards'
 * action costs multiplies it, repeated combos deflate, and the two sides'
 * results are netted into a transfer between their persistent pools.
 */

#pragma once

#include "actor_state.hpp"
#include "card_instance.hpp"

namespace tactics {

constexpr int ETHER_THRESHOLD = 100;       // Points per ether slot
constexpr double DEFLATION_RATE = 0.8;

enum class ComboType : uint8_t {
    HIGH_CARD,
    PAIR,
    TWO_PAIR,
    TRIPLE,
    FLUSH,
    FULL_HOUSE,
    FOUR_CARD,
    FIVE_CARD
};

const char* to_string(ComboType combo);
double combo_multiplier(ComboType combo);

struct ComboResult {
    ComboType type = ComboType::HIGH_CARD;
    std::string name = "High Card";
    double multiplier = 1.0;
    std::vector<int> bonus_keys;   // Action costs forming the combo (empty for flush)
};

/**
 * Per-side ether outcome of a turn.
 */
struct EtherGain {
    int accumulated = 0;
    ComboResult combo;
    double cost_bonus = 0.0;
    double deflation = 1.0;
    int usage_count = 0;
    int final_ether = 0;     // After combo, cost bonus, deflation and halving
    int applied_ether = 0;   // What enters the transfer (0 under etherBan)
    bool halved = false;
    bool banned = false;
    std::vector<std::string> logs;
};

struct EtherTransfer {
    int net = 0;                 // player applied - enemy applied
    int moved = 0;               // Positive toward the player
    int forfeited = 0;           // Enemy residual taken on defeat
    int next_player_pts = 0;
    int next_enemy_pts = 0;
    std::vector<std::string> logs;
};

// ============================================================================
// CARD VALUES
// ============================================================================

/**
 * Ether for one played card: common 10, rare 25, special 100, legendary 500.
 */
int card_ether(const CardDef& card);

/**
 * Cards that count toward combos and cost bonus (no ghosts, no outcast).
 */
std::vector<const CardInstance*> combo_cards(const std::vector<CardInstance>& played);

// ============================================================================
// COMBOS
// ============================================================================

/**
 * Detect the best combo by action-cost frequency (cost 0 counts as 1).
 *
 * Priority: five card, four card, full house, flush (4+ cards sharing an
 * attack/defensive type or a fencing/gun/special category), triple,
 * two pair, pair, high card.
 */
ComboResult detect_combo(const std::vector<CardInstance>& played);

/**
 * +(cost - 1) x 0.5 for every counted card of cost 2 or more.
 */
double action_cost_bonus(const std::vector<CardInstance>& played);

/**
 * 0.8 ^ times the combo was already used by this side.
 */
double deflation_multiplier(const std::string& combo_name,
                            const std::map<std::string, int>& usage,
                            int* usage_count = nullptr);

// ============================================================================
// TURN END
// ============================================================================

/**
 * Final ether for one side.
 *
 * final = round(accumulated x (combo + cost bonus) x deflation), halved
 * when the side holds half_ether. The player's applied ether is zeroed
 * by etherBan.
 */
EtherGain calculate_turn_ether(const std::vector<CardInstance>& played,
                               int accumulated,
                               const ActorState& side);

/**
 * Net the two sides' applied ether into a pool transfer, bounded by the
 * paying side's pool. A defeated enemy forfeits its whole residual pool.
 */
EtherTransfer calculate_ether_transfer(int player_applied,
                                       int enemy_applied,
                                       int player_pts,
                                       int enemy_pts,
                                       int enemy_hp);

/**
 * Count one use of a combo for deflation.
 */
void record_combo_usage(ActorState& side, const ComboResult& combo);

/**
 * Ether slots a pool provides (one per ETHER_THRESHOLD points).
 */
int calculate_ether_slots(int ether_pts);

} // namespace tactics
