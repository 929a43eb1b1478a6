/**
 * Tactics Battle Engine - Ether / Combo Economy Implementation
 */

#include "ether_economy.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <sstream>

namespace tactics {

namespace {

int effective_cost(const CardInstance& card) {
    return card.def.action_cost > 0 ? card.def.action_cost : 1;
}

ComboResult make_combo(ComboType type, std::vector<int> keys) {
    ComboResult result;
    result.type = type;
    result.name = to_string(type);
    result.multiplier = combo_multiplier(type);
    result.bonus_keys = std::move(keys);
    return result;
}

std::string side_name(const ActorState& side) {
    return side.side == Actor::PLAYER ? "Player" : "Enemy";
}

} // anonymous namespace

const char* to_string(ComboType combo) {
    switch (combo) {
        case ComboType::HIGH_CARD: return "High Card";
        case ComboType::PAIR: return "Pair";
        case ComboType::TWO_PAIR: return "Two Pair";
        case ComboType::TRIPLE: return "Triple";
        case ComboType::FLUSH: return "Flush";
        case ComboType::FULL_HOUSE: return "Full House";
        case ComboType::FOUR_CARD: return "Four Card";
        case ComboType::FIVE_CARD: return "Five Card";
    }
    return "High Card";
}

double combo_multiplier(ComboType combo) {
    switch (combo) {
        case ComboType::HIGH_CARD: return 1.0;
        case ComboType::PAIR: return 2.0;
        case ComboType::TWO_PAIR: return 2.5;
        case ComboType::TRIPLE: return 3.0;
        case ComboType::FLUSH: return 3.5;
        case ComboType::FULL_HOUSE: return 3.75;
        case ComboType::FOUR_CARD: return 4.0;
        case ComboType::FIVE_CARD: return 5.0;
    }
    return 1.0;
}

// ============================================================================
// CARD VALUES
// ============================================================================

int card_ether(const CardDef& card) {
    switch (card.rarity) {
        case Rarity::COMMON: return 10;
        case Rarity::RARE: return 25;
        case Rarity::SPECIAL: return 100;
        case Rarity::LEGENDARY: return 500;
    }
    return 10;
}

std::vector<const CardInstance*> combo_cards(const std::vector<CardInstance>& played) {
    std::vector<const CardInstance*> cards;
    for (const auto& card : played) {
        if (card.is_ghost || card.has_trait("outcast")) {
            continue;
        }
        cards.push_back(&card);
    }
    return cards;
}

// ============================================================================
// COMBOS
// ============================================================================

ComboResult detect_combo(const std::vector<CardInstance>& played) {
    const auto cards = combo_cards(played);
    if (cards.empty()) {
        return make_combo(ComboType::HIGH_CARD, {});
    }
    if (cards.size() == 1) {
        return make_combo(ComboType::HIGH_CARD, {effective_cost(*cards.front())});
    }

    std::map<int, int> freq;
    int attack_count = 0;
    int defensive_count = 0;
    std::map<CardCategory, int> category_count;
    for (const CardInstance* card : cards) {
        freq[effective_cost(*card)]++;
        if (card->def.type == CardType::ATTACK) {
            attack_count++;
        } else if (card->def.type == CardType::GENERAL || card->def.type == CardType::DEFENSE) {
            defensive_count++;
        }
        category_count[card->def.category]++;
    }

    std::vector<int> counts;
    for (const auto& entry : freq) {
        counts.push_back(entry.second);
    }
    std::sort(counts.begin(), counts.end(), std::greater<int>());
    const int first = counts[0];
    const int second = counts.size() > 1 ? counts[1] : 0;

    auto keys_with = [&freq](int n) {
        std::vector<int> keys;
        for (const auto& entry : freq) {
            if (entry.second >= n) keys.push_back(entry.first);
        }
        return keys;
    };

    const bool type_flush = attack_count >= 4 || defensive_count >= 4;
    const bool category_flush = category_count[CardCategory::FENCING] >= 4 ||
                                category_count[CardCategory::GUN] >= 4 ||
                                category_count[CardCategory::SPECIAL] >= 4;

    if (first >= 5) return make_combo(ComboType::FIVE_CARD, keys_with(5));
    if (first >= 4) return make_combo(ComboType::FOUR_CARD, keys_with(4));
    if (first >= 3 && second >= 2) return make_combo(ComboType::FULL_HOUSE, keys_with(2));
    if (type_flush || category_flush) return make_combo(ComboType::FLUSH, {});
    if (first >= 3) return make_combo(ComboType::TRIPLE, keys_with(3));
    if (first >= 2 && second >= 2) return make_combo(ComboType::TWO_PAIR, keys_with(2));
    if (first >= 2) return make_combo(ComboType::PAIR, keys_with(2));

    std::vector<int> all_keys;
    for (const auto& entry : freq) {
        all_keys.push_back(entry.first);
    }
    return make_combo(ComboType::HIGH_CARD, all_keys);
}

double action_cost_bonus(const std::vector<CardInstance>& played) {
    double bonus = 0.0;
    for (const CardInstance* card : combo_cards(played)) {
        const int cost = effective_cost(*card);
        if (cost >= 2) {
            bonus += (cost - 1) * 0.5;
        }
    }
    return bonus;
}

double deflation_multiplier(const std::string& combo_name,
                            const std::map<std::string, int>& usage,
                            int* usage_count) {
    auto it = usage.find(combo_name);
    const int count = it != usage.end() ? it->second : 0;
    if (usage_count) {
        *usage_count = count;
    }
    return std::pow(DEFLATION_RATE, count);
}

// ============================================================================
// TURN END
// ============================================================================

EtherGain calculate_turn_ether(const std::vector<CardInstance>& played,
                               int accumulated,
                               const ActorState& side) {
    EtherGain gain;
    gain.accumulated = accumulated;
    gain.combo = detect_combo(played);
    gain.cost_bonus = action_cost_bonus(played);
    gain.deflation = deflation_multiplier(gain.combo.name, side.combo_usage, &gain.usage_count);

    const double total = accumulated * (gain.combo.multiplier + gain.cost_bonus) * gain.deflation;
    gain.final_ether = static_cast<int>(std::lround(total));

    if (side.side == Actor::ENEMY && side.tokens.has("half_ether")) {
        gain.final_ether = gain.final_ether / 2;
        gain.halved = true;
    }

    gain.applied_ether = gain.final_ether;
    if (side.side == Actor::PLAYER && side.ether_ban) {
        gain.applied_ether = 0;
        gain.banned = true;
    }

    if (accumulated > 0) {
        std::ostringstream msg;
        msg << side_name(side) << " ether: " << accumulated << " x (" << gain.combo.name
            << " " << gain.combo.multiplier;
        if (gain.cost_bonus > 0.0) {
            msg << " + " << gain.cost_bonus;
        }
        msg << ")";
        if (gain.usage_count > 0) {
            msg << " x deflation " << gain.deflation << " (" << gain.usage_count << " uses)";
        }
        if (gain.halved) {
            msg << " x 0.5 (half ether)";
        }
        msg << " = " << gain.final_ether;
        gain.logs.push_back(msg.str());
    }
    if (gain.banned && gain.final_ether > 0) {
        gain.logs.push_back(side_name(side) + " ether gain blocked (ether ban)");
    }
    return gain;
}

EtherTransfer calculate_ether_transfer(int player_applied,
                                       int enemy_applied,
                                       int player_pts,
                                       int enemy_pts,
                                       int enemy_hp) {
    EtherTransfer transfer;
    transfer.net = player_applied - enemy_applied;
    transfer.next_player_pts = player_pts;
    transfer.next_enemy_pts = enemy_pts;

    if (transfer.net > 0) {
        const int moved = std::min(transfer.net, std::max(0, enemy_pts));
        transfer.next_player_pts += moved;
        transfer.next_enemy_pts -= moved;
        transfer.moved = moved;
    } else if (transfer.net < 0) {
        const int moved = std::min(-transfer.net, std::max(0, player_pts));
        transfer.next_player_pts -= moved;
        transfer.next_enemy_pts += moved;
        transfer.moved = -moved;
    }

    if (transfer.moved != 0) {
        transfer.logs.push_back(std::string("Ether transfer: ") +
                                (transfer.moved > 0 ? "enemy -> player " : "player -> enemy ") +
                                std::to_string(std::abs(transfer.moved)));
    }

    if (enemy_hp <= 0 && transfer.next_enemy_pts > 0) {
        transfer.forfeited = transfer.next_enemy_pts;
        transfer.next_player_pts += transfer.forfeited;
        transfer.next_enemy_pts = 0;
        transfer.moved += transfer.forfeited;
        transfer.logs.push_back("Enemy defeated: residual ether " +
                                std::to_string(transfer.forfeited) + " recovered");
    }
    return transfer;
}

void record_combo_usage(ActorState& side, const ComboResult& combo) {
    side.combo_usage[combo.name]++;
}

int calculate_ether_slots(int ether_pts) {
    return ether_pts > 0 ? ether_pts / ETHER_THRESHOLD : 0;
}

} // namespace tactics
