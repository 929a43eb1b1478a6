/**
 * Tactics Battle Engine - Card Catalog Implementation
 *
 * Loads card definitions from JSON files using nlohmann/json.
 * Missing optional fields fall back to neutral values.
 */

#include "card_catalog.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tactics {

CardCatalog::CardCatalog() {}

bool CardCatalog::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CardCatalog] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_from_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardCatalog] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CardCatalog] Error: " << e.what() << std::endl;
        return false;
    }
}

bool CardCatalog::load_from_document(const json& data) {
    if (!data.is_object() || !data.contains("cards") || !data["cards"].is_array()) {
        std::cerr << "[CardCatalog] No 'cards' array found" << std::endl;
        return false;
    }

    int player_count = 0;
    int enemy_count = 0;

    try {
        for (const auto& card_json : data["cards"]) {
            CardDef card = parse_card(card_json);
            if (!card.card_id.empty()) {
                add_card(std::move(card), false);
                player_count++;
            }
        }

        if (data.contains("enemy_cards") && data["enemy_cards"].is_array()) {
            for (const auto& card_json : data["enemy_cards"]) {
                CardDef card = parse_card(card_json);
                if (!card.card_id.empty()) {
                    add_card(std::move(card), true);
                    enemy_count++;
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[CardCatalog] Malformed card entry: " << e.what() << std::endl;
        return false;
    }

    std::cout << "[CardCatalog] Loaded " << player_count << " player cards, "
              << enemy_count << " enemy cards" << std::endl;
    return true;
}

void CardCatalog::add_card(CardDef card, bool enemy_pool) {
    if (card.card_id.empty()) {
        return;
    }

    CardDefID id = card.card_id;
    bool is_new = cards_.find(id) == cards_.end();
    cards_[id] = std::move(card);

    if (is_new) {
        if (enemy_pool) {
            enemy_ids_.push_back(id);
        } else {
            player_ids_.push_back(id);
        }
    }
}

// ============================================================================
// PARSING
// ============================================================================

CardDef CardCatalog::parse_card(const json& card_json) const {
    CardDef card;

    if (!card_json.is_object()) {
        return card;
    }

    card.card_id = card_json.value("id", "");
    card.name = card_json.value("name", card.card_id);

    if (card.card_id.empty()) {
        return card;  // Invalid card
    }

    card.type = parse_card_type(card_json.value("type", "general"));
    card.category = parse_category(card_json.value("cardCategory", "general"));
    card.rarity = parse_rarity(card_json.value("rarity", "common"));

    card.damage = std::max(0, card_json.value("damage", 0));
    card.block = std::max(0, card_json.value("block", 0));
    card.hits = std::max(1, card_json.value("hits", 1));
    card.speed_cost = std::max(0, card_json.value("speedCost", 0));
    card.action_cost = std::max(0, card_json.value("actionCost", 0));

    if (card_json.contains("traits") && card_json["traits"].is_array()) {
        for (const auto& t : card_json["traits"]) {
            if (t.is_string()) card.traits.push_back(t.get<std::string>());
        }
    }

    // "special" may be a single name or a list of names
    if (card_json.contains("special")) {
        const auto& special = card_json["special"];
        if (special.is_string()) {
            card.specials.push_back(special.get<std::string>());
        } else if (special.is_array()) {
            for (const auto& s : special) {
                if (s.is_string()) card.specials.push_back(s.get<std::string>());
            }
        }
    }

    if (card_json.contains("requiredTokens")) {
        parse_token_list(card_json["requiredTokens"], card.required_tokens);
    }
    if (card_json.contains("appliedTokens")) {
        parse_token_list(card_json["appliedTokens"], card.applied_tokens);
    }

    if (card_json.contains("advanceAmount") && card_json["advanceAmount"].is_number()) {
        card.advance_amount = card_json["advanceAmount"].get<int>();
    }
    if (card_json.contains("pushAmount") && card_json["pushAmount"].is_number()) {
        card.push_amount = card_json["pushAmount"].get<int>();
    }
    if (card_json.contains("parryRange") && card_json["parryRange"].is_number()) {
        card.parry_range = card_json["parryRange"].get<int>();
    }
    if (card_json.contains("parryPushAmount") && card_json["parryPushAmount"].is_number()) {
        card.parry_push_amount = card_json["parryPushAmount"].get<int>();
    }

    if (card_json.contains("crossBonus") && card_json["crossBonus"].is_object()) {
        const auto& bonus_json = card_json["crossBonus"];
        CrossBonus bonus;
        bonus.type = bonus_json.value("type", "");
        bonus.value = bonus_json.value("value", 0.0);
        bonus.count = bonus_json.value("count", 0);
        if (!bonus.type.empty()) {
            card.cross_bonus = bonus;
        }
    }

    return card;
}

void CardCatalog::parse_token_list(const json& list_json,
                                   std::vector<TokenGrant>& out) const {
    if (!list_json.is_array()) {
        return;
    }

    for (const auto& entry : list_json) {
        TokenGrant grant;
        if (entry.is_string()) {
            grant.id = entry.get<std::string>();
        } else if (entry.is_object()) {
            grant.id = entry.value("id", "");
            grant.stacks = std::max(1, entry.value("stacks", 1));
            grant.target_self = entry.value("target", "self") != "enemy";
        }
        if (!grant.id.empty()) {
            out.push_back(grant);
        }
    }
}

CardType CardCatalog::parse_card_type(const std::string& s) {
    if (s == "attack") return CardType::ATTACK;
    if (s == "defense") return CardType::DEFENSE;
    if (s == "special") return CardType::SPECIAL;
    return CardType::GENERAL;
}

CardCategory CardCatalog::parse_category(const std::string& s) {
    if (s == "fencing") return CardCategory::FENCING;
    if (s == "gun") return CardCategory::GUN;
    if (s == "special") return CardCategory::SPECIAL;
    return CardCategory::GENERAL;
}

Rarity CardCatalog::parse_rarity(const std::string& s) {
    if (s == "rare") return Rarity::RARE;
    if (s == "special") return Rarity::SPECIAL;
    if (s == "legendary") return Rarity::LEGENDARY;
    return Rarity::COMMON;
}

// ============================================================================
// LOOKUP
// ============================================================================

const CardDef* CardCatalog::get_card(const CardDefID& card_id) const {
    auto it = cards_.find(card_id);
    if (it != cards_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool CardCatalog::has_card(const CardDefID& card_id) const {
    return cards_.find(card_id) != cards_.end();
}

std::vector<const CardDef*> CardCatalog::player_cards() const {
    std::vector<const CardDef*> result;
    result.reserve(player_ids_.size());
    for (const auto& id : player_ids_) {
        result.push_back(&cards_.at(id));
    }
    return result;
}

std::vector<const CardDef*> CardCatalog::enemy_cards() const {
    std::vector<const CardDef*> result;
    result.reserve(enemy_ids_.size());
    for (const auto& id : enemy_ids_) {
        result.push_back(&cards_.at(id));
    }
    return result;
}

std::vector<const CardDef*> CardCatalog::filter_player_cards(
    bool (*predicate)(const CardDef&)) const {
    std::vector<const CardDef*> result;
    for (const auto& id : player_ids_) {
        const CardDef& card = cards_.at(id);
        if (predicate(card)) {
            result.push_back(&card);
        }
    }
    return result;
}

std::vector<const CardDef*> CardCatalog::creatable_attack_cards() const {
    return filter_player_cards([](const CardDef& c) {
        return c.is_attack() && !c.has_required_tokens();
    });
}

std::vector<const CardDef*> CardCatalog::fencing_attack_cards() const {
    return filter_player_cards([](const CardDef& c) {
        return c.is_attack() && c.category == CardCategory::FENCING &&
               !c.has_required_tokens();
    });
}

std::vector<const CardDef*> CardCatalog::breach_candidates() const {
    return filter_player_cards([](const CardDef& c) {
        return (c.is_attack() || c.is_general() || c.type == CardType::SPECIAL) &&
               !c.has_required_tokens();
    });
}

} // namespace tactics
