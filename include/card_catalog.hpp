/**
 * Tactics Battle Engine - Card Catalog
 *
 * Stores immutable card definitions loaded from JSON.
 * Provides fast lookup by card id and the filtered pools used by
 * card creation and the enemy planner.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace tactics {

/**
 * Token reference on a card (required cost or granted effect).
 *
 * For applied tokens, target_self selects the card's owner; otherwise
 * the opponent (or the targeted unit of a composite enemy) receives it.
 */
struct TokenGrant {
    TokenID id;
    int stacks = 1;
    bool target_self = true;
};

/**
 * Bonus applied when the card shares its sp with an opposing card.
 *
 * Types: "damage_mult", "block_mult", "push", "gun_attack".
 */
struct CrossBonus {
    std::string type;
    double value = 0.0;
    int count = 0;
};

/**
 * Card definition (immutable).
 */
struct CardDef {
    CardDefID card_id;
    std::string name;
    CardType type = CardType::GENERAL;
    CardCategory category = CardCategory::GENERAL;
    Rarity rarity = Rarity::COMMON;

    int damage = 0;
    int block = 0;
    int hits = 1;
    int speed_cost = 0;
    int action_cost = 0;

    std::vector<std::string> traits;
    std::vector<std::string> specials;

    std::vector<TokenGrant> required_tokens;
    std::vector<TokenGrant> applied_tokens;

    // Tunables for timeline and parry specials (defaults apply when unset)
    std::optional<int> advance_amount;
    std::optional<int> push_amount;
    std::optional<int> parry_range;
    std::optional<int> parry_push_amount;

    std::optional<CrossBonus> cross_bonus;

    bool is_attack() const { return type == CardType::ATTACK; }
    bool is_defense() const { return type == CardType::DEFENSE; }
    bool is_general() const { return type == CardType::GENERAL; }

    bool has_trait(const std::string& trait) const {
        return std::find(traits.begin(), traits.end(), trait) != traits.end();
    }

    bool has_special(const std::string& special) const {
        return std::find(specials.begin(), specials.end(), special) != specials.end();
    }

    bool has_required_tokens() const { return !required_tokens.empty(); }
};

/**
 * CardCatalog - Central card lookup.
 *
 * Holds two pools: cards available to the player and the shared enemy
 * pool. Definitions are never mutated after loading.
 */
class CardCatalog {
public:
    CardCatalog();
    ~CardCatalog() = default;

    /**
     * Load cards from a JSON file with "cards" and "enemy_cards" arrays.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load cards from an already parsed document.
     */
    bool load_from_document(const nlohmann::json& data);

    /**
     * Register a card programmatically.
     *
     * @param card Card definition (skipped if the id is empty)
     * @param enemy_pool True to add to the enemy pool
     */
    void add_card(CardDef card, bool enemy_pool = false);

    /**
     * Get a card definition by ID. Searches both pools.
     *
     * Returns nullptr if card not found.
     */
    const CardDef* get_card(const CardDefID& card_id) const;

    bool has_card(const CardDefID& card_id) const;

    const std::vector<CardDefID>& player_card_ids() const { return player_ids_; }
    const std::vector<CardDefID>& enemy_card_ids() const { return enemy_ids_; }

    std::vector<const CardDef*> player_cards() const;
    std::vector<const CardDef*> enemy_cards() const;

    /**
     * Player attack cards without token requirements.
     * Candidate pool for on-hit card creation.
     */
    std::vector<const CardDef*> creatable_attack_cards() const;

    /**
     * Fencing attack cards without token requirements.
     */
    std::vector<const CardDef*> fencing_attack_cards() const;

    /**
     * Attack, general and special cards without token requirements.
     * Candidate pool for breach selections.
     */
    std::vector<const CardDef*> breach_candidates() const;

    size_t card_count() const { return cards_.size(); }

    /**
     * Static parsing utilities - public for use by other components.
     */
    static CardType parse_card_type(const std::string& s);
    static CardCategory parse_category(const std::string& s);
    static Rarity parse_rarity(const std::string& s);

private:
    std::unordered_map<CardDefID, CardDef> cards_;
    std::vector<CardDefID> player_ids_;
    std::vector<CardDefID> enemy_ids_;

    CardDef parse_card(const nlohmann::json& card_json) const;
    void parse_token_list(const nlohmann::json& list_json,
                          std::vector<TokenGrant>& out) const;
    std::vector<const CardDef*> filter_player_cards(
        bool (*predicate)(const CardDef&)) const;
};

} // namespace tactics
