/**
 * Tactics Battle Engine - Card Instance
 *
 * A queued copy of a catalog card with the transient fields that card
 * creation, targeting and special effects attach to it.
 */

#pragma once

#include "card_catalog.hpp"

namespace tactics {

/**
 * CardInstance - A card placed on the timeline.
 *
 * Carries a full copy of its definition so created cards and queued
 * copies stay valid independently of the catalog's lifetime.
 */
struct CardInstance {
    // Identity
    CardID id;                     // Unique per battle (e.g., "p_3")
    CardDef def;

    // Creation metadata
    bool is_ghost = false;         // Created mid-turn, never counted for ether or combos
    std::optional<CardDefID> created_by;
    bool is_from_fleche = false;
    int fleche_chain_count = 0;    // Generations of on-hit creation behind this card

    // Targeting (composite enemies)
    std::optional<UnitID> target_unit_id;
    std::vector<UnitID> target_unit_ids;
    bool is_aoe = false;
    std::optional<UnitID> source_unit_id;   // Enemy unit that plays this card

    // Overrides
    bool ignore_block = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    CardInstance() = default;

    CardInstance(CardID id_, CardDef def_)
        : id(std::move(id_))
        , def(std::move(def_))
    {}

    static CardInstance from_def(const CardID& id, const CardDef& def) {
        return CardInstance(id, def);
    }

    // ========================================================================
    // HELPERS
    // ========================================================================

    const CardDefID& card_id() const { return def.card_id; }
    const std::string& name() const { return def.name; }

    bool is_attack() const { return def.is_attack(); }
    bool has_trait(const std::string& trait) const { return def.has_trait(trait); }
    bool has_special(const std::string& special) const { return def.has_special(special); }

    /**
     * AOE either from the card itself or from the creation that spawned it.
     */
    bool hits_all_units() const {
        return is_aoe || def.has_special("aoeAttack");
    }

    bool is_gun_attack() const {
        return def.is_attack() && def.category == CardCategory::GUN;
    }
};

} // namespace tactics
