/**
 * Tactics Battle Engine - Special Registry Implementation
 */

#include "special_registry.hpp"

namespace tactics {

// ============================================================================
// OUTCOME / CONTEXT HELPERS
// ============================================================================

void SpecialOutcome::merge(const SpecialOutcome& other) {
    events.insert(events.end(), other.events.begin(), other.events.end());
    logs.insert(logs.end(), other.logs.begin(), other.logs.end());
    extra_hits += other.extra_hits;
    bonus_cards.insert(bonus_cards.end(), other.bonus_cards.begin(), other.bonus_cards.end());
    next_turn.merge(other.next_turn);
    fencing_damage_bonus += other.fencing_damage_bonus;

    trigger_breach = trigger_breach || other.trigger_breach;
    trigger_fencing_creation = trigger_fencing_creation || other.trigger_fencing_creation;
    open_parry_window = open_parry_window || other.open_parry_window;
    start_growing_defense = start_growing_defense || other.start_growing_defense;
    stun = stun || other.stun;
    vanish = vanish || other.vanish;
}

void SpecialContext::grant(TokenStore& store, const TokenID& id, int stacks) {
    TokenResult result = store.add(id, stacks, resolve.granted_at());
    outcome.add_logs(result.logs);
}

// ============================================================================
// REGISTRATION
// ============================================================================

void SpecialRegistry::register_pre_attack(const std::string& kind,
                                          const std::string& name,
                                          SpecialHandler handler) {
    pre_attack_[make_key(kind, name)] = std::move(handler);
}

void SpecialRegistry::register_post_attack(const std::string& kind,
                                           const std::string& name,
                                           SpecialHandler handler) {
    post_attack_[make_key(kind, name)] = std::move(handler);
}

void SpecialRegistry::register_card_play(const std::string& kind,
                                         const std::string& name,
                                         SpecialHandler handler) {
    card_play_[make_key(kind, name)] = std::move(handler);
}

// ============================================================================
// LOOKUP
// ============================================================================

bool SpecialRegistry::has_pre_attack(const std::string& kind, const std::string& name) const {
    return pre_attack_.find(make_key(kind, name)) != pre_attack_.end();
}

bool SpecialRegistry::has_post_attack(const std::string& kind, const std::string& name) const {
    return post_attack_.find(make_key(kind, name)) != post_attack_.end();
}

bool SpecialRegistry::has_card_play(const std::string& kind, const std::string& name) const {
    return card_play_.find(make_key(kind, name)) != card_play_.end();
}

// ============================================================================
// INVOCATION
// ============================================================================

int SpecialRegistry::apply(const HandlerMap& handlers, SpecialContext& ctx) {
    if (handlers.empty()) {
        return 0;
    }

    // Handlers may rewrite the card, so walk copies of its tag lists
    const std::vector<std::string> specials = ctx.card.def.specials;
    const std::vector<std::string> traits = ctx.card.def.traits;

    int invoked = 0;
    for (const auto& special : specials) {
        auto it = handlers.find(make_key("special", special));
        if (it != handlers.end()) {
            it->second(ctx);
            invoked++;
        }
    }
    for (const auto& trait : traits) {
        auto it = handlers.find(make_key("trait", trait));
        if (it != handlers.end()) {
            it->second(ctx);
            invoked++;
        }
    }
    return invoked;
}

int SpecialRegistry::apply_pre_attack(SpecialContext& ctx) const {
    return apply(pre_attack_, ctx);
}

int SpecialRegistry::apply_post_attack(SpecialContext& ctx) const {
    return apply(post_attack_, ctx);
}

int SpecialRegistry::apply_card_play(SpecialContext& ctx) const {
    return apply(card_play_, ctx);
}

// ============================================================================
// GLOBAL REGISTRY
// ============================================================================

SpecialRegistry& get_special_registry() {
    static SpecialRegistry instance;
    return instance;
}

} // namespace tactics
