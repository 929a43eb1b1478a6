/**
 * Tactics Battle Engine - Token Effects Implementation
 */

#include "token_effects.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace tactics {

namespace {

int round_to_int(double v) {
    return static_cast<int>(std::lround(v));
}

int percent(double v) {
    return round_to_int(v * 100.0);
}

/**
 * Sum of value x stacks over turn tokens with the given effect type.
 */
double sum_turn_effect(const TokenStore& tokens, TokenEffectType type) {
    double total = 0.0;
    for (const auto& token : tokens.tokens(TokenLifetime::TURN)) {
        const TokenDef* def = find_token_def(token.id);
        if (def && def->effect.type == type) {
            total += def->effect.value * token.stacks;
        }
    }
    return total;
}

/**
 * First usage token with the given effect type, or nullptr.
 */
const TokenDef* first_usage_effect(const TokenStore& tokens, TokenEffectType type) {
    for (const auto& token : tokens.tokens(TokenLifetime::USAGE)) {
        const TokenDef* def = find_token_def(token.id);
        if (def && def->effect.type == type && token.stacks > 0) {
            return def;
        }
    }
    return nullptr;
}

/**
 * Sum of value x stacks over every bucket.
 */
double sum_all_effect(const TokenStore& tokens, TokenEffectType type) {
    double total = 0.0;
    for (const auto& token : tokens.all()) {
        const TokenDef* def = find_token_def(token.id);
        if (def && def->effect.type == type) {
            total += def->effect.value * token.stacks;
        }
    }
    return total;
}

} // anonymous namespace

// ============================================================================
// OUTGOING VALUES
// ============================================================================

CardValueModifier apply_tokens_to_damage(int damage, const TokenStore& tokens) {
    CardValueModifier result;
    result.value = damage;
    if (damage <= 0) {
        return result;
    }

    double boost = sum_turn_effect(tokens, TokenEffectType::ATTACK_BOOST);
    if (const TokenDef* usage = first_usage_effect(tokens, TokenEffectType::ATTACK_BOOST)) {
        boost += usage->effect.value;
        result.consumed.push_back({usage->id, TokenLifetime::USAGE});
    }
    if (boost > 0.0) {
        result.value = round_to_int(result.value * (1.0 + boost));
    }

    double penalty = sum_turn_effect(tokens, TokenEffectType::ATTACK_PENALTY);
    if (penalty > 0.0) {
        result.value = std::max(0, round_to_int(result.value * (1.0 - penalty)));
    }
    return result;
}

CardValueModifier apply_tokens_to_block(int block, const TokenStore& tokens) {
    CardValueModifier result;
    result.value = block;
    if (block <= 0) {
        return result;
    }

    double boost = sum_turn_effect(tokens, TokenEffectType::DEFENSE_BOOST);
    if (const TokenDef* usage = first_usage_effect(tokens, TokenEffectType::DEFENSE_BOOST)) {
        boost += usage->effect.value;
        result.consumed.push_back({usage->id, TokenLifetime::USAGE});
    }
    if (boost > 0.0) {
        result.value = round_to_int(result.value * (1.0 + boost));
    }

    double penalty = sum_turn_effect(tokens, TokenEffectType::DEFENSE_PENALTY);
    if (const TokenDef* usage = first_usage_effect(tokens, TokenEffectType::DEFENSE_PENALTY)) {
        penalty += usage->effect.value;
        result.consumed.push_back({usage->id, TokenLifetime::USAGE});
    }
    if (penalty > 0.0) {
        result.value = std::max(0, round_to_int(result.value * (1.0 - penalty)));
    }
    return result;
}

int apply_tokens_on_energy(int base_energy, const TokenStore& tokens) {
    double modifier = sum_all_effect(tokens, TokenEffectType::ENERGY_BOOST) -
                      sum_all_effect(tokens, TokenEffectType::ENERGY_PENALTY);
    return std::max(0, base_energy + round_to_int(modifier));
}

int total_strength(int base_strength, const TokenStore& tokens) {
    return base_strength + round_to_int(sum_all_effect(tokens, TokenEffectType::STRENGTH));
}

int total_agility(int base_agility, const TokenStore& tokens) {
    return base_agility + round_to_int(sum_all_effect(tokens, TokenEffectType::AGILITY));
}

double crit_chance(const TokenStore& tokens, double base_chance) {
    return base_chance + tokens.stacks("crit_boost") * 0.05;
}

// ============================================================================
// INCOMING VALUES
// ============================================================================

DamageTokenOutcome apply_tokens_on_damage(int damage,
                                          const TokenStore& defender_tokens,
                                          int defender_strength,
                                          Rng& rng) {
    DamageTokenOutcome result;
    result.final_damage = damage;

    const auto all = defender_tokens.all();

    // 1. Dodge
    for (const auto& token : all) {
        const TokenDef* def = find_token_def(token.id);
        if (!def || def->effect.type != TokenEffectType::DODGE) {
            continue;
        }

        bool is_usage = def->lifetime == TokenLifetime::USAGE;
        if (is_usage) {
            result.consumed.push_back({def->id, TokenLifetime::USAGE});
        }

        if (rng.next_double() < def->effect.value) {
            result.logs.push_back(def->name + " triggered! Attack dodged!");
            result.final_damage = 0;
            result.dodged = true;
            return result;
        }

        std::ostringstream msg;
        msg << def->name << " failed (" << percent(def->effect.value) << "% chance)";
        result.logs.push_back(msg.str());
        break;
    }

    // 2. Damage taken
    double multiplier = 1.0;
    for (const auto& token : all) {
        const TokenDef* def = find_token_def(token.id);
        if (!def || def->effect.type != TokenEffectType::DAMAGE_TAKEN) {
            continue;
        }

        std::ostringstream msg;
        if (def->lifetime == TokenLifetime::TURN) {
            multiplier += def->effect.value * token.stacks;
            msg << def->name << ": damage +" << percent(def->effect.value * token.stacks) << "%";
        } else if (def->lifetime == TokenLifetime::USAGE) {
            multiplier += def->effect.value;
            result.consumed.push_back({def->id, TokenLifetime::USAGE});
            msg << def->name << " consumed: damage +" << percent(def->effect.value) << "%";
        } else {
            continue;
        }
        result.logs.push_back(msg.str());
    }
    result.final_damage = round_to_int(result.final_damage * multiplier);

    // 3. Counter
    for (const auto& token : all) {
        const TokenDef* def = find_token_def(token.id);
        if (!def || def->effect.type != TokenEffectType::COUNTER) {
            continue;
        }
        result.reflected = round_to_int(def->effect.value) + defender_strength;
        result.consumed.push_back({def->id, def->lifetime});
        std::ostringstream msg;
        msg << def->name << " triggered! " << result.reflected << " reflected";
        result.logs.push_back(msg.str());
        break;
    }

    return result;
}

HealTokenOutcome apply_tokens_on_heal(int damage_dealt, const TokenStore& tokens) {
    HealTokenOutcome result;
    for (const auto& token : tokens.all()) {
        const TokenDef* def = find_token_def(token.id);
        if (!def || def->effect.type != TokenEffectType::LIFESTEAL) {
            continue;
        }
        result.healing = round_to_int(damage_dealt * def->effect.value);
        result.consumed.push_back({def->id, def->lifetime});
        std::ostringstream msg;
        msg << def->name << " triggered! Healed " << result.healing;
        result.logs.push_back(msg.str());
        break;
    }
    return result;
}

ReviveOutcome check_revive(int max_hp, const TokenStore& tokens) {
    ReviveOutcome result;
    for (const auto& token : tokens.all()) {
        const TokenDef* def = find_token_def(token.id);
        if (!def || def->effect.type != TokenEffectType::REVIVE) {
            continue;
        }
        result.revived = true;
        result.new_hp = round_to_int(max_hp * def->effect.value);
        std::ostringstream msg;
        msg << def->name << " triggered! Revived with " << result.new_hp << " hp";
        result.logs.push_back(msg.str());
        break;
    }
    return result;
}

int burn_damage(const TokenStore& tokens) {
    return round_to_int(sum_all_effect(tokens, TokenEffectType::BURN));
}

TokenResult consume_tokens(TokenStore& tokens, const std::vector<ConsumedToken>& consumed) {
    TokenResult result;
    for (const auto& entry : consumed) {
        result.append(tokens.remove(entry.id, entry.lifetime, 1));
    }
    return result;
}

} // namespace tactics
