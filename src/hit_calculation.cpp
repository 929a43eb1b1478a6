/**
 * Tactics Battle Engine - Hit Calculation Implementation
 */

#include "hit_calculation.hpp"
#include "token_effects.hpp"
#include <cmath>

namespace tactics {

namespace {

std::string attack_label(const ActorState& attacker, const ActorState& defender,
                         const CardInstance& card) {
    return attacker.name + "(" + card.name() + ") -> " + defender.name;
}

void push_event(HitResult& result, EventType type, Actor actor, int amount,
                const std::string& card, const std::string& message) {
    result.events.push_back(BattleEvent{type, actor, amount, card, message});
    result.logs.push_back(message);
}

} // anonymous namespace

bool roll_critical(const CardInstance& card,
                   const TokenStore& attacker_tokens,
                   double base_chance,
                   Rng& rng) {
    if (card.has_special("guaranteedCrit")) {
        return true;
    }
    return rng.next_double() < crit_chance(attacker_tokens, base_chance);
}

HitResult calculate_single_hit(ActorState& attacker,
                               ActorState& defender,
                               const CardInstance& card,
                               Actor actor,
                               bool is_critical,
                               const HitOptions& options,
                               Rng& rng) {
    HitResult result;
    result.is_critical = is_critical;

    TokenStore& defender_tokens = options.defender_tokens ? *options.defender_tokens
                                                          : defender.tokens;
    const std::string label = attack_label(attacker, defender, card);
    const std::string ghost_text = card.is_ghost ? " [ghost]" : "";
    const std::string crit_text = is_critical ? " [critical!]" : "";

    // ========================================================================
    // Base damage
    // ========================================================================

    const int fencing_bonus = card.def.category == CardCategory::FENCING
        ? options.fencing_damage_bonus : 0;
    int dmg = card.def.damage + fencing_bonus +
              total_strength(attacker.strength, attacker.tokens);
    dmg = std::max(0, dmg);
    if (is_critical) {
        dmg = static_cast<int>(std::lround(dmg * options.crit_multiplier));
    }

    // ========================================================================
    // Defender tokens
    // ========================================================================

    DamageTokenOutcome token_outcome =
        apply_tokens_on_damage(dmg, defender_tokens, defender.strength, rng);
    TokenResult consumed = consume_tokens(defender_tokens, token_outcome.consumed);
    result.logs.insert(result.logs.end(), consumed.logs.begin(), consumed.logs.end());

    if (token_outcome.dodged) {
        result.dodged = true;
        std::string msg = label + " • dodged";
        for (const auto& line : token_outcome.logs) {
            msg += " (" + line + ")";
        }
        push_event(result, EventType::DODGE, actor, 0, card.name(), msg);
        return result;
    }
    result.logs.insert(result.logs.end(), token_outcome.logs.begin(), token_outcome.logs.end());
    dmg = token_outcome.final_damage;

    // ========================================================================
    // Block
    // ========================================================================

    int final_dmg = 0;
    const bool ignore_block = card.ignore_block ||
                              card.has_special("ignoreBlock") ||
                              card.has_special("piercing");

    if (!ignore_block && defender.def && defender.block > 0) {
        const int crush_multiplier = card.has_trait("crush") ? 2 : 1;
        const std::string crush_text = crush_multiplier > 1 ? " [crush x2]" : "";
        const int before_block = defender.block;
        const int effective = dmg * crush_multiplier;

        if (effective < before_block) {
            defender.block = before_block - effective;
            result.block_destroyed = effective;
            result.fully_blocked = true;
            push_event(result, EventType::BLOCK, actor, effective, card.name(),
                       label + " • attack " + std::to_string(effective) + crit_text + crush_text +
                       " - block " + std::to_string(before_block) + " = blocked (block left " +
                       std::to_string(defender.block) + ")" + ghost_text);
            return result;
        }

        final_dmg = effective - before_block;
        defender.block = 0;
        result.block_destroyed = before_block;

        const int before_hp = defender.hp;
        defender.hp = std::max(0, defender.hp - final_dmg);
        push_event(result, EventType::DAMAGE, actor, final_dmg, card.name(),
                   label + " • attack " + std::to_string(effective) + crit_text + crush_text +
                   " - block " + std::to_string(before_block) + " = " + std::to_string(final_dmg) +
                   " damage (hp " + std::to_string(before_hp) + " -> " +
                   std::to_string(defender.hp) + ")" + ghost_text);
    } else {
        final_dmg = dmg;
        const int before_hp = defender.hp;
        defender.hp = std::max(0, defender.hp - final_dmg);
        const std::string bypass_text = ignore_block && defender.block > 0 ? " [ignores block]" : "";
        push_event(result, EventType::DAMAGE, actor, final_dmg, card.name(),
                   label + " • " + std::to_string(final_dmg) + " damage" + crit_text + bypass_text +
                   " (hp " + std::to_string(before_hp) + " -> " + std::to_string(defender.hp) + ")" +
                   ghost_text);
    }

    result.damage = final_dmg;

    // ========================================================================
    // Counter
    // ========================================================================

    const int total_counter = defender.counter + token_outcome.reflected;
    if (total_counter > 0 && final_dmg > 0) {
        const int before_hp = attacker.hp;
        attacker.hp = std::max(0, attacker.hp - total_counter);
        result.damage_taken += total_counter;
        push_event(result, EventType::COUNTER, opponent_of(actor), total_counter, card.name(),
                   defender.name + " -> " + attacker.name + " • counter " +
                   std::to_string(total_counter) + " (hp " + std::to_string(before_hp) +
                   " -> " + std::to_string(attacker.hp) + ")");
    }

    return result;
}

} // namespace tactics
