/**
 * Tactics Battle Engine - Pre-Attack Specials
 *
 * Handlers that run once per attack before any hit is calculated. They
 * rewrite the queued card copy (damage, hits, block bypass) and may
 * adjust either side's block or tokens.
 */

#include "specials/special_handlers.hpp"
#include "token_effects.hpp"
#include <cmath>
#include <sstream>

namespace tactics {
namespace specials {

namespace {

std::string prefix(const SpecialContext& ctx) {
    return std::string(ctx.actor == Actor::PLAYER ? "Player" : "Enemy") + " • " +
           ctx.card.name() + ": ";
}

void note(SpecialContext& ctx, const std::string& text) {
    ctx.outcome.add_event(EventType::INFO, ctx.actor, 0, ctx.card.name(), prefix(ctx) + text);
}

std::string format_multiplier(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

int ceil_one_and_half(int damage) {
    return static_cast<int>(std::ceil(damage * 1.5));
}

// ============================================================================
// BLOCK BYPASS
// ============================================================================

void ignore_block(SpecialContext& ctx) {
    ctx.card.ignore_block = true;
}

void clear_all_block(SpecialContext& ctx) {
    const int own_before = ctx.attacker.block;
    const int target_before = ctx.defender.block;

    ctx.attacker.block = 0;
    ctx.attacker.def = false;
    ctx.defender.block = 0;
    ctx.defender.def = false;

    if (own_before > 0 || target_before > 0) {
        note(ctx, "both sides' block cleared (attacker " + std::to_string(own_before) +
                  "->0, defender " + std::to_string(target_before) + "->0)");
    }
}

// ============================================================================
// DAMAGE MULTIPLIERS
// ============================================================================

void double_damage_if_solo(SpecialContext& ctx) {
    if (ctx.resolve.attack_cards_this_turn != 1) {
        return;
    }
    const int before = ctx.card.def.damage;
    ctx.card.def.damage = before * 2;
    note(ctx, "only attack card! damage x2 (" + std::to_string(before) + "->" +
              std::to_string(ctx.card.def.damage) + ")");
}

void agility_bonus(SpecialContext& ctx) {
    const int agility = total_agility(ctx.attacker.agility, ctx.attacker.tokens);
    if (agility <= 0) {
        return;
    }
    const int bonus = agility * 5;
    ctx.card.def.damage += bonus;
    note(ctx, "agility " + std::to_string(agility) + " -> +" + std::to_string(bonus) + " damage");
}

void cross_damage(SpecialContext& ctx) {
    const auto& bonus = ctx.card.def.cross_bonus;
    if (!bonus || bonus->type != "damage_mult" || !ctx.resolve.has_crossed) {
        return;
    }
    const double multiplier = bonus->value > 0.0 ? bonus->value : 2.0;
    const int before = ctx.card.def.damage;
    ctx.card.def.damage = static_cast<int>(std::round(before * multiplier));
    note(ctx, "cross! damage x" + format_multiplier(multiplier) + " (" +
              std::to_string(before) + "->" + std::to_string(ctx.card.def.damage) + ")");
}

void followup(SpecialContext& ctx) {
    const CardInstance* previous = ctx.resolve.previous_own_card;
    if (!previous || !previous->has_trait("chain") || ctx.card.def.damage <= 0) {
        return;
    }
    const int before = ctx.card.def.damage;
    ctx.card.def.damage = ceil_one_and_half(before);
    note(ctx, "followup! damage +50% (" + std::to_string(before) + "->" +
              std::to_string(ctx.card.def.damage) + ")");
}

void finisher(SpecialContext& ctx) {
    const CardInstance* previous = ctx.resolve.previous_own_card;
    if (!previous) {
        return;
    }

    if (previous->has_trait("chain") && ctx.card.def.damage > 0) {
        const int before = ctx.card.def.damage;
        ctx.card.def.damage = ceil_one_and_half(before);
        note(ctx, "finisher after chain! damage +50% (" + std::to_string(before) + "->" +
                  std::to_string(ctx.card.def.damage) + ")");
    }

    if (previous->has_trait("followup")) {
        ctx.grant(ctx.attacker.tokens, "finesse", 1);
        note(ctx, "finisher after followup! finesse gained");
    }
}

// ============================================================================
// GUN
// ============================================================================

void reload_spray(SpecialContext& ctx) {
    const bool was_jammed = ctx.attacker.tokens.has("gun_jam");
    ctx.outcome.add_logs(ctx.attacker.tokens.remove("gun_jam", TokenLifetime::PERMANENT, 99).logs);
    ctx.outcome.add_logs(ctx.attacker.tokens.set_stacks("roulette", TokenLifetime::PERMANENT, 0).logs);
    if (was_jammed) {
        note(ctx, "reloaded! jam cleared");
    }
}

/**
 * One or two hits per point of remaining energy (50% each).
 */
void gyrus_roulette(SpecialContext& ctx) {
    const int energy = ctx.actor == Actor::PLAYER ? ctx.resolve.player_energy_left
                                                  : ctx.resolve.enemy_energy_left;
    int hits = 0;
    int bonus = 0;
    for (int i = 0; i < energy; ++i) {
        if (ctx.rng.next_double() < 0.5) {
            hits += 2;
            bonus++;
        } else {
            hits += 1;
        }
    }
    ctx.card.def.hits = std::max(1, hits);
    note(ctx, "energy " + std::to_string(energy) + " -> " + std::to_string(ctx.card.def.hits) +
              " shots (" + std::to_string(bonus) + " bonus)");
}

// ============================================================================
// FENCING
// ============================================================================

/**
 * Three extra hits per finesse stack; all finesse is spent.
 */
void tempete_dechainee(SpecialContext& ctx) {
    const int finesse = ctx.attacker.tokens.stacks("finesse");
    const int base_hits = std::max(1, ctx.card.def.hits);
    const int bonus = finesse * 3;
    ctx.card.def.hits = base_hits + bonus;

    if (finesse > 0) {
        ctx.outcome.add_logs(
            ctx.attacker.tokens.remove("finesse", TokenLifetime::PERMANENT, finesse).logs);
        note(ctx, "finesse " + std::to_string(finesse) + " -> +" + std::to_string(bonus) +
                  " hits (" + std::to_string(ctx.card.def.hits) + " total)");
    } else {
        note(ctx, std::to_string(base_hits) + " hits");
    }
}

} // anonymous namespace

void register_pre_attack_specials(SpecialRegistry& registry) {
    registry.register_pre_attack("special", "ignoreBlock", ignore_block);
    registry.register_pre_attack("special", "piercing", ignore_block);
    registry.register_pre_attack("special", "clearAllBlock", clear_all_block);
    registry.register_pre_attack("special", "doubleDamageIfSolo", double_damage_if_solo);
    registry.register_pre_attack("special", "agilityBonus", agility_bonus);
    registry.register_pre_attack("special", "reloadSpray", reload_spray);
    registry.register_pre_attack("special", "gyrusRoulette", gyrus_roulette);
    registry.register_pre_attack("special", "tempeteDechainee", tempete_dechainee);

    registry.register_pre_attack("trait", "cross", cross_damage);
    registry.register_pre_attack("trait", "followup", followup);
    registry.register_pre_attack("trait", "finisher", finisher);
}

} // namespace specials
} // namespace tactics
