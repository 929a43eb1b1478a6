/**
 * Tactics Battle Engine - Post-Attack Specials
 *
 * Handlers that run once after every hit of an attack has resolved.
 * The context carries the total damage dealt, the block destroyed and
 * whether any hit was critical.
 */

#include "specials/special_handlers.hpp"

namespace tactics {
namespace specials {

namespace {

std::string prefix(const SpecialContext& ctx) {
    return std::string(ctx.actor == Actor::PLAYER ? "Player" : "Enemy") + " • " +
           ctx.card.name() + ": ";
}

void note(SpecialContext& ctx, EventType type, int amount, const std::string& text) {
    ctx.outcome.add_event(type, ctx.actor, amount, ctx.card.name(), prefix(ctx) + text);
}

// ============================================================================
// TARGET EFFECTS
// ============================================================================

/**
 * Kill a target left below 10% of its max hp.
 */
void execute_under_10(SpecialContext& ctx) {
    int& hp = ctx.target_hp();
    const int threshold = ctx.target_max_hp() / 10;
    if (hp <= 0 || hp >= threshold) {
        return;
    }
    const int before = hp;
    hp = 0;
    note(ctx, EventType::EXECUTE, before,
         "execute! (hp " + std::to_string(before) + " < " + std::to_string(threshold) + ")");
}

/**
 * Player attacks execute an opponent at or below VIOLENT_MORT_THRESHOLD
 * hp. A held revive is stripped first so it cannot trigger.
 */
void violent_mort(SpecialContext& ctx) {
    if (ctx.actor != Actor::PLAYER || !ctx.card.is_attack()) {
        return;
    }
    ActorState& target = ctx.defender;
    target.recompute_hp_from_units();
    if (target.hp <= 0 || target.hp > VIOLENT_MORT_THRESHOLD) {
        return;
    }

    const int revive = target.tokens.stacks("revive");
    if (revive > 0) {
        ctx.outcome.add_logs(target.tokens.remove("revive", TokenLifetime::USAGE, revive).logs);
    }

    const int before = target.hp;
    for (auto& unit : target.units) {
        unit.hp = 0;
    }
    target.hp = 0;
    note(ctx, EventType::EXECUTE, before,
         "execute! (hp " + std::to_string(before) + " <= " +
         std::to_string(VIOLENT_MORT_THRESHOLD) + (revive > 0 ? ", revive ignored)" : ")"));
}

void vuln_if_no_block(SpecialContext& ctx) {
    if (ctx.target_had_block) {
        return;
    }
    ctx.grant(ctx.target_tokens(), "vulnerable", 1);
    note(ctx, EventType::TOKEN, 1, "vulnerable applied (no block)");
}

void double_vuln_if_no_block(SpecialContext& ctx) {
    if (ctx.target_had_block) {
        return;
    }
    ctx.grant(ctx.target_tokens(), "vulnerable", 2);
    note(ctx, EventType::TOKEN, 2, "vulnerable x2 applied (no block)");
}

void half_enemy_ether(SpecialContext& ctx) {
    // Ether is tracked per side, so the debuff always lands on the defender itself
    ctx.grant(ctx.defender.tokens, "half_ether", 1);
    note(ctx, EventType::TOKEN, 1, "opponent ether gain halved this turn");
}

void steal_block(SpecialContext& ctx) {
    if (ctx.block_destroyed <= 0) {
        return;
    }
    ctx.attacker.gain_block(ctx.block_destroyed);
    note(ctx, EventType::BLOCK, ctx.block_destroyed,
         "stole " + std::to_string(ctx.block_destroyed) + " block");
}

// ============================================================================
// ATTACKER EFFECTS
// ============================================================================

void repeat_if_last(SpecialContext& ctx) {
    if (!ctx.resolve.is_last_own_card) {
        return;
    }
    ctx.outcome.extra_hits = std::max(ctx.outcome.extra_hits, 1);
    note(ctx, EventType::INFO, 1, "last card! one extra hit");
}

void empty_after_use(SpecialContext& ctx) {
    ctx.grant(ctx.attacker.tokens, "gun_jam", 1);
    note(ctx, EventType::JAM, 1, "magazine empty, gun jammed");
}

void reload_spray_jam(SpecialContext& ctx) {
    ctx.grant(ctx.attacker.tokens, "gun_jam", 1);
    note(ctx, EventType::JAM, 1, "sprayed dry, gun jammed");
}

void crit_load(SpecialContext& ctx) {
    if (!ctx.is_critical) {
        return;
    }
    ctx.outcome.add_logs(ctx.attacker.tokens.remove("gun_jam", TokenLifetime::PERMANENT, 99).logs);
    ctx.outcome.add_logs(ctx.attacker.tokens.set_stacks("roulette", TokenLifetime::PERMANENT, 0).logs);
    note(ctx, EventType::INFO, 0, "critical! reloaded");
}

} // anonymous namespace

void register_post_attack_specials(SpecialRegistry& registry) {
    registry.register_post_attack("special", "executeUnder10", execute_under_10);
    registry.register_post_attack("special", "violentMort", violent_mort);
    registry.register_post_attack("special", "vulnIfNoBlock", vuln_if_no_block);
    registry.register_post_attack("special", "doubleVulnIfNoBlock", double_vuln_if_no_block);
    registry.register_post_attack("special", "repeatIfLast", repeat_if_last);
    registry.register_post_attack("special", "halfEnemyEther", half_enemy_ether);
    registry.register_post_attack("special", "emptyAfterUse", empty_after_use);
    registry.register_post_attack("special", "reloadSpray", reload_spray_jam);
    registry.register_post_attack("special", "stealBlock", steal_block);
    registry.register_post_attack("special", "critLoad", crit_load);
}

} // namespace specials
} // namespace tactics
