/**
 * Tactics Battle Engine - Card-Play Specials
 *
 * Handlers that run whenever a card is played, attack or not. They grant
 * tokens, bank next-turn effects, queue ghost bonus cards and raise the
 * flags the engine acts on (choices, parry, stun, growing defense).
 */

#include "specials/special_handlers.hpp"
#include <algorithm>

namespace tactics {
namespace specials {

namespace {

const CardDefID kBasicShot = "shoot";

std::string prefix(const SpecialContext& ctx) {
    return std::string(ctx.actor == Actor::PLAYER ? "Player" : "Enemy") + " • " +
           ctx.card.name() + ": ";
}

void note(SpecialContext& ctx, EventType type, int amount, const std::string& text) {
    ctx.outcome.add_event(type, ctx.actor, amount, ctx.card.name(), prefix(ctx) + text);
}

/**
 * Queue `count` ghost copies of the basic shot.
 *
 * @return Number of cards queued (0 if the catalog has no basic shot)
 */
int queue_basic_shots(SpecialContext& ctx, int count, int speed_cost,
                      const std::vector<UnitID>& targets = {}) {
    if (!ctx.resolve.catalog || count <= 0) {
        return 0;
    }
    int queued = 0;
    for (int i = 0; i < count; ++i) {
        auto shot = make_ghost_card(*ctx.resolve.catalog, kBasicShot, ctx.card.card_id());
        if (!shot) {
            return queued;
        }
        shot->def.speed_cost = speed_cost;
        shot->def.action_cost = 0;
        if (static_cast<size_t>(i) < targets.size()) {
            shot->target_unit_id = targets[static_cast<size_t>(i)];
        }
        ctx.outcome.bonus_cards.push_back(std::move(*shot));
        queued++;
    }
    return queued;
}

// ============================================================================
// CROSS
// ============================================================================

void cross_gun_attack(SpecialContext& ctx) {
    const auto& bonus = ctx.card.def.cross_bonus;
    if (!bonus || bonus->type != "gun_attack" || !ctx.resolve.has_crossed) {
        return;
    }
    const int queued = queue_basic_shots(ctx, std::max(1, bonus->count), 0);
    if (queued > 0) {
        note(ctx, EventType::CREATE, queued, "cross! " + std::to_string(queued) + " bonus shot(s)");
    }
}

// ============================================================================
// GUN
// ============================================================================

void auto_reload(SpecialContext& ctx) {
    const auto& hand = ctx.resolve.committed_hand;
    if (std::find(hand.begin(), hand.end(), "reload") == hand.end()) {
        return;
    }
    ctx.grant(ctx.attacker.tokens, "loaded", 1);
    note(ctx, EventType::TOKEN, 1, "reload card in hand, auto reload");
}

void manipulation(SpecialContext& ctx) {
    if (ctx.attacker.tokens.has("gun_jam")) {
        ctx.outcome.add_logs(
            ctx.attacker.tokens.remove("gun_jam", TokenLifetime::PERMANENT, 99).logs);
        ctx.grant(ctx.attacker.tokens, "loaded", 1);
        note(ctx, EventType::TOKEN, 1, "jam cleared, loaded");
        return;
    }
    if (queue_basic_shots(ctx, 1, 0) > 0) {
        note(ctx, EventType::CREATE, 1, "shot!");
    }
}

void spread_shot(SpecialContext& ctx) {
    std::vector<UnitID> targets = ctx.defender.alive_unit_ids();
    const int count = std::max(1, static_cast<int>(targets.size()));
    const int queued = queue_basic_shots(ctx, count, 0, targets);
    if (queued > 0) {
        note(ctx, EventType::CREATE, queued, std::to_string(queued) + " spread shot(s)");
    }
}

void evasive_shot(SpecialContext& ctx) {
    if (queue_basic_shots(ctx, 1, 0) > 0) {
        note(ctx, EventType::CREATE, 1, "evasive shot!");
    }
}

void execution_squad(SpecialContext& ctx) {
    ctx.grant(ctx.attacker.tokens, "loaded", 1);
    ctx.grant(ctx.attacker.tokens, "jam_immunity", 1);
    const int queued = queue_basic_shots(ctx, 4, 1);
    note(ctx, EventType::CREATE, queued,
         "loaded, jam immune and " + std::to_string(queued) + " shots queued");
}

// ============================================================================
// FENCING / STANCE
// ============================================================================

void sharpen_blade(SpecialContext& ctx) {
    ctx.outcome.fencing_damage_bonus += 3;
    note(ctx, EventType::INFO, 3, "every fencing attack +3 damage for this battle");
}

void stance(SpecialContext& ctx) {
    const CardInstance* previous = ctx.resolve.previous_own_card;
    if (previous) {
        if (previous->def.category == CardCategory::GUN) {
            ctx.grant(ctx.attacker.tokens, "offense", 1);
            note(ctx, EventType::TOKEN, 1, "after a shot, offense gained");
        } else if (previous->def.category == CardCategory::FENCING) {
            ctx.grant(ctx.attacker.tokens, "loaded", 1);
            note(ctx, EventType::TOKEN, 1, "after a blade, loaded");
        }
    }

    int removed = 0;
    for (const auto& token : ctx.attacker.tokens.all()) {
        const TokenDef* def = find_token_def(token.id);
        if (def && def->category == TokenCategory::NEGATIVE) {
            ctx.outcome.add_logs(ctx.attacker.tokens.remove(token.id, token.stacks).logs);
            removed++;
        }
    }
    note(ctx, EventType::TOKEN, removed,
         removed > 0 ? "negative tokens removed" : "no negative tokens to remove");
}

void el_rapide(SpecialContext& ctx) {
    if (ctx.attacker.tokens.stacks("finesse") >= 1) {
        ctx.outcome.add_logs(ctx.attacker.tokens.remove("finesse", TokenLifetime::PERMANENT, 1).logs);
        note(ctx, EventType::TOKEN, 2, "finesse spent, pain skipped, agility +2");
    } else {
        ctx.grant(ctx.attacker.tokens, "pain", 1);
        note(ctx, EventType::TOKEN, 2, "pain gained, agility +2");
    }
    ctx.grant(ctx.attacker.tokens, "agility", 2);
}

// ============================================================================
// NEXT TURN
// ============================================================================

void mental_focus(SpecialContext& ctx) {
    ctx.outcome.next_turn.max_speed_bonus += 1;
    ctx.outcome.next_turn.bonus_energy += 2;
    note(ctx, EventType::INFO, 2, "focus! next turn +1 max speed, +2 energy");
}

// ============================================================================
// ENGINE FLAGS
// ============================================================================

void aoe_attack(SpecialContext& ctx) {
    ctx.card.is_aoe = true;
}

void breach(SpecialContext& ctx) {
    ctx.outcome.trigger_breach = true;
}

void create_fencing_cards_3(SpecialContext& ctx) {
    ctx.outcome.trigger_fencing_creation = true;
}

void parry_push(SpecialContext& ctx) {
    ctx.outcome.open_parry_window = true;
}

void growing_defense(SpecialContext& ctx) {
    ctx.outcome.start_growing_defense = true;
}

// ============================================================================
// IMMEDIATE TRAITS
// ============================================================================

void stun(SpecialContext& ctx) {
    ctx.outcome.stun = true;
}

void warmup(SpecialContext& ctx) {
    ctx.outcome.next_turn.bonus_energy += 2;
    note(ctx, EventType::INFO, 2, "warmup! +2 energy next turn");
}

void training(SpecialContext& ctx) {
    ctx.attacker.strength += 1;
    note(ctx, EventType::INFO, 1, "training! strength +1 (" +
                                  std::to_string(ctx.attacker.strength) + ")");
}

void double_edge(SpecialContext& ctx) {
    const int before = ctx.attacker.hp;
    ctx.attacker.hp = std::max(0, ctx.attacker.hp - 1);
    note(ctx, EventType::SELF_DAMAGE, before - ctx.attacker.hp,
         "double edge, 1 self damage (hp " + std::to_string(before) + " -> " +
             std::to_string(ctx.attacker.hp) + ")");
}

void vanish(SpecialContext& ctx) {
    ctx.outcome.vanish = true;
    note(ctx, EventType::INFO, 0, "vanished");
}

} // anonymous namespace

void register_card_play_specials(SpecialRegistry& registry) {
    registry.register_card_play("trait", "cross", cross_gun_attack);

    registry.register_card_play("special", "autoReload", auto_reload);
    registry.register_card_play("special", "manipulation", manipulation);
    registry.register_card_play("special", "spreadShot", spread_shot);
    registry.register_card_play("special", "evasiveShot", evasive_shot);
    registry.register_card_play("special", "executionSquad", execution_squad);
    registry.register_card_play("special", "sharpenBlade", sharpen_blade);
    registry.register_card_play("special", "stance", stance);
    registry.register_card_play("special", "elRapide", el_rapide);
    registry.register_card_play("special", "mentalFocus", mental_focus);

    registry.register_card_play("special", "aoeAttack", aoe_attack);
    registry.register_card_play("special", "breach", breach);
    registry.register_card_play("special", "createFencingCards3", create_fencing_cards_3);
    registry.register_card_play("special", "parryPush", parry_push);
    registry.register_card_play("special", "growingDefense", growing_defense);

    registry.register_card_play("trait", "stun", stun);
    registry.register_card_play("trait", "warmup", warmup);
    registry.register_card_play("trait", "training", training);
    registry.register_card_play("trait", "double_edge", double_edge);
    registry.register_card_play("trait", "vanish", vanish);
}

} // namespace specials
} // namespace tactics
