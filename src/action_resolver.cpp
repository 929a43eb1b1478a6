/**
 * Tactics Battle Engine - Action Resolver Implementation
 */

#include "action_resolver.hpp"
#include "card_catalog.hpp"
#include "specials/special_effects.hpp"
#include "token_effects.hpp"
#include <cmath>

namespace tactics {

namespace {

const char* who(Actor actor) {
    return actor == Actor::PLAYER ? "Player" : "Enemy";
}

void push_event(ActionResult& result, EventType type, Actor actor, int amount,
                const std::string& card, const std::string& message) {
    result.events.push_back(BattleEvent{type, actor, amount, card, message});
    result.logs.push_back(message);
}

void append_logs(ActionResult& result, const std::vector<std::string>& lines) {
    result.logs.insert(result.logs.end(), lines.begin(), lines.end());
}

/**
 * Revive a side that dropped to 0 hp while holding a revive token.
 */
void check_lethal(ActorState& side, Actor owner, const std::string& card_name,
                  ActionResult& result) {
    if (side.hp > 0 || side.has_units()) {
        return;
    }
    ReviveOutcome revive = check_revive(side.max_hp, side.tokens);
    if (!revive.revived) {
        return;
    }
    side.hp = revive.new_hp;
    append_logs(result, side.tokens.remove("revive", TokenLifetime::USAGE, 1).logs);
    push_event(result, EventType::REVIVE, owner, revive.new_hp, card_name,
               std::string(who(owner)) + " • " + revive.logs.front());
}

} // anonymous namespace

ActionResolver::ActionResolver(const SpecialRegistry& registry, Rng& rng)
    : registry_(registry)
    , rng_(rng)
{}

// ============================================================================
// RESOLVE
// ============================================================================

std::optional<ActionResult> ActionResolver::resolve(ActorState& attacker,
                                                    ActorState& defender,
                                                    CardInstance& card,
                                                    Actor actor,
                                                    const ResolveContext& ctx) {
    if (card.card_id().empty()) {
        return std::nullopt;
    }
    if (ctx.catalog && !ctx.catalog->has_card(card.card_id())) {
        return std::nullopt;
    }

    ActionResult result;

    // Token costs (a shortfall is the caller's problem; remove() clamps)
    for (const auto& required : card.def.required_tokens) {
        append_logs(result, attacker.tokens.remove(required.id, required.stacks).logs);
    }

    Unit* target_unit = nullptr;
    if (actor == Actor::PLAYER && defender.has_units()) {
        target_unit = resolve_target_unit(defender, card, ctx.selected_target);
        if (target_unit) {
            result.target_unit_id = target_unit->unit_id;
        }
    }
    result.target_had_block = (defender.def && defender.block > 0) ||
                              (target_unit && target_unit->block > 0);

    if (card.def.block > 0) {
        resolve_block(attacker, card, actor, ctx, result);
    }

    // General and defense cards only attack when they carry damage
    if (card.is_attack() || card.def.damage > 0) {
        resolve_attack(attacker, defender, card, actor, ctx, target_unit, result);
    }

    apply_granted_tokens(attacker, defender, card, ctx, target_unit, result);

    SpecialOutcome play;
    SpecialContext play_ctx(attacker, defender, card, actor, ctx, rng_, play);
    play_ctx.target_unit = target_unit;
    play_ctx.damage_dealt = result.dealt;
    play_ctx.is_critical = result.is_critical;
    play_ctx.target_had_block = result.target_had_block;
    registry_.apply_card_play(play_ctx);
    absorb(result, play);

    defender.recompute_hp_from_units();
    result.outcome.events.clear();
    result.outcome.logs.clear();
    return result;
}

Unit* ActionResolver::resolve_target_unit(ActorState& defender,
                                          const CardInstance& card,
                                          const std::optional<UnitID>& selected_target) {
    if (card.target_unit_id) {
        Unit* unit = defender.find_unit(*card.target_unit_id);
        if (unit && unit->is_alive()) {
            return unit;
        }
    }
    if (selected_target) {
        Unit* unit = defender.find_unit(*selected_target);
        if (unit && unit->is_alive()) {
            return unit;
        }
    }
    return defender.first_alive_unit();
}

// ============================================================================
// BLOCK
// ============================================================================

void ActionResolver::resolve_block(ActorState& attacker, const CardInstance& card, Actor actor,
                                   const ResolveContext& ctx, ActionResult& result) {
    const int base = card.def.block + total_strength(attacker.strength, attacker.tokens);
    CardValueModifier modified = apply_tokens_to_block(std::max(0, base), attacker.tokens);
    append_logs(result, consume_tokens(attacker.tokens, modified.consumed).logs);

    int block = modified.value;
    const auto& bonus = card.def.cross_bonus;
    if (bonus && bonus->type == "block_mult" && ctx.has_crossed) {
        const double multiplier = bonus->value > 0.0 ? bonus->value : 2.0;
        block = static_cast<int>(std::lround(block * multiplier));
    }
    if (block <= 0) {
        return;
    }

    // Composite enemies keep block on the unit that played the card
    if (actor == Actor::ENEMY && attacker.has_units() && card.source_unit_id) {
        Unit* unit = attacker.find_unit(*card.source_unit_id);
        if (unit) {
            const int before = unit->block;
            unit->block += block;
            result.blocked += block;
            push_event(result, EventType::BLOCK, actor, block, card.name(),
                       std::string(who(actor)) + " • " + card.name() + " (" + unit->name +
                       "): block +" + std::to_string(block) + " (" + std::to_string(before) +
                       " -> " + std::to_string(unit->block) + ")");
            return;
        }
    }

    const int before = attacker.block;
    attacker.gain_block(block);
    result.blocked += block;
    push_event(result, EventType::BLOCK, actor, block, card.name(),
               std::string(who(actor)) + " • " + card.name() + ": block +" +
               std::to_string(block) + " (" + std::to_string(before) + " -> " +
               std::to_string(attacker.block) + ")");
}

// ============================================================================
// ATTACK
// ============================================================================

void ActionResolver::resolve_attack(ActorState& attacker, ActorState& defender,
                                    CardInstance& card, Actor actor,
                                    const ResolveContext& ctx, Unit* target_unit,
                                    ActionResult& result) {
    result.attacked = true;

    // A single-target hit on a unit fights that unit's block through the
    // side block, and whatever is left goes back to the unit afterwards
    const bool single_unit_target = target_unit && !card.hits_all_units() &&
                                    card.target_unit_ids.empty();
    if (single_unit_target) {
        defender.block = target_unit->block;
        defender.def = defender.block > 0;
    }
    auto return_unit_block = [&]() {
        if (single_unit_target) {
            target_unit->block = defender.block;
            defender.block = 0;
            defender.def = false;
        }
    };

    SpecialOutcome pre;
    SpecialContext pre_ctx(attacker, defender, card, actor, ctx, rng_, pre);
    pre_ctx.target_unit = target_unit;
    registry_.apply_pre_attack(pre_ctx);
    absorb(result, pre);

    // A jammed gun spends its action clearing the jam
    if (card.is_gun_attack() && attacker.tokens.has("gun_jam")) {
        append_logs(result, attacker.tokens.remove("gun_jam", TokenLifetime::PERMANENT, 99).logs);
        push_event(result, EventType::JAM, actor, 0, card.name(),
                   std::string(who(actor)) + " • " + card.name() +
                   ": gun jammed, action spent clearing it");
        result.jammed = true;
        return_unit_block();
        return;
    }

    if (!card.is_ghost) {
        CardValueModifier modified = apply_tokens_to_damage(card.def.damage, attacker.tokens);
        card.def.damage = modified.value;
        append_logs(result, consume_tokens(attacker.tokens, modified.consumed).logs);
    }

    HitOptions options;
    options.fencing_damage_bonus = ctx.fencing_damage_bonus;
    options.crit_multiplier = ctx.crit_multiplier;
    options.defender_tokens = target_unit ? &target_unit->tokens : nullptr;

    const int hp_before = defender.hp;
    int unit_loss = 0;

    // Listed unit targets take the card's damage once, not once per hit
    const bool listed_targets = !card.hits_all_units() && !card.target_unit_ids.empty();
    bool listed_applied = false;

    MultiHitResolver hits(rng_, options, ctx.base_crit_chance, ctx.jam_chance_per_stack);
    hits.set_granted_at(ctx.granted_at());
    hits.set_hit_callback([&](const HitResult& hit, int index, int total) {
        if (target_unit && !(listed_targets && listed_applied)) {
            unit_loss += distribute_to_units(defender, card, hit, target_unit, actor, result);
            listed_applied = listed_targets;
        }
        if (on_hit_) {
            on_hit_(hit, index, total);
        }
    });

    auto run_hits = [&](int count) {
        MultiHitResult run = hits.resolve(attacker, defender, card, actor, count);
        result.total_hits += run.total_hits;
        result.hits_completed += run.hits_completed;
        result.taken += run.taken;
        result.block_destroyed += run.block_destroyed;
        result.critical_hits += run.critical_hits;
        result.jammed = result.jammed || run.jammed;
        result.events.insert(result.events.end(), run.events.begin(), run.events.end());
        append_logs(result, run.logs);
        return run.dealt;
    };

    int hit_dealt = run_hits(std::max(1, card.def.hits));

    auto current_dealt = [&]() {
        return target_unit ? unit_loss : hit_dealt;
    };

    SpecialOutcome post;
    SpecialContext post_ctx(attacker, defender, card, actor, ctx, rng_, post);
    post_ctx.target_unit = target_unit;
    post_ctx.damage_dealt = current_dealt();
    post_ctx.block_destroyed = result.block_destroyed;
    post_ctx.is_critical = result.critical_hits > 0;
    post_ctx.target_had_block = result.target_had_block;
    registry_.apply_post_attack(post_ctx);
    absorb(result, post);

    if (result.outcome.extra_hits > 0 && !result.jammed) {
        hit_dealt += run_hits(result.outcome.extra_hits);
        result.outcome.extra_hits = 0;
    }

    return_unit_block();
    defender.recompute_hp_from_units();
    result.dealt = target_unit ? unit_loss : std::max(0, std::min(hit_dealt, hp_before));
    result.is_critical = result.critical_hits > 0;

    // Player critical hits refund finesse
    if (actor == Actor::PLAYER && result.critical_hits > 0) {
        append_logs(result, attacker.tokens.add("finesse", result.critical_hits,
                                                ctx.granted_at()).logs);
        push_event(result, EventType::TOKEN, actor, result.critical_hits, card.name(),
                   std::string(who(actor)) + " • " + card.name() + ": critical! finesse +" +
                   std::to_string(result.critical_hits));
    }

    // On-hit creation
    if (ctx.catalog) {
        specials::CardCreationResult creation = specials::process_card_creation(
            card, actor, result.dealt, *ctx.catalog, rng_, ctx.fleche_chain_cap,
            CREATION_CHOICE_SIZE);
        result.events.insert(result.events.end(), creation.events.begin(), creation.events.end());
        append_logs(result, creation.logs);
        for (auto& created : creation.created_cards) {
            result.created_cards.push_back(std::move(created));
        }
    }

    // Lifesteal
    if (result.dealt > 0) {
        HealTokenOutcome heal = apply_tokens_on_heal(result.dealt, attacker.tokens);
        if (heal.healing > 0) {
            const int before = attacker.hp;
            attacker.heal(heal.healing);
            append_logs(result, consume_tokens(attacker.tokens, heal.consumed).logs);
            push_event(result, EventType::HEAL, actor, attacker.hp - before, card.name(),
                       std::string(who(actor)) + " • " + heal.logs.front() +
                       " (hp " + std::to_string(before) + " -> " +
                       std::to_string(attacker.hp) + ")");
        }
    }

    check_lethal(defender, opponent_of(actor), card.name(), result);
    check_lethal(attacker, actor, card.name(), result);
}

int ActionResolver::distribute_to_units(ActorState& defender, const CardInstance& card,
                                        const HitResult& hit, Unit* target_unit,
                                        Actor actor, ActionResult& result) {
    int loss = 0;

    auto damage_unit = [&](Unit& unit, int amount, bool use_block) {
        int remaining = std::max(0, amount);
        if (use_block && unit.block > 0) {
            const int absorbed = std::min(unit.block, remaining);
            unit.block -= absorbed;
            remaining -= absorbed;
        }
        const int before = unit.hp;
        unit.hp = std::max(0, unit.hp - remaining);
        loss += before - unit.hp;
        if (before != unit.hp) {
            push_event(result, EventType::DAMAGE, actor, before - unit.hp, card.name(),
                       std::string(who(actor)) + " • " + card.name() + " -> " + unit.name +
                       ": " + std::to_string(before - unit.hp) + " damage (hp " +
                       std::to_string(before) + " -> " + std::to_string(unit.hp) + ")");
        }
    };

    if (card.hits_all_units()) {
        if (!hit.dodged && hit.damage > 0) {
            for (auto& unit : defender.units) {
                if (unit.is_alive()) {
                    damage_unit(unit, hit.damage, true);
                }
            }
        }
    } else if (!card.target_unit_ids.empty()) {
        if (!hit.dodged) {
            for (UnitID id : card.target_unit_ids) {
                Unit* unit = defender.find_unit(id);
                if (unit && unit->is_alive()) {
                    damage_unit(*unit, card.def.damage, true);
                }
            }
        }
    } else if (target_unit && target_unit->is_alive()) {
        damage_unit(*target_unit, hit.damage, false);
    }

    defender.recompute_hp_from_units();
    return loss;
}

// ============================================================================
// TOKENS ON PLAY
// ============================================================================

void ActionResolver::apply_granted_tokens(ActorState& attacker, ActorState& defender,
                                          const CardInstance& card, const ResolveContext& ctx,
                                          Unit* target_unit, ActionResult& result) {
    for (const auto& grant : card.def.applied_tokens) {
        const int stacks = grant.stacks + (result.is_critical ? 1 : 0);
        TokenStore& store = grant.target_self
            ? attacker.tokens
            : (target_unit ? target_unit->tokens : defender.tokens);
        append_logs(result, store.add(grant.id, stacks, ctx.granted_at()).logs);
    }
}

void ActionResolver::absorb(ActionResult& result, SpecialOutcome& part) {
    result.events.insert(result.events.end(), part.events.begin(), part.events.end());
    append_logs(result, part.logs);
    result.outcome.merge(part);
}

} // namespace tactics
