/**
 * Tactics Battle Engine - Multi-Hit Resolver Implementation
 */

#include "multi_hit.hpp"
#include <cmath>

namespace tactics {

namespace {

const char* who(Actor actor) {
    return actor == Actor::PLAYER ? "Player" : "Enemy";
}

int percent(double v) {
    return static_cast<int>(std::lround(v * 100.0));
}

void append(std::vector<BattleEvent>& events, std::vector<std::string>& logs,
            const std::vector<BattleEvent>& more_events,
            const std::vector<std::string>& more_logs) {
    events.insert(events.end(), more_events.begin(), more_events.end());
    logs.insert(logs.end(), more_logs.begin(), more_logs.end());
}

} // anonymous namespace

// ============================================================================
// ROULETTE
// ============================================================================

RouletteResult process_per_hit_roulette(TokenStore& attacker_tokens,
                                        const CardInstance& card,
                                        Actor actor,
                                        int hit_index,
                                        int total_hits,
                                        Rng& rng,
                                        double chance_per_stack,
                                        std::optional<GrantedAt> granted_at) {
    RouletteResult result;
    if (!card.is_gun_attack()) {
        return result;
    }

    const bool single_roulette = card.has_special("singleRoulette");
    if (single_roulette && hit_index > 0) {
        return result;
    }
    result.checked = true;

    const int stacks = attacker_tokens.stacks("roulette");
    result.jam_chance = stacks * chance_per_stack;

    const std::string hit_label = total_hits > 1 && !single_roulette
        ? " [" + std::to_string(hit_index + 1) + "/" + std::to_string(total_hits) + "]"
        : "";
    const std::string prefix = std::string(who(actor)) + " • " + card.name() + hit_label + ": ";

    if (stacks > 0 && rng.next_double() < result.jam_chance) {
        if (attacker_tokens.has("jam_immunity")) {
            result.suppressed = true;
            std::string msg = prefix + "jam suppressed by jam immunity";
            result.events.push_back(BattleEvent{EventType::INFO, actor, 0, card.name(), msg});
            result.logs.push_back(msg);
            return result;
        }

        TokenResult jam = attacker_tokens.add("gun_jam", 1, granted_at);
        TokenResult reset = attacker_tokens.set_stacks("roulette", TokenLifetime::PERMANENT, 0);
        result.logs.insert(result.logs.end(), jam.logs.begin(), jam.logs.end());
        result.logs.insert(result.logs.end(), reset.logs.begin(), reset.logs.end());
        result.jammed = true;

        std::string msg = prefix + "gun jammed! (" + std::to_string(percent(result.jam_chance)) +
                          "% chance) remaining hits cancelled";
        result.events.push_back(BattleEvent{EventType::JAM, actor, 1, card.name(), msg});
        result.logs.push_back(msg);
        return result;
    }

    TokenResult added = attacker_tokens.add("roulette", 1, granted_at);
    result.logs.insert(result.logs.end(), added.logs.begin(), added.logs.end());
    const int now = attacker_tokens.stacks("roulette");
    std::string msg = prefix + "roulette " + std::to_string(now) + " (" +
                      std::to_string(percent(now * chance_per_stack)) + "% risk)";
    result.events.push_back(BattleEvent{EventType::TOKEN, actor, 1, card.name(), msg});
    result.logs.push_back(msg);
    return result;
}

// ============================================================================
// MULTI-HIT RESOLVER
// ============================================================================

MultiHitResolver::MultiHitResolver(Rng& rng, HitOptions options,
                                   double base_crit_chance,
                                   double jam_chance_per_stack)
    : rng_(rng)
    , options_(options)
    , base_crit_chance_(base_crit_chance)
    , jam_chance_per_stack_(jam_chance_per_stack)
{}

MultiHitResult MultiHitResolver::resolve(ActorState& attacker,
                                         ActorState& defender,
                                         const CardInstance& card,
                                         Actor actor,
                                         int hits) {
    MultiHitResult result;
    result.total_hits = std::max(1, hits);

    for (int i = 0; i < result.total_hits; ++i) {
        const bool critical = roll_critical(card, attacker.tokens, base_crit_chance_, rng_);
        if (critical) {
            result.critical_hits++;
        }

        HitResult hit = calculate_single_hit(attacker, defender, card, actor, critical,
                                             options_, rng_);
        result.hits_completed++;
        result.dealt += hit.damage;
        result.taken += hit.damage_taken;
        result.block_destroyed += hit.block_destroyed;
        append(result.events, result.logs, hit.events, hit.logs);

        if (on_hit_) {
            on_hit_(hit, i, result.total_hits);
        }

        RouletteResult roulette = process_per_hit_roulette(
            attacker.tokens, card, actor, i, result.total_hits, rng_,
            jam_chance_per_stack_, granted_at_);
        append(result.events, result.logs, roulette.events, roulette.logs);
        if (roulette.jammed) {
            result.jammed = true;
            break;
        }
    }

    if (result.total_hits > 1) {
        std::string summary = std::string(who(actor)) + "(" + card.name() + ") • " +
                              std::to_string(result.hits_completed) + "/" +
                              std::to_string(result.total_hits) + " hits, " +
                              std::to_string(result.dealt) + " damage";
        if (result.critical_hits > 0) {
            summary += " [critical x" + std::to_string(result.critical_hits) + "]";
        }
        if (result.jammed) {
            summary += " (jammed, " +
                       std::to_string(result.total_hits - result.hits_completed) +
                       " cancelled)";
        }
        result.events.push_back(BattleEvent{EventType::INFO, actor, result.dealt, card.name(), summary});
        result.logs.push_back(summary);
    }

    return result;
}

} // namespace tactics
