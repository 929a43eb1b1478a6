/**
 * Tactics Battle Engine - Engine Implementation
 *
 * Turn flow, step resolution and turn-end settlement.
 */

#include "battle_engine.hpp"
#include "specials/special_handlers.hpp"
#include "token_effects.hpp"
#include <cstdlib>
#include <iostream>

namespace tactics {

namespace {

const char* who(Actor actor) {
    return actor == Actor::PLAYER ? "Player" : "Enemy";
}

void push_event(StepReport& report, EventType type, Actor actor, int amount,
                const std::string& card, const std::string& message) {
    report.events.push_back(BattleEvent{type, actor, amount, card, message});
    report.logs.push_back(message);
}

void append(StepReport& report, const std::vector<BattleEvent>& events,
            const std::vector<std::string>& logs) {
    report.events.insert(report.events.end(), events.begin(), events.end());
    report.logs.insert(report.logs.end(), logs.begin(), logs.end());
}

void append_logs(StepReport& report, const std::vector<std::string>& logs) {
    report.logs.insert(report.logs.end(), logs.begin(), logs.end());
}

const SpecialRegistry& default_registry() {
    SpecialRegistry& registry = get_special_registry();
    specials::register_all_specials(registry);
    return registry;
}

/**
 * Damage that ignores block. Composite sides lose it from the given
 * unit (or the first living one).
 *
 * @return hp actually lost
 */
int damage_directly(ActorState& side, std::optional<UnitID> unit_id, int amount) {
    if (amount <= 0) {
        return 0;
    }
    if (side.has_units()) {
        Unit* unit = unit_id ? side.find_unit(*unit_id) : nullptr;
        if (!unit || !unit->is_alive()) {
            unit = side.first_alive_unit();
        }
        if (!unit) {
            return 0;
        }
        const int before = unit->hp;
        unit->hp = std::max(0, unit->hp - amount);
        side.recompute_hp_from_units();
        return before - unit->hp;
    }
    const int before = side.hp;
    side.hp = std::max(0, side.hp - amount);
    return before - side.hp;
}

} // anonymous namespace

BattleEngine::BattleEngine(const CardCatalog& catalog,
                           const EngineConfig& config,
                           Rng& rng,
                           const SpecialRegistry* registry)
    : catalog_(catalog)
    , config_(config)
    , rng_(rng)
    , registry_(registry ? *registry : default_registry())
    , resolver_(registry_, rng)
    , planner_(catalog, config, rng)
{}

void BattleEngine::add_sink(PresentationSink* sink) {
    if (sink) {
        sinks_.push_back(sink);
    }
}

void BattleEngine::set_hit_callback(HitCallback callback) {
    resolver_.set_hit_callback(std::move(callback));
}

// ============================================================================
// BATTLE SETUP
// ============================================================================

BattleState BattleEngine::create_battle(ActorState player, ActorState enemy) const {
    BattleState state;
    state.player = std::move(player);
    state.enemy = std::move(enemy);

    state.player.side = Actor::PLAYER;
    state.enemy.side = Actor::ENEMY;

    for (ActorState* side : {&state.player, &state.enemy}) {
        if (side->has_units()) {
            int total_max = 0;
            for (const auto& unit : side->units) {
                total_max += std::max(0, unit.max_hp);
            }
            side->max_hp = total_max;
            side->recompute_hp_from_units();
        }
        side->clamp_hp();
    }

    if (state.enemy.ether_slots <= 0) {
        state.enemy.ether_slots = calculate_ether_slots(state.enemy.ether_pts);
    }

    state.turn = 1;
    state.phase = BattlePhase::SELECT;
    state.result = BattleResult::ONGOING;
    return state;
}

// ============================================================================
// TURN START
// ============================================================================

int BattleEngine::turn_energy(const BattleState& state, Actor actor) const {
    const ActorState& side = state.side(actor);
    int base = side.max_energy;
    if (actor == Actor::ENEMY) {
        base = config_.base_player_energy + side.ether_slots;
    }
    base += state.turn_data(actor).next_turn.bonus_energy;
    return apply_tokens_on_energy(base, side.tokens);
}

int BattleEngine::turn_max_speed(const BattleState& state, Actor actor) const {
    return state.side(actor).max_speed + state.turn_data(actor).next_turn.max_speed_bonus;
}

std::vector<CardInstance> BattleEngine::instantiate(BattleState& state, Actor actor,
                                                    const std::vector<const CardDef*>& cards) const {
    const ActorState& side = state.side(actor);
    const int agility = total_agility(side.agility, side.tokens);
    const std::string prefix = actor == Actor::PLAYER ? "p_" : "e_";

    std::vector<CardInstance> instances;
    instances.reserve(cards.size());
    for (const CardDef* def : cards) {
        CardInstance card(state.make_instance_id(prefix), *def);
        if (agility > 0) {
            card.def.speed_cost = std::max(0, card.def.speed_cost - agility);
        }
        instances.push_back(std::move(card));
    }
    return instances;
}

void BattleEngine::apply_turn_start(BattleState& state, Actor actor, int energy) {
    ActorState& side = state.side(actor);
    SideTurn& data = state.turn_data(actor);
    side.energy = energy;
    data.next_turn = NextTurnEffects{};
}

bool BattleEngine::commit_turn(BattleState& state,
                               const std::vector<CardDefID>& player_card_ids,
                               std::optional<UnitID> selected_target) {
    if (state.phase != BattlePhase::SELECT) {
        std::cerr << "[BattleEngine] commit_turn called in phase "
                  << to_string(state.phase) << std::endl;
        return false;
    }
    if (static_cast<int>(player_card_ids.size()) > config_.max_submit_cards) {
        std::cerr << "[BattleEngine] Too many cards: " << player_card_ids.size()
                  << " (max " << config_.max_submit_cards << ")" << std::endl;
        return false;
    }

    std::vector<const CardDef*> player_defs;
    int total_cost = 0;
    for (const auto& id : player_card_ids) {
        const CardDef* def = catalog_.get_card(id);
        if (!def) {
            std::cerr << "[BattleEngine] Unknown card: " << id << std::endl;
            return false;
        }
        if (state.is_vanished(id)) {
            std::cerr << "[BattleEngine] Card vanished for this battle: " << id << std::endl;
            return false;
        }
        player_defs.push_back(def);
        total_cost += def->action_cost;
    }

    const int player_energy = turn_energy(state, Actor::PLAYER);
    if (total_cost > player_energy) {
        std::cerr << "[BattleEngine] Not enough energy: need " << total_cost
                  << ", have " << player_energy << std::endl;
        return false;
    }

    const int agility = total_agility(state.player.agility, state.player.tokens);
    int total_speed = 0;
    for (const CardDef* def : player_defs) {
        total_speed += std::max(0, def->speed_cost - std::max(0, agility));
    }
    const int player_speed = turn_max_speed(state, Actor::PLAYER);
    if (total_speed > player_speed) {
        std::cerr << "[BattleEngine] Hand too slow: " << total_speed
                  << " > max speed " << player_speed << std::endl;
        return false;
    }

    std::vector<CardInstance> player_cards = instantiate(state, Actor::PLAYER, player_defs);

    // Player side committed
    const int enemy_energy = turn_energy(state, Actor::ENEMY);
    apply_turn_start(state, Actor::PLAYER, player_energy);
    apply_turn_start(state, Actor::ENEMY, enemy_energy);

    state.player_turn.reset_turn();
    state.enemy_turn.reset_turn();
    state.player_turn.energy_left = player_energy - total_cost;

    state.selected_target = selected_target;
    state.committed_hand = player_card_ids;
    for (const auto& card : player_cards) {
        if (card.is_attack()) state.player_turn.attack_cards++;
    }

    // Enemy plan
    EnemyPlan plan = planner_.plan(state.enemy);
    state.enemy_mode = plan.mode;
    state.enemy_overdrive = should_enemy_overdrive(state.enemy, plan, state.turn);
    std::vector<CardInstance> enemy_cards = instantiate(state, Actor::ENEMY, plan.cards);
    assign_source_units(enemy_cards, state.enemy);

    int enemy_cost = 0;
    for (const auto& card : enemy_cards) {
        enemy_cost += card.def.action_cost;
        if (card.is_attack()) state.enemy_turn.attack_cards++;
    }
    state.enemy_turn.energy_left = std::max(0, enemy_energy - enemy_cost);

    // Queue
    state.scheduler.build(player_cards, enemy_cards);
    specials::RemovalResult collisions = specials::process_queue_collisions(state.scheduler);
    state.pending_events.insert(state.pending_events.end(),
                                collisions.events.begin(), collisions.events.end());

    state.phase = state.scheduler.size() > 0 ? BattlePhase::RESOLVE : BattlePhase::TURN_END;
    return true;
}

// ============================================================================
// STEP
// ============================================================================

ResolveContext BattleEngine::make_context(const BattleState& state, const QueueItem& item) const {
    const SideTurn& data = state.turn_data(item.actor);

    ResolveContext ctx;
    ctx.turn = state.turn;
    ctx.sp = item.sp;
    ctx.scheduler = &state.scheduler;
    ctx.catalog = &catalog_;
    ctx.player_energy_left = state.player_turn.energy_left;
    ctx.enemy_energy_left = state.enemy_turn.energy_left;
    ctx.played_categories = data.played_categories();

    const QueueItem* previous = state.scheduler.previous_own_item(item.actor);
    ctx.previous_own_card = previous ? &previous->card : nullptr;
    ctx.is_last_own_card = state.scheduler.is_last_own_item(item.actor);
    ctx.has_crossed = item.has_crossed;
    ctx.attack_cards_this_turn = data.attack_cards;

    ctx.fencing_damage_bonus = data.fencing_damage_bonus;
    if (item.actor == Actor::PLAYER) {
        ctx.selected_target = state.selected_target;
        ctx.committed_hand = state.committed_hand;
    }

    ctx.base_crit_chance = config_.base_crit_chance;
    ctx.crit_multiplier = config_.crit_multiplier;
    ctx.jam_chance_per_stack = config_.jam_chance_per_stack;
    ctx.fleche_chain_cap = config_.fleche_chain_cap;
    return ctx;
}

StepReport BattleEngine::step(BattleState& state) {
    StepReport report;

    if (state.phase != BattlePhase::RESOLVE || state.scheduler.in_flight()) {
        return report;
    }

    report.events = std::move(state.pending_events);
    state.pending_events.clear();
    for (const auto& event : report.events) {
        report.logs.push_back(event.message);
    }

    if (!state.scheduler.advance(state.enemy.is_defeated())) {
        state.phase = BattlePhase::TURN_END;
        report.turn_complete = true;
        notify_step(state, report);
        return report;
    }
    if (!state.scheduler.begin_step()) {
        return report;
    }

    QueueItem item = *state.scheduler.current();
    report.item = item;

    if (item.card.card_id().empty() || !catalog_.has_card(item.card.card_id())) {
        std::cerr << "[BattleEngine] FATAL: unresolvable card '" << item.card.card_id()
                  << "' at sp " << item.sp << " (" << to_string(item.actor) << ")" << std::endl;
        state.scheduler.end_step();
        if (state.scheduler.exhausted()) {
            state.phase = BattlePhase::TURN_END;
            report.turn_complete = true;
        }
        notify_step(state, report);
        return report;
    }

    apply_growing_defense(state, item, report);

    ActorState& attacker = state.side(item.actor);
    if (attacker.is_defeated()) {
        check_defeat(state, report);
        state.scheduler.end_step();
        notify_step(state, report);
        return report;
    }

    ActorState& defender = state.side(opponent_of(item.actor));
    const ResolveContext ctx = make_context(state, item);

    std::optional<ActionResult> resolved = resolver_.resolve(attacker, defender, item.card,
                                                             item.actor, ctx);
    if (!resolved) {
        std::cerr << "[BattleEngine] FATAL: resolver returned no result for '"
                  << item.card.card_id() << "' at sp " << item.sp << std::endl;
        state.scheduler.end_step();
        notify_step(state, report);
        return report;
    }

    ActionResult& result = *resolved;
    report.resolved = true;
    report.dealt = result.dealt;
    report.item = item;
    append(report, result.events, result.logs);

    SideTurn& data = state.turn_data(item.actor);
    data.played.push_back(item.card);
    if (!item.card.is_ghost) {
        data.accumulated_ether += card_ether(item.card.def);
    }
    data.fencing_damage_bonus += result.outcome.fencing_damage_bonus;
    data.next_turn.merge(result.outcome.next_turn);
    if (result.outcome.vanish && item.actor == Actor::PLAYER && !item.card.is_ghost) {
        state.vanished_cards.push_back(item.card.card_id());
    }

    // Burn lands once the card has resolved
    apply_burn(state, item, report);

    apply_timeline_effects(state, item, result, report);
    insert_created_cards(state, item, result, report);
    open_choice(state, item, result.outcome, report);
    expire_timeline_tokens(state, item.sp, report);
    check_defeat(state, report);

    state.scheduler.end_step();

    if (state.phase == BattlePhase::RESOLVE && state.scheduler.exhausted()) {
        state.phase = BattlePhase::TURN_END;
        report.turn_complete = true;
    }

    notify_step(state, report);
    if (report.choice_required) {
        notify_choice(state);
    }
    return report;
}

std::vector<StepReport> BattleEngine::run_until_blocked(BattleState& state) {
    std::vector<StepReport> reports;
    while (state.phase == BattlePhase::RESOLVE && !state.scheduler.in_flight()) {
        reports.push_back(step(state));
    }
    return reports;
}

// ============================================================================
// STEP PARTS
// ============================================================================

void BattleEngine::apply_growing_defense(BattleState& state, const QueueItem& item,
                                         StepReport& report) {
    for (auto& growing : state.growing_defenses) {
        ActorState& owner = state.side(growing.owner);
        const int before = owner.block;
        const int gained = growing.apply(owner, item.sp);
        if (gained > 0) {
            push_event(report, EventType::BLOCK, growing.owner, gained, "",
                       std::string(who(growing.owner)) + " • growing defense: block +" +
                       std::to_string(gained) + " (" + std::to_string(before) + " -> " +
                       std::to_string(owner.block) + ")");
        }
    }
}

void BattleEngine::apply_burn(BattleState& state, const QueueItem& item, StepReport& report) {
    ActorState& side = state.side(item.actor);

    int damage = burn_damage(side.tokens);
    if (side.has_units() && item.card.source_unit_id) {
        const Unit* source = side.find_unit(*item.card.source_unit_id);
        if (source) {
            damage += burn_damage(source->tokens);
        }
    }
    if (damage <= 0) {
        return;
    }

    const int before = side.hp;
    const int lost = damage_directly(side, item.card.source_unit_id, damage);
    push_event(report, EventType::BURN, item.actor, lost, item.card.name(),
               std::string(who(item.actor)) + " • " + item.card.name() + ": burn " +
               std::to_string(damage) + " (hp " + std::to_string(before) + " -> " +
               std::to_string(side.hp) + ")");
}

void BattleEngine::apply_timeline_effects(BattleState& state, const QueueItem& item,
                                          const ActionResult& result, StepReport& report) {
    // Parry windows react to the opposing side's attacks
    if (item.card.is_attack() && !state.parry_windows.empty()) {
        specials::ParryResult parry = specials::check_parry_trigger(
            state.parry_windows, item, state.scheduler, turn_max_speed(state, item.actor));
        append(report, parry.events, parry.logs);
    }

    if (result.outcome.stun) {
        specials::RemovalResult stun = specials::process_stun(item, state.scheduler,
                                                              config_.stun_range);
        append(report, stun.events, stun.logs);
    }

    specials::TimelineSpecialResult shifts = specials::process_timeline_specials(
        item.card, item.actor, state.scheduler, result.dealt, item.has_crossed);
    append(report, shifts.events, shifts.logs);
    if (shifts.changes.any()) {
        state.scheduler.reorder(item.actor, shifts.changes);
    }

    if (result.outcome.open_parry_window) {
        specials::ParryWindow window = specials::setup_parry_window(item, config_.parry_range,
                                                                    config_.parry_push);
        push_event(report, EventType::PARRY, item.actor, window.push_amount, item.card.name(),
                   std::string(who(item.actor)) + " • " + item.card.name() +
                   ": parry stance (sp " + std::to_string(window.center_sp) + "-" +
                   std::to_string(window.max_sp) + ")");
        state.parry_windows.push_back(window);
    }

    if (result.outcome.start_growing_defense) {
        specials::GrowingDefense growing;
        growing.owner = item.actor;
        growing.activated_sp = item.sp;
        growing.rate = config_.growing_defense_rate;
        state.growing_defenses.push_back(growing);
    }
}

void BattleEngine::insert_created_cards(BattleState& state, const QueueItem& item,
                                        ActionResult& result, StepReport& report) {
    std::vector<QueueItem> inserted;

    for (auto& card : result.created_cards) {
        card.id = state.make_instance_id("g_");
        inserted.emplace_back(item.actor, std::move(card), item.sp + CREATION_SP_OFFSET);
    }

    int offset = CREATION_SP_OFFSET;
    for (auto& card : result.outcome.bonus_cards) {
        card.id = state.make_instance_id("g_");
        const int sp = item.sp + offset;
        offset += card.def.speed_cost;
        inserted.emplace_back(item.actor, std::move(card), sp);
    }

    if (inserted.empty()) {
        return;
    }
    for (const auto& queued : inserted) {
        report.logs.push_back(std::string(who(item.actor)) + " • \"" + queued.card.name() +
                              "\" queued at sp " + std::to_string(queued.sp));
    }
    state.scheduler.insert(std::move(inserted));
}

void BattleEngine::open_choice(BattleState& state, const QueueItem& item,
                               const SpecialOutcome& outcome, StepReport& report) {
    if (!outcome.trigger_breach && !outcome.trigger_fencing_creation) {
        return;
    }

    PendingChoice choice;
    choice.actor = item.actor;
    choice.source_card = item.card.card_id();
    choice.source_name = item.card.name();

    if (outcome.trigger_breach) {
        choice.kind = ChoiceKind::BREACH;
        choice.insert_sp = item.sp + BREACH_SP_OFFSET;
        std::vector<CardDefID> offers = specials::generate_breach_offers(
            catalog_, item.card.card_id(), rng_, config_.creation_choice_size);
        if (!offers.empty()) {
            choice.rounds.push_back(std::move(offers));
        }
    } else {
        choice.kind = ChoiceKind::FENCING_CREATION;
        choice.insert_sp = item.sp + CREATION_SP_OFFSET;
        choice.is_aoe = true;
        choice.rounds = specials::generate_fencing_offers(
            catalog_, item.card.card_id(), rng_, 3, config_.creation_choice_size);
    }

    if (choice.rounds.empty()) {
        push_event(report, EventType::INFO, item.actor, 0, item.card.name(),
                   std::string(who(item.actor)) + " • " + item.card.name() +
                   ": no cards to offer");
        return;
    }

    push_event(report, EventType::BREACH, item.actor, choice.remaining_rounds(), item.card.name(),
               std::string(who(item.actor)) + " • " + item.card.name() + ": choose 1 of " +
               std::to_string(choice.offers().size()) + " cards");

    state.pending_choice = std::move(choice);

    // The enemy never pauses the battle: it takes the first offer
    if (item.actor == Actor::ENEMY) {
        while (state.pending_choice) {
            const CardDefID pick = state.pending_choice->offers().front();
            if (!apply_choice(state, pick, report.events)) {
                state.pending_choice.reset();
                break;
            }
        }
        return;
    }

    state.phase = BattlePhase::AWAITING_CHOICE;
    report.choice_required = true;
}

bool BattleEngine::apply_choice(BattleState& state, const CardDefID& card_id,
                                std::vector<BattleEvent>& events) {
    PendingChoice& choice = *state.pending_choice;

    std::optional<CardInstance> ghost = specials::make_ghost_card(catalog_, card_id,
                                                                  choice.source_card);
    if (!ghost) {
        std::cerr << "[BattleEngine] Offered card missing from catalog: " << card_id << std::endl;
        return false;
    }
    ghost->id = state.make_instance_id("g_");
    ghost->is_aoe = choice.is_aoe;

    const std::string message = std::string(who(choice.actor)) + " • " + choice.source_name +
                                ": \"" + ghost->name() + "\" queued at sp " +
                                std::to_string(choice.insert_sp);
    events.push_back(BattleEvent{EventType::CREATE, choice.actor, 1, ghost->name(), message});

    std::vector<QueueItem> items;
    items.emplace_back(choice.actor, std::move(*ghost), choice.insert_sp);
    state.scheduler.insert(std::move(items));

    choice.rounds.erase(choice.rounds.begin());
    if (choice.rounds.empty()) {
        state.pending_choice.reset();
    }
    return true;
}

bool BattleEngine::resume_with_choice(BattleState& state, const CardDefID& card_id) {
    if (state.phase != BattlePhase::AWAITING_CHOICE || !state.pending_choice) {
        std::cerr << "[BattleEngine] No choice pending" << std::endl;
        return false;
    }
    if (!state.pending_choice->is_offered(card_id)) {
        std::cerr << "[BattleEngine] Card was not offered: " << card_id << std::endl;
        return false;
    }

    if (!apply_choice(state, card_id, state.pending_events)) {
        return false;
    }

    if (state.pending_choice) {
        notify_choice(state);
        return true;
    }

    state.phase = state.scheduler.exhausted() ? BattlePhase::TURN_END : BattlePhase::RESOLVE;
    return true;
}

void BattleEngine::expire_timeline_tokens(BattleState& state, int sp, StepReport& report) {
    for (ActorState* side : {&state.player, &state.enemy}) {
        append_logs(report, side->tokens.expire_turn_tokens_by_timeline(state.turn, sp).logs);
        for (auto& unit : side->units) {
            append_logs(report, unit.tokens.expire_turn_tokens_by_timeline(state.turn, sp).logs);
        }
    }
}

void BattleEngine::check_defeat(BattleState& state, StepReport& report) {
    state.enemy.recompute_hp_from_units();

    if (state.result == BattleResult::ONGOING) {
        if (state.enemy.is_defeated()) {
            state.result = BattleResult::PLAYER_WIN;
            push_event(report, EventType::DEFEAT, Actor::ENEMY, 0, "",
                       state.enemy.name + " defeated");
        } else if (state.player.is_defeated()) {
            state.result = BattleResult::ENEMY_WIN;
            push_event(report, EventType::DEFEAT, Actor::PLAYER, 0, "",
                       state.player.name + " defeated");
        }
    }

    if (state.is_over()) {
        report.battle_over = true;
        state.pending_choice.reset();
        if (state.phase == BattlePhase::RESOLVE || state.phase == BattlePhase::AWAITING_CHOICE) {
            state.phase = BattlePhase::TURN_END;
            report.turn_complete = true;
            report.choice_required = false;
        }
    }
}

// ============================================================================
// TURN END
// ============================================================================

TurnEndReport BattleEngine::finish_turn(BattleState& state) {
    TurnEndReport report;
    report.turn = state.turn;

    if (state.phase != BattlePhase::TURN_END) {
        std::cerr << "[BattleEngine] finish_turn called in phase "
                  << to_string(state.phase) << std::endl;
        return report;
    }
    report.valid = true;

    // Ether and combos
    report.player_ether = calculate_turn_ether(state.player_turn.played,
                                               state.player_turn.accumulated_ether, state.player);
    report.enemy_ether = calculate_turn_ether(state.enemy_turn.played,
                                              state.enemy_turn.accumulated_ether, state.enemy);
    report.logs.insert(report.logs.end(), report.player_ether.logs.begin(),
                       report.player_ether.logs.end());
    report.logs.insert(report.logs.end(), report.enemy_ether.logs.begin(),
                       report.enemy_ether.logs.end());

    if (!combo_cards(state.player_turn.played).empty()) {
        record_combo_usage(state.player, report.player_ether.combo);
    }
    if (!combo_cards(state.enemy_turn.played).empty()) {
        record_combo_usage(state.enemy, report.enemy_ether.combo);
    }

    report.transfer = calculate_ether_transfer(report.player_ether.applied_ether,
                                               report.enemy_ether.applied_ether,
                                               state.player.ether_pts,
                                               state.enemy.ether_pts,
                                               state.enemy.hp);
    state.player.ether_pts = report.transfer.next_player_pts;
    state.enemy.ether_pts = report.transfer.next_enemy_pts;
    state.enemy.ether_slots = calculate_ether_slots(state.enemy.ether_pts);
    report.logs.insert(report.logs.end(), report.transfer.logs.begin(),
                       report.transfer.logs.end());
    if (report.transfer.moved != 0) {
        const Actor gainer = report.transfer.moved > 0 ? Actor::PLAYER : Actor::ENEMY;
        report.events.push_back(BattleEvent{EventType::INFO, gainer,
                                            std::abs(report.transfer.moved), "",
                                            report.transfer.logs.front()});
    }

    // Tokens and flags
    for (ActorState* side : {&state.player, &state.enemy}) {
        auto cleared = side->tokens.clear_turn_tokens();
        report.logs.insert(report.logs.end(), cleared.logs.begin(), cleared.logs.end());
        auto immunity = side->tokens.remove("jam_immunity", 1);
        report.logs.insert(report.logs.end(), immunity.logs.begin(), immunity.logs.end());
        for (auto& unit : side->units) {
            auto unit_cleared = unit.tokens.clear_turn_tokens();
            report.logs.insert(report.logs.end(), unit_cleared.logs.begin(),
                               unit_cleared.logs.end());
        }
        side->reset_turn_flags();
    }

    // Timeline
    state.scheduler.clear();
    state.parry_windows.clear();
    state.growing_defenses.clear();
    state.pending_choice.reset();
    state.pending_events.clear();
    state.player_turn.reset_turn();
    state.enemy_turn.reset_turn();
    state.committed_hand.clear();

    report.result = state.result;
    if (state.is_over()) {
        state.phase = BattlePhase::FINISHED;
    } else {
        state.turn++;
        state.phase = BattlePhase::SELECT;
    }

    notify_turn_end(state, report);
    return report;
}

// ============================================================================
// SINK DISPATCH
// ============================================================================

void BattleEngine::notify_step(const BattleState& state, const StepReport& report) {
    for (PresentationSink* sink : sinks_) {
        sink->on_step(state, report);
    }
}

void BattleEngine::notify_turn_end(const BattleState& state, const TurnEndReport& report) {
    for (PresentationSink* sink : sinks_) {
        sink->on_turn_end(state, report);
    }
}

void BattleEngine::notify_choice(const BattleState& state) {
    if (!state.pending_choice) {
        return;
    }
    for (PresentationSink* sink : sinks_) {
        sink->on_choice_required(state, *state.pending_choice);
    }
}

} // namespace tactics
