/**
 * Tests for hit calculation, the multi-hit loop and the action resolver
 */

#include "action_resolver.hpp"
#include "hit_calculation.hpp"
#include "multi_hit.hpp"

using namespace tactics;
using namespace tactics::testing;

namespace {

CardDef make_gun(const CardDefID& id, int damage, int hits) {
    CardDef gun = make_attack(id, damage, 5, CardCategory::GUN);
    gun.hits = hits;
    return gun;
}

} // anonymous namespace

// ============================================================================
// SINGLE HIT TESTS
// ============================================================================

TEST(HitCalculation, BlockAbsorbsPartialHit) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    defender.gain_block(8);
    ScriptedRng rng;

    CardInstance card("p_1", make_attack("strike", 5));
    HitResult blocked = calculate_single_hit(attacker, defender, card, Actor::PLAYER, false,
                                             HitOptions{}, rng);
    TEST_ASSERT_TRUE(blocked.fully_blocked);
    TEST_ASSERT_EQ(0, blocked.damage);
    TEST_ASSERT_EQ(3, defender.block);
    TEST_ASSERT_EQ(40, defender.hp);

    HitResult through = calculate_single_hit(attacker, defender, card, Actor::PLAYER, false,
                                             HitOptions{}, rng);
    TEST_ASSERT_EQ(2, through.damage);
    TEST_ASSERT_EQ(3, through.block_destroyed);
    TEST_ASSERT_EQ(38, defender.hp);
}

TEST(HitCalculation, CrushDoublesDamageAgainstBlock) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    defender.gain_block(8);
    ScriptedRng rng;

    CardDef blow = make_attack("blow", 5);
    blow.traits.push_back("crush");
    HitResult hit = calculate_single_hit(attacker, defender, CardInstance("p_1", blow),
                                         Actor::PLAYER, false, HitOptions{}, rng);
    TEST_ASSERT_EQ(2, hit.damage);
    TEST_ASSERT_EQ(0, defender.block);
}

TEST(HitCalculation, CriticalStrengthAndFencingBonus) {
    ActorState attacker = make_player();
    attacker.strength = 1;
    ActorState defender = make_enemy(40);
    ScriptedRng rng;

    HitOptions options;
    options.fencing_damage_bonus = 3;
    CardInstance blade("p_1", make_attack("blade", 5, 5, CardCategory::FENCING));
    HitResult hit = calculate_single_hit(attacker, defender, blade, Actor::PLAYER, true,
                                         options, rng);
    TEST_ASSERT_EQ(18, hit.damage);

    CardInstance club("p_2", make_attack("club", 5));
    TEST_ASSERT_EQ(6, calculate_single_hit(attacker, defender, club, Actor::PLAYER, false,
                                           options, rng).damage);
}

TEST(HitCalculation, CounterOnlyWhenHpIsHit) {
    ActorState attacker = make_player(20);
    ActorState defender = make_enemy(40);
    defender.counter = 3;
    ScriptedRng rng;
    CardInstance card("p_1", make_attack("strike", 5));

    HitResult hit = calculate_single_hit(attacker, defender, card, Actor::PLAYER, false,
                                         HitOptions{}, rng);
    TEST_ASSERT_EQ(3, hit.damage_taken);
    TEST_ASSERT_EQ(17, attacker.hp);

    defender.gain_block(20);
    HitResult blocked = calculate_single_hit(attacker, defender, card, Actor::PLAYER, false,
                                             HitOptions{}, rng);
    TEST_ASSERT_EQ(0, blocked.damage_taken);
    TEST_ASSERT_EQ(17, attacker.hp);
}

TEST(HitCalculation, GuaranteedCritSkipsRoll) {
    ScriptedRng rng;
    TokenStore tokens;
    CardDef sure = make_attack("sure", 5);
    sure.specials.push_back("guaranteedCrit");
    TEST_ASSERT_TRUE(roll_critical(CardInstance("p_1", sure), tokens, 0.05, rng));
    TEST_ASSERT_EQ(0, rng.doubles_used);

    rng.doubles = {0.07};
    tokens.add("crit_boost", 1);
    TEST_ASSERT_TRUE(roll_critical(CardInstance("p_2", make_attack("plain", 5)), tokens, 0.05, rng));
}

// ============================================================================
// ROULETTE TESTS
// ============================================================================

TEST(Roulette, JamAtFourStacks) {
    ActorState attacker = make_player();
    attacker.tokens.add("roulette", 4);
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    rng.doubles = {0.99, 0.1};

    MultiHitResolver resolver(rng, HitOptions{});
    MultiHitResult result = resolver.resolve(attacker, defender,
                                             CardInstance("p_1", make_gun("pistol", 5, 2)),
                                             Actor::PLAYER, 2);
    TEST_ASSERT_TRUE(result.jammed);
    TEST_ASSERT_EQ(1, result.hits_completed);
    TEST_ASSERT_EQ(5, result.dealt);
    TEST_ASSERT_EQ(1, attacker.tokens.stacks("gun_jam"));
    TEST_ASSERT_EQ(0, attacker.tokens.stacks("roulette"));
    TEST_ASSERT_EQ(35, defender.hp);
}

TEST(Roulette, EachHitAddsAStack) {
    ActorState attacker = make_player();
    attacker.tokens.add("roulette", 4);
    ActorState defender = make_enemy(40);
    ScriptedRng rng;

    MultiHitResolver resolver(rng, HitOptions{});
    MultiHitResult result = resolver.resolve(attacker, defender,
                                             CardInstance("p_1", make_gun("pistol", 5, 2)),
                                             Actor::PLAYER, 2);
    TEST_ASSERT_FALSE(result.jammed);
    TEST_ASSERT_EQ(2, result.hits_completed);
    TEST_ASSERT_EQ(6, attacker.tokens.stacks("roulette"));
}

TEST(Roulette, JamImmunitySuppressesWithoutStacking) {
    TokenStore tokens;
    tokens.add("roulette", 4);
    tokens.add("jam_immunity", 1);
    ScriptedRng rng;
    rng.doubles = {0.0};

    RouletteResult result = process_per_hit_roulette(tokens, CardInstance("p_1", make_gun("g", 5, 1)),
                                                     Actor::PLAYER, 0, 1, rng);
    TEST_ASSERT_TRUE(result.suppressed);
    TEST_ASSERT_FALSE(result.jammed);
    TEST_ASSERT_EQ(4, tokens.stacks("roulette"));
    TEST_ASSERT_FALSE(tokens.has("gun_jam"));
}

TEST(Roulette, SingleRouletteChecksFirstHitOnly) {
    TokenStore tokens;
    ScriptedRng rng;
    CardDef piercer = make_gun("piercer", 8, 2);
    piercer.specials.push_back("singleRoulette");
    CardInstance card("p_1", piercer);

    TEST_ASSERT_TRUE(process_per_hit_roulette(tokens, card, Actor::PLAYER, 0, 2, rng).checked);
    TEST_ASSERT_FALSE(process_per_hit_roulette(tokens, card, Actor::PLAYER, 1, 2, rng).checked);
    TEST_ASSERT_EQ(1, tokens.stacks("roulette"));
}

TEST(Roulette, NonGunCardsSkipCheck) {
    TokenStore tokens;
    ScriptedRng rng;
    RouletteResult result = process_per_hit_roulette(
        tokens, CardInstance("p_1", make_attack("strike", 5)), Actor::PLAYER, 0, 1, rng);
    TEST_ASSERT_FALSE(result.checked);
    TEST_ASSERT_FALSE(tokens.has("roulette"));
}

// ============================================================================
// ACTION RESOLVER TESTS
// ============================================================================

TEST(ActionResolver, JammedGunSpendsActionClearing) {
    ActorState attacker = make_player();
    attacker.tokens.add("gun_jam", 1);
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance card("p_1", make_gun("pistol", 5, 1));
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_TRUE(result.has_value());
    TEST_ASSERT_TRUE(result->jammed);
    TEST_ASSERT_EQ(0, result->dealt);
    TEST_ASSERT_EQ(40, defender.hp);
    TEST_ASSERT_FALSE(attacker.tokens.has("gun_jam"));
}

TEST(ActionResolver, UnknownCardHasNoResult) {
    CardCatalog catalog;
    ActorState attacker = make_player();
    ActorState defender = make_enemy();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance card("p_1", make_attack("ghost_card", 5));
    TEST_ASSERT_FALSE(resolver.resolve(attacker, defender, card, Actor::PLAYER,
                                       make_context(&catalog)).has_value());
    TEST_ASSERT_EQ(40, defender.hp);
}

TEST(ActionResolver, BlockCardGainsBlock) {
    ActorState attacker = make_player();
    attacker.tokens.add("guard", 1);
    ActorState defender = make_enemy();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance card("p_1", make_defense("guard_stance", 6));
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(9, result->blocked);
    TEST_ASSERT_EQ(9, attacker.block);
    TEST_ASSERT_TRUE(attacker.def);
    TEST_ASSERT_FALSE(result->attacked);
    TEST_ASSERT_FALSE(attacker.tokens.has("guard"));
}

TEST(ActionResolver, IgnoreBlockBypassesBlock) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    defender.gain_block(10);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef piercer = make_attack("piercer", 8);
    piercer.specials.push_back("ignoreBlock");
    CardInstance card("p_1", piercer);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(8, result->dealt);
    TEST_ASSERT_EQ(10, defender.block);
    TEST_ASSERT_EQ(32, defender.hp);
}

TEST(ActionResolver, CriticalAddsAppliedTokenStack) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef brand = make_attack("brand", 4);
    brand.specials.push_back("guaranteedCrit");
    brand.applied_tokens.push_back(TokenGrant{"burn", 1, false});
    CardInstance card("p_1", brand);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_TRUE(result->is_critical);
    TEST_ASSERT_EQ(8, result->dealt);
    TEST_ASSERT_EQ(2, defender.tokens.stacks("burn"));
}

TEST(ActionResolver, PlayerCriticalsGrantFinesse) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef twin = make_attack("twin", 3, 5, CardCategory::FENCING);
    twin.hits = 2;
    twin.specials.push_back("guaranteedCrit");
    CardInstance card("p_1", twin);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(2, result->critical_hits);
    TEST_ASSERT_EQ(2, attacker.tokens.stacks("finesse"));

    // Enemy criticals grant nothing
    CardInstance bite("e_1", twin);
    resolver.resolve(defender, attacker, bite, Actor::ENEMY, make_context());
    TEST_ASSERT_EQ(0, defender.tokens.stacks("finesse"));
}

TEST(ActionResolver, ViolentMortExecutesThroughRevive) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    defender.tokens.add("revive", 1);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef mort = make_attack("mort", 12, 8, CardCategory::FENCING);
    mort.specials.push_back("violentMort");
    CardInstance card("p_1", mort);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());

    TEST_ASSERT_TRUE(has_event(result->events, EventType::EXECUTE));
    TEST_ASSERT_FALSE(has_event(result->events, EventType::REVIVE));
    TEST_ASSERT_EQ(0, defender.hp);
    TEST_ASSERT_FALSE(defender.tokens.has("revive"));
}

TEST(ActionResolver, ViolentMortSparesHealthyTargets) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(60);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef mort = make_attack("mort", 12, 8, CardCategory::FENCING);
    mort.specials.push_back("violentMort");
    CardInstance card("p_1", mort);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_FALSE(has_event(result->events, EventType::EXECUTE));
    TEST_ASSERT_EQ(48, defender.hp);

    // Enemies never execute with it
    ActorState player = make_player(25);
    CardInstance enemy_mort("e_1", mort);
    resolver.resolve(defender, player, enemy_mort, Actor::ENEMY, make_context());
    TEST_ASSERT_EQ(13, player.hp);
}

TEST(ActionResolver, RequiredTokensArePaid) {
    ActorState attacker = make_player();
    attacker.tokens.add("finesse", 2);
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef focus = make_attack("focus", 12, 7, CardCategory::FENCING);
    focus.required_tokens.push_back(TokenGrant{"finesse", 1, true});
    CardInstance card("p_1", focus);
    resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(1, attacker.tokens.stacks("finesse"));
    TEST_ASSERT_EQ(28, defender.hp);
}

TEST(ActionResolver, SoloAttackDoublesDamage) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef solo = make_attack("solo", 6);
    solo.specials.push_back("doubleDamageIfSolo");
    ResolveContext ctx = make_context();
    ctx.attack_cards_this_turn = 1;
    CardInstance card("p_1", solo);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, ctx);
    TEST_ASSERT_EQ(12, result->dealt);

    ctx.attack_cards_this_turn = 2;
    CardInstance again("p_2", solo);
    TEST_ASSERT_EQ(6, resolver.resolve(attacker, defender, again, Actor::PLAYER, ctx)->dealt);
}

TEST(ActionResolver, RepeatIfLastAddsHit) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(40);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef closer = make_attack("closer", 5);
    closer.specials.push_back("repeatIfLast");
    ResolveContext ctx = make_context();
    ctx.is_last_own_card = true;
    CardInstance card("p_1", closer);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, ctx);
    TEST_ASSERT_EQ(2, result->hits_completed);
    TEST_ASSERT_EQ(10, result->dealt);
}

TEST(ActionResolver, ExecuteUnderTenPercent) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy(100);
    defender.hp = 15;
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef coup = make_attack("coup", 8);
    coup.specials.push_back("executeUnder10");
    CardInstance card("p_1", coup);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(0, defender.hp);
    TEST_ASSERT_TRUE(has_event(result->events, EventType::EXECUTE));
}

TEST(ActionResolver, LifestealAndRevive) {
    ActorState attacker = make_player(50);
    attacker.hp = 30;
    attacker.tokens.add("absorb", 1);
    ActorState defender = make_enemy(40);
    defender.hp = 6;
    defender.tokens.add("revive", 1);
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance card("p_1", make_attack("strike", 10));
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(6, result->dealt);
    TEST_ASSERT_EQ(33, attacker.hp);
    TEST_ASSERT_EQ(20, defender.hp);
    TEST_ASSERT_FALSE(defender.tokens.has("revive"));
    TEST_ASSERT_TRUE(has_event(result->events, EventType::REVIVE));
}

TEST(ActionResolver, CardPlayFlagsReachOutcome) {
    ActorState attacker = make_player();
    ActorState defender = make_enemy();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef focus = make_card("focus", CardType::GENERAL, 0, 0, 2);
    focus.specials.push_back("mentalFocus");
    focus.traits.push_back("stun");
    CardInstance card("p_1", focus);
    auto result = resolver.resolve(attacker, defender, card, Actor::PLAYER, make_context());
    TEST_ASSERT_TRUE(result->outcome.stun);
    TEST_ASSERT_EQ(2, result->outcome.next_turn.bonus_energy);
    TEST_ASSERT_EQ(1, result->outcome.next_turn.max_speed_bonus);
    TEST_ASSERT_TRUE(result->outcome.events.empty());
    TEST_ASSERT_TRUE(has_event(result->events, EventType::INFO));
}
