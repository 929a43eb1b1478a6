/**
 * Tests for damage distribution over composite enemy units
 */

#include "action_resolver.hpp"

using namespace tactics;
using namespace tactics::testing;

namespace {

ActorState make_squad() {
    ActorState enemy = make_enemy(40);
    enemy.units.push_back(make_unit(1, 20, 4));
    enemy.units.push_back(make_unit(2, 20, 0));
    enemy.recompute_hp_from_units();
    return enemy;
}

int unit_hp_sum(const ActorState& side) {
    int total = 0;
    for (const auto& unit : side.units) {
        total += std::max(0, unit.hp);
    }
    return total;
}

} // anonymous namespace

// ============================================================================
// TARGET SELECTION
// ============================================================================

TEST(UnitTargeting, ExplicitTargetWins) {
    ActorState enemy = make_squad();
    CardInstance card("p_1", make_attack("strike", 5));
    card.target_unit_id = 2;

    Unit* unit = ActionResolver::resolve_target_unit(enemy, card, UnitID(1));
    TEST_ASSERT_NOT_NULL(unit);
    TEST_ASSERT_EQ(2, unit->unit_id);
}

TEST(UnitTargeting, SelectedTargetThenFirstAlive) {
    ActorState enemy = make_squad();
    CardInstance card("p_1", make_attack("strike", 5));

    TEST_ASSERT_EQ(2, ActionResolver::resolve_target_unit(enemy, card, UnitID(2))->unit_id);
    TEST_ASSERT_EQ(1, ActionResolver::resolve_target_unit(enemy, card, std::nullopt)->unit_id);

    enemy.units[0].hp = 0;
    TEST_ASSERT_EQ(2, ActionResolver::resolve_target_unit(enemy, card, UnitID(1))->unit_id);

    enemy.units[1].hp = 0;
    TEST_ASSERT_NULL(ActionResolver::resolve_target_unit(enemy, card, std::nullopt));
}

// ============================================================================
// DISTRIBUTION
// ============================================================================

TEST(UnitTargeting, AoeHitsEveryUnitThroughUnitBlock) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef sweep = make_attack("sweep", 10);
    sweep.specials.push_back("aoeAttack");
    CardInstance card("p_1", sweep);
    auto result = resolver.resolve(player, enemy, card, Actor::PLAYER, make_context());

    TEST_ASSERT_TRUE(result.has_value());
    TEST_ASSERT_EQ(16, result->dealt);
    TEST_ASSERT_EQ(14, enemy.units[0].hp);
    TEST_ASSERT_EQ(0, enemy.units[0].block);
    TEST_ASSERT_EQ(10, enemy.units[1].hp);
    TEST_ASSERT_EQ(24, enemy.hp);
    TEST_ASSERT_TRUE(card.is_aoe);
}

TEST(UnitTargeting, SingleTargetFightsOnlyThatUnitsBlock) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    enemy.units[1].block = 5;
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    ResolveContext ctx = make_context();
    ctx.selected_target = 2;
    CardInstance card("p_1", make_attack("strike", 7));
    auto result = resolver.resolve(player, enemy, card, Actor::PLAYER, ctx);

    TEST_ASSERT_EQ(2, result->dealt);
    TEST_ASSERT_TRUE(result->target_had_block);
    TEST_ASSERT_EQ(2, result->target_unit_id.value_or(0));
    TEST_ASSERT_EQ(20, enemy.units[0].hp);
    TEST_ASSERT_EQ(4, enemy.units[0].block);
    TEST_ASSERT_EQ(18, enemy.units[1].hp);
    TEST_ASSERT_EQ(0, enemy.units[1].block);
    TEST_ASSERT_EQ(0, enemy.block);
    TEST_ASSERT_FALSE(enemy.def);
    TEST_ASSERT_EQ(38, enemy.hp);
}

TEST(UnitTargeting, LeftoverBlockStaysOnTargetUnit) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    enemy.units[0].block = 10;
    CardInstance card("p_1", make_attack("strike", 7));
    auto result = resolver.resolve(player, enemy, card, Actor::PLAYER, make_context());

    TEST_ASSERT_EQ(0, result->dealt);
    TEST_ASSERT_EQ(3, enemy.units[0].block);
    TEST_ASSERT_EQ(20, enemy.units[0].hp);
    TEST_ASSERT_EQ(0, enemy.block);
    TEST_ASSERT_EQ(40, enemy.hp);
}

TEST(UnitTargeting, ListedTargetsTakeDamageOncePerCard) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    enemy.units[0].block = 0;
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef volley = make_attack("volley", 4);
    volley.hits = 3;
    CardInstance card("p_1", volley);
    card.target_unit_ids = {1, 2};
    auto result = resolver.resolve(player, enemy, card, Actor::PLAYER, make_context());

    TEST_ASSERT_EQ(3, result->hits_completed);
    TEST_ASSERT_EQ(8, result->dealt);
    TEST_ASSERT_EQ(16, enemy.units[0].hp);
    TEST_ASSERT_EQ(16, enemy.units[1].hp);
    TEST_ASSERT_EQ(32, enemy.hp);
}

TEST(UnitTargeting, EnemyBlockLandsOnSourceUnit) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    enemy.units[0].block = 0;
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance wall("e_1", make_defense("wall", 4));
    wall.source_unit_id = 2;
    auto result = resolver.resolve(enemy, player, wall, Actor::ENEMY, make_context());

    TEST_ASSERT_EQ(4, result->blocked);
    TEST_ASSERT_EQ(0, enemy.units[0].block);
    TEST_ASSERT_EQ(4, enemy.units[1].block);
    TEST_ASSERT_EQ(0, enemy.block);
    TEST_ASSERT_FALSE(enemy.def);

    // Without a source unit the side itself blocks
    CardInstance brace("e_2", make_defense("brace", 3));
    resolver.resolve(enemy, player, brace, Actor::ENEMY, make_context());
    TEST_ASSERT_EQ(3, enemy.block);
    TEST_ASSERT_TRUE(enemy.def);
}

TEST(UnitTargeting, TokensLandOnTargetedUnit) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardDef brand = make_attack("brand", 3);
    brand.applied_tokens.push_back(TokenGrant{"vulnerable", 1, false});
    CardInstance card("p_1", brand);
    card.target_unit_id = 2;
    resolver.resolve(player, enemy, card, Actor::PLAYER, make_context());

    TEST_ASSERT_TRUE(enemy.units[1].tokens.has("vulnerable"));
    TEST_ASSERT_FALSE(enemy.units[0].tokens.has("vulnerable"));
    TEST_ASSERT_FALSE(enemy.tokens.has("vulnerable"));
}

TEST(UnitTargeting, HpAlwaysMatchesUnitSum) {
    ActorState player = make_player();
    ActorState enemy = make_squad();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance heavy("p_1", make_attack("heavy", 25));
    resolver.resolve(player, enemy, heavy, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(0, enemy.units[0].hp);
    TEST_ASSERT_EQ(unit_hp_sum(enemy), enemy.hp);

    // The dead unit is skipped on the next attack
    CardInstance next("p_2", make_attack("strike", 5));
    auto result = resolver.resolve(player, enemy, next, Actor::PLAYER, make_context());
    TEST_ASSERT_EQ(2, result->target_unit_id.value_or(0));
    TEST_ASSERT_EQ(15, enemy.units[1].hp);
    TEST_ASSERT_EQ(unit_hp_sum(enemy), enemy.hp);
}

TEST(UnitTargeting, EnemyAttacksIgnoreUnits) {
    ActorState player = make_player(30);
    ActorState enemy = make_squad();
    ScriptedRng rng;
    ActionResolver resolver(full_registry(), rng);

    CardInstance claw("e_1", make_attack("claw", 6));
    auto result = resolver.resolve(enemy, player, claw, Actor::ENEMY, make_context());
    TEST_ASSERT_FALSE(result->target_unit_id.has_value());
    TEST_ASSERT_EQ(24, player.hp);
    TEST_ASSERT_EQ(40, enemy.hp);
}
