/**
 * Tests for the Enemy AI Planner
 */

#include "enemy_ai.hpp"

using namespace tactics;
using namespace tactics::testing;

namespace {

CardCatalog enemy_catalog() {
    CardCatalog catalog;
    catalog.add_card(make_attack("bite", 5, 5), true);
    catalog.add_card(make_card("claw", CardType::ATTACK, 8, 0, 8, 2), true);
    catalog.add_card(make_defense("shell", 6, 4), true);
    return catalog;
}

std::vector<CardDefID> ids_of(const std::vector<const CardDef*>& cards) {
    std::vector<CardDefID> ids;
    for (const CardDef* card : cards) {
        ids.push_back(card->card_id);
    }
    return ids;
}

} // anonymous namespace

// ============================================================================
// BUDGET / MODE TESTS
// ============================================================================

TEST(EnemyPlanner, BudgetsGrowWithMinCards) {
    CardCatalog catalog = enemy_catalog();
    EngineConfig config;
    ScriptedRng rng;
    EnemyPlanner planner(catalog, config, rng);

    ActorState enemy = make_enemy();
    TEST_ASSERT_EQ(30, planner.speed_budget(enemy));
    TEST_ASSERT_EQ(6, planner.energy_budget(enemy));

    enemy.min_cards = 3;
    enemy.ether_slots = 2;
    TEST_ASSERT_EQ(50, planner.speed_budget(enemy));
    TEST_ASSERT_EQ(12, planner.energy_budget(enemy));
}

TEST(EnemyPlanner, PickModeFollowsWeights) {
    CardCatalog catalog = enemy_catalog();
    EngineConfig config;
    ScriptedRng rng;
    rng.doubles = {0.1, 0.5, 0.9};
    EnemyPlanner planner(catalog, config, rng);

    TEST_ASSERT(planner.pick_mode("") == AiMode::AGGRO);
    TEST_ASSERT(planner.pick_mode("") == AiMode::TURTLE);
    TEST_ASSERT(planner.pick_mode("") == AiMode::BALANCED);
    TEST_ASSERT_EQ(3, rng.doubles_used);
}

TEST(EnemyPlanner, PerKindWeightsOverrideDefault) {
    CardCatalog catalog = enemy_catalog();
    EngineConfig config;
    config.enemy_mode_weights["brute"] = AiModeWeights{0.0, 1.0, 0.0};
    ScriptedRng rng;
    EnemyPlanner planner(catalog, config, rng);

    TEST_ASSERT(planner.pick_mode("brute") == AiMode::TURTLE);
    TEST_ASSERT(planner.pick_mode("other") == AiMode::BALANCED);
}

TEST(EnemyPlanner, StatsAndScore) {
    CardCatalog catalog = enemy_catalog();
    const CardDef* bite = catalog.get_card("bite");
    const CardDef* shell = catalog.get_card("shell");

    PlanStats s = EnemyPlanner::stats({bite, shell});
    TEST_ASSERT_EQ(1, s.atk);
    TEST_ASSERT_EQ(1, s.def);
    TEST_ASSERT_EQ(5, s.dmg);
    TEST_ASSERT_EQ(6, s.blk);
    TEST_ASSERT_EQ(9, s.sp);
    TEST_ASSERT_EQ(2, s.en);

    TEST_ASSERT_EQ(10145, EnemyPlanner::score(AiMode::AGGRO, {bite}));
    TEST_ASSERT_EQ(20101, EnemyPlanner::score(AiMode::BALANCED, {bite, shell}));
}

// ============================================================================
// SELECTION TESTS
// ============================================================================

TEST(EnemyPlanner, ChooseCardsPerMode) {
    CardCatalog catalog = enemy_catalog();
    EngineConfig config;
    ScriptedRng rng;
    EnemyPlanner planner(catalog, config, rng);

    ActorState enemy = make_enemy();
    enemy.max_cards = 2;
    enemy.deck = {"bite", "claw", "shell"};

    std::vector<CardDefID> aggro = ids_of(planner.choose_cards(enemy, AiMode::AGGRO));
    TEST_ASSERT_EQ(2u, aggro.size());
    TEST_ASSERT_EQ(std::string("bite"), aggro[0]);
    TEST_ASSERT_EQ(std::string("claw"), aggro[1]);

    std::vector<CardDefID> balanced = ids_of(planner.choose_cards(enemy, AiMode::BALANCED));
    TEST_ASSERT_EQ(2u, balanced.size());
    TEST_ASSERT_EQ(std::string("bite"), balanced[0]);
    TEST_ASSERT_EQ(std::string("shell"), balanced[1]);

    // No pair reaches the turtle threshold, so the best-scoring pair wins
    std::vector<CardDefID> turtle = ids_of(planner.choose_cards(enemy, AiMode::TURTLE));
    TEST_ASSERT_EQ(std::string("shell"), turtle[1]);
}

TEST(EnemyPlanner, MinCardsRepeatsSmallDeck) {
    CardCatalog catalog = enemy_catalog();
    EngineConfig config;
    ScriptedRng rng;
    EnemyPlanner planner(catalog, config, rng);

    ActorState enemy = make_enemy();
    enemy.min_cards = 2;
    enemy.max_cards = 2;
    enemy.deck = {"bite"};

    EnemyPlan plan = planner.plan(enemy);
    TEST_ASSERT(plan.mode == AiMode::BALANCED);
    std::vector<CardDefID> ids = plan.card_ids();
    TEST_ASSERT_EQ(2u, ids.size());
    TEST_ASSERT_EQ(std::string("bite"), ids[0]);
    TEST_ASSERT_EQ(std::string("bite"), ids[1]);
}

TEST(EnemyPlanner, EmptyDeckFallsBackToCatalogEnemyCards) {
    CardCatalog catalog = enemy_catalog();
    EngineConfig config;
    ScriptedRng rng;
    EnemyPlanner planner(catalog, config, rng);

    ActorState enemy = make_enemy();
    enemy.deck = {"missing"};
    TEST_ASSERT_EQ(1u, planner.choose_cards(enemy, AiMode::AGGRO).size());
}

TEST(EnemyPlanner, NothingFitsPlansNothing) {
    CardCatalog catalog;
    catalog.add_card(make_attack("slam", 20, 40), true);
    EngineConfig config;
    ScriptedRng rng;
    EnemyPlanner planner(catalog, config, rng);

    ActorState enemy = make_enemy();
    enemy.deck = {"slam"};
    TEST_ASSERT_TRUE(planner.choose_cards(enemy, AiMode::AGGRO).empty());
}

// ============================================================================
// UNIT / OVERDRIVE TESTS
// ============================================================================

TEST(EnemyPlanner, SourceUnitsRoundRobinOverLivingUnits) {
    ActorState enemy = make_enemy();
    enemy.units.push_back(make_unit(1, 10));
    enemy.units.push_back(make_unit(2, 0));
    enemy.units.push_back(make_unit(3, 10));

    std::vector<CardInstance> actions;
    for (int i = 0; i < 3; ++i) {
        actions.emplace_back("e_" + std::to_string(i), make_attack("bite", 5));
    }
    assign_source_units(actions, enemy);

    TEST_ASSERT_EQ(1, actions[0].source_unit_id.value_or(0));
    TEST_ASSERT_EQ(3, actions[1].source_unit_id.value_or(0));
    TEST_ASSERT_EQ(1, actions[2].source_unit_id.value_or(0));

    std::vector<CardInstance> solo;
    solo.emplace_back("e_9", make_attack("bite", 5));
    assign_source_units(solo, make_enemy());
    TEST_ASSERT_FALSE(solo[0].source_unit_id.has_value());
}

TEST(EnemyPlanner, OverdriveStaysLocked) {
    CardCatalog catalog = enemy_catalog();
    EnemyPlan plan;
    plan.mode = AiMode::AGGRO;
    plan.cards = {catalog.get_card("bite")};

    ActorState enemy = make_enemy();
    enemy.ether_slots = 0;
    TEST_ASSERT_FALSE(should_enemy_overdrive(enemy, plan, 5));

    enemy.ether_slots = 2;
    TEST_ASSERT_FALSE(should_enemy_overdrive(enemy, plan, 1));

    // Slot and turn checks pass, the lock still holds
    TEST_ASSERT_FALSE(ENEMY_OVERDRIVE_ENABLED);
    TEST_ASSERT_FALSE(should_enemy_overdrive(enemy, plan, 5));
}
