/**
 * Tests for timeline specials, card creation, parry, stun and growing defense
 */

#include <set>
#include "specials/special_effects.hpp"
#include "specials/special_handlers.hpp"

using namespace tactics;
using namespace tactics::specials;
using namespace tactics::testing;

namespace {

CardCatalog make_fencing_catalog() {
    CardCatalog catalog;
    CardDef fleche = make_attack("fleche", 7, 7, CardCategory::FENCING);
    fleche.specials.push_back("createAttackOnHit");
    catalog.add_card(fleche);
    catalog.add_card(make_attack("strike", 6, 5, CardCategory::FENCING));
    catalog.add_card(make_attack("lunge", 8, 6, CardCategory::FENCING));
    catalog.add_card(make_attack("beat", 4, 4, CardCategory::FENCING));
    catalog.add_card(make_attack("feint", 3, 3, CardCategory::FENCING));
    catalog.add_card(make_attack("shoot", 5, 3, CardCategory::GUN));
    CardDef breach = make_card("breach", CardType::SPECIAL, 0, 0, 4, 1, CardCategory::SPECIAL);
    breach.specials.push_back("breach");
    catalog.add_card(breach);
    catalog.add_card(make_defense("guard", 7));
    return catalog;
}

} // anonymous namespace

// ============================================================================
// TIMELINE SPECIAL TESTS
// ============================================================================

TEST(TimelineSpecials, PushEnemyTimelineNeedsDamage) {
    TimelineScheduler scheduler;
    CardDef lunge = make_attack("lunge", 8, 6);
    lunge.specials.push_back("pushEnemyTimeline");
    CardInstance card("p_1", lunge);

    TEST_ASSERT_FALSE(process_timeline_specials(card, Actor::PLAYER, scheduler, 0).changes.any());

    TimelineSpecialResult hit = process_timeline_specials(card, Actor::PLAYER, scheduler, 4);
    TEST_ASSERT_EQ(DEFAULT_PUSH_AMOUNT, hit.changes.push_opponent);
    TEST_ASSERT_EQ(1u, hit.events.size());
}

TEST(TimelineSpecials, BeatAdvancesAlwaysPushesOnHit) {
    TimelineScheduler scheduler;
    CardDef beat = make_attack("beat", 4, 4);
    beat.specials.push_back("beatEffect");
    CardInstance card("p_1", beat);

    TimelineSpecialResult miss = process_timeline_specials(card, Actor::PLAYER, scheduler, 0);
    TEST_ASSERT_EQ(DEFAULT_BEAT_ADVANCE, miss.changes.advance_own);
    TEST_ASSERT_EQ(0, miss.changes.push_opponent);

    TimelineSpecialResult hit = process_timeline_specials(card, Actor::PLAYER, scheduler, 2);
    TEST_ASSERT_EQ(DEFAULT_BEAT_PUSH, hit.changes.push_opponent);
}

TEST(TimelineSpecials, ShiftsFromSeveralSpecialsAccumulate) {
    TimelineScheduler scheduler;
    CardDef combo = make_attack("combo", 4, 4);
    combo.specials.push_back("advanceTimeline");
    combo.specials.push_back("pushEnemyTimeline");
    combo.specials.push_back("beatEffect");
    CardInstance card("p_1", combo);

    TimelineSpecialResult hit = process_timeline_specials(card, Actor::PLAYER, scheduler, 3);
    TEST_ASSERT_EQ(DEFAULT_ADVANCE_AMOUNT + DEFAULT_BEAT_ADVANCE, hit.changes.advance_own);
    TEST_ASSERT_EQ(DEFAULT_PUSH_AMOUNT + DEFAULT_BEAT_PUSH, hit.changes.push_opponent);
}

TEST(TimelineSpecials, ChainAdvancesOnlyBeforeFencing) {
    TimelineScheduler scheduler;
    CardDef feint = make_attack("feint", 3, 3, CardCategory::FENCING);
    feint.traits.push_back("chain");
    std::vector<CardInstance> player = {
        CardInstance("p_1", feint),
        CardInstance("p_2", make_attack("strike", 6, 5, CardCategory::FENCING)),
    };
    scheduler.build(player, {});
    scheduler.advance();

    TimelineSpecialResult result = process_timeline_specials(
        scheduler.current()->card, Actor::PLAYER, scheduler, 3);
    TEST_ASSERT_EQ(DEFAULT_CHAIN_ADVANCE, result.changes.advance_own);

    TimelineScheduler gun_next;
    player[1] = CardInstance("p_2", make_attack("shoot", 5, 3, CardCategory::GUN));
    gun_next.build(player, {});
    gun_next.advance();
    TEST_ASSERT_FALSE(process_timeline_specials(
        gun_next.current()->card, Actor::PLAYER, gun_next, 3).changes.any());
}

TEST(TimelineSpecials, CrossPushOnlyWhenCrossed) {
    TimelineScheduler scheduler;
    CardDef cut = make_attack("cut", 6, 5);
    cut.traits.push_back("cross");
    cut.cross_bonus = CrossBonus{"push", 3.0, 0};
    CardInstance card("p_1", cut);

    TEST_ASSERT_FALSE(process_timeline_specials(card, Actor::PLAYER, scheduler, 6, false).changes.any());
    TEST_ASSERT_EQ(3, process_timeline_specials(card, Actor::PLAYER, scheduler, 6, true)
                          .changes.push_opponent);
}

// ============================================================================
// CARD CREATION TESTS
// ============================================================================

TEST(CardCreation, FlecheChainStopsAtCap) {
    CardCatalog catalog = make_fencing_catalog();
    ScriptedRng rng;
    CardInstance fleche("p_1", *catalog.get_card("fleche"));

    CardCreationResult first = process_card_creation(fleche, Actor::PLAYER, 5, catalog, rng);
    TEST_ASSERT_EQ(3u, first.created_cards.size());
    for (const auto& created : first.created_cards) {
        TEST_ASSERT_TRUE(created.is_ghost);
        TEST_ASSERT_TRUE(created.is_from_fleche);
        TEST_ASSERT_EQ(1, created.fleche_chain_count);
        TEST_ASSERT_EQ(std::string("fleche"), created.created_by.value_or(""));
        TEST_ASSERT_NE(std::string("fleche"), created.card_id());
    }

    CardCreationResult second = process_card_creation(first.created_cards.front(), Actor::PLAYER,
                                                      4, catalog, rng);
    TEST_ASSERT_EQ(3u, second.created_cards.size());
    TEST_ASSERT_EQ(2, second.created_cards.front().fleche_chain_count);

    CardCreationResult third = process_card_creation(second.created_cards.front(), Actor::PLAYER,
                                                     4, catalog, rng);
    TEST_ASSERT_TRUE(third.created_cards.empty());
}

TEST(CardCreation, NoCreationWithoutDamage) {
    CardCatalog catalog = make_fencing_catalog();
    ScriptedRng rng;
    CardInstance fleche("p_1", *catalog.get_card("fleche"));
    TEST_ASSERT_TRUE(process_card_creation(fleche, Actor::PLAYER, 0, catalog, rng)
                         .created_cards.empty());

    CardInstance strike("p_2", *catalog.get_card("strike"));
    TEST_ASSERT_TRUE(process_card_creation(strike, Actor::PLAYER, 6, catalog, rng)
                         .created_cards.empty());
}

TEST(CardCreation, GhostCopyOfUnknownCardFails) {
    CardCatalog catalog = make_fencing_catalog();
    TEST_ASSERT_FALSE(make_ghost_card(catalog, "missing", "breach").has_value());

    auto ghost = make_ghost_card(catalog, "strike", "breach");
    TEST_ASSERT_TRUE(ghost.has_value());
    TEST_ASSERT_TRUE(ghost->is_ghost);
}

TEST(CardCreation, BreachOffersExcludeBreach) {
    CardCatalog catalog = make_fencing_catalog();
    ScriptedRng rng;
    std::vector<CardDefID> offers = generate_breach_offers(catalog, "breach", rng, 3);

    TEST_ASSERT_EQ(3u, offers.size());
    std::set<CardDefID> unique(offers.begin(), offers.end());
    TEST_ASSERT_EQ(3u, unique.size());
    TEST_ASSERT_EQ(0u, unique.count("breach"));
    TEST_ASSERT_EQ(0u, unique.count("guard"));
}

TEST(CardCreation, FencingOffersNeverRepeat) {
    CardCatalog catalog = make_fencing_catalog();
    ScriptedRng rng;
    auto rounds = generate_fencing_offers(catalog, "flurry", rng, 3, 2);

    TEST_ASSERT_EQ(3u, rounds.size());
    std::set<CardDefID> seen;
    size_t total = 0;
    for (const auto& round : rounds) {
        total += round.size();
        seen.insert(round.begin(), round.end());
    }
    TEST_ASSERT_EQ(total, seen.size());
    TEST_ASSERT_EQ(0u, seen.count("shoot"));

    TEST_ASSERT_TRUE(generate_fencing_offers(catalog, "flurry", rng, 3, 6).empty());
}

// ============================================================================
// PARRY TESTS
// ============================================================================

TEST(Parry, WindowCoversExclusiveCenterInclusiveEnd) {
    QueueItem parry = make_item(Actor::PLAYER, make_defense("parry", 4, 5), 5);
    ParryWindow window = setup_parry_window(parry, 5, 3);

    TEST_ASSERT_FALSE(window.covers(5));
    TEST_ASSERT_TRUE(window.covers(6));
    TEST_ASSERT_TRUE(window.covers(10));
    TEST_ASSERT_FALSE(window.covers(11));
    window.triggered = true;
    TEST_ASSERT_FALSE(window.covers(6));
}

TEST(Parry, TriggerPushesAndOutsPastMaxSpeed) {
    TimelineScheduler scheduler;
    std::vector<CardInstance> player = {CardInstance("p_1", make_defense("parry", 4, 2))};
    std::vector<CardInstance> enemy = {
        CardInstance("e_1", make_attack("claw", 6, 4)),
        CardInstance("e_2", make_attack("slam", 6, 16)),
        CardInstance("e_3", make_attack("bite", 6, 8)),
    };
    scheduler.build(player, enemy);
    scheduler.advance();

    std::vector<ParryWindow> windows = {setup_parry_window(*scheduler.current(), 5, 3)};
    scheduler.advance();

    ParryResult result = check_parry_trigger(windows, *scheduler.current(), scheduler, 30);
    TEST_ASSERT_TRUE(result.triggered);
    TEST_ASSERT_EQ(3, result.total_push);
    TEST_ASSERT_EQ(1u, result.outed.size());
    TEST_ASSERT_EQ(std::string("e_3"), result.outed.front().card.id);
    TEST_ASSERT_EQ(23, scheduler.future_items(Actor::ENEMY)[0]->sp);
    TEST_ASSERT_TRUE(windows.front().triggered);

    TEST_ASSERT_FALSE(check_parry_trigger(windows, *scheduler.current(), scheduler, 30).triggered);
}

TEST(Parry, IgnoresNonAttacksAndOwnCards) {
    TimelineScheduler scheduler;
    std::vector<ParryWindow> windows = {
        setup_parry_window(make_item(Actor::PLAYER, make_defense("parry", 4), 2))
    };

    QueueItem block = make_item(Actor::ENEMY, make_defense("hide", 6), 4);
    TEST_ASSERT_FALSE(check_parry_trigger(windows, block, scheduler, 30).triggered);

    QueueItem own = make_item(Actor::PLAYER, make_attack("strike", 6), 4);
    TEST_ASSERT_FALSE(check_parry_trigger(windows, own, scheduler, 30).triggered);
}

// ============================================================================
// STUN / COLLISION TESTS
// ============================================================================

TEST(Stun, RemovesOpposingItemsInInclusiveRange) {
    TimelineScheduler scheduler;
    std::vector<CardInstance> player = {CardInstance("p_1", make_attack("pommel", 4, 5))};
    std::vector<CardInstance> enemy = {
        CardInstance("e_1", make_attack("a", 1, 5)),
        CardInstance("e_2", make_attack("b", 1, 5)),
        CardInstance("e_3", make_attack("c", 1, 1)),
    };
    scheduler.build(player, enemy);
    scheduler.advance();

    RemovalResult result = process_stun(*scheduler.current(), scheduler, 5);
    TEST_ASSERT_EQ(2u, result.removed.size());
    TEST_ASSERT_TRUE(has_event(result.events, EventType::STUN));

    auto remaining = scheduler.future_items(Actor::ENEMY);
    TEST_ASSERT_EQ(1u, remaining.size());
    TEST_ASSERT_EQ(11, remaining.front()->sp);
}

TEST(Collision, DestroysEnemyCardsAtSameSp) {
    TimelineScheduler scheduler;
    CardDef ram = make_attack("ram", 3, 5);
    ram.specials.push_back("destroyOnCollision");
    std::vector<CardInstance> player = {CardInstance("p_1", ram)};
    std::vector<CardInstance> enemy = {
        CardInstance("e_1", make_attack("a", 1, 5)),
        CardInstance("e_2", make_attack("b", 1, 3)),
    };
    scheduler.build(player, enemy);

    RemovalResult result = process_queue_collisions(scheduler);
    TEST_ASSERT_EQ(1u, result.removed.size());
    TEST_ASSERT_EQ(std::string("e_1"), result.removed.front().card.id);
    TEST_ASSERT_EQ(2u, scheduler.size());
    TEST_ASSERT_TRUE(has_event(result.events, EventType::DESTROY));
}

// ============================================================================
// GROWING DEFENSE TESTS
// ============================================================================

TEST(GrowingDefense, GrantsEachUnitOfGrowthOnce) {
    ActorState owner = make_player();
    GrowingDefense growing;
    growing.activated_sp = 3;

    TEST_ASSERT_EQ(2, growing.apply(owner, 5));
    TEST_ASSERT_EQ(0, growing.apply(owner, 5));
    TEST_ASSERT_EQ(0, growing.apply(owner, 4));
    TEST_ASSERT_EQ(3, growing.apply(owner, 8));
    TEST_ASSERT_EQ(5, owner.block);
    TEST_ASSERT_TRUE(owner.def);
}

// ============================================================================
// HANDLER TABLE TESTS
// ============================================================================

TEST(SpecialHandlers, EveryHookRegistered) {
    const SpecialRegistry& registry = full_registry();
    TEST_ASSERT_TRUE(registry.has_pre_attack("special", "ignoreBlock"));
    TEST_ASSERT_TRUE(registry.has_pre_attack("trait", "followup"));
    TEST_ASSERT_TRUE(registry.has_post_attack("special", "executeUnder10"));
    TEST_ASSERT_TRUE(registry.has_post_attack("special", "violentMort"));
    TEST_ASSERT_TRUE(registry.has_card_play("special", "breach"));
    TEST_ASSERT_TRUE(registry.has_card_play("trait", "stun"));
    TEST_ASSERT_FALSE(registry.has_card_play("trait", "knockback"));

    TEST_ASSERT_TRUE(is_special_implemented("parryPush"));
    TEST_ASSERT_FALSE(is_special_implemented("knockback"));
}
