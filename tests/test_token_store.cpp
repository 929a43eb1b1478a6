/**
 * Tests for the Token Store and Token Effects
 */

#include "token_store.hpp"
#include "token_effects.hpp"

using namespace tactics;
using namespace tactics::testing;

// ============================================================================
// TOKEN STORE TESTS
// ============================================================================

TEST(TokenStore, AddStacksByLifetime) {
    TokenStore store;
    store.add("offense", 2);
    store.add("attack", 1);
    store.add("strength", 3);

    TEST_ASSERT_EQ(2, store.stacks("offense"));
    TEST_ASSERT_EQ(1u, store.tokens(TokenLifetime::USAGE).size());
    TEST_ASSERT_EQ(1u, store.tokens(TokenLifetime::TURN).size());
    TEST_ASSERT_EQ(1u, store.tokens(TokenLifetime::PERMANENT).size());
}

TEST(TokenStore, ZeroStacksAndUnknownIdsAreNoops) {
    TokenStore store;
    TEST_ASSERT_FALSE(store.add("offense", 0).changed);
    TEST_ASSERT_FALSE(store.add("not_a_token", 1).changed);
    TEST_ASSERT_TRUE(store.empty());
}

TEST(TokenStore, ImmunityBlocksOneNegative) {
    TokenStore store;
    store.add("immunity", 1);

    TokenResult blocked = store.add("vulnerable", 1);
    TEST_ASSERT_TRUE(blocked.changed);
    TEST_ASSERT_EQ(0, store.stacks("vulnerable"));
    TEST_ASSERT_EQ(0, store.stacks("immunity"));

    store.add("vulnerable", 1);
    TEST_ASSERT_EQ(1, store.stacks("vulnerable"));
}

TEST(TokenStore, OppositeTokensCancelFirst) {
    TokenStore store;
    store.add("dullness", 2);
    store.add("attack", 3);

    TEST_ASSERT_EQ(0, store.stacks("dullness"));
    TEST_ASSERT_EQ(1, store.stacks("attack"));
}

TEST(TokenStore, FullCancellationAddsNothing) {
    TokenStore store;
    store.add("dizzy", 2);
    store.add("warmedUp", 1);

    TEST_ASSERT_EQ(1, store.stacks("dizzy"));
    TEST_ASSERT_FALSE(store.has("warmedUp"));
}

TEST(TokenStore, GunJamNeverStacksAndFreezesRoulette) {
    TokenStore store;
    store.add("roulette", 2);
    store.add("gun_jam", 1);
    store.add("gun_jam", 1);
    store.add("roulette", 1);

    TEST_ASSERT_EQ(1, store.stacks("gun_jam"));
    TEST_ASSERT_EQ(2, store.stacks("roulette"));
}

TEST(TokenStore, LoadedOnlyClearsJam) {
    TokenStore store;
    store.add("loaded", 1);
    TEST_ASSERT_FALSE(store.has("loaded"));

    store.add("gun_jam", 1);
    store.add("loaded", 1);
    TEST_ASSERT_FALSE(store.has("gun_jam"));
    TEST_ASSERT_FALSE(store.has("loaded"));
}

TEST(TokenStore, MaxStacksCap) {
    TokenStore store;
    store.add("counter", 7);
    TEST_ASSERT_EQ(5, store.stacks("counter"));
}

TEST(TokenStore, RemoveClampsAndDropsEntry) {
    TokenStore store;
    store.add("offense", 2);
    store.remove("offense", 5);
    TEST_ASSERT_EQ(0, store.stacks("offense"));
    TEST_ASSERT_TRUE(store.tokens(TokenLifetime::USAGE).empty());
}

TEST(TokenStore, SetStacksOverwritesAndResets) {
    TokenStore store;
    store.set_stacks("roulette", TokenLifetime::PERMANENT, 3);
    TEST_ASSERT_EQ(3, store.stacks("roulette"));
    store.set_stacks("roulette", TokenLifetime::PERMANENT, 0);
    TEST_ASSERT_FALSE(store.has("roulette"));
}

TEST(TokenStore, ClearTurnTokensKeepsMidTurnGrants) {
    TokenStore store;
    store.add("attack", 1);
    store.add("vulnerable", 1, GrantedAt{1, 10});

    store.clear_turn_tokens();
    TEST_ASSERT_FALSE(store.has("attack"));
    TEST_ASSERT_TRUE(store.has("vulnerable"));

    store.expire_turn_tokens_by_timeline(1, 20);
    TEST_ASSERT_TRUE(store.has("vulnerable"));

    store.expire_turn_tokens_by_timeline(2, 9);
    TEST_ASSERT_TRUE(store.has("vulnerable"));

    TokenResult expired = store.expire_turn_tokens_by_timeline(2, 10);
    TEST_ASSERT_TRUE(expired.changed);
    TEST_ASSERT_FALSE(store.has("vulnerable"));
}

TEST(TokenStore, CancellationTableIsSymmetricForDizzy) {
    const TokenID* opposite = cancelling_token("dizzy");
    TEST_ASSERT_NOT_NULL(opposite);
    TEST_ASSERT_EQ(std::string("warmedUp"), *opposite);
    TEST_ASSERT_NULL(cancelling_token("strength"));
}

// ============================================================================
// TOKEN EFFECT TESTS
// ============================================================================

TEST(TokenEffects, DamageBoostsStackAndConsumeUsage) {
    TokenStore store;
    store.add("offense", 1);
    store.add("attack", 1);

    CardValueModifier modified = apply_tokens_to_damage(10, store);
    TEST_ASSERT_EQ(20, modified.value);
    TEST_ASSERT_EQ(1u, modified.consumed.size());
    TEST_ASSERT_EQ(std::string("offense"), modified.consumed.front().id);
}

TEST(TokenEffects, AttackPenaltyHalvesDamage) {
    TokenStore store;
    store.add("dullness", 1);
    TEST_ASSERT_EQ(5, apply_tokens_to_damage(10, store).value);
}

TEST(TokenEffects, ShakenReducesBlockAndIsConsumed) {
    TokenStore store;
    store.add("shaken", 1);
    CardValueModifier modified = apply_tokens_to_block(8, store);
    TEST_ASSERT_EQ(4, modified.value);
    TEST_ASSERT_EQ(1u, modified.consumed.size());
}

TEST(TokenEffects, FailedDodgeStillConsumesUsageToken) {
    TokenStore store;
    store.add("blur", 1);
    ScriptedRng rng;
    rng.doubles = {0.9};

    DamageTokenOutcome outcome = apply_tokens_on_damage(10, store, 0, rng);
    TEST_ASSERT_FALSE(outcome.dodged);
    TEST_ASSERT_EQ(10, outcome.final_damage);
    TEST_ASSERT_EQ(1u, outcome.consumed.size());
}

TEST(TokenEffects, SuccessfulDodgeZeroesDamage) {
    TokenStore store;
    store.add("dodge", 1);
    ScriptedRng rng;
    rng.doubles = {0.1};

    DamageTokenOutcome outcome = apply_tokens_on_damage(10, store, 0, rng);
    TEST_ASSERT_TRUE(outcome.dodged);
    TEST_ASSERT_EQ(0, outcome.final_damage);
    TEST_ASSERT_TRUE(outcome.consumed.empty());
}

TEST(TokenEffects, VulnerableAndCounter) {
    TokenStore store;
    store.add("vulnerable", 1);
    store.add("counter", 1);
    ScriptedRng rng;

    DamageTokenOutcome outcome = apply_tokens_on_damage(10, store, 2, rng);
    TEST_ASSERT_EQ(15, outcome.final_damage);
    TEST_ASSERT_EQ(7, outcome.reflected);
    TEST_ASSERT_EQ(0, rng.doubles_used);
}

TEST(TokenEffects, EnergyModifiers) {
    TokenStore warm;
    warm.add("warmedUp", 1);
    TEST_ASSERT_EQ(8, apply_tokens_on_energy(6, warm));

    TokenStore dizzy;
    dizzy.add("dizzy", 4);
    TEST_ASSERT_EQ(0, apply_tokens_on_energy(6, dizzy));
}

TEST(TokenEffects, BurnScalesWithStacks) {
    TokenStore store;
    store.add("burn", 2);
    TEST_ASSERT_EQ(6, burn_damage(store));
}

TEST(TokenEffects, ReviveRestoresHalfMaxHp) {
    TokenStore store;
    store.add("revive", 1);
    ReviveOutcome revive = check_revive(40, store);
    TEST_ASSERT_TRUE(revive.revived);
    TEST_ASSERT_EQ(20, revive.new_hp);
}
