/**
 * Tests for Post-Battle Settlement
 */

#include <sstream>
#include <cmath>
#include "rewards.hpp"
#include "test_helpers.hpp"

using namespace monsters;
using namespace test_helpers;

// ============================================================================
// VICTORY
// ============================================================================

TEST(Rewards, VictoryRewardsPayWholeParty) {
    Monster fainted_ally = make_monster("Sleeper");
    fainted_ally.set_hp(0);
    Monster lead = make_monster("Boss", 12);
    lead.set_hp(0);

    BattleState state = make_state({make_monster("Hero"), fainted_ally, make_monster("Sidekick")}, {lead});
    state.phase = BattlePhase::VICTORY;

    auto rewards = calculate_victory_rewards(state);
    TEST_ASSERT_TRUE(rewards.has_value());
    TEST_ASSERT_EQ(170, rewards->experience_per_monster);
    TEST_ASSERT_EQ(85, rewards->gold);

    // Fainted members still took part
    std::vector<SlotIndex> expected = {0, 1, 2};
    TEST_ASSERT_TRUE(rewards->recipients == expected);
}

TEST(Rewards, NoRewardsUnlessVictory) {
    BattleState state = make_state({make_monster("Hero")}, {make_monster("Foe")});
    state.phase = BattlePhase::ESCAPED;
    TEST_ASSERT_FALSE(calculate_victory_rewards(state).has_value());
}

// ============================================================================
// DEFEAT
// ============================================================================

TEST(Rewards, DefeatLeavesPartyAtOneHp) {
    Monster a = make_monster("A");
    a.set_hp(0);
    Monster b = make_monster("B", 5, MonsterType::NORMAL, 80);

    auto party = apply_defeat_penalty({a, b});
    TEST_ASSERT_EQ(1, party[0].current_hp());
    TEST_ASSERT_EQ(1, party[1].current_hp());
    TEST_ASSERT_EQ(80, party[1].max_hp());
}

TEST(Rewards, DefeatCostsTenPercentGold) {
    TEST_ASSERT_EQ(90, gold_after_defeat(100));
    TEST_ASSERT_EQ(9, gold_after_defeat(11));
    TEST_ASSERT_EQ(0, gold_after_defeat(0));
}

// ============================================================================
// RECRUITMENT
// ============================================================================

TEST(Rewards, RecruitmentChance) {
    Monster fresh = make_monster("Fresh", 5);
    TEST_ASSERT_TRUE(std::abs(recruitment_chance(fresh) - 0.1) < 1e-9);

    Monster fond = make_monster("Fond", 3);
    fond.affection = 100;
    TEST_ASSERT_TRUE(std::abs(recruitment_chance(fond) - 0.6) < 1e-9);

    Monster veteran = make_monster("Veteran", 30);
    TEST_ASSERT_EQ(0.0, recruitment_chance(veteran));

    Monster devoted = make_monster("Devoted", 1);
    devoted.affection = 500;
    TEST_ASSERT_EQ(0.8, recruitment_chance(devoted));
}

// ============================================================================
// CAPTURE
// ============================================================================

TEST(Rewards, CapturedMonsterJoinsTamed) {
    Monster wild = make_monster("Wildling", 5, MonsterType::GRASS, 75);
    wild.is_wild = true;
    wild.set_hp(10);

    BattleState state = make_state({make_monster("Hero")}, {wild});
    state.phase = BattlePhase::CAPTURED;

    auto captured = settle_captured_monster(state);
    TEST_ASSERT_TRUE(captured.has_value());
    TEST_ASSERT_FALSE(captured->is_wild);
    TEST_ASSERT_EQ(60, captured->current_hp());
    TEST_ASSERT_EQ(std::string("Wildling"), captured->name);
}

TEST(Rewards, NothingToSettleWithoutCapture) {
    BattleState state = make_state({make_monster("Hero")}, {make_monster("Foe")});
    state.phase = BattlePhase::VICTORY;
    TEST_ASSERT_FALSE(settle_captured_monster(state).has_value());
}

// ============================================================================
// RECRUITMENT ROLL
// ============================================================================

TEST(Rewards, RecruitmentRollSucceedsBelowChance) {
    Monster wild = make_monster("Wildling", 5, MonsterType::GRASS, 75);
    wild.is_wild = true;
    wild.set_hp(0);

    BattleState state = make_state({make_monster("Hero")}, {wild});
    state.phase = BattlePhase::VICTORY;

    // Chance is 0.1 for a level 5 monster with no affection
    SequenceRandomSource random({0.09});
    auto recruit = roll_recruitment(state, random);

    TEST_ASSERT_TRUE(recruit.has_value());
    TEST_ASSERT_FALSE(recruit->is_wild);
    TEST_ASSERT_EQ(60, recruit->current_hp());
    TEST_ASSERT_EQ(1u, random.draws());
}

TEST(Rewards, RecruitmentRollFailsAtChance) {
    Monster wild = make_monster("Wildling", 5);
    wild.is_wild = true;
    wild.set_hp(0);

    BattleState state = make_state({make_monster("Hero")}, {wild});
    state.phase = BattlePhase::VICTORY;

    SequenceRandomSource random({0.1});
    TEST_ASSERT_FALSE(roll_recruitment(state, random).has_value());
    TEST_ASSERT_EQ(1u, random.draws());
}

TEST(Rewards, RecruitmentRollNeedsWildVictory) {
    BattleState trainer = make_state({make_monster("Hero")}, {make_monster("Rival")}, false);
    trainer.phase = BattlePhase::VICTORY;

    BattleState escaped = make_state({make_monster("Hero")}, {make_monster("Foe")});
    escaped.phase = BattlePhase::ESCAPED;

    SequenceRandomSource random({0.0, 0.0});
    TEST_ASSERT_FALSE(roll_recruitment(trainer, random).has_value());
    TEST_ASSERT_FALSE(roll_recruitment(escaped, random).has_value());
    TEST_ASSERT_EQ(0u, random.draws());
}
