/**
 * Tests for the Type Effectiveness Table
 */

#include <sstream>
#include "type_chart.hpp"

using namespace monsters;

// ============================================================================
// DEFINED PAIRS
// ============================================================================

TEST(TypeChart, SuperEffectivePairs) {
    TEST_ASSERT_EQ(1.5, type_effectiveness(MonsterType::FIRE, MonsterType::GRASS));
    TEST_ASSERT_EQ(1.5, type_effectiveness(MonsterType::WATER, MonsterType::FIRE));
    TEST_ASSERT_EQ(1.5, type_effectiveness(MonsterType::GRASS, MonsterType::WATER));
    TEST_ASSERT_EQ(1.5, type_effectiveness(MonsterType::ELECTRIC, MonsterType::FLYING));
    TEST_ASSERT_EQ(1.5, type_effectiveness(MonsterType::FIGHTING, MonsterType::NORMAL));
}

TEST(TypeChart, NotVeryEffectivePairs) {
    TEST_ASSERT_EQ(0.5, type_effectiveness(MonsterType::FIRE, MonsterType::WATER));
    TEST_ASSERT_EQ(0.5, type_effectiveness(MonsterType::WATER, MonsterType::GRASS));
    TEST_ASSERT_EQ(0.5, type_effectiveness(MonsterType::GRASS, MonsterType::FIRE));
    TEST_ASSERT_EQ(0.5, type_effectiveness(MonsterType::ELECTRIC, MonsterType::GROUND));
}

TEST(TypeChart, TableHasNineEntries) {
    TEST_ASSERT_EQ(9u, defined_matchups().size());
}

// ============================================================================
// NEUTRAL DEFAULT
// ============================================================================

TEST(TypeChart, UndefinedPairsAreNeutral) {
    for (MonsterType attacking : all_monster_types()) {
        for (MonsterType defending : all_monster_types()) {
            bool defined = false;
            for (const auto& entry : defined_matchups()) {
                if (entry.attacking == attacking && entry.defending == defending) {
                    defined = true;
                }
            }
            if (!defined) {
                TEST_ASSERT_EQ(1.0, type_effectiveness(attacking, defending));
            }
        }
    }
}

TEST(TypeChart, MultipliersInAllowedSet) {
    for (MonsterType attacking : all_monster_types()) {
        for (MonsterType defending : all_monster_types()) {
            double m = type_effectiveness(attacking, defending);
            TEST_ASSERT_TRUE(m == 0.5 || m == 1.0 || m == 1.5);
        }
    }
}

TEST(TypeChart, NotSymmetric) {
    // Electric beats Flying, but Flying has no entry against Electric
    TEST_ASSERT_EQ(1.5, type_effectiveness(MonsterType::ELECTRIC, MonsterType::FLYING));
    TEST_ASSERT_EQ(1.0, type_effectiveness(MonsterType::FLYING, MonsterType::ELECTRIC));
}

// ============================================================================
// PARSING
// ============================================================================

TEST(TypeChart, ParseMonsterType) {
    auto fire = parse_monster_type("Fire");
    TEST_ASSERT_TRUE(fire.has_value());
    TEST_ASSERT_TRUE(*fire == MonsterType::FIRE);

    auto steel = parse_monster_type("STEEL");
    TEST_ASSERT_TRUE(steel.has_value());
    TEST_ASSERT_TRUE(*steel == MonsterType::STEEL);

    TEST_ASSERT_FALSE(parse_monster_type("plasma").has_value());
}
