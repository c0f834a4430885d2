/**
 * Tests for the Enemy Decision Policy
 */

#include <sstream>
#include "enemy_policy.hpp"
#include "test_helpers.hpp"

using namespace monsters;
using namespace test_helpers;

namespace {

BattleState policy_state(Monster enemy) {
    return make_state({make_monster("Hero")}, {enemy});
}

} // anonymous namespace

// ============================================================================
// SKILL RULE
// ============================================================================

TEST(EnemyPolicy, LowMpSkipsSkillRule) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    SequenceRandomSource random({0.0, 0.0});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Monster enemy = make_monster("Drained", 5, MonsterType::NORMAL, 100, 8);
    Action action = policy.decide(policy_state(enemy));

    TEST_ASSERT_TRUE(action.action_type == ActionType::ATTACK);
    TEST_ASSERT_TRUE(action.side == Side::ENEMY);
    TEST_ASSERT_EQ(0u, random.draws());
}

TEST(EnemyPolicy, PicksFromWholeCatalogWhenNoSkillsKnown) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    EnemyPolicyConfig config;

    // Sorted candidates: bite, fireball, gust, heal, tackle
    SequenceRandomSource first({0.1, 0.0});
    EnemyPolicy policy(skills, first, config);
    Action action = policy.decide(policy_state(make_monster("Caster")));
    TEST_ASSERT_TRUE(action.action_type == ActionType::USE_SKILL);
    TEST_ASSERT_EQ(std::string("bite"), *action.skill_id);

    SequenceRandomSource last({0.1, 0.99});
    EnemyPolicy policy2(skills, last, config);
    Action action2 = policy2.decide(policy_state(make_monster("Caster")));
    TEST_ASSERT_EQ(std::string("tackle"), *action2.skill_id);
}

TEST(EnemyPolicy, PicksOnlyKnownSkills) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    SequenceRandomSource random({0.1, 0.6});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Monster enemy = make_monster("Picky");
    enemy.skills = {"tackle", "gust", "not_a_skill"};

    // Candidates: gust, tackle; floor(0.6 * 2) = 1
    Action action = policy.decide(policy_state(enemy));
    TEST_ASSERT_EQ(std::string("tackle"), *action.skill_id);
}

TEST(EnemyPolicy, SkillRollFailsFallsThroughToAttack) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    SequenceRandomSource random({0.5});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Action action = policy.decide(policy_state(make_monster("Healthy")));

    TEST_ASSERT_TRUE(action.action_type == ActionType::ATTACK);
    TEST_ASSERT_EQ(1u, random.draws());
}

TEST(EnemyPolicy, NothingAffordableMeansAttack) {
    SkillCatalog skills;
    skills.add_skill({"mega_blast", "Mega Blast", "", SkillCategory::MAGICAL,
                      SkillTarget::SINGLE_ENEMY, 50, 120, 100, 0});
    SequenceRandomSource random({0.1});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Monster enemy = make_monster("Broke", 5, MonsterType::NORMAL, 100, 20);
    enemy.skills = {"mega_blast"};

    Action action = policy.decide(policy_state(enemy));
    TEST_ASSERT_TRUE(action.action_type == ActionType::ATTACK);
}

TEST(EnemyPolicy, SkillActionCarriesPriority) {
    SkillCatalog skills;
    skills.add_skill({"quick_jab", "Quick Jab", "", SkillCategory::PHYSICAL,
                      SkillTarget::SINGLE_ENEMY, 0, 20, 100, 1});
    SequenceRandomSource random({0.1, 0.0});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Action action = policy.decide(policy_state(make_monster("Jabber")));
    TEST_ASSERT_EQ(1, action.priority);
}

// ============================================================================
// DEFEND RULE
// ============================================================================

TEST(EnemyPolicy, LowHpDefends) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    SequenceRandomSource random({0.1});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Monster enemy = make_monster("Hurt", 5, MonsterType::NORMAL, 100, 0);
    enemy.set_hp(20);

    Action action = policy.decide(policy_state(enemy));
    TEST_ASSERT_TRUE(action.action_type == ActionType::DEFEND);
}

TEST(EnemyPolicy, LowHpDefendRollFails) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    SequenceRandomSource random({0.5});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Monster enemy = make_monster("Hurt", 5, MonsterType::NORMAL, 100, 0);
    enemy.set_hp(20);

    Action action = policy.decide(policy_state(enemy));
    TEST_ASSERT_TRUE(action.action_type == ActionType::ATTACK);
}

TEST(EnemyPolicy, UsesActiveSlot) {
    SkillCatalog skills = SkillCatalog::with_default_skills();
    SequenceRandomSource random(std::vector<double>{});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    Monster fallen = make_monster("Fallen");
    fallen.set_hp(0);
    BattleState state = make_state({make_monster("Hero")},
                                   {fallen, make_monster("Reserve", 5, MonsterType::NORMAL, 100, 0)});
    state.party(Side::ENEMY).active_slot = 1;

    Action action = policy.decide(state);
    TEST_ASSERT_EQ(1, action.actor_slot);
}

// ============================================================================
// RULE LIST
// ============================================================================

TEST(EnemyPolicy, DefaultRuleOrder) {
    SkillCatalog skills;
    SequenceRandomSource random(std::vector<double>{});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    TEST_ASSERT_EQ(3u, policy.rules().size());
    TEST_ASSERT_EQ(std::string("use_skill"), policy.rules()[0].name);
    TEST_ASSERT_EQ(std::string("defend"), policy.rules()[1].name);
    TEST_ASSERT_EQ(std::string("attack"), policy.rules()[2].name);
}

TEST(EnemyPolicy, CustomRuleRunsBeforeFallback) {
    SkillCatalog skills;
    SequenceRandomSource random(std::vector<double>{});
    EnemyPolicyConfig config;
    EnemyPolicy policy(skills, random, config);

    policy.add_rule({
        "always_flee",
        [](const RuleContext&) { return true; },
        [](const RuleContext& ctx) { return Action::flee(Side::ENEMY, ctx.slot); }
    });

    TEST_ASSERT_EQ(std::string("attack"), policy.rules().back().name);

    Monster enemy = make_monster("Coward", 5, MonsterType::NORMAL, 100, 0);
    Action action = policy.decide(policy_state(enemy));
    TEST_ASSERT_TRUE(action.action_type == ActionType::FLEE);
}
