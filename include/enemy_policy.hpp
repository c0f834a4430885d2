/**
 * Monster Battle Engine - Enemy Decision Policy
 *
 * Picks the enemy's action each turn from an ordered rule list.
 * The first rule whose predicate holds produces the action.
 *
 * Default rules:
 *   1. use_skill - MP > 8 and draw < 0.4: random affordable skill
 *                  (Attack when nothing is affordable)
 *   2. defend    - HP < 30% of max and draw < 0.3
 *   3. attack    - always
 *
 * Draws are consumed only when the MP / HP condition before them holds.
 */

#pragma once

#include "battle_state.hpp"
#include "action.hpp"
#include "skill_catalog.hpp"
#include "battle_config.hpp"
#include "random_source.hpp"
#include <functional>

namespace monsters {

/**
 * Inputs visible to a rule.
 */
struct RuleContext {
    const BattleState& state;
    const Monster& monster;
    SlotIndex slot;
};

using RulePredicate = std::function<bool(const RuleContext&)>;
using RuleProducer = std::function<Action(const RuleContext&)>;

struct DecisionRule {
    std::string name;
    RulePredicate predicate;
    RuleProducer producer;
};

class EnemyPolicy {
public:
    /**
     * Rules capture this policy, so it is neither copyable nor movable.
     */
    EnemyPolicy(const SkillCatalog& skills,
                RandomSource& random,
                const EnemyPolicyConfig& config);

    EnemyPolicy(const EnemyPolicy&) = delete;
    EnemyPolicy& operator=(const EnemyPolicy&) = delete;

    /**
     * Decide the action for the enemy's active monster.
     */
    Action decide(const BattleState& state) const;

    /**
     * Insert a rule ahead of the unconditional attack fallback.
     */
    void add_rule(DecisionRule rule);

    const std::vector<DecisionRule>& rules() const { return rules_; }

    /**
     * Skills the monster could use right now, ordered by skill id.
     *
     * Candidates are the monster's known skills found in the catalog,
     * or the whole catalog when it knows none.
     */
    std::vector<const Skill*> affordable_skills(const Monster& monster) const;

private:
    const SkillCatalog& skills_;
    RandomSource& random_;
    EnemyPolicyConfig config_;
    std::vector<DecisionRule> rules_;

    void install_default_rules();
};

} // namespace monsters
