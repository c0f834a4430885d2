/**
 * Monster Battle Engine - Enemy Decision Policy Implementation
 */

#include "enemy_policy.hpp"
#include <algorithm>
#include <cmath>

namespace monsters {

EnemyPolicy::EnemyPolicy(const SkillCatalog& skills,
                         RandomSource& random,
                         const EnemyPolicyConfig& config)
    : skills_(skills)
    , random_(random)
    , config_(config)
{
    install_default_rules();
}

void EnemyPolicy::install_default_rules() {
    rules_.push_back({
        "use_skill",
        [this](const RuleContext& ctx) {
            return ctx.monster.current_mp() > config_.skill_mp_threshold
                && random_.next_double() < config_.skill_chance;
        },
        [this](const RuleContext& ctx) {
            auto candidates = affordable_skills(ctx.monster);
            if (candidates.empty()) {
                return Action::attack(Side::ENEMY, ctx.slot);
            }
            size_t n = candidates.size();
            size_t index = static_cast<size_t>(std::floor(random_.next_double() * n));
            index = std::min(index, n - 1);
            const Skill* chosen = candidates[index];
            return Action::use_skill(Side::ENEMY, ctx.slot, chosen->id, chosen->priority);
        }
    });

    rules_.push_back({
        "defend",
        [this](const RuleContext& ctx) {
            return ctx.monster.current_hp() < ctx.monster.max_hp() * config_.low_hp_fraction
                && random_.next_double() < config_.defend_chance;
        },
        [](const RuleContext& ctx) {
            return Action::defend(Side::ENEMY, ctx.slot);
        }
    });

    rules_.push_back({
        "attack",
        [](const RuleContext&) { return true; },
        [](const RuleContext& ctx) {
            return Action::attack(Side::ENEMY, ctx.slot);
        }
    });
}

void EnemyPolicy::add_rule(DecisionRule rule) {
    // Keep the unconditional fallback last
    auto pos = rules_.empty() ? rules_.end() : rules_.end() - 1;
    rules_.insert(pos, std::move(rule));
}

Action EnemyPolicy::decide(const BattleState& state) const {
    SlotIndex slot = state.active_slot(Side::ENEMY);
    const Monster* monster = state.active_monster(Side::ENEMY);
    if (!monster) {
        return Action::attack(Side::ENEMY, slot);
    }

    RuleContext ctx{state, *monster, slot};
    for (const auto& rule : rules_) {
        if (rule.predicate(ctx)) {
            return rule.producer(ctx);
        }
    }
    return Action::attack(Side::ENEMY, slot);
}

std::vector<const Skill*> EnemyPolicy::affordable_skills(const Monster& monster) const {
    std::vector<SkillID> candidate_ids;
    for (const auto& id : monster.skills) {
        if (skills_.has_skill(id)) {
            candidate_ids.push_back(id);
        }
    }
    if (monster.skills.empty()) {
        candidate_ids = skills_.get_all_skill_ids();
    }

    std::sort(candidate_ids.begin(), candidate_ids.end());
    candidate_ids.erase(std::unique(candidate_ids.begin(), candidate_ids.end()), candidate_ids.end());

    std::vector<const Skill*> affordable;
    for (const auto& id : candidate_ids) {
        const Skill* skill = skills_.get_skill(id);
        if (skill && monster.current_mp() >= skill->mp_cost) {
            affordable.push_back(skill);
        }
    }
    return affordable;
}

} // namespace monsters
