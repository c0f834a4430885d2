/**
 * Monster Battle Engine - Action Executor
 *
 * Applies exactly one action to a battle state and returns the new state
 * plus the event it produced. Infeasible actions are recoverable no-ops.
 */

#pragma once

#include "battle_state.hpp"
#include "action.hpp"
#include "skill_catalog.hpp"
#include "capture.hpp"
#include "battle_config.hpp"
#include "random_source.hpp"

namespace monsters {

/**
 * Result of applying one action.
 *
 * `event` is empty for silent no-ops (unknown skill, insufficient MP,
 * fainted or missing actor). Disallowed flee/capture attempts are still
 * no-ops but carry an explanatory event.
 */
struct StepResult {
    BattleState state;
    std::optional<std::string> event;
    bool applied = false;   // true when the action took effect
};

class ActionExecutor {
public:
    static constexpr const char* BASIC_ATTACK_ID = "basic_attack";

    /**
     * The executor keeps references; all collaborators must outlive it.
     */
    ActionExecutor(const SkillCatalog& skills,
                   const CaptureResolver& capture,
                   RandomSource& random,
                   const BattleConfig& config);

    /**
     * Apply one action. The input state is never modified.
     */
    StepResult apply(const BattleState& state, const Action& action) const;

    /**
     * The synthesized skill behind a plain Attack.
     */
    Skill basic_attack_skill() const;

private:
    const SkillCatalog& skills_;
    const CaptureResolver& capture_;
    RandomSource& random_;
    const BattleConfig& config_;

    // Action handlers
    StepResult apply_attack(const BattleState& state, const Action& action) const;
    StepResult apply_use_skill(const BattleState& state, const Action& action) const;
    StepResult apply_defend(const BattleState& state, const Action& action) const;
    StepResult apply_flee(const BattleState& state, const Action& action) const;
    StepResult apply_capture(const BattleState& state, const Action& action) const;

    /**
     * Shared skill routine: damage, healing or support, then MP cost.
     */
    StepResult apply_skill(const BattleState& state, const Action& action, const Skill& skill) const;

    static StepResult unchanged(const BattleState& state);
    static StepResult annotated(const BattleState& state, const std::string& event);
};

} // namespace monsters
