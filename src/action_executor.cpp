/**
 * Monster Battle Engine - Action Executor Implementation
 */

#include "action_executor.hpp"
#include "damage.hpp"
#include <algorithm>
#include <cmath>

namespace monsters {

ActionExecutor::ActionExecutor(const SkillCatalog& skills,
                               const CaptureResolver& capture,
                               RandomSource& random,
                               const BattleConfig& config)
    : skills_(skills)
    , capture_(capture)
    , random_(random)
    , config_(config)
{}

Skill ActionExecutor::basic_attack_skill() const {
    Skill skill;
    skill.id = BASIC_ATTACK_ID;
    skill.name = "Attack";
    skill.description = "Basic physical attack";
    skill.category = SkillCategory::PHYSICAL;
    skill.target = SkillTarget::SINGLE_ENEMY;
    skill.mp_cost = 0;
    skill.power = config_.basic_attack_power;
    skill.accuracy = config_.basic_attack_accuracy;
    skill.priority = 0;
    return skill;
}

StepResult ActionExecutor::unchanged(const BattleState& state) {
    StepResult result{state, std::nullopt, false};
    return result;
}

StepResult ActionExecutor::annotated(const BattleState& state, const std::string& event) {
    StepResult result{state, event, false};
    result.state.last_event = event;
    return result;
}

// ============================================================================
// DISPATCH
// ============================================================================

StepResult ActionExecutor::apply(const BattleState& state, const Action& action) const {
    // Actor must exist and still be standing
    const Monster* actor = state.monster_at(action.side, action.actor_slot);
    if (!actor || actor->is_fainted()) {
        return unchanged(state);
    }

    switch (action.action_type) {
        case ActionType::ATTACK:
            return apply_attack(state, action);
        case ActionType::USE_SKILL:
            return apply_use_skill(state, action);
        case ActionType::DEFEND:
            return apply_defend(state, action);
        case ActionType::FLEE:
            return apply_flee(state, action);
        case ActionType::CAPTURE:
            return apply_capture(state, action);
        default:
            return unchanged(state);
    }
}

// ============================================================================
// ACTION HANDLERS
// ============================================================================

StepResult ActionExecutor::apply_attack(const BattleState& state, const Action& action) const {
    return apply_skill(state, action, basic_attack_skill());
}

StepResult ActionExecutor::apply_use_skill(const BattleState& state, const Action& action) const {
    if (!action.skill_id.has_value()) {
        return unchanged(state);
    }

    const Skill* skill = skills_.get_skill(*action.skill_id);
    if (!skill) {
        return unchanged(state);
    }

    const Monster* actor = state.monster_at(action.side, action.actor_slot);
    if (actor->current_mp() < skill->mp_cost) {
        return unchanged(state);  // Not enough MP
    }

    return apply_skill(state, action, *skill);
}

StepResult ActionExecutor::apply_defend(const BattleState& state, const Action& action) const {
    StepResult result{state, std::nullopt, true};
    const Monster* actor = result.state.monster_at(action.side, action.actor_slot);

    result.state.party(action.side).set_defending(action.actor_slot, true);

    std::string event = actor->name + " is defending and takes a defensive stance!";
    result.state.last_event = event;
    result.event = event;
    return result;
}

StepResult ActionExecutor::apply_flee(const BattleState& state, const Action& action) const {
    if (!state.can_flee) {
        return annotated(state, "Can't escape from this battle!");
    }

    const Monster* actor = state.monster_at(action.side, action.actor_slot);
    const Monster* opponent = state.active_monster(opponent_of(action.side));
    int opposing_agility = opponent ? opponent->stats.agility : 0;

    double chance = calculate_flee_chance(actor->stats.agility, opposing_agility, config_);

    StepResult result{state, std::nullopt, true};
    if (random_.next_double() < chance) {
        result.state.phase = BattlePhase::ESCAPED;
        result.event = action.side == Side::PLAYER
            ? std::string("Got away safely!")
            : actor->name + " ran away!";
    } else {
        result.event = action.side == Side::PLAYER
            ? std::string("Couldn't get away!")
            : actor->name + " tried to run but couldn't get away!";
    }
    result.state.last_event = *result.event;
    return result;
}

StepResult ActionExecutor::apply_capture(const BattleState& state, const Action& action) const {
    if (action.side != Side::PLAYER || !state.is_wild_encounter || !state.can_capture) {
        return annotated(state, "This monster can't be captured!");
    }

    const Monster* target = state.active_monster(Side::ENEMY);
    if (!target || target->is_fainted()) {
        return unchanged(state);
    }

    ItemID item = action.item_id.value_or("basic_capture");
    double probability = std::clamp(capture_.probability(*target, item), 0.0, 1.0);

    StepResult result{state, std::nullopt, true};
    if (random_.next_double() < probability) {
        result.state.phase = BattlePhase::CAPTURED;
        result.event = "Captured " + target->name + "!";
    } else {
        result.event = target->name + " broke free!";
    }
    result.state.last_event = *result.event;
    return result;
}

// ============================================================================
// SHARED SKILL ROUTINE
// ============================================================================

StepResult ActionExecutor::apply_skill(const BattleState& state,
                                       const Action& action,
                                       const Skill& skill) const {
    StepResult result{state, std::nullopt, true};
    BattleState& next = result.state;

    Side enemy_side = opponent_of(action.side);
    std::string event = next.monster_at(action.side, action.actor_slot)->name
                      + " used " + skill.name + "!";

    if (skill.is_damaging()) {
        // Collect target slots
        std::vector<SlotIndex> targets;
        if (skill.hits_all_enemies()) {
            targets = next.party(enemy_side).living_slots();
        } else {
            const Monster* active = next.active_monster(enemy_side);
            if (active && !active->is_fainted()) {
                targets.push_back(next.active_slot(enemy_side));
            }
        }

        if (targets.empty()) {
            return unchanged(state);
        }

        bool multi = targets.size() > 1;
        for (SlotIndex slot : targets) {
            const Monster& attacker = *next.monster_at(action.side, action.actor_slot);
            Monster& target = *next.monster_at(enemy_side, slot);

            DamageBreakdown hit = calculate_damage_detailed(
                attacker, target, skill, skill.is_physical(), random_, config_);

            int damage = hit.final_damage;
            if (next.party(enemy_side).is_defending(slot)) {
                damage = std::max(config_.minimum_damage,
                                  static_cast<int>(std::floor(damage * config_.defend_damage_multiplier)));
            }

            target.set_hp(target.current_hp() - damage);

            event += " Dealt " + std::to_string(damage) + " damage";
            if (multi) {
                event += " to " + target.name;
            }
            event += "!";
            if (hit.critical) {
                event += " Critical hit!";
            }
        }
    } else if (skill.is_healing()) {
        const Monster& caster = *next.monster_at(action.side, action.actor_slot);
        int amount = std::max(1, caster.stats.magic * skill.power / 100);

        std::vector<SlotIndex> targets;
        if (skill.affects_all_allies()) {
            targets = next.party(action.side).living_slots();
        } else {
            targets.push_back(action.actor_slot);
        }

        int restored = 0;
        for (SlotIndex slot : targets) {
            Monster& ally = *next.monster_at(action.side, slot);
            int before = ally.current_hp();
            ally.set_hp(before + amount);
            restored += ally.current_hp() - before;
        }
        event += " Restored " + std::to_string(restored) + " HP!";
    }

    // MP cost
    Monster& actor = *next.monster_at(action.side, action.actor_slot);
    actor.set_mp(actor.current_mp() - skill.mp_cost);

    next.last_event = event;
    result.event = event;
    return result;
}

} // namespace monsters
