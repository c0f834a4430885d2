/**
 * Monster Battle Engine - Action Representation
 *
 * Defines the Action struct submitted by the player and produced by the
 * enemy policy.
 */

#pragma once

#include "types.hpp"
#include <optional>

namespace monsters {

/**
 * Action - A single battle action.
 *
 * The acting combatant is bound by (side, actor_slot), never by value.
 * skill_id is set for USE_SKILL, item_id for CAPTURE.
 */
struct Action {
    ActionType action_type = ActionType::ATTACK;
    Side side = Side::PLAYER;
    SlotIndex actor_slot = 0;
    int priority = 0;

    std::optional<SkillID> skill_id;
    std::optional<ItemID> item_id;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Action() = default;

    Action(ActionType type, Side acting_side, SlotIndex slot)
        : action_type(type)
        , side(acting_side)
        , actor_slot(slot)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static Action attack(Side side, SlotIndex slot) {
        return Action(ActionType::ATTACK, side, slot);
    }

    static Action use_skill(Side side, SlotIndex slot, const SkillID& skill, int priority = 0) {
        Action a(ActionType::USE_SKILL, side, slot);
        a.skill_id = skill;
        a.priority = priority;
        return a;
    }

    static Action defend(Side side, SlotIndex slot) {
        return Action(ActionType::DEFEND, side, slot);
    }

    static Action flee(Side side, SlotIndex slot) {
        return Action(ActionType::FLEE, side, slot);
    }

    static Action capture(Side side, SlotIndex slot, const ItemID& item) {
        Action a(ActionType::CAPTURE, side, slot);
        a.item_id = item;
        return a;
    }

    // ========================================================================
    // STRING REPRESENTATION
    // ========================================================================

    std::string to_string() const {
        std::string result = "Action(";
        result += monsters::to_string(action_type);
        result += ", ";
        result += monsters::to_string(side);
        result += ", slot=" + std::to_string(actor_slot);

        if (priority != 0) {
            result += ", priority=" + std::to_string(priority);
        }
        if (skill_id.has_value()) {
            result += ", skill=" + *skill_id;
        }
        if (item_id.has_value()) {
            result += ", item=" + *item_id;
        }
        result += ")";
        return result;
    }

    // ========================================================================
    // COMPARISON
    // ========================================================================

    bool operator==(const Action& other) const {
        return action_type == other.action_type
            && side == other.side
            && actor_slot == other.actor_slot
            && priority == other.priority
            && skill_id == other.skill_id
            && item_id == other.item_id;
    }

    bool operator!=(const Action& other) const {
        return !(*this == other);
    }
};

} // namespace monsters
