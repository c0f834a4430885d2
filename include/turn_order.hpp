/**
 * Monster Battle Engine - Turn Resolver
 *
 * Orders pending actions by priority, then by the actor's agility.
 */

#pragma once

#include "battle_state.hpp"
#include "action.hpp"

namespace monsters {

/**
 * Order key: priority * 1000 + actor agility.
 * An actor that cannot be resolved from the state counts as agility 0.
 */
int order_key(const BattleState& state, const Action& action);

/**
 * Sort actions by descending order key.
 *
 * Stable: actions with equal keys keep their submission order.
 */
std::vector<Action> order_actions(const BattleState& state, std::vector<Action> actions);

} // namespace monsters
