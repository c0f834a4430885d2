/**
 * Monster Battle Engine - Turn Resolver Implementation
 */

#include "turn_order.hpp"
#include <algorithm>

namespace monsters {

int order_key(const BattleState& state, const Action& action) {
    const Monster* actor = state.monster_at(action.side, action.actor_slot);
    int agility = actor ? actor->stats.agility : 0;
    return action.priority * 1000 + agility;
}

std::vector<Action> order_actions(const BattleState& state, std::vector<Action> actions) {
    std::stable_sort(actions.begin(), actions.end(),
        [&state](const Action& a, const Action& b) {
            return order_key(state, a) > order_key(state, b);
        });
    return actions;
}

} // namespace monsters
