/**
 * Monster Battle Engine - Battle Session Implementation
 */

#include "battle_session.hpp"

namespace monsters {

BattleSession::BattleSession(const BattleEngine& engine, BattleState initial)
    : engine_(engine)
    , state_(std::move(initial))
{
    if (!state_.last_event.empty()) {
        history_.push_back(state_.last_event);
    }
}

TurnResult BattleSession::submit(const Action& player_action) {
    if (state_.phase != BattlePhase::SELECTING) {
        return TurnResult{state_, {}};
    }
    return submit(player_action, engine_.decide_enemy_action(state_));
}

TurnResult BattleSession::submit(const Action& player_action, const Action& enemy_action) {
    if (state_.phase != BattlePhase::SELECTING) {
        return TurnResult{state_, {}};
    }

    TurnResult result = engine_.resolve_turn(state_, player_action, enemy_action);
    state_ = result.state;
    history_.insert(history_.end(), result.events.begin(), result.events.end());
    return result;
}

std::optional<Monster> BattleSession::try_recruit() {
    if (recruit_rolled_ || state_.phase != BattlePhase::VICTORY || !state_.is_wild_encounter) {
        return std::nullopt;
    }
    recruit_rolled_ = true;

    auto recruit = roll_recruitment(state_, engine_.get_random_source());
    if (recruit) {
        history_.push_back(recruit->name + " wants to join your party!");
    }
    return recruit;
}

} // namespace monsters
