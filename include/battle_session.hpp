/**
 * Monster Battle Engine - Battle Session
 *
 * Holds the evolving state of one battle and feeds player input into the
 * engine. Input outside SELECTING is ignored.
 */

#pragma once

#include "battle_engine.hpp"
#include "rewards.hpp"

namespace monsters {

class BattleSession {
public:
    BattleSession(const BattleEngine& engine, BattleState initial);

    /**
     * Submit the player's action; the enemy action comes from the
     * decision policy.
     */
    TurnResult submit(const Action& player_action);

    /**
     * Submit both actions (scripted enemy).
     */
    TurnResult submit(const Action& player_action, const Action& enemy_action);

    /**
     * After a wild victory, roll once for the defeated monster to join.
     * Later calls return nullopt without drawing.
     */
    std::optional<Monster> try_recruit();

    const BattleState& state() const { return state_; }
    BattlePhase phase() const { return state_.phase; }
    bool is_over() const { return state_.is_over(); }

    /**
     * Every event produced since the session started, in order.
     */
    const std::vector<std::string>& history() const { return history_; }

private:
    const BattleEngine& engine_;
    BattleState state_;
    std::vector<std::string> history_;
    bool recruit_rolled_ = false;
};

} // namespace monsters
