/**
 * Monster Battle Engine - Post-Battle Settlement
 *
 * Experience, gold and recruitment after a battle ends.
 * All helpers are pure: they take a finished state and return new values.
 */

#pragma once

#include "battle_state.hpp"
#include "random_source.hpp"
#include <optional>

namespace monsters {

// Victory rewards
constexpr int BASE_EXPERIENCE = 50;
constexpr int EXPERIENCE_PER_LEVEL = 10;
constexpr int BASE_GOLD = 25;
constexpr int GOLD_PER_LEVEL = 5;

// Defeat penalty
constexpr double DEFEAT_GOLD_RETAINED = 0.9;

// Recruitment
constexpr double RECRUIT_BASE_CHANCE = 0.1;
constexpr double RECRUIT_AFFECTION_FACTOR = 0.005;
constexpr double RECRUIT_LEVEL_PENALTY = 0.01;
constexpr int RECRUIT_PENALTY_FREE_LEVEL = 5;
constexpr double RECRUIT_MAX_CHANCE = 0.8;

// Captured monsters join at 80% HP
constexpr double CAPTURED_HP_FRACTION = 0.8;

struct BattleRewards {
    int experience_per_monster = 0;
    int gold = 0;
    std::vector<SlotIndex> recipients;  // Every player slot that took part
};

/**
 * Rewards for a VICTORY, based on the lead enemy's level.
 * Returns nullopt for any other phase.
 */
std::optional<BattleRewards> calculate_victory_rewards(const BattleState& state);

/**
 * Player party after a defeat: every member left at 1 HP.
 */
std::vector<Monster> apply_defeat_penalty(const std::vector<Monster>& party);

/**
 * Gold kept after a defeat.
 */
int gold_after_defeat(int gold);

/**
 * Chance that a defeated wild monster asks to join.
 */
double recruitment_chance(const Monster& monster);

/**
 * The captured monster as it joins the player's party.
 * Returns nullopt unless the state is CAPTURED.
 */
std::optional<Monster> settle_captured_monster(const BattleState& state);

/**
 * Roll whether the defeated wild monster joins after a victory.
 *
 * Only a wild VICTORY is eligible; it consumes exactly one draw, and the
 * monster joins when the draw is below recruitment_chance(). The recruit
 * is tamed and restored to CAPTURED_HP_FRACTION of its max HP.
 * Ineligible states consume no draw and return nullopt.
 */
std::optional<Monster> roll_recruitment(const BattleState& state, RandomSource& random);

} // namespace monsters
