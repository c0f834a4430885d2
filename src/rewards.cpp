/**
 * Monster Battle Engine - Post-Battle Settlement Implementation
 */

#include "rewards.hpp"
#include <algorithm>
#include <cmath>

namespace monsters {

namespace {

Monster tamed(const Monster& wild) {
    Monster result = wild;
    result.is_wild = false;
    result.set_hp(static_cast<int>(std::floor(result.max_hp() * CAPTURED_HP_FRACTION)));
    return result;
}

} // anonymous namespace

std::optional<BattleRewards> calculate_victory_rewards(const BattleState& state) {
    if (state.phase != BattlePhase::VICTORY) {
        return std::nullopt;
    }

    const Party& enemies = state.party(Side::ENEMY);
    const Monster* lead = enemies.at(0);
    int level = lead ? lead->level : 1;

    BattleRewards rewards;
    rewards.experience_per_monster = BASE_EXPERIENCE + level * EXPERIENCE_PER_LEVEL;
    rewards.gold = BASE_GOLD + level * GOLD_PER_LEVEL;
    const Party& players = state.party(Side::PLAYER);
    for (size_t slot = 0; slot < players.size(); ++slot) {
        rewards.recipients.push_back(static_cast<SlotIndex>(slot));
    }
    return rewards;
}

std::vector<Monster> apply_defeat_penalty(const std::vector<Monster>& party) {
    std::vector<Monster> result = party;
    for (auto& monster : result) {
        monster.set_hp(1);
    }
    return result;
}

int gold_after_defeat(int gold) {
    if (gold <= 0) return 0;
    return static_cast<int>(std::floor(gold * DEFEAT_GOLD_RETAINED));
}

double recruitment_chance(const Monster& monster) {
    double level_penalty = std::max(0.0, (monster.level - RECRUIT_PENALTY_FREE_LEVEL) * RECRUIT_LEVEL_PENALTY);
    double chance = RECRUIT_BASE_CHANCE
                  + monster.affection * RECRUIT_AFFECTION_FACTOR
                  - level_penalty;
    return std::clamp(chance, 0.0, RECRUIT_MAX_CHANCE);
}

std::optional<Monster> settle_captured_monster(const BattleState& state) {
    if (state.phase != BattlePhase::CAPTURED) {
        return std::nullopt;
    }

    const Monster* target = state.active_monster(Side::ENEMY);
    if (!target) {
        return std::nullopt;
    }

    return tamed(*target);
}

std::optional<Monster> roll_recruitment(const BattleState& state, RandomSource& random) {
    if (state.phase != BattlePhase::VICTORY || !state.is_wild_encounter) {
        return std::nullopt;
    }

    const Monster* candidate = state.active_monster(Side::ENEMY);
    if (!candidate) {
        return std::nullopt;
    }

    if (random.next_double() >= recruitment_chance(*candidate)) {
        return std::nullopt;
    }
    return tamed(*candidate);
}

} // namespace monsters
