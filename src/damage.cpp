/**
 * Monster Battle Engine - Damage Calculator Implementation
 */

#include "damage.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace monsters {

namespace {

// Absorbs representation error in the non-integral factors before flooring
constexpr double FLOOR_TOLERANCE = 1e-9;

} // anonymous namespace

DamageBreakdown calculate_damage_detailed(const Monster& attacker,
                                          const Monster& defender,
                                          const Skill& skill,
                                          bool is_physical,
                                          RandomSource& random,
                                          const BattleConfig& config) {
    DamageBreakdown result;

    result.attack_stat = is_physical ? attacker.stats.attack : attacker.stats.magic;
    result.defense_stat = is_physical ? defender.stats.defense : defender.stats.wisdom;

    // Step 1: Base damage (integer division floors for non-negative operands)
    result.base_damage = std::max(0, result.attack_stat * skill.power / 100);

    // Step 2: Level difference, kept as whole percent so the product stays exact
    int level_diff = attacker.level - defender.level;
    long long level_percent = 100 + std::llround(level_diff * config.level_modifier_per_level * 100.0);
    result.level_modifier = level_percent / 100.0;

    // Step 3: Type effectiveness on primary types only
    result.type_modifier = type_effectiveness(attacker.primary_type, defender.primary_type);
    long long type_percent = std::llround(result.type_modifier * 100.0);

    // Step 4: Critical roll
    result.critical = random.next_double() < config.critical_chance;
    result.critical_modifier = result.critical ? config.critical_multiplier : 1.0;

    // Step 5: Variance roll
    double span = config.variance_max - config.variance_min;
    result.variance_modifier = config.variance_min + random.next_double() * span;

    long long scaled = static_cast<long long>(result.base_damage) * level_percent * type_percent;
    double raw = scaled * result.critical_modifier * result.variance_modifier / 10000.0;

    raw = std::min(raw, static_cast<double>(std::numeric_limits<int>::max()));
    result.final_damage = std::max(config.minimum_damage,
                                   static_cast<int>(std::floor(raw + FLOOR_TOLERANCE)));
    return result;
}

int calculate_damage(const Monster& attacker,
                     const Monster& defender,
                     const Skill& skill,
                     bool is_physical,
                     RandomSource& random,
                     const BattleConfig& config) {
    return calculate_damage_detailed(attacker, defender, skill, is_physical, random, config)
        .final_damage;
}

double calculate_flee_chance(int fleeing_agility,
                             int opposing_agility,
                             const BattleConfig& config) {
    double chance = config.flee_base_chance
        + (fleeing_agility - opposing_agility) * config.flee_agility_factor;
    return std::clamp(chance, config.flee_min_chance, config.flee_max_chance);
}

} // namespace monsters
