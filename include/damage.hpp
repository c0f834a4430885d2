/**
 * Monster Battle Engine - Damage Calculator
 *
 * Computes the damage of a single hit:
 *
 *   base     = floor(attack_stat * power / 100)
 *   level    = 1 + 0.05 * (attacker.level - defender.level)
 *   type     = type_effectiveness(attacker.primary, defender.primary)
 *   critical = 1.5 on a draw < 0.05, else 1.0
 *   variance = uniform in [0.85, 1.15]
 *   final    = max(1, floor(base * level * type * critical * variance))
 *
 * Physical hits use attack/defense, magical hits use magic/wisdom.
 * Secondary types are not consulted.
 *
 * Random draws, in order: critical roll, variance roll.
 */

#pragma once

#include "monster.hpp"
#include "skill_catalog.hpp"
#include "battle_config.hpp"
#include "random_source.hpp"

namespace monsters {

/**
 * Full breakdown of one damage roll (for event text and logs).
 */
struct DamageBreakdown {
    int attack_stat = 0;
    int defense_stat = 0;
    int base_damage = 0;
    double level_modifier = 1.0;
    double type_modifier = 1.0;
    double critical_modifier = 1.0;
    double variance_modifier = 1.0;
    bool critical = false;
    int final_damage = 1;
};

DamageBreakdown calculate_damage_detailed(const Monster& attacker,
                                          const Monster& defender,
                                          const Skill& skill,
                                          bool is_physical,
                                          RandomSource& random,
                                          const BattleConfig& config = BattleConfig{});

int calculate_damage(const Monster& attacker,
                     const Monster& defender,
                     const Skill& skill,
                     bool is_physical,
                     RandomSource& random,
                     const BattleConfig& config = BattleConfig{});

/**
 * Escape probability for the fleeing side's active monster against the
 * opposing active monster, clamped to [flee_min_chance, flee_max_chance].
 */
double calculate_flee_chance(int fleeing_agility,
                             int opposing_agility,
                             const BattleConfig& config = BattleConfig{});

} // namespace monsters
