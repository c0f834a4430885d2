/**
 * Monster Battle Engine - Battle Configuration
 *
 * Tunable battle constants. Defaults reproduce the standard rules;
 * a JSON file can override any subset of them.
 */

#pragma once

#include <string>

namespace monsters {

/**
 * Enemy decision policy thresholds.
 */
struct EnemyPolicyConfig {
    int skill_mp_threshold = 8;      // skill considered when current MP > threshold
    double skill_chance = 0.4;
    double low_hp_fraction = 0.3;    // defend considered below this HP fraction
    double defend_chance = 0.3;
};

struct BattleConfig {
    // Damage
    double critical_chance = 0.05;
    double critical_multiplier = 1.5;
    double variance_min = 0.85;
    double variance_max = 1.15;
    double level_modifier_per_level = 0.05;
    int minimum_damage = 1;

    // Basic attack skill
    int basic_attack_power = 50;
    int basic_attack_accuracy = 95;

    // Defend stance
    double defend_damage_multiplier = 0.5;

    // Escape
    double flee_base_chance = 0.5;
    double flee_agility_factor = 0.01;
    double flee_min_chance = 0.1;
    double flee_max_chance = 0.9;

    // Presentation pacing between applied actions
    int pacing_interval_ms = 500;

    EnemyPolicyConfig enemy_ai;

    /**
     * Override values from a JSON file. Missing keys keep their current value.
     * On failure the config is left unchanged.
     */
    bool load_from_json(const std::string& filepath);

    bool load_from_string(const std::string& json_text);
};

} // namespace monsters
