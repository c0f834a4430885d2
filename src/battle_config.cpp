/**
 * Monster Battle Engine - Battle Configuration Loader
 */

#include "battle_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace monsters {

namespace {

BattleConfig parse_config(const json& data, const BattleConfig& base) {
    BattleConfig config = base;

    config.critical_chance = data.value("critical_chance", config.critical_chance);
    config.critical_multiplier = data.value("critical_multiplier", config.critical_multiplier);
    config.variance_min = data.value("variance_min", config.variance_min);
    config.variance_max = data.value("variance_max", config.variance_max);
    config.level_modifier_per_level = data.value("level_modifier_per_level",
                                                 config.level_modifier_per_level);
    config.minimum_damage = data.value("minimum_damage", config.minimum_damage);

    config.basic_attack_power = data.value("basic_attack_power", config.basic_attack_power);
    config.basic_attack_accuracy = data.value("basic_attack_accuracy", config.basic_attack_accuracy);

    config.defend_damage_multiplier = data.value("defend_damage_multiplier",
                                                 config.defend_damage_multiplier);

    config.flee_base_chance = data.value("flee_base_chance", config.flee_base_chance);
    config.flee_agility_factor = data.value("flee_agility_factor", config.flee_agility_factor);
    config.flee_min_chance = data.value("flee_min_chance", config.flee_min_chance);
    config.flee_max_chance = data.value("flee_max_chance", config.flee_max_chance);

    config.pacing_interval_ms = data.value("pacing_interval_ms", config.pacing_interval_ms);

    if (data.contains("enemy_ai") && data["enemy_ai"].is_object()) {
        const auto& ai = data["enemy_ai"];
        auto& policy = config.enemy_ai;
        policy.skill_mp_threshold = ai.value("skill_mp_threshold", policy.skill_mp_threshold);
        policy.skill_chance = ai.value("skill_chance", policy.skill_chance);
        policy.low_hp_fraction = ai.value("low_hp_fraction", policy.low_hp_fraction);
        policy.defend_chance = ai.value("defend_chance", policy.defend_chance);
    }

    return config;
}

bool validate(const BattleConfig& config) {
    if (config.variance_min > config.variance_max) {
        std::cerr << "[BattleConfig] variance_min exceeds variance_max" << std::endl;
        return false;
    }
    if (config.flee_min_chance > config.flee_max_chance) {
        std::cerr << "[BattleConfig] flee_min_chance exceeds flee_max_chance" << std::endl;
        return false;
    }
    if (config.minimum_damage < 1) {
        std::cerr << "[BattleConfig] minimum_damage must be at least 1" << std::endl;
        return false;
    }
    if (config.pacing_interval_ms < 0) {
        std::cerr << "[BattleConfig] pacing_interval_ms must not be negative" << std::endl;
        return false;
    }
    return true;
}

} // anonymous namespace

bool BattleConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[BattleConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        BattleConfig parsed = parse_config(data, *this);
        if (!validate(parsed)) {
            return false;
        }
        *this = parsed;
        std::cout << "[BattleConfig] Loaded " << filepath << std::endl;
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[BattleConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[BattleConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

bool BattleConfig::load_from_string(const std::string& json_text) {
    try {
        json data = json::parse(json_text);
        BattleConfig parsed = parse_config(data, *this);
        if (!validate(parsed)) {
            return false;
        }
        *this = parsed;
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[BattleConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[BattleConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace monsters
