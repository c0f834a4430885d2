/**
 * Monster Battle Engine - Type Effectiveness Table Implementation
 */

#include "type_chart.hpp"
#include <cctype>

namespace monsters {

const std::vector<TypeMatchup>& defined_matchups() {
    static const std::vector<TypeMatchup> table = {
        // Super effective
        {MonsterType::FIRE,     MonsterType::GRASS,  SUPER_EFFECTIVE},
        {MonsterType::WATER,    MonsterType::FIRE,   SUPER_EFFECTIVE},
        {MonsterType::GRASS,    MonsterType::WATER,  SUPER_EFFECTIVE},
        {MonsterType::ELECTRIC, MonsterType::FLYING, SUPER_EFFECTIVE},
        {MonsterType::FIGHTING, MonsterType::NORMAL, SUPER_EFFECTIVE},

        // Not very effective
        {MonsterType::FIRE,     MonsterType::WATER,  NOT_VERY_EFFECTIVE},
        {MonsterType::WATER,    MonsterType::GRASS,  NOT_VERY_EFFECTIVE},
        {MonsterType::GRASS,    MonsterType::FIRE,   NOT_VERY_EFFECTIVE},
        {MonsterType::ELECTRIC, MonsterType::GROUND, NOT_VERY_EFFECTIVE},
    };
    return table;
}

double type_effectiveness(MonsterType attacking, MonsterType defending) {
    for (const auto& entry : defined_matchups()) {
        if (entry.attacking == attacking && entry.defending == defending) {
            return entry.multiplier;
        }
    }
    return NEUTRAL;
}

std::optional<MonsterType> parse_monster_type(const std::string& s) {
    std::string upper;
    upper.reserve(s.size());
    for (char c : s) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    for (MonsterType type : all_monster_types()) {
        std::string name = to_string(type);
        for (auto& c : name) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (name == upper) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace monsters
