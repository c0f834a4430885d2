/**
 * Monster Battle Engine - Type Effectiveness Table
 *
 * Static lookup of attacking type x defending type -> damage multiplier.
 * Only the pairs in the table differ from neutral (1.0).
 */

#pragma once

#include "types.hpp"

namespace monsters {

constexpr double SUPER_EFFECTIVE = 1.5;
constexpr double NOT_VERY_EFFECTIVE = 0.5;
constexpr double NEUTRAL = 1.0;

/**
 * A single non-neutral table entry.
 */
struct TypeMatchup {
    MonsterType attacking;
    MonsterType defending;
    double multiplier;
};

/**
 * All defined (non-neutral) pairs, in table order.
 */
const std::vector<TypeMatchup>& defined_matchups();

/**
 * Multiplier for a single attacking/defending pair.
 * Returns NEUTRAL for any pair not in the table.
 */
double type_effectiveness(MonsterType attacking, MonsterType defending);

} // namespace monsters
