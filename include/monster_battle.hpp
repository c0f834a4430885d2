/**
 * Monster Battle Engine - C++ Implementation
 *
 * Deterministic turn-based battle resolver for monster-collecting games.
 * Given a seeded random source, identical inputs produce identical battles.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"

// Data structures
#include "monster.hpp"
#include "action.hpp"
#include "battle_state.hpp"

// Skills and tuning
#include "skill_catalog.hpp"
#include "battle_config.hpp"
#include "type_chart.hpp"

// Battle rules
#include "random_source.hpp"
#include "damage.hpp"
#include "capture.hpp"
#include "turn_order.hpp"
#include "action_executor.hpp"
#include "enemy_policy.hpp"
#include "pacing.hpp"

// Engine
#include "battle_engine.hpp"
#include "battle_session.hpp"
#include "battle_logger.hpp"
#include "rewards.hpp"

namespace monsters {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace monsters
