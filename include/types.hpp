/**
 * Monster Battle Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace monsters {

// ============================================================================
// ENUMS
// ============================================================================

enum class MonsterType : uint8_t {
    NORMAL,
    FIRE,
    WATER,
    GRASS,
    ELECTRIC,
    ICE,
    FIGHTING,
    POISON,
    GROUND,
    FLYING,
    PSYCHIC,
    BUG,
    ROCK,
    GHOST,
    DRAGON,
    DARK,
    STEEL
};

constexpr int MONSTER_TYPE_COUNT = 17;

enum class SkillCategory : uint8_t {
    PHYSICAL,
    MAGICAL,
    HEALING,
    SUPPORT
};

enum class SkillTarget : uint8_t {
    SELF,
    SINGLE_ENEMY,
    ALL_ENEMIES,
    SINGLE_ALLY,
    ALL_ALLIES,
    ALL
};

enum class BattlePhase : uint8_t {
    SELECTING,
    RESOLVING,
    VICTORY,
    DEFEAT,
    CAPTURED,
    ESCAPED
};

enum class BattleType : uint8_t {
    WILD_ENCOUNTER,
    TRAINER_BATTLE,
    BOSS_BATTLE
};

enum class ActionType : uint8_t {
    ATTACK,
    USE_SKILL,
    DEFEND,
    FLEE,
    CAPTURE
};

enum class Side : uint8_t {
    PLAYER = 0,
    ENEMY = 1
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using MonsterID = std::string;   // Unique instance ID (e.g., "mon_001")
using SkillID = std::string;     // Skill definition ID (e.g., "fireball")
using ItemID = std::string;      // Capture item ID (e.g., "great_capture")
using SlotIndex = int;           // Stable position within a party

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline Side opponent_of(Side side) {
    return side == Side::PLAYER ? Side::ENEMY : Side::PLAYER;
}

inline int side_index(Side side) {
    return static_cast<int>(side);
}

inline bool is_terminal(BattlePhase phase) {
    return phase == BattlePhase::VICTORY
        || phase == BattlePhase::DEFEAT
        || phase == BattlePhase::CAPTURED
        || phase == BattlePhase::ESCAPED;
}

inline const char* to_string(BattlePhase phase) {
    switch (phase) {
        case BattlePhase::SELECTING: return "selecting";
        case BattlePhase::RESOLVING: return "resolving";
        case BattlePhase::VICTORY: return "victory";
        case BattlePhase::DEFEAT: return "defeat";
        case BattlePhase::CAPTURED: return "captured";
        case BattlePhase::ESCAPED: return "escaped";
        default: return "unknown";
    }
}

inline const char* to_string(Side side) {
    switch (side) {
        case Side::PLAYER: return "player";
        case Side::ENEMY: return "enemy";
        default: return "unknown";
    }
}

inline const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::ATTACK: return "ATTACK";
        case ActionType::USE_SKILL: return "USE_SKILL";
        case ActionType::DEFEND: return "DEFEND";
        case ActionType::FLEE: return "FLEE";
        case ActionType::CAPTURE: return "CAPTURE";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(MonsterType type) {
    switch (type) {
        case MonsterType::NORMAL: return "Normal";
        case MonsterType::FIRE: return "Fire";
        case MonsterType::WATER: return "Water";
        case MonsterType::GRASS: return "Grass";
        case MonsterType::ELECTRIC: return "Electric";
        case MonsterType::ICE: return "Ice";
        case MonsterType::FIGHTING: return "Fighting";
        case MonsterType::POISON: return "Poison";
        case MonsterType::GROUND: return "Ground";
        case MonsterType::FLYING: return "Flying";
        case MonsterType::PSYCHIC: return "Psychic";
        case MonsterType::BUG: return "Bug";
        case MonsterType::ROCK: return "Rock";
        case MonsterType::GHOST: return "Ghost";
        case MonsterType::DRAGON: return "Dragon";
        case MonsterType::DARK: return "Dark";
        case MonsterType::STEEL: return "Steel";
        default: return "Unknown";
    }
}

inline const char* to_string(SkillCategory category) {
    switch (category) {
        case SkillCategory::PHYSICAL: return "physical";
        case SkillCategory::MAGICAL: return "magical";
        case SkillCategory::HEALING: return "healing";
        case SkillCategory::SUPPORT: return "support";
        default: return "unknown";
    }
}

inline const char* to_string(SkillTarget target) {
    switch (target) {
        case SkillTarget::SELF: return "self";
        case SkillTarget::SINGLE_ENEMY: return "single_enemy";
        case SkillTarget::ALL_ENEMIES: return "all_enemies";
        case SkillTarget::SINGLE_ALLY: return "single_ally";
        case SkillTarget::ALL_ALLIES: return "all_allies";
        case SkillTarget::ALL: return "all";
        default: return "unknown";
    }
}

/**
 * All monster types in declaration order (for exhaustive iteration).
 */
inline std::vector<MonsterType> all_monster_types() {
    std::vector<MonsterType> types;
    types.reserve(MONSTER_TYPE_COUNT);
    for (int i = 0; i < MONSTER_TYPE_COUNT; ++i) {
        types.push_back(static_cast<MonsterType>(i));
    }
    return types;
}

/**
 * Parse a type name ("Fire", "FIRE", "fire"). Returns nullopt if unknown.
 */
std::optional<MonsterType> parse_monster_type(const std::string& s);

} // namespace monsters
