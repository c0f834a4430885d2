/**
 * Monster Battle Engine - Monster (Combatant)
 *
 * A single combatant instance. Plain value type, cheap to copy.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <utility>

namespace monsters {

/**
 * Core stat block.
 */
struct MonsterStats {
    int attack = 0;
    int defense = 0;
    int agility = 0;
    int magic = 0;
    int wisdom = 0;
};

/**
 * Monster - one combatant in a party.
 *
 * HP and MP are private so every write goes through the clamping setters:
 * 0 <= current_hp <= max_hp and 0 <= current_mp <= max_mp always hold.
 */
struct Monster {
    MonsterID id;
    std::string species_id;
    std::string name;
    int level = 1;

    MonsterType primary_type = MonsterType::NORMAL;
    std::optional<MonsterType> secondary_type;

    MonsterStats stats;

    // Known skill IDs (resolved through the skill catalog)
    std::vector<SkillID> skills;

    int capture_rate = 100;  // 0..255
    int affection = 0;       // 0..100
    bool is_wild = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Monster() = default;

    Monster(MonsterID monster_id, std::string display_name, int lvl,
            MonsterType type, int hp, int mp, MonsterStats stat_block)
        : id(std::move(monster_id))
        , name(std::move(display_name))
        , level(lvl)
        , primary_type(type)
        , stats(stat_block)
        , max_hp_(std::max(0, hp))
        , current_hp_(std::max(0, hp))
        , max_mp_(std::max(0, mp))
        , current_mp_(std::max(0, mp))
    {}

    // ========================================================================
    // HP / MP ACCESS
    // ========================================================================

    int current_hp() const { return current_hp_; }
    int max_hp() const { return max_hp_; }
    int current_mp() const { return current_mp_; }
    int max_mp() const { return max_mp_; }

    void set_hp(int hp) { current_hp_ = std::clamp(hp, 0, max_hp_); }
    void set_mp(int mp) { current_mp_ = std::clamp(mp, 0, max_mp_); }

    /**
     * Change the maximum HP; current HP is re-clamped.
     */
    void set_max_hp(int hp) {
        max_hp_ = std::max(0, hp);
        current_hp_ = std::min(current_hp_, max_hp_);
    }

    void set_max_mp(int mp) {
        max_mp_ = std::max(0, mp);
        current_mp_ = std::min(current_mp_, max_mp_);
    }

    // ========================================================================
    // HELPERS
    // ========================================================================

    bool is_fainted() const { return current_hp_ <= 0; }

    /**
     * HP fraction in [0, 1]; 0 when max HP is 0.
     */
    double hp_fraction() const {
        return max_hp_ > 0 ? static_cast<double>(current_hp_) / max_hp_ : 0.0;
    }

    bool knows_skill(const SkillID& skill_id) const {
        return std::find(skills.begin(), skills.end(), skill_id) != skills.end();
    }

    bool operator==(const Monster& other) const {
        return id == other.id
            && name == other.name
            && level == other.level
            && primary_type == other.primary_type
            && secondary_type == other.secondary_type
            && current_hp_ == other.current_hp_
            && max_hp_ == other.max_hp_
            && current_mp_ == other.current_mp_
            && max_mp_ == other.max_mp_
            && stats.attack == other.stats.attack
            && stats.defense == other.stats.defense
            && stats.agility == other.stats.agility
            && stats.magic == other.stats.magic
            && stats.wisdom == other.stats.wisdom
            && skills == other.skills
            && capture_rate == other.capture_rate
            && affection == other.affection
            && is_wild == other.is_wild;
    }

    bool operator!=(const Monster& other) const {
        return !(*this == other);
    }

private:
    int max_hp_ = 0;
    int current_hp_ = 0;
    int max_mp_ = 0;
    int current_mp_ = 0;
};

} // namespace monsters
