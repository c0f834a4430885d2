/**
 * Monster Battle Engine - Skill Catalog
 *
 * Stores immutable skill definitions loaded from JSON.
 * Provides fast lookup by skill id.
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace monsters {

/**
 * Skill definition (immutable).
 */
struct Skill {
    SkillID id;
    std::string name;
    std::string description;
    SkillCategory category = SkillCategory::PHYSICAL;
    SkillTarget target = SkillTarget::SINGLE_ENEMY;
    int mp_cost = 0;
    int power = 0;        // 0 for non-damaging skills
    int accuracy = 100;
    int priority = 0;

    bool is_damaging() const {
        return power > 0
            && (category == SkillCategory::PHYSICAL || category == SkillCategory::MAGICAL);
    }

    bool is_healing() const {
        return power > 0 && category == SkillCategory::HEALING;
    }

    bool is_physical() const { return category == SkillCategory::PHYSICAL; }

    bool hits_all_enemies() const {
        return target == SkillTarget::ALL_ENEMIES || target == SkillTarget::ALL;
    }

    bool affects_all_allies() const {
        return target == SkillTarget::ALL_ALLIES || target == SkillTarget::ALL;
    }
};

/**
 * SkillCatalog - Central skill lookup.
 *
 * Loads skills from JSON and provides fast lookup.
 * Skill definitions are immutable and shared.
 */
class SkillCatalog {
public:
    SkillCatalog();
    ~SkillCatalog() = default;

    /**
     * Catalog pre-filled with the built-in skill set
     * (tackle, heal, fireball, gust, bite).
     */
    static SkillCatalog with_default_skills();

    /**
     * Load skills from a JSON file.
     *
     * Existing entries with the same id are replaced.
     * On failure the catalog is left unchanged.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load skills from an in-memory JSON document.
     */
    bool load_from_string(const std::string& json_text);

    /**
     * Add or replace a single skill.
     */
    void add_skill(Skill skill);

    /**
     * Get a skill definition by ID.
     *
     * Returns nullptr if skill not found.
     */
    const Skill* get_skill(const SkillID& skill_id) const;

    bool has_skill(const SkillID& skill_id) const;

    /**
     * Get all skill IDs, sorted.
     */
    std::vector<SkillID> get_all_skill_ids() const;

    size_t skill_count() const { return skills_.size(); }

    /**
     * Static parsing utilities - public for use by other components.
     */
    static SkillCategory parse_category(const std::string& s);
    static SkillTarget parse_target(const std::string& s);

private:
    std::unordered_map<SkillID, Skill> skills_;

    bool load_document(const nlohmann::json& data);
    Skill parse_skill(const nlohmann::json& skill_json) const;
};

} // namespace monsters
