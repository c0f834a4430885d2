/**
 * Monster Battle Engine - Skill Catalog Implementation
 *
 * Loads skill definitions from JSON files using nlohmann/json.
 */

#include "skill_catalog.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace monsters {

SkillCatalog::SkillCatalog() {}

SkillCatalog SkillCatalog::with_default_skills() {
    SkillCatalog catalog;

    catalog.add_skill({"tackle", "Tackle", "A basic physical attack",
                       SkillCategory::PHYSICAL, SkillTarget::SINGLE_ENEMY,
                       0, 40, 100, 0});
    catalog.add_skill({"heal", "Heal", "Restores HP to self",
                       SkillCategory::HEALING, SkillTarget::SELF,
                       6, 40, 100, 0});
    catalog.add_skill({"fireball", "Fireball", "Hurls a ball of fire at the enemy",
                       SkillCategory::MAGICAL, SkillTarget::SINGLE_ENEMY,
                       8, 60, 90, 0});
    catalog.add_skill({"gust", "Gust", "Creates a powerful wind attack",
                       SkillCategory::MAGICAL, SkillTarget::SINGLE_ENEMY,
                       5, 45, 95, 0});
    catalog.add_skill({"bite", "Bite", "Bites the enemy with sharp fangs",
                       SkillCategory::PHYSICAL, SkillTarget::SINGLE_ENEMY,
                       3, 50, 95, 0});

    return catalog;
}

bool SkillCatalog::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[SkillCatalog] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[SkillCatalog] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[SkillCatalog] Error: " << e.what() << std::endl;
        return false;
    }
}

bool SkillCatalog::load_from_string(const std::string& json_text) {
    try {
        json data = json::parse(json_text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[SkillCatalog] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[SkillCatalog] Error: " << e.what() << std::endl;
        return false;
    }
}

bool SkillCatalog::load_document(const json& data) {
    if (!data.contains("skills") || !data["skills"].is_array()) {
        std::cerr << "[SkillCatalog] No 'skills' array found" << std::endl;
        return false;
    }

    // Parse everything first so a bad entry leaves the catalog untouched
    std::vector<Skill> parsed;
    for (const auto& skill_json : data["skills"]) {
        Skill skill = parse_skill(skill_json);
        if (!skill.id.empty()) {
            parsed.push_back(std::move(skill));
        }
    }

    for (auto& skill : parsed) {
        add_skill(std::move(skill));
    }

    std::cout << "[SkillCatalog] Loaded " << parsed.size() << " skills" << std::endl;
    return true;
}

Skill SkillCatalog::parse_skill(const json& skill_json) const {
    Skill skill;

    skill.id = skill_json.value("id", "");
    skill.name = skill_json.value("name", "");

    if (skill.id.empty()) {
        return skill;  // Invalid skill
    }
    if (skill.name.empty()) {
        skill.name = skill.id;
    }

    skill.description = skill_json.value("description", "");
    skill.category = parse_category(skill_json.value("category", "physical"));
    skill.target = parse_target(skill_json.value("target", "single_enemy"));
    skill.mp_cost = std::max(0, skill_json.value("mpCost", 0));
    skill.power = std::max(0, skill_json.value("power", 0));
    skill.accuracy = skill_json.value("accuracy", 100);
    skill.priority = skill_json.value("priority", 0);

    return skill;
}

void SkillCatalog::add_skill(Skill skill) {
    SkillID id = skill.id;
    skills_[id] = std::move(skill);
}

const Skill* SkillCatalog::get_skill(const SkillID& skill_id) const {
    auto it = skills_.find(skill_id);
    if (it != skills_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool SkillCatalog::has_skill(const SkillID& skill_id) const {
    return skills_.find(skill_id) != skills_.end();
}

std::vector<SkillID> SkillCatalog::get_all_skill_ids() const {
    std::vector<SkillID> ids;
    ids.reserve(skills_.size());
    for (const auto& [id, skill] : skills_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ============================================================================
// PARSE UTILITIES
// ============================================================================

SkillCategory SkillCatalog::parse_category(const std::string& s) {
    if (s == "physical" || s == "PHYSICAL") return SkillCategory::PHYSICAL;
    if (s == "magical" || s == "MAGICAL") return SkillCategory::MAGICAL;
    if (s == "healing" || s == "HEALING") return SkillCategory::HEALING;
    if (s == "support" || s == "SUPPORT" || s == "status" || s == "STATUS") {
        return SkillCategory::SUPPORT;
    }
    return SkillCategory::PHYSICAL;
}

SkillTarget SkillCatalog::parse_target(const std::string& s) {
    if (s == "self" || s == "SELF") return SkillTarget::SELF;
    if (s == "single_enemy" || s == "SINGLE_ENEMY") return SkillTarget::SINGLE_ENEMY;
    if (s == "all_enemies" || s == "ALL_ENEMIES") return SkillTarget::ALL_ENEMIES;
    if (s == "single_ally" || s == "SINGLE_ALLY") return SkillTarget::SINGLE_ALLY;
    if (s == "all_allies" || s == "ALL_ALLIES") return SkillTarget::ALL_ALLIES;
    if (s == "all" || s == "ALL") return SkillTarget::ALL;
    return SkillTarget::SINGLE_ENEMY;
}

} // namespace monsters
