/**
 * Tests for the Skill Catalog
 */

#include <sstream>
#include <fstream>
#include <filesystem>
#include "skill_catalog.hpp"

using namespace monsters;

// ============================================================================
// DEFAULT SKILLS
// ============================================================================

TEST(SkillCatalog, DefaultSkills) {
    SkillCatalog catalog = SkillCatalog::with_default_skills();

    TEST_ASSERT_EQ(5u, catalog.skill_count());

    const Skill* fireball = catalog.get_skill("fireball");
    TEST_ASSERT_NOT_NULL(fireball);
    TEST_ASSERT_EQ(8, fireball->mp_cost);
    TEST_ASSERT_EQ(60, fireball->power);
    TEST_ASSERT_EQ(90, fireball->accuracy);
    TEST_ASSERT_TRUE(fireball->category == SkillCategory::MAGICAL);
    TEST_ASSERT_TRUE(fireball->is_damaging());

    const Skill* heal = catalog.get_skill("heal");
    TEST_ASSERT_NOT_NULL(heal);
    TEST_ASSERT_TRUE(heal->is_healing());
    TEST_ASSERT_FALSE(heal->is_damaging());
    TEST_ASSERT_TRUE(heal->target == SkillTarget::SELF);
}

TEST(SkillCatalog, UnknownSkillIsNull) {
    SkillCatalog catalog = SkillCatalog::with_default_skills();
    TEST_ASSERT_NULL(catalog.get_skill("hyper_beam"));
    TEST_ASSERT_FALSE(catalog.has_skill("hyper_beam"));
}

TEST(SkillCatalog, SkillIdsSorted) {
    SkillCatalog catalog = SkillCatalog::with_default_skills();
    std::vector<SkillID> expected = {"bite", "fireball", "gust", "heal", "tackle"};
    TEST_ASSERT_TRUE(catalog.get_all_skill_ids() == expected);
}

// ============================================================================
// JSON LOADING
// ============================================================================

TEST(SkillCatalog, LoadFromString) {
    SkillCatalog catalog;
    bool ok = catalog.load_from_string(R"({
        "skills": [
            {"id": "ice_shard", "name": "Ice Shard", "category": "physical",
             "target": "single_enemy", "mpCost": 2, "power": 35, "accuracy": 100, "priority": 1},
            {"id": "blizzard", "name": "Blizzard", "category": "magical",
             "target": "all_enemies", "mpCost": 12, "power": 70, "accuracy": 80},
            {"id": "mend", "category": "healing", "target": "all_allies", "mpCost": 10, "power": 30}
        ]
    })");

    TEST_ASSERT_TRUE(ok);
    TEST_ASSERT_EQ(3u, catalog.skill_count());

    const Skill* shard = catalog.get_skill("ice_shard");
    TEST_ASSERT_NOT_NULL(shard);
    TEST_ASSERT_EQ(1, shard->priority);

    const Skill* blizzard = catalog.get_skill("blizzard");
    TEST_ASSERT_TRUE(blizzard->hits_all_enemies());
    TEST_ASSERT_EQ(0, blizzard->priority);

    const Skill* mend = catalog.get_skill("mend");
    TEST_ASSERT_EQ(std::string("mend"), mend->name);
    TEST_ASSERT_TRUE(mend->affects_all_allies());
    TEST_ASSERT_EQ(100, mend->accuracy);
}

TEST(SkillCatalog, EntriesWithoutIdAreSkipped) {
    SkillCatalog catalog;
    bool ok = catalog.load_from_string(R"({"skills": [{"name": "Nameless"}, {"id": "poke", "power": 10}]})");

    TEST_ASSERT_TRUE(ok);
    TEST_ASSERT_EQ(1u, catalog.skill_count());
    TEST_ASSERT_TRUE(catalog.has_skill("poke"));
}

TEST(SkillCatalog, MalformedJsonLeavesCatalogUnchanged) {
    SkillCatalog catalog = SkillCatalog::with_default_skills();

    TEST_ASSERT_FALSE(catalog.load_from_string("{\"skills\": [ {\"id\": "));
    TEST_ASSERT_FALSE(catalog.load_from_string("{\"moves\": []}"));
    TEST_ASSERT_EQ(5u, catalog.skill_count());
}

TEST(SkillCatalog, BadFieldTypeLeavesCatalogUnchanged) {
    SkillCatalog catalog = SkillCatalog::with_default_skills();

    bool ok = catalog.load_from_string(R"({"skills": [
        {"id": "fine", "power": 10},
        {"id": "broken", "power": "lots"}
    ]})");

    TEST_ASSERT_FALSE(ok);
    TEST_ASSERT_FALSE(catalog.has_skill("fine"));
    TEST_ASSERT_EQ(5u, catalog.skill_count());
}

TEST(SkillCatalog, LoadFromFileReplacesExisting) {
    auto path = std::filesystem::temp_directory_path() / "monster_battle_test_skills.json";
    {
        std::ofstream out(path);
        out << R"({"skills": [{"id": "tackle", "name": "Heavy Tackle", "power": 55}]})";
    }

    SkillCatalog catalog = SkillCatalog::with_default_skills();
    TEST_ASSERT_TRUE(catalog.load_from_json(path.string()));
    TEST_ASSERT_EQ(5u, catalog.skill_count());
    TEST_ASSERT_EQ(55, catalog.get_skill("tackle")->power);
    TEST_ASSERT_EQ(std::string("Heavy Tackle"), catalog.get_skill("tackle")->name);

    std::filesystem::remove(path);
}

TEST(SkillCatalog, MissingFileFails) {
    SkillCatalog catalog;
    TEST_ASSERT_FALSE(catalog.load_from_json("/nonexistent/dir/skills.json"));
    TEST_ASSERT_EQ(0u, catalog.skill_count());
}

TEST(SkillCatalog, ParseHelpers) {
    TEST_ASSERT_TRUE(SkillCatalog::parse_category("healing") == SkillCategory::HEALING);
    TEST_ASSERT_TRUE(SkillCatalog::parse_category("status") == SkillCategory::SUPPORT);
    TEST_ASSERT_TRUE(SkillCatalog::parse_target("ALL") == SkillTarget::ALL);
    TEST_ASSERT_TRUE(SkillCatalog::parse_target("nonsense") == SkillTarget::SINGLE_ENEMY);
}
