/**
 * Monster Battle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ battle engine.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pybind11/functional.h>

#include "monster_battle.hpp"

namespace py = pybind11;

PYBIND11_MODULE(monster_battle_cpp, m) {
    m.doc() = "Deterministic turn-based monster battle engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<monsters::MonsterType>(m, "MonsterType")
        .value("NORMAL", monsters::MonsterType::NORMAL)
        .value("FIRE", monsters::MonsterType::FIRE)
        .value("WATER", monsters::MonsterType::WATER)
        .value("GRASS", monsters::MonsterType::GRASS)
        .value("ELECTRIC", monsters::MonsterType::ELECTRIC)
        .value("ICE", monsters::MonsterType::ICE)
        .value("FIGHTING", monsters::MonsterType::FIGHTING)
        .value("POISON", monsters::MonsterType::POISON)
        .value("GROUND", monsters::MonsterType::GROUND)
        .value("FLYING", monsters::MonsterType::FLYING)
        .value("PSYCHIC", monsters::MonsterType::PSYCHIC)
        .value("BUG", monsters::MonsterType::BUG)
        .value("ROCK", monsters::MonsterType::ROCK)
        .value("GHOST", monsters::MonsterType::GHOST)
        .value("DRAGON", monsters::MonsterType::DRAGON)
        .value("DARK", monsters::MonsterType::DARK)
        .value("STEEL", monsters::MonsterType::STEEL)
        .export_values();

    py::enum_<monsters::SkillCategory>(m, "SkillCategory")
        .value("PHYSICAL", monsters::SkillCategory::PHYSICAL)
        .value("MAGICAL", monsters::SkillCategory::MAGICAL)
        .value("HEALING", monsters::SkillCategory::HEALING)
        .value("SUPPORT", monsters::SkillCategory::SUPPORT)
        .export_values();

    py::enum_<monsters::SkillTarget>(m, "SkillTarget")
        .value("SELF", monsters::SkillTarget::SELF)
        .value("SINGLE_ENEMY", monsters::SkillTarget::SINGLE_ENEMY)
        .value("ALL_ENEMIES", monsters::SkillTarget::ALL_ENEMIES)
        .value("SINGLE_ALLY", monsters::SkillTarget::SINGLE_ALLY)
        .value("ALL_ALLIES", monsters::SkillTarget::ALL_ALLIES)
        .value("ALL", monsters::SkillTarget::ALL)
        .export_values();

    py::enum_<monsters::BattlePhase>(m, "BattlePhase")
        .value("SELECTING", monsters::BattlePhase::SELECTING)
        .value("RESOLVING", monsters::BattlePhase::RESOLVING)
        .value("VICTORY", monsters::BattlePhase::VICTORY)
        .value("DEFEAT", monsters::BattlePhase::DEFEAT)
        .value("CAPTURED", monsters::BattlePhase::CAPTURED)
        .value("ESCAPED", monsters::BattlePhase::ESCAPED)
        .export_values();

    py::enum_<monsters::BattleType>(m, "BattleType")
        .value("WILD_ENCOUNTER", monsters::BattleType::WILD_ENCOUNTER)
        .value("TRAINER_BATTLE", monsters::BattleType::TRAINER_BATTLE)
        .value("BOSS_BATTLE", monsters::BattleType::BOSS_BATTLE)
        .export_values();

    py::enum_<monsters::ActionType>(m, "ActionType")
        .value("ATTACK", monsters::ActionType::ATTACK)
        .value("USE_SKILL", monsters::ActionType::USE_SKILL)
        .value("DEFEND", monsters::ActionType::DEFEND)
        .value("FLEE", monsters::ActionType::FLEE)
        .value("CAPTURE", monsters::ActionType::CAPTURE)
        .export_values();

    py::enum_<monsters::Side>(m, "Side")
        .value("PLAYER", monsters::Side::PLAYER)
        .value("ENEMY", monsters::Side::ENEMY)
        .export_values();

    // ========================================================================
    // MONSTER
    // ========================================================================

    py::class_<monsters::MonsterStats>(m, "MonsterStats")
        .def(py::init<>())
        .def(py::init([](int attack, int defense, int agility, int magic, int wisdom) {
            return monsters::MonsterStats{attack, defense, agility, magic, wisdom};
        }), py::arg("attack"), py::arg("defense"), py::arg("agility"),
            py::arg("magic"), py::arg("wisdom"))
        .def_readwrite("attack", &monsters::MonsterStats::attack)
        .def_readwrite("defense", &monsters::MonsterStats::defense)
        .def_readwrite("agility", &monsters::MonsterStats::agility)
        .def_readwrite("magic", &monsters::MonsterStats::magic)
        .def_readwrite("wisdom", &monsters::MonsterStats::wisdom);

    py::class_<monsters::Monster>(m, "Monster")
        .def(py::init<>())
        .def(py::init<monsters::MonsterID, std::string, int, monsters::MonsterType,
                      int, int, monsters::MonsterStats>())
        .def_readwrite("id", &monsters::Monster::id)
        .def_readwrite("species_id", &monsters::Monster::species_id)
        .def_readwrite("name", &monsters::Monster::name)
        .def_readwrite("level", &monsters::Monster::level)
        .def_readwrite("primary_type", &monsters::Monster::primary_type)
        .def_readwrite("secondary_type", &monsters::Monster::secondary_type)
        .def_readwrite("stats", &monsters::Monster::stats)
        .def_readwrite("skills", &monsters::Monster::skills)
        .def_readwrite("capture_rate", &monsters::Monster::capture_rate)
        .def_readwrite("affection", &monsters::Monster::affection)
        .def_readwrite("is_wild", &monsters::Monster::is_wild)
        .def_property("current_hp", &monsters::Monster::current_hp, &monsters::Monster::set_hp)
        .def_property("max_hp", &monsters::Monster::max_hp, &monsters::Monster::set_max_hp)
        .def_property("current_mp", &monsters::Monster::current_mp, &monsters::Monster::set_mp)
        .def_property("max_mp", &monsters::Monster::max_mp, &monsters::Monster::set_max_mp)
        .def("is_fainted", &monsters::Monster::is_fainted)
        .def("hp_fraction", &monsters::Monster::hp_fraction)
        .def("knows_skill", &monsters::Monster::knows_skill)
        .def(py::self == py::self)
        .def(py::self != py::self);

    // ========================================================================
    // SKILLS
    // ========================================================================

    py::class_<monsters::Skill>(m, "Skill")
        .def(py::init<>())
        .def_readwrite("id", &monsters::Skill::id)
        .def_readwrite("name", &monsters::Skill::name)
        .def_readwrite("description", &monsters::Skill::description)
        .def_readwrite("category", &monsters::Skill::category)
        .def_readwrite("target", &monsters::Skill::target)
        .def_readwrite("mp_cost", &monsters::Skill::mp_cost)
        .def_readwrite("power", &monsters::Skill::power)
        .def_readwrite("accuracy", &monsters::Skill::accuracy)
        .def_readwrite("priority", &monsters::Skill::priority)
        .def("is_damaging", &monsters::Skill::is_damaging)
        .def("is_healing", &monsters::Skill::is_healing);

    py::class_<monsters::SkillCatalog>(m, "SkillCatalog")
        .def(py::init<>())
        .def_static("with_default_skills", &monsters::SkillCatalog::with_default_skills)
        .def("load_from_json", &monsters::SkillCatalog::load_from_json)
        .def("load_from_string", &monsters::SkillCatalog::load_from_string)
        .def("add_skill", &monsters::SkillCatalog::add_skill)
        .def("get_skill", &monsters::SkillCatalog::get_skill, py::return_value_policy::reference)
        .def("has_skill", &monsters::SkillCatalog::has_skill)
        .def("get_all_skill_ids", &monsters::SkillCatalog::get_all_skill_ids)
        .def("skill_count", &monsters::SkillCatalog::skill_count);

    // ========================================================================
    // CONFIG
    // ========================================================================

    py::class_<monsters::EnemyPolicyConfig>(m, "EnemyPolicyConfig")
        .def(py::init<>())
        .def_readwrite("skill_mp_threshold", &monsters::EnemyPolicyConfig::skill_mp_threshold)
        .def_readwrite("skill_chance", &monsters::EnemyPolicyConfig::skill_chance)
        .def_readwrite("low_hp_fraction", &monsters::EnemyPolicyConfig::low_hp_fraction)
        .def_readwrite("defend_chance", &monsters::EnemyPolicyConfig::defend_chance);

    py::class_<monsters::BattleConfig>(m, "BattleConfig")
        .def(py::init<>())
        .def_readwrite("critical_chance", &monsters::BattleConfig::critical_chance)
        .def_readwrite("critical_multiplier", &monsters::BattleConfig::critical_multiplier)
        .def_readwrite("variance_min", &monsters::BattleConfig::variance_min)
        .def_readwrite("variance_max", &monsters::BattleConfig::variance_max)
        .def_readwrite("level_modifier_per_level", &monsters::BattleConfig::level_modifier_per_level)
        .def_readwrite("minimum_damage", &monsters::BattleConfig::minimum_damage)
        .def_readwrite("basic_attack_power", &monsters::BattleConfig::basic_attack_power)
        .def_readwrite("basic_attack_accuracy", &monsters::BattleConfig::basic_attack_accuracy)
        .def_readwrite("defend_damage_multiplier", &monsters::BattleConfig::defend_damage_multiplier)
        .def_readwrite("flee_base_chance", &monsters::BattleConfig::flee_base_chance)
        .def_readwrite("flee_agility_factor", &monsters::BattleConfig::flee_agility_factor)
        .def_readwrite("flee_min_chance", &monsters::BattleConfig::flee_min_chance)
        .def_readwrite("flee_max_chance", &monsters::BattleConfig::flee_max_chance)
        .def_readwrite("pacing_interval_ms", &monsters::BattleConfig::pacing_interval_ms)
        .def_readwrite("enemy_ai", &monsters::BattleConfig::enemy_ai)
        .def("load_from_json", &monsters::BattleConfig::load_from_json)
        .def("load_from_string", &monsters::BattleConfig::load_from_string);

    // ========================================================================
    // ACTION
    // ========================================================================

    py::class_<monsters::Action>(m, "Action")
        .def(py::init<>())
        .def(py::init<monsters::ActionType, monsters::Side, monsters::SlotIndex>())
        .def_readwrite("action_type", &monsters::Action::action_type)
        .def_readwrite("side", &monsters::Action::side)
        .def_readwrite("actor_slot", &monsters::Action::actor_slot)
        .def_readwrite("priority", &monsters::Action::priority)
        .def_readwrite("skill_id", &monsters::Action::skill_id)
        .def_readwrite("item_id", &monsters::Action::item_id)
        .def("__str__", &monsters::Action::to_string)
        .def("__repr__", &monsters::Action::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("attack", &monsters::Action::attack)
        .def_static("use_skill", &monsters::Action::use_skill,
                    py::arg("side"), py::arg("slot"), py::arg("skill"), py::arg("priority") = 0)
        .def_static("defend", &monsters::Action::defend)
        .def_static("flee", &monsters::Action::flee)
        .def_static("capture", &monsters::Action::capture);

    // ========================================================================
    // BATTLE STATE
    // ========================================================================

    py::class_<monsters::Party>(m, "Party")
        .def(py::init<>())
        .def(py::init<std::vector<monsters::Monster>>())
        .def_readwrite("members", &monsters::Party::members)
        .def_readwrite("active_slot", &monsters::Party::active_slot)
        .def_readwrite("defending", &monsters::Party::defending)
        .def("size", &monsters::Party::size)
        .def("is_defending", &monsters::Party::is_defending)
        .def("all_fainted", &monsters::Party::all_fainted)
        .def("living_slots", &monsters::Party::living_slots);

    py::class_<monsters::BattleState>(m, "BattleState")
        .def(py::init<>())
        .def_readwrite("parties", &monsters::BattleState::parties)
        .def_readwrite("phase", &monsters::BattleState::phase)
        .def_readwrite("turn", &monsters::BattleState::turn)
        .def_readwrite("last_event", &monsters::BattleState::last_event)
        .def_readwrite("is_wild_encounter", &monsters::BattleState::is_wild_encounter)
        .def_readwrite("can_flee", &monsters::BattleState::can_flee)
        .def_readwrite("can_capture", &monsters::BattleState::can_capture)
        .def("party", py::overload_cast<monsters::Side>(&monsters::BattleState::party),
             py::return_value_policy::reference_internal)
        .def("active_monster", py::overload_cast<monsters::Side>(&monsters::BattleState::active_monster),
             py::return_value_policy::reference_internal)
        .def("is_side_exhausted", &monsters::BattleState::is_side_exhausted)
        .def("is_over", &monsters::BattleState::is_over)
        .def(py::self == py::self)
        .def(py::self != py::self);

    py::class_<monsters::StepResult>(m, "StepResult")
        .def_readonly("state", &monsters::StepResult::state)
        .def_readonly("event", &monsters::StepResult::event)
        .def_readonly("applied", &monsters::StepResult::applied);

    py::class_<monsters::TurnResult>(m, "TurnResult")
        .def_readonly("state", &monsters::TurnResult::state)
        .def_readonly("events", &monsters::TurnResult::events);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<monsters::BattleEngine>(m, "BattleEngine")
        .def(py::init<>())
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("start_battle", &monsters::BattleEngine::start_battle,
             py::arg("player_party"), py::arg("enemy_party"),
             py::arg("battle_type") = monsters::BattleType::WILD_ENCOUNTER)
        .def("resolve_turn", &monsters::BattleEngine::resolve_turn)
        .def("decide_enemy_action", &monsters::BattleEngine::decide_enemy_action)
        .def("compute_damage", &monsters::BattleEngine::compute_damage)
        .def("apply_action", &monsters::BattleEngine::apply_action)
        .def_static("check_termination", &monsters::BattleEngine::check_termination)
        .def("load_skill_catalog", &monsters::BattleEngine::load_skill_catalog)
        .def("load_config", &monsters::BattleEngine::load_config)
        .def("get_skill_catalog", py::overload_cast<>(&monsters::BattleEngine::get_skill_catalog),
             py::return_value_policy::reference_internal)
        .def("get_config", py::overload_cast<>(&monsters::BattleEngine::get_config),
             py::return_value_policy::reference_internal)
        .def("reseed", [](monsters::BattleEngine& engine, uint64_t seed) {
            engine.set_random_source(std::make_unique<monsters::Mt19937RandomSource>(seed));
        });

    py::class_<monsters::BattleSession>(m, "BattleSession")
        .def(py::init<const monsters::BattleEngine&, monsters::BattleState>(),
             py::keep_alive<1, 2>())
        .def("submit", py::overload_cast<const monsters::Action&>(&monsters::BattleSession::submit))
        .def("submit_both", py::overload_cast<const monsters::Action&, const monsters::Action&>(
             &monsters::BattleSession::submit))
        .def("state", &monsters::BattleSession::state, py::return_value_policy::reference_internal)
        .def("phase", &monsters::BattleSession::phase)
        .def("is_over", &monsters::BattleSession::is_over)
        .def("try_recruit", &monsters::BattleSession::try_recruit)
        .def("history", &monsters::BattleSession::history);

    // ========================================================================
    // RULES & SETTLEMENT
    // ========================================================================

    m.def("type_effectiveness", &monsters::type_effectiveness);
    m.def("calculate_flee_chance", &monsters::calculate_flee_chance,
          py::arg("fleeing_agility"), py::arg("opposing_agility"),
          py::arg("config") = monsters::BattleConfig{});
    m.def("capture_probability", [](const monsters::Monster& target, const monsters::ItemID& item) {
        return monsters::DefaultCaptureResolver().probability(target, item);
    });

    py::class_<monsters::BattleRewards>(m, "BattleRewards")
        .def_readonly("experience_per_monster", &monsters::BattleRewards::experience_per_monster)
        .def_readonly("gold", &monsters::BattleRewards::gold)
        .def_readonly("recipients", &monsters::BattleRewards::recipients);

    m.def("calculate_victory_rewards", &monsters::calculate_victory_rewards);
    m.def("apply_defeat_penalty", &monsters::apply_defeat_penalty);
    m.def("gold_after_defeat", &monsters::gold_after_defeat);
    m.def("recruitment_chance", &monsters::recruitment_chance);
    m.def("settle_captured_monster", &monsters::settle_captured_monster);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = monsters::get_version();
    m.attr("__version__") = monsters::get_version();
}
