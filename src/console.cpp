/**
 * Monster Battle Engine - Interactive Battle Console
 *
 * Simple REPL for playing battles against the enemy decision policy.
 * Loads skills and tuning from data/ when present.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

#include "monster_battle.hpp"

using namespace monsters;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string hp_bar(const Monster& monster, int width = 20) {
    int filled = static_cast<int>(monster.hp_fraction() * width + 0.5);
    return "[" + std::string(filled, '#') + std::string(width - filled, '.') + "]";
}

// ============================================================================
// ROSTERS
// ============================================================================

std::vector<Monster> player_roster() {
    Monster sprout("ply_001", "Sproutling", 8, MonsterType::GRASS, 140, 30, {48, 42, 45, 55, 50});
    sprout.species_id = "sproutling";
    sprout.skills = {"tackle", "heal", "gust"};

    Monster pup("ply_002", "Cinderpup", 7, MonsterType::FIRE, 120, 35, {58, 38, 62, 60, 35});
    pup.species_id = "cinderpup";
    pup.skills = {"bite", "fireball"};

    return {sprout, pup};
}

std::vector<Monster> enemy_roster(BattleType type) {
    if (type == BattleType::BOSS_BATTLE) {
        Monster drake("boss_001", "Tidal Drake", 14, MonsterType::WATER, 320, 60, {70, 60, 50, 72, 65});
        drake.species_id = "tidal_drake";
        drake.skills = {"bite", "gust", "heal"};
        return {drake};
    }

    Monster slime("wild_001", "Gel Slime", 6, MonsterType::WATER, 110, 20, {40, 45, 38, 42, 40});
    slime.species_id = "gel_slime";
    slime.skills = {"tackle", "gust"};
    slime.capture_rate = 190;
    slime.is_wild = type == BattleType::WILD_ENCOUNTER;

    if (type == BattleType::TRAINER_BATTLE) {
        Monster bat("trn_002", "Dusk Bat", 7, MonsterType::FLYING, 95, 25, {52, 35, 70, 40, 38});
        bat.species_id = "dusk_bat";
        bat.skills = {"bite", "gust"};
        return {slime, bat};
    }
    return {slime};
}

std::optional<BattleType> parse_battle_type(const std::string& s) {
    if (s == "wild") return BattleType::WILD_ENCOUNTER;
    if (s == "trainer") return BattleType::TRAINER_BATTLE;
    if (s == "boss") return BattleType::BOSS_BATTLE;
    return std::nullopt;
}

// ============================================================================
// DISPLAY
// ============================================================================

void print_help() {
    std::cout << R"(
=== Monster Battle Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Battle Setup:
  new [wild|trainer|boss] - Start a new battle (default: wild)
  show                    - Show current battle state
  skills                  - List skills known by your active monster

Actions (one per turn):
  attack / a              - Basic attack
  skill <id>              - Use a skill (e.g. skill fireball)
  defend / d              - Take a defensive stance for this turn
  flee / f                - Try to run away
  capture [item]          - Throw a capture item (default: basic_capture)

Options:
  xray on|off             - Toggle the x-ray battle trace
  pace <ms>               - Pause between actions (0 disables)

Examples:
  new boss                # Fight the boss
  skill gust              # Use Gust
  capture great_capture   # Throw a great capture item
)" << std::endl;
}

void show_party(const std::string& label, const Party& party) {
    std::cout << "  " << label << ":" << std::endl;
    for (size_t i = 0; i < party.size(); i++) {
        SlotIndex slot = static_cast<SlotIndex>(i);
        const Monster* monster = party.at(slot);
        std::cout << "    " << (slot == party.active_slot ? "*" : " ")
                  << "[" << slot << "] " << monster->name
                  << " Lv" << monster->level
                  << " (" << to_string(monster->primary_type) << ") "
                  << hp_bar(*monster) << " "
                  << monster->current_hp() << "/" << monster->max_hp() << " HP, "
                  << monster->current_mp() << "/" << monster->max_mp() << " MP";
        if (party.is_defending(slot)) std::cout << " [DEFENDING]";
        if (monster->is_fainted()) std::cout << " [FAINTED]";
        std::cout << std::endl;
    }
}

void show_battle_state(const BattleState& state) {
    std::cout << "\n--- Turn " << state.turn << " (" << to_string(state.phase) << ") ---" << std::endl;
    show_party("Enemy", state.party(Side::ENEMY));
    show_party("You", state.party(Side::PLAYER));
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    BattleEngine engine;
    std::unique_ptr<BattleSession> session;
    std::unique_ptr<BattleLogger> xray_logger;
    std::string data_dir;
    int gold = 100;

    explicit Console(std::string data_directory)
        : data_dir(std::move(data_directory))
    {
        std::string skills_path = data_dir + "/skills.json";
        if (std::filesystem::exists(skills_path)) {
            if (!engine.load_skill_catalog(skills_path)) {
                std::cerr << "Warning: Failed to load skills, using built-in set." << std::endl;
            }
        }

        std::string config_path = data_dir + "/battle_config.json";
        if (std::filesystem::exists(config_path)) {
            if (!engine.load_config(config_path)) {
                std::cerr << "Warning: Failed to load battle config, using defaults." << std::endl;
            }
        }

        std::cout << "Skill catalog: " << engine.get_skill_catalog().skill_count() << " skills" << std::endl;
        engine.set_pacing(std::make_unique<SleepPacing>());
    }

    bool in_battle() const {
        return session && !session->is_over();
    }

    void cmd_new(const std::vector<std::string>& args) {
        BattleType type = BattleType::WILD_ENCOUNTER;
        if (args.size() > 1) {
            auto parsed = parse_battle_type(args[1]);
            if (!parsed) {
                std::cout << "Unknown battle type: '" << args[1] << "'" << std::endl;
                return;
            }
            type = *parsed;
        }

        auto state = engine.start_battle(player_roster(), enemy_roster(type), type);
        if (!state) {
            std::cout << "Failed to start battle." << std::endl;
            return;
        }

        session = std::make_unique<BattleSession>(engine, *state);
        const std::string& foe = state->active_monster(Side::ENEMY)->name;
        if (state->is_wild_encounter) {
            std::cout << state->last_event << " A wild " << foe << " appears!" << std::endl;
        } else {
            std::cout << state->last_event << " " << foe << " steps up to fight!" << std::endl;
        }
        show_battle_state(session->state());
    }

    void cmd_skills() {
        if (!session) {
            std::cout << "No battle. Type 'new' to start one." << std::endl;
            return;
        }
        const Monster* active = session->state().active_monster(Side::PLAYER);
        if (!active) return;

        std::cout << active->name << " knows:" << std::endl;
        for (const auto& id : active->skills) {
            const Skill* skill = engine.get_skill_catalog().get_skill(id);
            if (!skill) {
                std::cout << "  " << id << " (unknown)" << std::endl;
                continue;
            }
            std::cout << "  " << skill->id << " - " << skill->name
                      << " [" << to_string(skill->category) << ", "
                      << skill->mp_cost << " MP, power " << skill->power << "]";
            if (active->current_mp() < skill->mp_cost) {
                std::cout << " (not enough MP)";
            }
            std::cout << std::endl;
        }
    }

    void cmd_xray(const std::vector<std::string>& args) {
        bool enable = args.size() < 2 || args[1] == "on";
        if (enable) {
            xray_logger = std::make_unique<BattleLogger>("xrays");
            engine.set_logger(xray_logger->is_enabled() ? xray_logger.get() : nullptr);
        } else {
            engine.set_logger(nullptr);
            xray_logger.reset();
            std::cout << "X-ray trace off." << std::endl;
        }
    }

    void cmd_pace(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Pacing: " << engine.get_config().pacing_interval_ms << " ms" << std::endl;
            return;
        }
        try {
            int ms = std::stoi(args[1]);
            if (ms < 0) {
                std::cout << "Pacing must not be negative." << std::endl;
                return;
            }
            engine.get_config().pacing_interval_ms = ms;
        } catch (const std::exception&) {
            std::cout << "Invalid interval: '" << args[1] << "'" << std::endl;
        }
    }

    void submit(const Action& action) {
        if (!in_battle()) {
            std::cout << "No battle in progress. Type 'new' to start one." << std::endl;
            return;
        }

        TurnResult result = session->submit(action);
        for (const auto& event : result.events) {
            std::cout << "  " << event << std::endl;
        }
        if (result.events.empty()) {
            std::cout << "  Nothing happened." << std::endl;
        }

        show_battle_state(session->state());

        if (session->is_over()) {
            settle();
        }
    }

    void settle() {
        const BattleState& state = session->state();
        switch (state.phase) {
            case BattlePhase::VICTORY: {
                auto rewards = calculate_victory_rewards(state);
                if (rewards) {
                    gold += rewards->gold;
                    std::cout << "Each party monster gains " << rewards->experience_per_monster
                              << " EXP. Found " << rewards->gold << " gold." << std::endl;
                }
                const Monster* defeated = state.active_monster(Side::ENEMY);
                if (state.is_wild_encounter && defeated) {
                    std::cout << "Recruit chance: "
                              << static_cast<int>(recruitment_chance(*defeated) * 100) << "%" << std::endl;
                    auto recruit = session->try_recruit();
                    if (recruit) {
                        std::cout << recruit->name << " wants to join your party! It joins with "
                                  << recruit->current_hp() << " HP." << std::endl;
                    } else {
                        std::cout << defeated->name << " wanders off." << std::endl;
                    }
                }
                break;
            }
            case BattlePhase::DEFEAT:
                gold = gold_after_defeat(gold);
                std::cout << "You blacked out... " << gold << " gold left." << std::endl;
                break;
            case BattlePhase::CAPTURED: {
                auto captured = settle_captured_monster(state);
                if (captured) {
                    std::cout << captured->name << " joined your party with "
                              << captured->current_hp() << " HP!" << std::endl;
                }
                break;
            }
            case BattlePhase::ESCAPED:
                std::cout << "The battle is over." << std::endl;
                break;
            default:
                break;
        }
    }

    void run() {
        std::cout << "Monster Battle Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;

        cmd_new({"new"});

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];
            SlotIndex slot = session ? session->state().active_slot(Side::PLAYER) : 0;

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "new" || cmd == "reset") {
                cmd_new(args);
            } else if (cmd == "show" || cmd == "s") {
                if (session) show_battle_state(session->state());
            } else if (cmd == "skills") {
                cmd_skills();
            } else if (cmd == "attack" || cmd == "a") {
                submit(Action::attack(Side::PLAYER, slot));
            } else if (cmd == "skill") {
                if (args.size() < 2) {
                    std::cout << "Usage: skill <id>" << std::endl;
                    continue;
                }
                const Skill* skill = engine.get_skill_catalog().get_skill(args[1]);
                int priority = skill ? skill->priority : 0;
                submit(Action::use_skill(Side::PLAYER, slot, args[1], priority));
            } else if (cmd == "defend" || cmd == "d") {
                submit(Action::defend(Side::PLAYER, slot));
            } else if (cmd == "flee" || cmd == "f") {
                submit(Action::flee(Side::PLAYER, slot));
            } else if (cmd == "capture" || cmd == "c") {
                ItemID item = args.size() > 1 ? args[1] : "basic_capture";
                submit(Action::capture(Side::PLAYER, slot, item));
            } else if (cmd == "xray") {
                cmd_xray(args);
            } else if (cmd == "pace") {
                cmd_pace(args);
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    std::string data_dir = argc > 1 ? argv[1] : "data";
    Console console(data_dir);
    console.run();
    return 0;
}
