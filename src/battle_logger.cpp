/**
 * Monster Battle Engine - Battle X-Ray Logger Implementation
 */

#include "battle_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace monsters {

namespace {

std::string timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

} // anonymous namespace

BattleLogger::BattleLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[BattleLogger] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    // Create timestamped log file
    std::ostringstream filename;
    filename << output_dir << "/xray_battle_" << timestamp("%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[BattleLogger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY BATTLE LOG - LINEAR STATE TRACE\n";
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[BattleLogger] Logging to: " << log_path_ << std::endl;
}

BattleLogger::~BattleLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string BattleLogger::format_monster_line(const Party& party, SlotIndex slot) const {
    const Monster* monster = party.at(slot);
    std::ostringstream line;

    std::string label = slot == party.active_slot ? "ACTIVE" : "RESERVE";
    line << label << " [" << slot << "]: ";

    if (!monster) {
        line << "(Empty)";
        return line.str();
    }

    line << monster->name << " (" << monster->id << ")";
    line << " | Lv " << monster->level << " " << to_string(monster->primary_type);
    if (monster->secondary_type.has_value()) {
        line << "/" << to_string(*monster->secondary_type);
    }
    line << " | HP: " << monster->current_hp() << "/" << monster->max_hp();
    line << " | MP: " << monster->current_mp() << "/" << monster->max_mp();

    if (party.is_defending(slot)) {
        line << " [DEFENDING]";
    }
    if (monster->is_fainted()) {
        line << " [FAINTED]";
    }
    return line.str();
}

std::string BattleLogger::format_action_description(const Action& action) const {
    std::ostringstream desc;

    desc << to_string(action.action_type) << " - slot " << action.actor_slot;

    if (action.skill_id.has_value()) {
        desc << " [" << *action.skill_id << "]";
    }
    if (action.item_id.has_value()) {
        desc << " {" << *action.item_id << "}";
    }
    if (action.priority != 0) {
        desc << " (priority " << action.priority << ")";
    }
    return desc.str();
}

void BattleLogger::log_action(int turn, const Action& action, const std::string& event) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << turn << " | SIDE: " << to_string(action.side)
              << "] ACTION: " << format_action_description(action) << "\n";
    log_file_ << "EVENT: " << (event.empty() ? "(no effect)" : event) << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    actions_logged_++;
    log_file_.flush();
}

void BattleLogger::log_party(const std::string& label, const Party& party) {
    log_file_ << "[" << label << "]\n";
    for (size_t i = 0; i < party.size(); i++) {
        log_file_ << format_monster_line(party, static_cast<SlotIndex>(i)) << "\n";
    }
}

void BattleLogger::log_state(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";

    log_party("PLAYER", state.party(Side::PLAYER));
    log_file_ << "\n";
    log_party("ENEMY", state.party(Side::ENEMY));

    // Global
    log_file_ << "\n[GLOBAL]\n";
    log_file_ << "Phase: " << to_string(state.phase)
              << " | Turn: " << state.turn
              << " | Wild: " << (state.is_wild_encounter ? "yes" : "no")
              << " | Flee: " << (state.can_flee ? "yes" : "no")
              << " | Capture: " << (state.can_capture ? "yes" : "no") << "\n";
    if (!state.last_event.empty()) {
        log_file_ << "Last event: " << state.last_event << "\n";
    }

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void BattleLogger::log_battle_end(const BattleState& state, const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "Outcome: " << to_string(state.phase) << "\n";
    log_file_ << "Turns: " << state.turn << "\n";
    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace monsters
