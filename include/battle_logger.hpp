/**
 * Monster Battle Engine - Battle X-Ray Logger
 *
 * Complete battle state visibility for debugging.
 * Logs every applied action followed by a full snapshot of both parties,
 * so HP/MP changes can be traced action by action.
 */

#pragma once

#include "battle_state.hpp"
#include "action.hpp"
#include <string>
#include <fstream>

namespace monsters {

/**
 * BattleLogger - linear trace of a battle.
 */
class BattleLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files (default: xrays)
     */
    explicit BattleLogger(const std::string& output_dir = "xrays");

    ~BattleLogger();

    BattleLogger(const BattleLogger&) = delete;
    BattleLogger& operator=(const BattleLogger&) = delete;

    /**
     * Log an applied action and the event it produced.
     *
     * @param turn Turn number the action belongs to
     * @param action Action being applied
     * @param event Event text (empty for silent no-ops)
     */
    void log_action(int turn, const Action& action, const std::string& event);

    /**
     * Log complete battle snapshot (both parties, phase, turn).
     */
    void log_state(const BattleState& state);

    /**
     * Log battle end result.
     */
    void log_battle_end(const BattleState& state, const std::string& reason);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

    /**
     * Number of action blocks written so far.
     */
    int actions_logged() const { return actions_logged_; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;
    int actions_logged_ = 0;

    /**
     * Format a monster line:
     * "ACTIVE [0]: Gel Slime (mon_001) | Lv 5 Normal | HP: 80/120 | MP: 30/40 [DEFENDING]"
     */
    std::string format_monster_line(const Party& party, SlotIndex slot) const;

    std::string format_action_description(const Action& action) const;

    void log_party(const std::string& label, const Party& party);
};

} // namespace monsters
