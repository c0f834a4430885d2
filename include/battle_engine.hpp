/**
 * Monster Battle Engine - Main Engine Interface
 *
 * This is the primary interface for the battle resolver.
 * Provides start_battle(), resolve_turn() and decide_enemy_action().
 */

#pragma once

#include "battle_state.hpp"
#include "action.hpp"
#include "skill_catalog.hpp"
#include "battle_config.hpp"
#include "random_source.hpp"
#include "capture.hpp"
#include "pacing.hpp"
#include "action_executor.hpp"
#include <memory>

namespace monsters {

class BattleLogger;

/**
 * Outcome of one full turn.
 */
struct TurnResult {
    BattleState state;
    std::vector<std::string> events;
};

/**
 * BattleEngine - The battle state machine.
 *
 * Phases: SELECTING -> RESOLVING -> SELECTING (next turn), or
 * RESOLVING -> VICTORY / DEFEAT / CAPTURED / ESCAPED.
 *
 * The engine itself holds no battle state; every call takes a state and
 * returns a new one. Not thread-safe: the random source is shared.
 */
class BattleEngine {
public:
    /**
     * Default skill catalog, time-seeded random source, default capture
     * formula, no pacing.
     */
    BattleEngine();

    /**
     * Same defaults with a fixed seed (reproducible battles).
     */
    explicit BattleEngine(uint64_t seed);

    ~BattleEngine();

    BattleEngine(const BattleEngine&) = delete;
    BattleEngine& operator=(const BattleEngine&) = delete;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Create the initial state for a battle.
     *
     * Rejects an empty party on either side (returns nullopt).
     * Wild encounters allow flee and capture, trainer battles allow flee
     * only, boss battles allow neither.
     */
    std::optional<BattleState> start_battle(const std::vector<Monster>& player_party,
                                            const std::vector<Monster>& enemy_party,
                                            BattleType battle_type = BattleType::WILD_ENCOUNTER) const;

    /**
     * Resolve one full turn.
     *
     * Returns the state unchanged (and no events) unless the phase is
     * SELECTING. Action sides are forced to PLAYER / ENEMY.
     */
    TurnResult resolve_turn(const BattleState& state,
                            const Action& player_action,
                            const Action& enemy_action) const;

    /**
     * Action chosen by the enemy decision policy for the current state.
     */
    Action decide_enemy_action(const BattleState& state) const;

    /**
     * Damage of a single hit using the engine's random source and config.
     */
    int compute_damage(const Monster& attacker,
                       const Monster& defender,
                       const Skill& skill,
                       bool is_physical) const;

    /**
     * Apply a single action outside of a full turn (no termination check).
     */
    StepResult apply_action(const BattleState& state, const Action& action) const;

    /**
     * Terminal phase implied by party HP, if any.
     *
     * Player exhaustion is checked first, so a simultaneous wipe-out of
     * both sides resolves to DEFEAT.
     */
    static std::optional<BattlePhase> check_termination(const BattleState& state);

    // ========================================================================
    // COLLABORATORS
    // ========================================================================

    const SkillCatalog& get_skill_catalog() const { return skill_catalog_; }
    SkillCatalog& get_skill_catalog() { return skill_catalog_; }

    bool load_skill_catalog(const std::string& filepath) {
        return skill_catalog_.load_from_json(filepath);
    }

    const BattleConfig& get_config() const { return config_; }
    BattleConfig& get_config() { return config_; }

    bool load_config(const std::string& filepath) {
        return config_.load_from_json(filepath);
    }

    RandomSource& get_random_source() const { return *random_; }
    void set_random_source(std::unique_ptr<RandomSource> random);

    const CaptureResolver& get_capture_resolver() const { return *capture_resolver_; }
    void set_capture_resolver(std::unique_ptr<CaptureResolver> resolver);

    void set_pacing(std::unique_ptr<PacingScheduler> pacing);

    /**
     * Attach a trace logger (not owned; nullptr detaches).
     */
    void set_logger(BattleLogger* logger) { logger_ = logger; }

private:
    SkillCatalog skill_catalog_;
    BattleConfig config_;
    std::unique_ptr<RandomSource> random_;
    std::unique_ptr<CaptureResolver> capture_resolver_;
    std::unique_ptr<PacingScheduler> pacing_;
    BattleLogger* logger_ = nullptr;

    void pause() const;

    /**
     * Non-terminal end of turn: clear defend stances, promote replacements,
     * pause, back to SELECTING with turn + 1.
     */
    void finish_turn(BattleState& state, std::vector<std::string>& events) const;

    /**
     * If the side's active monster fainted, the first living member takes
     * its place.
     */
    void promote_next_active(BattleState& state, Side side, std::vector<std::string>& events) const;
};

} // namespace monsters
