/**
 * Monster Battle Engine - Engine Implementation
 *
 * Battle start, full-turn resolution and termination.
 */

#include "battle_engine.hpp"
#include "battle_logger.hpp"
#include "enemy_policy.hpp"
#include "turn_order.hpp"
#include "damage.hpp"
#include <iostream>

namespace monsters {

BattleEngine::BattleEngine()
    : skill_catalog_(SkillCatalog::with_default_skills())
    , random_(std::make_unique<Mt19937RandomSource>())
    , capture_resolver_(std::make_unique<DefaultCaptureResolver>())
    , pacing_(std::make_unique<NullPacing>())
{}

BattleEngine::BattleEngine(uint64_t seed)
    : skill_catalog_(SkillCatalog::with_default_skills())
    , random_(std::make_unique<Mt19937RandomSource>(seed))
    , capture_resolver_(std::make_unique<DefaultCaptureResolver>())
    , pacing_(std::make_unique<NullPacing>())
{}

BattleEngine::~BattleEngine() = default;

void BattleEngine::set_random_source(std::unique_ptr<RandomSource> random) {
    if (random) {
        random_ = std::move(random);
    }
}

void BattleEngine::set_capture_resolver(std::unique_ptr<CaptureResolver> resolver) {
    if (resolver) {
        capture_resolver_ = std::move(resolver);
    }
}

void BattleEngine::set_pacing(std::unique_ptr<PacingScheduler> pacing) {
    pacing_ = pacing ? std::move(pacing) : std::make_unique<NullPacing>();
}

// ============================================================================
// BATTLE START
// ============================================================================

std::optional<BattleState> BattleEngine::start_battle(const std::vector<Monster>& player_party,
                                                      const std::vector<Monster>& enemy_party,
                                                      BattleType battle_type) const {
    if (player_party.empty()) {
        std::cerr << "[BattleEngine] Player party cannot be empty" << std::endl;
        return std::nullopt;
    }
    if (enemy_party.empty()) {
        std::cerr << "[BattleEngine] Enemy party cannot be empty" << std::endl;
        return std::nullopt;
    }

    BattleState state;
    state.parties[side_index(Side::PLAYER)] = Party(player_party);
    state.parties[side_index(Side::ENEMY)] = Party(enemy_party);
    state.phase = BattlePhase::SELECTING;
    state.turn = 1;
    state.last_event = "Battle started!";

    state.is_wild_encounter = battle_type == BattleType::WILD_ENCOUNTER;
    state.can_flee = battle_type == BattleType::WILD_ENCOUNTER
                  || battle_type == BattleType::TRAINER_BATTLE;
    state.can_capture = battle_type == BattleType::WILD_ENCOUNTER;

    // Lead with the first member able to fight
    for (Side side : {Side::PLAYER, Side::ENEMY}) {
        auto living = state.party(side).living_slots();
        if (!living.empty()) {
            state.party(side).active_slot = living.front();
        }
    }

    if (logger_) {
        logger_->log_state(state);
    }
    return state;
}

// ============================================================================
// TURN RESOLUTION
// ============================================================================

TurnResult BattleEngine::resolve_turn(const BattleState& state,
                                      const Action& player_action,
                                      const Action& enemy_action) const {
    if (state.phase != BattlePhase::SELECTING) {
        return TurnResult{state, {}};
    }

    BattleState current = state;
    current.phase = BattlePhase::RESOLVING;

    Action player = player_action;
    player.side = Side::PLAYER;
    Action enemy = enemy_action;
    enemy.side = Side::ENEMY;

    std::vector<Action> ordered = order_actions(current, {player, enemy});

    ActionExecutor executor(skill_catalog_, *capture_resolver_, *random_, config_);
    std::vector<std::string> events;

    for (size_t i = 0; i < ordered.size(); ++i) {
        const Action& action = ordered[i];

        // Pacing separates applied actions; never before the first
        if (i > 0) {
            pause();
        }

        StepResult step = executor.apply(current, action);
        current = std::move(step.state);
        if (step.event.has_value()) {
            events.push_back(*step.event);
        }

        if (logger_) {
            logger_->log_action(current.turn, action, step.event.value_or(""));
            logger_->log_state(current);
        }

        // Capture / escape end the battle immediately
        if (current.phase == BattlePhase::CAPTURED || current.phase == BattlePhase::ESCAPED) {
            break;
        }

        auto outcome = check_termination(current);
        if (outcome.has_value()) {
            current.phase = *outcome;
            std::string message = *outcome == BattlePhase::VICTORY
                ? "All enemies were defeated! Victory!"
                : "Your party has been defeated...";
            current.last_event = message;
            events.push_back(message);
            break;
        }
    }

    if (is_terminal(current.phase)) {
        if (logger_) {
            logger_->log_battle_end(current, current.last_event);
        }
    } else {
        finish_turn(current, events);
    }

    return TurnResult{std::move(current), std::move(events)};
}

void BattleEngine::finish_turn(BattleState& state, std::vector<std::string>& events) const {
    for (auto& party : state.parties) {
        party.clear_defending();
    }

    promote_next_active(state, Side::PLAYER, events);
    promote_next_active(state, Side::ENEMY, events);

    pause();

    state.phase = BattlePhase::SELECTING;
    state.turn += 1;
}

void BattleEngine::promote_next_active(BattleState& state, Side side,
                                       std::vector<std::string>& events) const {
    Party& party = state.party(side);
    const Monster* active = party.active();
    if (active && !active->is_fainted()) {
        return;
    }

    auto living = party.living_slots();
    if (living.empty()) {
        return;
    }

    party.active_slot = living.front();
    std::string message = party.active()->name + " steps forward!";
    state.last_event = message;
    events.push_back(message);
}

std::optional<BattlePhase> BattleEngine::check_termination(const BattleState& state) {
    if (state.is_side_exhausted(Side::PLAYER)) {
        return BattlePhase::DEFEAT;
    }
    if (state.is_side_exhausted(Side::ENEMY)) {
        return BattlePhase::VICTORY;
    }
    return std::nullopt;
}

void BattleEngine::pause() const {
    pacing_->pause(std::chrono::milliseconds(config_.pacing_interval_ms));
}

// ============================================================================
// SINGLE STEPS
// ============================================================================

StepResult BattleEngine::apply_action(const BattleState& state, const Action& action) const {
    ActionExecutor executor(skill_catalog_, *capture_resolver_, *random_, config_);
    return executor.apply(state, action);
}

Action BattleEngine::decide_enemy_action(const BattleState& state) const {
    EnemyPolicy policy(skill_catalog_, *random_, config_.enemy_ai);
    return policy.decide(state);
}

int BattleEngine::compute_damage(const Monster& attacker,
                                 const Monster& defender,
                                 const Skill& skill,
                                 bool is_physical) const {
    return calculate_damage(attacker, defender, skill, is_physical, *random_, config_);
}

} // namespace monsters
