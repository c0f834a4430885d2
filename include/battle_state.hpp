/**
 * Monster Battle Engine - Battle State
 *
 * The complete battle snapshot. A plain value: every engine step returns a
 * new BattleState and never mutates the caller's copy.
 */

#pragma once

#include "monster.hpp"
#include <array>

namespace monsters {

/**
 * Party - one side's combatants.
 *
 * Members keep their slot for the whole battle; the member list is never
 * reordered or resized once the battle starts.
 */
struct Party {
    std::vector<Monster> members;
    SlotIndex active_slot = 0;

    // Defend stance per slot, cleared at the end of each turn
    std::vector<bool> defending;

    Party() = default;

    explicit Party(std::vector<Monster> party_members)
        : members(std::move(party_members))
        , defending(members.size(), false)
    {}

    size_t size() const { return members.size(); }

    bool is_valid_slot(SlotIndex slot) const {
        return slot >= 0 && slot < static_cast<SlotIndex>(members.size());
    }

    Monster* at(SlotIndex slot) {
        return is_valid_slot(slot) ? &members[slot] : nullptr;
    }

    const Monster* at(SlotIndex slot) const {
        return is_valid_slot(slot) ? &members[slot] : nullptr;
    }

    Monster* active() { return at(active_slot); }
    const Monster* active() const { return at(active_slot); }

    bool is_defending(SlotIndex slot) const {
        return is_valid_slot(slot) && static_cast<size_t>(slot) < defending.size() && defending[slot];
    }

    void set_defending(SlotIndex slot, bool value) {
        if (!is_valid_slot(slot)) return;
        if (defending.size() < members.size()) {
            defending.resize(members.size(), false);
        }
        defending[slot] = value;
    }

    void clear_defending() {
        defending.assign(members.size(), false);
    }

    /**
     * True when every member has 0 HP (an empty party counts as exhausted).
     */
    bool all_fainted() const {
        for (const auto& member : members) {
            if (!member.is_fainted()) return false;
        }
        return true;
    }

    /**
     * Slots of members with HP > 0, in slot order.
     */
    std::vector<SlotIndex> living_slots() const {
        std::vector<SlotIndex> slots;
        for (size_t i = 0; i < members.size(); ++i) {
            if (!members[i].is_fainted()) {
                slots.push_back(static_cast<SlotIndex>(i));
            }
        }
        return slots;
    }

    bool operator==(const Party& other) const {
        return members == other.members
            && active_slot == other.active_slot
            && defending == other.defending;
    }

    bool operator!=(const Party& other) const {
        return !(*this == other);
    }
};

/**
 * BattleState - The complete battle snapshot.
 */
struct BattleState {
    // Parties indexed by Side (PLAYER = 0, ENEMY = 1)
    std::array<Party, 2> parties;

    BattlePhase phase = BattlePhase::SELECTING;
    int turn = 1;
    std::string last_event;

    // Battle-mode flags
    bool is_wild_encounter = false;
    bool can_flee = true;
    bool can_capture = false;

    // ========================================================================
    // PARTY ACCESS
    // ========================================================================

    Party& party(Side side) { return parties[side_index(side)]; }
    const Party& party(Side side) const { return parties[side_index(side)]; }

    Monster* monster_at(Side side, SlotIndex slot) { return party(side).at(slot); }
    const Monster* monster_at(Side side, SlotIndex slot) const { return party(side).at(slot); }

    Monster* active_monster(Side side) { return party(side).active(); }
    const Monster* active_monster(Side side) const { return party(side).active(); }

    SlotIndex active_slot(Side side) const { return party(side).active_slot; }

    // ========================================================================
    // STATUS
    // ========================================================================

    bool is_side_exhausted(Side side) const { return party(side).all_fainted(); }

    bool is_over() const { return is_terminal(phase); }

    bool operator==(const BattleState& other) const {
        return parties == other.parties
            && phase == other.phase
            && turn == other.turn
            && last_event == other.last_event
            && is_wild_encounter == other.is_wild_encounter
            && can_flee == other.can_flee
            && can_capture == other.can_capture;
    }

    bool operator!=(const BattleState& other) const {
        return !(*this == other);
    }
};

} // namespace monsters
