/**
 * PokeBattle Engine - Status/Field Effect State Machine
 *
 * Transition rules for primary status, volatiles, stat stages, hazards,
 * screens, side conditions, weather and terrain. Every function mutates
 * the given BattleState and appends what it did to the battle log.
 *
 * End-of-turn order is fixed:
 *   weather damage -> weather decay -> grassy heal -> status residuals
 *   -> volatiles (leech seed, partial trap, perish) -> items
 *   -> abilities -> counter decay
 */

#pragma once

#include "battle_state.hpp"
#include "effect_table.hpp"
#include "format_rules.hpp"

namespace pokebattle {
namespace conditions {

// ============================================================================
// HP CHANGES
// ============================================================================

// Damage the side's active, logging it under `source`. Returns HP lost.
int deal_damage(BattleState& state, SideID side, int amount, const std::string& source);

// Heal the side's active, logging it under `source`. Returns HP restored.
int heal(BattleState& state, SideID side, int amount, const std::string& source);

// ============================================================================
// PRIMARY STATUS
// ============================================================================

/**
 * Inflict a primary status on the side's active.
 *
 * Fails (returns false) when the target already has a status, is immune
 * by type, ability or terrain, or when the sleep clause forbids it.
 * Sleep lasts 1-3 turns; toxic starts its counter at 1.
 */
bool try_set_status(const EffectTable& table, const FormatRules& rules, BattleState& state,
                    SideID target_side, StatusCondition status, bool from_opponent,
                    bool ability_suppressed = false);

void cure_status(BattleState& state, SideID side, const std::string& source);

// ============================================================================
// VOLATILES AND STAGES
// ============================================================================

/**
 * Add a volatile to the side's active with its standard duration.
 * Encore and Disable lock the target's last move and fail without one.
 * Returns false if the volatile is already present or cannot apply.
 */
bool try_add_volatile(const EffectTable& table, BattleState& state, SideID side,
                      VolatileKind kind, SideID source_side);

/**
 * Change a stat stage. Drops caused by the opponent are blocked by
 * BLOCK_STAT_DROP holders. Returns the change actually applied.
 */
int apply_boost(const EffectTable& table, BattleState& state, SideID side, Stat stat, int stages,
                bool from_opponent, bool ability_suppressed = false);

// ============================================================================
// FIELD
// ============================================================================

// Both fail (return false) when the same weather/terrain is already up
bool set_weather(BattleState& state, Weather weather, int turns, bool permanent, int source_side);
bool set_terrain(BattleState& state, Terrain terrain, int turns, bool permanent, int source_side);

/**
 * Set a side condition for `turns`. A room that is already up on either
 * side is removed instead; Tailwind and Gravity fail while active.
 * Returns false when nothing changed.
 */
bool toggle_side_condition(BattleState& state, SideID side, SideConditionKind kind, int turns);

int side_condition_duration(SideConditionKind kind);

// ============================================================================
// SWITCHING
// ============================================================================

// Switch-out abilities, dynamax reversion, volatile and boost reset
void on_switch_out(const EffectTable& table, BattleState& state, SideID side);

// Entry hazards for the side's freshly switched-in active
void apply_entry_hazards(const EffectTable& table, const FormatRules& rules, BattleState& state, SideID side);

// Intimidate, weather and terrain setters
void apply_switch_in_abilities(const EffectTable& table, BattleState& state, SideID side);

// ============================================================================
// BEFORE MOVE
// ============================================================================

enum class BeforeMoveOutcome : uint8_t {
    ACT,
    SKIP,
    CONFUSION_SELF_HIT
};

/**
 * Status and volatile checks before the active uses `move`: sleep
 * countdown and wake roll, freeze thaw, flinch, confusion countdown and
 * self-hit roll, full paralysis.
 */
BeforeMoveOutcome before_move(BattleState& state, SideID side, const Move& move);

// 40 BP typeless physical hit on itself using roll index [0, 16)
int confusion_damage(const Pokemon& pokemon, int roll_index);

// ============================================================================
// END OF TURN
// ============================================================================

void end_of_turn(const EffectTable& table, BattleState& state);

// Individual end-of-turn stages, in order
void weather_damage(const EffectTable& table, BattleState& state);
void weather_decay(BattleState& state);
void grassy_heal(const EffectTable& table, BattleState& state);
void status_residuals(const EffectTable& table, BattleState& state);
void volatile_residuals(const EffectTable& table, BattleState& state);
void item_residuals(const EffectTable& table, BattleState& state);
void ability_residuals(const EffectTable& table, BattleState& state);
void decay_counters(const EffectTable& table, BattleState& state);

} // namespace conditions
} // namespace pokebattle
