/**
 * PokeBattle Engine - Damage & Outcome Calculator
 *
 * Pure evaluation of candidate actions against a BattleState. Nothing here
 * mutates the state or draws from its RNG, so the same (state, action)
 * pair always yields the same CalcResult and a Calculator can be shared
 * across threads.
 *
 * Usage:
 *   Calculator calc(effects, dex);
 *   CalcResult r = calc.evaluate(state, 0, actions::move(0));
 *   if (r.error) { ... do not select ... }
 */

#pragma once

#include "battle_state.hpp"
#include "effect_table.hpp"
#include "errors.hpp"
#include "move_dex.hpp"
#include <array>

namespace pokebattle {

// ============================================================================
// RESULT TYPES
// ============================================================================

// Percentages of the defender's max HP
struct DamageRange {
    double min_percent = 0.0;
    double max_percent = 0.0;
    double avg_percent = 0.0;
};

/**
 * SpeedCheck - Turn order between our active (or incoming) Pokemon and
 * the opposing active.
 *
 * `speed_diff` is signed in acting order: positive means we act first,
 * so under Trick Room it is their speed minus ours. A tie is never
 * `faster` and always has speed_diff 0.
 */
struct SpeedCheck {
    bool faster = false;
    int speed_diff = 0;
    bool tie = false;
    int our_speed = 0;
    int their_speed = 0;
};

/**
 * BeliefContext - Read-only guesses about the opposing active supplied by
 * the policy layer. Unset fields fall back to what the state shows.
 */
struct BeliefContext {
    std::optional<ItemID> opponent_item;
    std::optional<AbilityID> opponent_ability;
    std::optional<int> opponent_speed;
};

/**
 * CalcResult - One row per evaluated action.
 *
 * An error result has accuracy 0, expected_survival 0 and expected_gain 0
 * and must never be selected.
 */
struct CalcResult {
    Action action = PassAction{};

    bool error = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;

    DamageRange damage;
    double accuracy = 0.0;
    double ohko_prob = 0.0;
    double twohko_prob = 0.0;
    SpeedCheck speed_check;
    double hazard_damage = 0.0;          // % of the incoming Pokemon's max HP
    double expected_survival = 0.0;
    double expected_gain = 0.0;
    int priority = 0;
    double effectiveness = 1.0;
    double status_chance = 0.0;

    // Only set for tera actions
    double tera_offense_delta = 0.0;
    double tera_defense_delta = 0.0;
};

struct DamageOptions {
    bool crit = false;
};

/**
 * DamageRolls - The 16 possible damage values of one hit, lowest first.
 */
struct DamageRolls {
    std::array<int, NUM_ROLLS> rolls{};
    PokeType move_type = PokeType::TYPELESS;
    double effectiveness = 1.0;
    bool immune = false;
    int power = 0;                       // base power after modifiers

    int min() const { return rolls.front(); }
    int max() const { return rolls.back(); }
    double average() const;
};

// ============================================================================
// CALCULATOR
// ============================================================================

class Calculator {
public:
    Calculator(const EffectTable& effects, const MoveDex& dex);

    /**
     * Evaluate one candidate action for `side`.
     *
     * InvalidAction and MissingEntity are caught and returned as error
     * results; anything else propagates.
     */
    CalcResult evaluate(const BattleState& state, SideID side, const Action& action,
                        const BeliefContext* belief = nullptr) const;

    // Never aborts: each action gets its own (possibly error) result
    std::vector<CalcResult> evaluate_all(const BattleState& state, SideID side,
                                         const std::vector<Action>& actions,
                                         const BeliefContext* belief = nullptr) const;

    /**
     * Damage the active of `attacker_side` would deal to the opposing
     * active with `move`. Throws MissingEntity if either active is absent.
     */
    DamageRolls damage_rolls(const BattleState& state, SideID attacker_side, const Move& move,
                             const DamageOptions& options = DamageOptions{}) const;

    // Hit chance in [0, 1] of `move` used by the active of `attacker_side`
    double accuracy(const BattleState& state, SideID attacker_side, const Move& move) const;

    /**
     * Compare `ours` (the side's active when null) against the opposing
     * active. `belief` may override the opponent's speed.
     */
    SpeedCheck speed_check(const BattleState& state, SideID side, const Pokemon* ours = nullptr,
                           const BeliefContext* belief = nullptr) const;

    // Hazard damage in % of max HP for the bench Pokemon at `bench_index`
    double hazard_damage(const BattleState& state, SideID side, int bench_index) const;

    // Chance that `move` inflicts a primary status on the opposing active
    double status_chance(const BattleState& state, SideID attacker_side, const Move& move) const;

    /**
     * Resolve the move an action would use (slot, by-id, Struggle,
     * Z/Max conversion). Throws InvalidAction for unknown moves or slots.
     */
    Move resolve_move(const BattleState& state, SideID side, const Action& action) const;

private:
    const EffectTable& effects_;
    const MoveDex& dex_;

    struct Threat {
        bool exists = false;
        DamageRolls rolls;
        double accuracy = 0.0;
        int priority = 0;
        double avg_percent = 0.0;
    };

    CalcResult evaluate_move(const BattleState& state, SideID side, const Move& move,
                             const BeliefContext* belief) const;
    CalcResult evaluate_switch(const BattleState& state, SideID side, int bench_index,
                               const BeliefContext* belief) const;
    CalcResult evaluate_pass(const BattleState& state, SideID side,
                             const BeliefContext* belief) const;

    // Opponent's best expected-damage reply against our current active
    Threat strongest_threat(const BattleState& state, SideID side) const;

    double survive_chance(const BattleState& state, SideID side, const Threat& threat,
                          int hp_before_hit, double p_opponent_acts) const;

    void fill_tera_deltas(const BattleState& before, const BattleState& after,
                          SideID side, CalcResult& result) const;

    static CalcResult make_error(const Action& action, const EngineError& e);
};

// Fraction of the 16 rolls that reach `hp`. `survive_at_one` turns a KO
// from full HP into 1 HP left.
double ko_fraction(const DamageRolls& rolls, int hp, bool survive_at_one);

// Fraction of the 256 roll pairs whose two hits knock out `hp`
double two_hit_ko_fraction(const DamageRolls& rolls, int hp, bool survive_at_one);

} // namespace pokebattle
