/**
 * PokeBattle Engine - Main Engine Interface
 *
 * This is the primary interface for the battle engine.
 * Provides get_legal_actions(), evaluate() and advance().
 *
 * Thread-safe after construction: every public operation is const and
 * each battle owns its RNG inside the BattleState, so one engine can
 * serve many battles in parallel.
 */

#pragma once

#include "battle_state.hpp"
#include "calculator.hpp"
#include "effect_table.hpp"
#include "format_rules.hpp"
#include "legal_actions.hpp"
#include "move_dex.hpp"

namespace pokebattle {

/**
 * EngineConfig - Data paths and defaults.
 *
 * Loadable from JSON:
 *   {"moves": "data/moves.json", "formats": "data/formats.json",
 *    "effects": "", "default_seed": 42, "check_invariants": true,
 *    "trace": {"enabled": false, "dir": "logs"}}
 */
struct EngineConfig {
    std::string moves_path;
    std::string formats_path;
    std::string effects_path;            // extra ability/item rows, optional
    uint64_t default_seed = 0;
    bool check_invariants = true;
    bool trace_enabled = false;
    std::string trace_dir = "logs";

    bool load_from_json(const std::string& filepath);
};

/**
 * AdvanceResult - Next state plus the log entries this advance appended.
 *
 * `stage` is ADVANCED for a full turn. Forced-switch advances stop at
 * RESOLVING; a turn that ends the battle stops where the last Pokemon fell.
 */
struct AdvanceResult {
    BattleState state;
    std::vector<LogEntry> log;
    TurnStage stage = TurnStage::QUEUED;
};

class BattleEngine {
public:
    BattleEngine();
    explicit BattleEngine(const EngineConfig& config);
    ~BattleEngine() = default;

    BattleEngine(const BattleEngine&) = delete;
    BattleEngine& operator=(const BattleEngine&) = delete;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Get all candidate actions for `side`, disabled ones included.
     * Throws UnsupportedFormat for an unknown format id.
     */
    std::vector<LegalAction> get_legal_actions(const BattleState& state, SideID side) const;

    /**
     * Evaluate candidate actions for `side`. Never aborts on a bad
     * candidate: each gets its own (possibly error) result.
     * Throws UnsupportedFormat before any evaluation.
     */
    std::vector<CalcResult> evaluate(const BattleState& state, SideID side,
                                     const std::vector<Action>& actions,
                                     const BeliefContext* belief = nullptr) const;

    /**
     * Resolve one turn with both sides' choices.
     *
     * Clones the state, applies the turn and returns it. The original
     * state is not modified. Throws InvalidAction for an illegal choice
     * or a finished battle.
     */
    AdvanceResult advance(const BattleState& state, const Action& side0, const Action& side1) const;

    /**
     * Resolve one turn in-place. Returns the last stage reached.
     */
    TurnStage advance_inplace(BattleState& state, const Action& side0, const Action& side1) const;

    // ========================================================================
    // BATTLE SETUP
    // ========================================================================

    /**
     * Create a battle from two teams in team-preview order (index 0 leads).
     * Throws UnsupportedFormat, or InvalidAction for an empty/oversized
     * team or a species clause violation.
     */
    BattleState create_battle(const FormatID& format_id,
                              std::vector<Pokemon> team0,
                              std::vector<Pokemon> team1,
                              std::optional<uint64_t> seed = std::nullopt) const;

    // ========================================================================
    // INVARIANTS
    // ========================================================================

    // Throws StateInvariantViolation on the first broken invariant
    void check_invariants(const BattleState& state) const;

    // ========================================================================
    // DATA ACCESS
    // ========================================================================

    // Data is loaded once, from the EngineConfig paths at construction.
    // There are no mutators, so a constructed engine can be shared across threads.

    const MoveDex& get_move_dex() const { return dex_; }
    const FormatRegistry& get_formats() const { return formats_; }
    const EffectTable& get_effect_table() const { return effects_; }
    const Calculator& get_calculator() const { return calculator_; }
    const EngineConfig& get_config() const { return config_; }

    // Throws UnsupportedFormat
    const FormatRules& require_format(const FormatID& id) const { return formats_.require(id); }

private:
    EngineConfig config_;
    EffectTable effects_;
    MoveDex dex_;
    FormatRegistry formats_;
    Calculator calculator_;
    LegalActionGenerator generator_;

    struct QueuedAction {
        SideID side = 0;
        Action action;
        bool is_switch = false;
        int priority = 0;
        int speed = 0;
    };

    // ========================================================================
    // TURN PHASES
    // ========================================================================

    void validate_choice(const BattleState& state, SideID side, const FormatRules& rules,
                         const Action& action) const;

    void resolve_forced_switches(BattleState& state, const FormatRules& rules,
                                 const std::array<Action, 2>& choices) const;

    std::vector<QueuedAction> build_queue(BattleState& state, const std::array<Action, 2>& choices) const;
    void sort_queue(BattleState& state, std::vector<QueuedAction>& queue) const;

    void apply_transformation(BattleState& state, SideID side, const Action& action) const;

    // ========================================================================
    // ACTION APPLICATION
    // ========================================================================

    void apply_switch(BattleState& state, SideID side, int bench_index,
                      const FormatRules& rules, bool forced) const;
    void apply_pass(BattleState& state, SideID side) const;
    void apply_move(BattleState& state, SideID side, const Action& action,
                    const FormatRules& rules) const;

    // Damage step of a damaging move; returns HP dealt, or -1 when the target was immune
    int apply_damaging_hit(BattleState& state, SideID side, const Move& move) const;

    void apply_secondaries(BattleState& state, SideID side, const Move& move,
                           const FormatRules& rules, int damage_dealt) const;
    void apply_secondary(BattleState& state, SideID side, const Move& move,
                         const Secondary& sec, const FormatRules& rules,
                         int damage_dealt) const;

    // Sitrus Berry style heals after taking a hit
    void check_damage_items(BattleState& state, SideID side) const;

    // ========================================================================
    // FAINTS AND WIN CONDITION
    // ========================================================================

    void process_faints(BattleState& state) const;
    void check_win_conditions(BattleState& state) const;
};

} // namespace pokebattle
