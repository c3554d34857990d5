/**
 * PokeBattle Engine - Legal Action Generator
 *
 * Enumerates the candidate actions of one side. Order is fixed:
 * moves in slot order, then tera / mega / zmove / dynamax variants,
 * then switches in bench order, then pass. Inapplicable candidates stay
 * in the list with `disabled` set and a reason.
 *
 * The result is never empty.
 */

#pragma once

#include "battle_state.hpp"
#include "effect_table.hpp"
#include "format_rules.hpp"

namespace pokebattle {

class LegalActionGenerator {
public:
    explicit LegalActionGenerator(const EffectTable& effects);

    std::vector<LegalAction> generate(const BattleState& state, SideID side,
                                      const FormatRules& rules) const;

    /**
     * Whether `action` matches an enabled candidate. By-id move actions
     * are matched against the slot holding that move.
     */
    bool is_legal(const BattleState& state, SideID side, const FormatRules& rules,
                  const Action& action) const;

    // Reason the move in `slot` cannot be used, or empty when usable
    std::string move_block_reason(const BattleState& state, SideID side, int slot) const;

private:
    const EffectTable& effects_;

    // ========================================================================
    // SUB-GENERATORS
    // ========================================================================

    void add_move_actions(const BattleState& state, SideID side,
                          std::vector<LegalAction>& out) const;
    void add_tera_actions(const BattleState& state, SideID side, const FormatRules& rules,
                          std::vector<LegalAction>& out) const;
    void add_mega_actions(const BattleState& state, SideID side, const FormatRules& rules,
                          std::vector<LegalAction>& out) const;
    void add_zmove_actions(const BattleState& state, SideID side, const FormatRules& rules,
                           std::vector<LegalAction>& out) const;
    void add_dynamax_actions(const BattleState& state, SideID side, const FormatRules& rules,
                             std::vector<LegalAction>& out) const;
    void add_switch_actions(const BattleState& state, SideID side, bool forced,
                            std::vector<LegalAction>& out) const;

    // Recharging or mid-charge: the Pokemon cannot choose freely this turn
    std::string locked_in_reason(const Pokemon& pokemon) const;
};

// Match `action` against candidates, mapping by-id moves to their slot
const LegalAction* find_candidate(const std::vector<LegalAction>& candidates,
                                  const Pokemon* active, const Action& action);

} // namespace pokebattle
