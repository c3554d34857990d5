/**
 * PokeBattle Engine - Serialization
 *
 * BattleState <-> JSON document (nlohmann/json). The document carries the
 * full mt19937 engine state, so a saved battle replays identically after
 * loading. Moves are written inline; on load a move given only by id is
 * looked up in the MoveDex.
 *
 * Malformed documents raise nlohmann::json exceptions or
 * std::invalid_argument (bad enum strings); unknown move ids raise
 * MissingEntity. The file helpers report failures on stderr instead.
 */

#pragma once

#include "battle_state.hpp"
#include "calculator.hpp"
#include "move_dex.hpp"
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {
namespace serialization {

// ============================================================================
// ENTITIES
// ============================================================================

nlohmann::json move_to_json(const Move& move);

nlohmann::json pokemon_to_json(const Pokemon& pokemon);
Pokemon pokemon_from_json(const nlohmann::json& j, const MoveDex* dex);

nlohmann::json side_to_json(const Side& side);
Side side_from_json(const nlohmann::json& j, const MoveDex* dex);

nlohmann::json field_to_json(const Field& field);
Field field_from_json(const nlohmann::json& j);

// ============================================================================
// BATTLE STATE
// ============================================================================

nlohmann::json battle_state_to_json(const BattleState& state);
BattleState battle_state_from_json(const nlohmann::json& j, const MoveDex* dex = nullptr);

std::string dump_battle_state(const BattleState& state, int indent = -1);
BattleState parse_battle_state(const std::string& text, const MoveDex* dex = nullptr);

bool save_battle_state(const BattleState& state, const std::string& filepath);
bool load_battle_state(const std::string& filepath, const MoveDex* dex, BattleState& out);

// ============================================================================
// ACTIONS, RESULTS, LOG
// ============================================================================

// {"type": "move", "slot": 0} / {"type": "move", "move": "struggle"} /
// {"type": "switch", "index": 1} / {"type": "tera", "slot": 2} / {"type": "pass"}
nlohmann::json action_to_json(const Action& action);
Action action_from_json(const nlohmann::json& j);

nlohmann::json legal_action_to_json(const LegalAction& action);
nlohmann::json calc_result_to_json(const CalcResult& result);
nlohmann::json log_entry_to_json(const LogEntry& entry);

BeliefContext belief_from_json(const nlohmann::json& j);

// ============================================================================
// TEAMS
// ============================================================================

/**
 * Load a team file: {"name": "...", "team": [pokemon, ...]} or a bare
 * array. Pokemon may list moves by id; those are resolved in `dex`.
 */
bool load_team(const std::string& filepath, const MoveDex& dex, std::vector<Pokemon>& out);

} // namespace serialization
} // namespace pokebattle
