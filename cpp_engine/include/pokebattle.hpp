/**
 * PokeBattle Engine - C++ Implementation
 *
 * Deterministic singles battle mechanics engine.
 * Serves the real-time client (through the Python binding) and offline
 * self-play (through the library API).
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "errors.hpp"

// Battle data
#include "move.hpp"
#include "pokemon.hpp"
#include "side.hpp"
#include "field.hpp"
#include "battle_state.hpp"
#include "action.hpp"

// Tables and registries
#include "type_chart.hpp"
#include "move_dex.hpp"
#include "format_rules.hpp"
#include "effect_table.hpp"

// Engine
#include "calculator.hpp"
#include "legal_actions.hpp"
#include "engine.hpp"
#include "serialization.hpp"

namespace pokebattle {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace pokebattle
