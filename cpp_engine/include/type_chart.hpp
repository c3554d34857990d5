/**
 * PokeBattle Engine - Type Chart & Status Definitions
 *
 * Static lookup tables. No state, safe to call from any thread.
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace pokebattle {

/**
 * Effectiveness of an attacking type against a single defending type.
 * Returns 0, 0.5, 1 or 2. TYPELESS is neutral against everything.
 */
double single_type_effectiveness(PokeType attack, PokeType defend);

/**
 * Product over the defender's types: 0, 0.25, 0.5, 1, 2 or 4.
 */
double type_effectiveness(PokeType attack, const std::vector<PokeType>& defender_types);

inline bool has_type(const std::vector<PokeType>& types, PokeType t) {
    for (PokeType x : types) {
        if (x == t) return true;
    }
    return false;
}

/**
 * StatusDef - Residual damage and typed immunities for a primary status.
 *
 * Residual damage is residual_num/residual_den of max HP per end of turn.
 * For toxic residual_num is multiplied by the toxic counter.
 */
struct StatusDef {
    StatusCondition status = StatusCondition::NONE;
    int residual_num = 0;
    int residual_den = 1;
    std::vector<PokeType> immune_types;
};

const StatusDef& status_def(StatusCondition status);

bool is_status_immune_by_type(StatusCondition status, const std::vector<PokeType>& types);

} // namespace pokebattle
