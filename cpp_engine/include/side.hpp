/**
 * PokeBattle Engine - Side
 *
 * One player's half of the battle: active Pokemon, bench, hazards laid
 * against it, its screens and side conditions, and once-per-battle flags.
 */

#pragma once

#include "pokemon.hpp"
#include <map>
#include <optional>

namespace pokebattle {

struct Hazards {
    bool stealth_rock = false;
    int spikes = 0;          // 0..3
    int toxic_spikes = 0;    // 0..2
    bool sticky_web = false;

    bool any() const {
        return stealth_rock || spikes > 0 || toxic_spikes > 0 || sticky_web;
    }

    void clear() { *this = Hazards{}; }
};

/**
 * Side - Player's play area.
 *
 * The active slot is empty only in documents that describe a broken
 * state; a fainted active stays in place until its replacement switches
 * in (the forced-switch window).
 */
struct Side {
    SideID id = 0;
    std::string name;

    std::optional<Pokemon> active;
    std::vector<Pokemon> bench;

    Hazards hazards;
    std::map<ScreenKind, int> screens;                   // turns remaining
    std::map<SideConditionKind, int> conditions;         // turns remaining

    // Once-per-battle resources
    bool tera_used = false;
    bool mega_used = false;
    bool zmove_used = false;
    bool dynamax_used = false;
    int dynamax_turns = 0;

    bool forced_switch = false;

    // ========================================================================
    // ACCESS
    // ========================================================================

    bool has_active() const {
        return active.has_value();
    }

    bool has_healthy_active() const {
        return active.has_value() && !active->is_fainted();
    }

    int get_bench_count() const {
        return static_cast<int>(bench.size());
    }

    int healthy_bench_count() const {
        int n = 0;
        for (const auto& p : bench) {
            if (!p.is_fainted()) ++n;
        }
        return n;
    }

    bool all_fainted() const {
        if (has_healthy_active()) return false;
        return healthy_bench_count() == 0;
    }

    std::vector<const Pokemon*> get_all_pokemon() const {
        std::vector<const Pokemon*> result;
        if (active.has_value()) {
            result.push_back(&active.value());
        }
        for (const auto& p : bench) {
            result.push_back(&p);
        }
        return result;
    }

    // ========================================================================
    // SIDE CONDITIONS
    // ========================================================================

    bool has_screen(ScreenKind kind) const {
        auto it = screens.find(kind);
        return it != screens.end() && it->second > 0;
    }

    bool has_condition(SideConditionKind kind) const {
        auto it = conditions.find(kind);
        return it != conditions.end() && it->second > 0;
    }

    // ========================================================================
    // SWITCH OPERATIONS
    // ========================================================================

    // Swap active with a benched Pokemon. The outgoing Pokemon takes the
    // incoming one's bench slot so bench indices stay stable.
    bool switch_active(int bench_index) {
        if (bench_index < 0 || bench_index >= get_bench_count() || !active.has_value()) {
            return false;
        }
        Pokemon old_active = std::move(*active);
        *active = std::move(bench[bench_index]);
        bench[bench_index] = std::move(old_active);
        return true;
    }

    // Fill an empty active slot from the bench
    bool promote_to_active(int bench_index) {
        if (active.has_value() || bench_index < 0 || bench_index >= get_bench_count()) {
            return false;
        }
        active = std::move(bench[bench_index]);
        bench.erase(bench.begin() + bench_index);
        return true;
    }
};

} // namespace pokebattle
