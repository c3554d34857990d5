/**
 * PokeBattle Engine - Battle State
 *
 * The root state object representing the complete battle snapshot.
 * Copying it copies the RNG engine too, so a copy replays identically.
 */

#pragma once

#include "side.hpp"
#include "field.hpp"
#include "action.hpp"
#include <array>
#include <random>

namespace pokebattle {

/**
 * LogEntry - One sub-effect applied while resolving a turn.
 *
 * `event` is a short tag ("move", "damage", "status", "boost", "hazard",
 * "weather", "faint", "switch", ...). `side` is -1 for field events.
 */
struct LogEntry {
    int turn = 0;
    std::string event;
    int side = -1;
    std::string detail;
    int amount = 0;

    bool operator==(const LogEntry& o) const {
        return turn == o.turn && event == o.event && side == o.side
            && detail == o.detail && amount == o.amount;
    }
};

/**
 * BattleState - The complete battle snapshot.
 *
 * Mutated only by the turn resolution engine. Once phase is FINISHED
 * every further advance is rejected.
 */
struct BattleState {
    FormatID format_id;
    int turn = 0;
    BattlePhase phase = BattlePhase::PREPARATION;

    std::array<Side, 2> sides;
    Field field;

    std::vector<LogEntry> log;
    std::array<std::optional<Action>, 2> last_actions;
    std::optional<SideID> winner;

    uint64_t seed = 0;
    std::mt19937 rng;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    BattleState() {
        sides[0].id = 0;
        sides[1].id = 1;
    }

    // ========================================================================
    // SIDE ACCESS
    // ========================================================================

    Side& get_side(SideID id) {
        return sides[id];
    }

    const Side& get_side(SideID id) const {
        return sides[id];
    }

    Side& get_opponent(SideID id) {
        return sides[opponent_of(id)];
    }

    const Side& get_opponent(SideID id) const {
        return sides[opponent_of(id)];
    }

    // Room conditions are stored per side but apply to the whole battle
    bool room_active(SideConditionKind kind) const {
        return sides[0].has_condition(kind) || sides[1].has_condition(kind);
    }

    bool is_finished() const {
        return phase == BattlePhase::FINISHED;
    }

    // ========================================================================
    // RANDOMNESS
    // Raw mt19937 output is used instead of std distributions so results
    // are identical across standard library implementations.
    // ========================================================================

    void seed_rng(uint64_t s) {
        seed = s;
        rng.seed(static_cast<std::mt19937::result_type>(s));
    }

    // Uniform integer in [0, n)
    int random_int(int n) {
        if (n <= 1) return 0;
        return static_cast<int>(rng() % static_cast<uint32_t>(n));
    }

    // Uniform integer in [lo, hi]
    int random_range(int lo, int hi) {
        return lo + random_int(hi - lo + 1);
    }

    bool random_chance(double p) {
        if (p >= 1.0) return true;
        if (p <= 0.0) return false;
        return (static_cast<double>(rng()) / 4294967296.0) < p;
    }

    // ========================================================================
    // LOGGING
    // ========================================================================

    void add_log(const std::string& event, int side, const std::string& detail, int amount = 0) {
        log.push_back(LogEntry{turn, event, side, detail, amount});
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    BattleState clone() const {
        return *this;  // value semantics; RNG state is copied too
    }
};

} // namespace pokebattle
