/**
 * PokeBattle Engine - Battle Tracer
 *
 * Complete battle state visibility for debugging.
 * Logs both sides in full (bench, PP, volatiles, hidden items) after
 * every advance, so a bad turn can be traced back line by line.
 */

#pragma once

#include "battle_state.hpp"
#include "action.hpp"
#include <string>
#include <fstream>

namespace pokebattle {

/**
 * BattleTracer - Per-battle trace file.
 *
 * Owned by the caller, never by the engine; the engine core does no I/O.
 */
class BattleTracer {
public:
    /**
     * Constructor - creates timestamped trace file.
     *
     * @param output_dir Directory for trace files
     * @param label Optional tag included in the file name
     */
    explicit BattleTracer(const std::string& output_dir = "logs",
                          const std::string& label = "");

    ~BattleTracer();

    BattleTracer(const BattleTracer&) = delete;
    BattleTracer& operator=(const BattleTracer&) = delete;

    /**
     * Log the pair of choices about to be advanced.
     */
    void log_choices(const BattleState& state, const Action& side0, const Action& side1);

    /**
     * Log the entries an advance appended.
     */
    void log_events(const std::vector<LogEntry>& entries);

    /**
     * Log complete battle state snapshot.
     */
    void log_state(const BattleState& state);

    /**
     * Log battle end result.
     *
     * @param winner Winning side (nullopt on a tie)
     */
    void log_battle_end(std::optional<SideID> winner, int turns);

    const std::string& get_log_path() const { return log_path_; }
    bool is_enabled() const { return enabled_; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format a Pokemon line with HP, status, item and boosts.
     * Format: "ACTIVE:  Garchomp | HP: 301/357 | Status: none | Item: choicescarf | Boosts: [atk +1]"
     */
    std::string format_pokemon_line(const Pokemon& pokemon, const std::string& label) const;

    std::string format_side(const Side& side) const;

    static std::string describe_action(const Side& side, const Action& action);
};

} // namespace pokebattle
