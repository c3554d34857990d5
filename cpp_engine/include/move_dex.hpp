/**
 * PokeBattle Engine - Move Dex
 *
 * Stores immutable move definitions loaded from JSON.
 * Provides fast lookup by move id. Struggle and the confusion self-hit
 * are always present.
 */

#pragma once

#include "move.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {

class MoveDex {
public:
    MoveDex();
    ~MoveDex() = default;

    /**
     * Load moves from a JSON file: {"moves": [ {...}, ... ]}.
     * Accuracy may be `true` (always hits), a percentage or a fraction;
     * secondary chances are percentages.
     */
    bool load_from_json(const std::string& filepath);

    void register_move(Move move);

    /**
     * Get a move definition by id.
     *
     * Returns nullptr if the move is not found.
     */
    const Move* get_move(const MoveID& move_id) const;

    bool has_move(const MoveID& move_id) const;

    std::vector<MoveID> get_all_move_ids() const;

    size_t move_count() const { return moves_.size(); }

    /**
     * Static parsing utilities - public for the serializer, which accepts
     * inline move definitions in battle-state documents.
     */
    static Move parse_move(const nlohmann::json& move_json);
    static Secondary parse_secondary(const nlohmann::json& sec_json);

    static const Move& struggle();
    static const Move& confusion_self_hit();

private:
    std::unordered_map<MoveID, Move> moves_;
};

} // namespace pokebattle
