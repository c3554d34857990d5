/**
 * Shared fixtures for the engine tests
 *
 * Moves and Pokemon are built inline so the tests never depend on the
 * data files.
 */

#pragma once

#include "pokebattle.hpp"

#ifndef POKEBATTLE_DATA_DIR
#define POKEBATTLE_DATA_DIR "data"
#endif

namespace fixtures {

using namespace pokebattle;

// ============================================================================
// MOVES
// ============================================================================

inline Move attack(const std::string& id, PokeType type, MoveCategory category, int power,
                   double accuracy = 1.0, int pp = 16) {
    Move m;
    m.id = id;
    m.name = id;
    m.type = type;
    m.category = category;
    m.base_power = power;
    m.accuracy = accuracy;
    m.pp = pp;
    return m;
}

inline Move status_move(const std::string& id, PokeType type, MoveTarget target,
                        std::vector<Secondary> secondaries, double accuracy = 1.0, int pp = 16) {
    Move m;
    m.id = id;
    m.name = id;
    m.type = type;
    m.category = MoveCategory::STATUS;
    m.target = target;
    m.accuracy = accuracy;
    m.always_hits = target != MoveTarget::NORMAL;
    m.pp = pp;
    m.secondaries = std::move(secondaries);
    return m;
}

inline Move earthquake() {
    return attack("earthquake", PokeType::GROUND, MoveCategory::PHYSICAL, 100);
}

inline Move tackle() {
    Move m = attack("tackle", PokeType::NORMAL, MoveCategory::PHYSICAL, 40);
    m.flags.contact = true;
    return m;
}

inline Move quick_attack() {
    Move m = attack("quickattack", PokeType::NORMAL, MoveCategory::PHYSICAL, 40);
    m.flags.contact = true;
    m.priority = 1;
    return m;
}

inline Move flamethrower() {
    Move m = attack("flamethrower", PokeType::FIRE, MoveCategory::SPECIAL, 90);
    m.secondaries.push_back(Secondary::make_status(StatusCondition::BURN, 0.1));
    return m;
}

inline Move focus_blast() {
    return attack("focusblast", PokeType::FIGHTING, MoveCategory::SPECIAL, 120, 0.7, 8);
}

inline Move aerial_ace() {
    Move m = attack("aerialace", PokeType::FLYING, MoveCategory::PHYSICAL, 60);
    m.always_hits = true;
    m.flags.contact = true;
    return m;
}

inline Move swords_dance() {
    return status_move("swordsdance", PokeType::NORMAL, MoveTarget::SELF,
                       {Secondary::make_boost(true, Stat::ATK, 2)});
}

inline Move thunder_wave() {
    return status_move("thunderwave", PokeType::ELECTRIC, MoveTarget::NORMAL,
                       {Secondary::make_status(StatusCondition::PARALYSIS)}, 0.9);
}

inline Move trick_room() {
    Secondary sec;
    sec.kind = SecondaryKind::SET_SIDE_CONDITION;
    sec.side_condition = SideConditionKind::TRICK_ROOM;
    Move m = status_move("trickroom", PokeType::PSYCHIC, MoveTarget::FIELD, {sec});
    m.priority = -7;
    return m;
}

inline Move stealth_rock() {
    Secondary sec;
    sec.kind = SecondaryKind::SET_HAZARD;
    sec.hazard = HazardKind::STEALTH_ROCK;
    return status_move("stealthrock", PokeType::ROCK, MoveTarget::FOE_SIDE, {sec});
}

inline Move protect() {
    Secondary sec;
    sec.kind = SecondaryKind::PROTECT;
    Move m = status_move("protect", PokeType::NORMAL, MoveTarget::SELF, {sec});
    m.priority = 4;
    return m;
}

// ============================================================================
// POKEMON
// ============================================================================

inline Pokemon make_pokemon(const std::string& species, std::vector<PokeType> types, Stats stats,
                            std::vector<Move> moves, const std::string& ability = "",
                            const std::string& item = "") {
    Pokemon p;
    p.species = species;
    p.types = std::move(types);
    p.stats = stats;
    p.max_hp = stats.hp;
    p.current_hp = stats.hp;
    p.ability = ability;
    p.item = item;
    for (auto& m : moves) {
        int pp = m.pp > 0 ? m.pp : 16;
        p.moves.push_back(MoveSlot{std::move(m), pp, pp});
    }
    return p;
}

inline Pokemon garchomp(const std::string& item = "") {
    return make_pokemon("Garchomp", {PokeType::DRAGON, PokeType::GROUND},
                        Stats{357, 359, 226, 176, 206, 280},
                        {earthquake(), tackle(), swords_dance(), aerial_ace()}, "roughskin", item);
}

inline Pokemon dragapult() {
    return make_pokemon("Dragapult", {PokeType::DRAGON, PokeType::GHOST},
                        Stats{317, 276, 186, 299, 186, 333},
                        {quick_attack(), flamethrower(), thunder_wave(), focus_blast()}, "infiltrator");
}

inline Pokemon heatran() {
    return make_pokemon("Heatran", {PokeType::FIRE, PokeType::STEEL},
                        Stats{386, 194, 246, 296, 246, 253},
                        {flamethrower(), stealth_rock(), protect(), earthquake()}, "flashfire");
}

inline Pokemon corviknight() {
    return make_pokemon("Corviknight", {PokeType::FLYING, PokeType::STEEL},
                        Stats{398, 284, 246, 127, 206, 170},
                        {aerial_ace(), tackle(), trick_room(), swords_dance()}, "pressure");
}

inline Pokemon blissey() {
    return make_pokemon("Blissey", {PokeType::NORMAL},
                        Stats{714, 50, 50, 186, 306, 146},
                        {tackle(), thunder_wave(), protect(), stealth_rock()}, "naturalcure");
}

inline Pokemon weak(const std::string& species, int hp, int spe) {
    return make_pokemon(species, {PokeType::NORMAL}, Stats{hp, 50, 50, 50, 50, spe}, {tackle()});
}

// ============================================================================
// BATTLES
// ============================================================================

inline BattleState start(const BattleEngine& engine, std::vector<Pokemon> team0,
                         std::vector<Pokemon> team1, const FormatID& format = "gen9ou",
                         uint64_t seed = 42) {
    return engine.create_battle(format, std::move(team0), std::move(team1), seed);
}

inline const LegalAction* find_action(const std::vector<LegalAction>& candidates, const Action& action) {
    for (const auto& la : candidates) {
        if (la.action == action) return &la;
    }
    return nullptr;
}

inline int count_enabled(const std::vector<LegalAction>& candidates) {
    int n = 0;
    for (const auto& la : candidates) {
        if (la.is_enabled()) ++n;
    }
    return n;
}

inline bool log_has(const std::vector<LogEntry>& log, const std::string& event, int side = -2) {
    for (const auto& e : log) {
        if (e.event == event && (side == -2 || e.side == side)) return true;
    }
    return false;
}

inline bool log_has_detail(const std::vector<LogEntry>& log, const std::string& event,
                           const std::string& detail) {
    for (const auto& e : log) {
        if (e.event == event && e.detail == detail) return true;
    }
    return false;
}

// Sides of the "move" entries, in the order they were logged
inline std::vector<int> move_order(const std::vector<LogEntry>& log) {
    std::vector<int> sides;
    for (const auto& e : log) {
        if (e.event == "move") sides.push_back(e.side);
    }
    return sides;
}

} // namespace fixtures
