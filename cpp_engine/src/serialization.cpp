/**
 * PokeBattle Engine - Serialization Implementation
 */

#include "serialization.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace pokebattle {
namespace serialization {

namespace {

json stats_to_json(const Stats& s) {
    return json{{"hp", s.hp}, {"atk", s.atk}, {"def", s.def},
                {"spa", s.spa}, {"spd", s.spd}, {"spe", s.spe}};
}

Stats stats_from_json(const json& j) {
    Stats s;
    s.hp = j.value("hp", 1);
    s.atk = j.value("atk", 1);
    s.def = j.value("def", 1);
    s.spa = j.value("spa", 1);
    s.spd = j.value("spd", 1);
    s.spe = j.value("spe", 1);
    return s;
}

json types_to_json(const std::vector<PokeType>& types) {
    json arr = json::array();
    for (PokeType t : types) arr.push_back(to_string(t));
    return arr;
}

std::vector<PokeType> types_from_json(const json& j) {
    std::vector<PokeType> types;
    for (const auto& t : j) types.push_back(parse_type(t.get<std::string>()));
    return types;
}

// "earthquake", {"id": "earthquake", "pp": 3} or a full inline definition
MoveSlot move_slot_from_json(const json& j, const MoveDex* dex) {
    MoveSlot slot;
    bool inline_def = j.is_object() && (j.contains("type") || j.contains("category"));

    if (inline_def) {
        slot.move = MoveDex::parse_move(j);
    } else {
        MoveID id = to_id(j.is_string() ? j.get<std::string>() : j.at("id").get<std::string>());
        const Move* known = dex ? dex->get_move(id) : nullptr;
        if (!known) {
            throw MissingEntity("unknown move: " + id);
        }
        slot.move = *known;
    }

    slot.max_pp = slot.move.pp;
    slot.pp = slot.move.pp;
    if (j.is_object()) {
        slot.max_pp = j.value("max_pp", slot.max_pp);
        // By-id entries use "pp" for the remaining PP; inline ones use it for the move's base PP
        slot.pp = j.value("current_pp", inline_def ? slot.max_pp : j.value("pp", slot.max_pp));
    }
    return slot;
}

} // anonymous namespace

// ============================================================================
// MOVES
// ============================================================================

json move_to_json(const Move& move) {
    json j;
    j["id"] = move.id;
    j["name"] = move.name;
    j["type"] = to_string(move.type);
    j["category"] = to_string(move.category);
    j["basePower"] = move.base_power;
    if (move.always_hits) {
        j["accuracy"] = true;
    } else {
        j["accuracy"] = move.accuracy;
    }
    j["priority"] = move.priority;
    j["target"] = to_string(move.target);
    j["pp"] = move.pp;
    j["critRatio"] = move.crit_stage + 1;
    if (move.is_z) j["isZ"] = true;
    if (move.is_max) j["isMax"] = true;

    json flags = json::object();
    if (move.flags.contact) flags["contact"] = true;
    if (move.flags.sound) flags["sound"] = true;
    if (move.flags.punch) flags["punch"] = true;
    if (move.flags.bite) flags["bite"] = true;
    if (move.flags.pulse) flags["pulse"] = true;
    if (move.flags.powder) flags["powder"] = true;
    if (move.flags.charge) flags["charge"] = true;
    if (move.flags.recharge) flags["recharge"] = true;
    if (move.flags.gravity_banned) flags["gravity"] = true;
    if (move.flags.thaws_user) flags["defrost"] = true;
    j["flags"] = flags;

    json secs = json::array();
    for (const auto& sec : move.secondaries) {
        json s;
        s["kind"] = to_string(sec.kind);
        s["chance"] = sec.chance;
        switch (sec.kind) {
            case SecondaryKind::STATUS: s["status"] = to_string(sec.status); break;
            case SecondaryKind::VOLATILE: s["volatile"] = to_string(sec.volatile_kind); break;
            case SecondaryKind::BOOST_TARGET:
            case SecondaryKind::BOOST_SELF:
                s["stat"] = to_string(sec.stat);
                s["stages"] = sec.stages;
                break;
            case SecondaryKind::RECOIL:
            case SecondaryKind::DRAIN:
            case SecondaryKind::HEAL:
                s["fraction"] = sec.fraction;
                break;
            case SecondaryKind::SET_HAZARD: s["hazard"] = to_string(sec.hazard); break;
            case SecondaryKind::SET_SCREEN: s["screen"] = to_string(sec.screen); break;
            case SecondaryKind::SET_WEATHER: s["weather"] = to_string(sec.weather); break;
            case SecondaryKind::SET_TERRAIN: s["terrain"] = to_string(sec.terrain); break;
            case SecondaryKind::SET_SIDE_CONDITION: s["sideCondition"] = to_string(sec.side_condition); break;
            default: break;
        }
        secs.push_back(s);
    }
    j["secondaries"] = secs;
    return j;
}

// ============================================================================
// POKEMON
// ============================================================================

json pokemon_to_json(const Pokemon& p) {
    json j;
    j["species"] = p.species;
    j["level"] = p.level;
    j["types"] = types_to_json(p.types);
    j["ability"] = p.ability;
    j["item"] = p.item;
    j["stats"] = stats_to_json(p.stats);
    j["hp"] = p.current_hp;
    j["max_hp"] = p.max_hp;

    j["status"] = to_string(p.status);
    j["sleep_turns"] = p.sleep_turns;
    j["toxic_counter"] = p.toxic_counter;
    j["status_from_opponent"] = p.status_from_opponent;

    j["boosts"] = json{{"atk", p.boosts.atk}, {"def", p.boosts.def}, {"spa", p.boosts.spa},
                       {"spd", p.boosts.spd}, {"spe", p.boosts.spe},
                       {"accuracy", p.boosts.accuracy}, {"evasion", p.boosts.evasion}};

    json moves = json::array();
    for (const auto& slot : p.moves) {
        json m = move_to_json(slot.move);
        m["current_pp"] = slot.pp;
        m["max_pp"] = slot.max_pp;
        moves.push_back(m);
    }
    j["moves"] = moves;

    j["tera"] = json{{"available", p.tera.available}, {"used", p.tera.used}, {"type", to_string(p.tera.type)}};
    if (p.mega_forme) {
        const MegaForme& m = *p.mega_forme;
        j["mega"] = json{{"species", m.species}, {"item", m.item}, {"stats", stats_to_json(m.stats)},
                         {"types", types_to_json(m.types)}, {"ability", m.ability}};
    }
    j["mega_evolved"] = p.mega_evolved;
    j["dynamaxed"] = p.dynamaxed;
    j["pre_dynamax_max_hp"] = p.pre_dynamax_max_hp;

    j["last_move"] = p.last_move;
    j["item_consumed"] = p.item_consumed;
    j["switched_in_this_turn"] = p.switched_in_this_turn;
    j["protect_streak"] = p.protect_streak;

    json vols = json::object();
    for (const auto& [kind, v] : p.volatiles) {
        vols[to_string(kind)] = json{{"turns_left", v.turns_left}, {"counter", v.counter}, {"move", v.move}};
    }
    j["volatiles"] = vols;
    return j;
}

Pokemon pokemon_from_json(const json& j, const MoveDex* dex) {
    Pokemon p;
    p.species = j.at("species").get<std::string>();
    p.level = j.value("level", 100);
    p.types = types_from_json(j.at("types"));
    p.ability = to_id(j.value("ability", ""));
    p.item = to_id(j.value("item", ""));

    p.stats = stats_from_json(j.at("stats"));
    p.max_hp = j.value("max_hp", p.stats.hp);
    p.current_hp = j.value("hp", p.max_hp);

    p.status = parse_status(j.value("status", "none"));
    p.sleep_turns = j.value("sleep_turns", 0);
    p.toxic_counter = j.value("toxic_counter", p.status == StatusCondition::TOXIC ? 1 : 0);
    p.status_from_opponent = j.value("status_from_opponent", false);
    if (p.current_hp == 0) {
        p.status = StatusCondition::FAINTED;
    }

    if (j.contains("boosts")) {
        for (const auto& [name, stages] : j["boosts"].items()) {
            p.boosts.apply(parse_stat(name), stages.get<int>());
        }
    }

    if (j.contains("moves")) {
        for (const auto& m : j["moves"]) {
            p.moves.push_back(move_slot_from_json(m, dex));
        }
    }

    if (j.contains("tera")) {
        const auto& t = j["tera"];
        p.tera.used = t.value("used", false);
        p.tera.available = t.value("available", !p.tera.used);
        p.tera.type = parse_type(t.value("type", "Normal"));
    } else if (j.contains("tera_type")) {
        p.tera.available = true;
        p.tera.type = parse_type(j["tera_type"].get<std::string>());
    }

    if (j.contains("mega") && j["mega"].is_object()) {
        const auto& m = j["mega"];
        MegaForme forme;
        forme.species = m.at("species").get<std::string>();
        forme.item = to_id(m.at("item").get<std::string>());
        forme.stats = stats_from_json(m.at("stats"));
        forme.types = types_from_json(m.at("types"));
        forme.ability = to_id(m.value("ability", ""));
        p.mega_forme = forme;
    }
    p.mega_evolved = j.value("mega_evolved", false);
    p.dynamaxed = j.value("dynamaxed", false);
    p.pre_dynamax_max_hp = j.value("pre_dynamax_max_hp", 0);

    p.last_move = j.value("last_move", "");
    p.item_consumed = j.value("item_consumed", false);
    p.switched_in_this_turn = j.value("switched_in_this_turn", false);
    p.protect_streak = j.value("protect_streak", 0);

    if (j.contains("volatiles")) {
        for (const auto& [name, v] : j["volatiles"].items()) {
            VolatileEffect effect;
            effect.turns_left = v.value("turns_left", -1);
            effect.counter = v.value("counter", 0);
            effect.move = v.value("move", "");
            p.add_volatile(parse_volatile(name), effect);
        }
    }
    return p;
}

// ============================================================================
// SIDE AND FIELD
// ============================================================================

json side_to_json(const Side& s) {
    json j;
    j["id"] = s.id;
    j["name"] = s.name;
    j["active"] = s.active ? pokemon_to_json(*s.active) : json(nullptr);

    json bench = json::array();
    for (const auto& p : s.bench) bench.push_back(pokemon_to_json(p));
    j["bench"] = bench;

    j["hazards"] = json{{"stealthrock", s.hazards.stealth_rock}, {"spikes", s.hazards.spikes},
                        {"toxicspikes", s.hazards.toxic_spikes}, {"stickyweb", s.hazards.sticky_web}};

    json screens = json::object();
    for (const auto& [kind, turns] : s.screens) screens[to_string(kind)] = turns;
    j["screens"] = screens;

    json conditions = json::object();
    for (const auto& [kind, turns] : s.conditions) conditions[to_string(kind)] = turns;
    j["conditions"] = conditions;

    j["tera_used"] = s.tera_used;
    j["mega_used"] = s.mega_used;
    j["zmove_used"] = s.zmove_used;
    j["dynamax_used"] = s.dynamax_used;
    j["dynamax_turns"] = s.dynamax_turns;
    j["forced_switch"] = s.forced_switch;
    return j;
}

Side side_from_json(const json& j, const MoveDex* dex) {
    Side s;
    s.id = j.value("id", SideID{0});
    s.name = j.value("name", "");
    if (j.contains("active") && !j["active"].is_null()) {
        s.active = pokemon_from_json(j["active"], dex);
    }
    if (j.contains("bench")) {
        for (const auto& p : j["bench"]) s.bench.push_back(pokemon_from_json(p, dex));
    }

    if (j.contains("hazards")) {
        const auto& h = j["hazards"];
        s.hazards.stealth_rock = h.value("stealthrock", false);
        s.hazards.spikes = h.value("spikes", 0);
        s.hazards.toxic_spikes = h.value("toxicspikes", 0);
        s.hazards.sticky_web = h.value("stickyweb", false);
    }
    if (j.contains("screens")) {
        for (const auto& [name, turns] : j["screens"].items()) {
            s.screens[parse_screen(name)] = turns.get<int>();
        }
    }
    if (j.contains("conditions")) {
        for (const auto& [name, turns] : j["conditions"].items()) {
            s.conditions[parse_side_condition(name)] = turns.get<int>();
        }
    }

    s.tera_used = j.value("tera_used", false);
    s.mega_used = j.value("mega_used", false);
    s.zmove_used = j.value("zmove_used", false);
    s.dynamax_used = j.value("dynamax_used", false);
    s.dynamax_turns = j.value("dynamax_turns", 0);
    s.forced_switch = j.value("forced_switch", false);
    return s;
}

json field_to_json(const Field& f) {
    return json{{"weather", to_string(f.weather)}, {"weather_turns", f.weather_turns},
                {"weather_permanent", f.weather_permanent},
                {"terrain", to_string(f.terrain)}, {"terrain_turns", f.terrain_turns},
                {"terrain_permanent", f.terrain_permanent}};
}

Field field_from_json(const json& j) {
    Field f;
    f.weather = parse_weather(j.value("weather", "none"));
    f.weather_turns = j.value("weather_turns", f.weather == Weather::NONE ? 0 : 5);
    f.weather_permanent = j.value("weather_permanent", false);
    f.terrain = parse_terrain(j.value("terrain", "none"));
    f.terrain_turns = j.value("terrain_turns", f.terrain == Terrain::NONE ? 0 : 5);
    f.terrain_permanent = j.value("terrain_permanent", false);
    return f;
}

// ============================================================================
// BATTLE STATE
// ============================================================================

json battle_state_to_json(const BattleState& state) {
    json j;
    j["format"] = state.format_id;
    j["turn"] = state.turn;
    j["phase"] = to_string(state.phase);
    j["sides"] = json::array({side_to_json(state.sides[0]), side_to_json(state.sides[1])});
    j["field"] = field_to_json(state.field);

    json log = json::array();
    for (const auto& entry : state.log) log.push_back(log_entry_to_json(entry));
    j["log"] = log;

    json last = json::array();
    for (const auto& a : state.last_actions) {
        last.push_back(a ? action_to_json(*a) : json(nullptr));
    }
    j["last_actions"] = last;
    j["winner"] = state.winner ? json(*state.winner) : json(nullptr);

    j["seed"] = state.seed;
    std::ostringstream rng_state;
    rng_state << state.rng;
    j["rng_state"] = rng_state.str();
    return j;
}

BattleState battle_state_from_json(const json& j, const MoveDex* dex) {
    BattleState state;
    state.format_id = j.at("format").get<std::string>();
    state.turn = j.value("turn", 1);
    state.phase = parse_phase(j.value("phase", "battle"));

    const auto& sides = j.at("sides");
    if (!sides.is_array() || sides.size() != 2) {
        throw std::invalid_argument("battle state needs exactly two sides");
    }
    for (SideID i = 0; i < 2; ++i) {
        state.sides[i] = side_from_json(sides[i], dex);
        state.sides[i].id = i;
    }
    if (j.contains("field")) {
        state.field = field_from_json(j["field"]);
    }

    if (j.contains("log")) {
        for (const auto& e : j["log"]) {
            LogEntry entry;
            entry.turn = e.value("turn", 0);
            entry.event = e.value("event", "");
            entry.side = e.value("side", -1);
            entry.detail = e.value("detail", "");
            entry.amount = e.value("amount", 0);
            state.log.push_back(entry);
        }
    }
    if (j.contains("last_actions")) {
        const auto& last = j["last_actions"];
        for (size_t i = 0; i < 2 && i < last.size(); ++i) {
            if (!last[i].is_null()) state.last_actions[i] = action_from_json(last[i]);
        }
    }
    if (j.contains("winner") && !j["winner"].is_null()) {
        state.winner = j["winner"].get<SideID>();
    }

    state.seed_rng(j.value("seed", uint64_t{0}));
    if (j.contains("rng_state")) {
        std::istringstream rng_state(j["rng_state"].get<std::string>());
        rng_state >> state.rng;
        if (rng_state.fail()) {
            throw std::invalid_argument("malformed rng_state");
        }
    }
    return state;
}

std::string dump_battle_state(const BattleState& state, int indent) {
    return battle_state_to_json(state).dump(indent);
}

BattleState parse_battle_state(const std::string& text, const MoveDex* dex) {
    return battle_state_from_json(json::parse(text), dex);
}

bool save_battle_state(const BattleState& state, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Serialization] Failed to open for writing: " << filepath << std::endl;
        return false;
    }
    file << dump_battle_state(state, 2) << std::endl;
    return true;
}

bool load_battle_state(const std::string& filepath, const MoveDex* dex, BattleState& out) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Serialization] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        out = battle_state_from_json(json::parse(file), dex);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[Serialization] JSON error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[Serialization] Error loading battle state: " << e.what() << std::endl;
        return false;
    }
}

// ============================================================================
// ACTIONS, RESULTS, LOG
// ============================================================================

json action_to_json(const Action& action) {
    return std::visit(overloaded{
        [](const MoveAction& a) -> json {
            if (!a.move_id.empty()) return json{{"type", "move"}, {"move", a.move_id}};
            return json{{"type", "move"}, {"slot", a.slot}};
        },
        [](const SwitchAction& a) -> json { return json{{"type", "switch"}, {"index", a.bench_index}}; },
        [](const TeraAction& a) -> json { return json{{"type", "tera"}, {"slot", a.slot}}; },
        [](const MegaAction& a) -> json { return json{{"type", "mega"}, {"slot", a.slot}}; },
        [](const ZMoveAction& a) -> json { return json{{"type", "zmove"}, {"slot", a.slot}}; },
        [](const DynamaxAction& a) -> json { return json{{"type", "dynamax"}, {"slot", a.slot}}; },
        [](const PassAction&) -> json { return json{{"type", "pass"}}; },
    }, action);
}

Action action_from_json(const json& j) {
    std::string type = j.at("type").get<std::string>();
    int slot = j.value("slot", 0);

    if (type == "move") {
        if (j.contains("move")) return actions::move_by_id(to_id(j["move"].get<std::string>()));
        return actions::move(slot);
    }
    if (type == "switch") return actions::switch_to(j.value("index", 0));
    if (type == "tera") return actions::tera(slot);
    if (type == "mega") return actions::mega(slot);
    if (type == "zmove") return actions::zmove(slot);
    if (type == "dynamax") return actions::dynamax(slot);
    if (type == "pass") return actions::pass();
    throw InvalidAction("unknown action type: " + type);
}

json legal_action_to_json(const LegalAction& la) {
    json j;
    j["action"] = action_to_json(la.action);
    j["label"] = la.label;
    j["disabled"] = la.disabled;
    if (la.disabled) j["reason"] = la.reason;
    return j;
}

json calc_result_to_json(const CalcResult& r) {
    json j;
    j["action"] = action_to_json(r.action);
    j["error"] = r.error;
    if (r.error) {
        j["error_kind"] = to_string(r.error_kind);
        j["error_message"] = r.error_message;
    }
    j["damage"] = json{{"min", r.damage.min_percent}, {"max", r.damage.max_percent},
                       {"avg", r.damage.avg_percent}};
    j["accuracy"] = r.accuracy;
    j["ohko_prob"] = r.ohko_prob;
    j["twohko_prob"] = r.twohko_prob;
    j["speed_check"] = json{{"faster", r.speed_check.faster}, {"speed_diff", r.speed_check.speed_diff},
                            {"tie", r.speed_check.tie}, {"our_speed", r.speed_check.our_speed},
                            {"their_speed", r.speed_check.their_speed}};
    j["hazard_damage"] = r.hazard_damage;
    j["expected_survival"] = r.expected_survival;
    j["expected_gain"] = r.expected_gain;
    j["priority"] = r.priority;
    j["effectiveness"] = r.effectiveness;
    j["status_chance"] = r.status_chance;
    if (std::holds_alternative<TeraAction>(r.action)) {
        j["tera_offense_delta"] = r.tera_offense_delta;
        j["tera_defense_delta"] = r.tera_defense_delta;
    }
    return j;
}

json log_entry_to_json(const LogEntry& e) {
    return json{{"turn", e.turn}, {"event", e.event}, {"side", e.side},
                {"detail", e.detail}, {"amount", e.amount}};
}

BeliefContext belief_from_json(const json& j) {
    BeliefContext belief;
    if (j.contains("opponent_item") && !j["opponent_item"].is_null()) {
        belief.opponent_item = to_id(j["opponent_item"].get<std::string>());
    }
    if (j.contains("opponent_ability") && !j["opponent_ability"].is_null()) {
        belief.opponent_ability = to_id(j["opponent_ability"].get<std::string>());
    }
    if (j.contains("opponent_speed") && !j["opponent_speed"].is_null()) {
        belief.opponent_speed = j["opponent_speed"].get<int>();
    }
    return belief;
}

// ============================================================================
// TEAMS
// ============================================================================

bool load_team(const std::string& filepath, const MoveDex& dex, std::vector<Pokemon>& out) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Team] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        const json& team = data.is_array() ? data : data.at("team");

        out.clear();
        for (const auto& p : team) {
            out.push_back(pokemon_from_json(p, &dex));
        }

        std::cout << "[Team] Loaded " << out.size() << " Pokemon from " << filepath << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[Team] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[Team] Error loading team: " << e.what() << std::endl;
        return false;
    }
}

} // namespace serialization
} // namespace pokebattle
