/**
 * PokeBattle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * The battle client talks to the engine in JSON documents: every call
 * takes and returns a JSON string, so the Python side never holds C++
 * battle objects.
 *
 * Engine errors surface as Python exceptions (EngineError and its
 * InvalidAction / MissingEntity / UnsupportedFormat /
 * StateInvariantViolation subclasses).
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <nlohmann/json.hpp>
#include "pokebattle.hpp"

namespace py = pybind11;
using json = nlohmann::json;
using namespace pokebattle;

namespace {

// Request-level format overrides the one stored in the state document
BattleState state_from_request(const BattleEngine& engine, const json& request) {
    BattleState state = serialization::battle_state_from_json(request.at("state"), &engine.get_move_dex());
    if (request.contains("format")) {
        state.format_id = to_id(request["format"].get<std::string>());
    }
    engine.require_format(state.format_id);
    return state;
}

SideID side_from_request(const json& request) {
    int side = request.value("side", 0);
    if (side != 0 && side != 1) {
        throw InvalidAction("side must be 0 or 1");
    }
    return static_cast<SideID>(side);
}

/**
 * {"format", "state", "side", "actions"?: [...], "belief"?: {...}}
 *   -> {"results": [CalcResult, ...]}
 *
 * Without "actions", every enabled candidate is evaluated.
 */
std::string evaluate_json(const BattleEngine& engine, const std::string& request_text) {
    json request = json::parse(request_text);
    BattleState state = state_from_request(engine, request);
    SideID side = side_from_request(request);

    std::vector<Action> candidates;
    if (request.contains("actions")) {
        for (const auto& a : request["actions"]) {
            candidates.push_back(serialization::action_from_json(a));
        }
    } else {
        for (const auto& la : engine.get_legal_actions(state, side)) {
            if (la.is_enabled()) candidates.push_back(la.action);
        }
    }

    std::optional<BeliefContext> belief;
    if (request.contains("belief") && !request["belief"].is_null()) {
        belief = serialization::belief_from_json(request["belief"]);
    }

    json results = json::array();
    for (const auto& r : engine.evaluate(state, side, candidates, belief ? &*belief : nullptr)) {
        results.push_back(serialization::calc_result_to_json(r));
    }
    return json{{"results", results}}.dump();
}

/**
 * {"format", "state", "actions": [side0, side1]}
 *   -> {"state", "log": [...], "stage"}
 */
std::string advance_json(const BattleEngine& engine, const std::string& request_text) {
    json request = json::parse(request_text);
    BattleState state = state_from_request(engine, request);

    const json& choices = request.at("actions");
    if (!choices.is_array() || choices.size() != 2) {
        throw InvalidAction("advance needs exactly one action per side");
    }
    Action side0 = serialization::action_from_json(choices[0]);
    Action side1 = serialization::action_from_json(choices[1]);

    AdvanceResult result = engine.advance(state, side0, side1);

    json log = json::array();
    for (const auto& e : result.log) log.push_back(serialization::log_entry_to_json(e));

    json response;
    response["state"] = serialization::battle_state_to_json(result.state);
    response["log"] = log;
    response["stage"] = to_string(result.stage);
    response["finished"] = result.state.is_finished();
    response["winner"] = result.state.winner ? json(*result.state.winner) : json(nullptr);
    return response.dump();
}

// {"format"?, "state", "side"} -> [LegalAction, ...]
std::string legal_actions_json(const BattleEngine& engine, const std::string& request_text) {
    json request = json::parse(request_text);
    BattleState state = state_from_request(engine, request);
    SideID side = side_from_request(request);

    json out = json::array();
    for (const auto& la : engine.get_legal_actions(state, side)) {
        out.push_back(serialization::legal_action_to_json(la));
    }
    return out.dump();
}

// {"format", "teams": [[...], [...]], "seed"?} -> state
std::string create_battle_json(const BattleEngine& engine, const std::string& request_text) {
    json request = json::parse(request_text);
    FormatID format_id = to_id(request.at("format").get<std::string>());

    const json& teams = request.at("teams");
    if (!teams.is_array() || teams.size() != 2) {
        throw InvalidAction("create_battle needs exactly two teams");
    }

    std::vector<Pokemon> team[2];
    for (int i = 0; i < 2; i++) {
        for (const auto& p : teams[i]) {
            team[i].push_back(serialization::pokemon_from_json(p, &engine.get_move_dex()));
        }
    }

    std::optional<uint64_t> seed;
    if (request.contains("seed") && !request["seed"].is_null()) {
        seed = request["seed"].get<uint64_t>();
    }

    BattleState state = engine.create_battle(format_id, std::move(team[0]), std::move(team[1]), seed);
    return serialization::battle_state_to_json(state).dump();
}

} // anonymous namespace

PYBIND11_MODULE(pokebattle_cpp, m) {
    m.doc() = "Deterministic Pokemon singles battle mechanics engine";

    // ========================================================================
    // EXCEPTIONS
    // ========================================================================

    // Base first: pybind11 tries translators newest-first
    auto& engine_error = py::register_exception<EngineError>(m, "EngineError");
    py::register_exception<InvalidAction>(m, "InvalidAction", engine_error.ptr());
    py::register_exception<MissingEntity>(m, "MissingEntity", engine_error.ptr());
    py::register_exception<UnsupportedFormat>(m, "UnsupportedFormat", engine_error.ptr());
    py::register_exception<StateInvariantViolation>(m, "StateInvariantViolation", engine_error.ptr());

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<PokeType>(m, "PokeType")
        .value("NORMAL", PokeType::NORMAL)
        .value("FIRE", PokeType::FIRE)
        .value("WATER", PokeType::WATER)
        .value("ELECTRIC", PokeType::ELECTRIC)
        .value("GRASS", PokeType::GRASS)
        .value("ICE", PokeType::ICE)
        .value("FIGHTING", PokeType::FIGHTING)
        .value("POISON", PokeType::POISON)
        .value("GROUND", PokeType::GROUND)
        .value("FLYING", PokeType::FLYING)
        .value("PSYCHIC", PokeType::PSYCHIC)
        .value("BUG", PokeType::BUG)
        .value("ROCK", PokeType::ROCK)
        .value("GHOST", PokeType::GHOST)
        .value("DRAGON", PokeType::DRAGON)
        .value("DARK", PokeType::DARK)
        .value("STEEL", PokeType::STEEL)
        .value("FAIRY", PokeType::FAIRY)
        .value("TYPELESS", PokeType::TYPELESS)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("NONE", ErrorKind::NONE)
        .value("INVALID_ACTION", ErrorKind::INVALID_ACTION)
        .value("MISSING_ENTITY", ErrorKind::MISSING_ENTITY)
        .value("UNSUPPORTED_FORMAT", ErrorKind::UNSUPPORTED_FORMAT)
        .value("STATE_INVARIANT_VIOLATION", ErrorKind::STATE_INVARIANT_VIOLATION)
        .export_values();

    // ========================================================================
    // TYPE CHART
    // ========================================================================

    m.def("type_effectiveness", [](const std::string& attacking, const std::vector<std::string>& defending) {
        std::vector<PokeType> types;
        for (const auto& t : defending) types.push_back(parse_type(t));
        return pokebattle::type_effectiveness(parse_type(attacking), types);
    }, py::arg("attacking"), py::arg("defending"));

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<BattleEngine>(m, "Engine")
        .def(py::init<>())
        .def(py::init([](const std::string& moves_path, const std::string& formats_path,
                         const std::string& effects_path, uint64_t default_seed) {
            EngineConfig config;
            config.moves_path = moves_path;
            config.formats_path = formats_path;
            config.effects_path = effects_path;
            config.default_seed = default_seed;
            return std::make_unique<BattleEngine>(config);
        }), py::arg("moves_path"), py::arg("formats_path") = "", py::arg("effects_path") = "",
            py::arg("default_seed") = 0)
        .def_static("from_config", [](const std::string& config_path) {
            EngineConfig config;
            if (!config.load_from_json(config_path)) {
                throw std::runtime_error("failed to load engine config: " + config_path);
            }
            return std::make_unique<BattleEngine>(config);
        }, py::arg("config_path"))
        .def("move_count", [](const BattleEngine& e) { return e.get_move_dex().move_count(); })
        .def("format_ids", [](const BattleEngine& e) { return e.get_formats().get_all_format_ids(); })
        .def("evaluate_json", &evaluate_json, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("advance_json", &advance_json, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("legal_actions_json", &legal_actions_json, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("create_battle_json", &create_battle_json, py::arg("request"),
             py::call_guard<py::gil_scoped_release>());

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = get_version();
    m.attr("__version__") = get_version();
}
