/**
 * PokeBattle Engine - Interactive Test Console
 *
 * Simple REPL for manual testing of battle mechanics.
 * Both sides are driven from the prompt: pick one candidate per side and
 * the turn resolves.
 *
 * Usage:
 *   pokebattle_console [team1.json team2.json] [--format id] [--seed n]
 *                      [--moves moves.json] [--formats formats.json]
 *                      [--config engine.json] [--trace dir]
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <iomanip>
#include <cctype>

#include "engine.hpp"
#include "errors.hpp"
#include "serialization.hpp"
#include "battle_tracer.hpp"

using namespace pokebattle;

#ifndef POKEBATTLE_DATA_DIR
#define POKEBATTLE_DATA_DIR "data"
#endif

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

// ============================================================================
// COMMAND LINE
// ============================================================================

struct ConsoleOptions {
    std::string team_paths[2] = {
        std::string(POKEBATTLE_DATA_DIR) + "/teams/team_a.json",
        std::string(POKEBATTLE_DATA_DIR) + "/teams/team_b.json",
    };
    std::string config_path;
    std::string format_id = "gen9ou";
    std::optional<uint64_t> seed;
    std::optional<std::string> trace_dir;
    EngineConfig engine;
};

void print_usage() {
    std::cout << "Usage: pokebattle_console [team1.json team2.json] [--format id] [--seed n]\n"
              << "                          [--moves moves.json] [--formats formats.json]\n"
              << "                          [--config engine.json] [--trace dir]" << std::endl;
}

bool parse_args(int argc, char** argv, ConsoleOptions& opts) {
    opts.engine.moves_path = std::string(POKEBATTLE_DATA_DIR) + "/moves.json";
    opts.engine.formats_path = std::string(POKEBATTLE_DATA_DIR) + "/formats.json";

    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "[Console] Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return false;
        } else if (arg == "--format") {
            if (!next(value)) return false;
            opts.format_id = to_id(value);
        } else if (arg == "--seed") {
            if (!next(value)) return false;
            try {
                opts.seed = std::stoull(value);
            } catch (const std::exception&) {
                std::cerr << "[Console] Bad seed: " << value << std::endl;
                return false;
            }
        } else if (arg == "--moves") {
            if (!next(value)) return false;
            opts.engine.moves_path = value;
        } else if (arg == "--formats") {
            if (!next(value)) return false;
            opts.engine.formats_path = value;
        } else if (arg == "--config") {
            if (!next(value)) return false;
            opts.config_path = value;
        } else if (arg == "--trace") {
            if (!next(value)) return false;
            opts.trace_dir = value;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[Console] Unknown option: " << arg << std::endl;
            print_usage();
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (!positional.empty()) {
        if (positional.size() != 2) {
            std::cerr << "[Console] Expected two team files, got " << positional.size() << std::endl;
            print_usage();
            return false;
        }
        opts.team_paths[0] = positional[0];
        opts.team_paths[1] = positional[1];
    }

    // A config file supplies defaults; explicit flags still win
    if (!opts.config_path.empty()) {
        EngineConfig file_config;
        if (!file_config.load_from_json(opts.config_path)) {
            return false;
        }
        if (file_config.moves_path.empty()) file_config.moves_path = opts.engine.moves_path;
        if (file_config.formats_path.empty()) file_config.formats_path = opts.engine.formats_path;
        opts.engine = file_config;
    }
    if (opts.trace_dir) {
        opts.engine.trace_enabled = true;
        opts.engine.trace_dir = *opts.trace_dir;
    }
    return true;
}

// ============================================================================
// PRINT HELP
// ============================================================================

void print_help() {
    std::cout << R"(
=== PokeBattle C++ Test Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Battle Setup:
  load <t1.json> <t2.json> - Load both teams
  start / reset           - Start a battle with the loaded teams
  format <id>             - Switch format (takes effect on next start)
  formats                 - List registered formats

Battle:
  show / s                - Show current battle state
  actions / a             - Show candidate actions for both sides (numbered)
  do <n0> <n1>            - Advance one turn with candidate n0 for side 0, n1 for side 1
  eval <side>             - Evaluate every enabled candidate for a side
  log [n]                 - Show the last n log entries (default 20)

Persistence:
  save <path>             - Save the battle state as JSON
  restore <path>          - Load a battle state from JSON

Examples:
  load data/teams/team_a.json data/teams/team_b.json
  start
  do 0 0                  # both sides use their first move
  <n0> <n1>               # shorthand for do
)" << std::endl;
}

// ============================================================================
// BATTLE STATE DISPLAY
// ============================================================================

std::string hp_bar(const Pokemon& p) {
    int width = 20;
    int filled = p.max_hp > 0 ? (p.current_hp * width + p.max_hp - 1) / p.max_hp : 0;
    return "[" + std::string(filled, '#') + std::string(width - filled, '.') + "]";
}

void show_pokemon(const std::string& label, const Pokemon& p) {
    std::cout << "  " << label << ": " << p.species
              << " " << hp_bar(p) << " " << p.current_hp << "/" << p.max_hp;
    if (p.status != StatusCondition::NONE) {
        std::cout << " (" << to_string(p.status) << ")";
    }
    if (!p.item.empty()) std::cout << " @ " << p.item;
    if (p.tera.used) std::cout << " [tera " << to_string(p.tera.type) << "]";
    if (p.dynamaxed) std::cout << " [dynamax]";
    std::cout << std::endl;
}

void show_side(const Side& s) {
    std::cout << "\n--- Side " << static_cast<int>(s.id) << " (" << s.name << ") ---" << std::endl;
    if (s.active) {
        show_pokemon("Active", *s.active);
        const Pokemon& p = *s.active;
        std::cout << "    Boosts: atk " << p.boosts.atk << " def " << p.boosts.def
                  << " spa " << p.boosts.spa << " spd " << p.boosts.spd
                  << " spe " << p.boosts.spe << std::endl;
        if (!p.volatiles.empty()) {
            std::cout << "    Volatiles:";
            for (const auto& [kind, v] : p.volatiles) {
                std::cout << " " << to_string(kind);
            }
            std::cout << std::endl;
        }
    } else {
        std::cout << "  Active: (empty)" << std::endl;
    }
    for (size_t i = 0; i < s.bench.size(); i++) {
        show_pokemon("Bench " + std::to_string(i), s.bench[i]);
    }
    if (s.hazards.any()) {
        std::cout << "  Hazards:";
        if (s.hazards.stealth_rock) std::cout << " stealthrock";
        if (s.hazards.spikes) std::cout << " spikes x" << s.hazards.spikes;
        if (s.hazards.toxic_spikes) std::cout << " toxicspikes x" << s.hazards.toxic_spikes;
        if (s.hazards.sticky_web) std::cout << " stickyweb";
        std::cout << std::endl;
    }
    for (const auto& [kind, turns] : s.screens) {
        std::cout << "  " << to_string(kind) << " (" << turns << " turns)" << std::endl;
    }
    for (const auto& [kind, turns] : s.conditions) {
        std::cout << "  " << to_string(kind) << " (" << turns << " turns)" << std::endl;
    }
}

void show_state(const BattleState& state) {
    std::cout << "\n========== TURN " << state.turn << " | " << state.format_id
              << " | " << to_string(state.phase) << " ==========" << std::endl;
    if (state.field.weather != Weather::NONE) {
        std::cout << "Weather: " << to_string(state.field.weather);
        if (!state.field.weather_permanent) std::cout << " (" << state.field.weather_turns << ")";
        std::cout << std::endl;
    }
    if (state.field.terrain != Terrain::NONE) {
        std::cout << "Terrain: " << to_string(state.field.terrain);
        if (!state.field.terrain_permanent) std::cout << " (" << state.field.terrain_turns << ")";
        std::cout << std::endl;
    }
    show_side(state.sides[0]);
    show_side(state.sides[1]);

    if (state.is_finished()) {
        if (state.winner) {
            std::cout << "\n*** Side " << static_cast<int>(*state.winner) << " wins ***" << std::endl;
        } else {
            std::cout << "\n*** Tie ***" << std::endl;
        }
    }
}

void show_log(const std::vector<LogEntry>& entries) {
    for (const auto& e : entries) {
        std::cout << "  [T" << e.turn << "] " << e.event;
        if (e.side >= 0) std::cout << " p" << e.side;
        if (!e.detail.empty()) std::cout << " " << e.detail;
        if (e.amount != 0) std::cout << " " << e.amount;
        std::cout << std::endl;
    }
}

void show_actions(SideID side, const std::vector<LegalAction>& actions) {
    std::cout << "\n+-------------------------------------------------------------+" << std::endl;
    std::cout << "|  SIDE " << static_cast<int>(side) << " CANDIDATES (" << actions.size() << "):" << std::endl;
    std::cout << "+-------------------------------------------------------------+" << std::endl;

    for (size_t i = 0; i < actions.size(); i++) {
        const auto& la = actions[i];
        std::cout << "   [" << i << "] " << la.label;
        if (la.disabled) {
            std::cout << "  (disabled: " << la.reason << ")";
        }
        std::cout << std::endl;
    }
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    explicit Console(const ConsoleOptions& opts)
        : opts_(opts)
        , engine_(opts.engine)
    {
        std::cout << "Move dex: " << engine_.get_move_dex().move_count() << " moves, "
                  << engine_.get_formats().format_count() << " formats" << std::endl;
    }

    void cmd_load(const std::vector<std::string>& args) {
        if (args.size() == 3) {
            opts_.team_paths[0] = args[1];
            opts_.team_paths[1] = args[2];
        } else if (args.size() != 1) {
            std::cout << "Usage: load <team1.json> <team2.json>" << std::endl;
            return;
        }

        for (int i = 0; i < 2; i++) {
            if (!serialization::load_team(opts_.team_paths[i], engine_.get_move_dex(), teams_[i])) {
                std::cout << "Failed to load team from: " << opts_.team_paths[i] << std::endl;
                teams_[i].clear();
            }
        }
    }

    void cmd_start() {
        if (teams_[0].empty() || teams_[1].empty()) {
            std::cout << "Load two teams first." << std::endl;
            return;
        }

        try {
            state_ = engine_.create_battle(opts_.format_id, teams_[0], teams_[1], opts_.seed);
        } catch (const EngineError& e) {
            std::cout << "Cannot start battle: " << e.what() << std::endl;
            state_.reset();
            return;
        }

        if (engine_.get_config().trace_enabled) {
            tracer_ = std::make_unique<BattleTracer>(engine_.get_config().trace_dir, opts_.format_id);
            tracer_->log_state(*state_);
        }

        show_log(state_->log);
        show_state_and_actions();
    }

    void show_state_and_actions() {
        if (!state_) return;
        show_state(*state_);
        refresh_actions();
        if (!state_->is_finished()) {
            show_actions(0, actions_[0]);
            show_actions(1, actions_[1]);
            std::cout << "\nEnter two candidate numbers (e.g., 'do 0 0') or 'help' for commands." << std::endl;
        }
    }

    void refresh_actions() {
        for (SideID side = 0; side < 2; ++side) {
            actions_[side] = engine_.get_legal_actions(*state_, side);
        }
    }

    void cmd_do(const std::vector<std::string>& args) {
        if (!state_) {
            std::cout << "No battle in progress. Use 'start'." << std::endl;
            return;
        }
        if (args.size() != 3) {
            std::cout << "Usage: do <side0_index> <side1_index>" << std::endl;
            return;
        }

        Action choices[2];
        for (int i = 0; i < 2; i++) {
            int idx = -1;
            try {
                idx = std::stoi(args[i + 1]);
            } catch (const std::exception&) {
                std::cout << "Not a number: " << args[i + 1] << std::endl;
                return;
            }
            if (idx < 0 || idx >= static_cast<int>(actions_[i].size())) {
                std::cout << "Invalid candidate index for side " << i << ": " << idx << std::endl;
                return;
            }
            choices[i] = actions_[i][idx].action;
        }

        if (tracer_) tracer_->log_choices(*state_, choices[0], choices[1]);

        try {
            AdvanceResult result = engine_.advance(*state_, choices[0], choices[1]);
            state_ = std::move(result.state);
            show_log(result.log);
            if (tracer_) {
                tracer_->log_events(result.log);
                tracer_->log_state(*state_);
                if (state_->is_finished()) {
                    tracer_->log_battle_end(state_->winner, state_->turn);
                    std::cout << "Trace written to " << tracer_->get_log_path() << std::endl;
                }
            }
        } catch (const EngineError& e) {
            std::cout << "Advance failed (" << to_string(e.kind()) << "): " << e.what() << std::endl;
            return;
        }

        show_state_and_actions();
    }

    void cmd_eval(const std::vector<std::string>& args) {
        if (!state_) {
            std::cout << "No battle in progress. Use 'start'." << std::endl;
            return;
        }
        SideID side = (args.size() > 1 && args[1] == "1") ? 1 : 0;

        std::vector<Action> candidates;
        std::vector<std::string> labels;
        for (const auto& la : actions_[side]) {
            if (la.is_enabled()) {
                candidates.push_back(la.action);
                labels.push_back(la.label);
            }
        }

        std::vector<CalcResult> results;
        try {
            results = engine_.evaluate(*state_, side, candidates);
        } catch (const EngineError& e) {
            std::cout << "Evaluate failed: " << e.what() << std::endl;
            return;
        }

        std::cout << std::fixed << std::setprecision(1);
        for (size_t i = 0; i < results.size(); i++) {
            const CalcResult& r = results[i];
            std::cout << "  " << std::left << std::setw(24) << labels[i] << std::right;
            if (r.error) {
                std::cout << " error: " << r.error_message << std::endl;
                continue;
            }
            std::cout << " dmg " << r.damage.min_percent << "-" << r.damage.max_percent << "%"
                      << " acc " << r.accuracy * 100 << "%"
                      << " ohko " << r.ohko_prob * 100 << "%"
                      << " 2hko " << r.twohko_prob * 100 << "%"
                      << " spd " << (r.speed_check.tie ? "tie" : (r.speed_check.faster ? "faster" : "slower"))
                      << " gain " << r.expected_gain;
            if (r.hazard_damage > 0) std::cout << " hazards " << r.hazard_damage << "%";
            std::cout << std::endl;
        }
        std::cout << std::defaultfloat;
    }

    void cmd_log(const std::vector<std::string>& args) {
        if (!state_) return;
        size_t n = 20;
        if (args.size() > 1) {
            try {
                n = static_cast<size_t>(std::stoul(args[1]));
            } catch (const std::exception&) {
                std::cout << "Not a number: " << args[1] << std::endl;
                return;
            }
        }
        size_t start = state_->log.size() > n ? state_->log.size() - n : 0;
        show_log(std::vector<LogEntry>(state_->log.begin() + start, state_->log.end()));
    }

    void cmd_save(const std::vector<std::string>& args) {
        if (!state_ || args.size() != 2) {
            std::cout << "Usage: save <path> (with a battle in progress)" << std::endl;
            return;
        }
        if (serialization::save_battle_state(*state_, args[1])) {
            std::cout << "Saved to " << args[1] << std::endl;
        }
    }

    void cmd_restore(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            std::cout << "Usage: restore <path>" << std::endl;
            return;
        }
        BattleState loaded;
        if (!serialization::load_battle_state(args[1], &engine_.get_move_dex(), loaded)) {
            return;
        }
        try {
            engine_.require_format(loaded.format_id);
            engine_.check_invariants(loaded);
        } catch (const EngineError& e) {
            std::cout << "Rejected state: " << e.what() << std::endl;
            return;
        }
        state_ = std::move(loaded);
        show_state_and_actions();
    }

    void cmd_formats() {
        for (const auto& id : engine_.get_formats().get_all_format_ids()) {
            const FormatRules& f = engine_.require_format(id);
            std::cout << "  " << id << " (gen " << f.generation << ")"
                      << (f.tera_allowed ? " tera" : "")
                      << (f.mega_allowed ? " mega" : "")
                      << (f.zmove_allowed ? " z" : "")
                      << (f.dynamax_allowed ? " dynamax" : "") << std::endl;
        }
    }

    void run() {
        std::cout << "PokeBattle C++ Test Console" << std::endl;
        std::cout << "=====================================\n" << std::endl;

        cmd_load({"load"});
        if (!teams_[0].empty() && !teams_[1].empty()) {
            cmd_start();
        }

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            // Allow just typing two numbers as shorthand for "do <n0> <n1>"
            if (std::isdigit(static_cast<unsigned char>(cmd[0]))) {
                std::vector<std::string> do_args = {"do"};
                do_args.insert(do_args.end(), args.begin(), args.end());
                cmd_do(do_args);
                continue;
            }

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "load") {
                cmd_load(args);
            } else if (cmd == "start" || cmd == "reset" || cmd == "restart") {
                cmd_start();
            } else if (cmd == "format" && args.size() == 2) {
                opts_.format_id = to_id(args[1]);
                std::cout << "Format set to " << opts_.format_id << std::endl;
            } else if (cmd == "formats") {
                cmd_formats();
            } else if (cmd == "show" || cmd == "s") {
                show_state_and_actions();
            } else if (cmd == "actions" || cmd == "a") {
                if (state_) {
                    show_actions(0, actions_[0]);
                    show_actions(1, actions_[1]);
                }
            } else if (cmd == "do" || cmd == "d") {
                cmd_do(args);
            } else if (cmd == "eval" || cmd == "e") {
                cmd_eval(args);
            } else if (cmd == "log") {
                cmd_log(args);
            } else if (cmd == "save") {
                cmd_save(args);
            } else if (cmd == "restore") {
                cmd_restore(args);
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }

private:
    ConsoleOptions opts_;
    BattleEngine engine_;
    std::vector<Pokemon> teams_[2];
    std::optional<BattleState> state_;
    std::vector<LegalAction> actions_[2];
    std::unique_ptr<BattleTracer> tracer_;
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    ConsoleOptions opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    Console console(opts);
    console.run();
    return 0;
}
