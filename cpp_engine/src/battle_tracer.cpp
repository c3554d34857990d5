/**
 * PokeBattle Engine - Battle Tracer Implementation
 */

#include "battle_tracer.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace pokebattle {

namespace {

std::tm local_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    return *std::localtime(&time_t);
}

std::string format_boosts(const Boosts& b) {
    std::ostringstream out;
    const std::pair<const char*, int> stages[] = {
        {"atk", b.atk}, {"def", b.def}, {"spa", b.spa}, {"spd", b.spd},
        {"spe", b.spe}, {"accuracy", b.accuracy}, {"evasion", b.evasion},
    };
    bool first = true;
    for (const auto& [name, value] : stages) {
        if (value == 0) continue;
        if (!first) out << ", ";
        out << name << " " << std::showpos << value << std::noshowpos;
        first = false;
    }
    return out.str();
}

} // anonymous namespace

BattleTracer::BattleTracer(const std::string& output_dir, const std::string& label) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Tracer] Failed to create trace directory: " << output_dir
                  << " (" << ec.message() << ")" << std::endl;
        enabled_ = false;
        return;
    }

    std::tm tm = local_now();

    std::ostringstream filename;
    filename << output_dir << "/battle_";
    if (!label.empty()) filename << label << "_";
    filename << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Tracer] Failed to open trace file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE TRACE - FULL STATE PER TURN\n";
    log_file_ << "Started: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Tracer] Logging to: " << log_path_ << std::endl;
}

BattleTracer::~BattleTracer() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string BattleTracer::describe_action(const Side& side, const Action& action) {
    std::string desc = action_to_string(action);

    int slot = action_move_slot(action);
    if (slot >= 0 && side.active && slot < static_cast<int>(side.active->moves.size())) {
        desc += " [" + side.active->moves[slot].move.name + "]";
    }
    if (const auto* sw = std::get_if<SwitchAction>(&action)) {
        if (sw->bench_index >= 0 && sw->bench_index < side.get_bench_count()) {
            desc += " -> " + side.bench[sw->bench_index].species;
        }
    }
    return desc;
}

std::string BattleTracer::format_pokemon_line(const Pokemon& p, const std::string& label) const {
    std::ostringstream line;

    line << label << ":  " << p.species << " L" << p.level;
    line << " | HP: " << p.current_hp << "/" << p.max_hp;
    line << " | Status: " << to_string(p.status);
    if (p.status == StatusCondition::SLEEP) line << " (" << p.sleep_turns << ")";
    if (p.status == StatusCondition::TOXIC) line << " (" << p.toxic_counter << ")";
    line << " | Item: " << (p.item.empty() ? "(none)" : p.item);
    line << " | Ability: " << p.ability;

    std::string boosts = format_boosts(p.boosts);
    if (!boosts.empty()) line << " | Boosts: [" << boosts << "]";

    line << " | Moves: [";
    for (size_t i = 0; i < p.moves.size(); i++) {
        if (i > 0) line << ", ";
        line << p.moves[i].move.id << " " << p.moves[i].pp << "/" << p.moves[i].max_pp;
    }
    line << "]";

    if (!p.volatiles.empty()) {
        line << " | Volatiles: [";
        bool first = true;
        for (const auto& [kind, v] : p.volatiles) {
            if (!first) line << ", ";
            line << to_string(kind);
            if (v.turns_left >= 0) line << " " << v.turns_left;
            if (!v.move.empty()) line << " " << v.move;
            first = false;
        }
        line << "]";
    }

    if (p.tera.used) line << " | Tera: " << to_string(p.tera.type);
    if (p.mega_evolved) line << " | Mega";
    if (p.dynamaxed) line << " | Dynamax";
    return line.str();
}

std::string BattleTracer::format_side(const Side& s) const {
    std::ostringstream out;
    out << "[SIDE " << static_cast<int>(s.id) << (s.name.empty() ? "" : " " + s.name) << "]\n";

    if (s.active) {
        out << format_pokemon_line(*s.active, "ACTIVE") << "\n";
    } else {
        out << "ACTIVE:  (Empty)\n";
    }
    for (size_t i = 0; i < s.bench.size(); i++) {
        out << format_pokemon_line(s.bench[i], "BENCH " + std::to_string(i)) << "\n";
    }

    out << "HAZARDS: SR=" << (s.hazards.stealth_rock ? 1 : 0)
        << " Spikes=" << s.hazards.spikes
        << " TSpikes=" << s.hazards.toxic_spikes
        << " Web=" << (s.hazards.sticky_web ? 1 : 0) << "\n";

    if (!s.screens.empty() || !s.conditions.empty()) {
        out << "CONDITIONS: [";
        bool first = true;
        for (const auto& [kind, turns] : s.screens) {
            if (!first) out << ", ";
            out << to_string(kind) << " " << turns;
            first = false;
        }
        for (const auto& [kind, turns] : s.conditions) {
            if (!first) out << ", ";
            out << to_string(kind) << " " << turns;
            first = false;
        }
        out << "]\n";
    }

    out << "USED: tera=" << s.tera_used << " mega=" << s.mega_used
        << " z=" << s.zmove_used << " dynamax=" << s.dynamax_used;
    if (s.forced_switch) out << " | FORCED SWITCH";
    out << "\n";
    return out.str();
}

void BattleTracer::log_choices(const BattleState& state, const Action& side0, const Action& side1) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << state.turn << "] P0: " << describe_action(state.sides[0], side0)
              << " | P1: " << describe_action(state.sides[1], side1) << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void BattleTracer::log_events(const std::vector<LogEntry>& entries) {
    if (!enabled_ || !log_file_.is_open()) return;

    for (const auto& e : entries) {
        log_file_ << "  " << e.event;
        if (e.side >= 0) log_file_ << " p" << e.side;
        if (!e.detail.empty()) log_file_ << " " << e.detail;
        if (e.amount != 0) log_file_ << " " << e.amount;
        log_file_ << "\n";
    }
    log_file_ << "\n";
    log_file_.flush();
}

void BattleTracer::log_state(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << format_side(state.sides[0]) << "\n";
    log_file_ << format_side(state.sides[1]) << "\n";

    log_file_ << "[FIELD]\n";
    log_file_ << "Weather: " << to_string(state.field.weather);
    if (state.field.weather != Weather::NONE) {
        if (state.field.weather_permanent) log_file_ << " (permanent)";
        else log_file_ << " (" << state.field.weather_turns << ")";
    }
    log_file_ << " | Terrain: " << to_string(state.field.terrain);
    if (state.field.terrain != Terrain::NONE) {
        if (state.field.terrain_permanent) log_file_ << " (permanent)";
        else log_file_ << " (" << state.field.terrain_turns << ")";
    }
    log_file_ << "\n";

    log_file_ << "Format: " << state.format_id
              << " | Phase: " << to_string(state.phase)
              << " | Turn: " << state.turn << "\n";

    log_file_ << std::string(80, '=') << "\n\n";
    log_file_.flush();
}

void BattleTracer::log_battle_end(std::optional<SideID> winner, int turns) {
    if (!enabled_ || !log_file_.is_open()) return;

    std::tm tm = local_now();

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (winner.has_value()) {
        log_file_ << "Winner: Side " << static_cast<int>(*winner) << "\n";
    } else {
        log_file_ << "Result: Tie\n";
    }
    log_file_ << "Turns: " << turns << "\n";
    log_file_ << "Ended: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace pokebattle
