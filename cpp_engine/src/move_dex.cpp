/**
 * PokeBattle Engine - Move Dex Implementation
 *
 * Loads move definitions from JSON files using nlohmann/json.
 */

#include "move_dex.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace pokebattle {

MoveDex::MoveDex() {
    register_move(struggle());
    register_move(confusion_self_hit());
}

const Move& MoveDex::struggle() {
    static const Move move = [] {
        Move m;
        m.id = move_ids::STRUGGLE;
        m.name = "Struggle";
        m.type = PokeType::TYPELESS;
        m.category = MoveCategory::PHYSICAL;
        m.base_power = 50;
        m.always_hits = true;
        m.flags.contact = true;
        m.pp = 1;
        return m;
    }();
    return move;
}

const Move& MoveDex::confusion_self_hit() {
    static const Move move = [] {
        Move m;
        m.id = move_ids::CONFUSION_SELF_HIT;
        m.name = "Confusion Self-Hit";
        m.type = PokeType::TYPELESS;
        m.category = MoveCategory::PHYSICAL;
        m.base_power = 40;
        m.always_hits = true;
        m.pp = 1;
        return m;
    }();
    return move;
}

bool MoveDex::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[MoveDex] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);

        if (!data.contains("moves") || !data["moves"].is_array()) {
            std::cerr << "[MoveDex] No 'moves' array found" << std::endl;
            return false;
        }

        int move_count = 0;
        for (const auto& move_json : data["moves"]) {
            Move move = parse_move(move_json);
            if (!move.id.empty()) {
                register_move(std::move(move));
                move_count++;
            }
        }

        std::cout << "[MoveDex] Loaded " << move_count << " moves" << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[MoveDex] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[MoveDex] Error: " << e.what() << std::endl;
        return false;
    }
}

void MoveDex::register_move(Move move) {
    MoveID id = move.id;
    moves_[id] = std::move(move);
}

Move MoveDex::parse_move(const json& move_json) {
    Move move;

    move.name = move_json.value("name", "");
    move.id = to_id(move_json.value("id", move.name));
    if (move.id.empty()) {
        return move;  // Invalid move
    }
    if (move.name.empty()) {
        move.name = move.id;
    }

    move.type = parse_type(move_json.value("type", "Normal"));
    move.category = parse_category(move_json.value("category", "Status"));
    move.base_power = move_json.value("basePower", 0);
    move.priority = move_json.value("priority", 0);
    move.target = parse_target(move_json.value("target", "normal"));
    move.pp = move_json.value("pp", 5);
    move.crit_stage = move_json.value("critRatio", 1) - 1;
    move.is_z = move_json.value("isZ", false);
    move.is_max = move_json.value("isMax", false);

    // Accuracy: true = always hits, otherwise percent (or fraction <= 1)
    if (move_json.contains("accuracy")) {
        const auto& acc = move_json["accuracy"];
        if (acc.is_boolean()) {
            move.always_hits = acc.get<bool>();
            move.accuracy = 1.0;
        } else if (acc.is_number()) {
            double value = acc.get<double>();
            move.accuracy = value > 1.0 ? value / 100.0 : value;
        }
    }
    move.always_hits = move.always_hits || move_json.value("alwaysHits", false);

    if (move_json.contains("flags") && move_json["flags"].is_object()) {
        const auto& f = move_json["flags"];
        auto flag = [&f](const char* name) {
            return f.contains(name) && (f[name].is_boolean() ? f[name].get<bool>() : f[name].get<int>() != 0);
        };
        move.flags.contact = flag("contact");
        move.flags.sound = flag("sound");
        move.flags.punch = flag("punch");
        move.flags.bite = flag("bite");
        move.flags.pulse = flag("pulse");
        move.flags.powder = flag("powder");
        move.flags.charge = flag("charge");
        move.flags.recharge = flag("recharge");
        move.flags.gravity_banned = flag("gravity");
        move.flags.thaws_user = flag("defrost");
    }

    if (move_json.contains("secondaries") && move_json["secondaries"].is_array()) {
        for (const auto& sec_json : move_json["secondaries"]) {
            move.secondaries.push_back(parse_secondary(sec_json));
        }
    }

    return move;
}

Secondary MoveDex::parse_secondary(const json& sec_json) {
    Secondary sec;
    sec.kind = parse_secondary_kind(sec_json.at("kind").get<std::string>());

    double chance = sec_json.value("chance", 100.0);
    sec.chance = std::clamp(chance > 1.0 ? chance / 100.0 : chance, 0.0, 1.0);

    if (sec_json.contains("status")) sec.status = parse_status(sec_json["status"].get<std::string>());
    if (sec_json.contains("volatile")) sec.volatile_kind = parse_volatile(sec_json["volatile"].get<std::string>());
    if (sec_json.contains("stat")) sec.stat = parse_stat(sec_json["stat"].get<std::string>());
    sec.stages = sec_json.value("stages", 0);
    sec.fraction = sec_json.value("fraction", 0.0);
    if (sec_json.contains("hazard")) sec.hazard = parse_hazard(sec_json["hazard"].get<std::string>());
    if (sec_json.contains("screen")) sec.screen = parse_screen(sec_json["screen"].get<std::string>());
    if (sec_json.contains("weather")) sec.weather = parse_weather(sec_json["weather"].get<std::string>());
    if (sec_json.contains("terrain")) sec.terrain = parse_terrain(sec_json["terrain"].get<std::string>());
    if (sec_json.contains("sideCondition")) {
        sec.side_condition = parse_side_condition(sec_json["sideCondition"].get<std::string>());
    }
    return sec;
}

const Move* MoveDex::get_move(const MoveID& move_id) const {
    auto it = moves_.find(move_id);
    if (it != moves_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool MoveDex::has_move(const MoveID& move_id) const {
    return moves_.find(move_id) != moves_.end();
}

std::vector<MoveID> MoveDex::get_all_move_ids() const {
    std::vector<MoveID> ids;
    ids.reserve(moves_.size());
    for (const auto& [id, _] : moves_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace pokebattle
