/**
 * PokeBattle Engine - Effect Table Implementation
 */

#include "effect_table.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace pokebattle {

// ============================================================================
// STRING CONVERSION
// ============================================================================

const char* to_string(TriggerPhase phase) {
    switch (phase) {
        case TriggerPhase::ON_SWITCH_IN: return "on_switch_in";
        case TriggerPhase::ON_SWITCH_OUT: return "on_switch_out";
        case TriggerPhase::BEFORE_MOVE: return "before_move";
        case TriggerPhase::MODIFY_POWER: return "modify_power";
        case TriggerPhase::MODIFY_ATTACK: return "modify_attack";
        case TriggerPhase::MODIFY_DEFENSE: return "modify_defense";
        case TriggerPhase::MODIFY_SPEED: return "modify_speed";
        case TriggerPhase::MODIFY_PRIORITY: return "modify_priority";
        case TriggerPhase::MODIFY_ACCURACY: return "modify_accuracy";
        case TriggerPhase::ON_DAMAGING_HIT: return "on_damaging_hit";
        case TriggerPhase::ON_CONTACT_HIT: return "on_contact_hit";
        case TriggerPhase::ON_TAKING_DAMAGE: return "on_taking_damage";
        case TriggerPhase::END_OF_TURN: return "end_of_turn";
        case TriggerPhase::ON_TRY_HIT: return "on_try_hit";
        case TriggerPhase::PASSIVE: return "passive";
        default: return "unknown";
    }
}

const char* to_string(EffectKind kind) {
    switch (kind) {
        case EffectKind::DAMAGE_MODIFIER: return "damage_modifier";
        case EffectKind::POWER_MODIFIER: return "power_modifier";
        case EffectKind::STAT_MODIFIER: return "stat_modifier";
        case EffectKind::SPEED_MODIFIER: return "speed_modifier";
        case EffectKind::TYPE_IMMUNITY: return "type_immunity";
        case EffectKind::HAZARD_IMMUNITY: return "hazard_immunity";
        case EffectKind::STATUS_IMMUNITY: return "status_immunity";
        case EffectKind::INDIRECT_DAMAGE_IMMUNITY: return "indirect_damage_immunity";
        case EffectKind::STAT_CHANGE_ON_TRIGGER: return "stat_change_on_trigger";
        case EffectKind::HEAL_FRACTION: return "heal_fraction";
        case EffectKind::DAMAGE_FRACTION: return "damage_fraction";
        case EffectKind::SET_WEATHER: return "set_weather";
        case EffectKind::SET_TERRAIN: return "set_terrain";
        case EffectKind::PRIORITY_MODIFIER: return "priority_modifier";
        case EffectKind::CHOICE_LOCK: return "choice_lock";
        case EffectKind::SURVIVE_AT_ONE: return "survive_at_one";
        case EffectKind::IGNORE_BOOSTS: return "ignore_boosts";
        case EffectKind::IGNORE_ABILITIES: return "ignore_abilities";
        case EffectKind::IGNORE_SCREENS: return "ignore_screens";
        case EffectKind::BLOCK_STAT_DROP: return "block_stat_drop";
        case EffectKind::TYPE_CHANGE: return "type_change";
        case EffectKind::STATUS_MOVE_BLOCK: return "status_move_block";
        case EffectKind::CURE_ON_SWITCH_OUT: return "cure_on_switch_out";
        case EffectKind::DURATION_EXTENSION: return "duration_extension";
        case EffectKind::ESCAPE_TRAP: return "escape_trap";
        default: return "unknown";
    }
}

const char* to_string(EffectSource source) {
    return source == EffectSource::ABILITY ? "ability" : "item";
}

TriggerPhase parse_trigger_phase(const std::string& s) {
    for (int i = 0; i <= static_cast<int>(TriggerPhase::PASSIVE); ++i) {
        auto phase = static_cast<TriggerPhase>(i);
        if (s == to_string(phase)) return phase;
    }
    throw std::invalid_argument("unknown trigger phase: '" + s + "'");
}

EffectKind parse_effect_kind(const std::string& s) {
    for (int i = 0; i <= static_cast<int>(EffectKind::ESCAPE_TRAP); ++i) {
        auto kind = static_cast<EffectKind>(i);
        if (s == to_string(kind)) return kind;
    }
    throw std::invalid_argument("unknown effect kind: '" + s + "'");
}

// ============================================================================
// REGISTRATION
// ============================================================================

std::string EffectTable::make_key(TriggerPhase phase, EffectSource source, const std::string& id) {
    return std::string(to_string(phase)) + ":" + to_string(source) + ":" + id;
}

std::string EffectTable::make_id_key(EffectSource source, const std::string& id) {
    return std::string(to_string(source)) + ":" + id;
}

void EffectTable::register_entry(EffectEntry entry) {
    kinds_by_id_[make_id_key(entry.source, entry.id)].push_back(entry.kind);
    std::string key = make_key(entry.phase, entry.source, entry.id);
    entries_[key].push_back(std::move(entry));
    entry_count_++;
}

// ============================================================================
// LOOKUP
// ============================================================================

const std::vector<EffectEntry>& EffectTable::lookup(TriggerPhase phase, EffectSource source,
                                                    const std::string& id) const {
    static const std::vector<EffectEntry> empty;
    if (id.empty()) {
        return empty;
    }
    auto it = entries_.find(make_key(phase, source, id));
    if (it != entries_.end()) {
        return it->second;
    }
    return empty;
}

bool EffectTable::has_effect(TriggerPhase phase, EffectSource source, const std::string& id) const {
    return !lookup(phase, source, id).empty();
}

bool EffectTable::has_kind(EffectSource source, const std::string& id, EffectKind kind) const {
    auto it = kinds_by_id_.find(make_id_key(source, id));
    if (it == kinds_by_id_.end()) {
        return false;
    }
    for (EffectKind k : it->second) {
        if (k == kind) return true;
    }
    return false;
}

// ============================================================================
// JSON LOADING
// ============================================================================

bool EffectTable::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[EffectTable] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);

        if (!data.contains("effects") || !data["effects"].is_array()) {
            std::cerr << "[EffectTable] No 'effects' array found" << std::endl;
            return false;
        }

        int count = 0;
        for (const auto& entry_json : data["effects"]) {
            EffectEntry entry = parse_entry(entry_json);
            if (!entry.id.empty()) {
                register_entry(std::move(entry));
                count++;
            }
        }

        std::cout << "[EffectTable] Loaded " << count << " effect entries" << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[EffectTable] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EffectTable] Error: " << e.what() << std::endl;
        return false;
    }
}

EffectEntry EffectTable::parse_entry(const json& j) {
    EffectEntry e;
    e.id = to_id(j.value("id", ""));
    e.source = j.value("source", "ability") == "item" ? EffectSource::ITEM : EffectSource::ABILITY;
    e.phase = parse_trigger_phase(j.value("phase", "passive"));
    e.kind = parse_effect_kind(j.at("kind").get<std::string>());

    e.multiplier = j.value("multiplier", 1.0);
    if (j.contains("stat")) e.stat = parse_stat(j["stat"].get<std::string>());
    e.stages = j.value("stages", 0);
    e.fraction = j.value("fraction", 0.0);
    e.amount = j.value("amount", 0);
    if (j.contains("type")) e.type = parse_type(j["type"].get<std::string>());
    if (j.contains("status")) e.status = parse_status(j["status"].get<std::string>());
    if (j.contains("weather")) e.weather = parse_weather(j["weather"].get<std::string>());
    if (j.contains("terrain")) e.terrain = parse_terrain(j["terrain"].get<std::string>());
    e.scope = j.value("scope", "");
    if (j.contains("add_volatile")) e.add_volatile = parse_volatile(j["add_volatile"].get<std::string>());

    e.target_foe = j.value("target_foe", false);
    e.consumed = j.value("consumed", false);
    e.ignores_burn = j.value("ignores_burn", false);
    e.ignores_paralysis = j.value("ignores_paralysis", false);
    e.always_hits = j.value("always_hits", false);
    e.stab = j.value("stab", 0.0);
    e.suppresses_secondaries = j.value("suppresses_secondaries", false);
    e.fails_vs_dark = j.value("fails_vs_dark", false);
    e.weather_only = j.value("weather_only", false);

    if (j.contains("when") && j["when"].is_object()) {
        const auto& w = j["when"];
        if (w.contains("category")) e.when.category = parse_category(w["category"].get<std::string>());
        if (w.contains("move_type")) e.when.move_type = parse_type(w["move_type"].get<std::string>());
        e.when.move_flag = w.value("move_flag", "");
        if (w.contains("weather")) e.when.weather = parse_weather(w["weather"].get<std::string>());
        if (w.contains("terrain")) e.when.terrain = parse_terrain(w["terrain"].get<std::string>());
        e.when.requires_status = w.value("requires_status", false);
        if (w.contains("holder_status")) e.when.holder_status = parse_status(w["holder_status"].get<std::string>());
        e.when.requires_full_hp = w.value("requires_full_hp", false);
        e.when.hp_at_most = w.value("hp_at_most", 1.0);
        e.when.super_effective = w.value("super_effective", false);
        e.when.not_very_effective = w.value("not_very_effective", false);
        e.when.max_base_power = w.value("max_base_power", 0);
        e.when.chance_secondaries = w.value("chance_secondaries", false);
        if (w.contains("holder_type")) e.when.holder_type = parse_type(w["holder_type"].get<std::string>());
        if (w.contains("holder_not_type")) e.when.holder_not_type = parse_type(w["holder_not_type"].get<std::string>());
        if (w.contains("holder_volatile")) e.when.holder_volatile = parse_volatile(w["holder_volatile"].get<std::string>());
        e.when.item_consumed = w.value("item_consumed", false);
    }
    return e;
}

} // namespace pokebattle
