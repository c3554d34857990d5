/**
 * PokeBattle Engine - Format Rules Implementation
 */

#include "format_rules.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace pokebattle {

FormatRegistry::FormatRegistry() {
    register_builtin_formats();
}

void FormatRegistry::register_builtin_formats() {
    FormatClauses standard;
    standard.sleep = true;
    standard.species = true;
    standard.evasion = true;
    standard.ohko = true;

    FormatRules ou;
    ou.id = "gen9ou";
    ou.generation = 9;
    ou.dex_version = "gen9";
    ou.tera_allowed = true;
    ou.clauses = standard;
    register_format(ou);

    FormatRules ubers = ou;
    ubers.id = "gen9ubers";
    register_format(ubers);

    FormatRules natdex = ou;
    natdex.id = "gen9nationaldex";
    natdex.mega_allowed = true;
    natdex.zmove_allowed = true;
    register_format(natdex);

    FormatRules bss;
    bss.id = "gen8battlestadiumsingles";
    bss.generation = 8;
    bss.dex_version = "gen8";
    bss.dynamax_allowed = true;
    bss.clauses.species = true;
    register_format(bss);

    FormatRules gen7;
    gen7.id = "gen7ou";
    gen7.generation = 7;
    gen7.dex_version = "gen7";
    gen7.mega_allowed = true;
    gen7.zmove_allowed = true;
    gen7.clauses = standard;
    register_format(gen7);
}

void FormatRegistry::register_format(FormatRules rules) {
    FormatID id = rules.id;
    formats_[id] = std::move(rules);
}

bool FormatRegistry::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[FormatRegistry] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);

        if (!data.contains("formats") || !data["formats"].is_array()) {
            std::cerr << "[FormatRegistry] No 'formats' array found" << std::endl;
            return false;
        }

        int format_count = 0;
        for (const auto& format_json : data["formats"]) {
            FormatRules rules = parse_format(format_json);
            if (!rules.id.empty()) {
                register_format(std::move(rules));
                format_count++;
            }
        }

        std::cout << "[FormatRegistry] Loaded " << format_count << " formats" << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[FormatRegistry] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[FormatRegistry] Error: " << e.what() << std::endl;
        return false;
    }
}

FormatRules FormatRegistry::parse_format(const json& format_json) {
    FormatRules rules;
    rules.id = to_id(format_json.value("id", ""));
    rules.version = format_json.value("version", rules.version);
    rules.dex_version = format_json.value("dex_version", rules.dex_version);
    rules.generation = format_json.value("generation", rules.generation);
    rules.tera_allowed = format_json.value("tera_allowed", false);
    rules.mega_allowed = format_json.value("mega_allowed", false);
    rules.zmove_allowed = format_json.value("zmove_allowed", false);
    rules.dynamax_allowed = format_json.value("dynamax_allowed", false);

    if (format_json.contains("clauses") && format_json["clauses"].is_object()) {
        const auto& c = format_json["clauses"];
        rules.clauses.sleep = c.value("sleep", false);
        rules.clauses.species = c.value("species", false);
        rules.clauses.evasion = c.value("evasion", false);
        rules.clauses.ohko = c.value("ohko", false);
    }
    return rules;
}

const FormatRules* FormatRegistry::get_format(const FormatID& id) const {
    auto it = formats_.find(id);
    if (it != formats_.end()) {
        return &it->second;
    }
    return nullptr;
}

const FormatRules& FormatRegistry::require(const FormatID& id) const {
    const FormatRules* rules = get_format(id);
    if (!rules) {
        throw UnsupportedFormat(id);
    }
    return *rules;
}

bool FormatRegistry::has_format(const FormatID& id) const {
    return formats_.find(id) != formats_.end();
}

std::vector<FormatID> FormatRegistry::get_all_format_ids() const {
    std::vector<FormatID> ids;
    ids.reserve(formats_.size());
    for (const auto& [id, _] : formats_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace pokebattle
