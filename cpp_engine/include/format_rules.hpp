/**
 * PokeBattle Engine - Format Rules
 *
 * Rule sets keyed by format id. Built-in formats are registered at
 * construction; more can be loaded from a JSON file. Looking up any other
 * id throws UnsupportedFormat before the engine does any work.
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {

struct FormatClauses {
    bool sleep = false;
    bool species = false;
    bool evasion = false;
    bool ohko = false;
};

struct FormatRules {
    FormatID id;
    std::string version = "1.0.0";
    std::string dex_version = "gen9";
    int generation = 9;

    bool tera_allowed = false;
    bool mega_allowed = false;
    bool zmove_allowed = false;
    bool dynamax_allowed = false;

    FormatClauses clauses;
};

class FormatRegistry {
public:
    FormatRegistry();
    ~FormatRegistry() = default;

    /**
     * Load additional formats from a JSON file:
     *   {"formats": [{"id": "...", "generation": 9, "tera_allowed": true,
     *                 "clauses": {"sleep": true}}, ...]}
     * Existing ids are replaced.
     */
    bool load_from_json(const std::string& filepath);

    void register_format(FormatRules rules);

    // Returns nullptr if the format is unknown
    const FormatRules* get_format(const FormatID& id) const;

    // Throws UnsupportedFormat if the format is unknown
    const FormatRules& require(const FormatID& id) const;

    bool has_format(const FormatID& id) const;

    std::vector<FormatID> get_all_format_ids() const;

    size_t format_count() const { return formats_.size(); }

    static FormatRules parse_format(const nlohmann::json& format_json);

private:
    std::unordered_map<FormatID, FormatRules> formats_;

    void register_builtin_formats();
};

} // namespace pokebattle
