/**
 * PokeBattle Engine - Ability/Item Effect Table
 *
 * Central registry for ability and item behavior. Instead of code paths
 * per ability, every ability/item is a list of data entries keyed by
 * (trigger phase, source, id). Each entry names one effect from a small
 * closed set plus its parameters and gating conditions; the calculator
 * and the resolution engine interpret the entries.
 *
 * Example:
 *   // Life Orb: x1.3 damage, 10% recoil on a damaging hit
 *   table.register_entry(item("lifeorb", TriggerPhase::ON_DAMAGING_HIT,
 *                             EffectKind::DAMAGE_MODIFIER).mult(1.3));
 *
 *   for (const EffectEntry* e : table.lookup(TriggerPhase::ON_DAMAGING_HIT,
 *                                            EffectSource::ITEM, "lifeorb")) { ... }
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {

// ============================================================================
// ENUMS
// ============================================================================

enum class TriggerPhase : uint8_t {
    ON_SWITCH_IN,
    ON_SWITCH_OUT,
    BEFORE_MOVE,
    MODIFY_POWER,
    MODIFY_ATTACK,
    MODIFY_DEFENSE,
    MODIFY_SPEED,
    MODIFY_PRIORITY,
    MODIFY_ACCURACY,
    ON_DAMAGING_HIT,     // holder is the attacker
    ON_CONTACT_HIT,      // holder was hit by a contact move
    ON_TAKING_DAMAGE,    // holder is the defender
    END_OF_TURN,
    ON_TRY_HIT,          // immunity checks
    PASSIVE              // always-on flags (choice lock, ignore boosts, ...)
};

enum class EffectKind : uint8_t {
    DAMAGE_MODIFIER,
    POWER_MODIFIER,
    STAT_MODIFIER,
    SPEED_MODIFIER,
    TYPE_IMMUNITY,
    HAZARD_IMMUNITY,
    STATUS_IMMUNITY,
    INDIRECT_DAMAGE_IMMUNITY,
    STAT_CHANGE_ON_TRIGGER,
    HEAL_FRACTION,
    DAMAGE_FRACTION,
    SET_WEATHER,
    SET_TERRAIN,
    PRIORITY_MODIFIER,
    CHOICE_LOCK,
    SURVIVE_AT_ONE,
    IGNORE_BOOSTS,
    IGNORE_ABILITIES,
    IGNORE_SCREENS,
    BLOCK_STAT_DROP,
    TYPE_CHANGE,
    STATUS_MOVE_BLOCK,
    CURE_ON_SWITCH_OUT,
    DURATION_EXTENSION,
    ESCAPE_TRAP
};

enum class EffectSource : uint8_t {
    ABILITY,
    ITEM
};

const char* to_string(TriggerPhase phase);
const char* to_string(EffectKind kind);
const char* to_string(EffectSource source);

TriggerPhase parse_trigger_phase(const std::string& s);
EffectKind parse_effect_kind(const std::string& s);

// ============================================================================
// ENTRY DATA
// ============================================================================

/**
 * Conditions gating an entry. Unset fields do not constrain.
 *
 * holder_status POISON also matches TOXIC.
 */
struct EffectCondition {
    std::optional<MoveCategory> category;
    std::optional<PokeType> move_type;
    std::string move_flag;               // "contact", "punch", "bite", "pulse", "sound"
    std::optional<Weather> weather;
    std::optional<Terrain> terrain;
    bool requires_status = false;
    std::optional<StatusCondition> holder_status;
    bool requires_full_hp = false;
    double hp_at_most = 1.0;             // holder HP fraction threshold
    bool super_effective = false;
    bool not_very_effective = false;
    int max_base_power = 0;              // 0 = no limit
    bool chance_secondaries = false;
    std::optional<PokeType> holder_type;
    std::optional<PokeType> holder_not_type;
    std::optional<VolatileKind> holder_volatile;
    bool item_consumed = false;
};

/**
 * EffectEntry - One data row.
 *
 * Field use by kind:
 *   *_MODIFIER           multiplier (STAT_MODIFIER also `stat`)
 *   PRIORITY_MODIFIER    amount
 *   TYPE_IMMUNITY        type; optional fraction (heal), stat/stages (boost),
 *                        add_volatile
 *   STATUS_IMMUNITY      status (NONE = every status)
 *   STAT_CHANGE_ON_TRIGGER stat, stages, target_foe
 *   HEAL/DAMAGE_FRACTION fraction
 *   SET_WEATHER/TERRAIN  weather / terrain
 *   TYPE_CHANGE          type (+ multiplier on the converted move)
 *   DURATION_EXTENSION   scope ("screens", "weather", "terrain"), amount,
 *                        optional weather
 */
struct EffectEntry {
    std::string id;
    EffectSource source = EffectSource::ABILITY;
    TriggerPhase phase = TriggerPhase::PASSIVE;
    EffectKind kind = EffectKind::DAMAGE_MODIFIER;

    double multiplier = 1.0;
    Stat stat = Stat::ATK;
    int stages = 0;
    double fraction = 0.0;
    int amount = 0;
    PokeType type = PokeType::NORMAL;
    StatusCondition status = StatusCondition::NONE;
    Weather weather = Weather::NONE;
    Terrain terrain = Terrain::NONE;
    std::string scope;
    std::optional<VolatileKind> add_volatile;

    bool target_foe = false;
    bool consumed = false;               // single-use item
    bool ignores_burn = false;
    bool ignores_paralysis = false;
    bool always_hits = false;
    double stab = 0.0;                   // STAB override when > 0
    bool suppresses_secondaries = false;
    bool fails_vs_dark = false;
    bool weather_only = false;           // INDIRECT_DAMAGE_IMMUNITY limited to weather

    EffectCondition when;

    // Fluent setters for the registration tables
    EffectEntry& mult(double m) { multiplier = m; return *this; }
    EffectEntry& on_stat(Stat s) { stat = s; return *this; }
    EffectEntry& boost(Stat s, int n) { stat = s; stages = n; return *this; }
    EffectEntry& frac(double f) { fraction = f; return *this; }
    EffectEntry& amt(int a) { amount = a; return *this; }
    EffectEntry& of_type(PokeType t) { type = t; return *this; }
    EffectEntry& of_status(StatusCondition s) { status = s; return *this; }
    EffectEntry& of_weather(Weather w) { weather = w; return *this; }
    EffectEntry& of_terrain(Terrain t) { terrain = t; return *this; }
    EffectEntry& foe() { target_foe = true; return *this; }
    EffectEntry& single_use() { consumed = true; return *this; }
};

// ============================================================================
// EFFECT TABLE
// ============================================================================

class EffectTable {
public:
    EffectTable() = default;
    ~EffectTable() = default;

    void register_entry(EffectEntry entry);

    /**
     * Load extra entries from JSON:
     *   {"effects": [{"id": "hugepower", "source": "ability",
     *                 "phase": "modify_attack", "kind": "stat_modifier",
     *                 "stat": "atk", "multiplier": 2.0}, ...]}
     */
    bool load_from_json(const std::string& filepath);

    static EffectEntry parse_entry(const nlohmann::json& entry_json);

    // Entries registered for (phase, source, id); empty when none
    const std::vector<EffectEntry>& lookup(TriggerPhase phase, EffectSource source,
                                           const std::string& id) const;

    bool has_effect(TriggerPhase phase, EffectSource source, const std::string& id) const;

    // True if any entry of `kind` exists for this id in any phase
    bool has_kind(EffectSource source, const std::string& id, EffectKind kind) const;

    size_t entry_count() const { return entry_count_; }

private:
    std::unordered_map<std::string, std::vector<EffectEntry>> entries_;
    std::unordered_map<std::string, std::vector<EffectKind>> kinds_by_id_;
    size_t entry_count_ = 0;

    static std::string make_key(TriggerPhase phase, EffectSource source, const std::string& id);
    static std::string make_id_key(EffectSource source, const std::string& id);
};

// Populate with the built-in ability and item data
void register_all_abilities(EffectTable& table);
void register_all_items(EffectTable& table);

} // namespace pokebattle
