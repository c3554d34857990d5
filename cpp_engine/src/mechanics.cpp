/**
 * PokeBattle Engine - Shared Mechanics Implementation
 */

#include "mechanics.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace pokebattle {
namespace mechanics {

// ============================================================================
// STAGE MULTIPLIERS
// ============================================================================

double boost_multiplier(int stage) {
    stage = std::clamp(stage, -MAX_BOOST, MAX_BOOST);
    if (stage >= 0) {
        return (2.0 + stage) / 2.0;
    }
    return 2.0 / (2.0 - stage);
}

double accuracy_multiplier(int stage) {
    stage = std::clamp(stage, -MAX_BOOST, MAX_BOOST);
    if (stage >= 0) {
        return (3.0 + stage) / 3.0;
    }
    return 3.0 / (3.0 - stage);
}

double crit_chance(int crit_stage) {
    switch (crit_stage) {
        case 0: return 1.0 / 24.0;
        case 1: return 1.0 / 8.0;
        case 2: return 1.0 / 2.0;
        default: return crit_stage < 0 ? 0.0 : 1.0;
    }
}

// ============================================================================
// EFFECT-TABLE QUERIES
// ============================================================================

namespace {

bool move_has_flag(const Move& move, const std::string& flag) {
    if (flag == "contact") return move.flags.contact;
    if (flag == "punch") return move.flags.punch;
    if (flag == "bite") return move.flags.bite;
    if (flag == "pulse") return move.flags.pulse;
    if (flag == "sound") return move.flags.sound;
    if (flag == "powder") return move.flags.powder;
    return false;
}

bool status_matches(StatusCondition wanted, StatusCondition actual) {
    if (wanted == StatusCondition::POISON) {
        return actual == StatusCondition::POISON || actual == StatusCondition::TOXIC;
    }
    return wanted == actual;
}

} // anonymous namespace

bool condition_matches(const EffectCondition& c, const MatchContext& ctx) {
    const Pokemon* h = ctx.holder;

    if (c.category && (!ctx.move || ctx.move->category != *c.category)) return false;
    if (c.move_type && (!ctx.move || ctx.move_type != *c.move_type)) return false;
    if (!c.move_flag.empty() && (!ctx.move || !move_has_flag(*ctx.move, c.move_flag))) return false;
    if (c.weather && (!ctx.field || ctx.field->weather != *c.weather)) return false;
    if (c.terrain && (!ctx.field || ctx.field->terrain != *c.terrain)) return false;

    if (c.requires_status) {
        if (!h || h->status == StatusCondition::NONE || h->status == StatusCondition::FAINTED) return false;
    }
    if (c.holder_status && (!h || !status_matches(*c.holder_status, h->status))) return false;
    if (c.requires_full_hp && (!h || !h->at_full_hp())) return false;
    if (c.hp_at_most < 1.0 && (!h || h->hp_fraction() > c.hp_at_most)) return false;

    if (c.super_effective && ctx.effectiveness <= 1.0) return false;
    if (c.not_very_effective && (ctx.effectiveness >= 1.0 || ctx.effectiveness <= 0.0)) return false;
    if (c.max_base_power > 0 && (!ctx.move || ctx.move->base_power > c.max_base_power)) return false;
    if (c.chance_secondaries && (!ctx.move || !ctx.move->has_chance_secondaries())) return false;

    if (c.holder_type && (!h || !h->has_effective_type(*c.holder_type))) return false;
    if (c.holder_not_type && (!h || h->has_effective_type(*c.holder_not_type))) return false;
    if (c.holder_volatile && (!h || !h->has_volatile(*c.holder_volatile))) return false;
    if (c.item_consumed && (!h || !h->item_consumed)) return false;

    return true;
}

bool item_active(const BattleState& state, const Pokemon& holder) {
    return !holder.item.empty() && !state.room_active(SideConditionKind::MAGIC_ROOM);
}

std::vector<const EffectEntry*> collect(const EffectTable& table, const BattleState& state,
                                        const Pokemon& holder, TriggerPhase phase,
                                        bool ability_suppressed) {
    std::vector<const EffectEntry*> out;
    if (!ability_suppressed) {
        for (const auto& e : table.lookup(phase, EffectSource::ABILITY, holder.ability)) {
            out.push_back(&e);
        }
    }
    if (item_active(state, holder)) {
        for (const auto& e : table.lookup(phase, EffectSource::ITEM, holder.item)) {
            out.push_back(&e);
        }
    }
    return out;
}

std::vector<const EffectEntry*> collect_matching(const EffectTable& table, const BattleState& state,
                                                 const Pokemon& holder, TriggerPhase phase,
                                                 const MatchContext& ctx,
                                                 bool ability_suppressed) {
    std::vector<const EffectEntry*> out;
    for (const EffectEntry* e : collect(table, state, holder, phase, ability_suppressed)) {
        if (condition_matches(e->when, ctx)) {
            out.push_back(e);
        }
    }
    return out;
}

bool has_effect_kind(const EffectTable& table, const BattleState& state,
                     const Pokemon& holder, EffectKind kind, bool ability_suppressed) {
    if (!ability_suppressed && table.has_kind(EffectSource::ABILITY, holder.ability, kind)) {
        return true;
    }
    return item_active(state, holder) && table.has_kind(EffectSource::ITEM, holder.item, kind);
}

bool ignores_abilities(const EffectTable& table, const BattleState& state, const Pokemon& attacker) {
    return has_effect_kind(table, state, attacker, EffectKind::IGNORE_ABILITIES);
}

const EffectEntry* survive_at_one_entry(const EffectTable& table, const BattleState& state,
                                        const Pokemon& holder, bool ability_suppressed) {
    MatchContext ctx;
    ctx.holder = &holder;
    ctx.field = &state.field;
    for (const EffectEntry* e : collect_matching(table, state, holder, TriggerPhase::ON_TAKING_DAMAGE,
                                                 ctx, ability_suppressed)) {
        if (e->kind == EffectKind::SURVIVE_AT_ONE) {
            return e;
        }
    }
    return nullptr;
}

bool suppresses_secondaries(const EffectTable& table, const BattleState& state,
                            const Pokemon& attacker, const Move& move) {
    MatchContext ctx;
    ctx.holder = &attacker;
    ctx.move = &move;
    ctx.move_type = move.type;
    ctx.field = &state.field;
    for (const EffectEntry* e : collect_matching(table, state, attacker, TriggerPhase::MODIFY_POWER, ctx)) {
        if (e->suppresses_secondaries) return true;
    }
    return false;
}

bool status_move_blocked(const EffectTable& table, const BattleState& state,
                         const Pokemon& target, bool ability_suppressed) {
    for (const EffectEntry* e : collect(table, state, target, TriggerPhase::ON_TRY_HIT, ability_suppressed)) {
        if (e->kind == EffectKind::STATUS_MOVE_BLOCK) return true;
    }
    return false;
}

// ============================================================================
// POSITIONING AND IMMUNITIES
// ============================================================================

bool is_grounded(const EffectTable& table, const BattleState& state, const Pokemon& pokemon) {
    if (state.room_active(SideConditionKind::GRAVITY)) {
        return true;
    }
    if (pokemon.has_effective_type(PokeType::FLYING)) {
        return false;
    }
    for (const EffectEntry* e : collect(table, state, pokemon, TriggerPhase::ON_TRY_HIT)) {
        if (e->kind == EffectKind::TYPE_IMMUNITY && e->type == PokeType::GROUND) {
            return false;
        }
    }
    return true;
}

bool indirect_damage_immune(const EffectTable& table, const BattleState& state,
                            const Pokemon& pokemon, std::optional<Weather> weather) {
    for (const EffectEntry* e : collect(table, state, pokemon, TriggerPhase::PASSIVE)) {
        if (e->kind != EffectKind::INDIRECT_DAMAGE_IMMUNITY) continue;
        if (!e->weather_only) return true;
        if (!weather) continue;
        if (e->weather == Weather::NONE || e->weather == *weather) return true;
    }
    return false;
}

bool can_receive_status(const EffectTable& table, const BattleState& state, const Pokemon& target,
                        StatusCondition status, bool ability_suppressed) {
    if (status == StatusCondition::NONE || status == StatusCondition::FAINTED) return false;
    if (target.is_fainted() || target.status != StatusCondition::NONE) return false;
    if (is_status_immune_by_type(status, target.effective_types())) return false;

    for (const EffectEntry* e : collect(table, state, target, TriggerPhase::ON_TRY_HIT, ability_suppressed)) {
        if (e->kind != EffectKind::STATUS_IMMUNITY) continue;
        if (e->status == StatusCondition::NONE || status_matches(e->status, status)) {
            return false;
        }
    }

    if (is_grounded(table, state, target)) {
        if (state.field.terrain == Terrain::MISTY) return false;
        if (state.field.terrain == Terrain::ELECTRIC && status == StatusCondition::SLEEP) return false;
    }
    return true;
}

bool is_trapped(const EffectTable& table, const BattleState& state, const Pokemon& pokemon) {
    if (!pokemon.has_volatile(VolatileKind::PARTIAL_TRAP)) return false;
    if (pokemon.has_effective_type(PokeType::GHOST)) return false;
    return !has_effect_kind(table, state, pokemon, EffectKind::ESCAPE_TRAP);
}

// ============================================================================
// SPEED AND PRIORITY
// ============================================================================

int effective_speed(const EffectTable& table, const BattleState& state, SideID side) {
    const Side& s = state.sides[side];
    if (!s.active.has_value()) return 0;
    return effective_speed_of(table, state, side, *s.active);
}

int effective_speed_of(const EffectTable& table, const BattleState& state, SideID side,
                       const Pokemon& pokemon) {
    double speed = pokemon.stats.spe * boost_multiplier(pokemon.boosts.spe);

    MatchContext ctx;
    ctx.holder = &pokemon;
    ctx.field = &state.field;

    bool ignore_paralysis = false;
    for (const EffectEntry* e : collect_matching(table, state, pokemon, TriggerPhase::MODIFY_SPEED, ctx)) {
        if (e->kind != EffectKind::SPEED_MODIFIER) continue;
        speed *= e->multiplier;
        ignore_paralysis = ignore_paralysis || e->ignores_paralysis;
    }

    if (state.sides[side].has_condition(SideConditionKind::TAILWIND)) {
        speed *= 2.0;
    }
    if (pokemon.status == StatusCondition::PARALYSIS && !ignore_paralysis) {
        speed *= 0.5;
    }
    return static_cast<int>(std::floor(speed));
}

int effective_priority(const EffectTable& table, const BattleState& state,
                       const Pokemon& user, const Move& move, bool* prankster) {
    int priority = move.priority;

    MatchContext ctx;
    ctx.holder = &user;
    ctx.move = &move;
    ctx.move_type = move.type;
    ctx.field = &state.field;

    for (const EffectEntry* e : collect_matching(table, state, user, TriggerPhase::MODIFY_PRIORITY, ctx)) {
        if (e->kind != EffectKind::PRIORITY_MODIFIER) continue;
        priority += e->amount;
        if (e->fails_vs_dark && prankster) {
            *prankster = true;
        }
    }

    if (move.id == move_ids::GRASSY_GLIDE && state.field.terrain == Terrain::GRASSY
        && is_grounded(table, state, user)) {
        priority += 1;
    }
    return priority;
}

// ============================================================================
// HAZARDS
// ============================================================================

double hazard_damage_fraction(const EffectTable& table, const BattleState& state,
                              SideID side, const Pokemon& incoming) {
    const Hazards& hz = state.sides[side].hazards;
    if (!hz.stealth_rock && hz.spikes == 0) return 0.0;
    if (has_effect_kind(table, state, incoming, EffectKind::HAZARD_IMMUNITY)) return 0.0;
    if (indirect_damage_immune(table, state, incoming)) return 0.0;

    double fraction = 0.0;
    if (hz.stealth_rock) {
        fraction += 0.125 * type_effectiveness(PokeType::ROCK, incoming.effective_types());
    }
    if (hz.spikes > 0 && is_grounded(table, state, incoming)) {
        switch (std::min(hz.spikes, 3)) {
            case 1: fraction += 1.0 / 8.0; break;
            case 2: fraction += 1.0 / 6.0; break;
            default: fraction += 1.0 / 4.0; break;
        }
    }
    return fraction;
}

StatusCondition toxic_spikes_status(const EffectTable& table, const BattleState& state,
                                    SideID side, const Pokemon& incoming) {
    int layers = state.sides[side].hazards.toxic_spikes;
    if (layers == 0) return StatusCondition::NONE;
    if (!is_grounded(table, state, incoming)) return StatusCondition::NONE;
    if (has_effect_kind(table, state, incoming, EffectKind::HAZARD_IMMUNITY)) return StatusCondition::NONE;

    StatusCondition status = layers >= 2 ? StatusCondition::TOXIC : StatusCondition::POISON;
    if (!can_receive_status(table, state, incoming, status)) return StatusCondition::NONE;
    return status;
}

// ============================================================================
// TYPES AND STAB
// ============================================================================

PokeType resolved_move_type(const EffectTable& table, const BattleState& state,
                            const Pokemon& attacker, const Move& move, double* power_mult) {
    if (power_mult) *power_mult = 1.0;
    if (move.type == PokeType::TYPELESS) return move.type;

    MatchContext ctx;
    ctx.holder = &attacker;
    ctx.move = &move;
    ctx.move_type = move.type;
    ctx.field = &state.field;

    for (const EffectEntry* e : collect_matching(table, state, attacker, TriggerPhase::MODIFY_POWER, ctx)) {
        if (e->kind == EffectKind::TYPE_CHANGE) {
            if (power_mult) *power_mult = e->multiplier;
            return e->type;
        }
    }
    return move.type;
}

double stab_multiplier(const EffectTable& table, const BattleState& state,
                       const Pokemon& attacker, PokeType move_type) {
    if (move_type == PokeType::TYPELESS) return 1.0;

    bool original = has_type(attacker.types, move_type);
    bool tera_match = attacker.tera.used && attacker.tera.type == move_type;
    if (!original && !tera_match) return 1.0;

    double adaptability = 0.0;
    for (const EffectEntry* e : collect(table, state, attacker, TriggerPhase::MODIFY_POWER)) {
        if (e->stab > 0.0) adaptability = e->stab;
    }

    if (original && tera_match) {
        return adaptability > 0.0 ? 2.25 : 2.0;
    }
    return adaptability > 0.0 ? adaptability : 1.5;
}

double matchup(const BattleState& state, PokeType move_type, const Pokemon& defender) {
    std::vector<PokeType> types = defender.effective_types();
    if (move_type == PokeType::GROUND && state.room_active(SideConditionKind::GRAVITY)) {
        types.erase(std::remove(types.begin(), types.end(), PokeType::FLYING), types.end());
    }
    return type_effectiveness(move_type, types);
}

// ============================================================================
// DURATIONS
// ============================================================================

namespace {

int extended_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter,
                      const std::string& scope, Weather weather) {
    for (const EffectEntry* e : collect(table, state, setter, TriggerPhase::PASSIVE)) {
        if (e->kind != EffectKind::DURATION_EXTENSION || e->scope != scope) continue;
        if (scope == "weather" && e->weather != weather) continue;
        return e->amount;
    }
    return 5;
}

} // anonymous namespace

int screen_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter) {
    return extended_duration(table, state, setter, "screens", Weather::NONE);
}

int weather_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter, Weather weather) {
    return extended_duration(table, state, setter, "weather", weather);
}

int terrain_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter) {
    return extended_duration(table, state, setter, "terrain", Weather::NONE);
}

// ============================================================================
// MOVE CONVERSION
// ============================================================================

std::optional<PokeType> zcrystal_type(const ItemID& item) {
    static const std::unordered_map<std::string, PokeType> crystals = {
        {"normaliumz", PokeType::NORMAL},
        {"firiumz", PokeType::FIRE},
        {"wateriumz", PokeType::WATER},
        {"electriumz", PokeType::ELECTRIC},
        {"grassiumz", PokeType::GRASS},
        {"iciumz", PokeType::ICE},
        {"fightiniumz", PokeType::FIGHTING},
        {"poisoniumz", PokeType::POISON},
        {"groundiumz", PokeType::GROUND},
        {"flyiniumz", PokeType::FLYING},
        {"psychiumz", PokeType::PSYCHIC},
        {"buginiumz", PokeType::BUG},
        {"rockiumz", PokeType::ROCK},
        {"ghostiumz", PokeType::GHOST},
        {"dragoniumz", PokeType::DRAGON},
        {"darkiniumz", PokeType::DARK},
        {"steeliumz", PokeType::STEEL},
        {"fairiumz", PokeType::FAIRY},
    };
    auto it = crystals.find(item);
    if (it == crystals.end()) {
        return std::nullopt;
    }
    return it->second;
}

int zmove_power(int bp) {
    if (bp <= 55) return 100;
    if (bp <= 65) return 120;
    if (bp <= 75) return 140;
    if (bp <= 85) return 160;
    if (bp <= 95) return 175;
    if (bp <= 100) return 180;
    if (bp <= 110) return 185;
    if (bp <= 125) return 190;
    if (bp <= 130) return 195;
    return 200;
}

int max_move_power(int bp, PokeType type) {
    bool weak_table = type == PokeType::FIGHTING || type == PokeType::POISON;
    if (bp <= 40) return weak_table ? 70 : 90;
    if (bp <= 50) return weak_table ? 75 : 100;
    if (bp <= 60) return weak_table ? 80 : 110;
    if (bp <= 70) return weak_table ? 85 : 120;
    if (bp <= 100) return weak_table ? 90 : 130;
    if (bp <= 140) return weak_table ? 95 : 140;
    return weak_table ? 100 : 150;
}

Move convert_to_zmove(const Move& base) {
    Move z = base;
    z.id = "z" + base.id;
    z.name = "Z-" + base.name;
    z.base_power = zmove_power(base.base_power);
    z.always_hits = true;
    z.priority = 0;
    z.secondaries.clear();
    z.flags.charge = false;
    z.flags.recharge = false;
    z.is_z = true;
    return z;
}

Move convert_to_max_move(const Move& base) {
    Move max = base;
    max.is_max = true;
    max.always_hits = true;
    max.secondaries.clear();
    max.flags.charge = false;
    max.flags.recharge = false;

    if (base.is_status()) {
        max.id = "maxguard";
        max.name = "Max Guard";
        max.priority = 4;
        max.target = MoveTarget::SELF;
        Secondary guard;
        guard.kind = SecondaryKind::PROTECT;
        max.secondaries.push_back(guard);
        return max;
    }

    max.id = std::string("max") + to_id(to_string(base.type));
    max.name = std::string("Max ") + to_string(base.type);
    max.base_power = max_move_power(base.base_power, base.type);
    max.priority = 0;

    Secondary field;
    switch (base.type) {
        case PokeType::FIRE: field.kind = SecondaryKind::SET_WEATHER; field.weather = Weather::SUN; break;
        case PokeType::WATER: field.kind = SecondaryKind::SET_WEATHER; field.weather = Weather::RAIN; break;
        case PokeType::ROCK: field.kind = SecondaryKind::SET_WEATHER; field.weather = Weather::SAND; break;
        case PokeType::ICE: field.kind = SecondaryKind::SET_WEATHER; field.weather = Weather::HAIL; break;
        case PokeType::ELECTRIC: field.kind = SecondaryKind::SET_TERRAIN; field.terrain = Terrain::ELECTRIC; break;
        case PokeType::GRASS: field.kind = SecondaryKind::SET_TERRAIN; field.terrain = Terrain::GRASSY; break;
        case PokeType::PSYCHIC: field.kind = SecondaryKind::SET_TERRAIN; field.terrain = Terrain::PSYCHIC; break;
        case PokeType::FAIRY: field.kind = SecondaryKind::SET_TERRAIN; field.terrain = Terrain::MISTY; break;
        default: return max;
    }
    max.secondaries.push_back(field);
    return max;
}

// ============================================================================
// TRANSFORMATIONS
// ============================================================================

void apply_terastallize(Side& side, Pokemon& pokemon) {
    pokemon.tera.used = true;
    pokemon.tera.available = false;
    side.tera_used = true;
}

void apply_mega_evolution(Side& side, Pokemon& pokemon) {
    if (!pokemon.mega_forme.has_value()) return;
    const MegaForme& forme = *pokemon.mega_forme;
    int hp_stat = pokemon.stats.hp;
    pokemon.species = forme.species;
    pokemon.stats = forme.stats;
    pokemon.stats.hp = hp_stat;
    pokemon.types = forme.types;
    pokemon.ability = forme.ability;
    pokemon.mega_evolved = true;
    side.mega_used = true;
}

void apply_dynamax(Side& side, Pokemon& pokemon) {
    pokemon.pre_dynamax_max_hp = pokemon.max_hp;
    pokemon.max_hp *= 2;
    pokemon.current_hp *= 2;
    pokemon.dynamaxed = true;
    pokemon.remove_volatile(VolatileKind::CHOICE_LOCK);
    side.dynamax_used = true;
    side.dynamax_turns = 3;
}

void revert_dynamax(Side& side, Pokemon& pokemon) {
    if (!pokemon.dynamaxed) return;
    if (pokemon.pre_dynamax_max_hp > 0) {
        pokemon.current_hp = (pokemon.current_hp + 1) / 2;
        pokemon.max_hp = pokemon.pre_dynamax_max_hp;
    }
    pokemon.dynamaxed = false;
    pokemon.pre_dynamax_max_hp = 0;
    side.dynamax_turns = 0;
}

} // namespace mechanics
} // namespace pokebattle
