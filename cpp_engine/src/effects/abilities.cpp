/**
 * PokeBattle Engine - Ability Effect Data
 *
 * Every supported ability as rows of the effect table. Adding an ability
 * means adding rows here (or in an effects JSON file), nothing else.
 */

#include "effect_table.hpp"

namespace pokebattle {

namespace {

EffectEntry ability(const std::string& id, TriggerPhase phase, EffectKind kind) {
    EffectEntry e;
    e.id = id;
    e.source = EffectSource::ABILITY;
    e.phase = phase;
    e.kind = kind;
    return e;
}

// ============================================================================
// SWITCH-IN ABILITIES
// ============================================================================

void register_switch_in(EffectTable& t) {
    t.register_entry(ability("intimidate", TriggerPhase::ON_SWITCH_IN,
                             EffectKind::STAT_CHANGE_ON_TRIGGER).boost(Stat::ATK, -1).foe());

    t.register_entry(ability("drizzle", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_WEATHER).of_weather(Weather::RAIN));
    t.register_entry(ability("drought", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_WEATHER).of_weather(Weather::SUN));
    t.register_entry(ability("sandstream", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_WEATHER).of_weather(Weather::SAND));
    t.register_entry(ability("snowwarning", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_WEATHER).of_weather(Weather::SNOW));

    t.register_entry(ability("electricsurge", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_TERRAIN).of_terrain(Terrain::ELECTRIC));
    t.register_entry(ability("grassysurge", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_TERRAIN).of_terrain(Terrain::GRASSY));
    t.register_entry(ability("mistysurge", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_TERRAIN).of_terrain(Terrain::MISTY));
    t.register_entry(ability("psychicsurge", TriggerPhase::ON_SWITCH_IN, EffectKind::SET_TERRAIN).of_terrain(Terrain::PSYCHIC));
}

// ============================================================================
// SWITCH-OUT ABILITIES
// ============================================================================

void register_switch_out(EffectTable& t) {
    t.register_entry(ability("regenerator", TriggerPhase::ON_SWITCH_OUT, EffectKind::HEAL_FRACTION).frac(1.0 / 3.0));
    t.register_entry(ability("naturalcure", TriggerPhase::ON_SWITCH_OUT, EffectKind::CURE_ON_SWITCH_OUT));
}

// ============================================================================
// OFFENSIVE MODIFIERS
// ============================================================================

void register_offense(EffectTable& t) {
    t.register_entry(ability("hugepower", TriggerPhase::MODIFY_ATTACK, EffectKind::STAT_MODIFIER).on_stat(Stat::ATK).mult(2.0));
    t.register_entry(ability("purepower", TriggerPhase::MODIFY_ATTACK, EffectKind::STAT_MODIFIER).on_stat(Stat::ATK).mult(2.0));

    {
        auto e = ability("guts", TriggerPhase::MODIFY_ATTACK, EffectKind::STAT_MODIFIER).on_stat(Stat::ATK).mult(1.5);
        e.when.requires_status = true;
        e.ignores_burn = true;
        t.register_entry(e);
    }
    {
        auto e = ability("hustle", TriggerPhase::MODIFY_ATTACK, EffectKind::STAT_MODIFIER).on_stat(Stat::ATK).mult(1.5);
        t.register_entry(e);
        auto acc = ability("hustle", TriggerPhase::MODIFY_ACCURACY, EffectKind::STAT_MODIFIER).on_stat(Stat::ACCURACY).mult(0.8);
        acc.when.category = MoveCategory::PHYSICAL;
        t.register_entry(acc);
    }

    t.register_entry(ability("compoundeyes", TriggerPhase::MODIFY_ACCURACY, EffectKind::STAT_MODIFIER).on_stat(Stat::ACCURACY).mult(1.3));
    {
        auto e = ability("noguard", TriggerPhase::MODIFY_ACCURACY, EffectKind::STAT_MODIFIER).on_stat(Stat::ACCURACY);
        e.always_hits = true;
        t.register_entry(e);
    }

    {
        auto e = ability("adaptability", TriggerPhase::MODIFY_POWER, EffectKind::DAMAGE_MODIFIER);
        e.stab = 2.0;
        t.register_entry(e);
    }
    {
        auto e = ability("technician", TriggerPhase::MODIFY_POWER, EffectKind::POWER_MODIFIER).mult(1.5);
        e.when.max_base_power = 60;
        t.register_entry(e);
    }
    {
        auto e = ability("sheerforce", TriggerPhase::MODIFY_POWER, EffectKind::POWER_MODIFIER).mult(1.3);
        e.when.chance_secondaries = true;
        e.suppresses_secondaries = true;
        t.register_entry(e);
    }

    struct FlagBoost { const char* id; const char* flag; double mult; };
    for (const FlagBoost& fb : {FlagBoost{"ironfist", "punch", 1.2},
                                FlagBoost{"strongjaw", "bite", 1.5},
                                FlagBoost{"megalauncher", "pulse", 1.5},
                                FlagBoost{"toughclaws", "contact", 1.3},
                                FlagBoost{"punkrock", "sound", 1.3}}) {
        auto e = ability(fb.id, TriggerPhase::MODIFY_POWER, EffectKind::POWER_MODIFIER).mult(fb.mult);
        e.when.move_flag = fb.flag;
        t.register_entry(e);
    }

    // Pinch abilities: 1.5x to their type at or below 1/3 HP
    struct Pinch { const char* id; PokeType type; };
    for (const Pinch& p : {Pinch{"blaze", PokeType::FIRE},
                           Pinch{"torrent", PokeType::WATER},
                           Pinch{"overgrow", PokeType::GRASS},
                           Pinch{"swarm", PokeType::BUG}}) {
        auto e = ability(p.id, TriggerPhase::MODIFY_POWER, EffectKind::POWER_MODIFIER).mult(1.5);
        e.when.move_type = p.type;
        e.when.hp_at_most = 1.0 / 3.0;
        t.register_entry(e);
    }

    {
        auto e = ability("flashfire", TriggerPhase::MODIFY_POWER, EffectKind::POWER_MODIFIER).mult(1.5);
        e.when.move_type = PokeType::FIRE;
        e.when.holder_volatile = VolatileKind::FLASH_FIRE;
        t.register_entry(e);
    }

    {
        auto e = ability("tintedlens", TriggerPhase::ON_DAMAGING_HIT, EffectKind::DAMAGE_MODIFIER).mult(2.0);
        e.when.not_very_effective = true;
        t.register_entry(e);
    }

    // -ate abilities: Normal moves become the ability's type with 1.2x power
    struct Ate { const char* id; PokeType type; };
    for (const Ate& a : {Ate{"pixilate", PokeType::FAIRY},
                         Ate{"aerilate", PokeType::FLYING},
                         Ate{"refrigerate", PokeType::ICE},
                         Ate{"galvanize", PokeType::ELECTRIC}}) {
        auto e = ability(a.id, TriggerPhase::MODIFY_POWER, EffectKind::TYPE_CHANGE).of_type(a.type).mult(1.2);
        e.when.move_type = PokeType::NORMAL;
        t.register_entry(e);
    }

    t.register_entry(ability("unaware", TriggerPhase::PASSIVE, EffectKind::IGNORE_BOOSTS));
    t.register_entry(ability("moldbreaker", TriggerPhase::PASSIVE, EffectKind::IGNORE_ABILITIES));
    t.register_entry(ability("teravolt", TriggerPhase::PASSIVE, EffectKind::IGNORE_ABILITIES));
    t.register_entry(ability("turboblaze", TriggerPhase::PASSIVE, EffectKind::IGNORE_ABILITIES));
    t.register_entry(ability("infiltrator", TriggerPhase::PASSIVE, EffectKind::IGNORE_SCREENS));
}

// ============================================================================
// DEFENSIVE MODIFIERS AND IMMUNITIES
// ============================================================================

void register_defense(EffectTable& t) {
    t.register_entry(ability("furcoat", TriggerPhase::MODIFY_DEFENSE, EffectKind::STAT_MODIFIER).on_stat(Stat::DEF).mult(2.0));

    {
        auto e = ability("multiscale", TriggerPhase::ON_TAKING_DAMAGE, EffectKind::DAMAGE_MODIFIER).mult(0.5);
        e.when.requires_full_hp = true;
        t.register_entry(e);
    }
    for (const char* id : {"filter", "solidrock", "prismarmor"}) {
        auto e = ability(id, TriggerPhase::ON_TAKING_DAMAGE, EffectKind::DAMAGE_MODIFIER).mult(0.75);
        e.when.super_effective = true;
        t.register_entry(e);
    }
    for (PokeType type : {PokeType::FIRE, PokeType::ICE}) {
        auto e = ability("thickfat", TriggerPhase::ON_TAKING_DAMAGE, EffectKind::DAMAGE_MODIFIER).mult(0.5);
        e.when.move_type = type;
        t.register_entry(e);
    }

    {
        auto e = ability("sturdy", TriggerPhase::ON_TAKING_DAMAGE, EffectKind::SURVIVE_AT_ONE);
        e.when.requires_full_hp = true;
        t.register_entry(e);
    }

    // Type immunities, some with an absorb bonus
    t.register_entry(ability("levitate", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::GROUND));
    t.register_entry(ability("waterabsorb", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::WATER).frac(0.25));
    t.register_entry(ability("voltabsorb", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::ELECTRIC).frac(0.25));
    t.register_entry(ability("dryskin", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::WATER).frac(0.25));
    t.register_entry(ability("stormdrain", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::WATER).boost(Stat::SPA, 1));
    t.register_entry(ability("lightningrod", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::ELECTRIC).boost(Stat::SPA, 1));
    t.register_entry(ability("motordrive", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::ELECTRIC).boost(Stat::SPE, 1));
    t.register_entry(ability("sapsipper", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::GRASS).boost(Stat::ATK, 1));
    {
        auto e = ability("flashfire", TriggerPhase::ON_TRY_HIT, EffectKind::TYPE_IMMUNITY).of_type(PokeType::FIRE);
        e.add_volatile = VolatileKind::FLASH_FIRE;
        t.register_entry(e);
    }

    t.register_entry(ability("goodasgold", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_MOVE_BLOCK));
    t.register_entry(ability("magicbounce", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_MOVE_BLOCK));

    for (const char* id : {"clearbody", "whitesmoke", "fullmetalbody"}) {
        t.register_entry(ability(id, TriggerPhase::ON_TRY_HIT, EffectKind::BLOCK_STAT_DROP));
    }

    // Status immunities
    t.register_entry(ability("insomnia", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY).of_status(StatusCondition::SLEEP));
    t.register_entry(ability("vitalspirit", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY).of_status(StatusCondition::SLEEP));
    t.register_entry(ability("limber", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY).of_status(StatusCondition::PARALYSIS));
    t.register_entry(ability("immunity", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY).of_status(StatusCondition::POISON));
    t.register_entry(ability("waterveil", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY).of_status(StatusCondition::BURN));
    t.register_entry(ability("magmaarmor", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY).of_status(StatusCondition::FREEZE));
    t.register_entry(ability("purifyingsalt", TriggerPhase::ON_TRY_HIT, EffectKind::STATUS_IMMUNITY));

    // Indirect damage
    t.register_entry(ability("magicguard", TriggerPhase::PASSIVE, EffectKind::INDIRECT_DAMAGE_IMMUNITY));
    {
        auto e = ability("overcoat", TriggerPhase::PASSIVE, EffectKind::INDIRECT_DAMAGE_IMMUNITY);
        e.weather_only = true;
        t.register_entry(e);
    }
    for (const char* id : {"sandveil", "sandforce", "sandrush"}) {
        auto e = ability(id, TriggerPhase::PASSIVE, EffectKind::INDIRECT_DAMAGE_IMMUNITY).of_weather(Weather::SAND);
        e.weather_only = true;
        t.register_entry(e);
    }
    for (const char* id : {"icebody", "snowcloak", "slushrush"}) {
        auto e = ability(id, TriggerPhase::PASSIVE, EffectKind::INDIRECT_DAMAGE_IMMUNITY).of_weather(Weather::HAIL);
        e.weather_only = true;
        t.register_entry(e);
    }

    // Contact punishers
    for (const char* id : {"roughskin", "ironbarbs"}) {
        t.register_entry(ability(id, TriggerPhase::ON_CONTACT_HIT, EffectKind::DAMAGE_FRACTION).frac(1.0 / 8.0));
    }
}

// ============================================================================
// SPEED AND PRIORITY
// ============================================================================

void register_speed(EffectTable& t) {
    struct WeatherSpeed { const char* id; Weather weather; };
    for (const WeatherSpeed& ws : {WeatherSpeed{"swiftswim", Weather::RAIN},
                                   WeatherSpeed{"chlorophyll", Weather::SUN},
                                   WeatherSpeed{"sandrush", Weather::SAND},
                                   WeatherSpeed{"slushrush", Weather::HAIL},
                                   WeatherSpeed{"slushrush", Weather::SNOW}}) {
        auto e = ability(ws.id, TriggerPhase::MODIFY_SPEED, EffectKind::SPEED_MODIFIER).mult(2.0);
        e.when.weather = ws.weather;
        t.register_entry(e);
    }
    {
        auto e = ability("quickfeet", TriggerPhase::MODIFY_SPEED, EffectKind::SPEED_MODIFIER).mult(1.5);
        e.when.requires_status = true;
        e.ignores_paralysis = true;
        t.register_entry(e);
    }
    {
        auto e = ability("unburden", TriggerPhase::MODIFY_SPEED, EffectKind::SPEED_MODIFIER).mult(2.0);
        e.when.item_consumed = true;
        t.register_entry(e);
    }

    {
        auto e = ability("prankster", TriggerPhase::MODIFY_PRIORITY, EffectKind::PRIORITY_MODIFIER).amt(1);
        e.when.category = MoveCategory::STATUS;
        e.fails_vs_dark = true;
        t.register_entry(e);
    }
    {
        auto e = ability("galewings", TriggerPhase::MODIFY_PRIORITY, EffectKind::PRIORITY_MODIFIER).amt(1);
        e.when.move_type = PokeType::FLYING;
        e.when.requires_full_hp = true;
        t.register_entry(e);
    }
}

// ============================================================================
// END OF TURN
// ============================================================================

void register_end_of_turn(EffectTable& t) {
    t.register_entry(ability("speedboost", TriggerPhase::END_OF_TURN,
                             EffectKind::STAT_CHANGE_ON_TRIGGER).boost(Stat::SPE, 1));
    {
        // Replaces poison/toxic residual damage with healing
        auto e = ability("poisonheal", TriggerPhase::END_OF_TURN, EffectKind::HEAL_FRACTION).frac(1.0 / 8.0);
        e.when.holder_status = StatusCondition::POISON;
        t.register_entry(e);
    }
}

} // anonymous namespace

void register_all_abilities(EffectTable& table) {
    register_switch_in(table);
    register_switch_out(table);
    register_offense(table);
    register_defense(table);
    register_speed(table);
    register_end_of_turn(table);
}

} // namespace pokebattle
