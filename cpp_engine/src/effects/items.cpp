/**
 * PokeBattle Engine - Item Effect Data
 *
 * Items are suppressed entirely while Magic Room is up and once a
 * single-use item has been consumed.
 */

#include "effect_table.hpp"

namespace pokebattle {

namespace {

EffectEntry item(const std::string& id, TriggerPhase phase, EffectKind kind) {
    EffectEntry e;
    e.id = id;
    e.source = EffectSource::ITEM;
    e.phase = phase;
    e.kind = kind;
    return e;
}

void register_choice_items(EffectTable& t) {
    t.register_entry(item("choiceband", TriggerPhase::MODIFY_ATTACK, EffectKind::STAT_MODIFIER).on_stat(Stat::ATK).mult(1.5));
    t.register_entry(item("choicespecs", TriggerPhase::MODIFY_ATTACK, EffectKind::STAT_MODIFIER).on_stat(Stat::SPA).mult(1.5));
    t.register_entry(item("choicescarf", TriggerPhase::MODIFY_SPEED, EffectKind::SPEED_MODIFIER).mult(1.5));

    for (const char* id : {"choiceband", "choicespecs", "choicescarf"}) {
        t.register_entry(item(id, TriggerPhase::PASSIVE, EffectKind::CHOICE_LOCK));
    }
}

void register_defensive_items(EffectTable& t) {
    t.register_entry(item("assaultvest", TriggerPhase::MODIFY_DEFENSE, EffectKind::STAT_MODIFIER).on_stat(Stat::SPD).mult(1.5));
    t.register_entry(item("assaultvest", TriggerPhase::BEFORE_MOVE, EffectKind::STATUS_MOVE_BLOCK));

    // Holder is assumed to be eligible (not fully evolved)
    t.register_entry(item("eviolite", TriggerPhase::MODIFY_DEFENSE, EffectKind::STAT_MODIFIER).on_stat(Stat::DEF).mult(1.5));
    t.register_entry(item("eviolite", TriggerPhase::MODIFY_DEFENSE, EffectKind::STAT_MODIFIER).on_stat(Stat::SPD).mult(1.5));

    {
        auto e = item("focussash", TriggerPhase::ON_TAKING_DAMAGE, EffectKind::SURVIVE_AT_ONE).single_use();
        e.when.requires_full_hp = true;
        t.register_entry(e);
    }
    {
        auto e = item("sitrusberry", TriggerPhase::ON_TAKING_DAMAGE, EffectKind::HEAL_FRACTION).frac(0.25).single_use();
        e.when.hp_at_most = 0.5;
        t.register_entry(e);
    }

    t.register_entry(item("heavydutyboots", TriggerPhase::ON_SWITCH_IN, EffectKind::HAZARD_IMMUNITY));
    t.register_entry(item("shedshell", TriggerPhase::PASSIVE, EffectKind::ESCAPE_TRAP));
    {
        auto e = item("safetygoggles", TriggerPhase::PASSIVE, EffectKind::INDIRECT_DAMAGE_IMMUNITY);
        e.weather_only = true;
        t.register_entry(e);
    }

    t.register_entry(item("rockyhelmet", TriggerPhase::ON_CONTACT_HIT, EffectKind::DAMAGE_FRACTION).frac(1.0 / 6.0));
}

void register_offensive_items(EffectTable& t) {
    t.register_entry(item("lifeorb", TriggerPhase::ON_DAMAGING_HIT, EffectKind::DAMAGE_MODIFIER).mult(1.3));
    t.register_entry(item("lifeorb", TriggerPhase::ON_DAMAGING_HIT, EffectKind::DAMAGE_FRACTION).frac(0.1));

    {
        auto e = item("expertbelt", TriggerPhase::ON_DAMAGING_HIT, EffectKind::DAMAGE_MODIFIER).mult(1.2);
        e.when.super_effective = true;
        t.register_entry(e);
    }

    struct TypeBoost { const char* id; PokeType type; };
    for (const TypeBoost& tb : {TypeBoost{"charcoal", PokeType::FIRE},
                                TypeBoost{"mysticwater", PokeType::WATER},
                                TypeBoost{"magnet", PokeType::ELECTRIC},
                                TypeBoost{"miracleseed", PokeType::GRASS},
                                TypeBoost{"nevermeltice", PokeType::ICE},
                                TypeBoost{"blackbelt", PokeType::FIGHTING},
                                TypeBoost{"poisonbarb", PokeType::POISON},
                                TypeBoost{"softsand", PokeType::GROUND},
                                TypeBoost{"sharpbeak", PokeType::FLYING},
                                TypeBoost{"twistedspoon", PokeType::PSYCHIC},
                                TypeBoost{"silverpowder", PokeType::BUG},
                                TypeBoost{"hardstone", PokeType::ROCK},
                                TypeBoost{"spelltag", PokeType::GHOST},
                                TypeBoost{"dragonfang", PokeType::DRAGON},
                                TypeBoost{"blackglasses", PokeType::DARK},
                                TypeBoost{"metalcoat", PokeType::STEEL},
                                TypeBoost{"silkscarf", PokeType::NORMAL},
                                TypeBoost{"fairyfeather", PokeType::FAIRY}}) {
        auto e = item(tb.id, TriggerPhase::MODIFY_POWER, EffectKind::POWER_MODIFIER).mult(1.2);
        e.when.move_type = tb.type;
        t.register_entry(e);
    }
}

void register_residual_items(EffectTable& t) {
    t.register_entry(item("leftovers", TriggerPhase::END_OF_TURN, EffectKind::HEAL_FRACTION).frac(1.0 / 16.0));

    {
        auto heal = item("blacksludge", TriggerPhase::END_OF_TURN, EffectKind::HEAL_FRACTION).frac(1.0 / 16.0);
        heal.when.holder_type = PokeType::POISON;
        t.register_entry(heal);

        auto hurt = item("blacksludge", TriggerPhase::END_OF_TURN, EffectKind::DAMAGE_FRACTION).frac(1.0 / 8.0);
        hurt.when.holder_not_type = PokeType::POISON;
        t.register_entry(hurt);
    }
}

void register_duration_items(EffectTable& t) {
    {
        auto e = item("lightclay", TriggerPhase::PASSIVE, EffectKind::DURATION_EXTENSION).amt(8);
        e.scope = "screens";
        t.register_entry(e);
    }
    {
        auto e = item("terrainextender", TriggerPhase::PASSIVE, EffectKind::DURATION_EXTENSION).amt(8);
        e.scope = "terrain";
        t.register_entry(e);
    }

    struct Rock { const char* id; Weather weather; };
    for (const Rock& r : {Rock{"heatrock", Weather::SUN},
                          Rock{"damprock", Weather::RAIN},
                          Rock{"smoothrock", Weather::SAND},
                          Rock{"icyrock", Weather::HAIL},
                          Rock{"icyrock", Weather::SNOW}}) {
        auto e = item(r.id, TriggerPhase::PASSIVE, EffectKind::DURATION_EXTENSION).amt(8).of_weather(r.weather);
        e.scope = "weather";
        t.register_entry(e);
    }
}

} // anonymous namespace

void register_all_items(EffectTable& table) {
    register_choice_items(table);
    register_defensive_items(table);
    register_offensive_items(table);
    register_residual_items(table);
    register_duration_items(table);
}

} // namespace pokebattle
