/**
 * PokeBattle Engine - Type Parsing
 */

#include "types.hpp"
#include <cctype>
#include <stdexcept>

namespace pokebattle {

std::string to_id(const std::string& name) {
    std::string id;
    id.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            id.push_back(static_cast<char>(std::tolower(uc)));
        }
    }
    return id;
}

namespace {

[[noreturn]] void bad_value(const char* what, const std::string& s) {
    throw std::invalid_argument(std::string("unknown ") + what + ": '" + s + "'");
}

} // anonymous namespace

PokeType parse_type(const std::string& s) {
    std::string id = to_id(s);
    if (id == "normal") return PokeType::NORMAL;
    if (id == "fire") return PokeType::FIRE;
    if (id == "water") return PokeType::WATER;
    if (id == "electric") return PokeType::ELECTRIC;
    if (id == "grass") return PokeType::GRASS;
    if (id == "ice") return PokeType::ICE;
    if (id == "fighting") return PokeType::FIGHTING;
    if (id == "poison") return PokeType::POISON;
    if (id == "ground") return PokeType::GROUND;
    if (id == "flying") return PokeType::FLYING;
    if (id == "psychic") return PokeType::PSYCHIC;
    if (id == "bug") return PokeType::BUG;
    if (id == "rock") return PokeType::ROCK;
    if (id == "ghost") return PokeType::GHOST;
    if (id == "dragon") return PokeType::DRAGON;
    if (id == "dark") return PokeType::DARK;
    if (id == "steel") return PokeType::STEEL;
    if (id == "fairy") return PokeType::FAIRY;
    if (id.empty() || id == "typeless") return PokeType::TYPELESS;
    bad_value("type", s);
}

MoveCategory parse_category(const std::string& s) {
    std::string id = to_id(s);
    if (id == "physical") return MoveCategory::PHYSICAL;
    if (id == "special") return MoveCategory::SPECIAL;
    if (id == "status") return MoveCategory::STATUS;
    bad_value("move category", s);
}

StatusCondition parse_status(const std::string& s) {
    std::string id = to_id(s);
    if (id.empty() || id == "none") return StatusCondition::NONE;
    if (id == "brn" || id == "burn") return StatusCondition::BURN;
    if (id == "psn" || id == "poison") return StatusCondition::POISON;
    if (id == "tox" || id == "toxic") return StatusCondition::TOXIC;
    if (id == "par" || id == "paralysis") return StatusCondition::PARALYSIS;
    if (id == "slp" || id == "sleep") return StatusCondition::SLEEP;
    if (id == "frz" || id == "freeze") return StatusCondition::FREEZE;
    if (id == "fnt" || id == "fainted") return StatusCondition::FAINTED;
    bad_value("status", s);
}

Stat parse_stat(const std::string& s) {
    std::string id = to_id(s);
    if (id == "hp") return Stat::HP;
    if (id == "atk") return Stat::ATK;
    if (id == "def") return Stat::DEF;
    if (id == "spa") return Stat::SPA;
    if (id == "spd") return Stat::SPD;
    if (id == "spe") return Stat::SPE;
    if (id == "accuracy") return Stat::ACCURACY;
    if (id == "evasion") return Stat::EVASION;
    bad_value("stat", s);
}

Weather parse_weather(const std::string& s) {
    std::string id = to_id(s);
    if (id.empty() || id == "none") return Weather::NONE;
    if (id == "sun" || id == "sunnyday") return Weather::SUN;
    if (id == "rain" || id == "raindance") return Weather::RAIN;
    if (id == "sand" || id == "sandstorm") return Weather::SAND;
    if (id == "hail") return Weather::HAIL;
    if (id == "snow") return Weather::SNOW;
    bad_value("weather", s);
}

Terrain parse_terrain(const std::string& s) {
    std::string id = to_id(s);
    if (id.empty() || id == "none") return Terrain::NONE;
    if (id == "electric" || id == "electricterrain") return Terrain::ELECTRIC;
    if (id == "grassy" || id == "grassyterrain") return Terrain::GRASSY;
    if (id == "misty" || id == "mistyterrain") return Terrain::MISTY;
    if (id == "psychic" || id == "psychicterrain") return Terrain::PSYCHIC;
    bad_value("terrain", s);
}

BattlePhase parse_phase(const std::string& s) {
    std::string id = to_id(s);
    if (id == "preparation") return BattlePhase::PREPARATION;
    if (id == "teampreview") return BattlePhase::TEAM_PREVIEW;
    if (id == "battle") return BattlePhase::BATTLE;
    if (id == "finished") return BattlePhase::FINISHED;
    bad_value("phase", s);
}

MoveTarget parse_target(const std::string& s) {
    std::string id = to_id(s);
    if (id.empty() || id == "normal" || id == "any" || id == "adjacentfoe") return MoveTarget::NORMAL;
    if (id == "self") return MoveTarget::SELF;
    if (id == "foeside") return MoveTarget::FOE_SIDE;
    if (id == "allyside") return MoveTarget::ALLY_SIDE;
    if (id == "all" || id == "field") return MoveTarget::FIELD;
    bad_value("move target", s);
}

SecondaryKind parse_secondary_kind(const std::string& s) {
    std::string id = to_id(s);
    if (id == "status") return SecondaryKind::STATUS;
    if (id == "volatile") return SecondaryKind::VOLATILE;
    if (id == "boosttarget") return SecondaryKind::BOOST_TARGET;
    if (id == "boostself") return SecondaryKind::BOOST_SELF;
    if (id == "flinch") return SecondaryKind::FLINCH;
    if (id == "recoil") return SecondaryKind::RECOIL;
    if (id == "drain") return SecondaryKind::DRAIN;
    if (id == "heal") return SecondaryKind::HEAL;
    if (id == "sethazard") return SecondaryKind::SET_HAZARD;
    if (id == "clearhazards") return SecondaryKind::CLEAR_HAZARDS;
    if (id == "setscreen") return SecondaryKind::SET_SCREEN;
    if (id == "setweather") return SecondaryKind::SET_WEATHER;
    if (id == "setterrain") return SecondaryKind::SET_TERRAIN;
    if (id == "setsidecondition") return SecondaryKind::SET_SIDE_CONDITION;
    if (id == "protect") return SecondaryKind::PROTECT;
    if (id == "selfswitch") return SecondaryKind::SELF_SWITCH;
    bad_value("secondary kind", s);
}

VolatileKind parse_volatile(const std::string& s) {
    std::string id = to_id(s);
    if (id == "confusion") return VolatileKind::CONFUSION;
    if (id == "flinch") return VolatileKind::FLINCH;
    if (id == "taunt") return VolatileKind::TAUNT;
    if (id == "encore") return VolatileKind::ENCORE;
    if (id == "disable") return VolatileKind::DISABLE;
    if (id == "leechseed") return VolatileKind::LEECH_SEED;
    if (id == "perishsong") return VolatileKind::PERISH_SONG;
    if (id == "partiallytrapped") return VolatileKind::PARTIAL_TRAP;
    if (id == "protect") return VolatileKind::PROTECT;
    if (id == "choicelock") return VolatileKind::CHOICE_LOCK;
    if (id == "flashfire") return VolatileKind::FLASH_FIRE;
    if (id == "charging") return VolatileKind::CHARGING;
    if (id == "mustrecharge") return VolatileKind::RECHARGE;
    bad_value("volatile", s);
}

HazardKind parse_hazard(const std::string& s) {
    std::string id = to_id(s);
    if (id == "stealthrock") return HazardKind::STEALTH_ROCK;
    if (id == "spikes") return HazardKind::SPIKES;
    if (id == "toxicspikes") return HazardKind::TOXIC_SPIKES;
    if (id == "stickyweb") return HazardKind::STICKY_WEB;
    bad_value("hazard", s);
}

ScreenKind parse_screen(const std::string& s) {
    std::string id = to_id(s);
    if (id == "reflect") return ScreenKind::REFLECT;
    if (id == "lightscreen") return ScreenKind::LIGHT_SCREEN;
    if (id == "auroraveil") return ScreenKind::AURORA_VEIL;
    bad_value("screen", s);
}

SideConditionKind parse_side_condition(const std::string& s) {
    std::string id = to_id(s);
    if (id == "tailwind") return SideConditionKind::TAILWIND;
    if (id == "trickroom") return SideConditionKind::TRICK_ROOM;
    if (id == "gravity") return SideConditionKind::GRAVITY;
    if (id == "wonderroom") return SideConditionKind::WONDER_ROOM;
    if (id == "magicroom") return SideConditionKind::MAGIC_ROOM;
    bad_value("side condition", s);
}

} // namespace pokebattle
