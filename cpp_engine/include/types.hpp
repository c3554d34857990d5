/**
 * PokeBattle Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * String forms match the ids used in the JSON battle-state documents.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <optional>
#include <memory>

namespace pokebattle {

// ============================================================================
// ENUMS
// ============================================================================

enum class PokeType : uint8_t {
    NORMAL,
    FIRE,
    WATER,
    ELECTRIC,
    GRASS,
    ICE,
    FIGHTING,
    POISON,
    GROUND,
    FLYING,
    PSYCHIC,
    BUG,
    ROCK,
    GHOST,
    DRAGON,
    DARK,
    STEEL,
    FAIRY,
    TYPELESS     // Struggle, confusion self-hit
};

constexpr int NUM_TYPES = 18;

enum class MoveCategory : uint8_t {
    PHYSICAL,
    SPECIAL,
    STATUS
};

enum class StatusCondition : uint8_t {
    NONE,
    BURN,
    POISON,
    TOXIC,
    PARALYSIS,
    SLEEP,
    FREEZE,
    FAINTED
};

enum class Stat : uint8_t {
    HP,
    ATK,
    DEF,
    SPA,
    SPD,
    SPE,
    ACCURACY,
    EVASION
};

enum class Weather : uint8_t {
    NONE,
    SUN,
    RAIN,
    SAND,
    HAIL,
    SNOW
};

enum class Terrain : uint8_t {
    NONE,
    ELECTRIC,
    GRASSY,
    MISTY,
    PSYCHIC
};

enum class BattlePhase : uint8_t {
    PREPARATION,
    TEAM_PREVIEW,
    BATTLE,
    FINISHED
};

// Stages of a single turn inside the resolution engine
enum class TurnStage : uint8_t {
    QUEUED,
    PRIORITY_SORTED,
    RESOLVING,
    END_OF_TURN,
    ADVANCED
};

enum class MoveTarget : uint8_t {
    NORMAL,      // the opposing active Pokemon
    SELF,
    FOE_SIDE,
    ALLY_SIDE,
    FIELD
};

enum class SecondaryKind : uint8_t {
    STATUS,
    VOLATILE,
    BOOST_TARGET,
    BOOST_SELF,
    FLINCH,
    RECOIL,
    DRAIN,
    HEAL,
    SET_HAZARD,
    CLEAR_HAZARDS,
    SET_SCREEN,
    SET_WEATHER,
    SET_TERRAIN,
    SET_SIDE_CONDITION,
    PROTECT,
    SELF_SWITCH
};

enum class VolatileKind : uint8_t {
    CONFUSION,
    FLINCH,
    TAUNT,
    ENCORE,
    DISABLE,
    LEECH_SEED,
    PERISH_SONG,
    PARTIAL_TRAP,
    PROTECT,
    CHOICE_LOCK,
    FLASH_FIRE,
    CHARGING,
    RECHARGE
};

enum class HazardKind : uint8_t {
    STEALTH_ROCK,
    SPIKES,
    TOXIC_SPIKES,
    STICKY_WEB
};

enum class ScreenKind : uint8_t {
    REFLECT,
    LIGHT_SCREEN,
    AURORA_VEIL
};

enum class SideConditionKind : uint8_t {
    TAILWIND,
    TRICK_ROOM,
    GRAVITY,
    WONDER_ROOM,
    MAGIC_ROOM
};

enum class ErrorKind : uint8_t {
    NONE,
    INVALID_ACTION,
    MISSING_ENTITY,
    UNSUPPORTED_FORMAT,
    STATE_INVARIANT_VIOLATION
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using SideID = uint8_t;            // 0 or 1
using MoveID = std::string;        // normalized id, e.g. "stealthrock"
using SpeciesID = std::string;
using AbilityID = std::string;
using ItemID = std::string;
using FormatID = std::string;

constexpr int MAX_BOOST = 6;
constexpr int MAX_MOVES = 4;
constexpr int MAX_BENCH = 5;
constexpr int NUM_ROLLS = 16;

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * Normalize a display name to an id: lowercase, alphanumerics only.
 * "Heavy-Duty Boots" -> "heavydutyboots"
 */
std::string to_id(const std::string& name);

inline SideID opponent_of(SideID side) {
    return static_cast<SideID>(1 - side);
}

inline const char* to_string(PokeType type) {
    switch (type) {
        case PokeType::NORMAL: return "Normal";
        case PokeType::FIRE: return "Fire";
        case PokeType::WATER: return "Water";
        case PokeType::ELECTRIC: return "Electric";
        case PokeType::GRASS: return "Grass";
        case PokeType::ICE: return "Ice";
        case PokeType::FIGHTING: return "Fighting";
        case PokeType::POISON: return "Poison";
        case PokeType::GROUND: return "Ground";
        case PokeType::FLYING: return "Flying";
        case PokeType::PSYCHIC: return "Psychic";
        case PokeType::BUG: return "Bug";
        case PokeType::ROCK: return "Rock";
        case PokeType::GHOST: return "Ghost";
        case PokeType::DRAGON: return "Dragon";
        case PokeType::DARK: return "Dark";
        case PokeType::STEEL: return "Steel";
        case PokeType::FAIRY: return "Fairy";
        case PokeType::TYPELESS: return "???";
        default: return "Unknown";
    }
}

inline const char* to_string(MoveCategory category) {
    switch (category) {
        case MoveCategory::PHYSICAL: return "Physical";
        case MoveCategory::SPECIAL: return "Special";
        case MoveCategory::STATUS: return "Status";
        default: return "Unknown";
    }
}

inline const char* to_string(StatusCondition status) {
    switch (status) {
        case StatusCondition::NONE: return "none";
        case StatusCondition::BURN: return "brn";
        case StatusCondition::POISON: return "psn";
        case StatusCondition::TOXIC: return "tox";
        case StatusCondition::PARALYSIS: return "par";
        case StatusCondition::SLEEP: return "slp";
        case StatusCondition::FREEZE: return "frz";
        case StatusCondition::FAINTED: return "fnt";
        default: return "unknown";
    }
}

inline const char* to_string(Stat stat) {
    switch (stat) {
        case Stat::HP: return "hp";
        case Stat::ATK: return "atk";
        case Stat::DEF: return "def";
        case Stat::SPA: return "spa";
        case Stat::SPD: return "spd";
        case Stat::SPE: return "spe";
        case Stat::ACCURACY: return "accuracy";
        case Stat::EVASION: return "evasion";
        default: return "unknown";
    }
}

inline const char* to_string(Weather weather) {
    switch (weather) {
        case Weather::NONE: return "none";
        case Weather::SUN: return "sun";
        case Weather::RAIN: return "rain";
        case Weather::SAND: return "sand";
        case Weather::HAIL: return "hail";
        case Weather::SNOW: return "snow";
        default: return "unknown";
    }
}

inline const char* to_string(Terrain terrain) {
    switch (terrain) {
        case Terrain::NONE: return "none";
        case Terrain::ELECTRIC: return "electric";
        case Terrain::GRASSY: return "grassy";
        case Terrain::MISTY: return "misty";
        case Terrain::PSYCHIC: return "psychic";
        default: return "unknown";
    }
}

inline const char* to_string(BattlePhase phase) {
    switch (phase) {
        case BattlePhase::PREPARATION: return "preparation";
        case BattlePhase::TEAM_PREVIEW: return "team_preview";
        case BattlePhase::BATTLE: return "battle";
        case BattlePhase::FINISHED: return "finished";
        default: return "unknown";
    }
}

inline const char* to_string(TurnStage stage) {
    switch (stage) {
        case TurnStage::QUEUED: return "queued";
        case TurnStage::PRIORITY_SORTED: return "priority_sorted";
        case TurnStage::RESOLVING: return "resolving";
        case TurnStage::END_OF_TURN: return "end_of_turn";
        case TurnStage::ADVANCED: return "advanced";
        default: return "unknown";
    }
}

inline const char* to_string(MoveTarget target) {
    switch (target) {
        case MoveTarget::NORMAL: return "normal";
        case MoveTarget::SELF: return "self";
        case MoveTarget::FOE_SIDE: return "foeSide";
        case MoveTarget::ALLY_SIDE: return "allySide";
        case MoveTarget::FIELD: return "all";
        default: return "unknown";
    }
}

inline const char* to_string(SecondaryKind kind) {
    switch (kind) {
        case SecondaryKind::STATUS: return "status";
        case SecondaryKind::VOLATILE: return "volatile";
        case SecondaryKind::BOOST_TARGET: return "boost_target";
        case SecondaryKind::BOOST_SELF: return "boost_self";
        case SecondaryKind::FLINCH: return "flinch";
        case SecondaryKind::RECOIL: return "recoil";
        case SecondaryKind::DRAIN: return "drain";
        case SecondaryKind::HEAL: return "heal";
        case SecondaryKind::SET_HAZARD: return "set_hazard";
        case SecondaryKind::CLEAR_HAZARDS: return "clear_hazards";
        case SecondaryKind::SET_SCREEN: return "set_screen";
        case SecondaryKind::SET_WEATHER: return "set_weather";
        case SecondaryKind::SET_TERRAIN: return "set_terrain";
        case SecondaryKind::SET_SIDE_CONDITION: return "set_side_condition";
        case SecondaryKind::PROTECT: return "protect";
        case SecondaryKind::SELF_SWITCH: return "self_switch";
        default: return "unknown";
    }
}

inline const char* to_string(VolatileKind kind) {
    switch (kind) {
        case VolatileKind::CONFUSION: return "confusion";
        case VolatileKind::FLINCH: return "flinch";
        case VolatileKind::TAUNT: return "taunt";
        case VolatileKind::ENCORE: return "encore";
        case VolatileKind::DISABLE: return "disable";
        case VolatileKind::LEECH_SEED: return "leechseed";
        case VolatileKind::PERISH_SONG: return "perishsong";
        case VolatileKind::PARTIAL_TRAP: return "partiallytrapped";
        case VolatileKind::PROTECT: return "protect";
        case VolatileKind::CHOICE_LOCK: return "choicelock";
        case VolatileKind::FLASH_FIRE: return "flashfire";
        case VolatileKind::CHARGING: return "charging";
        case VolatileKind::RECHARGE: return "mustrecharge";
        default: return "unknown";
    }
}

inline const char* to_string(HazardKind kind) {
    switch (kind) {
        case HazardKind::STEALTH_ROCK: return "stealthrock";
        case HazardKind::SPIKES: return "spikes";
        case HazardKind::TOXIC_SPIKES: return "toxicspikes";
        case HazardKind::STICKY_WEB: return "stickyweb";
        default: return "unknown";
    }
}

inline const char* to_string(ScreenKind kind) {
    switch (kind) {
        case ScreenKind::REFLECT: return "reflect";
        case ScreenKind::LIGHT_SCREEN: return "lightscreen";
        case ScreenKind::AURORA_VEIL: return "auroraveil";
        default: return "unknown";
    }
}

inline const char* to_string(SideConditionKind kind) {
    switch (kind) {
        case SideConditionKind::TAILWIND: return "tailwind";
        case SideConditionKind::TRICK_ROOM: return "trickroom";
        case SideConditionKind::GRAVITY: return "gravity";
        case SideConditionKind::WONDER_ROOM: return "wonderroom";
        case SideConditionKind::MAGIC_ROOM: return "magicroom";
        default: return "unknown";
    }
}

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::INVALID_ACTION: return "InvalidAction";
        case ErrorKind::MISSING_ENTITY: return "MissingEntity";
        case ErrorKind::UNSUPPORTED_FORMAT: return "UnsupportedFormat";
        case ErrorKind::STATE_INVARIANT_VIOLATION: return "StateInvariantViolation";
        default: return "unknown";
    }
}

// ============================================================================
// PARSING (inverse of to_string; throws std::invalid_argument on bad input)
// ============================================================================

PokeType parse_type(const std::string& s);
MoveCategory parse_category(const std::string& s);
StatusCondition parse_status(const std::string& s);
Stat parse_stat(const std::string& s);
Weather parse_weather(const std::string& s);
Terrain parse_terrain(const std::string& s);
BattlePhase parse_phase(const std::string& s);
MoveTarget parse_target(const std::string& s);
SecondaryKind parse_secondary_kind(const std::string& s);
VolatileKind parse_volatile(const std::string& s);
HazardKind parse_hazard(const std::string& s);
ScreenKind parse_screen(const std::string& s);
SideConditionKind parse_side_condition(const std::string& s);

} // namespace pokebattle
