/**
 * PokeBattle Engine - Type Chart Implementation
 */

#include "type_chart.hpp"
#include <array>

namespace pokebattle {

namespace {

constexpr double X = 0.0;
constexpr double H = 0.5;
constexpr double N = 1.0;
constexpr double S = 2.0;

// Rows: attacking type, columns: defending type (PokeType order)
constexpr double CHART[NUM_TYPES][NUM_TYPES] = {
    //        NOR FIR WAT ELE GRA ICE FIG POI GRO FLY PSY BUG ROC GHO DRA DAR STE FAI
    /*NOR*/ { N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  H,  X,  N,  N,  H,  N },
    /*FIR*/ { N,  H,  H,  N,  S,  S,  N,  N,  N,  N,  N,  S,  H,  N,  H,  N,  S,  N },
    /*WAT*/ { N,  S,  H,  N,  H,  N,  N,  N,  S,  N,  N,  N,  S,  N,  H,  N,  N,  N },
    /*ELE*/ { N,  N,  S,  H,  H,  N,  N,  N,  X,  S,  N,  N,  N,  N,  H,  N,  N,  N },
    /*GRA*/ { N,  H,  S,  N,  H,  N,  N,  H,  S,  H,  N,  H,  S,  N,  H,  N,  H,  N },
    /*ICE*/ { N,  H,  H,  N,  S,  H,  N,  N,  S,  S,  N,  N,  N,  N,  S,  N,  H,  N },
    /*FIG*/ { S,  N,  N,  N,  N,  S,  N,  H,  N,  H,  H,  H,  S,  X,  N,  S,  S,  H },
    /*POI*/ { N,  N,  N,  N,  S,  N,  N,  H,  H,  N,  N,  N,  H,  H,  N,  N,  X,  S },
    /*GRO*/ { N,  S,  N,  S,  H,  N,  N,  S,  N,  X,  N,  H,  S,  N,  N,  N,  S,  N },
    /*FLY*/ { N,  N,  N,  H,  S,  N,  S,  N,  N,  N,  N,  S,  H,  N,  N,  N,  H,  N },
    /*PSY*/ { N,  N,  N,  N,  N,  N,  S,  S,  N,  N,  H,  N,  N,  N,  N,  X,  H,  N },
    /*BUG*/ { N,  H,  N,  N,  S,  N,  H,  H,  N,  H,  S,  N,  N,  H,  N,  S,  H,  H },
    /*ROC*/ { N,  S,  N,  N,  N,  S,  H,  N,  H,  S,  N,  S,  N,  N,  N,  N,  H,  N },
    /*GHO*/ { X,  N,  N,  N,  N,  N,  N,  N,  N,  N,  S,  N,  N,  S,  N,  H,  N,  N },
    /*DRA*/ { N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  S,  N,  H,  X },
    /*DAR*/ { N,  N,  N,  N,  N,  N,  H,  N,  N,  N,  S,  N,  N,  S,  N,  H,  N,  H },
    /*STE*/ { N,  H,  H,  H,  N,  S,  N,  N,  N,  N,  N,  N,  S,  N,  N,  N,  H,  S },
    /*FAI*/ { N,  H,  N,  N,  N,  N,  S,  H,  N,  N,  N,  N,  N,  N,  S,  S,  H,  N },
};

const std::array<StatusDef, 8>& status_table() {
    static const std::array<StatusDef, 8> table = {{
        {StatusCondition::NONE, 0, 1, {}},
        {StatusCondition::BURN, 1, 16, {PokeType::FIRE}},
        {StatusCondition::POISON, 1, 8, {PokeType::POISON, PokeType::STEEL}},
        {StatusCondition::TOXIC, 1, 16, {PokeType::POISON, PokeType::STEEL}},
        {StatusCondition::PARALYSIS, 0, 1, {PokeType::ELECTRIC}},
        {StatusCondition::SLEEP, 0, 1, {}},
        {StatusCondition::FREEZE, 0, 1, {PokeType::ICE}},
        {StatusCondition::FAINTED, 0, 1, {}},
    }};
    return table;
}

} // anonymous namespace

double single_type_effectiveness(PokeType attack, PokeType defend) {
    if (attack == PokeType::TYPELESS || defend == PokeType::TYPELESS) {
        return 1.0;
    }
    return CHART[static_cast<int>(attack)][static_cast<int>(defend)];
}

double type_effectiveness(PokeType attack, const std::vector<PokeType>& defender_types) {
    double mult = 1.0;
    for (PokeType t : defender_types) {
        mult *= single_type_effectiveness(attack, t);
    }
    return mult;
}

const StatusDef& status_def(StatusCondition status) {
    return status_table()[static_cast<size_t>(status)];
}

bool is_status_immune_by_type(StatusCondition status, const std::vector<PokeType>& types) {
    for (PokeType t : status_def(status).immune_types) {
        if (has_type(types, t)) return true;
    }
    return false;
}

} // namespace pokebattle
