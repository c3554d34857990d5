/**
 * Tests for the Damage & Outcome Calculator
 */

#include <cmath>
#include <sstream>
#include "test_helpers.hpp"

using namespace pokebattle;
using namespace fixtures;

// ============================================================================
// DAMAGE
// ============================================================================

TEST(Calculator, DamageRangeIsOrdered) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(0));

    TEST_ASSERT_FALSE(r.error);
    TEST_ASSERT(r.damage.min_percent > 0.0);
    TEST_ASSERT(r.damage.min_percent <= r.damage.avg_percent);
    TEST_ASSERT(r.damage.avg_percent <= r.damage.max_percent);
    TEST_ASSERT_EQ(4.0, r.effectiveness);
}

TEST(Calculator, KoProbabilitiesAreOrdered) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {garchomp()});

    for (int slot = 0; slot < 4; ++slot) {
        CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(slot));
        TEST_ASSERT_FALSE(r.error);
        TEST_ASSERT(r.ohko_prob >= 0.0);
        TEST_ASSERT(r.ohko_prob <= r.twohko_prob);
        TEST_ASSERT(r.twohko_prob <= 1.0);
        TEST_ASSERT(r.expected_survival >= 0.0 && r.expected_survival <= 1.0);
    }
}

TEST(Calculator, ImmuneTargetTakesNothing) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {corviknight()});

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(0));

    TEST_ASSERT_FALSE(r.error);
    TEST_ASSERT_EQ(0.0, r.effectiveness);
    TEST_ASSERT_EQ(0.0, r.damage.max_percent);
    TEST_ASSERT_EQ(0.0, r.ohko_prob);
    TEST_ASSERT_EQ(0.0, r.twohko_prob);
}

TEST(Calculator, LevitateGrantsGroundImmunity) {
    BattleEngine engine;
    Pokemon rotom = make_pokemon("Rotom-Wash", {PokeType::ELECTRIC, PokeType::WATER},
                                 Stats{304, 149, 245, 246, 245, 206}, {tackle()}, "levitate");
    BattleState state = start(engine, {garchomp()}, {rotom});

    DamageRolls rolls = engine.get_calculator().damage_rolls(state, 0, earthquake());
    TEST_ASSERT_TRUE(rolls.immune);
    TEST_ASSERT_EQ(0, rolls.max());

    // Mold Breaker ignores the ability
    state.sides[0].active->ability = "moldbreaker";
    rolls = engine.get_calculator().damage_rolls(state, 0, earthquake());
    TEST_ASSERT_FALSE(rolls.immune);
    TEST_ASSERT(rolls.min() > 0);
}

TEST(Calculator, RollsSpanEightyFiveToHundredPercent) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {blissey()});

    DamageRolls rolls = engine.get_calculator().damage_rolls(state, 0, earthquake());
    for (int i = 1; i < NUM_ROLLS; ++i) {
        TEST_ASSERT(rolls.rolls[i - 1] <= rolls.rolls[i]);
    }
    TEST_ASSERT(rolls.min() * 100 >= rolls.max() * 84);
}

TEST(Calculator, ScreensHalveDamage) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {blissey()});

    DamageRolls open = engine.get_calculator().damage_rolls(state, 0, earthquake());
    state.sides[1].screens[ScreenKind::REFLECT] = 5;
    DamageRolls screened = engine.get_calculator().damage_rolls(state, 0, earthquake());

    TEST_ASSERT(screened.max() < open.max());
    TEST_ASSERT(screened.max() <= open.max() / 2 + 1);

    // Light Screen does nothing against a physical move
    state.sides[1].screens.clear();
    state.sides[1].screens[ScreenKind::LIGHT_SCREEN] = 5;
    TEST_ASSERT_EQ(open.max(), engine.get_calculator().damage_rolls(state, 0, earthquake()).max());
}

TEST(Calculator, MissingActiveThrows) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.sides[1].active.reset();

    bool thrown = false;
    try {
        engine.get_calculator().damage_rolls(state, 0, earthquake());
    } catch (const MissingEntity&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

// ============================================================================
// KO FRACTIONS
// ============================================================================

TEST(KoFraction, CountsRollsReachingHp) {
    DamageRolls rolls;
    for (int i = 0; i < NUM_ROLLS; ++i) rolls.rolls[i] = 10 + i;

    TEST_ASSERT_EQ(6.0 / 16.0, ko_fraction(rolls, 20, false));
    TEST_ASSERT_EQ(1.0, ko_fraction(rolls, 10, false));
    TEST_ASSERT_EQ(0.0, ko_fraction(rolls, 26, false));
    TEST_ASSERT_EQ(0.0, ko_fraction(rolls, 10, true));
}

TEST(KoFraction, TwoHitsOverRollPairs) {
    DamageRolls rolls;
    for (int i = 0; i < NUM_ROLLS; ++i) rolls.rolls[i] = 10 + i;

    TEST_ASSERT_EQ(1.0, two_hit_ko_fraction(rolls, 20, false));
    TEST_ASSERT_EQ(0.0, two_hit_ko_fraction(rolls, 51, false));

    // Only the 25 + 25 pair reaches 50
    TEST_ASSERT_EQ(1.0 / 256.0, two_hit_ko_fraction(rolls, 50, false));

    rolls.immune = true;
    TEST_ASSERT_EQ(0.0, two_hit_ko_fraction(rolls, 20, false));
}

// ============================================================================
// ACCURACY
// ============================================================================

TEST(Accuracy, AlwaysHitsIgnoresEvasion) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {blissey()});
    state.sides[1].active->boosts.evasion = 6;

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(3));
    TEST_ASSERT_FALSE(r.error);
    TEST_ASSERT_EQ(1.0, r.accuracy);
}

TEST(Accuracy, EvasionStagesReduceHitChance) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {blissey()});
    const Calculator& calc = engine.get_calculator();

    TEST_ASSERT_NEAR(0.7, calc.accuracy(state, 0, focus_blast()), 1e-9);

    state.sides[1].active->boosts.evasion = 6;
    TEST_ASSERT_NEAR(0.7 / 3.0, calc.accuracy(state, 0, focus_blast()), 1e-9);

    state.sides[0].active->boosts.accuracy = 6;
    TEST_ASSERT_NEAR(0.7, calc.accuracy(state, 0, focus_blast()), 1e-9);
}

TEST(Accuracy, WeatherDependentMoves) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {blissey()});
    const Calculator& calc = engine.get_calculator();

    Move thunder = attack(move_ids::THUNDER, PokeType::ELECTRIC, MoveCategory::SPECIAL, 110, 0.7);
    Move blizzard = attack(move_ids::BLIZZARD, PokeType::ICE, MoveCategory::SPECIAL, 110, 0.7);

    state.field.set_weather(Weather::RAIN, 5, false);
    TEST_ASSERT_EQ(1.0, calc.accuracy(state, 0, thunder));

    state.field.set_weather(Weather::SUN, 5, false);
    TEST_ASSERT_NEAR(0.5, calc.accuracy(state, 0, thunder), 1e-9);

    state.field.set_weather(Weather::SNOW, 5, false);
    TEST_ASSERT_EQ(1.0, calc.accuracy(state, 0, blizzard));
    TEST_ASSERT(calc.accuracy(state, 0, thunder) < 1.0);
}

TEST(Accuracy, NonTargetedMovesAlwaysHit) {
    BattleEngine engine;
    BattleState state = start(engine, {heatran()}, {blissey()});
    state.sides[1].active->boosts.evasion = 6;

    TEST_ASSERT_EQ(1.0, engine.get_calculator().accuracy(state, 0, stealth_rock()));
}

// ============================================================================
// SPEED CHECK
// ============================================================================

TEST(SpeedCheck, FasterSideHasPositiveDiff) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {garchomp()});

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(1));
    TEST_ASSERT_TRUE(r.speed_check.faster);
    TEST_ASSERT_FALSE(r.speed_check.tie);
    TEST_ASSERT_EQ(333, r.speed_check.our_speed);
    TEST_ASSERT_EQ(280, r.speed_check.their_speed);
    TEST_ASSERT_EQ(53, r.speed_check.speed_diff);
}

TEST(SpeedCheck, TrickRoomInvertsOrder) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {garchomp()});
    state.sides[1].conditions[SideConditionKind::TRICK_ROOM] = 5;

    SpeedCheck sc = engine.get_calculator().speed_check(state, 0);
    TEST_ASSERT_FALSE(sc.faster);
    TEST_ASSERT_EQ(-53, sc.speed_diff);

    SpeedCheck theirs = engine.get_calculator().speed_check(state, 1);
    TEST_ASSERT_TRUE(theirs.faster);
    TEST_ASSERT_EQ(53, theirs.speed_diff);
}

TEST(SpeedCheck, TieIsNeverFaster) {
    BattleEngine engine;
    Pokemon chomp = garchomp();
    chomp.stats.spe = 333;
    BattleState state = start(engine, {dragapult()}, {chomp});

    SpeedCheck sc = engine.get_calculator().speed_check(state, 0);
    TEST_ASSERT_TRUE(sc.tie);
    TEST_ASSERT_FALSE(sc.faster);
    TEST_ASSERT_EQ(0, sc.speed_diff);
}

TEST(SpeedCheck, ModifiersApply) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {garchomp("choicescarf")});
    const Calculator& calc = engine.get_calculator();

    TEST_ASSERT_EQ(420, calc.speed_check(state, 0).their_speed);

    state.sides[0].active->status = StatusCondition::PARALYSIS;
    TEST_ASSERT_EQ(166, calc.speed_check(state, 0).our_speed);

    state.sides[0].conditions[SideConditionKind::TAILWIND] = 4;
    TEST_ASSERT_EQ(333, calc.speed_check(state, 0).our_speed);
}

TEST(SpeedCheck, BeliefOverridesOpponent) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {garchomp()});

    BeliefContext belief;
    belief.opponent_item = "choicescarf";
    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(0), &belief);
    TEST_ASSERT_FALSE(r.speed_check.faster);
    TEST_ASSERT_EQ(420, r.speed_check.their_speed);

    BeliefContext speed_only;
    speed_only.opponent_speed = 100;
    r = engine.get_calculator().evaluate(state, 0, actions::move(0), &speed_only);
    TEST_ASSERT_EQ(233, r.speed_check.speed_diff);

    // The state itself is untouched
    TEST_ASSERT_TRUE(state.sides[1].active->item.empty());
}

// ============================================================================
// SWITCHES AND HAZARDS
// ============================================================================

TEST(Hazards, StealthRockAndSpikes) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey(), corviknight()}, {heatran()});
    const Calculator& calc = engine.get_calculator();

    state.sides[0].hazards.stealth_rock = true;
    TEST_ASSERT_NEAR(12.5, calc.hazard_damage(state, 0, 0), 1e-9);

    state.sides[0].hazards.spikes = 3;
    TEST_ASSERT_NEAR(37.5, calc.hazard_damage(state, 0, 0), 1e-9);

    // Airborne: rocks only (Rock is neutral on Flying/Steel)
    TEST_ASSERT_NEAR(12.5, calc.hazard_damage(state, 0, 1), 1e-9);

    state.sides[0].hazards.stealth_rock = false;
    TEST_ASSERT_EQ(0.0, calc.hazard_damage(state, 0, 1));
}

TEST(Hazards, HeavyDutyBootsBlockEverything) {
    BattleEngine engine;
    Pokemon booted = blissey();
    booted.item = "heavydutyboots";
    BattleState state = start(engine, {garchomp(), booted}, {heatran()});
    state.sides[0].hazards.stealth_rock = true;
    state.sides[0].hazards.spikes = 2;
    state.sides[0].hazards.toxic_spikes = 2;

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::switch_to(0));
    TEST_ASSERT_FALSE(r.error);
    TEST_ASSERT_EQ(0.0, r.hazard_damage);
    TEST_ASSERT_EQ(0.0, r.status_chance);
}

TEST(Hazards, SwitchEvaluation) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey(), corviknight()}, {heatran()});
    state.sides[0].hazards.stealth_rock = true;
    state.sides[0].hazards.toxic_spikes = 2;

    CalcResult grounded = engine.get_calculator().evaluate(state, 0, actions::switch_to(0));
    TEST_ASSERT_FALSE(grounded.error);
    TEST_ASSERT_EQ(1.0, grounded.accuracy);
    TEST_ASSERT_NEAR(12.5, grounded.hazard_damage, 1e-9);
    TEST_ASSERT_EQ(1.0, grounded.status_chance);
    TEST_ASSERT(grounded.expected_gain <= -12.5);

    CalcResult flying = engine.get_calculator().evaluate(state, 0, actions::switch_to(1));
    TEST_ASSERT_EQ(0.0, flying.status_chance);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(CalculatorErrors, BadSlotBecomesErrorResult) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey()}, {heatran()});

    std::vector<CalcResult> results = engine.evaluate(state, 0, {
        actions::move(0), actions::move(7), actions::switch_to(4), actions::move_by_id("nosuchmove")
    });

    TEST_ASSERT_EQ(4u, results.size());
    TEST_ASSERT_FALSE(results[0].error);
    for (size_t i = 1; i < results.size(); ++i) {
        TEST_ASSERT_TRUE(results[i].error);
        TEST_ASSERT_EQ(static_cast<int>(ErrorKind::INVALID_ACTION), static_cast<int>(results[i].error_kind));
        TEST_ASSERT_EQ(0.0, results[i].accuracy);
        TEST_ASSERT_EQ(0.0, results[i].expected_survival);
        TEST_ASSERT_EQ(0.0, results[i].expected_gain);
    }
}

TEST(CalculatorErrors, FaintedBenchIsInvalid) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey()}, {heatran()});
    state.sides[0].bench[0].faint();

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::switch_to(0));
    TEST_ASSERT_TRUE(r.error);
    TEST_ASSERT_EQ(static_cast<int>(ErrorKind::INVALID_ACTION), static_cast<int>(r.error_kind));
}

TEST(CalculatorErrors, MissingActiveIsMissingEntity) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.sides[1].active.reset();

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(0));
    TEST_ASSERT_TRUE(r.error);
    TEST_ASSERT_EQ(static_cast<int>(ErrorKind::MISSING_ENTITY), static_cast<int>(r.error_kind));
}

TEST(CalculatorErrors, UnknownFormatThrows) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.format_id = "gen1randombattle";

    bool thrown = false;
    try {
        engine.evaluate(state, 0, {actions::move(0)});
    } catch (const UnsupportedFormat& e) {
        thrown = true;
        TEST_ASSERT_EQ(static_cast<int>(ErrorKind::UNSUPPORTED_FORMAT), static_cast<int>(e.kind()));
    }
    TEST_ASSERT_TRUE(thrown);
}

// ============================================================================
// OUTCOMES
// ============================================================================

TEST(Calculator, EvaluationIsDeterministic) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult(), garchomp()}, {heatran(), blissey()});
    BattleState before = state;
    std::vector<Action> candidates = {actions::move(0), actions::move(1), actions::move(3),
                                      actions::switch_to(0), actions::pass()};

    std::vector<CalcResult> first = engine.evaluate(state, 0, candidates);
    std::vector<CalcResult> second = engine.evaluate(state, 0, candidates);

    TEST_ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        TEST_ASSERT_EQ(first[i].damage.avg_percent, second[i].damage.avg_percent);
        TEST_ASSERT_EQ(first[i].ohko_prob, second[i].ohko_prob);
        TEST_ASSERT_EQ(first[i].expected_gain, second[i].expected_gain);
        TEST_ASSERT_EQ(first[i].expected_survival, second[i].expected_survival);
    }

    // Evaluating never draws from the battle RNG
    TEST_ASSERT_EQ(before.rng(), state.rng());
    TEST_ASSERT_EQ(before.log.size(), state.log.size());
}

TEST(Calculator, FocusSashPreventsOhko) {
    BattleEngine engine;
    Pokemon sashed = make_pokemon("Pichu", {PokeType::ELECTRIC}, Stats{100, 50, 50, 50, 50, 10},
                                  {tackle()}, "", "focussash");
    BattleState state = start(engine, {garchomp()}, {sashed});

    CalcResult r = engine.get_calculator().evaluate(state, 0, actions::move(0));
    TEST_ASSERT_EQ(0.0, r.ohko_prob);
    TEST_ASSERT_EQ(1.0, r.twohko_prob);

    state.sides[1].active->item.clear();
    r = engine.get_calculator().evaluate(state, 0, actions::move(0));
    TEST_ASSERT_EQ(1.0, r.ohko_prob);
}

TEST(Calculator, LifeOrbBoostsAndCosts) {
    BattleEngine engine;
    BattleState plain = start(engine, {garchomp()}, {blissey()});
    BattleState orb = start(engine, {garchomp("lifeorb")}, {blissey()});

    CalcResult a = engine.get_calculator().evaluate(plain, 0, actions::move(0));
    CalcResult b = engine.get_calculator().evaluate(orb, 0, actions::move(0));
    TEST_ASSERT(b.damage.avg_percent > a.damage.avg_percent);

    // Both knock Blissey out, so only the 10% recoil differs
    TEST_ASSERT_EQ(1.0, a.ohko_prob);
    TEST_ASSERT_NEAR(10.0, (a.expected_gain - b.expected_gain), 1e-9);
}

TEST(Calculator, PassAndStatusMoves) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult()}, {blissey()});

    CalcResult pass = engine.get_calculator().evaluate(state, 0, actions::pass());
    TEST_ASSERT_FALSE(pass.error);
    TEST_ASSERT_EQ(1.0, pass.accuracy);
    TEST_ASSERT(pass.expected_gain <= 0.0);

    // Thunder Wave: 90% to hit, paralysis guaranteed on a hit
    CalcResult twave = engine.get_calculator().evaluate(state, 0, actions::move(2));
    TEST_ASSERT_NEAR(0.9, twave.accuracy, 1e-9);
    TEST_ASSERT_NEAR(0.9, twave.status_chance, 1e-9);
    TEST_ASSERT_EQ(0.0, twave.damage.max_percent);

    // Already statused: nothing to inflict
    state.sides[1].active->status = StatusCondition::BURN;
    twave = engine.get_calculator().evaluate(state, 0, actions::move(2));
    TEST_ASSERT_EQ(0.0, twave.status_chance);
}

TEST(Calculator, TeraDeltasOnlyForTera) {
    BattleEngine engine;
    Pokemon chomp = garchomp();
    chomp.tera.available = true;
    chomp.tera.type = PokeType::GROUND;
    BattleState state = start(engine, {chomp}, {heatran()});

    CalcResult plain = engine.get_calculator().evaluate(state, 0, actions::move(0));
    TEST_ASSERT_EQ(0.0, plain.tera_offense_delta);
    TEST_ASSERT_EQ(0.0, plain.tera_defense_delta);

    CalcResult tera = engine.get_calculator().evaluate(state, 0, actions::tera(0));
    TEST_ASSERT_FALSE(tera.error);
    TEST_ASSERT(tera.tera_offense_delta > 0.0);
    TEST_ASSERT(tera.tera_defense_delta < 0.0);
    TEST_ASSERT(tera.damage.avg_percent > plain.damage.avg_percent);

    // Evaluating tera does not spend it
    TEST_ASSERT_TRUE(state.sides[0].active->tera.available);
    TEST_ASSERT_FALSE(state.sides[0].tera_used);
}
