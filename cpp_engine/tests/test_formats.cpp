/**
 * Tests for Format Rules, the Move Dex and the Effect Table
 */

#include <sstream>
#include <nlohmann/json.hpp>
#include "test_helpers.hpp"
#include "mechanics.hpp"

using namespace pokebattle;
using namespace fixtures;

// ============================================================================
// FORMAT RULES
// ============================================================================

TEST(Formats, BuiltinFormats) {
    FormatRegistry registry;
    TEST_ASSERT_TRUE(registry.has_format("gen9ou"));
    TEST_ASSERT_TRUE(registry.has_format("gen9nationaldex"));
    TEST_ASSERT_TRUE(registry.has_format("gen8battlestadiumsingles"));
    TEST_ASSERT_FALSE(registry.has_format("gen1ou"));

    const FormatRules& ou = registry.require("gen9ou");
    TEST_ASSERT_TRUE(ou.tera_allowed);
    TEST_ASSERT_FALSE(ou.mega_allowed);
    TEST_ASSERT_FALSE(ou.dynamax_allowed);
    TEST_ASSERT_TRUE(ou.clauses.sleep);
    TEST_ASSERT_TRUE(ou.clauses.species);

    const FormatRules& bss = registry.require("gen8battlestadiumsingles");
    TEST_ASSERT_TRUE(bss.dynamax_allowed);
    TEST_ASSERT_FALSE(bss.tera_allowed);
    TEST_ASSERT_FALSE(bss.clauses.sleep);
}

TEST(Formats, RequireThrowsForUnknown) {
    FormatRegistry registry;
    TEST_ASSERT_NULL(registry.get_format("gen3ou"));

    bool threw = false;
    try {
        registry.require("gen3ou");
    } catch (const UnsupportedFormat& e) {
        threw = true;
        TEST_ASSERT(std::string(e.what()).find("gen3ou") != std::string::npos);
    }
    TEST_ASSERT(threw);
}

TEST(Formats, ParseAndReplace) {
    FormatRegistry registry;
    size_t before = registry.format_count();

    nlohmann::json j = {{"id", "Gen9 Monotype"}, {"generation", 9}, {"tera_allowed", false},
                        {"clauses", {{"species", true}}}};
    FormatRules mono = FormatRegistry::parse_format(j);
    TEST_ASSERT_EQ(std::string("gen9monotype"), mono.id);
    TEST_ASSERT_TRUE(mono.clauses.species);
    TEST_ASSERT_FALSE(mono.clauses.sleep);

    registry.register_format(mono);
    TEST_ASSERT_EQ(before + 1, registry.format_count());

    FormatRules no_tera = registry.require("gen9ou");
    no_tera.tera_allowed = false;
    registry.register_format(no_tera);
    TEST_ASSERT_EQ(before + 1, registry.format_count());
    TEST_ASSERT_FALSE(registry.require("gen9ou").tera_allowed);
}

TEST(Formats, TeraFollowsTheFormat) {
    BattleEngine engine;
    Pokemon g = garchomp();
    g.tera.available = true;
    g.tera.type = PokeType::GROUND;

    BattleState ou = start(engine, {g}, {dragapult()});
    auto ou_candidates = engine.get_legal_actions(ou, 0);
    const LegalAction* tera = find_action(ou_candidates, actions::tera(0));
    TEST_ASSERT_NOT_NULL(tera);
    TEST_ASSERT_TRUE(tera->is_enabled());

    BattleState gen7 = start(engine, {g}, {dragapult()}, "gen7ou");
    auto candidates = engine.get_legal_actions(gen7, 0);
    tera = find_action(candidates, actions::tera(0));
    TEST_ASSERT_NOT_NULL(tera);
    TEST_ASSERT_EQ(std::string("tera not allowed by format"), tera->reason);
}

TEST(Formats, DataFileLoads) {
    FormatRegistry registry;
    TEST_ASSERT_TRUE(registry.load_from_json(std::string(POKEBATTLE_DATA_DIR) + "/formats.json"));
    TEST_ASSERT_TRUE(registry.has_format("gen9monotype"));
    TEST_ASSERT_TRUE(registry.has_format("gen8ou"));
    TEST_ASSERT_FALSE(registry.load_from_json("does/not/exist.json"));
}

// ============================================================================
// MOVE DEX
// ============================================================================

TEST(MoveDex, StruggleAlwaysPresent) {
    MoveDex dex;
    const Move* struggle = dex.get_move("struggle");
    TEST_ASSERT_NOT_NULL(struggle);
    TEST_ASSERT_TRUE(struggle->always_hits);
    TEST_ASSERT_EQ(static_cast<int>(PokeType::TYPELESS), static_cast<int>(struggle->type));
    TEST_ASSERT_NULL(dex.get_move("earthquake"));
}

TEST(MoveDex, ParsesPercentagesAndFlags) {
    nlohmann::json thunder = {{"id", "thunder"}, {"name", "Thunder"}, {"type", "Electric"},
                              {"category", "Special"}, {"basePower", 110}, {"accuracy", 70},
                              {"pp", 10}, {"target", "normal"},
                              {"secondaries", nlohmann::json::array({{{"kind", "status"}, {"status", "par"}, {"chance", 30}}})}};
    Move m = MoveDex::parse_move(thunder);
    TEST_ASSERT_EQ(110, m.base_power);
    TEST_ASSERT_NEAR(0.7, m.accuracy, 1e-9);
    TEST_ASSERT_FALSE(m.always_hits);
    TEST_ASSERT_EQ(1u, m.secondaries.size());
    TEST_ASSERT_NEAR(0.3, m.secondaries[0].chance, 1e-9);
    TEST_ASSERT_EQ(static_cast<int>(StatusCondition::PARALYSIS), static_cast<int>(m.secondaries[0].status));

    nlohmann::json rocks = {{"id", "stealthrock"}, {"type", "Rock"}, {"category", "Status"},
                            {"accuracy", true}, {"target", "foeSide"}};
    Move sr = MoveDex::parse_move(rocks);
    TEST_ASSERT_TRUE(sr.always_hits);
    TEST_ASSERT_EQ(static_cast<int>(MoveTarget::FOE_SIDE), static_cast<int>(sr.target));
}

TEST(MoveDex, DataFileLoads) {
    MoveDex dex;
    TEST_ASSERT_TRUE(dex.load_from_json(std::string(POKEBATTLE_DATA_DIR) + "/moves.json"));
    TEST_ASSERT(dex.move_count() > 50);

    const Move* solar = dex.get_move("solarbeam");
    TEST_ASSERT_NOT_NULL(solar);
    TEST_ASSERT_TRUE(solar->flags.charge);

    const Move* uturn = dex.get_move("uturn");
    TEST_ASSERT_NOT_NULL(uturn);
    TEST_ASSERT_TRUE(uturn->flags.contact);
    TEST_ASSERT_TRUE(uturn->has_secondary(SecondaryKind::SELF_SWITCH));
}

// ============================================================================
// EFFECT TABLE
// ============================================================================

TEST(EffectTable, BuiltinRows) {
    BattleEngine engine;
    const EffectTable& table = engine.get_effect_table();
    TEST_ASSERT(table.entry_count() > 50);
    TEST_ASSERT_TRUE(table.has_effect(TriggerPhase::ON_SWITCH_IN, EffectSource::ABILITY, "intimidate"));
    TEST_ASSERT_TRUE(table.has_kind(EffectSource::ITEM, "choicescarf", EffectKind::CHOICE_LOCK));
    TEST_ASSERT_TRUE(table.lookup(TriggerPhase::END_OF_TURN, EffectSource::ITEM, "choicescarf").empty());
    TEST_ASSERT_EQ(2u, table.lookup(TriggerPhase::ON_DAMAGING_HIT, EffectSource::ITEM, "lifeorb").size());
}

TEST(EffectTable, ExtraRowsFromJson) {
    EffectTable table;
    register_all_abilities(table);
    register_all_items(table);

    nlohmann::json row = {{"id", "quickstart"}, {"source", "ability"}, {"phase", "modify_speed"},
                          {"kind", "speed_modifier"}, {"multiplier", 2.0}};
    table.register_entry(EffectTable::parse_entry(row));

    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {dragapult()});
    state.sides[0].active->ability = "quickstart";
    TEST_ASSERT_EQ(560, mechanics::effective_speed(table, state, 0));
    TEST_ASSERT_EQ(280, mechanics::effective_speed(engine.get_effect_table(), state, 0));
}

// ============================================================================
// ENGINE CONFIG
// ============================================================================

TEST(EngineConfig, DataFileLoads) {
    EngineConfig config;
    TEST_ASSERT_TRUE(config.load_from_json(std::string(POKEBATTLE_DATA_DIR) + "/engine.json"));
    TEST_ASSERT_EQ(std::string("data/moves.json"), config.moves_path);
    TEST_ASSERT_EQ(42u, config.default_seed);
    TEST_ASSERT_TRUE(config.check_invariants);
    TEST_ASSERT_FALSE(config.trace_enabled);
    TEST_ASSERT_EQ(std::string("logs"), config.trace_dir);

    EngineConfig missing;
    TEST_ASSERT_FALSE(missing.load_from_json("does/not/exist.json"));
}

TEST(EngineConfig, PathsFeedTheEngine) {
    EngineConfig config;
    config.moves_path = std::string(POKEBATTLE_DATA_DIR) + "/moves.json";
    config.formats_path = std::string(POKEBATTLE_DATA_DIR) + "/formats.json";

    const BattleEngine engine(config);
    TEST_ASSERT_NOT_NULL(engine.get_move_dex().get_move("earthquake"));
    TEST_ASSERT_TRUE(engine.get_formats().has_format("gen9monotype"));

    // Everything a battle needs goes through the const interface
    BattleState state = start(engine, {garchomp()}, {heatran()}, "gen9monotype");
    auto results = engine.evaluate(state, 0, {actions::move(0)});
    TEST_ASSERT_FALSE(results[0].error);
    AdvanceResult r = engine.advance(state, actions::move(1), actions::move(1));
    TEST_ASSERT_EQ(2, r.state.turn);

    BattleEngine bare;
    TEST_ASSERT_NULL(bare.get_move_dex().get_move("earthquake"));
    TEST_ASSERT_FALSE(bare.get_formats().has_format("gen9monotype"));
}
