#include "engine_config.h"
#include "errors.h"
#include "simulation/simulation_config.h"
#include <gtest/gtest.h>
#include <json/json.h>
#include <sstream>

namespace {

Json::Value parse(const std::string &text) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  std::istringstream in(text);
  if (!Json::parseFromStream(builder, in, &root, &errors))
    throw std::runtime_error("bad test document: " + errors);
  return root;
}

std::string rejection_scope(const EngineConfig &config) {
  try {
    config.validate();
  } catch (const ConfigurationError &e) {
    return e.payload().scope;
  }
  return "";
}

} // namespace

TEST(EngineConfigTest, DefaultsAreValid) {
  EngineConfig config = default_engine_config();
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.zone_table.size(), 12u);
  EXPECT_DOUBLE_EQ(config.baseline_rate(Zone::SLOT, ShotType::WRIST), 0.15);
  EXPECT_NEAR(config.baseline_rate(Zone::CREASE, ShotType::TIP_IN), 0.42,
              1e-12);
  EXPECT_NEAR(config.baseline_rate(Zone::BEHIND_NET, ShotType::WRAP_AROUND),
              0.007, 1e-12);
  EXPECT_EQ(config.matchup.min_sample, 3);
  EXPECT_EQ(config.game_phases.mid_end_seconds, 2400);
}

TEST(EngineConfigTest, RejectsMalformedThresholds) {
  EngineConfig config = default_engine_config();
  config.matchup.full_confidence_sample = config.matchup.min_sample;
  EXPECT_EQ(rejection_scope(config), "matchup.full_confidence_sample");

  config = default_engine_config();
  config.game_phases.mid_end_seconds = config.game_phases.early_end_seconds;
  EXPECT_EQ(rejection_scope(config), "game_phases");

  config = default_engine_config();
  config.adjustments.momentum_bound = 1.0;
  EXPECT_EQ(rejection_scope(config), "adjustments.momentum_bound");

  config = default_engine_config();
  config.adjustments.rest_modifiers = {1.0, 0.9};
  EXPECT_EQ(rejection_scope(config), "adjustments.rest_modifiers");

  config = default_engine_config();
  config.resolver.min_probability = 0.96;
  EXPECT_EQ(rejection_scope(config), "resolver.probability clamp");

  config = default_engine_config();
  config.resolver.max_adjustment_product = 0.9;
  EXPECT_EQ(rejection_scope(config), "resolver.adjustment product clamp");

  config = default_engine_config();
  config.adjustments.synergy_min_shared_toi = 0;
  EXPECT_EQ(rejection_scope(config), "adjustments.synergy_min_shared_toi");

  config = default_engine_config();
  config.adjustments.synergy_z_cap = 0.0;
  EXPECT_EQ(rejection_scope(config), "adjustments.synergy_z_cap");

  config = default_engine_config();
  config.adjustments.synergy_sensitivity = -0.1;
  EXPECT_EQ(rejection_scope(config), "adjustments.synergy_sensitivity");

  config = default_engine_config();
  config.resolver.goalie_weight = -5.0;
  EXPECT_EQ(rejection_scope(config), "resolver.goalie_weight");
  config.resolver.goalie_weight = 0.0;
  EXPECT_EQ(rejection_scope(config), "resolver.goalie_weight");

  config = default_engine_config();
  config.simulation.overtime_pace = -1.0;
  EXPECT_EQ(rejection_scope(config), "simulation.overtime_pace");

  config = default_engine_config();
  config.simulation.home_ice_factor = -2.0;
  EXPECT_EQ(rejection_scope(config), "simulation.home_ice_factor");
}

TEST(EngineConfigTest, RejectsBrokenTables) {
  EngineConfig config = default_engine_config();
  config.zone_table.clear();
  EXPECT_EQ(rejection_scope(config), "zones");

  config = default_engine_config();
  config.zone_table.push_back({Zone::SLOT, 80, 70, 0, 10});
  EXPECT_EQ(rejection_scope(config), "zones.slot");

  config = default_engine_config();
  config.baseline_xg[index_of(Zone::SLOT)][index_of(ShotType::SNAP)] = 0.0;
  EXPECT_EQ(rejection_scope(config), "baseline_xg.slot/snap");
}

TEST(EngineConfigTest, JsonOverlaysDefaults) {
  EngineConfig config = engine_config_from_json(parse(R"({
    "matchup": {"min_sample": 4, "full_confidence_sample": 12},
    "adjustments": {"clutch_bound": 0.1, "rest_modifiers": [0.9, 1.0]},
    "baseline_xg": {
      "zone_rates": {"slot": 0.2},
      "overrides": [{"zone": "crease", "shot_type": "tip_in", "rate": 0.5}]
    },
    "simulation": {"shootout_success": 0.4}
  })"));

  EXPECT_EQ(config.matchup.min_sample, 4);
  EXPECT_EQ(config.matchup.full_confidence_sample, 12);
  EXPECT_DOUBLE_EQ(config.adjustments.clutch_bound, 0.1);
  ASSERT_EQ(config.adjustments.rest_modifiers.size(), 2u);
  EXPECT_DOUBLE_EQ(config.baseline_rate(Zone::SLOT, ShotType::WRIST), 0.2);
  EXPECT_DOUBLE_EQ(config.baseline_rate(Zone::CREASE, ShotType::TIP_IN), 0.5);
  EXPECT_DOUBLE_EQ(config.simulation.shootout_success, 0.4);
  // untouched sections keep their defaults
  EXPECT_DOUBLE_EQ(config.resolver.max_probability, 0.95);
}

TEST(EngineConfigTest, JsonErrorsAreConfigurationErrors) {
  EXPECT_THROW(engine_config_from_json(parse(R"({"matchup": {"min_sample": "x"}})")),
               ConfigurationError);
  EXPECT_THROW(engine_config_from_json(parse(R"({"matchup": {"min_sample": 12}})")),
               ConfigurationError);
  EXPECT_THROW(engine_config_from_json(parse(R"({"zones": [{"zone": "moon"}]})")),
               ConfigurationError);
  EXPECT_THROW(
      engine_config_from_json(parse(R"({"adjustments": {"rest_modifiers": []}})")),
      ConfigurationError);
  EXPECT_THROW(load_engine_config("/nonexistent/engine.json"),
               ConfigurationError);
}

TEST(EngineConfigTest, ShippedConfigurationLoads) {
  EngineConfig shipped =
      load_engine_config(std::string(HOCKEY_SOURCE_DIR) + "/config/engine.json");
  EngineConfig defaults = default_engine_config();
  EXPECT_EQ(shipped.zone_table.size(), defaults.zone_table.size());
  EXPECT_EQ(shipped.matchup.min_sample, defaults.matchup.min_sample);
  for (Zone z : ALL_ZONES)
    for (ShotType t : ALL_SHOT_TYPES)
      EXPECT_NEAR(shipped.baseline_rate(z, t), defaults.baseline_rate(z, t),
                  1e-12);
}

TEST(SimulationConfigTest, ValidatesRunParameters) {
  SimulationConfig sim;
  sim.home_team = 1;
  sim.away_team = 2;
  sim.game_date = "2025-01-15";
  EXPECT_NO_THROW(sim.validate());

  SimulationConfig same = sim;
  same.away_team = 1;
  EXPECT_THROW(same.validate(), ConfigurationError);

  SimulationConfig empty = sim;
  empty.iteration_count = 0;
  EXPECT_THROW(empty.validate(), ConfigurationError);

  SimulationConfig dated = sim;
  dated.game_date = "15/01/2025";
  EXPECT_THROW(dated.validate(), ConfigurationError);

  SimulationConfig weighted = sim;
  weighted.segment_weights[1] = 0.0;
  EXPECT_THROW(weighted.validate(), ConfigurationError);
}

TEST(SimulationConfigTest, SeriesValidationAndHomeIcePattern) {
  SeriesConfig series;
  EXPECT_NO_THROW(series.validate());
  series.home_wins = 4;
  EXPECT_THROW(series.validate(), ConfigurationError);

  const bool expected[] = {true, true, false, false, true, false, true};
  for (int g = 0; g < 7; ++g)
    EXPECT_EQ(SeriesConfig::home_hosts(g), expected[g]) << "game " << g + 1;
}
