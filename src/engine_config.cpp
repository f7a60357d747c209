#include "../include/engine_config.h"
#include "../include/errors.h"
#include "../include/logging.h"
#include <fstream>
#include <json/json.h>
#include <sstream>

namespace {

constexpr std::array<double, NUM_ZONES> DEFAULT_ZONE_RATES = {
    0.35, // crease
    0.25, // inner_slot
    0.15, // slot
    0.05, // high_slot
    0.08, // left_circle
    0.08, // right_circle
    0.03, // left_wing
    0.03, // right_wing
    0.02, // left_point
    0.02, // right_point
    0.01, // behind_net
    0.01, // neutral_zone
    0.03  // perimeter
};

constexpr std::array<double, NUM_SHOT_TYPES> DEFAULT_SHOT_TYPE_MODIFIERS = {
    1.00, // wrist
    0.95, // slap
    1.05, // snap
    0.85, // backhand
    1.20, // tip_in
    1.15, // deflected
    0.70, // wrap_around
    1.00  // other
};

std::vector<ZoneRect> default_zone_table() {
  // First match wins, so nested regions come before the ones around them.
  return {
      {Zone::CREASE, 84.0, 89.0, -4.0, 4.0},
      {Zone::INNER_SLOT, 74.0, 89.0, -9.0, 9.0},
      {Zone::BEHIND_NET, 89.0, 100.0, -42.5, 42.5},
      {Zone::SLOT, 69.0, 89.0, -22.0, 22.0},
      {Zone::LEFT_WING, 69.0, 89.0, -42.5, -22.0},
      {Zone::RIGHT_WING, 69.0, 89.0, 22.0, 42.5},
      {Zone::LEFT_CIRCLE, 54.0, 69.0, -32.0, -12.0},
      {Zone::RIGHT_CIRCLE, 54.0, 69.0, 12.0, 32.0},
      {Zone::HIGH_SLOT, 45.0, 69.0, -12.0, 12.0},
      {Zone::LEFT_POINT, 25.0, 54.0, -42.5, -12.0},
      {Zone::RIGHT_POINT, 25.0, 54.0, 12.0, 42.5},
      {Zone::NEUTRAL_ZONE, 0.0, 25.0, -42.5, 42.5},
  };
}

std::string where(const std::string &section, const std::string &key) {
  return section + "." + key;
}

void fail(const std::string &scope, const std::string &detail) {
  throw ConfigurationError(ErrorPayload{-1, scope, detail});
}

void check_bound(const std::string &key, double value) {
  if (!(value >= 0.0 && value < 1.0))
    fail(where("adjustments", key), "bound must lie in [0, 1)");
}

void read_double(const Json::Value &node, const char *key, double &out) {
  if (node.isMember(key)) {
    if (!node[key].isNumeric())
      fail(key, "expected a number");
    out = node[key].asDouble();
  }
}

void read_int(const Json::Value &node, const char *key, int &out) {
  if (node.isMember(key)) {
    if (!node[key].isInt())
      fail(key, "expected an integer");
    out = node[key].asInt();
  }
}

void read_table(const Json::Value &node, const char *key,
                std::vector<double> &out) {
  if (!node.isMember(key))
    return;
  const Json::Value &arr = node[key];
  if (!arr.isArray() || arr.empty())
    fail(key, "expected a non-empty array");
  out.clear();
  for (const auto &v : arr) {
    if (!v.isNumeric())
      fail(key, "expected numeric entries");
    out.push_back(v.asDouble());
  }
}

void rebuild_baseline(EngineConfig &config,
                      const std::array<double, NUM_ZONES> &zone_rates,
                      const std::array<double, NUM_SHOT_TYPES> &modifiers) {
  for (Zone z : ALL_ZONES) {
    for (ShotType t : ALL_SHOT_TYPES) {
      double rate = zone_rates[index_of(z)] * modifiers[index_of(t)];
      config.baseline_xg[index_of(z)][index_of(t)] =
          std::min(0.99, std::max(0.0005, rate));
    }
  }
}

} // namespace

void EngineConfig::validate() const {
  if (zone_table.empty())
    fail("zones", "zone table is empty");
  for (const auto &rect : zone_table) {
    if (rect.x_min > rect.x_max || rect.y_min > rect.y_max)
      fail(where("zones", to_string(rect.zone)), "inverted rectangle");
  }

  for (Zone z : ALL_ZONES) {
    for (ShotType t : ALL_SHOT_TYPES) {
      double rate = baseline_rate(z, t);
      if (!(rate > 0.0 && rate < 1.0))
        fail(where("baseline_xg", to_string(z) + "/" + to_string(t)),
             "rate must lie in (0, 1)");
    }
  }

  if (!(game_phases.early_end_seconds > 0 &&
        game_phases.early_end_seconds < game_phases.mid_end_seconds &&
        game_phases.mid_end_seconds < game_phases.regulation_end_seconds))
    fail("game_phases", "boundaries must be strictly increasing");

  if (matchup.min_sample < 1)
    fail(where("matchup", "min_sample"), "must be at least 1");
  if (matchup.min_sample >= matchup.full_confidence_sample)
    fail(where("matchup", "full_confidence_sample"),
         "must exceed min_sample (" + std::to_string(matchup.min_sample) +
             ")");
  if (!(matchup.deviation_scale > 0.0))
    fail(where("matchup", "deviation_scale"), "must be positive");

  check_bound("clutch_bound", adjustments.clutch_bound);
  check_bound("fatigue_bound", adjustments.fatigue_bound);
  check_bound("momentum_bound", adjustments.momentum_bound);
  check_bound("synergy_bound", adjustments.synergy_bound);
  if (adjustments.rest_modifiers.empty() ||
      adjustments.workload_modifiers.empty())
    fail("adjustments", "fatigue tables must not be empty");
  for (size_t i = 1; i < adjustments.rest_modifiers.size(); ++i) {
    if (adjustments.rest_modifiers[i] < adjustments.rest_modifiers[i - 1])
      fail(where("adjustments", "rest_modifiers"),
           "must be non-decreasing with rest");
  }
  for (size_t i = 1; i < adjustments.workload_modifiers.size(); ++i) {
    if (adjustments.workload_modifiers[i] >
        adjustments.workload_modifiers[i - 1])
      fail(where("adjustments", "workload_modifiers"),
           "must be non-increasing with load");
  }
  if (adjustments.momentum_min_recent_games < 1 ||
      adjustments.momentum_window < adjustments.momentum_min_recent_games)
    fail(where("adjustments", "momentum_window"),
         "window must cover the minimum recent games");
  if (adjustments.hot_ppg_threshold <= adjustments.cold_ppg_threshold ||
      adjustments.hot_shooting_threshold <=
          adjustments.cold_shooting_threshold)
    fail(where("adjustments", "hot/cold thresholds"),
         "hot thresholds must exceed cold thresholds");
  if (adjustments.workload_window_days < 1)
    fail(where("adjustments", "workload_window_days"), "must be positive");
  if (adjustments.synergy_min_shared_toi < 1)
    fail(where("adjustments", "synergy_min_shared_toi"), "must be positive");
  if (!(adjustments.synergy_z_cap > 0.0))
    fail(where("adjustments", "synergy_z_cap"), "must be positive");
  if (!(adjustments.synergy_sensitivity >= 0.0))
    fail(where("adjustments", "synergy_sensitivity"), "must not be negative");

  if (!(resolver.min_probability > 0.0 &&
        resolver.min_probability < resolver.max_probability &&
        resolver.max_probability < 1.0))
    fail(where("resolver", "probability clamp"),
         "need 0 < min < max < 1");
  if (!(resolver.min_adjustment_product > 0.0 &&
        resolver.min_adjustment_product <= 1.0 &&
        resolver.max_adjustment_product >= 1.0 &&
        resolver.min_adjustment_product < resolver.max_adjustment_product))
    fail(where("resolver", "adjustment product clamp"),
         "need 0 < min <= 1 <= max and min < max");
  if (resolver.prior_shots < 0.0)
    fail(where("resolver", "prior_shots"), "must not be negative");
  if (!(resolver.goalie_weight > 0.0))
    fail(where("resolver", "goalie_weight"), "must be positive");

  if (!(simulation.league_shots_per_60 > 0.0))
    fail(where("simulation", "league_shots_per_60"), "must be positive");
  if (simulation.overtime_seconds <= 0)
    fail(where("simulation", "overtime_seconds"), "must be positive");
  if (!(simulation.overtime_pace > 0.0))
    fail(where("simulation", "overtime_pace"), "must be positive");
  if (!(simulation.home_ice_factor > 0.0))
    fail(where("simulation", "home_ice_factor"), "must be positive");
  if (!(simulation.shootout_success > 0.0 &&
        simulation.shootout_success < 1.0))
    fail(where("simulation", "shootout_success"), "must lie in (0, 1)");
  if (simulation.shootout_rounds < 1 ||
      simulation.shootout_max_rounds < simulation.shootout_rounds)
    fail(where("simulation", "shootout_max_rounds"),
         "must be at least shootout_rounds");
}

EngineConfig default_engine_config() {
  EngineConfig config;
  config.zone_table = default_zone_table();
  rebuild_baseline(config, DEFAULT_ZONE_RATES, DEFAULT_SHOT_TYPE_MODIFIERS);
  return config;
}

EngineConfig engine_config_from_json(const Json::Value &root) {
  EngineConfig config = default_engine_config();

  if (root.isMember("zones")) {
    const Json::Value &zones = root["zones"];
    if (!zones.isArray())
      fail("zones", "expected an array of rectangles");
    config.zone_table.clear();
    for (const auto &z : zones) {
      try {
        config.zone_table.push_back({parse_zone(z["zone"].asString()),
                                     z["x_min"].asDouble(),
                                     z["x_max"].asDouble(),
                                     z["y_min"].asDouble(),
                                     z["y_max"].asDouble()});
      } catch (const std::invalid_argument &e) {
        fail("zones", e.what());
      } catch (const Json::Exception &e) {
        fail("zones", e.what());
      }
    }
  }

  if (root.isMember("baseline_xg")) {
    const Json::Value &node = root["baseline_xg"];
    std::array<double, NUM_ZONES> zone_rates = DEFAULT_ZONE_RATES;
    std::array<double, NUM_SHOT_TYPES> modifiers = DEFAULT_SHOT_TYPE_MODIFIERS;
    try {
      for (const auto &name : node["zone_rates"].getMemberNames())
        zone_rates[index_of(parse_zone(name))] =
            node["zone_rates"][name].asDouble();
      for (const auto &name : node["shot_type_modifiers"].getMemberNames())
        modifiers[index_of(parse_shot_type(name))] =
            node["shot_type_modifiers"][name].asDouble();
      rebuild_baseline(config, zone_rates, modifiers);
      for (const auto &cell : node["overrides"]) {
        Zone z = parse_zone(cell["zone"].asString());
        ShotType t = parse_shot_type(cell["shot_type"].asString());
        config.baseline_xg[index_of(z)][index_of(t)] = cell["rate"].asDouble();
      }
    } catch (const std::invalid_argument &e) {
      fail("baseline_xg", e.what());
    } catch (const Json::Exception &e) {
      fail("baseline_xg", e.what());
    }
  }

  const Json::Value &phases = root["game_phases"];
  read_int(phases, "early_end_seconds", config.game_phases.early_end_seconds);
  read_int(phases, "mid_end_seconds", config.game_phases.mid_end_seconds);
  read_int(phases, "regulation_end_seconds",
           config.game_phases.regulation_end_seconds);

  const Json::Value &matchup = root["matchup"];
  read_int(matchup, "min_sample", config.matchup.min_sample);
  read_int(matchup, "full_confidence_sample",
           config.matchup.full_confidence_sample);
  read_double(matchup, "deviation_scale", config.matchup.deviation_scale);

  const Json::Value &adj = root["adjustments"];
  AdjustmentParams &a = config.adjustments;
  read_double(adj, "clutch_bound", a.clutch_bound);
  read_double(adj, "clutch_sensitivity", a.clutch_sensitivity);
  read_int(adj, "clutch_min_games", a.clutch_min_games);
  read_double(adj, "fatigue_bound", a.fatigue_bound);
  read_table(adj, "rest_modifiers", a.rest_modifiers);
  read_table(adj, "workload_modifiers", a.workload_modifiers);
  read_int(adj, "workload_window_days", a.workload_window_days);
  read_double(adj, "momentum_bound", a.momentum_bound);
  read_int(adj, "momentum_window", a.momentum_window);
  read_int(adj, "momentum_min_recent_games", a.momentum_min_recent_games);
  read_double(adj, "hot_ppg_threshold", a.hot_ppg_threshold);
  read_double(adj, "hot_shooting_threshold", a.hot_shooting_threshold);
  read_double(adj, "cold_ppg_threshold", a.cold_ppg_threshold);
  read_double(adj, "cold_shooting_threshold", a.cold_shooting_threshold);
  read_double(adj, "hot_high_confidence", a.hot_high_confidence);
  read_double(adj, "hot_low_confidence", a.hot_low_confidence);
  read_double(adj, "cold_high_confidence", a.cold_high_confidence);
  read_double(adj, "cold_low_confidence", a.cold_low_confidence);
  read_double(adj, "high_confidence_cutoff", a.high_confidence_cutoff);
  read_double(adj, "synergy_bound", a.synergy_bound);
  read_double(adj, "synergy_sensitivity", a.synergy_sensitivity);
  read_int(adj, "synergy_min_shared_toi", a.synergy_min_shared_toi);
  read_double(adj, "synergy_z_cap", a.synergy_z_cap);

  const Json::Value &res = root["resolver"];
  read_double(res, "min_probability", config.resolver.min_probability);
  read_double(res, "max_probability", config.resolver.max_probability);
  read_double(res, "min_adjustment_product",
              config.resolver.min_adjustment_product);
  read_double(res, "max_adjustment_product",
              config.resolver.max_adjustment_product);
  read_double(res, "prior_shots", config.resolver.prior_shots);
  read_double(res, "goalie_weight", config.resolver.goalie_weight);
  read_int(res, "min_zone_events", config.resolver.min_zone_events);

  const Json::Value &sim = root["simulation"];
  SimulationParams &s = config.simulation;
  read_double(sim, "league_shots_per_60", s.league_shots_per_60);
  read_int(sim, "overtime_seconds", s.overtime_seconds);
  read_double(sim, "overtime_pace", s.overtime_pace);
  read_int(sim, "shootout_rounds", s.shootout_rounds);
  read_double(sim, "shootout_success", s.shootout_success);
  read_int(sim, "shootout_max_rounds", s.shootout_max_rounds);
  read_double(sim, "home_ice_factor", s.home_ice_factor);

  config.validate();
  return config;
}

EngineConfig load_engine_config(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    fail(path, "cannot open configuration file");

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, in, &root, &errors))
    fail(path, "invalid JSON: " + errors);

  EngineConfig config = engine_config_from_json(root);
  log_message(LogLevel::INFO, "CONFIG", "loaded engine configuration from " +
                                            path);
  return config;
}
