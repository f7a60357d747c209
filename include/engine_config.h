#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include "hockey_types.h"
#include <array>
#include <string>
#include <vector>

namespace Json {
class Value;
}

// Rink coordinates: attacking net at x = +89, boards at y = +-42.5.
struct ZoneRect {
  Zone zone;
  double x_min;
  double x_max;
  double y_min;
  double y_max;

  bool contains(double x, double y) const {
    return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
  }
};

// Game-time cut points in seconds from opening faceoff.
struct GamePhaseBoundaries {
  int early_end_seconds = 1200;
  int mid_end_seconds = 2400;
  int regulation_end_seconds = 3600;
};

struct MatchupThresholds {
  int min_sample = 3;
  int full_confidence_sample = 10;
  double deviation_scale = 2.0; // average |z| at which similarity hits 0
};

struct AdjustmentParams {
  // Clutch
  double clutch_bound = 0.15;
  double clutch_sensitivity = 0.25;
  int clutch_min_games = 10;

  // Fatigue: index = days of rest, last entry covers anything longer
  double fatigue_bound = 0.15;
  std::vector<double> rest_modifiers = {0.92, 0.97, 1.00};
  // index = games in the trailing window including this one
  std::vector<double> workload_modifiers = {1.00, 1.00, 1.00,
                                            0.98, 0.95, 0.92};
  int workload_window_days = 7;

  // Momentum
  double momentum_bound = 0.15;
  int momentum_window = 10;
  int momentum_min_recent_games = 5;
  double hot_ppg_threshold = 0.20;
  double hot_shooting_threshold = 0.15;
  double cold_ppg_threshold = -0.20;
  double cold_shooting_threshold = -0.15;
  double hot_high_confidence = 1.10;
  double hot_low_confidence = 1.05;
  double cold_high_confidence = 0.90;
  double cold_low_confidence = 0.95;
  double high_confidence_cutoff = 0.5;

  // Synergy
  double synergy_bound = 0.15;
  double synergy_sensitivity = 0.05;
  int synergy_min_shared_toi = 600;
  double synergy_z_cap = 3.0;
};

struct ResolverParams {
  double min_probability = 0.001;
  double max_probability = 0.95;
  double min_adjustment_product = 0.7;
  double max_adjustment_product = 1.3;
  double prior_shots = 20.0; // shrinkage weight toward the baseline table
  double goalie_weight = 1.0;
  int min_zone_events = 25; // below this a zone profile counts as thin
};

struct SimulationParams {
  double league_shots_per_60 = 30.0;
  int overtime_seconds = 300;
  double overtime_pace = 1.5;
  int shootout_rounds = 3;
  double shootout_success = 0.33;
  int shootout_max_rounds = 20;
  double home_ice_factor = 1.03;
};

struct EngineConfig {
  std::vector<ZoneRect> zone_table;
  std::array<std::array<double, NUM_SHOT_TYPES>, NUM_ZONES> baseline_xg;
  GamePhaseBoundaries game_phases;
  MatchupThresholds matchup;
  AdjustmentParams adjustments;
  ResolverParams resolver;
  SimulationParams simulation;

  double baseline_rate(Zone zone, ShotType type) const {
    return baseline_xg[index_of(zone)][index_of(type)];
  }

  // Throws ConfigurationError naming the first malformed entry.
  void validate() const;
};

EngineConfig default_engine_config();

// Overlays a JSON document onto the defaults, then validates.
EngineConfig engine_config_from_json(const Json::Value &root);
EngineConfig load_engine_config(const std::string &path);

#endif
