#ifndef GAME_PREDICTOR_H
#define GAME_PREDICTOR_H

#include "adjustments.h"
#include "data_source.h"
#include "engine_config.h"
#include "expected_goals.h"
#include "matchup_weighting.h"
#include "prediction.h"
#include "segment_profile.h"
#include "simulation/monte_carlo_engine.h"
#include "synergy.h"
#include "zone_profile.h"
#include <map>
#include <optional>
#include <tuple>

// Profiles derived for one entity against one opponent in one season.
struct EntityProfiles {
  ZoneProfile zones;
  std::optional<SegmentProfile> segments;
  MatchupProfile matchup;
};

// Derived profiles kept between predictions until new data arrives.
class ProfileCache {
public:
  using Key = std::tuple<int, int, int>; // entity, season, opponent

  const EntityProfiles *find(const Key &key) const;
  const EntityProfiles &store(const Key &key, EntityProfiles profiles);

  void invalidate_entity(int entity_id);
  void invalidate_season(int season_id);
  void clear() { entries.clear(); }

  size_t size() const { return entries.size(); }
  int hits() const { return hit_count; }
  int misses() const { return miss_count; }

private:
  std::map<Key, EntityProfiles> entries;
  mutable int hit_count = 0;
  mutable int miss_count = 0;
};

// Entry point: resolves every profile for both teams, then runs the
// simulation. Profile errors surface here before any trial runs.
class GamePredictor {
public:
  GamePredictor(const EngineConfig &config, const HistoricalDataSource &source);

  SimulationResult predict(const SimulationConfig &sim,
                           MonteCarloEngine::ProgressCallback progress = nullptr);
  SeriesResult predict_series(const SimulationConfig &sim,
                              const SeriesConfig &series);

  // Builds one side's simulation input and records its data quality.
  TeamSimulationInput prepare_team(int team_id, int opponent_id,
                                   const SimulationConfig &sim,
                                   DataQualityReport &quality);

  SeasonPhase season_phase_on(int season_id, const std::string &date) const;

  void cancel() { engine.cancel(); }
  void invalidate_entity(int entity_id) { cache.invalidate_entity(entity_id); }
  void invalidate_season(int season_id) { cache.invalidate_season(season_id); }
  void clear_cache() { cache.clear(); }
  const ProfileCache &profile_cache() const { return cache; }

private:
  struct SeasonData {
    std::vector<GameInfo> games;
    std::vector<ShotEvent> shots;
    std::vector<GameLine> lines;
  };

  SeasonData load_season(int season_id) const;
  const EntityProfiles &profiles_for(const ProfileScope &scope,
                                     int opponent_id, bool goalie,
                                     const SeasonData &data);
  void record_quality(const EntityProfiles &p, DataQualityReport &quality) const;

  const EngineConfig &config;
  const HistoricalDataSource &source;
  ZoneProfileBuilder zone_builder;
  SegmentProfileBuilder segment_builder;
  MatchupWeightingEngine matchup_engine;
  ContextAdjustmentCalculator adjustment_calculator;
  SynergyCalculator synergy_calculator;
  ProfileResolver profile_resolver;
  MonteCarloEngine engine;
  PredictionAggregator aggregator;
  ProfileCache cache;
};

#endif
