#ifndef EXPECTED_GOALS_H
#define EXPECTED_GOALS_H

#include "adjustments.h"
#include "engine_config.h"
#include "matchup_weighting.h"
#include "segment_profile.h"
#include "zone_profile.h"
#include <array>

using ZoneTypeTable = std::array<std::array<double, NUM_SHOT_TYPES>, NUM_ZONES>;

// Everything the simulator needs about one skater, already blended.
struct ShooterProfile {
  int player_id = -1;
  ZoneTypeTable goal_rate{};
  std::array<double, NUM_ZONES> zone_share{};
  ZoneTypeTable type_share{}; // conditioned on zone, rows sum to 1
  double shots_per_game = 0.0;
  std::array<double, NUM_GAME_PHASES> phase_shot_factor{1.0, 1.0, 1.0};
  int total_shots = 0;
  int thin_zones = 0;
  double matchup_weight = 0.0;
  int matchup_sample = 0;
};

struct GoalieProfile {
  int goalie_id = -1;
  ZoneTypeTable save_rate{};
  double save_percentage = 0.0;
  int total_shots = 0;
  int thin_zones = 0;
  double matchup_weight = 0.0;
  int matchup_sample = 0;
};

// Turns raw profiles into resolver inputs: shrinks thin cells toward the
// baseline table and applies the matchup blend.
class ProfileResolver {
public:
  explicit ProfileResolver(const EngineConfig &config);

  // segments may be null, leaving the phase factors neutral.
  ShooterProfile shooter(const ZoneProfile &zones,
                         const MatchupProfile &matchup,
                         const SegmentProfile *segments,
                         SeasonPhase season_phase) const;

  GoalieProfile goalie(const ZoneProfile &zones,
                       const MatchupProfile &matchup) const;

private:
  const EngineConfig &config;
};

class ExpectedGoalsResolver {
public:
  explicit ExpectedGoalsResolver(const EngineConfig &config);

  // Goal probability for one attempt. A null goalie means an average one.
  double probability(const ShooterProfile &shooter, Zone zone, ShotType type,
                     const GoalieProfile *goalie,
                     const AdjustmentSet &adjustments) const;

  double goalie_factor(const GoalieProfile &goalie, Zone zone,
                       ShotType type) const;
  double adjustment_product(const AdjustmentSet &adjustments) const;

private:
  const EngineConfig &config;
};

#endif
