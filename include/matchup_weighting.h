#ifndef MATCHUP_WEIGHTING_H
#define MATCHUP_WEIGHTING_H

#include "engine_config.h"
#include "stat_line.h"
#include <optional>
#include <string>
#include <vector>

struct StatDeviation {
  std::string stat;
  double general = 0.0;
  double matchup = 0.0;
  double z = 0.0; // 0 when the stat has no spread
};

struct MatchupProfile {
  int entity_id = -1;
  int opponent_id = -1;
  int season_id = 0;
  int sample_size = 0; // games against this opponent

  StatLine general;
  StatLine matchup;
  std::vector<StatDeviation> deviations;

  double similarity_score = 1.0;
  double sample_confidence = 0.0;
  double matchup_weight = 0.0;
  double general_weight = 1.0;
};

class MatchupWeightingEngine {
public:
  explicit MatchupWeightingEngine(const EngineConfig &config);

  // Throws InvalidProfileError when general is absent or empty, or when
  // the two stat lines are of different kinds.
  MatchupProfile evaluate(int entity_id, int opponent_id, int season_id,
                          const std::optional<StatLine> &general,
                          const StatLine &matchup) const;

  double similarity(const std::vector<StatDeviation> &deviations) const;
  double sample_confidence(int sample_size) const;

  static double blend(const MatchupProfile &profile, double general_value,
                      double matchup_value);
  // Every rate field blended with the profile's weights.
  static StatLine blended_line(const MatchupProfile &profile);

private:
  const MatchupThresholds &thresholds;
};

#endif
