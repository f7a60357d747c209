#ifndef SYNERGY_H
#define SYNERGY_H

#include "engine_config.h"
#include <map>
#include <optional>
#include <utility>
#include <vector>

// Ice time two players shared, and what their team did during it.
struct SharedIceRecord {
  int player_a = -1;
  int player_b = -1;
  int season_id = 0;
  int shared_toi_seconds = 0;
  int goals_for = 0;
  int shots_for = 0;
};

// A player's own on-ice scoring rate, with or without any partner.
struct OnIceRate {
  int player_id = -1;
  int toi_seconds = 0;
  int goals_for = 0;

  double goals_for_per_60() const {
    return toi_seconds > 0 ? goals_for * 3600.0 / toi_seconds : 0.0;
  }
};

// Symmetric by storage: one entry per unordered pair.
class SynergyMatrix {
public:
  // a == b throws std::invalid_argument. Unknown pairs score 0.
  double coefficient(int a, int b) const;
  void set(int a, int b, double score);
  bool contains(int a, int b) const;
  size_t size() const { return scores.size(); }
  const std::map<std::pair<int, int>, double> &pairs() const { return scores; }

  // Mean of all pairwise coefficients within the line.
  double line_score(const std::vector<int> &members) const;

  // Row/column per player; the diagonal is empty.
  std::vector<std::vector<std::optional<double>>>
  compatibility(const std::vector<int> &players) const;

private:
  static std::pair<int, int> key(int a, int b);
  std::map<std::pair<int, int>, double> scores;
};

class SynergyCalculator {
public:
  explicit SynergyCalculator(const EngineConfig &config);

  // Poisson z-score of observed shared goals against the additive
  // expectation, capped. 0 below the shared ice-time floor.
  double pair_score(const SharedIceRecord &shared, const OnIceRate &a,
                    const OnIceRate &b, double league_goals_per_60) const;

  // Records for the same pair are merged before scoring.
  SynergyMatrix build(const std::vector<SharedIceRecord> &records,
                      const std::map<int, OnIceRate> &rates) const;

  double multiplier(double score) const;

private:
  const AdjustmentParams &params;
};

#endif
