#ifndef PREDICTION_H
#define PREDICTION_H

#include "engine_config.h"
#include "simulation/monte_carlo_engine.h"
#include "simulation/simulation_config.h"
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Json {
class Value;
}

// Input completeness behind a prediction.
struct DataQualityReport {
  int entities = 0;
  int thin_zone_entities = 0;   // zone profile below the event floor
  int low_matchup_entities = 0; // matchup history below the minimum sample
  int reconciliation_warnings = 0;
  int entities_with_warnings = 0;
  std::vector<std::string> notes;

  void merge(const DataQualityReport &other);
};

struct SegmentBreakdown {
  SimSegment segment = SimSegment::EARLY;
  double home_goals = 0.0; // per trial
  double away_goals = 0.0;
  double home_xg = 0.0;
  double away_xg = 0.0;
  double share_of_xg = 0.0;
  // Which side outscored the other within the segment. Overtime rates are
  // over the trials that reached overtime.
  double home_win_rate = 0.0;
  double away_win_rate = 0.0;
  double tie_rate = 0.0;
};

enum class RunStatus { COMPLETE, ABORTED };

std::string to_string(RunStatus status);

struct PredictionSummary {
  int predicted_winner = -1; // -1 when the trials split evenly
  double favourite_probability = 0.0;
  std::string label;               // toss-up, lean, strong, blowout
  std::string variance_indicator;  // high, normal, low
  std::pair<int, int> most_likely_score{0, 0};
  double average_home_goals = 0.0;
  double average_away_goals = 0.0;
  double average_home_xg = 0.0;
  double average_away_xg = 0.0;
  double overtime_rate = 0.0;
  double shootout_rate = 0.0;
  double expected_points_home = 0.0;
  double expected_points_away = 0.0;
};

// Created once per run by PredictionAggregator and never modified.
class SimulationResult {
public:
  int home_team() const { return home_id; }
  int away_team() const { return away_id; }
  uint64_t seed() const { return run_seed; }
  int requested_iterations() const { return requested; }
  int completed_iterations() const { return (int)scores.size(); }

  RunStatus status() const { return run_status; }
  bool is_complete() const { return run_status == RunStatus::COMPLETE; }
  // Throws SimulationAbortedError for a partial result.
  void require_complete() const;

  const std::vector<TrialScore> &per_iteration_scores() const { return scores; }
  double win_probability_home() const { return p_home; }
  double win_probability_away() const { return p_away; }
  double draw_rate() const { return p_draw; }
  const std::map<std::pair<int, int>, int> &score_distribution() const {
    return distribution;
  }
  const std::array<SegmentBreakdown, NUM_SIM_SEGMENTS> &
  segment_breakdown() const {
    return segments;
  }
  SimSegment top_segment() const;
  double confidence_score() const { return confidence; }
  const DataQualityReport &data_quality() const { return quality; }
  const PredictionSummary &summary() const { return prediction; }

  Json::Value to_json() const;
  std::string to_json_string() const;
  std::string render_summary() const;

private:
  friend class PredictionAggregator;
  SimulationResult() = default;

  int home_id = -1;
  int away_id = -1;
  uint64_t run_seed = 0;
  int requested = 0;
  RunStatus run_status = RunStatus::COMPLETE;
  std::vector<TrialScore> scores;
  double p_home = 0.0;
  double p_away = 0.0;
  double p_draw = 0.0;
  std::map<std::pair<int, int>, int> distribution;
  std::array<SegmentBreakdown, NUM_SIM_SEGMENTS> segments{};
  double confidence = 0.0;
  DataQualityReport quality;
  PredictionSummary prediction;
};

class PredictionAggregator {
public:
  PredictionAggregator() = default;

  SimulationResult aggregate(TrialBatch batch, const SimulationConfig &sim,
                             const DataQualityReport &quality) const;

  // Data completeness scaled by Monte Carlo precision, in [0, 1]. The
  // precision term depends on the trial count only.
  static double confidence_score(const DataQualityReport &quality,
                                 int trials);
  static std::string probability_label(double favourite_probability);
  static std::string variance_indicator(double home, double away);
};

Json::Value series_to_json(const SeriesResult &series);
std::string render_series_summary(const SeriesResult &series);

#endif
