#ifndef MONTE_CARLO_ENGINE_H
#define MONTE_CARLO_ENGINE_H

#include "../engine_config.h"
#include "../expected_goals.h"
#include "game_simulator.h"
#include "simulation_config.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

// Raw output of a run, before aggregation.
struct TrialBatch {
  std::vector<TrialScore> trials; // completed trials in trial-index order
  int requested = 0;
  uint64_t seed = 0;
  bool aborted = false;
};

struct SeriesResult {
  int wins_needed = 4;
  int start_home_wins = 0;
  int start_away_wins = 0;
  int requested = 0;
  int completed = 0;
  uint64_t seed = 0;
  bool aborted = false;

  double home_win_probability = 0.0;
  double away_win_probability = 0.0;
  double average_length = 0.0; // games still to be played
  std::map<std::pair<int, int>, int> outcomes; // final (home, away) wins
};

class MonteCarloEngine {
public:
  // May be called from worker threads, one call at a time.
  using ProgressCallback = std::function<void(int completed, int total)>;

  explicit MonteCarloEngine(const EngineConfig &config);

  // Runs sim.iteration_count independent trials. The result does not
  // depend on sim.workers. Inputs must be fully resolved beforehand.
  TrialBatch run(const TeamSimulationInput &home,
                 const TeamSimulationInput &away, const SimulationConfig &sim,
                 ProgressCallback progress = nullptr);

  // One trial per series; ties left by the round cap are decided by a
  // coin flip from the same stream.
  SeriesResult run_series(const TeamSimulationInput &home,
                          const TeamSimulationInput &away,
                          const SimulationConfig &sim,
                          const SeriesConfig &series,
                          ProgressCallback progress = nullptr);

  // Stops the current or next run at a trial boundary. The flag is
  // cleared when a run finishes.
  void cancel() { cancel_requested = true; }

  static uint64_t resolve_seed(const SimulationConfig &sim);
  static int resolve_workers(int requested, int trials);

private:
  const EngineConfig &config;
  ExpectedGoalsResolver resolver;
  GameSimulator simulator;
  std::atomic<bool> cancel_requested{false};
};

#endif
