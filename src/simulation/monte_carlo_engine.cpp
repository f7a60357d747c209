#include "../../include/simulation/monte_carlo_engine.h"
#include "../../include/logging.h"
#include "../../include/simulation/trial_rng.h"
#include <algorithm>
#include <exception>
#include <mutex>
#include <random>
#include <thread>

namespace {

constexpr int PROGRESS_STEPS = 100;

// Runs trial(i) for i in [0, count) over the workers. Each result lands in
// its own slot, so completion order never matters. Returns the number of
// trials completed; stops claiming new trials once cancel is set and
// clears it before returning, so a cancel armed before the call aborts
// it with no trials.
template <typename Result, typename Trial>
int run_trials(int count, int workers, std::atomic<bool> &cancel,
               MonteCarloEngine::ProgressCallback &progress, Trial trial,
               std::vector<Result> &slots, std::vector<char> &done) {
  slots.assign(count, Result{});
  done.assign(count, 0);

  std::atomic<int> next{0};
  std::atomic<int> completed{0};
  std::mutex progress_mutex;
  int step = std::max(1, count / PROGRESS_STEPS);

  std::vector<std::exception_ptr> errors(workers);
  auto work = [&](int worker) {
    try {
      while (!cancel.load()) {
        int i = next.fetch_add(1);
        if (i >= count)
          break;
        slots[i] = trial(i);
        done[i] = 1;
        int c = ++completed;
        if (progress && (c % step == 0 || c == count)) {
          std::lock_guard<std::mutex> lock(progress_mutex);
          progress(c, count);
        }
      }
    } catch (...) {
      errors[worker] = std::current_exception();
      cancel = true;
    }
  };

  if (workers <= 1) {
    work(0);
  } else {
    std::vector<std::thread> pool;
    for (int w = 0; w < workers; ++w)
      pool.emplace_back(work, w);
    for (auto &t : pool)
      t.join();
  }
  cancel = false;

  for (auto &e : errors) {
    if (e)
      std::rethrow_exception(e);
  }
  return completed.load();
}

} // namespace

MonteCarloEngine::MonteCarloEngine(const EngineConfig &config)
    : config(config), resolver(config), simulator(config, resolver) {}

uint64_t MonteCarloEngine::resolve_seed(const SimulationConfig &sim) {
  if (sim.random_seed)
    return *sim.random_seed;
  std::random_device rd;
  return ((uint64_t)rd() << 32) ^ rd();
}

int MonteCarloEngine::resolve_workers(int requested, int trials) {
  int workers = requested;
  if (workers <= 0)
    workers = (int)std::max(1u, std::thread::hardware_concurrency());
  return std::max(1, std::min(workers, trials));
}

TrialBatch MonteCarloEngine::run(const TeamSimulationInput &home,
                                 const TeamSimulationInput &away,
                                 const SimulationConfig &sim,
                                 ProgressCallback progress) {
  sim.validate();

  TrialBatch batch;
  batch.requested = sim.iteration_count;
  batch.seed = resolve_seed(sim);
  int workers = resolve_workers(sim.workers, sim.iteration_count);

  log_message(LogLevel::INFO, "ENGINE",
              "Running " + std::to_string(sim.iteration_count) +
                  " trials: team " + std::to_string(home.team_id) +
                  " vs team " + std::to_string(away.team_id) + ", seed " +
                  std::to_string(batch.seed) + ", " + std::to_string(workers) +
                  " worker(s)");

  auto trial = [&](int i) {
    TrialRng rng(batch.seed, (uint64_t)i);
    return simulator.play(home, away, sim, rng);
  };

  std::vector<TrialScore> slots;
  std::vector<char> done;
  int completed = run_trials(sim.iteration_count, workers, cancel_requested,
                             progress, trial, slots, done);

  batch.aborted = completed < sim.iteration_count;
  if (batch.aborted) {
    for (int i = 0; i < sim.iteration_count; ++i) {
      if (done[i])
        batch.trials.push_back(slots[i]);
    }
    log_message(LogLevel::WARN, "ENGINE",
                "Run cancelled after " + std::to_string(completed) + " of " +
                    std::to_string(sim.iteration_count) + " trials");
  } else {
    batch.trials = std::move(slots);
    log_message(LogLevel::INFO, "ENGINE",
                "Completed " + std::to_string(completed) + " trials");
  }
  return batch;
}

SeriesResult MonteCarloEngine::run_series(const TeamSimulationInput &home,
                                          const TeamSimulationInput &away,
                                          const SimulationConfig &sim,
                                          const SeriesConfig &series,
                                          ProgressCallback progress) {
  sim.validate();
  series.validate();

  // Playoff games cannot end level.
  SimulationConfig game_sim = sim;
  game_sim.overtime_policy = OvertimePolicy::SHOOTOUT;

  SeriesResult result;
  result.wins_needed = series.wins_needed;
  result.start_home_wins = series.home_wins;
  result.start_away_wins = series.away_wins;
  result.requested = sim.iteration_count;
  result.seed = resolve_seed(sim);
  int workers = resolve_workers(sim.workers, sim.iteration_count);

  log_message(LogLevel::INFO, "ENGINE",
              "Running " + std::to_string(sim.iteration_count) +
                  " series trials from " + std::to_string(series.home_wins) +
                  "-" + std::to_string(series.away_wins) + ", seed " +
                  std::to_string(result.seed));

  auto trial = [&](int i) {
    TrialRng rng(result.seed, (uint64_t)i);
    std::pair<int, int> wins{series.home_wins, series.away_wins};
    while (wins.first < series.wins_needed && wins.second < series.wins_needed) {
      int game_index = wins.first + wins.second;
      bool hosted = SeriesConfig::home_hosts(game_index);
      TrialScore s = hosted ? simulator.play(home, away, game_sim, rng)
                            : simulator.play(away, home, game_sim, rng);
      int home_goals = hosted ? s.home : s.away;
      int away_goals = hosted ? s.away : s.home;
      bool home_won = home_goals > away_goals;
      if (home_goals == away_goals)
        home_won = rng.bernoulli(0.5);
      if (home_won)
        wins.first++;
      else
        wins.second++;
    }
    return wins;
  };

  std::vector<std::pair<int, int>> slots;
  std::vector<char> done;
  result.completed = run_trials(sim.iteration_count, workers, cancel_requested,
                                progress, trial, slots, done);
  result.aborted = result.completed < sim.iteration_count;

  int home_series = 0;
  long games = 0;
  for (int i = 0; i < sim.iteration_count; ++i) {
    if (!done[i])
      continue;
    const auto &wins = slots[i];
    result.outcomes[wins]++;
    if (wins.first >= series.wins_needed)
      home_series++;
    games += wins.first + wins.second - series.home_wins - series.away_wins;
  }
  if (result.completed > 0) {
    result.home_win_probability = (double)home_series / result.completed;
    result.away_win_probability = 1.0 - result.home_win_probability;
    result.average_length = (double)games / result.completed;
  }
  if (result.aborted)
    log_message(LogLevel::WARN, "ENGINE",
                "Series run cancelled after " +
                    std::to_string(result.completed) + " trials");
  return result;
}
