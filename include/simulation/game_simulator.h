#ifndef GAME_SIMULATOR_H
#define GAME_SIMULATOR_H

#include "../adjustments.h"
#include "../engine_config.h"
#include "../expected_goals.h"
#include "simulation_config.h"
#include "trial_rng.h"
#include <array>
#include <map>
#include <vector>

struct LineInput {
  std::vector<int> members;
  double toi_share = 0.0; // fraction of the game this unit is on the ice
  double synergy_score = 0.0;
};

struct TeamSimulationInput {
  int team_id = -1;
  std::vector<LineInput> lines;
  std::map<int, ShooterProfile> skaters;
  std::map<int, AdjustmentSet> adjustments; // missing entries are neutral
  GoalieProfile goalie;
  bool has_goalie = false;
  double shots_for_per_60 = 30.0;
  double shots_against_per_60 = 30.0;
};

// Outcome of one trial.
struct TrialScore {
  int home = 0;
  int away = 0;
  bool went_to_overtime = false;
  bool went_to_shootout = false;
  std::array<int, NUM_SIM_SEGMENTS> home_goals{};
  std::array<int, NUM_SIM_SEGMENTS> away_goals{};
  std::array<double, NUM_SIM_SEGMENTS> home_xg{};
  std::array<double, NUM_SIM_SEGMENTS> away_xg{};

  bool operator==(const TrialScore &other) const {
    return home == other.home && away == other.away &&
           went_to_overtime == other.went_to_overtime &&
           went_to_shootout == other.went_to_shootout &&
           home_goals == other.home_goals && away_goals == other.away_goals &&
           home_xg == other.home_xg && away_xg == other.away_xg;
  }
};

// Plays one game: three regulation segments, then sudden-death overtime
// and the configured tie policy. Holds no per-trial state.
class GameSimulator {
public:
  GameSimulator(const EngineConfig &config,
                const ExpectedGoalsResolver &resolver);

  TrialScore play(const TeamSimulationInput &home,
                  const TeamSimulationInput &away,
                  const SimulationConfig &sim, TrialRng &rng) const;

  // Expected shot attempts for one line over a stretch of play.
  double expected_shots(const TeamSimulationInput &attack,
                        const TeamSimulationInput &defence,
                        const LineInput &line, double seconds,
                        double weight) const;

private:
  struct Side {
    const TeamSimulationInput *team;
    const TeamSimulationInput *opponent;
    double form;
    bool home;
  };

  // Resolves one attempt by the line, adding its goal probability to xg.
  // True on a goal.
  bool attempt(const Side &side, const LineInput &line, GamePhase phase,
               TrialRng &rng, double &xg) const;
  bool overtime(const Side &home, const Side &away, TrialScore &score,
                TrialRng &rng) const;
  void shootout(TrialScore &score, TrialRng &rng) const;

  const EngineConfig &config;
  const ExpectedGoalsResolver &resolver;
};

#endif
