#ifndef SIMULATION_CONFIG_H
#define SIMULATION_CONFIG_H

#include "../hockey_types.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

// How a game still tied after overtime ends.
enum class OvertimePolicy { SHOOTOUT, DRAW };

std::string to_string(OvertimePolicy policy);

struct SimulationConfig {
  int home_team = -1;
  int away_team = -1;
  int season_id = 0;
  std::string game_date; // YYYY-MM-DD

  int iteration_count = 10000;
  std::optional<uint64_t> random_seed; // drawn and recorded when absent
  int workers = 1;                     // 0 picks the hardware thread count

  bool use_synergy = true;
  bool use_clutch = true;
  bool use_fatigue = true;
  bool use_momentum = true;

  // Shot-volume weights for the early, mid and late regulation segments.
  std::array<double, NUM_GAME_PHASES> segment_weights{1.0, 1.0, 1.0};
  // Standard deviation of the per-trial team form multiplier.
  double game_variance = 0.15;
  OvertimePolicy overtime_policy = OvertimePolicy::SHOOTOUT;

  // Throws ConfigurationError.
  void validate() const;
};

struct SeriesConfig {
  int wins_needed = 4;
  int home_wins = 0; // current series score
  int away_wins = 0;

  void validate() const;
  // True when the team listed as home hosts game number game_index (0-based),
  // on a 2-2-1-1-1 pattern.
  static bool home_hosts(int game_index);
};

#endif
