#include "../../include/simulation/simulation_config.h"
#include "../../include/errors.h"

namespace {

void reject(const std::string &field, const std::string &detail) {
  throw ConfigurationError(ErrorPayload{-1, "simulation." + field, detail});
}

} // namespace

std::string to_string(OvertimePolicy policy) {
  return policy == OvertimePolicy::SHOOTOUT ? "shootout" : "draw";
}

void SimulationConfig::validate() const {
  if (home_team < 0 || away_team < 0)
    reject("teams", "both team ids are required");
  if (home_team == away_team)
    reject("teams", "a team cannot play itself");
  if (iteration_count < 1)
    reject("iteration_count", "must be at least 1");
  if (workers < 0)
    reject("workers", "must not be negative");
  try {
    day_number(game_date);
  } catch (const std::invalid_argument &e) {
    reject("game_date", e.what());
  }
  for (double w : segment_weights) {
    if (!(w > 0.0))
      reject("segment_weights", "weights must be positive");
  }
  if (!(game_variance >= 0.0 && game_variance < 1.0))
    reject("game_variance", "must lie in [0, 1)");
}

void SeriesConfig::validate() const {
  if (wins_needed < 1)
    throw ConfigurationError(
        ErrorPayload{-1, "series.wins_needed", "must be at least 1"});
  if (home_wins < 0 || away_wins < 0 || home_wins >= wins_needed ||
      away_wins >= wins_needed)
    throw ConfigurationError(ErrorPayload{
        -1, "series.score", "current score must leave the series undecided"});
}

bool SeriesConfig::home_hosts(int game_index) {
  if (game_index < 2)
    return true;
  if (game_index < 4)
    return false;
  return game_index % 2 == 0;
}
