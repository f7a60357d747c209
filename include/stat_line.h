#ifndef STAT_LINE_H
#define STAT_LINE_H

#include "segment_profile.h"
#include <variant>
#include <vector>

struct SkaterStatLine {
  int games = 0;
  double goals_per_game = 0.0;
  double assists_per_game = 0.0;
  double points_per_game = 0.0;
  double shots_per_game = 0.0;
  double shooting_percentage = 0.0;

  // Per-game standard deviations
  double goals_sd = 0.0;
  double points_sd = 0.0;
  double shots_sd = 0.0;
  double shooting_sd = 0.0;
};

struct GoalieStatLine {
  int games = 0;
  double save_percentage = 0.0;
  double goals_against_average = 0.0;

  double save_percentage_sd = 0.0;
  double goals_against_average_sd = 0.0;
};

using StatLine = std::variant<SkaterStatLine, GoalieStatLine>;

int games_of(const StatLine &line);
bool is_goalie_line(const StatLine &line);

// Aggregates per-game rows into stat lines.
class StatLineBuilder {
public:
  static SkaterStatLine skater(const std::vector<GameLine> &lines);
  static GoalieStatLine goalie(const std::vector<GameLine> &lines);
  static StatLine build(bool goalie, const std::vector<GameLine> &lines);

  // Rows of one entity in one season, optionally against one opponent
  // (opponent_id < 0 keeps all), in date order.
  static std::vector<GameLine> select(const std::vector<GameLine> &lines,
                                      int entity_id, int season_id,
                                      int opponent_id = -1);
};

#endif
