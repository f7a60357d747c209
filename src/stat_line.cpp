#include "../include/stat_line.h"
#include <algorithm>
#include <cmath>

namespace {

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  double sum = 0.0;
  for (double v : values)
    sum += v;
  return sum / values.size();
}

double stddev(const std::vector<double> &values) {
  if (values.size() < 2)
    return 0.0;
  double m = mean(values);
  double acc = 0.0;
  for (double v : values)
    acc += (v - m) * (v - m);
  return std::sqrt(acc / values.size());
}

} // namespace

int games_of(const StatLine &line) {
  return std::visit([](const auto &l) { return l.games; }, line);
}

bool is_goalie_line(const StatLine &line) {
  return std::holds_alternative<GoalieStatLine>(line);
}

SkaterStatLine StatLineBuilder::skater(const std::vector<GameLine> &lines) {
  SkaterStatLine s;
  s.games = (int)lines.size();
  if (lines.empty())
    return s;

  std::vector<double> goals, assists, points, shots, shooting;
  int total_goals = 0;
  int total_shots = 0;
  for (const auto &l : lines) {
    goals.push_back(l.goals);
    assists.push_back(l.assists);
    points.push_back(l.goals + l.assists);
    shots.push_back(l.shots);
    if (l.shots > 0)
      shooting.push_back((double)l.goals / l.shots);
    total_goals += l.goals;
    total_shots += l.shots;
  }

  s.goals_per_game = mean(goals);
  s.assists_per_game = mean(assists);
  s.points_per_game = mean(points);
  s.shots_per_game = mean(shots);
  s.shooting_percentage =
      total_shots > 0 ? (double)total_goals / total_shots : 0.0;
  s.goals_sd = stddev(goals);
  s.points_sd = stddev(points);
  s.shots_sd = stddev(shots);
  s.shooting_sd = stddev(shooting);
  return s;
}

GoalieStatLine StatLineBuilder::goalie(const std::vector<GameLine> &lines) {
  GoalieStatLine g;
  g.games = (int)lines.size();
  if (lines.empty())
    return g;

  std::vector<double> save_pcts, gaas;
  int shots_against = 0;
  int goals_against = 0;
  int toi = 0;
  for (const auto &l : lines) {
    if (l.shots_against > 0)
      save_pcts.push_back(1.0 - (double)l.goals_against / l.shots_against);
    gaas.push_back(l.toi_seconds > 0 ? l.goals_against * 3600.0 / l.toi_seconds
                                     : (double)l.goals_against);
    shots_against += l.shots_against;
    goals_against += l.goals_against;
    toi += l.toi_seconds;
  }

  g.save_percentage =
      shots_against > 0 ? 1.0 - (double)goals_against / shots_against : 0.0;
  g.goals_against_average =
      toi > 0 ? goals_against * 3600.0 / toi : mean(gaas);
  g.save_percentage_sd = stddev(save_pcts);
  g.goals_against_average_sd = stddev(gaas);
  return g;
}

StatLine StatLineBuilder::build(bool goalie_rows,
                                const std::vector<GameLine> &lines) {
  if (goalie_rows)
    return goalie(lines);
  return skater(lines);
}

std::vector<GameLine> StatLineBuilder::select(const std::vector<GameLine> &lines,
                                              int entity_id, int season_id,
                                              int opponent_id) {
  std::vector<GameLine> out;
  for (const auto &l : lines) {
    if (l.entity_id != entity_id || l.season_id != season_id)
      continue;
    if (opponent_id >= 0 && l.opponent_id != opponent_id)
      continue;
    out.push_back(l);
  }
  std::sort(out.begin(), out.end(), [](const GameLine &a, const GameLine &b) {
    if (a.date != b.date)
      return a.date < b.date;
    return a.game_id < b.game_id;
  });
  return out;
}
