#include "../include/matchup_weighting.h"
#include "../include/errors.h"
#include <algorithm>
#include <cmath>

namespace {

StatDeviation deviation(const std::string &stat, double general,
                        double matchup, double sd) {
  StatDeviation d{stat, general, matchup, 0.0};
  if (sd > 0.0 && std::isfinite(sd)) {
    double z = (matchup - general) / sd;
    d.z = std::isfinite(z) ? z : 0.0;
  }
  return d;
}

std::vector<StatDeviation> deviations_of(const SkaterStatLine &g,
                                         const SkaterStatLine &m) {
  return {
      deviation("goals_per_game", g.goals_per_game, m.goals_per_game,
                g.goals_sd),
      deviation("points_per_game", g.points_per_game, m.points_per_game,
                g.points_sd),
      deviation("shots_per_game", g.shots_per_game, m.shots_per_game,
                g.shots_sd),
      deviation("shooting_percentage", g.shooting_percentage,
                m.shooting_percentage, g.shooting_sd),
  };
}

std::vector<StatDeviation> deviations_of(const GoalieStatLine &g,
                                         const GoalieStatLine &m) {
  return {
      deviation("save_percentage", g.save_percentage, m.save_percentage,
                g.save_percentage_sd),
      deviation("goals_against_average", g.goals_against_average,
                m.goals_against_average, g.goals_against_average_sd),
  };
}

} // namespace

MatchupWeightingEngine::MatchupWeightingEngine(const EngineConfig &config)
    : thresholds(config.matchup) {}

double MatchupWeightingEngine::similarity(
    const std::vector<StatDeviation> &deviations) const {
  if (deviations.empty())
    return 1.0;
  double sum = 0.0;
  for (const auto &d : deviations)
    sum += std::fabs(d.z);
  double avg = sum / deviations.size();
  return std::clamp(1.0 - avg / thresholds.deviation_scale, 0.0, 1.0);
}

double MatchupWeightingEngine::sample_confidence(int sample_size) const {
  if (sample_size < thresholds.min_sample)
    return 0.0;
  return std::min(1.0, (double)sample_size / thresholds.full_confidence_sample);
}

MatchupProfile
MatchupWeightingEngine::evaluate(int entity_id, int opponent_id, int season_id,
                                 const std::optional<StatLine> &general,
                                 const StatLine &matchup) const {
  std::string scope = "season " + std::to_string(season_id) + " vs " +
                      std::to_string(opponent_id);
  if (!general || games_of(*general) == 0)
    throw InvalidProfileError(
        {entity_id, scope, "no general baseline to compare against"});
  if (is_goalie_line(*general) != is_goalie_line(matchup))
    throw InvalidProfileError(
        {entity_id, scope, "general and matchup stat lines differ in kind"});

  MatchupProfile p;
  p.entity_id = entity_id;
  p.opponent_id = opponent_id;
  p.season_id = season_id;
  p.general = *general;
  p.matchup = matchup;
  p.sample_size = games_of(matchup);

  if (is_goalie_line(matchup))
    p.deviations = deviations_of(std::get<GoalieStatLine>(p.general),
                                 std::get<GoalieStatLine>(p.matchup));
  else
    p.deviations = deviations_of(std::get<SkaterStatLine>(p.general),
                                 std::get<SkaterStatLine>(p.matchup));

  p.similarity_score = similarity(p.deviations);
  p.sample_confidence = sample_confidence(p.sample_size);
  p.matchup_weight = (1.0 - p.similarity_score) * p.sample_confidence;
  if (p.sample_size < thresholds.min_sample)
    p.matchup_weight = 0.0;
  p.general_weight = 1.0 - p.matchup_weight;
  return p;
}

double MatchupWeightingEngine::blend(const MatchupProfile &profile,
                                     double general_value,
                                     double matchup_value) {
  return profile.general_weight * general_value +
         profile.matchup_weight * matchup_value;
}

StatLine MatchupWeightingEngine::blended_line(const MatchupProfile &profile) {
  auto mix = [&profile](double g, double m) { return blend(profile, g, m); };

  if (is_goalie_line(profile.general)) {
    const auto &g = std::get<GoalieStatLine>(profile.general);
    const auto &m = std::get<GoalieStatLine>(profile.matchup);
    GoalieStatLine out = g;
    out.save_percentage = mix(g.save_percentage, m.save_percentage);
    out.goals_against_average =
        mix(g.goals_against_average, m.goals_against_average);
    return out;
  }

  const auto &g = std::get<SkaterStatLine>(profile.general);
  const auto &m = std::get<SkaterStatLine>(profile.matchup);
  SkaterStatLine out = g;
  out.goals_per_game = mix(g.goals_per_game, m.goals_per_game);
  out.assists_per_game = mix(g.assists_per_game, m.assists_per_game);
  out.points_per_game = mix(g.points_per_game, m.points_per_game);
  out.shots_per_game = mix(g.shots_per_game, m.shots_per_game);
  out.shooting_percentage = mix(g.shooting_percentage, m.shooting_percentage);
  return out;
}
