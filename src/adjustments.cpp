#include "../include/adjustments.h"
#include <algorithm>
#include <cmath>

namespace {

// Deviation magnitude treated as a full-strength signal.
constexpr double MOMENTUM_FULL_MAGNITUDE = 0.3;
constexpr double MOMENTUM_SCORE_SCALE = 0.5;

double points_per_game(const std::vector<GameLine> &games) {
  if (games.empty())
    return 0.0;
  int points = 0;
  for (const auto &g : games)
    points += g.goals + g.assists;
  return (double)points / games.size();
}

double shooting_pct(const std::vector<GameLine> &games) {
  int goals = 0;
  int shots = 0;
  for (const auto &g : games) {
    goals += g.goals;
    shots += g.shots;
  }
  return shots > 0 ? (double)goals / shots : 0.0;
}

double relative(double recent, double season) {
  return season > 0.0 ? (recent - season) / season : 0.0;
}

bool team_won(int team_id, const GameInfo &game) {
  if (game.home_team == team_id)
    return game.home_score > game.away_score;
  return game.away_score > game.home_score;
}

} // namespace

std::string to_string(MomentumState state) {
  switch (state) {
  case MomentumState::HOT:
    return "hot";
  case MomentumState::COLD:
    return "cold";
  default:
    return "neutral";
  }
}

ContextAdjustmentCalculator::ContextAdjustmentCalculator(
    const EngineConfig &config)
    : params(config.adjustments) {}

double ContextAdjustmentCalculator::clutch(const SegmentProfile &profile) const {
  SegmentStats total = profile.total();
  if (total.games < params.clutch_min_games)
    return 1.0;

  int late_points = 0;
  for (SeasonPhase sp : ALL_SEASON_PHASES)
    late_points += profile.cell(sp, GamePhase::LATE).points();

  double baseline = total.points_per_game() / NUM_GAME_PHASES;
  if (baseline <= 0.0)
    return 1.0;
  double late = (double)late_points / total.games;
  double shift = params.clutch_sensitivity * (late - baseline) / baseline;
  return 1.0 + std::clamp(shift, -params.clutch_bound, params.clutch_bound);
}

ScheduleContext ContextAdjustmentCalculator::schedule_context(
    int team_id, const std::string &game_date,
    const std::vector<GameInfo> &games) const {
  ScheduleContext ctx;
  ctx.team_id = team_id;
  ctx.game_date = game_date;
  int today = day_number(game_date);

  std::vector<const GameInfo *> earlier;
  for (const auto &g : games) {
    if (g.home_team != team_id && g.away_team != team_id)
      continue;
    if (day_number(g.date) < today)
      earlier.push_back(&g);
  }
  std::sort(earlier.begin(), earlier.end(),
            [](const GameInfo *a, const GameInfo *b) {
              if (a->date != b->date)
                return a->date < b->date;
              return a->game_id < b->game_id;
            });

  if (!earlier.empty()) {
    ctx.days_rest = today - day_number(earlier.back()->date) - 1;
    ctx.back_to_back = ctx.days_rest == 0;
  }

  for (const GameInfo *g : earlier) {
    if (today - day_number(g->date) < params.workload_window_days)
      ctx.games_in_window++;
  }

  // Streak going into this game, newest result first.
  for (auto it = earlier.rbegin(); it != earlier.rend(); ++it) {
    bool won = team_won(team_id, **it);
    if (it == earlier.rbegin()) {
      (won ? ctx.win_streak : ctx.loss_streak) = 1;
    } else if (won && ctx.win_streak > 0) {
      ctx.win_streak++;
    } else if (!won && ctx.loss_streak > 0) {
      ctx.loss_streak++;
    } else {
      break;
    }
  }
  return ctx;
}

double ContextAdjustmentCalculator::fatigue(
    const ScheduleContext &schedule) const {
  const auto &rest = params.rest_modifiers;
  const auto &load = params.workload_modifiers;

  double rest_factor = rest.back();
  if (schedule.days_rest >= 0)
    rest_factor =
        rest[std::min<size_t>((size_t)schedule.days_rest, rest.size() - 1)];
  double load_factor = load[std::min<size_t>(
      (size_t)std::max(0, schedule.games_in_window), load.size() - 1)];

  return std::clamp(rest_factor * load_factor, 1.0 - params.fatigue_bound,
                    1.0);
}

MomentumAnalysis
ContextAdjustmentCalculator::momentum(int entity_id,
                                      const std::vector<GameLine> &game_log,
                                      const std::string &as_of_date) const {
  MomentumAnalysis a;
  a.entity_id = entity_id;
  a.as_of_date = as_of_date;

  int cutoff = day_number(as_of_date);
  std::vector<GameLine> played;
  for (const auto &g : game_log) {
    if (day_number(g.date) < cutoff)
      played.push_back(g);
  }

  size_t window = (size_t)params.momentum_window;
  size_t recent_start = played.size() > window ? played.size() - window : 0;
  std::vector<GameLine> recent(played.begin() + recent_start, played.end());
  // The baseline excludes the window unless the season is shorter than it.
  std::vector<GameLine> season =
      recent_start > 0
          ? std::vector<GameLine>(played.begin(), played.begin() + recent_start)
          : played;

  a.games_in_window = (int)recent.size();
  if (a.games_in_window < params.momentum_min_recent_games)
    return a;

  a.recent_ppg = points_per_game(recent);
  a.recent_shooting_pct = shooting_pct(recent);
  a.season_ppg = points_per_game(season);
  a.season_shooting_pct = shooting_pct(season);
  a.ppg_deviation = relative(a.recent_ppg, a.season_ppg);
  a.shooting_deviation = relative(a.recent_shooting_pct, a.season_shooting_pct);

  double combined = (a.ppg_deviation + a.shooting_deviation) /
                    MOMENTUM_SCORE_SCALE;
  if (a.ppg_deviation > params.hot_ppg_threshold &&
      a.shooting_deviation > params.hot_shooting_threshold) {
    a.state = MomentumState::HOT;
    a.score = std::min(1.0, combined);
  } else if (a.ppg_deviation < params.cold_ppg_threshold &&
             a.shooting_deviation < params.cold_shooting_threshold) {
    a.state = MomentumState::COLD;
    a.score = std::max(-1.0, combined);
  }

  double sample_factor =
      0.5 + 0.5 * std::min(1.0, (double)a.games_in_window / window);
  double magnitude =
      (std::fabs(a.ppg_deviation) + std::fabs(a.shooting_deviation)) / 2.0;
  a.confidence =
      sample_factor * std::min(1.0, magnitude / MOMENTUM_FULL_MAGNITUDE);
  return a;
}

double ContextAdjustmentCalculator::momentum_modifier(
    const MomentumAnalysis &analysis) const {
  double modifier = 1.0;
  bool high = analysis.confidence >= params.high_confidence_cutoff;
  if (analysis.state == MomentumState::HOT)
    modifier = high ? params.hot_high_confidence : params.hot_low_confidence;
  else if (analysis.state == MomentumState::COLD)
    modifier = high ? params.cold_high_confidence : params.cold_low_confidence;
  return std::clamp(modifier, 1.0 - params.momentum_bound,
                    1.0 + params.momentum_bound);
}

AdjustmentSet ContextAdjustmentCalculator::compute(
    const SegmentProfile &profile, const ScheduleContext &schedule,
    const MomentumAnalysis &analysis, double synergy_multiplier) const {
  AdjustmentSet set;
  set.synergy = std::clamp(synergy_multiplier, 1.0 - params.synergy_bound,
                           1.0 + params.synergy_bound);
  set.clutch = clutch(profile);
  set.fatigue = fatigue(schedule);
  set.momentum = momentum_modifier(analysis);
  return set;
}
