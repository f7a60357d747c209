#include "../include/prediction.h"
#include "../include/errors.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <json/json.h>
#include <sstream>

namespace {

constexpr double THIN_ZONE_WEIGHT = 0.4;
constexpr double LOW_MATCHUP_WEIGHT = 0.3;
constexpr double RECONCILIATION_WEIGHT = 0.1;
constexpr double MAX_PRECISION_PENALTY = 0.5;

double percent(double p) { return p * 100.0; }

} // namespace

void DataQualityReport::merge(const DataQualityReport &other) {
  entities += other.entities;
  thin_zone_entities += other.thin_zone_entities;
  low_matchup_entities += other.low_matchup_entities;
  reconciliation_warnings += other.reconciliation_warnings;
  entities_with_warnings += other.entities_with_warnings;
  notes.insert(notes.end(), other.notes.begin(), other.notes.end());
}

std::string to_string(RunStatus status) {
  return status == RunStatus::COMPLETE ? "complete" : "aborted";
}

void SimulationResult::require_complete() const {
  if (!is_complete())
    throw SimulationAbortedError(completed_iterations(), requested);
}

SimSegment SimulationResult::top_segment() const {
  SimSegment top = SimSegment::EARLY;
  double best = -1.0;
  for (const auto &s : segments) {
    double xg = s.home_xg + s.away_xg;
    if (xg > best) {
      best = xg;
      top = s.segment;
    }
  }
  return top;
}

std::string PredictionAggregator::probability_label(double favourite) {
  if (favourite < 0.55)
    return "toss-up";
  if (favourite < 0.62)
    return "lean";
  if (favourite < 0.70)
    return "strong";
  return "blowout";
}

std::string PredictionAggregator::variance_indicator(double home,
                                                     double away) {
  double margin = std::fabs(home - away);
  if (margin < 0.08)
    return "high";
  if (margin < 0.20)
    return "normal";
  return "low";
}

double PredictionAggregator::confidence_score(const DataQualityReport &q,
                                              int trials) {
  if (trials <= 0)
    return 0.0;
  double entities = std::max(1, q.entities);
  double data = 1.0 - THIN_ZONE_WEIGHT * (q.thin_zone_entities / entities) -
                LOW_MATCHUP_WEIGHT * (q.low_matchup_entities / entities) -
                RECONCILIATION_WEIGHT * (q.entities_with_warnings / entities);
  // worst-case binomial standard error
  double se = std::sqrt(0.25 / trials);
  double precision = 1.0 - std::min(MAX_PRECISION_PENALTY, 2.0 * se);
  return std::clamp(data * precision, 0.0, 1.0);
}

SimulationResult PredictionAggregator::aggregate(
    TrialBatch batch, const SimulationConfig &sim,
    const DataQualityReport &quality) const {
  SimulationResult r;
  r.home_id = sim.home_team;
  r.away_id = sim.away_team;
  r.run_seed = batch.seed;
  r.requested = batch.requested;
  r.run_status = batch.aborted ? RunStatus::ABORTED : RunStatus::COMPLETE;
  r.scores = std::move(batch.trials);
  r.quality = quality;

  int n = (int)r.scores.size();
  int home_wins = 0, away_wins = 0, draws = 0;
  int overtime = 0, shootout = 0;
  int home_ot_losses = 0, away_ot_losses = 0;
  long home_goals = 0, away_goals = 0;
  std::array<double, NUM_SIM_SEGMENTS> seg_home{}, seg_away{}, xg_home{},
      xg_away{};
  std::array<int, NUM_SIM_SEGMENTS> seg_home_wins{}, seg_away_wins{},
      seg_played{};
  const int ot = index_of(SimSegment::OVERTIME);

  for (const auto &t : r.scores) {
    r.distribution[{t.home, t.away}]++;
    home_goals += t.home;
    away_goals += t.away;
    if (t.went_to_overtime)
      overtime++;
    if (t.went_to_shootout)
      shootout++;
    if (t.home > t.away) {
      home_wins++;
      if (t.went_to_overtime)
        away_ot_losses++;
    } else if (t.away > t.home) {
      away_wins++;
      if (t.went_to_overtime)
        home_ot_losses++;
    } else {
      draws++;
    }
    for (int s = 0; s < NUM_SIM_SEGMENTS; ++s) {
      seg_home[s] += t.home_goals[s];
      seg_away[s] += t.away_goals[s];
      xg_home[s] += t.home_xg[s];
      xg_away[s] += t.away_xg[s];
      if (s == ot && !t.went_to_overtime)
        continue;
      seg_played[s]++;
      if (t.home_goals[s] > t.away_goals[s])
        seg_home_wins[s]++;
      else if (t.away_goals[s] > t.home_goals[s])
        seg_away_wins[s]++;
    }
  }

  double total_xg = 0.0;
  for (int s = 0; s < NUM_SIM_SEGMENTS; ++s)
    total_xg += xg_home[s] + xg_away[s];
  for (int s = 0; s < NUM_SIM_SEGMENTS; ++s) {
    SegmentBreakdown &b = r.segments[s];
    b.segment = static_cast<SimSegment>(s);
    if (n > 0) {
      b.home_goals = seg_home[s] / n;
      b.away_goals = seg_away[s] / n;
      b.home_xg = xg_home[s] / n;
      b.away_xg = xg_away[s] / n;
    }
    b.share_of_xg = total_xg > 0.0 ? (xg_home[s] + xg_away[s]) / total_xg : 0.0;
    if (seg_played[s] > 0) {
      b.home_win_rate = (double)seg_home_wins[s] / seg_played[s];
      b.away_win_rate = (double)seg_away_wins[s] / seg_played[s];
      int ties = seg_played[s] - seg_home_wins[s] - seg_away_wins[s];
      b.tie_rate = (double)ties / seg_played[s];
    }
  }

  PredictionSummary &p = r.prediction;
  if (n > 0) {
    r.p_home = (double)home_wins / n;
    r.p_away = (double)away_wins / n;
    r.p_draw = (double)draws / n;
    p.average_home_goals = (double)home_goals / n;
    p.average_away_goals = (double)away_goals / n;
    for (int s = 0; s < NUM_SIM_SEGMENTS; ++s) {
      p.average_home_xg += r.segments[s].home_xg;
      p.average_away_xg += r.segments[s].away_xg;
    }
    p.overtime_rate = (double)overtime / n;
    p.shootout_rate = (double)shootout / n;
    p.expected_points_home =
        2.0 * r.p_home + (double)(home_ot_losses + draws) / n;
    p.expected_points_away =
        2.0 * r.p_away + (double)(away_ot_losses + draws) / n;
  }

  if (r.p_home > r.p_away)
    p.predicted_winner = sim.home_team;
  else if (r.p_away > r.p_home)
    p.predicted_winner = sim.away_team;
  p.favourite_probability = std::max(r.p_home, r.p_away);
  p.label = probability_label(p.favourite_probability);
  p.variance_indicator = variance_indicator(r.p_home, r.p_away);

  int best = 0;
  for (const auto &entry : r.distribution) {
    if (entry.second > best) {
      best = entry.second;
      p.most_likely_score = entry.first;
    }
  }

  r.confidence = confidence_score(quality, n);
  return r;
}

Json::Value SimulationResult::to_json() const {
  Json::Value root(Json::objectValue);
  root["home_team"] = home_id;
  root["away_team"] = away_id;
  root["seed"] = Json::Value(Json::UInt64(run_seed));
  root["status"] = to_string(run_status);
  root["iterations"]["requested"] = requested;
  root["iterations"]["completed"] = completed_iterations();

  root["win_probability"]["home"] = p_home;
  root["win_probability"]["away"] = p_away;
  root["win_probability"]["draw"] = p_draw;
  root["confidence_score"] = confidence;

  Json::Value &dist = root["score_distribution"];
  dist = Json::Value(Json::arrayValue);
  int n = completed_iterations();
  for (const auto &entry : distribution) {
    Json::Value cell;
    cell["home"] = entry.first.first;
    cell["away"] = entry.first.second;
    cell["count"] = entry.second;
    cell["probability"] = n > 0 ? (double)entry.second / n : 0.0;
    dist.append(cell);
  }

  Json::Value &segs = root["segments"];
  segs = Json::Value(Json::arrayValue);
  for (const auto &s : segments) {
    Json::Value seg;
    seg["segment"] = to_string(s.segment);
    seg["home_goals"] = s.home_goals;
    seg["away_goals"] = s.away_goals;
    seg["home_xg"] = s.home_xg;
    seg["away_xg"] = s.away_xg;
    seg["share_of_xg"] = s.share_of_xg;
    seg["home_win_rate"] = s.home_win_rate;
    seg["away_win_rate"] = s.away_win_rate;
    seg["tie_rate"] = s.tie_rate;
    segs.append(seg);
  }
  root["top_segment"] = to_string(top_segment());

  Json::Value &sum = root["summary"];
  sum["predicted_winner"] = prediction.predicted_winner;
  sum["favourite_probability"] = prediction.favourite_probability;
  sum["label"] = prediction.label;
  sum["variance_indicator"] = prediction.variance_indicator;
  sum["most_likely_score"].append(prediction.most_likely_score.first);
  sum["most_likely_score"].append(prediction.most_likely_score.second);
  sum["average_home_goals"] = prediction.average_home_goals;
  sum["average_away_goals"] = prediction.average_away_goals;
  sum["average_home_xg"] = prediction.average_home_xg;
  sum["average_away_xg"] = prediction.average_away_xg;
  sum["overtime_rate"] = prediction.overtime_rate;
  sum["shootout_rate"] = prediction.shootout_rate;
  sum["expected_points_home"] = prediction.expected_points_home;
  sum["expected_points_away"] = prediction.expected_points_away;

  Json::Value &dq = root["data_quality"];
  dq["entities"] = quality.entities;
  dq["thin_zone_entities"] = quality.thin_zone_entities;
  dq["low_matchup_entities"] = quality.low_matchup_entities;
  dq["reconciliation_warnings"] = quality.reconciliation_warnings;
  dq["notes"] = Json::Value(Json::arrayValue);
  for (const auto &note : quality.notes)
    dq["notes"].append(note);

  Json::Value &trials = root["per_iteration_scores"];
  trials = Json::Value(Json::arrayValue);
  for (const auto &t : scores) {
    Json::Value pair(Json::arrayValue);
    pair.append(t.home);
    pair.append(t.away);
    trials.append(pair);
  }
  return root;
}

std::string SimulationResult::to_json_string() const {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, to_json());
}

std::string SimulationResult::render_summary() const {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(1);
  ss << "=== Game Prediction ===\n";
  ss << "Team " << home_id << " (home) vs Team " << away_id << " (away)\n";
  ss << "Trials: " << completed_iterations() << "/" << requested << " ("
     << to_string(run_status) << ") | Seed: " << run_seed << "\n";
  ss << "Win probability: home " << percent(p_home) << "% | away "
     << percent(p_away) << "% | draw " << percent(p_draw) << "%\n";

  if (prediction.predicted_winner >= 0)
    ss << "Prediction: team " << prediction.predicted_winner << " ("
       << prediction.label << ", " << percent(prediction.favourite_probability)
       << "%)\n";
  else
    ss << "Prediction: even\n";

  ss << std::setprecision(2);
  ss << "Most likely score: " << prediction.most_likely_score.first << "-"
     << prediction.most_likely_score.second
     << " | Avg goals: " << prediction.average_home_goals << " - "
     << prediction.average_away_goals << " | Avg xG: "
     << prediction.average_home_xg << " - " << prediction.average_away_xg
     << "\n";
  ss << std::setprecision(1) << "Overtime: " << percent(prediction.overtime_rate)
     << "% | Shootout: " << percent(prediction.shootout_rate) << "%\n";
  ss << std::setprecision(2) << "Expected points: home "
     << prediction.expected_points_home << " | away "
     << prediction.expected_points_away << "\n";
  ss << "Variance: " << prediction.variance_indicator
     << " | Confidence: " << confidence << "\n";

  ss << "Segments (avg goals home-away, share of xG, won home/away):\n";
  for (const auto &s : segments) {
    ss << "  " << std::left << std::setw(11) << to_string(s.segment)
       << std::right << std::setprecision(2) << s.home_goals << " - "
       << s.away_goals << "  (" << std::setprecision(1)
       << percent(s.share_of_xg) << "%)  won " << percent(s.home_win_rate)
       << "% / " << percent(s.away_win_rate) << "%\n";
  }
  for (const auto &note : quality.notes)
    ss << "Note: " << note << "\n";
  return ss.str();
}

Json::Value series_to_json(const SeriesResult &series) {
  Json::Value root(Json::objectValue);
  root["wins_needed"] = series.wins_needed;
  root["start"].append(series.start_home_wins);
  root["start"].append(series.start_away_wins);
  root["seed"] = Json::Value(Json::UInt64(series.seed));
  root["status"] = series.aborted ? "aborted" : "complete";
  root["trials"] = series.completed;
  root["home_win_probability"] = series.home_win_probability;
  root["away_win_probability"] = series.away_win_probability;
  root["average_length"] = series.average_length;
  root["outcomes"] = Json::Value(Json::arrayValue);
  for (const auto &entry : series.outcomes) {
    Json::Value cell;
    cell["home_wins"] = entry.first.first;
    cell["away_wins"] = entry.first.second;
    cell["probability"] =
        series.completed > 0 ? (double)entry.second / series.completed : 0.0;
    root["outcomes"].append(cell);
  }
  return root;
}

std::string render_series_summary(const SeriesResult &series) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(1);
  ss << "=== Series Prediction (first to " << series.wins_needed << ") ===\n";
  ss << "From " << series.start_home_wins << "-" << series.start_away_wins
     << " | Trials: " << series.completed << "/" << series.requested
     << (series.aborted ? " (aborted)" : "") << "\n";
  ss << "Series win: home " << percent(series.home_win_probability)
     << "% | away " << percent(series.away_win_probability) << "%\n";
  ss << std::setprecision(2) << "Average games remaining: "
     << series.average_length << "\n";
  for (const auto &entry : series.outcomes) {
    ss << "  " << entry.first.first << "-" << entry.first.second << ": "
       << std::setprecision(1)
       << percent((double)entry.second / std::max(1, series.completed))
       << "%\n";
  }
  return ss.str();
}
