#include "errors.h"
#include "prediction.h"
#include <gtest/gtest.h>
#include <json/json.h>
#include <sstream>

namespace {

TrialScore trial(std::array<int, NUM_SIM_SEGMENTS> home,
                 std::array<int, NUM_SIM_SEGMENTS> away, bool overtime) {
  TrialScore t;
  t.home_goals = home;
  t.away_goals = away;
  for (int s = 0; s < NUM_SIM_SEGMENTS; ++s) {
    t.home += home[s];
    t.away += away[s];
  }
  t.went_to_overtime = overtime;
  t.home_xg = {0.5, 0.5, 0.7, overtime ? 0.2 : 0.0};
  t.away_xg = {0.3, 0.3, 0.3, overtime ? 0.2 : 0.0};
  return t;
}

// Two regulation home wins, an overtime away win and a draw.
TrialBatch four_games() {
  TrialBatch batch;
  batch.requested = 4;
  batch.seed = 77;
  batch.trials = {trial({1, 1, 1, 0}, {0, 1, 0, 0}, false),
                  trial({1, 1, 0, 0}, {0, 1, 1, 1}, true),
                  trial({1, 1, 1, 0}, {0, 1, 0, 0}, false),
                  trial({1, 0, 1, 0}, {1, 1, 0, 0}, true)};
  return batch;
}

SimulationConfig matchup() {
  SimulationConfig sim;
  sim.home_team = 1;
  sim.away_team = 2;
  sim.season_id = 2024;
  sim.game_date = "2025-01-15";
  sim.overtime_policy = OvertimePolicy::DRAW;
  return sim;
}

DataQualityReport clean_report() {
  DataQualityReport q;
  q.entities = 10;
  return q;
}

class PredictionTest : public ::testing::Test {
protected:
  PredictionAggregator aggregator;
};

} // namespace

TEST(PredictionLabelTest, LabelsFollowFavouriteProbability) {
  EXPECT_EQ(PredictionAggregator::probability_label(0.50), "toss-up");
  EXPECT_EQ(PredictionAggregator::probability_label(0.549), "toss-up");
  EXPECT_EQ(PredictionAggregator::probability_label(0.55), "lean");
  EXPECT_EQ(PredictionAggregator::probability_label(0.62), "strong");
  EXPECT_EQ(PredictionAggregator::probability_label(0.70), "blowout");
  EXPECT_EQ(PredictionAggregator::probability_label(0.93), "blowout");
}

TEST(PredictionLabelTest, VarianceIndicatorFollowsMargin) {
  EXPECT_EQ(PredictionAggregator::variance_indicator(0.52, 0.48), "high");
  EXPECT_EQ(PredictionAggregator::variance_indicator(0.40, 0.55), "normal");
  EXPECT_EQ(PredictionAggregator::variance_indicator(0.70, 0.30), "low");
}

TEST(ConfidenceScoreTest, StaysInUnitInterval) {
  DataQualityReport worst;
  worst.entities = 4;
  worst.thin_zone_entities = 4;
  worst.low_matchup_entities = 4;
  worst.entities_with_warnings = 4;
  double low = PredictionAggregator::confidence_score(worst, 10);
  EXPECT_GE(low, 0.0);
  EXPECT_LE(low, 1.0);

  double high = PredictionAggregator::confidence_score(clean_report(), 1000000);
  EXPECT_GT(high, 0.95);
  EXPECT_LE(high, 1.0);
  EXPECT_DOUBLE_EQ(PredictionAggregator::confidence_score(clean_report(), 0), 0.0);
}

TEST(ConfidenceScoreTest, ThinDataAndFewTrialsLowerConfidence) {
  DataQualityReport thin = clean_report();
  thin.thin_zone_entities = 5;
  // 1 - 0.4 * 0.5, times 1 - 2 * sqrt(0.25 / 10000)
  EXPECT_NEAR(PredictionAggregator::confidence_score(thin, 10000), 0.8 * 0.99,
              1e-12);
  EXPECT_LT(PredictionAggregator::confidence_score(clean_report(), 100),
            PredictionAggregator::confidence_score(clean_report(), 10000));
}

TEST_F(PredictionTest, EvenSplitIsNotLessConfident) {
  // same inputs and trial count, one even run and one lopsided run
  TrialBatch even;
  TrialBatch lopsided;
  for (int i = 0; i < 100; ++i) {
    bool home_wins = i % 2 == 0;
    even.trials.push_back(trial({home_wins ? 1 : 0, 0, 0, 0},
                                {home_wins ? 0 : 1, 0, 0, 0}, false));
    lopsided.trials.push_back(trial({i < 90 ? 1 : 0, 0, 0, 0},
                                    {i < 90 ? 0 : 1, 0, 0, 0}, false));
  }
  even.requested = lopsided.requested = 100;
  SimulationResult a = aggregator.aggregate(even, matchup(), clean_report());
  SimulationResult b = aggregator.aggregate(lopsided, matchup(), clean_report());
  EXPECT_DOUBLE_EQ(a.win_probability_home(), 0.5);
  EXPECT_DOUBLE_EQ(b.win_probability_home(), 0.9);
  EXPECT_DOUBLE_EQ(a.confidence_score(), b.confidence_score());
  EXPECT_NEAR(a.confidence_score(), 0.9, 1e-12);
}

TEST_F(PredictionTest, AggregatesOutcomes) {
  SimulationResult r =
      aggregator.aggregate(four_games(), matchup(), clean_report());

  EXPECT_TRUE(r.is_complete());
  EXPECT_NO_THROW(r.require_complete());
  EXPECT_EQ(r.completed_iterations(), 4);
  EXPECT_EQ(r.seed(), 77u);
  EXPECT_DOUBLE_EQ(r.win_probability_home(), 0.5);
  EXPECT_DOUBLE_EQ(r.win_probability_away(), 0.25);
  EXPECT_DOUBLE_EQ(r.draw_rate(), 0.25);
  EXPECT_DOUBLE_EQ(r.win_probability_home() + r.win_probability_away() +
                       r.draw_rate(),
                   1.0);

  const auto &dist = r.score_distribution();
  ASSERT_EQ(dist.size(), 3u);
  EXPECT_EQ(dist.at({3, 1}), 2);
  EXPECT_EQ(dist.at({2, 3}), 1);
  EXPECT_EQ(dist.at({2, 2}), 1);
}

TEST_F(PredictionTest, SummarisesTheRun) {
  SimulationResult r =
      aggregator.aggregate(four_games(), matchup(), clean_report());
  const PredictionSummary &s = r.summary();

  EXPECT_EQ(s.predicted_winner, 1);
  EXPECT_DOUBLE_EQ(s.favourite_probability, 0.5);
  EXPECT_EQ(s.label, "toss-up");
  EXPECT_EQ(s.variance_indicator, "low");
  EXPECT_EQ(s.most_likely_score, std::make_pair(3, 1));
  EXPECT_DOUBLE_EQ(s.average_home_goals, 2.5);
  EXPECT_DOUBLE_EQ(s.average_away_goals, 1.75);
  EXPECT_NEAR(s.average_home_xg, 1.8, 1e-12);
  EXPECT_NEAR(s.average_away_xg, 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(s.overtime_rate, 0.5);
  EXPECT_DOUBLE_EQ(s.shootout_rate, 0.0);
  // two wins and an overtime loss and a draw for the home side
  EXPECT_DOUBLE_EQ(s.expected_points_home, 1.5);
  EXPECT_DOUBLE_EQ(s.expected_points_away, 0.75);
  // sqrt(0.25 / 4) = 0.25 hits the precision floor
  EXPECT_DOUBLE_EQ(r.confidence_score(), 0.5);
}

TEST_F(PredictionTest, SegmentSharesSumToOne) {
  SimulationResult r =
      aggregator.aggregate(four_games(), matchup(), clean_report());
  const auto &segments = r.segment_breakdown();

  double share = 0.0;
  for (const auto &s : segments)
    share += s.share_of_xg;
  EXPECT_NEAR(share, 1.0, 1e-12);

  const SegmentBreakdown &late = segments[index_of(SimSegment::LATE)];
  EXPECT_NEAR(late.share_of_xg, 4.0 / 11.2, 1e-12);
  EXPECT_DOUBLE_EQ(late.home_goals, 0.75);
  EXPECT_NEAR(segments[index_of(SimSegment::OVERTIME)].home_xg, 0.1, 1e-12);
  EXPECT_EQ(segments[index_of(SimSegment::OVERTIME)].away_goals, 0.25);
  EXPECT_EQ(r.top_segment(), SimSegment::LATE);
}

TEST_F(PredictionTest, SegmentWinRatesComeFromSegmentScores) {
  SimulationResult r =
      aggregator.aggregate(four_games(), matchup(), clean_report());
  const auto &segments = r.segment_breakdown();

  const SegmentBreakdown &early = segments[index_of(SimSegment::EARLY)];
  EXPECT_DOUBLE_EQ(early.home_win_rate, 0.75);
  EXPECT_DOUBLE_EQ(early.away_win_rate, 0.0);
  EXPECT_DOUBLE_EQ(early.tie_rate, 0.25);

  const SegmentBreakdown &mid = segments[index_of(SimSegment::MID)];
  EXPECT_DOUBLE_EQ(mid.home_win_rate, 0.0);
  EXPECT_DOUBLE_EQ(mid.away_win_rate, 0.25);
  EXPECT_DOUBLE_EQ(mid.tie_rate, 0.75);

  const SegmentBreakdown &late = segments[index_of(SimSegment::LATE)];
  EXPECT_DOUBLE_EQ(late.home_win_rate, 0.75);
  EXPECT_DOUBLE_EQ(late.away_win_rate, 0.25);
  EXPECT_DOUBLE_EQ(late.tie_rate, 0.0);

  // only the two overtime games count for the overtime segment
  const SegmentBreakdown &ot = segments[index_of(SimSegment::OVERTIME)];
  EXPECT_DOUBLE_EQ(ot.home_win_rate, 0.0);
  EXPECT_DOUBLE_EQ(ot.away_win_rate, 0.5);
  EXPECT_DOUBLE_EQ(ot.tie_rate, 0.5);
}

TEST_F(PredictionTest, PartialBatchIsMarkedAborted) {
  TrialBatch batch = four_games();
  batch.requested = 10;
  batch.aborted = true;
  SimulationResult r = aggregator.aggregate(batch, matchup(), clean_report());

  EXPECT_EQ(r.status(), RunStatus::ABORTED);
  EXPECT_FALSE(r.is_complete());
  EXPECT_EQ(r.requested_iterations(), 10);
  EXPECT_EQ(r.completed_iterations(), 4);
  try {
    r.require_complete();
    FAIL() << "expected SimulationAbortedError";
  } catch (const SimulationAbortedError &e) {
    EXPECT_EQ(e.completed(), 4);
    EXPECT_EQ(e.requested(), 10);
    EXPECT_EQ(e.kind(), ErrorKind::SIMULATION_ABORTED);
  }
}

TEST_F(PredictionTest, EmptyBatchHasNoWinner) {
  TrialBatch empty;
  empty.requested = 100;
  empty.aborted = true;
  SimulationResult r = aggregator.aggregate(empty, matchup(), clean_report());
  EXPECT_EQ(r.summary().predicted_winner, -1);
  EXPECT_DOUBLE_EQ(r.confidence_score(), 0.0);
  EXPECT_TRUE(r.score_distribution().empty());
}

TEST_F(PredictionTest, JsonCarriesEveryTrial) {
  DataQualityReport q = clean_report();
  q.thin_zone_entities = 2;
  q.notes.push_back("2 entities with thin zone data");
  SimulationResult r = aggregator.aggregate(four_games(), matchup(), q);
  Json::Value root = r.to_json();

  EXPECT_EQ(root["home_team"].asInt(), 1);
  EXPECT_EQ(root["seed"].asUInt64(), 77u);
  EXPECT_EQ(root["status"].asString(), "complete");
  EXPECT_EQ(root["iterations"]["completed"].asInt(), 4);
  EXPECT_DOUBLE_EQ(root["win_probability"]["draw"].asDouble(), 0.25);
  EXPECT_EQ(root["score_distribution"].size(), 3u);
  EXPECT_EQ(root["segments"].size(), (unsigned)NUM_SIM_SEGMENTS);
  EXPECT_EQ(root["segments"][0]["segment"].asString(), "early_game");
  EXPECT_DOUBLE_EQ(root["segments"][0]["home_win_rate"].asDouble(), 0.75);
  EXPECT_DOUBLE_EQ(root["segments"][1]["away_win_rate"].asDouble(), 0.25);
  EXPECT_DOUBLE_EQ(root["segments"][1]["tie_rate"].asDouble(), 0.75);
  EXPECT_NEAR(root["summary"]["average_home_xg"].asDouble(), 1.8, 1e-12);
  EXPECT_NEAR(root["summary"]["average_away_xg"].asDouble(), 1.0, 1e-12);
  EXPECT_EQ(root["top_segment"].asString(), "late_game");
  EXPECT_EQ(root["summary"]["label"].asString(), "toss-up");
  EXPECT_EQ(root["summary"]["most_likely_score"][0].asInt(), 3);
  EXPECT_EQ(root["data_quality"]["thin_zone_entities"].asInt(), 2);
  EXPECT_EQ(root["data_quality"]["notes"].size(), 1u);

  const Json::Value &trials = root["per_iteration_scores"];
  ASSERT_EQ(trials.size(), 4u);
  EXPECT_EQ(trials[1][0].asInt(), 2);
  EXPECT_EQ(trials[1][1].asInt(), 3);

  Json::CharReaderBuilder builder;
  Json::Value reparsed;
  std::string errors;
  std::istringstream in(r.to_json_string());
  ASSERT_TRUE(Json::parseFromStream(builder, in, &reparsed, &errors)) << errors;
  EXPECT_EQ(reparsed["per_iteration_scores"].size(), 4u);
  EXPECT_DOUBLE_EQ(reparsed["confidence_score"].asDouble(),
                   root["confidence_score"].asDouble());
}

TEST_F(PredictionTest, SummaryTextNamesTheFavourite) {
  DataQualityReport q = clean_report();
  q.notes.push_back("goalie for team 2 has no starts");
  SimulationResult r = aggregator.aggregate(four_games(), matchup(), q);
  std::string text = r.render_summary();

  EXPECT_EQ(text.rfind("=== Game Prediction ===", 0), 0u);
  EXPECT_NE(text.find("Team 1 (home) vs Team 2 (away)"), std::string::npos);
  EXPECT_NE(text.find("Win probability: home 50.0% | away 25.0% | draw 25.0%"),
            std::string::npos);
  EXPECT_NE(text.find("Prediction: team 1 (toss-up, 50.0%)"),
            std::string::npos);
  EXPECT_NE(text.find("Most likely score: 3-1"), std::string::npos);
  EXPECT_NE(text.find("late_game"), std::string::npos);
  EXPECT_NE(text.find("Avg xG: 1.80 - 1.00"), std::string::npos);
  EXPECT_NE(text.find("won 75.0% / 25.0%"), std::string::npos);
  EXPECT_NE(text.find("Note: goalie for team 2 has no starts"),
            std::string::npos);
}

TEST(SeriesOutputTest, JsonAndSummary) {
  SeriesResult series;
  series.requested = 4;
  series.completed = 4;
  series.seed = 9;
  series.home_win_probability = 0.75;
  series.away_win_probability = 0.25;
  series.average_length = 5.5;
  series.outcomes[{4, 1}] = 3;
  series.outcomes[{2, 4}] = 1;

  Json::Value root = series_to_json(series);
  EXPECT_EQ(root["wins_needed"].asInt(), 4);
  EXPECT_EQ(root["status"].asString(), "complete");
  EXPECT_EQ(root["start"][0].asInt(), 0);
  ASSERT_EQ(root["outcomes"].size(), 2u);
  EXPECT_EQ(root["outcomes"][0]["away_wins"].asInt(), 4);
  EXPECT_DOUBLE_EQ(root["outcomes"][1]["probability"].asDouble(), 0.75);

  std::string text = render_series_summary(series);
  EXPECT_NE(text.find("first to 4"), std::string::npos);
  EXPECT_NE(text.find("Series win: home 75.0% | away 25.0%"),
            std::string::npos);
  EXPECT_NE(text.find("Average games remaining: 5.50"), std::string::npos);
}
