#include "errors.h"
#include "matchup_weighting.h"
#include <gtest/gtest.h>

namespace {

std::vector<GameLine> skater_games(int count, int goals_even, int goals_odd,
                                   int shots_even, int shots_odd,
                                   int opponent = 2) {
  std::vector<GameLine> lines;
  for (int i = 0; i < count; ++i) {
    GameLine l;
    l.game_id = i + 1;
    l.season_id = 2024;
    l.entity_id = 7;
    l.opponent_id = opponent;
    l.goals = i % 2 == 0 ? goals_even : goals_odd;
    l.shots = i % 2 == 0 ? shots_even : shots_odd;
    lines.push_back(l);
  }
  return lines;
}

std::vector<GameLine> goalie_games(int count, int shots, int goals) {
  std::vector<GameLine> lines;
  for (int i = 0; i < count; ++i) {
    GameLine l;
    l.game_id = i + 1;
    l.season_id = 2024;
    l.entity_id = 50;
    l.is_goalie = true;
    l.shots_against = shots;
    l.goals_against = goals + i % 2;
    l.toi_seconds = 3600;
    lines.push_back(l);
  }
  return lines;
}

class MatchupWeightingTest : public ::testing::Test {
protected:
  EngineConfig config = default_engine_config();
  MatchupWeightingEngine engine{config};
  StatLine general = StatLineBuilder::skater(skater_games(20, 0, 1, 2, 4));
};

} // namespace

TEST_F(MatchupWeightingTest, BelowMinimumSampleHasZeroWeight) {
  for (int n = 0; n < config.matchup.min_sample; ++n) {
    StatLine versus = StatLineBuilder::skater(skater_games(n, 4, 4, 6, 6));
    MatchupProfile p = engine.evaluate(7, 2, 2024, general, versus);
    EXPECT_EQ(p.sample_size, n);
    EXPECT_EQ(p.matchup_weight, 0.0);
    EXPECT_EQ(p.general_weight, 1.0);
  }
}

TEST_F(MatchupWeightingTest, SampleOfTwoAgainstAnyGeneralProfile) {
  StatLine wild = StatLineBuilder::skater(skater_games(2, 5, 0, 9, 1));
  StatLine steady = StatLineBuilder::skater(skater_games(40, 2, 0, 3, 7));
  for (const StatLine &g : {general, steady}) {
    MatchupProfile p = engine.evaluate(7, 2, 2024, g, wild);
    EXPECT_EQ(p.matchup_weight, 0.0);
    EXPECT_EQ(p.general_weight, 1.0);
  }
}

TEST_F(MatchupWeightingTest, WeightsAlwaysSumToOne) {
  for (int n = 0; n <= 15; ++n) {
    for (int goals = 0; goals <= 3; ++goals) {
      StatLine versus =
          StatLineBuilder::skater(skater_games(n, goals, 1, 3 + goals, 2));
      MatchupProfile p = engine.evaluate(7, 2, 2024, general, versus);
      EXPECT_NEAR(p.general_weight + p.matchup_weight, 1.0, 1e-12);
      EXPECT_GE(p.matchup_weight, 0.0);
      EXPECT_LE(p.matchup_weight, 1.0);
      EXPECT_GE(p.similarity_score, 0.0);
      EXPECT_LE(p.similarity_score, 1.0);
    }
  }
}

TEST_F(MatchupWeightingTest, MatchingHistoryKeepsGeneralWeight) {
  StatLine versus = StatLineBuilder::skater(skater_games(10, 0, 1, 2, 4));
  MatchupProfile p = engine.evaluate(7, 2, 2024, general, versus);
  EXPECT_DOUBLE_EQ(p.similarity_score, 1.0);
  EXPECT_DOUBLE_EQ(p.sample_confidence, 1.0);
  EXPECT_DOUBLE_EQ(p.matchup_weight, 0.0);
}

TEST_F(MatchupWeightingTest, DivergentFullSampleTakesMatchupWeight) {
  StatLine versus = StatLineBuilder::skater(skater_games(10, 3, 3, 8, 8));
  MatchupProfile p = engine.evaluate(7, 2, 2024, general, versus);
  EXPECT_DOUBLE_EQ(p.similarity_score, 0.0);
  EXPECT_DOUBLE_EQ(p.matchup_weight, 1.0);
  EXPECT_DOUBLE_EQ(p.general_weight, 0.0);

  SkaterStatLine blended =
      std::get<SkaterStatLine>(MatchupWeightingEngine::blended_line(p));
  EXPECT_DOUBLE_EQ(blended.goals_per_game, 3.0);
  EXPECT_DOUBLE_EQ(blended.shots_per_game, 8.0);
}

TEST_F(MatchupWeightingTest, PartialSampleScalesWeight) {
  StatLine versus = StatLineBuilder::skater(skater_games(4, 3, 3, 8, 8));
  MatchupProfile p = engine.evaluate(7, 2, 2024, general, versus);
  EXPECT_DOUBLE_EQ(p.sample_confidence, 0.4);
  EXPECT_DOUBLE_EQ(p.matchup_weight, 0.4);
  EXPECT_NEAR(MatchupWeightingEngine::blend(p, 1.0, 2.0), 1.4, 1e-12);
}

TEST_F(MatchupWeightingTest, SampleConfidenceCurve) {
  EXPECT_DOUBLE_EQ(engine.sample_confidence(2), 0.0);
  EXPECT_DOUBLE_EQ(engine.sample_confidence(3), 0.3);
  EXPECT_DOUBLE_EQ(engine.sample_confidence(10), 1.0);
  EXPECT_DOUBLE_EQ(engine.sample_confidence(25), 1.0);
}

TEST_F(MatchupWeightingTest, FlatGeneralHistoryGivesZeroDeviation) {
  StatLine flat = StatLineBuilder::skater(skater_games(10, 1, 1, 3, 3));
  StatLine versus = StatLineBuilder::skater(skater_games(5, 2, 2, 3, 3));
  MatchupProfile p = engine.evaluate(7, 2, 2024, flat, versus);
  for (const auto &d : p.deviations)
    EXPECT_EQ(d.z, 0.0) << d.stat;
  EXPECT_DOUBLE_EQ(p.similarity_score, 1.0);
}

TEST_F(MatchupWeightingTest, GoalieLinesCompareGoalieStats) {
  StatLine g = StatLineBuilder::goalie(goalie_games(20, 30, 2));
  StatLine versus = StatLineBuilder::goalie(goalie_games(6, 30, 2));
  MatchupProfile p = engine.evaluate(50, 2, 2024, g, versus);
  ASSERT_EQ(p.deviations.size(), 2u);
  EXPECT_EQ(p.deviations[0].stat, "save_percentage");
  EXPECT_TRUE(is_goalie_line(MatchupWeightingEngine::blended_line(p)));
  EXPECT_NEAR(p.general_weight + p.matchup_weight, 1.0, 1e-12);
}

TEST_F(MatchupWeightingTest, MissingBaselineIsInvalidProfile) {
  StatLine versus = StatLineBuilder::skater(skater_games(5, 1, 1, 3, 3));
  EXPECT_THROW(engine.evaluate(7, 2, 2024, std::nullopt, versus),
               InvalidProfileError);
  EXPECT_THROW(engine.evaluate(7, 2, 2024, StatLine(SkaterStatLine{}), versus),
               InvalidProfileError);
}

TEST_F(MatchupWeightingTest, KindMismatchIsInvalidProfile) {
  StatLine versus = StatLineBuilder::goalie(goalie_games(5, 30, 2));
  try {
    engine.evaluate(7, 2, 2024, general, versus);
    FAIL() << "expected InvalidProfileError";
  } catch (const InvalidProfileError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::INVALID_PROFILE);
    EXPECT_EQ(e.payload().entity_id, 7);
  }
}
