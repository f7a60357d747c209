#ifndef SEGMENT_PROFILE_H
#define SEGMENT_PROFILE_H

#include "engine_config.h"
#include "hockey_types.h"
#include "zone_profile.h"
#include <array>
#include <map>
#include <string>
#include <vector>

struct GameInfo {
  int game_id = 0;
  int season_id = 0;
  std::string date; // YYYY-MM-DD
  GameType type = GameType::REGULAR;
  int home_team = -1;
  int away_team = -1;
  int home_score = 0;
  int away_score = 0;
  bool decided_in_overtime = false;
};

// One entity's box-score row for one game.
struct GameLine {
  int game_id = 0;
  int season_id = 0;
  std::string date;
  int entity_id = -1;
  int team_id = -1;
  int opponent_id = -1;
  bool is_goalie = false;
  int goals = 0;
  int assists = 0;
  int shots = 0;
  int shots_against = 0;
  int goals_against = 0;
  int toi_seconds = 0;
};

enum class SampleSize { INSUFFICIENT, MINIMUM, RECOMMENDED, HIGH_CONFIDENCE };

std::string to_string(SampleSize size);
SampleSize sample_size_category(int games);

struct SegmentStats {
  int games = 0;
  int goals = 0;
  int assists = 0;
  int shots = 0;
  int shots_against = 0;
  int goals_against = 0;
  SampleSize sample_size = SampleSize::INSUFFICIENT;

  int points() const { return goals + assists; }
  double goals_per_game() const { return games > 0 ? (double)goals / games : 0.0; }
  double points_per_game() const {
    return games > 0 ? (double)points() / games : 0.0;
  }
  double shots_per_game() const { return games > 0 ? (double)shots / games : 0.0; }
  double shooting_percentage() const {
    return shots > 0 ? (double)goals / shots : 0.0;
  }
  double save_percentage() const {
    return shots_against > 0 ? 1.0 - (double)goals_against / shots_against
                             : 0.0;
  }

  SegmentStats &operator+=(const SegmentStats &other);
};

// Regular-season games split into thirds by count, playoffs apart.
class SeasonPhaseMapping {
public:
  SeasonPhaseMapping() = default;
  SeasonPhaseMapping(int season_id, const std::vector<GameInfo> &games);

  int season_id() const { return season; }
  bool contains(int game_id) const;
  // Throws std::out_of_range for a game outside the season.
  SeasonPhase phase_of(int game_id) const;
  int game_count(SeasonPhase phase) const { return counts[index_of(phase)]; }
  bool empty() const { return phases.empty(); }

private:
  int season = 0;
  std::map<int, SeasonPhase> phases;
  std::array<int, NUM_SEASON_PHASES> counts{};
};

struct ReconciliationWarning {
  std::string stat;
  int expected = 0;   // from per-game rows
  int aggregated = 0; // from segment cells
};

class SegmentProfile {
public:
  SegmentProfile(EntityKind kind, int entity_id, SeasonPhaseMapping mapping);

  SegmentStats &cell(SeasonPhase season_phase, GamePhase game_phase) {
    return cells[index_of(season_phase)][index_of(game_phase)];
  }
  const SegmentStats &cell(SeasonPhase season_phase,
                           GamePhase game_phase) const {
    return cells[index_of(season_phase)][index_of(game_phase)];
  }

  // Counting stats summed over game phases; games counted once.
  SegmentStats phase_total(SeasonPhase season_phase) const;
  SegmentStats total() const;

  EntityKind kind() const { return entity_kind; }
  int entity_id() const { return id; }
  const SeasonPhaseMapping &mapping() const { return season_mapping; }

  const std::vector<ReconciliationWarning> &warnings() const {
    return reconciliation;
  }
  bool is_reconciled() const { return reconciliation.empty(); }
  void add_warning(ReconciliationWarning warning);

private:
  EntityKind entity_kind;
  int id;
  SeasonPhaseMapping season_mapping;
  std::array<std::array<SegmentStats, NUM_GAME_PHASES>, NUM_SEASON_PHASES>
      cells{};
  std::vector<ReconciliationWarning> reconciliation;
};

class SegmentProfileBuilder {
public:
  explicit SegmentProfileBuilder(const EngineConfig &config);

  GamePhase game_phase_of(int period, int period_seconds) const;

  // Aggregates shot events into cells and checks them against the game
  // lines. Mismatches become warnings on the profile.
  SegmentProfile build(const ProfileScope &scope,
                       const std::vector<GameInfo> &games,
                       const std::vector<ShotEvent> &events,
                       const std::vector<GameLine> &lines) const;

private:
  const EngineConfig &config;
};

#endif
