#include "../include/segment_profile.h"
#include "../include/errors.h"
#include "../include/logging.h"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

constexpr int SAMPLE_MINIMUM = 20;
constexpr int SAMPLE_RECOMMENDED = 100;
constexpr int SAMPLE_HIGH_CONFIDENCE = 500;

bool line_matches(const ProfileScope &scope, const GameLine &line) {
  if (line.season_id != scope.season_id)
    return false;
  switch (scope.kind) {
  case EntityKind::PLAYER:
  case EntityKind::GOALIE:
    return line.entity_id == scope.entity_id;
  case EntityKind::TEAM:
    return line.team_id == scope.entity_id;
  case EntityKind::LINE:
    return std::find(scope.members.begin(), scope.members.end(),
                     line.entity_id) != scope.members.end();
  }
  return false;
}

int credited_assists(const ProfileScope &scope, const ShotEvent &event) {
  int count = 0;
  for (int id : event.assist_ids) {
    switch (scope.kind) {
    case EntityKind::PLAYER:
      if (id == scope.entity_id)
        count++;
      break;
    case EntityKind::LINE:
      if (std::find(scope.members.begin(), scope.members.end(), id) !=
          scope.members.end())
        count++;
      break;
    case EntityKind::TEAM:
      if (event.team_id == scope.entity_id)
        count++;
      break;
    case EntityKind::GOALIE:
      break;
    }
  }
  return count;
}

// Shots this scope faced. Empty-net shots have no goalie and are not
// charged to the team either, matching the goalie box-score rows.
bool faced_by(const ProfileScope &scope, const ShotEvent &event) {
  if (event.season_id != scope.season_id || event.goalie_id < 0)
    return false;
  if (scope.kind == EntityKind::GOALIE)
    return event.goalie_id == scope.entity_id;
  if (scope.kind == EntityKind::TEAM)
    return event.opponent_id == scope.entity_id;
  return false;
}

void compare(SegmentProfile &profile, const std::string &stat, int expected,
             int aggregated) {
  if (expected != aggregated)
    profile.add_warning({stat, expected, aggregated});
}

} // namespace

std::string to_string(SampleSize size) {
  switch (size) {
  case SampleSize::INSUFFICIENT:
    return "insufficient";
  case SampleSize::MINIMUM:
    return "minimum";
  case SampleSize::RECOMMENDED:
    return "recommended";
  case SampleSize::HIGH_CONFIDENCE:
    return "high_confidence";
  }
  return "insufficient";
}

SampleSize sample_size_category(int games) {
  if (games >= SAMPLE_HIGH_CONFIDENCE)
    return SampleSize::HIGH_CONFIDENCE;
  if (games >= SAMPLE_RECOMMENDED)
    return SampleSize::RECOMMENDED;
  if (games >= SAMPLE_MINIMUM)
    return SampleSize::MINIMUM;
  return SampleSize::INSUFFICIENT;
}

SegmentStats &SegmentStats::operator+=(const SegmentStats &other) {
  games += other.games;
  goals += other.goals;
  assists += other.assists;
  shots += other.shots;
  shots_against += other.shots_against;
  goals_against += other.goals_against;
  sample_size = sample_size_category(games);
  return *this;
}

SeasonPhaseMapping::SeasonPhaseMapping(int season_id,
                                       const std::vector<GameInfo> &games)
    : season(season_id) {
  std::vector<const GameInfo *> regular;
  for (const auto &game : games) {
    if (game.season_id != season_id)
      continue;
    if (game.type == GameType::PLAYOFF) {
      phases[game.game_id] = SeasonPhase::PLAYOFFS;
      counts[index_of(SeasonPhase::PLAYOFFS)]++;
    } else {
      regular.push_back(&game);
    }
  }

  std::sort(regular.begin(), regular.end(),
            [](const GameInfo *a, const GameInfo *b) {
              if (a->date != b->date)
                return a->date < b->date;
              return a->game_id < b->game_id;
            });

  // Thirds by count; the remainder lands in the late tercile.
  size_t third = regular.size() / 3;
  for (size_t i = 0; i < regular.size(); ++i) {
    SeasonPhase phase = SeasonPhase::LATE;
    if (i < third)
      phase = SeasonPhase::EARLY;
    else if (i < 2 * third)
      phase = SeasonPhase::MID;
    phases[regular[i]->game_id] = phase;
    counts[index_of(phase)]++;
  }
}

bool SeasonPhaseMapping::contains(int game_id) const {
  return phases.count(game_id) > 0;
}

SeasonPhase SeasonPhaseMapping::phase_of(int game_id) const {
  auto it = phases.find(game_id);
  if (it == phases.end())
    throw std::out_of_range("game " + std::to_string(game_id) +
                            " is not in season " + std::to_string(season));
  return it->second;
}

SegmentProfile::SegmentProfile(EntityKind kind, int entity_id,
                               SeasonPhaseMapping mapping)
    : entity_kind(kind), id(entity_id), season_mapping(std::move(mapping)) {}

SegmentStats SegmentProfile::phase_total(SeasonPhase season_phase) const {
  SegmentStats total;
  for (GamePhase gp : ALL_GAME_PHASES)
    total += cell(season_phase, gp);
  // Every game phase carries the same game count.
  total.games = cell(season_phase, GamePhase::EARLY).games;
  total.sample_size = sample_size_category(total.games);
  return total;
}

SegmentStats SegmentProfile::total() const {
  SegmentStats total;
  for (SeasonPhase sp : ALL_SEASON_PHASES)
    total += phase_total(sp);
  return total;
}

void SegmentProfile::add_warning(ReconciliationWarning warning) {
  reconciliation.push_back(std::move(warning));
}

SegmentProfileBuilder::SegmentProfileBuilder(const EngineConfig &config)
    : config(config) {}

GamePhase SegmentProfileBuilder::game_phase_of(int period,
                                               int period_seconds) const {
  const GamePhaseBoundaries &b = config.game_phases;
  int period_length = b.regulation_end_seconds / 3;
  if (period > 3)
    return GamePhase::LATE;
  int game_seconds = (period - 1) * period_length + period_seconds;
  if (game_seconds < b.early_end_seconds)
    return GamePhase::EARLY;
  if (game_seconds < b.mid_end_seconds)
    return GamePhase::MID;
  return GamePhase::LATE;
}

SegmentProfile SegmentProfileBuilder::build(
    const ProfileScope &scope, const std::vector<GameInfo> &games,
    const std::vector<ShotEvent> &events,
    const std::vector<GameLine> &lines) const {
  SeasonPhaseMapping mapping(scope.season_id, games);
  std::string scope_name =
      to_string(scope.kind) + "/season " + std::to_string(scope.season_id);
  if (mapping.empty())
    throw InsufficientDataError(
        InsufficientDataError::Reason::UNKNOWN_SCOPE,
        {scope.entity_id, scope_name, "no games recorded for the season"});

  SegmentProfile profile(scope.kind, scope.entity_id, mapping);

  // Ground truth from the per-game rows.
  SegmentStats expected;
  std::set<int> played;
  for (const auto &line : lines) {
    if (!line_matches(scope, line))
      continue;
    expected.goals += line.goals;
    expected.assists += line.assists;
    expected.shots += line.shots;
    expected.shots_against += line.shots_against;
    expected.goals_against += line.goals_against;
    played.insert(line.game_id);
  }
  expected.games = (int)played.size();

  bool any_event = false;
  for (const auto &event : events) {
    if (event.season_id != scope.season_id || !mapping.contains(event.game_id))
      continue;
    bool shooting = scope.kind != EntityKind::GOALIE && scope.matches(event);
    int assists = event.is_goal ? credited_assists(scope, event) : 0;
    bool facing = faced_by(scope, event);
    if (!shooting && assists == 0 && !facing)
      continue;
    any_event = true;

    SegmentStats &cell =
        profile.cell(mapping.phase_of(event.game_id),
                     game_phase_of(event.period, event.period_seconds));
    if (shooting) {
      cell.shots++;
      if (event.is_goal)
        cell.goals++;
    }
    cell.assists += assists;
    if (facing) {
      cell.shots_against++;
      if (event.is_goal)
        cell.goals_against++;
    }
  }

  if (played.empty() && !any_event)
    throw InsufficientDataError(
        InsufficientDataError::Reason::EMPTY_SCOPE,
        {scope.entity_id, scope_name, "no games or events for this entity"});

  for (int game_id : played) {
    if (!mapping.contains(game_id))
      continue;
    SeasonPhase sp = mapping.phase_of(game_id);
    for (GamePhase gp : ALL_GAME_PHASES)
      profile.cell(sp, gp).games++;
  }
  for (SeasonPhase sp : ALL_SEASON_PHASES) {
    for (GamePhase gp : ALL_GAME_PHASES) {
      SegmentStats &cell = profile.cell(sp, gp);
      cell.sample_size = sample_size_category(cell.games);
    }
  }

  SegmentStats aggregated = profile.total();
  compare(profile, "games", expected.games, aggregated.games);
  compare(profile, "goals", expected.goals, aggregated.goals);
  compare(profile, "assists", expected.assists, aggregated.assists);
  compare(profile, "shots", expected.shots, aggregated.shots);
  compare(profile, "shots_against", expected.shots_against,
          aggregated.shots_against);
  compare(profile, "goals_against", expected.goals_against,
          aggregated.goals_against);

  for (const auto &w : profile.warnings()) {
    log_message(LogLevel::WARN, "SEGMENTS",
                scope_name + " entity " + std::to_string(scope.entity_id) +
                    ": " + w.stat + " expected " + std::to_string(w.expected) +
                    ", aggregated " + std::to_string(w.aggregated));
  }
  return profile;
}
