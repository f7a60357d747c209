#include "../include/game_predictor.h"
#include "../include/errors.h"
#include "../include/logging.h"
#include "../include/stat_line.h"
#include <iomanip>
#include <set>
#include <sstream>

const EntityProfiles *ProfileCache::find(const Key &key) const {
  auto it = entries.find(key);
  if (it == entries.end()) {
    miss_count++;
    return nullptr;
  }
  hit_count++;
  return &it->second;
}

const EntityProfiles &ProfileCache::store(const Key &key,
                                          EntityProfiles profiles) {
  entries.erase(key);
  return entries.emplace(key, std::move(profiles)).first->second;
}

void ProfileCache::invalidate_entity(int entity_id) {
  for (auto it = entries.begin(); it != entries.end();) {
    if (std::get<0>(it->first) == entity_id ||
        std::get<2>(it->first) == entity_id)
      it = entries.erase(it);
    else
      ++it;
  }
}

void ProfileCache::invalidate_season(int season_id) {
  for (auto it = entries.begin(); it != entries.end();) {
    if (std::get<1>(it->first) == season_id)
      it = entries.erase(it);
    else
      ++it;
  }
}

GamePredictor::GamePredictor(const EngineConfig &config,
                             const HistoricalDataSource &source)
    : config(config), source(source), zone_builder(config),
      segment_builder(config), matchup_engine(config),
      adjustment_calculator(config), synergy_calculator(config),
      profile_resolver(config), engine(config) {
  config.validate();
}

GamePredictor::SeasonData GamePredictor::load_season(int season_id) const {
  return {source.games(season_id), source.shot_events(season_id),
          source.game_lines(season_id)};
}

SeasonPhase GamePredictor::season_phase_on(int season_id,
                                           const std::string &date) const {
  std::vector<GameInfo> games = source.games(season_id);
  SeasonPhaseMapping mapping(season_id, games);
  if (mapping.empty())
    throw InsufficientDataError(
        InsufficientDataError::Reason::UNKNOWN_SCOPE,
        {-1, "season " + std::to_string(season_id), "no games recorded"});

  int day = day_number(date);
  const GameInfo *latest = nullptr;
  for (const auto &g : games) {
    if (day_number(g.date) > day)
      continue;
    if (!latest || g.date > latest->date ||
        (g.date == latest->date && g.game_id > latest->game_id))
      latest = &g;
  }
  return latest ? mapping.phase_of(latest->game_id) : SeasonPhase::EARLY;
}

const EntityProfiles &GamePredictor::profiles_for(const ProfileScope &scope,
                                                  int opponent_id, bool goalie,
                                                  const SeasonData &data) {
  ProfileCache::Key key{scope.entity_id, scope.season_id, opponent_id};
  if (const EntityProfiles *hit = cache.find(key))
    return *hit;

  ZoneProfile zones = zone_builder.build(scope, data.shots);
  SegmentProfile segments =
      segment_builder.build(scope, data.games, data.shots, data.lines);

  std::vector<GameLine> all =
      StatLineBuilder::select(data.lines, scope.entity_id, scope.season_id);
  std::optional<StatLine> general;
  if (!all.empty())
    general = StatLineBuilder::build(goalie, all);
  StatLine versus = StatLineBuilder::build(
      goalie, StatLineBuilder::select(data.lines, scope.entity_id,
                                      scope.season_id, opponent_id));

  MatchupProfile matchup = matchup_engine.evaluate(
      scope.entity_id, opponent_id, scope.season_id, general, versus);

  return cache.store(key, EntityProfiles{std::move(zones), std::move(segments),
                                         std::move(matchup)});
}

void GamePredictor::record_quality(const EntityProfiles &p,
                                   DataQualityReport &quality) const {
  quality.entities++;
  if (p.zones.total_shots() < config.resolver.min_zone_events) {
    quality.thin_zone_entities++;
    quality.notes.push_back(to_string(p.zones.kind()) + " " +
                            std::to_string(p.zones.entity_id()) + " has only " +
                            std::to_string(p.zones.total_shots()) +
                            " shot events");
  }
  if (p.matchup.sample_size < config.matchup.min_sample)
    quality.low_matchup_entities++;
  if (p.segments && !p.segments->is_reconciled()) {
    quality.entities_with_warnings++;
    quality.reconciliation_warnings += (int)p.segments->warnings().size();
  }
}

TeamSimulationInput GamePredictor::prepare_team(int team_id, int opponent_id,
                                                const SimulationConfig &sim,
                                                DataQualityReport &quality) {
  SeasonData data = load_season(sim.season_id);
  TeamRoster roster = source.roster(team_id, sim.season_id);
  if (roster.lines.empty())
    throw InsufficientDataError(
        InsufficientDataError::Reason::EMPTY_SCOPE,
        {team_id, "roster/season " + std::to_string(sim.season_id),
         "roster has no lines"});

  SeasonPhase phase = season_phase_on(sim.season_id, sim.game_date);
  SynergyMatrix synergy = synergy_calculator.build(
      source.shared_ice(sim.season_id), source.on_ice_rates(sim.season_id));
  ScheduleContext schedule = adjustment_calculator.schedule_context(
      team_id, sim.game_date, data.games);

  TeamSimulationInput input;
  input.team_id = team_id;

  for (const auto &assignment : roster.lines) {
    LineInput line;
    line.members = assignment.members;
    line.toi_share = assignment.toi_share;
    line.synergy_score = synergy.line_score(assignment.members);
    input.lines.push_back(line);
    double multiplier = synergy_calculator.multiplier(line.synergy_score);

    for (int player : assignment.members) {
      if (input.skaters.count(player))
        continue;
      ProfileScope scope{EntityKind::PLAYER, player, sim.season_id, {}};
      const EntityProfiles &p = profiles_for(scope, opponent_id, false, data);
      record_quality(p, quality);
      input.skaters[player] = profile_resolver.shooter(
          p.zones, p.matchup, p.segments ? &*p.segments : nullptr, phase);

      MomentumAnalysis momentum = adjustment_calculator.momentum(
          player, StatLineBuilder::select(data.lines, player, sim.season_id),
          sim.game_date);
      AdjustmentSet adj;
      if (p.segments)
        adj = adjustment_calculator.compute(*p.segments, schedule, momentum,
                                            multiplier);
      if (!sim.use_synergy)
        adj.synergy = 1.0;
      if (!sim.use_clutch)
        adj.clutch = 1.0;
      if (!sim.use_fatigue)
        adj.fatigue = 1.0;
      if (!sim.use_momentum)
        adj.momentum = 1.0;
      input.adjustments[player] = adj;
    }
  }

  if (roster.starting_goalie >= 0) {
    ProfileScope scope{EntityKind::GOALIE, roster.starting_goalie,
                       sim.season_id, {}};
    const EntityProfiles &p = profiles_for(scope, opponent_id, true, data);
    record_quality(p, quality);
    input.goalie = profile_resolver.goalie(p.zones, p.matchup);
    input.has_goalie = true;
  } else {
    quality.notes.push_back("team " + std::to_string(team_id) +
                            " has no starting goalie; using league average");
  }

  // Team pace from the box-score rows.
  std::set<int> games_played;
  int shots_for = 0;
  int shots_against = 0;
  for (const auto &l : data.lines) {
    if (l.team_id != team_id)
      continue;
    games_played.insert(l.game_id);
    shots_for += l.shots;
    shots_against += l.shots_against;
  }
  if (games_played.empty())
    throw InsufficientDataError(
        InsufficientDataError::Reason::EMPTY_SCOPE,
        {team_id, "team/season " + std::to_string(sim.season_id),
         "no box-score rows for this team"});
  double games = (double)games_played.size();
  input.shots_for_per_60 = shots_for / games;
  input.shots_against_per_60 = shots_against / games;
  if (shots_against == 0) {
    input.shots_against_per_60 = config.simulation.league_shots_per_60;
    quality.notes.push_back("team " + std::to_string(team_id) +
                            " has no goalie rows; league shot pace assumed");
  }
  return input;
}

SimulationResult
GamePredictor::predict(const SimulationConfig &sim,
                       MonteCarloEngine::ProgressCallback progress) {
  sim.validate();
  log_message(LogLevel::INFO, "PREDICTOR",
              "Predicting team " + std::to_string(sim.home_team) +
                  " vs team " + std::to_string(sim.away_team) + " on " +
                  sim.game_date);

  DataQualityReport quality;
  TeamSimulationInput home =
      prepare_team(sim.home_team, sim.away_team, sim, quality);
  TeamSimulationInput away =
      prepare_team(sim.away_team, sim.home_team, sim, quality);

  TrialBatch batch = engine.run(home, away, sim, std::move(progress));
  SimulationResult result = aggregator.aggregate(std::move(batch), sim, quality);

  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << "Home "
     << result.win_probability_home() * 100.0 << "% | Away "
     << result.win_probability_away() * 100.0 << "% | Confidence "
     << std::setprecision(2) << result.confidence_score();
  log_message(LogLevel::INFO, "PREDICTOR", ss.str());
  return result;
}

SeriesResult GamePredictor::predict_series(const SimulationConfig &sim,
                                           const SeriesConfig &series) {
  sim.validate();
  series.validate();

  DataQualityReport quality;
  TeamSimulationInput home =
      prepare_team(sim.home_team, sim.away_team, sim, quality);
  TeamSimulationInput away =
      prepare_team(sim.away_team, sim.home_team, sim, quality);
  return engine.run_series(home, away, sim, series);
}
