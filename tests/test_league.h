#ifndef TEST_LEAGUE_H
#define TEST_LEAGUE_H

#include "data_source.h"
#include "simulation/game_simulator.h"
#include <cstdio>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

// Deterministic synthetic league. Every team dresses two lines of three
// skaters and one goalie; box-score rows are derived from the generated
// shots, so segment profiles reconcile exactly.
struct LeagueSpec {
  int season_id = 2024;
  std::vector<int> teams = {1, 2, 3};
  int rounds = 8; // each round plays every pairing once
  int playoff_games = 0;
  unsigned seed = 7;
  int shots_per_skater = 3;
  std::map<int, double> finishing = {{1, 0.14}}; // per-team goal chance
  double default_finishing = 0.09;
};

inline int skater_id(int team, int line, int slot) {
  return team * 100 + 10 * (line + 1) + slot + 1;
}

inline int goalie_id(int team) { return team * 100 + 1; }

// Calendar days counted from 2024-10-01.
inline std::string league_date(int offset) {
  static const int month_days[] = {31, 30, 31, 31, 28, 31, 30, 31, 30};
  int year = 2024;
  int month = 10;
  int m = 0;
  while (offset >= month_days[m]) {
    offset -= month_days[m];
    m = (m + 1) % 9;
    if (++month > 12) {
      month = 1;
      year++;
    }
  }
  char buf[16];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, offset + 1);
  return buf;
}

inline TeamRoster league_roster(int team, int season_id) {
  TeamRoster r;
  r.team_id = team;
  r.season_id = season_id;
  r.starting_goalie = goalie_id(team);
  for (int line = 0; line < 2; ++line) {
    LineAssignment a;
    for (int slot = 0; slot < 3; ++slot)
      a.members.push_back(skater_id(team, line, slot));
    a.toi_share = line == 0 ? 0.55 : 0.45;
    r.lines.push_back(a);
  }
  return r;
}

inline InMemoryDataSource build_league(const LeagueSpec &spec = LeagueSpec()) {
  static const std::pair<double, double> spots[] = {
      {86, 0}, {80, 3}, {72, 15}, {60, 0}, {60, -20}, {60, 20}, {40, -30},
      {40, 30}};
  static const ShotType types[] = {ShotType::WRIST, ShotType::SLAP,
                                   ShotType::SNAP, ShotType::BACKHAND};

  InMemoryDataSource source;
  std::mt19937 gen(spec.seed);

  std::vector<std::pair<int, int>> pairings;
  for (size_t i = 0; i < spec.teams.size(); ++i)
    for (size_t j = i + 1; j < spec.teams.size(); ++j)
      pairings.push_back({spec.teams[i], spec.teams[j]});

  std::map<std::pair<int, int>, SharedIceRecord> shared;
  std::map<int, OnIceRate> on_ice;

  int total_games = spec.rounds * (int)pairings.size() + spec.playoff_games;
  for (int g = 0; g < total_games; ++g) {
    auto pairing = pairings[g % pairings.size()];
    bool flip = (g / pairings.size()) % 2 == 1;
    GameInfo game;
    game.game_id = spec.season_id * 1000 + g + 1;
    game.season_id = spec.season_id;
    game.date = league_date(g);
    game.type = g >= spec.rounds * (int)pairings.size() ? GameType::PLAYOFF
                                                         : GameType::REGULAR;
    game.home_team = flip ? pairing.second : pairing.first;
    game.away_team = flip ? pairing.first : pairing.second;

    std::map<int, int> team_goals;
    for (int side = 0; side < 2; ++side) {
      int team = side == 0 ? game.home_team : game.away_team;
      int opponent = side == 0 ? game.away_team : game.home_team;
      auto f = spec.finishing.find(team);
      double finishing =
          f == spec.finishing.end() ? spec.default_finishing : f->second;

      std::map<int, GameLine> rows;
      int shots_against = 0;
      int goals_against = 0;
      TeamRoster roster = league_roster(team, spec.season_id);
      for (int line = 0; line < 2; ++line) {
        const auto &members = roster.lines[line].members;
        int line_goals = 0;
        for (int slot = 0; slot < 3; ++slot) {
          int shooter = members[slot];
          GameLine &row = rows[shooter];
          for (int s = 0; s < spec.shots_per_skater; ++s) {
            ShotEvent e;
            e.game_id = game.game_id;
            e.season_id = spec.season_id;
            e.period = 1 + (int)(gen() % 3);
            e.period_seconds = (int)(gen() % 1200);
            e.shooter_id = shooter;
            e.goalie_id = goalie_id(opponent);
            e.team_id = team;
            e.opponent_id = opponent;
            auto spot = spots[gen() % 8];
            e.x = (gen() % 2 == 0) ? spot.first : -spot.first;
            e.y = e.x < 0 ? -spot.second : spot.second;
            e.shot_type = types[gen() % 4];
            e.is_goal = (gen() % 1000) < (unsigned)(finishing * 1000);
            row.shots++;
            shots_against++;
            if (e.is_goal) {
              int helper = members[(slot + 1) % 3];
              e.assist_ids.push_back(helper);
              row.goals++;
              rows[helper].assists++;
              goals_against++;
              line_goals++;
            }
            source.add_shot(e);
          }
        }
        int toi = (int)(roster.lines[line].toi_share * 3600);
        for (size_t a = 0; a < members.size(); ++a) {
          OnIceRate &r = on_ice[members[a]];
          r.player_id = members[a];
          r.toi_seconds += toi;
          r.goals_for += line_goals;
          for (size_t b = a + 1; b < members.size(); ++b) {
            SharedIceRecord &rec = shared[{members[a], members[b]}];
            rec.player_a = members[a];
            rec.player_b = members[b];
            rec.season_id = spec.season_id;
            rec.shared_toi_seconds += toi;
            rec.goals_for += line_goals;
          }
        }
        for (int id : members)
          rows[id].toi_seconds = toi;
      }

      for (auto &entry : rows) {
        GameLine row = entry.second;
        row.game_id = game.game_id;
        row.season_id = spec.season_id;
        row.date = game.date;
        row.entity_id = entry.first;
        row.team_id = team;
        row.opponent_id = opponent;
        source.add_game_line(row);
        team_goals[team] += row.goals;
      }

      // The opposing goalie faced these shots.
      GameLine keeper;
      keeper.game_id = game.game_id;
      keeper.season_id = spec.season_id;
      keeper.date = game.date;
      keeper.entity_id = goalie_id(opponent);
      keeper.team_id = opponent;
      keeper.opponent_id = team;
      keeper.is_goalie = true;
      keeper.shots_against = shots_against;
      keeper.goals_against = goals_against;
      keeper.toi_seconds = 3600;
      source.add_game_line(keeper);
    }

    game.home_score = team_goals[game.home_team];
    game.away_score = team_goals[game.away_team];
    source.add_game(game);
  }

  for (const auto &entry : shared)
    source.add_shared_ice(entry.second);
  for (const auto &entry : on_ice)
    source.add_on_ice_rate(spec.season_id, entry.second);
  for (int team : spec.teams)
    source.set_roster(league_roster(team, spec.season_id));
  return source;
}

// Hand-built simulation input: two lines of three identical shooters who
// only shoot wristers from the slot.
inline TeamSimulationInput flat_team(int team_id, double goal_rate,
                                     double shots_per_60 = 30.0) {
  TeamSimulationInput t;
  t.team_id = team_id;
  for (int line = 0; line < 2; ++line) {
    LineInput l;
    l.toi_share = 0.5;
    for (int slot = 0; slot < 3; ++slot) {
      int id = skater_id(team_id, line, slot);
      l.members.push_back(id);
      ShooterProfile p;
      p.player_id = id;
      for (auto &row : p.goal_rate)
        row.fill(goal_rate);
      p.zone_share[index_of(Zone::SLOT)] = 1.0;
      p.type_share[index_of(Zone::SLOT)][index_of(ShotType::WRIST)] = 1.0;
      p.shots_per_game = 3.0;
      p.total_shots = 200;
      t.skaters[id] = p;
    }
    t.lines.push_back(l);
  }
  t.shots_for_per_60 = shots_per_60;
  t.shots_against_per_60 = shots_per_60;
  return t;
}

#endif
