#include "../include/data_source.h"
#include "../include/errors.h"
#include "../include/logging.h"
#include <fstream>
#include <json/json.h>

namespace {

template <typename Record>
std::vector<Record> for_season(const std::vector<Record> &records,
                               int season_id) {
  std::vector<Record> out;
  for (const auto &r : records) {
    if (r.season_id == season_id)
      out.push_back(r);
  }
  return out;
}

std::vector<int> id_list(const Json::Value &arr) {
  std::vector<int> ids;
  for (const auto &v : arr)
    ids.push_back(v.asInt());
  return ids;
}

GameInfo parse_game(const Json::Value &g) {
  GameInfo game;
  game.game_id = g["game_id"].asInt();
  game.season_id = g["season"].asInt();
  game.date = g["date"].asString();
  game.type = parse_game_type(g.get("type", "regular").asString());
  game.home_team = g["home"].asInt();
  game.away_team = g["away"].asInt();
  game.home_score = g.get("home_score", 0).asInt();
  game.away_score = g.get("away_score", 0).asInt();
  game.decided_in_overtime = g.get("overtime", false).asBool();
  day_number(game.date); // rejects malformed dates
  return game;
}

ShotEvent parse_shot(const Json::Value &s) {
  ShotEvent shot;
  shot.game_id = s["game_id"].asInt();
  shot.season_id = s["season"].asInt();
  shot.period = s.get("period", 1).asInt();
  shot.period_seconds = s.get("time", 0).asInt();
  shot.shooter_id = s["shooter"].asInt();
  shot.goalie_id = s.get("goalie", -1).asInt();
  shot.team_id = s["team"].asInt();
  shot.opponent_id = s["opponent"].asInt();
  shot.assist_ids = id_list(s["assists"]);
  if (s.isMember("x") && s.isMember("y")) {
    shot.x = s["x"].asDouble();
    shot.y = s["y"].asDouble();
  } else {
    shot.has_coordinates = false;
    shot.zone = parse_zone(s.get("zone", "perimeter").asString());
  }
  shot.shot_type = parse_shot_type(s.get("type", "wrist").asString());
  shot.is_goal = s.get("goal", false).asBool();
  return shot;
}

GameLine parse_line(const Json::Value &l) {
  GameLine line;
  line.game_id = l["game_id"].asInt();
  line.season_id = l["season"].asInt();
  line.date = l["date"].asString();
  line.entity_id = l["player"].asInt();
  line.team_id = l["team"].asInt();
  line.opponent_id = l["opponent"].asInt();
  line.is_goalie = l.get("goalie", false).asBool();
  line.goals = l.get("goals", 0).asInt();
  line.assists = l.get("assists", 0).asInt();
  line.shots = l.get("shots", 0).asInt();
  line.shots_against = l.get("shots_against", 0).asInt();
  line.goals_against = l.get("goals_against", 0).asInt();
  line.toi_seconds = l.get("toi", 0).asInt();
  return line;
}

} // namespace

std::vector<GameInfo> InMemoryDataSource::games(int season_id) const {
  return for_season(game_list, season_id);
}

std::vector<ShotEvent> InMemoryDataSource::shot_events(int season_id) const {
  return for_season(shots, season_id);
}

std::vector<GameLine> InMemoryDataSource::game_lines(int season_id) const {
  return for_season(lines, season_id);
}

std::vector<SharedIceRecord>
InMemoryDataSource::shared_ice(int season_id) const {
  return for_season(shared, season_id);
}

std::map<int, OnIceRate> InMemoryDataSource::on_ice_rates(int season_id) const {
  auto it = rates.find(season_id);
  return it == rates.end() ? std::map<int, OnIceRate>{} : it->second;
}

TeamRoster InMemoryDataSource::roster(int team_id, int season_id) const {
  auto it = rosters.find({team_id, season_id});
  if (it == rosters.end())
    throw InsufficientDataError(
        InsufficientDataError::Reason::UNKNOWN_SCOPE,
        {team_id, "roster/season " + std::to_string(season_id),
         "no roster recorded for this team"});
  return it->second;
}

InMemoryDataSource data_source_from_json(const Json::Value &root) {
  InMemoryDataSource source;
  std::string section;
  try {
    section = "games";
    for (const auto &g : root["games"])
      source.add_game(parse_game(g));
    section = "shots";
    for (const auto &s : root["shots"])
      source.add_shot(parse_shot(s));
    section = "game_lines";
    for (const auto &l : root["game_lines"])
      source.add_game_line(parse_line(l));

    section = "shared_ice";
    for (const auto &r : root["shared_ice"]) {
      SharedIceRecord rec;
      rec.player_a = r["a"].asInt();
      rec.player_b = r["b"].asInt();
      rec.season_id = r["season"].asInt();
      rec.shared_toi_seconds = r["toi"].asInt();
      rec.goals_for = r.get("goals_for", 0).asInt();
      rec.shots_for = r.get("shots_for", 0).asInt();
      source.add_shared_ice(rec);
    }

    section = "on_ice";
    for (const auto &r : root["on_ice"]) {
      OnIceRate rate;
      rate.player_id = r["player"].asInt();
      rate.toi_seconds = r["toi"].asInt();
      rate.goals_for = r.get("goals_for", 0).asInt();
      source.add_on_ice_rate(r["season"].asInt(), rate);
    }

    section = "rosters";
    for (const auto &r : root["rosters"]) {
      TeamRoster roster;
      roster.team_id = r["team"].asInt();
      roster.season_id = r["season"].asInt();
      roster.starting_goalie = r.get("goalie", -1).asInt();
      for (const auto &l : r["lines"])
        roster.lines.push_back({id_list(l["members"]), l["toi_share"].asDouble()});
      source.set_roster(roster);
    }
  } catch (const std::invalid_argument &e) {
    throw ConfigurationError(ErrorPayload{-1, "fixture." + section, e.what()});
  } catch (const Json::Exception &e) {
    throw ConfigurationError(ErrorPayload{-1, "fixture." + section, e.what()});
  }
  return source;
}

InMemoryDataSource load_fixture(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigurationError(
        ErrorPayload{-1, path, "cannot open data fixture"});

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, in, &root, &errors))
    throw ConfigurationError(ErrorPayload{-1, path, "invalid JSON: " + errors});

  InMemoryDataSource source = data_source_from_json(root);
  log_message(LogLevel::INFO, "DATA", "loaded fixture " + path);
  return source;
}
