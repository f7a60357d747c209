#ifndef DATA_SOURCE_H
#define DATA_SOURCE_H

#include "segment_profile.h"
#include "synergy.h"
#include "zone_profile.h"
#include <map>
#include <string>
#include <vector>

namespace Json {
class Value;
}

struct LineAssignment {
  std::vector<int> members;
  double toi_share = 0.0;
};

// Who dresses for a team. Lines are supplied as-is.
struct TeamRoster {
  int team_id = -1;
  int season_id = 0;
  int starting_goalie = -1;
  std::vector<LineAssignment> lines;
};

// Read-only query surface over stored history.
class HistoricalDataSource {
public:
  virtual ~HistoricalDataSource() = default;

  virtual std::vector<GameInfo> games(int season_id) const = 0;
  virtual std::vector<ShotEvent> shot_events(int season_id) const = 0;
  virtual std::vector<GameLine> game_lines(int season_id) const = 0;
  virtual std::vector<SharedIceRecord> shared_ice(int season_id) const = 0;
  virtual std::map<int, OnIceRate> on_ice_rates(int season_id) const = 0;
  // Throws InsufficientDataError when the team has no roster that season.
  virtual TeamRoster roster(int team_id, int season_id) const = 0;
};

class InMemoryDataSource : public HistoricalDataSource {
public:
  void add_game(const GameInfo &game) { game_list.push_back(game); }
  void add_shot(const ShotEvent &shot) { shots.push_back(shot); }
  void add_game_line(const GameLine &line) { lines.push_back(line); }
  void add_shared_ice(const SharedIceRecord &r) { shared.push_back(r); }
  void add_on_ice_rate(int season_id, const OnIceRate &rate) {
    rates[season_id][rate.player_id] = rate;
  }
  void set_roster(const TeamRoster &r) { rosters[{r.team_id, r.season_id}] = r; }

  std::vector<GameInfo> games(int season_id) const override;
  std::vector<ShotEvent> shot_events(int season_id) const override;
  std::vector<GameLine> game_lines(int season_id) const override;
  std::vector<SharedIceRecord> shared_ice(int season_id) const override;
  std::map<int, OnIceRate> on_ice_rates(int season_id) const override;
  TeamRoster roster(int team_id, int season_id) const override;

private:
  std::vector<GameInfo> game_list;
  std::vector<ShotEvent> shots;
  std::vector<GameLine> lines;
  std::vector<SharedIceRecord> shared;
  std::map<int, std::map<int, OnIceRate>> rates;
  std::map<std::pair<int, int>, TeamRoster> rosters;
};

// Fixture documents: games, shots, game_lines, shared_ice, on_ice, rosters.
// Malformed documents throw ConfigurationError.
InMemoryDataSource data_source_from_json(const Json::Value &root);
InMemoryDataSource load_fixture(const std::string &path);

#endif
