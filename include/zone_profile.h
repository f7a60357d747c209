#ifndef ZONE_PROFILE_H
#define ZONE_PROFILE_H

#include "engine_config.h"
#include "hockey_types.h"
#include <array>
#include <vector>

// One shot attempt on goal as recorded by the data source.
struct ShotEvent {
  int game_id = 0;
  int season_id = 0;
  int period = 1;
  int period_seconds = 0; // elapsed in the period
  int shooter_id = -1;
  int goalie_id = -1; // -1 for an empty net
  int team_id = -1;
  int opponent_id = -1;
  std::vector<int> assist_ids;

  bool has_coordinates = true;
  double x = 0.0;
  double y = 0.0;
  Zone zone = Zone::PERIMETER; // used when has_coordinates is false

  ShotType shot_type = ShotType::WRIST;
  bool is_goal = false;
};

// Whose events a profile aggregates. Line members are supplied, not inferred.
struct ProfileScope {
  EntityKind kind = EntityKind::PLAYER;
  int entity_id = -1;
  int season_id = 0;
  std::vector<int> members;

  bool matches(const ShotEvent &event) const;
};

struct ShotTypeCount {
  int shots = 0;
  int goals = 0;
};

struct ZoneStats {
  int shot_count = 0;
  int goal_count = 0;
  double expected_goal_sum = 0.0;
  std::array<ShotTypeCount, NUM_SHOT_TYPES> by_type{};

  double goal_rate() const {
    return shot_count > 0 ? (double)goal_count / shot_count : 0.0;
  }
  double expected_goal_rate() const {
    return shot_count > 0 ? expected_goal_sum / shot_count : 0.0;
  }
};

class ZoneProfile {
public:
  ZoneProfile(EntityKind kind, int entity_id, int season_id);

  void record(Zone zone, ShotType type, bool is_goal, double expected_goal);

  const ZoneStats &zone(Zone z) const { return zones[index_of(z)]; }

  EntityKind kind() const { return entity_kind; }
  int entity_id() const { return id; }
  int season_id() const { return season; }

  int total_shots() const;
  int total_goals() const;
  double total_expected_goals() const;

  double goal_rate(Zone z) const { return zone(z).goal_rate(); }
  // Fraction of all shots taken from z; 0 for an empty profile.
  double shot_share(Zone z) const;
  // Fraction of z's shots of the given type.
  double shot_type_share(Zone z, ShotType type) const;

  // Number of zones holding fewer shots than min_events.
  int thin_zone_count(int min_events) const;

private:
  EntityKind entity_kind;
  int id;
  int season;
  std::array<ZoneStats, NUM_ZONES> zones{};
};

class ZoneClassifier {
public:
  explicit ZoneClassifier(const EngineConfig &config);

  Zone classify(double x, double y) const;
  Zone classify(const ShotEvent &event) const;

private:
  const std::vector<ZoneRect> &table;
};

class ZoneProfileBuilder {
public:
  explicit ZoneProfileBuilder(const EngineConfig &config);

  // events may span many entities and seasons; only the scope's are used.
  // Throws InsufficientDataError when the scope yields no events.
  ZoneProfile build(const ProfileScope &scope,
                    const std::vector<ShotEvent> &events) const;

private:
  const EngineConfig &config;
  ZoneClassifier classifier;
};

#endif
