#include "../include/zone_profile.h"
#include "../include/errors.h"
#include <algorithm>

bool ProfileScope::matches(const ShotEvent &event) const {
  if (event.season_id != season_id)
    return false;
  switch (kind) {
  case EntityKind::PLAYER:
    return event.shooter_id == entity_id;
  case EntityKind::GOALIE:
    return event.goalie_id == entity_id;
  case EntityKind::TEAM:
    return event.team_id == entity_id;
  case EntityKind::LINE:
    return std::find(members.begin(), members.end(), event.shooter_id) !=
           members.end();
  }
  return false;
}

ZoneProfile::ZoneProfile(EntityKind kind, int entity_id, int season_id)
    : entity_kind(kind), id(entity_id), season(season_id) {}

void ZoneProfile::record(Zone z, ShotType type, bool is_goal,
                         double expected_goal) {
  ZoneStats &stats = zones[index_of(z)];
  ShotTypeCount &cell = stats.by_type[index_of(type)];
  stats.shot_count++;
  cell.shots++;
  if (is_goal) {
    stats.goal_count++;
    cell.goals++;
  }
  stats.expected_goal_sum += expected_goal;
}

int ZoneProfile::total_shots() const {
  int total = 0;
  for (const auto &z : zones)
    total += z.shot_count;
  return total;
}

int ZoneProfile::total_goals() const {
  int total = 0;
  for (const auto &z : zones)
    total += z.goal_count;
  return total;
}

double ZoneProfile::total_expected_goals() const {
  double total = 0.0;
  for (const auto &z : zones)
    total += z.expected_goal_sum;
  return total;
}

double ZoneProfile::shot_share(Zone z) const {
  int total = total_shots();
  return total > 0 ? (double)zone(z).shot_count / total : 0.0;
}

double ZoneProfile::shot_type_share(Zone z, ShotType type) const {
  const ZoneStats &stats = zone(z);
  if (stats.shot_count == 0)
    return 0.0;
  return (double)stats.by_type[index_of(type)].shots / stats.shot_count;
}

int ZoneProfile::thin_zone_count(int min_events) const {
  int thin = 0;
  for (const auto &z : zones) {
    if (z.shot_count < min_events)
      thin++;
  }
  return thin;
}

ZoneClassifier::ZoneClassifier(const EngineConfig &config)
    : table(config.zone_table) {}

Zone ZoneClassifier::classify(double x, double y) const {
  // Shots at the far net are folded onto the attacking half.
  if (x < 0) {
    x = -x;
    y = -y;
  }
  for (const auto &rect : table) {
    if (rect.contains(x, y))
      return rect.zone;
  }
  return Zone::PERIMETER;
}

Zone ZoneClassifier::classify(const ShotEvent &event) const {
  if (!event.has_coordinates)
    return event.zone;
  return classify(event.x, event.y);
}

ZoneProfileBuilder::ZoneProfileBuilder(const EngineConfig &config)
    : config(config), classifier(config) {}

ZoneProfile ZoneProfileBuilder::build(const ProfileScope &scope,
                                      const std::vector<ShotEvent> &events) const {
  ZoneProfile profile(scope.kind, scope.entity_id, scope.season_id);

  bool season_seen = false;
  for (const auto &event : events) {
    if (event.season_id == scope.season_id)
      season_seen = true;
    if (!scope.matches(event))
      continue;
    Zone z = classifier.classify(event);
    profile.record(z, event.shot_type, event.is_goal,
                   config.baseline_rate(z, event.shot_type));
  }

  if (profile.total_shots() == 0) {
    ErrorPayload payload{scope.entity_id,
                         to_string(scope.kind) + "/season " +
                             std::to_string(scope.season_id),
                         ""};
    if (!season_seen) {
      payload.detail = "no shot events recorded for the season";
      throw InsufficientDataError(
          InsufficientDataError::Reason::UNKNOWN_SCOPE, payload);
    }
    payload.detail = "season has shot events but none for this entity";
    throw InsufficientDataError(InsufficientDataError::Reason::EMPTY_SCOPE,
                                payload);
  }
  return profile;
}
