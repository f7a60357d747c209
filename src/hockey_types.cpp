#include "../include/hockey_types.h"
#include <sstream>
#include <stdexcept>

std::string to_string(Zone zone) {
  switch (zone) {
  case Zone::CREASE:
    return "crease";
  case Zone::INNER_SLOT:
    return "inner_slot";
  case Zone::SLOT:
    return "slot";
  case Zone::HIGH_SLOT:
    return "high_slot";
  case Zone::LEFT_CIRCLE:
    return "left_circle";
  case Zone::RIGHT_CIRCLE:
    return "right_circle";
  case Zone::LEFT_WING:
    return "left_wing";
  case Zone::RIGHT_WING:
    return "right_wing";
  case Zone::LEFT_POINT:
    return "left_point";
  case Zone::RIGHT_POINT:
    return "right_point";
  case Zone::BEHIND_NET:
    return "behind_net";
  case Zone::NEUTRAL_ZONE:
    return "neutral_zone";
  case Zone::PERIMETER:
    return "perimeter";
  }
  return "perimeter";
}

std::string to_string(ShotType type) {
  switch (type) {
  case ShotType::WRIST:
    return "wrist";
  case ShotType::SLAP:
    return "slap";
  case ShotType::SNAP:
    return "snap";
  case ShotType::BACKHAND:
    return "backhand";
  case ShotType::TIP_IN:
    return "tip_in";
  case ShotType::DEFLECTED:
    return "deflected";
  case ShotType::WRAP_AROUND:
    return "wrap_around";
  case ShotType::OTHER:
    return "other";
  }
  return "other";
}

std::string to_string(SeasonPhase phase) {
  switch (phase) {
  case SeasonPhase::EARLY:
    return "early_season";
  case SeasonPhase::MID:
    return "mid_season";
  case SeasonPhase::LATE:
    return "late_season";
  case SeasonPhase::PLAYOFFS:
    return "playoffs";
  }
  return "early_season";
}

std::string to_string(GamePhase phase) {
  switch (phase) {
  case GamePhase::EARLY:
    return "early_game";
  case GamePhase::MID:
    return "mid_game";
  case GamePhase::LATE:
    return "late_game";
  }
  return "early_game";
}

std::string to_string(SimSegment segment) {
  switch (segment) {
  case SimSegment::EARLY:
    return "early_game";
  case SimSegment::MID:
    return "mid_game";
  case SimSegment::LATE:
    return "late_game";
  case SimSegment::OVERTIME:
    return "overtime";
  }
  return "early_game";
}

std::string to_string(EntityKind kind) {
  switch (kind) {
  case EntityKind::PLAYER:
    return "player";
  case EntityKind::GOALIE:
    return "goalie";
  case EntityKind::LINE:
    return "line";
  case EntityKind::TEAM:
    return "team";
  }
  return "player";
}

Zone parse_zone(const std::string &name) {
  for (Zone z : ALL_ZONES) {
    if (to_string(z) == name)
      return z;
  }
  throw std::invalid_argument("unknown zone: " + name);
}

ShotType parse_shot_type(const std::string &name) {
  for (ShotType t : ALL_SHOT_TYPES) {
    if (to_string(t) == name)
      return t;
  }
  // Feed spellings seen in raw play-by-play
  if (name == "tip-in" || name == "tip")
    return ShotType::TIP_IN;
  if (name == "wrap-around")
    return ShotType::WRAP_AROUND;
  throw std::invalid_argument("unknown shot type: " + name);
}

GameType parse_game_type(const std::string &name) {
  if (name == "regular" || name == "R")
    return GameType::REGULAR;
  if (name == "playoff" || name == "P")
    return GameType::PLAYOFF;
  throw std::invalid_argument("unknown game type: " + name);
}

GamePhase game_phase_of(SimSegment segment) {
  switch (segment) {
  case SimSegment::EARLY:
    return GamePhase::EARLY;
  case SimSegment::MID:
    return GamePhase::MID;
  default:
    return GamePhase::LATE;
  }
}

int day_number(const std::string &date) {
  int y, m, d;
  char dash1, dash2;
  std::istringstream in(date);
  if (date.size() != 10 || !(in >> y >> dash1 >> m >> dash2 >> d) ||
      dash1 != '-' || dash2 != '-' || m < 1 || m > 12 || d < 1 || d > 31)
    throw std::invalid_argument("malformed date (want YYYY-MM-DD): " + date);

  // Days since 1970-01-01 in the proleptic Gregorian calendar.
  y -= m <= 2;
  int era = (y >= 0 ? y : y - 399) / 400;
  int yoe = y - era * 400;
  int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}
