#ifndef HOCKEY_TYPES_H
#define HOCKEY_TYPES_H

#include <array>
#include <string>

// Ice regions, ordered by the default classification table.
enum class Zone {
  CREASE,
  INNER_SLOT,
  SLOT,
  HIGH_SLOT,
  LEFT_CIRCLE,
  RIGHT_CIRCLE,
  LEFT_WING,
  RIGHT_WING,
  LEFT_POINT,
  RIGHT_POINT,
  BEHIND_NET,
  NEUTRAL_ZONE,
  PERIMETER
};

enum class ShotType {
  WRIST,
  SLAP,
  SNAP,
  BACKHAND,
  TIP_IN,
  DEFLECTED,
  WRAP_AROUND,
  OTHER
};

enum class SeasonPhase { EARLY, MID, LATE, PLAYOFFS };

enum class GamePhase { EARLY, MID, LATE };

// Simulation segments: the three regulation phases plus overtime.
enum class SimSegment { EARLY, MID, LATE, OVERTIME };

enum class EntityKind { PLAYER, GOALIE, LINE, TEAM };

enum class GameType { REGULAR, PLAYOFF };

constexpr int NUM_ZONES = 13;
constexpr int NUM_SHOT_TYPES = 8;
constexpr int NUM_SEASON_PHASES = 4;
constexpr int NUM_GAME_PHASES = 3;
constexpr int NUM_SIM_SEGMENTS = 4;

constexpr std::array<Zone, NUM_ZONES> ALL_ZONES = {
    Zone::CREASE,     Zone::INNER_SLOT,   Zone::SLOT,        Zone::HIGH_SLOT,
    Zone::LEFT_CIRCLE, Zone::RIGHT_CIRCLE, Zone::LEFT_WING,  Zone::RIGHT_WING,
    Zone::LEFT_POINT, Zone::RIGHT_POINT,  Zone::BEHIND_NET, Zone::NEUTRAL_ZONE,
    Zone::PERIMETER};

constexpr std::array<ShotType, NUM_SHOT_TYPES> ALL_SHOT_TYPES = {
    ShotType::WRIST,   ShotType::SLAP,      ShotType::SNAP,
    ShotType::BACKHAND, ShotType::TIP_IN,   ShotType::DEFLECTED,
    ShotType::WRAP_AROUND, ShotType::OTHER};

constexpr std::array<SeasonPhase, NUM_SEASON_PHASES> ALL_SEASON_PHASES = {
    SeasonPhase::EARLY, SeasonPhase::MID, SeasonPhase::LATE,
    SeasonPhase::PLAYOFFS};

constexpr std::array<GamePhase, NUM_GAME_PHASES> ALL_GAME_PHASES = {
    GamePhase::EARLY, GamePhase::MID, GamePhase::LATE};

inline int index_of(Zone z) { return static_cast<int>(z); }
inline int index_of(ShotType t) { return static_cast<int>(t); }
inline int index_of(SeasonPhase p) { return static_cast<int>(p); }
inline int index_of(GamePhase p) { return static_cast<int>(p); }
inline int index_of(SimSegment s) { return static_cast<int>(s); }

std::string to_string(Zone zone);
std::string to_string(ShotType type);
std::string to_string(SeasonPhase phase);
std::string to_string(GamePhase phase);
std::string to_string(SimSegment segment);
std::string to_string(EntityKind kind);

// Parsers throw std::invalid_argument on unknown names.
Zone parse_zone(const std::string &name);
ShotType parse_shot_type(const std::string &name);
GameType parse_game_type(const std::string &name);

// Overtime is profiled as part of the late phase.
GamePhase game_phase_of(SimSegment segment);

// Day count for a YYYY-MM-DD date; throws std::invalid_argument.
int day_number(const std::string &date);

#endif
