#ifndef ADJUSTMENTS_H
#define ADJUSTMENTS_H

#include "engine_config.h"
#include "segment_profile.h"
#include <string>
#include <vector>

// Multipliers centred at 1.0, applied in this order by the resolver.
struct AdjustmentSet {
  double synergy = 1.0;
  double clutch = 1.0; // only active in the late phase
  double fatigue = 1.0;
  double momentum = 1.0;

  AdjustmentSet in_phase(GamePhase phase) const {
    AdjustmentSet out = *this;
    if (phase != GamePhase::LATE)
      out.clutch = 1.0;
    return out;
  }
  double product() const { return synergy * clutch * fatigue * momentum; }
};

struct ScheduleContext {
  int team_id = -1;
  std::string game_date;
  int days_rest = -1; // -1 when the team has no earlier game
  bool back_to_back = false;
  int games_in_window = 1; // includes the game itself
  int win_streak = 0;
  int loss_streak = 0;
};

enum class MomentumState { HOT, NEUTRAL, COLD };

std::string to_string(MomentumState state);

struct MomentumAnalysis {
  int entity_id = -1;
  std::string as_of_date;
  int games_in_window = 0;

  double recent_ppg = 0.0;
  double recent_shooting_pct = 0.0;
  double season_ppg = 0.0;
  double season_shooting_pct = 0.0;
  double ppg_deviation = 0.0; // relative to the season value
  double shooting_deviation = 0.0;

  MomentumState state = MomentumState::NEUTRAL;
  double score = 0.0;      // -1 to 1
  double confidence = 0.0; // 0 to 1
};

class ContextAdjustmentCalculator {
public:
  explicit ContextAdjustmentCalculator(const EngineConfig &config);

  // Late-game scoring against the entity's own per-phase average.
  double clutch(const SegmentProfile &profile) const;

  ScheduleContext schedule_context(int team_id, const std::string &game_date,
                                   const std::vector<GameInfo> &games) const;
  double fatigue(const ScheduleContext &schedule) const;

  // game_log in date order; only games before as_of_date count.
  MomentumAnalysis momentum(int entity_id, const std::vector<GameLine> &game_log,
                            const std::string &as_of_date) const;
  double momentum_modifier(const MomentumAnalysis &analysis) const;

  AdjustmentSet compute(const SegmentProfile &profile,
                        const ScheduleContext &schedule,
                        const MomentumAnalysis &analysis,
                        double synergy_multiplier) const;

private:
  const AdjustmentParams &params;
};

#endif
