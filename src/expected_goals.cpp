#include "../include/expected_goals.h"
#include <algorithm>
#include <cmath>

namespace {

constexpr double PHASE_FACTOR_BOUND = 0.15;
// Fewer shots than this in a season phase falls back to the full season.
constexpr int MIN_PHASE_SHOTS = 30;

double shrink(int goals, int shots, double baseline, double prior) {
  return (goals + prior * baseline) / (shots + prior);
}

// Ratio of blended to general value, 1 when the general value is empty.
double blend_ratio(const MatchupProfile &m, double general, double matchup) {
  if (general <= 0.0)
    return 1.0;
  return MatchupWeightingEngine::blend(m, general, matchup) / general;
}

std::array<double, NUM_GAME_PHASES> phase_factors(const SegmentStats &early,
                                                  const SegmentStats &mid,
                                                  const SegmentStats &late) {
  std::array<double, NUM_GAME_PHASES> out{1.0, 1.0, 1.0};
  int total = early.shots + mid.shots + late.shots;
  if (total == 0)
    return out;
  double even = total / (double)NUM_GAME_PHASES;
  const SegmentStats *cells[] = {&early, &mid, &late};
  for (int i = 0; i < NUM_GAME_PHASES; ++i)
    out[i] = std::clamp(cells[i]->shots / even, 1.0 - PHASE_FACTOR_BOUND,
                        1.0 + PHASE_FACTOR_BOUND);
  return out;
}

} // namespace

ProfileResolver::ProfileResolver(const EngineConfig &config) : config(config) {}

ShooterProfile ProfileResolver::shooter(const ZoneProfile &zones,
                                        const MatchupProfile &matchup,
                                        const SegmentProfile *segments,
                                        SeasonPhase season_phase) const {
  ShooterProfile p;
  p.player_id = zones.entity_id();
  p.total_shots = zones.total_shots();
  p.thin_zones = zones.thin_zone_count(config.resolver.min_zone_events);
  p.matchup_weight = matchup.matchup_weight;
  p.matchup_sample = matchup.sample_size;

  double finishing = 1.0;
  double shots_per_game = 0.0;
  if (const auto *g = std::get_if<SkaterStatLine>(&matchup.general)) {
    const auto &m = std::get<SkaterStatLine>(matchup.matchup);
    finishing =
        blend_ratio(matchup, g->shooting_percentage, m.shooting_percentage);
    shots_per_game = MatchupWeightingEngine::blend(matchup, g->shots_per_game,
                                                   m.shots_per_game);
  }
  p.shots_per_game = shots_per_game;

  // Shot-type mix over all zones, used for zones the player never shot from.
  std::array<int, NUM_SHOT_TYPES> overall{};
  for (Zone z : ALL_ZONES)
    for (ShotType t : ALL_SHOT_TYPES)
      overall[index_of(t)] += zones.zone(z).by_type[index_of(t)].shots;

  for (Zone z : ALL_ZONES) {
    const ZoneStats &stats = zones.zone(z);
    p.zone_share[index_of(z)] = zones.shot_share(z);
    for (ShotType t : ALL_SHOT_TYPES) {
      const ShotTypeCount &cell = stats.by_type[index_of(t)];
      double rate = shrink(cell.goals, cell.shots, config.baseline_rate(z, t),
                           config.resolver.prior_shots);
      p.goal_rate[index_of(z)][index_of(t)] = rate * finishing;
      p.type_share[index_of(z)][index_of(t)] =
          stats.shot_count > 0
              ? zones.shot_type_share(z, t)
              : (double)overall[index_of(t)] / std::max(1, p.total_shots);
    }
  }

  if (segments) {
    SeasonPhase sp = season_phase;
    if (segments->phase_total(sp).shots < MIN_PHASE_SHOTS) {
      SegmentStats e, m, l;
      for (SeasonPhase each : ALL_SEASON_PHASES) {
        e += segments->cell(each, GamePhase::EARLY);
        m += segments->cell(each, GamePhase::MID);
        l += segments->cell(each, GamePhase::LATE);
      }
      p.phase_shot_factor = phase_factors(e, m, l);
    } else {
      p.phase_shot_factor = phase_factors(segments->cell(sp, GamePhase::EARLY),
                                          segments->cell(sp, GamePhase::MID),
                                          segments->cell(sp, GamePhase::LATE));
    }
  }
  return p;
}

GoalieProfile ProfileResolver::goalie(const ZoneProfile &zones,
                                      const MatchupProfile &matchup) const {
  GoalieProfile p;
  p.goalie_id = zones.entity_id();
  p.total_shots = zones.total_shots();
  p.thin_zones = zones.thin_zone_count(config.resolver.min_zone_events);
  p.matchup_weight = matchup.matchup_weight;
  p.matchup_sample = matchup.sample_size;

  double leak = 1.0;
  if (const auto *g = std::get_if<GoalieStatLine>(&matchup.general)) {
    const auto &m = std::get<GoalieStatLine>(matchup.matchup);
    leak = blend_ratio(matchup, 1.0 - g->save_percentage,
                       1.0 - m.save_percentage);
  }

  int goals = 0;
  for (Zone z : ALL_ZONES) {
    const ZoneStats &stats = zones.zone(z);
    goals += stats.goal_count;
    for (ShotType t : ALL_SHOT_TYPES) {
      const ShotTypeCount &cell = stats.by_type[index_of(t)];
      double against = shrink(cell.goals, cell.shots,
                              config.baseline_rate(z, t),
                              config.resolver.prior_shots);
      p.save_rate[index_of(z)][index_of(t)] =
          std::clamp(1.0 - against * leak, 0.0, 1.0);
    }
  }
  p.save_percentage =
      p.total_shots > 0 ? 1.0 - (double)goals / p.total_shots : 0.0;
  return p;
}

ExpectedGoalsResolver::ExpectedGoalsResolver(const EngineConfig &config)
    : config(config) {}

double ExpectedGoalsResolver::goalie_factor(const GoalieProfile &goalie,
                                            Zone zone, ShotType type) const {
  double league_save = 1.0 - config.baseline_rate(zone, type);
  double save = goalie.save_rate[index_of(zone)][index_of(type)];
  double factor = 1.0 - config.resolver.goalie_weight * (save - league_save) /
                            (1.0 - league_save);
  return std::max(0.0, factor);
}

double
ExpectedGoalsResolver::adjustment_product(const AdjustmentSet &adj) const {
  double product = 1.0;
  product *= adj.synergy;
  product *= adj.clutch;
  product *= adj.fatigue;
  product *= adj.momentum;
  return std::clamp(product, config.resolver.min_adjustment_product,
                    config.resolver.max_adjustment_product);
}

double ExpectedGoalsResolver::probability(const ShooterProfile &shooter,
                                          Zone zone, ShotType type,
                                          const GoalieProfile *goalie,
                                          const AdjustmentSet &adjustments) const {
  double p = shooter.goal_rate[index_of(zone)][index_of(type)];
  if (goalie)
    p *= goalie_factor(*goalie, zone, type);
  p *= adjustment_product(adjustments);

  const ResolverParams &r = config.resolver;
  if (!std::isfinite(p))
    return r.min_probability;
  return std::clamp(p, r.min_probability, r.max_probability);
}
