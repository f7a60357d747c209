#include "../../include/simulation/game_simulator.h"
#include <algorithm>

namespace {

constexpr double MIN_FORM = 0.5;
constexpr double MAX_FORM = 1.5;
// Hard stop for the overtime loop on degenerate shot rates.
constexpr int MAX_OVERTIME_ATTEMPTS = 10000;

const AdjustmentSet NEUTRAL_ADJUSTMENTS{};

} // namespace

GameSimulator::GameSimulator(const EngineConfig &config,
                             const ExpectedGoalsResolver &resolver)
    : config(config), resolver(resolver) {}

double GameSimulator::expected_shots(const TeamSimulationInput &attack,
                                     const TeamSimulationInput &defence,
                                     const LineInput &line, double seconds,
                                     double weight) const {
  double pace = defence.shots_against_per_60 /
                config.simulation.league_shots_per_60;
  return attack.shots_for_per_60 * line.toi_share * (seconds / 3600.0) *
         weight * pace;
}

bool GameSimulator::attempt(const Side &side, const LineInput &line,
                            GamePhase phase, TrialRng &rng, double &xg) const {
  const TeamSimulationInput &team = *side.team;

  std::vector<double> weights;
  weights.reserve(line.members.size());
  for (int id : line.members) {
    auto it = team.skaters.find(id);
    weights.push_back(it == team.skaters.end()
                          ? 0.0
                          : it->second.shots_per_game *
                                it->second.phase_shot_factor[index_of(phase)]);
  }
  int pick = rng.weighted_index(weights);
  if (pick < 0)
    return false;
  int shooter_id = line.members[pick];
  const ShooterProfile &shooter = team.skaters.at(shooter_id);

  int zone_index = rng.weighted_index(shooter.zone_share);
  if (zone_index < 0)
    return false;
  Zone zone = ALL_ZONES[zone_index];
  int type_index = rng.weighted_index(shooter.type_share[zone_index]);
  ShotType type = type_index < 0 ? ShotType::OTHER : ALL_SHOT_TYPES[type_index];

  auto adj = team.adjustments.find(shooter_id);
  const AdjustmentSet &set =
      adj == team.adjustments.end() ? NEUTRAL_ADJUSTMENTS : adj->second;
  const GoalieProfile *goalie =
      side.opponent->has_goalie ? &side.opponent->goalie : nullptr;

  double p = resolver.probability(shooter, zone, type, goalie,
                                  set.in_phase(phase));
  xg += p;
  return rng.uniform() < p;
}

TrialScore GameSimulator::play(const TeamSimulationInput &home,
                               const TeamSimulationInput &away,
                               const SimulationConfig &sim,
                               TrialRng &rng) const {
  TrialScore score;

  double home_form = 1.0;
  double away_form = 1.0;
  if (sim.game_variance > 0.0) {
    home_form = std::clamp(rng.normal(1.0, sim.game_variance), MIN_FORM,
                           MAX_FORM);
    away_form = std::clamp(rng.normal(1.0, sim.game_variance), MIN_FORM,
                           MAX_FORM);
  }
  Side home_side{&home, &away, home_form, true};
  Side away_side{&away, &home, away_form, false};

  const GamePhaseBoundaries &b = config.game_phases;
  const std::array<double, NUM_GAME_PHASES> seconds = {
      (double)b.early_end_seconds,
      (double)(b.mid_end_seconds - b.early_end_seconds),
      (double)(b.regulation_end_seconds - b.mid_end_seconds)};

  for (GamePhase phase : ALL_GAME_PHASES) {
    int seg = index_of(phase);
    for (const Side *side : {&home_side, &away_side}) {
      double ice = side->home ? config.simulation.home_ice_factor : 1.0;
      int &goals = side->home ? score.home_goals[seg] : score.away_goals[seg];
      double &xg = side->home ? score.home_xg[seg] : score.away_xg[seg];
      for (const auto &line : side->team->lines) {
        double mean = expected_shots(*side->team, *side->opponent, line,
                                     seconds[seg], sim.segment_weights[seg]) *
                      side->form * ice;
        int shots = rng.poisson(mean);
        for (int s = 0; s < shots; ++s) {
          if (attempt(*side, line, phase, rng, xg))
            goals++;
        }
      }
    }
  }

  for (int seg = 0; seg < NUM_GAME_PHASES; ++seg) {
    score.home += score.home_goals[seg];
    score.away += score.away_goals[seg];
  }
  if (score.home != score.away)
    return score;

  score.went_to_overtime = true;
  if (overtime(home_side, away_side, score, rng))
    return score;

  if (sim.overtime_policy == OvertimePolicy::SHOOTOUT)
    shootout(score, rng);
  return score;
}

bool GameSimulator::overtime(const Side &home, const Side &away,
                             TrialScore &score, TrialRng &rng) const {
  const SimulationParams &p = config.simulation;
  int ot = index_of(SimSegment::OVERTIME);

  auto rate = [&](const Side &side, std::vector<double> &shares) {
    double ice = side.home ? p.home_ice_factor : 1.0;
    double total = 0.0;
    for (const auto &line : side.team->lines) {
      total += expected_shots(*side.team, *side.opponent, line, 1.0, 1.0);
      shares.push_back(line.toi_share);
    }
    return total * side.form * ice * p.overtime_pace;
  };
  std::vector<double> home_shares, away_shares;
  double home_rate = rate(home, home_shares);
  double away_rate = rate(away, away_shares);
  double total = home_rate + away_rate;
  if (!(total > 0.0))
    return false;

  double clock = 0.0;
  for (int n = 0; n < MAX_OVERTIME_ATTEMPTS; ++n) {
    clock += rng.exponential(total);
    if (clock > p.overtime_seconds)
      return false;

    bool home_shoots = rng.uniform() * total < home_rate;
    const Side &side = home_shoots ? home : away;
    int line = rng.weighted_index(home_shoots ? home_shares : away_shares);
    if (line < 0)
      continue;
    double &xg = home_shoots ? score.home_xg[ot] : score.away_xg[ot];
    if (attempt(side, side.team->lines[line], GamePhase::LATE, rng, xg)) {
      if (home_shoots) {
        score.home_goals[ot]++;
        score.home++;
      } else {
        score.away_goals[ot]++;
        score.away++;
      }
      return true;
    }
  }
  return false;
}

void GameSimulator::shootout(TrialScore &score, TrialRng &rng) const {
  const SimulationParams &p = config.simulation;
  score.went_to_shootout = true;

  int home_made = 0;
  int away_made = 0;
  for (int round = 0; round < p.shootout_max_rounds; ++round) {
    if (rng.bernoulli(p.shootout_success))
      home_made++;
    if (rng.bernoulli(p.shootout_success))
      away_made++;
    // Past the opening rounds every round is sudden death.
    if (round + 1 >= p.shootout_rounds && home_made != away_made)
      break;
  }

  // Still level at the round cap: the game stays a draw.
  if (home_made > away_made)
    score.home++;
  else if (away_made > home_made)
    score.away++;
}
