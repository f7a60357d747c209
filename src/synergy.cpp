#include "../include/synergy.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

// Keeps the expected rate positive when two weak players share the ice.
constexpr double MIN_EXPECTED_GOALS_PER_60 = 0.1;

} // namespace

std::pair<int, int> SynergyMatrix::key(int a, int b) {
  if (a == b)
    throw std::invalid_argument("no self-synergy for player " +
                                std::to_string(a));
  return {std::min(a, b), std::max(a, b)};
}

double SynergyMatrix::coefficient(int a, int b) const {
  auto it = scores.find(key(a, b));
  return it == scores.end() ? 0.0 : it->second;
}

void SynergyMatrix::set(int a, int b, double score) { scores[key(a, b)] = score; }

bool SynergyMatrix::contains(int a, int b) const {
  return scores.count(key(a, b)) > 0;
}

double SynergyMatrix::line_score(const std::vector<int> &members) const {
  double sum = 0.0;
  int pairs = 0;
  for (size_t i = 0; i < members.size(); ++i) {
    for (size_t j = i + 1; j < members.size(); ++j) {
      sum += coefficient(members[i], members[j]);
      pairs++;
    }
  }
  return pairs > 0 ? sum / pairs : 0.0;
}

std::vector<std::vector<std::optional<double>>>
SynergyMatrix::compatibility(const std::vector<int> &players) const {
  std::vector<std::vector<std::optional<double>>> grid(
      players.size(), std::vector<std::optional<double>>(players.size()));
  for (size_t i = 0; i < players.size(); ++i) {
    for (size_t j = i + 1; j < players.size(); ++j) {
      double c = coefficient(players[i], players[j]);
      grid[i][j] = c;
      grid[j][i] = c;
    }
  }
  return grid;
}

SynergyCalculator::SynergyCalculator(const EngineConfig &config)
    : params(config.adjustments) {}

double SynergyCalculator::pair_score(const SharedIceRecord &shared,
                                     const OnIceRate &a, const OnIceRate &b,
                                     double league_goals_per_60) const {
  if (shared.shared_toi_seconds < params.synergy_min_shared_toi)
    return 0.0;

  double expected_rate =
      std::max(MIN_EXPECTED_GOALS_PER_60, a.goals_for_per_60() +
                                              b.goals_for_per_60() -
                                              league_goals_per_60);
  double expected = expected_rate * shared.shared_toi_seconds / 3600.0;
  double z = (shared.goals_for - expected) / std::sqrt(expected);
  return std::clamp(z, -params.synergy_z_cap, params.synergy_z_cap);
}

SynergyMatrix
SynergyCalculator::build(const std::vector<SharedIceRecord> &records,
                         const std::map<int, OnIceRate> &rates) const {
  std::map<std::pair<int, int>, SharedIceRecord> merged;
  for (const auto &r : records) {
    if (r.player_a == r.player_b)
      continue;
    std::pair<int, int> k{std::min(r.player_a, r.player_b),
                          std::max(r.player_a, r.player_b)};
    SharedIceRecord &m = merged[k];
    m.player_a = k.first;
    m.player_b = k.second;
    m.season_id = r.season_id;
    m.shared_toi_seconds += r.shared_toi_seconds;
    m.goals_for += r.goals_for;
    m.shots_for += r.shots_for;
  }

  double league = 0.0;
  for (const auto &entry : rates)
    league += entry.second.goals_for_per_60();
  if (!rates.empty())
    league /= rates.size();

  SynergyMatrix matrix;
  for (const auto &entry : merged) {
    auto a = rates.find(entry.first.first);
    auto b = rates.find(entry.first.second);
    if (a == rates.end() || b == rates.end())
      continue;
    matrix.set(entry.first.first, entry.first.second,
               pair_score(entry.second, a->second, b->second, league));
  }
  return matrix;
}

double SynergyCalculator::multiplier(double score) const {
  return 1.0 + std::clamp(params.synergy_sensitivity * score,
                          -params.synergy_bound, params.synergy_bound);
}
