#include "../../include/simulation/trial_rng.h"
#include <cmath>

namespace {

constexpr double TWO_PI = 6.283185307179586;
// Above this mean the Poisson draw uses a normal approximation.
constexpr double POISSON_NORMAL_CUTOFF = 60.0;

uint64_t splitmix64(uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

} // namespace

uint64_t TrialRng::derive_seed(uint64_t base_seed, uint64_t trial_index) {
  return splitmix64(splitmix64(base_seed) ^ splitmix64(trial_index + 1));
}

TrialRng::TrialRng(uint64_t base_seed, uint64_t trial_index)
    : gen(derive_seed(base_seed, trial_index)) {}

double TrialRng::uniform() {
  // 53 random bits into the mantissa
  return (gen() >> 11) * (1.0 / 9007199254740992.0);
}

int TrialRng::poisson(double mean) {
  if (!(mean > 0.0))
    return 0;
  if (mean > POISSON_NORMAL_CUTOFF) {
    double draw = std::round(normal(mean, std::sqrt(mean)));
    return draw > 0.0 ? (int)draw : 0;
  }
  // Knuth: multiply uniforms until the product drops below e^-mean.
  double limit = std::exp(-mean);
  double product = uniform();
  int count = 0;
  while (product > limit) {
    product *= uniform();
    ++count;
  }
  return count;
}

double TrialRng::normal(double mean, double stddev) {
  // Box-Muller, one value per call.
  double u1 = uniform();
  double u2 = uniform();
  if (u1 <= 0.0)
    u1 = 1e-300;
  double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(TWO_PI * u2);
  return mean + stddev * z;
}

double TrialRng::exponential(double rate) {
  double u = uniform();
  return -std::log(1.0 - u) / rate;
}
