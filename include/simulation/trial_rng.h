#ifndef TRIAL_RNG_H
#define TRIAL_RNG_H

#include <cstdint>
#include <random>
#include <vector>

// Random source for one trial. The stream depends only on the base seed
// and the trial index. Draws must not vary with the standard library
// vendor, so the distributions are implemented here.
class TrialRng {
public:
  TrialRng(uint64_t base_seed, uint64_t trial_index);

  static uint64_t derive_seed(uint64_t base_seed, uint64_t trial_index);

  double uniform(); // [0, 1)
  bool bernoulli(double p) { return uniform() < p; }
  int poisson(double mean);
  double normal(double mean, double stddev);
  double exponential(double rate);

  // Index drawn in proportion to weights; -1 when all weights are zero.
  template <typename Container> int weighted_index(const Container &weights) {
    double total = 0.0;
    for (double w : weights)
      total += w > 0.0 ? w : 0.0;
    if (total <= 0.0)
      return -1;
    double target = uniform() * total;
    int last = -1;
    int i = 0;
    for (double w : weights) {
      if (w > 0.0) {
        last = i;
        if (target < w)
          return i;
        target -= w;
      }
      ++i;
    }
    return last;
  }

private:
  std::mt19937_64 gen;
};

#endif
