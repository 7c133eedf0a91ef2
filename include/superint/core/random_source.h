#pragma once

#include <cstdint>

#include "superint/util/hash_rng.h"

namespace superint {

// Source of uniform draws in [0,1) for gameplay rolls.
class RandomSource {
 public:
  virtual ~RandomSource() = default;
  virtual double next_u01() = 0;
};

// Seedable splitmix64 stream; the same seed replays the same rolls.
class HashRandomSource : public RandomSource {
 public:
  explicit HashRandomSource(std::uint64_t seed) : rng_(util::splitmix64(seed ^ util::fnv1a64("research_risk"))) {}

  double next_u01() override { return rng_.next_u01(); }

 private:
  util::HashRng rng_;
};

} // namespace superint
