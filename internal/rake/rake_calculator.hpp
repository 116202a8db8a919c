#pragma once

#include <cstdint>
#include <vector>

namespace pokertable::rake {

struct RakeConfig {
  uint32_t rate_basis_points = 0;
  int64_t  cap               = 0;
};

// min(floor(pot * rate_basis_points / 10000), cap). A zero cap means no rake.
int64_t ComputeRake(int64_t pot, const RakeConfig& config);

/*
  Deducts `rake` from `amounts` in place, proportional to each share of the
  total. The last entry absorbs the rounding remainder so the deductions sum
  to exactly `rake`. No amount goes below zero.

  Returns the per-entry deduction.
*/
std::vector<int64_t> DistributeRake(std::vector<int64_t>& amounts, int64_t rake);

} // namespace pokertable::rake
