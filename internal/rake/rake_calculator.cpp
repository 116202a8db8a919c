#include "internal/rake/rake_calculator.hpp"

#include <algorithm>
#include <numeric>

namespace pokertable::rake {

namespace {

constexpr int64_t kBasisPointsPerUnit = 10000;

} // namespace

int64_t ComputeRake(int64_t pot, const RakeConfig& config) {
  if (pot <= 0 || config.rate_basis_points == 0 || config.cap <= 0) {
    return 0;
  }
  const int64_t proportional = pot * static_cast<int64_t>(config.rate_basis_points) / kBasisPointsPerUnit;
  return std::min(proportional, config.cap);
}

std::vector<int64_t> DistributeRake(std::vector<int64_t>& amounts, int64_t rake) {
  std::vector<int64_t> deductions(amounts.size(), 0);
  const int64_t        total = std::accumulate(amounts.begin(), amounts.end(), int64_t{0});
  if (amounts.empty() || rake <= 0 || total <= 0) {
    return deductions;
  }
  rake = std::min(rake, total);

  int64_t assigned = 0;
  for (size_t i = 0; i + 1 < amounts.size(); ++i) {
    deductions[i] = rake * amounts[i] / total;
    assigned += deductions[i];
  }
  deductions.back() = rake - assigned;

  // Push any excess back towards earlier (larger) shares.
  for (size_t i = amounts.size() - 1; i > 0; --i) {
    if (deductions[i] > amounts[i]) {
      deductions[i - 1] += deductions[i] - amounts[i];
      deductions[i] = amounts[i];
    }
  }

  for (size_t i = 0; i < amounts.size(); ++i) {
    amounts[i] -= deductions[i];
  }
  return deductions;
}

} // namespace pokertable::rake
