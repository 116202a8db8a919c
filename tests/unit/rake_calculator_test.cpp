#include "internal/rake/rake_calculator.hpp"

#include <cassert>
#include <iostream>
#include <numeric>
#include <vector>

namespace {

using pokertable::rake::ComputeRake;
using pokertable::rake::DistributeRake;
using pokertable::rake::RakeConfig;

void TestRakeIsCappedProportion() {
  assert(ComputeRake(1000, RakeConfig{500, 30}) == 30);
  assert(ComputeRake(400, RakeConfig{500, 30}) == 20);
}

void TestFivePercentCappedAtFifty() {
  const RakeConfig config{500, 50};
  assert(ComputeRake(1000, config) == 50);
  assert(ComputeRake(20, config) == 1);
  assert(ComputeRake(5000, config) == 50);
}

void TestRakeRoundsDown() {
  assert(ComputeRake(199, RakeConfig{500, 100}) == 9);
}

void TestZeroCapOrRateMeansNoRake() {
  assert(ComputeRake(1000, RakeConfig{500, 0}) == 0);
  assert(ComputeRake(1000, RakeConfig{0, 100}) == 0);
  assert(ComputeRake(0, RakeConfig{500, 100}) == 0);
}

void TestDistributeIsProportional() {
  std::vector<int64_t> amounts{600, 400};
  const auto           deductions = DistributeRake(amounts, 50);
  assert((deductions == std::vector<int64_t>{30, 20}));
  assert((amounts == std::vector<int64_t>{570, 380}));
}

void TestDistributeSumsExactlyToRake() {
  std::vector<int64_t> amounts{1, 1, 1};
  const auto           deductions = DistributeRake(amounts, 2);
  assert(std::accumulate(deductions.begin(), deductions.end(), int64_t{0}) == 2);
  for (size_t i = 0; i < amounts.size(); ++i) assert(amounts[i] >= 0);
}

void TestDistributeNeverExceedsTotal() {
  std::vector<int64_t> amounts{10};
  const auto           deductions = DistributeRake(amounts, 50);
  assert(deductions[0] == 10);
  assert(amounts[0] == 0);
}

void TestDistributeNoRakeLeavesAmounts() {
  std::vector<int64_t> amounts{100, 50};
  const auto           deductions = DistributeRake(amounts, 0);
  assert((deductions == std::vector<int64_t>{0, 0}));
  assert((amounts == std::vector<int64_t>{100, 50}));
}

} // namespace

int main() {
  TestRakeIsCappedProportion();
  TestFivePercentCappedAtFifty();
  TestRakeRoundsDown();
  TestZeroCapOrRateMeansNoRake();
  TestDistributeIsProportional();
  TestDistributeSumsExactlyToRake();
  TestDistributeNeverExceedsTotal();
  TestDistributeNoRakeLeavesAmounts();

  std::cout << "rake_calculator_test: pass\n";
  return 0;
}
