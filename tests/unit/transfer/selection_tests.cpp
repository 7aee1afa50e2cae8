#include <cstdint>
#include <iostream>
#include <limits>
#include <numeric>
#include <vector>

#include "transfer/builder.hpp"

using sealnode::contract::AssetAmount;
using sealnode::transfer::SelectCovering;

namespace {

bool ExpectSelection(const char* label, const std::vector<AssetAmount>& values, AssetAmount target,
                     const std::vector<std::size_t>& expected) {
  const auto selected = SelectCovering(values, target);
  if (!selected) {
    std::cerr << label << ": no selection\n";
    return false;
  }
  if (*selected != expected) {
    std::cerr << label << ": selected";
    for (auto i : *selected) std::cerr << " " << i;
    std::cerr << "\n";
    return false;
  }
  return true;
}

AssetAmount SumOf(const std::vector<AssetAmount>& values, const std::vector<std::size_t>& picks) {
  AssetAmount sum = 0;
  for (auto i : picks) sum += values[i];
  return sum;
}

}  // namespace

int main() {
  // Single allocation that covers beats several smaller ones.
  if (!ExpectSelection("single cover", {100, 300, 250}, 250, {2})) return 1;
  // Exact pair preferred over an overshooting pair.
  if (!ExpectSelection("two inputs", {60, 50, 40, 10}, 90, {1, 2})) return 1;
  // Fewest inputs first, even at a larger sum.
  if (!ExpectSelection("fewest inputs", {45, 45, 45, 100}, 90, {3})) return 1;
  if (!ExpectSelection("all inputs", {1, 2, 3}, 6, {0, 1, 2})) return 1;

  if (SelectCovering({10, 20}, 31)) {
    std::cerr << "insufficient set produced a selection\n";
    return 1;
  }
  if (SelectCovering({}, 1)) {
    std::cerr << "empty set produced a selection\n";
    return 1;
  }

  // Sums near the top of the range must not wrap.
  {
    const AssetAmount max = std::numeric_limits<AssetAmount>::max();
    if (!ExpectSelection("overflow guard", {max, max - 1, 5}, max - 1, {1})) return 1;
  }

  // Beyond the exhaustive limit the greedy path still covers with few inputs.
  {
    std::vector<AssetAmount> values(40);
    std::iota(values.begin(), values.end(), 1);  // 1..40
    const auto selected = SelectCovering(values, 75);
    if (!selected || SumOf(values, *selected) < 75) {
      std::cerr << "greedy selection does not cover\n";
      return 1;
    }
    // 40 + 35 (smallest second pick that finishes the target).
    if (selected->size() != 2 || SumOf(values, *selected) != 75) {
      std::cerr << "greedy selection overshoots: " << SumOf(values, *selected) << "\n";
      return 1;
    }
    // Refinement must revisit earlier picks, not only the last one:
    // 100 + 90 overshoots, 90 + 60 is exact.
    std::vector<AssetAmount> mixed{100, 90, 60, 55};
    mixed.resize(20, 1);
    if (!ExpectSelection("greedy refinement", mixed, 150, {1, 2})) return 1;

    std::vector<AssetAmount> small(30, 1);
    if (SelectCovering(small, 31)) {
      std::cerr << "greedy selection covered an insufficient set\n";
      return 1;
    }
    const auto all = SelectCovering(small, 30);
    if (!all || all->size() != 30) {
      std::cerr << "greedy selection did not use every input\n";
      return 1;
    }
  }

  std::cout << "selection tests passed\n";
  return 0;
}
