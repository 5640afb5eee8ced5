#include "wavepack/electromagnetics/attenuation_model.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace {

bool near(double actual, double expected, double rel) {
  return std::fabs(actual - expected) <= rel * std::fabs(expected);
}

} // namespace

int main() {
  using namespace wavepack;
  using electromagnetics::cutoff_frequency;
  using electromagnetics::decade_sweep;
  using electromagnetics::evaluate;

  const properties::MaterialProperties steel{8000.0, 1.0, 1.05, 1.5e-6};
  const properties::MaterialProperties aluminum{2700.0, 1.0, 1.0, 1.2e-6};

  auto sweep = decade_sweep(5, 10);
  if (!sweep || sweep->size() != 6 || sweep->front() != 1e5 || sweep->back() != 1e10) {
    std::cerr << "Default sweep should be 1e5 ... 1e10 Hz, one point per decade\n";
    return 1;
  }
  if (decade_sweep(7, 6)) {
    std::cerr << "Expected failure for an inverted decade range\n";
    return 1;
  }

  // 10^400 overflows a double; INT_MAX would overflow the loop counter
  for (int too_high : {301, 400, std::numeric_limits<int>::max()}) {
    auto overflow = decade_sweep(5, too_high);
    if (overflow || overflow.error().kind() != core::ErrorKind::InvalidInput ||
        overflow.error().field() != "frequency_decade_max") {
      std::cerr << "Expected InvalidInput on frequency_decade_max for decade " << too_high << "\n";
      return 1;
    }
  }
  auto underflow = decade_sweep(std::numeric_limits<int>::min(), 5);
  if (underflow || underflow.error().field() != "frequency_decade_min") {
    std::cerr << "Expected InvalidInput on frequency_decade_min for a huge negative decade\n";
    return 1;
  }
  auto widest = decade_sweep(-300, 300);
  if (!widest || widest->size() != 601 || !std::isfinite(widest->back()) || !(widest->front() > 0.0)) {
    std::cerr << "The full accepted decade range should give finite, positive frequencies\n";
    return 1;
  }

  geometry::ChannelGeometry rect{geometry::ChannelShape::Rectangular, 0.0508, 0.0254, 0.00127, 0.1524};
  auto fc_rect = cutoff_frequency(rect, steel);
  if (!fc_rect || !near(*fc_rect, 6.439146013065995e9, 1e-12)) {
    std::cerr << "Rectangular cutoff mismatch\n";
    return 1;
  }

  geometry::ChannelGeometry tube{geometry::ChannelShape::CircularInline, 0.0127, 0.0127, 0.000762, 0.0508};
  auto fc_tube = cutoff_frequency(tube, aluminum);
  if (!fc_tube || !near(*fc_tube, 13.83499482677089e9, 1e-12)) {
    std::cerr << "Circular cutoff mismatch\n";
    return 1;
  }

  // Circular cutoff ignores the height field
  auto tube_odd = tube;
  tube_odd.height = -1.0;
  auto fc_odd = cutoff_frequency(tube_odd, aluminum);
  if (!fc_odd || *fc_odd != *fc_tube) {
    std::cerr << "Circular cutoff should not depend on height\n";
    return 1;
  }

  auto result = evaluate(rect, steel, *sweep);
  if (!result) {
    std::cerr << result.error().message() << "\n";
    return 1;
  }
  // Every point below cutoff shares the floored attenuation
  for (std::size_t i = 0; i < 5; ++i) {
    if (result->alpha[i] != 1.0 || !near(result->shielding_db[i], 1.3237295808411114, 1e-12)) {
      std::cerr << "Below-cutoff point " << i << " should use alpha = 1\n";
      return 1;
    }
  }
  if (!near(result->shielding_db[5], 217.49980537880094, 1e-9)) {
    std::cerr << "Above-cutoff SE mismatch: " << result->shielding_db[5] << "\n";
    return 1;
  }
  if (auto se = result->shielding_at(1e10); !se || *se != result->shielding_db[5]) {
    std::cerr << "shielding_at(1e10) should return the last point\n";
    return 1;
  }
  if (result->shielding_at(2e9)) {
    std::cerr << "shielding_at should miss frequencies outside the sweep\n";
    return 1;
  }
  // Lookup stops at the shorter of the two sequences
  if (electromagnetics::lookup_shielding({1e9, 1e10}, {5.0}, 1e10) ||
      electromagnetics::lookup_shielding({1e9, 1e10}, {5.0}, 1e9) != 5.0) {
    std::cerr << "lookup_shielding should only match aligned points\n";
    return 1;
  }

  // Longer channels never shield less
  double previous = 0.0;
  for (double length : {0.05, 0.1, 0.2, 0.4}) {
    auto longer = rect;
    longer.length = length;
    auto r = evaluate(longer, steel, {1e10});
    if (!r || r->shielding_db[0] < previous) {
      std::cerr << "SE must be non-decreasing in length\n";
      return 1;
    }
    previous = r->shielding_db[0];
  }

  auto bad_width = rect;
  bad_width.width = 0.0;
  auto fc_bad = cutoff_frequency(bad_width, steel);
  if (fc_bad || fc_bad.error().kind() != core::ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero width\n";
    return 1;
  }

  const properties::MaterialProperties lossless{1000.0, 0.0, 1.0, 0.0};
  if (cutoff_frequency(rect, lossless)) {
    std::cerr << "Expected failure for zero permittivity\n";
    return 1;
  }

  auto zero_length = rect;
  zero_length.length = 0.0;
  if (evaluate(zero_length, steel, *sweep)) {
    std::cerr << "Expected failure for zero length\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
