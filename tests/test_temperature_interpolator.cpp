#include "wavepack/properties/temperature_interpolator.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace {

bool near(double actual, double expected, double rel) {
  return std::fabs(actual - expected) <= rel * std::fabs(expected);
}

} // namespace

int main() {
  using namespace wavepack::properties;
  using wavepack::core::ErrorKind;

  const FluidProperties air{1.225, 1.81e-5};

  if (!near(fahrenheit_to_kelvin(32.0), 273.15, 1e-12) || !near(fahrenheit_to_kelvin(212.0), 373.15, 1e-12)) {
    std::cerr << "Fahrenheit to kelvin conversion is off\n";
    return 1;
  }

  // At the reference temperature both laws return the baseline values
  if (!near(density_at(air.density, 273.15), air.density, 1e-12) ||
      !near(viscosity_at(air.viscosity, 273.15), air.viscosity, 1e-12)) {
    std::cerr << "Property laws do not reproduce the reference state\n";
    return 1;
  }

  auto profile = interpolate_profile(air, 32.0, 212.0, 10);
  if (!profile) {
    std::cerr << profile.error().message() << "\n";
    return 1;
  }
  if (profile->samples.size() != 10) {
    std::cerr << "Expected 10 samples\n";
    return 1;
  }
  if (!near(profile->samples.front().temperature, 273.15, 1e-12) ||
      profile->samples.back().temperature != fahrenheit_to_kelvin(212.0)) {
    std::cerr << "Endpoints must be included\n";
    return 1;
  }
  if (!near(profile->mean_density, 1.045737453406631, 1e-12) ||
      !near(profile->mean_viscosity, 2.0564402872716678e-05, 1e-12)) {
    std::cerr << "Mean properties differ from the reference case: " << profile->mean_density << " "
              << profile->mean_viscosity << "\n";
    return 1;
  }

  // Density falls and gas viscosity rises with temperature
  for (std::size_t i = 1; i < profile->samples.size(); ++i) {
    if (profile->samples[i].density >= profile->samples[i - 1].density ||
        profile->samples[i].viscosity <= profile->samples[i - 1].viscosity) {
      std::cerr << "Profile is not monotonic at sample " << i << "\n";
      return 1;
    }
  }

  auto reversed = interpolate_profile(air, 212.0, 32.0, 10);
  if (!reversed || !near(reversed->mean_density, profile->mean_density, 1e-12)) {
    std::cerr << "Reversed bounds should produce the same means\n";
    return 1;
  }

  auto too_few = interpolate_profile(air, 32.0, 212.0, 1);
  if (too_few || too_few.error().kind() != ErrorKind::InvalidInput) {
    std::cerr << "Expected InvalidInput for fewer than two samples\n";
    return 1;
  }

  auto not_finite = interpolate_profile(air, std::numeric_limits<double>::quiet_NaN(), 212.0, 10);
  if (not_finite || not_finite.error().kind() != ErrorKind::InvalidInput) {
    std::cerr << "Expected InvalidInput for a NaN bound\n";
    return 1;
  }

  auto absolute_zero = interpolate_profile(air, -459.67, 212.0, 10);
  if (absolute_zero || absolute_zero.error().kind() != ErrorKind::Domain) {
    std::cerr << "Expected Domain error at absolute zero\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
