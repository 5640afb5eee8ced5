#include "wavepack/properties/temperature_interpolator.hpp"
#include <cmath>
#include <format>

namespace wavepack::properties {

auto density_at(double reference_density, double temperature) noexcept -> double {
  return reference_density * (constants::physical::reference_temperature / temperature);
}

auto viscosity_at(double reference_viscosity, double temperature) noexcept -> double {
  constexpr double t_ref = constants::physical::reference_temperature;
  constexpr double s = constants::physical::sutherland_constant;
  return reference_viscosity * std::pow(temperature / t_ref, 1.5) * (t_ref + s) / (temperature + s);
}

auto interpolate_profile(const FluidProperties& fluid, double t_min_f, double t_max_f, int n_samples)
    -> std::expected<TemperatureProfile, core::SolveError> {

  if (n_samples < constants::defaults::min_temperature_samples) {
    return std::unexpected(core::InvalidInputError("temperature_samples", std::to_string(n_samples),
                                                   "At least two temperature samples are required"));
  }
  if (!std::isfinite(t_min_f)) {
    return std::unexpected(core::InvalidInputError("T_min_F", std::format("{}", t_min_f), "Value is not finite"));
  }
  if (!std::isfinite(t_max_f)) {
    return std::unexpected(core::InvalidInputError("T_max_F", std::format("{}", t_max_f), "Value is not finite"));
  }

  const double t_lo = fahrenheit_to_kelvin(t_min_f);
  const double t_hi = fahrenheit_to_kelvin(t_max_f);
  if (t_lo <= 0.0) {
    return std::unexpected(
        core::DomainError("T_min_F", std::format("{}", t_min_f), "Absolute temperature must be positive"));
  }
  if (t_hi <= 0.0) {
    return std::unexpected(
        core::DomainError("T_max_F", std::format("{}", t_max_f), "Absolute temperature must be positive"));
  }

  TemperatureProfile profile;
  profile.samples.reserve(static_cast<std::size_t>(n_samples));

  const double step = (t_hi - t_lo) / static_cast<double>(n_samples - 1);
  double density_sum = 0.0;
  double viscosity_sum = 0.0;

  for (int i = 0; i < n_samples; ++i) {
    // Last sample pinned to the upper bound
    const double temperature = (i == n_samples - 1) ? t_hi : t_lo + step * static_cast<double>(i);
    TemperatureSample sample{temperature, density_at(fluid.density, temperature),
                             viscosity_at(fluid.viscosity, temperature)};
    density_sum += sample.density;
    viscosity_sum += sample.viscosity;
    profile.samples.push_back(sample);
  }

  profile.mean_density = density_sum / static_cast<double>(n_samples);
  profile.mean_viscosity = viscosity_sum / static_cast<double>(n_samples);

  return profile;
}

} // namespace wavepack::properties
