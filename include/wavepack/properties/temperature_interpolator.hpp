#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include "property_library.hpp"
#include <expected>
#include <vector>

namespace wavepack::properties {

struct TemperatureSample {
  double temperature; // [K]
  double density;     // [kg/m³]
  double viscosity;   // [Pa·s]
};

struct TemperatureProfile {
  std::vector<TemperatureSample> samples;
  double mean_density;
  double mean_viscosity;
};

[[nodiscard]] constexpr auto fahrenheit_to_kelvin(double temperature_f) noexcept -> double {
  return (temperature_f + constants::physical::rankine_offset) * constants::conversion::rankine_to_kelvin;
}

[[nodiscard]] constexpr auto kelvin_to_fahrenheit(double temperature_k) noexcept -> double {
  return temperature_k / constants::conversion::rankine_to_kelvin - constants::physical::rankine_offset;
}

// Ideal-gas style density scaling from the reference temperature
[[nodiscard]] auto density_at(double reference_density, double temperature) noexcept -> double;

// Sutherland viscosity law referenced to 273.15 K
[[nodiscard]] auto viscosity_at(double reference_viscosity, double temperature) noexcept -> double;

/**
 * @brief Samples fluid properties over an operating temperature range
 *
 * @param fluid Baseline properties at the reference temperature
 * @param t_min_f Lower bound [°F]
 * @param t_max_f Upper bound [°F]; may be below t_min_f, samples then descend
 * @param n_samples Number of equally spaced samples, endpoints included
 * @return Profile with arithmetic mean density and viscosity, or InvalidInputError
 *         (fewer than two samples, non-finite bound) / DomainError (absolute temperature <= 0)
 */
[[nodiscard]] auto interpolate_profile(const FluidProperties& fluid, double t_min_f, double t_max_f,
                                       int n_samples = constants::defaults::temperature_samples)
    -> std::expected<TemperatureProfile, core::SolveError>;

} // namespace wavepack::properties
