#pragma once
#include "../core/exceptions.hpp"
#include "../electromagnetics/attenuation_model.hpp"
#include "../geometry/array_synthesizer.hpp"
#include "../properties/property_library.hpp"
#include "../properties/temperature_interpolator.hpp"
#include "solve_types.hpp"
#include <expected>

namespace wavepack::solver {

/**
 * @brief Sizes a perforated-tube duct array for one operating case
 *
 * Sequence: input validation and unit conversion, property lookup, temperature
 * averaging, channel sizing, representative channel flow, shielding sweep,
 * layout and mass, then the per-temperature flow sweep. The first failing step
 * aborts the solve; no partial result is produced.
 *
 * The solver holds only a const reference to the property library and is safe
 * to share between threads.
 */
class WavepackSolver {
private:
  const properties::PropertyLibrary& library_;
  SolveOptions options_;

  // Converted, validated inputs
  struct ResolvedCase {
    geometry::ChannelGeometry channel;
    double velocity;    // [m/s]
    double dp_limit;    // [Pa]
    properties::MaterialProperties material;
    properties::FluidProperties fluid;
  };

  [[nodiscard]] auto resolve(const SolveInput& input) const -> std::expected<ResolvedCase, core::SolveError>;

  [[nodiscard]] auto build_temperature_sweep(const properties::TemperatureProfile& profile,
                                             const ResolvedCase& resolved, double hydraulic_diameter) const
      -> std::expected<core::Matrix<double>, core::SolveError>;

public:
  explicit WavepackSolver(const properties::PropertyLibrary& library = properties::PropertyLibrary::reference(),
                          SolveOptions options = {})
      : library_(library), options_(options) {}

  [[nodiscard]] auto solve(const SolveInput& input) const -> std::expected<SolveResult, core::SolveError>;

  [[nodiscard]] auto options() const noexcept -> const SolveOptions& { return options_; }
  [[nodiscard]] auto library() const noexcept -> const properties::PropertyLibrary& { return library_; }
};

// Linear unit helpers used for inputs and echoed outputs
[[nodiscard]] constexpr auto inches_to_meters(double inches) noexcept -> double {
  return inches * constants::conversion::inch_to_m;
}
[[nodiscard]] constexpr auto meters_to_inches(double meters) noexcept -> double {
  return meters / constants::conversion::inch_to_m;
}
[[nodiscard]] constexpr auto meters_to_feet(double meters) noexcept -> double {
  return meters / constants::conversion::foot_to_m;
}
[[nodiscard]] constexpr auto feet_to_meters(double feet) noexcept -> double {
  return feet * constants::conversion::foot_to_m;
}
[[nodiscard]] constexpr auto psi_to_pascal(double psi) noexcept -> double {
  return psi * constants::conversion::psi_to_pa;
}
[[nodiscard]] constexpr auto pascal_to_psi(double pascal) noexcept -> double {
  return pascal / constants::conversion::psi_to_pa;
}

} // namespace wavepack::solver
