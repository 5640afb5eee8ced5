#include "wavepack/flow/flow_solver.hpp"
#include "wavepack/core/constants.hpp"
#include "wavepack/core/expected_utils.hpp"
#include <cmath>
#include <format>

namespace wavepack::flow {

namespace {

auto require_positive(std::string_view field, double value) -> std::expected<void, core::SolveError> {
  if (!std::isfinite(value)) {
    return std::unexpected(core::InvalidInputError(std::string(field), std::format("{}", value), "Value is not finite"));
  }
  if (value <= 0.0) {
    return std::unexpected(core::DomainError(std::string(field), std::format("{}", value), "Value must be positive"));
  }
  return {};
}

} // namespace

auto reynolds_number(double density, double velocity, double hydraulic_diameter, double viscosity)
    -> std::expected<double, core::SolveError> {
  WAVEPACK_TRY_VOID(require_positive("density", density));
  WAVEPACK_TRY_VOID(require_positive("velocity", velocity));
  WAVEPACK_TRY_VOID(require_positive("hydraulic_diameter", hydraulic_diameter));
  WAVEPACK_TRY_VOID(require_positive("viscosity", viscosity));

  return density * velocity * hydraulic_diameter / viscosity;
}

auto classify_regime(double reynolds) noexcept -> FlowRegime {
  return reynolds < constants::flow::transition_reynolds ? FlowRegime::Laminar : FlowRegime::Turbulent;
}

auto friction_factor(double reynolds, double roughness, double hydraulic_diameter)
    -> std::expected<double, core::SolveError> {
  WAVEPACK_TRY_VOID(require_positive("reynolds", reynolds));
  WAVEPACK_TRY_VOID(require_positive("hydraulic_diameter", hydraulic_diameter));
  if (!std::isfinite(roughness) || roughness < 0.0) {
    return std::unexpected(
        core::DomainError("roughness", std::format("{}", roughness), "Roughness must be finite and non-negative"));
  }

  if (classify_regime(reynolds) == FlowRegime::Laminar) {
    return constants::flow::laminar_coefficient / reynolds;
  }

  namespace sj = constants::flow::swamee_jain;
  const double log_term = std::log10(roughness / (sj::roughness_divisor * hydraulic_diameter) +
                                     sj::reynolds_coefficient / std::pow(reynolds, sj::reynolds_exponent));
  return sj::numerator / (log_term * log_term);
}

auto pressure_drop(double density, double velocity, double length, double hydraulic_diameter, double friction)
    -> std::expected<double, core::SolveError> {
  WAVEPACK_TRY_VOID(require_positive("density", density));
  WAVEPACK_TRY_VOID(require_positive("velocity", velocity));
  WAVEPACK_TRY_VOID(require_positive("length", length));
  WAVEPACK_TRY_VOID(require_positive("hydraulic_diameter", hydraulic_diameter));
  WAVEPACK_TRY_VOID(require_positive("friction_factor", friction));

  return friction * (length / hydraulic_diameter) * 0.5 * density * (velocity * velocity);
}

auto solve_channel(double density, double velocity, double viscosity, double length, double hydraulic_diameter,
                   double roughness) -> std::expected<ChannelFlow, core::SolveError> {
  ChannelFlow flow{};

  WAVEPACK_TRY_ASSIGN(flow.reynolds, reynolds_number(density, velocity, hydraulic_diameter, viscosity));
  flow.regime = classify_regime(flow.reynolds);
  WAVEPACK_TRY_ASSIGN(flow.friction_factor, friction_factor(flow.reynolds, roughness, hydraulic_diameter));
  WAVEPACK_TRY_ASSIGN(flow.pressure_drop,
                      pressure_drop(density, velocity, length, hydraulic_diameter, flow.friction_factor));

  return flow;
}

} // namespace wavepack::flow
