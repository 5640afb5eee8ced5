#pragma once
#include "../core/exceptions.hpp"
#include <expected>
#include <string_view>

namespace wavepack::flow {

enum class FlowRegime { Laminar, Turbulent };

[[nodiscard]] constexpr auto regime_name(FlowRegime regime) noexcept -> std::string_view {
  return regime == FlowRegime::Laminar ? "laminar" : "turbulent";
}

// Hydraulic state of one representative channel
struct ChannelFlow {
  double reynolds;
  double friction_factor; // Darcy
  FlowRegime regime;
  double pressure_drop; // [Pa]
};

[[nodiscard]] auto reynolds_number(double density, double velocity, double hydraulic_diameter, double viscosity)
    -> std::expected<double, core::SolveError>;

// Re < 2300 is laminar, everything else turbulent
[[nodiscard]] auto classify_regime(double reynolds) noexcept -> FlowRegime;

// 64/Re when laminar, explicit Swamee-Jain otherwise
[[nodiscard]] auto friction_factor(double reynolds, double roughness, double hydraulic_diameter)
    -> std::expected<double, core::SolveError>;

// Darcy-Weisbach
[[nodiscard]] auto pressure_drop(double density, double velocity, double length, double hydraulic_diameter,
                                 double friction) -> std::expected<double, core::SolveError>;

[[nodiscard]] auto solve_channel(double density, double velocity, double viscosity, double length,
                                 double hydraulic_diameter, double roughness)
    -> std::expected<ChannelFlow, core::SolveError>;

} // namespace wavepack::flow
