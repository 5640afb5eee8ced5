#include "wavepack/flow/flow_solver.hpp"
#include <cmath>
#include <iostream>

int main() {
  using namespace wavepack::flow;
  using wavepack::core::ErrorKind;

  // Regime boundary
  if (classify_regime(2299.999) != FlowRegime::Laminar) {
    std::cerr << "Re = 2299.999 must be laminar\n";
    return 1;
  }
  if (classify_regime(2300.0) != FlowRegime::Turbulent) {
    std::cerr << "Re = 2300 must be turbulent\n";
    return 1;
  }

  // The friction factor switches correlation exactly at the boundary
  {
    const double eps = 1.5e-6;
    const double dh = 0.0254;
    auto just_laminar = friction_factor(2299.999, eps, dh);
    if (!just_laminar || std::fabs(*just_laminar - 64.0 / 2299.999) > 1e-15) {
      std::cerr << "Re = 2299.999 should use 64/Re\n";
      return 1;
    }
    auto at_boundary = friction_factor(2300.0, eps, dh);
    const double swamee_jain = 0.25 / std::pow(std::log10(eps / (3.7 * dh) + 5.74 / std::pow(2300.0, 0.9)), 2.0);
    if (!at_boundary || std::fabs(*at_boundary - swamee_jain) > 1e-12 * swamee_jain) {
      std::cerr << "Re = 2300 should use the Swamee-Jain correlation\n";
      return 1;
    }
    if (std::fabs(*at_boundary - 64.0 / 2300.0) < 1e-6) {
      std::cerr << "Turbulent value at Re = 2300 should differ from 64/Re\n";
      return 1;
    }
  }

  auto laminar = friction_factor(1000.0, 1.5e-6, 0.01);
  if (!laminar || std::fabs(*laminar - 0.064) > 1e-15) {
    std::cerr << "Laminar friction factor should be 64/Re\n";
    return 1;
  }

  // Swamee-Jain, smooth-ish tube
  const double re = 1.0e5;
  const double rough = 1.5e-6;
  const double dh = 0.0338667;
  auto turbulent = friction_factor(re, rough, dh);
  const double expected = 0.25 / std::pow(std::log10(rough / (3.7 * dh) + 5.74 / std::pow(re, 0.9)), 2.0);
  if (!turbulent || std::fabs(*turbulent - expected) > 1e-12 * expected) {
    std::cerr << "Turbulent friction factor mismatch\n";
    return 1;
  }

  auto re_value = reynolds_number(1.2, 10.0, 0.02, 1.8e-5);
  if (!re_value || std::fabs(*re_value - 1.2 * 10.0 * 0.02 / 1.8e-5) > 1e-9) {
    std::cerr << "Reynolds number mismatch\n";
    return 1;
  }

  auto dp = pressure_drop(1.2, 10.0, 0.5, 0.02, 0.03);
  if (!dp || std::fabs(*dp - 0.03 * (0.5 / 0.02) * 0.5 * 1.2 * 100.0) > 1e-9) {
    std::cerr << "Darcy-Weisbach pressure drop mismatch\n";
    return 1;
  }

  auto zero_velocity = reynolds_number(1.2, 0.0, 0.02, 1.8e-5);
  if (zero_velocity || zero_velocity.error().kind() != ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero velocity\n";
    return 1;
  }

  auto zero_viscosity = reynolds_number(1.2, 10.0, 0.02, 0.0);
  if (zero_viscosity || zero_viscosity.error().kind() != ErrorKind::Domain) {
    std::cerr << "Expected Domain error for zero viscosity\n";
    return 1;
  }

  auto nan_density = solve_channel(std::nan(""), 10.0, 1.8e-5, 0.5, 0.02, 1e-6);
  if (nan_density || nan_density.error().kind() != ErrorKind::InvalidInput) {
    std::cerr << "Expected InvalidInput for NaN density\n";
    return 1;
  }

  auto state = solve_channel(1.045737453406631, 15.24, 2.0564402872716678e-05, 0.1524, 0.033866666666666666, 1.5e-6);
  if (!state || state->regime != FlowRegime::Turbulent || std::fabs(state->reynolds - 26246.05) > 0.01) {
    std::cerr << "Reference channel state mismatch\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
